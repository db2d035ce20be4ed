#include "sonos_property_store.h"

#include <algorithm>

#include <QDeadlineTimer>

#include "sonos_log.h"

namespace sonoswatch {

class ChangeChannel
{
public:
    explicit ChangeChannel(int capacity)
        : m_capacity(capacity)
    {
    }

    void push(const ChangeEvent &event)
    {
        QMutexLocker locker(&m_mutex);
        if (m_closed)
            return;
        if (m_capacity > 0 && m_queue.size() >= m_capacity) {
            m_queue.dequeue();
            if (m_dropped++ == 0)
                qCWarning(storeLog) << "Change cursor is full, dropping oldest events (capacity" << m_capacity << ")";
        }
        m_queue.enqueue(event);
        m_ready.wakeOne();
    }

    std::optional<ChangeEvent> pop(QDeadlineTimer deadline)
    {
        QMutexLocker locker(&m_mutex);
        while (m_queue.isEmpty()) {
            if (m_closed)
                return std::nullopt;
            if (!m_ready.wait(&m_mutex, deadline))
                break;
        }
        if (m_queue.isEmpty())
            return std::nullopt;
        return m_queue.dequeue();
    }

    void close()
    {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_ready.wakeAll();
    }

    bool isClosed() const
    {
        QMutexLocker locker(&m_mutex);
        return m_closed && m_queue.isEmpty();
    }

    int pending() const
    {
        QMutexLocker locker(&m_mutex);
        return m_queue.size();
    }

    int dropped() const
    {
        QMutexLocker locker(&m_mutex);
        return m_dropped;
    }

private:
    const int m_capacity;
    mutable QMutex m_mutex;
    QWaitCondition m_ready;
    QQueue<ChangeEvent> m_queue;
    int m_dropped = 0;
    bool m_closed = false;
};

ChangeIterator::ChangeIterator(std::shared_ptr<ChangeChannel> channel)
    : m_channel(std::move(channel))
{
}

std::optional<ChangeEvent> ChangeIterator::next()
{
    if (!m_channel)
        return std::nullopt;
    return m_channel->pop(QDeadlineTimer(QDeadlineTimer::Forever));
}

std::optional<ChangeEvent> ChangeIterator::tryNext()
{
    if (!m_channel)
        return std::nullopt;
    return m_channel->pop(QDeadlineTimer(0));
}

std::optional<ChangeEvent> ChangeIterator::nextFor(int timeoutMs)
{
    if (!m_channel)
        return std::nullopt;
    return m_channel->pop(QDeadlineTimer(std::max(0, timeoutMs)));
}

bool ChangeIterator::isClosed() const
{
    return !m_channel || m_channel->isClosed();
}

int ChangeIterator::pending() const
{
    return m_channel ? m_channel->pending() : 0;
}

int ChangeIterator::dropped() const
{
    return m_channel ? m_channel->dropped() : 0;
}

PropertyStore::PropertyStore(int channelCapacity, const Clock &clock, QObject *parent)
    : QObject(parent)
    , m_channelCapacity(std::max(0, channelCapacity))
    , m_clock(clock ? clock : Clock(&systemClockMs))
{
}

PropertyStore::~PropertyStore()
{
    close();
}

bool PropertyStore::set(const QString &entity, const QString &key, Service service, const QVariant &value)
{
    if (!value.isValid())
        return false;

    // Publishing under the write lock keeps per-entity events in set() order.
    QWriteLocker locker(&m_lock);
    QHash<QString, QVariant> &bag = m_bags[entity];
    const auto it = bag.constFind(key);
    const bool changed = it == bag.constEnd() || it.value() != value;
    if (!changed)
        return false;

    bag.insert(key, value);
    if (!m_watchSet.contains(WatchKey(entity, key)))
        return true;

    ChangeEvent change;
    change.entity = entity;
    change.key = key;
    change.service = service;
    change.timestampMs = m_clock();
    publish(change);
    locker.unlock();

    emit propertyChanged(change);
    return true;
}

QVariant PropertyStore::value(const QString &entity, const QString &key) const
{
    QReadLocker locker(&m_lock);
    const auto bag = m_bags.constFind(entity);
    if (bag == m_bags.constEnd())
        return {};
    return bag.value().value(key);
}

void PropertyStore::watch(const QString &entity, const QString &key)
{
    QWriteLocker locker(&m_lock);
    m_watchSet.insert(WatchKey(entity, key));
}

void PropertyStore::unwatch(const QString &entity, const QString &key)
{
    QWriteLocker locker(&m_lock);
    m_watchSet.remove(WatchKey(entity, key));
}

bool PropertyStore::isWatched(const QString &entity, const QString &key) const
{
    QReadLocker locker(&m_lock);
    return m_watchSet.contains(WatchKey(entity, key));
}

ChangeIterator PropertyStore::iterate()
{
    auto channel = std::make_shared<ChangeChannel>(m_channelCapacity);
    QMutexLocker locker(&m_channelsMutex);
    if (m_closed)
        channel->close();
    else
        m_channels.append(channel);
    return ChangeIterator(channel);
}

void PropertyStore::removeEntity(const QString &entity)
{
    QWriteLocker locker(&m_lock);
    m_bags.remove(entity);
    qCDebug(storeLog) << "Removed property bag for" << entity;
}

QStringList PropertyStore::entities() const
{
    QReadLocker locker(&m_lock);
    return m_bags.keys();
}

int PropertyStore::propertyCount(const QString &entity) const
{
    QReadLocker locker(&m_lock);
    return m_bags.value(entity).size();
}

void PropertyStore::close()
{
    QMutexLocker locker(&m_channelsMutex);
    if (m_closed)
        return;
    m_closed = true;
    for (const std::weak_ptr<ChangeChannel> &weak : std::as_const(m_channels)) {
        if (auto channel = weak.lock())
            channel->close();
    }
    m_channels.clear();
}

bool PropertyStore::isClosed() const
{
    QMutexLocker locker(&m_channelsMutex);
    return m_closed;
}

void PropertyStore::publish(const ChangeEvent &event)
{
    QMutexLocker locker(&m_channelsMutex);
    if (m_closed)
        return;
    for (auto it = m_channels.begin(); it != m_channels.end();) {
        if (auto channel = it->lock()) {
            channel->push(event);
            ++it;
        } else {
            it = m_channels.erase(it);
        }
    }
}

} // namespace sonoswatch
