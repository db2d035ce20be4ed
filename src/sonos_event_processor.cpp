#include "sonos_event_processor.h"

#include <algorithm>
#include <exception>

#include <QDeadlineTimer>

#include "sonos_log.h"

namespace sonoswatch {

namespace {

constexpr int kDestructorStopTimeoutMs = 5000;

const char *originName(NotificationOrigin origin)
{
    return origin == NotificationOrigin::Poll ? "poll" : "push";
}

} // namespace

EventProcessor::EventProcessor(const ProviderTable *providers, PropertyStore *store)
    : m_providers(providers)
    , m_store(store)
{
}

EventProcessor::~EventProcessor()
{
    stop(kDestructorStopTimeoutMs);
}

void EventProcessor::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_thread || m_closed)
        return;
    m_thread.reset(QThread::create([this]() { run(); }));
    m_thread->setObjectName(QStringLiteral("sonoswatch-events"));
    m_thread->start();
}

bool EventProcessor::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_thread && m_thread->isRunning();
}

bool EventProcessor::enqueue(const RawNotification &notification)
{
    QMutexLocker locker(&m_mutex);
    if (m_closed) {
        qCDebug(eventsLog).noquote() << "Event queue closed, dropping" << originName(notification.origin)
                                     << "event for" << notification.key.toString();
        return false;
    }
    m_queue.enqueue(notification);
    m_wake.wakeOne();
    return true;
}

QList<DecodedChange> EventProcessor::decode(const RawNotification &notification) const
{
    QList<DecodedChange> changes;

    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(notification.key.service) : nullptr;
    if (!provider)
        return changes;

    QList<DecodedProperty> properties;
    try {
        properties = provider->decode(notification.payload);
    } catch (const std::exception &e) {
        qCWarning(eventsLog).noquote() << "Decoder for" << serviceName(notification.key.service)
                                       << "threw on payload from" << notification.key.deviceId << ":" << e.what();
        return changes;
    } catch (...) {
        qCWarning(eventsLog).noquote() << "Decoder for" << serviceName(notification.key.service)
                                       << "threw a non-standard exception on payload from"
                                       << notification.key.deviceId;
        return changes;
    }

    changes.reserve(properties.size());
    for (const DecodedProperty &property : std::as_const(properties)) {
        if (property.key.isEmpty() || !property.value.isValid())
            continue;
        DecodedChange change;
        change.entity = notification.key.deviceId;
        change.key = property.key;
        change.service = notification.key.service;
        change.value = property.value;
        changes.append(change);
    }
    return changes;
}

int EventProcessor::process(const RawNotification &notification)
{
    ++m_processed;

    if (!m_providers || !m_providers->contains(notification.key.service)) {
        ++m_discarded;
        qCWarning(eventsLog).noquote() << "Configuration error: no decoder registered for"
                                       << serviceName(notification.key.service) << "- dropping"
                                       << originName(notification.origin) << "event from" << notification.key.deviceId;
        return 0;
    }

    const QList<DecodedChange> changes = decode(notification);
    int applied = 0;
    if (m_store) {
        for (const DecodedChange &change : changes) {
            if (m_store->set(change.entity, change.key, change.service, change.value))
                ++applied;
        }
    }
    m_applied += applied;

    qCDebug(eventsLog).noquote() << "Processed" << originName(notification.origin) << "event for"
                                 << notification.key.toString() << "decoded=" << changes.size()
                                 << "changed=" << applied;
    return applied;
}

int EventProcessor::processPending()
{
    int applied = 0;
    for (;;) {
        RawNotification notification;
        {
            QMutexLocker locker(&m_mutex);
            if (m_queue.isEmpty())
                break;
            notification = m_queue.dequeue();
        }
        applied += process(notification);
    }
    return applied;
}

bool EventProcessor::stop(int timeoutMs)
{
    std::unique_ptr<QThread> thread;
    {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_wake.wakeAll();
        thread = std::move(m_thread);
    }

    bool clean = true;
    if (thread) {
        if (!thread->wait(QDeadlineTimer(std::max(0, timeoutMs)))) {
            qCWarning(eventsLog) << "Event processor did not drain within" << timeoutMs << "ms, terminating";
            thread->terminate();
            thread->wait();
            clean = false;
        }
    }

    QMutexLocker locker(&m_mutex);
    if (!m_queue.isEmpty()) {
        qCWarning(eventsLog) << "Discarding" << m_queue.size() << "unprocessed events at shutdown";
        m_discarded += m_queue.size();
        m_queue.clear();
    }
    return clean;
}

int EventProcessor::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue.size();
}

void EventProcessor::run()
{
    for (;;) {
        RawNotification notification;
        {
            QMutexLocker locker(&m_mutex);
            while (m_queue.isEmpty() && !m_closed)
                m_wake.wait(&m_mutex);
            if (m_queue.isEmpty())
                return;
            notification = m_queue.dequeue();
        }
        process(notification);
    }
}

} // namespace sonoswatch
