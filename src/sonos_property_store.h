#pragma once

#include <memory>
#include <optional>

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QReadWriteLock>
#include <QSet>
#include <QString>
#include <QVariant>
#include <QWaitCondition>

#include "sonos_types.h"

namespace sonoswatch {

class ChangeChannel;

// Cursor over the store's change stream. Copies share the same queue.
class ChangeIterator
{
public:
    ChangeIterator() = default;

    // Blocks until an event arrives; empty once the store is closed and drained.
    std::optional<ChangeEvent> next();
    std::optional<ChangeEvent> tryNext();
    std::optional<ChangeEvent> nextFor(int timeoutMs);

    bool isClosed() const;
    int pending() const;
    int dropped() const;

private:
    friend class PropertyStore;
    explicit ChangeIterator(std::shared_ptr<ChangeChannel> channel);

    std::shared_ptr<ChangeChannel> m_channel;
};

class PropertyStore : public QObject
{
    Q_OBJECT

public:
    explicit PropertyStore(int channelCapacity = 0, const Clock &clock = Clock(), QObject *parent = nullptr);
    ~PropertyStore() override;

    // Returns true when the stored value changed.
    bool set(const QString &entity, const QString &key, Service service, const QVariant &value);

    template <typename P>
    bool set(const QString &entity, const P &property)
    {
        return set(entity, QString::fromLatin1(P::key), P::service, QVariant::fromValue(property));
    }

    QVariant value(const QString &entity, const QString &key) const;

    template <typename P>
    std::optional<P> get(const QString &entity) const
    {
        const QVariant stored = value(entity, QString::fromLatin1(P::key));
        if (!stored.isValid() || !stored.canConvert<P>())
            return std::nullopt;
        return stored.value<P>();
    }

    void watch(const QString &entity, const QString &key);
    void unwatch(const QString &entity, const QString &key);
    bool isWatched(const QString &entity, const QString &key) const;

    template <typename P>
    void watch(const QString &entity) { watch(entity, QString::fromLatin1(P::key)); }
    template <typename P>
    void unwatch(const QString &entity) { unwatch(entity, QString::fromLatin1(P::key)); }

    ChangeIterator iterate();

    void removeEntity(const QString &entity);
    QStringList entities() const;
    int propertyCount(const QString &entity) const;

    // Wakes every blocked cursor; no further events are published.
    void close();
    bool isClosed() const;

signals:
    void propertyChanged(const sonoswatch::ChangeEvent &event);

private:
    using WatchKey = QPair<QString, QString>;

    void publish(const ChangeEvent &event);

    int m_channelCapacity = 0;
    Clock m_clock;

    mutable QReadWriteLock m_lock;
    QHash<QString, QHash<QString, QVariant>> m_bags;
    QSet<WatchKey> m_watchSet;

    mutable QMutex m_channelsMutex;
    QList<std::weak_ptr<ChangeChannel>> m_channels;
    bool m_closed = false;
};

} // namespace sonoswatch
