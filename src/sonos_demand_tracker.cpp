#include "sonos_demand_tracker.h"

#include "sonos_log.h"

namespace sonoswatch {

DemandTracker::DemandTracker(SubscriptionRegistry *registry,
                             PollingEngine *polling,
                             const FirewallDetector *firewall,
                             QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_polling(polling)
    , m_firewall(firewall)
{
}

EnsureResult DemandTracker::ensure(const SubscriptionKey &key)
{
    EnsureResult result;
    const std::shared_ptr<KeyDemand> entry = demandFor(key);
    QMutexLocker locker(&entry->mutex);

    entry->count += 1;
    result.demand = entry->count;
    if (entry->count > 1) {
        result.ok = true;
        result.subscribed = m_registry && m_registry->contains(key);
        result.polling = m_polling && m_polling->isPolling(key);
        qCDebug(demandLog).noquote() << "Demand for" << key.toString() << "is now" << entry->count;
        return result;
    }

    qCInfo(demandLog).noquote() << "First demand for" << key.toString() << ", subscribing";
    const CreateResult created = m_registry ? m_registry->create(key) : CreateResult{};
    if (created.ok || created.error == CreateError::Conflict) {
        result.subscribed = true;
        if (m_polling && m_firewall && m_firewall->status(key.deviceId) == FirewallStatus::Blocked) {
            qCInfo(demandLog).noquote() << "Device" << key.deviceId << "is known to block callbacks, polling"
                                        << key.toString() << "right away";
            result.polling = m_polling->start(key, PollReason::DeviceBlocked, &result.error);
        }
    } else {
        result.error = created.message;
        qCWarning(demandLog).noquote() << "Subscription for" << key.toString() << "failed:" << created.message
                                       << "- falling back to polling";
        QString pollError;
        result.polling = m_polling && m_polling->start(key, PollReason::SubscribeFailed, &pollError);
        if (!result.polling && !pollError.isEmpty())
            result.error += QStringLiteral("; ") + pollError;
    }

    result.ok = result.subscribed || result.polling;
    return result;
}

bool DemandTracker::release(const SubscriptionKey &key)
{
    const std::shared_ptr<KeyDemand> entry = findDemand(key);
    if (!entry) {
        qCWarning(demandLog).noquote() << "Release for" << key.toString() << "without outstanding demand";
        return false;
    }
    QMutexLocker locker(&entry->mutex);

    if (entry->count <= 0) {
        qCWarning(demandLog).noquote() << "Release for" << key.toString() << "without outstanding demand";
        return false;
    }

    entry->count -= 1;
    if (entry->count > 0) {
        qCDebug(demandLog).noquote() << "Demand for" << key.toString() << "is now" << entry->count;
        return true;
    }

    qCInfo(demandLog).noquote() << "Last demand for" << key.toString() << "released";
    if (m_registry)
        m_registry->remove(key);
    if (m_polling)
        m_polling->stop(key);
    dropIfIdle(key, entry);
    return true;
}

int DemandTracker::demand(const SubscriptionKey &key) const
{
    const std::shared_ptr<KeyDemand> entry = findDemand(key);
    if (!entry)
        return 0;
    QMutexLocker locker(&entry->mutex);
    return entry->count;
}

QList<SubscriptionKey> DemandTracker::demandedKeys() const
{
    QHash<SubscriptionKey, std::shared_ptr<KeyDemand>> keys;
    {
        QMutexLocker locker(&m_mapMutex);
        keys = m_keys;
    }

    QList<SubscriptionKey> out;
    for (auto it = keys.constBegin(); it != keys.constEnd(); ++it) {
        QMutexLocker locker(&it.value()->mutex);
        if (it.value()->count > 0)
            out.append(it.key());
    }
    return out;
}

void DemandTracker::onSubscriptionExpired(const SubscriptionKey &key, const QString &reason)
{
    const std::shared_ptr<KeyDemand> entry = findDemand(key);
    if (!entry)
        return;
    QMutexLocker locker(&entry->mutex);
    if (entry->count <= 0 || !m_polling)
        return;

    qCInfo(demandLog).noquote() << "Subscription" << key.toString() << "expired (" << reason
                                << "), falling back to polling";
    m_polling->start(key, PollReason::SubscriptionExpired);
}

void DemandTracker::onPushSilent(const SubscriptionKey &key)
{
    const std::shared_ptr<KeyDemand> entry = findDemand(key);
    if (!entry)
        return;
    QMutexLocker locker(&entry->mutex);
    if (entry->count <= 0 || !m_polling)
        return;
    m_polling->start(key, PollReason::PushSilent);
}

void DemandTracker::onPushResumed(const SubscriptionKey &key)
{
    const std::shared_ptr<KeyDemand> entry = findDemand(key);
    if (!entry)
        return;
    QMutexLocker locker(&entry->mutex);
    if (entry->count <= 0 || !m_polling)
        return;

    const std::optional<PollReason> reason = m_polling->reason(key);
    if (!reason || (*reason != PollReason::PushSilent && *reason != PollReason::DeviceBlocked))
        return;

    qCInfo(demandLog).noquote() << "Push is working again for" << key.toString() << ", stopping poll";
    m_polling->stop(key);
}

int DemandTracker::trackedKeyCount() const
{
    QMutexLocker locker(&m_mapMutex);
    return m_keys.size();
}

std::shared_ptr<DemandTracker::KeyDemand> DemandTracker::findDemand(const SubscriptionKey &key) const
{
    QMutexLocker locker(&m_mapMutex);
    return m_keys.value(key);
}

void DemandTracker::dropIfIdle(const SubscriptionKey &key, const std::shared_ptr<KeyDemand> &entry)
{
    QMutexLocker locker(&m_mapMutex);
    const auto it = m_keys.constFind(key);
    // One reference in the map, one held by the caller.
    if (it == m_keys.constEnd() || it.value() != entry || entry.use_count() > 2)
        return;
    m_keys.erase(it);
}

std::shared_ptr<DemandTracker::KeyDemand> DemandTracker::demandFor(const SubscriptionKey &key) const
{
    QMutexLocker locker(&m_mapMutex);
    std::shared_ptr<KeyDemand> &entry = m_keys[key];
    if (!entry)
        entry = std::make_shared<KeyDemand>();
    return entry;
}

} // namespace sonoswatch
