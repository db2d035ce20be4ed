#include "sonos_firewall.h"

#include <algorithm>

#include <QSet>

#include "sonos_log.h"

namespace sonoswatch {

QString firewallStatusName(FirewallStatus status)
{
    switch (status) {
    case FirewallStatus::Unknown:
        return QStringLiteral("unknown");
    case FirewallStatus::Accessible:
        return QStringLiteral("accessible");
    case FirewallStatus::Blocked:
        return QStringLiteral("blocked");
    }
    return QStringLiteral("unknown");
}

FirewallDetector::FirewallDetector(const SubscriptionRegistry *registry,
                                   const EngineConfig &config,
                                   const Clock &clock,
                                   QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_config(config)
    , m_clock(clock ? clock : Clock(&systemClockMs))
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(std::max(10, m_config.firewallCheckMs));
    connect(m_timer, &QTimer::timeout, this, &FirewallDetector::tick);
}

FirewallStatus FirewallDetector::status(const QString &deviceId) const
{
    QMutexLocker locker(&m_mutex);
    return m_status.value(deviceId, FirewallStatus::Unknown);
}

void FirewallDetector::clearDevice(const QString &deviceId)
{
    QMutexLocker locker(&m_mutex);
    m_status.remove(deviceId);
    m_silent.removeIf([&deviceId](const QHash<SubscriptionKey, qint64>::iterator &it) {
        return it.key().deviceId == deviceId;
    });
}

bool FirewallDetector::isSilent(const SubscriptionKey &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_silent.contains(key);
}

void FirewallDetector::start()
{
    if (!m_config.firewallDetection)
        return;
    m_timer->start();
}

void FirewallDetector::stop()
{
    m_timer->stop();
}

void FirewallDetector::tick()
{
    tickAt(m_clock());
}

void FirewallDetector::tickAt(qint64 nowMs)
{
    if (!m_registry || !m_config.firewallDetection)
        return;

    QList<SubscriptionKey> silenced;
    QList<SubscriptionKey> resumed;
    QSet<SubscriptionKey> present;

    const QList<SubscriptionInfo> subscriptions = m_registry->snapshot();
    {
        QMutexLocker locker(&m_mutex);
        for (const SubscriptionInfo &info : subscriptions) {
            if (info.state != SubscriptionState::Active && info.state != SubscriptionState::Renewing)
                continue;
            present.insert(info.key);

            const auto silentIt = m_silent.constFind(info.key);
            if (info.lastNotificationAtMs > 0) {
                if (silentIt != m_silent.constEnd()) {
                    m_silent.remove(info.key);
                    resumed.append(info.key);
                }
                continue;
            }

            if (silentIt != m_silent.constEnd())
                continue;
            const qint64 anchor = std::max(info.createdAtMs, info.lastRenewedAtMs);
            if (nowMs - anchor >= m_config.firewallWindowMs) {
                m_silent.insert(info.key, nowMs);
                silenced.append(info.key);
            }
        }

        // Forget keys whose subscription went away.
        m_silent.removeIf([&present](const QHash<SubscriptionKey, qint64>::iterator &it) {
            return !present.contains(it.key());
        });
    }

    for (const SubscriptionKey &key : std::as_const(resumed)) {
        qCInfo(firewallLog).noquote() << "Push notifications resumed for" << key.toString();
        setStatus(key.deviceId, FirewallStatus::Accessible);
        emit pushResumed(key);
    }
    for (const SubscriptionKey &key : std::as_const(silenced)) {
        qCWarning(firewallLog).noquote() << "No notification for" << key.toString() << "within"
                                         << m_config.firewallWindowMs << "ms, assuming callbacks are blocked";
        setStatus(key.deviceId, FirewallStatus::Blocked);
        emit pushSilent(key);
    }

    // Devices that delivered at least once are reachable.
    for (const SubscriptionInfo &info : subscriptions) {
        if (info.lastNotificationAtMs > 0 && status(info.key.deviceId) == FirewallStatus::Unknown)
            setStatus(info.key.deviceId, FirewallStatus::Accessible);
    }
}

void FirewallDetector::setStatus(const QString &deviceId, FirewallStatus status)
{
    {
        QMutexLocker locker(&m_mutex);
        const FirewallStatus previous = m_status.value(deviceId, FirewallStatus::Unknown);
        if (previous == status)
            return;
        m_status.insert(deviceId, status);
    }
    qCDebug(firewallLog).noquote() << "Device" << deviceId << "firewall status" << firewallStatusName(status);
    emit statusChanged(deviceId, static_cast<int>(status));
}

} // namespace sonoswatch
