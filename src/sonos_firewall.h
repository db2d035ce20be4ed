#pragma once

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTimer>

#include "sonos_config.h"
#include "sonos_subscription_registry.h"
#include "sonos_types.h"

namespace sonoswatch {

enum class FirewallStatus {
    Unknown,
    Accessible,
    Blocked
};

QString firewallStatusName(FirewallStatus status);

// Treats a subscription that stays silent for the detection window as blocked
// by a firewall, and reports when notifications show up again.
class FirewallDetector : public QObject
{
    Q_OBJECT

public:
    FirewallDetector(const SubscriptionRegistry *registry,
                     const EngineConfig &config,
                     const Clock &clock = Clock(),
                     QObject *parent = nullptr);

    FirewallStatus status(const QString &deviceId) const;
    void clearDevice(const QString &deviceId);
    bool isSilent(const SubscriptionKey &key) const;

public slots:
    void start();
    void stop();
    void tick();
    void tickAt(qint64 nowMs);

signals:
    void pushSilent(const sonoswatch::SubscriptionKey &key);
    void pushResumed(const sonoswatch::SubscriptionKey &key);
    void statusChanged(const QString &deviceId, int status);

private:
    void setStatus(const QString &deviceId, FirewallStatus status);

    const SubscriptionRegistry *m_registry = nullptr;
    EngineConfig m_config;
    Clock m_clock;
    QTimer *m_timer = nullptr;

    mutable QMutex m_mutex;
    QHash<QString, FirewallStatus> m_status;
    // Key -> time it was reported silent.
    QHash<SubscriptionKey, qint64> m_silent;
};

} // namespace sonoswatch
