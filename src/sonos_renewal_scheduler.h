#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include "sonos_config.h"
#include "sonos_subscription_registry.h"
#include "sonos_types.h"

namespace sonoswatch {

class RenewalScheduler : public QObject
{
    Q_OBJECT

public:
    RenewalScheduler(SubscriptionRegistry *registry,
                     const EngineConfig &config,
                     const Clock &clock = Clock(),
                     QObject *parent = nullptr);

    // Delay before the retry that follows the given number of failures.
    static qint64 backoffDelayMs(int baseMs, int failedAttempts);

    int tickIntervalMs() const { return m_config.renewalTickMs; }
    bool isRunning() const;

public slots:
    void start();
    void stop();
    // One scan of the registry; returns the number of renewal attempts made.
    int tick();
    int tickAt(qint64 nowMs);

signals:
    void subscriptionRenewed(const sonoswatch::SubscriptionKey &key);
    void renewalFailed(const sonoswatch::SubscriptionKey &key, int failedAttempts, qint64 retryInMs);
    void subscriptionExpired(const sonoswatch::SubscriptionKey &key, const QString &reason);

private:
    bool isDue(const SubscriptionInfo &info, qint64 nowMs) const;
    void handleFailure(const SubscriptionKey &key, const RenewOutcome &outcome, qint64 nowMs);
    // Arms the retry timer for the earliest pending retry.
    void armNextRetry();

    SubscriptionRegistry *m_registry = nullptr;
    EngineConfig m_config;
    Clock m_clock;
    QTimer *m_timer = nullptr;
    QTimer *m_retryTimer = nullptr;
    bool m_stopped = false;
};

} // namespace sonoswatch
