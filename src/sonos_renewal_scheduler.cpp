#include "sonos_renewal_scheduler.h"

#include <algorithm>
#include <optional>

#include "sonos_log.h"

namespace sonoswatch {

RenewalScheduler::RenewalScheduler(SubscriptionRegistry *registry,
                                   const EngineConfig &config,
                                   const Clock &clock,
                                   QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_config(config)
    , m_clock(clock ? clock : Clock(&systemClockMs))
    , m_timer(new QTimer(this))
    , m_retryTimer(new QTimer(this))
{
    m_timer->setInterval(std::max(50, m_config.renewalTickMs));
    connect(m_timer, &QTimer::timeout, this, [this]() { tick(); });

    m_retryTimer->setSingleShot(true);
    m_retryTimer->setTimerType(Qt::PreciseTimer);
    connect(m_retryTimer, &QTimer::timeout, this, [this]() { tick(); });
}

qint64 RenewalScheduler::backoffDelayMs(int baseMs, int failedAttempts)
{
    const int exponent = std::clamp(failedAttempts - 1, 0, 20);
    return static_cast<qint64>(std::max(1, baseMs)) << exponent;
}

bool RenewalScheduler::isRunning() const
{
    return m_timer->isActive();
}

void RenewalScheduler::start()
{
    m_stopped = false;
    m_timer->start();
    qCDebug(renewalLog) << "RenewalScheduler started, tick" << m_timer->interval() << "ms";
}

void RenewalScheduler::stop()
{
    m_stopped = true;
    m_timer->stop();
    m_retryTimer->stop();
    qCDebug(renewalLog) << "RenewalScheduler stopped";
}

int RenewalScheduler::tick()
{
    return tickAt(m_clock());
}

int RenewalScheduler::tickAt(qint64 nowMs)
{
    if (!m_registry || m_stopped)
        return 0;

    int attempts = 0;
    const QList<SubscriptionInfo> subscriptions = m_registry->snapshot();
    for (const SubscriptionInfo &info : subscriptions) {
        if (m_stopped)
            break;
        if (!isDue(info, nowMs))
            continue;

        ++attempts;
        const RenewOutcome outcome = m_registry->renew(info.key);
        switch (outcome.status) {
        case RenewStatus::Renewed:
            qCInfo(renewalLog).noquote() << "Renewed" << info.key.toString();
            emit subscriptionRenewed(info.key);
            break;
        case RenewStatus::Failed:
        case RenewStatus::Rejected:
            handleFailure(info.key, outcome, nowMs);
            break;
        case RenewStatus::NotFound:
            break;
        }
    }

    // Retries are not bound to the tick interval.
    if (m_timer->isActive())
        armNextRetry();
    return attempts;
}

void RenewalScheduler::armNextRetry()
{
    if (m_stopped)
        return;

    std::optional<qint64> nextRetryAtMs;
    const QList<SubscriptionInfo> subscriptions = m_registry->snapshot();
    for (const SubscriptionInfo &info : subscriptions) {
        if (info.state != SubscriptionState::Renewing || info.failedRenewals <= 0)
            continue;
        if (!nextRetryAtMs || info.nextRetryAtMs < *nextRetryAtMs)
            nextRetryAtMs = info.nextRetryAtMs;
    }
    if (!nextRetryAtMs) {
        m_retryTimer->stop();
        return;
    }

    const qint64 delay = std::clamp<qint64>(*nextRetryAtMs - m_clock(), 0, m_timer->interval());
    m_retryTimer->start(static_cast<int>(delay));
}

bool RenewalScheduler::isDue(const SubscriptionInfo &info, qint64 nowMs) const
{
    switch (info.state) {
    case SubscriptionState::Active:
        return info.expiresAtMs - nowMs <= m_config.renewalThresholdMs;
    case SubscriptionState::Renewing:
        return info.failedRenewals > 0 && info.nextRetryAtMs <= nowMs;
    default:
        return false;
    }
}

void RenewalScheduler::handleFailure(const SubscriptionKey &key, const RenewOutcome &outcome, qint64 nowMs)
{
    QString reason;
    if (outcome.status == RenewStatus::Rejected) {
        reason = QStringLiteral("subscription rejected by device: %1").arg(outcome.error);
    } else if (outcome.failedRenewals >= m_config.maxRenewalAttempts) {
        reason = QStringLiteral("renewal failed %1 times, last error: %2")
                     .arg(outcome.failedRenewals)
                     .arg(outcome.error);
    }

    if (reason.isEmpty()) {
        const qint64 delay = backoffDelayMs(m_config.retryBackoffBaseMs, outcome.failedRenewals);
        // Counted from when the failed call returned, which can be well after the tick started.
        m_registry->scheduleRetry(key, std::max(nowMs, m_clock()) + delay);
        qCWarning(renewalLog).noquote() << "Renewal of" << key.toString() << "failed (attempt"
                                        << outcome.failedRenewals << "of" << m_config.maxRenewalAttempts
                                        << "):" << outcome.error << "- retrying in" << delay << "ms";
        emit renewalFailed(key, outcome.failedRenewals, delay);
        return;
    }

    if (!m_registry->expire(key))
        return;
    qCWarning(renewalLog).noquote() << "Subscription" << key.toString() << "expired:" << reason;
    emit subscriptionExpired(key, reason);
}

} // namespace sonoswatch
