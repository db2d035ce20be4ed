#include "sonos_subscription_registry.h"

#include "sonos_log.h"

namespace sonoswatch {

QString subscriptionStateName(SubscriptionState state)
{
    switch (state) {
    case SubscriptionState::Pending:
        return QStringLiteral("Pending");
    case SubscriptionState::Active:
        return QStringLiteral("Active");
    case SubscriptionState::Renewing:
        return QStringLiteral("Renewing");
    case SubscriptionState::Expired:
        return QStringLiteral("Expired");
    case SubscriptionState::Removed:
        return QStringLiteral("Removed");
    }
    return QStringLiteral("Unknown");
}

SubscriptionRegistry::SubscriptionRegistry(const ProviderTable *providers,
                                           const DeviceDirectory *devices,
                                           const EngineConfig &config,
                                           const Clock &clock)
    : m_providers(providers)
    , m_devices(devices)
    , m_config(config)
    , m_clock(clock ? clock : Clock(&systemClockMs))
{
}

void SubscriptionRegistry::setCallbackUrl(const QString &url)
{
    QWriteLocker locker(&m_lock);
    m_callbackUrl = url;
}

QString SubscriptionRegistry::callbackUrl() const
{
    QReadLocker locker(&m_lock);
    return m_callbackUrl;
}

CreateResult SubscriptionRegistry::create(const SubscriptionKey &key)
{
    CreateResult result;

    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(key.service) : nullptr;
    if (!provider) {
        result.error = CreateError::ProviderMissing;
        result.message = QStringLiteral("No provider registered for %1").arg(serviceName(key.service));
        qCWarning(registryLog).noquote() << "Cannot subscribe" << key.toString() << ":" << result.message;
        return result;
    }

    QString callbackUrl;
    {
        QWriteLocker locker(&m_lock);
        if (m_entries.contains(key)) {
            result.error = CreateError::Conflict;
            result.message = QStringLiteral("Subscription for %1 already exists").arg(key.toString());
            return result;
        }
        Entry pending;
        pending.createdAtMs = m_clock();
        m_entries.insert(key, pending);
        callbackUrl = m_callbackUrl;
    }

    const DeviceDescriptor device = resolveDevice(key.deviceId);
    const SubscribeResult remote = provider->subscribe(device, callbackUrl, m_config.subscriptionTimeoutSec);

    QWriteLocker locker(&m_lock);
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->state != SubscriptionState::Pending) {
        locker.unlock();
        if (remote.ok) {
            QString error;
            if (!provider->unsubscribe(device, remote.token, &error))
                qCWarning(registryLog).noquote() << "Unsubscribe of abandoned" << key.toString() << "failed:" << error;
        }
        result.error = CreateError::RemoteRejected;
        result.message = QStringLiteral("Subscription for %1 was removed while pending").arg(key.toString());
        return result;
    }

    if (!remote.ok || remote.token.isEmpty()) {
        m_entries.erase(it);
        result.error = CreateError::RemoteRejected;
        result.message = remote.ok ? QStringLiteral("Device returned an empty subscription id") : remote.error;
        qCWarning(registryLog).noquote() << "Subscribe" << key.toString() << "rejected:" << result.message;
        return result;
    }

    const qint64 now = m_clock();
    const int timeoutSec = remote.timeoutSec > 0 ? remote.timeoutSec : m_config.subscriptionTimeoutSec;
    it->token = remote.token;
    it->state = SubscriptionState::Active;
    it->createdAtMs = now;
    it->lastRenewedAtMs = now;
    it->expiresAtMs = now + static_cast<qint64>(timeoutSec) * 1000;
    m_tokens.insert(remote.token, key);

    qCInfo(registryLog).noquote() << "Subscribed" << key.toString() << "sid=" << remote.token
                                  << "timeout=" << timeoutSec << "s";
    result.ok = true;
    return result;
}

RenewOutcome SubscriptionRegistry::renew(const SubscriptionKey &key)
{
    RenewOutcome outcome;

    QString token;
    {
        QWriteLocker locker(&m_lock);
        auto it = m_entries.find(key);
        if (it == m_entries.end()
            || (it->state != SubscriptionState::Active && it->state != SubscriptionState::Renewing)) {
            return outcome;
        }
        it->state = SubscriptionState::Renewing;
        token = it->token;
        outcome.failedRenewals = it->failedRenewals;
    }

    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(key.service) : nullptr;
    RenewResult remote;
    if (provider) {
        const DeviceDescriptor device = resolveDevice(key.deviceId);
        remote = provider->renew(device, token, m_config.subscriptionTimeoutSec);
    } else {
        remote.retryable = false;
        remote.error = QStringLiteral("No provider registered for %1").arg(serviceName(key.service));
    }

    QWriteLocker locker(&m_lock);
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->token != token)
        return outcome;

    if (remote.ok) {
        const qint64 now = m_clock();
        const int timeoutSec = remote.timeoutSec > 0 ? remote.timeoutSec : m_config.subscriptionTimeoutSec;
        it->state = SubscriptionState::Active;
        it->failedRenewals = 0;
        it->nextRetryAtMs = 0;
        it->lastRenewedAtMs = now;
        it->expiresAtMs = now + static_cast<qint64>(timeoutSec) * 1000;
        outcome.status = RenewStatus::Renewed;
        outcome.failedRenewals = 0;
        return outcome;
    }

    it->failedRenewals += 1;
    outcome.failedRenewals = it->failedRenewals;
    outcome.error = remote.error;
    outcome.status = remote.retryable ? RenewStatus::Failed : RenewStatus::Rejected;
    return outcome;
}

bool SubscriptionRegistry::scheduleRetry(const SubscriptionKey &key, qint64 retryAtMs)
{
    QWriteLocker locker(&m_lock);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    it->nextRetryAtMs = retryAtMs;
    return true;
}

std::optional<SubscriptionInfo> SubscriptionRegistry::expire(const SubscriptionKey &key)
{
    QWriteLocker locker(&m_lock);
    const auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd())
        return std::nullopt;

    SubscriptionInfo info = toInfo(key, it.value());
    info.state = SubscriptionState::Expired;
    eraseLocked(key);
    return info;
}

bool SubscriptionRegistry::remove(const SubscriptionKey &key)
{
    QString token;
    {
        QWriteLocker locker(&m_lock);
        const auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd())
            return false;
        token = it->token;
        eraseLocked(key);
    }

    qCInfo(registryLog).noquote() << "Removed subscription" << key.toString();
    if (token.isEmpty())
        return true;

    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(key.service) : nullptr;
    if (!provider)
        return true;

    const DeviceDescriptor device = resolveDevice(key.deviceId);
    QString error;
    if (!provider->unsubscribe(device, token, &error))
        qCWarning(registryLog).noquote() << "Unsubscribe" << key.toString() << "failed:" << error;
    return true;
}

int SubscriptionRegistry::removeAll()
{
    QList<SubscriptionKey> keys;
    {
        QReadLocker locker(&m_lock);
        keys = m_entries.keys();
    }

    int removed = 0;
    for (const SubscriptionKey &key : std::as_const(keys)) {
        if (remove(key))
            ++removed;
    }
    return removed;
}

std::optional<SubscriptionKey> SubscriptionRegistry::recordNotification(const QString &token)
{
    QWriteLocker locker(&m_lock);
    const auto tokenIt = m_tokens.constFind(token);
    if (tokenIt == m_tokens.constEnd())
        return std::nullopt;

    const SubscriptionKey key = tokenIt.value();
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return std::nullopt;
    it->lastNotificationAtMs = m_clock();
    return key;
}

std::optional<SubscriptionKey> SubscriptionRegistry::keyForToken(const QString &token) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_tokens.constFind(token);
    if (it == m_tokens.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<SubscriptionInfo> SubscriptionRegistry::info(const SubscriptionKey &key) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd())
        return std::nullopt;
    return toInfo(key, it.value());
}

QList<SubscriptionInfo> SubscriptionRegistry::snapshot() const
{
    QReadLocker locker(&m_lock);
    QList<SubscriptionInfo> out;
    out.reserve(m_entries.size());
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it)
        out.append(toInfo(it.key(), it.value()));
    return out;
}

bool SubscriptionRegistry::contains(const SubscriptionKey &key) const
{
    QReadLocker locker(&m_lock);
    return m_entries.contains(key);
}

int SubscriptionRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return m_entries.size();
}

SubscriptionInfo SubscriptionRegistry::toInfo(const SubscriptionKey &key, const Entry &entry)
{
    SubscriptionInfo info;
    info.key = key;
    info.token = entry.token;
    info.state = entry.state;
    info.createdAtMs = entry.createdAtMs;
    info.expiresAtMs = entry.expiresAtMs;
    info.lastNotificationAtMs = entry.lastNotificationAtMs;
    info.lastRenewedAtMs = entry.lastRenewedAtMs;
    info.failedRenewals = entry.failedRenewals;
    info.nextRetryAtMs = entry.nextRetryAtMs;
    return info;
}

DeviceDescriptor SubscriptionRegistry::resolveDevice(const QString &deviceId) const
{
    if (m_devices)
        return m_devices->resolve(deviceId);
    DeviceDescriptor device;
    device.id = deviceId;
    device.host = deviceId;
    return device;
}

void SubscriptionRegistry::eraseLocked(const SubscriptionKey &key)
{
    const auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd())
        return;
    if (!it->token.isEmpty())
        m_tokens.remove(it->token);
    m_entries.remove(key);
}

} // namespace sonoswatch
