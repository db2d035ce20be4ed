#pragma once

#include <optional>

#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QString>

#include "sonos_config.h"
#include "sonos_provider.h"
#include "sonos_types.h"

namespace sonoswatch {

enum class SubscriptionState {
    Pending,
    Active,
    Renewing,
    Expired,
    Removed
};

QString subscriptionStateName(SubscriptionState state);

// Copy of a registry entry; the entries themselves never leave the registry lock.
struct SubscriptionInfo {
    SubscriptionKey key;
    QString token;
    SubscriptionState state = SubscriptionState::Pending;
    qint64 createdAtMs = 0;
    qint64 expiresAtMs = 0;
    qint64 lastNotificationAtMs = 0;
    qint64 lastRenewedAtMs = 0;
    int failedRenewals = 0;
    qint64 nextRetryAtMs = 0;
};

enum class CreateError {
    None,
    Conflict,
    ProviderMissing,
    RemoteRejected
};

struct CreateResult {
    bool ok = false;
    CreateError error = CreateError::None;
    QString message;
};

enum class RenewStatus {
    Renewed,
    Failed,
    Rejected,
    NotFound
};

struct RenewOutcome {
    RenewStatus status = RenewStatus::NotFound;
    int failedRenewals = 0;
    QString error;
};

class SubscriptionRegistry
{
public:
    SubscriptionRegistry(const ProviderTable *providers,
                         const DeviceDirectory *devices,
                         const EngineConfig &config,
                         const Clock &clock = Clock());

    void setCallbackUrl(const QString &url);
    QString callbackUrl() const;

    CreateResult create(const SubscriptionKey &key);

    // One renewal round trip. Failures are counted but the entry stays in
    // Renewing; expiring it is the caller's decision.
    RenewOutcome renew(const SubscriptionKey &key);
    bool scheduleRetry(const SubscriptionKey &key, qint64 retryAtMs);
    std::optional<SubscriptionInfo> expire(const SubscriptionKey &key);

    // Best-effort remote unsubscribe; the local entry is always dropped.
    bool remove(const SubscriptionKey &key);
    int removeAll();

    // Resolves a token and stamps its last-notification time.
    std::optional<SubscriptionKey> recordNotification(const QString &token);
    std::optional<SubscriptionKey> keyForToken(const QString &token) const;

    std::optional<SubscriptionInfo> info(const SubscriptionKey &key) const;
    QList<SubscriptionInfo> snapshot() const;
    bool contains(const SubscriptionKey &key) const;
    int size() const;

private:
    struct Entry {
        QString token;
        SubscriptionState state = SubscriptionState::Pending;
        qint64 createdAtMs = 0;
        qint64 expiresAtMs = 0;
        qint64 lastNotificationAtMs = 0;
        qint64 lastRenewedAtMs = 0;
        int failedRenewals = 0;
        qint64 nextRetryAtMs = 0;
    };

    static SubscriptionInfo toInfo(const SubscriptionKey &key, const Entry &entry);
    DeviceDescriptor resolveDevice(const QString &deviceId) const;
    void eraseLocked(const SubscriptionKey &key);

    const ProviderTable *m_providers = nullptr;
    const DeviceDirectory *m_devices = nullptr;
    EngineConfig m_config;
    Clock m_clock;

    mutable QReadWriteLock m_lock;
    QHash<SubscriptionKey, Entry> m_entries;
    QHash<QString, SubscriptionKey> m_tokens;
    QString m_callbackUrl;
};

} // namespace sonoswatch
