#pragma once

#include <memory>

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>

#include "sonos_firewall.h"
#include "sonos_polling_engine.h"
#include "sonos_subscription_registry.h"
#include "sonos_types.h"

namespace sonoswatch {

struct EnsureResult {
    bool ok = false;
    bool subscribed = false;
    bool polling = false;
    int demand = 0;
    QString error;
};

// Reference counts consumer interest per key. The count change and the
// subscribe/unsubscribe/poll side effects run under the same per-key lock.
class DemandTracker : public QObject
{
    Q_OBJECT

public:
    DemandTracker(SubscriptionRegistry *registry,
                  PollingEngine *polling,
                  const FirewallDetector *firewall = nullptr,
                  QObject *parent = nullptr);

    EnsureResult ensure(const SubscriptionKey &key);
    // False when there was no demand to release.
    bool release(const SubscriptionKey &key);

    int demand(const SubscriptionKey &key) const;
    QList<SubscriptionKey> demandedKeys() const;
    // Keys with a bookkeeping entry; idle keys are dropped on their last release.
    int trackedKeyCount() const;

public slots:
    void onSubscriptionExpired(const sonoswatch::SubscriptionKey &key, const QString &reason);
    void onPushSilent(const sonoswatch::SubscriptionKey &key);
    void onPushResumed(const sonoswatch::SubscriptionKey &key);

private:
    struct KeyDemand {
        QMutex mutex;
        int count = 0;
    };

    std::shared_ptr<KeyDemand> demandFor(const SubscriptionKey &key) const;
    std::shared_ptr<KeyDemand> findDemand(const SubscriptionKey &key) const;
    // Erases the entry unless another caller still holds it. Caller holds entry->mutex.
    void dropIfIdle(const SubscriptionKey &key, const std::shared_ptr<KeyDemand> &entry);

    SubscriptionRegistry *m_registry = nullptr;
    PollingEngine *m_polling = nullptr;
    const FirewallDetector *m_firewall = nullptr;

    mutable QMutex m_mapMutex;
    mutable QHash<SubscriptionKey, std::shared_ptr<KeyDemand>> m_keys;
};

} // namespace sonoswatch
