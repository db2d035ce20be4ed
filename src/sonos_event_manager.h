#pragma once

#include <memory>
#include <optional>

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPair>
#include <QString>

#include "sonos_callback_server.h"
#include "sonos_config.h"
#include "sonos_demand_tracker.h"
#include "sonos_event_processor.h"
#include "sonos_firewall.h"
#include "sonos_notification_router.h"
#include "sonos_polling_engine.h"
#include "sonos_property_store.h"
#include "sonos_provider.h"
#include "sonos_renewal_scheduler.h"
#include "sonos_subscription_registry.h"
#include "sonos_types.h"

class QThread;

namespace sonoswatch {

struct EngineStats {
    qint64 notificationsRouted = 0;
    qint64 notificationsDropped = 0;
    qint64 eventsProcessed = 0;
    qint64 changesApplied = 0;
    qint64 polls = 0;
    qint64 pollFailures = 0;
    int subscriptions = 0;
    int pollingKeys = 0;
};

// Owns the engine and exposes the consumer API. Components can be driven by
// hand (ticks, processPending) until start() spins up the background threads.
class EventManager : public QObject
{
    Q_OBJECT

public:
    explicit EventManager(const EngineConfig &config = EngineConfig(),
                          const Clock &clock = Clock(),
                          QObject *parent = nullptr);
    ~EventManager() override;

    void registerProvider(std::shared_ptr<ServiceProvider> provider);
    void registerDefaultProviders();

    void addDevice(const DeviceDescriptor &device);
    // Drops the device's cached properties and firewall status.
    void removeDevice(const QString &deviceId);

    bool start(QString *error = nullptr);
    void shutdown();
    bool isStarted() const { return m_started; }

    EnsureResult ensureWatch(const QString &entity, Service service);
    bool releaseWatch(const QString &entity, Service service);

    // Typed watches are counted per (entity, property); the property stays in
    // the watch set until every watch<P> has been matched by an unwatch<P>.
    template <typename P>
    EnsureResult watch(const QString &entity)
    {
        return watchProperty(entity, QString::fromLatin1(P::key), P::service);
    }

    template <typename P>
    bool unwatch(const QString &entity)
    {
        return unwatchProperty(entity, QString::fromLatin1(P::key), P::service);
    }

    EnsureResult watchProperty(const QString &entity, const QString &key, Service service);
    // False when the property had no outstanding watch.
    bool unwatchProperty(const QString &entity, const QString &key, Service service);

    template <typename P>
    std::optional<P> get(const QString &entity) const
    {
        return m_store.get<P>(entity);
    }

    ChangeIterator iterateChanges();

    QString callbackUrl() const;
    EngineStats stats() const;
    const EngineConfig &config() const { return m_config; }

    PropertyStore *store() { return &m_store; }
    SubscriptionRegistry *registry() { return m_registry.get(); }
    NotificationRouter *router() { return m_router.get(); }
    EventProcessor *processor() { return m_processor.get(); }
    PollingEngine *polling() { return m_polling; }
    FirewallDetector *firewall() { return m_firewall; }
    RenewalScheduler *scheduler() { return m_scheduler; }
    DemandTracker *demand() { return m_demand; }
    DeviceDirectory *devices() { return &m_devices; }

private:
    EngineConfig m_config;
    Clock m_clock;

    ProviderTable m_providers;
    DeviceDirectory m_devices;
    PropertyStore m_store;

    QMutex m_watchMutex;
    QHash<QPair<QString, QString>, int> m_watchCounts;
    std::unique_ptr<SubscriptionRegistry> m_registry;
    std::unique_ptr<EventProcessor> m_processor;
    std::unique_ptr<NotificationRouter> m_router;

    PollingEngine *m_polling = nullptr;
    DemandTracker *m_demand = nullptr;

    // Live in m_engineThread once started.
    RenewalScheduler *m_scheduler = nullptr;
    FirewallDetector *m_firewall = nullptr;
    CallbackServer *m_callbackServer = nullptr;
    QThread *m_engineThread = nullptr;

    bool m_started = false;
    bool m_shutDown = false;
};

} // namespace sonoswatch
