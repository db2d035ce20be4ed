#include "sonos_event_manager.h"

#include <QDeadlineTimer>
#include <QMetaObject>
#include <QThread>

#include "sonos_log.h"
#include "sonos_properties.h"
#include "sonos_upnp.h"

namespace sonoswatch {

EventManager::EventManager(const EngineConfig &config, const Clock &clock, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_clock(clock ? clock : Clock(&systemClockMs))
    , m_store(config.changeBufferSize, m_clock)
{
    registerMetaTypes();

    m_registry = std::make_unique<SubscriptionRegistry>(&m_providers, &m_devices, m_config, m_clock);
    m_processor = std::make_unique<EventProcessor>(&m_providers, &m_store);
    m_router = std::make_unique<NotificationRouter>(m_registry.get(), m_processor.get(), m_clock);

    m_polling = new PollingEngine(&m_providers, &m_devices, m_processor.get(), m_config, m_clock, this);
    m_scheduler = new RenewalScheduler(m_registry.get(), m_config, m_clock);
    m_firewall = new FirewallDetector(m_registry.get(), m_config, m_clock);
    m_callbackServer = new CallbackServer(m_router.get(), m_config);
    m_demand = new DemandTracker(m_registry.get(), m_polling, m_firewall, this);

    // Direct: the handlers lock per key and may run on the engine thread.
    connect(m_scheduler, &RenewalScheduler::subscriptionExpired,
            m_demand, &DemandTracker::onSubscriptionExpired, Qt::DirectConnection);
    connect(m_firewall, &FirewallDetector::pushSilent,
            m_demand, &DemandTracker::onPushSilent, Qt::DirectConnection);
    connect(m_firewall, &FirewallDetector::pushResumed,
            m_demand, &DemandTracker::onPushResumed, Qt::DirectConnection);
}

EventManager::~EventManager()
{
    shutdown();

    delete m_demand;
    m_demand = nullptr;
    delete m_polling;
    m_polling = nullptr;

    delete m_callbackServer;
    delete m_firewall;
    delete m_scheduler;
    delete m_engineThread;
}

void EventManager::registerProvider(std::shared_ptr<ServiceProvider> provider)
{
    m_providers.registerProvider(std::move(provider));
}

void EventManager::registerDefaultProviders()
{
    upnp::registerUpnpProviders(&m_providers, m_config.httpTimeoutMs);
}

void EventManager::addDevice(const DeviceDescriptor &device)
{
    m_devices.addDevice(device);
}

void EventManager::removeDevice(const QString &deviceId)
{
    m_devices.removeDevice(deviceId);
    m_store.removeEntity(deviceId);
    m_firewall->clearDevice(deviceId);
}

bool EventManager::start(QString *error)
{
    if (m_started) {
        if (error)
            error->clear();
        return true;
    }
    if (m_shutDown) {
        if (error)
            *error = QStringLiteral("Event manager was already shut down");
        return false;
    }
    if (!m_config.validate(error))
        return false;

    m_processor->start();

    m_engineThread = new QThread;
    m_engineThread->setObjectName(QStringLiteral("sonoswatch-engine"));
    m_scheduler->moveToThread(m_engineThread);
    m_firewall->moveToThread(m_engineThread);
    m_callbackServer->moveToThread(m_engineThread);
    m_engineThread->start();

    bool listening = false;
    QString listenError;
    QString url;
    QMetaObject::invokeMethod(
        m_callbackServer,
        [this, &listening, &listenError, &url]() {
            listening = m_callbackServer->listen(&listenError);
            url = m_callbackServer->callbackUrl();
        },
        Qt::BlockingQueuedConnection);

    if (!listening) {
        qCWarning(managerLog).noquote() << "Cannot start callback server:" << listenError;
        if (error)
            *error = listenError;
        shutdown();
        return false;
    }

    m_registry->setCallbackUrl(url);
    QMetaObject::invokeMethod(m_scheduler, &RenewalScheduler::start, Qt::QueuedConnection);
    QMetaObject::invokeMethod(m_firewall, &FirewallDetector::start, Qt::QueuedConnection);

    m_started = true;
    qCInfo(managerLog).noquote() << "Event manager started, callback" << url;
    if (error)
        error->clear();
    return true;
}

void EventManager::shutdown()
{
    if (m_shutDown)
        return;
    m_shutDown = true;
    qCInfo(managerLog) << "Shutting down event manager";

    if (m_engineThread && m_engineThread->isRunning()) {
        QThread *home = thread();
        QMetaObject::invokeMethod(
            m_scheduler,
            [this, home]() {
                m_scheduler->stop();
                m_firewall->stop();
                m_callbackServer->close();
                m_scheduler->moveToThread(home);
                m_firewall->moveToThread(home);
                m_callbackServer->moveToThread(home);
                QThread::currentThread()->quit();
            },
            Qt::QueuedConnection);
        if (!m_engineThread->wait(QDeadlineTimer(m_config.shutdownTimeoutMs))) {
            qCWarning(managerLog) << "Engine thread did not stop within" << m_config.shutdownTimeoutMs
                                  << "ms, terminating";
            m_engineThread->terminate();
            m_engineThread->wait();
        }
    } else {
        m_scheduler->stop();
        m_firewall->stop();
        m_callbackServer->close();
    }
    m_polling->stopAll();

    m_processor->stop(m_config.shutdownTimeoutMs);

    const int removed = m_registry->removeAll();
    if (removed > 0)
        qCInfo(managerLog) << "Unsubscribed" << removed << "subscriptions";

    m_store.close();
}

EnsureResult EventManager::ensureWatch(const QString &entity, Service service)
{
    if (m_shutDown) {
        EnsureResult result;
        result.error = QStringLiteral("Event manager is shut down");
        return result;
    }
    return m_demand->ensure(SubscriptionKey{entity, service});
}

bool EventManager::releaseWatch(const QString &entity, Service service)
{
    return m_demand->release(SubscriptionKey{entity, service});
}

EnsureResult EventManager::watchProperty(const QString &entity, const QString &key, Service service)
{
    {
        QMutexLocker locker(&m_watchMutex);
        int &count = m_watchCounts[qMakePair(entity, key)];
        if (++count == 1)
            m_store.watch(entity, key);
    }
    return ensureWatch(entity, service);
}

bool EventManager::unwatchProperty(const QString &entity, const QString &key, Service service)
{
    {
        QMutexLocker locker(&m_watchMutex);
        const auto it = m_watchCounts.find(qMakePair(entity, key));
        if (it == m_watchCounts.end()) {
            qCWarning(managerLog).noquote() << "unwatch of" << entity << key << "without a matching watch";
            return false;
        }
        if (--it.value() == 0) {
            m_watchCounts.erase(it);
            m_store.unwatch(entity, key);
        }
    }
    return releaseWatch(entity, service);
}

ChangeIterator EventManager::iterateChanges()
{
    return m_store.iterate();
}

QString EventManager::callbackUrl() const
{
    return m_registry->callbackUrl();
}

EngineStats EventManager::stats() const
{
    EngineStats stats;
    stats.notificationsRouted = m_router->routedCount();
    stats.notificationsDropped = m_router->droppedCount();
    stats.eventsProcessed = m_processor->processedCount();
    stats.changesApplied = m_processor->appliedCount();
    stats.polls = m_polling->pollCount();
    stats.pollFailures = m_polling->pollFailureCount();
    stats.subscriptions = m_registry->size();
    stats.pollingKeys = m_polling->activeKeys().size();
    return stats;
}

} // namespace sonoswatch
