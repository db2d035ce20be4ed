#include "sonos_polling_engine.h"

#include <algorithm>
#include <utility>

#include <QDeadlineTimer>
#include <QThread>
#include <QWaitCondition>

#include "sonos_log.h"

namespace sonoswatch {

namespace {

constexpr int kTaskDestroyTimeoutMs = 5000;

} // namespace

QString pollReasonName(PollReason reason)
{
    switch (reason) {
    case PollReason::SubscribeFailed:
        return QStringLiteral("subscribe-failed");
    case PollReason::SubscriptionExpired:
        return QStringLiteral("subscription-expired");
    case PollReason::PushSilent:
        return QStringLiteral("push-silent");
    case PollReason::DeviceBlocked:
        return QStringLiteral("device-blocked");
    }
    return QStringLiteral("unknown");
}

class PollTask
{
public:
    PollTask(PollingEngine *engine, const SubscriptionKey &key, int intervalMs)
        : m_engine(engine)
        , m_key(key)
        , m_intervalMs(std::max(10, intervalMs))
    {
    }

    ~PollTask()
    {
        requestStop();
        join(kTaskDestroyTimeoutMs);
    }

    void start()
    {
        m_thread.reset(QThread::create([this]() { run(); }));
        m_thread->setObjectName(QStringLiteral("sonoswatch-poll"));
        m_thread->start();
    }

    // Also cancels a poll in flight.
    void requestStop()
    {
        m_cancelled = true;
        QMutexLocker locker(&m_mutex);
        m_stopping = true;
        m_wake.wakeAll();
    }

    bool isFinished() const
    {
        return !m_thread || m_thread->isFinished();
    }

    // False when the thread had to be terminated.
    bool join(int timeoutMs)
    {
        if (!m_thread)
            return true;
        if (m_thread->wait(QDeadlineTimer(std::max(0, timeoutMs))))
            return true;
        m_thread->terminate();
        m_thread->wait();
        return false;
    }

private:
    void run()
    {
        int consecutiveFailures = 0;
        for (;;) {
            {
                QMutexLocker locker(&m_mutex);
                if (m_stopping)
                    return;
            }

            QString error;
            const bool polled = m_engine->pollOnce(m_key, &error, &m_cancelled);
            if (m_cancelled)
                return;
            if (polled) {
                if (consecutiveFailures > 0)
                    qCInfo(pollingLog).noquote() << "Polling" << m_key.toString() << "recovered after"
                                                 << consecutiveFailures << "failures";
                consecutiveFailures = 0;
            } else if (++consecutiveFailures == 1) {
                qCWarning(pollingLog).noquote() << "Poll of" << m_key.toString() << "failed:" << error;
            }

            QMutexLocker locker(&m_mutex);
            if (!m_stopping)
                m_wake.wait(&m_mutex, QDeadlineTimer(m_intervalMs));
            if (m_stopping)
                return;
        }
    }

    PollingEngine *m_engine = nullptr;
    const SubscriptionKey m_key;
    const int m_intervalMs;

    std::atomic_bool m_cancelled{false};
    QMutex m_mutex;
    QWaitCondition m_wake;
    bool m_stopping = false;
    std::unique_ptr<QThread> m_thread;
};

PollingEngine::PollingEngine(const ProviderTable *providers,
                             const DeviceDirectory *devices,
                             EventProcessor *processor,
                             const EngineConfig &config,
                             const Clock &clock,
                             QObject *parent)
    : QObject(parent)
    , m_providers(providers)
    , m_devices(devices)
    , m_processor(processor)
    , m_config(config)
    , m_clock(clock ? clock : Clock(&systemClockMs))
{
}

PollingEngine::~PollingEngine()
{
    stopAll();
}

bool PollingEngine::start(const SubscriptionKey &key, PollReason reason, QString *error)
{
    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(key.service) : nullptr;
    if (!provider || !provider->supportsPolling()) {
        const QString message = provider
            ? QStringLiteral("%1 does not support polling").arg(serviceName(key.service))
            : QStringLiteral("No provider registered for %1").arg(serviceName(key.service));
        qCWarning(pollingLog).noquote() << "Cannot poll" << key.toString() << ":" << message;
        if (error)
            *error = message;
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        reapFinishedLocked();
        if (m_tasks.contains(key)) {
            if (error)
                error->clear();
            return true;
        }

        TaskEntry entry;
        entry.reason = reason;
        entry.task = std::make_shared<PollTask>(this, key, m_config.pollIntervalMs);
        entry.task->start();
        m_tasks.insert(key, entry);
    }

    qCInfo(pollingLog).noquote() << "Polling started for" << key.toString() << "reason=" << pollReasonName(reason)
                                 << "interval=" << m_config.pollIntervalMs << "ms";
    emit pollingStarted(key, pollReasonName(reason));
    if (error)
        error->clear();
    return true;
}

bool PollingEngine::stop(const SubscriptionKey &key)
{
    {
        QMutexLocker locker(&m_mutex);
        const auto it = m_tasks.constFind(key);
        if (it == m_tasks.constEnd())
            return false;
        const std::shared_ptr<PollTask> task = it->task;
        m_tasks.remove(key);
        task->requestStop();
        m_retired.append(qMakePair(key, task));
        reapFinishedLocked();
    }

    qCInfo(pollingLog).noquote() << "Polling stopped for" << key.toString();
    emit pollingStopped(key);
    return true;
}

void PollingEngine::stopAll()
{
    QHash<SubscriptionKey, TaskEntry> tasks;
    QList<QPair<SubscriptionKey, std::shared_ptr<PollTask>>> retired;
    {
        QMutexLocker locker(&m_mutex);
        tasks.swap(m_tasks);
        retired.swap(m_retired);
    }

    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it)
        it->task->requestStop();
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        joinTask(it.key(), it->task);
        qCInfo(pollingLog).noquote() << "Polling stopped for" << it.key().toString();
        emit pollingStopped(it.key());
    }
    for (const auto &task : std::as_const(retired))
        joinTask(task.first, task.second);
}

int PollingEngine::retiredTaskCount() const
{
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (const auto &task : m_retired) {
        if (!task.second->isFinished())
            ++count;
    }
    return count;
}

bool PollingEngine::isPolling(const SubscriptionKey &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_tasks.contains(key);
}

std::optional<PollReason> PollingEngine::reason(const SubscriptionKey &key) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_tasks.constFind(key);
    if (it == m_tasks.constEnd())
        return std::nullopt;
    return it->reason;
}

QList<SubscriptionKey> PollingEngine::activeKeys() const
{
    QMutexLocker locker(&m_mutex);
    return m_tasks.keys();
}

bool PollingEngine::pollOnce(const SubscriptionKey &key, QString *error, const std::atomic_bool *cancelled)
{
    const std::shared_ptr<ServiceProvider> provider = m_providers ? m_providers->provider(key.service) : nullptr;
    if (!provider) {
        if (error)
            *error = QStringLiteral("No provider registered for %1").arg(serviceName(key.service));
        return false;
    }

    DeviceDescriptor device;
    if (m_devices) {
        device = m_devices->resolve(key.deviceId);
    } else {
        device.id = key.deviceId;
        device.host = key.deviceId;
    }

    if (cancelled && cancelled->load()) {
        if (error)
            *error = QStringLiteral("Poll of %1 cancelled").arg(key.toString());
        return false;
    }

    ++m_polls;
    const PollResult result = provider->poll(device, cancelled);
    if (cancelled && cancelled->load()) {
        if (error)
            *error = QStringLiteral("Poll of %1 cancelled").arg(key.toString());
        return false;
    }
    if (!result.ok) {
        ++m_failures;
        if (error)
            *error = result.error;
        qCDebug(pollingLog).noquote() << "Poll of" << key.toString() << "failed:" << result.error;
        return false;
    }

    RawNotification notification;
    notification.key = key;
    notification.payload = result.payload;
    notification.arrivedAtMs = m_clock();
    notification.origin = NotificationOrigin::Poll;
    if (!m_processor || !m_processor->enqueue(notification)) {
        if (error)
            *error = QStringLiteral("Event processor unavailable");
        return false;
    }

    if (error)
        error->clear();
    return true;
}

void PollingEngine::joinTask(const SubscriptionKey &key, const std::shared_ptr<PollTask> &task)
{
    task->requestStop();
    if (task->join(m_config.shutdownTimeoutMs))
        return;
    ++m_terminated;
    qCWarning(pollingLog).noquote() << "Poll task for" << key.toString() << "did not stop within"
                                    << m_config.shutdownTimeoutMs << "ms, terminated";
}

void PollingEngine::reapFinishedLocked()
{
    m_retired.removeIf([](const QPair<SubscriptionKey, std::shared_ptr<PollTask>> &task) {
        return task.second->isFinished();
    });
}

} // namespace sonoswatch
