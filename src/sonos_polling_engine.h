#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QPair>
#include <QString>

#include "sonos_config.h"
#include "sonos_event_processor.h"
#include "sonos_provider.h"
#include "sonos_types.h"

namespace sonoswatch {

enum class PollReason {
    SubscribeFailed,
    SubscriptionExpired,
    PushSilent,
    DeviceBlocked
};

QString pollReasonName(PollReason reason);

class PollTask;

// One poll task per key; every result goes through the event processor like a push event.
class PollingEngine : public QObject
{
    Q_OBJECT

public:
    PollingEngine(const ProviderTable *providers,
                  const DeviceDirectory *devices,
                  EventProcessor *processor,
                  const EngineConfig &config,
                  const Clock &clock = Clock(),
                  QObject *parent = nullptr);
    ~PollingEngine() override;

    // Idempotent; an already running task keeps its original reason.
    bool start(const SubscriptionKey &key, PollReason reason, QString *error = nullptr);
    // Cancels the task and its poll in flight without waiting for the thread.
    bool stop(const SubscriptionKey &key);
    // Stops every task and joins the threads, bounded by shutdownTimeoutMs each.
    void stopAll();

    bool isPolling(const SubscriptionKey &key) const;
    std::optional<PollReason> reason(const SubscriptionKey &key) const;
    QList<SubscriptionKey> activeKeys() const;

    // Issues a single poll on the calling thread and enqueues the result.
    // Nothing is enqueued once *cancelled is raised.
    bool pollOnce(const SubscriptionKey &key, QString *error = nullptr, const std::atomic_bool *cancelled = nullptr);

    qint64 pollCount() const { return m_polls.load(); }
    qint64 pollFailureCount() const { return m_failures.load(); }
    // Tasks that missed the shutdown bound and had to be terminated.
    int terminatedTaskCount() const { return m_terminated.load(); }
    // Stopped tasks whose thread has not been reaped yet.
    int retiredTaskCount() const;

signals:
    void pollingStarted(const sonoswatch::SubscriptionKey &key, const QString &reason);
    void pollingStopped(const sonoswatch::SubscriptionKey &key);

private:
    struct TaskEntry {
        PollReason reason = PollReason::SubscribeFailed;
        std::shared_ptr<PollTask> task;
    };

    void joinTask(const SubscriptionKey &key, const std::shared_ptr<PollTask> &task);
    // Drops retired tasks whose thread has finished. Caller holds m_mutex.
    void reapFinishedLocked();

    const ProviderTable *m_providers = nullptr;
    const DeviceDirectory *m_devices = nullptr;
    EventProcessor *m_processor = nullptr;
    EngineConfig m_config;
    Clock m_clock;

    mutable QMutex m_mutex;
    QHash<SubscriptionKey, TaskEntry> m_tasks;
    QList<QPair<SubscriptionKey, std::shared_ptr<PollTask>>> m_retired;

    std::atomic<qint64> m_polls{0};
    std::atomic<qint64> m_failures{0};
    std::atomic<int> m_terminated{0};
};

} // namespace sonoswatch
