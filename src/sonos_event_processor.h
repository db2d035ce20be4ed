#pragma once

#include <atomic>
#include <memory>

#include <QList>
#include <QMutex>
#include <QQueue>
#include <QThread>
#include <QWaitCondition>

#include "sonos_property_store.h"
#include "sonos_provider.h"
#include "sonos_types.h"

namespace sonoswatch {

// Single worker draining one FIFO, so notifications for a key are applied in arrival order.
class EventProcessor
{
public:
    EventProcessor(const ProviderTable *providers, PropertyStore *store);
    ~EventProcessor();

    EventProcessor(const EventProcessor &) = delete;
    EventProcessor &operator=(const EventProcessor &) = delete;

    void start();
    bool isRunning() const;

    // Never blocks on decoding; returns false once the queue is closed.
    bool enqueue(const RawNotification &notification);

    QList<DecodedChange> decode(const RawNotification &notification) const;
    // Decodes and applies one notification; returns the number of values that changed.
    int process(const RawNotification &notification);
    // Drains the queue on the calling thread.
    int processPending();

    // Closes the queue, lets the worker drain within the timeout, then terminates it.
    bool stop(int timeoutMs);

    int pendingCount() const;
    qint64 processedCount() const { return m_processed.load(); }
    qint64 appliedCount() const { return m_applied.load(); }
    qint64 discardedCount() const { return m_discarded.load(); }

private:
    void run();

    const ProviderTable *m_providers = nullptr;
    PropertyStore *m_store = nullptr;

    mutable QMutex m_mutex;
    QWaitCondition m_wake;
    QQueue<RawNotification> m_queue;
    bool m_closed = false;
    std::unique_ptr<QThread> m_thread;

    std::atomic<qint64> m_processed{0};
    std::atomic<qint64> m_applied{0};
    std::atomic<qint64> m_discarded{0};
};

} // namespace sonoswatch
