#pragma once

#include <atomic>

#include <QByteArray>
#include <QString>

#include "sonos_event_processor.h"
#include "sonos_subscription_registry.h"
#include "sonos_types.h"

namespace sonoswatch {

class NotificationRouter
{
public:
    NotificationRouter(SubscriptionRegistry *registry, EventProcessor *processor, const Clock &clock = Clock());

    // Resolves the token and hands the payload to the event processor without decoding it.
    // Unknown tokens are dropped and reported as false.
    bool deliver(const QString &token, const QByteArray &payload);

    qint64 routedCount() const { return m_routed.load(); }
    qint64 droppedCount() const { return m_dropped.load(); }

private:
    SubscriptionRegistry *m_registry = nullptr;
    EventProcessor *m_processor = nullptr;
    Clock m_clock;

    std::atomic<qint64> m_routed{0};
    std::atomic<qint64> m_dropped{0};
};

} // namespace sonoswatch
