#include "sonos_notification_router.h"

#include "sonos_log.h"

namespace sonoswatch {

NotificationRouter::NotificationRouter(SubscriptionRegistry *registry, EventProcessor *processor, const Clock &clock)
    : m_registry(registry)
    , m_processor(processor)
    , m_clock(clock ? clock : Clock(&systemClockMs))
{
}

bool NotificationRouter::deliver(const QString &token, const QByteArray &payload)
{
    const QString sid = token.trimmed();
    const std::optional<SubscriptionKey> key = m_registry ? m_registry->recordNotification(sid) : std::nullopt;
    if (!key) {
        ++m_dropped;
        qCDebug(callbackLog).noquote() << "Dropping notification for unknown subscription" << sid
                                       << "(" << payload.size() << "bytes)";
        return false;
    }

    RawNotification notification;
    notification.token = sid;
    notification.key = *key;
    notification.payload = payload;
    notification.arrivedAtMs = m_clock();
    notification.origin = NotificationOrigin::Push;

    if (!m_processor || !m_processor->enqueue(notification)) {
        ++m_dropped;
        qCDebug(callbackLog).noquote() << "Event processor unavailable, dropping notification for" << key->toString();
        return false;
    }

    ++m_routed;
    return true;
}

} // namespace sonoswatch
