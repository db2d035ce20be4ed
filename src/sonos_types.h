#pragma once

#include <functional>
#include <optional>

#include <QByteArray>
#include <QDebug>
#include <QHash>
#include <QMetaType>
#include <QString>
#include <QVariant>

namespace sonoswatch {

enum class Service {
    AVTransport,
    RenderingControl,
    GroupRenderingControl,
    ZoneGroupTopology,
    GroupManagement
};

QString serviceName(Service service);
std::optional<Service> serviceFromName(const QString &name);

// Milliseconds since epoch.
using Clock = std::function<qint64()>;
qint64 systemClockMs();

struct SubscriptionKey {
    QString deviceId;
    Service service = Service::RenderingControl;

    bool operator==(const SubscriptionKey &other) const
    {
        return service == other.service && deviceId == other.deviceId;
    }
    bool operator!=(const SubscriptionKey &other) const { return !(*this == other); }

    QString toString() const;
};

size_t qHash(const SubscriptionKey &key, size_t seed = 0) noexcept;
QDebug operator<<(QDebug dbg, const SubscriptionKey &key);

struct DeviceDescriptor {
    QString id;
    QString host;
    int port = 1400;
};

enum class NotificationOrigin {
    Push,
    Poll
};

struct RawNotification {
    QString token;
    SubscriptionKey key;
    QByteArray payload;
    qint64 arrivedAtMs = 0;
    NotificationOrigin origin = NotificationOrigin::Push;
};

struct DecodedProperty {
    QString key;
    QVariant value;
};

struct DecodedChange {
    QString entity;
    QString key;
    Service service = Service::RenderingControl;
    QVariant value;
};

struct ChangeEvent {
    QString entity;
    QString key;
    Service service = Service::RenderingControl;
    qint64 timestampMs = 0;
};

} // namespace sonoswatch

Q_DECLARE_METATYPE(sonoswatch::SubscriptionKey)
Q_DECLARE_METATYPE(sonoswatch::ChangeEvent)
