#include "sonos_types.h"

#include <QDateTime>

namespace sonoswatch {

QString serviceName(Service service)
{
    switch (service) {
    case Service::AVTransport:
        return QStringLiteral("AVTransport");
    case Service::RenderingControl:
        return QStringLiteral("RenderingControl");
    case Service::GroupRenderingControl:
        return QStringLiteral("GroupRenderingControl");
    case Service::ZoneGroupTopology:
        return QStringLiteral("ZoneGroupTopology");
    case Service::GroupManagement:
        return QStringLiteral("GroupManagement");
    }
    return QStringLiteral("Unknown");
}

std::optional<Service> serviceFromName(const QString &name)
{
    static const Service all[] = {
        Service::AVTransport,
        Service::RenderingControl,
        Service::GroupRenderingControl,
        Service::ZoneGroupTopology,
        Service::GroupManagement,
    };
    const QString trimmed = name.trimmed();
    for (Service service : all) {
        if (serviceName(service).compare(trimmed, Qt::CaseInsensitive) == 0)
            return service;
    }
    return std::nullopt;
}

qint64 systemClockMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

QString SubscriptionKey::toString() const
{
    return deviceId + QLatin1Char('/') + serviceName(service);
}

size_t qHash(const SubscriptionKey &key, size_t seed) noexcept
{
    return qHashMulti(seed, key.deviceId, static_cast<int>(key.service));
}

QDebug operator<<(QDebug dbg, const SubscriptionKey &key)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace().noquote() << key.toString();
    return dbg;
}

} // namespace sonoswatch
