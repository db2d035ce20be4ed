#include "sonos_provider.h"

namespace sonoswatch {

void ProviderTable::registerProvider(std::shared_ptr<ServiceProvider> provider)
{
    if (!provider)
        return;
    const int service = static_cast<int>(provider->service());
    QWriteLocker locker(&m_lock);
    m_providers.insert(service, std::move(provider));
}

void ProviderTable::unregisterProvider(Service service)
{
    QWriteLocker locker(&m_lock);
    m_providers.remove(static_cast<int>(service));
}

std::shared_ptr<ServiceProvider> ProviderTable::provider(Service service) const
{
    QReadLocker locker(&m_lock);
    return m_providers.value(static_cast<int>(service));
}

bool ProviderTable::contains(Service service) const
{
    QReadLocker locker(&m_lock);
    return m_providers.contains(static_cast<int>(service));
}

void DeviceDirectory::addDevice(const DeviceDescriptor &device)
{
    if (device.id.isEmpty())
        return;
    QWriteLocker locker(&m_lock);
    m_devices.insert(device.id, device);
}

bool DeviceDirectory::removeDevice(const QString &id)
{
    QWriteLocker locker(&m_lock);
    return m_devices.remove(id) > 0;
}

DeviceDescriptor DeviceDirectory::resolve(const QString &id) const
{
    {
        QReadLocker locker(&m_lock);
        const auto it = m_devices.constFind(id);
        if (it != m_devices.constEnd())
            return it.value();
    }

    DeviceDescriptor device;
    device.id = id;
    device.host = id;
    return device;
}

bool DeviceDirectory::contains(const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_devices.contains(id);
}

QList<DeviceDescriptor> DeviceDirectory::devices() const
{
    QReadLocker locker(&m_lock);
    return m_devices.values();
}

} // namespace sonoswatch
