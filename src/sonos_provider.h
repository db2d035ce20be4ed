#pragma once

#include <atomic>
#include <memory>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QString>

#include "sonos_types.h"

namespace sonoswatch {

struct SubscribeResult {
    bool ok = false;
    QString token;
    int timeoutSec = 0;
    QString error;
};

struct RenewResult {
    bool ok = false;
    int timeoutSec = 0;
    // False when the remote side no longer knows the subscription.
    bool retryable = true;
    QString error;
};

struct PollResult {
    bool ok = false;
    QByteArray payload;
    QString error;
};

// Per-service transport and decoding capabilities.
class ServiceProvider
{
public:
    virtual ~ServiceProvider() = default;

    virtual Service service() const = 0;

    virtual SubscribeResult subscribe(const DeviceDescriptor &device,
                                      const QString &callbackUrl,
                                      int timeoutSec) = 0;
    virtual RenewResult renew(const DeviceDescriptor &device, const QString &token, int timeoutSec) = 0;
    virtual bool unsubscribe(const DeviceDescriptor &device, const QString &token, QString *error = nullptr) = 0;

    virtual bool supportsPolling() const { return false; }
    // Returns early with an error once *cancelled becomes true.
    virtual PollResult poll(const DeviceDescriptor &device, const std::atomic_bool *cancelled = nullptr)
    {
        Q_UNUSED(device);
        Q_UNUSED(cancelled);
        PollResult result;
        result.error = QStringLiteral("Polling not supported for %1").arg(serviceName(service()));
        return result;
    }

    // Must not throw; unparseable fields are left out of the result.
    virtual QList<DecodedProperty> decode(const QByteArray &payload) const = 0;
};

class ProviderTable
{
public:
    void registerProvider(std::shared_ptr<ServiceProvider> provider);
    void unregisterProvider(Service service);

    std::shared_ptr<ServiceProvider> provider(Service service) const;
    bool contains(Service service) const;

private:
    mutable QReadWriteLock m_lock;
    QHash<int, std::shared_ptr<ServiceProvider>> m_providers;
};

class DeviceDirectory
{
public:
    void addDevice(const DeviceDescriptor &device);
    bool removeDevice(const QString &id);

    // Unknown ids resolve to themselves as host on the default port.
    DeviceDescriptor resolve(const QString &id) const;
    bool contains(const QString &id) const;
    QList<DeviceDescriptor> devices() const;

private:
    mutable QReadWriteLock m_lock;
    QHash<QString, DeviceDescriptor> m_devices;
};

} // namespace sonoswatch
