#pragma once

#include <optional>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>

#include "sonos_decoders.h"
#include "sonos_http.h"
#include "sonos_provider.h"

namespace sonoswatch::upnp {

struct ServiceEndpoint {
    QString eventPath;
    QString controlPath;
    QString serviceType;
    // Default namespace of the service's LastChange <Event> document.
    QString eventNamespace;
};

ServiceEndpoint endpointFor(Service service);

// Seconds from a "Second-N" TIMEOUT header; "infinite" and garbage yield fallback.
int parseTimeoutHeader(const QByteArray &value, int fallback);

using SoapArguments = QList<QPair<QString, QString>>;

QByteArray buildSoapEnvelope(const QString &serviceType, const QString &action, const SoapArguments &arguments);
bool parseSoapResponse(const QByteArray &payload,
                       const QString &action,
                       QHash<QString, QString> *values,
                       QString *error = nullptr);
// UPnPError/errorCode of a SOAP fault, or empty.
QString soapFaultCode(const QByteArray &payload);

// GENA subscriptions and SOAP polling for one Sonos service.
class UpnpServiceProvider final : public ServiceProvider
{
public:
    explicit UpnpServiceProvider(Service service, int timeoutMs = 10000);

    Service service() const override { return m_service; }

    SubscribeResult subscribe(const DeviceDescriptor &device, const QString &callbackUrl, int timeoutSec) override;
    RenewResult renew(const DeviceDescriptor &device, const QString &token, int timeoutSec) override;
    bool unsubscribe(const DeviceDescriptor &device, const QString &token, QString *error = nullptr) override;

    bool supportsPolling() const override;
    PollResult poll(const DeviceDescriptor &device, const std::atomic_bool *cancelled = nullptr) override;

    QList<DecodedProperty> decode(const QByteArray &payload) const override;

private:
    struct PollAction {
        QString action;
        SoapArguments arguments;
        // Response field -> LastChange variable name, channel.
        QList<QPair<QString, StateVariable>> mapping;
    };

    QList<PollAction> pollActions() const;
    bool callAction(const HttpClient &http,
                    const ConnectionSettings &settings,
                    const QString &action,
                    const SoapArguments &arguments,
                    QHash<QString, QString> *values,
                    QString *error) const;

    static ConnectionSettings settingsFor(const DeviceDescriptor &device);

    Service m_service;
    ServiceEndpoint m_endpoint;
    int m_timeoutMs = 10000;
};

void registerUpnpProviders(ProviderTable *table, int timeoutMs = 10000);

} // namespace sonoswatch::upnp
