#include "sonos_upnp.h"

#include <memory>

#include <QNetworkAccessManager>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include "sonos_log.h"

namespace sonoswatch::upnp {

namespace {

const QString kSoapEnvelopeNs = QStringLiteral("http://schemas.xmlsoap.org/soap/envelope/");
const QString kSoapEncoding = QStringLiteral("http://schemas.xmlsoap.org/soap/encoding/");

StateVariable variable(const QString &name, const QString &channel = QString())
{
    StateVariable out;
    out.name = name;
    out.channel = channel;
    return out;
}

} // namespace

ServiceEndpoint endpointFor(Service service)
{
    ServiceEndpoint endpoint;
    switch (service) {
    case Service::AVTransport:
        endpoint.eventPath = QStringLiteral("/MediaRenderer/AVTransport/Event");
        endpoint.controlPath = QStringLiteral("/MediaRenderer/AVTransport/Control");
        endpoint.serviceType = QStringLiteral("urn:schemas-upnp-org:service:AVTransport:1");
        endpoint.eventNamespace = QStringLiteral("urn:schemas-upnp-org:metadata-1-0/AVT/");
        break;
    case Service::RenderingControl:
        endpoint.eventPath = QStringLiteral("/MediaRenderer/RenderingControl/Event");
        endpoint.controlPath = QStringLiteral("/MediaRenderer/RenderingControl/Control");
        endpoint.serviceType = QStringLiteral("urn:schemas-upnp-org:service:RenderingControl:1");
        endpoint.eventNamespace = QStringLiteral("urn:schemas-upnp-org:metadata-1-0/RCS/");
        break;
    case Service::GroupRenderingControl:
        endpoint.eventPath = QStringLiteral("/MediaRenderer/GroupRenderingControl/Event");
        endpoint.controlPath = QStringLiteral("/MediaRenderer/GroupRenderingControl/Control");
        endpoint.serviceType = QStringLiteral("urn:schemas-upnp-org:service:GroupRenderingControl:1");
        break;
    case Service::ZoneGroupTopology:
        endpoint.eventPath = QStringLiteral("/ZoneGroupTopology/Event");
        endpoint.controlPath = QStringLiteral("/ZoneGroupTopology/Control");
        endpoint.serviceType = QStringLiteral("urn:schemas-upnp-org:service:ZoneGroupTopology:1");
        break;
    case Service::GroupManagement:
        endpoint.eventPath = QStringLiteral("/GroupManagement/Event");
        endpoint.controlPath = QStringLiteral("/GroupManagement/Control");
        endpoint.serviceType = QStringLiteral("urn:schemas-upnp-org:service:GroupManagement:1");
        break;
    }
    return endpoint;
}

int parseTimeoutHeader(const QByteArray &value, int fallback)
{
    const QByteArray trimmed = value.trimmed().toLower();
    if (!trimmed.startsWith("second-"))
        return fallback;
    bool ok = false;
    const int seconds = trimmed.mid(7).toInt(&ok);
    return ok && seconds > 0 ? seconds : fallback;
}

QByteArray buildSoapEnvelope(const QString &serviceType, const QString &action, const SoapArguments &arguments)
{
    QByteArray out;
    QXmlStreamWriter writer(&out);
    writer.writeStartDocument();
    writer.writeStartElement(QStringLiteral("s:Envelope"));
    writer.writeAttribute(QStringLiteral("xmlns:s"), kSoapEnvelopeNs);
    writer.writeAttribute(QStringLiteral("s:encodingStyle"), kSoapEncoding);
    writer.writeStartElement(QStringLiteral("s:Body"));
    writer.writeStartElement(QStringLiteral("u:") + action);
    writer.writeAttribute(QStringLiteral("xmlns:u"), serviceType);
    for (const auto &argument : arguments)
        writer.writeTextElement(argument.first, argument.second);
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndDocument();
    return out;
}

bool parseSoapResponse(const QByteArray &payload,
                       const QString &action,
                       QHash<QString, QString> *values,
                       QString *error)
{
    const QString responseName = action + QStringLiteral("Response");
    QXmlStreamReader reader(payload);

    bool found = false;
    QHash<QString, QString> out;
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement())
            continue;
        if (reader.name() == QLatin1String("Fault")) {
            if (error) {
                const QString code = soapFaultCode(payload);
                *error = code.isEmpty() ? QStringLiteral("SOAP fault") : QStringLiteral("UPnP error %1").arg(code);
            }
            return false;
        }
        if (reader.name() != responseName)
            continue;

        found = true;
        while (reader.readNextStartElement()) {
            const QString name = reader.name().toString();
            out.insert(name, reader.readElementText(QXmlStreamReader::IncludeChildElements));
        }
        break;
    }

    if (reader.hasError() && !found) {
        if (error)
            *error = QStringLiteral("Malformed SOAP response: %1").arg(reader.errorString());
        return false;
    }
    if (!found) {
        if (error)
            *error = QStringLiteral("SOAP response has no %1 element").arg(responseName);
        return false;
    }

    if (values)
        *values = out;
    if (error)
        error->clear();
    return true;
}

QString soapFaultCode(const QByteArray &payload)
{
    QXmlStreamReader reader(payload);
    while (!reader.atEnd()) {
        reader.readNext();
        if (reader.isStartElement() && reader.name() == QLatin1String("errorCode"))
            return reader.readElementText().trimmed();
    }
    return {};
}

UpnpServiceProvider::UpnpServiceProvider(Service service, int timeoutMs)
    : m_service(service)
    , m_endpoint(endpointFor(service))
    , m_timeoutMs(timeoutMs)
{
}

SubscribeResult UpnpServiceProvider::subscribe(const DeviceDescriptor &device, const QString &callbackUrl, int timeoutSec)
{
    SubscribeResult result;
    if (callbackUrl.isEmpty()) {
        result.error = QStringLiteral("Callback URL is not set");
        return result;
    }

    QNetworkAccessManager network;
    const HttpClient http(&network);
    const HeaderList headers = {
        {QByteArrayLiteral("CALLBACK"), '<' + callbackUrl.toUtf8() + '>'},
        {QByteArrayLiteral("NT"), QByteArrayLiteral("upnp:event")},
        {QByteArrayLiteral("TIMEOUT"), "Second-" + QByteArray::number(timeoutSec)},
    };

    const HttpResult reply = http.subscribe(settingsFor(device), m_endpoint.eventPath, headers, m_timeoutMs);
    if (!reply.ok) {
        result.error = QStringLiteral("SUBSCRIBE %1 on %2 failed: %3")
                           .arg(serviceName(m_service), device.host, reply.error);
        return result;
    }

    result.token = QString::fromUtf8(reply.headers.value(QByteArrayLiteral("sid")).trimmed());
    if (result.token.isEmpty()) {
        result.error = QStringLiteral("SUBSCRIBE response from %1 carries no SID").arg(device.host);
        return result;
    }

    result.timeoutSec = parseTimeoutHeader(reply.headers.value(QByteArrayLiteral("timeout")), timeoutSec);
    result.ok = true;
    qCDebug(upnpLog).noquote() << "SUBSCRIBE" << serviceName(m_service) << device.host << "sid=" << result.token;
    return result;
}

RenewResult UpnpServiceProvider::renew(const DeviceDescriptor &device, const QString &token, int timeoutSec)
{
    RenewResult result;

    QNetworkAccessManager network;
    const HttpClient http(&network);
    const HeaderList headers = {
        {QByteArrayLiteral("SID"), token.toUtf8()},
        {QByteArrayLiteral("TIMEOUT"), "Second-" + QByteArray::number(timeoutSec)},
    };

    const HttpResult reply = http.subscribe(settingsFor(device), m_endpoint.eventPath, headers, m_timeoutMs);
    if (!reply.ok) {
        // 412: the device dropped the SID; 404: it no longer serves the event path.
        result.retryable = !(reply.statusCode == 412 || reply.statusCode == 404);
        result.error = QStringLiteral("Renewal of %1 failed: %2").arg(token, reply.error);
        return result;
    }

    result.timeoutSec = parseTimeoutHeader(reply.headers.value(QByteArrayLiteral("timeout")), timeoutSec);
    result.ok = true;
    return result;
}

bool UpnpServiceProvider::unsubscribe(const DeviceDescriptor &device, const QString &token, QString *error)
{
    QNetworkAccessManager network;
    const HttpClient http(&network);
    const HttpResult reply = http.unsubscribe(settingsFor(device), m_endpoint.eventPath, token, m_timeoutMs);
    if (!reply.ok) {
        if (error)
            *error = QStringLiteral("UNSUBSCRIBE %1 failed: %2").arg(token, reply.error);
        return false;
    }
    if (error)
        error->clear();
    return true;
}

bool UpnpServiceProvider::supportsPolling() const
{
    return !pollActions().isEmpty();
}

PollResult UpnpServiceProvider::poll(const DeviceDescriptor &device, const std::atomic_bool *cancelled)
{
    PollResult result;
    const QList<PollAction> actions = pollActions();
    if (actions.isEmpty()) {
        result.error = QStringLiteral("Polling not supported for %1").arg(serviceName(m_service));
        return result;
    }

    QNetworkAccessManager network;
    const HttpClient http(&network, cancelled);
    const ConnectionSettings settings = settingsFor(device);

    QList<StateVariable> variables;
    QString lastError;
    int succeeded = 0;
    for (const PollAction &action : actions) {
        if (cancelled && cancelled->load()) {
            result.error = QStringLiteral("Poll of %1 cancelled").arg(serviceName(m_service));
            return result;
        }
        QHash<QString, QString> values;
        QString error;
        if (!callAction(http, settings, action.action, action.arguments, &values, &error)) {
            lastError = error;
            continue;
        }
        ++succeeded;
        for (const auto &field : action.mapping) {
            const auto it = values.constFind(field.first);
            if (it == values.constEnd())
                continue;
            StateVariable state = field.second;
            state.value = it.value();
            variables.append(state);
        }
    }

    if (succeeded == 0) {
        result.error = lastError;
        return result;
    }

    result.payload = buildEventDocument(m_endpoint.eventNamespace, variables);
    result.ok = true;
    return result;
}

QList<DecodedProperty> UpnpServiceProvider::decode(const QByteArray &payload) const
{
    switch (m_service) {
    case Service::RenderingControl:
        return decodeRenderingControl(payload);
    case Service::AVTransport:
        return decodeAvTransport(payload);
    default:
        return {};
    }
}

QList<UpnpServiceProvider::PollAction> UpnpServiceProvider::pollActions() const
{
    const QPair<QString, QString> instance(QStringLiteral("InstanceID"), QStringLiteral("0"));
    const QPair<QString, QString> master(QStringLiteral("Channel"), QStringLiteral("Master"));

    const auto makeAction = [](const QString &name, const SoapArguments &arguments) {
        PollAction action;
        action.action = name;
        action.arguments = arguments;
        return action;
    };

    QList<PollAction> actions;
    if (m_service == Service::RenderingControl) {
        PollAction volume = makeAction(QStringLiteral("GetVolume"), {instance, master});
        volume.mapping.append(qMakePair(QStringLiteral("CurrentVolume"),
                                        variable(QStringLiteral("Volume"), QStringLiteral("Master"))));
        actions.append(volume);

        PollAction mute = makeAction(QStringLiteral("GetMute"), {instance, master});
        mute.mapping.append(qMakePair(QStringLiteral("CurrentMute"),
                                      variable(QStringLiteral("Mute"), QStringLiteral("Master"))));
        actions.append(mute);
    } else if (m_service == Service::AVTransport) {
        PollAction transport = makeAction(QStringLiteral("GetTransportInfo"), {instance});
        transport.mapping.append(qMakePair(QStringLiteral("CurrentTransportState"),
                                           variable(QStringLiteral("TransportState"))));
        actions.append(transport);

        PollAction position = makeAction(QStringLiteral("GetPositionInfo"), {instance});
        position.mapping.append(qMakePair(QStringLiteral("TrackURI"), variable(QStringLiteral("CurrentTrackURI"))));
        position.mapping.append(qMakePair(QStringLiteral("TrackDuration"),
                                          variable(QStringLiteral("CurrentTrackDuration"))));
        actions.append(position);

        PollAction settings = makeAction(QStringLiteral("GetTransportSettings"), {instance});
        settings.mapping.append(qMakePair(QStringLiteral("PlayMode"), variable(QStringLiteral("CurrentPlayMode"))));
        actions.append(settings);
    }
    return actions;
}

bool UpnpServiceProvider::callAction(const HttpClient &http,
                                     const ConnectionSettings &settings,
                                     const QString &action,
                                     const SoapArguments &arguments,
                                     QHash<QString, QString> *values,
                                     QString *error) const
{
    const QByteArray envelope = buildSoapEnvelope(m_endpoint.serviceType, action, arguments);
    const QByteArray soapAction = (m_endpoint.serviceType + QLatin1Char('#') + action).toUtf8();
    const HttpResult reply = http.postSoap(settings, m_endpoint.controlPath, soapAction, envelope, m_timeoutMs);
    if (!reply.ok) {
        const QString code = soapFaultCode(reply.payload);
        if (error) {
            *error = code.isEmpty()
                ? QStringLiteral("%1 on %2 failed: %3").arg(action, settings.host, reply.error)
                : QStringLiteral("%1 on %2 failed: UPnP error %3").arg(action, settings.host, code);
        }
        return false;
    }
    return parseSoapResponse(reply.payload, action, values, error);
}

ConnectionSettings UpnpServiceProvider::settingsFor(const DeviceDescriptor &device)
{
    ConnectionSettings settings;
    settings.host = device.host.isEmpty() ? device.id : device.host;
    settings.port = device.port;
    return settings;
}

void registerUpnpProviders(ProviderTable *table, int timeoutMs)
{
    if (!table)
        return;
    table->registerProvider(std::make_shared<UpnpServiceProvider>(Service::RenderingControl, timeoutMs));
    table->registerProvider(std::make_shared<UpnpServiceProvider>(Service::AVTransport, timeoutMs));
}

} // namespace sonoswatch::upnp
