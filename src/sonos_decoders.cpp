#include "sonos_decoders.h"

#include <optional>

#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include "sonos_log.h"
#include "sonos_properties.h"

namespace sonoswatch::upnp {

namespace {

const QString kNotImplemented = QStringLiteral("NOT_IMPLEMENTED");

std::optional<int> parseBoundedInt(const QString &text, int minimum, int maximum)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < minimum || value > maximum)
        return std::nullopt;
    return value;
}

std::optional<bool> parseFlag(const QString &text)
{
    const QString value = text.trimmed().toLower();
    if (value == QLatin1String("1") || value == QLatin1String("true"))
        return true;
    if (value == QLatin1String("0") || value == QLatin1String("false"))
        return false;
    return std::nullopt;
}

bool isMasterChannel(const StateVariable &variable)
{
    return variable.channel.isEmpty() || variable.channel == QLatin1String("Master");
}

template <typename P>
void append(QList<DecodedProperty> *out, const P &property)
{
    out->append(DecodedProperty{QString::fromLatin1(P::key), QVariant::fromValue(property)});
}

void skipped(const StateVariable &variable)
{
    qCDebug(upnpLog).noquote() << "Skipping unparseable" << variable.name << "value" << variable.value;
}

} // namespace

QList<QByteArray> lastChangeDocuments(const QByteArray &payload)
{
    QList<QByteArray> documents;
    QXmlStreamReader reader(payload);

    bool rootSeen = false;
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement())
            continue;

        if (!rootSeen) {
            rootSeen = true;
            if (reader.name() == QLatin1String("Event")) {
                documents.append(payload);
                return documents;
            }
        }

        if (reader.name() == QLatin1String("LastChange")) {
            const QString text = reader.readElementText();
            if (!text.trimmed().isEmpty())
                documents.append(text.toUtf8());
        }
    }

    if (reader.hasError())
        qCDebug(upnpLog).noquote() << "Malformed propertyset:" << reader.errorString();
    return documents;
}

QList<StateVariable> parseEventDocument(const QByteArray &document)
{
    QList<StateVariable> variables;
    QXmlStreamReader reader(document);

    int depth = 0;
    int instanceDepth = -1;
    while (!reader.atEnd()) {
        reader.readNext();
        if (reader.isEndElement()) {
            if (depth == instanceDepth)
                instanceDepth = -1;
            --depth;
            continue;
        }
        if (!reader.isStartElement())
            continue;

        ++depth;
        const QXmlStreamAttributes attributes = reader.attributes();
        if (reader.name() == QLatin1String("InstanceID")) {
            if (attributes.value(QLatin1String("val")) == QLatin1String("0"))
                instanceDepth = depth;
            continue;
        }

        if (instanceDepth < 0 || depth != instanceDepth + 1)
            continue;
        if (!attributes.hasAttribute(QLatin1String("val")))
            continue;

        StateVariable variable;
        variable.name = reader.name().toString();
        variable.channel = attributes.value(QLatin1String("channel")).toString();
        variable.value = attributes.value(QLatin1String("val")).toString();
        variables.append(variable);
    }

    if (reader.hasError())
        qCDebug(upnpLog).noquote() << "Malformed LastChange event after" << variables.size()
                                   << "variables:" << reader.errorString();
    return variables;
}

QByteArray buildEventDocument(const QString &eventNamespace, const QList<StateVariable> &variables)
{
    QByteArray out;
    QXmlStreamWriter writer(&out);
    writer.writeStartElement(QStringLiteral("Event"));
    if (!eventNamespace.isEmpty())
        writer.writeDefaultNamespace(eventNamespace);
    writer.writeStartElement(QStringLiteral("InstanceID"));
    writer.writeAttribute(QStringLiteral("val"), QStringLiteral("0"));
    for (const StateVariable &variable : variables) {
        writer.writeEmptyElement(variable.name);
        if (!variable.channel.isEmpty())
            writer.writeAttribute(QStringLiteral("channel"), variable.channel);
        writer.writeAttribute(QStringLiteral("val"), variable.value);
    }
    writer.writeEndElement();
    writer.writeEndElement();
    return out;
}

QList<DecodedProperty> decodeRenderingControl(const QByteArray &payload)
{
    QList<DecodedProperty> out;
    const QList<QByteArray> documents = lastChangeDocuments(payload);
    for (const QByteArray &document : documents) {
        const QList<StateVariable> variables = parseEventDocument(document);
        for (const StateVariable &variable : variables) {
            if (!isMasterChannel(variable))
                continue;

            if (variable.name == QLatin1String("Volume")) {
                if (const auto value = parseBoundedInt(variable.value, 0, 100))
                    append(&out, Volume{*value});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("Mute")) {
                if (const auto value = parseFlag(variable.value))
                    append(&out, Mute{*value});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("Bass")) {
                if (const auto value = parseBoundedInt(variable.value, -10, 10))
                    append(&out, Bass{*value});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("Treble")) {
                if (const auto value = parseBoundedInt(variable.value, -10, 10))
                    append(&out, Treble{*value});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("Loudness")) {
                if (const auto value = parseFlag(variable.value))
                    append(&out, Loudness{*value});
                else
                    skipped(variable);
            }
        }
    }
    return out;
}

QList<DecodedProperty> decodeAvTransport(const QByteArray &payload)
{
    QList<DecodedProperty> out;
    const QList<QByteArray> documents = lastChangeDocuments(payload);
    for (const QByteArray &document : documents) {
        const QList<StateVariable> variables = parseEventDocument(document);
        for (const StateVariable &variable : variables) {
            if (variable.value == kNotImplemented)
                continue;

            if (variable.name == QLatin1String("TransportState")) {
                if (const auto state = transportStateFromString(variable.value))
                    append(&out, PlaybackState{*state});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("CurrentTrackURI")) {
                append(&out, CurrentTrackUri{variable.value});
            } else if (variable.name == QLatin1String("CurrentPlayMode")) {
                if (isKnownPlayMode(variable.value))
                    append(&out, PlayMode{variable.value});
                else
                    skipped(variable);
            } else if (variable.name == QLatin1String("CurrentTrackDuration")) {
                if (const auto seconds = parseDurationSeconds(variable.value))
                    append(&out, TrackDuration{*seconds});
                else
                    skipped(variable);
            }
        }
    }
    return out;
}

} // namespace sonoswatch::upnp
