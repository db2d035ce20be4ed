#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "sonos_types.h"

namespace sonoswatch::upnp {

// One `<Name channel=".." val=".."/>` entry of a LastChange event.
struct StateVariable {
    QString name;
    QString channel;
    QString value;
};

// Unwraps the LastChange documents of a GENA propertyset. A bare <Event>
// document is returned as is.
QList<QByteArray> lastChangeDocuments(const QByteArray &payload);

// Variables of InstanceID 0. Parsing stops at the first XML error and keeps
// what was read so far.
QList<StateVariable> parseEventDocument(const QByteArray &document);

QByteArray buildEventDocument(const QString &eventNamespace, const QList<StateVariable> &variables);

QList<DecodedProperty> decodeRenderingControl(const QByteArray &payload);
QList<DecodedProperty> decodeAvTransport(const QByteArray &payload);

} // namespace sonoswatch::upnp
