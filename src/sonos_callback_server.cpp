#include "sonos_callback_server.h"

#include <QNetworkInterface>
#include <QTcpServer>
#include <QTcpSocket>

#include "sonos_log.h"

namespace sonoswatch {

namespace {

constexpr int kMaxHeaderBytes = 16 * 1024;
constexpr int kMaxBodyBytes = 4 * 1024 * 1024;

QByteArray reasonPhrase(int status)
{
    switch (status) {
    case 200:
        return QByteArrayLiteral("OK");
    case 400:
        return QByteArrayLiteral("Bad Request");
    case 405:
        return QByteArrayLiteral("Method Not Allowed");
    case 412:
        return QByteArrayLiteral("Precondition Failed");
    default:
        return QByteArrayLiteral("Error");
    }
}

// Decodes a chunked body starting at offset; Incomplete until the last chunk is in.
RequestParse decodeChunked(const QByteArray &buffer, int offset, QByteArray *body, int *end, QString *error)
{
    QByteArray out;
    int pos = offset;
    for (;;) {
        const int lineEnd = buffer.indexOf("\r\n", pos);
        if (lineEnd < 0)
            return RequestParse::Incomplete;

        QByteArray sizeText = buffer.mid(pos, lineEnd - pos);
        const int extension = sizeText.indexOf(';');
        if (extension >= 0)
            sizeText.truncate(extension);
        bool ok = false;
        const int chunkSize = sizeText.trimmed().toInt(&ok, 16);
        if (!ok || chunkSize < 0 || out.size() + chunkSize > kMaxBodyBytes) {
            if (error)
                *error = QStringLiteral("Invalid chunk size");
            return RequestParse::Invalid;
        }

        pos = lineEnd + 2;
        if (chunkSize == 0) {
            const int trailerEnd = buffer.indexOf("\r\n", pos);
            if (trailerEnd < 0)
                return RequestParse::Incomplete;
            *end = trailerEnd + 2;
            *body = out;
            return RequestParse::Complete;
        }

        if (buffer.size() < pos + chunkSize + 2)
            return RequestParse::Incomplete;
        out.append(buffer.constData() + pos, chunkSize);
        pos += chunkSize + 2;
    }
}

} // namespace

RequestParse parseNotifyRequest(const QByteArray &buffer, NotifyRequest *request, int *consumed, QString *error)
{
    const int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (buffer.size() > kMaxHeaderBytes) {
            if (error)
                *error = QStringLiteral("Request header too large");
            return RequestParse::Invalid;
        }
        return RequestParse::Incomplete;
    }

    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() != 3 || !requestLine.at(2).startsWith("HTTP/")) {
        if (error)
            *error = QStringLiteral("Malformed request line");
        return RequestParse::Invalid;
    }

    NotifyRequest parsed;
    parsed.method = requestLine.at(0).toUpper();
    parsed.path = QString::fromLatin1(requestLine.at(1));

    int contentLength = -1;
    bool chunked = false;
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty())
            continue;
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            if (error)
                *error = QStringLiteral("Malformed header line");
            return RequestParse::Invalid;
        }
        const QByteArray name = line.left(colon).trimmed().toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        if (name == "sid") {
            parsed.sid = QString::fromLatin1(value);
        } else if (name == "nt") {
            parsed.nt = QString::fromLatin1(value);
        } else if (name == "nts") {
            parsed.nts = QString::fromLatin1(value);
        } else if (name == "content-length") {
            bool ok = false;
            contentLength = value.toInt(&ok);
            if (!ok || contentLength < 0 || contentLength > kMaxBodyBytes) {
                if (error)
                    *error = QStringLiteral("Invalid Content-Length");
                return RequestParse::Invalid;
            }
        } else if (name == "transfer-encoding") {
            chunked = value.toLower().contains("chunked");
        }
    }

    const int bodyStart = headerEnd + 4;
    int end = bodyStart;
    if (chunked) {
        const RequestParse state = decodeChunked(buffer, bodyStart, &parsed.body, &end, error);
        if (state != RequestParse::Complete)
            return state;
    } else if (contentLength > 0) {
        if (buffer.size() < bodyStart + contentLength)
            return RequestParse::Incomplete;
        parsed.body = buffer.mid(bodyStart, contentLength);
        end = bodyStart + contentLength;
    }

    if (request)
        *request = parsed;
    if (consumed)
        *consumed = end;
    return RequestParse::Complete;
}

int notifyResponseStatus(const NotifyRequest &request, QString *error)
{
    QString message;
    int status = 200;
    if (request.method != "NOTIFY") {
        status = 405;
        message = QStringLiteral("Unsupported method %1").arg(QString::fromLatin1(request.method));
    } else if (request.sid.isEmpty()) {
        status = 412;
        message = QStringLiteral("Missing SID header");
    } else if (!request.nt.isEmpty() && request.nt != QLatin1String("upnp:event")) {
        status = 400;
        message = QStringLiteral("Unexpected NT header %1").arg(request.nt);
    } else if (!request.nts.isEmpty() && request.nts != QLatin1String("upnp:propchange")) {
        status = 400;
        message = QStringLiteral("Unexpected NTS header %1").arg(request.nts);
    }

    if (error)
        *error = message;
    return status;
}

CallbackServer::CallbackServer(NotificationRouter *router, const EngineConfig &config, QObject *parent)
    : QObject(parent)
    , m_router(router)
    , m_config(config)
    , m_server(new QTcpServer(this))
{
    connect(m_server, &QTcpServer::newConnection, this, &CallbackServer::onNewConnection);
}

CallbackServer::~CallbackServer()
{
    close();
}

bool CallbackServer::listen(QString *error)
{
    return listen(QHostAddress::AnyIPv4,
                  static_cast<quint16>(m_config.callbackPortFirst),
                  static_cast<quint16>(m_config.callbackPortLast),
                  error);
}

bool CallbackServer::listen(const QHostAddress &address, quint16 firstPort, quint16 lastPort, QString *error)
{
    if (m_server->isListening()) {
        if (error)
            error->clear();
        return true;
    }

    QString lastError;
    for (quint32 port = firstPort; port <= lastPort; ++port) {
        if (m_server->listen(address, static_cast<quint16>(port))) {
            m_advertisedHost = m_config.callbackHost.isEmpty() ? detectLocalAddress() : m_config.callbackHost;
            qCInfo(callbackLog).noquote() << "Callback server listening on port" << m_server->serverPort()
                                          << "url=" << callbackUrl();
            if (error)
                error->clear();
            return true;
        }
        lastError = m_server->errorString();
    }

    if (error)
        *error = QStringLiteral("No free callback port in %1-%2: %3").arg(firstPort).arg(lastPort).arg(lastError);
    return false;
}

void CallbackServer::close()
{
    if (m_server->isListening()) {
        m_server->close();
        qCInfo(callbackLog) << "Callback server closed";
    }
    const QList<QTcpSocket *> sockets = m_buffers.keys();
    m_buffers.clear();
    for (QTcpSocket *socket : sockets) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
}

bool CallbackServer::isListening() const
{
    return m_server->isListening();
}

quint16 CallbackServer::port() const
{
    return m_server->serverPort();
}

QString CallbackServer::callbackUrl() const
{
    if (!m_server->isListening())
        return {};
    return QStringLiteral("http://%1:%2%3").arg(m_advertisedHost).arg(m_server->serverPort()).arg(m_config.callbackPath);
}

QString CallbackServer::detectLocalAddress()
{
    const QList<QHostAddress> addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback())
            return address.toString();
    }
    return QHostAddress(QHostAddress::LocalHost).toString();
}

void CallbackServer::onNewConnection()
{
    while (QTcpSocket *socket = m_server->nextPendingConnection()) {
        m_buffers.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { handleReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }
}

void CallbackServer::handleReadyRead(QTcpSocket *socket)
{
    auto it = m_buffers.find(socket);
    if (it == m_buffers.end())
        return;
    it->append(socket->readAll());

    NotifyRequest request;
    int consumed = 0;
    QString error;
    const RequestParse state = parseNotifyRequest(*it, &request, &consumed, &error);
    if (state == RequestParse::Incomplete)
        return;

    it->clear();
    if (state == RequestParse::Invalid) {
        qCDebug(callbackLog).noquote() << "Rejecting malformed callback request from"
                                       << socket->peerAddress().toString() << ":" << error;
        respond(socket, 400);
        return;
    }

    const int status = notifyResponseStatus(request, &error);
    if (status != 200) {
        qCDebug(callbackLog).noquote() << "Rejecting callback request from" << socket->peerAddress().toString()
                                       << "status" << status << ":" << error;
        respond(socket, status);
        return;
    }

    // Unknown SIDs still get 200 so the device does not retry.
    if (m_router)
        m_router->deliver(request.sid, request.body);
    respond(socket, 200);
}

void CallbackServer::respond(QTcpSocket *socket, int status)
{
    QByteArray response = QByteArrayLiteral("HTTP/1.1 ");
    response += QByteArray::number(status) + ' ' + reasonPhrase(status) + "\r\n";
    response += "Content-Length: 0\r\nConnection: close\r\n\r\n";
    socket->write(response);
    socket->disconnectFromHost();
}

} // namespace sonoswatch
