#pragma once

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>

#include "sonos_config.h"
#include "sonos_notification_router.h"

class QTcpServer;
class QTcpSocket;

namespace sonoswatch {

struct NotifyRequest {
    QByteArray method;
    QString path;
    QString sid;
    QString nt;
    QString nts;
    QByteArray body;
};

enum class RequestParse {
    Incomplete,
    Complete,
    Invalid
};

// Parses one HTTP request from the start of buffer. consumed receives the
// request length when Complete.
RequestParse parseNotifyRequest(const QByteArray &buffer,
                                NotifyRequest *request,
                                int *consumed = nullptr,
                                QString *error = nullptr);

// HTTP status the listener answers with: 200, 400, 405 or 412.
int notifyResponseStatus(const NotifyRequest &request, QString *error = nullptr);

class CallbackServer : public QObject
{
    Q_OBJECT

public:
    CallbackServer(NotificationRouter *router, const EngineConfig &config, QObject *parent = nullptr);
    ~CallbackServer() override;

    // Binds the first free port in the configured range.
    bool listen(QString *error = nullptr);
    bool listen(const QHostAddress &address, quint16 firstPort, quint16 lastPort, QString *error = nullptr);
    void close();

    bool isListening() const;
    quint16 port() const;
    QString callbackUrl() const;

    static QString detectLocalAddress();

private slots:
    void onNewConnection();

private:
    void handleReadyRead(QTcpSocket *socket);
    void respond(QTcpSocket *socket, int status);

    NotificationRouter *m_router = nullptr;
    EngineConfig m_config;
    QTcpServer *m_server = nullptr;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QString m_advertisedHost;
};

} // namespace sonoswatch
