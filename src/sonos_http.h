#pragma once

#include <atomic>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>

class QNetworkAccessManager;
class QNetworkRequest;

namespace sonoswatch::upnp {

struct ConnectionSettings {
    QString host;
    int port = 1400;
};

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    // Lower-cased header names.
    QHash<QByteArray, QByteArray> headers;
    QString error;
    // Set when no HTTP response was received at all.
    bool transportError = false;
    bool cancelled = false;
};

// Synchronous requests on a caller-owned QNetworkAccessManager. The manager
// must live in the calling thread. A request in flight is aborted once the
// optional cancel flag is raised.
class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager, const std::atomic_bool *cancelled = nullptr);

    HttpResult subscribe(const ConnectionSettings &settings,
                         const QString &path,
                         const HeaderList &headers,
                         int timeoutMs = 10000) const;

    HttpResult unsubscribe(const ConnectionSettings &settings,
                           const QString &path,
                           const QString &sid,
                           int timeoutMs = 10000) const;

    HttpResult postSoap(const ConnectionSettings &settings,
                        const QString &path,
                        const QByteArray &soapAction,
                        const QByteArray &envelope,
                        int timeoutMs = 10000) const;

private:
    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      const HeaderList &headers,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const HeaderList &headers,
                       const QByteArray &payload,
                       int timeoutMs) const;

    bool isCancelled() const { return m_cancelled && m_cancelled->load(); }

    QNetworkAccessManager *m_manager = nullptr;
    const std::atomic_bool *m_cancelled = nullptr;
};

} // namespace sonoswatch::upnp
