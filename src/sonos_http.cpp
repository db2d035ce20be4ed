#include "sonos_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace sonoswatch::upnp {

namespace {

constexpr int kCancelCheckMs = 20;

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager, const std::atomic_bool *cancelled)
    : m_manager(manager)
    , m_cancelled(cancelled)
{
}

HttpResult HttpClient::subscribe(const ConnectionSettings &settings,
                                 const QString &path,
                                 const HeaderList &headers,
                                 int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("SUBSCRIBE"), path, headers, {}, timeoutMs);
}

HttpResult HttpClient::unsubscribe(const ConnectionSettings &settings,
                                   const QString &path,
                                   const QString &sid,
                                   int timeoutMs) const
{
    const HeaderList headers = {
        {QByteArrayLiteral("SID"), sid.toUtf8()},
    };
    return request(settings, QByteArrayLiteral("UNSUBSCRIBE"), path, headers, {}, timeoutMs);
}

HttpResult HttpClient::postSoap(const ConnectionSettings &settings,
                                const QString &path,
                                const QByteArray &soapAction,
                                const QByteArray &envelope,
                                int timeoutMs) const
{
    const HeaderList headers = {
        {QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/xml; charset=\"utf-8\"")},
        {QByteArrayLiteral("SOAPACTION"), '"' + soapAction + '"'},
    };
    return request(settings, QByteArrayLiteral("POST"), path, headers, envelope, timeoutMs);
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              const HeaderList &headers,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    const QString host = settings.host.trimmed();
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device host is empty");
        return false;
    }

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(settings.port > 0 ? settings.port : 1400);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);

    QNetworkRequest out(url);
    out.setRawHeader("User-Agent", "sonoswatch/1.0 UPnP/1.0");
    for (const auto &header : headers)
        out.setRawHeader(header.first, header.second);

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const HeaderList &headers,
                               const QByteArray &payload,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.transportError = true;
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    if (isCancelled()) {
        result.transportError = true;
        result.cancelled = true;
        result.error = QStringLiteral("Request cancelled");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, headers, &requestObj, &result.error)) {
        result.transportError = true;
        return result;
    }

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("POST"))
        reply = m_manager->post(requestObj, payload);
    else
        reply = m_manager->sendCustomRequest(requestObj, method, payload);

    if (!reply) {
        result.transportError = true;
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    bool cancelled = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    QTimer cancelCheck;
    if (m_cancelled) {
        QObject::connect(&cancelCheck, &QTimer::timeout, &loop, [&]() {
            if (!isCancelled())
                return;
            cancelled = true;
            loop.quit();
        });
        cancelCheck.start(kCancelCheckMs);
    }

    timer.start(timeoutMs > 0 ? timeoutMs : 10000);
    loop.exec();

    if (timedOut || cancelled) {
        reply->abort();
        reply->deleteLater();
        result.transportError = true;
        result.cancelled = cancelled;
        result.error = cancelled ? QStringLiteral("Request cancelled") : QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    for (const QNetworkReply::RawHeaderPair &header : reply->rawHeaderPairs())
        result.headers.insert(header.first.toLower(), header.second);

    if (result.statusCode >= 200 && result.statusCode < 300 && reply->error() == QNetworkReply::NoError) {
        result.ok = true;
    } else if (result.statusCode > 0) {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    } else {
        result.transportError = true;
        result.error = reply->errorString();
    }

    reply->deleteLater();
    return result;
}

} // namespace sonoswatch::upnp
