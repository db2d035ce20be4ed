#include "sonos_config.h"

#include <algorithm>

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QVariant>

namespace sonoswatch {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toInt() != 0;
    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("true") || text == QLatin1String("1") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("false") || text == QLatin1String("0") || text == QLatin1String("off"))
            return false;
    }
    return fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QJsonValue value = obj.value(key);
    return value.isString() ? value.toString().trimmed() : fallback;
}

} // namespace

EngineConfig EngineConfig::fromJson(const QJsonObject &obj)
{
    EngineConfig config;
    config.renewalThresholdMs = std::clamp(readInt(obj, QStringLiteral("renewalThresholdMs"), config.renewalThresholdMs), 1000, 3600000);
    config.renewalTickMs = std::clamp(readInt(obj, QStringLiteral("renewalTickMs"), config.renewalTickMs), 50, 600000);
    config.retryBackoffBaseMs = std::clamp(readInt(obj, QStringLiteral("retryBackoffBaseMs"), config.retryBackoffBaseMs), 10, 600000);
    config.maxRenewalAttempts = std::clamp(readInt(obj, QStringLiteral("maxRenewalAttempts"), config.maxRenewalAttempts), 1, 20);
    config.subscriptionTimeoutSec = std::clamp(readInt(obj, QStringLiteral("subscriptionTimeoutSec"), config.subscriptionTimeoutSec), 60, 86400);

    config.pollIntervalMs = std::clamp(readInt(obj, QStringLiteral("pollIntervalMs"), config.pollIntervalMs), 10, 600000);

    config.firewallDetection = readBool(obj, QStringLiteral("firewallDetection"), config.firewallDetection);
    config.firewallWindowMs = std::clamp(readInt(obj, QStringLiteral("firewallWindowMs"), config.firewallWindowMs), 10, 600000);
    config.firewallCheckMs = std::clamp(readInt(obj, QStringLiteral("firewallCheckMs"), config.firewallCheckMs), 10, 60000);

    config.callbackHost = readString(obj, QStringLiteral("callbackHost"), config.callbackHost);
    config.callbackPortFirst = std::clamp(readInt(obj, QStringLiteral("callbackPortFirst"), config.callbackPortFirst), 1, 65535);
    config.callbackPortLast = std::clamp(readInt(obj, QStringLiteral("callbackPortLast"), config.callbackPortLast), 1, 65535);
    config.callbackPath = readString(obj, QStringLiteral("callbackPath"), config.callbackPath);

    config.changeBufferSize = std::clamp(readInt(obj, QStringLiteral("changeBufferSize"), config.changeBufferSize), 0, 1000000);
    config.httpTimeoutMs = std::clamp(readInt(obj, QStringLiteral("httpTimeoutMs"), config.httpTimeoutMs), 100, 120000);
    config.shutdownTimeoutMs = std::clamp(readInt(obj, QStringLiteral("shutdownTimeoutMs"), config.shutdownTimeoutMs), 100, 60000);
    return config;
}

QJsonObject EngineConfig::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("renewalThresholdMs"), renewalThresholdMs);
    obj.insert(QStringLiteral("renewalTickMs"), renewalTickMs);
    obj.insert(QStringLiteral("retryBackoffBaseMs"), retryBackoffBaseMs);
    obj.insert(QStringLiteral("maxRenewalAttempts"), maxRenewalAttempts);
    obj.insert(QStringLiteral("subscriptionTimeoutSec"), subscriptionTimeoutSec);
    obj.insert(QStringLiteral("pollIntervalMs"), pollIntervalMs);
    obj.insert(QStringLiteral("firewallDetection"), firewallDetection);
    obj.insert(QStringLiteral("firewallWindowMs"), firewallWindowMs);
    obj.insert(QStringLiteral("firewallCheckMs"), firewallCheckMs);
    obj.insert(QStringLiteral("callbackHost"), callbackHost);
    obj.insert(QStringLiteral("callbackPortFirst"), callbackPortFirst);
    obj.insert(QStringLiteral("callbackPortLast"), callbackPortLast);
    obj.insert(QStringLiteral("callbackPath"), callbackPath);
    obj.insert(QStringLiteral("changeBufferSize"), changeBufferSize);
    obj.insert(QStringLiteral("httpTimeoutMs"), httpTimeoutMs);
    obj.insert(QStringLiteral("shutdownTimeoutMs"), shutdownTimeoutMs);
    return obj;
}

bool EngineConfig::validate(QString *error) const
{
    QString message;
    if (callbackPortFirst > callbackPortLast) {
        message = QStringLiteral("Callback port range is empty (%1 > %2)").arg(callbackPortFirst).arg(callbackPortLast);
    } else if (static_cast<qint64>(renewalThresholdMs) >= static_cast<qint64>(subscriptionTimeoutSec) * 1000) {
        message = QStringLiteral("Renewal threshold must be shorter than the subscription timeout");
    } else if (!callbackPath.startsWith(QLatin1Char('/'))) {
        message = QStringLiteral("Callback path must start with '/'");
    }

    if (error)
        *error = message;
    return message.isEmpty();
}

bool loadEngineConfig(const QString &path, EngineConfig *config, QString *error)
{
    if (!config) {
        if (error)
            *error = QStringLiteral("Config object is null");
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Invalid config %1: %2").arg(path, parseError.errorString());
        return false;
    }

    const EngineConfig loaded = EngineConfig::fromJson(doc.object());
    if (!loaded.validate(error))
        return false;

    *config = loaded;
    return true;
}

} // namespace sonoswatch
