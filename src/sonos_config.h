#pragma once

#include <QJsonObject>
#include <QString>

namespace sonoswatch {

struct EngineConfig {
    int renewalThresholdMs = 300000;
    int renewalTickMs = 10000;
    int retryBackoffBaseMs = 2000;
    int maxRenewalAttempts = 3;
    int subscriptionTimeoutSec = 1800;

    int pollIntervalMs = 5000;

    bool firewallDetection = true;
    int firewallWindowMs = 15000;
    int firewallCheckMs = 1000;

    QString callbackHost;
    int callbackPortFirst = 3400;
    int callbackPortLast = 3500;
    QString callbackPath = QStringLiteral("/notify");

    int changeBufferSize = 1000;
    int httpTimeoutMs = 10000;
    int shutdownTimeoutMs = 5000;

    static EngineConfig fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    bool validate(QString *error = nullptr) const;
};

bool loadEngineConfig(const QString &path, EngineConfig *config, QString *error = nullptr);

} // namespace sonoswatch
