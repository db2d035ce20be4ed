#include <catch2/catch.hpp>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "sonos_config.h"

using namespace sonoswatch;

TEST_CASE("Default configuration is valid", "[config]")
{
    const EngineConfig config{};
    QString error;
    CHECK(config.validate(&error));
    CHECK(error.isEmpty());
    CHECK(config.renewalThresholdMs == 300000);
    CHECK(config.maxRenewalAttempts == 3);
    CHECK(config.firewallWindowMs == 15000);
    CHECK(config.callbackPath == QStringLiteral("/notify"));
}

TEST_CASE("fromJson reads, clamps and falls back", "[config]")
{
    QJsonObject obj;
    obj.insert(QStringLiteral("pollIntervalMs"), 2500);
    obj.insert(QStringLiteral("maxRenewalAttempts"), 500);
    obj.insert(QStringLiteral("retryBackoffBaseMs"), QStringLiteral("750"));
    obj.insert(QStringLiteral("firewallDetection"), QStringLiteral("off"));
    obj.insert(QStringLiteral("callbackHost"), QStringLiteral(" 10.0.0.2 "));
    obj.insert(QStringLiteral("renewalTickMs"), QStringLiteral("soon"));

    const EngineConfig config = EngineConfig::fromJson(obj);
    CHECK(config.pollIntervalMs == 2500);
    CHECK(config.maxRenewalAttempts == 20);
    CHECK(config.retryBackoffBaseMs == 750);
    CHECK_FALSE(config.firewallDetection);
    CHECK(config.callbackHost == QStringLiteral("10.0.0.2"));
    CHECK(config.renewalTickMs == EngineConfig().renewalTickMs);
}

TEST_CASE("toJson round-trips through fromJson", "[config]")
{
    EngineConfig config;
    config.subscriptionTimeoutSec = 600;
    config.renewalThresholdMs = 60000;
    config.callbackPortFirst = 5000;
    config.callbackPortLast = 5010;

    const EngineConfig copy = EngineConfig::fromJson(config.toJson());
    CHECK(copy.subscriptionTimeoutSec == 600);
    CHECK(copy.renewalThresholdMs == 60000);
    CHECK(copy.callbackPortFirst == 5000);
    CHECK(copy.callbackPortLast == 5010);
}

TEST_CASE("validate rejects inconsistent settings", "[config]")
{
    EngineConfig config;
    QString error;

    SECTION("empty port range")
    {
        config.callbackPortFirst = 4000;
        config.callbackPortLast = 3999;
        CHECK_FALSE(config.validate(&error));
    }

    SECTION("threshold not below the timeout")
    {
        config.subscriptionTimeoutSec = 300;
        config.renewalThresholdMs = 300000;
        CHECK_FALSE(config.validate(&error));
    }

    SECTION("relative callback path")
    {
        config.callbackPath = QStringLiteral("notify");
        CHECK_FALSE(config.validate(&error));
    }

    CHECK_FALSE(error.isEmpty());
}

TEST_CASE("loadEngineConfig", "[config]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    EngineConfig config;
    QString error;

    SECTION("missing file")
    {
        CHECK_FALSE(loadEngineConfig(dir.filePath(QStringLiteral("absent.json")), &config, &error));
        CHECK(error.startsWith(QStringLiteral("Cannot open")));
    }

    SECTION("invalid JSON")
    {
        const QString path = dir.filePath(QStringLiteral("broken.json"));
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();
        CHECK_FALSE(loadEngineConfig(path, &config, &error));
        CHECK(error.startsWith(QStringLiteral("Invalid config")));
    }

    SECTION("valid file")
    {
        const QString path = dir.filePath(QStringLiteral("engine.json"));
        QJsonObject obj;
        obj.insert(QStringLiteral("pollIntervalMs"), 1234);
        obj.insert(QStringLiteral("callbackPath"), QStringLiteral("/sonos"));
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(QJsonDocument(obj).toJson());
        file.close();

        REQUIRE(loadEngineConfig(path, &config, &error));
        CHECK(config.pollIntervalMs == 1234);
        CHECK(config.callbackPath == QStringLiteral("/sonos"));
    }

    SECTION("file that fails validation leaves the config untouched")
    {
        const QString path = dir.filePath(QStringLiteral("bad.json"));
        QJsonObject obj;
        obj.insert(QStringLiteral("callbackPortFirst"), 9000);
        obj.insert(QStringLiteral("callbackPortLast"), 8000);
        obj.insert(QStringLiteral("pollIntervalMs"), 1234);
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(QJsonDocument(obj).toJson());
        file.close();

        CHECK_FALSE(loadEngineConfig(path, &config, &error));
        CHECK(config.pollIntervalMs == EngineConfig().pollIntervalMs);
    }
}
