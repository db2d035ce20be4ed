#include <catch2/catch.hpp>

#include <memory>

#include <QElapsedTimer>

#include "sonos_renewal_scheduler.h"
#include "test_support.h"

using namespace sonoswatch;
using sonoswatch::testing::FakeProvider;
using sonoswatch::testing::ManualClock;
using sonoswatch::testing::waitUntil;

namespace {

struct SchedulerFixture {
    SchedulerFixture()
        : provider(std::make_shared<FakeProvider>(Service::RenderingControl))
        , registry(&providers, &devices, config, clock.clock())
        , scheduler(&registry, config, clock.clock())
    {
        providers.registerProvider(provider);
        registry.setCallbackUrl(QStringLiteral("http://127.0.0.1:3400/notify"));

        QObject::connect(&scheduler, &RenewalScheduler::subscriptionRenewed,
                         [this](const SubscriptionKey &) { ++renewed; });
        QObject::connect(&scheduler, &RenewalScheduler::renewalFailed,
                         [this](const SubscriptionKey &, int, qint64 retryInMs) { retryDelays.append(retryInMs); });
        QObject::connect(&scheduler, &RenewalScheduler::subscriptionExpired,
                         [this](const SubscriptionKey &expiredKey, const QString &) { expired.append(expiredKey); });
    }

    static EngineConfig makeConfig()
    {
        EngineConfig config;
        config.maxRenewalAttempts = 3;
        config.retryBackoffBaseMs = 2000;
        return config;
    }

    ManualClock clock;
    EngineConfig config = makeConfig();
    ProviderTable providers;
    DeviceDirectory devices;
    std::shared_ptr<FakeProvider> provider;
    SubscriptionRegistry registry;
    RenewalScheduler scheduler;

    int renewed = 0;
    QList<qint64> retryDelays;
    QList<SubscriptionKey> expired;

    const SubscriptionKey key{QStringLiteral("D1"), Service::RenderingControl};
};

} // namespace

TEST_CASE("Backoff doubles per failure", "[renewal]")
{
    CHECK(RenewalScheduler::backoffDelayMs(2000, 1) == 2000);
    CHECK(RenewalScheduler::backoffDelayMs(2000, 2) == 4000);
    CHECK(RenewalScheduler::backoffDelayMs(2000, 3) == 8000);
    CHECK(RenewalScheduler::backoffDelayMs(500, 0) == 500);
    CHECK(RenewalScheduler::backoffDelayMs(1, 100) == (qint64(1) << 20));
}

TEST_CASE_METHOD(SchedulerFixture, "Subscriptions renew inside the threshold", "[renewal]")
{
    REQUIRE(registry.create(key).ok);
    const qint64 expiresAt = registry.info(key)->expiresAtMs;

    CHECK(scheduler.tickAt(expiresAt - config.renewalThresholdMs - 1) == 0);
    CHECK(provider->renewCalls == 0);

    clock.set(expiresAt - config.renewalThresholdMs);
    CHECK(scheduler.tickAt(clock.now()) == 1);
    CHECK(provider->renewCalls == 1);
    CHECK(renewed == 1);
    CHECK(registry.info(key)->expiresAtMs > expiresAt);

    // Freshly renewed, nothing due.
    CHECK(scheduler.tickAt(clock.now()) == 0);
}

TEST_CASE_METHOD(SchedulerFixture, "Failed renewals back off and then expire", "[renewal]")
{
    provider->failRenewals = -1;
    REQUIRE(registry.create(key).ok);
    qint64 now = registry.info(key)->expiresAtMs - config.renewalThresholdMs;

    CHECK(scheduler.tickAt(now) == 1);
    REQUIRE(retryDelays == QList<qint64>{2000});
    CHECK(registry.info(key)->nextRetryAtMs == now + 2000);

    CHECK(scheduler.tickAt(now + 1999) == 0);

    now += 2000;
    CHECK(scheduler.tickAt(now) == 1);
    REQUIRE(retryDelays == (QList<qint64>{2000, 4000}));
    CHECK(expired.isEmpty());

    CHECK(scheduler.tickAt(now + 3999) == 0);
    now += 4000;
    CHECK(scheduler.tickAt(now) == 1);

    CHECK(provider->renewCalls == 3);
    REQUIRE(expired.size() == 1);
    CHECK(expired.first() == key);
    CHECK_FALSE(registry.contains(key));

    // Nothing left to retry or expire.
    CHECK(scheduler.tickAt(now + 100000) == 0);
    CHECK(expired.size() == 1);
}

TEST_CASE_METHOD(SchedulerFixture, "A recovered renewal resets the failure count", "[renewal]")
{
    provider->failRenewals = 1;
    REQUIRE(registry.create(key).ok);
    const qint64 now = registry.info(key)->expiresAtMs - config.renewalThresholdMs;

    scheduler.tickAt(now);
    CHECK(registry.info(key)->failedRenewals == 1);
    scheduler.tickAt(now + 2000);
    CHECK(renewed == 1);
    CHECK(registry.info(key)->failedRenewals == 0);
    CHECK(registry.info(key)->state == SubscriptionState::Active);
    CHECK(expired.isEmpty());
}

TEST_CASE_METHOD(SchedulerFixture, "A rejected renewal expires at once", "[renewal]")
{
    provider->rejectRenewals = true;
    REQUIRE(registry.create(key).ok);

    scheduler.tickAt(registry.info(key)->expiresAtMs);
    CHECK(provider->renewCalls == 1);
    CHECK(expired.size() == 1);
    CHECK(retryDelays.isEmpty());
}

TEST_CASE_METHOD(SchedulerFixture, "A stopped scheduler does nothing", "[renewal]")
{
    REQUIRE(registry.create(key).ok);
    scheduler.start();
    CHECK(scheduler.isRunning());
    scheduler.stop();
    CHECK_FALSE(scheduler.isRunning());
    CHECK(scheduler.tickAt(registry.info(key)->expiresAtMs) == 0);
}

TEST_CASE("A running scheduler retries on the backoff schedule, not the tick", "[renewal]")
{
    EngineConfig config;
    config.renewalTickMs = 60000;
    config.renewalThresholdMs = 3600000;
    config.retryBackoffBaseMs = 40;
    config.maxRenewalAttempts = 3;

    auto provider = std::make_shared<FakeProvider>(Service::RenderingControl);
    provider->failRenewals = -1;
    ProviderTable providers;
    providers.registerProvider(provider);
    DeviceDirectory devices;
    SubscriptionRegistry registry(&providers, &devices, config);
    registry.setCallbackUrl(QStringLiteral("http://127.0.0.1:3400/notify"));
    RenewalScheduler scheduler(&registry, config);

    QList<qint64> retryDelays;
    QList<SubscriptionKey> expired;
    QObject::connect(&scheduler, &RenewalScheduler::renewalFailed,
                     [&retryDelays](const SubscriptionKey &, int, qint64 retryInMs) { retryDelays.append(retryInMs); });
    QObject::connect(&scheduler, &RenewalScheduler::subscriptionExpired,
                     [&expired](const SubscriptionKey &expiredKey, const QString &) { expired.append(expiredKey); });

    const SubscriptionKey key{QStringLiteral("D1"), Service::RenderingControl};
    REQUIRE(registry.create(key).ok);

    scheduler.start();
    QElapsedTimer elapsed;
    elapsed.start();
    CHECK(scheduler.tick() == 1);

    // Only the retry timer can get there before the 60 s tick.
    REQUIRE(waitUntil([&expired]() { return !expired.isEmpty(); }, 3000));
    CHECK(elapsed.elapsed() >= 100);
    CHECK(provider->renewCalls == 3);
    CHECK(retryDelays == QList<qint64>{40, 80});
    CHECK(expired == QList<SubscriptionKey>{key});
    CHECK_FALSE(registry.contains(key));
    scheduler.stop();
}
