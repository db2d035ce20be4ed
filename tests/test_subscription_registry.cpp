#include <catch2/catch.hpp>

#include <memory>

#include "sonos_subscription_registry.h"
#include "test_support.h"

using namespace sonoswatch;
using sonoswatch::testing::FakeProvider;
using sonoswatch::testing::ManualClock;

namespace {

struct RegistryFixture {
    RegistryFixture()
        : provider(std::make_shared<FakeProvider>(Service::RenderingControl))
        , registry(&providers, &devices, config, clock.clock())
    {
        providers.registerProvider(provider);
        devices.addDevice(DeviceDescriptor{QStringLiteral("D1"), QStringLiteral("192.168.1.20"), 1400});
        registry.setCallbackUrl(QStringLiteral("http://192.168.1.2:3400/notify"));
    }

    ManualClock clock;
    EngineConfig config;
    ProviderTable providers;
    DeviceDirectory devices;
    std::shared_ptr<FakeProvider> provider;
    SubscriptionRegistry registry;

    const SubscriptionKey key{QStringLiteral("D1"), Service::RenderingControl};
};

} // namespace

TEST_CASE_METHOD(RegistryFixture, "create subscribes once per key", "[registry]")
{
    const CreateResult created = registry.create(key);
    REQUIRE(created.ok);
    CHECK(provider->subscribeCalls == 1);
    CHECK(provider->lastCallbackUrl() == QStringLiteral("http://192.168.1.2:3400/notify"));

    const auto info = registry.info(key);
    REQUIRE(info.has_value());
    CHECK(info->state == SubscriptionState::Active);
    CHECK(info->token == QStringLiteral("uuid:D1-RenderingControl-1"));
    CHECK(info->expiresAtMs == clock.now() + config.subscriptionTimeoutSec * 1000LL);
    CHECK(registry.keyForToken(info->token) == key);

    const CreateResult again = registry.create(key);
    CHECK_FALSE(again.ok);
    CHECK(again.error == CreateError::Conflict);
    CHECK(provider->subscribeCalls == 1);
}

TEST_CASE_METHOD(RegistryFixture, "create honours the granted timeout", "[registry]")
{
    provider->grantedTimeoutSec = 600;
    REQUIRE(registry.create(key).ok);
    CHECK(registry.info(key)->expiresAtMs == clock.now() + 600000);
}

TEST_CASE_METHOD(RegistryFixture, "create reports missing providers and remote failures", "[registry]")
{
    SECTION("no provider")
    {
        const CreateResult created = registry.create(SubscriptionKey{QStringLiteral("D1"), Service::ZoneGroupTopology});
        CHECK_FALSE(created.ok);
        CHECK(created.error == CreateError::ProviderMissing);
        CHECK(registry.size() == 0);
    }

    SECTION("device refuses")
    {
        provider->failSubscribe = true;
        const CreateResult created = registry.create(key);
        CHECK_FALSE(created.ok);
        CHECK(created.error == CreateError::RemoteRejected);
        CHECK(created.message == QStringLiteral("connection refused"));
        CHECK_FALSE(registry.contains(key));
    }
}

TEST_CASE_METHOD(RegistryFixture, "remove unsubscribes and forgets the token", "[registry]")
{
    REQUIRE(registry.create(key).ok);
    const QString token = registry.info(key)->token;

    SECTION("clean unsubscribe")
    {
        CHECK(registry.remove(key));
        CHECK(provider->unsubscribeCalls == 1);
    }

    SECTION("remote failure still drops the local entry")
    {
        provider->failUnsubscribe = true;
        CHECK(registry.remove(key));
        CHECK(provider->unsubscribeCalls == 1);
    }

    CHECK_FALSE(registry.contains(key));
    CHECK_FALSE(registry.keyForToken(token).has_value());
    CHECK_FALSE(registry.remove(key));
}

TEST_CASE_METHOD(RegistryFixture, "renew updates expiry and counts failures", "[registry]")
{
    REQUIRE(registry.create(key).ok);

    SECTION("success")
    {
        clock.advance(60000);
        const RenewOutcome outcome = registry.renew(key);
        CHECK(outcome.status == RenewStatus::Renewed);
        const auto info = registry.info(key);
        CHECK(info->state == SubscriptionState::Active);
        CHECK(info->lastRenewedAtMs == clock.now());
        CHECK(info->expiresAtMs == clock.now() + config.subscriptionTimeoutSec * 1000LL);
    }

    SECTION("retryable failure")
    {
        provider->failRenewals = 2;
        CHECK(registry.renew(key).failedRenewals == 1);
        const RenewOutcome second = registry.renew(key);
        CHECK(second.status == RenewStatus::Failed);
        CHECK(second.failedRenewals == 2);
        CHECK(registry.info(key)->state == SubscriptionState::Renewing);

        const RenewOutcome third = registry.renew(key);
        CHECK(third.status == RenewStatus::Renewed);
        CHECK(registry.info(key)->failedRenewals == 0);
    }

    SECTION("rejected")
    {
        provider->rejectRenewals = true;
        CHECK(registry.renew(key).status == RenewStatus::Rejected);
    }

    SECTION("unknown key")
    {
        CHECK(registry.renew(SubscriptionKey{QStringLiteral("D9"), Service::RenderingControl}).status
              == RenewStatus::NotFound);
    }
}

TEST_CASE_METHOD(RegistryFixture, "expire hands back the final state", "[registry]")
{
    REQUIRE(registry.create(key).ok);
    const auto expired = registry.expire(key);
    REQUIRE(expired.has_value());
    CHECK(expired->state == SubscriptionState::Expired);
    CHECK_FALSE(registry.contains(key));
    CHECK_FALSE(registry.expire(key).has_value());
    // Expiry is local; the device is not contacted.
    CHECK(provider->unsubscribeCalls == 0);
}

TEST_CASE_METHOD(RegistryFixture, "recordNotification stamps the entry", "[registry]")
{
    REQUIRE(registry.create(key).ok);
    const QString token = registry.info(key)->token;
    CHECK(registry.info(key)->lastNotificationAtMs == 0);

    clock.advance(1234);
    CHECK(registry.recordNotification(token) == key);
    CHECK(registry.info(key)->lastNotificationAtMs == clock.now());
    CHECK_FALSE(registry.recordNotification(QStringLiteral("uuid:unknown")).has_value());
}

TEST_CASE_METHOD(RegistryFixture, "removeAll unsubscribes everything", "[registry]")
{
    auto transport = std::make_shared<FakeProvider>(Service::AVTransport);
    providers.registerProvider(transport);
    REQUIRE(registry.create(key).ok);
    REQUIRE(registry.create(SubscriptionKey{QStringLiteral("D1"), Service::AVTransport}).ok);

    CHECK(registry.removeAll() == 2);
    CHECK(registry.size() == 0);
    CHECK(provider->unsubscribeCalls == 1);
    CHECK(transport->unsubscribeCalls == 1);
}

TEST_CASE("Unknown devices resolve to their id", "[registry]")
{
    DeviceDirectory devices;
    const DeviceDescriptor device = devices.resolve(QStringLiteral("10.0.0.5"));
    CHECK(device.host == QStringLiteral("10.0.0.5"));
    CHECK(device.port == 1400);
    CHECK_FALSE(devices.contains(QStringLiteral("10.0.0.5")));
}
