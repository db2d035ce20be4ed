#include <catch2/catch.hpp>

#include <thread>

#include "sonos_properties.h"
#include "sonos_property_store.h"
#include "test_support.h"

using namespace sonoswatch;
using sonoswatch::testing::ManualClock;

TEST_CASE("PropertyStore emits only for watched values that change", "[store]")
{
    ManualClock clock;
    PropertyStore store(0, clock.clock());
    ChangeIterator changes = store.iterate();

    SECTION("unwatched values are stored silently")
    {
        CHECK(store.set(QStringLiteral("D1"), Volume{10}));
        CHECK(store.get<Volume>(QStringLiteral("D1")) == Volume{10});
        CHECK_FALSE(changes.tryNext().has_value());
    }

    SECTION("setting the same value twice emits exactly one event")
    {
        store.watch<Volume>(QStringLiteral("D1"));
        CHECK(store.set(QStringLiteral("D1"), Volume{50}));
        CHECK_FALSE(store.set(QStringLiteral("D1"), Volume{50}));

        const auto first = changes.tryNext();
        REQUIRE(first.has_value());
        CHECK(first->entity == QStringLiteral("D1"));
        CHECK(first->key == QStringLiteral("volume"));
        CHECK(first->service == Service::RenderingControl);
        CHECK(first->timestampMs == clock.now());
        CHECK_FALSE(changes.tryNext().has_value());
    }

    SECTION("a different value emits again")
    {
        store.watch<Volume>(QStringLiteral("D1"));
        store.set(QStringLiteral("D1"), Volume{50});
        store.set(QStringLiteral("D1"), Volume{51});
        CHECK(changes.pending() == 2);
    }

    SECTION("watching one key does not publish others")
    {
        store.watch<Volume>(QStringLiteral("D1"));
        store.set(QStringLiteral("D1"), Mute{true});
        store.set(QStringLiteral("D2"), Volume{3});
        CHECK(changes.pending() == 0);
    }

    SECTION("unwatch stops publishing")
    {
        store.watch<Volume>(QStringLiteral("D1"));
        store.unwatch<Volume>(QStringLiteral("D1"));
        CHECK_FALSE(store.isWatched(QStringLiteral("D1"), QStringLiteral("volume")));
        store.set(QStringLiteral("D1"), Volume{7});
        CHECK(changes.pending() == 0);
    }
}

TEST_CASE("PropertyStore typed access", "[store]")
{
    PropertyStore store;

    CHECK_FALSE(store.get<Volume>(QStringLiteral("missing")).has_value());

    store.set(QStringLiteral("D1"), PlaybackState{TransportState::Playing});
    store.set(QStringLiteral("D1"), CurrentTrackUri{QStringLiteral("x-sonos-spotify:track")});

    const auto playback = store.get<PlaybackState>(QStringLiteral("D1"));
    REQUIRE(playback.has_value());
    CHECK(playback->value == TransportState::Playing);
    CHECK(store.get<CurrentTrackUri>(QStringLiteral("D1"))->value == QStringLiteral("x-sonos-spotify:track"));
    CHECK(store.propertyCount(QStringLiteral("D1")) == 2);

    CHECK_FALSE(store.set(QStringLiteral("D1"), QStringLiteral("volume"), Service::RenderingControl, QVariant()));
}

TEST_CASE("PropertyStore removeEntity keeps watches", "[store]")
{
    PropertyStore store;
    ChangeIterator changes = store.iterate();
    store.watch<Volume>(QStringLiteral("D1"));
    store.set(QStringLiteral("D1"), Volume{20});

    store.removeEntity(QStringLiteral("D1"));
    CHECK_FALSE(store.get<Volume>(QStringLiteral("D1")).has_value());
    CHECK_FALSE(store.entities().contains(QStringLiteral("D1")));

    // Same value as before removal counts as new.
    CHECK(store.set(QStringLiteral("D1"), Volume{20}));
    CHECK(changes.pending() == 2);
}

TEST_CASE("Every cursor sees every event", "[store]")
{
    PropertyStore store;
    ChangeIterator first = store.iterate();
    ChangeIterator second = store.iterate();
    store.watch<Mute>(QStringLiteral("D1"));

    store.set(QStringLiteral("D1"), Mute{true});
    store.set(QStringLiteral("D1"), Mute{false});

    CHECK(first.pending() == 2);
    CHECK(second.pending() == 2);
    CHECK(first.tryNext()->key == QStringLiteral("mute"));
    CHECK(first.pending() == 1);
    CHECK(second.pending() == 2);
}

TEST_CASE("Bounded cursor drops the oldest events", "[store]")
{
    PropertyStore store(2);
    ChangeIterator changes = store.iterate();
    store.watch<Volume>(QStringLiteral("D1"));

    for (int volume = 1; volume <= 5; ++volume)
        store.set(QStringLiteral("D1"), Volume{volume});

    CHECK(changes.pending() == 2);
    CHECK(changes.dropped() == 3);
    CHECK(store.get<Volume>(QStringLiteral("D1")) == Volume{5});
}

TEST_CASE("Closing the store ends iteration", "[store]")
{
    PropertyStore store;
    ChangeIterator changes = store.iterate();
    store.watch<Volume>(QStringLiteral("D1"));
    store.set(QStringLiteral("D1"), Volume{1});

    SECTION("buffered events drain before the cursor reports closed")
    {
        store.close();
        CHECK_FALSE(changes.isClosed());
        CHECK(changes.next().has_value());
        CHECK_FALSE(changes.next().has_value());
        CHECK(changes.isClosed());
    }

    SECTION("a blocked reader is woken")
    {
        REQUIRE(changes.tryNext().has_value());
        std::optional<ChangeEvent> received = ChangeEvent{};
        std::thread reader([&changes, &received]() { received = changes.next(); });
        QThread::msleep(50);
        store.close();
        reader.join();
        CHECK_FALSE(received.has_value());
    }

    SECTION("cursors created after close are closed")
    {
        store.close();
        CHECK(store.isClosed());
        CHECK(store.iterate().isClosed());
    }
}

TEST_CASE("nextFor times out without events", "[store]")
{
    PropertyStore store;
    ChangeIterator changes = store.iterate();
    CHECK_FALSE(changes.nextFor(20).has_value());
    CHECK_FALSE(changes.isClosed());
}

TEST_CASE("propertyChanged signal mirrors the cursor", "[store]")
{
    PropertyStore store;
    QList<ChangeEvent> signalled;
    QObject::connect(&store, &PropertyStore::propertyChanged,
                     [&signalled](const ChangeEvent &change) { signalled.append(change); });
    store.watch<Bass>(QStringLiteral("D1"));

    store.set(QStringLiteral("D1"), Bass{-3});
    store.set(QStringLiteral("D1"), Bass{-3});

    REQUIRE(signalled.size() == 1);
    CHECK(signalled.first().key == QStringLiteral("bass"));
}
