#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <vector>

#include "ditch/gameplay/GameEvents.hpp"

using namespace ditch::gameplay;

namespace {

GameEvent MakeEvent(GameEventType type, CowId id = kInvalidCowId) {
    GameEvent event;
    event.type = type;
    event.cowId = id;
    return event;
}

} // namespace

TEST_CASE("GameEventBus delivers only the subscribed event type", "[events]") {
    GameEventBus bus;
    std::vector<CowId> splashes;
    int everything = 0;

    auto splash = bus.Subscribe(GameEventType::SplashOccurred,
                                [&splashes](const GameEvent& event) { splashes.push_back(event.cowId); });
    auto all = bus.SubscribeAll([&everything](const GameEvent&) { ++everything; });

    bus.Publish(MakeEvent(GameEventType::CowMooed, 1));
    bus.Publish(MakeEvent(GameEventType::SplashOccurred, 2));

    REQUIRE(splashes == std::vector<CowId>{2});
    REQUIRE(everything == 2);
    REQUIRE(bus.SubscriberCount() == 2);

    bus.Unsubscribe(splash);
    REQUIRE_FALSE(splash.IsValid());
    bus.Publish(MakeEvent(GameEventType::SplashOccurred, 3));
    REQUIRE(splashes.size() == 1);
    REQUIRE(everything == 3);
}

TEST_CASE("Scoped subscriptions end with their scope", "[events]") {
    GameEventBus bus;
    int calls = 0;
    {
        GameEventBus::ScopedSubscription scoped(
            bus.Subscribe(GameEventType::GameOver, [&calls](const GameEvent&) { ++calls; }));
        bus.Publish(MakeEvent(GameEventType::GameOver));
        REQUIRE(scoped.IsValid());
    }
    bus.Publish(MakeEvent(GameEventType::GameOver));

    REQUIRE(calls == 1);
    REQUIRE(bus.SubscriberCount() == 0);
}

TEST_CASE("Subscribers may unsubscribe while an event is being delivered", "[events]") {
    GameEventBus bus;
    std::vector<int> order;

    GameEventBus::SubscriptionHandle second;
    auto first = bus.SubscribeAll([&](const GameEvent&) {
        order.push_back(1);
        bus.Unsubscribe(second);
    });
    second = bus.SubscribeAll([&](const GameEvent&) { order.push_back(2); });
    auto third = bus.SubscribeAll([&](const GameEvent&) { order.push_back(3); });

    bus.Publish(MakeEvent(GameEventType::CowSpawned));

    REQUIRE(order == std::vector<int>{1, 3});
    REQUIRE(bus.SubscriberCount() == 2);
}

TEST_CASE("Subscribers added during delivery only see later events", "[events]") {
    GameEventBus bus;
    int lateCalls = 0;
    std::vector<GameEventBus::SubscriptionHandle> handles;

    handles.push_back(bus.Subscribe(GameEventType::CowRescued, [&](const GameEvent&) {
        if (handles.size() == 1) {
            handles.push_back(bus.Subscribe(GameEventType::CowRescued,
                                            [&lateCalls](const GameEvent&) { ++lateCalls; }));
        }
    }));

    bus.Publish(MakeEvent(GameEventType::CowRescued));
    REQUIRE(lateCalls == 0);

    bus.Publish(MakeEvent(GameEventType::CowRescued));
    REQUIRE(lateCalls == 1);
}

TEST_CASE("Scoped subscriptions may outlive the bus", "[events]") {
    auto bus = std::make_unique<GameEventBus>();
    GameEventBus::ScopedSubscription scoped(bus->SubscribeAll([](const GameEvent&) {}));

    bus.reset();
    scoped.Reset();

    REQUIRE_FALSE(scoped.IsValid());
}

TEST_CASE("Game event types have stable names", "[events]") {
    REQUIRE(ToString(GameEventType::FarmerDragStarted) == "farmer.giddy_up");
    REQUIRE(ToString(GameEventType::SplashOccurred) == "cow.splash");
    REQUIRE(ToString(GameEventType::CowMooed) == "cow.mooed");
}
