#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <unordered_map>
#include <vector>

#include "ditch/core/Error.hpp"
#include "ditch/gameplay/GameSession.hpp"
#include "ditch/utils/Random.hpp"

using namespace ditch::gameplay;

namespace {

constexpr std::uint32_t kSeed = 20240617u;

struct EventLog {
    std::vector<GameEvent> events;
    GameEventBus::ScopedSubscription subscription;

    explicit EventLog(GameSession& session)
        : subscription(session.Events().SubscribeAll(
              [this](const GameEvent& event) { events.push_back(event); })) {}

    std::vector<GameEvent> OfType(GameEventType type) const {
        std::vector<GameEvent> matching;
        for (const auto& event : events) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }
};

// Drags the farmer from mid-field down to the ditch bank.
void WalkFarmerToDitch(GameSession& session) {
    const glm::vec2 start = session.GetFarmer().GetPosition();
    session.OnPointerDown(start.x, start.y);
    session.OnPointerMove(start.x, 0.0f);
    session.OnPointerUp();
}

} // namespace

TEST_CASE("Session starts with a closed gate and full lives", "[session]") {
    GameSession session(GameplayConfig{}, kSeed);

    const auto state = session.GetSession();
    REQUIRE(state.score == 0);
    REQUIRE(state.lives == 3);
    REQUIRE_FALSE(state.gameOver);
    REQUIRE(state.difficultyLevel == 0);
    REQUIRE(session.GetCows().empty());
    REQUIRE(session.GetSeed() == kSeed);

    const auto& farmer = session.GetFarmer().GetPosition();
    REQUIRE(farmer.x == Catch::Approx(195.0f));
    REQUIRE(farmer.y == Catch::Approx(session.GetLayout().fieldMidY));

    session.Tick(1.0f);
    const auto gate = session.GetGate();
    REQUIRE(gate.state == GateState::Opening);
    REQUIRE(gate.timer == Catch::Approx(2.5f));
    REQUIRE(gate.openAmount == 0.0f);
}

TEST_CASE("A cow walking into the ditch starts drowning with the full timer", "[session]") {
    GameSession session(GameplayConfig{}, kSeed);
    EventLog log(session);

    const CowId id = session.SpawnCowAt({100.0f, 150.0f}, {0.0f, -40.0f});
    session.Tick(2.0f);

    const Cow* cow = session.FindCow(id);
    REQUIRE(cow != nullptr);
    REQUIRE(cow->state == CowState::Drowning);
    REQUIRE(cow->drownTimer == 10.0f);

    const auto snapshots = session.GetCows();
    REQUIRE(snapshots.size() == 1);
    REQUIRE(snapshots.front().remainingDrownTime.has_value());
    REQUIRE(log.OfType(GameEventType::SplashOccurred).size() == 1);
}

TEST_CASE("Lasso rescues a drowning cow when the farmer is at the ditch", "[session][lasso]") {
    GameSession session(GameplayConfig{}, kSeed);
    EventLog log(session);

    WalkFarmerToDitch(session);
    REQUIRE(session.GetFarmer().GetPosition().y == Catch::Approx(105.0f));
    REQUIRE(session.GetFarmer().IsNearDitch());
    REQUIRE(log.OfType(GameEventType::FarmerDragStarted).size() == 1);

    const CowId id = session.SpawnCowAt({100.0f, 120.0f}, {0.0f, -40.0f});
    session.Tick(0.5f);
    REQUIRE(session.FindCow(id)->state == CowState::Drowning);
    REQUIRE(session.FindCow(id)->position.y == Catch::Approx(40.0f));

    session.OnPointerDown(100.0f, 40.0f);
    session.OnPointerUp();

    const Cow* cow = session.FindCow(id);
    REQUIRE(cow->state == CowState::Wandering);
    REQUIRE(cow->position.x >= 78.0f);
    REQUIRE(cow->position.x <= 312.0f);
    REQUIRE(cow->position.y == Catch::Approx(session.GetLayout().fieldMidY));
    REQUIRE(session.GetScore() == 3);

    const auto rescued = log.OfType(GameEventType::CowRescued);
    REQUIRE(rescued.size() == 1);
    REQUIRE(rescued.front().cowId == id);
    REQUIRE(rescued.front().bonus == 3);
}

TEST_CASE("Lasso does nothing while the farmer is far from the ditch", "[session][lasso]") {
    GameSession session(GameplayConfig{}, kSeed);

    const CowId id = session.SpawnCowAt({100.0f, 120.0f}, {0.0f, -40.0f});
    session.Tick(0.5f);
    REQUIRE_FALSE(session.GetFarmer().IsNearDitch());

    session.OnPointerDown(100.0f, 40.0f);

    REQUIRE(session.FindCow(id)->state == CowState::Drowning);
    REQUIRE(session.GetScore() == 0);
    REQUIRE_FALSE(session.GetFarmer().IsDragging());
}

TEST_CASE("Lasso takes the earliest spawned cow in reach, not the nearest", "[session][lasso]") {
    GameSession session(GameplayConfig{}, kSeed);
    WalkFarmerToDitch(session);

    const CowId first = session.SpawnCowAt({100.0f, 120.0f}, {0.0f, -40.0f});
    const CowId second = session.SpawnCowAt({120.0f, 120.0f}, {0.0f, -40.0f});
    session.Tick(0.5f);
    REQUIRE(session.FindCow(first)->state == CowState::Drowning);
    REQUIRE(session.FindCow(second)->state == CowState::Drowning);

    session.OnPointerDown(118.0f, 40.0f);

    REQUIRE(session.FindCow(first)->state == CowState::Wandering);
    REQUIRE(session.FindCow(second)->state == CowState::Drowning);
    REQUIRE(session.GetScore() == 3);
}

TEST_CASE("A cow through the open gate scores and leaves the field", "[session][gate]") {
    GameSession session(GameplayConfig{}, kSeed);
    EventLog log(session);

    session.Tick(1.0f);
    session.Tick(2.5f);
    REQUIRE(session.GetGate().state == GateState::Open);

    const float fenceY = session.GetLayout().fenceY;
    const CowId id = session.SpawnCowAt({195.0f, fenceY - 25.0f}, {0.0f, 100.0f});
    session.Tick(0.1f);

    REQUIRE(session.FindCow(id) == nullptr);
    REQUIRE(session.GetScore() == 1);

    const auto safe = log.OfType(GameEventType::CowReachedSafety);
    REQUIRE(safe.size() == 1);
    REQUIRE(safe.front().cowId == id);
    REQUIRE(safe.front().bonus == 1);
}

TEST_CASE("Lives never go negative and game over is announced once", "[session]") {
    GameSession session(GameplayConfig{}, kSeed);
    EventLog log(session);

    std::vector<CowId> doomed;
    for (float x : {60.0f, 120.0f, 180.0f, 240.0f}) {
        doomed.push_back(session.SpawnCowAt({x, 110.0f}, {0.0f, -40.0f}));
    }

    for (int i = 0; i < 40 && !session.IsGameOver(); ++i) {
        session.Tick(0.5f);
    }

    REQUIRE(session.IsGameOver());
    REQUIRE(session.GetLives() == 0);

    const auto drowned = log.OfType(GameEventType::CowDrowned);
    REQUIRE(drowned.size() == 3);
    REQUIRE(drowned[0].livesRemaining == 2);
    REQUIRE(drowned[1].livesRemaining == 1);
    REQUIRE(drowned[2].livesRemaining == 0);

    // The fourth cow was still in the ditch when the game ended.
    REQUIRE(session.FindCow(doomed[3]) != nullptr);

    const float frozenTime = session.GetElapsedTime();
    for (int i = 0; i < 10; ++i) {
        session.Tick(0.5f);
    }
    REQUIRE(session.GetElapsedTime() == frozenTime);
    REQUIRE(session.GetLives() == 0);

    const auto gameOver = log.OfType(GameEventType::GameOver);
    REQUIRE(gameOver.size() == 1);
    REQUIRE(gameOver.front().finalScore == session.GetScore());

    const glm::vec2 farmer = session.GetFarmer().GetPosition();
    session.OnPointerDown(farmer.x, farmer.y);
    REQUIRE_FALSE(session.GetFarmer().IsDragging());
}

TEST_CASE("A drowning cow keeps the timer it fell in with", "[session][difficulty]") {
    GameplayConfig config;
    config.difficulty.initialDrowningDuration = 100.0f;
    config.difficulty.drowningDurationStep = 50.0f;
    GameSession session(config, kSeed);
    EventLog log(session);

    const CowId early = session.SpawnCowAt({100.0f, 110.0f}, {0.0f, -40.0f});
    session.Tick(0.5f);
    REQUIRE(session.FindCow(early)->drownTimer == 100.0f);

    for (int i = 0; i < 61; ++i) {
        session.Tick(0.5f);
    }
    REQUIRE(session.GetDifficultyLevel() == 1);
    REQUIRE(session.FindCow(early)->drownTimer == Catch::Approx(69.5f));

    const auto levelUps = log.OfType(GameEventType::DifficultyIncreased);
    REQUIRE(levelUps.size() == 1);
    REQUIRE(levelUps.front().difficultyLevel == 1);

    const CowId late = session.SpawnCowAt({300.0f, 110.0f}, {0.0f, -40.0f});
    session.Tick(0.5f);
    REQUIRE(session.FindCow(late)->drownTimer == 50.0f);
    REQUIRE(session.FindCow(early)->drownTimer == Catch::Approx(69.0f));
}

TEST_CASE("Cows stay inside the pasture and never climb out of the ditch on their own", "[session]") {
    GameSession session(GameplayConfig{}, kSeed);
    ditch::utils::RandomSource input(5);

    const auto& layout = session.GetLayout();
    const float r = session.GetConfig().cow.radius;

    std::unordered_map<CowId, CowState> lastState;
    int climbedOut = 0;
    GameEventBus::ScopedSubscription watcher(session.Events().Subscribe(
        GameEventType::CowReachedSafety, [&](const GameEvent& event) {
            auto it = lastState.find(event.cowId);
            if (it != lastState.end() && it->second == CowState::Drowning) {
                ++climbedOut;
            }
        }));

    for (int frame = 0; frame < 3600; ++frame) {
        if (frame % 45 == 0) {
            const glm::vec2 farmer = session.GetFarmer().GetPosition();
            session.OnPointerDown(farmer.x, farmer.y);
        }
        if (frame % 45 == 20) {
            session.OnPointerMove(input.UniformFloat(-50.0f, 440.0f), input.UniformFloat(-50.0f, 900.0f));
            session.OnPointerUp();
        }

        session.Tick(1.0f / 60.0f);

        const glm::vec2 farmer = session.GetFarmer().GetPosition();
        REQUIRE(farmer.x >= session.GetFarmer().GetRadius());
        REQUIRE(farmer.x <= layout.width - session.GetFarmer().GetRadius());

        for (const auto& cow : session.GetCows()) {
            REQUIRE(cow.position.x >= r);
            REQUIRE(cow.position.x <= layout.width - r);
            REQUIRE(cow.position.y <= layout.fenceY - r);

            auto it = lastState.find(cow.id);
            if (it != lastState.end() && it->second == CowState::Drowning) {
                REQUIRE((cow.state == CowState::Drowning || cow.state == CowState::Wandering));
            }
            lastState[cow.id] = cow.state;
        }
    }

    REQUIRE(climbedOut == 0);
}

TEST_CASE("Sessions with the same seed and input replay identically", "[session]") {
    GameSession a(GameplayConfig{}, 77u);
    GameSession b(GameplayConfig{}, 77u);

    for (int frame = 0; frame < 1800; ++frame) {
        if (frame == 100) {
            for (GameSession* session : {&a, &b}) {
                const glm::vec2 farmer = session->GetFarmer().GetPosition();
                session->OnPointerDown(farmer.x, farmer.y);
                session->OnPointerMove(farmer.x - 80.0f, farmer.y + 120.0f);
                session->OnPointerUp();
            }
        }
        a.Tick(1.0f / 60.0f);
        b.Tick(1.0f / 60.0f);
    }

    const auto cowsA = a.GetCows();
    const auto cowsB = b.GetCows();
    REQUIRE(cowsA.size() == cowsB.size());
    for (std::size_t i = 0; i < cowsA.size(); ++i) {
        REQUIRE(cowsA[i].id == cowsB[i].id);
        REQUIRE(cowsA[i].state == cowsB[i].state);
        REQUIRE(cowsA[i].position.x == cowsB[i].position.x);
        REQUIRE(cowsA[i].position.y == cowsB[i].position.y);
    }
    REQUIRE(a.GetScore() == b.GetScore());
    REQUIRE(a.GetLives() == b.GetLives());
}

TEST_CASE("Pointer input outside the field is clamped", "[session][farmer]") {
    GameSession session(GameplayConfig{}, kSeed);
    const auto& layout = session.GetLayout();
    const glm::vec2 start = session.GetFarmer().GetPosition();

    session.OnPointerDown(start.x, start.y);
    REQUIRE(session.GetFarmer().IsDragging());

    session.OnPointerMove(-1000.0f, 5000.0f);
    REQUIRE(session.GetFarmer().GetPosition().x == Catch::Approx(25.0f));
    REQUIRE(session.GetFarmer().GetPosition().y == Catch::Approx(layout.fenceY - 25.0f));

    session.OnPointerMove(1.0e6f, -1.0e6f);
    REQUIRE(session.GetFarmer().GetPosition().x == Catch::Approx(layout.width - 25.0f));
    REQUIRE(session.GetFarmer().GetPosition().y == Catch::Approx(layout.ditchHeight + 25.0f));

    session.OnPointerUp();
    session.OnPointerMove(start.x, start.y);
    REQUIRE_FALSE(session.GetFarmer().IsDragging());
    REQUIRE(session.GetFarmer().GetPosition().x == Catch::Approx(layout.width - 25.0f));
}

TEST_CASE("Invalid frame deltas are ignored", "[session]") {
    GameSession session(GameplayConfig{}, kSeed);

    session.Tick(-1.0f);
    session.Tick(std::numeric_limits<float>::quiet_NaN());
    session.Tick(std::numeric_limits<float>::infinity());
    REQUIRE(session.GetElapsedTime() == 0.0f);
    REQUIRE(session.GetGate().timer == Catch::Approx(1.0f));

    session.Update(100.0);
    REQUIRE(session.GetElapsedTime() == 0.0f);
    session.Update(100.5);
    REQUIRE(session.GetElapsedTime() == Catch::Approx(0.5f));
}

TEST_CASE("Session refuses an invalid configuration", "[session][config]") {
    GameplayConfig config;
    config.gate.openDuration = 0.0f;
    REQUIRE_THROWS_AS(GameSession(config, kSeed), ditch::core::ConfigError);

    GameplayConfig seeded;
    seeded.session.randomSeed = 1234u;
    GameSession session(seeded);
    REQUIRE(session.GetSeed() == 1234u);
}

TEST_CASE("Event handlers may spawn cows while a tick is running", "[session][events]") {
    GameplayConfig config;
    config.cow.mooChance = 1.0f;
    GameSession session(config, kSeed);
    EventLog log(session);

    std::vector<CowId> handlerSpawned;
    int spawnedOnMoo = 0;
    auto spawnOne = [&](const GameEvent&) {
        if (handlerSpawned.size() < 40) {
            handlerSpawned.push_back(session.SpawnCowAt({200.0f, 300.0f}, {0.0f, -40.0f}));
        }
    };
    GameEventBus::ScopedSubscription onMoo(session.Events().Subscribe(
        GameEventType::CowMooed, [&](const GameEvent& event) {
            ++spawnedOnMoo;
            spawnOne(event);
        }));
    GameEventBus::ScopedSubscription onSafe(session.Events().Subscribe(GameEventType::CowReachedSafety, spawnOne));
    GameEventBus::ScopedSubscription onDrowned(session.Events().Subscribe(GameEventType::CowDrowned, spawnOne));

    session.Tick(1.0f);
    session.Tick(2.5f);
    REQUIRE(session.GetGate().state == GateState::Open);

    const float fenceY = session.GetLayout().fenceY;
    const CowId safeCow = session.SpawnCowAt({195.0f, fenceY - 25.0f}, {0.0f, 100.0f});
    const CowId doomed = session.SpawnCowAt({60.0f, 102.0f}, {0.0f, -40.0f});
    session.Tick(0.1f);
    REQUIRE(session.FindCow(safeCow) == nullptr);
    REQUIRE(session.FindCow(doomed)->state == CowState::Drowning);

    auto doomedDrowned = [&] {
        for (const auto& event : log.OfType(GameEventType::CowDrowned)) {
            if (event.cowId == doomed) {
                return true;
            }
        }
        return false;
    };
    for (int i = 0; i < 25 && !doomedDrowned(); ++i) {
        session.Tick(0.5f);
    }

    REQUIRE(doomedDrowned());
    REQUIRE(session.FindCow(doomed) == nullptr);
    REQUIRE(spawnedOnMoo > 0);
    REQUIRE_FALSE(handlerSpawned.empty());

    for (CowId id : handlerSpawned) {
        const Cow* cow = session.FindCow(id);
        if (cow != nullptr) {
            REQUIRE(cow->id == id);
        }
    }

    const auto cows = session.GetCows();
    for (std::size_t i = 0; i < cows.size(); ++i) {
        for (std::size_t j = i + 1; j < cows.size(); ++j) {
            REQUIRE(cows[i].id != cows[j].id);
        }
    }
}
