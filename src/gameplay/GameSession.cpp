#include "ditch/gameplay/GameSession.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include "ditch/core/Logger.hpp"

namespace ditch::gameplay {

namespace {

const GameplayConfig& Validated(const GameplayConfig& config) {
    RequireValidGameplayConfig(config);
    return config;
}

std::uint32_t ResolveSeed(const GameplayConfig& config) {
    if (config.session.randomSeed) {
        return *config.session.randomSeed;
    }
    return std::random_device{}();
}

} // namespace

GameSession::GameSession(const GameplayConfig& config)
    : GameSession(config, ResolveSeed(config)) {}

GameSession::GameSession(const GameplayConfig& config, std::uint32_t seed)
    : m_config(Validated(config))
    , m_layout(MakeFieldLayout(m_config.field))
    , m_random(seed)
    , m_gate(m_config.gate, m_layout.gateCenterX)
    , m_difficulty(m_config.difficulty)
    , m_spawner(m_config.cow, m_layout)
    , m_farmer(m_config.farmer, m_layout)
    , m_lifecycle(m_config.cow, m_layout, m_random, m_events)
    , m_lives(m_config.session.startingLives) {
    core::Logger::Info("[GameSession] New session on {:.0f}x{:.0f} field (fence at {:.1f}, seed {})",
                       m_layout.width, m_layout.height, m_layout.fenceY, seed);
}

void GameSession::Tick(float deltaTime) {
    if (m_gameOver) {
        return;
    }
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        core::Logger::Debug("[GameSession] Ignoring invalid frame delta {}", deltaTime);
        return;
    }

    m_elapsedTime += deltaTime;
    if (m_difficulty.Update(m_elapsedTime)) {
        core::Logger::Info("[GameSession] Difficulty level {}: spawn every {:.2f}s, speed {:.0f}, drown in {:.1f}s",
                           m_difficulty.GetLevel(),
                           m_difficulty.GetSpawnInterval(),
                           m_difficulty.GetCowSpeed(),
                           m_difficulty.GetDrowningDuration());
        GameEvent event;
        event.type = GameEventType::DifficultyIncreased;
        event.difficultyLevel = m_difficulty.GetLevel();
        m_events.Publish(event);
    }

    m_gate.Update(deltaTime);

    if (auto request = m_spawner.Update(deltaTime,
                                        m_difficulty.GetSpawnInterval(),
                                        m_difficulty.GetCowSpeed(),
                                        m_random)) {
        const CowId id = m_herd.Spawn(request->position, request->velocity, request->radius);
        GameEvent event;
        event.type = GameEventType::CowSpawned;
        event.cowId = id;
        event.position = request->position;
        m_events.Publish(event);
    }

    UpdateCows(deltaTime);
    m_herd.CollectGarbage();
}

void GameSession::Update(double currentTimeSeconds) {
    Tick(m_clock.Update(currentTimeSeconds));
}

void GameSession::UpdateCows(float deltaTime) {
    const float cowSpeed = m_difficulty.GetCowSpeed();
    const float drowningDuration = m_difficulty.GetDrowningDuration();
    const glm::vec2 farmerPosition = m_farmer.GetPosition();

    m_herd.ForEachLive([&](Cow& cow) {
        if (m_gameOver) {
            return;
        }
        switch (cow.state) {
            case CowState::Wandering: {
                const auto outcome = m_lifecycle.UpdateWandering(
                    cow, deltaTime, farmerPosition, m_gate, cowSpeed, drowningDuration);
                if (outcome == WanderOutcome::ReachedSafety) {
                    HandleReachedSafety(cow);
                }
                break;
            }
            case CowState::Drowning:
                if (m_lifecycle.UpdateDrowning(cow, deltaTime) == DrownOutcome::Drowned) {
                    HandleDrowned(cow);
                }
                break;
            case CowState::Rescued:
            case CowState::Dead:
            case CowState::Safe:
                break;
        }
    });
}

void GameSession::HandleReachedSafety(Cow& cow) {
    m_score += m_config.session.safetyBonus;

    // Finish with the herd before handlers run; they may spawn cows.
    GameEvent event;
    event.type = GameEventType::CowReachedSafety;
    event.cowId = cow.id;
    event.position = cow.position;
    event.bonus = m_config.session.safetyBonus;
    m_herd.Remove(cow.id);

    m_events.Publish(event);
}

void GameSession::HandleDrowned(Cow& cow) {
    m_lives = std::max(0, m_lives - 1);
    core::Logger::Debug("[GameSession] Cow {} drowned, {} lives left", cow.id, m_lives);

    GameEvent event;
    event.type = GameEventType::CowDrowned;
    event.cowId = cow.id;
    event.position = cow.position;
    event.livesRemaining = m_lives;
    m_herd.Remove(cow.id);

    m_events.Publish(event);

    if (m_lives == 0) {
        LatchGameOver();
    }
}

void GameSession::LatchGameOver() {
    if (m_gameOver) {
        return;
    }
    m_gameOver = true;
    m_farmer.EndDrag();
    core::Logger::Info("[GameSession] Game over after {:.1f}s with score {}", m_elapsedTime, m_score);

    GameEvent event;
    event.type = GameEventType::GameOver;
    event.finalScore = m_score;
    event.difficultyLevel = m_difficulty.GetLevel();
    m_events.Publish(event);
}

void GameSession::OnPointerDown(float x, float y) {
    if (m_gameOver) {
        return;
    }
    const glm::vec2 point = ClampToField(x, y);
    if (TryLasso(point)) {
        return;
    }
    if (m_farmer.BeginDrag(point)) {
        GameEvent event;
        event.type = GameEventType::FarmerDragStarted;
        event.position = m_farmer.GetPosition();
        m_events.Publish(event);
    }
}

void GameSession::OnPointerMove(float x, float y) {
    if (m_gameOver) {
        return;
    }
    m_farmer.DragTo(ClampToField(x, y));
}

void GameSession::OnPointerUp() {
    m_farmer.EndDrag();
}

bool GameSession::TryLasso(const glm::vec2& point) {
    if (!m_farmer.IsNearDitch()) {
        return false;
    }

    // First drowning cow in spawn order wins, not the nearest one.
    Cow* target = nullptr;
    m_herd.ForEachLive([&](Cow& cow) {
        if (!target && cow.state == CowState::Drowning && m_lifecycle.IsWithinLassoReach(cow, point)) {
            target = &cow;
        }
    });
    if (!target || !m_lifecycle.Rescue(*target, m_difficulty.GetCowSpeed())) {
        return false;
    }

    m_score += m_config.session.rescueBonus;
    core::Logger::Debug("[GameSession] Lassoed cow {} back to x={:.1f}", target->id, target->position.x);

    GameEvent event;
    event.type = GameEventType::CowRescued;
    event.cowId = target->id;
    event.position = target->position;
    event.bonus = m_config.session.rescueBonus;
    m_events.Publish(event);
    return true;
}

CowId GameSession::SpawnCowAt(const glm::vec2& position, const glm::vec2& velocity) {
    const float r = m_config.cow.radius;
    const glm::vec2 clamped(std::max(r, std::min(m_layout.width - r, position.x)),
                            std::max(0.0f, std::min(m_layout.fenceY - r, position.y)));
    const CowId id = m_herd.Spawn(clamped, velocity, r);

    GameEvent event;
    event.type = GameEventType::CowSpawned;
    event.cowId = id;
    event.position = clamped;
    m_events.Publish(event);
    return id;
}

GateSnapshot GameSession::GetGate() const {
    GateSnapshot snapshot;
    snapshot.state = m_gate.GetState();
    snapshot.openAmount = m_gate.GetOpenAmount();
    snapshot.openingWidth = m_gate.GetOpeningWidth();
    snapshot.centerX = m_gate.GetCenterX();
    snapshot.timer = m_gate.GetTimer();
    return snapshot;
}

SessionSnapshot GameSession::GetSession() const {
    SessionSnapshot snapshot;
    snapshot.score = m_score;
    snapshot.lives = m_lives;
    snapshot.gameOver = m_gameOver;
    snapshot.elapsedTime = m_elapsedTime;
    snapshot.difficultyLevel = m_difficulty.GetLevel();
    return snapshot;
}

glm::vec2 GameSession::ClampToField(float x, float y) const {
    const float cx = std::isfinite(x) ? std::clamp(x, 0.0f, m_layout.width) : m_layout.width * 0.5f;
    const float cy = std::isfinite(y) ? std::clamp(y, 0.0f, m_layout.height) : m_layout.fieldMidY;
    return glm::vec2(cx, cy);
}

} // namespace ditch::gameplay
