#pragma once

#include <cstdint>
#include <vector>

#include <glm/vec2.hpp>

#include "ditch/core/Time.hpp"
#include "ditch/gameplay/Cow.hpp"
#include "ditch/gameplay/CowHerd.hpp"
#include "ditch/gameplay/CowLifecycleManager.hpp"
#include "ditch/gameplay/DifficultyScheduler.hpp"
#include "ditch/gameplay/FarmerController.hpp"
#include "ditch/gameplay/GameEvents.hpp"
#include "ditch/gameplay/GameplayConfig.hpp"
#include "ditch/gameplay/GateController.hpp"
#include "ditch/gameplay/SpawnScheduler.hpp"
#include "ditch/utils/Random.hpp"

namespace ditch::gameplay {

struct GateSnapshot {
    GateState state = GateState::Closed;
    float openAmount = 0.0f;
    float openingWidth = 0.0f;
    float centerX = 0.0f;
    float timer = 0.0f;
};

struct SessionSnapshot {
    int score = 0;
    int lives = 0;
    bool gameOver = false;
    float elapsedTime = 0.0f;
    int difficultyLevel = 0;
};

/**
 * @brief Owns one round of the game and advances it a frame at a time.
 *
 * Tick order: elapsed time and difficulty, gate, spawning, then every live cow in spawn
 * order. Pointer handlers must be called between ticks on the same thread as Tick().
 * Once the last life is lost the session latches game over and ignores further ticks
 * and pointer input.
 */
class GameSession {
public:
    // Seeds from config.session.randomSeed, or from std::random_device when unset.
    explicit GameSession(const GameplayConfig& config);
    GameSession(const GameplayConfig& config, std::uint32_t seed);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    void Tick(float deltaTime);

    // Derives dt from a host timestamp through the session's FrameClock, then ticks.
    void Update(double currentTimeSeconds);

    void OnPointerDown(float x, float y);
    void OnPointerMove(float x, float y);
    void OnPointerUp();

    // Places a wandering cow directly, bypassing the spawn timer. Safe to call from event handlers.
    CowId SpawnCowAt(const glm::vec2& position, const glm::vec2& velocity);

    const FarmerController& GetFarmer() const { return m_farmer; }
    std::vector<CowSnapshot> GetCows() const { return m_herd.Snapshot(); }
    const Cow* FindCow(CowId id) const { return m_herd.Find(id); }
    std::size_t GetLiveCowCount() const { return m_herd.LiveCount(); }

    GateSnapshot GetGate() const;
    const GateController& GetGateController() const { return m_gate; }
    SessionSnapshot GetSession() const;
    const DifficultyScheduler& GetDifficulty() const { return m_difficulty; }

    int GetScore() const { return m_score; }
    int GetLives() const { return m_lives; }
    bool IsGameOver() const { return m_gameOver; }
    float GetElapsedTime() const { return m_elapsedTime; }
    int GetDifficultyLevel() const { return m_difficulty.GetLevel(); }

    GameEventBus& Events() { return m_events; }
    const GameplayConfig& GetConfig() const { return m_config; }
    const FieldLayout& GetLayout() const { return m_layout; }
    std::uint32_t GetSeed() const { return m_random.GetSeed(); }
    core::FrameClock& Clock() { return m_clock; }

private:
    void UpdateCows(float deltaTime);
    void HandleReachedSafety(Cow& cow);
    void HandleDrowned(Cow& cow);
    bool TryLasso(const glm::vec2& point);
    void LatchGameOver();
    glm::vec2 ClampToField(float x, float y) const;

    GameplayConfig m_config;
    FieldLayout m_layout;
    utils::RandomSource m_random;
    GameEventBus m_events;
    core::FrameClock m_clock;
    GateController m_gate;
    DifficultyScheduler m_difficulty;
    SpawnScheduler m_spawner;
    FarmerController m_farmer;
    CowLifecycleManager m_lifecycle;
    CowHerd m_herd;

    int m_score = 0;
    int m_lives = 0;
    bool m_gameOver = false;
    float m_elapsedTime = 0.0f;
};

} // namespace ditch::gameplay
