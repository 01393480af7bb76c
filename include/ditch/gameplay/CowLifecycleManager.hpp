#pragma once

#include <glm/vec2.hpp>

#include "ditch/gameplay/Cow.hpp"
#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::utils {
class RandomSource;
}

namespace ditch::gameplay {

class GameEventBus;
class GateController;

enum class WanderOutcome {
    StillWandering,
    ReachedSafety,
    FellInDitch
};

enum class DrownOutcome {
    StillDrowning,
    Drowned
};

/**
 * @brief Per-cow transition logic: wandering physics, ditch entry, drowning countdown, lasso rescue.
 *
 * The manager only mutates the cow it is handed and publishes CowMooed / SplashOccurred. Score,
 * lives and removal from the herd stay with GameSession, which acts on the returned outcome.
 */
class CowLifecycleManager {
public:
    CowLifecycleManager(const CowConfig& config,
                        const FieldLayout& layout,
                        utils::RandomSource& random,
                        GameEventBus& events);

    /**
     * @brief One wandering step: meander, herding push, integrate, walls, fence, ditch.
     *
     * On ReachedSafety the cow is parked just above the fence in state Safe. On FellInDitch
     * the cow is already Drowning with drownTimer = drowningDuration.
     */
    WanderOutcome UpdateWandering(Cow& cow,
                                  float deltaTime,
                                  const glm::vec2& farmerPosition,
                                  const GateController& gate,
                                  float cowSpeed,
                                  float drowningDuration);

    // Counts the drown timer down; on expiry the cow becomes Dead.
    DrownOutcome UpdateDrowning(Cow& cow, float deltaTime);

    // Snaps the cow into the water and captures drowningDuration for this cow only.
    void EnterDrowning(Cow& cow, float drowningDuration);

    // Pulls a drowning cow back to mid-field as if freshly spawned. Returns false if not Drowning.
    bool Rescue(Cow& cow, float cowSpeed);

    bool IsWithinLassoReach(const Cow& cow, const glm::vec2& point) const;

    // Zero outside the herding radius and when cow and farmer coincide.
    static glm::vec2 ComputeHerdingImpulse(const glm::vec2& cowPosition,
                                           const glm::vec2& farmerPosition,
                                           const CowConfig& config);

    const CowConfig& GetConfig() const { return m_config; }
    const FieldLayout& GetLayout() const { return m_layout; }

private:
    void Meander(Cow& cow, float deltaTime, float cowSpeed);

    CowConfig m_config;
    FieldLayout m_layout;
    utils::RandomSource& m_random;
    GameEventBus& m_events;
};

} // namespace ditch::gameplay
