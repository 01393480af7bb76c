#pragma once

#include <string_view>

#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::gameplay {

enum class GateState {
    Closed,
    Opening,
    Open,
    Closing
};

std::string_view ToString(GateState state);

/**
 * @brief Timer-driven Closed -> Opening -> Open -> Closing cycle for the fence gate.
 *
 * Each state counts its timer down by dt. On expiry the gate moves exactly one state
 * forward and the timer is reloaded with the next state's full duration, so no state
 * is ever skipped, even for dt larger than a phase. openAmount is snapped to exactly
 * 1 or 0 when Opening or Closing completes.
 */
class GateController {
public:
    // Throws core::ConfigError for non-positive durations or width.
    GateController(const GateConfig& config, float centerX);

    void Update(float deltaTime);

    GateState GetState() const { return m_state; }
    float GetTimer() const { return m_timer; }
    float GetOpenAmount() const { return m_openAmount; }
    float GetCenterX() const { return m_centerX; }
    const GateConfig& GetConfig() const { return m_config; }

    // Passable width in field units, centered on GetCenterX().
    float GetOpeningWidth() const { return m_config.fullWidth * m_openAmount; }

    // tolerance: fraction of the radius that must clear each gate post.
    bool CanPass(float x, float radius, float tolerance) const;

    // Full cycle length: open + stay open + close + stay closed.
    float GetCycleDuration() const;

private:
    void Enter(GateState state, float timer);

    GateConfig m_config;
    float m_centerX = 0.0f;
    GateState m_state = GateState::Closed;
    float m_timer = 0.0f;
    float m_openAmount = 0.0f;
};

} // namespace ditch::gameplay
