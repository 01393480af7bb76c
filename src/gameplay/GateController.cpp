#include "ditch/gameplay/GateController.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "ditch/core/Error.hpp"
#include "ditch/core/Logger.hpp"

namespace ditch::gameplay {

namespace {

float Clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}

// Guards a zero or non-finite duration so the ratio never turns into NaN.
float SafeRatio(float timer, float duration) {
    if (!(duration > 0.0f)) {
        return 0.0f;
    }
    return timer / duration;
}

void RequirePositive(const char* field, float value) {
    if (!std::isfinite(value) || value <= 0.0f) {
        throw core::ConfigError(field, fmt::format("must be positive (got {})", value));
    }
}

} // namespace

std::string_view ToString(GateState state) {
    switch (state) {
        case GateState::Closed:  return "Closed";
        case GateState::Opening: return "Opening";
        case GateState::Open:    return "Open";
        case GateState::Closing: return "Closing";
    }
    return "Unknown";
}

GateController::GateController(const GateConfig& config, float centerX)
    : m_config(config), m_centerX(centerX) {
    RequirePositive("gate.fullWidth", m_config.fullWidth);
    RequirePositive("gate.openDuration", m_config.openDuration);
    RequirePositive("gate.closeDuration", m_config.closeDuration);
    RequirePositive("gate.stayOpenDuration", m_config.stayOpenDuration);
    RequirePositive("gate.stayClosedDuration", m_config.stayClosedDuration);
    if (!std::isfinite(m_config.initialClosedDelay) || m_config.initialClosedDelay < 0.0f) {
        throw core::ConfigError("gate.initialClosedDelay",
                                fmt::format("must not be negative (got {})", m_config.initialClosedDelay));
    }

    m_state = GateState::Closed;
    m_timer = m_config.initialClosedDelay;
    m_openAmount = 0.0f;
}

void GateController::Update(float deltaTime) {
    m_timer -= deltaTime;

    switch (m_state) {
        case GateState::Closed:
            m_openAmount = 0.0f;
            if (m_timer <= 0.0f) {
                Enter(GateState::Opening, m_config.openDuration);
            }
            break;
        case GateState::Opening:
            m_openAmount = Clamp01(1.0f - SafeRatio(m_timer, m_config.openDuration));
            if (m_timer <= 0.0f) {
                m_openAmount = 1.0f;
                Enter(GateState::Open, m_config.stayOpenDuration);
            }
            break;
        case GateState::Open:
            m_openAmount = 1.0f;
            if (m_timer <= 0.0f) {
                Enter(GateState::Closing, m_config.closeDuration);
            }
            break;
        case GateState::Closing:
            m_openAmount = Clamp01(SafeRatio(m_timer, m_config.closeDuration));
            if (m_timer <= 0.0f) {
                m_openAmount = 0.0f;
                Enter(GateState::Closed, m_config.stayClosedDuration);
            }
            break;
    }
}

bool GateController::CanPass(float x, float radius, float tolerance) const {
    const float halfOpening = GetOpeningWidth() * 0.5f;
    const float gateLeft = m_centerX - halfOpening;
    const float gateRight = m_centerX + halfOpening;
    const float cowHalf = radius * tolerance;
    return (x - cowHalf >= gateLeft) && (x + cowHalf <= gateRight);
}

float GateController::GetCycleDuration() const {
    return m_config.openDuration + m_config.stayOpenDuration +
           m_config.closeDuration + m_config.stayClosedDuration;
}

void GateController::Enter(GateState state, float timer) {
    core::Logger::Debug("[GateController] {} -> {}", ToString(m_state), ToString(state));
    m_state = state;
    m_timer = timer;
}

} // namespace ditch::gameplay
