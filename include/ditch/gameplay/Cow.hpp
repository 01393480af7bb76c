#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <glm/vec2.hpp>

namespace ditch::gameplay {

using CowId = std::uint32_t;
constexpr CowId kInvalidCowId = 0;

enum class CowState {
    Wandering,
    Drowning,
    Rescued,    // Transient while a lasso pulls the cow back; becomes Wandering immediately
    Dead,
    Safe
};

std::string_view ToString(CowState state);

inline bool IsTerminal(CowState state) {
    return state == CowState::Dead || state == CowState::Safe;
}

struct Cow {
    CowId id = kInvalidCowId;
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float radius = 20.0f;
    CowState state = CowState::Wandering;
    float wanderTimer = 0.0f;
    float drownTimer = 0.0f;    // Meaningful only while Drowning
};

/// Read-only view handed to rendering collaborators.
struct CowSnapshot {
    CowId id = kInvalidCowId;
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float radius = 0.0f;
    CowState state = CowState::Wandering;
    std::optional<float> remainingDrownTime;
};

} // namespace ditch::gameplay
