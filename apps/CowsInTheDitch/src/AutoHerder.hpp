#pragma once

#include <optional>
#include <vector>

#include <glm/vec2.hpp>

#include "ditch/gameplay/Cow.hpp"

namespace ditch::gameplay {
class GameSession;
}

/**
 * @brief Scripted player that drives a session purely through pointer events.
 *
 * Drowning cows come first: the farmer runs to the ditch bank and lassoes them.
 * Otherwise the farmer gets between the lowest wandering cow and the ditch so the
 * herding push sends it back toward the gate.
 */
class AutoHerder {
public:
    explicit AutoHerder(float moveSpeed = 420.0f);

    void Update(ditch::gameplay::GameSession& session, float deltaTime);

    int GetLassoAttempts() const { return m_lassoAttempts; }

private:
    std::optional<glm::vec2> ChooseTarget(const ditch::gameplay::GameSession& session,
                                          const std::vector<ditch::gameplay::CowSnapshot>& cows) const;

    float m_moveSpeed = 420.0f;
    int m_lassoAttempts = 0;
};
