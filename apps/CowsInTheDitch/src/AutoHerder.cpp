#include "AutoHerder.hpp"

#include <algorithm>
#include <limits>

#include <glm/geometric.hpp>

#include "ditch/gameplay/GameSession.hpp"

using ditch::gameplay::CowSnapshot;
using ditch::gameplay::CowState;

namespace {

// How far behind a cow (away from the gate) the farmer stands to push it.
constexpr float kPushStandoff = 45.0f;

} // namespace

AutoHerder::AutoHerder(float moveSpeed)
    : m_moveSpeed(moveSpeed) {}

void AutoHerder::Update(ditch::gameplay::GameSession& session, float deltaTime) {
    if (session.IsGameOver()) {
        return;
    }

    const auto cows = session.GetCows();
    const auto& farmer = session.GetFarmer();

    if (farmer.IsNearDitch()) {
        for (const auto& cow : cows) {
            if (cow.state == CowState::Drowning) {
                ++m_lassoAttempts;
                session.OnPointerUp();
                session.OnPointerDown(cow.position.x, cow.position.y);
                session.OnPointerUp();
                return;
            }
        }
    }

    const auto target = ChooseTarget(session, cows);
    if (!target) {
        return;
    }

    if (!farmer.IsDragging()) {
        session.OnPointerDown(farmer.GetPosition().x, farmer.GetPosition().y);
        if (!session.GetFarmer().IsDragging()) {
            return;
        }
    }

    // Grabbing at the farmer's centre leaves a zero drag offset, so moves land exactly.
    const glm::vec2 from = session.GetFarmer().GetPosition();
    glm::vec2 step = *target - from;
    const float maxStep = m_moveSpeed * deltaTime;
    const float length = glm::length(step);
    if (length > maxStep && length > 0.0f) {
        step *= maxStep / length;
    }
    session.OnPointerMove(from.x + step.x, from.y + step.y);
}

std::optional<glm::vec2> AutoHerder::ChooseTarget(const ditch::gameplay::GameSession& session,
                                                  const std::vector<CowSnapshot>& cows) const {
    const auto& layout = session.GetLayout();
    const auto& config = session.GetConfig();

    const CowSnapshot* drowning = nullptr;
    const CowSnapshot* lowest = nullptr;
    float lowestY = std::numeric_limits<float>::max();
    for (const auto& cow : cows) {
        if (cow.state == CowState::Drowning && !drowning) {
            drowning = &cow;
        } else if (cow.state == CowState::Wandering && cow.position.y < lowestY) {
            lowestY = cow.position.y;
            lowest = &cow;
        }
    }

    if (drowning) {
        return glm::vec2(drowning->position.x, layout.ditchHeight + config.farmer.lassoRange * 0.5f);
    }
    if (!lowest) {
        return std::nullopt;
    }

    const glm::vec2 gate(layout.gateCenterX, layout.fenceY);
    glm::vec2 toGate = gate - lowest->position;
    const float distance = glm::length(toGate);
    if (distance <= 0.0f) {
        return std::nullopt;
    }
    toGate /= distance;
    return lowest->position - toGate * kPushStandoff;
}
