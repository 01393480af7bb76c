#include "ditch/gameplay/CowLifecycleManager.hpp"

#include <cmath>

#include <fmt/format.h>
#include <glm/geometric.hpp>

#include "ditch/core/Error.hpp"
#include "ditch/core/Logger.hpp"
#include "ditch/gameplay/GameEvents.hpp"
#include "ditch/gameplay/GateController.hpp"
#include "ditch/utils/Random.hpp"

namespace ditch::gameplay {

namespace {

void RequirePositive(const char* field, float value) {
    if (!std::isfinite(value) || value <= 0.0f) {
        throw core::ConfigError(field, fmt::format("must be positive (got {})", value));
    }
}

} // namespace

CowLifecycleManager::CowLifecycleManager(const CowConfig& config,
                                         const FieldLayout& layout,
                                         utils::RandomSource& random,
                                         GameEventBus& events)
    : m_config(config)
    , m_layout(layout)
    , m_random(random)
    , m_events(events) {
    RequirePositive("cow.radius", m_config.radius);
    RequirePositive("cow.herdingRadius", m_config.herdingRadius);
    RequirePositive("cow.wanderInterval", m_config.wanderInterval);
    RequirePositive("cow.lassoPickScale", m_config.lassoPickScale);
    if (!(m_layout.width > m_config.radius * 2.0f) || !(m_layout.fenceY > m_layout.ditchHeight)) {
        throw core::ConfigError("field", fmt::format("{}x{} field with fence at {} cannot hold cows",
                                                     m_layout.width, m_layout.height, m_layout.fenceY));
    }
}

WanderOutcome CowLifecycleManager::UpdateWandering(Cow& cow,
                                                   float deltaTime,
                                                   const glm::vec2& farmerPosition,
                                                   const GateController& gate,
                                                   float cowSpeed,
                                                   float drowningDuration) {
    Meander(cow, deltaTime, cowSpeed);

    glm::vec2 velocity = cow.velocity + ComputeHerdingImpulse(cow.position, farmerPosition, m_config);
    glm::vec2 next = cow.position + velocity * deltaTime;

    const float r = cow.radius;
    if (next.x < r) {
        next.x = r;
        velocity.x = std::abs(velocity.x);
    } else if (next.x > m_layout.width - r) {
        next.x = m_layout.width - r;
        velocity.x = -std::abs(velocity.x);
    }

    const bool wasBelowFence = cow.position.y < m_layout.fenceY;
    const bool isAtFence = wasBelowFence && next.y >= m_layout.fenceY - r;
    if (isAtFence) {
        if (gate.CanPass(next.x, r, m_config.gatePassTolerance)) {
            cow.position = glm::vec2(next.x, m_layout.fenceY + r + m_config.safeOffsetAboveFence);
            cow.velocity = velocity;
            cow.state = CowState::Safe;
            core::Logger::Debug("[CowLifecycle] Cow {} passed the gate at x={:.1f}", cow.id, next.x);
            return WanderOutcome::ReachedSafety;
        }
        next.y = m_layout.fenceY - r - 1.0f;
        velocity.y = -std::abs(velocity.y) * m_config.fenceBounceDamping;
    }

    cow.position = next;
    cow.velocity = velocity;

    if (next.y <= m_layout.ditchHeight + r) {
        EnterDrowning(cow, drowningDuration);
        return WanderOutcome::FellInDitch;
    }
    return WanderOutcome::StillWandering;
}

void CowLifecycleManager::Meander(Cow& cow, float deltaTime, float cowSpeed) {
    cow.wanderTimer += deltaTime;
    if (cow.wanderTimer <= m_config.wanderInterval) {
        return;
    }

    cow.wanderTimer = 0.0f;
    cow.velocity.x = m_random.UniformFloat(-m_config.wanderJitterX, m_config.wanderJitterX);
    cow.velocity.y = -cowSpeed + m_random.UniformFloat(m_config.wanderJitterYMin, m_config.wanderJitterYMax);

    if (m_random.Chance(m_config.mooChance)) {
        GameEvent event;
        event.type = GameEventType::CowMooed;
        event.cowId = cow.id;
        event.position = cow.position;
        m_events.Publish(event);
    }
}

DrownOutcome CowLifecycleManager::UpdateDrowning(Cow& cow, float deltaTime) {
    cow.drownTimer -= deltaTime;
    if (cow.drownTimer <= 0.0f) {
        cow.state = CowState::Dead;
        core::Logger::Debug("[CowLifecycle] Cow {} drowned", cow.id);
        return DrownOutcome::Drowned;
    }
    return DrownOutcome::StillDrowning;
}

void CowLifecycleManager::EnterDrowning(Cow& cow, float drowningDuration) {
    cow.state = CowState::Drowning;
    cow.drownTimer = drowningDuration;
    cow.position.y = m_layout.ditchHeight * 0.5f;
    cow.velocity = glm::vec2(0.0f);
    core::Logger::Debug("[CowLifecycle] Cow {} fell in the ditch ({:.1f}s to rescue)", cow.id, drowningDuration);

    GameEvent event;
    event.type = GameEventType::SplashOccurred;
    event.cowId = cow.id;
    event.position = cow.position;
    m_events.Publish(event);
}

bool CowLifecycleManager::Rescue(Cow& cow, float cowSpeed) {
    if (cow.state != CowState::Drowning) {
        return false;
    }

    cow.state = CowState::Rescued;
    cow.drownTimer = 0.0f;
    cow.position.x = m_random.UniformFloat(m_layout.width * m_config.rescueMinXRatio,
                                           m_layout.width * m_config.rescueMaxXRatio);
    cow.position.y = m_layout.fieldMidY;
    cow.velocity.x = m_random.UniformFloat(-m_config.spawnJitterX, m_config.spawnJitterX);
    cow.velocity.y = -cowSpeed;
    cow.wanderTimer = 0.0f;
    cow.state = CowState::Wandering;
    return true;
}

bool CowLifecycleManager::IsWithinLassoReach(const Cow& cow, const glm::vec2& point) const {
    return glm::distance(cow.position, point) < cow.radius * m_config.lassoPickScale;
}

glm::vec2 CowLifecycleManager::ComputeHerdingImpulse(const glm::vec2& cowPosition,
                                                     const glm::vec2& farmerPosition,
                                                     const CowConfig& config) {
    const glm::vec2 offset = cowPosition - farmerPosition;
    const float dist = glm::length(offset);
    if (!(dist > 0.0f) || dist >= config.herdingRadius) {
        return glm::vec2(0.0f);
    }
    const float strength = config.herdingForce * (1.0f - dist / config.herdingRadius);
    return (offset / dist) * strength * config.herdingImpulseScale;
}

} // namespace ditch::gameplay
