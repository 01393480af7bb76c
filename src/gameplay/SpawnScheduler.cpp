#include "ditch/gameplay/SpawnScheduler.hpp"

#include "ditch/utils/Random.hpp"

namespace ditch::gameplay {

SpawnScheduler::SpawnScheduler(const CowConfig& cowConfig, const FieldLayout& layout)
    : m_cowConfig(cowConfig), m_layout(layout) {}

std::optional<CowSpawnRequest> SpawnScheduler::Update(float deltaTime,
                                                      float spawnInterval,
                                                      float cowSpeed,
                                                      utils::RandomSource& random) {
    m_accumulator += deltaTime;
    if (m_accumulator < spawnInterval) {
        return std::nullopt;
    }
    m_accumulator = 0.0f;
    return MakeSpawn(cowSpeed, random);
}

CowSpawnRequest SpawnScheduler::MakeSpawn(float cowSpeed, utils::RandomSource& random) const {
    const float r = m_cowConfig.radius;

    CowSpawnRequest request;
    request.radius = r;
    request.position.x = random.UniformFloat(r * 2.0f, m_layout.width - r * 2.0f);
    request.position.y = m_layout.fenceY - r - m_cowConfig.spawnOffsetBelowFence;
    request.velocity.x = random.UniformFloat(-m_cowConfig.spawnJitterX, m_cowConfig.spawnJitterX);
    request.velocity.y = -cowSpeed;
    return request;
}

} // namespace ditch::gameplay
