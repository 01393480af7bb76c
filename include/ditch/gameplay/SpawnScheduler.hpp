#pragma once

#include <optional>

#include <glm/vec2.hpp>

#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::utils {
class RandomSource;
}

namespace ditch::gameplay {

struct CowSpawnRequest {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float radius = 0.0f;
};

class SpawnScheduler {
public:
    SpawnScheduler(const CowConfig& cowConfig, const FieldLayout& layout);

    // Leftover time is dropped on a spawn, so at most one cow per call.
    std::optional<CowSpawnRequest> Update(float deltaTime,
                                          float spawnInterval,
                                          float cowSpeed,
                                          utils::RandomSource& random);

    // Builds a fresh cow just below the fence, heading for the ditch.
    CowSpawnRequest MakeSpawn(float cowSpeed, utils::RandomSource& random) const;

    float GetAccumulator() const { return m_accumulator; }
    void Reset() { m_accumulator = 0.0f; }

private:
    CowConfig m_cowConfig;
    FieldLayout m_layout;
    float m_accumulator = 0.0f;
};

} // namespace ditch::gameplay
