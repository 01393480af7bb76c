#include "ditch/gameplay/DifficultyScheduler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "ditch/core/Error.hpp"

namespace ditch::gameplay {

DifficultyScheduler::DifficultyScheduler(const DifficultyConfig& config)
    : m_config(config) {
    if (!(m_config.levelInterval > 0.0f)) {
        throw core::ConfigError("difficulty.levelInterval",
                                fmt::format("must be positive (got {})", m_config.levelInterval));
    }
    if (!(m_config.minimumSpawnInterval > 0.0f)) {
        throw core::ConfigError("difficulty.minimumSpawnInterval",
                                fmt::format("must be positive (got {})", m_config.minimumSpawnInterval));
    }
    if (!(m_config.minimumDrowningDuration > 0.0f)) {
        throw core::ConfigError("difficulty.minimumDrowningDuration",
                                fmt::format("must be positive (got {})", m_config.minimumDrowningDuration));
    }
}

bool DifficultyScheduler::Update(float elapsedTime) {
    const int level = LevelForElapsed(m_config, elapsedTime);
    if (level > m_level) {
        m_level = level;
        return true;
    }
    return false;
}

int DifficultyScheduler::LevelForElapsed(const DifficultyConfig& config, float elapsedTime) {
    if (!(config.levelInterval > 0.0f) || !std::isfinite(elapsedTime) || elapsedTime <= 0.0f) {
        return 0;
    }
    const double steps = std::floor(static_cast<double>(elapsedTime) / config.levelInterval);
    return static_cast<int>(std::min(steps, static_cast<double>(std::numeric_limits<int>::max())));
}

float DifficultyScheduler::SpawnIntervalForLevel(const DifficultyConfig& config, int level) {
    return std::max(config.minimumSpawnInterval,
                    config.initialSpawnInterval - static_cast<float>(level) * config.spawnIntervalStep);
}

float DifficultyScheduler::CowSpeedForLevel(const DifficultyConfig& config, int level) {
    return config.initialCowSpeed + static_cast<float>(level) * config.cowSpeedStep;
}

float DifficultyScheduler::DrowningDurationForLevel(const DifficultyConfig& config, int level) {
    return std::max(config.minimumDrowningDuration,
                    config.initialDrowningDuration - static_cast<float>(level) * config.drowningDurationStep);
}

} // namespace ditch::gameplay
