#pragma once

#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::gameplay {

// Level is floor(elapsed / levelInterval) and never moves backwards.
class DifficultyScheduler {
public:
    explicit DifficultyScheduler(const DifficultyConfig& config);

    // Returns true when the level went up.
    bool Update(float elapsedTime);

    int GetLevel() const { return m_level; }
    float GetSpawnInterval() const { return SpawnIntervalForLevel(m_config, m_level); }
    float GetCowSpeed() const { return CowSpeedForLevel(m_config, m_level); }
    float GetDrowningDuration() const { return DrowningDurationForLevel(m_config, m_level); }
    const DifficultyConfig& GetConfig() const { return m_config; }

    static int LevelForElapsed(const DifficultyConfig& config, float elapsedTime);
    static float SpawnIntervalForLevel(const DifficultyConfig& config, int level);
    static float CowSpeedForLevel(const DifficultyConfig& config, int level);
    static float DrowningDurationForLevel(const DifficultyConfig& config, int level);

private:
    DifficultyConfig m_config;
    int m_level = 0;
};

} // namespace ditch::gameplay
