#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ditch::gameplay {

struct FieldConfig {
    float width = 390.0f;
    float height = 844.0f;
    float ditchHeight = 80.0f;          // Water occupies [0, ditchHeight]
    float fenceHeightRatio = 0.68f;     // fenceY = height * ratio
    float fenceThickness = 8.0f;
};

struct FarmerConfig {
    float radius = 25.0f;
    float dragPickupScale = 2.5f;       // Pointer must land within radius * scale to grab
    float lassoRange = 100.0f;          // Farmer y must be below ditchHeight + lassoRange
};

struct CowConfig {
    float radius = 20.0f;
    float herdingRadius = 70.0f;
    float herdingForce = 3.0f;
    float herdingImpulseScale = 60.0f;
    float wanderInterval = 1.5f;
    float mooChance = 0.15f;
    float spawnJitterX = 15.0f;
    float wanderJitterX = 20.0f;
    float wanderJitterYMin = -10.0f;
    float wanderJitterYMax = 5.0f;
    float spawnOffsetBelowFence = 20.0f;
    float gatePassTolerance = 0.8f;     // Fraction of the radius that must clear the gate posts
    float fenceBounceDamping = 0.5f;
    float lassoPickScale = 3.0f;
    float safeOffsetAboveFence = 5.0f;
    float rescueMinXRatio = 0.2f;
    float rescueMaxXRatio = 0.8f;
};

struct GateConfig {
    float fullWidth = 160.0f;
    float openDuration = 2.5f;
    float closeDuration = 2.5f;
    float stayOpenDuration = 3.0f;
    float stayClosedDuration = 3.0f;
    float initialClosedDelay = 1.0f;    // First opening starts this long after session start
};

struct DifficultyConfig {
    float levelInterval = 30.0f;
    float initialSpawnInterval = 2.5f;
    float minimumSpawnInterval = 0.8f;
    float spawnIntervalStep = 0.3f;
    float initialCowSpeed = 40.0f;
    float cowSpeedStep = 8.0f;
    float initialDrowningDuration = 10.0f;
    float minimumDrowningDuration = 1.0f;
    float drowningDurationStep = 1.5f;
};

struct SessionConfig {
    int startingLives = 3;
    int rescueBonus = 3;
    int safetyBonus = 1;
    std::optional<std::uint32_t> randomSeed;
};

struct GameplayConfig {
    FieldConfig field;
    FarmerConfig farmer;
    CowConfig cow;
    GateConfig gate;
    DifficultyConfig difficulty;
    SessionConfig session;
};

/// Playfield geometry derived once from FieldConfig.
struct FieldLayout {
    float width = 0.0f;
    float height = 0.0f;
    float ditchHeight = 0.0f;
    float fenceY = 0.0f;
    float gateCenterX = 0.0f;
    float fieldMidY = 0.0f;
};

FieldLayout MakeFieldLayout(const FieldConfig& field);

// One "field: details" entry per invalid value; empty when usable.
std::vector<std::string> ValidateGameplayConfig(const GameplayConfig& config);

// Throws core::ConfigError naming the first invalid field.
void RequireValidGameplayConfig(const GameplayConfig& config);

} // namespace ditch::gameplay
