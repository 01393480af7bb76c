#include "ditch/gameplay/GameplayConfig.hpp"

#include <cmath>

#include <fmt/format.h>

#include "ditch/core/Error.hpp"

namespace ditch::gameplay {

namespace {

struct Issue {
    std::string field;
    std::string details;
};

class IssueCollector {
public:
    void Positive(const char* field, float value) {
        if (!std::isfinite(value) || value <= 0.0f) {
            Add(field, fmt::format("must be positive (got {})", value));
        }
    }

    void NonNegative(const char* field, float value) {
        if (!std::isfinite(value) || value < 0.0f) {
            Add(field, fmt::format("must not be negative (got {})", value));
        }
    }

    void UnitInterval(const char* field, float value) {
        if (!std::isfinite(value) || value < 0.0f || value > 1.0f) {
            Add(field, fmt::format("must lie in [0, 1] (got {})", value));
        }
    }

    void OrderedRange(const char* field, float minValue, float maxValue) {
        if (!std::isfinite(minValue) || !std::isfinite(maxValue) || minValue > maxValue) {
            Add(field, fmt::format("minimum {} exceeds maximum {}", minValue, maxValue));
        }
    }

    void Add(std::string field, std::string details) {
        m_issues.push_back(Issue{std::move(field), std::move(details)});
    }

    const std::vector<Issue>& Issues() const { return m_issues; }

private:
    std::vector<Issue> m_issues;
};

std::vector<Issue> CollectIssues(const GameplayConfig& config) {
    IssueCollector check;

    const auto& field = config.field;
    check.Positive("field.width", field.width);
    check.Positive("field.height", field.height);
    check.Positive("field.ditchHeight", field.ditchHeight);
    check.NonNegative("field.fenceThickness", field.fenceThickness);
    if (!(field.fenceHeightRatio > 0.0f && field.fenceHeightRatio < 1.0f)) {
        check.Add("field.fenceHeightRatio",
                  fmt::format("must lie strictly between 0 and 1 (got {})", field.fenceHeightRatio));
    } else if (field.height * field.fenceHeightRatio <= field.ditchHeight) {
        check.Add("field.ditchHeight",
                  fmt::format("ditch top {} must be below the fence at {}",
                              field.ditchHeight, field.height * field.fenceHeightRatio));
    }

    const auto& farmer = config.farmer;
    check.Positive("farmer.radius", farmer.radius);
    check.Positive("farmer.dragPickupScale", farmer.dragPickupScale);
    check.NonNegative("farmer.lassoRange", farmer.lassoRange);

    const auto& cow = config.cow;
    check.Positive("cow.radius", cow.radius);
    check.Positive("cow.herdingRadius", cow.herdingRadius);
    check.NonNegative("cow.herdingForce", cow.herdingForce);
    check.NonNegative("cow.herdingImpulseScale", cow.herdingImpulseScale);
    check.Positive("cow.wanderInterval", cow.wanderInterval);
    check.UnitInterval("cow.mooChance", cow.mooChance);
    check.NonNegative("cow.spawnJitterX", cow.spawnJitterX);
    check.NonNegative("cow.wanderJitterX", cow.wanderJitterX);
    check.OrderedRange("cow.wanderJitterY", cow.wanderJitterYMin, cow.wanderJitterYMax);
    check.NonNegative("cow.spawnOffsetBelowFence", cow.spawnOffsetBelowFence);
    check.Positive("cow.gatePassTolerance", cow.gatePassTolerance);
    check.UnitInterval("cow.fenceBounceDamping", cow.fenceBounceDamping);
    check.Positive("cow.lassoPickScale", cow.lassoPickScale);
    check.NonNegative("cow.safeOffsetAboveFence", cow.safeOffsetAboveFence);
    check.UnitInterval("cow.rescueMinXRatio", cow.rescueMinXRatio);
    check.UnitInterval("cow.rescueMaxXRatio", cow.rescueMaxXRatio);
    check.OrderedRange("cow.rescueXRatio", cow.rescueMinXRatio, cow.rescueMaxXRatio);
    if (field.width > 0.0f && cow.radius * 4.0f > field.width) {
        check.Add("cow.radius", fmt::format("field width {} is too narrow for cows of radius {}",
                                            field.width, cow.radius));
    }

    const auto& gate = config.gate;
    check.Positive("gate.fullWidth", gate.fullWidth);
    check.Positive("gate.openDuration", gate.openDuration);
    check.Positive("gate.closeDuration", gate.closeDuration);
    check.Positive("gate.stayOpenDuration", gate.stayOpenDuration);
    check.Positive("gate.stayClosedDuration", gate.stayClosedDuration);
    check.NonNegative("gate.initialClosedDelay", gate.initialClosedDelay);

    const auto& difficulty = config.difficulty;
    check.Positive("difficulty.levelInterval", difficulty.levelInterval);
    check.Positive("difficulty.initialSpawnInterval", difficulty.initialSpawnInterval);
    check.Positive("difficulty.minimumSpawnInterval", difficulty.minimumSpawnInterval);
    check.NonNegative("difficulty.spawnIntervalStep", difficulty.spawnIntervalStep);
    check.Positive("difficulty.initialCowSpeed", difficulty.initialCowSpeed);
    check.NonNegative("difficulty.cowSpeedStep", difficulty.cowSpeedStep);
    check.Positive("difficulty.initialDrowningDuration", difficulty.initialDrowningDuration);
    check.Positive("difficulty.minimumDrowningDuration", difficulty.minimumDrowningDuration);
    check.NonNegative("difficulty.drowningDurationStep", difficulty.drowningDurationStep);

    const auto& session = config.session;
    if (session.startingLives < 1) {
        check.Add("session.startingLives", fmt::format("must be at least 1 (got {})", session.startingLives));
    }
    if (session.rescueBonus < 0) {
        check.Add("session.rescueBonus", fmt::format("must not be negative (got {})", session.rescueBonus));
    }
    if (session.safetyBonus < 0) {
        check.Add("session.safetyBonus", fmt::format("must not be negative (got {})", session.safetyBonus));
    }

    return check.Issues();
}

} // namespace

FieldLayout MakeFieldLayout(const FieldConfig& field) {
    FieldLayout layout;
    layout.width = field.width;
    layout.height = field.height;
    layout.ditchHeight = field.ditchHeight;
    layout.fenceY = field.height * field.fenceHeightRatio;
    layout.gateCenterX = field.width * 0.5f;
    layout.fieldMidY = (layout.ditchHeight + layout.fenceY) * 0.5f;
    return layout;
}

std::vector<std::string> ValidateGameplayConfig(const GameplayConfig& config) {
    std::vector<std::string> messages;
    for (const auto& issue : CollectIssues(config)) {
        messages.push_back(fmt::format("{}: {}", issue.field, issue.details));
    }
    return messages;
}

void RequireValidGameplayConfig(const GameplayConfig& config) {
    const auto issues = CollectIssues(config);
    if (!issues.empty()) {
        throw core::ConfigError(issues.front().field, issues.front().details);
    }
}

} // namespace ditch::gameplay
