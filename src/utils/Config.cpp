#include "ditch/utils/Config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

#include "ditch/core/Logger.hpp"

namespace ditch::utils {

namespace {

constexpr double kMinFrameStep = 1.0 / 1000.0;
constexpr double kMaxFrameStep = 1.0;
constexpr double kMaxSimulatedSeconds = 24.0 * 60.0 * 60.0;

static std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

static std::filesystem::path ResolvePath(const std::filesystem::path& baseDir,
                                         const std::string& value) {
    if (value.empty()) {
        return NormalizePath(baseDir);
    }
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

// Reads section[key] into target, leaving the default and recording a warning on a type mismatch.
template <typename T>
static void ReadInto(const nlohmann::json& section,
                     const char* sectionName,
                     const char* key,
                     T& target,
                     std::vector<std::string>& warnings) {
    if (!section.is_object()) {
        return;
    }
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        warnings.push_back(fmt::format("Ignoring '{}.{}': {}", sectionName, key, e.what()));
    }
}

static nlohmann::json Section(const nlohmann::json& root, const char* name) {
    if (root.contains(name) && root[name].is_object()) {
        return root[name];
    }
    return nlohmann::json::object();
}

} // namespace

std::filesystem::path ConfigLoader::GetUserDocumentsPath() {
#ifdef _WIN32
    wchar_t* documentsPath = nullptr;
    if (SHGetKnownFolderPath(FOLDERID_Documents, 0, nullptr, &documentsPath) == S_OK) {
        std::filesystem::path path(documentsPath);
        CoTaskMemFree(documentsPath);
        return path / "CowsInTheDitch";
    }
#else
    const char* homeDir = getenv("HOME");
    if (homeDir) {
        return std::filesystem::path(homeDir) / "Documents" / "CowsInTheDitch";
    }
    // Fallback to passwd entry
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir) / "Documents" / "CowsInTheDitch";
    }
#endif
    return std::filesystem::path();
}

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;

    std::filesystem::path userDocsPath = GetUserDocumentsPath();
    if (!userDocsPath.empty()) {
        config.paths.saves = NormalizePath(userDocsPath / "saves");
    } else {
        config.paths.saves = NormalizePath(baseDir / "saves");
    }
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        core::Logger::Warning(
            "[ConfigLoader] Config file '{}' not found, using defaults",
            path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        return result;
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    ApplyJson(path.string(), contents.str(), result);
    Report(result);
    if (result.loadedFromFile) {
        core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    }
    return result;
}

ConfigLoadResult ConfigLoader::LoadFromString(const std::string& text, const std::filesystem::path& baseDir) {
    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);
    ApplyJson("<memory>", text, result);
    Report(result);
    return result;
}

void ConfigLoader::ApplyJson(const std::string& source, const std::string& text, ConfigLoadResult& result) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("Failed to parse JSON '{}': {}", source, e.what()));
        return;
    }
    if (!json.is_object()) {
        result.errors.push_back(fmt::format("Config '{}' must be a JSON object", source));
        return;
    }

    auto& warnings = result.warnings;
    auto& gameplay = result.config.gameplay;
    const std::filesystem::path& baseDir = result.config.configDirectory;

    const auto fieldObj = Section(json, "field");
    ReadInto(fieldObj, "field", "width", gameplay.field.width, warnings);
    ReadInto(fieldObj, "field", "height", gameplay.field.height, warnings);
    ReadInto(fieldObj, "field", "ditchHeight", gameplay.field.ditchHeight, warnings);
    ReadInto(fieldObj, "field", "fenceHeightRatio", gameplay.field.fenceHeightRatio, warnings);
    ReadInto(fieldObj, "field", "fenceThickness", gameplay.field.fenceThickness, warnings);

    const auto farmerObj = Section(json, "farmer");
    ReadInto(farmerObj, "farmer", "radius", gameplay.farmer.radius, warnings);
    ReadInto(farmerObj, "farmer", "dragPickupScale", gameplay.farmer.dragPickupScale, warnings);
    ReadInto(farmerObj, "farmer", "lassoRange", gameplay.farmer.lassoRange, warnings);

    const auto cowObj = Section(json, "cow");
    auto& cow = gameplay.cow;
    ReadInto(cowObj, "cow", "radius", cow.radius, warnings);
    ReadInto(cowObj, "cow", "herdingRadius", cow.herdingRadius, warnings);
    ReadInto(cowObj, "cow", "herdingForce", cow.herdingForce, warnings);
    ReadInto(cowObj, "cow", "herdingImpulseScale", cow.herdingImpulseScale, warnings);
    ReadInto(cowObj, "cow", "wanderInterval", cow.wanderInterval, warnings);
    ReadInto(cowObj, "cow", "mooChance", cow.mooChance, warnings);
    ReadInto(cowObj, "cow", "spawnJitterX", cow.spawnJitterX, warnings);
    ReadInto(cowObj, "cow", "wanderJitterX", cow.wanderJitterX, warnings);
    ReadInto(cowObj, "cow", "wanderJitterYMin", cow.wanderJitterYMin, warnings);
    ReadInto(cowObj, "cow", "wanderJitterYMax", cow.wanderJitterYMax, warnings);
    ReadInto(cowObj, "cow", "spawnOffsetBelowFence", cow.spawnOffsetBelowFence, warnings);
    ReadInto(cowObj, "cow", "gatePassTolerance", cow.gatePassTolerance, warnings);
    ReadInto(cowObj, "cow", "fenceBounceDamping", cow.fenceBounceDamping, warnings);
    ReadInto(cowObj, "cow", "lassoPickScale", cow.lassoPickScale, warnings);
    ReadInto(cowObj, "cow", "safeOffsetAboveFence", cow.safeOffsetAboveFence, warnings);
    ReadInto(cowObj, "cow", "rescueMinXRatio", cow.rescueMinXRatio, warnings);
    ReadInto(cowObj, "cow", "rescueMaxXRatio", cow.rescueMaxXRatio, warnings);

    const auto gateObj = Section(json, "gate");
    ReadInto(gateObj, "gate", "fullWidth", gameplay.gate.fullWidth, warnings);
    ReadInto(gateObj, "gate", "openDuration", gameplay.gate.openDuration, warnings);
    ReadInto(gateObj, "gate", "closeDuration", gameplay.gate.closeDuration, warnings);
    ReadInto(gateObj, "gate", "stayOpenDuration", gameplay.gate.stayOpenDuration, warnings);
    ReadInto(gateObj, "gate", "stayClosedDuration", gameplay.gate.stayClosedDuration, warnings);
    ReadInto(gateObj, "gate", "initialClosedDelay", gameplay.gate.initialClosedDelay, warnings);

    const auto difficultyObj = Section(json, "difficulty");
    auto& difficulty = gameplay.difficulty;
    ReadInto(difficultyObj, "difficulty", "levelInterval", difficulty.levelInterval, warnings);
    ReadInto(difficultyObj, "difficulty", "initialSpawnInterval", difficulty.initialSpawnInterval, warnings);
    ReadInto(difficultyObj, "difficulty", "minimumSpawnInterval", difficulty.minimumSpawnInterval, warnings);
    ReadInto(difficultyObj, "difficulty", "spawnIntervalStep", difficulty.spawnIntervalStep, warnings);
    ReadInto(difficultyObj, "difficulty", "initialCowSpeed", difficulty.initialCowSpeed, warnings);
    ReadInto(difficultyObj, "difficulty", "cowSpeedStep", difficulty.cowSpeedStep, warnings);
    ReadInto(difficultyObj, "difficulty", "initialDrowningDuration", difficulty.initialDrowningDuration, warnings);
    ReadInto(difficultyObj, "difficulty", "minimumDrowningDuration", difficulty.minimumDrowningDuration, warnings);
    ReadInto(difficultyObj, "difficulty", "drowningDurationStep", difficulty.drowningDurationStep, warnings);

    const auto sessionObj = Section(json, "session");
    ReadInto(sessionObj, "session", "startingLives", gameplay.session.startingLives, warnings);
    ReadInto(sessionObj, "session", "rescueBonus", gameplay.session.rescueBonus, warnings);
    ReadInto(sessionObj, "session", "safetyBonus", gameplay.session.safetyBonus, warnings);
    if (sessionObj.contains("randomSeed")) {
        const auto& seed = sessionObj["randomSeed"];
        if (seed.is_number_unsigned() || (seed.is_number_integer() && seed.get<std::int64_t>() >= 0)) {
            gameplay.session.randomSeed = static_cast<std::uint32_t>(seed.get<std::uint64_t>());
        } else if (!seed.is_null()) {
            warnings.push_back("Ignoring 'session.randomSeed': expected a non-negative integer");
        }
    }

    const auto pathsObj = Section(json, "paths");
    if (pathsObj.contains("saves") && pathsObj["saves"].is_string()) {
        result.config.paths.saves = ResolvePath(baseDir, pathsObj["saves"].get<std::string>());
    }

    const auto loggingObj = Section(json, "logging");
    ReadInto(loggingObj, "logging", "level", result.config.logging.level, warnings);
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        const auto file = loggingObj["file"].get<std::string>();
        result.config.logging.file = file.empty() ? std::filesystem::path() : ResolvePath(baseDir, file);
    }

    const auto runObj = Section(json, "run");
    auto& run = result.config.run;
    ReadInto(runObj, "run", "frameStepSeconds", run.frameStepSeconds, warnings);
    ReadInto(runObj, "run", "maxSimulatedSeconds", run.maxSimulatedSeconds, warnings);
    ReadInto(runObj, "run", "maxFrameDeltaSeconds", run.maxFrameDeltaSeconds, warnings);
    ReadInto(runObj, "run", "autoHerder", run.autoHerder, warnings);

    result.loadedFromFile = true;
    ValidateConfig(result.config, result);
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    for (auto& issue : gameplay::ValidateGameplayConfig(config.gameplay)) {
        result.errors.push_back(std::move(issue));
    }
    if (!core::Logger::ParseLevel(config.logging.level)) {
        result.warnings.push_back(fmt::format("Unknown logging.level '{}', using 'info'", config.logging.level));
        config.logging.level = "info";
    }
    ValidateRunConfig(config.run, result);
}

void ConfigLoader::ValidateRunConfig(RunConfig& run, ConfigLoadResult& result) {
    if (run.frameStepSeconds < kMinFrameStep || run.frameStepSeconds > kMaxFrameStep) {
        double clamped = std::clamp(run.frameStepSeconds, kMinFrameStep, kMaxFrameStep);
        result.warnings.push_back(fmt::format(
            "run.frameStepSeconds {} is out of range [{}, {}], clamping to {}",
            run.frameStepSeconds, kMinFrameStep, kMaxFrameStep, clamped));
        run.frameStepSeconds = clamped;
    }
    if (run.maxSimulatedSeconds <= 0.0 || run.maxSimulatedSeconds > kMaxSimulatedSeconds) {
        double clamped = std::clamp(run.maxSimulatedSeconds, 1.0, kMaxSimulatedSeconds);
        result.warnings.push_back(fmt::format(
            "run.maxSimulatedSeconds {} is out of range, clamping to {}",
            run.maxSimulatedSeconds, clamped));
        run.maxSimulatedSeconds = clamped;
    }
    if (run.maxFrameDeltaSeconds < 0.0) {
        result.warnings.push_back("run.maxFrameDeltaSeconds must not be negative, disabling the clamp");
        run.maxFrameDeltaSeconds = 0.0;
    }
}

void ConfigLoader::Report(const ConfigLoadResult& result) {
    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        core::Logger::Error("[ConfigLoader] {}", error);
    }
}

} // namespace ditch::utils
