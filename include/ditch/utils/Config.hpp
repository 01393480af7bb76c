#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ditch/gameplay/GameplayConfig.hpp"

namespace ditch::utils {

struct PathsConfig {
    std::filesystem::path saves;
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;         // Empty disables the log file
};

// Settings for the headless host loop; the simulation itself never reads these.
struct RunConfig {
    double frameStepSeconds = 1.0 / 60.0;
    double maxSimulatedSeconds = 600.0;
    double maxFrameDeltaSeconds = 0.0;  // 0 leaves frame deltas unclamped
    bool autoHerder = true;
};

struct AppConfig {
    gameplay::GameplayConfig gameplay;
    PathsConfig paths;
    LoggingConfig logging;
    RunConfig run;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Critical errors that should prevent startup
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    // Same as Load() but from an in-memory JSON document; relative paths resolve against baseDir.
    static ConfigLoadResult LoadFromString(const std::string& text, const std::filesystem::path& baseDir);

    /**
     * @brief Get the default user documents directory for saves/logs.
     * @return Path to user documents/CowsInTheDitch directory, or empty path if unavailable
     */
    static std::filesystem::path GetUserDocumentsPath();

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ApplyJson(const std::string& source, const std::string& text, ConfigLoadResult& result);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateRunConfig(RunConfig& run, ConfigLoadResult& result);
    static void Report(const ConfigLoadResult& result);
};

} // namespace ditch::utils
