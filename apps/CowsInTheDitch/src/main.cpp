#include <filesystem>
#include <string>
#include <exception>

#include "HeadlessGame.hpp"
#include "ditch/core/Error.hpp"
#include "ditch/core/Logger.hpp"
#include "ditch/utils/Config.hpp"

#ifndef DITCH_CONFIG_PATH
#define DITCH_CONFIG_PATH "config.json"
#endif

int main(int argc, char* argv[]) {
  try {
    const std::filesystem::path configPath =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(DITCH_CONFIG_PATH);
    auto configResult = ditch::utils::ConfigLoader::Load(configPath);

    if (configResult.HasErrors()) {
      ditch::core::Logger::Error("[main] Configuration errors detected. Please fix the following:");
      for (const auto& error : configResult.errors) {
        ditch::core::Logger::Error("[main]   - {}", error);
      }
      return 1;
    }

    ditch::utils::AppConfig appConfig = configResult.config;

    if (auto level = ditch::core::Logger::ParseLevel(appConfig.logging.level)) {
      ditch::core::Logger::SetMinimumLevel(*level);
    }
    // DITCH_LOG_LEVEL in the environment wins over the config file.
    ditch::core::Logger::ConfigureFromEnvironment();
    if (!appConfig.logging.file.empty()) {
      ditch::core::Logger::SetLogFile(appConfig.logging.file);
    }

    HeadlessGame game(appConfig);
    const RunSummary summary = game.Run();

    ditch::core::Logger::Info("[main] Saved {} cows{}", summary.finalScore,
                              summary.newHighScore ? " (new high score)" : "");
    return 0;
  } catch (const ditch::core::ConfigError& ex) {
    ditch::core::Logger::Error("[main] {}", ex.what());
    return 1;
  } catch (const std::exception& ex) {
    ditch::core::Logger::Error("[main] Fatal error: {}", ex.what());
    return 1;
  }
}
