#include "ditch/core/Logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct LoggerFileGuard {
    std::filesystem::path path;
    ditch::core::LogLevel previousLevel = ditch::core::Logger::GetMinimumLevel();

    LoggerFileGuard() = default;
    explicit LoggerFileGuard(std::filesystem::path p) : path(std::move(p)) {
        ditch::core::Logger::SetMinimumLevel(ditch::core::LogLevel::Debug);
    }
    ~LoggerFileGuard() {
        ditch::core::Logger::SetLogFile({});
        ditch::core::Logger::SetMinimumLevel(previousLevel);
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

} // namespace

TEST_CASE("Logger writes formatted messages to file", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "cowsintheditch_logger_test.log";

    LoggerFileGuard guard(tempFile);

    ditch::core::Logger::SetLogFile(tempFile);
    ditch::core::Logger::Info("Cow {} reached safety", 42);

    std::ifstream file(tempFile);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("[Info] Cow 42 reached safety") != std::string::npos);
}

TEST_CASE("Logger listeners receive log lines", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "cowsintheditch_logger_listener.log";

    LoggerFileGuard guard(tempFile);

    ditch::core::Logger::SetLogFile(tempFile);

    std::vector<std::string> captured;
    const auto token = ditch::core::Logger::RegisterListener(
        [&captured](ditch::core::LogLevel level, const std::string& line) {
            if (level == ditch::core::LogLevel::Warning) {
                captured.push_back(line);
            }
        });

    ditch::core::Logger::Warning("Captured warning {}", 7);

    ditch::core::Logger::UnregisterListener(token);
    ditch::core::Logger::Warning("Not captured");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Warning] Captured warning 7") != std::string::npos);
}

TEST_CASE("Logger minimum level filters quieter messages", "[logger]") {
    LoggerFileGuard guard;

    std::vector<ditch::core::LogLevel> seen;
    const auto token = ditch::core::Logger::RegisterListener(
        [&seen](ditch::core::LogLevel level, const std::string&) { seen.push_back(level); });

    ditch::core::Logger::SetMinimumLevel(ditch::core::LogLevel::Warning);
    ditch::core::Logger::Info("dropped");
    ditch::core::Logger::Warning("kept");
    ditch::core::Logger::Error("always kept");

    ditch::core::Logger::UnregisterListener(token);

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0] == ditch::core::LogLevel::Warning);
    REQUIRE(seen[1] == ditch::core::LogLevel::Error);
}

TEST_CASE("Logger parses level names", "[logger]") {
    using ditch::core::LogLevel;
    using ditch::core::Logger;

    REQUIRE(Logger::ParseLevel("debug") == LogLevel::Debug);
    REQUIRE(Logger::ParseLevel("INFO") == LogLevel::Info);
    REQUIRE(Logger::ParseLevel("warn") == LogLevel::Warning);
    REQUIRE(Logger::ParseLevel("Warning") == LogLevel::Warning);
    REQUIRE(Logger::ParseLevel("error") == LogLevel::Error);
    REQUIRE_FALSE(Logger::ParseLevel("loud").has_value());
}
