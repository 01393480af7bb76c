#include "ditch/save/HighScoreStore.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>

#include "ditch/core/Logger.hpp"

namespace ditch::save {

namespace {

constexpr const char* kHighScoreFilename = "high_score.json";

} // namespace

HighScoreStore::HighScoreStore(std::filesystem::path filePath)
    : m_filePath(std::move(filePath)) {}

std::filesystem::path HighScoreStore::DefaultPath(const std::filesystem::path& saveDirectory) {
    return saveDirectory / kHighScoreFilename;
}

HighScoreLoadResult HighScoreStore::Load() const {
    HighScoreLoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(m_filePath, ec)) {
        result.success = true;
        result.message = "No high score recorded yet";
        return result;
    }

    std::ifstream file(m_filePath);
    if (!file) {
        result.message = "Failed to open " + m_filePath.string();
        core::Logger::Error("[HighScoreStore] {}", result.message);
        return result;
    }

    try {
        nlohmann::json json;
        file >> json;
        // Read wide so 64-bit or fractional values clamp instead of wrapping.
        const double stored = json.value(kHighScoreKey, 0.0);
        const double clamped = std::clamp(stored, 0.0, static_cast<double>(std::numeric_limits<int>::max()));
        if (clamped != stored) {
            core::Logger::Warning("[HighScoreStore] Stored high score {} out of range, using {}", stored, clamped);
        }
        result.highScore = static_cast<int>(clamped);
        result.success = true;
        result.message = "Loaded high score";
    } catch (const nlohmann::json::exception& ex) {
        result.message = std::string("Failed to parse high score: ") + ex.what();
        core::Logger::Error("[HighScoreStore] {} ({})", result.message, m_filePath.string());
    }
    return result;
}

HighScoreSubmitResult HighScoreStore::Submit(int finalScore) {
    HighScoreSubmitResult result;

    const auto loaded = Load();
    result.previousBest = loaded.highScore;
    result.best = std::max(finalScore, result.previousBest);
    result.isNewHighScore = finalScore > result.previousBest;

    if (!result.isNewHighScore) {
        result.message = "Score did not beat the stored best";
        return result;
    }

    std::string error;
    if (!Write(finalScore, error)) {
        result.message = error;
        core::Logger::Error("[HighScoreStore] {}", error);
        return result;
    }

    result.saved = true;
    result.message = "New high score saved";
    core::Logger::Info("[HighScoreStore] New high score {} (previous {})", finalScore, result.previousBest);
    return result;
}

bool HighScoreStore::Write(int highScore, std::string& outError) const {
    std::error_code ec;
    const auto directory = m_filePath.parent_path();
    if (!directory.empty() && !std::filesystem::exists(directory, ec)) {
        if (!std::filesystem::create_directories(directory, ec)) {
            outError = "Failed to create save directory: " + directory.string() + " (" + ec.message() + ")";
            return false;
        }
    }

    nlohmann::json json = {
        {kHighScoreKey, highScore}
    };

    std::ofstream file(m_filePath, std::ios::out | std::ios::trunc);
    if (!file) {
        outError = "Failed to open " + m_filePath.string() + " for writing";
        return false;
    }
    file << json.dump(4);
    if (!file) {
        outError = "Failed to write " + m_filePath.string();
        return false;
    }
    return true;
}

} // namespace ditch::save
