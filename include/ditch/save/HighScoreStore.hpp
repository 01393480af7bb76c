#pragma once

#include <filesystem>
#include <string>

namespace ditch::save {

constexpr const char* kHighScoreKey = "CowsInTheDitchHighScore";

struct HighScoreLoadResult {
    bool success = false;
    std::string message;
    int highScore = 0;
};

struct HighScoreSubmitResult {
    int previousBest = 0;
    int best = 0;
    bool isNewHighScore = false;
    bool saved = false;     // False when nothing needed writing or the write failed
    std::string message;
};

/**
 * @brief Persists the best final score as a small JSON document.
 *
 * Storage problems are reported through the result structs and logged; they never
 * throw, so a broken save directory cannot interrupt play.
 */
class HighScoreStore {
public:
    explicit HighScoreStore(std::filesystem::path filePath);

    // A missing file is not an error: it loads as a high score of 0.
    HighScoreLoadResult Load() const;

    // Writes only when finalScore beats the stored best.
    HighScoreSubmitResult Submit(int finalScore);

    const std::filesystem::path& GetFilePath() const { return m_filePath; }

    static std::filesystem::path DefaultPath(const std::filesystem::path& saveDirectory);

private:
    bool Write(int highScore, std::string& outError) const;

    std::filesystem::path m_filePath;
};

} // namespace ditch::save
