#pragma once

#include <memory>

#include "ditch/utils/Config.hpp"

#include "AudioCues.hpp"
#include "AutoHerder.hpp"
#include "EventRouter.hpp"

namespace ditch::gameplay {
class GameSession;
}

namespace ditch::save {
class HighScoreStore;
}

struct RunSummary {
    int finalScore = 0;
    int livesRemaining = 0;
    int difficultyLevel = 0;
    double simulatedSeconds = 0.0;
    bool gameOver = false;
    bool newHighScore = false;
    int bestScore = 0;
};

/**
 * @brief Drives a GameSession at a fixed step without any window or renderer.
 */
class HeadlessGame {
public:
    explicit HeadlessGame(const ditch::utils::AppConfig& config);
    ~HeadlessGame();

    HeadlessGame(const HeadlessGame&) = delete;
    HeadlessGame& operator=(const HeadlessGame&) = delete;

    RunSummary Run();

private:
    void OnGameOver(int finalScore);

    ditch::utils::AppConfig m_config;
    std::unique_ptr<ditch::gameplay::GameSession> m_session;
    std::unique_ptr<ditch::save::HighScoreStore> m_highScores;
    std::unique_ptr<AudioCues> m_audio;
    AutoHerder m_herder;
    EventRouter m_router;
    RunSummary m_summary;
};
