#include "HeadlessGame.hpp"

#include "ditch/core/Logger.hpp"
#include "ditch/gameplay/GameSession.hpp"
#include "ditch/save/HighScoreStore.hpp"

using ditch::gameplay::GameEvent;
using ditch::gameplay::GameEventType;

HeadlessGame::HeadlessGame(const ditch::utils::AppConfig& config)
    : m_config(config) {
    m_session = std::make_unique<ditch::gameplay::GameSession>(m_config.gameplay);
    m_session->Clock().SetMaxDelta(m_config.run.maxFrameDeltaSeconds);
    m_highScores = std::make_unique<ditch::save::HighScoreStore>(
        ditch::save::HighScoreStore::DefaultPath(m_config.paths.saves));

    m_audio = std::make_unique<AudioCues>(*m_session);
    m_audio->Attach(m_session->Events());

    m_router.Register(m_session->Events(), GameEventType::GameOver,
                      [this](const GameEvent& event) { OnGameOver(event.finalScore); });
    m_router.Register(m_session->Events(), GameEventType::DifficultyIncreased,
                      [](const GameEvent& event) {
                          ditch::core::Logger::Info("[HeadlessGame] Things speed up: level {}", event.difficultyLevel);
                      });
}

HeadlessGame::~HeadlessGame() {
    m_router.Clear();
    if (m_audio) {
        m_audio->Detach();
    }
}

RunSummary HeadlessGame::Run() {
    const double step = m_config.run.frameStepSeconds;
    const double limit = m_config.run.maxSimulatedSeconds;

    ditch::core::Logger::Info("[HeadlessGame] Running up to {:.0f}s at {:.4f}s per frame (bot {})",
                              limit, step, m_config.run.autoHerder ? "on" : "off");

    // The first Update() only seeds the clock.
    double now = 0.0;
    m_session->Update(now);
    while (!m_session->IsGameOver() && m_session->GetElapsedTime() < limit) {
        now += step;
        m_session->Update(now);
        if (m_config.run.autoHerder) {
            m_herder.Update(*m_session, static_cast<float>(step));
        }
    }

    const auto state = m_session->GetSession();
    m_summary.finalScore = state.score;
    m_summary.livesRemaining = state.lives;
    m_summary.difficultyLevel = state.difficultyLevel;
    m_summary.simulatedSeconds = state.elapsedTime;
    m_summary.gameOver = state.gameOver;
    if (!state.gameOver) {
        // Time cap reached: still offer the score to the high-score table.
        OnGameOver(state.score);
    }

    ditch::core::Logger::Info("[HeadlessGame] Finished after {:.1f}s: score {}, lives {}, level {}, {} lasso throws, {} audio cues",
                              m_summary.simulatedSeconds,
                              m_summary.finalScore,
                              m_summary.livesRemaining,
                              m_summary.difficultyLevel,
                              m_herder.GetLassoAttempts(),
                              m_audio->GetCuesPlayed());
    return m_summary;
}

void HeadlessGame::OnGameOver(int finalScore) {
    const auto result = m_highScores->Submit(finalScore);
    m_summary.newHighScore = result.isNewHighScore && finalScore > 0;
    m_summary.bestScore = result.best;
    if (m_summary.newHighScore) {
        ditch::core::Logger::Info("[HeadlessGame] New High Score! {}", finalScore);
    } else {
        ditch::core::Logger::Info("[HeadlessGame] Final score {} (best {})", finalScore, result.best);
    }
}
