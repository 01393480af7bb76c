#include "AudioCues.hpp"

#include "ditch/core/Logger.hpp"
#include "ditch/gameplay/GameSession.hpp"

using ditch::gameplay::GameEvent;
using ditch::gameplay::GameEventType;

AudioCues::AudioCues(const ditch::gameplay::GameSession& session, float giddyUpCooldownSeconds)
    : m_session(session)
    , m_giddyUpCooldown(giddyUpCooldownSeconds) {}

void AudioCues::Attach(ditch::gameplay::GameEventBus& bus) {
    m_router.RegisterAll(bus, [this](const GameEvent& event) { OnEvent(event); });
}

void AudioCues::Detach() {
    m_router.Clear();
}

void AudioCues::OnEvent(const GameEvent& event) {
    switch (event.type) {
        case GameEventType::CowMooed:
            ++m_cuesPlayed;
            ditch::core::Logger::Debug("[Audio] Moo from cow {}", event.cowId);
            break;
        case GameEventType::SplashOccurred:
            ++m_cuesPlayed;
            ditch::core::Logger::Info("[Audio] Splash! Cow {} is in the ditch", event.cowId);
            break;
        case GameEventType::CowRescued:
            ++m_cuesPlayed;
            ditch::core::Logger::Info("[Audio] Lasso rescue of cow {} (+{})", event.cowId, event.bonus);
            break;
        case GameEventType::CowReachedSafety:
            ++m_cuesPlayed;
            ditch::core::Logger::Info("[Audio] Cow {} made it to the pasture (+{})", event.cowId, event.bonus);
            break;
        case GameEventType::CowDrowned:
            ++m_cuesPlayed;
            ditch::core::Logger::Info("[Audio] Cow {} drowned, {} lives left", event.cowId, event.livesRemaining);
            break;
        case GameEventType::FarmerDragStarted:
            PlayGiddyUp();
            break;
        case GameEventType::GameOver:
        case GameEventType::CowSpawned:
        case GameEventType::DifficultyIncreased:
            break;
    }
}

void AudioCues::PlayGiddyUp() {
    const float now = m_session.GetElapsedTime();
    if (m_lastGiddyUpTime >= 0.0f && now - m_lastGiddyUpTime < m_giddyUpCooldown) {
        return;
    }
    m_lastGiddyUpTime = now;
    ++m_cuesPlayed;
    ditch::core::Logger::Info("[Audio] Giddy up!");
}
