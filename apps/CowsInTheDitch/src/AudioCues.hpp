#pragma once

#include "ditch/gameplay/GameEvents.hpp"

#include "EventRouter.hpp"

namespace ditch::gameplay {
class GameSession;
}

/**
 * @brief Stand-in for the sound layer: turns gameplay events into logged cues.
 *
 * The "giddy up" shout is throttled to one per cooldown window of simulated time.
 */
class AudioCues {
public:
    explicit AudioCues(const ditch::gameplay::GameSession& session, float giddyUpCooldownSeconds = 4.0f);

    void Attach(ditch::gameplay::GameEventBus& bus);
    void Detach();

    int GetCuesPlayed() const { return m_cuesPlayed; }

private:
    void OnEvent(const ditch::gameplay::GameEvent& event);
    void PlayGiddyUp();

    const ditch::gameplay::GameSession& m_session;
    EventRouter m_router;
    float m_giddyUpCooldown = 4.0f;
    float m_lastGiddyUpTime = -1.0f;
    int m_cuesPlayed = 0;
};
