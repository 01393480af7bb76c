#include "ditch/core/Time.hpp"

#include <algorithm>

namespace ditch {
namespace core {

FrameClock::FrameClock(double maxDeltaSeconds) {
    SetMaxDelta(maxDeltaSeconds);
}

float FrameClock::Update(double currentTimeSeconds) {
    if (!m_started) {
        m_started = true;
        m_lastUpdate = currentTimeSeconds;
        m_deltaTime = 0.0f;
        return m_deltaTime;
    }

    double delta = currentTimeSeconds - m_lastUpdate;
    m_lastUpdate = currentTimeSeconds;
    if (delta < 0.0) {
        delta = 0.0;
    }
    if (m_maxDelta > 0.0) {
        delta = std::min(delta, m_maxDelta);
    }

    m_totalTime += delta;
    m_deltaTime = static_cast<float>(delta);
    return m_deltaTime;
}

void FrameClock::Reset() {
    m_lastUpdate = 0.0;
    m_totalTime = 0.0;
    m_deltaTime = 0.0f;
    m_started = false;
}

void FrameClock::SetMaxDelta(double maxDeltaSeconds) {
    m_maxDelta = std::max(0.0, maxDeltaSeconds);
}

}} // namespace ditch::core
