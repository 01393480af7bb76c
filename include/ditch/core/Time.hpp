#pragma once

namespace ditch {
namespace core {

// First Update() seeds the clock and returns 0; backwards timestamps also return 0.
class FrameClock {
public:
    FrameClock() = default;
    explicit FrameClock(double maxDeltaSeconds);

    float Update(double currentTimeSeconds);
    void Reset();

    float DeltaTime() const { return m_deltaTime; }
    double TotalTime() const { return m_totalTime; }
    bool HasStarted() const { return m_started; }

    void SetMaxDelta(double maxDeltaSeconds);
    double GetMaxDelta() const { return m_maxDelta; }

private:
    double m_lastUpdate = 0.0;
    double m_totalTime = 0.0;
    double m_maxDelta = 0.0;
    float m_deltaTime = 0.0f;
    bool m_started = false;
};

}} // namespace ditch::core
