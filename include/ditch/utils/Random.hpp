#pragma once

#include <cstdint>
#include <random>

namespace ditch::utils {

// One seedable source for every gameplay draw, so a fixed seed replays a session.
class RandomSource {
public:
    RandomSource();
    explicit RandomSource(std::uint32_t seed);

    void Reseed(std::uint32_t seed);
    std::uint32_t GetSeed() const { return m_seed; }

    // Inclusive on both ends; swapped bounds are reordered.
    float UniformFloat(float minValue, float maxValue);
    int UniformInt(int minValue, int maxValue);

    // True with the given probability, clamped to [0,1].
    bool Chance(float probability);

private:
    std::uint32_t m_seed = 0;
    std::mt19937 m_engine;
};

} // namespace ditch::utils
