#include "ditch/utils/Random.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ditch::utils {

RandomSource::RandomSource()
    : RandomSource(std::random_device{}()) {}

RandomSource::RandomSource(std::uint32_t seed)
    : m_seed(seed), m_engine(seed) {}

void RandomSource::Reseed(std::uint32_t seed) {
    m_seed = seed;
    m_engine.seed(seed);
}

float RandomSource::UniformFloat(float minValue, float maxValue) {
    if (minValue > maxValue) {
        std::swap(minValue, maxValue);
    }
    if (minValue == maxValue) {
        return minValue;
    }
    // uniform_real_distribution is half-open; nextafter makes the upper bound reachable.
    std::uniform_real_distribution<float> dist(minValue, std::nextafter(maxValue, maxValue + 1.0f));
    return std::min(dist(m_engine), maxValue);
}

int RandomSource::UniformInt(int minValue, int maxValue) {
    if (minValue > maxValue) {
        std::swap(minValue, maxValue);
    }
    std::uniform_int_distribution<int> dist(minValue, maxValue);
    return dist(m_engine);
}

bool RandomSource::Chance(float probability) {
    const float p = std::clamp(probability, 0.0f, 1.0f);
    if (p <= 0.0f) {
        return false;
    }
    if (p >= 1.0f) {
        return true;
    }
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(m_engine) < p;
}

} // namespace ditch::utils
