#include "MaskedSampling.h"

#include "core/Random.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace AntSim {

int sampleMaskedLogits(
    std::span<const float> logits,
    std::span<const bool> mask,
    float temperature,
    int fallback,
    std::mt19937& rng)
{
    const size_t count = std::min(logits.size(), mask.size());
    const float invTemp = 1.0f / std::max(0.05f, temperature);

    float maxLogit = -std::numeric_limits<float>::infinity();
    bool hasValid = false;
    for (size_t i = 0; i < count; i++) {
        if (!mask[i]) {
            continue;
        }
        hasValid = true;
        maxLogit = std::max(maxLogit, logits[i] * invTemp);
    }

    if (!hasValid) {
        return fallback;
    }

    float total = 0.0f;
    for (size_t i = 0; i < count; i++) {
        if (mask[i]) {
            total += std::exp(logits[i] * invTemp - maxLogit);
        }
    }

    float roll = static_cast<float>(uniformRange(rng, 0.0, total));
    for (size_t i = 0; i < count; i++) {
        if (!mask[i]) {
            continue;
        }
        roll -= std::exp(logits[i] * invTemp - maxLogit);
        if (roll <= 0.0f) {
            return static_cast<int>(i);
        }
    }

    // Rounding can leave a sliver of remainder; the last feasible candidate owns it.
    for (size_t i = count; i-- > 0;) {
        if (mask[i]) {
            return static_cast<int>(i);
        }
    }
    return fallback;
}

} // namespace AntSim
