#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>

namespace AntSim {

// All simulation randomness flows through one std::mt19937 owned by the
// colony runner. These helpers fix how a draw maps onto the stream.

// Uniform double in [0, 1).
inline double uniform01(std::mt19937& rng)
{
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

// Uniform double in [min, max).
inline double uniformRange(std::mt19937& rng, double min, double max)
{
    return min + uniform01(rng) * (max - min);
}

// Uniform integer in [minInclusive, maxExclusive). Returns minInclusive for empty ranges.
inline int uniformInt(std::mt19937& rng, int minInclusive, int maxExclusive)
{
    if (maxExclusive <= minInclusive) {
        return minInclusive;
    }
    return std::uniform_int_distribution<int>(minInclusive, maxExclusive - 1)(rng);
}

/**
 * Standard normal sample via the Box-Muller transform of two uniform draws.
 */
inline double nextGaussian(std::mt19937& rng)
{
    const double u1 = std::max(1e-9, uniform01(rng));
    const double u2 = uniform01(rng);
    const double radius = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * std::numbers::pi * u2;
    return radius * std::cos(theta);
}

} // namespace AntSim
