#pragma once

namespace AntSim {

/**
 * Configuration for genome mutation.
 *
 * Every weight gets a small drift (sigma * driftScale). With probability `rate`
 * it additionally gets a full-size Gaussian kick (sigma). Results are clamped to
 * [-Genome::WEIGHT_LIMIT, Genome::WEIGHT_LIMIT].
 */
struct MutationConfig {
    double sigma = 0.32;       // Gaussian noise standard deviation, floored at MIN_SIGMA.
    double rate = 0.14;        // Probability each weight gets the large perturbation.
    double driftScale = 0.015; // Drift sigma as a fraction of sigma.

    static constexpr double MIN_SIGMA = 0.01;
};

/**
 * Configuration for building the next generation's genome pools.
 */
struct SelectionConfig {
    int workerCount = 32;
    int eliteCount = 4;
    double mutationStrength = 0.32;

    double freshGenomeRate = 0.15; // Chance a non-elite slot gets a random genome.

    // Queen strength multipliers: exploit after building a nest, explore otherwise.
    double queenExploitScale = 0.25;
    double queenExploreScale = 1.1;
    double queenReplaceRate = 0.3; // Chance a nestless queen is replaced outright.
};

} // namespace AntSim
