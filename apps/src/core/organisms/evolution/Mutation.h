#pragma once

#include "EvolutionConfig.h"

#include <random>

namespace AntSim {

struct Genome;

// Optional bookkeeping for a single mutate() call.
struct MutationStats {
    int perturbations = 0; // Weights that received the full-size kick.
    int clamped = 0;       // Weights that hit +/-Genome::WEIGHT_LIMIT.
};

/**
 * Returns a mutated copy of `parent`.
 *
 * Each weight drifts by N(0, sigma * driftScale); with probability `rate` it is
 * additionally kicked by N(0, sigma). Results are clamped to the genome weight
 * limit. Consumes rng in weight order, so equal seeds give equal children.
 */
Genome mutate(
    const Genome& parent,
    const MutationConfig& config,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

} // namespace AntSim
