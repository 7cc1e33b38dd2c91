#pragma once

#include "EvolutionConfig.h"

#include <random>
#include <vector>

namespace AntSim {

struct Genome;

/**
 * Build the next worker genome pool.
 *
 * Workers are ranked by fitness (descending). The top min(eliteCount, workers)
 * genomes are copied unchanged. Every remaining slot gets a fresh random genome
 * with probability freshGenomeRate, otherwise a mutated copy of a uniformly chosen
 * elite. With no workers at all the pool is refilled with random genomes.
 *
 * The result always has exactly max(1, workerCount) entries.
 */
std::vector<Genome> evolveWorkerGenomes(
    const std::vector<Genome>& workers,
    const std::vector<double>& fitness,
    const SelectionConfig& config,
    std::mt19937& rng);

/**
 * Derive the next queen genome.
 *
 * Without a queen this generation, the previous genome is mutated at full
 * strength. Otherwise her genome is mutated at queenExploitScale when she built
 * nests, or at queenExploreScale when she built none, in which case it may also be
 * replaced by a random genome.
 */
Genome evolveQueenGenome(
    const Genome& previousQueenGenome,
    const Genome* generationQueenGenome,
    int queenNests,
    const SelectionConfig& config,
    std::mt19937& rng);

} // namespace AntSim
