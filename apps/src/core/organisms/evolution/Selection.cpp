#include "Selection.h"

#include "Mutation.h"
#include "core/Assert.h"
#include "core/Random.h"
#include "core/organisms/brains/Genome.h"

#include <algorithm>
#include <numeric>

namespace AntSim {

std::vector<Genome> evolveWorkerGenomes(
    const std::vector<Genome>& workers,
    const std::vector<double>& fitness,
    const SelectionConfig& config,
    std::mt19937& rng)
{
    ANTSIM_ASSERT(workers.size() == fitness.size(), "Every worker genome needs a fitness");

    const int workerCount = std::max(1, config.workerCount);
    const int eliteCount = std::clamp(config.eliteCount, 1, workerCount);

    std::vector<Genome> next;
    next.reserve(workerCount);

    if (workers.empty()) {
        for (int i = 0; i < workerCount; i++) {
            next.push_back(Genome::random(rng));
        }
        return next;
    }

    // Rank by fitness descending.
    std::vector<size_t> order(workers.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&fitness](size_t a, size_t b) {
        return fitness[a] > fitness[b];
    });

    const int elitesToKeep = std::min(eliteCount, static_cast<int>(workers.size()));
    for (int i = 0; i < elitesToKeep && static_cast<int>(next.size()) < workerCount; i++) {
        next.push_back(workers[order[i]]);
    }

    const MutationConfig mutation{ .sigma = config.mutationStrength };
    while (static_cast<int>(next.size()) < workerCount) {
        if (uniform01(rng) < config.freshGenomeRate) {
            next.push_back(Genome::random(rng));
            continue;
        }

        const Genome& parent = next[uniformInt(rng, 0, elitesToKeep)];
        next.push_back(mutate(parent, mutation, rng));
    }

    return next;
}

Genome evolveQueenGenome(
    const Genome& previousQueenGenome,
    const Genome* generationQueenGenome,
    int queenNests,
    const SelectionConfig& config,
    std::mt19937& rng)
{
    if (!generationQueenGenome) {
        return mutate(previousQueenGenome, MutationConfig{ .sigma = config.mutationStrength }, rng);
    }

    const double scale = queenNests > 0 ? config.queenExploitScale : config.queenExploreScale;
    Genome next =
        mutate(*generationQueenGenome, MutationConfig{ .sigma = config.mutationStrength * scale }, rng);

    if (queenNests == 0 && uniform01(rng) < config.queenReplaceRate) {
        next = Genome::random(rng);
    }
    return next;
}

} // namespace AntSim
