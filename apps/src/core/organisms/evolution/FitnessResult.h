#pragma once

namespace AntSim {

struct Ant;

/**
 * Final per-generation accumulators of one ant, as fitness sees them.
 */
struct FitnessResult {
    int stepsAlive = 0;
    double finalHealth = 0.0;
    int nestsBuilt = 0;
    int mulchConsumed = 0;
    double healthShared = 0.0;
    int blocksDug = 0;

    static FitnessResult fromAnt(const Ant& ant);

    // Nests dominate; survival and leftover health break ties.
    double computeQueenFitness() const
    {
        return 95.0 * nestsBuilt + 0.08 * stepsAlive + 0.35 * finalHealth;
    }

    // Workers are rewarded for the colony's nests, feeding and sharing; digging costs.
    double computeWorkerFitness(int queenNests) const
    {
        return 4.0 * mulchConsumed + 6.0 * healthShared + 0.05 * stepsAlive + 4.0 * queenNests
            - 0.45 * blocksDug;
    }
};

} // namespace AntSim
