#include "FitnessCalculator.h"

#include "core/organisms/Ant.h"

#include <algorithm>
#include <limits>

namespace AntSim {

FitnessResult FitnessResult::fromAnt(const Ant& ant)
{
    return FitnessResult{
        .stepsAlive = ant.stepsAlive,
        .finalHealth = ant.health,
        .nestsBuilt = ant.nestsBuilt,
        .mulchConsumed = ant.mulchConsumed,
        .healthShared = ant.healthShared,
        .blocksDug = ant.blocksDug,
    };
}

double computeFitnessForAnt(const Ant& ant, int queenNests)
{
    const FitnessResult result = FitnessResult::fromAnt(ant);
    return ant.isQueen() ? result.computeQueenFitness() : result.computeWorkerFitness(queenNests);
}

int countQueenNests(const std::vector<Ant>& ants)
{
    for (const Ant& ant : ants) {
        if (ant.isQueen()) {
            return ant.nestsBuilt;
        }
    }
    return 0;
}

GenerationFitnessSummary scoreGeneration(std::vector<Ant>& ants)
{
    GenerationFitnessSummary summary;
    summary.queenNests = countQueenNests(ants);

    constexpr double kNone = std::numeric_limits<double>::lowest();
    double total = 0.0;
    double best = kNone;
    double bestWorker = kNone;

    for (Ant& ant : ants) {
        ant.fitness = computeFitnessForAnt(ant, summary.queenNests);
        total += ant.fitness;
        best = std::max(best, ant.fitness);
        if (!ant.isQueen()) {
            bestWorker = std::max(bestWorker, ant.fitness);
        }
    }

    summary.bestFitness = best > kNone ? best : 0.0;
    summary.bestWorkerFitness = bestWorker > kNone ? bestWorker : 0.0;
    summary.averageFitness = ants.empty() ? 0.0 : total / static_cast<double>(ants.size());
    return summary;
}

} // namespace AntSim
