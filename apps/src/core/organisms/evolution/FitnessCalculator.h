#pragma once

#include "FitnessResult.h"

#include <vector>

namespace AntSim {

struct Ant;

struct GenerationFitnessSummary {
    int queenNests = 0;
    double bestFitness = 0.0;
    double averageFitness = 0.0;
    double bestWorkerFitness = 0.0;
};

double computeFitnessForAnt(const Ant& ant, int queenNests);

// Nests the generation's queen built, or 0 without a queen.
int countQueenNests(const std::vector<Ant>& ants);

// Writes Ant::fitness for every ant, dead ones included, and summarizes.
GenerationFitnessSummary scoreGeneration(std::vector<Ant>& ants);

} // namespace AntSim
