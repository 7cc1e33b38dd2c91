#pragma once

#include <string>

namespace AntSim {

/**
 * Read-only counters for whatever presents the colony (CLI, logs).
 * The simulation never reads these back.
 */
struct ColonyStatus {
    int nestBlockCount = 0;
    int generation = 0;
    int step = 0;
    int evaluationSteps = 0;
    int aliveAnts = 0;
    int totalAnts = 0;

    // Results of the last finished generation.
    int lastGenerationNests = 0;
    double lastGenerationBestFitness = 0.0;
    double lastGenerationAverageFitness = 0.0;
    double lastGenerationBestWorkerFitness = 0.0;
};

std::string formatStatusLine(const ColonyStatus& status);

} // namespace AntSim
