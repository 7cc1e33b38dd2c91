#include "ColonyStatus.h"

#include <spdlog/fmt/fmt.h>

namespace AntSim {

std::string formatStatusLine(const ColonyStatus& status)
{
    return fmt::format(
        "gen {} step {}/{} | alive {}/{} | nest blocks {} | last gen: nests {} best {:.2f} "
        "avg {:.2f} best worker {:.2f}",
        status.generation,
        status.step,
        status.evaluationSteps,
        status.aliveAnts,
        status.totalAnts,
        status.nestBlockCount,
        status.lastGenerationNests,
        status.lastGenerationBestFitness,
        status.lastGenerationAverageFitness,
        status.lastGenerationBestWorkerFitness);
}

} // namespace AntSim
