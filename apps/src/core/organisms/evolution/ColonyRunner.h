#pragma once

#include "ColonyStatus.h"
#include "FitnessCalculator.h"
#include "core/organisms/AntActionExecutor.h"
#include "core/organisms/AntBrain.h"
#include "core/organisms/AntColony.h"
#include "core/organisms/ColonyConfig.h"
#include "core/organisms/SpawnPlacement.h"
#include "core/organisms/brains/Genome.h"

#include <optional>
#include <random>
#include <vector>

namespace AntSim {

class Terrain;

/**
 * Runs the colony one tick at a time and evolves it between generations.
 *
 * Each generation goes Spawning -> Running -> Ending. Running lasts until the
 * evaluation step count is reached or every ant is dead; the tick that notices
 * scores the ants, evolves the genome pools and spawns the next generation.
 *
 * All randomness comes from one std::mt19937 seeded from the config, so a run is
 * reproducible given the same config and terrain.
 */
class ColonyRunner {
public:
    enum class Phase {
        Spawning,
        Running,
        Ending,
    };

    struct GenerationSummary {
        int generation = 0;
        int antsPlaced = 0;
        GenerationFitnessSummary fitness;
    };

    static constexpr uint32_t RNG_SEED_OFFSET = 8128;

    // Builds random genome pools and spawns the first generation.
    ColonyRunner(Terrain& terrain, const ColonyConfig& config);

    ColonyRunner(const ColonyRunner&) = delete;
    ColonyRunner& operator=(const ColonyRunner&) = delete;

    // Advance the simulation by one tick.
    void step();

    ColonyStatus getStatus() const;
    Phase getPhase() const { return phase_; }
    int getGenerationIndex() const { return generationIndex_; }
    int getStepInGeneration() const { return stepInGeneration_; }
    const ColonyConfig& getConfig() const { return config_; }

    const AntColony& getColony() const { return colony_; }
    const std::vector<Genome>& getWorkerGenomes() const { return workerGenomes_; }
    const Genome& getQueenGenome() const { return queenGenome_; }
    const std::optional<GenerationSummary>& getLastGeneration() const { return lastGeneration_; }

private:
    void setPhase(Phase phase);
    void startNextGeneration();
    void runTick();
    void endGenerationAndEvolve();
    std::vector<AntId> buildLiveActionOrder();

    Terrain& terrain_;
    ColonyConfig config_;
    std::mt19937 rng_;

    AntColony colony_;
    AntBrain brain_;
    AntActionExecutor executor_;
    SpawnPlacement spawner_;

    std::vector<Genome> workerGenomes_;
    Genome queenGenome_;

    Phase phase_ = Phase::Spawning;
    int generationIndex_ = 0;
    int stepInGeneration_ = 0;
    std::optional<GenerationSummary> lastGeneration_;
};

const char* toString(ColonyRunner::Phase phase);

} // namespace AntSim
