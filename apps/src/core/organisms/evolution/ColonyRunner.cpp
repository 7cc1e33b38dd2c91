#include "ColonyRunner.h"

#include "Selection.h"
#include "core/LoggingChannels.h"
#include "core/Random.h"
#include "core/terrain/Terrain.h"

#include <utility>

namespace AntSim {

const char* toString(ColonyRunner::Phase phase)
{
    switch (phase) {
        case ColonyRunner::Phase::Spawning:
            return "Spawning";
        case ColonyRunner::Phase::Running:
            return "Running";
        case ColonyRunner::Phase::Ending:
            return "Ending";
    }
    return "Unknown";
}

ColonyRunner::ColonyRunner(Terrain& terrain, const ColonyConfig& config)
    : terrain_(terrain),
      config_(config),
      rng_(config.seed + RNG_SEED_OFFSET),
      executor_(terrain_, colony_, config_, rng_),
      spawner_(terrain_, rng_)
{
    const int workerCount = config_.effectiveWorkerCount();
    workerGenomes_.reserve(workerCount);
    for (int i = 0; i < workerCount; i++) {
        workerGenomes_.push_back(Genome::random(rng_));
    }
    queenGenome_ = Genome::random(rng_);

    LOG_INFO(
        Colony,
        "Colony of 1 queen + {} workers on {}x{}x{} terrain (seed {})",
        workerCount,
        terrain_.sizeX(),
        terrain_.sizeY(),
        terrain_.sizeZ(),
        config_.seed);

    startNextGeneration();
}

void ColonyRunner::setPhase(Phase phase)
{
    if (phase_ == phase) {
        return;
    }
    LOG_DEBUG(State, "Generation {}: {} -> {}", generationIndex_, toString(phase_), toString(phase));
    phase_ = phase;
}

void ColonyRunner::step()
{
    if (stepInGeneration_ >= config_.effectiveEvaluationSteps() || colony_.countAlive() == 0) {
        endGenerationAndEvolve();
        startNextGeneration();
        return;
    }

    runTick();
    stepInGeneration_++;
}

void ColonyRunner::startNextGeneration()
{
    setPhase(Phase::Spawning);

    if (generationIndex_ > 0 && config_.resetWorldEachGeneration) {
        terrain_.resetToInitialState();
        LOG_DEBUG(Terrain, "Terrain reset for generation {}", generationIndex_ + 1);
    }

    colony_.clear();
    stepInGeneration_ = 0;
    generationIndex_++;

    OccupiedCells occupied;

    std::optional<Vector3i> queenCell = spawner_.find(occupied);
    if (queenCell.has_value()) {
        occupied.insert(queenCell.value());
        colony_.add(AntRole::Queen, queenGenome_, queenCell.value(), config_.queenMaxHealth);
    }

    for (size_t i = 0; i < workerGenomes_.size(); i++) {
        const std::optional<Vector3i> cell = spawner_.findForWorker(queenCell, occupied);
        if (!cell.has_value()) {
            LOG_WARN(
                Spawn,
                "Placed only {} of {} workers in generation {}",
                i,
                workerGenomes_.size(),
                generationIndex_);
            break;
        }
        occupied.insert(cell.value());
        colony_.add(AntRole::Worker, workerGenomes_[i], cell.value(), config_.workerMaxHealth);
    }

    if (colony_.empty()) {
        LOG_WARN(Spawn, "No valid spawn cells were found for generation {}", generationIndex_);
    }

    LOG_DEBUG(Colony, "Generation {} spawned {} ants", generationIndex_, colony_.size());
    setPhase(Phase::Running);
}

std::vector<AntId> ColonyRunner::buildLiveActionOrder()
{
    std::vector<AntId> order = colony_.liveIds();

    // Fisher-Yates, fresh every tick.
    for (int i = static_cast<int>(order.size()) - 1; i > 0; i--) {
        const int swapIndex = uniformInt(rng_, 0, i + 1);
        std::swap(order[i], order[swapIndex]);
    }
    return order;
}

void ColonyRunner::runTick()
{
    const std::vector<AntId> order = buildLiveActionOrder();

    for (const AntId id : order) {
        Ant& ant = colony_.get(id);
        if (!ant.alive) {
            continue;
        }

        executor_.applyHealthDecay(ant);
        if (!ant.alive) {
            LOG_DEBUG(Colony, "Ant {} starved at step {}", ant.id, stepInGeneration_);
            continue;
        }

        const int sameCellCount = colony_.countLivingAt(ant.cell);
        const AntSensoryData sensory = executor_.sense(ant, sameCellCount);
        const AntDecision decision = brain_.decide(ant, sensory, rng_);
        executor_.execute(ant, decision);

        ant.stepsAlive++;
    }
}

void ColonyRunner::endGenerationAndEvolve()
{
    setPhase(Phase::Ending);

    const GenerationFitnessSummary fitness = scoreGeneration(colony_.ants());
    lastGeneration_ = GenerationSummary{
        .generation = generationIndex_,
        .antsPlaced = static_cast<int>(colony_.size()),
        .fitness = fitness,
    };

    LOG_INFO(
        Evolution,
        "Generation {} complete | nests={} | best={:.2f} | avg={:.2f} | bestWorker={:.2f}",
        generationIndex_,
        fitness.queenNests,
        fitness.bestFitness,
        fitness.averageFitness,
        fitness.bestWorkerFitness);

    std::vector<Genome> workers;
    std::vector<double> workerFitness;
    const Genome* queenGenome = nullptr;
    for (const Ant& ant : colony_.ants()) {
        if (ant.isQueen()) {
            queenGenome = &ant.genome;
            continue;
        }
        workers.push_back(ant.genome);
        workerFitness.push_back(ant.fitness);
    }

    const SelectionConfig selection{
        .workerCount = config_.effectiveWorkerCount(),
        .eliteCount = config_.effectiveEliteCount(),
        .mutationStrength = config_.mutationStrength,
    };

    workerGenomes_ = evolveWorkerGenomes(workers, workerFitness, selection, rng_);
    queenGenome_ = evolveQueenGenome(queenGenome_, queenGenome, fitness.queenNests, selection, rng_);
}

ColonyStatus ColonyRunner::getStatus() const
{
    ColonyStatus status{
        .nestBlockCount = terrain_.getNestBlockCount(),
        .generation = generationIndex_,
        .step = stepInGeneration_,
        .evaluationSteps = config_.effectiveEvaluationSteps(),
        .aliveAnts = colony_.countAlive(),
        .totalAnts = static_cast<int>(colony_.size()),
    };

    if (lastGeneration_.has_value()) {
        status.lastGenerationNests = lastGeneration_->fitness.queenNests;
        status.lastGenerationBestFitness = lastGeneration_->fitness.bestFitness;
        status.lastGenerationAverageFitness = lastGeneration_->fitness.averageFitness;
        status.lastGenerationBestWorkerFitness = lastGeneration_->fitness.bestWorkerFitness;
    }
    return status;
}

} // namespace AntSim
