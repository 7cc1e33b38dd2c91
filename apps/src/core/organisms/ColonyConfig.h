#pragma once

#include "core/ReflectSerializer.h"
#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace AntSim {

/**
 * Tunables for the colony simulation and its neuroevolution loop.
 *
 * Values are stored as configured; the effective*() accessors apply the floors
 * the simulation relies on.
 */
struct ColonyConfig {
    uint32_t seed = 1337;

    // Population and evaluation.
    int workerCount = 32;      // Queen is spawned in addition to this count.
    int evaluationSteps = 700; // Ticks per generation.
    double tickSeconds = 0.15; // Simulated seconds per tick.

    // Health.
    double workerMaxHealth = 24.0;
    double queenMaxHealth = 48.0;
    double baseHealthDrain = 0.25;      // Per tick, doubled on acidic blocks.
    double mulchHealthRestore = 12.0;   // Per mulch block eaten.
    double healthTransferAmount = 3.0;  // Per ShareHealth action.
    double queenNestCostFraction = 1.0 / 3.0;

    // Evolution.
    int eliteCount = 4;
    double mutationStrength = 0.32;
    bool resetWorldEachGeneration = true;

    int effectiveWorkerCount() const { return std::max(1, workerCount); }
    int effectiveEvaluationSteps() const { return std::max(1, evaluationSteps); }
    int effectiveEliteCount() const { return std::clamp(eliteCount, 1, effectiveWorkerCount()); }
    double effectiveTickSeconds() const { return std::max(0.01, tickSeconds); }
    double effectiveDrain() const { return std::max(0.0, baseHealthDrain); }
    double effectiveMulchRestore() const { return std::max(0.0, mulchHealthRestore); }
    double effectiveTransferAmount() const { return std::max(0.0, healthTransferAmount); }
    double effectiveNestCostFraction() const { return std::clamp(queenNestCostFraction, 0.0, 1.0); }
};

inline void to_json(nlohmann::json& j, const ColonyConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, ColonyConfig& config)
{
    config = ReflectSerializer::from_json<ColonyConfig>(j);
}

} // namespace AntSim
