#pragma once

#include "AntAction.h"
#include "AntSensoryData.h"
#include "core/organisms/brains/PolicyNetwork.h"

#include <array>
#include <optional>
#include <random>

namespace AntSim {

struct Ant;

/**
 * Per-tick decision making for one ant.
 *
 * Role-specific heuristics run first and short-circuit when they fire. Otherwise
 * the ant's policy network scores the six actions; infeasible actions are masked
 * out and one is sampled from the temperature-scaled softmax. A Move then samples
 * its direction from the four direction logits, masked by move feasibility.
 */
class AntBrain {
public:
    static constexpr float ACTION_TEMPERATURE = 0.8f;
    static constexpr float DIRECTION_TEMPERATURE = 0.75f;

    static constexpr double QUEEN_BUILD_MARGIN = 1.1;
    static constexpr double QUEEN_EAT_RATIO = 0.7;
    static constexpr double WORKER_EAT_RATIO = 0.62;

    AntDecision decide(const Ant& ant, const AntSensoryData& sensory, std::mt19937& rng) const;

    static std::optional<AntDecision> heuristicOverride(const AntSensoryData& sensory);
    static Observation buildObservation(const AntSensoryData& sensory);
    static std::array<bool, ACTION_COUNT> buildActionMask(const AntSensoryData& sensory);
};

} // namespace AntSim
