#pragma once

#include "AntAction.h"
#include "AntSensoryData.h"

#include <random>

namespace AntSim {

struct Ant;
class AntColony;
struct ColonyConfig;
class Terrain;

/**
 * Applies ant actions to the colony and the shared terrain.
 *
 * Every try*() re-checks its precondition against the current world before
 * mutating anything, since an earlier ant in the same tick may have changed the
 * terrain or the occupancy. A failed precondition is a no-op and returns false.
 * Falls and starvation are state changes (the ant dies), never errors.
 */
class AntActionExecutor {
public:
    // Queen steering only kicks in below this health ratio.
    static constexpr double QUEEN_STEER_RATIO = 0.85;
    static constexpr int QUEEN_STEER_RADIUS = 4;
    static constexpr double QUEEN_NEEDS_HEALTH_RATIO = 0.9;
    static constexpr double WORKER_ESCORT_RATIO = 0.55;
    static constexpr double WORKER_HUNGRY_RATIO = 0.75;
    static constexpr double SHARE_TO_QUEEN_MIN_RATIO = 0.35;
    static constexpr int MAX_STEP_HEIGHT = 2;

    AntActionExecutor(Terrain& terrain, AntColony& colony, const ColonyConfig& config, std::mt19937& rng);

    AntSensoryData sense(const Ant& ant, int sameCellCount) const;

    // Runs the action; the co-location count is recomputed here.
    bool execute(Ant& ant, const AntDecision& decision);

    bool canDig(const Ant& ant) const;
    bool canEat(const Ant& ant, int sameCellCount) const;
    bool canShareHealth(const Ant& ant, int sameCellCount) const;
    bool canBuildNest(const Ant& ant) const;
    double nestCost(const Ant& ant) const;

    int buildMoveOptions(const Ant& ant, MoveOptions& options) const;

    bool tryMove(Ant& ant, int preferredDirection);
    bool tryDig(Ant& ant);
    bool tryEat(Ant& ant, int sameCellCount);
    bool tryShareHealth(Ant& donor);
    bool tryBuildNest(Ant& queen);

    // Per-tick drain, doubled on acidic ground. Kills the ant at <= 0.
    void applyHealthDecay(Ant& ant) const;

private:
    int heuristicMoveDirection(const Ant& ant, const MoveOptions& options) const;

    // Drop the ant onto the first solid block below its old cell; kill it when
    // there is none.
    void settleAfterSupportRemoved(Ant& ant);

    // Settle every live ant standing on `cell` after its block was removed.
    void settleAntsAt(const Vector3i& cell);

    const Ant* findShareReceiver(const Ant& donor) const;

    Terrain& terrain_;
    AntColony& colony_;
    const ColonyConfig& config_;
    std::mt19937& rng_;
};

} // namespace AntSim
