#pragma once

#include "core/Vector3i.h"

#include <optional>
#include <random>
#include <unordered_set>

namespace AntSim {

class Terrain;

using OccupiedCells = std::unordered_set<Vector3i>;

/**
 * Finds standable, unoccupied spawn cells: the top solid block of an interior
 * column, y >= 1, not a Container.
 *
 * find() runs three tiers, each only when the previous one came up empty:
 * uniform random column probes, an exhaustive interior scan, and finally an
 * expanding ring around the world center that converts an unusable cell into
 * Grass so the ant has somewhere to stand.
 */
class SpawnPlacement {
public:
    static constexpr int RANDOM_PROBES = 2400;
    static constexpr int NEAR_PROBES = 140;
    static constexpr int NEAR_RADIUS = 8;

    SpawnPlacement(Terrain& terrain, std::mt19937& rng);

    // Random probes within `radius` columns of the anchor only.
    std::optional<Vector3i> findNear(const Vector3i& anchor, const OccupiedCells& occupied, int radius);

    std::optional<Vector3i> find(const OccupiedCells& occupied);

    // Near the queen when there is one, otherwise anywhere.
    std::optional<Vector3i> findForWorker(const std::optional<Vector3i>& queenCell, const OccupiedCells& occupied);

    bool isSpawnable(int x, int z, const OccupiedCells& occupied) const;

private:
    std::optional<Vector3i> probeRandom(const OccupiedCells& occupied);
    std::optional<Vector3i> scanExhaustive(const OccupiedCells& occupied) const;
    std::optional<Vector3i> forceRingFallback(const OccupiedCells& occupied);

    std::optional<Vector3i> candidateAt(int x, int z, const OccupiedCells& occupied) const;

    Terrain& terrain_;
    std::mt19937& rng_;
};

} // namespace AntSim
