#include "SpawnPlacement.h"

#include "core/LoggingChannels.h"
#include "core/Random.h"
#include "core/terrain/Terrain.h"
#include "core/terrain/TerrainQueries.h"

#include <algorithm>

namespace AntSim {

SpawnPlacement::SpawnPlacement(Terrain& terrain, std::mt19937& rng) : terrain_(terrain), rng_(rng)
{}

std::optional<Vector3i> SpawnPlacement::candidateAt(
    int x, int z, const OccupiedCells& occupied) const
{
    const int y = findTopSolidY(terrain_, x, z);
    if (y < 1) {
        return std::nullopt;
    }

    const Vector3i candidate{ x, y, z };
    if (occupied.contains(candidate)) {
        return std::nullopt;
    }
    if (terrain_.getBlock(x, y, z) == Block::EnumType::Container) {
        return std::nullopt;
    }
    return candidate;
}

bool SpawnPlacement::isSpawnable(int x, int z, const OccupiedCells& occupied) const
{
    return interiorColumns(terrain_).contains(x, z) && candidateAt(x, z, occupied).has_value();
}

std::optional<Vector3i> SpawnPlacement::findNear(
    const Vector3i& anchor, const OccupiedCells& occupied, int radius)
{
    const ColumnBounds bounds = interiorColumns(terrain_);
    if (bounds.empty()) {
        return std::nullopt;
    }

    for (int i = 0; i < NEAR_PROBES; i++) {
        const int x = std::clamp(anchor.x + uniformInt(rng_, -radius, radius + 1), bounds.minX, bounds.maxX);
        const int z = std::clamp(anchor.z + uniformInt(rng_, -radius, radius + 1), bounds.minZ, bounds.maxZ);
        if (auto cell = candidateAt(x, z, occupied)) {
            return cell;
        }
    }
    return std::nullopt;
}

std::optional<Vector3i> SpawnPlacement::find(const OccupiedCells& occupied)
{
    if (auto cell = probeRandom(occupied)) {
        return cell;
    }
    if (auto cell = scanExhaustive(occupied)) {
        return cell;
    }
    return forceRingFallback(occupied);
}

std::optional<Vector3i> SpawnPlacement::findForWorker(
    const std::optional<Vector3i>& queenCell, const OccupiedCells& occupied)
{
    if (queenCell.has_value()) {
        if (auto cell = findNear(queenCell.value(), occupied, NEAR_RADIUS)) {
            return cell;
        }
    }
    return find(occupied);
}

std::optional<Vector3i> SpawnPlacement::probeRandom(const OccupiedCells& occupied)
{
    const ColumnBounds bounds = interiorColumns(terrain_);
    if (bounds.empty()) {
        return std::nullopt;
    }

    for (int i = 0; i < RANDOM_PROBES; i++) {
        const int x = uniformInt(rng_, bounds.minX, bounds.maxX + 1);
        const int z = uniformInt(rng_, bounds.minZ, bounds.maxZ + 1);
        if (auto cell = candidateAt(x, z, occupied)) {
            return cell;
        }
    }
    return std::nullopt;
}

std::optional<Vector3i> SpawnPlacement::scanExhaustive(const OccupiedCells& occupied) const
{
    const ColumnBounds bounds = interiorColumns(terrain_);
    for (int x = bounds.minX; x <= bounds.maxX; x++) {
        for (int z = bounds.minZ; z <= bounds.maxZ; z++) {
            if (auto cell = candidateAt(x, z, occupied)) {
                return cell;
            }
        }
    }
    return std::nullopt;
}

std::optional<Vector3i> SpawnPlacement::forceRingFallback(const OccupiedCells& occupied)
{
    const ColumnBounds bounds = interiorColumns(terrain_);
    if (bounds.empty() || terrain_.sizeY() < 2) {
        LOG_WARN(Spawn, "World has no interior columns to place an ant on");
        return std::nullopt;
    }

    const int centerX = std::clamp(terrain_.sizeX() / 2, bounds.minX, bounds.maxX);
    const int centerZ = std::clamp(terrain_.sizeZ() / 2, bounds.minZ, bounds.maxZ);
    const int maxRadius = std::max(terrain_.sizeX(), terrain_.sizeZ());

    for (int radius = 0; radius <= maxRadius; radius++) {
        for (int dx = -radius; dx <= radius; dx++) {
            for (int dz = -radius; dz <= radius; dz++) {
                const int x = std::clamp(centerX + dx, bounds.minX, bounds.maxX);
                const int z = std::clamp(centerZ + dz, bounds.minZ, bounds.maxZ);
                const int y = std::max(1, findTopSolidY(terrain_, x, z));
                const Vector3i candidate{ x, y, z };
                if (occupied.contains(candidate)) {
                    continue;
                }

                const Block::EnumType block = terrain_.getBlock(x, y, z);
                if (!Block::isSolid(block) || block == Block::EnumType::Container) {
                    terrain_.setBlock(x, y, z, Block::EnumType::Grass);
                }

                LOG_WARN(Spawn, "Spawn fallback placed an ant at {}", candidate);
                return candidate;
            }
        }
    }

    LOG_WARN(Spawn, "Spawn fallback found no free cell");
    return std::nullopt;
}

} // namespace AntSim
