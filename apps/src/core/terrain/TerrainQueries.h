#pragma once

#include "Terrain.h"
#include "core/Vector3i.h"

#include <optional>

namespace AntSim {

/**
 * Inclusive range of columns agents may occupy. Worlds at least three cells
 * wide keep a one-cell margin on each side.
 */
struct ColumnBounds {
    int minX = 0;
    int maxX = -1;
    int minZ = 0;
    int maxZ = -1;

    bool contains(int x, int z) const { return x >= minX && x <= maxX && z >= minZ && z <= maxZ; }
    bool empty() const { return maxX < minX || maxZ < minZ; }
};

ColumnBounds interiorColumns(const Terrain& terrain);

// Highest solid y >= 1 in column (x, z), or -1 when the column is empty.
int findTopSolidY(const Terrain& terrain, int x, int z);

// First solid y strictly below fromY (and >= 1) in column (x, z).
std::optional<int> findSupportBelow(const Terrain& terrain, int x, int fromY, int z);

} // namespace AntSim
