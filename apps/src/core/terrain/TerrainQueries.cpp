#include "TerrainQueries.h"

namespace AntSim {

ColumnBounds interiorColumns(const Terrain& terrain)
{
    ColumnBounds bounds;
    if (terrain.sizeX() >= 3) {
        bounds.minX = 1;
        bounds.maxX = terrain.sizeX() - 2;
    }
    else {
        bounds.minX = 0;
        bounds.maxX = terrain.sizeX() - 1;
    }
    if (terrain.sizeZ() >= 3) {
        bounds.minZ = 1;
        bounds.maxZ = terrain.sizeZ() - 2;
    }
    else {
        bounds.minZ = 0;
        bounds.maxZ = terrain.sizeZ() - 1;
    }
    return bounds;
}

int findTopSolidY(const Terrain& terrain, int x, int z)
{
    for (int y = terrain.sizeY() - 1; y >= 1; y--) {
        if (Block::isSolid(terrain.getBlock(x, y, z))) {
            return y;
        }
    }
    return -1;
}

std::optional<int> findSupportBelow(const Terrain& terrain, int x, int fromY, int z)
{
    for (int y = fromY - 1; y >= 1; y--) {
        if (Block::isSolid(terrain.getBlock(x, y, z))) {
            return y;
        }
    }
    return std::nullopt;
}

} // namespace AntSim
