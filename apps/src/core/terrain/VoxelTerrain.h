#pragma once

#include "Terrain.h"
#include "TerrainConfig.h"

#include <vector>

namespace AntSim {

/**
 * Dense in-memory voxel grid.
 *
 * Stores one Block::EnumType per cell in x-major, then z, then y order and keeps
 * a snapshot of the generated world for resetToInitialState().
 */
class VoxelTerrain : public Terrain {
public:
    VoxelTerrain(int sizeX, int sizeY, int sizeZ, Block::EnumType fill = Block::EnumType::Air);

    // Deterministic procedural world built from config.seed. The result has its
    // initial state captured already.
    static VoxelTerrain generate(const TerrainConfig& config);

    Block::EnumType getBlock(int x, int y, int z) const override;
    void setBlock(int x, int y, int z, Block::EnumType type) override;

    int sizeX() const override { return sizeX_; }
    int sizeY() const override { return sizeY_; }
    int sizeZ() const override { return sizeZ_; }

    void resetToInitialState() override;
    int getNestBlockCount() const override { return nestCount_; }

    // Make the current grid the state resetToInitialState() returns to.
    void captureInitialState();

    // Fill the column (x, z) with `type` from y=1 up to and including topY.
    void fillColumn(int x, int z, int topY, Block::EnumType type);

    int countBlocks(Block::EnumType type) const;

private:
    size_t index(int x, int y, int z) const;

    int sizeX_;
    int sizeY_;
    int sizeZ_;
    std::vector<Block::EnumType> cells_;
    std::vector<Block::EnumType> initialCells_;
    int nestCount_ = 0;
    int initialNestCount_ = 0;
};

} // namespace AntSim
