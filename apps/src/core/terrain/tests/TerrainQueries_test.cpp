#include "core/terrain/BlockType.h"
#include "core/terrain/TerrainQueries.h"
#include "core/terrain/VoxelTerrain.h"

#include <gtest/gtest.h>

using namespace AntSim;

TEST(TerrainQueriesTest, InteriorColumnsKeepOneCellMargin)
{
    const VoxelTerrain terrain(6, 4, 5);
    const ColumnBounds bounds = interiorColumns(terrain);

    EXPECT_EQ(bounds.minX, 1);
    EXPECT_EQ(bounds.maxX, 4);
    EXPECT_EQ(bounds.minZ, 1);
    EXPECT_EQ(bounds.maxZ, 3);
    EXPECT_FALSE(bounds.contains(0, 2));
    EXPECT_FALSE(bounds.contains(5, 2));
    EXPECT_TRUE(bounds.contains(4, 3));
}

TEST(TerrainQueriesTest, NarrowWorldsUseEveryColumn)
{
    const VoxelTerrain terrain(2, 4, 2);
    const ColumnBounds bounds = interiorColumns(terrain);

    EXPECT_FALSE(bounds.empty());
    EXPECT_TRUE(bounds.contains(0, 0));
    EXPECT_TRUE(bounds.contains(1, 1));
}

TEST(TerrainQueriesTest, FindTopSolidYIgnoresFloorLayer)
{
    VoxelTerrain terrain(3, 8, 3);
    terrain.setBlock(1, 0, 1, Block::EnumType::Container);
    EXPECT_EQ(findTopSolidY(terrain, 1, 1), -1);

    terrain.fillColumn(1, 1, 4, Block::EnumType::Stone);
    terrain.setBlock(1, 6, 1, Block::EnumType::Mulch);
    EXPECT_EQ(findTopSolidY(terrain, 1, 1), 6);
}

TEST(TerrainQueriesTest, FindSupportBelowSkipsGaps)
{
    VoxelTerrain terrain(3, 8, 3);
    terrain.setBlock(1, 2, 1, Block::EnumType::Stone);
    terrain.setBlock(1, 5, 1, Block::EnumType::Grass);

    EXPECT_EQ(findSupportBelow(terrain, 1, 5, 1), 2);
    EXPECT_EQ(findSupportBelow(terrain, 1, 2, 1), std::nullopt);
}

TEST(BlockTypeTest, StringRoundTripAndSolidity)
{
    for (const Block::EnumType type : Block::getAllTypes()) {
        EXPECT_EQ(Block::fromString(Block::toString(type)), type);
    }
    EXPECT_EQ(Block::fromString("Lava"), std::nullopt);

    EXPECT_FALSE(Block::isSolid(Block::EnumType::Air));
    EXPECT_TRUE(Block::isSolid(Block::EnumType::Container));
    EXPECT_TRUE(Block::isSolid(Block::EnumType::Nest));
}
