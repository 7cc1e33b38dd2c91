#include "ColonyTestUtils.h"
#include "core/organisms/Ant.h"
#include "core/organisms/AntActionExecutor.h"
#include "core/organisms/AntColony.h"
#include "core/organisms/ColonyConfig.h"

#include <gtest/gtest.h>

using namespace AntSim;
using namespace AntSim::Test;

class AntActionExecutorTest : public ::testing::Test {
protected:
    // 7x10x7 world, flat grass at y=3.
    VoxelTerrain terrain = makeFlatTerrain(7, 10, 7, 3);
    AntColony colony;
    ColonyConfig config;
    std::mt19937 rng{ 42 };
    AntActionExecutor executor{ terrain, colony, config, rng };

    // Adding ants can move the arena, so tests hold ids and look ants up after.
    AntId addWorker(const Vector3i& cell, double health)
    {
        const AntId id = colony.add(AntRole::Worker, Genome{}, cell, config.workerMaxHealth);
        colony.get(id).health = health;
        return id;
    }

    AntId addQueen(const Vector3i& cell, double health)
    {
        const AntId id = colony.add(AntRole::Queen, Genome{}, cell, config.queenMaxHealth);
        colony.get(id).health = health;
        return id;
    }

    Ant& ant(AntId id) { return colony.get(id); }
};

TEST_F(AntActionExecutorTest, QueenBuildsNestAtFullHealth)
{
    Ant& queen = ant(addQueen({ 3, 3, 3 }, 48.0));

    EXPECT_DOUBLE_EQ(executor.nestCost(queen), 16.0);
    ASSERT_TRUE(executor.canBuildNest(queen));
    ASSERT_TRUE(executor.tryBuildNest(queen));

    EXPECT_DOUBLE_EQ(queen.health, 32.0);
    EXPECT_EQ(queen.nestsBuilt, 1);
    EXPECT_TRUE(queen.alive);
    EXPECT_EQ(terrain.getBlock(3, 3, 3), Block::EnumType::Nest);
    EXPECT_EQ(terrain.getNestBlockCount(), 1);

    // Nests are not built on nests.
    EXPECT_FALSE(executor.canBuildNest(queen));
}

TEST_F(AntActionExecutorTest, BuildNestRequiresQueenAndHealth)
{
    const AntId workerId = addWorker({ 2, 3, 2 }, 24.0);
    const AntId queenId = addQueen({ 3, 3, 3 }, 15.0);

    EXPECT_FALSE(executor.canBuildNest(ant(workerId)));
    EXPECT_FALSE(executor.canBuildNest(ant(queenId)));
    EXPECT_FALSE(executor.tryBuildNest(ant(queenId)));
    EXPECT_EQ(terrain.getBlock(3, 3, 3), Block::EnumType::Grass);
}

TEST_F(AntActionExecutorTest, NestThatDrainsQueenToZeroKillsHer)
{
    config.queenNestCostFraction = 1.0;
    Ant& queen = ant(addQueen({ 3, 3, 3 }, 48.0));

    ASSERT_TRUE(executor.tryBuildNest(queen));
    EXPECT_FALSE(queen.alive);
    EXPECT_DOUBLE_EQ(queen.health, 0.0);
}

TEST_F(AntActionExecutorTest, ShareHealthMovesTransferAmountToWeakerAnt)
{
    const AntId donorId = addWorker({ 2, 3, 2 }, 10.0);
    const AntId receiverId = addWorker({ 2, 3, 2 }, 2.0);
    Ant& donor = ant(donorId);
    Ant& receiver = ant(receiverId);

    ASSERT_TRUE(executor.canShareHealth(donor, colony.countLivingAt(donor.cell)));
    ASSERT_TRUE(executor.tryShareHealth(donor));

    EXPECT_DOUBLE_EQ(donor.health, 7.0);
    EXPECT_DOUBLE_EQ(receiver.health, 5.0);
    EXPECT_DOUBLE_EQ(donor.healthShared, 3.0);
}

TEST_F(AntActionExecutorTest, ShareHealthIsCappedByReceiverHeadroom)
{
    const AntId donorId = addWorker({ 2, 3, 2 }, 20.0);
    const AntId receiverId = addWorker({ 2, 3, 2 }, 17.5);
    Ant& donor = ant(donorId);
    Ant& receiver = ant(receiverId);
    receiver.maxHealth = 18.5;

    ASSERT_TRUE(executor.tryShareHealth(donor));
    EXPECT_DOUBLE_EQ(receiver.health, 18.5);
    EXPECT_DOUBLE_EQ(donor.health, 19.0);
    EXPECT_DOUBLE_EQ(donor.healthShared, 1.0);
}

TEST_F(AntActionExecutorTest, ShareHealthPrefersInjuredCoLocatedQueen)
{
    const AntId queenId = addQueen({ 2, 3, 2 }, 40.0);
    const AntId donorId = addWorker({ 2, 3, 2 }, 20.0);
    const AntId weakId = addWorker({ 2, 3, 2 }, 4.0);

    ASSERT_TRUE(executor.tryShareHealth(ant(donorId)));
    EXPECT_DOUBLE_EQ(ant(queenId).health, 43.0);
    EXPECT_DOUBLE_EQ(ant(weakId).health, 4.0);
    EXPECT_DOUBLE_EQ(ant(donorId).health, 17.0);
}

TEST_F(AntActionExecutorTest, DonorBelowQueenThresholdCannotShare)
{
    addQueen({ 2, 3, 2 }, 40.0);
    Ant& donor = ant(addWorker({ 2, 3, 2 }, 8.0)); // 8/24 is below 35%.

    EXPECT_FALSE(executor.canShareHealth(donor, colony.countLivingAt(donor.cell)));
    EXPECT_FALSE(executor.tryShareHealth(donor));
    EXPECT_DOUBLE_EQ(donor.health, 8.0);
}

TEST_F(AntActionExecutorTest, ShareHealthNeedsCompanyAndAHealthGap)
{
    const AntId aloneId = addWorker({ 1, 3, 1 }, 20.0);
    const AntId pairedId = addWorker({ 4, 3, 4 }, 20.0);
    addWorker({ 4, 3, 4 }, 19.5);
    const AntId queenId = addQueen({ 5, 3, 5 }, 10.0);

    EXPECT_FALSE(executor.canShareHealth(ant(aloneId), 1));
    EXPECT_FALSE(executor.canShareHealth(ant(pairedId), 2));
    EXPECT_FALSE(executor.canShareHealth(ant(queenId), 2));
}

TEST_F(AntActionExecutorTest, DigDropsAntOntoBlockBelow)
{
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 24.0));

    ASSERT_TRUE(executor.canDig(worker));
    ASSERT_TRUE(executor.tryDig(worker));

    EXPECT_EQ(terrain.getBlock(3, 3, 3), Block::EnumType::Air);
    EXPECT_EQ(worker.cell, (Vector3i{ 3, 2, 3 }));
    EXPECT_EQ(worker.blocksDug, 1);
    EXPECT_TRUE(worker.alive);
}

TEST_F(AntActionExecutorTest, DigWithNothingBelowIsLethal)
{
    terrain.setBlock(3, 1, 3, Block::EnumType::Air);
    terrain.setBlock(3, 2, 3, Block::EnumType::Air);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 24.0));

    ASSERT_TRUE(executor.tryDig(worker));
    EXPECT_FALSE(worker.alive);
    EXPECT_DOUBLE_EQ(worker.health, 0.0);
    EXPECT_EQ(worker.blocksDug, 1);
}

TEST_F(AntActionExecutorTest, DigDropsCoLocatedAntsWithTheDigger)
{
    const AntId diggerId = addWorker({ 3, 3, 3 }, 24.0);
    const AntId bystanderId = addWorker({ 3, 3, 3 }, 20.0);
    const AntId neighborId = addWorker({ 2, 3, 3 }, 20.0);

    ASSERT_TRUE(executor.tryDig(ant(diggerId)));

    const Ant& bystander = ant(bystanderId);
    EXPECT_TRUE(bystander.alive);
    EXPECT_EQ(bystander.cell, (Vector3i{ 3, 2, 3 }));
    EXPECT_TRUE(Block::isSolid(terrain.getBlock(bystander.cell.x, bystander.cell.y, bystander.cell.z)));
    EXPECT_EQ(bystander.blocksDug, 0);
    EXPECT_EQ(ant(diggerId).cell, bystander.cell);
    EXPECT_EQ(ant(neighborId).cell, (Vector3i{ 2, 3, 3 }));
}

TEST_F(AntActionExecutorTest, DigWithNothingBelowKillsCoLocatedAnts)
{
    terrain.setBlock(3, 1, 3, Block::EnumType::Air);
    terrain.setBlock(3, 2, 3, Block::EnumType::Air);
    const AntId diggerId = addWorker({ 3, 3, 3 }, 24.0);
    const AntId queenId = addQueen({ 3, 3, 3 }, 30.0);

    ASSERT_TRUE(executor.tryDig(ant(diggerId)));

    EXPECT_FALSE(ant(diggerId).alive);
    EXPECT_FALSE(ant(queenId).alive);
    EXPECT_EQ(colony.liveQueen(), nullptr);
}

TEST_F(AntActionExecutorTest, DigIsRefusedOnProtectedBlocksAndForQueen)
{
    const AntId workerId = addWorker({ 3, 3, 3 }, 24.0);
    const AntId queenId = addQueen({ 2, 3, 2 }, 48.0);

    for (const Block::EnumType type :
         { Block::EnumType::Mulch, Block::EnumType::Container, Block::EnumType::Nest }) {
        terrain.setBlock(3, 3, 3, type);
        EXPECT_FALSE(executor.canDig(ant(workerId))) << Block::toString(type);
        EXPECT_FALSE(executor.tryDig(ant(workerId)));
    }

    EXPECT_FALSE(executor.canDig(ant(queenId)));
}

TEST_F(AntActionExecutorTest, EatRestoresHealthAndConsumesMulch)
{
    terrain.setBlock(3, 3, 3, Block::EnumType::Mulch);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 10.0));

    ASSERT_TRUE(executor.tryEat(worker, 1));
    EXPECT_DOUBLE_EQ(worker.health, 22.0);
    EXPECT_EQ(worker.mulchConsumed, 1);
    EXPECT_EQ(terrain.getBlock(3, 3, 3), Block::EnumType::Air);
    EXPECT_EQ(worker.cell.y, 2);
}

TEST_F(AntActionExecutorTest, EatNeverExceedsMaxHealth)
{
    terrain.setBlock(3, 3, 3, Block::EnumType::Mulch);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 20.0));

    ASSERT_TRUE(executor.tryEat(worker, 1));
    EXPECT_DOUBLE_EQ(worker.health, 24.0);
}

TEST_F(AntActionExecutorTest, CoLocationBlocksEating)
{
    terrain.setBlock(3, 3, 3, Block::EnumType::Mulch);
    const AntId workerId = addWorker({ 3, 3, 3 }, 10.0);
    addWorker({ 3, 3, 3 }, 10.0);

    EXPECT_FALSE(executor.canEat(ant(workerId), 2));
    EXPECT_FALSE(executor.execute(ant(workerId), AntDecision{ .action = AntAction::Eat }));
    EXPECT_EQ(terrain.getBlock(3, 3, 3), Block::EnumType::Mulch);
}

TEST_F(AntActionExecutorTest, MoveOptionsRespectStepHeightBordersAndContainers)
{
    placeColumn(terrain, 4, 3, 6);                         // +x: 3 higher, too steep.
    placeColumn(terrain, 2, 3, 5);                         // -x: 2 higher, fine.
    terrain.setBlock(3, 3, 4, Block::EnumType::Container); // +z: container top.
    const AntId workerId = addWorker({ 3, 3, 3 }, 24.0);
    const AntId edgeId = addWorker({ 1, 3, 1 }, 24.0);

    MoveOptions options;
    EXPECT_EQ(executor.buildMoveOptions(ant(workerId), options), 2);
    EXPECT_FALSE(options[0].valid);
    EXPECT_TRUE(options[1].valid);
    EXPECT_EQ(options[1].cell, (Vector3i{ 2, 5, 3 }));
    EXPECT_FALSE(options[2].valid);
    EXPECT_TRUE(options[3].valid);

    // Border columns are never entered.
    executor.buildMoveOptions(ant(edgeId), options);
    EXPECT_FALSE(options[1].valid);
    EXPECT_FALSE(options[3].valid);
}

TEST_F(AntActionExecutorTest, MoveFollowsPreferredDirectionWithoutQueen)
{
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 24.0));

    ASSERT_TRUE(executor.tryMove(worker, 2));
    EXPECT_EQ(worker.cell, (Vector3i{ 3, 3, 4 }));
}

TEST_F(AntActionExecutorTest, BlockedDirectionFallsBackToAValidOne)
{
    placeColumn(terrain, 4, 3, 8);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 24.0));

    ASSERT_TRUE(executor.tryMove(worker, 0));
    EXPECT_EQ(worker.cell.y, 3);
    EXPECT_EQ(manhattanDistance(worker.cell, Vector3i{ 3, 3, 3 }), 1);
}

TEST_F(AntActionExecutorTest, HealthyWorkerSteersTowardInjuredQueen)
{
    addQueen({ 5, 3, 3 }, 30.0);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 24.0));

    // Asked to go -x; the escort heuristic turns it towards the queen.
    ASSERT_TRUE(executor.tryMove(worker, 1));
    EXPECT_EQ(worker.cell, (Vector3i{ 4, 3, 3 }));
}

TEST_F(AntActionExecutorTest, HealthDecayDoublesOnAcid)
{
    terrain.setBlock(4, 3, 4, Block::EnumType::Acidic);
    const AntId grassId = addWorker({ 2, 3, 2 }, 10.0);
    const AntId acidId = addWorker({ 4, 3, 4 }, 10.0);

    executor.applyHealthDecay(ant(grassId));
    executor.applyHealthDecay(ant(acidId));

    EXPECT_DOUBLE_EQ(ant(grassId).health, 9.75);
    EXPECT_DOUBLE_EQ(ant(acidId).health, 9.5);
}

TEST_F(AntActionExecutorTest, HealthDecayKillsAtZero)
{
    Ant& worker = ant(addWorker({ 2, 3, 2 }, 0.2));

    executor.applyHealthDecay(worker);
    EXPECT_FALSE(worker.alive);
    EXPECT_DOUBLE_EQ(worker.health, 0.0);
}

TEST_F(AntActionExecutorTest, SenseReportsQueenOffsetForWorkers)
{
    addQueen({ 5, 3, 2 }, 48.0);
    Ant& worker = ant(addWorker({ 3, 3, 3 }, 12.0));

    const AntSensoryData sensory = executor.sense(worker, 1);
    EXPECT_FALSE(sensory.isQueen);
    EXPECT_DOUBLE_EQ(sensory.healthRatio, 0.5);
    EXPECT_EQ(sensory.standingOn, Block::EnumType::Grass);
    EXPECT_TRUE(sensory.canDig);
    EXPECT_FALSE(sensory.canEat);
    EXPECT_EQ(sensory.validMoveCount, 4);
    ASSERT_TRUE(sensory.queenOffset.has_value());
    EXPECT_EQ(sensory.queenOffset.value(), (Vector3i{ 2, 0, -1 }));
    EXPECT_FALSE(sensory.queenCoLocated);
}
