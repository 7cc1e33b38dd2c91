#include "core/organisms/evolution/ColonyRunner.h"
#include "core/organisms/evolution/ColonyStatus.h"
#include "core/organisms/tests/ColonyTestUtils.h"

#include <gtest/gtest.h>

using namespace AntSim;
using namespace AntSim::Test;

namespace {

/**
 * 4x8x3 world with exactly two interior columns, (1, 1) and (2, 1), both topped
 * with Nest and four blocks apart in height. Nobody can build, dig, eat, share
 * or move, so every ant idles until the generation ends.
 */
VoxelTerrain makeStandoffTerrain()
{
    VoxelTerrain terrain = makeFlatTerrain(4, 8, 3, 2);
    placeColumn(terrain, 1, 1, 2, Block::EnumType::Nest);
    placeColumn(terrain, 2, 1, 6, Block::EnumType::Nest);
    terrain.captureInitialState();
    return terrain;
}

ColonyConfig makeSmallConfig()
{
    ColonyConfig config;
    config.seed = 99;
    config.workerCount = 6;
    config.eliteCount = 2;
    config.evaluationSteps = 20;
    return config;
}

VoxelTerrain makeFieldTerrain()
{
    VoxelTerrain terrain = makeFlatTerrain(12, 8, 12, 3);
    for (int x = 2; x < 10; x += 3) {
        for (int z = 2; z < 10; z += 2) {
            terrain.setBlock(x, 3, z, Block::EnumType::Mulch);
        }
    }
    placeColumn(terrain, 6, 6, 5);
    terrain.setBlock(8, 3, 3, Block::EnumType::Acidic);
    terrain.captureInitialState();
    return terrain;
}

} // namespace

TEST(ColonyRunnerTest, ConstructionSpawnsFirstGeneration)
{
    VoxelTerrain terrain = makeFieldTerrain();
    const ColonyConfig config = makeSmallConfig();
    ColonyRunner runner(terrain, config);

    EXPECT_EQ(runner.getGenerationIndex(), 1);
    EXPECT_EQ(runner.getStepInGeneration(), 0);
    EXPECT_EQ(runner.getPhase(), ColonyRunner::Phase::Running);
    EXPECT_EQ(runner.getColony().size(), 7u);
    ASSERT_NE(runner.getColony().queen(), nullptr);
    EXPECT_EQ(runner.getWorkerGenomes().size(), 6u);
    EXPECT_FALSE(runner.getLastGeneration().has_value());

    // No two ants share a spawn cell.
    OccupiedCells cells;
    for (const Ant& ant : runner.getColony().ants()) {
        EXPECT_TRUE(cells.insert(ant.cell).second) << "duplicate spawn at " << ant.cell;
        EXPECT_DOUBLE_EQ(ant.health, ant.maxHealth);
    }
}

TEST(ColonyRunnerTest, IdleStandoffScoresSurvivalOnly)
{
    VoxelTerrain terrain = makeStandoffTerrain();
    ColonyConfig config;
    config.workerCount = 1;
    config.eliteCount = 1;
    config.evaluationSteps = 50;
    ColonyRunner runner(terrain, config);

    ASSERT_EQ(runner.getColony().size(), 2u);

    for (int i = 0; i < 50; i++) {
        runner.step();
    }
    EXPECT_EQ(runner.getGenerationIndex(), 1);
    EXPECT_EQ(runner.getStepInGeneration(), 50);
    EXPECT_EQ(runner.getColony().countAlive(), 2);

    const Ant* queen = runner.getColony().queen();
    ASSERT_NE(queen, nullptr);
    EXPECT_DOUBLE_EQ(queen->health, 48.0 - 50 * 0.25);
    EXPECT_EQ(queen->stepsAlive, 50);
    EXPECT_EQ(queen->nestsBuilt, 0);

    runner.step();
    EXPECT_EQ(runner.getGenerationIndex(), 2);
    EXPECT_EQ(runner.getStepInGeneration(), 0);

    const auto& last = runner.getLastGeneration();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->generation, 1);
    EXPECT_EQ(last->antsPlaced, 2);
    EXPECT_EQ(last->fitness.queenNests, 0);
    EXPECT_NEAR(last->fitness.bestWorkerFitness, 2.5, 1e-9);
    EXPECT_NEAR(last->fitness.bestFitness, 4.0 + 0.35 * 35.5, 1e-9);
    EXPECT_NEAR(last->fitness.averageFitness, (2.5 + 4.0 + 0.35 * 35.5) / 2.0, 1e-9);
}

TEST(ColonyRunnerTest, GenerationEndsEarlyWhenEveryoneDies)
{
    VoxelTerrain terrain = makeStandoffTerrain();
    ColonyConfig config;
    config.workerCount = 1;
    config.evaluationSteps = 500;
    config.baseHealthDrain = 30.0;
    ColonyRunner runner(terrain, config);

    // The first tick kills the worker (24) and leaves the queen at 18; the second kills her.
    runner.step();
    runner.step();
    EXPECT_EQ(runner.getColony().countAlive(), 0);
    EXPECT_EQ(runner.getGenerationIndex(), 1);

    runner.step();
    EXPECT_EQ(runner.getGenerationIndex(), 2);
    ASSERT_TRUE(runner.getLastGeneration().has_value());
    EXPECT_EQ(runner.getColony().countAlive(), 2);
}

TEST(ColonyRunnerTest, EmptyWorldEndsEachGenerationImmediately)
{
    VoxelTerrain terrain(5, 1, 5);
    terrain.captureInitialState();
    ColonyConfig config = makeSmallConfig();
    ColonyRunner runner(terrain, config);

    EXPECT_TRUE(runner.getColony().empty());

    runner.step();
    EXPECT_EQ(runner.getGenerationIndex(), 2);
    ASSERT_TRUE(runner.getLastGeneration().has_value());
    EXPECT_EQ(runner.getLastGeneration()->antsPlaced, 0);
    EXPECT_DOUBLE_EQ(runner.getLastGeneration()->fitness.bestFitness, 0.0);
    EXPECT_EQ(runner.getWorkerGenomes().size(), 6u);
}

TEST(ColonyRunnerTest, PopulationSizeIsStableAcrossGenerations)
{
    VoxelTerrain terrain = makeFieldTerrain();
    const ColonyConfig config = makeSmallConfig();
    ColonyRunner runner(terrain, config);

    int generationsSeen = 0;
    int lastGeneration = runner.getGenerationIndex();
    for (int i = 0; i < 200 && generationsSeen < 4; i++) {
        runner.step();
        if (runner.getGenerationIndex() != lastGeneration) {
            lastGeneration = runner.getGenerationIndex();
            generationsSeen++;
            EXPECT_EQ(runner.getColony().size(), 7u);
            EXPECT_EQ(runner.getWorkerGenomes().size(), 6u);
            EXPECT_EQ(runner.getQueenGenome().weights.size(), Genome::EXPECTED_WEIGHT_COUNT);
        }
    }
    EXPECT_EQ(generationsSeen, 4);
}

TEST(ColonyRunnerTest, StepsNeverExceedEvaluationLimit)
{
    VoxelTerrain terrain = makeFieldTerrain();
    const ColonyConfig config = makeSmallConfig();
    ColonyRunner runner(terrain, config);

    for (int i = 0; i < 100; i++) {
        runner.step();
        EXPECT_LE(runner.getStepInGeneration(), config.evaluationSteps);
        for (const Ant& ant : runner.getColony().ants()) {
            EXPECT_GE(ant.health, 0.0);
            EXPECT_LE(ant.health, ant.maxHealth);
            EXPECT_LE(ant.stepsAlive, config.evaluationSteps);
        }
    }
}

TEST(ColonyRunnerTest, SameSeedSameRun)
{
    VoxelTerrain terrainA = makeFieldTerrain();
    VoxelTerrain terrainB = makeFieldTerrain();
    const ColonyConfig config = makeSmallConfig();
    ColonyRunner a(terrainA, config);
    ColonyRunner b(terrainB, config);

    for (int i = 0; i < 75; i++) {
        a.step();
        b.step();
    }

    ASSERT_EQ(a.getGenerationIndex(), b.getGenerationIndex());
    ASSERT_EQ(a.getColony().size(), b.getColony().size());
    for (size_t i = 0; i < a.getColony().size(); i++) {
        const Ant& antA = a.getColony().ants()[i];
        const Ant& antB = b.getColony().ants()[i];
        EXPECT_EQ(antA.cell, antB.cell);
        EXPECT_DOUBLE_EQ(antA.health, antB.health);
        EXPECT_EQ(antA.alive, antB.alive);
    }
    EXPECT_EQ(a.getWorkerGenomes(), b.getWorkerGenomes());
    EXPECT_EQ(a.getQueenGenome(), b.getQueenGenome());
    EXPECT_EQ(terrainA.getNestBlockCount(), terrainB.getNestBlockCount());
}

TEST(ColonyRunnerTest, TerrainIsRestoredBetweenGenerations)
{
    VoxelTerrain terrain = makeStandoffTerrain();
    ColonyConfig config;
    config.workerCount = 1;
    config.evaluationSteps = 5;
    ColonyRunner runner(terrain, config);

    terrain.setBlock(0, 5, 0, Block::EnumType::Mulch);
    for (int i = 0; i < 6; i++) {
        runner.step();
    }

    EXPECT_EQ(runner.getGenerationIndex(), 2);
    EXPECT_EQ(terrain.getBlock(0, 5, 0), Block::EnumType::Air);
}

TEST(ColonyRunnerTest, TerrainPersistsWhenResetDisabled)
{
    VoxelTerrain terrain = makeStandoffTerrain();
    ColonyConfig config;
    config.workerCount = 1;
    config.evaluationSteps = 5;
    config.resetWorldEachGeneration = false;
    ColonyRunner runner(terrain, config);

    terrain.setBlock(0, 5, 0, Block::EnumType::Mulch);
    for (int i = 0; i < 6; i++) {
        runner.step();
    }

    EXPECT_EQ(runner.getGenerationIndex(), 2);
    EXPECT_EQ(terrain.getBlock(0, 5, 0), Block::EnumType::Mulch);
}

TEST(ColonyRunnerTest, StatusReflectsRunner)
{
    VoxelTerrain terrain = makeStandoffTerrain();
    ColonyConfig config;
    config.workerCount = 1;
    config.evaluationSteps = 50;
    ColonyRunner runner(terrain, config);

    for (int i = 0; i < 3; i++) {
        runner.step();
    }

    const ColonyStatus status = runner.getStatus();
    EXPECT_EQ(status.generation, 1);
    EXPECT_EQ(status.step, 3);
    EXPECT_EQ(status.evaluationSteps, 50);
    EXPECT_EQ(status.aliveAnts, 2);
    EXPECT_EQ(status.totalAnts, 2);
    EXPECT_EQ(status.nestBlockCount, 2);
}

TEST(ColonyStatusTest, FormatsStatusLine)
{
    const ColonyStatus status{
        .nestBlockCount = 3,
        .generation = 4,
        .step = 120,
        .evaluationSteps = 700,
        .aliveAnts = 20,
        .totalAnts = 33,
        .lastGenerationNests = 2,
        .lastGenerationBestFitness = 201.5,
        .lastGenerationAverageFitness = 18.25,
        .lastGenerationBestWorkerFitness = 40.0,
    };

    EXPECT_EQ(
        formatStatusLine(status),
        "gen 4 step 120/700 | alive 20/33 | nest blocks 3 | last gen: nests 2 best 201.50 "
        "avg 18.25 best worker 40.00");
}

TEST(ColonyRunnerTest, PhaseNames)
{
    EXPECT_STREQ(toString(ColonyRunner::Phase::Spawning), "Spawning");
    EXPECT_STREQ(toString(ColonyRunner::Phase::Running), "Running");
    EXPECT_STREQ(toString(ColonyRunner::Phase::Ending), "Ending");
}
