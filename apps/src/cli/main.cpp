#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/TickScheduler.h"
#include "core/organisms/ColonyConfig.h"
#include "core/organisms/evolution/ColonyRunner.h"
#include "core/organisms/evolution/ColonyStatus.h"
#include "core/terrain/TerrainConfig.h"
#include "core/terrain/VoxelTerrain.h"
#include <args.hxx>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

using namespace AntSim;

namespace {

// Simulated host frame; the scheduler turns frames into colony ticks.
constexpr double FRAME_SECONDS = 1.0 / 60.0;

struct RunOptions {
    int generations = 5;
    bool realtime = false;
};

void runColony(ColonyRunner& runner, TickScheduler& scheduler, const RunOptions& options)
{
    int reportedGeneration = runner.getGenerationIndex();
    const int lastGeneration = reportedGeneration + options.generations - 1;

    while (runner.getGenerationIndex() <= lastGeneration) {
        const auto frameStart = std::chrono::steady_clock::now();

        const int ticks = scheduler.advance(FRAME_SECONDS);
        for (int i = 0; i < ticks; i++) {
            runner.step();

            if (runner.getGenerationIndex() != reportedGeneration) {
                std::cout << formatStatusLine(runner.getStatus()) << std::endl;
                reportedGeneration = runner.getGenerationIndex();
                if (reportedGeneration > lastGeneration) {
                    break;
                }
            }
        }

        if (options.realtime) {
            std::this_thread::sleep_until(
                frameStart
                + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(FRAME_SECONDS)));
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "antsim - ant colony neuroevolution",
        "Evolves a queen and her workers on a voxel terrain, one generation at a time.");

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for colony.json / terrain.json", { "config-dir" });
    args::ValueFlag<int> generations(
        parser, "count", "Number of generations to run (default: 5)", { "generations" }, 5);
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "Override both the colony and the terrain seed", { "seed" });
    args::ValueFlag<int> workers(parser, "count", "Override the worker count", { "workers" });
    args::ValueFlag<int> steps(
        parser, "steps", "Override the evaluation steps per generation", { "steps" });
    args::ValueFlag<std::string> logConfig(
        parser, "path", "Logging config file (JSON, .local override)", { "log-config" });
    args::ValueFlag<std::string> channels(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'evolution:debug,brain:trace'",
        { 'C', "channels" });
    args::Flag realtime(
        parser, "realtime", "Pace ticks against the wall clock", { "realtime" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig), "antsim");
    }
    else {
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "antsim");
    }
    if (channels) {
        LoggingChannels::configureFromString(args::get(channels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    auto colonyResult = ConfigLoader::loadOrDefault<ColonyConfig>("colony.json");
    if (colonyResult.isError()) {
        SLOG_ERROR("{}", colonyResult.errorValue());
        return 1;
    }
    auto terrainResult = ConfigLoader::loadOrDefault<TerrainConfig>("terrain.json");
    if (terrainResult.isError()) {
        SLOG_ERROR("{}", terrainResult.errorValue());
        return 1;
    }

    ColonyConfig colonyConfig = colonyResult.value();
    TerrainConfig terrainConfig = terrainResult.value();

    if (seed) {
        colonyConfig.seed = args::get(seed);
        terrainConfig.seed = args::get(seed);
    }
    if (workers) {
        colonyConfig.workerCount = args::get(workers);
    }
    if (steps) {
        colonyConfig.evaluationSteps = args::get(steps);
    }

    const int generationCount = args::get(generations);
    if (generationCount < 1) {
        std::cerr << "Error: --generations must be at least 1" << std::endl;
        return 1;
    }

    VoxelTerrain terrain = VoxelTerrain::generate(terrainConfig);
    ColonyRunner runner(terrain, colonyConfig);
    TickScheduler scheduler(colonyConfig.effectiveTickSeconds());

    SLOG_INFO(
        "Running {} generations of {} steps ({} workers)",
        generationCount,
        colonyConfig.effectiveEvaluationSteps(),
        colonyConfig.effectiveWorkerCount());

    runColony(
        runner,
        scheduler,
        RunOptions{ .generations = generationCount, .realtime = args::get(realtime) });
    return 0;
}
