#pragma once

#include "core/ReflectSerializer.h"
#include <cstdint>
#include <nlohmann/json.hpp>

namespace AntSim {

/**
 * Procedural generation parameters for VoxelTerrain.
 */
struct TerrainConfig {
    uint32_t seed = 1337;
    int sizeX = 64;
    int sizeY = 32;
    int sizeZ = 64;

    int baseHeight = 12;      // Mean surface height.
    int heightVariation = 6;  // Peak deviation of the surface from baseHeight.
    double mulchChance = 0.08; // Chance a surface cell is mulch.

    int acidicRegionCount = 10;
    int acidicRegionRadius = 5;
    int containerSphereCount = 5;
    int containerSphereRadius = 8;
};

inline void to_json(nlohmann::json& j, const TerrainConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, TerrainConfig& config)
{
    config = ReflectSerializer::from_json<TerrainConfig>(j);
}

} // namespace AntSim
