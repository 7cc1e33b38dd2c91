#pragma once

/**
 * \file
 * Block classification for the voxel terrain. Each cell holds exactly one
 * block type; the colony only ever asks for the type and whether it is solid.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace AntSim::Block {

enum class EnumType : uint8_t {
    Air = 0,   // Empty, passable.
    Grass,     // Default surface solid.
    Stone,     // Default body solid.
    Mulch,     // Edible, restores health.
    Acidic,    // Doubles health drain for agents standing on it.
    Container, // Indestructible, never buildable or standable for spawns.
    Nest,      // Built by the queen.
};

std::string toString(EnumType type);

std::optional<EnumType> fromString(const std::string& str);

const std::vector<EnumType>& getAllTypes();

// True for every block an agent can stand on (everything except Air).
inline bool isSolid(EnumType type)
{
    return type != EnumType::Air;
}

} // namespace AntSim::Block
