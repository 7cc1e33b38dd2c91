#pragma once

#include "AntAction.h"
#include "core/Vector3i.h"
#include "core/terrain/BlockType.h"

#include <array>
#include <optional>

namespace AntSim {

// Cardinal directions in network output order: +x, -x, +z, -z.
constexpr std::array<Vector3i, MOVE_DIRECTION_COUNT> MOVE_DIRECTIONS = { {
    { 1, 0, 0 },
    { -1, 0, 0 },
    { 0, 0, 1 },
    { 0, 0, -1 },
} };

struct MoveOption {
    bool valid = false;
    Vector3i cell;                                // Destination (top solid block of the column).
    Block::EnumType block = Block::EnumType::Air; // Destination block type.
};

using MoveOptions = std::array<MoveOption, MOVE_DIRECTION_COUNT>;

/**
 * Everything an ant perceives at the start of its turn.
 * Gathered by AntActionExecutor::sense(), consumed by AntBrain.
 */
struct AntSensoryData {
    bool isQueen = false;
    Vector3i cell;
    double health = 0.0;
    double healthRatio = 0.0;
    int sameCellCount = 1; // Live ants on this cell, self included.
    Block::EnumType standingOn = Block::EnumType::Air;

    bool canEat = false;
    bool canDig = false;
    bool canShare = false;
    bool canBuild = false;
    double nestCost = 0.0;

    MoveOptions moveOptions{};
    int validMoveCount = 0;

    // Worker view of a live queen.
    bool queenCoLocated = false;
    bool queenBelowFullHealth = false;
    std::optional<Vector3i> queenOffset; // queen.cell - ant.cell
};

} // namespace AntSim
