#pragma once

#include <cstdint>

namespace AntSim {

enum class AntAction : uint8_t {
    Idle = 0,
    Move = 1,
    Dig = 2,
    Eat = 3,
    ShareHealth = 4,
    BuildNest = 5,
};

constexpr int ACTION_COUNT = 6;
constexpr int MOVE_DIRECTION_COUNT = 4;

struct AntDecision {
    AntAction action = AntAction::Idle;
    int moveDirection = -1; // Only meaningful for Move.
};

inline const char* toString(AntAction action)
{
    switch (action) {
        case AntAction::Idle:
            return "Idle";
        case AntAction::Move:
            return "Move";
        case AntAction::Dig:
            return "Dig";
        case AntAction::Eat:
            return "Eat";
        case AntAction::ShareHealth:
            return "ShareHealth";
        case AntAction::BuildNest:
            return "BuildNest";
    }
    return "Unknown";
}

} // namespace AntSim
