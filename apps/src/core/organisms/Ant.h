#pragma once

#include "core/StrongType.h"
#include "core/Vector3i.h"
#include "core/organisms/brains/Genome.h"

#include <algorithm>
#include <cstdint>

namespace AntSim {

enum class AntRole : uint8_t {
    Queen = 0,
    Worker = 1,
};

using AntId = StrongType<struct AntIdTag>;
const AntId INVALID_ANT_ID{};

/**
 * One colony member for the duration of a single generation.
 *
 * The ant owns its genome copy outright; nothing else holds a reference to it.
 * `cell` is the solid block the ant stands on.
 */
struct Ant {
    AntId id;
    AntRole role = AntRole::Worker;
    Genome genome;
    Vector3i cell;
    double health = 0.0;
    double maxHealth = 0.0;
    bool alive = true;

    // Per-generation accumulators.
    int stepsAlive = 0;
    int mulchConsumed = 0;
    int blocksDug = 0;
    int nestsBuilt = 0;
    double healthShared = 0.0;

    double fitness = 0.0; // Filled in at generation end.

    bool isQueen() const { return role == AntRole::Queen; }

    double healthRatio() const { return maxHealth > 0.0 ? health / maxHealth : 0.0; }

    void setHealth(double value) { health = std::clamp(value, 0.0, maxHealth); }

    // Death is permanent for the rest of the generation.
    void kill()
    {
        alive = false;
        health = 0.0;
    }
};

} // namespace AntSim
