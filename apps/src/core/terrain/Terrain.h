#pragma once

#include "BlockType.h"

namespace AntSim {

/**
 * Narrow cell-based view of the world the colony lives in.
 *
 * The colony never owns terrain storage; it reads block classifications and
 * replaces single cells. Reads outside the bounds report Air and writes outside
 * the bounds are ignored.
 */
class Terrain {
public:
    virtual ~Terrain() = default;

    virtual Block::EnumType getBlock(int x, int y, int z) const = 0;
    virtual void setBlock(int x, int y, int z, Block::EnumType type) = 0;

    virtual int sizeX() const = 0;
    virtual int sizeY() const = 0;
    virtual int sizeZ() const = 0;

    // Restore the world to the state it had right after generation.
    virtual void resetToInitialState() = 0;

    // Number of Nest blocks currently in the world.
    virtual int getNestBlockCount() const = 0;

    bool inBounds(int x, int y, int z) const
    {
        return x >= 0 && y >= 0 && z >= 0 && x < sizeX() && y < sizeY() && z < sizeZ();
    }
};

} // namespace AntSim
