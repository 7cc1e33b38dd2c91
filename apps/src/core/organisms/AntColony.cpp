#include "AntColony.h"

#include "core/Assert.h"

namespace AntSim {

AntId AntColony::add(AntRole role, Genome genome, const Vector3i& cell, double maxHealth)
{
    ANTSIM_ASSERT(
        role != AntRole::Queen || !queenId_.isValid(), "A generation holds at most one queen");

    Ant ant;
    ant.id = AntId::fromIndex(ants_.size());
    ant.role = role;
    ant.genome = std::move(genome);
    ant.cell = cell;
    ant.maxHealth = maxHealth;
    ant.health = maxHealth;
    ants_.push_back(std::move(ant));

    if (role == AntRole::Queen) {
        queenId_ = ants_.back().id;
    }
    return ants_.back().id;
}

void AntColony::clear()
{
    ants_.clear();
    queenId_ = INVALID_ANT_ID;
}

Ant* AntColony::queen()
{
    return queenId_.isValid() ? &get(queenId_) : nullptr;
}

const Ant* AntColony::queen() const
{
    return queenId_.isValid() ? &get(queenId_) : nullptr;
}

const Ant* AntColony::liveQueen() const
{
    const Ant* q = queen();
    return q && q->alive ? q : nullptr;
}

int AntColony::countAlive() const
{
    int alive = 0;
    for (const Ant& ant : ants_) {
        if (ant.alive) {
            alive++;
        }
    }
    return alive;
}

int AntColony::countLivingAt(const Vector3i& cell) const
{
    int count = 0;
    for (const Ant& ant : ants_) {
        if (ant.alive && ant.cell == cell) {
            count++;
        }
    }
    return count;
}

int AntColony::countLiveWorkersWithin(const Vector3i& cell, int radius) const
{
    int count = 0;
    for (const Ant& ant : ants_) {
        if (ant.alive && !ant.isQueen() && manhattanDistance(cell, ant.cell) <= radius) {
            count++;
        }
    }
    return count;
}

std::vector<AntId> AntColony::liveIds() const
{
    std::vector<AntId> ids;
    ids.reserve(ants_.size());
    for (const Ant& ant : ants_) {
        if (ant.alive) {
            ids.push_back(ant.id);
        }
    }
    return ids;
}

} // namespace AntSim
