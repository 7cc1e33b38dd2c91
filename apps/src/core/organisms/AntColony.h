#pragma once

#include "Ant.h"

#include <vector>

namespace AntSim {

/**
 * Arena of the ants living in the current generation.
 *
 * Ants are addressed by AntId, which is their index in the arena. Ants are never
 * removed mid-generation; death only flips `alive`. clear() discards the whole
 * generation.
 */
class AntColony {
public:
    AntId add(AntRole role, Genome genome, const Vector3i& cell, double maxHealth);
    void clear();

    Ant& get(AntId id) { return ants_[id.index()]; }
    const Ant& get(AntId id) const { return ants_[id.index()]; }

    std::vector<Ant>& ants() { return ants_; }
    const std::vector<Ant>& ants() const { return ants_; }

    size_t size() const { return ants_.size(); }
    bool empty() const { return ants_.empty(); }

    // The generation's queen, alive or dead. Null when none was placed.
    Ant* queen();
    const Ant* queen() const;

    // The queen if she is still alive.
    const Ant* liveQueen() const;

    int countAlive() const;
    int countLivingAt(const Vector3i& cell) const;
    int countLiveWorkersWithin(const Vector3i& cell, int radius) const;

    std::vector<AntId> liveIds() const;

private:
    std::vector<Ant> ants_;
    AntId queenId_ = INVALID_ANT_ID;
};

} // namespace AntSim
