#include "AntActionExecutor.h"

#include "Ant.h"
#include "AntColony.h"
#include "ColonyConfig.h"
#include "core/LoggingChannels.h"
#include "core/Random.h"
#include "core/terrain/Terrain.h"
#include "core/terrain/TerrainQueries.h"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace AntSim {

AntActionExecutor::AntActionExecutor(
    Terrain& terrain, AntColony& colony, const ColonyConfig& config, std::mt19937& rng)
    : terrain_(terrain), colony_(colony), config_(config), rng_(rng)
{}

AntSensoryData AntActionExecutor::sense(const Ant& ant, int sameCellCount) const
{
    AntSensoryData data;
    data.isQueen = ant.isQueen();
    data.cell = ant.cell;
    data.health = ant.health;
    data.healthRatio = ant.healthRatio();
    data.sameCellCount = sameCellCount;
    data.standingOn = terrain_.getBlock(ant.cell.x, ant.cell.y, ant.cell.z);

    data.canEat = canEat(ant, sameCellCount);
    data.canDig = canDig(ant);
    data.canShare = canShareHealth(ant, sameCellCount);
    data.canBuild = canBuildNest(ant);
    data.nestCost = nestCost(ant);

    data.validMoveCount = buildMoveOptions(ant, data.moveOptions);

    const Ant* queen = colony_.liveQueen();
    if (queen && !ant.isQueen()) {
        data.queenCoLocated = queen->cell == ant.cell;
        data.queenBelowFullHealth = queen->health < queen->maxHealth;
        data.queenOffset = Vector3i{ queen->cell.x - ant.cell.x,
                                     queen->cell.y - ant.cell.y,
                                     queen->cell.z - ant.cell.z };
    }

    return data;
}

bool AntActionExecutor::execute(Ant& ant, const AntDecision& decision)
{
    if (!ant.alive) {
        return false;
    }

    switch (decision.action) {
        case AntAction::Move:
            return tryMove(ant, decision.moveDirection);
        case AntAction::Dig:
            return tryDig(ant);
        case AntAction::Eat:
            return tryEat(ant, colony_.countLivingAt(ant.cell));
        case AntAction::ShareHealth:
            return tryShareHealth(ant);
        case AntAction::BuildNest:
            return tryBuildNest(ant);
        case AntAction::Idle:
            return false;
    }
    return false;
}

bool AntActionExecutor::canDig(const Ant& ant) const
{
    if (ant.isQueen()) {
        return false;
    }

    const Block::EnumType standing = terrain_.getBlock(ant.cell.x, ant.cell.y, ant.cell.z);
    return Block::isSolid(standing) && standing != Block::EnumType::Container
        && standing != Block::EnumType::Nest && standing != Block::EnumType::Mulch;
}

bool AntActionExecutor::canEat(const Ant& ant, int sameCellCount) const
{
    if (sameCellCount > 1) {
        return false;
    }
    return terrain_.getBlock(ant.cell.x, ant.cell.y, ant.cell.z) == Block::EnumType::Mulch;
}

bool AntActionExecutor::canShareHealth(const Ant& donor, int sameCellCount) const
{
    if (!donor.alive || donor.isQueen() || donor.health <= 1.0) {
        return false;
    }
    if (sameCellCount <= 1) {
        return false;
    }

    const Ant* queen = colony_.liveQueen();
    if (queen && queen->cell == donor.cell && queen->health < queen->maxHealth) {
        return donor.health > donor.maxHealth * SHARE_TO_QUEEN_MIN_RATIO;
    }

    for (const Ant& other : colony_.ants()) {
        if (!other.alive || other.id == donor.id || other.cell != donor.cell) {
            continue;
        }
        if (other.health < donor.health - 1.0) {
            return true;
        }
    }
    return false;
}

bool AntActionExecutor::canBuildNest(const Ant& ant) const
{
    if (!ant.alive || !ant.isQueen()) {
        return false;
    }
    if (ant.health < nestCost(ant)) {
        return false;
    }

    const Block::EnumType standing = terrain_.getBlock(ant.cell.x, ant.cell.y, ant.cell.z);
    return Block::isSolid(standing) && standing != Block::EnumType::Container
        && standing != Block::EnumType::Nest;
}

double AntActionExecutor::nestCost(const Ant& ant) const
{
    return ant.maxHealth * config_.effectiveNestCostFraction();
}

int AntActionExecutor::buildMoveOptions(const Ant& ant, MoveOptions& options) const
{
    const ColumnBounds bounds = interiorColumns(terrain_);
    int validCount = 0;

    for (int i = 0; i < MOVE_DIRECTION_COUNT; i++) {
        MoveOption& option = options[i];
        option = MoveOption{ .valid = false, .cell = ant.cell, .block = Block::EnumType::Air };

        const int nx = ant.cell.x + MOVE_DIRECTIONS[i].x;
        const int nz = ant.cell.z + MOVE_DIRECTIONS[i].z;
        if (!bounds.contains(nx, nz)) {
            continue;
        }

        const int ny = findTopSolidY(terrain_, nx, nz);
        if (ny < 1 || std::abs(ny - ant.cell.y) > MAX_STEP_HEIGHT) {
            continue;
        }

        const Block::EnumType destination = terrain_.getBlock(nx, ny, nz);
        if (destination == Block::EnumType::Container) {
            continue;
        }

        option.valid = true;
        option.cell = Vector3i{ nx, ny, nz };
        option.block = destination;
        validCount++;
    }

    return validCount;
}

int AntActionExecutor::heuristicMoveDirection(const Ant& ant, const MoveOptions& options) const
{
    const Ant* queen = colony_.liveQueen();
    if (!queen) {
        return -1;
    }

    int best = -1;
    double bestScore = -std::numeric_limits<double>::infinity();

    if (ant.isQueen()) {
        if (ant.health >= ant.maxHealth * QUEEN_STEER_RATIO) {
            return -1;
        }
        for (int i = 0; i < MOVE_DIRECTION_COUNT; i++) {
            if (!options[i].valid) {
                continue;
            }
            double score = colony_.countLiveWorkersWithin(options[i].cell, QUEEN_STEER_RADIUS);
            if (options[i].block == Block::EnumType::Acidic) {
                score -= 3.0;
            }
            if (score > bestScore) {
                bestScore = score;
                best = i;
            }
        }
        return best;
    }

    const double workerRatio = ant.healthRatio();
    const bool queenNeedsHealth = queen->health < queen->maxHealth * QUEEN_NEEDS_HEALTH_RATIO;
    const int currentDistance = manhattanDistance(ant.cell, queen->cell);

    for (int i = 0; i < MOVE_DIRECTION_COUNT; i++) {
        if (!options[i].valid) {
            continue;
        }

        const int delta = currentDistance - manhattanDistance(options[i].cell, queen->cell);
        double score = 0.0;
        if (queenNeedsHealth && workerRatio > WORKER_ESCORT_RATIO) {
            score += delta * 2.2;
        }
        else {
            score -= delta * 1.1;
        }

        if (options[i].block == Block::EnumType::Mulch && workerRatio < WORKER_HUNGRY_RATIO) {
            score += 4.0;
        }
        if (options[i].block == Block::EnumType::Acidic) {
            score -= 5.0;
        }

        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }
    return best;
}

bool AntActionExecutor::tryMove(Ant& ant, int preferredDirection)
{
    MoveOptions options;
    const int validCount = buildMoveOptions(ant, options);
    if (validCount <= 0) {
        return false;
    }

    const int heuristic = heuristicMoveDirection(ant, options);
    if (heuristic >= 0) {
        preferredDirection = heuristic;
    }

    if (preferredDirection >= 0 && preferredDirection < MOVE_DIRECTION_COUNT
        && options[preferredDirection].valid) {
        ant.cell = options[preferredDirection].cell;
        return true;
    }

    // Requested direction is blocked: pick uniformly among the open ones.
    const int target = uniformInt(rng_, 0, validCount);
    int seen = 0;
    for (const MoveOption& option : options) {
        if (!option.valid) {
            continue;
        }
        if (seen == target) {
            ant.cell = option.cell;
            return true;
        }
        seen++;
    }
    return false;
}

bool AntActionExecutor::tryDig(Ant& ant)
{
    if (!canDig(ant)) {
        return false;
    }

    const Vector3i dugCell = ant.cell;
    terrain_.setBlock(dugCell.x, dugCell.y, dugCell.z, Block::EnumType::Air);
    ant.blocksDug++;
    settleAntsAt(dugCell);
    return true;
}

bool AntActionExecutor::tryEat(Ant& ant, int sameCellCount)
{
    if (!canEat(ant, sameCellCount)) {
        return false;
    }

    const Vector3i eatenCell = ant.cell;
    terrain_.setBlock(eatenCell.x, eatenCell.y, eatenCell.z, Block::EnumType::Air);
    ant.setHealth(ant.health + config_.effectiveMulchRestore());
    ant.mulchConsumed++;
    settleAntsAt(eatenCell);
    return true;
}

const Ant* AntActionExecutor::findShareReceiver(const Ant& donor) const
{
    const Ant* queen = colony_.liveQueen();
    if (queen && queen->cell == donor.cell && queen->health < queen->maxHealth) {
        return queen;
    }

    const Ant* receiver = nullptr;
    for (const Ant& other : colony_.ants()) {
        if (!other.alive || other.id == donor.id || other.cell != donor.cell) {
            continue;
        }
        if (!receiver || other.health < receiver->health) {
            receiver = &other;
        }
    }
    return receiver;
}

bool AntActionExecutor::tryShareHealth(Ant& donor)
{
    if (!canShareHealth(donor, colony_.countLivingAt(donor.cell))) {
        return false;
    }

    const Ant* found = findShareReceiver(donor);
    if (!found) {
        return false;
    }
    Ant& receiver = colony_.get(found->id);

    const double transfer = std::min(
        { config_.effectiveTransferAmount(),
          donor.health - 1.0,
          receiver.maxHealth - receiver.health });
    if (transfer <= 0.0) {
        return false;
    }

    donor.health -= transfer;
    receiver.health += transfer;
    donor.healthShared += transfer;

    LOG_TRACE(Colony, "Ant {} shared {:.2f} health with ant {}", donor.id, transfer, receiver.id);
    return true;
}

bool AntActionExecutor::tryBuildNest(Ant& queen)
{
    if (!canBuildNest(queen)) {
        return false;
    }

    terrain_.setBlock(queen.cell.x, queen.cell.y, queen.cell.z, Block::EnumType::Nest);
    queen.setHealth(queen.health - nestCost(queen));
    queen.nestsBuilt++;

    LOG_DEBUG(Colony, "Queen built nest at {} (health {:.1f})", queen.cell, queen.health);

    if (queen.health <= 0.0) {
        queen.kill();
    }
    return true;
}

void AntActionExecutor::applyHealthDecay(Ant& ant) const
{
    double drain = config_.effectiveDrain();
    if (terrain_.getBlock(ant.cell.x, ant.cell.y, ant.cell.z) == Block::EnumType::Acidic) {
        drain *= 2.0;
    }

    ant.setHealth(ant.health - drain);
    if (ant.health <= 0.0) {
        ant.kill();
    }
}

void AntActionExecutor::settleAntsAt(const Vector3i& cell)
{
    for (Ant& ant : colony_.ants()) {
        if (ant.alive && ant.cell == cell) {
            settleAfterSupportRemoved(ant);
        }
    }
}

void AntActionExecutor::settleAfterSupportRemoved(Ant& ant)
{
    const std::optional<int> support = findSupportBelow(terrain_, ant.cell.x, ant.cell.y, ant.cell.z);
    if (!support.has_value()) {
        LOG_DEBUG(Colony, "Ant {} fell from {} with nothing below", ant.id, ant.cell);
        ant.kill();
        return;
    }
    ant.cell.y = support.value();
}

} // namespace AntSim
