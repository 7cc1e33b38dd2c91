#include "AntBrain.h"

#include "Ant.h"
#include "core/LoggingChannels.h"
#include "core/organisms/brains/MaskedSampling.h"

#include <algorithm>
#include <span>

namespace AntSim {

namespace {
float flag(bool value)
{
    return value ? 1.0f : 0.0f;
}

float clamp01(double value)
{
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

float clampUnit(double value)
{
    return static_cast<float>(std::clamp(value, -1.0, 1.0));
}
} // namespace

std::optional<AntDecision> AntBrain::heuristicOverride(const AntSensoryData& sensory)
{
    if (sensory.isQueen) {
        if (sensory.canBuild && sensory.health >= sensory.nestCost * QUEEN_BUILD_MARGIN) {
            return AntDecision{ .action = AntAction::BuildNest };
        }
        if (sensory.canEat && sensory.healthRatio < QUEEN_EAT_RATIO) {
            return AntDecision{ .action = AntAction::Eat };
        }
        return std::nullopt;
    }

    if (sensory.canShare && sensory.queenCoLocated && sensory.queenBelowFullHealth) {
        return AntDecision{ .action = AntAction::ShareHealth };
    }
    if (sensory.canEat && sensory.healthRatio < WORKER_EAT_RATIO) {
        return AntDecision{ .action = AntAction::Eat };
    }
    return std::nullopt;
}

Observation AntBrain::buildObservation(const AntSensoryData& sensory)
{
    Observation obs{};

    const Block::EnumType standing = sensory.standingOn;

    obs[0] = clamp01(sensory.healthRatio);
    obs[1] = 1.0f - obs[0];
    obs[2] = flag(sensory.isQueen);
    obs[3] = clamp01((sensory.sameCellCount - 1) / 4.0);
    obs[4] = flag(standing == Block::EnumType::Mulch);
    obs[5] = flag(standing == Block::EnumType::Acidic);
    obs[6] = flag(standing == Block::EnumType::Nest);
    obs[7] = flag(
        Block::isSolid(standing) && standing != Block::EnumType::Mulch
        && standing != Block::EnumType::Acidic && standing != Block::EnumType::Nest);
    obs[8] = flag(sensory.canEat);
    obs[9] = flag(sensory.canDig);
    obs[10] = flag(sensory.canShare);
    obs[11] = flag(sensory.canBuild);
    obs[12] = static_cast<float>(sensory.validMoveCount) / MOVE_DIRECTION_COUNT;

    if (!sensory.isQueen && sensory.queenOffset.has_value()) {
        const Vector3i& d = sensory.queenOffset.value();
        const int dist = manhattanDistance(d, Vector3i{});
        obs[13] = clamp01(dist / 30.0);
        obs[14] = clampUnit(d.x / 10.0);
        obs[15] = clampUnit(d.z / 10.0);
    }

    for (int i = 0; i < MOVE_DIRECTION_COUNT; i++) {
        const MoveOption& option = sensory.moveOptions[i];
        if (!option.valid) {
            continue;
        }
        obs[16 + i] = clampUnit((option.cell.y - sensory.cell.y) / 2.0);
        obs[20 + i] = flag(option.block == Block::EnumType::Mulch);
    }

    return obs;
}

std::array<bool, ACTION_COUNT> AntBrain::buildActionMask(const AntSensoryData& sensory)
{
    std::array<bool, ACTION_COUNT> mask{};
    mask[static_cast<int>(AntAction::Idle)] = true;
    mask[static_cast<int>(AntAction::Move)] = sensory.validMoveCount > 0;
    mask[static_cast<int>(AntAction::Dig)] = sensory.canDig;
    mask[static_cast<int>(AntAction::Eat)] = sensory.canEat;
    mask[static_cast<int>(AntAction::ShareHealth)] = sensory.canShare;
    mask[static_cast<int>(AntAction::BuildNest)] = sensory.canBuild;
    return mask;
}

AntDecision AntBrain::decide(const Ant& ant, const AntSensoryData& sensory, std::mt19937& rng) const
{
    if (auto forced = heuristicOverride(sensory)) {
        LOG_TRACE(Brain, "Ant {} heuristic {}", ant.id, toString(forced->action));
        return *forced;
    }

    const Observation obs = buildObservation(sensory);
    const PolicyOutput output = PolicyNetwork::forward(ant.genome, obs);
    const auto mask = buildActionMask(sensory);

    const std::span<const float> logits(output);
    const int actionIndex = sampleMaskedLogits(
        logits.first(ACTION_COUNT),
        mask,
        ACTION_TEMPERATURE,
        static_cast<int>(AntAction::Idle),
        rng);

    AntDecision decision{ .action = static_cast<AntAction>(actionIndex) };

    if (decision.action == AntAction::Move) {
        std::array<bool, MOVE_DIRECTION_COUNT> directionMask{};
        for (int i = 0; i < MOVE_DIRECTION_COUNT; i++) {
            directionMask[i] = sensory.moveOptions[i].valid;
        }
        decision.moveDirection = sampleMaskedLogits(
            logits.subspan(ACTION_COUNT, MOVE_DIRECTION_COUNT),
            directionMask,
            DIRECTION_TEMPERATURE,
            0,
            rng);
    }

    LOG_TRACE(
        Brain,
        "Ant {} sampled {} (direction {})",
        ant.id,
        toString(decision.action),
        decision.moveDirection);
    return decision;
}

} // namespace AntSim
