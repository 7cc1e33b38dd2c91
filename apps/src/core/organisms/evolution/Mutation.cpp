#include "Mutation.h"

#include "core/Random.h"
#include "core/organisms/brains/Genome.h"
#include "core/organisms/brains/WeightType.h"

#include <algorithm>

namespace AntSim {

Genome mutate(
    const Genome& parent, const MutationConfig& config, std::mt19937& rng, MutationStats* stats)
{
    if (stats) {
        stats->perturbations = 0;
        stats->clamped = 0;
    }

    Genome child = parent;

    const double sigma = std::max(MutationConfig::MIN_SIGMA, config.sigma);
    const double driftSigma = sigma * config.driftScale;

    for (size_t i = 0; i < child.weights.size(); i++) {
        double value = child.weights[i];

        if (uniform01(rng) < config.rate) {
            value += nextGaussian(rng) * sigma;
            if (stats) {
                stats->perturbations++;
            }
        }

        // Fine drift on every weight.
        value += nextGaussian(rng) * driftSigma;

        const double clampedValue = std::clamp(
            value,
            static_cast<double>(-Genome::WEIGHT_LIMIT),
            static_cast<double>(Genome::WEIGHT_LIMIT));
        if (stats && clampedValue != value) {
            stats->clamped++;
        }
        child.weights[i] = static_cast<WeightType>(clampedValue);
    }

    return child;
}

} // namespace AntSim
