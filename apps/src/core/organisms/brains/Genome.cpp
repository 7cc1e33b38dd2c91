#include "Genome.h"

#include "core/Random.h"

namespace AntSim {

Genome::Genome() : weights(EXPECTED_WEIGHT_COUNT, 0.0f)
{}

Genome Genome::random(std::mt19937& rng)
{
    Genome g;
    for (WeightType& w : g.weights) {
        w = static_cast<WeightType>(uniformRange(rng, -1.0, 1.0));
    }
    return g;
}

Genome Genome::constant(WeightType value)
{
    Genome g;
    g.weights.assign(EXPECTED_WEIGHT_COUNT, value);
    return g;
}

bool Genome::operator==(const Genome& other) const
{
    return weights == other.weights;
}

} // namespace AntSim
