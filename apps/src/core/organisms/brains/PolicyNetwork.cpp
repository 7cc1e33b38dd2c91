#include "PolicyNetwork.h"

#include "core/Assert.h"

#include <cmath>

namespace AntSim {

PolicyOutput PolicyNetwork::forward(const Genome& genome, const Observation& input)
{
    ANTSIM_ASSERT(
        genome.weights.size() == Genome::EXPECTED_WEIGHT_COUNT,
        "Genome length does not match the policy layout");

    const WeightType* p = genome.weights.data();

    // Hidden pre-activations: one row of input weights per hidden unit.
    std::array<float, Genome::HIDDEN_SIZE> hidden{};
    for (int h = 0; h < Genome::HIDDEN_SIZE; h++) {
        float sum = 0.0f;
        for (int i = 0; i < Genome::INPUT_SIZE; i++) {
            sum += input[i] * *p++;
        }
        hidden[h] = sum;
    }

    for (int h = 0; h < Genome::HIDDEN_SIZE; h++) {
        hidden[h] = std::tanh(hidden[h] + *p++);
    }

    // Output layer is linear.
    PolicyOutput output{};
    for (int o = 0; o < Genome::OUTPUT_SIZE; o++) {
        float sum = 0.0f;
        for (int h = 0; h < Genome::HIDDEN_SIZE; h++) {
            sum += hidden[h] * *p++;
        }
        output[o] = sum;
    }

    for (int o = 0; o < Genome::OUTPUT_SIZE; o++) {
        output[o] += *p++;
    }

    return output;
}

} // namespace AntSim
