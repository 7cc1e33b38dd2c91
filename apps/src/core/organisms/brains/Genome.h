#pragma once

#include "WeightType.h"

#include <random>
#include <vector>

namespace AntSim {

/**
 * Policy network genome - a flat vector of weights for evolution.
 *
 * Layout (see PolicyNetwork): input->hidden weights, hidden biases,
 * hidden->output weights, output biases.
 */
struct Genome {
    std::vector<WeightType> weights;

    static constexpr int INPUT_SIZE = 24;
    static constexpr int HIDDEN_SIZE = 10;
    static constexpr int OUTPUT_SIZE = 10;

    static constexpr size_t EXPECTED_WEIGHT_COUNT =
        INPUT_SIZE * HIDDEN_SIZE + HIDDEN_SIZE + HIDDEN_SIZE * OUTPUT_SIZE + OUTPUT_SIZE;

    // Every weight is kept inside [-WEIGHT_LIMIT, WEIGHT_LIMIT] by mutation.
    static constexpr WeightType WEIGHT_LIMIT = 4.0f;

    Genome();

    // Every weight drawn uniformly from [-1, 1].
    static Genome random(std::mt19937& rng);
    static Genome constant(WeightType value);

    bool operator==(const Genome& other) const;
};

} // namespace AntSim
