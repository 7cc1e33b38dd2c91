#pragma once

#include "Genome.h"

#include <array>

namespace AntSim {

using Observation = std::array<float, Genome::INPUT_SIZE>;
using PolicyOutput = std::array<float, Genome::OUTPUT_SIZE>;

/**
 * Single-hidden-layer feed-forward policy.
 *
 * hidden = tanh(W_ih^T @ input + b_h), output = W_ho^T @ hidden + b_o (raw logits).
 * Weights are read sequentially from the genome: for each hidden unit its
 * INPUT_SIZE input weights, then the hidden biases, then for each output its
 * HIDDEN_SIZE weights, then the output biases.
 *
 * Pure function of (genome, observation): no state, no randomness.
 */
namespace PolicyNetwork {

PolicyOutput forward(const Genome& genome, const Observation& input);

} // namespace PolicyNetwork

} // namespace AntSim
