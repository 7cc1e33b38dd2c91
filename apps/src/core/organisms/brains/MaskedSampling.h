#pragma once

#include <random>
#include <span>

namespace AntSim {

/**
 * Temperature-scaled softmax sampling restricted to the candidates whose mask
 * entry is true.
 *
 * Logits are scaled by 1/temperature (temperature floored at 0.05), shifted by
 * the largest feasible scaled logit and exponentiated. A uniform roll in
 * [0, total) is walked down the candidates in index order; the first candidate
 * that brings the remainder to <= 0 is chosen.
 *
 * Returns `fallback` when no candidate is feasible. Otherwise the result is
 * always a feasible index.
 */
int sampleMaskedLogits(
    std::span<const float> logits,
    std::span<const bool> mask,
    float temperature,
    int fallback,
    std::mt19937& rng);

} // namespace AntSim
