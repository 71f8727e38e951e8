#pragma once

#include "sa.hpp"
#include <cstdint>
#include <vector>

namespace lunar_habitat {

// Independent annealing runs, one per seed, executed in parallel when
// OpenMP is available. Each run owns its RNG and layout copies, so
// results[i] equals optimize(layout, iterations, settings, weights, seeds[i]).
[[nodiscard]] std::vector<OptimizationResult> optimize_multistart(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    const std::vector<uint64_t>& seeds,
    bool verbose = false
);

// n_starts runs, each with its own RNG split from rng in start order
[[nodiscard]] std::vector<OptimizationResult> optimize_multistart(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    RNG& rng,
    int n_starts,
    bool verbose = false
);

// Highest-scoring result (first one on ties); throws std::runtime_error if empty
[[nodiscard]] const OptimizationResult& best_result(const std::vector<OptimizationResult>& results);

// n reproducible seeds derived from a base seed
[[nodiscard]] std::vector<uint64_t> derive_seeds(uint64_t base_seed, int n);

}  // namespace lunar_habitat
