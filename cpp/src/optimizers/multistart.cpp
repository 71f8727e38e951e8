#include "lunar_habitat/optimizers/multistart.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace lunar_habitat {

namespace {

// Runs are independent; each one consumes only its own RNG
std::vector<OptimizationResult> run_starts(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    std::vector<RNG>& rngs,
    bool verbose
) {
    const SimulatedAnnealing annealer(settings, weights);
    const int n = static_cast<int>(rngs.size());
    std::vector<OptimizationResult> results(rngs.size());

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int i = 0; i < n; ++i) {
        results[static_cast<size_t>(i)] = annealer.run(layout, iterations, rngs[static_cast<size_t>(i)]);
    }

    if (verbose) {
        #ifdef _OPENMP
        std::cout << "[MultiStart] threads=" << omp_get_max_threads() << "\n";
        #endif
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "[MultiStart] start=" << i << " score=" << results[i].score << "\n";
        }
    }
    return results;
}

}  // namespace

std::vector<OptimizationResult> optimize_multistart(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    const std::vector<uint64_t>& seeds,
    bool verbose
) {
    std::vector<RNG> rngs;
    rngs.reserve(seeds.size());
    for (uint64_t seed : seeds) {
        rngs.emplace_back(seed);
    }
    return run_starts(layout, iterations, settings, weights, rngs, verbose);
}

std::vector<OptimizationResult> optimize_multistart(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    RNG& rng,
    int n_starts,
    bool verbose
) {
    std::vector<RNG> rngs;
    rngs.reserve(static_cast<size_t>(std::max(n_starts, 0)));
    for (int i = 0; i < n_starts; ++i) {
        rngs.push_back(rng.split());
    }
    return run_starts(layout, iterations, settings, weights, rngs, verbose);
}

const OptimizationResult& best_result(const std::vector<OptimizationResult>& results) {
    if (results.empty()) {
        throw std::runtime_error("best_result: no optimization results");
    }
    size_t best = 0;
    for (size_t i = 1; i < results.size(); ++i) {
        if (results[i].score > results[best].score) {
            best = i;
        }
    }
    return results[best];
}

std::vector<uint64_t> derive_seeds(uint64_t base_seed, int n) {
    RNG rng(base_seed);
    std::vector<uint64_t> seeds;
    seeds.reserve(static_cast<size_t>(std::max(n, 0)));
    for (int i = 0; i < n; ++i) {
        seeds.push_back(rng.next());
    }
    return seeds;
}

}  // namespace lunar_habitat
