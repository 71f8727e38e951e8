#pragma once

#include "neighbors.hpp"
#include "../core/results.hpp"
#include "../core/settings.hpp"
#include "../random/rng.hpp"
#include "../scoring/scorer.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace lunar_habitat {

// Cooling schedule type
enum class CoolingSchedule {
    Geometric,  // T0 * (Tend / T0)^(step / iterations)
    Linear      // T0 + (Tend - T0) * step / iterations
};

struct AnnealingConfig {
    double initial_temp{1.0};
    double final_temp{0.05};
    double min_temp{1e-6};  // floor used in the acceptance test
    CoolingSchedule cooling_schedule{CoolingSchedule::Geometric};
    bool verbose{false};
};

class SimulatedAnnealing;

// One annealing run in progress.
// Holds private copies of the current and best layouts; a candidate is a
// fresh copy of current, so rejecting it needs no rollback.
class AnnealingRun {
public:
    AnnealingRun(const SimulatedAnnealing& annealer, const Layout& layout, int iterations);

    [[nodiscard]] bool done() const { return step_ >= iterations_; }

    // Advance one iteration and return its log entry
    const OptimizationLogEntry& step(RNG& rng);

    [[nodiscard]] int iteration() const { return step_; }
    [[nodiscard]] int iterations() const { return iterations_; }
    [[nodiscard]] const Layout& current() const { return current_; }
    [[nodiscard]] const Layout& best() const { return best_; }
    [[nodiscard]] double current_score() const { return current_eval_.score; }
    [[nodiscard]] double best_score() const { return best_eval_.score; }
    [[nodiscard]] const std::vector<OptimizationLogEntry>& history() const { return history_; }

    [[nodiscard]] size_t accepted_count() const { return n_accepted_; }
    [[nodiscard]] size_t rejected_count() const { return n_rejected_; }
    [[nodiscard]] size_t infeasible_count() const { return n_infeasible_; }
    [[nodiscard]] double accept_rate() const {
        double total = static_cast<double>(n_accepted_ + n_rejected_ + n_infeasible_);
        return total > 0.0 ? static_cast<double>(n_accepted_) / total : 0.0;
    }

    // Best layout, its metrics and score, and the full history
    [[nodiscard]] OptimizationResult result() const;

private:
    const SimulatedAnnealing* annealer_;
    int iterations_;
    int step_{0};

    Layout current_;
    Evaluation current_eval_;
    Layout best_;
    Evaluation best_eval_;
    std::vector<OptimizationLogEntry> history_;

    size_t n_accepted_{0};
    size_t n_rejected_{0};
    size_t n_infeasible_{0};
};

// Simulated annealing over neighbor operators with the validator as a hard
// feasibility gate and the scorer as a maximization objective.
// Temperature depends only on the iteration index.
class SimulatedAnnealing {
public:
    SimulatedAnnealing(
        ConstraintSettings settings,
        const ScoreWeights& weights,
        AnnealingConfig config = {},
        std::vector<NeighborOperator> operators = default_neighbor_operators()
    );

    // The run points back at this annealer, which must outlive it
    [[nodiscard]] AnnealingRun start(const Layout& layout, int iterations) const&;
    AnnealingRun start(const Layout& layout, int iterations) const&& = delete;

    // Run the full fixed iteration budget
    [[nodiscard]] OptimizationResult run(const Layout& layout, int iterations, RNG& rng) const;

    [[nodiscard]] double temperature(int step, int iterations) const;

    [[nodiscard]] const Scorer& scorer() const { return scorer_; }
    [[nodiscard]] const AnnealingConfig& config() const { return config_; }
    [[nodiscard]] const std::vector<NeighborOperator>& operators() const { return operators_; }

private:
    Scorer scorer_;
    AnnealingConfig config_;
    std::vector<NeighborOperator> operators_;
};

// Entry point. Without a seed, falls back to layout.metadata.seed, then 42.
[[nodiscard]] OptimizationResult optimize(
    const Layout& layout,
    int iterations = 3000,
    const ConstraintSettings& settings = {},
    const ScoreWeights& weights = {},
    std::optional<uint64_t> seed = std::nullopt
);

}  // namespace lunar_habitat
