#include "lunar_habitat/optimizers/sa.hpp"
#include "lunar_habitat/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace lunar_habitat {

namespace {

constexpr uint64_t DEFAULT_SEED = 42;

std::string constraint_fail_reason(const ValidationResult& validation) {
    std::string reason = "constraint_fail:";
    for (size_t i = 0; i < validation.failed_rules.size(); ++i) {
        if (i > 0) reason += ",";
        reason += validation.failed_rules[i];
    }
    return reason;
}

}  // namespace

AnnealingRun::AnnealingRun(const SimulatedAnnealing& annealer, const Layout& layout, int iterations)
    : annealer_(&annealer)
    , iterations_(std::max(iterations, 0))
    , current_(layout)
    , current_eval_(annealer.scorer().evaluate(current_))
    , best_(current_)
    , best_eval_(current_eval_)
{
    history_.reserve(static_cast<size_t>(iterations_) + 1);
    history_.push_back({0, current_eval_.score, true, "initial"});
}

const OptimizationLogEntry& AnnealingRun::step(RNG& rng) {
    if (done()) {
        return history_.back();
    }
    const int s = ++step_;
    const auto& ops = annealer_->operators();
    const Scorer& scorer = annealer_->scorer();

    Layout candidate = current_;
    const NeighborOperator& op = ops[static_cast<size_t>(rng.randint(0, static_cast<int>(ops.size()) - 1))];
    apply_neighbor(op, candidate, rng);

    ValidationResult validation = scorer.validator().validate(candidate);
    if (!validation.passed) {
        ++n_infeasible_;
        history_.push_back({s, current_eval_.score, false, constraint_fail_reason(validation)});
        if (annealer_->config().verbose) {
            std::cout << "[SimulatedAnnealing] step=" << s << " " << history_.back().reason << "\n";
        }
        return history_.back();
    }

    Evaluation candidate_eval = scorer.evaluate(candidate, true);
    const double temperature = annealer_->temperature(s, iterations_);
    const double delta = candidate_eval.score - current_eval_.score;

    bool accept = delta >= 0.0;
    double accept_prob = 1.0;
    if (!accept) {
        accept_prob = std::exp(delta / std::max(temperature, annealer_->config().min_temp));
        accept = rng.uniform() < accept_prob;
    }

    if (annealer_->config().verbose) {
        std::cout << "[SimulatedAnnealing] step=" << s << " temp=" << temperature
                  << " | score: " << current_eval_.score << "->" << candidate_eval.score
                  << " prob=" << accept_prob << (accept ? " accept" : " reject")
                  << " (" << neighbor_name(op) << ")\n";
    }

    if (accept) {
        ++n_accepted_;
        current_ = std::move(candidate);
        current_eval_ = candidate_eval;
        history_.push_back({s, current_eval_.score, true, std::string(neighbor_name(op))});
        if (current_eval_.score > best_eval_.score) {
            best_ = current_;
            best_eval_ = current_eval_;
        }
    } else {
        ++n_rejected_;
        history_.push_back({s, current_eval_.score, false, "anneal_reject"});
    }
    return history_.back();
}

OptimizationResult AnnealingRun::result() const {
    return OptimizationResult{best_, best_eval_.metrics, best_eval_.score, history_};
}

SimulatedAnnealing::SimulatedAnnealing(
    ConstraintSettings settings,
    const ScoreWeights& weights,
    AnnealingConfig config,
    std::vector<NeighborOperator> operators
)
    : scorer_(std::move(settings), weights)
    , config_(config)
    , operators_(std::move(operators))
{
    if (operators_.empty()) {
        throw ConfigurationError("SimulatedAnnealing requires at least one neighbor operator");
    }
}

double SimulatedAnnealing::temperature(int step, int iterations) const {
    if (iterations <= 0) {
        return config_.initial_temp;
    }
    const double progress = static_cast<double>(step) / static_cast<double>(iterations);
    switch (config_.cooling_schedule) {
        case CoolingSchedule::Geometric:
            return config_.initial_temp * std::pow(config_.final_temp / config_.initial_temp, progress);
        case CoolingSchedule::Linear:
            return config_.initial_temp + (config_.final_temp - config_.initial_temp) * progress;
    }
    return config_.initial_temp;
}

AnnealingRun SimulatedAnnealing::start(const Layout& layout, int iterations) const& {
    return AnnealingRun(*this, layout, iterations);
}

OptimizationResult SimulatedAnnealing::run(const Layout& layout, int iterations, RNG& rng) const {
    AnnealingRun run = start(layout, iterations);
    while (!run.done()) {
        run.step(rng);
    }
    if (config_.verbose) {
        std::cout << "[SimulatedAnnealing] done: best=" << run.best_score()
                  << " accepted=" << run.accepted_count()
                  << " rejected=" << run.rejected_count()
                  << " infeasible=" << run.infeasible_count() << "\n";
    }
    return run.result();
}

OptimizationResult optimize(
    const Layout& layout,
    int iterations,
    const ConstraintSettings& settings,
    const ScoreWeights& weights,
    std::optional<uint64_t> seed
) {
    RNG rng(seed.value_or(layout.metadata.seed.value_or(DEFAULT_SEED)));
    return SimulatedAnnealing(settings, weights).run(layout, iterations, rng);
}

}  // namespace lunar_habitat
