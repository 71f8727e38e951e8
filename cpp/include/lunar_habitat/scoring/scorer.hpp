#pragma once

#include "../constraints/validator.hpp"
#include "../core/layout.hpp"
#include "../core/results.hpp"
#include "../core/settings.hpp"

namespace lunar_habitat {

// Multi-objective scorer.
//
// The scalar score is the normalized-weight sum of
//   min(nhv_efficiency / min_nhv_efficiency, 1.2), privacy, transit,
//   safety, sustainability and clamp(2 / energy, 0, 1).
// Infeasible layouts are scored at half value.
class Scorer {
public:
    // Throws ConfigurationError if the weights cannot be normalized
    Scorer(ConstraintSettings settings, const ScoreWeights& weights);

    [[nodiscard]] Evaluation evaluate(const Layout& layout) const;

    // Same as evaluate() with the feasibility verdict supplied by the caller
    [[nodiscard]] Evaluation evaluate(const Layout& layout, bool feasible) const;

    [[nodiscard]] const ConstraintValidator& validator() const { return validator_; }
    [[nodiscard]] const ScoreWeights& weights() const { return weights_; }

private:
    ConstraintValidator validator_;
    ScoreWeights weights_;  // normalized
};

// Sub-scores, each in [0, 1] except energy (kWh per person-day)
[[nodiscard]] double transit_score(const Layout& layout, const ConstraintSettings& settings);
[[nodiscard]] double privacy_score(const Layout& layout);
[[nodiscard]] double sustainability_score(const Layout& layout, const ConstraintSettings& settings);
[[nodiscard]] double energy_per_person_day(const Layout& layout);
[[nodiscard]] double safety_score(const Layout& layout, const ConstraintSettings& settings);

// Entry point: metrics plus weighted score
[[nodiscard]] Evaluation evaluate(
    const Layout& layout,
    const ConstraintSettings& settings = {},
    const ScoreWeights& weights = {}
);

}  // namespace lunar_habitat
