#pragma once

#include "../core/layout.hpp"
#include "../core/results.hpp"
#include "../core/settings.hpp"

namespace lunar_habitat {

// Hard-constraint validator.
//
// Evaluates every mission rule independently against a layout and reports
// one message per rule. Rule violations are returned as data, never thrown.
//
// Stable rule ids, in evaluation order:
//   crew_range, duration_range, required_zones, nhv_per_crew, nhv_efficiency,
//   radiation_shield, eclss_redundancy, water_recycling, power_autonomy,
//   dust_mitigation, connectivity, redundant_paths, adjacency_<A>_<B>,
//   egress_paths, storm_shelter_access, crew_privacy
class ConstraintValidator {
public:
    explicit ConstraintValidator(ConstraintSettings settings = {});

    [[nodiscard]] ValidationResult validate(const Layout& layout) const;

    [[nodiscard]] const ConstraintSettings& settings() const { return settings_; }

private:
    ConstraintSettings settings_;
};

// Pure, deterministic; never mutates the layout
[[nodiscard]] ValidationResult validate(const Layout& layout, const ConstraintSettings& settings);

// Rule ids for the two NHV checks (used by the generator's self-heal pass)
inline constexpr const char* RULE_NHV_PER_CREW = "nhv_per_crew";
inline constexpr const char* RULE_NHV_EFFICIENCY = "nhv_efficiency";

}  // namespace lunar_habitat
