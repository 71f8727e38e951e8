#pragma once

#include "layout.hpp"
#include <string>
#include <vector>

namespace lunar_habitat {

// Calculated performance metrics for a layout
struct Metrics {
    double nhv_m3{0.0};
    double nhv_efficiency{0.0};
    double transit_distance_score{0.0};
    double privacy_score{0.0};
    double sustainability_score{0.0};
    double energy_use_kwh_per_person_day{0.0};  // lower is better
    double safety_redundancy_score{0.0};
    bool feasibility{false};

    bool operator==(const Metrics&) const = default;
};

// Metrics plus the weighted scalar objective
struct Evaluation {
    Metrics metrics;
    double score{0.0};
};

// Outcome of the hard-constraint checks.
// One message per rule; failed_rules holds stable ids in encounter order.
struct ValidationResult {
    bool passed{true};
    std::vector<std::string> messages;
    std::vector<std::string> failed_rules;

    [[nodiscard]] bool has_failure(const std::string& rule) const;

    bool operator==(const ValidationResult&) const = default;
};

// One optimizer iteration
struct OptimizationLogEntry {
    int iteration{0};
    double score{0.0};
    bool accepted{false};
    std::string reason;

    bool operator==(const OptimizationLogEntry&) const = default;
};

struct OptimizationResult {
    Layout layout;
    Metrics metrics;
    double score{0.0};
    std::vector<OptimizationLogEntry> history;

    bool operator==(const OptimizationResult&) const = default;
};

}  // namespace lunar_habitat
