#pragma once

#include "../core/layout.hpp"
#include "../core/results.hpp"
#include <string>
#include <vector>

namespace lunar_habitat {

// Markdown habitat summary: overview, zone table, systems, metrics and the
// validation messages (marked as met or warning).
[[nodiscard]] std::string export_markdown(
    const Layout& layout,
    const Metrics& metrics,
    const std::vector<std::string>& validation_messages
);

// "Metric,Value" rows in Metrics field order
[[nodiscard]] std::string export_metrics_csv(const Metrics& metrics);

// True when a validation message reports a satisfied rule
[[nodiscard]] bool is_passing_message(const std::string& message);

}  // namespace lunar_habitat
