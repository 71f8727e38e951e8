#pragma once

#include <nlohmann/json.hpp>

namespace lunar_habitat {

// JSON Schema descriptions of the interchange documents.
// Field names, types and enum labels match what json_io reads and writes.
[[nodiscard]] nlohmann::json layout_schema();
[[nodiscard]] nlohmann::json metrics_schema();
[[nodiscard]] nlohmann::json config_schema();

}  // namespace lunar_habitat
