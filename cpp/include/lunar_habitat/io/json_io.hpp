#pragma once

#include "../core/layout.hpp"
#include "../core/results.hpp"
#include "../core/settings.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lunar_habitat {

// nlohmann::json conversions (found by ADL).
// Layout-side from_json is strict: missing required fields, wrong types and
// unknown enum labels raise LayoutFormatError. Settings, weights and
// generator config keep their defaults for absent keys.
void to_json(nlohmann::json& j, const Zone& zone);
void from_json(const nlohmann::json& j, Zone& zone);
void to_json(nlohmann::json& j, const Systems& systems);
void from_json(const nlohmann::json& j, Systems& systems);
void to_json(nlohmann::json& j, const LayoutMetadata& metadata);
void from_json(const nlohmann::json& j, LayoutMetadata& metadata);
void to_json(nlohmann::json& j, const Layout& layout);
void from_json(const nlohmann::json& j, Layout& layout);

void to_json(nlohmann::json& j, const Metrics& metrics);
void from_json(const nlohmann::json& j, Metrics& metrics);
void to_json(nlohmann::json& j, const ValidationResult& result);
void from_json(const nlohmann::json& j, ValidationResult& result);
void to_json(nlohmann::json& j, const OptimizationLogEntry& entry);
void from_json(const nlohmann::json& j, OptimizationLogEntry& entry);
void to_json(nlohmann::json& j, const OptimizationResult& result);
void from_json(const nlohmann::json& j, OptimizationResult& result);

void to_json(nlohmann::json& j, const ConstraintSettings& settings);
void from_json(const nlohmann::json& j, ConstraintSettings& settings);
void to_json(nlohmann::json& j, const ScoreWeights& weights);
void from_json(const nlohmann::json& j, ScoreWeights& weights);
void to_json(nlohmann::json& j, const GeneratorConfig& config);
void from_json(const nlohmann::json& j, GeneratorConfig& config);

// Parse and check a layout document; throws LayoutFormatError
[[nodiscard]] Layout layout_from_json(const nlohmann::json& j);
[[nodiscard]] Layout layout_from_string(const std::string& text);
[[nodiscard]] std::string layout_to_string(const Layout& layout, int indent = 2);

// File helpers (std::runtime_error on I/O failure)
[[nodiscard]] nlohmann::json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const nlohmann::json& j, int indent = 2);

[[nodiscard]] Layout load_layout(const std::string& path);
void save_layout(const Layout& layout, const std::string& path);

// Throw ConfigurationError on malformed content
[[nodiscard]] GeneratorConfig load_config(const std::string& path);
[[nodiscard]] ScoreWeights load_weights(const std::string& path);
[[nodiscard]] ConstraintSettings load_settings(const std::string& path);

}  // namespace lunar_habitat
