#include "lunar_habitat/io/schema.hpp"
#include "lunar_habitat/core/layout.hpp"
#include "lunar_habitat/core/settings.hpp"
#include "lunar_habitat/core/types.hpp"
#include <array>
#include <string>
#include <utility>

namespace lunar_habitat {

using nlohmann::json;

namespace {

constexpr const char* SCHEMA_DIALECT = "https://json-schema.org/draft/2020-12/schema";

template <typename Enum, size_t N>
json enum_labels(const std::array<Enum, N>& values) {
    json labels = json::array();
    for (Enum value : values) {
        labels.push_back(std::string(to_string(value)));
    }
    return labels;
}

json number(double minimum) {
    return json{{"type", "number"}, {"minimum", minimum}};
}

json unit_interval() {
    return json{{"type", "number"}, {"minimum", 0.0}, {"maximum", 1.0}};
}

json integer(int minimum) {
    return json{{"type", "integer"}, {"minimum", minimum}};
}

json string_array() {
    return json{{"type", "array"}, {"items", {{"type", "string"}}}};
}

json object(json properties, json required) {
    return json{
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
    };
}

json zone_schema() {
    json usable = {{"type", "number"}, {"exclusiveMinimum", 0.0}, {"maximum", 1.0}};
    json volume = {{"type", "number"}, {"exclusiveMinimum", 0.0}};
    json zone = object(
        {
            {"name", {{"enum", enum_labels(ALL_ZONE_KINDS)}}},
            {"volume_m3", volume},
            {"usable_ratio", usable},
            {"privacy", {{"enum", enum_labels(std::array{
                PrivacyLevel::Low, PrivacyLevel::Medium, PrivacyLevel::High})}}},
            {"connections", string_array()},
            {"acoustic_isolation", unit_interval()},
            {"lighting", {{"enum", enum_labels(std::array{
                LightingProfile::Warm3000K, LightingProfile::Neutral4000K,
                LightingProfile::Cool6500K, LightingProfile::Adaptive})}}},
            {"is_pressurized", {{"type", "boolean"}, {"default", true}}},
            {"is_egress", {{"type", "boolean"}, {"default", false}}},
            {"equipment", string_array()},
        },
        json::array({"name", "volume_m3", "usable_ratio", "privacy", "acoustic_isolation", "lighting"}));
    return zone;
}

json systems_schema() {
    json power = object(
        {
            {"source", {{"type", "string"}}},
            {"autonomy_days", integer(0)},
            {"storage_kwh", number(0.0)},
        },
        json::array({"autonomy_days", "storage_kwh"}));
    json range = {
        {"type", "array"},
        {"items", {{"type", "number"}}},
        {"minItems", 2},
        {"maxItems", 2},
    };
    json thermal = object({{"control", {{"type", "string"}}}, {"range_c", range}}, json::array());
    json comms = object({{"local", {{"type", "boolean"}}}, {"gateway", {{"type", "string"}}}}, json::array());
    json dust = object(
        {
            {"dual_door", {{"type", "boolean"}}},
            {"suit_storage", {{"type", "boolean"}}},
            {"electrostatic", {{"type", "boolean"}, {"default", DustMitigation{}.electrostatic}}},
        },
        json::array({"dual_door", "suit_storage"}));
    return object(
        {
            {"eclss_redundancy_loops", integer(0)},
            {"water_recycling_rate", unit_interval()},
            {"power", power},
            {"thermal", thermal},
            {"comms", comms},
            {"dust_mitigation", dust},
        },
        json::array({"eclss_redundancy_loops", "water_recycling_rate", "power", "dust_mitigation"}));
}

}  // namespace

json layout_schema() {
    json metadata = object(
        {
            {"crew", {{"type", "integer"}}},
            {"duration_days", {{"type", "integer"}}},
            {"seed", {{"type", "integer"}, {"minimum", 0}}},
        },
        json::array({"crew", "duration_days"}));
    metadata["additionalProperties"] = true;

    json schema = object(
        {
            {"habitat_name", {{"type", "string"}}},
            {"habitat_type", {{"enum", enum_labels(std::array{
                HabitatType::Inflatable, HabitatType::Rigid, HabitatType::RegolithHybrid})}}},
            {"pressurized_volume_m3", {{"type", "number"}, {"exclusiveMinimum", 0.0}}},
            {"zones", {{"type", "array"}, {"items", zone_schema()}}},
            {"systems", systems_schema()},
            {"shield_equivalent_g_cm2", number(0.0)},
            {"isru_ratio", unit_interval()},
            {"docking_ports", integer(0)},
            {"metadata", metadata},
        },
        json::array({"habitat_name", "habitat_type", "pressurized_volume_m3", "zones", "systems",
                     "shield_equivalent_g_cm2", "isru_ratio", "docking_ports", "metadata"}));
    schema["$schema"] = SCHEMA_DIALECT;
    schema["title"] = "Layout";
    return schema;
}

json metrics_schema() {
    json schema = object(
        {
            {"nhv_m3", number(0.0)},
            {"nhv_efficiency", number(0.0)},
            {"transit_distance_score", unit_interval()},
            {"privacy_score", unit_interval()},
            {"sustainability_score", unit_interval()},
            {"energy_use_kwh_per_person_day", number(0.0)},
            {"safety_redundancy_score", unit_interval()},
            {"feasibility", {{"type", "boolean"}}},
        },
        json::array({"nhv_m3", "nhv_efficiency", "transit_distance_score", "privacy_score",
                     "sustainability_score", "energy_use_kwh_per_person_day", "safety_redundancy_score",
                     "feasibility"}));
    schema["$schema"] = SCHEMA_DIALECT;
    schema["title"] = "Metrics";
    return schema;
}

json config_schema() {
    // Every key is optional; absent keys keep the generator defaults
    const GeneratorConfig d;
    json schema = object(
        {
            {"crew", {{"type", "integer"}, {"default", d.crew}}},
            {"duration_days", {{"type", "integer"}, {"default", d.duration_days}}},
            {"habitat_type", {{"enum", enum_labels(std::array{
                HabitatType::Inflatable, HabitatType::Rigid, HabitatType::RegolithHybrid})},
                {"default", std::string(to_string(d.habitat_type))}}},
            {"pressurized_volume_m3", {{"type", "number"}, {"exclusiveMinimum", 0.0},
                {"default", d.pressurized_volume_m3}}},
            {"target_isru_ratio", {{"type", "number"}, {"default", d.target_isru_ratio}}},
            {"docking_ports", {{"type", "integer"}, {"minimum", 0}, {"default", d.docking_ports}}},
            {"seed", {{"type", "integer"}, {"minimum", 0}, {"default", d.seed}}},
            {"habitat_name", {{"type", "string"}, {"default", d.habitat_name}}},
        },
        json::array());
    schema["$schema"] = SCHEMA_DIALECT;
    schema["title"] = "GeneratorConfig";
    return schema;
}

}  // namespace lunar_habitat
