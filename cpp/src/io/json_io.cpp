#include "lunar_habitat/io/json_io.hpp"
#include "lunar_habitat/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lunar_habitat {

using nlohmann::json;

namespace {

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw LayoutFormatError(where + ": expected an object");
    }
}

template <typename T>
T required(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw LayoutFormatError(where + ": missing field '" + key + "'");
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw LayoutFormatError(where + ": field '" + key + "' has wrong type (" + e.what() + ")");
    }
}

template <typename T>
T optional_field(const json& j, const char* key, const T& fallback, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw LayoutFormatError(where + ": field '" + key + "' has wrong type (" + e.what() + ")");
    }
}

template <typename Enum, typename Parser>
Enum required_enum(const json& j, const char* key, const std::string& where, Parser parse) {
    const auto label = required<std::string>(j, key, where);
    auto value = parse(label);
    if (!value) {
        throw LayoutFormatError(where + ": unknown " + key + " '" + label + "'");
    }
    return *value;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

// Zone

void to_json(json& j, const Zone& zone) {
    j = json{
        {"name", std::string(to_string(zone.kind))},
        {"volume_m3", zone.volume_m3},
        {"usable_ratio", zone.usable_ratio},
        {"privacy", std::string(to_string(zone.privacy))},
        {"connections", zone.connections},
        {"acoustic_isolation", zone.acoustic_isolation},
        {"lighting", std::string(to_string(zone.lighting))},
        {"is_pressurized", zone.is_pressurized},
        {"is_egress", zone.is_egress},
        {"equipment", zone.equipment},
    };
}

void from_json(const json& j, Zone& zone) {
    require_object(j, "zone");
    zone.kind = required_enum<ZoneKind>(j, "name", "zone", parse_zone_kind);
    const std::string where = "zone " + std::string(zone.name());
    zone.volume_m3 = required<double>(j, "volume_m3", where);
    zone.usable_ratio = required<double>(j, "usable_ratio", where);
    zone.privacy = required_enum<PrivacyLevel>(j, "privacy", where, parse_privacy_level);
    zone.connections.clear();
    for (const auto& name : optional_field<std::vector<std::string>>(j, "connections", {}, where)) {
        zone.connections.push_back(trim(name));
    }
    zone.acoustic_isolation = required<double>(j, "acoustic_isolation", where);
    zone.lighting = required_enum<LightingProfile>(j, "lighting", where, parse_lighting_profile);
    zone.is_pressurized = optional_field<bool>(j, "is_pressurized", true, where);
    zone.is_egress = optional_field<bool>(j, "is_egress", false, where);
    zone.equipment = optional_field<std::vector<std::string>>(j, "equipment", {}, where);
}

// Systems

void to_json(json& j, const Systems& systems) {
    j = json{
        {"eclss_redundancy_loops", systems.eclss_redundancy_loops},
        {"water_recycling_rate", systems.water_recycling_rate},
        {"power", {
            {"source", systems.power.source},
            {"autonomy_days", systems.power.autonomy_days},
            {"storage_kwh", systems.power.storage_kwh},
        }},
        {"thermal", {
            {"control", systems.thermal.control},
            {"range_c", {systems.thermal.range_min_c, systems.thermal.range_max_c}},
        }},
        {"comms", {
            {"local", systems.comms.local},
            {"gateway", systems.comms.gateway},
        }},
        {"dust_mitigation", {
            {"dual_door", systems.dust_mitigation.dual_door},
            {"suit_storage", systems.dust_mitigation.suit_storage},
            {"electrostatic", systems.dust_mitigation.electrostatic},
        }},
    };
}

void from_json(const json& j, Systems& systems) {
    require_object(j, "systems");
    systems.eclss_redundancy_loops = required<int>(j, "eclss_redundancy_loops", "systems");
    systems.water_recycling_rate = required<double>(j, "water_recycling_rate", "systems");

    const auto power = required<json>(j, "power", "systems");
    require_object(power, "systems.power");
    systems.power.source = optional_field<std::string>(power, "source", PowerSystem{}.source, "systems.power");
    systems.power.autonomy_days = required<int>(power, "autonomy_days", "systems.power");
    systems.power.storage_kwh = required<double>(power, "storage_kwh", "systems.power");

    const auto thermal = optional_field<json>(j, "thermal", json::object(), "systems");
    require_object(thermal, "systems.thermal");
    systems.thermal = ThermalSystem{};
    systems.thermal.control = optional_field<std::string>(thermal, "control", systems.thermal.control, "systems.thermal");
    if (thermal.contains("range_c")) {
        const auto range = optional_field<std::vector<double>>(thermal, "range_c", {}, "systems.thermal");
        if (range.size() != 2) {
            throw LayoutFormatError("systems.thermal: range_c must hold [min, max]");
        }
        systems.thermal.range_min_c = range[0];
        systems.thermal.range_max_c = range[1];
    }

    const auto comms = optional_field<json>(j, "comms", json::object(), "systems");
    require_object(comms, "systems.comms");
    systems.comms.local = optional_field<bool>(comms, "local", CommsSystem{}.local, "systems.comms");
    systems.comms.gateway = optional_field<std::string>(comms, "gateway", CommsSystem{}.gateway, "systems.comms");

    const auto dust = required<json>(j, "dust_mitigation", "systems");
    require_object(dust, "systems.dust_mitigation");
    systems.dust_mitigation.dual_door = required<bool>(dust, "dual_door", "systems.dust_mitigation");
    systems.dust_mitigation.suit_storage = required<bool>(dust, "suit_storage", "systems.dust_mitigation");
    systems.dust_mitigation.electrostatic = optional_field<bool>(dust, "electrostatic", DustMitigation{}.electrostatic, "systems.dust_mitigation");
}

// Metadata: crew and duration_days required, seed optional, other keys kept as-is

void to_json(json& j, const LayoutMetadata& metadata) {
    j = json::object();
    for (const auto& [key, value] : metadata.extra) {
        j[key] = value;
    }
    j["crew"] = metadata.crew;
    j["duration_days"] = metadata.duration_days;
    if (metadata.seed) {
        j["seed"] = *metadata.seed;
    }
}

void from_json(const json& j, LayoutMetadata& metadata) {
    require_object(j, "metadata");
    metadata.crew = required<int>(j, "crew", "metadata");
    metadata.duration_days = required<int>(j, "duration_days", "metadata");
    metadata.seed.reset();
    if (j.contains("seed") && !j.at("seed").is_null()) {
        metadata.seed = required<uint64_t>(j, "seed", "metadata");
    }
    metadata.extra.clear();
    for (const auto& [key, value] : j.items()) {
        if (key == "crew" || key == "duration_days" || key == "seed") {
            continue;
        }
        metadata.extra[key] = value;
    }
}

// Layout

void to_json(json& j, const Layout& layout) {
    j = json{
        {"habitat_name", layout.habitat_name},
        {"habitat_type", std::string(to_string(layout.habitat_type))},
        {"pressurized_volume_m3", layout.pressurized_volume_m3},
        {"zones", layout.zones},
        {"systems", layout.systems},
        {"shield_equivalent_g_cm2", layout.shield_equivalent_g_cm2},
        {"isru_ratio", layout.isru_ratio},
        {"docking_ports", layout.docking_ports},
        {"metadata", layout.metadata},
    };
}

void from_json(const json& j, Layout& layout) {
    require_object(j, "layout");
    layout.habitat_name = required<std::string>(j, "habitat_name", "layout");
    layout.habitat_type = required_enum<HabitatType>(j, "habitat_type", "layout", parse_habitat_type);
    layout.pressurized_volume_m3 = required<double>(j, "pressurized_volume_m3", "layout");
    const auto zones = required<json>(j, "zones", "layout");
    if (!zones.is_array()) {
        throw LayoutFormatError("layout: zones must be an array");
    }
    layout.zones.clear();
    for (const auto& z : zones) {
        layout.zones.push_back(z.get<Zone>());
    }
    layout.systems = required<json>(j, "systems", "layout").get<Systems>();
    layout.shield_equivalent_g_cm2 = required<double>(j, "shield_equivalent_g_cm2", "layout");
    layout.isru_ratio = required<double>(j, "isru_ratio", "layout");
    layout.docking_ports = required<int>(j, "docking_ports", "layout");
    layout.metadata = required<json>(j, "metadata", "layout").get<LayoutMetadata>();
}

// Results

void to_json(json& j, const Metrics& m) {
    j = json{
        {"nhv_m3", m.nhv_m3},
        {"nhv_efficiency", m.nhv_efficiency},
        {"transit_distance_score", m.transit_distance_score},
        {"privacy_score", m.privacy_score},
        {"sustainability_score", m.sustainability_score},
        {"energy_use_kwh_per_person_day", m.energy_use_kwh_per_person_day},
        {"safety_redundancy_score", m.safety_redundancy_score},
        {"feasibility", m.feasibility},
    };
}

void from_json(const json& j, Metrics& m) {
    require_object(j, "metrics");
    m.nhv_m3 = required<double>(j, "nhv_m3", "metrics");
    m.nhv_efficiency = required<double>(j, "nhv_efficiency", "metrics");
    m.transit_distance_score = required<double>(j, "transit_distance_score", "metrics");
    m.privacy_score = required<double>(j, "privacy_score", "metrics");
    m.sustainability_score = required<double>(j, "sustainability_score", "metrics");
    m.energy_use_kwh_per_person_day = required<double>(j, "energy_use_kwh_per_person_day", "metrics");
    m.safety_redundancy_score = required<double>(j, "safety_redundancy_score", "metrics");
    m.feasibility = required<bool>(j, "feasibility", "metrics");
}

void to_json(json& j, const ValidationResult& result) {
    j = json{
        {"passed", result.passed},
        {"messages", result.messages},
        {"failed_rules", result.failed_rules},
    };
}

void from_json(const json& j, ValidationResult& result) {
    require_object(j, "validation");
    result.passed = required<bool>(j, "passed", "validation");
    result.messages = required<std::vector<std::string>>(j, "messages", "validation");
    result.failed_rules = optional_field<std::vector<std::string>>(j, "failed_rules", {}, "validation");
}

void to_json(json& j, const OptimizationLogEntry& entry) {
    j = json{
        {"iteration", entry.iteration},
        {"score", entry.score},
        {"accepted", entry.accepted},
        {"reason", entry.reason},
    };
}

void from_json(const json& j, OptimizationLogEntry& entry) {
    require_object(j, "history entry");
    entry.iteration = required<int>(j, "iteration", "history entry");
    entry.score = required<double>(j, "score", "history entry");
    entry.accepted = required<bool>(j, "accepted", "history entry");
    entry.reason = required<std::string>(j, "reason", "history entry");
}

void to_json(json& j, const OptimizationResult& result) {
    j = json{
        {"layout", result.layout},
        {"metrics", result.metrics},
        {"score", result.score},
        {"history", result.history},
    };
}

void from_json(const json& j, OptimizationResult& result) {
    require_object(j, "optimization result");
    result.layout = layout_from_json(required<json>(j, "layout", "optimization result"));
    result.metrics = required<json>(j, "metrics", "optimization result").get<Metrics>();
    result.score = required<double>(j, "score", "optimization result");
    result.history = required<json>(j, "history", "optimization result").get<std::vector<OptimizationLogEntry>>();
}

// Configuration

void to_json(json& j, const ConstraintSettings& s) {
    json required_zones = json::array();
    for (ZoneKind kind : s.required_zones) {
        required_zones.push_back(std::string(to_string(kind)));
    }
    json pairs = json::array();
    for (const auto& [a, b] : s.adjacency_pairs) {
        pairs.push_back(json::array({a, b}));
    }
    j = json{
        {"min_crew", s.min_crew},
        {"max_crew", s.max_crew},
        {"min_duration_days", s.min_duration_days},
        {"max_duration_days", s.max_duration_days},
        {"min_nhv_per_person", s.min_nhv_per_person},
        {"min_nhv_efficiency", s.min_nhv_efficiency},
        {"min_shield_g_cm2", s.min_shield_g_cm2},
        {"min_eclss_loops", s.min_eclss_loops},
        {"min_water_recycling", s.min_water_recycling},
        {"min_power_autonomy_days", s.min_power_autonomy_days},
        {"min_privacy_quarters", s.min_privacy_quarters},
        {"required_zones", required_zones},
        {"adjacency_pairs", pairs},
        {"max_storm_shelter_hops", s.max_storm_shelter_hops},
    };
}

void from_json(const json& j, ConstraintSettings& s) {
    const ConstraintSettings d;
    s.min_crew = j.value("min_crew", d.min_crew);
    s.max_crew = j.value("max_crew", d.max_crew);
    s.min_duration_days = j.value("min_duration_days", d.min_duration_days);
    s.max_duration_days = j.value("max_duration_days", d.max_duration_days);
    s.min_nhv_per_person = j.value("min_nhv_per_person", d.min_nhv_per_person);
    s.min_nhv_efficiency = j.value("min_nhv_efficiency", d.min_nhv_efficiency);
    s.min_shield_g_cm2 = j.value("min_shield_g_cm2", d.min_shield_g_cm2);
    s.min_eclss_loops = j.value("min_eclss_loops", d.min_eclss_loops);
    s.min_water_recycling = j.value("min_water_recycling", d.min_water_recycling);
    s.min_power_autonomy_days = j.value("min_power_autonomy_days", d.min_power_autonomy_days);
    s.min_privacy_quarters = j.value("min_privacy_quarters", d.min_privacy_quarters);
    s.max_storm_shelter_hops = j.value("max_storm_shelter_hops", d.max_storm_shelter_hops);

    s.required_zones = d.required_zones;
    if (j.contains("required_zones")) {
        s.required_zones.clear();
        for (const auto& label : j.at("required_zones").get<std::vector<std::string>>()) {
            auto kind = parse_zone_kind(label);
            if (!kind) {
                throw ConfigurationError("settings: unknown zone '" + label + "' in required_zones");
            }
            s.required_zones.push_back(*kind);
        }
    }
    s.adjacency_pairs = d.adjacency_pairs;
    if (j.contains("adjacency_pairs")) {
        s.adjacency_pairs.clear();
        for (const auto& pair : j.at("adjacency_pairs")) {
            auto names = pair.get<std::vector<std::string>>();
            if (names.size() != 2) {
                throw ConfigurationError("settings: adjacency pairs must hold exactly two zone names");
            }
            s.adjacency_pairs.emplace_back(names[0], names[1]);
        }
    }
}

void to_json(json& j, const ScoreWeights& w) {
    j = json{
        {"w_volume_eff", w.w_volume_eff},
        {"w_privacy", w.w_privacy},
        {"w_transit", w.w_transit},
        {"w_safety", w.w_safety},
        {"w_sustain", w.w_sustain},
        {"w_energy", w.w_energy},
    };
}

void from_json(const json& j, ScoreWeights& w) {
    const ScoreWeights d;
    w.w_volume_eff = j.value("w_volume_eff", d.w_volume_eff);
    w.w_privacy = j.value("w_privacy", d.w_privacy);
    w.w_transit = j.value("w_transit", d.w_transit);
    w.w_safety = j.value("w_safety", d.w_safety);
    w.w_sustain = j.value("w_sustain", d.w_sustain);
    w.w_energy = j.value("w_energy", d.w_energy);
}

void to_json(json& j, const GeneratorConfig& c) {
    j = json{
        {"crew", c.crew},
        {"duration_days", c.duration_days},
        {"habitat_type", std::string(to_string(c.habitat_type))},
        {"pressurized_volume_m3", c.pressurized_volume_m3},
        {"target_isru_ratio", c.target_isru_ratio},
        {"docking_ports", c.docking_ports},
        {"seed", c.seed},
        {"habitat_name", c.habitat_name},
    };
}

void from_json(const json& j, GeneratorConfig& c) {
    const GeneratorConfig d;
    c.crew = j.value("crew", d.crew);
    c.duration_days = j.value("duration_days", d.duration_days);
    c.habitat_type = d.habitat_type;
    if (j.contains("habitat_type")) {
        const auto label = j.at("habitat_type").get<std::string>();
        auto type = parse_habitat_type(label);
        if (!type) {
            throw ConfigurationError("config: unknown habitat_type '" + label + "'");
        }
        c.habitat_type = *type;
    }
    c.pressurized_volume_m3 = j.value("pressurized_volume_m3", d.pressurized_volume_m3);
    c.target_isru_ratio = j.value("target_isru_ratio", d.target_isru_ratio);
    c.docking_ports = j.value("docking_ports", d.docking_ports);
    c.seed = j.value("seed", d.seed);
    c.habitat_name = j.value("habitat_name", d.habitat_name);
}

// Documents and files

Layout layout_from_json(const json& j) {
    Layout layout;
    try {
        layout = j.get<Layout>();
    } catch (const json::exception& e) {
        throw LayoutFormatError(std::string("Layout document invalid: ") + e.what());
    }
    check_layout(layout);
    return layout;
}

Layout layout_from_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw LayoutFormatError(std::string("Layout document is not valid JSON: ") + e.what());
    }
    return layout_from_json(j);
}

std::string layout_to_string(const Layout& layout, int indent) {
    return json(layout).dump(indent);
}

json read_json_file(const std::string& path) {
    const std::string text = slurp(path);
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

void write_json_file(const std::string& path, const json& j, int indent) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write file: " + path);
    }
    out << j.dump(indent) << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}

Layout load_layout(const std::string& path) {
    return layout_from_string(slurp(path));
}

void save_layout(const Layout& layout, const std::string& path) {
    write_json_file(path, json(layout));
}

GeneratorConfig load_config(const std::string& path) {
    const json j = read_json_file(path);
    try {
        return j.get<GeneratorConfig>();
    } catch (const json::exception& e) {
        throw ConfigurationError("Config file " + path + " invalid: " + e.what());
    }
}

ScoreWeights load_weights(const std::string& path) {
    const json j = read_json_file(path);
    try {
        return j.get<ScoreWeights>();
    } catch (const json::exception& e) {
        throw ConfigurationError("Weights file " + path + " invalid: " + e.what());
    }
}

ConstraintSettings load_settings(const std::string& path) {
    const json j = read_json_file(path);
    try {
        return j.get<ConstraintSettings>();
    } catch (const json::exception& e) {
        throw ConfigurationError("Settings file " + path + " invalid: " + e.what());
    }
}

}  // namespace lunar_habitat
