#include "lunar_habitat/generator/generator.hpp"
#include "lunar_habitat/constraints/validator.hpp"
#include "lunar_habitat/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace lunar_habitat {

namespace {

constexpr double MIN_ZONE_VOLUME = 5.0;
constexpr double VOLUME_JITTER = 0.05;

bool only_volume_rules_failed(const ValidationResult& result) {
    if (result.failed_rules.empty()) {
        return false;
    }
    for (const auto& rule : result.failed_rules) {
        if (rule != RULE_NHV_PER_CREW && rule != RULE_NHV_EFFICIENCY) {
            return false;
        }
    }
    return true;
}

bool is_boosted_by_heal(ZoneKind kind) {
    return kind == ZoneKind::CrewQuarters || kind == ZoneKind::GalleyDining ||
           kind == ZoneKind::HygieneMedical || kind == ZoneKind::StormShelter;
}

}  // namespace

LayoutGenerator::LayoutGenerator(ZoneCatalog catalog, bool verbose)
    : catalog_(std::move(catalog))
    , verbose_(verbose)
{}

void LayoutGenerator::check_config(const GeneratorConfig& config, const ConstraintSettings& settings) const {
    if (config.crew < settings.min_crew || config.crew > settings.max_crew) {
        throw ConfigurationError(
            "Config crew " + std::to_string(config.crew) + " outside supported range " +
            std::to_string(settings.min_crew) + "-" + std::to_string(settings.max_crew));
    }
    if (config.duration_days < settings.min_duration_days || config.duration_days > settings.max_duration_days) {
        throw ConfigurationError(
            "Config duration " + std::to_string(config.duration_days) + " days outside supported range " +
            std::to_string(settings.min_duration_days) + "-" + std::to_string(settings.max_duration_days));
    }
    if (!(config.pressurized_volume_m3 > 0.0)) {
        throw ConfigurationError("Config pressurized_volume_m3 must be > 0");
    }
    if (config.docking_ports < 0) {
        throw ConfigurationError("Config docking_ports must be >= 0");
    }
}

Layout LayoutGenerator::generate(
    const GeneratorConfig& config,
    const ConstraintSettings& settings,
    RNG& rng
) const {
    check_config(config, settings);

    const double pressurized = config.pressurized_volume_m3;
    const double crew_scale = std::max(1.0, static_cast<double>(config.crew) / 4.0);

    Layout layout;
    layout.habitat_name = config.habitat_name;
    layout.habitat_type = config.habitat_type;
    layout.pressurized_volume_m3 = pressurized;
    layout.zones.reserve(catalog_.size());

    for (const auto& t : catalog_.templates()) {
        Zone zone;
        zone.kind = t.kind;
        zone.volume_m3 = pressurized * t.volume_fraction / catalog_.fraction_sum();
        if (t.crew_scaled) {
            zone.volume_m3 *= crew_scale;
        }
        zone.usable_ratio = t.usable_ratio;
        zone.privacy = t.privacy;
        zone.connections = t.connections;
        zone.acoustic_isolation = t.acoustic_isolation;
        zone.lighting = t.lighting;
        zone.is_pressurized = true;
        zone.is_egress = t.is_egress;
        zone.equipment = t.equipment;
        layout.zones.push_back(std::move(zone));
    }

    // Jitter then renormalize so zone volumes sum to the target again
    for (auto& zone : layout.zones) {
        double jitter = rng.uniform(-VOLUME_JITTER, VOLUME_JITTER);
        zone.volume_m3 = std::max(zone.volume_m3 * (1.0 + jitter), MIN_ZONE_VOLUME);
    }
    const double total = layout.zone_volume_sum();
    const double scaling = total > 0.0 ? pressurized / total : 1.0;
    for (auto& zone : layout.zones) {
        zone.volume_m3 *= scaling;
    }

    Systems& systems = layout.systems;
    systems.eclss_redundancy_loops = 2;
    systems.water_recycling_rate = 0.92;
    systems.power = PowerSystem{"Solar+Battery", std::max(settings.min_power_autonomy_days, 14), 160.0};
    systems.thermal = ThermalSystem{"heat-pump", -173.0, 127.0};
    systems.comms = CommsSystem{true, "HALO-link"};
    systems.dust_mitigation = DustMitigation{true, true, true};

    layout.shield_equivalent_g_cm2 = std::max(5.5, 5.0 + 0.2 * config.crew);
    layout.isru_ratio = std::clamp(config.target_isru_ratio, 0.5, 1.0);
    layout.docking_ports = config.docking_ports;
    layout.metadata.crew = config.crew;
    layout.metadata.duration_days = config.duration_days;
    layout.metadata.seed = config.seed;

    const ConstraintValidator validator(settings);
    ValidationResult result = validator.validate(layout);
    if (only_volume_rules_failed(result)) {
        heal_volume(layout, settings);
        result = validator.validate(layout);
    }
    if (!result.passed) {
        throw GenerationError(result.failed_rules);
    }
    return layout;
}

void LayoutGenerator::heal_volume(Layout& layout, const ConstraintSettings& settings) const {
    const double needed = layout.metadata.crew * settings.min_nhv_per_person;
    double current = 0.0;
    for (const auto& zone : layout.zones) {
        current += zone.usable_volume();
    }
    const double boost = current > 0.0 ? std::sqrt(needed / current) : 1.1;

    for (auto& zone : layout.zones) {
        if (is_boosted_by_heal(zone.kind)) {
            zone.volume_m3 *= boost;
        }
    }
    layout.pressurized_volume_m3 = layout.zone_volume_sum();

    if (verbose_) {
        std::cout << "[Generator] NHV heal: boost=" << boost
                  << " pressurized=" << layout.pressurized_volume_m3 << "\n";
    }
}

Layout generate(const GeneratorConfig& config, const ConstraintSettings& settings) {
    RNG rng(config.seed);
    return generate(config, settings, rng);
}

Layout generate(const GeneratorConfig& config, const ConstraintSettings& settings, RNG& rng) {
    return LayoutGenerator().generate(config, settings, rng);
}

}  // namespace lunar_habitat
