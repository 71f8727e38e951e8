#include <catch2/catch.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include "lunar_habitat/constraints/validator.hpp"
#include "lunar_habitat/generator/generator.hpp"

using namespace lunar_habitat;

namespace {

Layout feasible_layout() {
    GeneratorConfig config;
    config.crew = 4;
    config.duration_days = 90;
    config.pressurized_volume_m3 = 170.0;
    config.seed = 7;
    return generate(config);
}

Zone tree_zone(ZoneKind kind, std::vector<std::string> connections) {
    Zone zone;
    zone.kind = kind;
    zone.volume_m3 = 30.0;
    zone.usable_ratio = 0.9;
    zone.privacy = PrivacyLevel::Medium;
    zone.acoustic_isolation = 0.6;
    zone.connections = std::move(connections);
    return zone;
}

// Five zones joined as a tree rooted at Work:
// Airlock - Work - StormShelter, Work - CrewQuarters - HygieneMedical
Layout spanning_tree_layout() {
    Layout layout;
    layout.habitat_name = "Tree";
    layout.pressurized_volume_m3 = 150.0;
    layout.zones.push_back(tree_zone(ZoneKind::Airlock, {"Work"}));
    layout.zones.push_back(tree_zone(ZoneKind::Work, {"CrewQuarters", "StormShelter"}));
    layout.zones.push_back(tree_zone(ZoneKind::CrewQuarters, {"HygieneMedical"}));
    layout.zones.push_back(tree_zone(ZoneKind::HygieneMedical, {}));
    layout.zones.push_back(tree_zone(ZoneKind::StormShelter, {}));
    layout.zones[0].is_egress = true;
    layout.zones[4].is_egress = true;
    layout.zones[2].privacy = PrivacyLevel::High;
    layout.zones[2].acoustic_isolation = 0.8;
    layout.shield_equivalent_g_cm2 = 6.0;
    layout.isru_ratio = 0.6;
    layout.docking_ports = 1;
    layout.metadata.crew = 4;
    layout.metadata.duration_days = 90;
    return layout;
}

ConstraintSettings tree_settings() {
    ConstraintSettings settings;
    settings.required_zones = {
        ZoneKind::Airlock, ZoneKind::Work, ZoneKind::CrewQuarters,
        ZoneKind::HygieneMedical, ZoneKind::StormShelter
    };
    settings.adjacency_pairs = {{"Airlock", "Work"}, {"CrewQuarters", "HygieneMedical"}};
    return settings;
}

void remove_zone(Layout& layout, ZoneKind kind) {
    layout.zones.erase(
        std::remove_if(layout.zones.begin(), layout.zones.end(),
                       [kind](const Zone& z) { return z.kind == kind; }),
        layout.zones.end());
}

}  // namespace

TEST_CASE("Validator accepts a generated layout", "[validator]") {
    Layout layout = feasible_layout();
    ValidationResult result = validate(layout, ConstraintSettings{});

    REQUIRE(result.passed);
    REQUIRE(result.failed_rules.empty());
    // One message per rule, with no adjacency failures on a passing layout
    REQUIRE(result.messages.size() == 15);
}

TEST_CASE("Validator rules", "[validator]") {
    Layout layout = feasible_layout();
    const ConstraintSettings settings;

    SECTION("Missing Exercise zone fails required_zones") {
        remove_zone(layout, ZoneKind::Exercise);
        ValidationResult result = validate(layout, settings);
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.has_failure("required_zones"));
    }

    SECTION("Removing a required zone does not fail unrelated rules") {
        remove_zone(layout, ZoneKind::Exercise);
        ValidationResult result = validate(layout, settings);
        REQUIRE_FALSE(result.has_failure("crew_range"));
        REQUIRE_FALSE(result.has_failure("radiation_shield"));
        REQUIRE_FALSE(result.has_failure("dust_mitigation"));
        REQUIRE_FALSE(result.has_failure("crew_privacy"));
    }

    SECTION("Crew outside range") {
        layout.metadata.crew = 5;
        ValidationResult result = validate(layout, settings);
        REQUIRE(result.has_failure("crew_range"));
        REQUIRE(result.failed_rules.front() == "crew_range");
    }

    SECTION("Duration outside range") {
        layout.metadata.duration_days = 365;
        REQUIRE(validate(layout, settings).has_failure("duration_range"));
    }

    SECTION("NHV per crew") {
        ConstraintSettings strict = settings;
        strict.min_nhv_per_person = 1000.0;
        ValidationResult result = validate(layout, strict);
        REQUIRE(result.has_failure("nhv_per_crew"));
        REQUIRE_FALSE(result.has_failure("nhv_efficiency"));
    }

    SECTION("NHV efficiency") {
        layout.pressurized_volume_m3 *= 2.0;
        REQUIRE(validate(layout, settings).has_failure("nhv_efficiency"));
    }

    SECTION("Systems thresholds") {
        layout.shield_equivalent_g_cm2 = 4.0;
        layout.systems.eclss_redundancy_loops = 1;
        layout.systems.water_recycling_rate = 0.85;
        layout.systems.power.autonomy_days = 10;
        layout.systems.dust_mitigation.suit_storage = false;
        ValidationResult result = validate(layout, settings);
        std::vector<std::string> expected = {
            "radiation_shield", "eclss_redundancy", "water_recycling",
            "power_autonomy", "dust_mitigation"
        };
        REQUIRE(result.failed_rules == expected);
    }

    SECTION("Disconnected graph") {
        Zone island;
        island.kind = ZoneKind::Agriculture;
        island.volume_m3 = 5.0;
        remove_zone(layout, ZoneKind::Agriculture);
        for (auto& zone : layout.zones) {
            auto& c = zone.connections;
            c.erase(std::remove(c.begin(), c.end(), "Agriculture"), c.end());
        }
        layout.zones.push_back(island);

        ValidationResult result = validate(layout, settings);
        REQUIRE(result.has_failure("connectivity"));
        // Cycle check only runs on a connected graph
        REQUIRE_FALSE(result.has_failure("redundant_paths"));
        REQUIRE(result.has_failure("storm_shelter_access"));
    }

    SECTION("Missing critical adjacency") {
        Zone* airlock = layout.find_zone(ZoneKind::Airlock);
        Zone* work = layout.find_zone(ZoneKind::Work);
        airlock->connections = {"MaintenanceStorage"};
        work->connections.erase(
            std::remove(work->connections.begin(), work->connections.end(), "Airlock"),
            work->connections.end());

        ValidationResult result = validate(layout, settings);
        REQUIRE(result.has_failure("adjacency_Airlock_Work"));
        REQUIRE_FALSE(result.has_failure("adjacency_CrewQuarters_GalleyDining"));
    }

    SECTION("Single egress zone") {
        layout.find_zone(ZoneKind::StormShelter)->is_egress = false;
        REQUIRE(validate(layout, settings).has_failure("egress_paths"));
    }

    SECTION("Missing storm shelter") {
        remove_zone(layout, ZoneKind::StormShelter);
        ValidationResult result = validate(layout, settings);
        REQUIRE(result.has_failure("storm_shelter_access"));
        REQUIRE(result.has_failure("required_zones"));
    }

    SECTION("Storm shelter too many hops away") {
        ConstraintSettings tight = settings;
        tight.max_storm_shelter_hops = 1;
        ValidationResult result = validate(layout, tight);
        REQUIRE(result.has_failure("storm_shelter_access"));
    }

    SECTION("Crew quarters privacy") {
        layout.find_zone(ZoneKind::CrewQuarters)->privacy = PrivacyLevel::Medium;
        REQUIRE(validate(layout, settings).has_failure("crew_privacy"));
    }

    SECTION("Crew quarters acoustic isolation") {
        layout.find_zone(ZoneKind::CrewQuarters)->acoustic_isolation = 0.5;
        REQUIRE(validate(layout, settings).has_failure("crew_privacy"));
    }

    SECTION("Validation never mutates the layout") {
        Layout copy = layout;
        (void)validate(layout, settings);
        REQUIRE(copy == layout);
    }

    SECTION("Deterministic") {
        REQUIRE(validate(layout, settings) == validate(layout, settings));
    }
}

TEST_CASE("Redundant paths", "[validator]") {
    Layout layout = spanning_tree_layout();
    const ConstraintSettings settings = tree_settings();

    SECTION("Spanning tree lacks a cycle") {
        ValidationResult result = validate(layout, settings);
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.failed_rules == std::vector<std::string>{"redundant_paths"});
    }

    SECTION("Closing a loop satisfies every rule") {
        layout.zones[0].connections.push_back("StormShelter");
        ValidationResult result = validate(layout, settings);
        REQUIRE(result.passed);
    }

    SECTION("Validator object matches the free function") {
        ConstraintValidator validator(settings);
        REQUIRE(validator.validate(layout) == validate(layout, settings));
    }
}

TEST_CASE("Empty layout", "[validator]") {
    Layout layout;
    layout.metadata.crew = 3;
    layout.metadata.duration_days = 60;
    ValidationResult result = validate(layout, ConstraintSettings{});

    REQUIRE_FALSE(result.passed);
    REQUIRE(result.has_failure("connectivity"));
    REQUIRE(result.has_failure("storm_shelter_access"));
    REQUIRE(result.has_failure("required_zones"));
    REQUIRE_FALSE(result.has_failure("crew_privacy"));
}
