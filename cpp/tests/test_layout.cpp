#include <catch2/catch.hpp>
#include <string>
#include "lunar_habitat/core/errors.hpp"
#include "lunar_habitat/core/layout.hpp"
#include "lunar_habitat/core/results.hpp"
#include "lunar_habitat/core/settings.hpp"

using namespace lunar_habitat;
using Catch::Detail::Approx;

namespace {

Zone make_zone(ZoneKind kind, double volume, double usable) {
    Zone zone;
    zone.kind = kind;
    zone.volume_m3 = volume;
    zone.usable_ratio = usable;
    return zone;
}

Layout make_layout() {
    Layout layout;
    layout.habitat_name = "Test";
    layout.pressurized_volume_m3 = 100.0;
    layout.zones.push_back(make_zone(ZoneKind::Work, 60.0, 0.5));
    layout.zones.push_back(make_zone(ZoneKind::Airlock, 40.0, 1.0));
    layout.shield_equivalent_g_cm2 = 6.0;
    layout.isru_ratio = 0.6;
    layout.docking_ports = 2;
    layout.metadata.crew = 4;
    layout.metadata.duration_days = 90;
    return layout;
}

}  // namespace

TEST_CASE("Enum labels", "[layout]") {
    SECTION("Zone kinds round trip") {
        for (ZoneKind kind : ALL_ZONE_KINDS) {
            auto parsed = parse_zone_kind(to_string(kind));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == kind);
        }
    }

    SECTION("Canonical spellings") {
        REQUIRE(to_string(ZoneKind::MaintenanceStorage) == "MaintenanceStorage");
        REQUIRE(to_string(PrivacyLevel::High) == "High");
        REQUIRE(to_string(LightingProfile::Neutral4000K) == "Neutral4000K");
        REQUIRE(to_string(HabitatType::RegolithHybrid) == "RegolithHybrid");
    }

    SECTION("Unknown labels") {
        REQUIRE_FALSE(parse_zone_kind("Garage").has_value());
        REQUIRE_FALSE(parse_zone_kind("airlock").has_value());
        REQUIRE_FALSE(parse_privacy_level("Extreme").has_value());
        REQUIRE_FALSE(parse_lighting_profile("").has_value());
        REQUIRE_FALSE(parse_habitat_type("Tent").has_value());
    }
}

TEST_CASE("Layout volumes", "[layout]") {
    Layout layout = make_layout();

    SECTION("NHV sums usable volume") {
        REQUIRE(layout.zone_volume_sum() == Approx(100.0));
        REQUIRE(layout.net_habitable_volume() == Approx(70.0));
        REQUIRE(layout.nhv_efficiency() == Approx(0.7));
    }

    SECTION("Unpressurized zones excluded from NHV") {
        layout.zones[1].is_pressurized = false;
        REQUIRE(layout.net_habitable_volume() == Approx(30.0));
    }

    SECTION("Zero pressurized volume gives zero efficiency") {
        layout.pressurized_volume_m3 = 0.0;
        REQUIRE(layout.nhv_efficiency() == 0.0);
    }

    SECTION("Zone lookup returns the first match") {
        layout.zones.push_back(make_zone(ZoneKind::Work, 5.0, 1.0));
        const Zone* work = layout.find_zone(ZoneKind::Work);
        REQUIRE(work != nullptr);
        REQUIRE(work->volume_m3 == 60.0);
        REQUIRE_FALSE(layout.has_zone(ZoneKind::StormShelter));
    }

    SECTION("Egress count") {
        REQUIRE(layout.egress_count() == 0);
        layout.zones[1].is_egress = true;
        REQUIRE(layout.egress_count() == 1);
    }

    SECTION("Copies are independent") {
        Layout copy = layout;
        copy.zones[0].volume_m3 = 1.0;
        copy.zones[0].connections.push_back("Airlock");
        REQUIRE(layout.zones[0].volume_m3 == 60.0);
        REQUIRE(layout.zones[0].connections.empty());
        REQUIRE_FALSE(copy == layout);
    }
}

TEST_CASE("Layout invariants", "[layout]") {
    Layout layout = make_layout();

    SECTION("Valid layout passes") {
        REQUIRE_NOTHROW(check_layout(layout));
    }

    SECTION("Non-positive zone volume") {
        layout.zones[0].volume_m3 = 0.0;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
    }

    SECTION("Usable ratio outside (0, 1]") {
        layout.zones[0].usable_ratio = 0.0;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
        layout.zones[0].usable_ratio = 1.2;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
    }

    SECTION("ISRU ratio outside [0, 1]") {
        layout.isru_ratio = 1.5;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
    }

    SECTION("Negative shielding or docking ports") {
        layout.shield_equivalent_g_cm2 = -1.0;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
        layout.shield_equivalent_g_cm2 = 1.0;
        layout.docking_ports = -1;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
    }

    SECTION("ECLSS loops below one") {
        layout.systems.eclss_redundancy_loops = 0;
        REQUIRE_THROWS_AS(check_layout(layout), LayoutFormatError);
    }
}

TEST_CASE("Settings and results", "[layout]") {
    SECTION("Default weights") {
        ScoreWeights w;
        REQUIRE(w.total() == Approx(1.0));
    }

    SECTION("Normalized weights sum to one") {
        ScoreWeights w{2.0, 1.0, 1.0, 2.0, 1.0, 1.0};
        ScoreWeights n = w.normalized();
        REQUIRE(n.total() == Approx(1.0));
        REQUIRE(n.w_volume_eff == Approx(0.25));
        REQUIRE(n.w_privacy == Approx(0.125));
    }

    SECTION("Degenerate weights rejected") {
        ScoreWeights zero{0, 0, 0, 0, 0, 0};
        REQUIRE_THROWS_AS(zero.normalized(), ConfigurationError);
        ScoreWeights negative;
        negative.w_energy = -0.5;
        REQUIRE_THROWS_AS(negative.normalized(), ConfigurationError);
    }

    SECTION("Default constraint settings") {
        ConstraintSettings s;
        REQUIRE(s.required_zones.size() == 8);
        REQUIRE(s.adjacency_pairs.size() == 3);
        REQUIRE(s.max_storm_shelter_hops == 3);
    }

    SECTION("Generation error lists failed rules") {
        GenerationError error({"nhv_per_crew", "nhv_efficiency"});
        REQUIRE(error.failed_rules().size() == 2);
        REQUIRE(std::string(error.what()) ==
                "Initial layout generation failed: [nhv_per_crew, nhv_efficiency]");
    }

    SECTION("Failed rule lookup") {
        ValidationResult result;
        result.passed = false;
        result.failed_rules = {"connectivity"};
        REQUIRE(result.has_failure("connectivity"));
        REQUIRE_FALSE(result.has_failure("egress_paths"));
    }
}
