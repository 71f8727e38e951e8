#include "lunar_habitat/constraints/validator.hpp"
#include "lunar_habitat/spatial/zone_graph.hpp"
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace lunar_habitat {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

// Accumulates messages and failed rule ids
class Report {
public:
    void pass(std::string message) {
        result_.messages.push_back(std::move(message));
    }

    void fail(std::string rule, std::string message) {
        result_.failed_rules.push_back(std::move(rule));
        result_.messages.push_back(std::move(message));
    }

    // Returns true if the rule passed
    bool check(bool ok, const char* rule, std::string ok_message, std::string fail_message) {
        if (ok) {
            pass(std::move(ok_message));
        } else {
            fail(rule, std::move(fail_message));
        }
        return ok;
    }

    ValidationResult finish() {
        result_.passed = result_.failed_rules.empty();
        return std::move(result_);
    }

private:
    ValidationResult result_;
};

void check_mission_ranges(const Layout& layout, const ConstraintSettings& s, Report& report) {
    const int crew = layout.metadata.crew;
    const int duration = layout.metadata.duration_days;

    report.check(
        crew >= s.min_crew && crew <= s.max_crew, "crew_range",
        "Crew size " + std::to_string(crew) + " within supported range.",
        "Crew size " + std::to_string(crew) + " outside supported range " +
            std::to_string(s.min_crew) + "-" + std::to_string(s.max_crew) + ".");

    report.check(
        duration >= s.min_duration_days && duration <= s.max_duration_days, "duration_range",
        "Mission duration " + std::to_string(duration) + " days within supported range.",
        "Duration " + std::to_string(duration) + " days outside supported range " +
            std::to_string(s.min_duration_days) + "-" + std::to_string(s.max_duration_days) + ".");
}

void check_required_zones(const Layout& layout, const ConstraintSettings& s, Report& report) {
    std::string missing;
    for (ZoneKind kind : s.required_zones) {
        if (!layout.has_zone(kind)) {
            if (!missing.empty()) missing += ", ";
            missing += to_string(kind);
        }
    }
    report.check(missing.empty(), "required_zones",
                 "All mandatory zones present.",
                 "Missing mandatory zones: " + missing + ".");
}

void check_volume(const Layout& layout, const ConstraintSettings& s, Report& report) {
    const double nhv = layout.net_habitable_volume();
    const double efficiency = layout.nhv_efficiency();
    const double required = layout.metadata.crew * s.min_nhv_per_person;

    report.check(
        nhv >= required, RULE_NHV_PER_CREW,
        "NHV " + fixed(nhv, 1) + " m³ meets per-crew requirement.",
        "NHV " + fixed(nhv, 1) + " m³ below required " + fixed(required, 1) +
            " m³ (add " + fixed(required - nhv, 1) + " m³ usable).");

    report.check(
        efficiency >= s.min_nhv_efficiency, RULE_NHV_EFFICIENCY,
        "NHV efficiency " + fixed(efficiency, 2) + " meets minimum.",
        "NHV efficiency " + fixed(efficiency, 2) + " < " + fixed(s.min_nhv_efficiency, 2) +
            "; consider more usable volume.");
}

void check_systems(const Layout& layout, const ConstraintSettings& s, Report& report) {
    const Systems& sys = layout.systems;

    report.check(
        layout.shield_equivalent_g_cm2 >= s.min_shield_g_cm2, "radiation_shield",
        "Radiation shielding meets requirement.",
        "Shielding " + fixed(layout.shield_equivalent_g_cm2, 1) + " g/cm² < " +
            fixed(s.min_shield_g_cm2, 1) + " g/cm².");

    report.check(
        sys.eclss_redundancy_loops >= s.min_eclss_loops, "eclss_redundancy",
        "ECLSS redundancy satisfied.",
        "ECLSS redundancy below requirement; need >= " + std::to_string(s.min_eclss_loops) +
            " full loops.");

    report.check(
        sys.water_recycling_rate >= s.min_water_recycling, "water_recycling",
        "Water recycling meets specification.",
        "Water recycling " + fixed(sys.water_recycling_rate, 2) + " < " +
            fixed(s.min_water_recycling, 2) + ".");

    report.check(
        sys.power.autonomy_days >= s.min_power_autonomy_days, "power_autonomy",
        "Power autonomy meets lunar night requirement.",
        "Power autonomy " + std::to_string(sys.power.autonomy_days) + " days < " +
            std::to_string(s.min_power_autonomy_days) + " days target.");

    report.check(
        sys.dust_mitigation.dual_door && sys.dust_mitigation.suit_storage, "dust_mitigation",
        "Dust mitigation features verified.",
        "Dust mitigation must include dual-door vestibule and suit storage.");
}

void check_topology(const Layout& layout, const ConstraintSettings& s, const ZoneGraph& graph, Report& report) {
    // Connectivity: every declared zone reached from the first node
    bool connected = false;
    if (graph.empty()) {
        report.fail("connectivity", "No connectivity graph defined across zones.");
    } else {
        auto seen = graph.reachable_from(0);
        connected = true;
        for (const auto& zone : layout.zones) {
            if (!seen[static_cast<size_t>(graph.index_of(zone.name()))]) {
                connected = false;
                break;
            }
        }
        report.check(connected, "connectivity",
                     "Zone adjacency graph is connected.",
                     "Zone adjacency graph is disconnected.");
    }

    // Redundant paths: only meaningful once the graph is connected
    if (connected) {
        report.check(graph.has_cycle(), "redundant_paths",
                     "Redundant paths present in adjacency graph.",
                     "Adjacency graph lacks alternate routes; add redundant connections.");
    }

    for (const auto& [a, b] : s.adjacency_pairs) {
        if (!graph.has_edge(a, b)) {
            report.fail("adjacency_" + a + "_" + b,
                        "Critical adjacency missing between " + a + " and " + b + ".");
        }
    }
}

void check_safety(const Layout& layout, const ConstraintSettings& s, const ZoneGraph& graph, Report& report) {
    report.check(
        layout.egress_count() >= 2, "egress_paths",
        "Multiple egress-capable zones confirmed.",
        "At least two egress-capable zones required (e.g., airlock and shelter exit).");

    const std::string shelter(to_string(ZoneKind::StormShelter));
    if (!layout.has_zone(ZoneKind::StormShelter) || graph.empty()) {
        report.fail("storm_shelter_access", "Storm shelter zone missing or disconnected.");
        return;
    }
    for (const auto& zone : layout.zones) {
        int dist = graph.hop_distance(zone.name(), shelter);
        if (dist < 0 || dist > s.max_storm_shelter_hops) {
            report.fail("storm_shelter_access",
                        "Storm shelter too far from " + std::string(zone.name()) +
                            " (distance " + std::to_string(dist) + ").");
            return;
        }
    }
    report.pass("Storm shelter reachable within required hops.");
}

void check_privacy(const Layout& layout, const ConstraintSettings& s, Report& report) {
    const Zone* quarters = layout.find_zone(ZoneKind::CrewQuarters);
    if (quarters == nullptr) {
        // Absence is already reported by required_zones
        report.pass("Crew quarters zone not defined.");
        return;
    }
    report.check(
        quarters->privacy == PrivacyLevel::High &&
            quarters->acoustic_isolation >= s.min_privacy_quarters,
        "crew_privacy",
        "Crew quarters privacy targets satisfied.",
        "Crew quarters must have High privacy and acoustic isolation >= " +
            fixed(s.min_privacy_quarters, 2) + ".");
}

}  // namespace

ConstraintValidator::ConstraintValidator(ConstraintSettings settings)
    : settings_(std::move(settings))
{}

ValidationResult ConstraintValidator::validate(const Layout& layout) const {
    Report report;
    const ZoneGraph graph = ZoneGraph::from_layout(layout);

    check_mission_ranges(layout, settings_, report);
    check_required_zones(layout, settings_, report);
    check_volume(layout, settings_, report);
    check_systems(layout, settings_, report);
    check_topology(layout, settings_, graph, report);
    check_safety(layout, settings_, graph, report);
    check_privacy(layout, settings_, report);

    return report.finish();
}

ValidationResult validate(const Layout& layout, const ConstraintSettings& settings) {
    return ConstraintValidator(settings).validate(layout);
}

}  // namespace lunar_habitat
