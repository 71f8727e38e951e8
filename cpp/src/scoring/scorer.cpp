#include "lunar_habitat/scoring/scorer.hpp"
#include "lunar_habitat/spatial/zone_graph.hpp"
#include <algorithm>
#include <utility>

namespace lunar_habitat {

namespace {

constexpr double INFEASIBLE_FACTOR = 0.5;
constexpr double DEFAULT_ENERGY = 10.0;
constexpr double ISRU_REFERENCE = 0.5;

double privacy_weight(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::Low:
            return 0.3;
        case PrivacyLevel::Medium:
            return 0.6;
        case PrivacyLevel::High:
            return 1.0;
    }
    return 0.3;
}

// Acoustic target per kind; negative means no bonus
double acoustic_target(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::CrewQuarters:
            return 0.7;
        case ZoneKind::Exercise:
            return 0.6;
        case ZoneKind::Work:
            return 0.5;
        default:
            return -1.0;
    }
}

// ratio / reference capped at cap; a non-positive reference counts as fully met
double capped_ratio(double value, double reference, double cap) {
    if (reference <= 0.0) {
        return cap;
    }
    return std::min(value / reference, cap);
}

}  // namespace

double transit_score(const Layout& layout, const ConstraintSettings& settings) {
    if (settings.adjacency_pairs.empty()) {
        return 1.0;
    }
    const ZoneGraph graph = ZoneGraph::from_layout(layout);
    int satisfied = 0;
    for (const auto& [a, b] : settings.adjacency_pairs) {
        if (graph.has_edge(a, b)) {
            ++satisfied;
        }
    }
    return static_cast<double>(satisfied) / static_cast<double>(settings.adjacency_pairs.size());
}

double privacy_score(const Layout& layout) {
    if (layout.zones.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& zone : layout.zones) {
        double bonus = 0.0;
        double target = acoustic_target(zone.kind);
        if (target >= 0.0) {
            bonus = std::clamp(zone.acoustic_isolation - target, 0.0, 0.3);
        }
        total += std::clamp(privacy_weight(zone.privacy) + bonus, 0.0, 1.0);
    }
    return total / static_cast<double>(layout.zones.size());
}

double sustainability_score(const Layout& layout, const ConstraintSettings& settings) {
    double water = capped_ratio(layout.systems.water_recycling_rate, settings.min_water_recycling, 1.2);
    double isru = capped_ratio(layout.isru_ratio, ISRU_REFERENCE, 1.2);
    return std::min((water + isru) / 2.0, 1.0);
}

double energy_per_person_day(const Layout& layout) {
    const int crew = layout.metadata.crew;
    const int autonomy = layout.systems.power.autonomy_days;
    if (crew <= 0 || autonomy <= 0) {
        return DEFAULT_ENERGY;
    }
    return layout.systems.power.storage_kwh / static_cast<double>(crew * autonomy);
}

double safety_score(const Layout& layout, const ConstraintSettings& settings) {
    double loops = capped_ratio(layout.systems.eclss_redundancy_loops, settings.min_eclss_loops, 1.5);
    double egress = std::min(layout.egress_count() / 2.0, 1.0);
    double shelter = layout.has_zone(ZoneKind::StormShelter) ? 1.0 : 0.0;
    return std::min((loops + egress + shelter) / 3.0, 1.0);
}

Scorer::Scorer(ConstraintSettings settings, const ScoreWeights& weights)
    : validator_(std::move(settings))
    , weights_(weights.normalized())
{}

Evaluation Scorer::evaluate(const Layout& layout) const {
    return evaluate(layout, validator_.validate(layout).passed);
}

Evaluation Scorer::evaluate(const Layout& layout, bool feasible) const {
    const ConstraintSettings& s = validator_.settings();

    Evaluation eval;
    Metrics& m = eval.metrics;
    m.nhv_m3 = layout.net_habitable_volume();
    m.nhv_efficiency = layout.nhv_efficiency();
    m.transit_distance_score = transit_score(layout, s);
    m.privacy_score = privacy_score(layout);
    m.sustainability_score = sustainability_score(layout, s);
    m.energy_use_kwh_per_person_day = energy_per_person_day(layout);
    m.safety_redundancy_score = safety_score(layout, s);
    m.feasibility = feasible;

    const double volume_term = capped_ratio(m.nhv_efficiency, s.min_nhv_efficiency, 1.2);
    const double energy_term = std::clamp(2.0 / std::max(m.energy_use_kwh_per_person_day, 1e-6), 0.0, 1.0);

    double score = weights_.w_volume_eff * volume_term
                 + weights_.w_privacy * m.privacy_score
                 + weights_.w_transit * m.transit_distance_score
                 + weights_.w_safety * m.safety_redundancy_score
                 + weights_.w_sustain * m.sustainability_score
                 + weights_.w_energy * energy_term;
    if (!feasible) {
        score *= INFEASIBLE_FACTOR;
    }
    eval.score = score;
    return eval;
}

Evaluation evaluate(const Layout& layout, const ConstraintSettings& settings, const ScoreWeights& weights) {
    return Scorer(settings, weights).evaluate(layout);
}

}  // namespace lunar_habitat
