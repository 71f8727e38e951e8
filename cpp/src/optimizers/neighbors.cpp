#include "lunar_habitat/optimizers/neighbors.hpp"
#include <algorithm>

namespace lunar_habitat {

void AdjustZoneVolume::apply(Layout& layout, RNG& rng) const {
    std::vector<Zone*> adjustable;
    adjustable.reserve(layout.zones.size());
    for (auto& zone : layout.zones) {
        if (zone.kind != ZoneKind::Airlock && zone.kind != ZoneKind::StormShelter) {
            adjustable.push_back(&zone);
        }
    }
    if (adjustable.size() < 2) {
        return;
    }
    auto picked = rng.choice(static_cast<int>(adjustable.size()), 2);
    Zone& donor = *adjustable[static_cast<size_t>(picked[0])];
    Zone& receiver = *adjustable[static_cast<size_t>(picked[1])];

    double transfer = donor.volume_m3 * rng.uniform(min_share, max_share);
    donor.volume_m3 = std::max(donor.volume_m3 - transfer, min_volume);
    receiver.volume_m3 += transfer;
    layout.pressurized_volume_m3 = layout.zone_volume_sum();
}

void TuneSystems::apply(Layout& layout, RNG& rng) const {
    Systems& sys = layout.systems;
    sys.water_recycling_rate = std::clamp(
        sys.water_recycling_rate + rng.uniform(water_delta_min, water_delta_max),
        water_min, water_max);
    sys.power.autonomy_days = std::max(
        autonomy_floor,
        sys.power.autonomy_days + rng.randint(autonomy_delta_min, autonomy_delta_max));
    sys.power.storage_kwh = std::max(
        storage_floor,
        sys.power.storage_kwh + rng.uniform(storage_delta_min, storage_delta_max));
}

void AdjustIsru::apply(Layout& layout, RNG& rng) const {
    layout.isru_ratio = std::clamp(
        layout.isru_ratio + rng.uniform(delta_min, delta_max), ratio_min, ratio_max);
}

void AdjustPrivacy::apply(Layout& layout, RNG& rng) const {
    std::vector<Zone*> targets;
    for (auto& zone : layout.zones) {
        if (zone.kind == ZoneKind::Work || zone.kind == ZoneKind::Exercise ||
            zone.kind == ZoneKind::GalleyDining) {
            targets.push_back(&zone);
        }
    }
    if (targets.empty()) {
        return;
    }
    Zone& zone = *targets[static_cast<size_t>(rng.randint(0, static_cast<int>(targets.size()) - 1))];
    zone.acoustic_isolation = std::clamp(
        zone.acoustic_isolation + rng.uniform(delta_min, delta_max), isolation_min, isolation_max);
}

std::vector<NeighborOperator> default_neighbor_operators() {
    return {AdjustZoneVolume{}, TuneSystems{}, AdjustIsru{}, AdjustPrivacy{}};
}

void apply_neighbor(const NeighborOperator& op, Layout& layout, RNG& rng) {
    std::visit([&](const auto& o) { o.apply(layout, rng); }, op);
}

std::string_view neighbor_name(const NeighborOperator& op) {
    return std::visit([](const auto& o) { return o.name; }, op);
}

}  // namespace lunar_habitat
