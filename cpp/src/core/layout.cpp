#include "lunar_habitat/core/layout.hpp"
#include "lunar_habitat/core/errors.hpp"

namespace lunar_habitat {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw LayoutFormatError(message);
    }
}

}  // namespace

const Zone* Layout::find_zone(ZoneKind kind) const {
    for (const auto& zone : zones) {
        if (zone.kind == kind) return &zone;
    }
    return nullptr;
}

Zone* Layout::find_zone(ZoneKind kind) {
    for (auto& zone : zones) {
        if (zone.kind == kind) return &zone;
    }
    return nullptr;
}

double Layout::zone_volume_sum() const {
    double total = 0.0;
    for (const auto& zone : zones) {
        total += zone.volume_m3;
    }
    return total;
}

double Layout::net_habitable_volume() const {
    double nhv = 0.0;
    for (const auto& zone : zones) {
        if (zone.is_pressurized) {
            nhv += zone.usable_volume();
        }
    }
    return nhv;
}

double Layout::nhv_efficiency() const {
    if (pressurized_volume_m3 == 0.0) {
        return 0.0;
    }
    return net_habitable_volume() / pressurized_volume_m3;
}

int Layout::egress_count() const {
    int count = 0;
    for (const auto& zone : zones) {
        if (zone.is_egress) ++count;
    }
    return count;
}

void check_zone(const Zone& zone) {
    const std::string prefix = "zone " + std::string(zone.name()) + ": ";
    require(zone.volume_m3 > 0.0, prefix + "volume_m3 must be > 0");
    require(zone.usable_ratio > 0.0 && zone.usable_ratio <= 1.0, prefix + "usable_ratio must be in (0, 1]");
    require(zone.acoustic_isolation >= 0.0 && zone.acoustic_isolation <= 1.0,
            prefix + "acoustic_isolation must be in [0, 1]");
}

void check_systems(const Systems& systems) {
    require(systems.eclss_redundancy_loops >= 1, "systems: eclss_redundancy_loops must be >= 1");
    require(systems.water_recycling_rate >= 0.0 && systems.water_recycling_rate <= 1.0,
            "systems: water_recycling_rate must be in [0, 1]");
}

void check_layout(const Layout& layout) {
    require(layout.pressurized_volume_m3 > 0.0, "pressurized_volume_m3 must be > 0");
    require(layout.shield_equivalent_g_cm2 >= 0.0, "shield_equivalent_g_cm2 must be >= 0");
    require(layout.isru_ratio >= 0.0 && layout.isru_ratio <= 1.0, "isru_ratio must be in [0, 1]");
    require(layout.docking_ports >= 0, "docking_ports must be >= 0");
    for (const auto& zone : layout.zones) {
        check_zone(zone);
    }
    check_systems(layout.systems);
}

}  // namespace lunar_habitat
