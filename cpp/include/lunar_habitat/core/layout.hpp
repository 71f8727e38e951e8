#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lunar_habitat {

// Named functional compartment.
// Connections are declared one-directionally and may name zones that do not
// exist in the layout; consumers symmetrize them (see ZoneGraph).
struct Zone {
    ZoneKind kind{ZoneKind::Work};
    double volume_m3{1.0};            // > 0
    double usable_ratio{1.0};         // (0, 1]
    PrivacyLevel privacy{PrivacyLevel::Medium};
    std::vector<std::string> connections;
    double acoustic_isolation{0.5};   // [0, 1]
    LightingProfile lighting{LightingProfile::Neutral4000K};
    bool is_pressurized{true};
    bool is_egress{false};
    std::vector<std::string> equipment;

    [[nodiscard]] std::string_view name() const { return to_string(kind); }
    [[nodiscard]] double usable_volume() const { return volume_m3 * usable_ratio; }

    bool operator==(const Zone&) const = default;
};

struct PowerSystem {
    std::string source{"Solar+Battery"};
    int autonomy_days{14};
    double storage_kwh{160.0};

    bool operator==(const PowerSystem&) const = default;
};

struct ThermalSystem {
    std::string control{"heat-pump"};
    double range_min_c{-173.0};
    double range_max_c{127.0};

    bool operator==(const ThermalSystem&) const = default;
};

struct CommsSystem {
    bool local{true};
    std::string gateway{"HALO-link"};

    bool operator==(const CommsSystem&) const = default;
};

struct DustMitigation {
    bool dual_door{true};
    bool suit_storage{true};
    bool electrostatic{true};

    bool operator==(const DustMitigation&) const = default;
};

// Habitat-wide subsystem summary
struct Systems {
    int eclss_redundancy_loops{2};    // >= 1
    double water_recycling_rate{0.92};  // [0, 1]
    PowerSystem power;
    ThermalSystem thermal;
    CommsSystem comms;
    DustMitigation dust_mitigation;

    bool operator==(const Systems&) const = default;
};

struct LayoutMetadata {
    int crew{0};
    int duration_days{0};
    std::optional<uint64_t> seed;
    std::map<std::string, nlohmann::json> extra;  // any other keys, values as parsed

    bool operator==(const LayoutMetadata&) const = default;
};

// Aggregate root. Value semantics: copying a Layout is a deep copy, so a
// candidate can be mutated and dropped without touching its source.
struct Layout {
    std::string habitat_name;
    HabitatType habitat_type{HabitatType::Inflatable};
    double pressurized_volume_m3{0.0};
    std::vector<Zone> zones;
    Systems systems;
    double shield_equivalent_g_cm2{0.0};  // >= 0
    double isru_ratio{0.0};               // [0, 1]
    int docking_ports{0};                 // >= 0
    LayoutMetadata metadata;

    // First zone of the given kind (nullptr if absent)
    [[nodiscard]] const Zone* find_zone(ZoneKind kind) const;
    [[nodiscard]] Zone* find_zone(ZoneKind kind);
    [[nodiscard]] bool has_zone(ZoneKind kind) const { return find_zone(kind) != nullptr; }

    // Sum of all zone volumes
    [[nodiscard]] double zone_volume_sum() const;

    // NHV: sum of volume * usable_ratio over pressurized zones
    [[nodiscard]] double net_habitable_volume() const;

    // NHV / pressurized volume (0 when the volume is 0)
    [[nodiscard]] double nhv_efficiency() const;

    [[nodiscard]] int egress_count() const;

    bool operator==(const Layout&) const = default;
};

// Enforce the declarative field invariants; throws LayoutFormatError
void check_zone(const Zone& zone);
void check_systems(const Systems& systems);
void check_layout(const Layout& layout);

}  // namespace lunar_habitat
