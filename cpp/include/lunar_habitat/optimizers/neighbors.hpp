#pragma once

#include "../core/layout.hpp"
#include "../random/rng.hpp"
#include <string_view>
#include <variant>
#include <vector>

namespace lunar_habitat {

// Neighbor operators: small randomized mutations applied in place to a
// candidate copy. Each kind carries its own parameters and mutation logic.

// Move donor.volume * U(min_share, max_share) between two distinct zones
// (Airlock and StormShelter excluded); donor floored at min_volume.
struct AdjustZoneVolume {
    static constexpr std::string_view name = "adjust_zone_volume";
    double min_share{0.02};
    double max_share{0.06};
    double min_volume{5.0};

    void apply(Layout& layout, RNG& rng) const;
};

// Perturb water recycling, power autonomy and storage
struct TuneSystems {
    static constexpr std::string_view name = "tune_systems";
    double water_delta_min{-0.02};
    double water_delta_max{0.03};
    double water_min{0.90};
    double water_max{0.99};
    int autonomy_delta_min{-1};
    int autonomy_delta_max{2};
    int autonomy_floor{14};
    double storage_delta_min{-10.0};
    double storage_delta_max{15.0};
    double storage_floor{120.0};

    void apply(Layout& layout, RNG& rng) const;
};

// Perturb the ISRU ratio
struct AdjustIsru {
    static constexpr std::string_view name = "adjust_isru";
    double delta_min{-0.05};
    double delta_max{0.08};
    double ratio_min{0.4};
    double ratio_max{1.0};

    void apply(Layout& layout, RNG& rng) const;
};

// Perturb acoustic isolation of one Work, Exercise or GalleyDining zone
struct AdjustPrivacy {
    static constexpr std::string_view name = "adjust_privacy";
    double delta_min{-0.05};
    double delta_max{0.1};
    double isolation_min{0.3};
    double isolation_max{1.0};

    void apply(Layout& layout, RNG& rng) const;
};

using NeighborOperator = std::variant<AdjustZoneVolume, TuneSystems, AdjustIsru, AdjustPrivacy>;

// The four operators with their default parameters, in selection order
[[nodiscard]] std::vector<NeighborOperator> default_neighbor_operators();

void apply_neighbor(const NeighborOperator& op, Layout& layout, RNG& rng);

[[nodiscard]] std::string_view neighbor_name(const NeighborOperator& op);

}  // namespace lunar_habitat
