#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lunar_habitat {

// Validation thresholds (pure configuration)
struct ConstraintSettings {
    int min_crew{2};
    int max_crew{4};
    int min_duration_days{30};
    int max_duration_days{180};
    double min_nhv_per_person{25.0};
    double min_nhv_efficiency{0.70};
    double min_shield_g_cm2{5.0};
    int min_eclss_loops{2};
    double min_water_recycling{0.90};
    int min_power_autonomy_days{14};
    double min_privacy_quarters{0.7};
    std::vector<ZoneKind> required_zones{
        ZoneKind::Airlock,
        ZoneKind::Work,
        ZoneKind::HygieneMedical,
        ZoneKind::GalleyDining,
        ZoneKind::CrewQuarters,
        ZoneKind::Exercise,
        ZoneKind::MaintenanceStorage,
        ZoneKind::StormShelter
    };
    std::vector<std::pair<std::string, std::string>> adjacency_pairs{
        {"Airlock", "Work"},
        {"CrewQuarters", "HygieneMedical"},
        {"CrewQuarters", "GalleyDining"}
    };
    int max_storm_shelter_hops{3};
};

// Weights of the scalar objective
struct ScoreWeights {
    double w_volume_eff{0.20};
    double w_privacy{0.15};
    double w_transit{0.15};
    double w_safety{0.20};
    double w_sustain{0.15};
    double w_energy{0.15};

    [[nodiscard]] double total() const {
        return w_volume_eff + w_privacy + w_transit + w_safety + w_sustain + w_energy;
    }

    // Same weights scaled to sum to 1.0.
    // Throws ConfigurationError on a negative weight or a non-positive total.
    [[nodiscard]] ScoreWeights normalized() const;
};

// Generator input
struct GeneratorConfig {
    int crew{4};
    int duration_days{90};
    HabitatType habitat_type{HabitatType::Inflatable};
    double pressurized_volume_m3{160.0};
    double target_isru_ratio{0.6};
    int docking_ports{2};
    uint64_t seed{42};
    std::string habitat_name{"Helios-Init"};
};

}  // namespace lunar_habitat
