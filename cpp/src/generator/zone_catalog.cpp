#include "lunar_habitat/generator/zone_catalog.hpp"
#include "lunar_habitat/core/errors.hpp"
#include <utility>

namespace lunar_habitat {

ZoneCatalog::ZoneCatalog(std::vector<ZoneTemplate> templates)
    : templates_(std::move(templates))
{
    for (const auto& t : templates_) {
        if (t.volume_fraction <= 0.0) {
            throw ConfigurationError("Zone template " + std::string(to_string(t.kind)) +
                                     " has a non-positive volume fraction");
        }
        fraction_sum_ += t.volume_fraction;
    }
}

const ZoneCatalog& default_zone_catalog() {
    using K = ZoneKind;
    using P = PrivacyLevel;
    using L = LightingProfile;
    static const ZoneCatalog catalog({
        {K::Airlock, 0.07, 0.60, P::Low, 0.40, L::Neutral4000K, true, false,
         {"MaintenanceStorage", "Work"},
         {"dual-door", "suit-lock", "dust-scrubber"}},
        {K::Work, 0.18, 0.85, P::Medium, 0.55, L::Neutral4000K, false, false,
         {"Airlock", "GalleyDining", "Exercise", "MaintenanceStorage"},
         {"lab-bench", "fab-station"}},
        {K::HygieneMedical, 0.09, 0.80, P::High, 0.75, L::Neutral4000K, false, true,
         {"CrewQuarters", "StormShelter"},
         {"med-kit", "hygiene-module"}},
        {K::GalleyDining, 0.11, 0.85, P::Medium, 0.60, L::Adaptive, false, true,
         {"Work", "CrewQuarters", "Agriculture"},
         {"galley", "table"}},
        {K::CrewQuarters, 0.20, 0.90, P::High, 0.80, L::Adaptive, false, true,
         {"GalleyDining", "HygieneMedical", "Exercise"},
         {"pods", "privacy-panels"}},
        {K::Exercise, 0.10, 0.80, P::Medium, 0.65, L::Neutral4000K, false, true,
         {"CrewQuarters", "Work"},
         {"treadmill", "flywheel"}},
        {K::MaintenanceStorage, 0.10, 0.75, P::Low, 0.50, L::Neutral4000K, false, false,
         {"Airlock", "Work", "StormShelter", "Agriculture"},
         {"tool-racks", "spares"}},
        {K::StormShelter, 0.07, 0.70, P::High, 0.85, L::Neutral4000K, true, false,
         {"HygieneMedical", "MaintenanceStorage"},
         {"shielded-bunks", "backup-comms"}},
        {K::Agriculture, 0.08, 0.85, P::Medium, 0.60, L::Neutral4000K, false, true,
         {"GalleyDining", "MaintenanceStorage"},
         {"hydroponics", "algae"}},
    });
    return catalog;
}

}  // namespace lunar_habitat
