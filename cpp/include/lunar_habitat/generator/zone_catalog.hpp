#pragma once

#include "../core/types.hpp"
#include <string>
#include <vector>

namespace lunar_habitat {

// Per-kind defaults used to build an initial zone
struct ZoneTemplate {
    ZoneKind kind;
    double volume_fraction;      // share of the pressurized volume (before normalization)
    double usable_ratio;
    PrivacyLevel privacy;
    double acoustic_isolation;
    LightingProfile lighting;
    bool is_egress;
    bool crew_scaled;            // volume scales with max(1, crew / 4)
    std::vector<std::string> connections;
    std::vector<std::string> equipment;
};

// Immutable template table; zones are generated in table order
class ZoneCatalog {
public:
    explicit ZoneCatalog(std::vector<ZoneTemplate> templates);

    [[nodiscard]] const std::vector<ZoneTemplate>& templates() const { return templates_; }
    [[nodiscard]] size_t size() const { return templates_.size(); }
    [[nodiscard]] double fraction_sum() const { return fraction_sum_; }

private:
    std::vector<ZoneTemplate> templates_;
    double fraction_sum_{0.0};
};

// Built-in nine-zone table
[[nodiscard]] const ZoneCatalog& default_zone_catalog();

}  // namespace lunar_habitat
