#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lunar_habitat {

// Functional compartment kinds (closed set)
enum class ZoneKind {
    Airlock,
    Work,
    HygieneMedical,
    GalleyDining,
    CrewQuarters,
    Exercise,
    MaintenanceStorage,
    StormShelter,
    Agriculture
};

constexpr size_t ZONE_KIND_COUNT = 9;

constexpr std::array<ZoneKind, ZONE_KIND_COUNT> ALL_ZONE_KINDS = {
    ZoneKind::Airlock,
    ZoneKind::Work,
    ZoneKind::HygieneMedical,
    ZoneKind::GalleyDining,
    ZoneKind::CrewQuarters,
    ZoneKind::Exercise,
    ZoneKind::MaintenanceStorage,
    ZoneKind::StormShelter,
    ZoneKind::Agriculture
};

enum class PrivacyLevel {
    Low,
    Medium,
    High
};

enum class LightingProfile {
    Warm3000K,
    Neutral4000K,
    Cool6500K,
    Adaptive
};

enum class HabitatType {
    Inflatable,
    Rigid,
    RegolithHybrid
};

// Canonical labels (these are the interchange spellings)
[[nodiscard]] std::string_view to_string(ZoneKind kind);
[[nodiscard]] std::string_view to_string(PrivacyLevel level);
[[nodiscard]] std::string_view to_string(LightingProfile profile);
[[nodiscard]] std::string_view to_string(HabitatType type);

// Parse a label; nullopt when the label is not part of the closed set
[[nodiscard]] std::optional<ZoneKind> parse_zone_kind(std::string_view label);
[[nodiscard]] std::optional<PrivacyLevel> parse_privacy_level(std::string_view label);
[[nodiscard]] std::optional<LightingProfile> parse_lighting_profile(std::string_view label);
[[nodiscard]] std::optional<HabitatType> parse_habitat_type(std::string_view label);

}  // namespace lunar_habitat
