#include "lunar_habitat/core/types.hpp"

namespace lunar_habitat {

namespace {

constexpr std::array<std::string_view, ZONE_KIND_COUNT> ZONE_LABELS = {
    "Airlock",
    "Work",
    "HygieneMedical",
    "GalleyDining",
    "CrewQuarters",
    "Exercise",
    "MaintenanceStorage",
    "StormShelter",
    "Agriculture"
};

constexpr std::array<std::string_view, 3> PRIVACY_LABELS = {"Low", "Medium", "High"};

constexpr std::array<std::string_view, 4> LIGHTING_LABELS = {
    "Warm3000K", "Neutral4000K", "Cool6500K", "Adaptive"
};

constexpr std::array<std::string_view, 3> HABITAT_LABELS = {
    "Inflatable", "Rigid", "RegolithHybrid"
};

template <typename Enum, size_t N>
std::optional<Enum> parse_label(const std::array<std::string_view, N>& labels, std::string_view label) {
    for (size_t i = 0; i < N; ++i) {
        if (labels[i] == label) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(ZoneKind kind) {
    return ZONE_LABELS[static_cast<size_t>(kind)];
}

std::string_view to_string(PrivacyLevel level) {
    return PRIVACY_LABELS[static_cast<size_t>(level)];
}

std::string_view to_string(LightingProfile profile) {
    return LIGHTING_LABELS[static_cast<size_t>(profile)];
}

std::string_view to_string(HabitatType type) {
    return HABITAT_LABELS[static_cast<size_t>(type)];
}

std::optional<ZoneKind> parse_zone_kind(std::string_view label) {
    return parse_label<ZoneKind>(ZONE_LABELS, label);
}

std::optional<PrivacyLevel> parse_privacy_level(std::string_view label) {
    return parse_label<PrivacyLevel>(PRIVACY_LABELS, label);
}

std::optional<LightingProfile> parse_lighting_profile(std::string_view label) {
    return parse_label<LightingProfile>(LIGHTING_LABELS, label);
}

std::optional<HabitatType> parse_habitat_type(std::string_view label) {
    return parse_label<HabitatType>(HABITAT_LABELS, label);
}

}  // namespace lunar_habitat
