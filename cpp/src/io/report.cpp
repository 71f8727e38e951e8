#include "lunar_habitat/io/report.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace lunar_habitat {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

bool is_passing_message(const std::string& message) {
    const std::string lower = lowercase(message);
    return lower.rfind("crew", 0) == 0 || lower.find("meets") != std::string::npos;
}

std::string export_markdown(
    const Layout& layout,
    const Metrics& metrics,
    const std::vector<std::string>& validation_messages
) {
    std::ostringstream out;
    out << std::fixed;

    out << "# " << layout.habitat_name << " Summary\n\n";
    out << "- Crew: " << layout.metadata.crew << "\n";
    out << "- Duration: " << layout.metadata.duration_days << " days\n";
    out << "- Habitat Type: " << to_string(layout.habitat_type) << "\n";
    out << "- ISRU Ratio: " << std::setprecision(2) << layout.isru_ratio << "\n";
    out << "- Power Autonomy: " << layout.systems.power.autonomy_days << " days\n\n";

    out << "## Zones\n";
    out << "| Zone | Volume (m³) | Usable | Privacy | Connections | Equipment |\n";
    out << "| --- | --- | --- | --- | --- | --- |\n";
    for (const auto& zone : layout.zones) {
        out << "| " << zone.name()
            << " | " << std::setprecision(1) << zone.volume_m3
            << " | " << std::setprecision(2) << zone.usable_ratio
            << " | " << to_string(zone.privacy)
            << " | " << join(zone.connections, ", ")
            << " | " << join(zone.equipment, ", ") << " |\n";
    }
    out << "\n";

    out << "## Systems\n";
    out << "- ECLSS loops: " << layout.systems.eclss_redundancy_loops << "\n";
    out << "- Water recycling: " << std::setprecision(2) << layout.systems.water_recycling_rate << "\n";
    out << "- Power autonomy days: " << layout.systems.power.autonomy_days << "\n";
    out << "- Shielding: " << std::setprecision(1) << layout.shield_equivalent_g_cm2 << " g/cm²\n\n";

    out << "## Metrics\n";
    out << "- NHV: " << std::setprecision(1) << metrics.nhv_m3 << " m³\n";
    out << std::setprecision(2);
    out << "- NHV Efficiency: " << metrics.nhv_efficiency << "\n";
    out << "- Privacy Score: " << metrics.privacy_score << "\n";
    out << "- Transit Score: " << metrics.transit_distance_score << "\n";
    out << "- Sustainability Score: " << metrics.sustainability_score << "\n";
    out << "- Energy Use (kWh/person-day): " << metrics.energy_use_kwh_per_person_day << "\n";
    out << "- Safety Score: " << metrics.safety_redundancy_score << "\n";
    out << "- Feasible: " << (metrics.feasibility ? "yes" : "no") << "\n\n";

    out << "## Validation\n";
    for (const auto& message : validation_messages) {
        out << "- " << (is_passing_message(message) ? "✅" : "⚠️") << " " << message << "\n";
    }
    return out.str();
}

std::string export_metrics_csv(const Metrics& metrics) {
    std::ostringstream out;
    out << std::setprecision(17);
    out << "Metric,Value\n";
    out << "nhv_m3," << metrics.nhv_m3 << "\n";
    out << "nhv_efficiency," << metrics.nhv_efficiency << "\n";
    out << "transit_distance_score," << metrics.transit_distance_score << "\n";
    out << "privacy_score," << metrics.privacy_score << "\n";
    out << "sustainability_score," << metrics.sustainability_score << "\n";
    out << "energy_use_kwh_per_person_day," << metrics.energy_use_kwh_per_person_day << "\n";
    out << "safety_redundancy_score," << metrics.safety_redundancy_score << "\n";
    out << "feasibility," << (metrics.feasibility ? "True" : "False") << "\n";
    return out.str();
}

}  // namespace lunar_habitat
