#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "lunar_habitat/lunar_habitat.hpp"

namespace py = pybind11;
namespace lh = lunar_habitat;

namespace {

template <typename T>
std::string dump(const T& value, int indent) {
    return nlohmann::json(value).dump(indent);
}

template <typename T>
T parse(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw lh::ConfigurationError(e.what());
    }
}

}  // namespace

PYBIND11_MODULE(lunar_habitat_cpp, m) {
    m.doc() = "Lunar habitat layout generation, validation, scoring and optimization";

    py::register_exception<lh::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<lh::GenerationError>(m, "GenerationError", PyExc_RuntimeError);
    py::register_exception<lh::LayoutFormatError>(m, "LayoutFormatError", PyExc_ValueError);

    // Enums
    py::enum_<lh::ZoneKind>(m, "ZoneKind")
        .value("Airlock", lh::ZoneKind::Airlock)
        .value("Work", lh::ZoneKind::Work)
        .value("HygieneMedical", lh::ZoneKind::HygieneMedical)
        .value("GalleyDining", lh::ZoneKind::GalleyDining)
        .value("CrewQuarters", lh::ZoneKind::CrewQuarters)
        .value("Exercise", lh::ZoneKind::Exercise)
        .value("MaintenanceStorage", lh::ZoneKind::MaintenanceStorage)
        .value("StormShelter", lh::ZoneKind::StormShelter)
        .value("Agriculture", lh::ZoneKind::Agriculture);

    py::enum_<lh::PrivacyLevel>(m, "PrivacyLevel")
        .value("Low", lh::PrivacyLevel::Low)
        .value("Medium", lh::PrivacyLevel::Medium)
        .value("High", lh::PrivacyLevel::High);

    py::enum_<lh::LightingProfile>(m, "LightingProfile")
        .value("Warm3000K", lh::LightingProfile::Warm3000K)
        .value("Neutral4000K", lh::LightingProfile::Neutral4000K)
        .value("Cool6500K", lh::LightingProfile::Cool6500K)
        .value("Adaptive", lh::LightingProfile::Adaptive);

    py::enum_<lh::HabitatType>(m, "HabitatType")
        .value("Inflatable", lh::HabitatType::Inflatable)
        .value("Rigid", lh::HabitatType::Rigid)
        .value("RegolithHybrid", lh::HabitatType::RegolithHybrid);

    // Zone
    py::class_<lh::Zone>(m, "Zone")
        .def(py::init<>())
        .def_readwrite("kind", &lh::Zone::kind)
        .def_readwrite("volume_m3", &lh::Zone::volume_m3)
        .def_readwrite("usable_ratio", &lh::Zone::usable_ratio)
        .def_readwrite("privacy", &lh::Zone::privacy)
        .def_readwrite("connections", &lh::Zone::connections)
        .def_readwrite("acoustic_isolation", &lh::Zone::acoustic_isolation)
        .def_readwrite("lighting", &lh::Zone::lighting)
        .def_readwrite("is_pressurized", &lh::Zone::is_pressurized)
        .def_readwrite("is_egress", &lh::Zone::is_egress)
        .def_readwrite("equipment", &lh::Zone::equipment)
        .def_property_readonly("name", [](const lh::Zone& z) { return std::string(z.name()); })
        .def("usable_volume", &lh::Zone::usable_volume);

    // Systems
    py::class_<lh::PowerSystem>(m, "PowerSystem")
        .def(py::init<>())
        .def_readwrite("source", &lh::PowerSystem::source)
        .def_readwrite("autonomy_days", &lh::PowerSystem::autonomy_days)
        .def_readwrite("storage_kwh", &lh::PowerSystem::storage_kwh);

    py::class_<lh::ThermalSystem>(m, "ThermalSystem")
        .def(py::init<>())
        .def_readwrite("control", &lh::ThermalSystem::control)
        .def_readwrite("range_min_c", &lh::ThermalSystem::range_min_c)
        .def_readwrite("range_max_c", &lh::ThermalSystem::range_max_c);

    py::class_<lh::CommsSystem>(m, "CommsSystem")
        .def(py::init<>())
        .def_readwrite("local", &lh::CommsSystem::local)
        .def_readwrite("gateway", &lh::CommsSystem::gateway);

    py::class_<lh::DustMitigation>(m, "DustMitigation")
        .def(py::init<>())
        .def_readwrite("dual_door", &lh::DustMitigation::dual_door)
        .def_readwrite("suit_storage", &lh::DustMitigation::suit_storage)
        .def_readwrite("electrostatic", &lh::DustMitigation::electrostatic);

    py::class_<lh::Systems>(m, "Systems")
        .def(py::init<>())
        .def_readwrite("eclss_redundancy_loops", &lh::Systems::eclss_redundancy_loops)
        .def_readwrite("water_recycling_rate", &lh::Systems::water_recycling_rate)
        .def_readwrite("power", &lh::Systems::power)
        .def_readwrite("thermal", &lh::Systems::thermal)
        .def_readwrite("comms", &lh::Systems::comms)
        .def_readwrite("dust_mitigation", &lh::Systems::dust_mitigation);

    // Layout
    py::class_<lh::LayoutMetadata>(m, "LayoutMetadata")
        .def(py::init<>())
        .def_readwrite("crew", &lh::LayoutMetadata::crew)
        .def_readwrite("duration_days", &lh::LayoutMetadata::duration_days)
        .def_readwrite("seed", &lh::LayoutMetadata::seed)
        .def_property("extra",
            [](const lh::LayoutMetadata& meta) {
                py::object loads = py::module_::import("json").attr("loads");
                py::dict extra;
                for (const auto& [key, value] : meta.extra) {
                    extra[py::str(key)] = loads(value.dump());
                }
                return extra;
            },
            [](lh::LayoutMetadata& meta, const py::dict& extra) {
                py::object dumps = py::module_::import("json").attr("dumps");
                meta.extra.clear();
                for (const auto& [key, value] : extra) {
                    meta.extra[py::cast<std::string>(key)] =
                        nlohmann::json::parse(py::cast<std::string>(dumps(value)));
                }
            });

    py::class_<lh::Layout>(m, "Layout")
        .def(py::init<>())
        .def_readwrite("habitat_name", &lh::Layout::habitat_name)
        .def_readwrite("habitat_type", &lh::Layout::habitat_type)
        .def_readwrite("pressurized_volume_m3", &lh::Layout::pressurized_volume_m3)
        .def_readwrite("zones", &lh::Layout::zones)
        .def_readwrite("systems", &lh::Layout::systems)
        .def_readwrite("shield_equivalent_g_cm2", &lh::Layout::shield_equivalent_g_cm2)
        .def_readwrite("isru_ratio", &lh::Layout::isru_ratio)
        .def_readwrite("docking_ports", &lh::Layout::docking_ports)
        .def_readwrite("metadata", &lh::Layout::metadata)
        .def("net_habitable_volume", &lh::Layout::net_habitable_volume)
        .def("nhv_efficiency", &lh::Layout::nhv_efficiency)
        .def("egress_count", &lh::Layout::egress_count)
        .def("to_json", [](const lh::Layout& self, int indent) {
            return lh::layout_to_string(self, indent);
        }, py::arg("indent") = 2)
        .def_static("from_json", &lh::layout_from_string)
        .def("__eq__", [](const lh::Layout& a, const lh::Layout& b) { return a == b; });

    // Configuration
    py::class_<lh::ConstraintSettings>(m, "ConstraintSettings")
        .def(py::init<>())
        .def_readwrite("min_crew", &lh::ConstraintSettings::min_crew)
        .def_readwrite("max_crew", &lh::ConstraintSettings::max_crew)
        .def_readwrite("min_duration_days", &lh::ConstraintSettings::min_duration_days)
        .def_readwrite("max_duration_days", &lh::ConstraintSettings::max_duration_days)
        .def_readwrite("min_nhv_per_person", &lh::ConstraintSettings::min_nhv_per_person)
        .def_readwrite("min_nhv_efficiency", &lh::ConstraintSettings::min_nhv_efficiency)
        .def_readwrite("min_shield_g_cm2", &lh::ConstraintSettings::min_shield_g_cm2)
        .def_readwrite("min_eclss_loops", &lh::ConstraintSettings::min_eclss_loops)
        .def_readwrite("min_water_recycling", &lh::ConstraintSettings::min_water_recycling)
        .def_readwrite("min_power_autonomy_days", &lh::ConstraintSettings::min_power_autonomy_days)
        .def_readwrite("min_privacy_quarters", &lh::ConstraintSettings::min_privacy_quarters)
        .def_readwrite("required_zones", &lh::ConstraintSettings::required_zones)
        .def_readwrite("adjacency_pairs", &lh::ConstraintSettings::adjacency_pairs)
        .def_readwrite("max_storm_shelter_hops", &lh::ConstraintSettings::max_storm_shelter_hops);

    py::class_<lh::ScoreWeights>(m, "ScoreWeights")
        .def(py::init<>())
        .def_readwrite("w_volume_eff", &lh::ScoreWeights::w_volume_eff)
        .def_readwrite("w_privacy", &lh::ScoreWeights::w_privacy)
        .def_readwrite("w_transit", &lh::ScoreWeights::w_transit)
        .def_readwrite("w_safety", &lh::ScoreWeights::w_safety)
        .def_readwrite("w_sustain", &lh::ScoreWeights::w_sustain)
        .def_readwrite("w_energy", &lh::ScoreWeights::w_energy)
        .def("total", &lh::ScoreWeights::total)
        .def("normalized", &lh::ScoreWeights::normalized);

    py::class_<lh::GeneratorConfig>(m, "GeneratorConfig")
        .def(py::init<>())
        .def_readwrite("crew", &lh::GeneratorConfig::crew)
        .def_readwrite("duration_days", &lh::GeneratorConfig::duration_days)
        .def_readwrite("habitat_type", &lh::GeneratorConfig::habitat_type)
        .def_readwrite("pressurized_volume_m3", &lh::GeneratorConfig::pressurized_volume_m3)
        .def_readwrite("target_isru_ratio", &lh::GeneratorConfig::target_isru_ratio)
        .def_readwrite("docking_ports", &lh::GeneratorConfig::docking_ports)
        .def_readwrite("seed", &lh::GeneratorConfig::seed)
        .def_readwrite("habitat_name", &lh::GeneratorConfig::habitat_name)
        .def_static("from_json", &parse<lh::GeneratorConfig>);

    // Results
    py::class_<lh::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("nhv_m3", &lh::Metrics::nhv_m3)
        .def_readwrite("nhv_efficiency", &lh::Metrics::nhv_efficiency)
        .def_readwrite("transit_distance_score", &lh::Metrics::transit_distance_score)
        .def_readwrite("privacy_score", &lh::Metrics::privacy_score)
        .def_readwrite("sustainability_score", &lh::Metrics::sustainability_score)
        .def_readwrite("energy_use_kwh_per_person_day", &lh::Metrics::energy_use_kwh_per_person_day)
        .def_readwrite("safety_redundancy_score", &lh::Metrics::safety_redundancy_score)
        .def_readwrite("feasibility", &lh::Metrics::feasibility)
        .def("to_json", &dump<lh::Metrics>, py::arg("indent") = 2);

    py::class_<lh::ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readwrite("passed", &lh::ValidationResult::passed)
        .def_readwrite("messages", &lh::ValidationResult::messages)
        .def_readwrite("failed_rules", &lh::ValidationResult::failed_rules)
        .def("has_failure", &lh::ValidationResult::has_failure)
        .def("to_json", &dump<lh::ValidationResult>, py::arg("indent") = 2);

    py::class_<lh::OptimizationLogEntry>(m, "OptimizationLogEntry")
        .def(py::init<>())
        .def_readwrite("iteration", &lh::OptimizationLogEntry::iteration)
        .def_readwrite("score", &lh::OptimizationLogEntry::score)
        .def_readwrite("accepted", &lh::OptimizationLogEntry::accepted)
        .def_readwrite("reason", &lh::OptimizationLogEntry::reason);

    py::class_<lh::OptimizationResult>(m, "OptimizationResult")
        .def(py::init<>())
        .def_readwrite("layout", &lh::OptimizationResult::layout)
        .def_readwrite("metrics", &lh::OptimizationResult::metrics)
        .def_readwrite("score", &lh::OptimizationResult::score)
        .def_readwrite("history", &lh::OptimizationResult::history)
        .def("to_json", &dump<lh::OptimizationResult>, py::arg("indent") = 2);

    // RNG
    py::class_<lh::RNG>(m, "RNG")
        .def(py::init<>())
        .def(py::init<uint64_t>())
        .def("uniform", py::overload_cast<>(&lh::RNG::uniform))
        .def("uniform", py::overload_cast<double, double>(&lh::RNG::uniform))
        .def("randint", &lh::RNG::randint)
        .def("permutation", &lh::RNG::permutation)
        .def("choice", &lh::RNG::choice)
        .def("split", &lh::RNG::split);

    // Entry points
    m.def("generate",
        py::overload_cast<const lh::GeneratorConfig&, const lh::ConstraintSettings&>(&lh::generate),
        py::arg("config"),
        py::arg("settings") = lh::ConstraintSettings{});

    m.def("validate",
        py::overload_cast<const lh::Layout&, const lh::ConstraintSettings&>(&lh::validate),
        py::arg("layout"),
        py::arg("settings") = lh::ConstraintSettings{});

    m.def("evaluate", [](const lh::Layout& layout, const lh::ConstraintSettings& settings, const lh::ScoreWeights& weights) {
            lh::Evaluation eval = lh::evaluate(layout, settings, weights);
            return py::make_tuple(eval.metrics, eval.score);
        },
        py::arg("layout"),
        py::arg("settings") = lh::ConstraintSettings{},
        py::arg("weights") = lh::ScoreWeights{});

    m.def("optimize", &lh::optimize,
        py::arg("layout"),
        py::arg("iterations") = 3000,
        py::arg("settings") = lh::ConstraintSettings{},
        py::arg("weights") = lh::ScoreWeights{},
        py::arg("seed") = py::none(),
        py::call_guard<py::gil_scoped_release>());

    m.def("optimize_multistart",
        py::overload_cast<const lh::Layout&, int, const lh::ConstraintSettings&, const lh::ScoreWeights&,
                          const std::vector<uint64_t>&, bool>(&lh::optimize_multistart),
        py::arg("layout"),
        py::arg("iterations"),
        py::arg("settings"),
        py::arg("weights"),
        py::arg("seeds"),
        py::arg("verbose") = false,
        py::call_guard<py::gil_scoped_release>());
    m.def("optimize_multistart",
        py::overload_cast<const lh::Layout&, int, const lh::ConstraintSettings&, const lh::ScoreWeights&,
                          lh::RNG&, int, bool>(&lh::optimize_multistart),
        py::arg("layout"),
        py::arg("iterations"),
        py::arg("settings"),
        py::arg("weights"),
        py::arg("rng"),
        py::arg("n_starts"),
        py::arg("verbose") = false,
        py::call_guard<py::gil_scoped_release>());

    m.def("best_result", &lh::best_result, py::return_value_policy::copy);
    m.def("derive_seeds", &lh::derive_seeds);

    m.def("export_markdown", &lh::export_markdown);
    m.def("export_metrics_csv", &lh::export_metrics_csv);

    m.def("layout_schema", [] { return lh::layout_schema().dump(2); });
    m.def("metrics_schema", [] { return lh::metrics_schema().dump(2); });
    m.def("config_schema", [] { return lh::config_schema().dump(2); });
}
