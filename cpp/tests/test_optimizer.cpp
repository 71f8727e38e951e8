#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include "lunar_habitat/core/errors.hpp"
#include "lunar_habitat/generator/generator.hpp"
#include "lunar_habitat/optimizers/neighbors.hpp"
#include "lunar_habitat/optimizers/sa.hpp"
#include "lunar_habitat/scoring/scorer.hpp"

using namespace lunar_habitat;
using Catch::Detail::Approx;

namespace {

Layout scenario_layout() {
    GeneratorConfig config;
    config.crew = 4;
    config.duration_days = 90;
    config.pressurized_volume_m3 = 170.0;
    config.target_isru_ratio = 0.6;
    config.docking_ports = 2;
    config.seed = 7;
    return generate(config);
}

bool is_known_reason(const std::string& reason) {
    return reason == "initial" || reason == "anneal_reject" ||
           reason == "adjust_zone_volume" || reason == "tune_systems" ||
           reason == "adjust_isru" || reason == "adjust_privacy" ||
           reason.rfind("constraint_fail:", 0) == 0;
}

}  // namespace

TEST_CASE("Neighbor operators", "[optimizer]") {
    Layout layout = scenario_layout();
    RNG rng(3);

    SECTION("Names") {
        auto ops = default_neighbor_operators();
        REQUIRE(ops.size() == 4);
        REQUIRE(neighbor_name(ops[0]) == "adjust_zone_volume");
        REQUIRE(neighbor_name(ops[1]) == "tune_systems");
        REQUIRE(neighbor_name(ops[2]) == "adjust_isru");
        REQUIRE(neighbor_name(ops[3]) == "adjust_privacy");
    }

    SECTION("Volume transfer keeps the total and spares Airlock and StormShelter") {
        const double airlock = layout.find_zone(ZoneKind::Airlock)->volume_m3;
        const double shelter = layout.find_zone(ZoneKind::StormShelter)->volume_m3;
        const double total = layout.zone_volume_sum();
        for (int i = 0; i < 50; ++i) {
            apply_neighbor(AdjustZoneVolume{}, layout, rng);
            REQUIRE(layout.pressurized_volume_m3 == Approx(layout.zone_volume_sum()));
        }
        REQUIRE(layout.zone_volume_sum() == Approx(total));
        REQUIRE(layout.find_zone(ZoneKind::Airlock)->volume_m3 == airlock);
        REQUIRE(layout.find_zone(ZoneKind::StormShelter)->volume_m3 == shelter);
    }

    SECTION("System tuning stays within bounds") {
        for (int i = 0; i < 200; ++i) {
            apply_neighbor(TuneSystems{}, layout, rng);
            REQUIRE(layout.systems.water_recycling_rate >= 0.90);
            REQUIRE(layout.systems.water_recycling_rate <= 0.99);
            REQUIRE(layout.systems.power.autonomy_days >= 14);
            REQUIRE(layout.systems.power.storage_kwh >= 120.0);
        }
    }

    SECTION("ISRU stays within bounds") {
        for (int i = 0; i < 200; ++i) {
            apply_neighbor(AdjustIsru{}, layout, rng);
            REQUIRE(layout.isru_ratio >= 0.4);
            REQUIRE(layout.isru_ratio <= 1.0);
        }
    }

    SECTION("Privacy tuning only touches Work, Exercise and GalleyDining") {
        const Layout before = layout;
        for (int i = 0; i < 100; ++i) {
            apply_neighbor(AdjustPrivacy{}, layout, rng);
        }
        for (size_t i = 0; i < layout.zones.size(); ++i) {
            const Zone& zone = layout.zones[i];
            if (zone.kind == ZoneKind::Work || zone.kind == ZoneKind::Exercise ||
                zone.kind == ZoneKind::GalleyDining) {
                REQUIRE(zone.acoustic_isolation >= 0.3);
                REQUIRE(zone.acoustic_isolation <= 1.0);
            } else {
                REQUIRE(zone.acoustic_isolation == before.zones[i].acoustic_isolation);
            }
        }
    }

    SECTION("Operators are no-ops without eligible zones") {
        Layout empty;
        empty.pressurized_volume_m3 = 10.0;
        apply_neighbor(AdjustZoneVolume{}, empty, rng);
        apply_neighbor(AdjustPrivacy{}, empty, rng);
        REQUIRE(empty.pressurized_volume_m3 == 10.0);
    }
}

TEST_CASE("Annealing temperature", "[optimizer]") {
    SECTION("Geometric") {
        SimulatedAnnealing sa(ConstraintSettings{}, ScoreWeights{});
        REQUIRE(sa.temperature(0, 100) == Approx(1.0));
        REQUIRE(sa.temperature(100, 100) == Approx(0.05));
        REQUIRE(sa.temperature(50, 100) == Approx(std::sqrt(0.05)));
    }

    SECTION("Linear") {
        AnnealingConfig config;
        config.cooling_schedule = CoolingSchedule::Linear;
        SimulatedAnnealing sa(ConstraintSettings{}, ScoreWeights{}, config);
        REQUIRE(sa.temperature(50, 100) == Approx(0.525));
        REQUIRE(sa.temperature(100, 100) == Approx(0.05));
    }

    SECTION("No operators") {
        REQUIRE_THROWS_AS(
            SimulatedAnnealing(ConstraintSettings{}, ScoreWeights{}, AnnealingConfig{}, {}),
            ConfigurationError);
    }
}

TEST_CASE("Optimize improves a generated layout", "[optimizer]") {
    Layout layout = scenario_layout();
    const double initial = evaluate(layout).score;

    OptimizationResult result = optimize(layout, 50, ConstraintSettings{}, ScoreWeights{}, 5);

    SECTION("Feasible and not worse than 90% of the start") {
        REQUIRE(result.metrics.feasibility);
        REQUIRE(result.score >= initial * 0.9);
    }

    SECTION("Best score never drops below the initial score") {
        REQUIRE(result.score >= result.history.front().score);
    }

    SECTION("History shape") {
        REQUIRE(result.history.size() == 51);
        REQUIRE(result.history[0].iteration == 0);
        REQUIRE(result.history[0].accepted);
        REQUIRE(result.history[0].reason == "initial");
        REQUIRE(result.history[0].score == Approx(initial));
        for (size_t i = 0; i < result.history.size(); ++i) {
            REQUIRE(result.history[i].iteration == static_cast<int>(i));
            REQUIRE(is_known_reason(result.history[i].reason));
        }
    }

    SECTION("Best is the highest logged score") {
        double highest = result.history.front().score;
        for (const auto& entry : result.history) {
            highest = std::max(highest, entry.score);
        }
        REQUIRE(result.score == highest);
    }

    SECTION("Best metrics describe the best layout") {
        Evaluation eval = evaluate(result.layout);
        REQUIRE(eval.metrics == result.metrics);
        REQUIRE(eval.score == Approx(result.score));
    }

    SECTION("Input layout untouched") {
        REQUIRE(layout == scenario_layout());
    }
}

TEST_CASE("Optimize is reproducible", "[optimizer]") {
    Layout layout = scenario_layout();

    SECTION("Same seed, same run") {
        OptimizationResult a = optimize(layout, 200, ConstraintSettings{}, ScoreWeights{}, 99);
        OptimizationResult b = optimize(layout, 200, ConstraintSettings{}, ScoreWeights{}, 99);
        REQUIRE(a.history == b.history);
        REQUIRE(a.score == b.score);
        REQUIRE(a.layout == b.layout);
    }

    SECTION("Seed falls back to the layout metadata") {
        OptimizationResult implicit = optimize(layout, 100);
        OptimizationResult explicit_seed = optimize(layout, 100, ConstraintSettings{}, ScoreWeights{}, 7);
        REQUIRE(implicit.history == explicit_seed.history);
    }

    SECTION("Without any seed the default is used") {
        layout.metadata.seed.reset();
        OptimizationResult implicit = optimize(layout, 100);
        OptimizationResult explicit_seed = optimize(layout, 100, ConstraintSettings{}, ScoreWeights{}, 42);
        REQUIRE(implicit.history == explicit_seed.history);
    }

    SECTION("Stepwise run matches the full run") {
        SimulatedAnnealing sa(ConstraintSettings{}, ScoreWeights{});
        RNG rng_full(13);
        OptimizationResult full = sa.run(layout, 150, rng_full);

        RNG rng_step(13);
        AnnealingRun run = sa.start(layout, 150);
        while (!run.done()) {
            run.step(rng_step);
        }
        REQUIRE(run.result() == full);
        REQUIRE(run.accepted_count() + run.rejected_count() + run.infeasible_count() == 150);
    }
}

namespace {

template <typename Annealer>
concept CanStartRun = requires(Annealer&& sa, const Layout& layout) {
    std::forward<Annealer>(sa).start(layout, 1);
};

}  // namespace

TEST_CASE("Annealing runs need a live annealer", "[optimizer]") {
    STATIC_REQUIRE(CanStartRun<SimulatedAnnealing&>);
    STATIC_REQUIRE(CanStartRun<const SimulatedAnnealing&>);
    STATIC_REQUIRE_FALSE(CanStartRun<SimulatedAnnealing>);
    STATIC_REQUIRE_FALSE(CanStartRun<const SimulatedAnnealing>);
}

TEST_CASE("Optimizer rejects infeasible candidates", "[optimizer]") {
    Layout layout = scenario_layout();
    // Shielding fails, so every candidate is infeasible
    layout.shield_equivalent_g_cm2 = 1.0;

    OptimizationResult result = optimize(layout, 30, ConstraintSettings{}, ScoreWeights{}, 1);
    REQUIRE(result.history.size() == 31);
    for (size_t i = 1; i < result.history.size(); ++i) {
        const auto& entry = result.history[i];
        REQUIRE_FALSE(entry.accepted);
        REQUIRE(entry.reason.rfind("constraint_fail:", 0) == 0);
        REQUIRE(entry.reason.find("radiation_shield") != std::string::npos);
        REQUIRE(entry.score == result.history[0].score);
    }
    REQUIRE(result.layout == layout);
    REQUIRE_FALSE(result.metrics.feasibility);
}

TEST_CASE("Zero iterations", "[optimizer]") {
    Layout layout = scenario_layout();
    OptimizationResult result = optimize(layout, 0, ConstraintSettings{}, ScoreWeights{}, 1);
    REQUIRE(result.history.size() == 1);
    REQUIRE(result.layout == layout);
}
