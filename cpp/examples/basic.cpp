#include <iostream>
#include <iomanip>
#include "lunar_habitat/lunar_habitat.hpp"

using namespace lunar_habitat;

int main() {
    std::cout << "Lunar Habitat Layout Example\n";
    std::cout << "============================\n\n";

    GeneratorConfig config;
    config.crew = 4;
    config.duration_days = 90;
    config.pressurized_volume_m3 = 170.0;
    config.seed = 7;

    ConstraintSettings settings;
    ScoreWeights weights;

    // Generate initial layout
    Layout layout = generate(config, settings);
    ValidationResult validation = validate(layout, settings);
    Evaluation initial = evaluate(layout, settings, weights);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Initial layout: " << layout.habitat_name << "\n";
    std::cout << "  Zones: " << layout.zones.size() << "\n";
    std::cout << "  Pressurized volume: " << layout.pressurized_volume_m3 << " m3\n";
    std::cout << "  NHV: " << initial.metrics.nhv_m3 << " m3\n";
    std::cout << "  Feasible: " << (validation.passed ? "yes" : "no") << "\n";
    std::cout << "  Score: " << initial.score << "\n\n";

    // Step the annealer by hand
    const int num_iterations = 2000;
    SimulatedAnnealing sa(settings, weights);
    AnnealingRun run = sa.start(layout, num_iterations);
    RNG rng(config.seed);

    std::cout << "Running " << num_iterations << " iterations...\n";
    while (!run.done()) {
        run.step(rng);
        if (run.iteration() % 250 == 0) {
            std::cout << "  Iteration " << std::setw(5) << run.iteration()
                      << " | T: " << sa.temperature(run.iteration(), num_iterations)
                      << " | Current: " << run.current_score()
                      << " | Best: " << run.best_score()
                      << " | Accept rate: " << run.accept_rate() << "\n";
        }
    }

    OptimizationResult result = run.result();
    std::cout << "\nOptimization complete!\n";
    std::cout << "  Best score: " << result.score << "\n";
    std::cout << "  Accepted: " << run.accepted_count()
              << " | Rejected: " << run.rejected_count()
              << " | Infeasible: " << run.infeasible_count() << "\n\n";

    // Independent restarts
    std::vector<uint64_t> seeds = derive_seeds(config.seed, 4);
    auto results = optimize_multistart(layout, 500, settings, weights, seeds, true);
    std::cout << "Best multi-start score: " << best_result(results).score << "\n\n";

    std::cout << export_markdown(result.layout, result.metrics, validate(result.layout, settings).messages);
    return 0;
}
