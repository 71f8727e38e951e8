#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "lunar_habitat/lunar_habitat.hpp"

using namespace lunar_habitat;

namespace {

const char* DEFAULT_CONFIG_PATH = "examples/seed_config.json";

// --key value pairs following the subcommand
class Args {
public:
    Args(int argc, char** argv, int first) {
        for (int i = first; i < argc; ++i) {
            std::string key = argv[i];
            if (key.rfind("--", 0) != 0) {
                throw std::runtime_error("Unexpected argument: " + key);
            }
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + key);
            }
            values_[key.substr(2)] = argv[++i];
        }
    }

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::string require(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            throw std::runtime_error("Missing required option --" + key);
        }
        return *value;
    }

private:
    std::map<std::string, std::string> values_;
};

ScoreWeights weights_from(const Args& args) {
    auto path = args.get("weights");
    return path ? load_weights(*path) : ScoreWeights{};
}

void write_text(const std::optional<std::string>& path, const std::string& text) {
    if (!path) {
        std::cout << text;
        return;
    }
    std::ofstream out(*path);
    if (!out) {
        throw std::runtime_error("Cannot write file: " + *path);
    }
    out << text;
}

int cmd_init(const Args& args) {
    const std::string path = args.get("out").value_or(DEFAULT_CONFIG_PATH);
    nlohmann::json config = GeneratorConfig{};
    config.erase("habitat_name");
    config["weights"] = ScoreWeights{};
    write_json_file(path, config);
    std::cout << "Wrote seed configuration to " << path << "\n";
    return 0;
}

int cmd_generate(const Args& args) {
    const GeneratorConfig config = load_config(args.require("config"));
    const std::string out = args.require("out");
    save_layout(generate(config), out);
    std::cout << "Generated layout saved to " << out << "\n";
    return 0;
}

int cmd_validate(const Args& args) {
    const Layout layout = load_layout(args.require("in"));
    const ValidationResult result = validate(layout, ConstraintSettings{});
    for (const auto& message : result.messages) {
        std::cout << message << "\n";
    }
    return result.passed ? 0 : 1;
}

int cmd_score(const Args& args) {
    const Layout layout = load_layout(args.require("in"));
    const Evaluation eval = evaluate(layout, ConstraintSettings{}, weights_from(args));
    nlohmann::json out = {{"metrics", eval.metrics}, {"score", eval.score}};
    std::cout << out.dump(2) << "\n";
    return eval.metrics.feasibility ? 0 : 1;
}

int cmd_optimize(const Args& args) {
    const Layout layout = load_layout(args.require("in"));
    const std::string out = args.require("out");
    const int iterations = std::stoi(args.get("iters").value_or("3000"));
    std::optional<uint64_t> seed;
    if (auto s = args.get("seed")) {
        seed = std::stoull(*s);
    }
    const OptimizationResult result = optimize(layout, iterations, ConstraintSettings{}, weights_from(args), seed);
    save_layout(result.layout, out);
    std::cout << "Optimized layout saved to " << out << "; score="
              << std::fixed << std::setprecision(3) << result.score << "\n";
    return 0;
}

int cmd_export(const Args& args) {
    const Layout layout = load_layout(args.require("in"));
    const std::string format = args.require("format");
    const auto out = args.get("out");
    const ConstraintSettings settings;
    const Evaluation eval = evaluate(layout, settings, weights_from(args));
    const ValidationResult validation = validate(layout, settings);

    if (format == "md") {
        write_text(out, export_markdown(layout, eval.metrics, validation.messages));
    } else if (format == "json") {
        nlohmann::json data = {
            {"layout", layout},
            {"metrics", eval.metrics},
            {"score", eval.score},
            {"validation", validation.messages},
        };
        write_text(out, data.dump(2) + "\n");
    } else if (format == "csv") {
        write_text(out, export_metrics_csv(eval.metrics));
    } else {
        throw std::runtime_error("Unsupported export format: " + format);
    }
    return 0;
}

int cmd_schema(const Args& args) {
    const std::string target = args.require("target");
    const std::string kind = args.get("kind").value_or("layout");
    nlohmann::json schema;
    if (target == "layout") {
        if (kind == "layout") {
            schema = layout_schema();
        } else if (kind == "config") {
            schema = config_schema();
        } else {
            throw std::runtime_error("Unknown schema kind: " + kind);
        }
    } else if (target == "metrics") {
        schema = metrics_schema();
    } else {
        throw std::runtime_error("Unknown schema target: " + target);
    }
    std::cout << schema.dump(2) << "\n";
    return 0;
}

void print_usage() {
    std::cerr << "usage: lunar_layout <command> [options]\n"
              << "  init      [--out PATH]\n"
              << "  generate  --config PATH --out PATH\n"
              << "  validate  --in PATH\n"
              << "  score     --in PATH [--weights PATH]\n"
              << "  optimize  --in PATH --out PATH [--iters N] [--seed N] [--weights PATH]\n"
              << "  export    --in PATH --format md|json|csv [--out PATH] [--weights PATH]\n"
              << "  schema    --target layout|metrics [--kind layout|config]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        Args args(argc, argv, 2);
        if (command == "init") return cmd_init(args);
        if (command == "generate") return cmd_generate(args);
        if (command == "validate") return cmd_validate(args);
        if (command == "score") return cmd_score(args);
        if (command == "optimize") return cmd_optimize(args);
        if (command == "export") return cmd_export(args);
        if (command == "schema") return cmd_schema(args);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
