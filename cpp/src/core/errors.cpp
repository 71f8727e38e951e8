#include "lunar_habitat/core/errors.hpp"
#include <utility>

namespace lunar_habitat {

namespace {

std::string describe_failure(const std::vector<std::string>& failed_rules) {
    std::string message = "Initial layout generation failed: [";
    for (size_t i = 0; i < failed_rules.size(); ++i) {
        if (i > 0) message += ", ";
        message += failed_rules[i];
    }
    message += "]";
    return message;
}

}  // namespace

GenerationError::GenerationError(std::vector<std::string> failed_rules)
    : std::runtime_error(describe_failure(failed_rules))
    , failed_rules_(std::move(failed_rules))
{}

}  // namespace lunar_habitat
