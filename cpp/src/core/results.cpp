#include "lunar_habitat/core/results.hpp"
#include <algorithm>

namespace lunar_habitat {

bool ValidationResult::has_failure(const std::string& rule) const {
    return std::find(failed_rules.begin(), failed_rules.end(), rule) != failed_rules.end();
}

}  // namespace lunar_habitat
