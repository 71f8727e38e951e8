#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace lunar_habitat {

// Unsupported crew/duration/volume or malformed configuration values
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Initial layout could not be made feasible by the self-heal pass
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(std::vector<std::string> failed_rules);

    [[nodiscard]] const std::vector<std::string>& failed_rules() const { return failed_rules_; }

private:
    std::vector<std::string> failed_rules_;
};

// Layout document or value violating the interchange schema
class LayoutFormatError : public std::runtime_error {
public:
    explicit LayoutFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace lunar_habitat
