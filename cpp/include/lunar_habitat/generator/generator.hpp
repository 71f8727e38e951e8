#pragma once

#include "zone_catalog.hpp"
#include "../core/layout.hpp"
#include "../core/settings.hpp"
#include "../random/rng.hpp"

namespace lunar_habitat {

// Builds an initial, already-feasible layout from a generator config.
//
// Volumes come from the catalog fractions, crew-scaled zones grow with
// max(1, crew / 4), each zone gets a +/-5% jitter (floored at 5 m³) and the
// set is renormalized to the configured pressurized volume. If validation
// fails only on NHV rules, one boost pass enlarges the living zones and the
// layout is validated again; a second failure is fatal.
class LayoutGenerator {
public:
    explicit LayoutGenerator(
        ZoneCatalog catalog = default_zone_catalog(),
        bool verbose = false
    );

    // Throws ConfigurationError (bad config) or GenerationError (infeasible)
    [[nodiscard]] Layout generate(
        const GeneratorConfig& config,
        const ConstraintSettings& settings,
        RNG& rng
    ) const;

private:
    ZoneCatalog catalog_;
    bool verbose_;

    void check_config(const GeneratorConfig& config, const ConstraintSettings& settings) const;
    void heal_volume(Layout& layout, const ConstraintSettings& settings) const;
};

// Entry point seeded from config.seed
[[nodiscard]] Layout generate(const GeneratorConfig& config, const ConstraintSettings& settings = {});

// Entry point with an explicit random source
[[nodiscard]] Layout generate(const GeneratorConfig& config, const ConstraintSettings& settings, RNG& rng);

}  // namespace lunar_habitat
