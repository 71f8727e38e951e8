#pragma once

// Data model
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/layout.hpp"
#include "core/settings.hpp"
#include "core/results.hpp"

// Zone adjacency graph
#include "spatial/zone_graph.hpp"

// Hard constraints
#include "constraints/validator.hpp"

// Initial layouts
#include "generator/zone_catalog.hpp"
#include "generator/generator.hpp"

// Objective
#include "scoring/scorer.hpp"

// Search
#include "optimizers/neighbors.hpp"
#include "optimizers/sa.hpp"
#include "optimizers/multistart.hpp"

// Random number generation
#include "random/rng.hpp"

// Interchange and reports
#include "io/json_io.hpp"
#include "io/report.hpp"
#include "io/schema.hpp"
