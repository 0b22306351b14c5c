// src/worldgen/Hydrology.hpp
#pragma once

// River network over a Planet: steepest-descent routing plus discharge
// accumulation.
//
// - Land tiles touching the ocean are river mouths (sinks).
// - Any other land tile drains to its strictly lowest neighbor (lowest id on
//   ties) when that neighbor is strictly lower; otherwise it is a sink.
// - Ocean tiles have no downstream and zero discharge.
// - Discharge(t) = 1 + sum of the discharge of tiles draining into t.

#include "worldgen/Planet.hpp"

#include <vector>

namespace orbis::worldgen {

// Downstream tile per tile, -1 for sinks and ocean.
[[nodiscard]] std::vector<int> compute_flow(const Planet& planet);

// One pass over land tiles in strictly descending elevation (ties by id).
// Throws InvariantViolation when a target is not strictly lower than its source.
[[nodiscard]] std::vector<double> accumulate_discharge(const Planet& planet, const std::vector<int>& flow);

[[nodiscard]] Planet generate_rivers(const Planet& planet);

} // namespace orbis::worldgen
