// src/worldgen/StageContext.hpp
#pragma once
#include <optional>

#include "worldgen/ClimateSim.hpp"     // ClimateObserver
#include "worldgen/Grid.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/StagesConfig.hpp"

namespace orbis::worldgen {

class AlgorithmRegistry;

// State threaded through the stages of one generation run.
struct StageContext {
    // Read-only settings for this run.
    const StagesRuntimeConfig& config;
    const AlgorithmRegistry&   registry;
    const ClimateObserver&     observer;   // may be empty

    // G0..GN, built once before the first stage.
    GridSequence grids;

    // Empty until the terrain stage has run.
    std::optional<Planet> planet;

    // Throws InvariantViolation when no stage has produced a planet yet.
    [[nodiscard]] const Planet& current(const char* stage) const;
};

} // namespace orbis::worldgen
