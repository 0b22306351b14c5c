// src/worldgen/Terrain.hpp
#pragma once

// Terrain evaluation: turns an algorithm expression into one elevation value
// (meters) per tile of the finest grid in a sequence.

#include "worldgen/Grid.hpp"
#include "worldgen/TerrainExpr.hpp"

#include <cstdint>
#include <vector>

namespace orbis::worldgen {

class AlgorithmRegistry;

using TileField = std::vector<double>;

// Throws ConfigError for octaves < 0, persistence < 0 or non-finite magnitude.
void validate(const TerrainParameters& params);

// Evaluates on grids.back(). `ref` nodes throw ConfigError without a registry.
[[nodiscard]] TileField evaluate(const TerrainExpr& e, const GridSequence& grids,
                                 const TerrainParameters& params);
[[nodiscard]] TileField evaluate(const TerrainExpr& e, const GridSequence& grids,
                                 const TerrainParameters& params, const AlgorithmRegistry& registry);

// registry.at(params.name), evaluated with the registry for refs.
[[nodiscard]] TileField evaluate_algorithm(const AlgorithmRegistry& registry, const GridSequence& grids,
                                           const TerrainParameters& params);

// Coarse-to-fine midpoint displacement over G0..GN. Level 0 draws
// magnitude*u; at level k every new tile takes the mean of its parents plus
// magnitude*persistence^k*u while k < octaves. u is uniform in [-1, 1) from a
// stream keyed by (seed, level, tile).
[[nodiscard]] TileField heightmap(const GridSequence& grids, std::uint64_t seed, int octaves,
                                  double magnitude, double persistence);

// Values below `threshold` are shifted down by `threshold`.
[[nodiscard]] TileField elevation_lower(double threshold, TileField field);

// continent + mountain where both are positive, continent elsewhere.
[[nodiscard]] TileField combine_relief(const TileField& continent, const TileField& mountain);

} // namespace orbis::worldgen
