// src/worldgen/Export.hpp
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>

namespace orbis::worldgen {

class Planet;

struct ExportOptions {
    bool scale_corners_by_radius = false;   // unit coordinates otherwise
    bool include_corners = true;
    bool include_tile_type = true;          // only when the planet has climate
};

// {
//   "tile_count", "radius_km", "sea_level", "axis", "season_count",
//   "seasons": [ { "season": s, "tiles": [ { "id", "elevation", "area",
//       "discharge", "river_target", "sunlight", "temperature", "humidity",
//       "precipitation", "snow", "leaf_area_index", "type", "corners" } ] } ]
// }
// A planet without climate exports one season holding terrain and rivers only.
[[nodiscard]] nlohmann::json export_planet(const Planet& planet, const ExportOptions& options = {});

// Throws ConfigError when the file cannot be written.
void write_export(const Planet& planet, const std::filesystem::path& path, const ExportOptions& options = {});

} // namespace orbis::worldgen
