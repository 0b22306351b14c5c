// src/worldgen/Planet.hpp
#pragma once

// Immutable planet value. Every generation step returns a new Planet; the
// grid is shared between all of them.

#include "worldgen/Climate.hpp"
#include "worldgen/Grid.hpp"

#include <optional>
#include <vector>

namespace orbis::worldgen {

class Planet {
public:
    [[nodiscard]] const Grid&    grid() const noexcept { return *grid_; }
    [[nodiscard]] const GridPtr& grid_ptr() const noexcept { return grid_; }
    [[nodiscard]] std::size_t    tile_count() const noexcept { return elevation_.size(); }

    [[nodiscard]] double radius_km() const noexcept { return radius_; }
    [[nodiscard]] Vec3   axis() const noexcept { return axis_; }          // unit
    [[nodiscard]] double sea_level() const noexcept { return seaLevel_; }   // applied shift (m)

    // ---- terrain ----
    [[nodiscard]] double elevation(int tile) const;   // meters above sea level
    [[nodiscard]] double area(int tile) const;        // km^2
    [[nodiscard]] bool   is_land(int tile) const { return elevation(tile) >= 0.0; }
    [[nodiscard]] bool   is_ocean(int tile) const { return !is_land(tile); }
    [[nodiscard]] const std::vector<double>& elevations() const noexcept { return elevation_; }
    [[nodiscard]] const std::vector<double>& areas() const noexcept { return area_; }
    [[nodiscard]] double total_area() const noexcept;

    // Latitude (radians) of a tile relative to the rotation axis.
    [[nodiscard]] double latitude(int tile) const;

    // ---- rivers ----
    [[nodiscard]] bool has_rivers() const noexcept { return !flow_.empty(); }
    [[nodiscard]] std::optional<int> river_target(int tile) const;
    [[nodiscard]] double discharge(int tile) const;   // 0 without rivers
    [[nodiscard]] bool   is_sink(int tile) const;     // land tile with no downstream
    // Tiles from `tile` down to its sink, inclusive. Throws InvariantViolation
    // when the walk exceeds the tile count.
    [[nodiscard]] std::vector<int> river_path(int tile) const;

    // ---- climate ----
    [[nodiscard]] bool has_climate() const noexcept { return !seasons_.empty(); }
    [[nodiscard]] const std::optional<ClimateParameters>& climate_parameters() const noexcept { return climateParams_; }
    // State left by the last simulated season (converged or not).
    [[nodiscard]] const std::optional<SeasonClimate>& current_climate() const noexcept { return current_; }
    [[nodiscard]] int season_count() const noexcept { return static_cast<int>(seasons_.size()); }
    [[nodiscard]] const SeasonClimate& season(int s) const;   // IndexOutOfRange when unknown
    [[nodiscard]] const std::vector<SeasonClimate>& seasons() const noexcept { return seasons_; }

    [[nodiscard]] double insolation(int tile, int s) const;
    [[nodiscard]] double sunlight(int tile, int s) const { return insolation(tile, s); }
    [[nodiscard]] double temperature(int tile, int s) const;
    [[nodiscard]] double humidity(int tile, int s) const;
    [[nodiscard]] double precipitation(int tile, int s) const;
    [[nodiscard]] double snow(int tile, int s) const;
    [[nodiscard]] double leaf_area_index(int tile, int s) const;

    // ---- derivation ----
    // flow[t] = downstream tile or -1.
    [[nodiscard]] Planet with_rivers(std::vector<int> flow, std::vector<double> discharge) const;
    // Replaces climate data; an empty `seasons` keeps only the running state.
    [[nodiscard]] Planet with_climate(ClimateParameters params,
                                      std::optional<SeasonClimate> current,
                                      std::vector<SeasonClimate> seasons) const;

private:
    friend Planet heightmap_to_planet(GridPtr grid, std::vector<double> elevation, double radiusKm, Vec3 axis);
    friend Planet sea_level(const Planet& planet, double target);

    Planet() = default;

    std::size_t checked_(int tile) const;
    double field_(int tile, int s, std::vector<double> SeasonClimate::*member) const;

    GridPtr grid_;
    double  radius_   = 1.0;
    Vec3    axis_     = make3(0.0, 0.0, 1.0);
    double  seaLevel_ = 0.0;

    std::vector<double> elevation_;
    std::vector<double> area_;

    std::vector<int>    flow_;        // empty until rivers are generated
    std::vector<double> discharge_;

    std::optional<ClimateParameters> climateParams_;
    std::optional<SeasonClimate>     current_;
    std::vector<SeasonClimate>       seasons_;
};

// Validates radius (> 0, finite), axis (non-zero, normalized here) and the
// elevation size; throws ConfigError. Tile areas are solid angle * R^2.
[[nodiscard]] Planet heightmap_to_planet(GridPtr grid, std::vector<double> elevation, double radiusKm, Vec3 axis);

// Every elevation becomes elevation - target. River and climate data are
// dropped because they depend on the old zero reference.
[[nodiscard]] Planet sea_level(const Planet& planet, double target);

} // namespace orbis::worldgen
