// src/worldgen/Planet.cpp
#include "worldgen/Planet.hpp"
#include "worldgen/Errors.hpp"
#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace orbis::worldgen {

std::size_t Planet::checked_(int tile) const
{
    if (tile < 0 || static_cast<std::size_t>(tile) >= elevation_.size())
        throw IndexOutOfRange("tile index " + std::to_string(tile) + " out of range [0, " +
                              std::to_string(elevation_.size()) + ")");
    return static_cast<std::size_t>(tile);
}

double Planet::elevation(int tile) const { return elevation_[checked_(tile)]; }
double Planet::area(int tile) const { return area_[checked_(tile)]; }

double Planet::total_area() const noexcept
{
    return std::accumulate(area_.begin(), area_.end(), 0.0);
}

double Planet::latitude(int tile) const
{
    const double s = dot(grid_->tile_center(tile), axis_);
    return std::asin(std::clamp(s, -1.0, 1.0));
}

// -------------------- rivers --------------------

std::optional<int> Planet::river_target(int tile) const
{
    const std::size_t i = checked_(tile);
    if (flow_.empty() || flow_[i] < 0)
        return std::nullopt;
    return flow_[i];
}

double Planet::discharge(int tile) const
{
    const std::size_t i = checked_(tile);
    return discharge_.empty() ? 0.0 : discharge_[i];
}

bool Planet::is_sink(int tile) const
{
    return is_land(tile) && !river_target(tile).has_value();
}

std::vector<int> Planet::river_path(int tile) const
{
    std::vector<int> path{tile};
    std::optional<int> next = river_target(tile);
    while (next) {
        if (path.size() > tile_count())
            throw InvariantViolation("river path from tile " + std::to_string(tile) + " does not terminate");
        path.push_back(*next);
        next = river_target(*next);
    }
    return path;
}

// -------------------- climate --------------------

const SeasonClimate& Planet::season(int s) const
{
    if (s < 0 || s >= season_count())
        throw IndexOutOfRange("season " + std::to_string(s) + " out of range [0, " +
                              std::to_string(season_count()) + ")");
    return seasons_[static_cast<std::size_t>(s)];
}

double Planet::field_(int tile, int s, std::vector<double> SeasonClimate::*member) const
{
    const std::size_t i = checked_(tile);
    return (season(s).*member)[i];
}

double Planet::insolation(int tile, int s) const      { return field_(tile, s, &SeasonClimate::insolation); }
double Planet::temperature(int tile, int s) const     { return field_(tile, s, &SeasonClimate::temperature); }
double Planet::humidity(int tile, int s) const        { return field_(tile, s, &SeasonClimate::humidity); }
double Planet::precipitation(int tile, int s) const   { return field_(tile, s, &SeasonClimate::precipitation); }
double Planet::snow(int tile, int s) const            { return field_(tile, s, &SeasonClimate::snow); }
double Planet::leaf_area_index(int tile, int s) const { return field_(tile, s, &SeasonClimate::leaf_area_index); }

// -------------------- derivation --------------------

Planet Planet::with_rivers(std::vector<int> flow, std::vector<double> discharge) const
{
    if (flow.size() != tile_count() || discharge.size() != tile_count())
        throw InvariantViolation("river data size does not match tile count");
    Planet p = *this;
    p.flow_ = std::move(flow);
    p.discharge_ = std::move(discharge);
    return p;
}

Planet Planet::with_climate(ClimateParameters params,
                            std::optional<SeasonClimate> current,
                            std::vector<SeasonClimate> seasons) const
{
    Planet p = *this;
    p.climateParams_ = params;
    p.current_ = std::move(current);
    p.seasons_ = std::move(seasons);
    return p;
}

// -------------------- construction --------------------

Planet heightmap_to_planet(GridPtr grid, std::vector<double> elevation, double radiusKm, Vec3 axis)
{
    if (!grid)
        throw ConfigError("planet: null grid");
    if (!(radiusKm > 0.0) || !std::isfinite(radiusKm))
        throw ConfigError("planet.radius_km must be a finite value > 0");
    const double axisLen = length(axis);
    if (!(axisLen > 0.0) || !std::isfinite(axisLen))
        throw ConfigError("planet.axis must be a finite non-zero vector");
    if (elevation.size() != grid->tile_count())
        throw ConfigError("planet: elevation has " + std::to_string(elevation.size()) +
                          " values for " + std::to_string(grid->tile_count()) + " tiles");

    Planet p;
    p.radius_ = radiusKm;
    p.axis_ = normalize(axis);
    p.elevation_ = std::move(elevation);
    p.area_.resize(grid->tile_count());

    const double r2 = radiusKm * radiusKm;
    const Grid& g = *grid;
    jobs::parallel_for_index(std::size_t{0}, g.tile_count(), [&](std::size_t t) {
        p.area_[t] = g.tile_solid_angle(static_cast<int>(t)) * r2;
    });
    p.grid_ = std::move(grid);

    spdlog::debug("Planet: {} tiles, radius {} km, surface {:.6g} km^2",
                  p.tile_count(), p.radius_, p.total_area());
    return p;
}

Planet sea_level(const Planet& planet, double target)
{
    if (!std::isfinite(target))
        throw ConfigError("planet.sea_level must be finite");

    Planet p;
    p.grid_ = planet.grid_;
    p.radius_ = planet.radius_;
    p.axis_ = planet.axis_;
    p.area_ = planet.area_;
    p.seaLevel_ = planet.seaLevel_ + target;
    p.elevation_ = planet.elevation_;
    for (double& e : p.elevation_)
        e -= target;

    const auto land = std::count_if(p.elevation_.begin(), p.elevation_.end(), [](double e) { return e >= 0.0; });
    spdlog::debug("Planet: sea level {} m, {} of {} tiles are land", target, land, p.tile_count());
    return p;
}

} // namespace orbis::worldgen
