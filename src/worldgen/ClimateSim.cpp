// src/worldgen/ClimateSim.cpp
#include "worldgen/ClimateSim.hpp"
#include "worldgen/Errors.hpp"
#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

namespace orbis::worldgen {
namespace {

// Temperature
constexpr double kBaseTempK          = 224.0;
constexpr double kInsolationGain     = 0.19;     // K per W/m^2
constexpr double kSnowAlbedo         = 0.35;
constexpr double kLapseRatePerM      = 0.0065;
constexpr double kTempMixing         = 0.15;
constexpr double kLandInertiaDays    = 10.0;
constexpr double kOceanInertiaDays   = 60.0;

// Humidity / precipitation
constexpr double kHumidityMixing     = 0.5;
constexpr double kOceanSaturation    = 0.8;
constexpr double kInlandTransport    = 0.9;      // share of neighbor humidity carried inland
constexpr double kSeaLevelPressure   = 101325.0; // Pa
constexpr double kGravity            = 9.80665;  // m/s^2
constexpr double kColumnMass         = kSeaLevelPressure / kGravity; // kg/m^2 of air
constexpr double kWaterDensity       = 1000.0;   // kg/m^3
constexpr double kScaleHeightM       = 8000.0;
constexpr double kUpliftScaleM       = 1000.0;
constexpr double kCondenseOnset      = 0.3;      // relative humidity where rain starts
constexpr double kMaxCondensed       = 0.6;

// Snow
constexpr double kSnowDepthForCover  = 0.1;      // m of water for full cover
constexpr double kMeltPerDegreeDay   = 0.01;

// Vegetation
constexpr double kMaxLai             = 10.0;
constexpr double kPrecipHalfSat      = 5e-9;     // m/s
constexpr double kFullSunlight       = 250.0;    // W/m^2
constexpr double kLaiResponseDays    = 180.0;

struct Neighborhood {
    double temperature = 0.0;
    double humidity = 0.0;
    double elevation = 0.0;
};

Neighborhood neighbor_means(const Tile& t, const SeasonClimate& prev, const std::vector<double>& elevation)
{
    Neighborhood m;
    for (int k = 0; k < t.edge_count; ++k) {
        const auto n = static_cast<std::size_t>(t.tiles[static_cast<std::size_t>(k)]);
        m.temperature += prev.temperature[n];
        m.humidity    += prev.humidity[n];
        m.elevation   += elevation[n];
    }
    const double inv = 1.0 / static_cast<double>(t.edge_count);
    m.temperature *= inv;
    m.humidity    *= inv;
    m.elevation   *= inv;
    return m;
}

void check_state(const SeasonClimate& s, std::size_t n)
{
    if (s.insolation.size() != n || s.temperature.size() != n || s.humidity.size() != n ||
        s.precipitation.size() != n || s.snow.size() != n || s.leaf_area_index.size() != n)
        throw InvariantViolation("climate state does not match tile count " + std::to_string(n));
}

} // namespace

// -------------------- parameters & state --------------------

void validate(const ClimateParameters& p)
{
    if (p.seasons_per_cycle <= 0)
        throw ConfigError("climate.seasons_per_cycle must be > 0 (got " + std::to_string(p.seasons_per_cycle) + ")");
    if (!(p.acceptable_delta > 0.0))
        throw ConfigError("climate.acceptable_delta must be > 0");
    if (!(p.humidity_half_life_days > 0.0) || !std::isfinite(p.humidity_half_life_days))
        throw ConfigError("climate.humidity_half_life_days must be a finite value > 0");
    if (!(p.precipitation_factor >= 0.0) || !std::isfinite(p.precipitation_factor))
        throw ConfigError("climate.precipitation_factor must be a finite value >= 0");
    if (!std::isfinite(p.axial_tilt))
        throw ConfigError("climate.axial_tilt must be finite");
}

SeasonClimate neutral_climate(std::size_t tileCount, int season)
{
    SeasonClimate s;
    s.season = season;
    s.insolation.assign(tileCount, 0.0);
    s.temperature.assign(tileCount, climate::kNeutralTempK);
    s.humidity.assign(tileCount, 0.0);
    s.precipitation.assign(tileCount, 0.0);
    s.snow.assign(tileCount, 0.0);
    s.leaf_area_index.assign(tileCount, 0.0);
    return s;
}

double max_abs_delta(const SeasonClimate& a, const SeasonClimate& b)
{
    double d = 0.0;
    const auto scan = [&d](const std::vector<double>& x, const std::vector<double>& y) {
        if (x.size() != y.size())
            throw InvariantViolation("climate states differ in tile count");
        for (std::size_t i = 0; i < x.size(); ++i)
            d = std::max(d, std::abs(x[i] - y[i]));
    };
    scan(a.insolation, b.insolation);
    scan(a.temperature, b.temperature);
    scan(a.humidity, b.humidity);
    scan(a.precipitation, b.precipitation);
    scan(a.snow, b.snow);
    scan(a.leaf_area_index, b.leaf_area_index);
    return d;
}

// -------------------- physics --------------------

double daily_insolation(double latitude, double declination) noexcept
{
    const double x  = std::clamp(-std::tan(latitude) * std::tan(declination), -1.0, 1.0);
    const double h0 = std::acos(x);
    const double q  = (climate::kSolarConstant / kPi) *
                      (h0 * std::sin(latitude) * std::sin(declination) +
                       std::cos(latitude) * std::cos(declination) * std::sin(h0));
    return std::max(q, 0.0);
}

double saturation_humidity(double kelvin, double elevationM) noexcept
{
    // Magnus formula over water, Pa.
    const double c  = kelvin - climate::kFreezingK;
    const double es = 610.94 * std::exp(17.625 * c / (c + 243.04));
    const double p  = kSeaLevelPressure * std::exp(-std::max(elevationM, 0.0) / kScaleHeightM);
    return 0.622 * es / p;
}

double vegetation_temperature_factor(double kelvin) noexcept
{
    if (kelvin <= 273.15 || kelvin >= 318.15) return 0.0;
    if (kelvin < 298.15) return (kelvin - 273.15) / 25.0;
    if (kelvin <= 308.15) return 1.0;
    return (318.15 - kelvin) / 10.0;
}

// -------------------- ClimateSimulator --------------------

ClimateSimulator::ClimateSimulator(ClimateParameters params)
    : params_(params)
{
    validate(params_);
}

SeasonClimate ClimateSimulator::step(const Planet& planet, const SeasonClimate& prev, int season) const
{
    const int n = params_.seasons_per_cycle;
    if (season < 0 || season >= n)
        throw IndexOutOfRange("season " + std::to_string(season) + " out of range [0, " + std::to_string(n) + ")");

    const std::size_t tiles = planet.tile_count();
    check_state(prev, tiles);

    const double days    = season_days(params_);
    const double seconds = days * climate::kSecondsPerDay;
    const double theta   = kTwoPi * static_cast<double>(season) / static_cast<double>(n);
    const double decl    = params_.axial_tilt * std::sin(theta);

    const double landRetention  = std::exp(-days / kLandInertiaDays);
    const double oceanRetention = std::exp(-days / kOceanInertiaDays);
    const double humidityDecay  = std::pow(0.5, days / params_.humidity_half_life_days);
    const double laiResponse    = 1.0 - std::exp(-days / kLaiResponseDays);
    const double rainSeconds    = params_.humidity_half_life_days * climate::kSecondsPerDay;
    const double precipToColumn = kWaterDensity * rainSeconds / kColumnMass;   // m/s -> kg/kg

    SeasonClimate out = neutral_climate(tiles, season);
    const Grid& g = planet.grid();
    const std::vector<double>& elevation = planet.elevations();

    jobs::parallel_for_index(std::size_t{0}, tiles, [&](std::size_t i) {
        const Tile& t = g.tiles()[i];
        const double elev = elevation[i];
        const double high = std::max(elev, 0.0);
        const bool   land = elev >= 0.0;
        const Neighborhood nb = neighbor_means(t, prev, elevation);

        // Sunlight
        const double q = daily_insolation(planet.latitude(static_cast<int>(i)), decl);
        out.insolation[i] = q;

        // Temperature
        const double target = kBaseTempK + kInsolationGain * q * (1.0 - kSnowAlbedo * prev.snow[i]) -
                              kLapseRatePerM * high;
        const double mixedT = prev.temperature[i] + kTempMixing * (nb.temperature - prev.temperature[i]);
        const double keep   = land ? landRetention : oceanRetention;
        const double temp   = target + (mixedT - target) * keep;
        out.temperature[i] = temp;

        // Humidity and precipitation
        const double qsat  = saturation_humidity(temp, elev);
        const double mixed = prev.humidity[i] + kHumidityMixing * (nb.humidity - prev.humidity[i]);
        double supply;
        if (land) {
            const double recycle = 0.3 + 0.05 * std::min(prev.leaf_area_index[i], 8.0);
            supply = kInlandTransport * nb.humidity + recycle * prev.precipitation[i] * precipToColumn;
        } else {
            supply = kOceanSaturation * qsat;
        }
        const double hum = std::max(0.0, supply + (mixed - supply) * humidityDecay);

        const double uplift    = 1.0 + std::max(0.0, elev - nb.elevation) / kUpliftScaleM;
        const double relative  = uplift * hum / qsat;
        const double condensed = std::clamp((relative - kCondenseOnset) / (1.0 - kCondenseOnset), 0.0, 1.0) * kMaxCondensed;
        const double precip    = params_.precipitation_factor * condensed * hum * kColumnMass / (kWaterDensity * rainSeconds);
        out.precipitation[i] = precip;
        // Evaporation keeps the ocean column at its supply; rain drains land columns.
        out.humidity[i]      = land ? hum * (1.0 - condensed) : hum;

        // Snow
        double snow = land ? prev.snow[i] : 0.0;
        if (land) {
            if (temp <= climate::kFreezingK && precip > 0.0)
                snow = std::min(1.0, snow + precip * seconds / kSnowDepthForCover);
            else if (temp > climate::kFreezingK)
                snow = std::max(0.0, snow - kMeltPerDegreeDay * (temp - climate::kFreezingK) * days);
        }
        out.snow[i] = snow;

        // Vegetation
        if (land) {
            const double fT = vegetation_temperature_factor(temp);
            const double fP = precip / (precip + kPrecipHalfSat);
            const double fS = std::min(1.0, q / kFullSunlight);
            const double potential = kMaxLai * fT * fP * fS * (1.0 - snow);
            out.leaf_area_index[i] = prev.leaf_area_index[i] + (potential - prev.leaf_area_index[i]) * laiResponse;
        }
    });
    return out;
}

std::pair<Planet, int> ClimateSimulator::next(const Planet& planet, int season) const
{
    const SeasonClimate& prev = planet.current_climate() ? *planet.current_climate()
                                                         : neutral_climate(planet.tile_count());
    SeasonClimate state = step(planet, prev, season);
    return {planet.with_climate(params_, std::move(state), planet.seasons()),
            (season + 1) % params_.seasons_per_cycle};
}

// -------------------- singular_climate --------------------

Planet singular_climate(const ClimateParameters& params, const Planet& planet, const ClimateRunOptions& options)
{
    const ClimateSimulator sim(params);
    if (options.max_cycles < 1)
        throw ConfigError("climate.max_cycles must be >= 1 (got " + std::to_string(options.max_cycles) + ")");

    const int n = params.seasons_per_cycle;
    const std::size_t tiles = planet.tile_count();

    spdlog::info("Climate: {} seasons per cycle, acceptable delta {}, cap {} cycles",
                 n, params.acceptable_delta, options.max_cycles);

    SeasonClimate state = neutral_climate(tiles);
    std::vector<SeasonClimate> previous;
    std::vector<SeasonClimate> cycle;
    double lastDelta = std::numeric_limits<double>::infinity();

    for (int c = 1; c <= options.max_cycles; ++c) {
        cycle.clear();
        cycle.reserve(static_cast<std::size_t>(n));
        for (int s = 0; s < n; ++s) {
            state = sim.step(planet, state, s);
            cycle.push_back(state);
            if (options.observer && !options.observer(ClimateProgress{c, s, lastDelta})) {
                spdlog::warn("Climate: cancelled at cycle {}, season {}", c, s);
                throw SimulationCancelled("climate simulation cancelled at cycle " + std::to_string(c) +
                                          ", season " + std::to_string(s));
            }
        }

        if (!previous.empty()) {
            lastDelta = 0.0;
            for (int s = 0; s < n; ++s)
                lastDelta = std::max(lastDelta, max_abs_delta(cycle[static_cast<std::size_t>(s)],
                                                              previous[static_cast<std::size_t>(s)]));
            spdlog::debug("Climate: cycle {} max delta {}", c, lastDelta);
            if (lastDelta < params.acceptable_delta) {
                spdlog::info("Climate: converged after {} cycles (delta {})", c, lastDelta);
                return planet.with_climate(params, state, std::move(cycle));
            }
        }
        previous.swap(cycle);
    }

    // `previous` now holds the last completed cycle.
    auto best = std::make_shared<const Planet>(planet.with_climate(params, state, previous));
    spdlog::warn("Climate: no convergence after {} cycles (last delta {})", options.max_cycles, lastDelta);
    throw NonConvergenceError("climate did not converge after " + std::to_string(options.max_cycles) +
                                  " cycles (last delta " + std::to_string(lastDelta) + ")",
                              lastDelta, options.max_cycles, std::move(best));
}

} // namespace orbis::worldgen
