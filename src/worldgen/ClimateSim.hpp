// src/worldgen/ClimateSim.hpp
#pragma once

// Seasonal climate iteration. One step computes season `s` from the state of
// the previous season; whole cycles repeat until two consecutive cycles agree
// within ClimateParameters::acceptable_delta.

#include "worldgen/Climate.hpp"
#include "worldgen/Planet.hpp"

#include <functional>
#include <utility>

namespace orbis::worldgen {

struct ClimateProgress {
    int    cycle = 0;          // 1-based
    int    season = 0;         // season just computed
    double last_delta = 0.0;   // max delta of the last compared cycle (inf before the first comparison)
};

// Return false to cancel the run.
using ClimateObserver = std::function<bool(const ClimateProgress&)>;

struct ClimateRunOptions {
    int max_cycles = 500;
    ClimateObserver observer;
};

// ---- per-tile physics (exposed for tests and exporters) ----

// Daily mean top-of-atmosphere flux (W/m^2) at `latitude` for solar declination `declination`.
[[nodiscard]] double daily_insolation(double latitude, double declination) noexcept;

// Saturation specific humidity (kg/kg) at temperature `kelvin` and `elevationM`.
[[nodiscard]] double saturation_humidity(double kelvin, double elevationM) noexcept;

// Vegetation temperature response: 0 at 273.15 K, 1 on [298.15, 308.15], 0 at 318.15 K.
[[nodiscard]] double vegetation_temperature_factor(double kelvin) noexcept;

class ClimateSimulator {
public:
    // Throws ConfigError for invalid parameters.
    explicit ClimateSimulator(ClimateParameters params);

    [[nodiscard]] const ClimateParameters& parameters() const noexcept { return params_; }

    // Season `season` of every tile from `previous`.
    [[nodiscard]] SeasonClimate step(const Planet& planet, const SeasonClimate& previous, int season) const;

    // Computes `season` from the planet's current state (neutral when it has
    // none) and stores it as the new current state. Returns the planet and
    // the following season number.
    [[nodiscard]] std::pair<Planet, int> next(const Planet& planet, int season) const;

private:
    ClimateParameters params_;
};

// Runs cycles from the neutral state until converged and stores the last
// cycle in the returned planet. Throws NonConvergenceError after
// options.max_cycles and SimulationCancelled when the observer says stop.
[[nodiscard]] Planet singular_climate(const ClimateParameters& params, const Planet& planet,
                                      const ClimateRunOptions& options = {});

} // namespace orbis::worldgen
