// src/worldgen/Climate.hpp
#pragma once

// Climate parameters and per-season climate state.
//
// Keep this header lightweight: Planet stores these values directly.

#include <vector>

namespace orbis::worldgen {

namespace climate {
    inline constexpr double kYearDays       = 365.25;
    inline constexpr double kSecondsPerDay  = 86400.0;
    inline constexpr double kSolarConstant  = 1361.0;   // W/m^2
    inline constexpr double kFreezingK      = 273.15;
    inline constexpr double kNeutralTempK   = 288.15;   // ~15 C, starting temperature
} // namespace climate

struct ClimateParameters final {
    // Obliquity of the rotation axis (radians). Earth ~ 0.4091 (23.44 deg).
    double axial_tilt = 0.4091;

    // Convergence threshold: max absolute change of any field between cycles.
    double acceptable_delta = 0.05;

    // Scales condensed humidity into precipitation.
    double precipitation_factor = 1.0;

    // Time for column humidity to halve without replenishment.
    double humidity_half_life_days = 7.0;

    int seasons_per_cycle = 4;
};

// Throws ConfigError for seasons_per_cycle <= 0, acceptable_delta <= 0,
// half-life <= 0, negative precipitation factor or non-finite tilt.
void validate(const ClimateParameters& params);

[[nodiscard]] inline double season_days(const ClimateParameters& p) noexcept {
    return climate::kYearDays / static_cast<double>(p.seasons_per_cycle);
}

// Climate of every tile for one season. All vectors hold tile_count values.
struct SeasonClimate {
    int season = 0;
    std::vector<double> insolation;        // W/m^2, daily mean
    std::vector<double> temperature;       // K
    std::vector<double> humidity;          // kg/kg
    std::vector<double> precipitation;     // m/s of water
    std::vector<double> snow;              // cover fraction 0..1
    std::vector<double> leaf_area_index;
};

// Temperature 288.15 K, every other field zero.
[[nodiscard]] SeasonClimate neutral_climate(std::size_t tileCount, int season = 0);

// Largest absolute per-tile difference over every tracked field.
[[nodiscard]] double max_abs_delta(const SeasonClimate& a, const SeasonClimate& b);

} // namespace orbis::worldgen
