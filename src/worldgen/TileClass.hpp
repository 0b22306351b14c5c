#pragma once
// -----------------------------------------------------------------------------
// src/worldgen/TileClass.hpp
// Per-tile terrain type from elevation plus the converged seasonal climate
// (leaf-area-index, precipitation, snow, temperature), and planet-wide
// statistics over those types.
// -----------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <string>

namespace orbis::worldgen {

class Planet;

enum class TileType : std::uint8_t {
    DeepOcean, MidOcean, SurfaceOcean,
    Swamp, Marsh,
    JungleForest, HeavyJungleForest, HillJungleForest, MountainJungleForest,
    BorealForest, HeavyBorealForest, HillBorealForest, MountainBorealForest,
    MixedForest, HeavyMixedForest, HillMixedForest, MountainMixedForest,
    DeciduousForest, HeavyDeciduousForest, HillDeciduousForest, MountainDeciduousForest,
    Mountain, SnowMountain,
    Savanna, HillSavanna,
    Grass,
    SandDesert, SnowDesert, Desert,
    Count
};

inline constexpr std::size_t kTileTypeCount = static_cast<std::size_t>(TileType::Count);

struct TileClassThresholds {
    // Elevation bands (m)
    double mountain   = 825.0;
    double hill       = 500.0;
    double mid_ocean  = -1500.0;
    double deep_ocean = -3500.0;

    // Leaf-area-index, reached in at least one season
    double heavy_forest_lai = 8.0;
    double forest_lai       = 6.25;
    double savanna_lai      = 5.9;
    double land_lai         = 4.0;

    // Temperatures (K)
    double sand_desert_min_temp = 288.15;
    double snow_desert_max_temp = 283.15;
    double jungle_min_temp      = 303.15;

    // Precipitation (m/s) every unfrozen season must exceed for wetlands
    double wetlands_precipitation = 2e-8;

    // Seasonal LAI spread (max - min)
    double jungle_lai_spread    = 2.0;
    double boreal_lai_spread    = 6.5;
    double deciduous_lai_spread = 8.0;
};

// Needs a planet with a converged climate for land tiles; ocean tiles are
// classified by depth alone. Throws InvariantViolation for land tiles of a
// planet without climate.
[[nodiscard]] TileType classify_tile(const Planet& planet, int tile, const TileClassThresholds& th = {});

[[nodiscard]] const char* tile_type_name(TileType t) noexcept;

[[nodiscard]] bool is_forest(TileType t) noexcept;
[[nodiscard]] bool is_ocean(TileType t) noexcept;
// Types whose name carries "Hill" / "Mountain".
[[nodiscard]] bool is_hill(TileType t) noexcept;
[[nodiscard]] bool is_mountain(TileType t) noexcept;

struct TileStatistics {
    std::size_t total = 0;
    std::size_t ocean = 0;
    std::size_t land  = 0;

    // Relief of land tiles: by type name once classified, by elevation
    // band otherwise. A desert or wetland on high ground counts as flat.
    std::size_t mountain = 0;
    std::size_t hill     = 0;
    std::size_t flat     = 0;

    // Only filled for planets with climate.
    bool classified = false;
    std::array<std::size_t, kTileTypeCount> by_type{};

    [[nodiscard]] std::size_t count(TileType t) const noexcept { return by_type[static_cast<std::size_t>(t)]; }
    [[nodiscard]] std::size_t forests() const noexcept;
    [[nodiscard]] std::size_t jungle() const noexcept;
    [[nodiscard]] std::size_t boreal() const noexcept;
    [[nodiscard]] std::size_t mixed() const noexcept;
    [[nodiscard]] std::size_t deciduous() const noexcept;
    [[nodiscard]] std::size_t savanna() const noexcept;
    [[nodiscard]] std::size_t deserts() const noexcept;
    [[nodiscard]] std::size_t wetlands() const noexcept;
};

[[nodiscard]] TileStatistics gather_statistics(const Planet& planet, const TileClassThresholds& th = {});

// Multi-line percentage report ("Ocean: 70.00%" ...).
[[nodiscard]] std::string format_statistics(const TileStatistics& s);

} // namespace orbis::worldgen
