// src/worldgen/TileClass.cpp
#include "worldgen/TileClass.hpp"
#include "worldgen/Climate.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Planet.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>

namespace orbis::worldgen {
namespace {

struct Series {
    double minV = 0.0;
    double maxV = 0.0;
    double spread() const { return maxV - minV; }
};

Series series(const Planet& p, int tile, std::vector<double> SeasonClimate::*member)
{
    const auto i = static_cast<std::size_t>(tile);
    Series s;
    s.minV = s.maxV = (p.season(0).*member)[i];
    for (const SeasonClimate& c : p.seasons()) {
        s.minV = std::min(s.minV, (c.*member)[i]);
        s.maxV = std::max(s.maxV, (c.*member)[i]);
    }
    return s;
}

// 0 plain, 1 heavy, 2 hill, 3 mountain
TileType forest_type(TileType base, int variant)
{
    return static_cast<TileType>(static_cast<int>(base) + variant);
}

double ratio(std::size_t a, std::size_t b) { return b == 0 ? 0.0 : 100.0 * static_cast<double>(a) / static_cast<double>(b); }

} // namespace

TileType classify_tile(const Planet& planet, int tile, const TileClassThresholds& th)
{
    const double elev = planet.elevation(tile);
    if (elev < th.deep_ocean) return TileType::DeepOcean;
    if (elev < th.mid_ocean)  return TileType::MidOcean;
    if (elev < 0.0)           return TileType::SurfaceOcean;

    if (!planet.has_climate())
        throw InvariantViolation("classify_tile: land tile " + std::to_string(tile) + " needs a planet with climate");

    const Series lai  = series(planet, tile, &SeasonClimate::leaf_area_index);
    const Series temp = series(planet, tile, &SeasonClimate::temperature);

    // Wetlands: flat, wet in every season that is not frozen, never frozen all year.
    if (elev < th.hill) {
        const auto i = static_cast<std::size_t>(tile);
        bool wet = true;
        double snowSum = 0.0;
        for (const SeasonClimate& c : planet.seasons()) {
            wet = wet && (c.precipitation[i] > th.wetlands_precipitation || c.snow[i] > 0.0);
            snowSum += c.snow[i];
        }
        if (wet && snowSum < static_cast<double>(planet.season_count()))
            return lai.maxV > th.savanna_lai ? TileType::Swamp : TileType::Marsh;
    }

    if (lai.maxV > th.forest_lai) {
        TileType base;
        if (lai.spread() < th.jungle_lai_spread && temp.minV > th.jungle_min_temp)
            base = TileType::JungleForest;
        else if (lai.spread() < th.boreal_lai_spread)
            base = TileType::BorealForest;
        else if (lai.spread() > th.deciduous_lai_spread)
            base = TileType::DeciduousForest;
        else
            base = TileType::MixedForest;

        if (elev > th.mountain)              return forest_type(base, 3);
        if (elev > th.hill)                  return forest_type(base, 2);
        if (lai.maxV > th.heavy_forest_lai)  return forest_type(base, 1);
        return base;
    }

    if (elev > th.mountain) {
        // Warmest season cooled by 1 K per 100 m.
        const Series snow = series(planet, tile, &SeasonClimate::snow);
        if (snow.minV > 0.0 || temp.maxV - elev / 100.0 < climate::kFreezingK)
            return TileType::SnowMountain;
        return TileType::Mountain;
    }

    if (lai.maxV > th.savanna_lai)
        return elev > th.hill ? TileType::HillSavanna : TileType::Savanna;

    if (lai.maxV > th.land_lai)                 return TileType::Grass;
    if (temp.minV > th.sand_desert_min_temp)    return TileType::SandDesert;
    if (temp.maxV < th.snow_desert_max_temp)    return TileType::SnowDesert;
    return TileType::Desert;
}

const char* tile_type_name(TileType t) noexcept
{
    switch (t) {
        case TileType::DeepOcean:               return "Deep Ocean";
        case TileType::MidOcean:                return "Mid Ocean";
        case TileType::SurfaceOcean:            return "Surface Ocean";
        case TileType::Swamp:                   return "Swamp";
        case TileType::Marsh:                   return "Marsh";
        case TileType::JungleForest:            return "Jungle Forest";
        case TileType::HeavyJungleForest:       return "Heavy Jungle Forest";
        case TileType::HillJungleForest:        return "Hill Jungle Forest";
        case TileType::MountainJungleForest:    return "Mountain Jungle Forest";
        case TileType::BorealForest:            return "Boreal Forest";
        case TileType::HeavyBorealForest:       return "Heavy Boreal Forest";
        case TileType::HillBorealForest:        return "Hill Boreal Forest";
        case TileType::MountainBorealForest:    return "Mountain Boreal Forest";
        case TileType::MixedForest:             return "Mixed Forest";
        case TileType::HeavyMixedForest:        return "Heavy Mixed Forest";
        case TileType::HillMixedForest:         return "Hill Mixed Forest";
        case TileType::MountainMixedForest:     return "Mountain Mixed Forest";
        case TileType::DeciduousForest:         return "Deciduous Forest";
        case TileType::HeavyDeciduousForest:    return "Heavy Deciduous Forest";
        case TileType::HillDeciduousForest:     return "Hill Deciduous Forest";
        case TileType::MountainDeciduousForest: return "Mountain Deciduous Forest";
        case TileType::Mountain:                return "Mountain";
        case TileType::SnowMountain:            return "Snow Mountain";
        case TileType::Savanna:                 return "Savanna";
        case TileType::HillSavanna:             return "Hill Savanna";
        case TileType::Grass:                   return "Grass";
        case TileType::SandDesert:              return "Sand Desert";
        case TileType::SnowDesert:              return "Snow Desert";
        case TileType::Desert:                  return "Desert";
        case TileType::Count:                   break;
    }
    return "Unknown";
}

bool is_forest(TileType t) noexcept
{
    return t >= TileType::JungleForest && t <= TileType::MountainDeciduousForest;
}

bool is_ocean(TileType t) noexcept
{
    return t == TileType::DeepOcean || t == TileType::MidOcean || t == TileType::SurfaceOcean;
}

bool is_hill(TileType t) noexcept
{
    switch (t) {
        case TileType::HillJungleForest:
        case TileType::HillBorealForest:
        case TileType::HillMixedForest:
        case TileType::HillDeciduousForest:
        case TileType::HillSavanna:
            return true;
        default:
            return false;
    }
}

bool is_mountain(TileType t) noexcept
{
    switch (t) {
        case TileType::MountainJungleForest:
        case TileType::MountainBorealForest:
        case TileType::MountainMixedForest:
        case TileType::MountainDeciduousForest:
        case TileType::Mountain:
        case TileType::SnowMountain:
            return true;
        default:
            return false;
    }
}

// -------------------- statistics --------------------

namespace {
std::size_t sum_family(const TileStatistics& s, TileType base)
{
    std::size_t n = 0;
    for (int v = 0; v < 4; ++v) n += s.count(forest_type(base, v));
    return n;
}
} // namespace

std::size_t TileStatistics::jungle() const noexcept    { return sum_family(*this, TileType::JungleForest); }
std::size_t TileStatistics::boreal() const noexcept    { return sum_family(*this, TileType::BorealForest); }
std::size_t TileStatistics::mixed() const noexcept     { return sum_family(*this, TileType::MixedForest); }
std::size_t TileStatistics::deciduous() const noexcept { return sum_family(*this, TileType::DeciduousForest); }
std::size_t TileStatistics::forests() const noexcept   { return jungle() + boreal() + mixed() + deciduous(); }
std::size_t TileStatistics::savanna() const noexcept   { return count(TileType::Savanna) + count(TileType::HillSavanna); }
std::size_t TileStatistics::wetlands() const noexcept  { return count(TileType::Swamp) + count(TileType::Marsh); }
std::size_t TileStatistics::deserts() const noexcept
{
    return count(TileType::SandDesert) + count(TileType::SnowDesert) + count(TileType::Desert);
}

TileStatistics gather_statistics(const Planet& planet, const TileClassThresholds& th)
{
    TileStatistics s;
    s.total = planet.tile_count();
    s.classified = planet.has_climate();

    for (std::size_t i = 0; i < s.total; ++i) {
        const int t = static_cast<int>(i);
        const double elev = planet.elevation(t);
        if (elev < 0.0) {
            ++s.ocean;
        } else {
            ++s.land;
        }

        if (s.classified) {
            const TileType type = classify_tile(planet, t, th);
            ++s.by_type[static_cast<std::size_t>(type)];
            if (is_mountain(type))  ++s.mountain;
            else if (is_hill(type)) ++s.hill;
        } else if (elev >= 0.0) {
            if (elev > th.mountain)  ++s.mountain;
            else if (elev > th.hill) ++s.hill;
        }
    }
    s.flat = s.land - s.hill - s.mountain;
    return s;
}

std::string format_statistics(const TileStatistics& s)
{
    std::string out;
    out += fmt::format("Ocean: {:.2f}%\n", ratio(s.ocean, s.total));
    out += fmt::format("Land: {:.2f}%\n", ratio(s.land, s.total));
    out += fmt::format("    Hill: {:.2f}%\n", ratio(s.hill, s.land));
    out += fmt::format("    Mountain: {:.2f}%\n", ratio(s.mountain, s.land));
    out += fmt::format("    Flat: {:.2f}%\n", ratio(s.flat, s.land));
    if (!s.classified)
        return out;

    const std::size_t forests = s.forests();
    const std::size_t deserts = s.deserts();
    const std::size_t wet     = s.wetlands();
    out += fmt::format("Forests: {:.2f}%\n", ratio(forests, s.land));
    out += fmt::format("    Jungle: {:.2f}%\n", ratio(s.jungle(), forests));
    out += fmt::format("    Deciduous: {:.2f}%\n", ratio(s.deciduous(), forests));
    out += fmt::format("    Boreal: {:.2f}%\n", ratio(s.boreal(), forests));
    out += fmt::format("    Mixed: {:.2f}%\n", ratio(s.mixed(), forests));
    out += fmt::format("Savanna: {:.2f}%\n", ratio(s.savanna(), s.land));
    out += fmt::format("Grass: {:.2f}%\n", ratio(s.count(TileType::Grass), s.land));
    out += fmt::format("Desert: {:.2f}%\n", ratio(deserts, s.land));
    out += fmt::format("    Warm Desert: {:.2f}%\n", ratio(s.count(TileType::SandDesert), deserts));
    out += fmt::format("    Snow Desert: {:.2f}%\n", ratio(s.count(TileType::SnowDesert), deserts));
    out += fmt::format("    Bare land: {:.2f}%\n", ratio(s.count(TileType::Desert), deserts));
    out += fmt::format("Wetlands: {:.2f}%\n", ratio(wet, s.land));
    out += fmt::format("    Marsh: {:.2f}%\n", ratio(s.count(TileType::Marsh), wet));
    out += fmt::format("    Swamp: {:.2f}%\n", ratio(s.count(TileType::Swamp), wet));
    return out;
}

} // namespace orbis::worldgen
