// src/worldgen/Export.cpp
#include "worldgen/Export.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/TileClass.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace orbis::worldgen {
namespace {

json corner_polygon(const Planet& planet, int tile, double scale)
{
    const Grid& g = planet.grid();
    json poly = json::array();
    for (int k = 0; k < g.tile_edge_count(tile); ++k) {
        const Vec3 c = mul(g.corner_coordinates(g.tile_corner(tile, k)), scale);
        poly.push_back({c.x, c.y, c.z});
    }
    return poly;
}

json tile_entry(const Planet& planet, int t, int season, const ExportOptions& options)
{
    json e = {
        {"id", t},
        {"elevation", planet.elevation(t)},
        {"area", planet.area(t)},
        {"discharge", planet.discharge(t)},
    };
    if (const auto target = planet.river_target(t))
        e["river_target"] = *target;
    else
        e["river_target"] = nullptr;

    if (planet.has_climate()) {
        e["sunlight"]        = planet.sunlight(t, season);
        e["temperature"]     = planet.temperature(t, season);
        e["humidity"]        = planet.humidity(t, season);
        e["precipitation"]   = planet.precipitation(t, season);
        e["snow"]            = planet.snow(t, season);
        e["leaf_area_index"] = planet.leaf_area_index(t, season);
        if (options.include_tile_type)
            e["type"] = tile_type_name(classify_tile(planet, t));
    }
    if (options.include_corners)
        e["corners"] = corner_polygon(planet, t, options.scale_corners_by_radius ? planet.radius_km() : 1.0);
    return e;
}

} // namespace

json export_planet(const Planet& planet, const ExportOptions& options)
{
    const Vec3 axis = planet.axis();
    const int seasons = planet.has_climate() ? planet.season_count() : 1;

    json root = {
        {"tile_count", planet.tile_count()},
        {"grid_level", planet.grid().level()},
        {"radius_km", planet.radius_km()},
        {"sea_level", planet.sea_level()},
        {"axis", {axis.x, axis.y, axis.z}},
        {"season_count", seasons},
    };

    json list = json::array();
    for (int s = 0; s < seasons; ++s) {
        json tiles = json::array();
        for (std::size_t t = 0; t < planet.tile_count(); ++t)
            tiles.push_back(tile_entry(planet, static_cast<int>(t), s, options));
        list.push_back({{"season", s}, {"tiles", std::move(tiles)}});
    }
    root["seasons"] = std::move(list);
    return root;
}

void write_export(const Planet& planet, const fs::path& path, const ExportOptions& options)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            throw ConfigError("export: cannot create '" + path.parent_path().string() + "': " + ec.message());
    }
    std::ofstream os(path, std::ios::binary);
    if (!os)
        throw ConfigError("export: cannot open '" + path.string() + "' for writing");
    os << export_planet(planet, options).dump(2) << '\n';
    if (!os.good())
        throw ConfigError("export: write to '" + path.string() + "' failed");
    spdlog::info("Export: wrote {} tiles to {}", planet.tile_count(), path.string());
}

} // namespace orbis::worldgen
