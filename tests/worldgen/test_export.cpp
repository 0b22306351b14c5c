// tests/worldgen/test_export.cpp
#include <doctest/doctest.h>

#include "worldgen/ClimateSim.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Export.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/Planet.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <vector>

namespace wg = orbis::worldgen;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

wg::Planet terrain_only()
{
    const wg::GridPtr g = wg::build_grid(1);
    std::vector<double> h(g->tile_count());
    for (std::size_t t = 0; t < h.size(); ++t)
        h[t] = 1000.0 * g->tile_center(static_cast<int>(t)).z;
    return wg::heightmap_to_planet(g, h, 100.0, wg::make3(0, 0, 1));
}

} // namespace

TEST_CASE("export_planet: terrain-only planet has one season without climate fields") {
    const wg::Planet p = terrain_only();
    const json doc = wg::export_planet(p);

    CHECK(doc["tile_count"].get<std::size_t>() == p.tile_count());
    CHECK(doc["grid_level"].get<int>() == 1);
    CHECK(doc["radius_km"].get<double>() == doctest::Approx(100.0));
    CHECK(doc["season_count"].get<int>() == 1);
    REQUIRE(doc["seasons"].size() == 1);

    const json& tiles = doc["seasons"][0]["tiles"];
    REQUIRE(tiles.size() == p.tile_count());
    const json& t0 = tiles[0];
    CHECK(t0["id"].get<int>() == 0);
    CHECK(t0["elevation"].get<double>() == doctest::Approx(p.elevation(0)));
    CHECK(t0["river_target"].is_null());
    CHECK_FALSE(t0.contains("temperature"));
    CHECK_FALSE(t0.contains("type"));
    CHECK(t0["corners"].size() == static_cast<std::size_t>(p.grid().tile_edge_count(0)));
}

TEST_CASE("export_planet: rivers and corner scaling") {
    const wg::Planet p = wg::generate_rivers(terrain_only());

    wg::ExportOptions opts;
    opts.scale_corners_by_radius = true;
    const json doc = wg::export_planet(p, opts);
    const json& tiles = doc["seasons"][0]["tiles"];

    bool sawTarget = false;
    for (const json& t : tiles) {
        const int id = t["id"].get<int>();
        if (const auto target = p.river_target(id)) {
            CHECK(t["river_target"].get<int>() == *target);
            sawTarget = true;
        }
        for (const json& c : t["corners"]) {
            const double len = std::sqrt(c[0].get<double>() * c[0].get<double>() +
                                         c[1].get<double>() * c[1].get<double>() +
                                         c[2].get<double>() * c[2].get<double>());
            CHECK(len == doctest::Approx(100.0));
        }
    }
    CHECK(sawTarget);

    opts.include_corners = false;
    CHECK_FALSE(wg::export_planet(p, opts)["seasons"][0]["tiles"][0].contains("corners"));
}

TEST_CASE("export_planet: climate planet exports every season with tile types") {
    wg::ClimateParameters params;
    params.seasons_per_cycle = 2;
    params.acceptable_delta = 1.0;
    const wg::Planet p = wg::singular_climate(params, terrain_only());

    const json doc = wg::export_planet(p);
    CHECK(doc["season_count"].get<int>() == 2);
    REQUIRE(doc["seasons"].size() == 2);
    for (int s = 0; s < 2; ++s) {
        const json& t = doc["seasons"][static_cast<std::size_t>(s)]["tiles"][3];
        CHECK(t["temperature"].get<double>() == doctest::Approx(p.temperature(3, s)));
        CHECK(t["snow"].get<double>() == doctest::Approx(p.snow(3, s)));
        CHECK(t["type"].is_string());
    }
}

TEST_CASE("write_export: writes a parseable file and reports bad paths") {
    const wg::Planet p = terrain_only();
    const fs::path dir = fs::temp_directory_path() / "orbis_export_test";
    const fs::path file = dir / "planet.json";
    fs::remove_all(dir);

    wg::write_export(p, file);
    REQUIRE(fs::exists(file));
    std::ifstream in(file);
    const json doc = json::parse(in);
    CHECK(doc["tile_count"].get<std::size_t>() == p.tile_count());
    in.close();

    // A regular file where a directory is expected.
    CHECK_THROWS_AS(wg::write_export(p, file / "nested.json"), wg::ConfigError);
    fs::remove_all(dir);
}
