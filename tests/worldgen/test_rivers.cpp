// tests/worldgen/test_rivers.cpp
//
// Flow routing: acyclic, strictly descending, discharge conserving.
#include <doctest/doctest.h>

#include "worldgen/Errors.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/Terrain.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace wg = orbis::worldgen;

namespace {

wg::Planet make_planet(const wg::GridPtr& g, std::vector<double> elevation)
{
    return wg::heightmap_to_planet(g, std::move(elevation), 1000.0, wg::make3(0, 0, 1));
}

void check_network(const wg::Planet& p)
{
    const std::size_t n = p.tile_count();
    for (std::size_t i = 0; i < n; ++i) {
        const int t = static_cast<int>(i);
        if (p.is_ocean(t)) {
            CHECK_FALSE(p.river_target(t).has_value());
            CHECK(p.discharge(t) == 0.0);
            continue;
        }
        CHECK(p.discharge(t) >= 1.0);

        // every walk ends in a sink, strictly downhill
        const std::vector<int> path = p.river_path(t);
        CHECK(path.size() <= n);
        for (std::size_t k = 1; k < path.size(); ++k)
            CHECK(p.elevation(path[k]) < p.elevation(path[k - 1]));
        CHECK(p.is_sink(path.back()));
        CHECK(p.is_land(path.back()));
    }

    // conservation: sink discharge adds up to the land tile count
    double sinks = 0.0;
    std::size_t land = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const int t = static_cast<int>(i);
        if (p.is_land(t)) {
            ++land;
            if (p.is_sink(t)) sinks += p.discharge(t);
        }
    }
    CHECK(sinks == doctest::Approx(static_cast<double>(land)));
}

} // namespace

TEST_CASE("generate_rivers: random terrain forms an acyclic network") {
    const wg::GridSequence grids = wg::build_grid_sequence(4);
    for (std::uint64_t seed : {1u, 2u, 3u}) {
        CAPTURE(seed);
        const wg::TileField h = wg::heightmap(grids, seed, 5, 2000.0, 0.6);
        const wg::Planet p = wg::generate_rivers(wg::sea_level(make_planet(grids.back(), h), 100.0));
        check_network(p);
    }
}

TEST_CASE("generate_rivers: plateaus of equal height do not route") {
    const wg::GridPtr g = wg::build_grid(3);
    const wg::Planet p = wg::generate_rivers(make_planet(g, std::vector<double>(g->tile_count(), 500.0)));
    for (std::size_t t = 0; t < p.tile_count(); ++t) {
        CHECK_FALSE(p.river_target(static_cast<int>(t)).has_value());
        CHECK(p.discharge(static_cast<int>(t)) == doctest::Approx(1.0));
    }
    check_network(p);
}

TEST_CASE("generate_rivers: lowest neighbor wins, ties by id") {
    const wg::GridPtr g = wg::build_grid(1);
    std::vector<double> h(g->tile_count(), 1000.0);
    const wg::Tile& t0 = g->tile(0);
    const int a = t0.tiles[1];
    const int b = t0.tiles[3];
    h[static_cast<std::size_t>(a)] = 400.0;
    h[static_cast<std::size_t>(b)] = 400.0;

    const wg::Planet p = wg::generate_rivers(make_planet(g, h));
    REQUIRE(p.river_target(0).has_value());
    CHECK(*p.river_target(0) == std::min(a, b));
    CHECK(p.discharge(std::min(a, b)) >= 2.0);
}

TEST_CASE("generate_rivers: coast tiles are river mouths") {
    const wg::GridPtr g = wg::build_grid(2);
    std::vector<double> h(g->tile_count(), 0.0);
    for (std::size_t t = 0; t < h.size(); ++t)
        h[t] = g->tile_center(static_cast<int>(t)).z > 0.2 ? 100.0 + 900.0 * g->tile_center(static_cast<int>(t)).z : -200.0;

    const wg::Planet p = wg::generate_rivers(make_planet(g, h));
    for (const wg::Tile& t : g->tiles()) {
        if (p.is_ocean(t.id)) continue;
        bool coast = false;
        for (int k = 0; k < t.edge_count; ++k)
            coast = coast || p.is_ocean(t.tiles[static_cast<std::size_t>(k)]);
        if (coast) CHECK(p.is_sink(t.id));
    }
    check_network(p);
}

TEST_CASE("accumulate_discharge: uphill targets are invariant violations") {
    const wg::GridPtr g = wg::build_grid(0);
    std::vector<double> h(12, 100.0);
    h[1] = 200.0;
    const wg::Planet p = make_planet(g, h);

    std::vector<int> flow(12, -1);
    flow[0] = 1;   // 100 m -> 200 m
    CHECK_THROWS_AS((void)wg::accumulate_discharge(p, flow), wg::InvariantViolation);

    std::vector<int> flat(12, -1);
    flat[2] = 3;   // equal heights
    CHECK_THROWS_AS((void)wg::accumulate_discharge(p, flat), wg::InvariantViolation);
}
