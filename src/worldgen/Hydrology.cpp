// src/worldgen/Hydrology.cpp

#include "worldgen/Hydrology.hpp"
#include "worldgen/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace orbis::worldgen {
namespace {

bool touches_ocean(const Planet& planet, const Tile& t)
{
    for (int k = 0; k < t.edge_count; ++k)
        if (planet.is_ocean(t.tiles[static_cast<std::size_t>(k)]))
            return true;
    return false;
}

} // namespace

std::vector<int> compute_flow(const Planet& planet)
{
    const Grid& g = planet.grid();
    const std::vector<double>& h = planet.elevations();
    std::vector<int> down(planet.tile_count(), -1);

    for (const Tile& t : g.tiles()) {
        const std::size_t i = static_cast<std::size_t>(t.id);
        if (h[i] < 0.0 || touches_ocean(planet, t))
            continue;

        int best = -1;
        double bestH = h[i];
        for (int k = 0; k < t.edge_count; ++k) {
            const int n = t.tiles[static_cast<std::size_t>(k)];
            const double hn = h[static_cast<std::size_t>(n)];
            if (hn < bestH || (best >= 0 && hn == bestH && n < best)) {
                best = n;
                bestH = hn;
            }
        }
        down[i] = best;
    }
    return down;
}

std::vector<double> accumulate_discharge(const Planet& planet, const std::vector<int>& flow)
{
    const std::vector<double>& h = planet.elevations();
    const std::size_t n = planet.tile_count();
    if (flow.size() != n)
        throw InvariantViolation("flow size does not match tile count");

    // Land tiles, highest first; equal heights in id order.
    std::vector<int> order;
    order.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        if (h[i] >= 0.0) order.push_back(static_cast<int>(i));
    std::sort(order.begin(), order.end(), [&h](int a, int b) {
        const double ha = h[static_cast<std::size_t>(a)];
        const double hb = h[static_cast<std::size_t>(b)];
        return ha != hb ? ha > hb : a < b;
    });

    std::vector<double> q(n, 0.0);
    for (int t : order)
        q[static_cast<std::size_t>(t)] = 1.0;

    for (int t : order) {
        const int d = flow[static_cast<std::size_t>(t)];
        if (d < 0) continue;
        if (d >= static_cast<int>(n) || !(h[static_cast<std::size_t>(d)] < h[static_cast<std::size_t>(t)]))
            throw InvariantViolation("river from tile " + std::to_string(t) + " to tile " + std::to_string(d) +
                                     " does not descend");
        q[static_cast<std::size_t>(d)] += q[static_cast<std::size_t>(t)];
    }
    return q;
}

Planet generate_rivers(const Planet& planet)
{
    std::vector<int> flow = compute_flow(planet);
    std::vector<double> q = accumulate_discharge(planet, flow);

    if (spdlog::should_log(spdlog::level::debug)) {
        int sinks = 0;
        double peak = 0.0;
        for (std::size_t i = 0; i < flow.size(); ++i) {
            if (planet.is_land(static_cast<int>(i)) && flow[i] < 0) ++sinks;
            peak = std::max(peak, q[i]);
        }
        spdlog::debug("Rivers: {} sinks, peak discharge {}", sinks, peak);
    }
    return planet.with_rivers(std::move(flow), std::move(q));
}

} // namespace orbis::worldgen
