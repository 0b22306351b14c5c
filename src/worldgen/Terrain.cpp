// src/worldgen/Terrain.cpp
#include "worldgen/Terrain.hpp"
#include "worldgen/AlgorithmRegistry.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Random.hpp"
#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

namespace orbis::worldgen {
namespace {

class Evaluator {
public:
    Evaluator(const GridSequence& grids, const TerrainParameters& params, const AlgorithmRegistry* registry)
        : grids_(grids), params_(params), registry_(registry) {}

    TileField run(const TerrainExpr& e)
    {
        return std::visit([this](const auto& n) { return eval(n); }, e.node);
    }

private:
    std::size_t tiles() const { return grids_.back()->tile_count(); }

    TileField eval(const expr::Constant& n) { return TileField(tiles(), n.value); }

    TileField eval(const expr::Heightmap& n)
    {
        return heightmap(grids_,
                         n.seed.value_or(params_.seed),
                         n.octaves.value_or(params_.octaves),
                         n.magnitude.value_or(params_.magnitude),
                         n.persistence.value_or(params_.persistence));
    }

    TileField eval(const expr::Lower& n) { return elevation_lower(n.threshold, run(*n.source)); }

    TileField eval(const expr::Relief& n) { return combine_relief(run(*n.continent), run(*n.mountain)); }

    TileField eval(const expr::Add& n)
    {
        TileField sum(tiles(), 0.0);
        for (const auto& term : n.terms) {
            const TileField v = run(*term);
            for (std::size_t i = 0; i < sum.size(); ++i) sum[i] += v[i];
        }
        return sum;
    }

    TileField eval(const expr::Scale& n)
    {
        TileField v = run(*n.source);
        for (double& x : v) x *= n.factor;
        return v;
    }

    TileField eval(const expr::Ref& n)
    {
        if (!registry_)
            throw ConfigError("terrain: ref '" + n.name + "' needs an algorithm registry");
        // The registry rejects cycles at construction; depth guards against
        // hand-built expression trees.
        if (++depth_ > 64)
            throw ConfigError("terrain: ref chain too deep at '" + n.name + "'");
        TileField v = run(registry_->at(n.name));
        --depth_;
        return v;
    }

    const GridSequence&      grids_;
    const TerrainParameters& params_;
    const AlgorithmRegistry* registry_ = nullptr;
    int depth_ = 0;
};

void check_sequence(const GridSequence& grids)
{
    if (grids.empty())
        throw ConfigError("terrain: empty grid sequence");
    for (std::size_t k = 0; k < grids.size(); ++k)
        if (!grids[k] || grids[k]->level() != static_cast<int>(k))
            throw ConfigError("terrain: grid sequence must hold levels 0.." + std::to_string(grids.size() - 1));
}

TileField evaluate_impl(const TerrainExpr& e, const GridSequence& grids,
                        const TerrainParameters& params, const AlgorithmRegistry* registry)
{
    validate(params);
    check_sequence(grids);
    Evaluator ev(grids, params, registry);
    TileField out = ev.run(e);
    spdlog::debug("Terrain: evaluated {} tiles at level {}", out.size(), grids.back()->level());
    return out;
}

} // namespace

void validate(const TerrainParameters& params)
{
    if (params.octaves < 0)
        throw ConfigError("terrain.octaves must be >= 0 (got " + std::to_string(params.octaves) + ")");
    if (!(params.persistence >= 0.0) || !std::isfinite(params.persistence))
        throw ConfigError("terrain.persistence must be a finite value >= 0");
    if (!std::isfinite(params.magnitude))
        throw ConfigError("terrain.magnitude must be finite");
}

TileField evaluate(const TerrainExpr& e, const GridSequence& grids, const TerrainParameters& params)
{
    return evaluate_impl(e, grids, params, nullptr);
}

TileField evaluate(const TerrainExpr& e, const GridSequence& grids,
                   const TerrainParameters& params, const AlgorithmRegistry& registry)
{
    return evaluate_impl(e, grids, params, &registry);
}

TileField evaluate_algorithm(const AlgorithmRegistry& registry, const GridSequence& grids,
                             const TerrainParameters& params)
{
    return evaluate_impl(registry.at(params.name), grids, params, &registry);
}

TileField heightmap(const GridSequence& grids, std::uint64_t seed, int octaves,
                    double magnitude, double persistence)
{
    check_sequence(grids);
    if (octaves < 0)
        throw ConfigError("heightmap: octaves must be >= 0");
    if (!(persistence >= 0.0))
        throw ConfigError("heightmap: persistence must be >= 0");

    const Grid& g0 = *grids.front();
    TileField field(g0.tile_count());
    for (std::size_t t = 0; t < field.size(); ++t) {
        Pcg32 rng = tile_rng(seed, 0, static_cast<int>(t));
        field[t] = magnitude * rng.next_signed();
    }

    double amplitude = magnitude;
    for (std::size_t k = 1; k < grids.size(); ++k) {
        const Grid& g = *grids[k];
        const int level = static_cast<int>(k);
        amplitude *= persistence;
        const bool displace = level < octaves;

        const std::size_t first = g.previous_tile_count();
        field.resize(g.tile_count());
        jobs::parallel_for_index(first, g.tile_count(), [&](std::size_t t) {
            const auto p = g.parents(static_cast<int>(t));
            double v = 0.5 * (field[static_cast<std::size_t>(p[0])] + field[static_cast<std::size_t>(p[1])]);
            if (displace) {
                Pcg32 rng = tile_rng(seed, level, static_cast<int>(t));
                v += amplitude * rng.next_signed();
            }
            field[t] = v;
        });
    }
    return field;
}

TileField elevation_lower(double threshold, TileField field)
{
    for (double& v : field)
        if (v < threshold) v -= threshold;
    return field;
}

TileField combine_relief(const TileField& continent, const TileField& mountain)
{
    if (continent.size() != mountain.size())
        throw ConfigError("relief: continent and mountain fields differ in size (" +
                          std::to_string(continent.size()) + " vs " + std::to_string(mountain.size()) + ")");
    TileField out(continent.size());
    for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = (mountain[i] > 0.0 && continent[i] > 0.0) ? continent[i] + mountain[i] : continent[i];
    return out;
}

} // namespace orbis::worldgen
