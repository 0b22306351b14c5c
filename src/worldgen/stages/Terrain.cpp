// src/worldgen/stages/Terrain.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Terrain.hpp"

#include <utility>

namespace orbis::worldgen {

void TerrainStage::generate(StageContext& ctx)
{
    const auto& cfg = ctx.config;
    TileField elevation = evaluate_algorithm(ctx.registry, ctx.grids, cfg.terrain);

    const Vec3 axis = make3(cfg.planet.axis[0], cfg.planet.axis[1], cfg.planet.axis[2]);
    ctx.planet = heightmap_to_planet(ctx.grids.back(), std::move(elevation), cfg.planet.radius_km, axis);
}

} // namespace orbis::worldgen
