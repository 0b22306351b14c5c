// src/worldgen/stages/Climate.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/ClimateSim.hpp"

namespace orbis::worldgen {

void ClimateStage::generate(StageContext& ctx)
{
    ClimateRunOptions options;
    options.max_cycles = ctx.config.climate.max_cycles;
    options.observer = ctx.observer;

    ctx.planet = singular_climate(ctx.config.climate.params, ctx.current(name()), options);
}

} // namespace orbis::worldgen
