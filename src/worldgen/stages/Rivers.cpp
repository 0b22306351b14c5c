// src/worldgen/stages/Rivers.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Hydrology.hpp"

namespace orbis::worldgen {

void RiversStage::generate(StageContext& ctx)
{
    ctx.planet = generate_rivers(ctx.current(name()));
}

} // namespace orbis::worldgen
