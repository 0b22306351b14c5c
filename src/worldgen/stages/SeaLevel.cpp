// src/worldgen/stages/SeaLevel.cpp
#include "worldgen/stages/StageCommon.hpp"

namespace orbis::worldgen {

void SeaLevelStage::generate(StageContext& ctx)
{
    ctx.planet = sea_level(ctx.current(name()), ctx.config.planet.sea_level);
}

} // namespace orbis::worldgen
