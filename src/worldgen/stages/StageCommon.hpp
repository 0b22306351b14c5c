// src/worldgen/stages/StageCommon.hpp
#pragma once
#include "worldgen/WorldGen.hpp"      // StageId + IPlanetStage
#include "worldgen/StageContext.hpp"  // StageContext
