// src/worldgen/StageContext.cpp
#include "worldgen/StageContext.hpp"
#include "worldgen/Errors.hpp"

#include <string>

namespace orbis::worldgen {

const Planet& StageContext::current(const char* stage) const
{
    if (!planet)
        throw InvariantViolation(std::string(stage) + " stage needs a planet; run the terrain stage first");
    return *planet;
}

} // namespace orbis::worldgen
