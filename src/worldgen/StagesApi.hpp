// src/worldgen/StagesApi.hpp
#pragma once
#include <cstdint>
#include <memory>

namespace orbis::worldgen {

// Keep this scoped enum stable; values are logged and used to order reports.
enum class StageId : std::uint32_t {
    Terrain  = 1,
    SeaLevel = 2,
    Rivers   = 3,
    Climate  = 4
};

struct StageContext; // forward declare (definition in StageContext.hpp)

// Polymorphic interface for all planet stages. A stage reads the planet in
// the context and replaces it with a new value.
struct IPlanetStage {
    virtual ~IPlanetStage() = default;

    virtual StageId     id()   const noexcept = 0;
    virtual const char* name() const noexcept = 0;
    virtual void        generate(StageContext& ctx) = 0;
};

// Owning pointer for stages.
using StagePtr = std::unique_ptr<IPlanetStage>;

} // namespace orbis::worldgen
