#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "StagesApi.hpp"
#include "StageContext.hpp"
#include "AlgorithmRegistry.hpp"

namespace orbis::worldgen {

// Builds a Planet by running an ordered list of stages over one shared
// grid sequence. Generation is pure: the same config and registry give the
// same planet.
class PlanetGenerator {
public:
    PlanetGenerator(StagesRuntimeConfig config, std::shared_ptr<const AlgorithmRegistry> registry);

    // Register/override stages (call before generating)
    void clearStages();
    void addStage(StagePtr stage); // appended in order

    // Progress hook forwarded to the climate stage.
    void setClimateObserver(ClimateObserver observer) { observer_ = std::move(observer); }

    // Synchronous generation
    [[nodiscard]] Planet generate() const;

    // Convenience: generate with a temporary terrain-seed override
    [[nodiscard]] Planet generate(std::uint64_t altSeed) const;

    [[nodiscard]] const StagesRuntimeConfig& settings() const noexcept { return config_; }
    [[nodiscard]] std::vector<std::string> stageNames() const;

private:
    [[nodiscard]] Planet run_(const StagesRuntimeConfig& config) const;

private:
    StagesRuntimeConfig config_;
    std::shared_ptr<const AlgorithmRegistry> registry_;
    ClimateObserver observer_;
    std::vector<StagePtr> stages_;
};

// ----- Default stages -----
// Terrain -> SeaLevel -> Rivers (optional) -> Climate (optional)

class TerrainStage final : public IPlanetStage {
public:
    StageId id() const noexcept override { return StageId::Terrain; }
    const char* name() const noexcept override { return "Terrain"; }
    void generate(StageContext& ctx) override;
};

class SeaLevelStage final : public IPlanetStage {
public:
    StageId id() const noexcept override { return StageId::SeaLevel; }
    const char* name() const noexcept override { return "SeaLevel"; }
    void generate(StageContext& ctx) override;
};

class RiversStage final : public IPlanetStage {
public:
    StageId id() const noexcept override { return StageId::Rivers; }
    const char* name() const noexcept override { return "Rivers"; }
    void generate(StageContext& ctx) override;
};

class ClimateStage final : public IPlanetStage {
public:
    StageId id() const noexcept override { return StageId::Climate; }
    const char* name() const noexcept override { return "Climate"; }
    void generate(StageContext& ctx) override;
};

} // namespace orbis::worldgen
