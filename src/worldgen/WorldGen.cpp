// src/worldgen/WorldGen.cpp
#include "WorldGen.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace orbis::worldgen {

// -------------------- PlanetGenerator --------------------

PlanetGenerator::PlanetGenerator(StagesRuntimeConfig config, std::shared_ptr<const AlgorithmRegistry> registry)
    : config_(std::move(config))
    , registry_(std::move(registry))
{
    if (!registry_)
        throw ConfigError("PlanetGenerator: null algorithm registry");
    StagesConfig::validate(config_);

    // Default pipeline
    stages_.emplace_back(std::make_unique<TerrainStage>());
    stages_.emplace_back(std::make_unique<SeaLevelStage>());
    if (config_.stages.rivers)
        stages_.emplace_back(std::make_unique<RiversStage>());
    if (config_.stages.climate)
        stages_.emplace_back(std::make_unique<ClimateStage>());
}

void PlanetGenerator::clearStages() { stages_.clear(); }
void PlanetGenerator::addStage(StagePtr stage) { stages_.emplace_back(std::move(stage)); }

std::vector<std::string> PlanetGenerator::stageNames() const
{
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& st : stages_)
        names.emplace_back(st->name());
    return names;
}

Planet PlanetGenerator::run_(const StagesRuntimeConfig& config) const
{
    StageContext ctx{config, *registry_, observer_, build_grid_sequence(config.grid.level), std::nullopt};
    spdlog::info("Worldgen: level {} grid, {} tiles, algorithm '{}', seed {}",
                 config.grid.level, ctx.grids.back()->tile_count(), config.terrain.name, config.terrain.seed);

    for (const auto& st : stages_) {
        const auto t0 = std::chrono::steady_clock::now();
        spdlog::debug("Worldgen: stage {} ({}) started", st->name(), static_cast<std::uint32_t>(st->id()));
        st->generate(ctx);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        spdlog::info("Worldgen: stage {} finished in {} ms", st->name(), ms.count());
    }
    return ctx.current("final");
}

Planet PlanetGenerator::generate() const
{
    return run_(config_);
}

Planet PlanetGenerator::generate(std::uint64_t altSeed) const
{
    StagesRuntimeConfig config = config_;
    config.terrain.seed = altSeed;
    return run_(config);
}

} // namespace orbis::worldgen
