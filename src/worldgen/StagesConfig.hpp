#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <filesystem>
#include <string>

#include "worldgen/Climate.hpp"
#include "worldgen/TerrainExpr.hpp"

namespace orbis::worldgen {

// [grid]
struct GridConfig {
    int level = 5;
};

// [planet]
struct PlanetConfig {
    double radius_km = 6371.0;
    std::array<double, 3> axis{0.0, 0.0, 1.0};
    double sea_level = 0.0;   // meters subtracted from every elevation
};

// [climate] run options on top of ClimateParameters
struct ClimateRunConfig {
    ClimateParameters params{};
    int max_cycles = 500;
};

// [stages]
struct StageToggles {
    bool rivers  = true;
    bool climate = true;
};

// [algorithms]
struct AlgorithmsConfig {
    std::string directory = "assets/algorithms";
    std::string category  = "terrain";
};

// [log]
struct LogConfig {
    std::string level = "info";
    std::string file;   // empty => console only
};

// Aggregate runtime config loaded from JSON.
struct StagesRuntimeConfig {
    GridConfig        grid{};
    TerrainParameters terrain{};
    PlanetConfig      planet{};
    ClimateRunConfig  climate{};
    StageToggles      stages{};
    AlgorithmsConfig  algorithms{};
    LogConfig         log{};
};

class StagesConfig {
public:
    // Load or throw ConfigError: unreadable file, parse error, type mismatch
    // or an invalid value. Missing keys keep their defaults.
    static StagesRuntimeConfig load(const std::filesystem::path& path);

    // Same rules for an already parsed document.
    static StagesRuntimeConfig from_json(const nlohmann::json& root);

    // Throws ConfigError on the first invalid value.
    static void validate(const StagesRuntimeConfig& cfg);

    // Compute default path: assets/config/planet.json
    static std::filesystem::path default_path();
};

} // namespace orbis::worldgen
