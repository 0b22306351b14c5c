#include "StagesConfig.hpp"

#include "worldgen/Errors.hpp"
#include "worldgen/Grid.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/Terrain.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <type_traits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace orbis::worldgen {
namespace {

// Missing key => fallback. A present key of the wrong type is an error.
template <typename T>
T GetOr(const json& j, const char* section, const char* key, const T& fallback)
{
    auto it = j.find(key);
    if (it == j.end())
        return fallback;

    const auto fail = [&](const char* expected) {
        return ConfigError(std::string(section) + "." + key + ": expected " + expected +
                           ", got " + it->type_name());
    };
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) throw fail("boolean");
    } else if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) throw fail("non-negative integer");
        const auto v = it->get<std::uint64_t>();
        if constexpr (sizeof(T) < sizeof(std::uint64_t)) {
            if (v > std::numeric_limits<T>::max())
                throw ConfigError(std::string(section) + "." + key + ": " + std::to_string(v) + " is out of range");
        }
        return static_cast<T>(v);
    } else if constexpr (std::is_integral_v<T>) {
        if (!it->is_number_integer()) throw fail("integer");
        // Above int64 max.
        if (it->is_number_unsigned() && it->get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            throw ConfigError(std::string(section) + "." + key + ": " + it->dump() + " is out of range");
        const auto v = it->get<std::int64_t>();
        if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max())
            throw ConfigError(std::string(section) + "." + key + ": " + std::to_string(v) + " is out of range");
        return static_cast<T>(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number()) throw fail("number");
    } else {
        if (!it->is_string()) throw fail("string");
    }
    return it->get<T>();
}

const json& Section(const json& root, const char* name)
{
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end())
        return empty;
    if (!it->is_object())
        throw ConfigError(std::string(name) + ": section must be a JSON object");
    return *it;
}

} // namespace

StagesRuntimeConfig StagesConfig::from_json(const json& root)
{
    if (!root.is_object())
        throw ConfigError("config: top level must be a JSON object");

    StagesRuntimeConfig cfg;

    // Grid
    const json& grid = Section(root, "grid");
    cfg.grid.level = GetOr<int>(grid, "grid", "level", cfg.grid.level);

    // Terrain
    const json& terrain = Section(root, "terrain");
    cfg.terrain.name        = GetOr<std::string>  (terrain, "terrain", "algorithm",   cfg.terrain.name);
    cfg.terrain.seed        = GetOr<std::uint64_t>(terrain, "terrain", "seed",        cfg.terrain.seed);
    cfg.terrain.octaves     = GetOr<int>          (terrain, "terrain", "octaves",     cfg.terrain.octaves);
    cfg.terrain.magnitude   = GetOr<double>       (terrain, "terrain", "magnitude",   cfg.terrain.magnitude);
    cfg.terrain.persistence = GetOr<double>       (terrain, "terrain", "persistence", cfg.terrain.persistence);

    // Planet
    const json& planet = Section(root, "planet");
    cfg.planet.radius_km = GetOr<double>(planet, "planet", "radius_km", cfg.planet.radius_km);
    cfg.planet.sea_level = GetOr<double>(planet, "planet", "sea_level", cfg.planet.sea_level);
    if (auto it = planet.find("axis"); it != planet.end()) {
        if (!it->is_array() || it->size() != 3)
            throw ConfigError("planet.axis: expected an array of 3 numbers");
        for (std::size_t i = 0; i < 3; ++i) {
            if (!(*it)[i].is_number())
                throw ConfigError("planet.axis: expected an array of 3 numbers");
            cfg.planet.axis[i] = (*it)[i].get<double>();
        }
    }

    // Climate
    const json& climate = Section(root, "climate");
    ClimateParameters& cp = cfg.climate.params;
    const double tiltDeg = GetOr<double>(climate, "climate", "axial_tilt_deg", cp.axial_tilt * 180.0 / kPi);
    cp.axial_tilt              = tiltDeg * kPi / 180.0;
    cp.acceptable_delta        = GetOr<double>(climate, "climate", "acceptable_delta",        cp.acceptable_delta);
    cp.precipitation_factor    = GetOr<double>(climate, "climate", "precipitation_factor",    cp.precipitation_factor);
    cp.humidity_half_life_days = GetOr<double>(climate, "climate", "humidity_half_life_days", cp.humidity_half_life_days);
    cp.seasons_per_cycle       = GetOr<int>   (climate, "climate", "seasons_per_cycle",       cp.seasons_per_cycle);
    cfg.climate.max_cycles     = GetOr<int>   (climate, "climate", "max_cycles",              cfg.climate.max_cycles);

    // Stages
    const json& stages = Section(root, "stages");
    cfg.stages.rivers  = GetOr<bool>(stages, "stages", "rivers",  cfg.stages.rivers);
    cfg.stages.climate = GetOr<bool>(stages, "stages", "climate", cfg.stages.climate);

    // Algorithms
    const json& algorithms = Section(root, "algorithms");
    cfg.algorithms.directory = GetOr<std::string>(algorithms, "algorithms", "directory", cfg.algorithms.directory);
    cfg.algorithms.category  = GetOr<std::string>(algorithms, "algorithms", "category",  cfg.algorithms.category);

    // Log
    const json& log = Section(root, "log");
    cfg.log.level = GetOr<std::string>(log, "log", "level", cfg.log.level);
    cfg.log.file  = GetOr<std::string>(log, "log", "file",  cfg.log.file);

    validate(cfg);
    return cfg;
}

StagesRuntimeConfig StagesConfig::load(const fs::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw ConfigError("config: could not open '" + path.string() + "'");

    json root;
    try
    {
        f >> root;
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError("config: parse error in '" + path.string() + "': " + e.what());
    }

    StagesRuntimeConfig cfg = from_json(root);
    spdlog::debug("Config: loaded {}", path.string());
    return cfg;
}

void StagesConfig::validate(const StagesRuntimeConfig& cfg)
{
    if (cfg.grid.level < 0 || cfg.grid.level > Grid::kMaxLevel)
        throw ConfigError("grid.level must be in [0, " + std::to_string(Grid::kMaxLevel) + "]");
    if (cfg.terrain.name.empty())
        throw ConfigError("terrain.algorithm must not be empty");
    worldgen::validate(cfg.terrain);

    if (!(cfg.planet.radius_km > 0.0) || !std::isfinite(cfg.planet.radius_km))
        throw ConfigError("planet.radius_km must be a finite value > 0");
    const Vec3 axis = make3(cfg.planet.axis[0], cfg.planet.axis[1], cfg.planet.axis[2]);
    if (!(length(axis) > 0.0) || !std::isfinite(length(axis)))
        throw ConfigError("planet.axis must be a finite non-zero vector");
    if (!std::isfinite(cfg.planet.sea_level))
        throw ConfigError("planet.sea_level must be finite");

    worldgen::validate(cfg.climate.params);
    if (cfg.climate.max_cycles < 1)
        throw ConfigError("climate.max_cycles must be >= 1");

    if (cfg.algorithms.category.empty())
        throw ConfigError("algorithms.category must not be empty");
}

fs::path StagesConfig::default_path()
{
    return fs::path("assets") / "config" / "planet.json";
}

} // namespace orbis::worldgen
