// tests/worldgen/test_config.cpp
#include <doctest/doctest.h>

#include "logging/Log.h"
#include "worldgen/Errors.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/StagesConfig.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace wg = orbis::worldgen;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Returns the message of the ConfigError thrown by from_json, or "" if none.
std::string config_error(const json& doc)
{
    try {
        (void)wg::StagesConfig::from_json(doc);
    } catch (const wg::ConfigError& e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST_CASE("StagesConfig::from_json: empty object keeps defaults") {
    const wg::StagesRuntimeConfig cfg = wg::StagesConfig::from_json(json::object());
    CHECK(cfg.grid.level == 5);
    CHECK(cfg.terrain.name == "default");
    CHECK(cfg.terrain.seed == 1);
    CHECK(cfg.planet.radius_km == doctest::Approx(6371.0));
    CHECK(cfg.planet.axis[2] == doctest::Approx(1.0));
    CHECK(cfg.climate.max_cycles == 500);
    CHECK(cfg.climate.params.seasons_per_cycle == 4);
    CHECK(cfg.stages.rivers);
    CHECK(cfg.stages.climate);
    CHECK(cfg.algorithms.category == "terrain");
    CHECK(cfg.log.level == "info");
}

TEST_CASE("StagesConfig::from_json: values override defaults") {
    const json doc = {
        {"grid", {{"level", 3}}},
        {"terrain", {{"algorithm", "archipelago"}, {"seed", 99}, {"octaves", 4}}},
        {"planet", {{"radius_km", 3390.0}, {"axis", {0.0, 1.0, 0.0}}, {"sea_level", 120.0}}},
        {"climate", {{"axial_tilt_deg", 90.0}, {"seasons_per_cycle", 2}, {"max_cycles", 10}}},
        {"stages", {{"rivers", false}}},
        {"log", {{"level", "debug"}}},
    };
    const wg::StagesRuntimeConfig cfg = wg::StagesConfig::from_json(doc);
    CHECK(cfg.grid.level == 3);
    CHECK(cfg.terrain.name == "archipelago");
    CHECK(cfg.terrain.seed == 99);
    CHECK(cfg.terrain.octaves == 4);
    CHECK(cfg.terrain.magnitude == doctest::Approx(3000.0));
    CHECK(cfg.planet.radius_km == doctest::Approx(3390.0));
    CHECK(cfg.planet.axis[1] == doctest::Approx(1.0));
    CHECK(cfg.planet.sea_level == doctest::Approx(120.0));
    CHECK(cfg.climate.params.axial_tilt == doctest::Approx(wg::kPi / 2));
    CHECK(cfg.climate.params.seasons_per_cycle == 2);
    CHECK(cfg.climate.max_cycles == 10);
    CHECK_FALSE(cfg.stages.rivers);
    CHECK(cfg.stages.climate);
    CHECK(cfg.log.level == "debug");
}

TEST_CASE("StagesConfig::from_json: type mismatches name the key") {
    CHECK(config_error(json{{"grid", {{"level", "five"}}}}).find("grid.level") != std::string::npos);
    CHECK(config_error(json{{"terrain", {{"seed", -3}}}}).find("terrain.seed") != std::string::npos);
    CHECK(config_error(json{{"stages", {{"climate", 1}}}}).find("stages.climate") != std::string::npos);
    CHECK(config_error(json{{"planet", {{"axis", {1.0, 0.0}}}}}).find("planet.axis") != std::string::npos);
    CHECK(config_error(json{{"climate", 5}}).find("climate") != std::string::npos);
    CHECK_FALSE(config_error(json::array()).empty());
}

TEST_CASE("StagesConfig::from_json: invalid values") {
    CHECK_FALSE(config_error(json{{"grid", {{"level", -1}}}}).empty());
    CHECK_FALSE(config_error(json{{"grid", {{"level", 11}}}}).empty());
    CHECK_FALSE(config_error(json{{"planet", {{"radius_km", 0.0}}}}).empty());
    CHECK_FALSE(config_error(json{{"planet", {{"axis", {0.0, 0.0, 0.0}}}}}).empty());
    CHECK_FALSE(config_error(json{{"climate", {{"seasons_per_cycle", 0}}}}).empty());
    CHECK_FALSE(config_error(json{{"climate", {{"acceptable_delta", 0.0}}}}).empty());
    CHECK_FALSE(config_error(json{{"climate", {{"precipitation_factor", -1.0}}}}).empty());
    CHECK_FALSE(config_error(json{{"climate", {{"max_cycles", 0}}}}).empty());
    CHECK_FALSE(config_error(json{{"terrain", {{"octaves", -2}}}}).empty());
    CHECK_FALSE(config_error(json{{"terrain", {{"persistence", -0.5}}}}).empty());
    CHECK_FALSE(config_error(json{{"terrain", {{"algorithm", ""}}}}).empty());
}

TEST_CASE("StagesConfig::from_json: integers that do not fit are rejected, not wrapped") {
    const std::string level = config_error(json{{"grid", {{"level", 4294967296LL}}}});
    CHECK(level.find("grid.level") != std::string::npos);
    CHECK(level.find("out of range") != std::string::npos);

    CHECK(config_error(json{{"climate", {{"max_cycles", -4294967296LL}}}}).find("climate.max_cycles") !=
          std::string::npos);
    CHECK(config_error(json{{"terrain", {{"octaves", 18446744073709551615ULL}}}}).find("terrain.octaves") !=
          std::string::npos);

    // The full unsigned 64-bit range is still a valid seed.
    const wg::StagesRuntimeConfig cfg =
        wg::StagesConfig::from_json(json{{"terrain", {{"seed", 18446744073709551615ULL}}}});
    CHECK(cfg.terrain.seed == 18446744073709551615ULL);
}

TEST_CASE("StagesConfig::load: shipped config and file errors") {
    const fs::path shipped = fs::path(ORBIS_TEST_ASSETS_DIR) / "config" / "planet.json";
    const wg::StagesRuntimeConfig cfg = wg::StagesConfig::load(shipped);
    CHECK(cfg.terrain.seed == 12345);
    CHECK(cfg.climate.params.axial_tilt == doctest::Approx(23.44 * wg::kPi / 180.0));

    CHECK_THROWS_AS((void)wg::StagesConfig::load("does/not/exist.json"), wg::ConfigError);

    const fs::path bad = fs::temp_directory_path() / "orbis_bad_config.json";
    {
        std::ofstream os(bad);
        os << "{ \"grid\": { \"level\": ";
    }
    CHECK_THROWS_AS((void)wg::StagesConfig::load(bad), wg::ConfigError);
    fs::remove(bad);

    CHECK(wg::StagesConfig::default_path() == fs::path("assets") / "config" / "planet.json");
}

TEST_CASE("logsys::parse_level") {
    CHECK(orbis::logsys::parse_level("debug") == spdlog::level::debug);
    CHECK(orbis::logsys::parse_level("warn") == spdlog::level::warn);
    CHECK(orbis::logsys::parse_level("off") == spdlog::level::off);
    CHECK_THROWS_AS((void)orbis::logsys::parse_level("verbose"), wg::ConfigError);
}
