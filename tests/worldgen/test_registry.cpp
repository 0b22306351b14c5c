// tests/worldgen/test_registry.cpp
#include <doctest/doctest.h>

#include "worldgen/AlgorithmRegistry.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Terrain.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace wg = orbis::worldgen;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

json sample_document()
{
    return json::parse(R"({
      "terrain": {
        "flat":   { "op": "constant", "value": 100 },
        "sunk":   { "op": "lower", "threshold": 300, "source": { "op": "ref", "name": "flat" } },
        "double": { "op": "scale", "factor": 2, "source": { "op": "ref", "name": "flat" } },
        "sum":    { "op": "add", "terms": [ { "op": "ref", "name": "flat" }, { "op": "constant", "value": -40 } ] },
        "noise":  { "op": "heightmap", "seed": 3, "octaves": 2 }
      }
    })");
}

std::string message_of(const std::function<void()>& fn)
{
    try {
        fn();
    } catch (const wg::ConfigError& e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST_CASE("AlgorithmRegistry: lookup by name") {
    const wg::InlineAlgorithmSource source(sample_document());
    const wg::AlgorithmRegistry registry(source, "terrain");

    CHECK(registry.size() == 5);
    CHECK(registry.contains("flat"));
    CHECK_FALSE(registry.contains("volcano"));
    CHECK(registry.names() == std::vector<std::string>{"double", "flat", "noise", "sum", "sunk"});
    CHECK(std::holds_alternative<wg::expr::Constant>(registry.at("flat").node));

    const auto& hm = std::get<wg::expr::Heightmap>(registry.at("noise").node);
    REQUIRE(hm.seed.has_value());
    CHECK(*hm.seed == 3u);
    CHECK(hm.octaves == 2);
    CHECK_FALSE(hm.magnitude.has_value());
}

TEST_CASE("AlgorithmRegistry: unknown name names the key") {
    const wg::InlineAlgorithmSource source(sample_document());
    const wg::AlgorithmRegistry registry(source, "terrain");

    CHECK_THROWS_AS((void)registry.at("volcano"), wg::ConfigError);
    const std::string msg = message_of([&] { (void)registry.at("volcano"); });
    CHECK(msg.find("volcano") != std::string::npos);
}

TEST_CASE("AlgorithmRegistry: refs evaluate through the registry") {
    const wg::InlineAlgorithmSource source(sample_document());
    const wg::AlgorithmRegistry registry(source, "terrain");
    const wg::GridSequence grids = wg::build_grid_sequence(1);

    wg::TerrainParameters params;
    params.name = "sunk";
    for (double v : wg::evaluate_algorithm(registry, grids, params))
        CHECK(v == doctest::Approx(-200.0));

    params.name = "double";
    for (double v : wg::evaluate_algorithm(registry, grids, params))
        CHECK(v == doctest::Approx(200.0));

    params.name = "sum";
    for (double v : wg::evaluate_algorithm(registry, grids, params))
        CHECK(v == doctest::Approx(60.0));

    params.name = "missing";
    CHECK_THROWS_AS((void)wg::evaluate_algorithm(registry, grids, params), wg::ConfigError);
}

TEST_CASE("AlgorithmRegistry: cycles and dangling refs are configuration errors") {
    const json cyclic = json::parse(R"({ "terrain": {
        "a": { "op": "ref", "name": "b" },
        "b": { "op": "scale", "factor": 1, "source": { "op": "ref", "name": "a" } }
    } })");
    const std::string cycleMsg = message_of([&] { wg::AlgorithmRegistry r(wg::InlineAlgorithmSource(cyclic), "terrain"); });
    CHECK(cycleMsg.find("ref cycle") != std::string::npos);
    CHECK(cycleMsg.find("terrain.") == 0);

    const json self = json::parse(R"({ "terrain": { "a": { "op": "ref", "name": "a" } } })");
    const std::string selfMsg = message_of([&] { wg::AlgorithmRegistry r(wg::InlineAlgorithmSource(self), "terrain"); });
    CHECK(selfMsg.find("ref cycle through 'a'") != std::string::npos);

    const json dangling = json::parse(R"({ "terrain": { "a": { "op": "ref", "name": "nowhere" } } })");
    const std::string msg = message_of([&] { wg::AlgorithmRegistry r(wg::InlineAlgorithmSource(dangling), "terrain"); });
    CHECK(msg.find("unknown algorithm 'nowhere'") != std::string::npos);

    const std::string catMsg = message_of([&] { wg::AlgorithmRegistry r(wg::InlineAlgorithmSource(cyclic), "oceans"); });
    CHECK(catMsg.find("unknown category 'oceans'") != std::string::npos);
}

TEST_CASE("AlgorithmRegistry: sources load the requested category") {
    const json doc = json::parse(R"({
        "terrain": { "flat": { "op": "constant", "value": 1 } },
        "moons":   { "crater": { "op": "constant", "value": -5 }, "rim": { "op": "constant", "value": 5 } }
    })");
    const wg::InlineAlgorithmSource inline_source(doc);
    const wg::AlgorithmRegistry moons(inline_source, "moons");
    CHECK(moons.category() == "moons");
    CHECK(moons.names() == std::vector<std::string>{"crater", "rim"});

    const fs::path dir = fs::temp_directory_path() / "orbis_registry_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    {
        std::ofstream os(dir / "moons.json");
        os << doc["moons"].dump();
    }
    const wg::JsonAlgorithmSource file_source(dir);
    const wg::AlgorithmRegistry fromFile(file_source, "moons");
    CHECK(fromFile.category() == "moons");
    CHECK(fromFile.size() == 2);
    CHECK(fromFile.contains("crater"));

    const std::string missing = message_of([&] { wg::AlgorithmRegistry r(file_source, "terrain"); });
    CHECK(missing.find("terrain.json") != std::string::npos);
    fs::remove_all(dir);
}

TEST_CASE("parse_terrain_expr: malformed expressions") {
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json::array()), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"value", 1}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "volcano"}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "constant"}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "constant"}, {"value", "high"}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "heightmap"}, {"seed", -4}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "heightmap"}, {"octaves", 1.5}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "add"}, {"terms", json::array()}}), wg::ConfigError);
    CHECK_THROWS_AS((void)wg::parse_terrain_expr(json{{"op", "lower"}, {"threshold", 1}}), wg::ConfigError);
}

TEST_CASE("parse_terrain_expr: to_json writes back the same tree") {
    const json src = json::parse(R"({ "op": "relief",
        "continent": { "op": "lower", "threshold": 600, "source": { "op": "heightmap", "seed": 9 } },
        "mountain":  { "op": "scale", "factor": 0.5, "source": { "op": "constant", "value": 10 } } })");
    CHECK(wg::to_json(*wg::parse_terrain_expr(src)) == src);
}

#ifdef ORBIS_TEST_ASSETS_DIR
TEST_CASE("JsonAlgorithmSource: bundled terrain algorithms load") {
    const wg::JsonAlgorithmSource source(std::string(ORBIS_TEST_ASSETS_DIR) + "/algorithms");
    const wg::AlgorithmRegistry registry(source, "terrain");
    CHECK(registry.contains("default"));
    CHECK(registry.contains("flat"));

    CHECK_THROWS_AS(wg::AlgorithmRegistry(source, "no_such_category"), wg::ConfigError);
}
#endif
