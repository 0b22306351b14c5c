// src/worldgen/TerrainExpr.hpp
#pragma once

// Terrain algorithms as data: a small expression tree parsed from JSON objects
// with an "op" field. Nodes are immutable and shared between algorithms.
//
//   { "op": "constant",  "value": 100 }
//   { "op": "heightmap", "seed": 7, "octaves": 6, "magnitude": 3000, "persistence": 0.6 }
//   { "op": "lower",     "threshold": 200, "source": {...} }
//   { "op": "relief",    "continent": {...}, "mountain": {...} }
//   { "op": "add",       "terms": [ {...}, {...} ] }
//   { "op": "scale",     "factor": 0.5, "source": {...} }
//   { "op": "ref",       "name": "continents" }

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace orbis::worldgen {

// Caller-side knobs for the reference heightmap algorithm.
struct TerrainParameters {
    std::string   name        = "default";
    std::uint64_t seed        = 1;
    int           octaves     = 6;
    double        magnitude   = 3000.0;   // meters at level 0
    double        persistence = 0.6;      // amplitude ratio per level
};

struct TerrainExpr;
using TerrainExprPtr = std::shared_ptr<const TerrainExpr>;

namespace expr {

struct Constant {
    double value = 0.0;
};

struct Heightmap {
    std::optional<std::uint64_t> seed;
    std::optional<int>           octaves;
    std::optional<double>        magnitude;
    std::optional<double>        persistence;
};

struct Lower {
    double         threshold = 0.0;
    TerrainExprPtr source;
};

struct Relief {
    TerrainExprPtr continent;
    TerrainExprPtr mountain;
};

struct Add {
    std::vector<TerrainExprPtr> terms;
};

struct Scale {
    double         factor = 1.0;
    TerrainExprPtr source;
};

struct Ref {
    std::string name;
};

} // namespace expr

struct TerrainExpr {
    using Node = std::variant<expr::Constant, expr::Heightmap, expr::Lower,
                              expr::Relief, expr::Add, expr::Scale, expr::Ref>;
    Node node;
};

// Throws ConfigError on unknown ops, missing fields or wrong JSON types.
// `where` prefixes error messages (e.g. "terrain.continents").
[[nodiscard]] TerrainExprPtr parse_terrain_expr(const nlohmann::json& j, const std::string& where = "terrain");

[[nodiscard]] nlohmann::json to_json(const TerrainExpr& e);

// Names of every `ref` reachable from `e` without following them.
void collect_refs(const TerrainExpr& e, std::vector<std::string>& out);

// Convenience builders, mostly for tests and inline algorithms.
[[nodiscard]] TerrainExprPtr make_constant(double value);
[[nodiscard]] TerrainExprPtr make_heightmap(std::optional<std::uint64_t> seed = std::nullopt);
[[nodiscard]] TerrainExprPtr make_lower(double threshold, TerrainExprPtr source);
[[nodiscard]] TerrainExprPtr make_relief(TerrainExprPtr continent, TerrainExprPtr mountain);
[[nodiscard]] TerrainExprPtr make_ref(std::string name);

} // namespace orbis::worldgen
