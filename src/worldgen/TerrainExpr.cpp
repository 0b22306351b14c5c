// src/worldgen/TerrainExpr.cpp
#include "worldgen/TerrainExpr.hpp"
#include "worldgen/Errors.hpp"

#include <cmath>
#include <type_traits>
#include <utility>

using json = nlohmann::json;

namespace orbis::worldgen {
namespace {

const json& require(const json& j, const char* key, const std::string& where)
{
    auto it = j.find(key);
    if (it == j.end())
        throw ConfigError(where + ": missing field '" + key + "'");
    return *it;
}

double read_number(const json& v, const std::string& where, const char* key)
{
    if (!v.is_number())
        throw ConfigError(where + ": field '" + key + "' must be a number");
    const double d = v.get<double>();
    if (!std::isfinite(d))
        throw ConfigError(where + ": field '" + key + "' must be finite");
    return d;
}

std::uint64_t read_seed(const json& v, const std::string& where)
{
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>();
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(v.get<std::int64_t>());
    throw ConfigError(where + ": field 'seed' must be a non-negative integer");
}

int read_octaves(const json& v, const std::string& where)
{
    if (!v.is_number_integer() || v.get<std::int64_t>() < 0 || v.get<std::int64_t>() > 64)
        throw ConfigError(where + ": field 'octaves' must be an integer in [0, 64]");
    return v.get<int>();
}

TerrainExprPtr wrap(TerrainExpr::Node node)
{
    return std::make_shared<const TerrainExpr>(TerrainExpr{std::move(node)});
}

} // namespace

TerrainExprPtr parse_terrain_expr(const json& j, const std::string& where)
{
    if (!j.is_object())
        throw ConfigError(where + ": expression must be a JSON object");

    const json& opv = require(j, "op", where);
    if (!opv.is_string())
        throw ConfigError(where + ": field 'op' must be a string");
    const std::string op = opv.get<std::string>();

    if (op == "constant") {
        return wrap(expr::Constant{read_number(require(j, "value", where), where, "value")});
    }
    if (op == "heightmap") {
        expr::Heightmap h;
        if (auto it = j.find("seed"); it != j.end())
            h.seed = read_seed(*it, where);
        if (auto it = j.find("octaves"); it != j.end())
            h.octaves = read_octaves(*it, where);
        if (auto it = j.find("magnitude"); it != j.end())
            h.magnitude = read_number(*it, where, "magnitude");
        if (auto it = j.find("persistence"); it != j.end()) {
            h.persistence = read_number(*it, where, "persistence");
            if (*h.persistence < 0.0)
                throw ConfigError(where + ": field 'persistence' must be >= 0");
        }
        return wrap(h);
    }
    if (op == "lower") {
        expr::Lower l;
        l.threshold = read_number(require(j, "threshold", where), where, "threshold");
        l.source    = parse_terrain_expr(require(j, "source", where), where + ".source");
        return wrap(std::move(l));
    }
    if (op == "relief") {
        expr::Relief r;
        r.continent = parse_terrain_expr(require(j, "continent", where), where + ".continent");
        r.mountain  = parse_terrain_expr(require(j, "mountain", where), where + ".mountain");
        return wrap(std::move(r));
    }
    if (op == "add") {
        const json& terms = require(j, "terms", where);
        if (!terms.is_array() || terms.empty())
            throw ConfigError(where + ": field 'terms' must be a non-empty array");
        expr::Add a;
        for (std::size_t i = 0; i < terms.size(); ++i)
            a.terms.push_back(parse_terrain_expr(terms[i], where + ".terms[" + std::to_string(i) + "]"));
        return wrap(std::move(a));
    }
    if (op == "scale") {
        expr::Scale s;
        s.factor = read_number(require(j, "factor", where), where, "factor");
        s.source = parse_terrain_expr(require(j, "source", where), where + ".source");
        return wrap(std::move(s));
    }
    if (op == "ref") {
        const json& name = require(j, "name", where);
        if (!name.is_string() || name.get<std::string>().empty())
            throw ConfigError(where + ": field 'name' must be a non-empty string");
        return wrap(expr::Ref{name.get<std::string>()});
    }
    throw ConfigError(where + ": unknown op '" + op + "'");
}

json to_json(const TerrainExpr& e)
{
    return std::visit([](const auto& n) -> json {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, expr::Constant>) {
            return {{"op", "constant"}, {"value", n.value}};
        } else if constexpr (std::is_same_v<T, expr::Heightmap>) {
            json j = {{"op", "heightmap"}};
            if (n.seed)        j["seed"] = *n.seed;
            if (n.octaves)     j["octaves"] = *n.octaves;
            if (n.magnitude)   j["magnitude"] = *n.magnitude;
            if (n.persistence) j["persistence"] = *n.persistence;
            return j;
        } else if constexpr (std::is_same_v<T, expr::Lower>) {
            return {{"op", "lower"}, {"threshold", n.threshold}, {"source", to_json(*n.source)}};
        } else if constexpr (std::is_same_v<T, expr::Relief>) {
            return {{"op", "relief"}, {"continent", to_json(*n.continent)}, {"mountain", to_json(*n.mountain)}};
        } else if constexpr (std::is_same_v<T, expr::Add>) {
            json terms = json::array();
            for (const auto& t : n.terms) terms.push_back(to_json(*t));
            return {{"op", "add"}, {"terms", std::move(terms)}};
        } else if constexpr (std::is_same_v<T, expr::Scale>) {
            return {{"op", "scale"}, {"factor", n.factor}, {"source", to_json(*n.source)}};
        } else {
            return {{"op", "ref"}, {"name", n.name}};
        }
    }, e.node);
}

void collect_refs(const TerrainExpr& e, std::vector<std::string>& out)
{
    std::visit([&out](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, expr::Lower> || std::is_same_v<T, expr::Scale>) {
            collect_refs(*n.source, out);
        } else if constexpr (std::is_same_v<T, expr::Relief>) {
            collect_refs(*n.continent, out);
            collect_refs(*n.mountain, out);
        } else if constexpr (std::is_same_v<T, expr::Add>) {
            for (const auto& t : n.terms) collect_refs(*t, out);
        } else if constexpr (std::is_same_v<T, expr::Ref>) {
            out.push_back(n.name);
        }
    }, e.node);
}

TerrainExprPtr make_constant(double value) { return wrap(expr::Constant{value}); }

TerrainExprPtr make_heightmap(std::optional<std::uint64_t> seed)
{
    expr::Heightmap h;
    h.seed = seed;
    return wrap(h);
}

TerrainExprPtr make_lower(double threshold, TerrainExprPtr source)
{
    return wrap(expr::Lower{threshold, std::move(source)});
}

TerrainExprPtr make_relief(TerrainExprPtr continent, TerrainExprPtr mountain)
{
    return wrap(expr::Relief{std::move(continent), std::move(mountain)});
}

TerrainExprPtr make_ref(std::string name) { return wrap(expr::Ref{std::move(name)}); }

} // namespace orbis::worldgen
