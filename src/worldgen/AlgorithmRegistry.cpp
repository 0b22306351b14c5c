// src/worldgen/AlgorithmRegistry.cpp
#include "worldgen/AlgorithmRegistry.hpp"
#include "worldgen/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace orbis::worldgen {

AlgorithmMap parse_algorithm_map(const json& j, const std::string& category)
{
    if (!j.is_object())
        throw ConfigError(category + ": algorithm document must be a JSON object");

    AlgorithmMap out;
    for (auto it = j.begin(); it != j.end(); ++it)
        out.emplace(it.key(), parse_terrain_expr(it.value(), category + "." + it.key()));
    return out;
}

// -------------------- JsonAlgorithmSource --------------------

JsonAlgorithmSource::JsonAlgorithmSource(fs::path directory)
    : directory_(std::move(directory)) {}

AlgorithmMap JsonAlgorithmSource::load(const std::string& category) const
{
    const fs::path path = directory_ / (category + ".json");
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw ConfigError("algorithms: cannot open '" + path.string() + "'");

    json root;
    try {
        f >> root;
    } catch (const json::parse_error& e) {
        throw ConfigError("algorithms: parse error in '" + path.string() + "': " + e.what());
    }

    AlgorithmMap out = parse_algorithm_map(root, category);
    spdlog::debug("Algorithms: loaded {} '{}' entries from {}", out.size(), category, path.string());
    return out;
}

// -------------------- InlineAlgorithmSource --------------------

InlineAlgorithmSource::InlineAlgorithmSource(json document)
    : document_(std::move(document)) {}

AlgorithmMap InlineAlgorithmSource::load(const std::string& category) const
{
    if (!document_.is_object())
        throw ConfigError("algorithms: inline document must be a JSON object");
    auto it = document_.find(category);
    if (it == document_.end())
        throw ConfigError("algorithms: unknown category '" + category + "'");
    return parse_algorithm_map(*it, category);
}

// -------------------- AlgorithmRegistry --------------------

AlgorithmRegistry::AlgorithmRegistry(const IAlgorithmSource& source, const std::string& category)
    : AlgorithmRegistry(source.load(category), category) {}

AlgorithmRegistry::AlgorithmRegistry(AlgorithmMap algorithms, std::string category)
    : category_(std::move(category))
    , algorithms_(std::move(algorithms))
{
    validate_refs_();
}

const TerrainExpr& AlgorithmRegistry::at(const std::string& name) const
{
    auto it = algorithms_.find(name);
    if (it == algorithms_.end())
        throw ConfigError("unknown " + category_ + " algorithm '" + name + "'");
    return *it->second;
}

std::vector<std::string> AlgorithmRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(algorithms_.size());
    for (const auto& [name, e] : algorithms_)
        out.push_back(name);
    return out;
}

void AlgorithmRegistry::validate_refs_() const
{
    // Depth-first walk; a name met again while still on the stack is a cycle.
    enum class Mark { None, Active, Done };
    std::map<std::string, Mark> marks;

    auto visit = [&](auto&& self, const std::string& name, const std::string& from) -> void {
        auto it = algorithms_.find(name);
        if (it == algorithms_.end())
            throw ConfigError(category_ + "." + from + ": ref to unknown algorithm '" + name + "'");
        Mark& m = marks[name];
        if (m == Mark::Done) return;
        if (m == Mark::Active)
            throw ConfigError(category_ + "." + from + ": ref cycle through '" + name + "'");
        m = Mark::Active;
        std::vector<std::string> refs;
        collect_refs(*it->second, refs);
        for (const auto& r : refs)
            self(self, r, name);
        marks[name] = Mark::Done;
    };

    for (const auto& [name, e] : algorithms_)
        visit(visit, name, name);
}

} // namespace orbis::worldgen
