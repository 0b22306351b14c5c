// src/worldgen/AlgorithmRegistry.hpp
#pragma once

#include "worldgen/TerrainExpr.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace orbis::worldgen {

using AlgorithmMap = std::map<std::string, TerrainExprPtr>;

// Where named terrain algorithms come from.
struct IAlgorithmSource {
    virtual ~IAlgorithmSource() = default;

    // All algorithms of `category`. Throws ConfigError when the category
    // cannot be read or an entry is malformed.
    virtual AlgorithmMap load(const std::string& category) const = 0;
};

// Reads <directory>/<category>.json: one object mapping names to expressions.
class JsonAlgorithmSource final : public IAlgorithmSource {
public:
    explicit JsonAlgorithmSource(std::filesystem::path directory);

    AlgorithmMap load(const std::string& category) const override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

// Algorithms held in memory, keyed by category: { "terrain": { "name": expr, ... } }.
class InlineAlgorithmSource final : public IAlgorithmSource {
public:
    explicit InlineAlgorithmSource(nlohmann::json document);

    AlgorithmMap load(const std::string& category) const override;

private:
    nlohmann::json document_;
};

// Parses one category object ({ name: expr, ... }).
[[nodiscard]] AlgorithmMap parse_algorithm_map(const nlohmann::json& j, const std::string& category);

// Immutable name -> algorithm lookup for one category. Every `ref` must
// resolve inside the category and references may not form a cycle.
class AlgorithmRegistry {
public:
    AlgorithmRegistry(const IAlgorithmSource& source, const std::string& category);
    AlgorithmRegistry(AlgorithmMap algorithms, std::string category);

    // Throws ConfigError naming `name` when it is not registered.
    [[nodiscard]] const TerrainExpr& at(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return algorithms_.count(name) != 0; }
    [[nodiscard]] std::vector<std::string> names() const;   // sorted
    [[nodiscard]] std::size_t size() const noexcept { return algorithms_.size(); }
    [[nodiscard]] const std::string& category() const noexcept { return category_; }

private:
    void validate_refs_() const;

    std::string  category_;
    AlgorithmMap algorithms_;
};

} // namespace orbis::worldgen
