// src/worldgen/Grid.cpp
#include "worldgen/Grid.hpp"
#include "worldgen/Errors.hpp"
#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>

namespace orbis::worldgen {
namespace {

std::string describe(const char* what, int id, std::size_t count)
{
    return std::string(what) + " index " + std::to_string(id) + " out of range [0, " +
           std::to_string(count) + ")";
}

inline std::uint64_t edge_key(int a, int b) noexcept
{
    const auto lo = static_cast<std::uint64_t>(static_cast<std::uint32_t>(a < b ? a : b));
    const auto hi = static_cast<std::uint64_t>(static_cast<std::uint32_t>(a < b ? b : a));
    return (lo << 32) | hi;
}

inline std::uint64_t directed_key(int a, int b) noexcept
{
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(a)) << 32) |
           static_cast<std::uint32_t>(b);
}

// ---------- icosahedron base ----------
void make_icosahedron(std::vector<Vec3>& positions, std::vector<std::array<int, 3>>& faces)
{
    const double t = (1.0 + std::sqrt(5.0)) * 0.5; // golden ratio
    positions = {
        make3(-1,  t,  0), make3( 1,  t,  0), make3(-1, -t,  0), make3( 1, -t,  0),
        make3( 0, -1,  t), make3( 0,  1,  t), make3( 0, -1, -t), make3( 0,  1, -t),
        make3( t,  0, -1), make3( t,  0,  1), make3(-t,  0, -1), make3(-t,  0,  1)
    };
    for (auto& p : positions) p = normalize(p);

    faces = {
        {0,11,5},  {0,5,1},   {0,1,7},   {0,7,10},  {0,10,11},
        {1,5,9},   {5,11,4},  {11,10,2}, {10,7,6},  {7,1,8},
        {3,9,4},   {3,4,2},   {3,2,6},   {3,6,8},   {3,8,9},
        {4,9,5},   {2,4,11},  {6,2,10},  {8,6,7},   {9,8,1}
    };

    // Every face must wind counter-clockwise seen from outside.
    for (auto& f : faces) {
        const Vec3& a = positions[f[0]];
        const Vec3& b = positions[f[1]];
        const Vec3& c = positions[f[2]];
        if (dot(cross(sub(b, a), sub(c, a)), add(add(a, b), c)) < 0.0)
            std::swap(f[1], f[2]);
    }
}

} // namespace

// -------------------- accessors --------------------

const Tile& Grid::tile(int id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= tiles_.size())
        throw IndexOutOfRange(describe("tile", id, tiles_.size()));
    return tiles_[static_cast<std::size_t>(id)];
}

const Corner& Grid::corner(int id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= corners_.size())
        throw IndexOutOfRange(describe("corner", id, corners_.size()));
    return corners_[static_cast<std::size_t>(id)];
}

const Edge& Grid::edge(int id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= edges_.size())
        throw IndexOutOfRange(describe("edge", id, edges_.size()));
    return edges_[static_cast<std::size_t>(id)];
}

int Grid::tile_corner(int tileId, int i) const
{
    const Tile& t = tile(tileId);
    if (i < 0 || i >= t.edge_count)
        throw IndexOutOfRange(describe("tile corner slot", i, static_cast<std::size_t>(t.edge_count)));
    return t.corners[static_cast<std::size_t>(i)];
}

int Grid::tile_tile(int tileId, int i) const
{
    const Tile& t = tile(tileId);
    if (i < 0 || i >= t.edge_count)
        throw IndexOutOfRange(describe("tile neighbor slot", i, static_cast<std::size_t>(t.edge_count)));
    return t.tiles[static_cast<std::size_t>(i)];
}

bool Grid::is_new_tile(int tileId) const
{
    (void)tile(tileId);
    return level_ > 0 && static_cast<std::size_t>(tileId) >= previousTileCount_;
}

std::array<int, 2> Grid::parents(int tileId) const
{
    if (!is_new_tile(tileId))
        return {tileId, tileId};
    return parents_[static_cast<std::size_t>(tileId) - previousTileCount_];
}

double Grid::tile_solid_angle(int tileId) const
{
    const Tile& t = tile(tileId);
    double sum = 0.0;
    for (int k = 0; k < t.edge_count; ++k) {
        const Vec3& a = corners_[static_cast<std::size_t>(t.corners[static_cast<std::size_t>(k)])].v;
        const Vec3& b = corners_[static_cast<std::size_t>(t.corners[static_cast<std::size_t>((k + 1) % t.edge_count)])].v;
        sum += solid_angle(t.v, a, b);
    }
    return sum;
}

// -------------------- construction --------------------

GridPtr Grid::from_triangles(int level,
                             std::vector<Vec3> positions,
                             const std::vector<std::array<int, 3>>& faces,
                             std::size_t previousTileCount,
                             std::vector<std::array<int, 2>> parents)
{
    std::shared_ptr<Grid> g(new Grid());
    g->level_ = level;
    g->previousTileCount_ = previousTileCount;
    g->parents_ = std::move(parents);

    const std::size_t nTiles = positions.size();
    const std::size_t nFaces = faces.size();

    g->tiles_.resize(nTiles);
    g->corners_.resize(nFaces);

    // Directed edge (a -> b) => face that contains it in its winding.
    std::unordered_map<std::uint64_t, int> faceOf;
    faceOf.reserve(nFaces * 3);
    for (std::size_t f = 0; f < nFaces; ++f)
        for (int i = 0; i < 3; ++i)
            faceOf.emplace(directed_key(faces[f][i], faces[f][(i + 1) % 3]), static_cast<int>(f));

    // Undirected edges, numbered in face order at their a < b occurrence.
    std::unordered_map<std::uint64_t, int> edgeOf;
    edgeOf.reserve(nFaces * 3 / 2);
    g->edges_.reserve(nFaces * 3 / 2);
    for (std::size_t f = 0; f < nFaces; ++f) {
        for (int i = 0; i < 3; ++i) {
            const int a = faces[f][i];
            const int b = faces[f][(i + 1) % 3];
            if (a > b) continue;
            const auto twin = faceOf.find(directed_key(b, a));
            if (twin == faceOf.end())
                throw InvariantViolation("grid: edge " + std::to_string(a) + "-" + std::to_string(b) +
                                         " has no opposite face");
            Edge e;
            e.id = static_cast<int>(g->edges_.size());
            e.tiles = {a, b};
            e.corners = {static_cast<int>(f), twin->second};
            edgeOf.emplace(edge_key(a, b), e.id);
            g->edges_.push_back(e);
        }
    }

    // Corners
    for (std::size_t f = 0; f < nFaces; ++f) {
        Corner& c = g->corners_[f];
        c.id = static_cast<int>(f);
        const auto& tri = faces[f];
        c.v = normalize(add(add(positions[tri[0]], positions[tri[1]]), positions[tri[2]]));
        for (int i = 0; i < 3; ++i) {
            const int a = tri[i];
            const int b = tri[(i + 1) % 3];
            c.tiles[i]   = a;
            c.corners[i] = faceOf.at(directed_key(b, a));
            c.edges[i]   = edgeOf.at(edge_key(a, b));
        }
    }

    // Incident faces per tile as (next vertex after the tile, face).
    struct Fan {
        int count = 0;
        std::array<std::pair<int, int>, 6> items{};
    };
    std::vector<Fan> fans(nTiles);
    for (std::size_t f = 0; f < nFaces; ++f) {
        for (int i = 0; i < 3; ++i) {
            Fan& fan = fans[static_cast<std::size_t>(faces[f][i])];
            if (fan.count == 6)
                throw InvariantViolation("grid: tile " + std::to_string(faces[f][i]) + " has more than 6 corners");
            fan.items[static_cast<std::size_t>(fan.count++)] = {faces[f][(i + 1) % 3], static_cast<int>(f)};
        }
    }

    // Walk each fan counter-clockwise: face (v, a, b) is followed by (v, b, c).
    for (std::size_t v = 0; v < nTiles; ++v) {
        Tile& t = g->tiles_[v];
        const Fan& fan = fans[v];
        t.id = static_cast<int>(v);
        t.v = positions[v];
        t.edge_count = fan.count;
        if (fan.count != 5 && fan.count != 6)
            throw InvariantViolation("grid: tile " + std::to_string(v) + " has " +
                                     std::to_string(fan.count) + " corners");

        int face = fan.items[0].second;
        for (int k = 0; k < fan.count; ++k) {
            const auto& tri = faces[static_cast<std::size_t>(face)];
            int at = 0;
            while (tri[at] != static_cast<int>(v)) ++at;
            const int a = tri[(at + 1) % 3];
            const int b = tri[(at + 2) % 3];
            t.tiles[static_cast<std::size_t>(k)]   = a;
            t.corners[static_cast<std::size_t>(k)] = face;
            t.edges[static_cast<std::size_t>(k)]   = edgeOf.at(edge_key(static_cast<int>(v), a));

            int next = -1;
            for (int j = 0; j < fan.count; ++j)
                if (fan.items[static_cast<std::size_t>(j)].first == b) { next = fan.items[static_cast<std::size_t>(j)].second; break; }
            if (next < 0)
                throw InvariantViolation("grid: open fan around tile " + std::to_string(v));
            face = next;
        }
        if (face != fan.items[0].second)
            throw InvariantViolation("grid: fan around tile " + std::to_string(v) + " does not close");
    }

    return g;
}

GridPtr build_grid(int level)
{
    if (level < 0 || level > Grid::kMaxLevel)
        throw ConfigError("grid level " + std::to_string(level) + " outside [0, " +
                          std::to_string(Grid::kMaxLevel) + "]");

    std::vector<Vec3> positions;
    std::vector<std::array<int, 3>> faces;
    make_icosahedron(positions, faces);

    GridPtr g = Grid::from_triangles(0, std::move(positions), faces, 0, {});
    for (int l = 0; l < level; ++l)
        g = subdivide_grid(*g);
    return g;
}

GridPtr subdivide_grid(const Grid& grid)
{
    if (grid.level() >= Grid::kMaxLevel)
        throw ConfigError("cannot subdivide grid beyond level " + std::to_string(Grid::kMaxLevel));

    const std::size_t n = grid.tile_count();

    std::vector<Vec3> positions(n + grid.edge_count());
    std::vector<std::array<int, 2>> parents(grid.edge_count());
    for (std::size_t i = 0; i < n; ++i)
        positions[i] = grid.tiles()[i].v;

    // New tile at every edge midpoint, id = n + edge id.
    jobs::parallel_for_index(std::size_t{0}, grid.edge_count(), [&](std::size_t e) {
        const Edge& edge = grid.edges()[e];
        const Vec3& a = grid.tiles()[static_cast<std::size_t>(edge.tiles[0])].v;
        const Vec3& b = grid.tiles()[static_cast<std::size_t>(edge.tiles[1])].v;
        positions[n + e] = normalize(add(a, b));
        parents[e] = edge.tiles;
    });

    // 4 new faces per corner triangle, same winding.
    std::vector<std::array<int, 3>> faces;
    faces.reserve(grid.corner_count() * 4);
    for (const Corner& c : grid.corners()) {
        const int i0 = c.tiles[0], i1 = c.tiles[1], i2 = c.tiles[2];
        const int a = static_cast<int>(n) + c.edges[0];   // midpoint i0-i1
        const int b = static_cast<int>(n) + c.edges[1];   // midpoint i1-i2
        const int m = static_cast<int>(n) + c.edges[2];   // midpoint i2-i0
        faces.push_back({i0, a, m});
        faces.push_back({i1, b, a});
        faces.push_back({i2, m, b});
        faces.push_back({a, b, m});
    }

    GridPtr out = Grid::from_triangles(grid.level() + 1, std::move(positions), faces, n, std::move(parents));
    spdlog::debug("Grid: level {} built ({} tiles, {} corners, {} edges)",
                  out->level(), out->tile_count(), out->corner_count(), out->edge_count());
    return out;
}

GridSequence build_grid_sequence(int level)
{
    if (level < 0 || level > Grid::kMaxLevel)
        throw ConfigError("grid level " + std::to_string(level) + " outside [0, " +
                          std::to_string(Grid::kMaxLevel) + "]");

    GridSequence seq;
    seq.reserve(static_cast<std::size_t>(level) + 1);
    seq.push_back(build_grid(0));
    for (int l = 1; l <= level; ++l)
        seq.push_back(subdivide_grid(*seq.back()));
    return seq;
}

} // namespace orbis::worldgen
