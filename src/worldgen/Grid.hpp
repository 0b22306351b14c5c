// src/worldgen/Grid.hpp
#pragma once

// Spherical tile grid: the dual of a subdivided icosahedron.
//
// Tiles are the icosphere vertices, corners are its triangles, edges its
// edges. Level L has 10*4^L + 2 tiles (12 pentagons, the rest hexagons),
// 20*4^L corners and 30*4^L edges. A level-L grid keeps every tile id of
// level L-1 at the same coordinate; the tiles it adds sit at the edge
// midpoints of level L-1 and record those two tiles as parents.
//
// Adjacency is stored in flat arrays indexed by id. Per tile, tiles[] and
// corners[] both wind counter-clockwise seen from outside the sphere, and
// neighbor tiles[i] lies between corners[i-1] and corners[i].

#include "worldgen/Math.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace orbis::worldgen {

struct Tile {
    int  id = 0;
    Vec3 v{};                       // unit-sphere center
    int  edge_count = 0;            // 5 or 6
    std::array<int, 6> tiles{};     // neighbor tiles (first edge_count valid)
    std::array<int, 6> corners{};
    std::array<int, 6> edges{};
};

struct Corner {
    int  id = 0;
    Vec3 v{};                       // unit-sphere coordinate
    std::array<int, 3> tiles{};
    std::array<int, 3> corners{};
    std::array<int, 3> edges{};
};

struct Edge {
    int id = 0;
    std::array<int, 2> tiles{};
    std::array<int, 2> corners{};
};

class Grid;
using GridPtr      = std::shared_ptr<const Grid>;
using GridSequence = std::vector<GridPtr>;   // G0..GN, each a refinement of the previous

class Grid {
public:
    static constexpr int kMaxLevel = 10;

    [[nodiscard]] static constexpr std::size_t tile_count_for_level(int level) noexcept {
        return 10u * (std::size_t{1} << (2 * level)) + 2u;
    }

    [[nodiscard]] int level() const noexcept { return level_; }

    [[nodiscard]] std::size_t tile_count()   const noexcept { return tiles_.size(); }
    [[nodiscard]] std::size_t corner_count() const noexcept { return corners_.size(); }
    [[nodiscard]] std::size_t edge_count()   const noexcept { return edges_.size(); }

    [[nodiscard]] const std::vector<Tile>&   tiles()   const noexcept { return tiles_; }
    [[nodiscard]] const std::vector<Corner>& corners() const noexcept { return corners_; }
    [[nodiscard]] const std::vector<Edge>&   edges()   const noexcept { return edges_; }

    // Checked accessors; malformed ids throw IndexOutOfRange.
    [[nodiscard]] const Tile&   tile(int id) const;
    [[nodiscard]] const Corner& corner(int id) const;
    [[nodiscard]] const Edge&   edge(int id) const;

    [[nodiscard]] int  tile_corner(int tileId, int i) const;   // i in [0, edge_count)
    [[nodiscard]] int  tile_tile(int tileId, int i) const;
    [[nodiscard]] int  tile_edge_count(int tileId) const { return tile(tileId).edge_count; }
    [[nodiscard]] Vec3 tile_center(int tileId) const { return tile(tileId).v; }
    [[nodiscard]] Vec3 corner_coordinates(int cornerId) const { return corner(cornerId).v; }

    // Number of tiles inherited from the previous level (0 at level 0).
    [[nodiscard]] std::size_t previous_tile_count() const noexcept { return previousTileCount_; }
    [[nodiscard]] bool is_new_tile(int tileId) const;

    // The two previous-level tiles a new tile was inserted between.
    // Inherited and level-0 tiles are their own parents: {id, id}.
    [[nodiscard]] std::array<int, 2> parents(int tileId) const;

    // Solid angle (steradians) of the tile polygon; sums to 4*pi over the grid.
    [[nodiscard]] double tile_solid_angle(int tileId) const;

private:
    friend GridPtr build_grid(int level);
    friend GridPtr subdivide_grid(const Grid& grid);

    Grid() = default;

    // Builds every adjacency table from a consistently oriented (CCW) triangle list.
    static GridPtr from_triangles(int level,
                                  std::vector<Vec3> positions,
                                  const std::vector<std::array<int, 3>>& faces,
                                  std::size_t previousTileCount,
                                  std::vector<std::array<int, 2>> parents);

    int level_ = 0;
    std::size_t previousTileCount_ = 0;
    std::vector<Tile>   tiles_;
    std::vector<Corner> corners_;
    std::vector<Edge>   edges_;
    std::vector<std::array<int, 2>> parents_;   // indexed by (id - previousTileCount_)
};

// Level-0 grid subdivided `level` times. Throws ConfigError for levels
// outside [0, Grid::kMaxLevel].
[[nodiscard]] GridPtr build_grid(int level);

// One refinement step; tile ids of `grid` are preserved.
[[nodiscard]] GridPtr subdivide_grid(const Grid& grid);

// G0..G(level).
[[nodiscard]] GridSequence build_grid_sequence(int level);

} // namespace orbis::worldgen
