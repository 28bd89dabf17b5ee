#pragma once
#include "common.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <vector>

// Maze grid model.
//
// A Grid is an arena: it owns a flat row-major vector of Cells, and every
// adjacency reference is an index into that vector (-1 when the neighbor
// would fall outside the grid). Adjacency is wired once at construction and
// never changes; only link state and the tile marker mutate afterwards.
//
// Links are stored per cell as a 4-bit direction mask. Cell::link/unlink keep
// both sides in sync unless asked not to.

enum class Dir : uint8_t {
    North = 0,
    South,
    East,
    West,
};

constexpr int DIR_COUNT = 4;

constexpr std::array<Dir, DIR_COUNT> ALL_DIRS = {Dir::North, Dir::South, Dir::East, Dir::West};

inline Dir opposite(Dir d) {
    switch (d) {
        case Dir::North: return Dir::South;
        case Dir::South: return Dir::North;
        case Dir::East:  return Dir::West;
        case Dir::West:
        default:         return Dir::East;
    }
}

// Tile markers. The grid stores a tile per cell but never interprets it; these
// are the characters the level builder writes.
constexpr char TILE_EMPTY    = ' ';
constexpr char TILE_FLOOR    = '.';
constexpr char TILE_ENTRANCE = '@';
constexpr char TILE_STAIRS   = '%';
constexpr char TILE_FEATURE  = '$';

// How a grid was initialized, and whether a generator has already run on it.
enum class GridState : uint8_t {
    Closed = 0, // no links
    Open,       // every adjacent pair linked
    Carved,     // a generation algorithm has been applied
};

const char* gridStateName(GridState s);

class Cell {
public:
    Cell(int row, int column, int index);

    int row() const { return row_; }
    int column() const { return column_; }
    int index() const { return index_; }
    Vec2i pos() const { return {column_, row_}; }

    // Physical adjacency (independent of links). -1 when there is no cell.
    int neighborIndex(Dir d) const { return nb_[static_cast<size_t>(d)]; }
    bool hasNeighbor(Dir d) const { return neighborIndex(d) >= 0; }

    // No-op when `other` is null or not physically adjacent.
    void link(Cell* other, bool bidirectional = true);
    void unlink(Cell* other, bool bidirectional = true);

    bool isLinked(const Cell* other) const;
    bool isLinked(Dir d) const { return (links_ & bit(d)) != 0; }
    int linkCount() const;
    uint8_t linkMask() const { return links_; }

    // Opaque marker owned by the level builder / renderer.
    char tile = TILE_EMPTY;

private:
    friend class Grid;

    static uint8_t bit(Dir d) { return static_cast<uint8_t>(1u << static_cast<unsigned>(d)); }

    // Direction from this cell to `other`, or false if not adjacent.
    bool dirTo(const Cell& other, Dir& out) const;

    int row_ = 0;
    int column_ = 0;
    int index_ = 0;
    std::array<int, DIR_COUNT> nb_ = {-1, -1, -1, -1};
    uint8_t links_ = 0;
};

class Grid {
public:
    static constexpr int MAX_DIM = 4096;

    // All cells allocated and wired, zero links.
    static Grid closed(int rows, int columns);
    // All physically adjacent pairs pre-linked.
    static Grid open(int rows, int columns);

    int rows() const { return rows_; }
    int columns() const { return columns_; }
    int size() const { return static_cast<int>(cells_.size()); }

    GridState state() const { return state_; }
    // Called by generators once they have finished carving.
    void markCarved() { state_ = GridState::Carved; }

    bool inBounds(int row, int column) const {
        return row >= 0 && column >= 0 && row < rows_ && column < columns_;
    }

    // Bounds-checked; nullptr when out of range.
    Cell* at(int row, int column);
    const Cell* at(int row, int column) const;

    Cell& cell(int index) { return cells_[static_cast<size_t>(index)]; }
    const Cell& cell(int index) const { return cells_[static_cast<size_t>(index)]; }

    Cell* neighbor(const Cell& c, Dir d);
    const Cell* neighbor(const Cell& c, Dir d) const;

    // Existing physical neighbors in N, S, E, W order, ignoring links.
    std::vector<Cell*> neighbors(const Cell& c);
    std::vector<const Cell*> neighbors(const Cell& c) const;

    // Neighbors the cell is linked to, in N, S, E, W order.
    std::vector<const Cell*> links(const Cell& c) const;

    // Cells with exactly one link, row-major.
    std::vector<Cell*> deadEnds();
    std::vector<const Cell*> deadEnds() const;

    Cell& randomCell(RNG& rng);

    // Row-major iteration. Each range-for starts a fresh traversal.
    std::vector<Cell>::iterator begin() { return cells_.begin(); }
    std::vector<Cell>::iterator end() { return cells_.end(); }
    std::vector<Cell>::const_iterator begin() const { return cells_.begin(); }
    std::vector<Cell>::const_iterator end() const { return cells_.end(); }

private:
    Grid(int rows, int columns, GridState initial);

    int rows_ = 0;
    int columns_ = 0;
    GridState state_ = GridState::Closed;
    std::vector<Cell> cells_;
};
