#pragma once

#include "distances.hpp"
#include "maze_grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Maze generators.
//
// Each generator is a small stateless struct with:
//   - REQUIRED_STATE: the grid state it must start from;
//   - apply(grid, rng, err): carves the maze in place.
//
// apply() returns false (and fills *err if given) when the grid is not in
// REQUIRED_STATE, including a grid another generator already carved or one
// whose links were edited after construction. The grid is left untouched in
// that case. On success the grid is marked Carved.
//
// BinaryTree, AldousBroder and RecursiveBacktracker open passages in a closed
// grid; RecursiveDivision raises walls in an open one. All four produce a
// spanning tree (every cell reachable, no loops) unless RecursiveDivision is
// asked to leave rooms, in which case the maze is connected but has loops.

enum class MazeAlgorithm : uint8_t {
    BinaryTree = 0,
    AldousBroder,
    RecursiveBacktracker,
    RecursiveDivision,
};

constexpr int MAZE_ALGORITHM_COUNT = 4;

const char* mazeAlgorithmName(MazeAlgorithm a);

// Accepts the names above case-insensitively, with '-' or '_' separators
// ("binary_tree", "Binary-Tree", "binarytree").
bool parseMazeAlgorithm(const std::string& s, MazeAlgorithm& out);

MazeAlgorithm randomMazeAlgorithm(RNG& rng);

GridState requiredGridState(MazeAlgorithm a);

// A fresh grid in the state `a` expects.
Grid makeGridFor(MazeAlgorithm a, int rows, int columns);

// RecursiveDivision rooms: a region below roomSize on both axes stops
// dividing with probability 1/roomOneIn and stays open. roomOneIn = 0 (the
// default) never leaves rooms.
constexpr int DIVISION_ROOM_SIZE = 5;
constexpr int DIVISION_ROOM_ONE_IN = 4;

struct DivisionOptions {
    int roomSize = DIVISION_ROOM_SIZE;
    int roomOneIn = 0;

    bool rooms() const { return roomOneIn > 0 && roomSize > 2; }
};

inline DivisionOptions divisionWithRooms() {
    DivisionOptions o;
    o.roomOneIn = DIVISION_ROOM_ONE_IN;
    return o;
}

bool applyMazeAlgorithm(MazeAlgorithm a, Grid& grid, RNG& rng, std::string* err = nullptr);
// `division` only affects RecursiveDivision.
bool applyMazeAlgorithm(MazeAlgorithm a, Grid& grid, RNG& rng, const DivisionOptions& division,
                        std::string* err = nullptr);

struct BinaryTree {
    static constexpr GridState REQUIRED_STATE = GridState::Closed;
    static bool apply(Grid& grid, RNG& rng, std::string* err = nullptr);
};

struct AldousBroder {
    static constexpr GridState REQUIRED_STATE = GridState::Closed;
    static bool apply(Grid& grid, RNG& rng, std::string* err = nullptr);
};

struct RecursiveBacktracker {
    static constexpr GridState REQUIRED_STATE = GridState::Closed;
    static bool apply(Grid& grid, RNG& rng, std::string* err = nullptr);
};

struct RecursiveDivision {
    static constexpr GridState REQUIRED_STATE = GridState::Open;
    static bool apply(Grid& grid, RNG& rng, std::string* err = nullptr);
    static bool apply(Grid& grid, RNG& rng, const DivisionOptions& opts, std::string* err = nullptr);
};

// Tree diameter by two BFS passes: the farthest cell A from any start is an
// end of a longest path; the farthest cell B from A is the other end.
// Exact only when the link graph is a tree. On a division maze with rooms
// the result is a long path, not necessarily the longest.
struct LongestPathResult {
    int from = -1;  // cell index of A
    int to = -1;    // cell index of B
    int length = 0; // hops from A to B
    std::vector<const Cell*> path; // {A, ..., B}
};

struct LongestPath {
    // Starts from a random cell in the upper-left quadrant.
    static LongestPathResult apply(const Grid& grid, RNG& rng);
    static LongestPathResult from(const Grid& grid, const Cell& start);
};
