#pragma once

#include "maze_algorithms.hpp"
#include "maze_grid.hpp"

#include <string>

// Structural checks over a grid's link graph. Used by `procmaze --verify` and
// by the tests.

// Every cell reachable from cell (0,0).
bool isFullyConnected(const Grid& grid);

// Every link is reciprocated by the neighbor it points at.
bool linksSymmetric(const Grid& grid);

// Number of undirected links (each linked pair counted once).
int countLinks(const Grid& grid);

// Connected with exactly size()-1 links, i.e. no loops.
bool isSpanningTree(const Grid& grid);

// At least one linked and one unlinked physically adjacent pair.
bool hasMixedWalls(const Grid& grid);

// Runs the checks `algorithm` guarantees on a grid it produced. Returns false
// with a reason in *err on the first failure. A division maze with rooms is
// only required to be connected, not loop-free.
bool verifyMaze(const Grid& grid, MazeAlgorithm algorithm, std::string* err = nullptr);
bool verifyMaze(const Grid& grid, MazeAlgorithm algorithm, const DivisionOptions& division,
                std::string* err = nullptr);
