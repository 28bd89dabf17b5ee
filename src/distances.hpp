#pragma once

#include "maze_grid.hpp"

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

// Hop distances over a grid's link graph.
//
// Every edge weighs 1, so a plain breadth-first search gives exact distances;
// there is no priority queue here. A Distances value is a snapshot: it is not
// updated if links change after it was computed.
//
// Cells that were not reached (a different connected component) are absent.

class Distances {
public:
    int root() const { return root_; }
    // Cell count of the grid the snapshot was taken on.
    int gridSize() const { return gridSize_; }

    bool contains(const Cell& c) const { return dist_.count(c.index()) != 0; }
    std::optional<int> get(const Cell& c) const;
    size_t size() const { return order_.size(); }

    // Reached cell indices, in the order they were first recorded (BFS order
    // when produced by computeDistances).
    const std::vector<int>& cells() const { return order_; }

    // Farthest reached cell (index, distance). Ties go to the earliest cell
    // in cells(). A lone root yields {root, 0}.
    std::pair<int, int> max() const;

private:
    friend Distances computeDistances(const Grid& grid, const Cell& start);

    Distances(const Cell& root, int gridSize);

    // The first call for a cell fixes its position in cells(); later calls
    // only overwrite the value.
    void set(const Cell& c, int distance);

    int root_ = -1;
    int gridSize_ = 0;
    std::unordered_map<int, int> dist_;
    std::vector<int> order_;
};

Distances computeDistances(const Grid& grid, const Cell& start);

// Walks from `goal` back to the root of `dist`. Returns {root, ..., goal};
// empty if `goal` was not reached, or if `dist` or `goal` belong to another grid.
std::vector<const Cell*> pathTo(const Grid& grid, const Distances& dist, const Cell& goal);

// computeDistances + pathTo. Empty when goal is unreachable from start.
std::vector<const Cell*> shortestPath(const Grid& grid, const Cell& start, const Cell& goal);
