#include "maze_checks.hpp"

#include "distances.hpp"

bool isFullyConnected(const Grid& grid) {
    const Cell* origin = grid.at(0, 0);
    if (!origin) return false;
    return static_cast<int>(computeDistances(grid, *origin).size()) == grid.size();
}

bool linksSymmetric(const Grid& grid) {
    for (const Cell& c : grid) {
        for (Dir d : ALL_DIRS) {
            if (!c.isLinked(d)) continue;
            const Cell* n = grid.neighbor(c, d);
            // A link bit toward a missing neighbor is corrupt state.
            if (!n) return false;
            if (!n->isLinked(&c)) return false;
        }
    }
    return true;
}

int countLinks(const Grid& grid) {
    int n = 0;
    for (const Cell& c : grid) {
        // South and east only, so each pair is seen once.
        if (c.isLinked(Dir::South)) ++n;
        if (c.isLinked(Dir::East)) ++n;
    }
    return n;
}

bool isSpanningTree(const Grid& grid) {
    return countLinks(grid) == grid.size() - 1 && isFullyConnected(grid);
}

bool hasMixedWalls(const Grid& grid) {
    bool anyLinked = false;
    bool anyWall = false;
    for (const Cell& c : grid) {
        for (Dir d : {Dir::South, Dir::East}) {
            if (!c.hasNeighbor(d)) continue;
            if (c.isLinked(d)) anyLinked = true;
            else anyWall = true;
        }
        if (anyLinked && anyWall) return true;
    }
    return false;
}

bool verifyMaze(const Grid& grid, MazeAlgorithm algorithm, std::string* err) {
    return verifyMaze(grid, algorithm, DivisionOptions{}, err);
}

bool verifyMaze(const Grid& grid, MazeAlgorithm algorithm, const DivisionOptions& division, std::string* err) {
    const bool rooms = algorithm == MazeAlgorithm::RecursiveDivision && division.rooms();

    auto fail = [&](const std::string& msg) {
        if (err) *err = std::string(mazeAlgorithmName(algorithm)) + ": " + msg;
        return false;
    };

    if (grid.state() != GridState::Carved) return fail("grid has not been carved");
    if (!linksSymmetric(grid)) return fail("asymmetric link found");
    if (!isFullyConnected(grid)) return fail("not every cell is reachable");
    if (!rooms && !isSpanningTree(grid)) {
        return fail("expected " + std::to_string(grid.size() - 1) + " links, found "
                    + std::to_string(countLinks(grid)));
    }
    if (algorithm == MazeAlgorithm::RecursiveDivision && grid.rows() > 1 && grid.columns() > 1) {
        if (!hasMixedWalls(grid)) return fail("division left no walls or no passages");
    }
    return true;
}
