#include "maze_algorithms.hpp"

namespace {

// The state tag alone is not enough: Cell::link/unlink can change links
// without touching it. Closed means no links at all, Open means every
// physically adjacent pair is linked.
bool linksMatchState(const Grid& grid, GridState state) {
    for (const Cell& c : grid) {
        for (Dir d : ALL_DIRS) {
            const bool linked = c.isLinked(d);
            if (state == GridState::Closed && linked) return false;
            if (state == GridState::Open && linked != c.hasNeighbor(d)) return false;
        }
    }
    return true;
}

bool checkState(const Grid& grid, GridState required, MazeAlgorithm a, std::string* err) {
    if (grid.state() != required) {
        if (err) {
            *err = std::string(mazeAlgorithmName(a)) + " requires a " + gridStateName(required)
                 + " grid, got a " + gridStateName(grid.state()) + " one";
        }
        return false;
    }
    if (!linksMatchState(grid, required)) {
        if (err) {
            *err = std::string(mazeAlgorithmName(a)) + " requires a " + gridStateName(required)
                 + " grid, but its links were changed after construction";
        }
        return false;
    }
    return true;
}

std::string normalizeName(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : toLower(s)) {
        if (c == '_' || c == '-' || c == ' ') continue;
        out.push_back(c);
    }
    return out;
}

struct Region {
    int row = 0;
    int column = 0;
    int height = 0;
    int width = 0;
};

} // namespace

const char* mazeAlgorithmName(MazeAlgorithm a) {
    switch (a) {
        case MazeAlgorithm::BinaryTree:           return "binary_tree";
        case MazeAlgorithm::AldousBroder:         return "aldous_broder";
        case MazeAlgorithm::RecursiveBacktracker: return "recursive_backtracker";
        case MazeAlgorithm::RecursiveDivision:    return "recursive_division";
    }
    return "unknown";
}

bool parseMazeAlgorithm(const std::string& s, MazeAlgorithm& out) {
    const std::string key = normalizeName(s);
    for (int i = 0; i < MAZE_ALGORITHM_COUNT; ++i) {
        const MazeAlgorithm a = static_cast<MazeAlgorithm>(i);
        if (key == normalizeName(mazeAlgorithmName(a))) {
            out = a;
            return true;
        }
    }
    return false;
}

MazeAlgorithm randomMazeAlgorithm(RNG& rng) {
    return static_cast<MazeAlgorithm>(rng.range(0, MAZE_ALGORITHM_COUNT - 1));
}

GridState requiredGridState(MazeAlgorithm a) {
    switch (a) {
        case MazeAlgorithm::BinaryTree:           return BinaryTree::REQUIRED_STATE;
        case MazeAlgorithm::AldousBroder:         return AldousBroder::REQUIRED_STATE;
        case MazeAlgorithm::RecursiveBacktracker: return RecursiveBacktracker::REQUIRED_STATE;
        case MazeAlgorithm::RecursiveDivision:    return RecursiveDivision::REQUIRED_STATE;
    }
    return GridState::Closed;
}

Grid makeGridFor(MazeAlgorithm a, int rows, int columns) {
    if (requiredGridState(a) == GridState::Open) return Grid::open(rows, columns);
    return Grid::closed(rows, columns);
}

bool applyMazeAlgorithm(MazeAlgorithm a, Grid& grid, RNG& rng, std::string* err) {
    return applyMazeAlgorithm(a, grid, rng, DivisionOptions{}, err);
}

bool applyMazeAlgorithm(MazeAlgorithm a, Grid& grid, RNG& rng, const DivisionOptions& division, std::string* err) {
    switch (a) {
        case MazeAlgorithm::BinaryTree:           return BinaryTree::apply(grid, rng, err);
        case MazeAlgorithm::AldousBroder:         return AldousBroder::apply(grid, rng, err);
        case MazeAlgorithm::RecursiveBacktracker: return RecursiveBacktracker::apply(grid, rng, err);
        case MazeAlgorithm::RecursiveDivision:    return RecursiveDivision::apply(grid, rng, division, err);
    }
    if (err) *err = "unknown maze algorithm";
    return false;
}

bool BinaryTree::apply(Grid& grid, RNG& rng, std::string* err) {
    if (!checkState(grid, REQUIRED_STATE, MazeAlgorithm::BinaryTree, err)) return false;

    // Links north or east only, so the top row and the right column end up as
    // unbroken corridors.
    for (Cell& c : grid) {
        Cell* north = grid.neighbor(c, Dir::North);
        Cell* east = grid.neighbor(c, Dir::East);

        if (north && east) {
            c.link(rng.coinFlip() ? north : east);
        } else if (north) {
            c.link(north);
        } else if (east) {
            c.link(east);
        }
    }

    grid.markCarved();
    return true;
}

bool AldousBroder::apply(Grid& grid, RNG& rng, std::string* err) {
    if (!checkState(grid, REQUIRED_STATE, MazeAlgorithm::AldousBroder, err)) return false;

    std::vector<uint8_t> visited(static_cast<size_t>(grid.size()), 0);

    Cell* cell = &grid.randomCell(rng);
    visited[static_cast<size_t>(cell->index())] = 1;
    int unvisited = grid.size() - 1;

    // Random walk; the walk itself ignores links, only first entries carve.
    while (unvisited > 0) {
        const std::vector<Cell*> neigh = grid.neighbors(*cell);
        Cell* next = neigh[static_cast<size_t>(rng.range(0, static_cast<int>(neigh.size()) - 1))];
        if (visited[static_cast<size_t>(next->index())] == 0) {
            cell->link(next);
            visited[static_cast<size_t>(next->index())] = 1;
            --unvisited;
        }
        cell = next;
    }

    grid.markCarved();
    return true;
}

bool RecursiveBacktracker::apply(Grid& grid, RNG& rng, std::string* err) {
    if (!checkState(grid, REQUIRED_STATE, MazeAlgorithm::RecursiveBacktracker, err)) return false;

    std::vector<uint8_t> visited(static_cast<size_t>(grid.size()), 0);
    std::vector<Cell*> stack;
    stack.reserve(static_cast<size_t>(grid.size()));

    Cell* start = &grid.randomCell(rng);
    visited[static_cast<size_t>(start->index())] = 1;
    stack.push_back(start);

    std::vector<Cell*> neigh;
    neigh.reserve(DIR_COUNT);

    while (!stack.empty()) {
        Cell* cur = stack.back();

        neigh.clear();
        for (Cell* n : grid.neighbors(*cur)) {
            if (visited[static_cast<size_t>(n->index())] == 0) neigh.push_back(n);
        }

        if (neigh.empty()) {
            stack.pop_back();
            continue;
        }

        Cell* nxt = neigh[static_cast<size_t>(rng.range(0, static_cast<int>(neigh.size()) - 1))];
        cur->link(nxt);
        visited[static_cast<size_t>(nxt->index())] = 1;
        stack.push_back(nxt);
    }

    grid.markCarved();
    return true;
}

bool RecursiveDivision::apply(Grid& grid, RNG& rng, std::string* err) {
    return apply(grid, rng, DivisionOptions{}, err);
}

bool RecursiveDivision::apply(Grid& grid, RNG& rng, const DivisionOptions& opts, std::string* err) {
    if (!checkState(grid, REQUIRED_STATE, MazeAlgorithm::RecursiveDivision, err)) return false;

    // Explicit stack instead of recursion; the second half is pushed first so
    // regions are visited in the same order a recursive split would use.
    std::vector<Region> stack;
    stack.push_back({0, 0, grid.rows(), grid.columns()});
    bool first = true;

    while (!stack.empty()) {
        const Region r = stack.back();
        stack.pop_back();

        if (r.height <= 1 || r.width <= 1) continue;

        // Small regions are sometimes left undivided as rooms. The whole grid
        // is always split at least once so a wall exists.
        if (!first && opts.rooms() && r.height < opts.roomSize && r.width < opts.roomSize
            && rng.range(0, opts.roomOneIn - 1) == 0) {
            continue;
        }
        first = false;

        bool horizontal = false;
        if (r.height > r.width) horizontal = true;
        else if (r.width > r.height) horizontal = false;
        else horizontal = rng.coinFlip();

        if (horizontal) {
            // Wall below row `split`, one passage left open.
            const int split = rng.range(0, r.height - 2);
            const int passage = rng.range(0, r.width - 1);
            for (int x = 0; x < r.width; ++x) {
                if (x == passage) continue;
                Cell* c = grid.at(r.row + split, r.column + x);
                if (c) c->unlink(grid.neighbor(*c, Dir::South));
            }
            stack.push_back({r.row + split + 1, r.column, r.height - split - 1, r.width});
            stack.push_back({r.row, r.column, split + 1, r.width});
        } else {
            // Wall east of column `split`, one passage left open.
            const int split = rng.range(0, r.width - 2);
            const int passage = rng.range(0, r.height - 1);
            for (int y = 0; y < r.height; ++y) {
                if (y == passage) continue;
                Cell* c = grid.at(r.row + y, r.column + split);
                if (c) c->unlink(grid.neighbor(*c, Dir::East));
            }
            stack.push_back({r.row, r.column + split + 1, r.height, r.width - split - 1});
            stack.push_back({r.row, r.column, r.height, split + 1});
        }
    }

    grid.markCarved();
    return true;
}

LongestPathResult LongestPath::apply(const Grid& grid, RNG& rng) {
    const int row = rng.range(0, (grid.rows() - 1) / 2);
    const int column = rng.range(0, (grid.columns() - 1) / 2);
    return from(grid, *grid.at(row, column));
}

LongestPathResult LongestPath::from(const Grid& grid, const Cell& start) {
    LongestPathResult out;

    const Distances first = computeDistances(grid, start);
    const int a = first.max().first;

    const Distances second = computeDistances(grid, grid.cell(a));
    const auto [b, len] = second.max();

    out.from = a;
    out.to = b;
    out.length = len;
    out.path = pathTo(grid, second, grid.cell(b));
    return out;
}
