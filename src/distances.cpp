#include "distances.hpp"

#include <algorithm>
#include <deque>

Distances::Distances(const Cell& root, int gridSize) : root_(root.index()), gridSize_(gridSize) {
    set(root, 0);
}

std::optional<int> Distances::get(const Cell& c) const {
    auto it = dist_.find(c.index());
    if (it == dist_.end()) return std::nullopt;
    return it->second;
}

void Distances::set(const Cell& c, int distance) {
    auto res = dist_.insert({c.index(), distance});
    if (res.second) {
        order_.push_back(c.index());
    } else {
        res.first->second = distance;
    }
}

std::pair<int, int> Distances::max() const {
    int bestCell = root_;
    int bestDist = 0;
    for (int i : order_) {
        const int d = dist_.at(i);
        if (d > bestDist) {
            bestDist = d;
            bestCell = i;
        }
    }
    return {bestCell, bestDist};
}

Distances computeDistances(const Grid& grid, const Cell& start) {
    Distances dist(start, grid.size());

    std::deque<const Cell*> q;
    q.push_back(&start);

    while (!q.empty()) {
        const Cell* cur = q.front();
        q.pop_front();
        const int cd = *dist.get(*cur);

        for (const Cell* n : grid.links(*cur)) {
            if (dist.contains(*n)) continue;
            dist.set(*n, cd + 1);
            q.push_back(n);
        }
    }

    return dist;
}

std::vector<const Cell*> pathTo(const Grid& grid, const Distances& dist, const Cell& goal) {
    if (dist.gridSize() != grid.size()) return {};
    if (goal.index() < 0 || goal.index() >= grid.size() || &grid.cell(goal.index()) != &goal) return {};

    std::optional<int> goalDist = dist.get(goal);
    if (!goalDist) return {};

    std::vector<const Cell*> path;
    path.reserve(static_cast<size_t>(*goalDist) + 1);
    path.push_back(&goal);

    const Cell* cur = &goal;
    int curDist = *goalDist;
    while (curDist > 0) {
        const Cell* prev = nullptr;
        for (const Cell* n : grid.links(*cur)) {
            std::optional<int> nd = dist.get(*n);
            if (nd && *nd == curDist - 1) {
                prev = n;
                break;
            }
        }
        // Links changed since the snapshot was taken.
        if (!prev) return {};
        path.push_back(prev);
        cur = prev;
        curDist -= 1;
    }

    if (cur->index() != dist.root()) return {};
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<const Cell*> shortestPath(const Grid& grid, const Cell& start, const Cell& goal) {
    const Distances dist = computeDistances(grid, start);
    return pathTo(grid, dist, goal);
}
