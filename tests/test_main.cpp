#include "common.hpp"
#include "distances.hpp"
#include "level_layout.hpp"
#include "maze_algorithms.hpp"
#include "maze_checks.hpp"
#include "maze_grid.hpp"
#include "rng.hpp"
#include "settings.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

const MazeAlgorithm ALL_ALGORITHMS[] = {
    MazeAlgorithm::BinaryTree,
    MazeAlgorithm::AldousBroder,
    MazeAlgorithm::RecursiveBacktracker,
    MazeAlgorithm::RecursiveDivision,
};

Grid generate(MazeAlgorithm a, int rows, int columns, uint32_t seed) {
    Grid g = makeGridFor(a, rows, columns);
    RNG rng(seed);
    std::string err;
    const bool ok = applyMazeAlgorithm(a, g, rng, &err);
    expect(ok, std::string("applyMazeAlgorithm failed: ") + err);
    return g;
}

std::vector<uint8_t> linkMasks(const Grid& g) {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(g.size()));
    for (const Cell& c : g) out.push_back(c.linkMask());
    return out;
}

void linkAll(Grid& g) {
    for (Cell& c : g) {
        for (Cell* n : g.neighbors(c)) c.link(n);
    }
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_grid_construction() {
    Grid g = Grid::closed(3, 4);
    expect(g.rows() == 3 && g.columns() == 4, "closed grid dimensions");
    expect(g.size() == 12, "closed grid cell count");
    expect(g.state() == GridState::Closed, "closed grid state");
    expect(countLinks(g) == 0, "closed grid has no links");

    expect(g.at(-1, 0) == nullptr, "at(-1,0) should be absent");
    expect(g.at(0, -1) == nullptr, "at(0,-1) should be absent");
    expect(g.at(3, 0) == nullptr, "at(rows,0) should be absent");
    expect(g.at(0, 4) == nullptr, "at(0,cols) should be absent");

    const Cell* c = g.at(1, 2);
    expect(c != nullptr && c->row() == 1 && c->column() == 2, "at(1,2) coordinates");

    const Cell* corner = g.at(0, 0);
    expect(!corner->hasNeighbor(Dir::North) && !corner->hasNeighbor(Dir::West), "corner has no N/W neighbor");
    expect(g.neighbor(*corner, Dir::South) == g.at(1, 0), "south of (0,0) is (1,0)");
    expect(g.neighbor(*corner, Dir::East) == g.at(0, 1), "east of (0,0) is (0,1)");

    expect(g.neighbors(*g.at(0, 0)).size() == 2, "corner has 2 neighbors");
    expect(g.neighbors(*g.at(0, 1)).size() == 3, "edge cell has 3 neighbors");
    expect(g.neighbors(*g.at(1, 1)).size() == 4, "interior cell has 4 neighbors");

    Grid o = Grid::open(3, 4);
    expect(o.state() == GridState::Open, "open grid state");
    expect(countLinks(o) == 3 * 3 + 4 * 2, "open grid links every adjacent pair");
    expect(linksSymmetric(o), "open grid links are symmetric");
    expect(isFullyConnected(o), "open grid is connected");
    expect(!isSpanningTree(o), "open grid has loops");

    Grid tiny = Grid::closed(0, 5);
    expect(tiny.rows() == 1 && tiny.columns() == 5, "zero rows clamp to one");
}

void test_cell_link_unlink() {
    Grid g = Grid::closed(3, 3);
    Cell* a = g.at(1, 1);
    Cell* b = g.at(1, 2);
    Cell* far = g.at(0, 0);

    a->link(b);
    expect(a->isLinked(b) && b->isLinked(a), "link is bidirectional by default");
    expect(a->isLinked(Dir::East) && b->isLinked(Dir::West), "link sets direction bits");
    expect(a->linkCount() == 1, "one link after link()");

    a->link(nullptr);
    expect(a->linkCount() == 1, "linking to an absent neighbor is a no-op");
    expect(!a->isLinked(nullptr), "isLinked(nullptr) is false");

    a->link(far);
    expect(!a->isLinked(far) && a->linkCount() == 1, "linking a non-adjacent cell is a no-op");

    a->unlink(b);
    expect(!a->isLinked(b) && !b->isLinked(a), "unlink is bidirectional by default");

    Cell* c = g.at(2, 1);
    a->link(c, false);
    expect(a->isLinked(c) && !c->isLinked(a), "unidirectional link");
    expect(!linksSymmetric(g), "one-way link breaks symmetry");
    a->unlink(c, false);
    expect(countLinks(g) == 0 && linksSymmetric(g), "unidirectional unlink restores state");

    a->tile = TILE_STAIRS;
    expect(g.at(1, 1)->tile == TILE_STAIRS, "tile marker is stored as written");
}

void test_each_cell_row_major() {
    const Grid g = Grid::closed(3, 5);
    for (int pass = 0; pass < 2; ++pass) {
        int expectedIndex = 0;
        for (const Cell& c : g) {
            expect(c.index() == expectedIndex, "iteration is row-major");
            expect(c.row() == expectedIndex / 5 && c.column() == expectedIndex % 5, "iteration coordinates");
            ++expectedIndex;
        }
        expect(expectedIndex == 15, "iteration visits every cell each pass");
    }
}

void test_random_cell_uses_rng() {
    Grid g = Grid::closed(4, 4);
    RNG r1(99u);
    RNG r2(99u);
    for (int i = 0; i < 50; ++i) {
        expect(g.randomCell(r1).index() == g.randomCell(r2).index(), "randomCell reproducible for equal seeds");
    }
}

void test_generators_produce_spanning_trees() {
    const int sizes[][2] = {{1, 1}, {1, 7}, {7, 1}, {2, 2}, {5, 5}, {12, 9}, {8, 16}};
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        for (const auto& sz : sizes) {
            for (uint32_t seed = 1; seed <= 5; ++seed) {
                const Grid g = generate(a, sz[0], sz[1], seed);
                const std::string tag = std::string(mazeAlgorithmName(a)) + " "
                    + std::to_string(sz[0]) + "x" + std::to_string(sz[1]) + " seed " + std::to_string(seed);

                expect(g.size() == sz[0] * sz[1], tag + ": cell count unchanged");
                expect(g.rows() == sz[0] && g.columns() == sz[1], tag + ": dimensions unchanged");
                expect(g.state() == GridState::Carved, tag + ": grid marked carved");
                expect(linksSymmetric(g), tag + ": links symmetric");
                expect(isFullyConnected(g), tag + ": every cell reachable");
                expect(isSpanningTree(g), tag + ": no loops");

                std::string err;
                expect(verifyMaze(g, a, &err), tag + ": verifyMaze " + err);
            }
        }
    }
}

void test_binary_tree_structure() {
    const Grid g = generate(MazeAlgorithm::BinaryTree, 9, 11, 7u);
    for (const Cell& c : g) {
        const int ne = (c.isLinked(Dir::North) ? 1 : 0) + (c.isLinked(Dir::East) ? 1 : 0);
        const bool hasN = c.hasNeighbor(Dir::North);
        const bool hasE = c.hasNeighbor(Dir::East);
        if (!hasN && !hasE) {
            expect(ne == 0, "top-right cell carves nothing");
        } else {
            expect(ne == 1, "every other cell links exactly one of north/east");
        }
        if (!hasN && hasE) expect(c.isLinked(Dir::East), "top row is a corridor");
        if (hasN && !hasE) expect(c.isLinked(Dir::North), "right column is a corridor");
    }
}

void test_generation_is_deterministic() {
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        const Grid g1 = generate(a, 10, 13, 4242u);
        const Grid g2 = generate(a, 10, 13, 4242u);
        expect(linkMasks(g1) == linkMasks(g2),
               std::string(mazeAlgorithmName(a)) + ": same seed must give the same maze");
    }
}

void test_precondition_errors() {
    {
        Grid g = Grid::closed(8, 8);
        RNG rng(1u);
        std::string err;
        expect(!RecursiveDivision::apply(g, rng, &err), "division on a closed grid must fail");
        expect(!err.empty(), "division failure reports a reason");
        expect(g.state() == GridState::Closed && countLinks(g) == 0, "failed division leaves grid untouched");
    }
    {
        Grid g = Grid::open(6, 6);
        const int before = countLinks(g);
        RNG rng(1u);
        std::string err;
        expect(!BinaryTree::apply(g, rng, &err), "binary tree on an open grid must fail");
        expect(err.find("binary_tree") != std::string::npos, "error names the algorithm");
        expect(countLinks(g) == before, "failed binary tree leaves links untouched");
    }
    {
        // Still tagged Closed, but every pair was linked by hand.
        Grid g = Grid::closed(4, 4);
        linkAll(g);
        const std::vector<uint8_t> before = linkMasks(g);
        RNG rng(1u);
        std::string err;
        expect(!BinaryTree::apply(g, rng, &err), "binary tree on a hand-linked closed grid must fail");
        expect(!err.empty(), "hand-linked grid failure reports a reason");
        expect(linkMasks(g) == before && g.state() == GridState::Closed, "hand-linked grid left untouched");
    }
    {
        Grid g = Grid::closed(4, 4);
        g.at(2, 2)->link(g.at(2, 3));
        RNG rng(1u);
        expect(!RecursiveBacktracker::apply(g, rng), "a single stray link is enough to reject a closed grid");
        expect(countLinks(g) == 1, "stray link preserved");
    }
    {
        // Still tagged Open, but every wall was raised by hand.
        Grid g = Grid::open(4, 4);
        for (Cell& c : g) {
            for (Cell* n : g.neighbors(c)) c.unlink(n);
        }
        RNG rng(1u);
        std::string err;
        expect(!RecursiveDivision::apply(g, rng, &err), "division on a hand-walled open grid must fail");
        expect(err.find("recursive_division") != std::string::npos, "error names the algorithm");
        expect(countLinks(g) == 0 && g.state() == GridState::Open, "hand-walled grid left untouched");
    }
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        Grid g = generate(a, 5, 5, 3u);
        const std::vector<uint8_t> before = linkMasks(g);
        RNG rng(2u);
        expect(!applyMazeAlgorithm(a, g, rng), std::string(mazeAlgorithmName(a)) + ": reapplying must fail");
        expect(linkMasks(g) == before, "failed reapply leaves links untouched");
    }
    expect(requiredGridState(MazeAlgorithm::RecursiveDivision) == GridState::Open, "division needs an open grid");
    expect(makeGridFor(MazeAlgorithm::AldousBroder, 3, 3).state() == GridState::Closed, "makeGridFor closed");
    expect(makeGridFor(MazeAlgorithm::RecursiveDivision, 3, 3).state() == GridState::Open, "makeGridFor open");
}

void test_recursive_division_scenario() {
    Grid g = Grid::open(8, 8);
    RNG rng(2024u);
    std::string err;
    expect(RecursiveDivision::apply(g, rng, &err), "division on an open grid succeeds: " + err);
    expect(g.rows() == 8 && g.columns() == 8, "division keeps 8x8");
    expect(hasMixedWalls(g), "division leaves both walls and passages");
    expect(isSpanningTree(g), "division yields a spanning tree");
}

void test_division_rooms() {
    const DivisionOptions rooms = divisionWithRooms();
    expect(rooms.rooms() && rooms.roomSize == 5 && rooms.roomOneIn == 4, "room defaults");
    expect(!DivisionOptions{}.rooms(), "rooms are off by default");

    int withLoops = 0;
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Grid g = Grid::open(8, 8);
        RNG rng(seed);
        std::string err;
        expect(RecursiveDivision::apply(g, rng, rooms, &err), "division with rooms succeeds: " + err);
        expect(linksSymmetric(g), "rooms: links symmetric");
        expect(isFullyConnected(g), "rooms: every cell reachable");
        expect(hasMixedWalls(g), "rooms: walls and passages both present");
        expect(verifyMaze(g, MazeAlgorithm::RecursiveDivision, rooms, &err), "rooms: verifyMaze " + err);

        if (countLinks(g) > g.size() - 1) {
            ++withLoops;
            expect(!verifyMaze(g, MazeAlgorithm::RecursiveDivision), "a room maze is not a perfect maze");
        }
    }
    expect(withLoops > 0, "some room mazes keep open rooms");

    // Small enough to be a room from the start; the first split still happens.
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Grid g = Grid::open(2, 2);
        RNG rng(seed);
        expect(RecursiveDivision::apply(g, rng, rooms), "2x2 division with rooms succeeds");
        expect(hasMixedWalls(g) && isFullyConnected(g), "2x2 room maze has a wall and stays connected");
    }

    LevelConfig cfg;
    cfg.algorithm = MazeAlgorithm::RecursiveDivision;
    expect(cfg.division.rooms(), "levels use division rooms by default");
    for (int i = 0; i < 10; ++i) {
        LevelLayout lay;
        std::string err;
        expect(buildLevelLayout(cfg, levelSeed(3u, i), lay, &err), "room level builds: " + err);
        expect(verifyMaze(lay.grid, lay.algorithm, cfg.division, &err), "room level verifies: " + err);
        expect(lay.entrance != lay.stairs, "room level has distinct entrance and stairs");
    }
}

void test_bfs_full_grid() {
    Grid g = Grid::closed(3, 3);
    linkAll(g);

    const Distances d = computeDistances(g, *g.at(0, 0));
    expect(d.size() == 9, "BFS reaches all 9 cells");
    expect(d.get(*g.at(0, 0)) == 0, "distance to root is 0");
    expect(d.get(*g.at(2, 2)) == 4, "distance to far corner is 4");
    for (const Cell& c : g) {
        expect(d.get(c) == c.row() + c.column(), "hop count equals Manhattan distance on a full grid");
    }
    expect(d.cells().front() == g.at(0, 0)->index(), "root is first in BFS order");

    const auto far = d.max();
    expect(far.first == g.at(2, 2)->index() && far.second == 4, "max() is the far corner");
}

void test_distances_unreached_cells() {
    Grid g = Grid::closed(2, 2);
    g.at(0, 0)->link(g.at(0, 1));

    const Distances d = computeDistances(g, *g.at(0, 0));
    expect(d.size() == 2, "only the linked component is reached");
    expect(!d.contains(*g.at(1, 1)), "unreached cell is absent");
    expect(!d.get(*g.at(1, 0)).has_value(), "unreached cell has no distance");

    expect(pathTo(g, d, *g.at(1, 1)).empty(), "pathTo unreached goal is empty");
    expect(shortestPath(g, *g.at(0, 0), *g.at(1, 0)).empty(), "shortestPath to another component is empty");

    expect(d.gridSize() == g.size(), "distances remember their grid size");

    const Distances lone = computeDistances(g, *g.at(1, 1));
    expect(lone.size() == 1 && lone.max().first == g.at(1, 1)->index() && lone.max().second == 0,
           "isolated root is its own farthest cell");
}

void test_distances_from_another_grid() {
    Grid small = Grid::closed(2, 2);
    linkAll(small);
    Grid big = Grid::closed(6, 6);
    linkAll(big);

    const Distances bigDist = computeDistances(big, *big.at(0, 0));
    expect(pathTo(small, bigDist, *big.at(5, 5)).empty(), "foreign distances and goal give an empty path");
    expect(pathTo(small, bigDist, *small.at(1, 1)).empty(), "distances from a different grid give an empty path");

    const Distances smallDist = computeDistances(small, *small.at(0, 0));
    expect(pathTo(small, smallDist, *big.at(1, 1)).empty(), "goal from a different grid gives an empty path");
    expect(pathTo(small, smallDist, *small.at(1, 1)).size() == 3, "matching grid still resolves the path");

    expect(small.neighbor(*big.at(5, 5), Dir::North) == nullptr, "neighbor of a foreign cell past the arena is absent");
}

void test_parse_u32() {
    uint32_t v = 0;
    expect(parseU32("4294967295", v) && v == 4294967295u, "max u32 parses");
    expect(!parseU32("4294967296", v), "overflow rejected");
    expect(!parseU32("-1", v) && !parseU32("", v) && !parseU32("12a", v), "non-digits rejected");
    expect(!parseU32(" 7", v), "whitespace is the caller's job");
}

void test_shortest_path_reconstruction() {
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        const Grid g = generate(a, 9, 14, 77u);
        const Cell& start = *g.at(0, 0);
        const Cell& goal = *g.at(8, 13);

        const std::vector<const Cell*> path = shortestPath(g, start, goal);
        const std::string tag = mazeAlgorithmName(a);
        expect(!path.empty(), tag + ": path exists in a perfect maze");
        if (path.empty()) continue;

        expect(path.front() == &start, tag + ": path starts at start");
        expect(path.back() == &goal, tag + ": path ends at goal");
        for (size_t i = 1; i < path.size(); ++i) {
            expect(path[i - 1]->isLinked(path[i]), tag + ": consecutive path cells are linked");
        }

        const Distances d = computeDistances(g, start);
        expect(static_cast<int>(path.size()) == *d.get(goal) + 1, tag + ": path length matches distance");
    }

    const Grid g = generate(MazeAlgorithm::RecursiveBacktracker, 4, 4, 5u);
    const std::vector<const Cell*> self = shortestPath(g, *g.at(2, 2), *g.at(2, 2));
    expect(self.size() == 1 && self.front() == g.at(2, 2), "path from a cell to itself is that cell");
}

void test_dead_ends() {
    const Grid g = generate(MazeAlgorithm::BinaryTree, 6, 6, 11u);
    const std::vector<const Cell*> ends = g.deadEnds();
    expect(!ends.empty(), "binary tree maze has dead ends");
    for (const Cell* c : ends) {
        expect(c->linkCount() == 1, "dead end has exactly one link");
    }

    const Grid single = generate(MazeAlgorithm::BinaryTree, 1, 1, 11u);
    expect(single.deadEnds().empty(), "1x1 grid has no dead ends");
}

void test_longest_path_corridor() {
    Grid g = Grid::closed(1, 6);
    for (int c = 0; c + 1 < 6; ++c) g.at(0, c)->link(g.at(0, c + 1));

    const LongestPathResult lp = LongestPath::from(g, *g.at(0, 2));
    const int a = g.at(0, 0)->index();
    const int b = g.at(0, 5)->index();
    expect((lp.from == a && lp.to == b) || (lp.from == b && lp.to == a), "corridor ends are the diameter");
    expect(lp.length == 5, "corridor diameter is 5");
    expect(lp.path.size() == 6, "diameter path covers the corridor");
    expect(!lp.path.empty() && lp.path.front()->index() == lp.from && lp.path.back()->index() == lp.to,
           "diameter path runs from A to B");
}

void test_longest_path_is_diameter() {
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        const Grid g = generate(a, 6, 7, 31u);

        int best = 0;
        for (const Cell& c : g) {
            best = std::max(best, computeDistances(g, c).max().second);
        }

        RNG rng(8u);
        const LongestPathResult lp = LongestPath::apply(g, rng);
        expect(lp.length == best, std::string(mazeAlgorithmName(a)) + ": two-pass BFS finds the diameter");
        expect(static_cast<int>(lp.path.size()) == lp.length + 1, "diameter path has length + 1 cells");
    }
}

void test_longest_path_deterministic() {
    const Grid g = generate(MazeAlgorithm::AldousBroder, 7, 7, 19u);
    RNG r1(555u);
    RNG r2(555u);
    const LongestPathResult a = LongestPath::apply(g, r1);
    const LongestPathResult b = LongestPath::apply(g, r2);
    expect(a.from == b.from && a.to == b.to, "LongestPath endpoints reproducible for equal seeds");
}

void test_algorithm_names() {
    for (MazeAlgorithm a : ALL_ALGORITHMS) {
        MazeAlgorithm parsed{};
        expect(parseMazeAlgorithm(mazeAlgorithmName(a), parsed) && parsed == a, "name round-trips");
    }
    MazeAlgorithm parsed{};
    expect(parseMazeAlgorithm("Recursive-Division", parsed) && parsed == MazeAlgorithm::RecursiveDivision,
           "names are case/separator insensitive");
    expect(parseMazeAlgorithm("aldousbroder", parsed) && parsed == MazeAlgorithm::AldousBroder,
           "separators are optional");
    expect(!parseMazeAlgorithm("sidewinder", parsed), "unknown names are rejected");
}

void test_level_layout() {
    LevelConfig cfg;
    cfg.rows = 12;
    cfg.columns = 15;
    cfg.algorithm = MazeAlgorithm::RecursiveBacktracker;
    cfg.deadEndFeatures = 4;

    LevelLayout lay;
    std::string err;
    expect(buildLevelLayout(cfg, 9001u, lay, &err), "buildLevelLayout succeeds: " + err);
    expect(lay.grid.rows() == 12 && lay.grid.columns() == 15, "layout uses configured size");
    expect(lay.algorithm == MazeAlgorithm::RecursiveBacktracker, "layout uses configured algorithm");
    expect(lay.entrance != lay.stairs, "entrance and stairs differ");

    const Cell* entrance = lay.grid.at(lay.entrance.y, lay.entrance.x);
    const Cell* stairs = lay.grid.at(lay.stairs.y, lay.stairs.x);
    expect(entrance && entrance->tile == TILE_ENTRANCE, "entrance marker written");
    expect(stairs && stairs->tile == TILE_STAIRS, "stairs marker written");
    if (entrance && stairs) {
        const std::vector<const Cell*> path = shortestPath(lay.grid, *entrance, *stairs);
        expect(static_cast<int>(path.size()) == lay.pathLength + 1, "pathLength matches entrance->stairs path");
    }

    expect(lay.features.size() <= 4, "no more features than requested");
    for (const Vec2i& p : lay.features) {
        const Cell* c = lay.grid.at(p.y, p.x);
        expect(c && c->tile == TILE_FEATURE, "feature marker written");
        expect(c && c->linkCount() == 1, "features sit on dead ends");
    }
    expect(lay.deadEnds.size() == lay.grid.deadEnds().size(), "all dead ends reported");

    LevelLayout again;
    expect(buildLevelLayout(cfg, 9001u, again, &err), "second build succeeds");
    expect(again.entrance == lay.entrance && again.stairs == lay.stairs, "same seed, same endpoints");
    expect(linkMasks(again.grid) == linkMasks(lay.grid), "same seed, same maze");
    expect(again.features.size() == lay.features.size(), "same seed, same feature count");
    for (size_t i = 0; i < lay.features.size() && i < again.features.size(); ++i) {
        expect(again.features[i] == lay.features[i], "same seed, same features");
    }
}

void test_level_layout_random_choices() {
    LevelConfig cfg;
    cfg.rows = 0;
    cfg.columns = 0;
    cfg.algorithm.reset();

    for (int i = 0; i < 20; ++i) {
        LevelLayout lay;
        std::string err;
        const uint32_t seed = levelSeed(77u, i);
        expect(buildLevelLayout(cfg, seed, lay, &err), "random layout builds: " + err);
        expect(lay.seed == seed, "layout records its seed");
        expect(lay.grid.rows() >= RANDOM_DIM_MIN && lay.grid.rows() <= RANDOM_DIM_MAX, "random rows in range");
        expect(lay.grid.columns() >= RANDOM_DIM_MIN && lay.grid.columns() <= RANDOM_DIM_MAX, "random columns in range");
        expect(verifyMaze(lay.grid, lay.algorithm, cfg.division, &err), "random layout verifies: " + err);
    }

    expect(levelSeed(5u, 0) == levelSeed(5u, 0), "levelSeed is stable");
    expect(levelSeed(5u, 0) != levelSeed(5u, 1), "levelSeed varies per level");
    expect(levelSeed(5u, 0) != levelSeed(6u, 0), "levelSeed varies per run");
}

void test_verify_maze_detects_damage() {
    Grid g = generate(MazeAlgorithm::BinaryTree, 5, 5, 21u);
    std::string err;
    expect(verifyMaze(g, MazeAlgorithm::BinaryTree, &err), "fresh maze verifies");

    // Open one wall: still connected, but now there is a loop.
    for (Cell& c : g) {
        Cell* s = g.neighbor(c, Dir::South);
        if (s && !c.isLinked(s)) {
            c.link(s);
            break;
        }
    }
    err.clear();
    expect(!verifyMaze(g, MazeAlgorithm::BinaryTree, &err), "extra link is detected");
    expect(!err.empty(), "verify failure reports a reason");

    const Grid closed = Grid::closed(3, 3);
    expect(!verifyMaze(closed, MazeAlgorithm::BinaryTree), "uncarved grid fails verification");
}

void test_settings_load() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "procmaze_settings_test.ini";

    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "rows = 14\n";
        out << "Columns = 99999   ; clamped\n";
        out << "algorithm = Aldous-Broder\n";
        out << "seed = 4000000000\n";
        out << "levels = 0\n";
        out << "dead_end_features = 2\n";
        out << "verify = yes\n";
        out << "bogus_key = 1\n";
        out << "no equals sign here\n";
        out << "rows_typo = x\n";
        out << "division_rooms = no\n";
    }

    std::string warns;
    const Settings s = loadSettings(path.string(), &warns);
    expect(s.rows == 14, "rows loaded");
    expect(s.columns == Grid::MAX_DIM, "columns clamped");
    expect(s.algorithm && *s.algorithm == MazeAlgorithm::AldousBroder, "algorithm loaded");
    expect(s.seed == 4000000000u, "u32 seed loaded");
    expect(s.levels == 1, "levels clamped to at least 1");
    expect(s.deadEndFeatures == 2, "dead_end_features loaded");
    expect(s.verify, "verify loaded");
    expect(warns.find("Line 9") != std::string::npos, "unknown key warned with line number");
    expect(warns.find("Line 10") != std::string::npos, "malformed line warned");

    const LevelConfig cfg = levelConfigFrom(s);
    expect(cfg.rows == 14 && cfg.deadEndFeatures == 2, "level config mirrors settings");
    expect(!s.divisionRooms && !cfg.division.rooms(), "division_rooms off reaches the level config");

    {
        std::ofstream out(path);
        out << "algorithm = random\nrows = -3\nseed = -1\n";
    }
    warns.clear();
    const Settings r = loadSettings(path.string(), &warns);
    expect(!r.algorithm.has_value(), "random algorithm leaves it unset");
    expect(r.rows == 0, "negative rows clamp to random");
    expect(r.seed == 1u, "invalid seed keeps default");
    expect(!warns.empty(), "invalid seed warned");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_settings_defaults_roundtrip() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "procmaze_settings_default_test.ini";

    expect(writeDefaultSettings(path.string()), "default settings written");

    std::string warns;
    const Settings s = loadSettings(path.string(), &warns);
    const Settings d;
    expect(warns.empty(), "default settings parse without warnings");
    expect(s.rows == d.rows && s.columns == d.columns, "default size round-trips");
    expect(!s.algorithm.has_value(), "default algorithm is random");
    expect(s.seed == d.seed && s.levels == d.levels, "default seed/levels round-trip");
    expect(s.deadEndFeatures == d.deadEndFeatures && s.verify == d.verify, "default features/verify round-trip");
    expect(s.divisionRooms == d.divisionRooms && levelConfigFrom(s).division.rooms(), "default division rooms round-trip");

    const Settings missing = loadSettings((fs::temp_directory_path() / "procmaze_no_such_file.ini").string());
    expect(missing.rows == d.rows && missing.seed == d.seed, "missing file yields defaults");

    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running ProcMaze tests...\n";

    test_rng_reproducible();
    test_parse_u32();
    test_grid_construction();
    test_cell_link_unlink();
    test_each_cell_row_major();
    test_random_cell_uses_rng();

    test_generators_produce_spanning_trees();
    test_binary_tree_structure();
    test_generation_is_deterministic();
    test_precondition_errors();
    test_recursive_division_scenario();
    test_division_rooms();

    test_bfs_full_grid();
    test_distances_unreached_cells();
    test_distances_from_another_grid();
    test_shortest_path_reconstruction();
    test_dead_ends();
    test_longest_path_corridor();
    test_longest_path_is_diameter();
    test_longest_path_deterministic();

    test_algorithm_names();
    test_level_layout();
    test_level_layout_random_choices();
    test_verify_maze_detects_damage();

    test_settings_load();
    test_settings_defaults_roundtrip();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
