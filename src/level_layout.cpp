#include "level_layout.hpp"

#include "rng.hpp"

#include <algorithm>
#include <utility>

uint32_t levelSeed(uint32_t runSeed, int levelIndex) {
    return hashCombine(runSeed, tag32("LEVEL"), static_cast<uint32_t>(levelIndex));
}

bool buildLevelLayout(const LevelConfig& cfg, uint32_t seed, LevelLayout& out, std::string* err) {
    RNG rng(seed);

    const int rows = (cfg.rows > 0) ? cfg.rows : rng.range(RANDOM_DIM_MIN, RANDOM_DIM_MAX);
    const int columns = (cfg.columns > 0) ? cfg.columns : rng.range(RANDOM_DIM_MIN, RANDOM_DIM_MAX);
    const MazeAlgorithm algo = cfg.algorithm ? *cfg.algorithm : randomMazeAlgorithm(rng);

    Grid grid = makeGridFor(algo, rows, columns);
    if (!applyMazeAlgorithm(algo, grid, rng, cfg.division, err)) return false;

    for (Cell& c : grid) c.tile = TILE_FLOOR;

    // Entrance and stairs as far apart as the maze allows. On a 1x1 grid both
    // land on the same cell and the stairs marker wins.
    const LongestPathResult lp = LongestPath::apply(grid, rng);
    Cell& entrance = grid.cell(lp.from);
    Cell& stairs = grid.cell(lp.to);
    entrance.tile = TILE_ENTRANCE;
    stairs.tile = TILE_STAIRS;

    std::vector<Vec2i> deadEnds;
    std::vector<Cell*> candidates;
    for (Cell* c : grid.deadEnds()) {
        deadEnds.push_back(c->pos());
        if (c == &entrance || c == &stairs) continue;
        candidates.push_back(c);
    }

    // Shuffle for variety.
    for (int i = static_cast<int>(candidates.size()) - 1; i > 0; --i) {
        const int j = rng.range(0, i);
        std::swap(candidates[static_cast<size_t>(i)], candidates[static_cast<size_t>(j)]);
    }

    const size_t featureCount = std::min(candidates.size(), static_cast<size_t>(std::max(0, cfg.deadEndFeatures)));
    std::vector<Vec2i> features;
    features.reserve(featureCount);
    for (size_t i = 0; i < featureCount; ++i) {
        candidates[i]->tile = TILE_FEATURE;
        features.push_back(candidates[i]->pos());
    }

    out.seed = seed;
    out.algorithm = algo;
    out.entrance = entrance.pos();
    out.stairs = stairs.pos();
    out.pathLength = lp.length;
    out.deadEnds = std::move(deadEnds);
    out.features = std::move(features);
    out.grid = std::move(grid);
    return true;
}
