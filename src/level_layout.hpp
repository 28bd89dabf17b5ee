#pragma once

#include "common.hpp"
#include "maze_algorithms.hpp"
#include "maze_grid.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Level layout: the step between "a maze exists" and "a level exists".
//
// Builds a grid in the state the chosen algorithm needs, carves it, then puts
// the entrance and the stairs at the two ends of a two-pass BFS diameter and
// drops a few feature markers on dead ends. Everything is driven by one seed, so the
// same config + seed always yields the same layout.

constexpr int RANDOM_DIM_MIN = 8;
constexpr int RANDOM_DIM_MAX = 20;

struct LevelConfig {
    // 0 = random in [RANDOM_DIM_MIN, RANDOM_DIM_MAX].
    int rows = 10;
    int columns = 10;

    // Unset = pick one of the four generators with the level RNG.
    std::optional<MazeAlgorithm> algorithm;

    // How many dead ends (other than entrance/stairs) get TILE_FEATURE.
    int deadEndFeatures = 3;

    // Levels carved by RecursiveDivision keep some small open rooms.
    DivisionOptions division = divisionWithRooms();
};

struct LevelLayout {
    uint32_t seed = 0;
    MazeAlgorithm algorithm = MazeAlgorithm::BinaryTree;
    Grid grid = Grid::closed(1, 1);

    Vec2i entrance{ -1, -1 };
    Vec2i stairs{ -1, -1 };
    int pathLength = 0;

    std::vector<Vec2i> deadEnds; // all dead ends, row-major
    std::vector<Vec2i> features; // dead ends that received TILE_FEATURE
};

// Per-level seed for level `levelIndex` of a run.
uint32_t levelSeed(uint32_t runSeed, int levelIndex);

bool buildLevelLayout(const LevelConfig& cfg, uint32_t seed, LevelLayout& out, std::string* err = nullptr);
