#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "level_layout.hpp"
#include "maze_algorithms.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// Command-line flags override anything loaded from here.
struct Settings {
    // Grid size; 0 picks a random size per level (8..20).
    int rows = 10;
    int columns = 10;

    // Unset means "random": each level draws one of the generators.
    std::optional<MazeAlgorithm> algorithm;

    // Run seed. Per-level seeds are derived from it.
    uint32_t seed = 1;

    // How many levels a run generates.
    int levels = 1;

    // Dead ends that get a feature marker in each level.
    int deadEndFeatures = 3;

    // Let RecursiveDivision leave small open rooms (loops) in its mazes.
    bool divisionRooms = true;

    // Run the structural checks on every generated level.
    bool verify = false;
};

// Loads settings from disk. If the file is missing, defaults are used.
// Unknown keys and bad values are skipped; a line-numbered description of each
// is appended to *outWarnings when given.
Settings loadSettings(const std::string& path, std::string* outWarnings = nullptr);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

LevelConfig levelConfigFrom(const Settings& s);
