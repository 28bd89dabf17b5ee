#include "settings.hpp"

#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return false;
    }
}

void appendWarning(std::string* w, int lineNo, const std::string& msg) {
    if (!w) return;
    *w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
}

} // namespace

Settings loadSettings(const std::string& path, std::string* outWarnings) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    for (int lineNo = 1; std::getline(f, line); ++lineNo) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(outWarnings, lineNo, "Expected key = value");
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "rows" || key == "columns") {
            int v = 0;
            if (!parseInt(val, v)) {
                appendWarning(outWarnings, lineNo, "Invalid int for " + key);
                continue;
            }
            v = std::clamp(v, 0, Grid::MAX_DIM);
            if (key == "rows") s.rows = v;
            else s.columns = v;
        } else if (key == "algorithm") {
            if (toLower(val) == "random") {
                s.algorithm.reset();
                continue;
            }
            MazeAlgorithm a{};
            if (parseMazeAlgorithm(val, a)) s.algorithm = a;
            else appendWarning(outWarnings, lineNo, "Unknown algorithm: " + val);
        } else if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(trim(val), v)) s.seed = v;
            else appendWarning(outWarnings, lineNo, "Invalid seed (expected 0..4294967295)");
        } else if (key == "levels") {
            int v = 0;
            if (parseInt(val, v)) s.levels = std::clamp(v, 1, 10000);
            else appendWarning(outWarnings, lineNo, "Invalid int for levels");
        } else if (key == "dead_end_features") {
            int v = 0;
            if (parseInt(val, v)) s.deadEndFeatures = std::clamp(v, 0, 1000);
            else appendWarning(outWarnings, lineNo, "Invalid int for dead_end_features");
        } else if (key == "division_rooms") {
            bool b = false;
            if (parseBool(val, b)) s.divisionRooms = b;
            else appendWarning(outWarnings, lineNo, "Invalid bool for division_rooms");
        } else if (key == "verify") {
            bool b = false;
            if (parseBool(val, b)) s.verify = b;
            else appendWarning(outWarnings, lineNo, "Invalid bool for verify");
        } else {
            appendWarning(outWarnings, lineNo, "Unknown key: " + key);
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# ProcMaze settings
#
# Lines are: key = value
# Comments start with # or ;
#
# Command-line flags override these values.

# Grid size. 0 picks a random size (8..20) for every level.
rows = 10
columns = 10

# algorithm: random | binary_tree | aldous_broder | recursive_backtracker | recursive_division
algorithm = random

# seed: run seed (0..4294967295). Each level derives its own seed from it.
seed = 1

# levels: how many levels to generate (1..10000)
levels = 1

# dead_end_features: dead ends per level that receive a feature marker
dead_end_features = 3

# division_rooms: true/false  (recursive_division leaves some small open rooms)
division_rooms = true

# verify: true/false  (check connectivity / link symmetry / tree shape)
verify = false
)INI";

    return static_cast<bool>(f);
}

LevelConfig levelConfigFrom(const Settings& s) {
    LevelConfig cfg;
    cfg.rows = s.rows;
    cfg.columns = s.columns;
    cfg.algorithm = s.algorithm;
    cfg.deadEndFeatures = s.deadEndFeatures;
    cfg.division = s.divisionRooms ? divisionWithRooms() : DivisionOptions{};
    return cfg;
}
