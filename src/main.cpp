#include "common.hpp"
#include "level_layout.hpp"
#include "maze_checks.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --rows <n>              Grid rows (0 = random 8..20). Default: 10.\n"
        << "  --cols <n>              Grid columns (0 = random 8..20). Default: 10.\n"
        << "  --algorithm <name>      random | binary_tree | aldous_broder |\n"
        << "                          recursive_backtracker | recursive_division\n"
        << "  --seed <n>              Run seed (0..4294967295). Default: 1.\n"
        << "  --count <n>             Number of levels to generate. Default: 1.\n"
        << "  --features <n>          Dead-end feature markers per level. Default: 3.\n"
        << "  --config <path>         Settings file to load before applying flags.\n"
        << "  --write-config <path>   Write a commented default settings file and exit.\n"
        << "  --no-rooms              recursive_division carves perfect mazes (no open rooms).\n"
        << "  --verify                Check every level's structure; exit 1 on failure.\n"
        << "  --verbose               Print per-level diagnostics.\n"
        << "  --json-report <path>    Write a JSON summary report.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseCount(const std::string& s, int lo, int hi, int& out) {
    uint32_t v = 0;
    if (!parseU32(s, v)) return false;
    if (v < static_cast<uint32_t>(lo) || v > static_cast<uint32_t>(hi)) return false;
    out = static_cast<int>(v);
    return true;
}

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

std::string posStr(const Vec2i& p) {
    // Printed as (row,col).
    return "(" + std::to_string(p.y) + "," + std::to_string(p.x) + ")";
}

struct LevelRunResult {
    int index = 0;
    uint32_t seed = 0;
    bool ok = false;
    std::string error;
    std::string algorithm;
    int rows = 0;
    int columns = 0;
    Vec2i entrance{ -1, -1 };
    Vec2i stairs{ -1, -1 };
    int pathLength = 0;
    int deadEnds = 0;
    int features = 0;
};

bool writeJsonReport(const std::filesystem::path& path,
                     const std::vector<LevelRunResult>& results,
                     const Settings& s,
                     std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path.generic_string();
        return false;
    }

    size_t okCount = 0;
    for (const auto& r : results) if (r.ok) ++okCount;

    f << "{\n";
    f << "  \"tool\": \"" << jsonEscape(PROCMAZE_APPNAME) << "\",\n";
    f << "  \"version\": \"" << jsonEscape(PROCMAZE_VERSION) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"seed\": " << s.seed << ",\n";
    f << "    \"rows\": " << s.rows << ",\n";
    f << "    \"columns\": " << s.columns << ",\n";
    f << "    \"algorithm\": \"" << (s.algorithm ? mazeAlgorithmName(*s.algorithm) : "random") << "\",\n";
    f << "    \"deadEndFeatures\": " << s.deadEndFeatures << ",\n";
    f << "    \"divisionRooms\": " << (s.divisionRooms ? "true" : "false") << ",\n";
    f << "    \"verify\": " << (s.verify ? "true" : "false") << "\n";
    f << "  },\n";
    f << "  \"summary\": {\n";
    f << "    \"total\": " << results.size() << ",\n";
    f << "    \"ok\": " << okCount << ",\n";
    f << "    \"failed\": " << (results.size() - okCount) << "\n";
    f << "  },\n";
    f << "  \"levels\": [\n";

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        f << "    {\n";
        f << "      \"index\": " << r.index << ",\n";
        f << "      \"seed\": " << r.seed << ",\n";
        f << "      \"ok\": " << (r.ok ? "true" : "false") << ",\n";
        f << "      \"algorithm\": \"" << jsonEscape(r.algorithm) << "\",\n";
        f << "      \"rows\": " << r.rows << ",\n";
        f << "      \"columns\": " << r.columns << ",\n";
        f << "      \"entrance\": [" << r.entrance.y << ", " << r.entrance.x << "],\n";
        f << "      \"stairs\": [" << r.stairs.y << ", " << r.stairs.x << "],\n";
        f << "      \"pathLength\": " << r.pathLength << ",\n";
        f << "      \"deadEnds\": " << r.deadEnds << ",\n";
        f << "      \"features\": " << r.features;
        if (!r.ok) {
            f << ",\n";
            f << "      \"error\": \"" << jsonEscape(r.error) << "\"\n";
        } else {
            f << "\n";
        }
        f << "    }";
        if (i + 1 < results.size()) f << ",";
        f << "\n";
    }

    f << "  ]\n";
    f << "}\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path configPath;
    std::filesystem::path writeConfigPath;
    std::filesystem::path jsonReport;
    bool verbose = false;

    std::optional<int> rows;
    std::optional<int> columns;
    std::optional<std::string> algorithm;
    std::optional<uint32_t> seed;
    std::optional<int> count;
    std::optional<int> features;
    bool verifyFlag = false;
    bool noRooms = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << PROCMAZE_APPNAME << " " << PROCMAZE_VERSION << "\n";
            return 0;
        } else if (a == "--rows" || a == "--cols" || a == "--columns") {
            int n = 0;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            if (!parseCount(v, 0, Grid::MAX_DIM, n)) {
                std::cerr << "Invalid " << a << ": " << v << "\n";
                return 2;
            }
            if (a == "--rows") rows = n;
            else columns = n;
        } else if (a == "--algorithm") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--algorithm requires a name\n";
                return 2;
            }
            algorithm = v;
        } else if (a == "--seed") {
            uint32_t s = 0;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, s)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
            seed = s;
        } else if (a == "--count") {
            int n = 0;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--count requires a value\n";
                return 2;
            }
            if (!parseCount(v, 1, 10000, n)) {
                std::cerr << "Invalid --count: " << v << "\n";
                return 2;
            }
            count = n;
        } else if (a == "--features") {
            int n = 0;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--features requires a value\n";
                return 2;
            }
            if (!parseCount(v, 0, 1000, n)) {
                std::cerr << "Invalid --features: " << v << "\n";
                return 2;
            }
            features = n;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
            configPath = v;
        } else if (a == "--write-config") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-config requires a path\n";
                return 2;
            }
            writeConfigPath = v;
        } else if (a == "--json-report") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
            jsonReport = v;
        } else if (a == "--no-rooms") {
            noRooms = true;
        } else if (a == "--verify") {
            verifyFlag = true;
        } else if (a == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!writeConfigPath.empty()) {
        if (!writeDefaultSettings(writeConfigPath.string())) {
            std::cerr << "Failed to write settings: " << writeConfigPath.generic_string() << "\n";
            return 1;
        }
        std::cout << "Wrote " << writeConfigPath.generic_string() << "\n";
        return 0;
    }

    Settings settings;
    if (!configPath.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(configPath, ec)) {
            std::cerr << "Settings file not found: " << configPath.generic_string() << "\n";
            return 2;
        }
        std::string warns;
        settings = loadSettings(configPath.string(), &warns);
        if (!warns.empty()) std::cerr << warns;
    }

    if (rows) settings.rows = *rows;
    if (columns) settings.columns = *columns;
    if (seed) settings.seed = *seed;
    if (count) settings.levels = *count;
    if (features) settings.deadEndFeatures = *features;
    if (verifyFlag) settings.verify = true;
    if (noRooms) settings.divisionRooms = false;
    if (algorithm) {
        MazeAlgorithm alg{};
        if (toLower(*algorithm) == "random") {
            settings.algorithm.reset();
        } else if (parseMazeAlgorithm(*algorithm, alg)) {
            settings.algorithm = alg;
        } else {
            std::cerr << "Unknown algorithm: " << *algorithm << "\n";
            return 2;
        }
    }

    const LevelConfig cfg = levelConfigFrom(settings);
    std::vector<LevelRunResult> results;
    results.reserve(static_cast<size_t>(settings.levels));

    size_t okCount = 0;
    for (int i = 0; i < settings.levels; ++i) {
        LevelRunResult rr;
        rr.index = i;
        rr.seed = levelSeed(settings.seed, i);

        LevelLayout layout;
        std::string err;
        if (!buildLevelLayout(cfg, rr.seed, layout, &err)) {
            rr.error = err;
            results.push_back(rr);
            std::cout << "FAIL level " << i << " seed=" << rr.seed << "  " << err << "\n";
            continue;
        }

        rr.algorithm = mazeAlgorithmName(layout.algorithm);
        rr.rows = layout.grid.rows();
        rr.columns = layout.grid.columns();
        rr.entrance = layout.entrance;
        rr.stairs = layout.stairs;
        rr.pathLength = layout.pathLength;
        rr.deadEnds = static_cast<int>(layout.deadEnds.size());
        rr.features = static_cast<int>(layout.features.size());
        rr.ok = true;

        if (settings.verify && !verifyMaze(layout.grid, layout.algorithm, cfg.division, &err)) {
            rr.ok = false;
            rr.error = err;
        }

        if (rr.ok) {
            ++okCount;
            std::cout << "OK   level " << i
                      << " seed=" << rr.seed
                      << " algorithm=" << rr.algorithm
                      << " size=" << rr.rows << "x" << rr.columns
                      << " entrance=" << posStr(rr.entrance)
                      << " stairs=" << posStr(rr.stairs)
                      << " path=" << rr.pathLength
                      << "\n";
        } else {
            std::cout << "FAIL level " << i << " seed=" << rr.seed << "  " << rr.error << "\n";
        }

        if (verbose) {
            std::cout << "     links=" << countLinks(layout.grid)
                      << " deadEnds=" << rr.deadEnds
                      << " features=" << rr.features;
            for (const Vec2i& p : layout.features) std::cout << " " << posStr(p);
            std::cout << "\n";
        }

        results.push_back(rr);
    }

    const size_t total = results.size();
    const size_t failed = total - okCount;
    std::cout << "Summary: total=" << total << " ok=" << okCount << " failed=" << failed << "\n";

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, results, settings, &jerr)) {
            std::cerr << jerr << "\n";
            return 1;
        }
    }

    return (failed == 0) ? 0 : 1;
}
