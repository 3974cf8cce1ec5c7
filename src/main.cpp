// filename: main.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/ingest.hpp"
#include "territory/io_csv.hpp"
#include "territory/io_json.hpp"
#include "territory/io_vtk.hpp"
#include "territory/territorymap.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: territory_map [--scene PATH] [--list-outputs] [--outputs IDs]"
                 " [--list-factions] [--cell-size VALUE] [--threshold VALUE]"
                 " [--padding VALUE] [--stitch-epsilon CELLS] [--adaptive] [--no-adaptive]"
                 " [--debug] [--no-debug] [--shapes-json PATH] [--outlines-vtp PATH]"
                 " [--loops-csv PATH] [--dominance-csv PATH] [--dominance-vti PATH]"
                 " [--verbose] [--quiet] [--no-quiet]\n";
}

std::vector<std::string> splitCommaSeparated(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

// Parses the numeric value following argv[i]; prints the reason and returns nullopt on failure.
std::optional<double> parseNumberArg(int& i, int argc, char** argv, const std::string& flag,
                                     bool allowZero) {
    if (i + 1 >= argc) {
        std::cerr << flag << " requires a floating-point argument\n";
        printUsage();
        return std::nullopt;
    }
    double value = 0.0;
    try {
        value = std::stod(argv[++i]);
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid floating-point argument\n";
        return std::nullopt;
    }
    if (allowZero ? !(value >= 0.0) : !(value > 0.0)) {
        std::cerr << flag << (allowZero ? " must be non-negative\n" : " must be positive\n");
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> parsePathArg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        std::cerr << flag << " requires a path argument\n";
        printUsage();
        return std::nullopt;
    }
    std::string value = argv[++i];
    if (value.empty()) {
        std::cerr << flag << " requires a non-empty path\n";
        return std::nullopt;
    }
    return value;
}

bool wanted(const std::string& id, bool restrictOutputs, bool skipOutputs,
            const std::unordered_set<std::string>& requested) {
    if (skipOutputs) {
        return false;
    }
    return !restrictOutputs || requested.count(id) > 0;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace territory;

    std::optional<std::string> scenePath;
    bool listOutputs = false;
    bool listFactions = false;
    bool verboseFlag = false;
    std::optional<std::string> outputsFilterArg;
    std::optional<double> cellSizeOverride;
    std::optional<double> thresholdOverride;
    std::optional<double> paddingOverride;
    std::optional<double> stitchEpsilonOverride;
    std::optional<bool> adaptiveOverride;
    std::optional<bool> debugOverride;
    std::optional<bool> quietOverride;
    std::optional<std::string> shapesJsonPath;
    std::optional<std::string> outlinesVtpPath;
    std::optional<std::string> loopsCsvPath;
    std::optional<std::string> dominanceCsvPath;
    std::optional<std::string> dominanceVtiPath;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--scene") {
            scenePath = parsePathArg(i, argc, argv, arg);
            if (!scenePath) {
                return 1;
            }
        } else if (arg == "--list-outputs") {
            listOutputs = true;
        } else if (arg == "--list-factions") {
            listFactions = true;
        } else if (arg == "--outputs") {
            if (i + 1 >= argc) {
                std::cerr << "--outputs requires a comma-separated list or 'all'/'none'\n";
                printUsage();
                return 1;
            }
            outputsFilterArg = std::string(argv[++i]);
        } else if (arg == "--cell-size") {
            cellSizeOverride = parseNumberArg(i, argc, argv, arg, false);
            if (!cellSizeOverride) {
                return 1;
            }
        } else if (arg == "--threshold") {
            thresholdOverride = parseNumberArg(i, argc, argv, arg, false);
            if (!thresholdOverride) {
                return 1;
            }
        } else if (arg == "--padding") {
            paddingOverride = parseNumberArg(i, argc, argv, arg, true);
            if (!paddingOverride) {
                return 1;
            }
        } else if (arg == "--stitch-epsilon") {
            stitchEpsilonOverride = parseNumberArg(i, argc, argv, arg, false);
            if (!stitchEpsilonOverride) {
                return 1;
            }
        } else if (arg == "--adaptive") {
            adaptiveOverride = true;
        } else if (arg == "--no-adaptive") {
            adaptiveOverride = false;
        } else if (arg == "--debug") {
            debugOverride = true;
        } else if (arg == "--no-debug") {
            debugOverride = false;
        } else if (arg == "--shapes-json") {
            shapesJsonPath = parsePathArg(i, argc, argv, arg);
            if (!shapesJsonPath) {
                return 1;
            }
        } else if (arg == "--outlines-vtp") {
            outlinesVtpPath = parsePathArg(i, argc, argv, arg);
            if (!outlinesVtpPath) {
                return 1;
            }
        } else if (arg == "--loops-csv") {
            loopsCsvPath = parsePathArg(i, argc, argv, arg);
            if (!loopsCsvPath) {
                return 1;
            }
        } else if (arg == "--dominance-csv") {
            dominanceCsvPath = parsePathArg(i, argc, argv, arg);
            if (!dominanceCsvPath) {
                return 1;
            }
        } else if (arg == "--dominance-vti") {
            dominanceVtiPath = parsePathArg(i, argc, argv, arg);
            if (!dominanceVtiPath) {
                return 1;
            }
        } else if (arg == "--verbose") {
            verboseFlag = true;
        } else if (arg == "--quiet") {
            quietOverride = true;
        } else if (arg == "--no-quiet") {
            quietOverride = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unrecognised argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (!scenePath) {
        printUsage();
        return 0;
    }

    TerritoryScene scene;
    try {
        scene = loadSceneFromJson(*scenePath);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load scene: " << ex.what() << "\n";
        return 1;
    }

    TerritoryOptions options = scene.options;
    if (cellSizeOverride) {
        options.cellSize = *cellSizeOverride;
    }
    if (thresholdOverride) {
        options.contourThreshold = *thresholdOverride;
    }
    if (paddingOverride) {
        options.boundaryPadding = *paddingOverride;
    }
    if (stitchEpsilonOverride) {
        options.stitchEpsilonCells = *stitchEpsilonOverride;
    }
    if (adaptiveOverride) {
        options.adaptive.enabled = *adaptiveOverride;
    }
    if (debugOverride) {
        options.debugMode = *debugOverride;
    }
    const bool quiet = quietOverride.value_or(scene.quietSpecified ? scene.quiet : false);
    options.verbose = (options.verbose || verboseFlag) && !quiet;

    try {
        validateOptions(options);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid territory options: " << ex.what() << "\n";
        return 1;
    }

    std::unordered_set<std::string> availableOutputIds;
    for (const auto& request : scene.outputs.shapesJson) {
        availableOutputIds.insert(request.id);
    }
    for (const auto& request : scene.outputs.outlinesVtp) {
        availableOutputIds.insert(request.id);
    }
    for (const auto& request : scene.outputs.loopsCsv) {
        availableOutputIds.insert(request.id);
    }
    for (const auto& request : scene.outputs.dominanceMaps) {
        availableOutputIds.insert(request.id);
    }

    if (listOutputs) {
        std::cout << "Scene outputs (" << availableOutputIds.size() << "):\n";
        for (const auto& request : scene.outputs.shapesJson) {
            std::cout << "  - [shapes_json] id=" << request.id << ", indent=" << request.indent
                      << ", path=" << request.path << "\n";
        }
        for (const auto& request : scene.outputs.outlinesVtp) {
            std::cout << "  - [outlines_vtp] id=" << request.id << ", path=" << request.path << "\n";
        }
        for (const auto& request : scene.outputs.loopsCsv) {
            std::cout << "  - [loops_csv] id=" << request.id << ", path=" << request.path << "\n";
        }
        for (const auto& request : scene.outputs.dominanceMaps) {
            std::cout << "  - [dominance_map] id=" << request.id << ", format=" << request.format
                      << ", path=" << request.path << "\n";
        }
    }

    std::unordered_set<std::string> requestedOutputIds;
    bool restrictOutputs = false;
    bool skipOutputs = false;
    if (outputsFilterArg) {
        if (outputsFilterArg->empty()) {
            std::cerr << "--outputs argument must not be empty\n";
            return 1;
        }
        if (*outputsFilterArg == "all") {
            restrictOutputs = false;
        } else if (*outputsFilterArg == "none") {
            skipOutputs = true;
        } else {
            if (availableOutputIds.empty()) {
                std::cerr << "Scene defines no outputs but --outputs was specified\n";
                return 1;
            }
            const auto ids = splitCommaSeparated(*outputsFilterArg);
            if (ids.empty()) {
                std::cerr << "--outputs requires a comma-separated list of ids or 'all'/'none'\n";
                return 1;
            }
            restrictOutputs = true;
            for (const auto& id : ids) {
                if (availableOutputIds.find(id) == availableOutputIds.end()) {
                    std::cerr << "Requested output id not found in scene: " << id << "\n";
                    return 1;
                }
                requestedOutputIds.insert(id);
            }
        }
    }

    const std::vector<InfluenceSource> sources = scene.allSources();
    DominanceGrid grid;
    TerritoryResult result;
    try {
        result = computeTerritories(sources, options, nullptr, &grid);
    } catch (const std::exception& ex) {
        std::cerr << "Territory computation failed: " << ex.what() << "\n";
        return 1;
    }

    if (!quiet) {
        if (result.stats.openChains > 0) {
            std::cerr << "Warning: discarded " << result.stats.openChains
                      << " open contour chain(s) that did not close\n";
        }
        if (result.stats.degenerateLoops > 0) {
            std::cerr << "Warning: discarded " << result.stats.degenerateLoops
                      << " degenerate loop(s) with fewer than 3 points\n";
        }
        std::cout << "Computed " << result.territories.size() << " territory(ies) with "
                  << result.stats.shapes << " shape(s) and " << result.stats.holes
                  << " hole(s) from " << result.stats.validSources << "/"
                  << result.stats.inputSources << " source(s) at cell size "
                  << result.stats.cellSize << "\n";
    }

    if (listFactions) {
        std::cout << "Factions (" << result.territories.size() << "):\n";
        for (const auto& territory : result.territories) {
            std::size_t holes = 0;
            for (const auto& shape : territory.shapes) {
                holes += shape.holeLoops.size();
            }
            std::cout << "  - " << territory.faction << " color=" << formatHexColor(territory.color)
                      << ", shapes=" << territory.shapes.size() << ", holes=" << holes << "\n";
        }
    }

    bool outputError = false;
    const auto runOutput = [&](const std::string& kind, const std::string& path, auto&& writer) {
        try {
            ensureParentDirectory(path);
            writer(path);
            if (!quiet) {
                std::cout << "Wrote " << kind << " to " << path << "\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write " << kind << " '" << path << "': " << ex.what() << "\n";
            outputError = true;
        }
    };

    const auto writeShapes = [&](const std::string& path, int indent) {
        runOutput("shapes JSON", path,
                  [&](const std::string& p) { write_shapes_json(p, result, indent); });
    };
    const auto writeOutlines = [&](const std::string& path) {
        runOutput("outline VTP", path, [&](const std::string& p) {
            write_vtp_outlines(p, collectOutlineLoops(result));
        });
    };
    const auto writeLoops = [&](const std::string& path) {
        runOutput("loop CSV", path, [&](const std::string& p) { write_csv_loops(p, result); });
    };
    const auto writeDominance = [&](const std::string& path, const std::string& format) {
        if (grid.nodeCount() == 0) {
            if (!quiet) {
                std::cerr << "Warning: no dominance grid was sampled; skipping " << path << "\n";
            }
            return;
        }
        if (format == "vti") {
            runOutput("dominance VTI", path,
                      [&](const std::string& p) { write_vti_dominance_map(p, grid); });
        } else {
            runOutput("dominance CSV", path,
                      [&](const std::string& p) { write_csv_dominance_grid(p, grid); });
        }
    };

    for (const auto& request : scene.outputs.shapesJson) {
        if (wanted(request.id, restrictOutputs, skipOutputs, requestedOutputIds)) {
            writeShapes(request.path, request.indent);
        }
    }
    for (const auto& request : scene.outputs.outlinesVtp) {
        if (wanted(request.id, restrictOutputs, skipOutputs, requestedOutputIds)) {
            writeOutlines(request.path);
        }
    }
    for (const auto& request : scene.outputs.loopsCsv) {
        if (wanted(request.id, restrictOutputs, skipOutputs, requestedOutputIds)) {
            writeLoops(request.path);
        }
    }
    for (const auto& request : scene.outputs.dominanceMaps) {
        if (wanted(request.id, restrictOutputs, skipOutputs, requestedOutputIds)) {
            writeDominance(request.path, request.format);
        }
    }

    if (shapesJsonPath) {
        writeShapes(*shapesJsonPath, 2);
    }
    if (outlinesVtpPath) {
        writeOutlines(*outlinesVtpPath);
    }
    if (loopsCsvPath) {
        writeLoops(*loopsCsvPath);
    }
    if (dominanceCsvPath) {
        writeDominance(*dominanceCsvPath, "csv");
    }
    if (dominanceVtiPath) {
        writeDominance(*dominanceVtiPath, "vti");
    }

    return outputError ? 1 : 0;
}
