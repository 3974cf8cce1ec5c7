// filename: territory_benchmark.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/territorymap.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::size_t sources{40};
    std::size_t factions{4};
    double extent{4000.0};
    double minRadius{150.0};
    double maxRadius{600.0};
    double cellSize{25.0};
    std::size_t repeats{3};
    std::uint32_t seed{1234};
    bool adaptive{false};
    bool verbose{false};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "territory_benchmark options:\n"
              << "  --sources <int>        Number of random influence sources (default 40)\n"
              << "  --factions <int>       Number of factions to spread them over (default 4)\n"
              << "  --extent <float>       Side of the square scene in scene units (default 4000)\n"
              << "  --min-radius <float>   Smallest source radius (default 150)\n"
              << "  --max-radius <float>   Largest source radius (default 600)\n"
              << "  --cell-size <float>    Grid spacing (default 25)\n"
              << "  --adaptive             Enable adaptive cell sizing\n"
              << "  --repeats <int>        Number of benchmark repeats (default 3)\n"
              << "  --seed <int>           Random seed (default 1234)\n"
              << "  --verbose              Print per-phase pipeline logs\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--sources" && i + 1 < argc) {
                cfg.sources = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--factions" && i + 1 < argc) {
                cfg.factions = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--extent" && i + 1 < argc) {
                cfg.extent = std::stod(argv[++i]);
            } else if (arg == "--min-radius" && i + 1 < argc) {
                cfg.minRadius = std::stod(argv[++i]);
            } else if (arg == "--max-radius" && i + 1 < argc) {
                cfg.maxRadius = std::stod(argv[++i]);
            } else if (arg == "--cell-size" && i + 1 < argc) {
                cfg.cellSize = std::stod(argv[++i]);
            } else if (arg == "--adaptive") {
                cfg.adaptive = true;
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

std::vector<territory::InfluenceSource> makeSources(const BenchmarkConfig& cfg) {
    std::mt19937 rng(cfg.seed);
    std::uniform_real_distribution<double> position(0.0, cfg.extent);
    std::uniform_real_distribution<double> radius(cfg.minRadius, cfg.maxRadius);
    std::uniform_real_distribution<double> power(0.5, 2.0);
    std::uniform_int_distribution<std::size_t> faction(0, cfg.factions - 1);

    std::vector<territory::InfluenceSource> sources;
    sources.reserve(cfg.sources);
    for (std::size_t s = 0; s < cfg.sources; ++s) {
        territory::InfluenceSource source{};
        source.x = position(rng);
        source.y = position(rng);
        source.radius = radius(rng);
        source.power = power(rng);
        source.faction = "faction-" + std::to_string(faction(rng));
        source.label = "source-" + std::to_string(s);
        sources.push_back(std::move(source));
    }
    return sources;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    const territory::ComputeStats& stats,
                    double avgMs,
                    double minMs,
                    double maxMs,
                    double samplesPerSecond) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "sources,factions,cell_size,nx,ny,loops,shapes,holes,avg_ms,min_ms,max_ms,"
               "samples_per_second\n";
    }
    csv << stats.validSources << ',' << stats.factions << ',' << stats.cellSize << ',' << stats.nx
        << ',' << stats.ny << ',' << stats.loops << ',' << stats.shapes << ',' << stats.holes << ','
        << avgMs << ',' << minMs << ',' << maxMs << ',' << samplesPerSecond << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }

    if (cfg.sources == 0 || cfg.factions == 0 || cfg.repeats == 0) {
        std::cerr << "Sources, factions and repeats must be positive.\n";
        return 1;
    }
    if (!(cfg.minRadius > 0.0) || cfg.maxRadius < cfg.minRadius) {
        std::cerr << "Radius range must be positive and ordered.\n";
        return 1;
    }

    territory::TerritoryOptions options{};
    options.cellSize = cfg.cellSize;
    options.adaptive.enabled = cfg.adaptive;
    options.verbose = cfg.verbose;

    const std::vector<territory::InfluenceSource> sources = makeSources(cfg);

    std::vector<double> durationsMs;
    durationsMs.reserve(cfg.repeats);
    territory::TerritoryResult result;

    try {
        for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
            const auto start = std::chrono::steady_clock::now();
            result = territory::computeTerritories(sources, options);
            const auto end = std::chrono::steady_clock::now();
            durationsMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
        }
    } catch (const std::exception& ex) {
        std::cerr << "Territory computation failed: " << ex.what() << "\n";
        return 1;
    }

    const territory::ComputeStats& stats = result.stats;
    const double avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                         static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    const double minMs = *minIt;
    const double maxMs = *maxIt;

    const double samples = static_cast<double>(stats.nx) * static_cast<double>(stats.ny) *
                           static_cast<double>(stats.validSources);
    const double samplesPerSecond = avgMs > 0.0 ? samples / (avgMs / 1000.0) : 0.0;

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Grid: " << stats.nx << " x " << stats.ny << " nodes (cell " << stats.cellSize
              << ")\n";
    std::cout << "Sources: " << stats.validSources << " over " << stats.factions << " faction(s)\n";
    std::cout << "Output: " << stats.loops << " loop(s), " << stats.shapes << " shape(s), "
              << stats.holes << " hole(s), " << stats.openChains << " open chain(s)\n";
    std::cout << "Average compute time: " << avgMs << " ms (min=" << minMs << " ms, max=" << maxMs
              << " ms)\n";
    std::cout << "Throughput: " << samplesPerSecond / 1.0e6 << "e6 source-samples/s\n";

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, stats, avgMs, minMs, maxMs, samplesPerSecond);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    return 0;
}
