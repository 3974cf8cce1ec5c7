// filename: territory.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/territory.hpp"

#include "territory/contour.hpp"
#include "territory/hierarchy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace territory {
namespace {

using Clock = std::chrono::steady_clock;

double requireFinitePositive(const std::string& field, double value) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        throw std::invalid_argument(field + " must be a positive finite number");
    }
    return value;
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}  // namespace

const FactionTerritory* TerritoryResult::find(const FactionId& faction) const {
    for (const auto& territory : territories) {
        if (territory.faction == faction) {
            return &territory;
        }
    }
    return nullptr;
}

void validateOptions(const TerritoryOptions& options) {
    requireFinitePositive("cellSize", options.cellSize);
    if (!std::isfinite(options.contourThreshold) || !(options.contourThreshold > 0.0) ||
        !(options.contourThreshold < 1.0)) {
        throw std::invalid_argument("contourThreshold must lie in the open interval (0, 1)");
    }
    if (!std::isfinite(options.boundaryPadding) || options.boundaryPadding < 0.0) {
        throw std::invalid_argument("boundaryPadding must be a non-negative finite number");
    }
    requireFinitePositive("stitchEpsilonCells", options.stitchEpsilonCells);
    if (options.debugCircleSegments < 3) {
        throw std::invalid_argument("debugCircleSegments must be at least 3");
    }
    if (options.adaptive.enabled) {
        requireFinitePositive("adaptive.maxSamplingWork", options.adaptive.maxSamplingWork);
        requireFinitePositive("adaptive.minCellSize", options.adaptive.minCellSize);
        requireFinitePositive("adaptive.maxCellSize", options.adaptive.maxCellSize);
        if (options.adaptive.maxCellSize < options.adaptive.minCellSize) {
            throw std::invalid_argument("adaptive.maxCellSize must not be below adaptive.minCellSize");
        }
    }
}

double resolveCellSize(const TerritoryOptions& options, const Bounds& bounds,
                       std::size_t sourceCount) {
    double cellSize = options.cellSize;
    if (!options.adaptive.enabled) {
        return cellSize;
    }

    const double width = std::max(1.0, bounds.width());
    const double height = std::max(1.0, bounds.height());
    const double sources = static_cast<double>(std::max<std::size_t>(1, sourceCount));
    const double cols = std::ceil(width / cellSize);
    const double rows = std::ceil(height / cellSize);
    const double work = (rows + 1.0) * (cols + 1.0) * sources;

    if (work > options.adaptive.maxSamplingWork) {
        const double factor = std::sqrt(work / options.adaptive.maxSamplingWork);
        cellSize = std::min(options.adaptive.maxCellSize,
                            std::max(options.adaptive.minCellSize, cellSize * factor));
    }
    return cellSize;
}

std::vector<Point2> makeCircleOutline(const Point2& center, double radius, std::size_t segments) {
    std::vector<Point2> points;
    points.reserve(segments);
    for (std::size_t k = 0; k < segments; ++k) {
        const double angle = 2.0 * kPi * static_cast<double>(k) / static_cast<double>(segments);
        points.push_back(Point2{center.x + std::cos(angle) * radius, center.y + std::sin(angle) * radius});
    }
    return points;
}

TerritoryResult computeTerritories(const std::vector<InfluenceSource>& sources,
                                   const TerritoryOptions& options,
                                   ProgressSink* progress,
                                   DominanceGrid* gridOut) {
    validateOptions(options);

    const auto start = Clock::now();
    TerritoryResult result{};
    result.stats.inputSources = sources.size();

    std::vector<InfluenceSource> valid = filterValidSources(sources);
    for (auto& source : valid) {
        source.faction = normalizeFactionKey(source.faction);
    }
    result.stats.validSources = valid.size();
    if (options.verbose && valid.size() != sources.size()) {
        std::cout << "Ignoring " << (sources.size() - valid.size())
                  << " source(s) with non-positive radius or power\n";
    }
    if (valid.empty()) {
        if (options.verbose) {
            std::cout << "No influence sources; territory map is empty\n";
        }
        return result;
    }

    const std::vector<FactionGroup> groups = groupByFaction(valid);
    result.stats.factions = groups.size();

    const std::optional<Bounds> bounds = computeSourceBounds(valid, options.boundaryPadding);
    result.bounds = bounds;
    const double cellSize = resolveCellSize(options, *bounds, valid.size());
    result.stats.cellSize = cellSize;

    DominanceGrid grid;
    if (!buildDominanceGrid(groups, *bounds, cellSize, grid, progress)) {
        if (options.verbose) {
            std::cout << "Dominance sampling cancelled; no shapes emitted\n";
        }
        TerritoryResult cancelled{};
        cancelled.stats = result.stats;
        cancelled.stats.cancelled = true;
        return cancelled;
    }
    result.stats.nx = grid.nx;
    result.stats.ny = grid.ny;
    if (options.verbose) {
        std::cout << "Sampled " << grid.nx << "x" << grid.ny << " dominance grid (cell "
                  << cellSize << ", " << groups.size() << " faction(s), " << valid.size()
                  << " source(s)) in " << secondsSince(start) << " s\n";
    }

    const double epsilon = options.stitchEpsilonCells * cellSize;
    StitchStats stitchStats{};
    std::vector<ContourLoop> loops;
    for (std::size_t f = 0; f < groups.size(); ++f) {
        const FactionField field = extractFactionField(grid, f);
        std::vector<LineSegment> segments =
            traceContourSegments(grid, field, options.contourThreshold);
        std::vector<ContourLoop> factionLoops =
            stitchSegments(std::move(segments), epsilon, groups[f].faction, &stitchStats);
        if (options.verbose) {
            std::cout << "Faction '" << groups[f].faction << "': " << factionLoops.size()
                      << " loop(s)\n";
        }
        for (auto& loop : factionLoops) {
            loops.push_back(std::move(loop));
        }
    }
    result.stats.segments = stitchStats.segments;
    result.stats.loops = stitchStats.loops;
    result.stats.openChains = stitchStats.openChains;
    result.stats.degenerateLoops = stitchStats.degenerateLoops;

    const ContourHierarchy hierarchy = buildContourHierarchy(loops);
    std::vector<TerritoryShape> shapes = assembleShapes(loops, hierarchy);

    std::unordered_map<FactionId, std::size_t> territoryIndex;
    for (auto& shape : shapes) {
        auto it = territoryIndex.find(shape.faction);
        if (it == territoryIndex.end()) {
            FactionTerritory territory{};
            territory.faction = shape.faction;
            territory.color = resolveFactionColor(shape.faction, options.colorOverrides);
            it = territoryIndex.emplace(shape.faction, result.territories.size()).first;
            result.territories.push_back(std::move(territory));
        }
        result.stats.holes += shape.holeLoops.size();
        result.territories[it->second].shapes.push_back(std::move(shape));
    }
    result.stats.shapes = shapes.size();
    std::sort(result.territories.begin(), result.territories.end(),
              [](const FactionTerritory& a, const FactionTerritory& b) { return a.faction < b.faction; });

    for (const auto& source : valid) {
        const Rgb color = resolveFactionColor(source.faction, options.colorOverrides);
        SourceMarker marker{};
        marker.faction = source.faction;
        marker.color = color;
        marker.label = source.label;
        marker.center = Point2{source.x, source.y};
        result.markers.push_back(marker);

        if (options.debugMode) {
            DebugCircle circle{};
            circle.faction = source.faction;
            circle.color = color;
            circle.label = source.label;
            circle.center = marker.center;
            circle.radius = source.radius;
            circle.outline = makeCircleOutline(circle.center, source.radius, options.debugCircleSegments);
            result.debugCircles.push_back(std::move(circle));
        }
    }

    if (gridOut != nullptr) {
        *gridOut = std::move(grid);
    }

    if (options.verbose) {
        std::cout << "Territory map: " << result.stats.shapes << " shape(s), " << result.stats.holes
                  << " hole(s) across " << result.territories.size() << " faction(s) in "
                  << secondsSince(start) << " s\n";
    }
    return result;
}

TerritoryLayer::TerritoryLayer(TerritoryOptions options) : options_(std::move(options)) {
    validateOptions(options_);
}

void TerritoryLayer::enable(bool debug) {
    enabled_ = true;
    options_.debugMode = debug;
}

void TerritoryLayer::disable() {
    enabled_ = false;
    clear();
}

bool TerritoryLayer::toggle() {
    if (enabled_) {
        disable();
        return false;
    }
    enable(options_.debugMode);
    return true;
}

const TerritoryResult& TerritoryLayer::refresh(const std::vector<InfluenceSource>& sources,
                                               ProgressSink* progress) {
    clear();
    if (!enabled_) {
        return current_;
    }
    current_ = computeTerritories(sources, options_, progress);
    return current_;
}

void TerritoryLayer::clear() { current_ = TerritoryResult{}; }

}  // namespace territory
