// filename: territory.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "territory/color.hpp"
#include "territory/field.hpp"
#include "territory/grid.hpp"
#include "territory/hierarchy.hpp"
#include "territory/types.hpp"

namespace territory {

struct AdaptiveResolution {
    bool enabled{false};
    double maxSamplingWork{1200000.0};
    double minCellSize{5.0};
    double maxCellSize{100.0};
};

struct TerritoryOptions {
    double cellSize{kDefaultCellSize};
    double contourThreshold{kDefaultContourThreshold};
    double boundaryPadding{kDefaultBoundaryPadding};
    double stitchEpsilonCells{kStitchEpsilonCells};
    bool debugMode{false};
    std::size_t debugCircleSegments{64};
    AdaptiveResolution adaptive;
    ColorOverrides colorOverrides;
    bool verbose{false};
};

struct FactionTerritory {
    FactionId faction;
    Rgb color{0};
    std::vector<TerritoryShape> shapes;
};

struct DebugCircle {
    FactionId faction;
    Rgb color{0};
    std::string label;
    Point2 center;
    double radius{0.0};
    std::vector<Point2> outline;
};

struct SourceMarker {
    FactionId faction;
    Rgb color{0};
    std::string label;
    Point2 center;
};

struct ComputeStats {
    std::size_t inputSources{0};
    std::size_t validSources{0};
    std::size_t factions{0};
    std::size_t nx{0};
    std::size_t ny{0};
    double cellSize{0.0};
    std::size_t segments{0};
    std::size_t loops{0};
    std::size_t openChains{0};
    std::size_t degenerateLoops{0};
    std::size_t shapes{0};
    std::size_t holes{0};
    bool cancelled{false};
};

struct TerritoryResult {
    std::vector<FactionTerritory> territories;
    std::vector<DebugCircle> debugCircles;
    std::vector<SourceMarker> markers;
    std::optional<Bounds> bounds;
    ComputeStats stats;

    [[nodiscard]] bool empty() const {
        return territories.empty() && debugCircles.empty() && markers.empty();
    }
    [[nodiscard]] const FactionTerritory* find(const FactionId& faction) const;
};

/**
 * @brief Throws std::invalid_argument for settings that indicate a configuration mistake.
 */
void validateOptions(const TerritoryOptions& options);

/**
 * @brief Effective grid spacing. With adaptive resolution enabled the configured cell size is
 *        widened when (rows + 1) * (cols + 1) * sources exceeds the work budget.
 */
[[nodiscard]] double resolveCellSize(const TerritoryOptions& options, const Bounds& bounds,
                                     std::size_t sourceCount);

/**
 * @brief Polygon approximation of a source's radius circle, @p segments vertices.
 */
std::vector<Point2> makeCircleOutline(const Point2& center, double radius, std::size_t segments);

/**
 * @brief Full pipeline: filter, group, sample dominance, trace each faction's gated field,
 *        stitch, nest and assemble shapes.
 *
 * Faction ids pass through normalizeFactionKey before grouping, so " A" and "A" are one
 * faction and results report the normalised id.
 *
 * A pure function of its inputs; nothing is cached between calls.
 * @param progress optional row-level observer; returning false cancels and yields an empty
 *        result with stats.cancelled set.
 * @param gridOut when non-null receives a copy of the sampled dominance grid.
 * @throws std::invalid_argument when @p options fail validateOptions.
 */
TerritoryResult computeTerritories(const std::vector<InfluenceSource>& sources,
                                   const TerritoryOptions& options,
                                   ProgressSink* progress = nullptr,
                                   DominanceGrid* gridOut = nullptr);

/**
 * @brief Visible territory overlay. Holds only the last emitted result and replaces it
 *        wholesale on every refresh.
 */
class TerritoryLayer {
public:
    explicit TerritoryLayer(TerritoryOptions options = {});

    void enable(bool debug = false);
    void disable();
    bool toggle();
    [[nodiscard]] bool isEnabled() const { return enabled_; }
    [[nodiscard]] bool debugEnabled() const { return options_.debugMode; }

    const TerritoryResult& refresh(const std::vector<InfluenceSource>& sources,
                                   ProgressSink* progress = nullptr);
    void clear();

    [[nodiscard]] const TerritoryResult& current() const { return current_; }
    [[nodiscard]] const TerritoryOptions& options() const { return options_; }

private:
    TerritoryOptions options_;
    bool enabled_{false};
    TerritoryResult current_;
};

}  // namespace territory
