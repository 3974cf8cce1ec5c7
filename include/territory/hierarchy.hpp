// filename: hierarchy.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include "territory/contour.hpp"
#include "territory/types.hpp"

namespace territory {

/**
 * @brief One connected region of a faction: a filled outer loop minus its holes.
 */
struct TerritoryShape {
    FactionId faction;
    std::vector<Point2> outerLoop;
    std::vector<std::vector<Point2>> holeLoops;
    double area{0.0};
    std::size_t depth{0};
};

struct ContourHierarchy {
    static constexpr long kNoParent = -1;

    // All vectors are indexed like the input loops.
    std::vector<long> parent;
    std::vector<std::size_t> depth;
    std::vector<double> area;

    [[nodiscard]] bool isHole(std::size_t loop) const { return (depth[loop] % 2U) == 1U; }
};

/**
 * @brief Shoelace area, positive for counter-clockwise loops (y up).
 */
[[nodiscard]] double signedPolygonArea(const std::vector<Point2>& polygon);

[[nodiscard]] double polygonArea(const std::vector<Point2>& polygon);

/**
 * @brief Even-odd ray casting test.
 */
[[nodiscard]] bool pointInPolygon(const Point2& point, const std::vector<Point2>& polygon);

/**
 * @brief True when the first @p sampleCount vertices of @p child all lie inside @p parent.
 */
[[nodiscard]] bool loopInsideLoop(const std::vector<Point2>& child,
                                  const std::vector<Point2>& parent,
                                  std::size_t sampleCount = kHierarchySampleVertices);

/**
 * @brief Nest loops across all factions. Each loop's parent is the smallest-area loop that
 *        contains it; depth counts enclosing ancestors. Even depth is a fill, odd a hole.
 */
ContourHierarchy buildContourHierarchy(const std::vector<ContourLoop>& loops);

/**
 * @brief One shape per even-depth loop, carrying its odd-depth children as holes. Shapes and
 *        holes are ordered by descending area.
 */
std::vector<TerritoryShape> assembleShapes(const std::vector<ContourLoop>& loops,
                                           const ContourHierarchy& hierarchy);

}  // namespace territory
