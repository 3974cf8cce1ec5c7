// filename: contour.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "territory/grid.hpp"
#include "territory/types.hpp"

namespace territory {

struct LineSegment {
    Point2 p0;
    Point2 p1;
};

/**
 * @brief Closed polyline; the last point repeats the first within the stitch epsilon.
 */
struct ContourLoop {
    FactionId faction;
    std::vector<Point2> points;
};

// Cell corners, in bit order of the marching squares code.
enum class CellCorner : unsigned { TopLeft = 1U, TopRight = 2U, BottomRight = 4U, BottomLeft = 8U };

// Cell edges: 0 top (TL-TR), 1 right (TR-BR), 2 bottom (BR-BL), 3 left (BL-TL).
struct CellEdgePair {
    std::uint8_t from{0};
    std::uint8_t to{0};
};

struct CellCase {
    std::uint8_t segmentCount{0};
    std::array<CellEdgePair, 2> segments{};
};

/**
 * @brief Marching squares lookup, code -> edge pairs. Codes 5 and 10 (opposite corners
 *        above the threshold) are split into two independent corner cuts.
 */
const std::array<CellCase, 16>& marchingSquaresTable();

/**
 * @brief 4-bit code of a cell; a corner contributes its bit when its value is >= threshold.
 */
[[nodiscard]] unsigned classifyCell(double topLeft, double topRight, double bottomRight,
                                    double bottomLeft, double threshold);

/**
 * @brief Threshold crossing on the edge p0-p1 by linear interpolation. Falls back to the
 *        midpoint when |v0 - v1| < kInterpolationEpsilon.
 */
[[nodiscard]] Point2 interpolateCrossing(const Point2& p0, const Point2& p1, double v0, double v1,
                                         double threshold);

/**
 * @brief Append the 0, 1 or 2 segments of cell @p code to @p out.
 * @param edges crossing points on edges 0..3.
 * @return number of segments appended.
 */
std::size_t appendCellSegments(unsigned code, const std::array<Point2, 4>& edges,
                               std::vector<LineSegment>& out);

/**
 * @brief Unordered boundary segments of @p values at @p threshold over the node layout of
 *        @p grid. When @p foreign is non-null, crossings on edges towards a foreign node stay
 *        within kContestedCrossingLimit of the owned node.
 */
std::vector<LineSegment> traceContourSegments(const DominanceGrid& grid,
                                              const std::vector<double>& values,
                                              double threshold,
                                              const std::vector<std::uint8_t>* foreign = nullptr);

std::vector<LineSegment> traceContourSegments(const DominanceGrid& grid, const FactionField& field,
                                              double threshold);

struct StitchStats {
    std::size_t segments{0};
    std::size_t loops{0};
    std::size_t openChains{0};
    std::size_t degenerateLoops{0};
};

/**
 * @brief Join segments whose endpoints lie within @p epsilon into closed loops.
 *
 * Chains are grown greedily from the nearest pool endpoint. Chains that never close and
 * loops with fewer than 3 distinct points are dropped and counted in @p stats.
 */
std::vector<ContourLoop> stitchSegments(std::vector<LineSegment> segments,
                                        double epsilon,
                                        const FactionId& faction = FactionId{},
                                        StitchStats* stats = nullptr);

}  // namespace territory
