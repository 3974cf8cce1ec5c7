// filename: contour.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/contour.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace territory {
namespace {

// Consecutive chain points closer than this fraction of the stitch epsilon are merged.
constexpr double kDuplicatePointFraction = 1e-9;

constexpr CellCase noSegments() { return CellCase{0, {}}; }

constexpr CellCase oneSegment(std::uint8_t a, std::uint8_t b) {
    return CellCase{1, {{CellEdgePair{a, b}, CellEdgePair{}}}};
}

constexpr CellCase twoSegments(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) {
    return CellCase{2, {{CellEdgePair{a, b}, CellEdgePair{c, d}}}};
}

constexpr std::array<CellCase, 16> kCellCases = {{
    noSegments(),             // 0
    oneSegment(3, 0),         // 1  TL
    oneSegment(0, 1),         // 2  TR
    oneSegment(3, 1),         // 3  TL TR
    oneSegment(1, 2),         // 4  BR
    twoSegments(3, 0, 1, 2),  // 5  TL BR (saddle)
    oneSegment(0, 2),         // 6  TR BR
    oneSegment(3, 2),         // 7  TL TR BR
    oneSegment(2, 3),         // 8  BL
    oneSegment(2, 0),         // 9  TL BL
    twoSegments(0, 1, 2, 3),  // 10 TR BL (saddle)
    oneSegment(2, 1),         // 11 TL TR BL
    oneSegment(1, 3),         // 12 BR BL
    oneSegment(1, 0),         // 13 TL BR BL
    oneSegment(0, 3),         // 14 TR BR BL
    noSegments(),             // 15
}};

[[nodiscard]] double distanceSq(const Point2& a, const Point2& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

Point2 contestedCrossing(const Point2& p0, const Point2& p1, double v0, double v1, bool foreign0,
                         bool foreign1, double threshold) {
    double t = 0.5;
    if (std::abs(v0 - v1) >= kInterpolationEpsilon) {
        t = (threshold - v0) / (v1 - v0);
    }
    if (foreign1 && !foreign0) {
        t = std::min(t, kContestedCrossingLimit);
    } else if (foreign0 && !foreign1) {
        t = std::max(t, 1.0 - kContestedCrossingLimit);
    }
    return Point2{p0.x + t * (p1.x - p0.x), p0.y + t * (p1.y - p0.y)};
}

}  // namespace

const std::array<CellCase, 16>& marchingSquaresTable() { return kCellCases; }

unsigned classifyCell(double topLeft, double topRight, double bottomRight, double bottomLeft,
                      double threshold) {
    unsigned code = 0U;
    if (topLeft >= threshold) {
        code |= static_cast<unsigned>(CellCorner::TopLeft);
    }
    if (topRight >= threshold) {
        code |= static_cast<unsigned>(CellCorner::TopRight);
    }
    if (bottomRight >= threshold) {
        code |= static_cast<unsigned>(CellCorner::BottomRight);
    }
    if (bottomLeft >= threshold) {
        code |= static_cast<unsigned>(CellCorner::BottomLeft);
    }
    return code;
}

Point2 interpolateCrossing(const Point2& p0, const Point2& p1, double v0, double v1,
                           double threshold) {
    if (std::abs(v0 - v1) < kInterpolationEpsilon) {
        return Point2{0.5 * (p0.x + p1.x), 0.5 * (p0.y + p1.y)};
    }
    const double t = (threshold - v0) / (v1 - v0);
    return Point2{p0.x + t * (p1.x - p0.x), p0.y + t * (p1.y - p0.y)};
}

std::size_t appendCellSegments(unsigned code, const std::array<Point2, 4>& edges,
                               std::vector<LineSegment>& out) {
    if (code > 15U) {
        throw std::invalid_argument("appendCellSegments: cell code must be in [0, 15]");
    }
    const CellCase& cellCase = kCellCases[code];
    for (std::size_t s = 0; s < cellCase.segmentCount; ++s) {
        const CellEdgePair& pair = cellCase.segments[s];
        out.push_back(LineSegment{edges[pair.from], edges[pair.to]});
    }
    return cellCase.segmentCount;
}

std::vector<LineSegment> traceContourSegments(const DominanceGrid& grid,
                                              const std::vector<double>& values,
                                              double threshold,
                                              const std::vector<std::uint8_t>* foreign) {
    if (values.size() != grid.nodeCount()) {
        throw std::invalid_argument("traceContourSegments: field size does not match grid");
    }
    if (foreign != nullptr && foreign->size() != grid.nodeCount()) {
        throw std::invalid_argument("traceContourSegments: foreign mask size does not match grid");
    }

    std::vector<LineSegment> segments;
    if (grid.nx < 2 || grid.ny < 2) {
        return segments;
    }

    const auto isForeign = [&](std::size_t p) {
        return foreign != nullptr && (*foreign)[p] != 0U;
    };

    for (std::size_t j = 0; j + 1 < grid.ny; ++j) {
        for (std::size_t i = 0; i + 1 < grid.nx; ++i) {
            const std::size_t tl = grid.idx(i, j);
            const std::size_t tr = grid.idx(i + 1, j);
            const std::size_t br = grid.idx(i + 1, j + 1);
            const std::size_t bl = grid.idx(i, j + 1);

            const unsigned code = classifyCell(values[tl], values[tr], values[br], values[bl], threshold);
            if (code == 0U || code == 15U) {
                continue;
            }

            const Point2 pTL = grid.nodePosition(i, j);
            const Point2 pTR = grid.nodePosition(i + 1, j);
            const Point2 pBR = grid.nodePosition(i + 1, j + 1);
            const Point2 pBL = grid.nodePosition(i, j + 1);

            const auto crossing = [&](const Point2& a, const Point2& b, std::size_t ia, std::size_t ib) {
                return contestedCrossing(a, b, values[ia], values[ib], isForeign(ia), isForeign(ib),
                                         threshold);
            };

            const std::array<Point2, 4> edges = {
                crossing(pTL, pTR, tl, tr),
                crossing(pTR, pBR, tr, br),
                crossing(pBR, pBL, br, bl),
                crossing(pBL, pTL, bl, tl),
            };
            appendCellSegments(code, edges, segments);
        }
    }

    return segments;
}

std::vector<LineSegment> traceContourSegments(const DominanceGrid& grid, const FactionField& field,
                                              double threshold) {
    return traceContourSegments(grid, field.values, threshold, &field.foreign);
}

std::vector<ContourLoop> stitchSegments(std::vector<LineSegment> segments,
                                        double epsilon,
                                        const FactionId& faction,
                                        StitchStats* stats) {
    if (!(epsilon > 0.0)) {
        throw std::invalid_argument("stitchSegments: epsilon must be positive");
    }

    StitchStats local{};
    local.segments = segments.size();
    const double epsilonSq = epsilon * epsilon;
    const double duplicate = epsilon * kDuplicatePointFraction;
    const double duplicateSq = duplicate * duplicate;

    std::vector<ContourLoop> loops;
    while (!segments.empty()) {
        const LineSegment start = segments.back();
        segments.pop_back();

        std::vector<Point2> chain{start.p0};
        if (distanceSq(start.p1, start.p0) > duplicateSq) {
            chain.push_back(start.p1);
        }
        bool closed = false;

        while (true) {
            const Point2& end = chain.back();
            std::size_t bestIndex = segments.size();
            bool bestReversed = false;
            double bestDistSq = std::numeric_limits<double>::infinity();
            for (std::size_t s = 0; s < segments.size(); ++s) {
                const double d0 = distanceSq(end, segments[s].p0);
                if (d0 < bestDistSq) {
                    bestDistSq = d0;
                    bestIndex = s;
                    bestReversed = false;
                }
                const double d1 = distanceSq(end, segments[s].p1);
                if (d1 < bestDistSq) {
                    bestDistSq = d1;
                    bestIndex = s;
                    bestReversed = true;
                }
            }

            const double closeDistSq = distanceSq(end, chain.front());
            if (chain.size() >= 3 && closeDistSq < epsilonSq && closeDistSq <= bestDistSq) {
                closed = true;
                break;
            }
            if (bestIndex == segments.size() || !(bestDistSq < epsilonSq)) {
                break;
            }

            const LineSegment next = segments[bestIndex];
            const Point2& far = bestReversed ? next.p0 : next.p1;
            if (distanceSq(far, chain.back()) > duplicateSq) {
                chain.push_back(far);
            }
            segments[bestIndex] = segments.back();
            segments.pop_back();
        }

        if (!closed) {
            ++local.openChains;
            continue;
        }
        if (chain.size() - 1 < 3) {
            ++local.degenerateLoops;
            continue;
        }

        ContourLoop loop{};
        loop.faction = faction;
        loop.points = std::move(chain);
        loops.push_back(std::move(loop));
    }

    local.loops = loops.size();
    if (stats != nullptr) {
        stats->segments += local.segments;
        stats->loops += local.loops;
        stats->openChains += local.openChains;
        stats->degenerateLoops += local.degenerateLoops;
    }
    return loops;
}

}  // namespace territory
