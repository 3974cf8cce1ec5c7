// filename: segment_stitcher_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/contour.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

int main() {
    using namespace territory;

    // Unit square, shuffled and with two segments reversed.
    const std::vector<LineSegment> square = {
        {Point2{10.0, 10.0}, Point2{0.0, 10.0}},
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{0.0, 0.0}, Point2{0.0, 10.0}},
        {Point2{10.0, 10.0}, Point2{10.0, 0.0}},
    };
    StitchStats stats{};
    const auto loops = stitchSegments(square, 1.0, "A", &stats);
    if (loops.size() != 1) {
        std::cerr << "Square segments must stitch into one loop, got " << loops.size() << "\n";
        return 1;
    }
    if (loops.front().faction != "A" || loops.front().points.size() != 5) {
        std::cerr << "Closed square should carry 4 distinct vertices plus the closing point\n";
        return 1;
    }
    if (stats.segments != 4 || stats.loops != 1 || stats.openChains != 0) {
        std::cerr << "Stitch statistics mismatch for the square\n";
        return 1;
    }

    // Endpoints that differ by floating noise still join.
    const std::vector<LineSegment> noisy = {
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{10.0 + 1e-7, 0.0}, Point2{10.0, 10.0}},
        {Point2{10.0, 10.0 - 1e-7}, Point2{0.0, 10.0}},
        {Point2{0.0, 10.0}, Point2{1e-7, 0.0}},
    };
    if (stitchSegments(noisy, 1.0).size() != 1) {
        std::cerr << "Near-coincident endpoints must be stitched together\n";
        return 1;
    }

    // Two disjoint triangles stay separate loops.
    std::vector<LineSegment> pair = {
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{10.0, 0.0}, Point2{5.0, 8.0}},
        {Point2{5.0, 8.0}, Point2{0.0, 0.0}},
        {Point2{100.0, 0.0}, Point2{110.0, 0.0}},
        {Point2{110.0, 0.0}, Point2{105.0, 8.0}},
        {Point2{105.0, 8.0}, Point2{100.0, 0.0}},
    };
    if (stitchSegments(pair, 1.0).size() != 2) {
        std::cerr << "Disjoint triangles must yield two loops\n";
        return 1;
    }

    StitchStats openStats{};
    const std::vector<LineSegment> open = {
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{10.0, 0.0}, Point2{10.0, 10.0}},
    };
    if (!stitchSegments(open, 1.0, "A", &openStats).empty() || openStats.openChains == 0) {
        std::cerr << "Chains that never close must be discarded and counted\n";
        return 1;
    }

    StitchStats degenerateStats{};
    const std::vector<LineSegment> backAndForth = {
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{10.0, 0.0}, Point2{0.0, 0.0}},
    };
    if (!stitchSegments(backAndForth, 1.0, "A", &degenerateStats).empty() ||
        degenerateStats.degenerateLoops != 1) {
        std::cerr << "Loops with fewer than 3 distinct points must be dropped\n";
        return 1;
    }

    // A zero-length piece at a corner must not leave a doubled vertex behind.
    const std::vector<LineSegment> pinched = {
        {Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        {Point2{10.0, 0.0}, Point2{10.0, 1e-15}},
        {Point2{10.0, 1e-15}, Point2{10.0, 10.0}},
        {Point2{10.0, 10.0}, Point2{0.0, 10.0}},
        {Point2{0.0, 10.0}, Point2{0.0, 0.0}},
    };
    const auto pinchedLoops = stitchSegments(pinched, 1.0);
    if (pinchedLoops.size() != 1 || pinchedLoops.front().points.size() != 5) {
        std::cerr << "Zero-length pieces must be absorbed into the square\n";
        return 1;
    }
    const auto& ring = pinchedLoops.front().points;
    for (std::size_t k = 1; k < ring.size(); ++k) {
        if (std::hypot(ring[k].x - ring[k - 1].x, ring[k].y - ring[k - 1].y) < 1e-9) {
            std::cerr << "Stitched loop kept two coincident consecutive points\n";
            return 1;
        }
    }

    if (!stitchSegments({}, 1.0).empty()) {
        std::cerr << "No segments must give no loops\n";
        return 1;
    }

    try {
        (void)stitchSegments(square, 0.0);
        std::cerr << "Non-positive epsilon must be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    std::cout << "Segment stitcher validated successfully\n";
    return 0;
}
