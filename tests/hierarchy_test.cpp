// filename: hierarchy_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/contour.hpp"
#include "territory/hierarchy.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

territory::ContourLoop square(const char* faction, double cx, double cy, double half) {
    territory::ContourLoop loop{};
    loop.faction = faction;
    loop.points = {
        {cx - half, cy - half},
        {cx + half, cy - half},
        {cx + half, cy + half},
        {cx - half, cy + half},
    };
    return loop;
}

}  // namespace

int main() {
    using namespace territory;

    const ContourLoop outer = square("A", 0.0, 0.0, 50.0);
    if (std::abs(polygonArea(outer.points) - 10000.0) > 1e-9) {
        std::cerr << "Square area mismatch\n";
        return 1;
    }
    std::vector<Point2> reversed(outer.points.rbegin(), outer.points.rend());
    if (std::abs(signedPolygonArea(reversed) + signedPolygonArea(outer.points)) > 1e-9) {
        std::cerr << "Reversing a polygon must flip the signed area\n";
        return 1;
    }
    if (!pointInPolygon(Point2{10.0, 10.0}, outer.points) ||
        pointInPolygon(Point2{60.0, 0.0}, outer.points)) {
        std::cerr << "Ray casting misclassified a point\n";
        return 1;
    }

    // Input order deliberately not sorted by area.
    const std::vector<ContourLoop> loops = {
        square("B", 0.0, 0.0, 5.0),    // inner island
        square("A", 0.0, 0.0, 50.0),   // outer territory
        square("C", 200.0, 0.0, 20.0), // separate territory
        square("A", 0.0, 0.0, 25.0),   // hole in A
    };
    const ContourHierarchy hierarchy = buildContourHierarchy(loops);
    if (hierarchy.parent[1] != ContourHierarchy::kNoParent || hierarchy.depth[1] != 0 ||
        hierarchy.parent[2] != ContourHierarchy::kNoParent || hierarchy.depth[2] != 0) {
        std::cerr << "Outermost loops must have no parent\n";
        return 1;
    }
    if (hierarchy.parent[3] != 1 || hierarchy.depth[3] != 1 || !hierarchy.isHole(3)) {
        std::cerr << "Middle loop must be a hole of the outer territory\n";
        return 1;
    }
    if (hierarchy.parent[0] != 3 || hierarchy.depth[0] != 2 || hierarchy.isHole(0)) {
        std::cerr << "Island must nest in the smallest containing loop at depth 2\n";
        return 1;
    }

    const auto shapes = assembleShapes(loops, hierarchy);
    if (shapes.size() != 3) {
        std::cerr << "Expected 3 shapes (outer, separate, island), got " << shapes.size() << "\n";
        return 1;
    }
    for (std::size_t s = 1; s < shapes.size(); ++s) {
        if (shapes[s - 1].area < shapes[s].area) {
            std::cerr << "Shapes must be ordered by descending area\n";
            return 1;
        }
    }
    const TerritoryShape& big = shapes.front();
    if (big.faction != "A" || big.holeLoops.size() != 1 || big.depth != 0) {
        std::cerr << "Outer territory must carry exactly one hole\n";
        return 1;
    }
    if (std::abs(polygonArea(big.holeLoops.front()) - 2500.0) > 1e-9) {
        std::cerr << "Hole geometry was not attached to its parent\n";
        return 1;
    }
    const TerritoryShape& island = shapes.back();
    if (island.faction != "B" || island.depth != 2 || !island.holeLoops.empty()) {
        std::cerr << "Island must become its own fill shape\n";
        return 1;
    }

    try {
        ContourHierarchy truncated = hierarchy;
        truncated.parent.pop_back();
        (void)assembleShapes(loops, truncated);
        std::cerr << "Mismatched hierarchy must be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    std::cout << "Hierarchy builder validated successfully\n";
    return 0;
}
