// filename: hierarchy.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/hierarchy.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace territory {
namespace {
constexpr double kTiny = 1e-12;
}  // namespace

double signedPolygonArea(const std::vector<Point2>& polygon) {
    if (polygon.size() < 3) {
        return 0.0;
    }
    double area = 0.0;
    const std::size_t count = polygon.size();
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        area += polygon[j].x * polygon[i].y - polygon[i].x * polygon[j].y;
    }
    return 0.5 * area;
}

double polygonArea(const std::vector<Point2>& polygon) {
    return std::abs(signedPolygonArea(polygon));
}

bool pointInPolygon(const Point2& point, const std::vector<Point2>& polygon) {
    const std::size_t count = polygon.size();
    if (count == 0U) {
        return false;
    }

    bool inside = false;
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const double xi = polygon[i].x;
        const double yi = polygon[i].y;
        const double xj = polygon[j].x;
        const double yj = polygon[j].y;

        const double denom = yj - yi;
        if (std::abs(denom) < kTiny) {
            continue;
        }
        const bool intersects = ((yi > point.y) != (yj > point.y)) &&
                                (point.x < (xj - xi) * (point.y - yi) / denom + xi);
        if (intersects) {
            inside = !inside;
        }
    }

    return inside;
}

bool loopInsideLoop(const std::vector<Point2>& child, const std::vector<Point2>& parent,
                    std::size_t sampleCount) {
    const std::size_t samples = std::min(sampleCount, child.size());
    if (samples == 0U) {
        return false;
    }
    for (std::size_t k = 0; k < samples; ++k) {
        if (!pointInPolygon(child[k], parent)) {
            return false;
        }
    }
    return true;
}

ContourHierarchy buildContourHierarchy(const std::vector<ContourLoop>& loops) {
    const std::size_t count = loops.size();
    ContourHierarchy hierarchy{};
    hierarchy.parent.assign(count, ContourHierarchy::kNoParent);
    hierarchy.depth.assign(count, 0);
    hierarchy.area.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        hierarchy.area[i] = polygonArea(loops[i].points);
    }

    // Largest first: a parent always precedes its children, so depths resolve in one pass.
    std::vector<std::size_t> order(count);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return hierarchy.area[a] > hierarchy.area[b];
    });

    for (std::size_t rank = 0; rank < count; ++rank) {
        const std::size_t child = order[rank];
        for (std::size_t candidateRank = rank; candidateRank-- > 0;) {
            const std::size_t candidate = order[candidateRank];
            if (loopInsideLoop(loops[child].points, loops[candidate].points)) {
                hierarchy.parent[child] = static_cast<long>(candidate);
                hierarchy.depth[child] = hierarchy.depth[candidate] + 1;
                break;
            }
        }
    }

    return hierarchy;
}

std::vector<TerritoryShape> assembleShapes(const std::vector<ContourLoop>& loops,
                                           const ContourHierarchy& hierarchy) {
    const std::size_t count = loops.size();
    if (hierarchy.parent.size() != count || hierarchy.depth.size() != count ||
        hierarchy.area.size() != count) {
        throw std::invalid_argument("assembleShapes: hierarchy does not match loop count");
    }

    std::vector<long> shapeOfLoop(count, -1);
    std::vector<TerritoryShape> shapes;
    for (std::size_t i = 0; i < count; ++i) {
        if (hierarchy.isHole(i)) {
            continue;
        }
        shapeOfLoop[i] = static_cast<long>(shapes.size());
        TerritoryShape shape{};
        shape.faction = loops[i].faction;
        shape.outerLoop = loops[i].points;
        shape.area = hierarchy.area[i];
        shape.depth = hierarchy.depth[i];
        shapes.push_back(std::move(shape));
    }

    std::vector<std::vector<std::size_t>> holesOfShape(shapes.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (!hierarchy.isHole(i)) {
            continue;
        }
        const long parent = hierarchy.parent[i];
        if (parent == ContourHierarchy::kNoParent) {
            continue;
        }
        const long shapeIndex = shapeOfLoop[static_cast<std::size_t>(parent)];
        if (shapeIndex >= 0) {
            holesOfShape[static_cast<std::size_t>(shapeIndex)].push_back(i);
        }
    }

    for (std::size_t s = 0; s < shapes.size(); ++s) {
        auto& holes = holesOfShape[s];
        std::stable_sort(holes.begin(), holes.end(), [&](std::size_t a, std::size_t b) {
            return hierarchy.area[a] > hierarchy.area[b];
        });
        for (const std::size_t hole : holes) {
            shapes[s].holeLoops.push_back(loops[hole].points);
        }
    }

    std::stable_sort(shapes.begin(), shapes.end(), [](const TerritoryShape& a, const TerritoryShape& b) {
        return a.area > b.area;
    });
    return shapes;
}

}  // namespace territory
