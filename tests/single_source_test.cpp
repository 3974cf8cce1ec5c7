// filename: single_source_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/hierarchy.hpp"
#include "territory/ingest.hpp"
#include "territory/territory.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>

int main() {
    using namespace territory;

    namespace fs = std::filesystem;
    const fs::path scenePath =
        (fs::path(__FILE__).parent_path() / "../inputs/tests/single_source_test.json").lexically_normal();

    TerritoryScene scene;
    try {
        scene = loadSceneFromJson(scenePath.string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse single source scene: " << ex.what() << "\n";
        return 1;
    }

    TerritoryResult result;
    try {
        result = computeTerritories(scene.allSources(), scene.options);
    } catch (const std::exception& ex) {
        std::cerr << "Territory computation failed: " << ex.what() << "\n";
        return 1;
    }

    if (result.territories.size() != 1) {
        std::cerr << "Expected exactly one territory, got " << result.territories.size() << "\n";
        return 1;
    }
    const FactionTerritory* territory = result.find("A");
    if (territory == nullptr || territory->shapes.size() != 1) {
        std::cerr << "Faction A must own exactly one shape\n";
        return 1;
    }
    const TerritoryShape& shape = territory->shapes.front();
    if (!shape.holeLoops.empty() || shape.depth != 0) {
        std::cerr << "Single source territory must have no holes\n";
        return 1;
    }
    if (result.stats.openChains != 0 || result.stats.degenerateLoops != 0) {
        std::cerr << "Single source contour must close cleanly\n";
        return 1;
    }

    if (!pointInPolygon(Point2{50.0, 0.0}, shape.outerLoop)) {
        std::cerr << "(50, 0) lies above the threshold and must be inside\n";
        return 1;
    }
    if (pointInPolygon(Point2{150.0, 0.0}, shape.outerLoop)) {
        std::cerr << "(150, 0) lies outside the radius and must be outside\n";
        return 1;
    }

    // strength 1 - d^2 / r^2 reaches 0.3 at d = r * sqrt(0.7)
    const double expectedRadius = 100.0 * std::sqrt(0.7);
    for (const auto& p : shape.outerLoop) {
        const double r = std::hypot(p.x, p.y);
        if (std::abs(r - expectedRadius) > scene.options.cellSize) {
            std::cerr << "Contour vertex at radius " << r << " deviates from " << expectedRadius
                      << " by more than one cell\n";
            return 1;
        }
    }

    const double expectedArea = kPi * expectedRadius * expectedRadius;
    if (std::abs(shape.area - expectedArea) / expectedArea > 0.05) {
        std::cerr << "Territory area " << shape.area << " too far from " << expectedArea << "\n";
        return 1;
    }

    if (result.markers.size() != 1 || result.markers.front().label != "keep" ||
        !result.debugCircles.empty()) {
        std::cerr << "Expected a single source marker and no debug circles\n";
        return 1;
    }

    // Nodes landing exactly on the threshold must not break inside tests along their row.
    InfluenceSource small{};
    small.radius = 5.0;
    small.power = 1.5;
    small.faction = "A";
    TerritoryOptions fine{};
    fine.cellSize = 1.0;
    DominanceGrid grid;
    const TerritoryResult exact = computeTerritories({small}, fine, nullptr, &grid);
    const FactionTerritory* exactTerritory = exact.find("A");
    if (exactTerritory == nullptr || exactTerritory->shapes.size() != 1) {
        std::cerr << "Small source must give a single shape\n";
        return 1;
    }
    const auto& loop = exactTerritory->shapes.front().outerLoop;
    for (std::size_t k = 1; k < loop.size(); ++k) {
        if (std::hypot(loop[k].x - loop[k - 1].x, loop[k].y - loop[k - 1].y) < 1e-9) {
            std::cerr << "Contour kept coincident consecutive vertices near (" << loop[k].x << ", "
                      << loop[k].y << ")\n";
            return 1;
        }
    }
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            if (grid.strengthAt(i, j) < fine.contourThreshold + 0.05) {
                continue;
            }
            if (!pointInPolygon(grid.nodePosition(i, j), loop)) {
                std::cerr << "Node (" << grid.nodeX(i) << ", " << grid.nodeY(j) << ") with strength "
                          << grid.strengthAt(i, j) << " classified outside its territory\n";
                return 1;
            }
        }
    }

    std::cout << "Single source territory validated successfully\n";
    return 0;
}
