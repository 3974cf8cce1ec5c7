// filename: enclave_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/hierarchy.hpp"
#include "territory/ingest.hpp"
#include "territory/territory.hpp"

#include <filesystem>
#include <iostream>

int main() {
    using namespace territory;

    namespace fs = std::filesystem;
    const fs::path scenePath =
        (fs::path(__FILE__).parent_path() / "../inputs/tests/enclave_test.json").lexically_normal();

    TerritoryScene scene;
    try {
        scene = loadSceneFromJson(scenePath.string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse enclave scene: " << ex.what() << "\n";
        return 1;
    }

    const TerritoryResult result = computeTerritories(scene.allSources(), scene.options);
    const FactionTerritory* realm = result.find("A");
    const FactionTerritory* fort = result.find("B");
    if (realm == nullptr || fort == nullptr) {
        std::cerr << "Both factions must have territory\n";
        return 1;
    }

    if (realm->shapes.size() != 1 || realm->shapes.front().holeLoops.size() != 1) {
        std::cerr << "Faction A must own one shape with one hole\n";
        return 1;
    }
    const TerritoryShape& outer = realm->shapes.front();
    if (outer.depth != 0) {
        std::cerr << "Faction A shape must be top level\n";
        return 1;
    }

    if (fort->shapes.size() != 1 || !fort->shapes.front().holeLoops.empty()) {
        std::cerr << "Faction B must own one solid shape\n";
        return 1;
    }
    const TerritoryShape& enclave = fort->shapes.front();
    if (enclave.depth != 2) {
        std::cerr << "Enclave must sit at depth 2 inside the hole, got " << enclave.depth << "\n";
        return 1;
    }

    const auto& hole = outer.holeLoops.front();
    if (!pointInPolygon(Point2{0.0, 0.0}, hole) || !pointInPolygon(Point2{0.0, 0.0}, enclave.outerLoop)) {
        std::cerr << "The hole and the enclave must both surround the shared centre\n";
        return 1;
    }
    for (const auto& p : enclave.outerLoop) {
        if (!pointInPolygon(p, hole)) {
            std::cerr << "Enclave outline must lie inside faction A's hole\n";
            return 1;
        }
    }
    if (polygonArea(hole) <= enclave.area) {
        std::cerr << "Hole must be larger than the enclave it surrounds\n";
        return 1;
    }
    if (result.stats.holes != 1 || result.stats.shapes != 2) {
        std::cerr << "Expected 2 shapes and 1 hole in the statistics\n";
        return 1;
    }

    std::cout << "Enclave nesting validated successfully\n";
    return 0;
}
