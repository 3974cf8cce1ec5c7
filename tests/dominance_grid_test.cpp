// filename: dominance_grid_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/field.hpp"
#include "territory/grid.hpp"
#include "territory/territory.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

territory::InfluenceSource makeSource(double x, double y, double radius, double power,
                                      const char* faction) {
    territory::InfluenceSource source{};
    source.x = x;
    source.y = y;
    source.radius = radius;
    source.power = power;
    source.faction = faction;
    return source;
}

struct StopAfterRows final : territory::ProgressSink {
    std::size_t limit{1};
    std::size_t calls{0};
    bool onProgress(const territory::ProgressSample& sample) override {
        ++calls;
        return sample.rowsDone < limit;
    }
};

}  // namespace

int main() {
    using namespace territory;

    if (computeSourceBounds({}, 50.0).has_value()) {
        std::cerr << "Empty source list must have no bounds\n";
        return 1;
    }

    const std::vector<InfluenceSource> sources = {
        makeSource(0.0, 0.0, 100.0, 1.0, "B"),
        makeSource(60.0, 0.0, 100.0, 1.0, "A"),
    };
    const auto bounds = computeSourceBounds(sources, 50.0);
    if (!bounds || bounds->minX != -150.0 || bounds->maxX != 210.0 || bounds->minY != -150.0 ||
        bounds->maxY != 150.0) {
        std::cerr << "Bounds must cover every source radius plus padding\n";
        return 1;
    }

    const auto groups = groupByFaction(sources);
    DominanceGrid grid;
    if (!buildDominanceGrid(groups, *bounds, 25.0, grid)) {
        std::cerr << "Uncancelled grid build must succeed\n";
        return 1;
    }
    // ceil(360 / 25) + 1 columns, ceil(300 / 25) + 1 rows
    if (grid.nx != 16 || grid.ny != 13) {
        std::cerr << "Unexpected grid dimensions " << grid.nx << "x" << grid.ny << "\n";
        return 1;
    }
    if (grid.nodeX(grid.nx - 1) < bounds->maxX || grid.nodeY(grid.ny - 1) < bounds->maxY) {
        std::cerr << "Last node must reach the far edge of the bounds\n";
        return 1;
    }
    if (grid.factions.size() != 2 || grid.factions[0] != "A" || grid.factions[1] != "B") {
        std::cerr << "Grid faction table must follow sorted faction ids\n";
        return 1;
    }

    try {
        // Node (6, 6) sits at (0, 0): B is centred there.
        if (grid.winnerAt(6, 6) != 1 || std::abs(grid.strengthAt(6, 6) - 1.0) > 1e-12) {
            std::cerr << "Faction B must win its own centre\n";
            return 1;
        }
        // Node (0, 0) lies outside both radii.
        if (grid.winnerAt(0, 0) != DominanceGrid::kUnclaimed || grid.strengthAt(0, 0) != 0.0) {
            std::cerr << "Corner node must be unclaimed\n";
            return 1;
        }
        (void)grid.winnerAt(grid.nx, 0);
        std::cerr << "winnerAt must reject out-of-range indices\n";
        return 1;
    } catch (const std::out_of_range&) {
    }

    // Equal strength on the perpendicular bisector resolves to A.
    {
        const std::vector<InfluenceSource> symmetric = {
            makeSource(-50.0, 0.0, 100.0, 1.0, "B"),
            makeSource(50.0, 0.0, 100.0, 1.0, "A"),
        };
        const Bounds box{-200.0, -200.0, 200.0, 200.0};
        DominanceGrid tieGrid;
        if (!buildDominanceGrid(groupByFaction(symmetric), box, 50.0, tieGrid)) {
            std::cerr << "Tie grid build failed\n";
            return 1;
        }
        if (tieGrid.winnerAt(4, 4) != 0) {
            std::cerr << "Tie at the bisector must go to faction A\n";
            return 1;
        }
    }

    const FactionField fieldA = extractFactionField(grid, 0);
    const FactionField fieldB = extractFactionField(grid, 1);
    for (std::size_t p = 0; p < grid.nodeCount(); ++p) {
        const int owner = grid.winner[p];
        const double a = fieldA.values[p];
        const double b = fieldB.values[p];
        if (a > 0.0 && b > 0.0) {
            std::cerr << "A node may contribute to at most one faction field\n";
            return 1;
        }
        if (owner == 0 && (a != grid.strength[p] || fieldA.foreign[p] != 0U)) {
            std::cerr << "Faction A field must copy the winning strength\n";
            return 1;
        }
        if (owner == 1 && (a != 0.0 || fieldA.foreign[p] != 1U)) {
            std::cerr << "Faction A field must be gated and flagged where B wins\n";
            return 1;
        }
        if (owner == DominanceGrid::kUnclaimed && (fieldA.foreign[p] != 0U || fieldB.foreign[p] != 0U)) {
            std::cerr << "Unclaimed nodes are not foreign to any faction\n";
            return 1;
        }
    }

    try {
        (void)extractFactionField(grid, 2);
        std::cerr << "extractFactionField must reject an unknown faction index\n";
        return 1;
    } catch (const std::out_of_range&) {
    }

    try {
        DominanceGrid bad;
        (void)buildDominanceGrid(groups, *bounds, 0.0, bad);
        std::cerr << "Zero cell size must be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    StopAfterRows stopper;
    stopper.limit = 2;
    DominanceGrid partial;
    if (buildDominanceGrid(groups, *bounds, 25.0, partial, &stopper)) {
        std::cerr << "Progress sink returning false must cancel the build\n";
        return 1;
    }
    if (stopper.calls != 2) {
        std::cerr << "Build must stop right after the refused row\n";
        return 1;
    }

    StopAfterRows immediate;
    TerritoryOptions options{};
    const TerritoryResult cancelled = computeTerritories(sources, options, &immediate);
    if (!cancelled.stats.cancelled || !cancelled.empty()) {
        std::cerr << "Cancelled computation must yield an empty result\n";
        return 1;
    }

    std::cout << "Dominance grid validated successfully\n";
    return 0;
}
