// filename: grid.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/grid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace territory {

std::optional<Bounds> computeSourceBounds(const std::vector<InfluenceSource>& sources,
                                          double padding) {
    if (sources.empty()) {
        return std::nullopt;
    }

    Bounds bounds{};
    bounds.minX = std::numeric_limits<double>::infinity();
    bounds.minY = std::numeric_limits<double>::infinity();
    bounds.maxX = -std::numeric_limits<double>::infinity();
    bounds.maxY = -std::numeric_limits<double>::infinity();
    for (const auto& source : sources) {
        bounds.minX = std::min(bounds.minX, source.x - source.radius);
        bounds.minY = std::min(bounds.minY, source.y - source.radius);
        bounds.maxX = std::max(bounds.maxX, source.x + source.radius);
        bounds.maxY = std::max(bounds.maxY, source.y + source.radius);
    }

    bounds.minX -= padding;
    bounds.minY -= padding;
    bounds.maxX += padding;
    bounds.maxY += padding;
    return bounds;
}

bool buildDominanceGrid(const std::vector<FactionGroup>& groups,
                        const Bounds& bounds,
                        double cellSize,
                        DominanceGrid& grid,
                        ProgressSink* progress) {
    if (!(cellSize > 0.0)) {
        throw std::invalid_argument("buildDominanceGrid: cell size must be positive");
    }

    const auto cols = static_cast<std::size_t>(std::ceil(std::max(0.0, bounds.width()) / cellSize));
    const auto rows = static_cast<std::size_t>(std::ceil(std::max(0.0, bounds.height()) / cellSize));
    grid.resize(cols + 1, rows + 1, cellSize, bounds.minX, bounds.minY);

    grid.factions.clear();
    grid.factions.reserve(groups.size());
    for (const auto& group : groups) {
        grid.factions.push_back(group.faction);
    }

    for (std::size_t j = 0; j < grid.ny; ++j) {
        const double y = grid.nodeY(j);
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const DominanceSample sample = sampleDominance(groups, Point2{grid.nodeX(i), y});
            const std::size_t p = grid.idx(i, j);
            grid.winner[p] = sample.factionIndex;
            grid.strength[p] = sample.strength;
        }

        if (progress != nullptr) {
            ProgressSample report{};
            report.rowsDone = j + 1;
            report.rowsTotal = grid.ny;
            if (!progress->onProgress(report)) {
                return false;
            }
        }
    }

    return true;
}

FactionField extractFactionField(const DominanceGrid& grid, std::size_t factionIndex) {
    if (factionIndex >= grid.factions.size()) {
        throw std::out_of_range("extractFactionField: faction index out of range");
    }

    FactionField field{};
    field.factionIndex = factionIndex;
    const std::size_t count = grid.nodeCount();
    field.values.assign(count, 0.0);
    field.foreign.assign(count, 0U);

    const int target = static_cast<int>(factionIndex);
    for (std::size_t p = 0; p < count; ++p) {
        const int owner = grid.winner[p];
        if (owner == target) {
            field.values[p] = grid.strength[p];
        } else if (owner != DominanceGrid::kUnclaimed) {
            field.foreign[p] = 1U;
        }
    }
    return field;
}

}  // namespace territory
