// filename: grid.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "territory/field.hpp"
#include "territory/types.hpp"

namespace territory {

/**
 * @brief Structured uniform grid recording the winning faction and its strength per node.
 *
 * Nodes are laid out row-major with node (i, j) at (originX + i * cellSize,
 * originY + j * cellSize). The grid lives for a single computation pass.
 */
struct DominanceGrid {
    static constexpr int kUnclaimed = DominanceSample::kUnclaimed;

    std::size_t nx{0};
    std::size_t ny{0};
    double cellSize{1.0};
    double originX{0.0};
    double originY{0.0};
    std::vector<FactionId> factions;
    std::vector<int> winner;
    std::vector<double> strength;

    DominanceGrid() = default;

    DominanceGrid(std::size_t nxIn, std::size_t nyIn, double cellSizeIn, double originXIn,
                  double originYIn)
        : nx(nxIn), ny(nyIn), cellSize(cellSizeIn), originX(originXIn), originY(originYIn),
          winner(nxIn * nyIn, kUnclaimed), strength(nxIn * nyIn, 0.0) {}

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j) const {
        return j * nx + i;
    }

    [[nodiscard]] inline bool inBounds(std::size_t i, std::size_t j) const {
        return i < nx && j < ny;
    }

    [[nodiscard]] inline double nodeX(std::size_t i) const {
        return originX + static_cast<double>(i) * cellSize;
    }

    [[nodiscard]] inline double nodeY(std::size_t j) const {
        return originY + static_cast<double>(j) * cellSize;
    }

    [[nodiscard]] inline Point2 nodePosition(std::size_t i, std::size_t j) const {
        return Point2{nodeX(i), nodeY(j)};
    }

    [[nodiscard]] inline int winnerAt(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("DominanceGrid::winnerAt index out of range");
        }
        return winner[idx(i, j)];
    }

    [[nodiscard]] inline double strengthAt(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("DominanceGrid::strengthAt index out of range");
        }
        return strength[idx(i, j)];
    }

    [[nodiscard]] inline std::size_t nodeCount() const { return nx * ny; }

    void resize(std::size_t nxIn, std::size_t nyIn, double cellSizeIn, double originXIn,
                double originYIn) {
        nx = nxIn;
        ny = nyIn;
        cellSize = cellSizeIn;
        originX = originXIn;
        originY = originYIn;
        const std::size_t count = nx * ny;
        winner.assign(count, kUnclaimed);
        strength.assign(count, 0.0);
    }
};

/**
 * @brief Single-faction scalar field gated by dominance, plus a mask of nodes won by
 *        another faction.
 */
struct FactionField {
    std::size_t factionIndex{0};
    std::vector<double> values;
    std::vector<std::uint8_t> foreign;
};

struct ProgressSample {
    std::size_t rowsDone{0};
    std::size_t rowsTotal{0};
};

struct ProgressSink {
    virtual ~ProgressSink() = default;
    // Return false to stop the computation after the current row.
    virtual bool onProgress(const ProgressSample& sample) = 0;
};

/**
 * @brief Union of every source's (position +/- radius) square, expanded by @p padding.
 * @return std::nullopt when @p sources is empty.
 */
std::optional<Bounds> computeSourceBounds(const std::vector<InfluenceSource>& sources,
                                          double padding);

/**
 * @brief Sample the dominance field over @p bounds with nodes @p cellSize apart.
 *
 * The grid gets ceil(width / cellSize) + 1 columns and ceil(height / cellSize) + 1 rows so
 * the last node reaches or passes the far edge of the bounds.
 * @return false when @p progress requested a stop; @p grid is then incomplete.
 */
bool buildDominanceGrid(const std::vector<FactionGroup>& groups,
                        const Bounds& bounds,
                        double cellSize,
                        DominanceGrid& grid,
                        ProgressSink* progress = nullptr);

/**
 * @brief value(node) = winning strength where @p factionIndex won the node, zero elsewhere.
 */
FactionField extractFactionField(const DominanceGrid& grid, std::size_t factionIndex);

}  // namespace territory
