// filename: types.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <string>

namespace territory {

using FactionId = std::string;

constexpr double kDefaultContourThreshold = 0.3;
constexpr double kDefaultBoundaryPadding = 50.0;
constexpr double kDefaultCellSize = 25.0;

// Stitch epsilon, measured in grid cells.
constexpr double kStitchEpsilonCells = 1.5;

// Below this corner-value difference an edge crossing falls back to the edge midpoint.
constexpr double kInterpolationEpsilon = 1e-3;

// Largest fraction of an edge a crossing may sit from the traced faction's node when the
// opposite node is won by another faction.
constexpr double kContestedCrossingLimit = 0.45;

// Vertices of a candidate child loop tested against a candidate parent.
constexpr std::size_t kHierarchySampleVertices = 3;

constexpr double kPi = 3.14159265358979323846;

inline const char* const kNeutralFaction = "neutral";

struct Point2 {
    double x{0.0};
    double y{0.0};
};

struct Bounds {
    double minX{0.0};
    double minY{0.0};
    double maxX{0.0};
    double maxY{0.0};

    [[nodiscard]] double width() const { return maxX - minX; }
    [[nodiscard]] double height() const { return maxY - minY; }
};

}  // namespace territory
