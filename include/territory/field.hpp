// filename: field.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "territory/types.hpp"

namespace territory {

/**
 * @brief Point source projecting a quadratic-falloff influence field for one faction.
 */
struct InfluenceSource {
    double x{0.0};
    double y{0.0};
    double radius{0.0};
    double power{0.0};
    FactionId faction;
    std::string label;
};

struct FactionGroup {
    FactionId faction;
    std::vector<InfluenceSource> sources;
};

struct DominanceSample {
    static constexpr int kUnclaimed = -1;

    int factionIndex{kUnclaimed};
    double strength{0.0};
};

/**
 * @brief Contribution of one source at a point: power * (1 - (d / radius)^2) inside the
 *        radius, zero outside.
 */
[[nodiscard]] double influenceStrength(const InfluenceSource& source, const Point2& point);

/**
 * @brief Sum of influenceStrength over every source belonging to @p faction.
 */
[[nodiscard]] double factionStrength(const std::vector<InfluenceSource>& sources,
                                     const FactionId& faction,
                                     const Point2& point);

[[nodiscard]] bool isValidSource(const InfluenceSource& source);

std::vector<InfluenceSource> filterValidSources(const std::vector<InfluenceSource>& sources);

/**
 * @brief Group sources by faction id. Groups are returned in ascending faction id order,
 *        which is also the dominance tie-break order.
 */
std::vector<FactionGroup> groupByFaction(const std::vector<InfluenceSource>& sources);

/**
 * @brief Winning faction (index into @p groups) and its aggregated strength at a point.
 *
 * A strictly greater strength is required to displace an earlier group, so exact ties go
 * to the lexicographically smallest faction id. A zero maximum leaves the point unclaimed.
 */
[[nodiscard]] DominanceSample sampleDominance(const std::vector<FactionGroup>& groups,
                                              const Point2& point);

}  // namespace territory
