// filename: field.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/field.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <utility>

namespace territory {

double influenceStrength(const InfluenceSource& source, const Point2& point) {
    const double rangeSq = source.radius * source.radius;
    if (!(source.radius > 0.0) || !(rangeSq > 0.0)) {
        return 0.0;
    }

    const double dx = point.x - source.x;
    const double dy = point.y - source.y;
    const double distSq = dx * dx + dy * dy;
    if (distSq > rangeSq) {
        return 0.0;
    }

    const double falloff = std::max(0.0, 1.0 - distSq / rangeSq);
    return falloff * source.power;
}

double factionStrength(const std::vector<InfluenceSource>& sources,
                       const FactionId& faction,
                       const Point2& point) {
    double total = 0.0;
    for (const auto& source : sources) {
        if (source.faction == faction) {
            total += influenceStrength(source, point);
        }
    }
    return total;
}

bool isValidSource(const InfluenceSource& source) {
    return std::isfinite(source.x) && std::isfinite(source.y) && std::isfinite(source.radius) &&
           std::isfinite(source.power) && source.radius > 0.0 && source.power > 0.0;
}

std::vector<InfluenceSource> filterValidSources(const std::vector<InfluenceSource>& sources) {
    std::vector<InfluenceSource> valid;
    valid.reserve(sources.size());
    for (const auto& source : sources) {
        if (isValidSource(source)) {
            valid.push_back(source);
        }
    }
    return valid;
}

std::vector<FactionGroup> groupByFaction(const std::vector<InfluenceSource>& sources) {
    std::unordered_map<FactionId, std::size_t> groupIndex;
    std::vector<FactionGroup> groups;
    for (const auto& source : sources) {
        const auto it = groupIndex.find(source.faction);
        if (it == groupIndex.end()) {
            groupIndex.emplace(source.faction, groups.size());
            FactionGroup group{};
            group.faction = source.faction;
            group.sources.push_back(source);
            groups.push_back(std::move(group));
        } else {
            groups[it->second].sources.push_back(source);
        }
    }

    std::sort(groups.begin(), groups.end(),
              [](const FactionGroup& a, const FactionGroup& b) { return a.faction < b.faction; });
    return groups;
}

DominanceSample sampleDominance(const std::vector<FactionGroup>& groups, const Point2& point) {
    DominanceSample best{};
    for (std::size_t g = 0; g < groups.size(); ++g) {
        double total = 0.0;
        for (const auto& source : groups[g].sources) {
            total += influenceStrength(source, point);
        }
        if (total > best.strength) {
            best.strength = total;
            best.factionIndex = static_cast<int>(g);
        }
    }
    return best;
}

}  // namespace territory
