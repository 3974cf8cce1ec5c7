// filename: field_sampler_test.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/field.hpp"
#include "territory/types.hpp"

#include <cmath>
#include <iostream>
#include <limits>
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

}  // namespace

int main() {
    using namespace territory;

    const InfluenceSource keep = makeSource(0.0, 0.0, 100.0, 2.0, "A");

    if (std::abs(influenceStrength(keep, Point2{0.0, 0.0}) - 2.0) > 1e-12) {
        std::cerr << "Strength at the source centre must equal its power\n";
        return 1;
    }
    // 1 - 50^2 / 100^2 = 0.75
    if (std::abs(influenceStrength(keep, Point2{50.0, 0.0}) - 1.5) > 1e-12) {
        std::cerr << "Quadratic falloff mismatch at half radius\n";
        return 1;
    }
    if (influenceStrength(keep, Point2{0.0, 100.0}) != 0.0) {
        std::cerr << "Strength must vanish at the radius\n";
        return 1;
    }
    if (influenceStrength(keep, Point2{120.0, 0.0}) != 0.0) {
        std::cerr << "Strength must be zero outside the radius\n";
        return 1;
    }

    const std::vector<InfluenceSource> sources = {
        makeSource(0.0, 0.0, 100.0, 1.0, "A"),
        makeSource(100.0, 0.0, 100.0, 1.0, "A"),
        makeSource(0.0, 0.0, 100.0, 5.0, "B"),
    };
    const double combined = factionStrength(sources, "A", Point2{50.0, 0.0});
    if (std::abs(combined - 1.5) > 1e-12) {
        std::cerr << "Same-faction sources must sum: expected 1.5, got " << combined << "\n";
        return 1;
    }
    if (factionStrength(sources, "C", Point2{0.0, 0.0}) != 0.0) {
        std::cerr << "Absent faction must have zero strength\n";
        return 1;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<InfluenceSource> mixed = {
        makeSource(0.0, 0.0, 100.0, 1.0, "A"),
        makeSource(0.0, 0.0, 0.0, 1.0, "A"),
        makeSource(0.0, 0.0, 100.0, 0.0, "A"),
        makeSource(0.0, 0.0, -10.0, 1.0, "A"),
        makeSource(nan, 0.0, 100.0, 1.0, "A"),
        makeSource(0.0, 0.0, 100.0, std::numeric_limits<double>::infinity(), "A"),
    };
    const auto valid = filterValidSources(mixed);
    if (valid.size() != 1) {
        std::cerr << "Only the well-formed source should survive filtering, got " << valid.size()
                  << "\n";
        return 1;
    }

    const auto groups = groupByFaction(std::vector<InfluenceSource>{
        makeSource(0.0, 0.0, 10.0, 1.0, "zulu"),
        makeSource(0.0, 0.0, 10.0, 1.0, "alpha"),
        makeSource(5.0, 0.0, 10.0, 1.0, "zulu"),
    });
    if (groups.size() != 2 || groups[0].faction != "alpha" || groups[1].faction != "zulu" ||
        groups[1].sources.size() != 2) {
        std::cerr << "Faction groups must be ordered by id and collect every member\n";
        return 1;
    }

    // B is stronger at the centre; far from both nothing wins.
    const auto bySide = groupByFaction(sources);
    const DominanceSample centre = sampleDominance(bySide, Point2{0.0, 0.0});
    if (centre.factionIndex != 1 || std::abs(centre.strength - 5.0) > 1e-12) {
        std::cerr << "Expected faction B to dominate the centre\n";
        return 1;
    }
    const DominanceSample east = sampleDominance(bySide, Point2{150.0, 0.0});
    if (east.factionIndex != 0) {
        std::cerr << "Only faction A reaches x=150\n";
        return 1;
    }
    const DominanceSample nowhere = sampleDominance(bySide, Point2{1000.0, 1000.0});
    if (nowhere.factionIndex != DominanceSample::kUnclaimed || nowhere.strength != 0.0) {
        std::cerr << "Points outside every radius must be unclaimed\n";
        return 1;
    }

    const auto tied = groupByFaction(std::vector<InfluenceSource>{
        makeSource(0.0, 0.0, 50.0, 1.0, "B"),
        makeSource(0.0, 0.0, 50.0, 1.0, "A"),
    });
    const DominanceSample tie = sampleDominance(tied, Point2{10.0, 0.0});
    if (tie.factionIndex != 0 || tied[0].faction != "A") {
        std::cerr << "Ties must go to the lexicographically smallest faction id\n";
        return 1;
    }

    std::cout << "Field sampler validated successfully\n";
    return 0;
}
