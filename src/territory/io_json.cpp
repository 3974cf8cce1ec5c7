// filename: io_json.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/io_json.hpp"

#include "territory/color.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace territory {
namespace {

constexpr const char* kDocumentVersion = "0.1";

nlohmann::json pointsToJson(const std::vector<Point2>& points) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& point : points) {
        array.push_back({point.x, point.y});
    }
    return array;
}

nlohmann::json statsToJson(const ComputeStats& stats) {
    return nlohmann::json{
        {"input_sources", stats.inputSources},
        {"valid_sources", stats.validSources},
        {"factions", stats.factions},
        {"nx", stats.nx},
        {"ny", stats.ny},
        {"cell_size", stats.cellSize},
        {"segments", stats.segments},
        {"loops", stats.loops},
        {"open_chains", stats.openChains},
        {"degenerate_loops", stats.degenerateLoops},
        {"shapes", stats.shapes},
        {"holes", stats.holes},
        {"cancelled", stats.cancelled},
    };
}

}  // namespace

std::string serialize_territories_json(const TerritoryResult& result, int indent) {
    nlohmann::json document;
    document["version"] = kDocumentVersion;
    document["cell_size"] = result.stats.cellSize;
    if (result.bounds) {
        document["bounds"] = {{"min_x", result.bounds->minX},
                              {"min_y", result.bounds->minY},
                              {"max_x", result.bounds->maxX},
                              {"max_y", result.bounds->maxY}};
    } else {
        document["bounds"] = nullptr;
    }

    nlohmann::json territories = nlohmann::json::array();
    for (const auto& territory : result.territories) {
        nlohmann::json shapes = nlohmann::json::array();
        for (const auto& shape : territory.shapes) {
            nlohmann::json holes = nlohmann::json::array();
            for (const auto& hole : shape.holeLoops) {
                holes.push_back(pointsToJson(hole));
            }
            shapes.push_back({{"outer", pointsToJson(shape.outerLoop)},
                              {"holes", std::move(holes)},
                              {"area", shape.area},
                              {"depth", shape.depth}});
        }
        territories.push_back({{"faction", territory.faction},
                               {"color", formatHexColor(territory.color)},
                               {"shapes", std::move(shapes)}});
    }
    document["territories"] = std::move(territories);

    nlohmann::json circles = nlohmann::json::array();
    for (const auto& circle : result.debugCircles) {
        circles.push_back({{"faction", circle.faction},
                           {"color", formatHexColor(circle.color)},
                           {"label", circle.label},
                           {"center", {circle.center.x, circle.center.y}},
                           {"radius", circle.radius},
                           {"outline", pointsToJson(circle.outline)}});
    }
    document["debug_circles"] = std::move(circles);

    nlohmann::json markers = nlohmann::json::array();
    for (const auto& marker : result.markers) {
        markers.push_back({{"faction", marker.faction},
                           {"color", formatHexColor(marker.color)},
                           {"label", marker.label},
                           {"center", {marker.center.x, marker.center.y}}});
    }
    document["markers"] = std::move(markers);
    document["stats"] = statsToJson(result.stats);

    return document.dump(indent);
}

void write_shapes_json(const std::string& path, const TerritoryResult& result, int indent) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open shapes JSON output: " + path);
    }
    ofs << serialize_territories_json(result, indent) << '\n';
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing shapes JSON output: " + path);
    }
}

}  // namespace territory
