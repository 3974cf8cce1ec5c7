// filename: ingest.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/ingest.hpp"

#include "territory/color.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace territory {
namespace {

double requirePositive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw std::runtime_error(field + " must be positive");
    }
    return value;
}

std::string requireNonEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error(field + " must be a non-empty string");
    }
    return value;
}

double requireFinite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw std::runtime_error(field + " must be a finite number");
    }
    return value;
}

void parseOptions(const nlohmann::json& options, TerritoryScene& scene) {
    if (!options.is_object()) {
        throw std::runtime_error("Scene options must be an object");
    }

    TerritoryOptions& out = scene.options;
    out.cellSize = options.value("cell_size", out.cellSize);
    out.contourThreshold = options.value("contour_threshold", out.contourThreshold);
    out.boundaryPadding = options.value("boundary_padding", out.boundaryPadding);
    out.stitchEpsilonCells = options.value("stitch_epsilon_cells", out.stitchEpsilonCells);
    out.debugMode = options.value("debug", out.debugMode);
    out.debugCircleSegments = options.value("debug_circle_segments", out.debugCircleSegments);
    out.verbose = options.value("verbose", out.verbose);
    if (options.contains("quiet")) {
        scene.quietSpecified = true;
        scene.quiet = options.at("quiet").get<bool>();
    }

    if (options.contains("adaptive_resolution")) {
        const auto& adaptive = options.at("adaptive_resolution");
        if (!adaptive.is_object()) {
            throw std::runtime_error("options.adaptive_resolution must be an object");
        }
        out.adaptive.enabled = adaptive.value("enabled", true);
        out.adaptive.maxSamplingWork = adaptive.value("max_work", out.adaptive.maxSamplingWork);
        out.adaptive.minCellSize = adaptive.value("min_cell_size", out.adaptive.minCellSize);
        out.adaptive.maxCellSize = adaptive.value("max_cell_size", out.adaptive.maxCellSize);
    }
}

void parseFactions(const nlohmann::json& factions, TerritoryScene& scene) {
    if (!factions.is_array()) {
        throw std::runtime_error("Scene factions must be an array");
    }
    std::unordered_set<FactionId> seen;
    for (const auto& faction : factions) {
        const FactionId id = normalizeFactionKey(faction.at("id").get<std::string>());
        if (!seen.insert(id).second) {
            throw std::runtime_error("Duplicate faction id: " + id);
        }
        if (faction.contains("color")) {
            const std::string colorText = faction.at("color").get<std::string>();
            const auto color = parseCssHexColor(colorText);
            if (!color) {
                throw std::runtime_error("Invalid color for faction '" + id + "': " + colorText);
            }
            scene.options.colorOverrides[id] = *color;
        }
    }
}

void parseSources(const nlohmann::json& sources, TerritoryScene& scene) {
    if (!sources.is_array()) {
        throw std::runtime_error("Scene sources must be an array");
    }
    for (const auto& entry : sources) {
        InfluenceSource source{};
        source.x = requireFinite("sources.x", entry.at("x").get<double>());
        source.y = requireFinite("sources.y", entry.at("y").get<double>());
        source.radius = requireFinite("sources.radius", entry.at("radius").get<double>());
        source.power = requireFinite("sources.power", entry.value("power", 1.0));
        source.faction = normalizeFactionKey(entry.value("faction", std::string{}));
        source.label = entry.value("id", std::string{});
        scene.sources.push_back(std::move(source));
    }
}

void parseTokens(const nlohmann::json& tokens, TerritoryScene& scene) {
    if (!tokens.is_array()) {
        throw std::runtime_error("Scene tokens must be an array");
    }
    for (const auto& entry : tokens) {
        TerritoryScene::Token token{};
        token.id = entry.value("id", std::string{});
        token.x = requireFinite("tokens.x", entry.at("x").get<double>());
        token.y = requireFinite("tokens.y", entry.at("y").get<double>());
        token.width = entry.value("width", token.width);
        token.height = entry.value("height", token.height);
        token.scaleX = entry.value("scale_x", token.scaleX);
        token.scaleY = entry.value("scale_y", token.scaleY);
        token.range = requireFinite("tokens.range", entry.value("range", 0.0));
        token.power = requireFinite("tokens.power", entry.value("power", 1.0));
        std::string faction = entry.value("faction", std::string{});
        if (faction.empty()) {
            faction = entry.value("side", std::string{});
        }
        token.faction = normalizeFactionKey(faction);
        scene.tokens.push_back(std::move(token));
    }
}

void parseOutputs(const nlohmann::json& outputs, TerritoryScene& scene) {
    if (!outputs.is_array()) {
        throw std::runtime_error("Scene outputs must be an array");
    }

    std::unordered_set<std::string> ids;
    ids.reserve(outputs.size());
    for (const auto& output : outputs) {
        const std::string type = output.at("type").get<std::string>();
        const std::string id = requireNonEmpty("outputs.id", output.at("id").get<std::string>());
        if (!ids.insert(id).second) {
            throw std::runtime_error("Duplicate output id: " + id);
        }
        const auto pathOr = [&](const std::string& fallback) {
            if (output.contains("path")) {
                return requireNonEmpty("outputs.path", output.at("path").get<std::string>());
            }
            return fallback;
        };

        if (type == "shapes_json") {
            TerritoryScene::Outputs::ShapesJson request{};
            request.id = id;
            request.path = pathOr("outputs/" + id + ".json");
            request.indent = output.value("indent", request.indent);
            scene.outputs.shapesJson.push_back(std::move(request));
        } else if (type == "outlines_vtp") {
            TerritoryScene::Outputs::OutlinesVtp request{};
            request.id = id;
            request.path = pathOr("outputs/" + id + ".vtp");
            scene.outputs.outlinesVtp.push_back(std::move(request));
        } else if (type == "loops_csv") {
            TerritoryScene::Outputs::LoopsCsv request{};
            request.id = id;
            request.path = pathOr("outputs/" + id + ".csv");
            scene.outputs.loopsCsv.push_back(std::move(request));
        } else if (type == "dominance_map") {
            TerritoryScene::Outputs::DominanceMap request{};
            request.id = id;
            request.format = output.value("format", std::string{"csv"});
            if (request.format != "csv" && request.format != "vti") {
                throw std::runtime_error("Unsupported dominance_map format for output '" + id +
                                         "': " + request.format);
            }
            request.path = pathOr("outputs/" + id + (request.format == "csv" ? ".csv" : ".vti"));
            scene.outputs.dominanceMaps.push_back(std::move(request));
        } else {
            throw std::runtime_error("Unsupported output type for output '" + id + "': " + type);
        }
    }
}

}  // namespace

std::vector<InfluenceSource> TerritoryScene::allSources() const {
    std::vector<InfluenceSource> all = sources;
    all.reserve(sources.size() + tokens.size());
    for (const auto& token : tokens) {
        all.push_back(tokenToSource(token, gridSize));
    }
    return all;
}

InfluenceSource tokenToSource(const TerritoryScene::Token& token, double gridSize) {
    const double footprintW = token.width * gridSize * token.scaleX;
    const double footprintH = token.height * gridSize * token.scaleY;

    InfluenceSource source{};
    source.x = token.x + 0.5 * footprintW;
    source.y = token.y + 0.5 * footprintH;
    source.radius = (token.range / 100.0) * gridSize;
    source.power = token.power;
    source.faction = token.faction;
    source.label = token.id;
    return source;
}

TerritoryScene parseSceneJson(const std::string& text, const std::string& origin) {
    const nlohmann::json json = nlohmann::json::parse(text);
    if (!json.is_object()) {
        throw std::runtime_error("Scene document must be a JSON object: " + origin);
    }

    TerritoryScene scene{};
    scene.version = json.value("version", std::string{});
    if (scene.version.empty()) {
        throw std::runtime_error("Scene JSON missing required field: version");
    }
    if (scene.version != "0.1") {
        throw std::runtime_error("Unsupported scene version: " + scene.version);
    }

    scene.gridSize = requirePositive("grid_size", json.value("grid_size", scene.gridSize));

    if (json.contains("options")) {
        parseOptions(json.at("options"), scene);
    }
    if (json.contains("factions")) {
        parseFactions(json.at("factions"), scene);
    }
    if (json.contains("sources")) {
        parseSources(json.at("sources"), scene);
    }
    if (json.contains("tokens")) {
        parseTokens(json.at("tokens"), scene);
    }
    if (json.contains("outputs")) {
        parseOutputs(json.at("outputs"), scene);
    }

    validateOptions(scene.options);
    return scene;
}

TerritoryScene loadSceneFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scene JSON: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parseSceneJson(buffer.str(), path);
}

}  // namespace territory
