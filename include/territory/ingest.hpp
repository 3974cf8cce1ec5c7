// filename: ingest.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "territory/field.hpp"
#include "territory/territory.hpp"
#include "territory/types.hpp"

namespace territory {

struct TerritoryScene {
    // Placed map object in scene units; range is grid units x 100.
    struct Token {
        std::string id;
        double x{0.0};
        double y{0.0};
        double width{1.0};
        double height{1.0};
        double scaleX{1.0};
        double scaleY{1.0};
        double range{0.0};
        double power{1.0};
        FactionId faction;
    };

    struct Outputs {
        struct ShapesJson {
            std::string id;
            std::string path;
            int indent{2};
        };

        struct OutlinesVtp {
            std::string id;
            std::string path;
        };

        struct LoopsCsv {
            std::string id;
            std::string path;
        };

        struct DominanceMap {
            std::string id;
            std::string path;
            std::string format;  // "csv" or "vti"
        };

        std::vector<ShapesJson> shapesJson;
        std::vector<OutlinesVtp> outlinesVtp;
        std::vector<LoopsCsv> loopsCsv;
        std::vector<DominanceMap> dominanceMaps;
    };

    std::string version;
    double gridSize{100.0};
    TerritoryOptions options;
    bool quietSpecified{false};
    bool quiet{false};
    std::vector<InfluenceSource> sources;
    std::vector<Token> tokens;
    Outputs outputs;

    // Direct sources followed by converted tokens.
    [[nodiscard]] std::vector<InfluenceSource> allSources() const;
};

/**
 * @brief Influence source of a placed token: centre of its footprint, radius range / 100 *
 *        gridSize.
 */
InfluenceSource tokenToSource(const TerritoryScene::Token& token, double gridSize);

TerritoryScene parseSceneJson(const std::string& text, const std::string& origin = "<string>");

TerritoryScene loadSceneFromJson(const std::string& path);

}  // namespace territory
