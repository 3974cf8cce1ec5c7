// filename: io_csv.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/io_csv.hpp"

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace territory {
namespace {

void writeRing(std::ofstream& ofs, const FactionId& faction, std::size_t shape, std::size_t ring,
               const char* role, const std::vector<Point2>& points) {
    for (std::size_t v = 0; v < points.size(); ++v) {
        ofs << csv_escape(faction) << ',' << shape << ',' << ring << ',' << role << ',' << v << ','
            << points[v].x << ',' << points[v].y << '\n';
    }
}

}  // namespace

std::string csv_escape(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

void write_csv_dominance_grid(const std::string& path, const DominanceGrid& grid) {
    const std::size_t n = grid.nodeCount();
    if (grid.winner.size() != n || grid.strength.size() != n) {
        throw std::invalid_argument("write_csv_dominance_grid: grid arrays do not match node count");
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "x,y,faction,strength\n";
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            const int owner = grid.winner[p];
            ofs << grid.nodeX(i) << ',' << grid.nodeY(j) << ',';
            if (owner != DominanceGrid::kUnclaimed) {
                if (static_cast<std::size_t>(owner) >= grid.factions.size()) {
                    throw std::invalid_argument(
                        "write_csv_dominance_grid: winner index outside faction table");
                }
                ofs << csv_escape(grid.factions[static_cast<std::size_t>(owner)]);
            }
            ofs << ',' << grid.strength[p] << '\n';
        }
    }
}

void write_csv_loops(const std::string& path, const TerritoryResult& result) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "faction,shape,ring,role,vertex,x,y\n";
    for (const auto& territory : result.territories) {
        for (std::size_t s = 0; s < territory.shapes.size(); ++s) {
            const auto& shape = territory.shapes[s];
            writeRing(ofs, territory.faction, s, 0, "outer", shape.outerLoop);
            for (std::size_t h = 0; h < shape.holeLoops.size(); ++h) {
                writeRing(ofs, territory.faction, s, h + 1, "hole", shape.holeLoops[h]);
            }
        }
    }
}

}  // namespace territory
