// filename: io_vtk.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/io_vtk.hpp"

#include "territory/io_csv.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace territory {
namespace {

bool isLittleEndian() {
    const std::uint16_t value = 1;
    return reinterpret_cast<const std::uint8_t*>(&value)[0] == 1;
}

VtkOutlineLoop makeLoop(VtkOutlineLoop::Kind kind, std::string label, std::string groupLabel,
                        int factionIndex, const std::vector<Point2>& points) {
    VtkOutlineLoop loop{};
    loop.kind = kind;
    loop.label = std::move(label);
    loop.groupLabel = std::move(groupLabel);
    loop.factionIndex = factionIndex;
    loop.xs.reserve(points.size());
    loop.ys.reserve(points.size());
    for (const auto& p : points) {
        loop.xs.push_back(p.x);
        loop.ys.push_back(p.y);
    }
    return loop;
}

}  // namespace

void write_vti_dominance_map(const std::string& path, const DominanceGrid& grid) {
    const std::size_t nodeCount = grid.nodeCount();
    if (grid.nx < 2 || grid.ny < 2) {
        throw std::invalid_argument("VTK export requires at least a 2x2 grid");
    }
    if (grid.strength.size() != nodeCount || grid.winner.size() != nodeCount) {
        throw std::invalid_argument("VTK export requires node-aligned dominance arrays");
    }

    std::vector<std::int32_t> winner(nodeCount);
    for (std::size_t p = 0; p < nodeCount; ++p) {
        winner[p] = static_cast<std::int32_t>(grid.winner[p]);
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    const std::uint64_t strengthBytes = static_cast<std::uint64_t>(nodeCount) * sizeof(double);
    const std::uint64_t winnerBytes = static_cast<std::uint64_t>(nodeCount) * sizeof(std::int32_t);

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"ImageData\" version=\"0.1\" byte_order=\""
        << (isLittleEndian() ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <ImageData WholeExtent=\"0 " << (grid.nx - 1) << " 0 " << (grid.ny - 1) << " 0 0\""
        << " Origin=\"" << grid.originX << ' ' << grid.originY << " 0\""
        << " Spacing=\"" << grid.cellSize << ' ' << grid.cellSize << " 1\">\n";
    ofs << "    <Piece Extent=\"0 " << (grid.nx - 1) << " 0 " << (grid.ny - 1) << " 0 0\">\n";
    ofs << "      <PointData Scalars=\"strength\">\n";
    ofs << "        <DataArray type=\"Float64\" Name=\"strength\" format=\"appended\" offset=\"0\"/>\n";
    ofs << "        <DataArray type=\"Int32\" Name=\"winner\" format=\"appended\" offset=\""
        << (sizeof(std::uint64_t) + strengthBytes) << "\"/>\n";
    ofs << "      </PointData>\n";
    ofs << "    </Piece>\n";
    ofs << "  </ImageData>\n";
    ofs << "  <AppendedData encoding=\"raw\">\n";
    ofs << '_';
    ofs.write(reinterpret_cast<const char*>(&strengthBytes), sizeof(strengthBytes));
    ofs.write(reinterpret_cast<const char*>(grid.strength.data()),
              static_cast<std::streamsize>(strengthBytes));
    ofs.write(reinterpret_cast<const char*>(&winnerBytes), sizeof(winnerBytes));
    ofs.write(reinterpret_cast<const char*>(winner.data()), static_cast<std::streamsize>(winnerBytes));
    ofs << "\n";
    ofs << "  </AppendedData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }
}

void write_vtp_outlines(const std::string& path, const std::vector<VtkOutlineLoop>& loops) {
    std::size_t pointCount = 0;
    for (const auto& loop : loops) {
        if (loop.xs.size() != loop.ys.size()) {
            throw std::invalid_argument("Outline loop '" + loop.label +
                                        "' has mismatched coordinate arrays");
        }
        if (loop.xs.size() < 3) {
            throw std::invalid_argument("Outline loop '" + loop.label + "' has fewer than 3 points");
        }
        pointCount += loop.xs.size();
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"PolyData\" version=\"0.1\" byte_order=\""
        << (isLittleEndian() ? "LittleEndian" : "BigEndian") << "\">\n";
    ofs << "  <PolyData>\n";
    ofs << "    <Piece NumberOfPoints=\"" << pointCount << "\" NumberOfVerts=\"0\" NumberOfLines=\""
        << loops.size() << "\" NumberOfStrips=\"0\" NumberOfPolys=\"0\">\n";

    ofs << "      <Points>\n";
    ofs << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (const auto& loop : loops) {
        for (std::size_t k = 0; k < loop.xs.size(); ++k) {
            ofs << "          " << loop.xs[k] << ' ' << loop.ys[k] << " 0\n";
        }
    }
    ofs << "        </DataArray>\n";
    ofs << "      </Points>\n";

    // Each loop is a polyline that repeats its first point to close.
    ofs << "      <Lines>\n";
    ofs << "        <DataArray type=\"Int64\" Name=\"connectivity\" format=\"ascii\">\n";
    std::size_t base = 0;
    for (const auto& loop : loops) {
        ofs << "         ";
        for (std::size_t k = 0; k < loop.xs.size(); ++k) {
            ofs << ' ' << (base + k);
        }
        ofs << ' ' << base << '\n';
        base += loop.xs.size();
    }
    ofs << "        </DataArray>\n";
    ofs << "        <DataArray type=\"Int64\" Name=\"offsets\" format=\"ascii\">\n";
    std::size_t offset = 0;
    for (const auto& loop : loops) {
        offset += loop.xs.size() + 1;
        ofs << "          " << offset << '\n';
    }
    ofs << "        </DataArray>\n";
    ofs << "      </Lines>\n";

    ofs << "      <CellData Scalars=\"kind\">\n";
    ofs << "        <DataArray type=\"Int32\" Name=\"kind\" format=\"ascii\">\n";
    for (const auto& loop : loops) {
        ofs << "          " << static_cast<int>(loop.kind) << '\n';
    }
    ofs << "        </DataArray>\n";
    ofs << "        <DataArray type=\"Int32\" Name=\"faction_index\" format=\"ascii\">\n";
    for (const auto& loop : loops) {
        ofs << "          " << loop.factionIndex << '\n';
    }
    ofs << "        </DataArray>\n";
    ofs << "      </CellData>\n";
    ofs << "    </Piece>\n";
    ofs << "  </PolyData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }

    std::filesystem::path labelsPath(path);
    labelsPath.replace_filename(labelsPath.stem().string() + "_labels.csv");
    std::ofstream labels(labelsPath);
    if (!labels.is_open()) {
        throw std::runtime_error("Failed to open outline label CSV: " + labelsPath.string());
    }
    labels << "index,kind,faction_index,label,group\n";
    for (std::size_t i = 0; i < loops.size(); ++i) {
        labels << i << ',' << static_cast<int>(loops[i].kind) << ',' << loops[i].factionIndex << ','
               << csv_escape(loops[i].label) << ',' << csv_escape(loops[i].groupLabel) << '\n';
    }
    labels.flush();
    if (!labels) {
        throw std::runtime_error("Failed while writing outline label CSV: " + labelsPath.string());
    }
}

std::vector<VtkOutlineLoop> collectOutlineLoops(const TerritoryResult& result) {
    std::vector<VtkOutlineLoop> loops;
    std::unordered_map<FactionId, int> factionIndex;
    for (std::size_t t = 0; t < result.territories.size(); ++t) {
        const auto& territory = result.territories[t];
        const int index = static_cast<int>(t);
        factionIndex[territory.faction] = index;
        for (std::size_t s = 0; s < territory.shapes.size(); ++s) {
            const auto& shape = territory.shapes[s];
            const std::string label = territory.faction + "/" + std::to_string(s);
            loops.push_back(makeLoop(VtkOutlineLoop::Kind::Fill, label, territory.faction, index,
                                     shape.outerLoop));
            for (std::size_t h = 0; h < shape.holeLoops.size(); ++h) {
                loops.push_back(makeLoop(VtkOutlineLoop::Kind::Hole,
                                         label + "/hole" + std::to_string(h), territory.faction,
                                         index, shape.holeLoops[h]));
            }
        }
    }
    for (const auto& circle : result.debugCircles) {
        const auto it = factionIndex.find(circle.faction);
        const int index = it == factionIndex.end() ? -1 : it->second;
        loops.push_back(makeLoop(VtkOutlineLoop::Kind::DebugCircle, circle.label, circle.faction,
                                 index, circle.outline));
    }
    return loops;
}

}  // namespace territory
