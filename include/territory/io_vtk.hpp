// filename: io_vtk.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <string>
#include <vector>

#include "territory/grid.hpp"
#include "territory/territory.hpp"

namespace territory {

struct VtkOutlineLoop {
    enum class Kind : int {
        Fill = 0,
        Hole = 1,
        DebugCircle = 2,
    };

    Kind kind{Kind::Fill};
    std::string label;
    std::string groupLabel;
    int factionIndex{-1};
    std::vector<double> xs;
    std::vector<double> ys;
};

// Writes a VTK ImageData (.vti) map of the dominance grid. Point data holds the
// winning `strength` (Float64) and the `winner` faction index (Int32, -1 when unclaimed)
// for every node, matching the node layout of DominanceGrid.
void write_vti_dominance_map(const std::string& path, const DominanceGrid& grid);

// Emits a VTK PolyData (.vtp) file of closed polyline outlines. Each loop carries
// `kind` and `faction_index` cell data. A companion `<stem>_labels.csv` maps the
// loop index to its label and group label.
void write_vtp_outlines(const std::string& path, const std::vector<VtkOutlineLoop>& loops);

// Flattens territories (fills and holes) and debug circles into outline loops. Faction
// indices follow the order of result.territories; label is "<faction>/<shape>".
std::vector<VtkOutlineLoop> collectOutlineLoops(const TerritoryResult& result);

}  // namespace territory
