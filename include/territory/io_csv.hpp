// filename: io_csv.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <string>

#include "territory/grid.hpp"
#include "territory/territory.hpp"

namespace territory {

// Quotes a CSV field when it holds a comma, quote or newline; embedded quotes are doubled.
std::string csv_escape(const std::string& text);

// One row per grid node: x,y,faction,strength. Unclaimed nodes have an empty faction.
void write_csv_dominance_grid(const std::string& path, const DominanceGrid& grid);

// One row per loop vertex: faction,shape,ring,role,vertex,x,y with role "outer" or "hole".
void write_csv_loops(const std::string& path, const TerritoryResult& result);

}  // namespace territory
