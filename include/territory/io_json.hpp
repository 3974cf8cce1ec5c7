// filename: io_json.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <string>

#include "territory/territory.hpp"

namespace territory {

// Shape hand-off document: territories with their color, outer loops and holes, optional
// debug circles, source markers and compute statistics.
std::string serialize_territories_json(const TerritoryResult& result, int indent = 2);

void write_shapes_json(const std::string& path, const TerritoryResult& result, int indent = 2);

}  // namespace territory
