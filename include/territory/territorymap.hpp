// filename: territorymap.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include "color.hpp"
#include "contour.hpp"
#include "grid.hpp"
#include "hierarchy.hpp"
#include "territory.hpp"
#include "types.hpp"
