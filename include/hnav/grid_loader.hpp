// grid_loader.hpp
//
// Reads occupancy grids from comma-separated map files.
//
// Cell codes: 0 free, 1 occupied, 2 visited, 3 start, 4 goal. Every non-blank
// line is one row and all rows must have the same number of cells.

#ifndef HNAV_GRID_LOADER_HPP_
#define HNAV_GRID_LOADER_HPP_

#include <istream>
#include <string>

#include "hnav/grid.hpp"

namespace hnav {

// Throws GridFormatError if the file cannot be opened or is malformed.
Grid load_grid_csv(const std::string& path);

// `source` names the input in error messages.
Grid parse_grid_csv(std::istream& input, const std::string& source = "<stream>");

}  // namespace hnav

#endif  // HNAV_GRID_LOADER_HPP_
