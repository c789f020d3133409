#pragma once

#include <string>
#include "grid.hpp"

// Whitespace-separated integers, one grid row (one x) per line. Blank lines
// are skipped. Throws std::runtime_error naming the file on failure.
Grid loadGrid(const std::string& filename);
void saveGrid(const Grid& grid, const std::string& filename);
