#pragma once

#include <cstddef>
#include "grid.hpp"
#include "rule.hpp"

// Number of in-bounds neighbors of (x, y) whose state equals the rule's
// maxState. Cells outside the grid are omitted, never wrapped.
int countLivingNeighbors(const Grid& grid, std::size_t x, std::size_t y,
                         const Rule& rule);
