#pragma once

#include <cstdint>
#include <Eigen/Dense>
#include "grid.hpp"
#include "rule.hpp"

// Row-major views matching Grid's storage: rows are x, columns are y.
using CellArray  = Eigen::Array<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using CountArray = Eigen::Array<int,     Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using FlagArray  = Eigen::Array<bool,    Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// 3x3 adjacency kernel with a zero center; von Neumann also zeroes the
// corners.
Eigen::Matrix3i neighborKernel(NeighborMode mode);

// 1 where the cell equals maxState, 0 elsewhere.
CountArray aliveMask(const Grid& grid, uint8_t maxState);

// Birth, survival and decay applied to the whole grid at once, given the
// neighbor count of every cell.
void applyRule(const Grid& from, const CountArray& counts, const Rule& rule,
               Grid& to);
