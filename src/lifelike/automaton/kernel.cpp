#include "kernel.hpp"

Eigen::Matrix3i neighborKernel(NeighborMode mode)
{
    Eigen::Matrix3i k;
    if (mode == NEIGHBOR_MOORE)
        k << 1, 1, 1,
             1, 0, 1,
             1, 1, 1;
    else
        k << 0, 1, 0,
             1, 0, 1,
             0, 1, 0;
    return k;
}

CountArray aliveMask(const Grid& grid, uint8_t maxState)
{
    const Eigen::Map<const CellArray> cells(grid.raw().data(),
                                            Eigen::Index(grid.numx()),
                                            Eigen::Index(grid.numy()));
    return (cells == maxState).cast<int>();
}

void applyRule(const Grid& from, const CountArray& counts, const Rule& rule,
               Grid& to)
{
    const Eigen::Index rows = Eigen::Index(from.numx());
    const Eigen::Index cols = Eigen::Index(from.numy());
    const int alive = rule.getMaxState();

    const CountArray state =
        Eigen::Map<const CellArray>(from.raw().data(), rows, cols).cast<int>();

    const FlagArray born =
        counts.unaryExpr([&rule](int c) { return rule.born(c); });
    const FlagArray survives =
        counts.unaryExpr([&rule](int c) { return rule.survives(c); });
    const FlagArray active = born || ((state == alive) && survives);

    const CountArray decayed =
        (state > 0).select(state - 1, CountArray::Zero(rows, cols));

    Eigen::Map<CellArray>(to.raw().data(), rows, cols) =
        active.select(CountArray::Constant(rows, cols, alive), decayed)
              .cast<uint8_t>();
}
