#include "convolution.hpp"

ConvolutionAutomaton::ConvolutionAutomaton(Grid initial, const Rule& rule)
    : Automaton(std::move(initial), rule),
      kernel(neighborKernel(rule.getNeighborMode())),
      padded(CountArray::Zero(Eigen::Index(numx()) + 2, Eigen::Index(numy()) + 2)),
      counts(Eigen::Index(numx()), Eigen::Index(numy()))
{
}

const CountArray& ConvolutionAutomaton::neighborCounts(const Grid& grid)
{
    requireShape(grid);

    const Eigen::Index rows = Eigen::Index(grid.numx());
    const Eigen::Index cols = Eigen::Index(grid.numy());

    // border stays zero: outside cells add no votes
    padded.block(1, 1, rows, cols) = aliveMask(grid, maxState());

    counts.setZero();
    for (int dx = 0; dx < 3; ++dx)
        for (int dy = 0; dy < 3; ++dy)
            if (kernel(dx, dy) != 0)
                counts += kernel(dx, dy) * padded.block(dx, dy, rows, cols);

    return counts;
}

void ConvolutionAutomaton::update(const Grid& from, Grid& to)
{
    applyRule(from, neighborCounts(from), rule(), to);
}
