#include "spectral.hpp"
#include <algorithm>
#include <cmath>

SpectralAutomaton::SpectralAutomaton(Grid initial, const Rule& rule)
    : Automaton(std::move(initial), rule),
      counts(Eigen::Index(numx()), Eigen::Index(numy()))
{
    const Eigen::Index rows = Eigen::Index(numx()) + 2;
    const Eigen::Index cols = Eigen::Index(numy()) + 2;

    lineIn.resize(std::size_t(std::max(rows, cols)));
    lineOut.resize(lineIn.size());

    // dimensions never change, so the kernel is transformed once
    kernelSpectrum = Eigen::MatrixXcd::Zero(rows, cols);
    kernelSpectrum.topLeftCorner(3, 3) =
        neighborKernel(rule.getNeighborMode()).cast<std::complex<double>>();
    transform(kernelSpectrum, false);

    workspace.resize(rows, cols);
}

// 2-D transform as 1-D transforms along columns, then rows.
void SpectralAutomaton::transform(Eigen::MatrixXcd& m, bool inverse)
{
    const Eigen::Index rows = m.rows();
    const Eigen::Index cols = m.cols();

    for (Eigen::Index j = 0; j < cols; ++j)
    {
        for (Eigen::Index i = 0; i < rows; ++i)
            lineIn[i] = m(i, j);
        if (inverse)
            fft.inv(lineOut.data(), lineIn.data(), rows);
        else
            fft.fwd(lineOut.data(), lineIn.data(), rows);
        for (Eigen::Index i = 0; i < rows; ++i)
            m(i, j) = lineOut[i];
    }

    for (Eigen::Index i = 0; i < rows; ++i)
    {
        for (Eigen::Index j = 0; j < cols; ++j)
            lineIn[j] = m(i, j);
        if (inverse)
            fft.inv(lineOut.data(), lineIn.data(), cols);
        else
            fft.fwd(lineOut.data(), lineIn.data(), cols);
        for (Eigen::Index j = 0; j < cols; ++j)
            m(i, j) = lineOut[j];
    }
}

const CountArray& SpectralAutomaton::neighborCounts(const Grid& grid)
{
    requireShape(grid);

    const Eigen::Index rows = Eigen::Index(grid.numx());
    const Eigen::Index cols = Eigen::Index(grid.numy());

    workspace.setZero();
    workspace.topLeftCorner(rows, cols) =
        aliveMask(grid, maxState()).cast<double>().cast<std::complex<double>>().matrix();

    transform(workspace, false);
    workspace = workspace.cwiseProduct(kernelSpectrum);
    transform(workspace, true);

    // full convolution is offset by the kernel center
    for (Eigen::Index x = 0; x < rows; ++x)
        for (Eigen::Index y = 0; y < cols; ++y)
            counts(x, y) = int(std::lround(workspace(x + 1, y + 1).real()));

    return counts;
}

void SpectralAutomaton::update(const Grid& from, Grid& to)
{
    applyRule(from, neighborCounts(from), rule(), to);
}
