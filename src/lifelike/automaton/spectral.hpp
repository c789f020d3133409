#pragma once

#include <complex>
#include <vector>
#include <unsupported/Eigen/FFT>
#include "automaton.hpp"
#include "kernel.hpp"

// Same convolution as ConvolutionAutomaton, evaluated as a product in the
// Fourier domain. Both operands are zero-padded to (numx + 2) x (numy + 2)
// so the circular convolution equals the linear one.
class SpectralAutomaton : public Automaton {
private:
    Eigen::FFT<double> fft;
    Eigen::MatrixXcd kernelSpectrum;
    Eigen::MatrixXcd workspace;
    std::vector<std::complex<double>> lineIn, lineOut;
    CountArray counts;

    void transform(Eigen::MatrixXcd& m, bool inverse);

public:
    SpectralAutomaton(Grid initial, const Rule& rule);

    const char* name() const noexcept override { return "fft"; }

    // Neighbor count of every cell of `grid`, rounded to the nearest integer.
    const CountArray& neighborCounts(const Grid& grid);

protected:
    void update(const Grid& from, Grid& to) override;
};
