#pragma once

#include "automaton.hpp"
#include "kernel.hpp"

// Convolves the alive mask with the adjacency kernel over a zero-padded
// border, then applies the rule to the whole grid at once.
class ConvolutionAutomaton : public Automaton {
private:
    Eigen::Matrix3i kernel;
    CountArray padded;
    CountArray counts;

public:
    ConvolutionAutomaton(Grid initial, const Rule& rule);

    const char* name() const noexcept override { return "convolution"; }

    // Neighbor count of every cell of `grid`.
    const CountArray& neighborCounts(const Grid& grid);

protected:
    void update(const Grid& from, Grid& to) override;
};
