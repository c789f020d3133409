#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "grid.hpp"
#include "rule.hpp"

// ---- Automaton ---- //
// Owns the rule and a double-buffered pair of grids. Each step writes the
// next generation into the inactive buffer and then swaps, so readers only
// ever see a complete generation.
class Automaton {
private:
    Rule rules;
    Grid current;
    Grid next;
    std::uint64_t generations{0};

public:
    Automaton(Grid initial, const Rule& rule);
    virtual ~Automaton() = default;

    Automaton(const Automaton&) = delete;
    Automaton& operator=(const Automaton&) = delete;

    // Advances exactly one generation.
    void step();

    // Writes the successor of `from` into `to` without publishing it. Both
    // must be distinct grids of this automaton's dimensions, otherwise
    // GridDimensionError / std::invalid_argument.
    void computeNextGeneration(const Grid& from, Grid& to);

    virtual const char* name() const noexcept = 0;

    // ---- Accessors ---- //
    std::optional<uint8_t> cell(std::size_t x, std::size_t y) const {
        return current.cell(x, y);
    }
    std::size_t numx() const noexcept { return current.numx(); }
    std::size_t numy() const noexcept { return current.numy(); }
    uint8_t maxState() const noexcept { return rules.getMaxState(); }

    const Grid& grid() const noexcept { return current; }
    const Rule& rule() const noexcept { return rules; }
    std::uint64_t generation() const noexcept { return generations; }

protected:
    // Successor of `from` into `to`; both already have this automaton's
    // dimensions. Must not read `to`.
    virtual void update(const Grid& from, Grid& to) = 0;

    // GridDimensionError unless `g` has this automaton's dimensions.
    void requireShape(const Grid& g) const;
};

// ---- Strategy selection ---- //
enum Algorithm : uint8_t {
    ALGORITHM_DIRECT = 0,
    ALGORITHM_CONVOLUTION = 1,
    ALGORITHM_SPECTRAL = 2
};

Algorithm parseAlgorithm(const std::string& text);
std::string toString(Algorithm algorithm);

std::unique_ptr<Automaton> makeAutomaton(Algorithm algorithm,
                                         Grid initial,
                                         const Rule& rule);
