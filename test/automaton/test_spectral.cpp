#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "spectral.hpp"
#include "neighbors.hpp"

using Rows = std::vector<std::vector<int>>;

Rows to_rows(const CountArray& counts) {
    Rows rows(counts.rows(), std::vector<int>(counts.cols()));
    for (Eigen::Index x = 0; x < counts.rows(); ++x)
        for (Eigen::Index y = 0; y < counts.cols(); ++y)
            rows[x][y] = counts(x, y);
    return rows;
}

Rows to_rows(const Grid& grid) {
    Rows rows(grid.numx(), std::vector<int>(grid.numy()));
    for (std::size_t x = 0; x < grid.numx(); ++x)
        for (std::size_t y = 0; y < grid.numy(); ++y)
            rows[x][y] = grid.at(x, y);
    return rows;
}

Rule life(NeighborMode mode, int maxState = 1) {
    return Rule(CountSpec::numbers({2, 3}), CountSpec::one(3), maxState, mode);
}

void test_counts_all_alive() {
    Grid grid(Rows{{1, 1, 1}, {1, 1, 1}, {1, 1, 1}});

    SpectralAutomaton moore(grid, life(NEIGHBOR_MOORE));
    assert(to_rows(moore.neighborCounts(grid)) == (Rows{{3, 5, 3}, {5, 8, 5}, {3, 5, 3}}));

    SpectralAutomaton vn(grid, life(NEIGHBOR_VON_NEUMANN));
    assert(to_rows(vn.neighborCounts(grid)) == (Rows{{2, 3, 2}, {3, 4, 3}, {2, 3, 2}}));
    std::cout << "PASSED: test_counts_all_alive\n";
}

// Rounded transform output equals exact per-cell counting, including
// awkward (prime, thin, single-cell) transform lengths.
void test_counts_match_direct_counting() {
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> state(0, 2);
    const std::vector<std::pair<std::size_t, std::size_t>> shapes = {
        {1, 1}, {1, 7}, {7, 1}, {2, 2}, {13, 17}, {31, 5}, {48, 50}};

    for (auto mode : {NEIGHBOR_MOORE, NEIGHBOR_VON_NEUMANN}) {
        const Rule rule = life(mode, 2);
        for (const auto& shape : shapes) {
            Grid grid(shape.first, shape.second);
            for (auto& c : grid.raw()) c = static_cast<uint8_t>(state(rng));

            SpectralAutomaton fft(grid, rule);
            const CountArray& counts = fft.neighborCounts(grid);
            assert(std::size_t(counts.rows()) == grid.numx());
            assert(std::size_t(counts.cols()) == grid.numy());
            for (std::size_t x = 0; x < grid.numx(); ++x)
                for (std::size_t y = 0; y < grid.numy(); ++y)
                    assert(counts(x, y) == countLivingNeighbors(grid, x, y, rule));
        }
    }
    std::cout << "PASSED: test_counts_match_direct_counting\n";
}

void test_standard_rule_all_alive() {
    SpectralAutomaton gol(Grid(Rows{{1, 1, 1}, {1, 1, 1}, {1, 1, 1}}), Rule::standard());
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{1, 0, 1}, {0, 0, 0}, {1, 0, 1}}));
    std::cout << "PASSED: test_standard_rule_all_alive\n";
}

void test_empty_grid_stays_empty() {
    SpectralAutomaton gol(Grid(20, 20), Rule::standard());
    for (int i = 0; i < 3; ++i) {
        gol.step();
        assert(gol.grid().countAlive(0) == 400);
    }
    std::cout << "PASSED: test_empty_grid_stays_empty\n";
}

void test_full_grid() {
    // every count from 3 (corner) to 8 (interior) appears
    Grid grid(Rows(9, std::vector<int>(9, 1)));
    SpectralAutomaton gol(grid, Rule::standard());
    gol.step();
    Rows next = to_rows(gol.grid());
    assert(next[0][0] == 1 && next[0][8] == 1 && next[8][0] == 1 && next[8][8] == 1);
    assert(gol.grid().countAlive(1) == 4);
    assert(std::string(gol.name()) == "fft");
    std::cout << "PASSED: test_full_grid\n";
}

void test_glider_evolution() {
    Grid start(12, 12);
    Grid moved(12, 12);
    for (const auto& p : std::vector<std::pair<int, int>>{{1, 2}, {2, 3}, {3, 1}, {3, 2}, {3, 3}}) {
        start.set(p.first, p.second, 1);
        moved.set(p.first + 1, p.second + 1, 1);
    }
    SpectralAutomaton gol(start, Rule::standard());
    for (int i = 0; i < 4; ++i)
        gol.step();
    assert(gol.grid() == moved);
    std::cout << "PASSED: test_glider_evolution\n";
}

void test_rejects_other_grid_sizes() {
    SpectralAutomaton engine(Grid(4, 4), Rule::standard());
    for (const auto& shape : std::vector<std::pair<std::size_t, std::size_t>>{{8, 8}, {2, 2}, {4, 5}}) {
        bool threw = false;
        try {
            engine.neighborCounts(Grid(shape.first, shape.second));
        } catch (const GridDimensionError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        Grid to(shape.first, shape.second);
        try {
            engine.computeNextGeneration(engine.grid(), to);
        } catch (const GridDimensionError&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "PASSED: test_rejects_other_grid_sizes\n";
}

int main() {
    test_counts_all_alive();
    test_counts_match_direct_counting();
    test_standard_rule_all_alive();
    test_empty_grid_stays_empty();
    test_full_grid();
    test_glider_evolution();
    test_rejects_other_grid_sizes();

    std::cout << "\nAll spectral tests passed!\n";
    return 0;
}
