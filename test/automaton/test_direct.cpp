#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "direct.hpp"

using Rows = std::vector<std::vector<int>>;

Rows to_rows(const Grid& grid) {
    Rows rows(grid.numx(), std::vector<int>(grid.numy()));
    for (std::size_t x = 0; x < grid.numx(); ++x)
        for (std::size_t y = 0; y < grid.numy(); ++y)
            rows[x][y] = grid.at(x, y);
    return rows;
}

Grid with_cells(std::size_t numx, std::size_t numy,
                const std::vector<std::pair<int, int>>& alive, uint8_t state = 1) {
    Grid grid(numx, numy);
    for (const auto& p : alive)
        grid.set(p.first, p.second, state);
    return grid;
}

void test_standard_rule_all_alive() {
    DirectAutomaton gol(Grid(Rows{{1, 1, 1}, {1, 1, 1}, {1, 1, 1}}), Rule::standard());
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{1, 0, 1}, {0, 0, 0}, {1, 0, 1}}));
    std::cout << "PASSED: test_standard_rule_all_alive\n";
}

// Cells that lose the survival condition decay one state instead of dying.
void test_two_step_decay_all_alive() {
    const Rule rule(CountSpec::numbers({2, 3}), CountSpec::one(3), 2, NEIGHBOR_MOORE);
    DirectAutomaton gol(Grid(Rows{{2, 2, 2}, {2, 2, 2}, {2, 2, 2}}), rule);
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{2, 1, 2}, {1, 1, 1}, {2, 1, 2}}));
    std::cout << "PASSED: test_two_step_decay_all_alive\n";
}

void test_block_is_still_life() {
    Grid block = with_cells(6, 6, {{2, 2}, {2, 3}, {3, 2}, {3, 3}});
    DirectAutomaton gol(block, Rule::standard());
    for (int gen = 1; gen <= 5; ++gen) {
        gol.step();
        assert(gol.grid() == block);
    }

    // large enough to run in parallel
    Grid big = with_cells(64, 64, {{30, 30}, {30, 31}, {31, 30}, {31, 31},
                                   {0, 0}, {0, 1}, {1, 0}, {1, 1}});
    DirectAutomaton parallel(big, Rule::standard());
    parallel.step();
    assert(parallel.grid() == big);
    std::cout << "PASSED: test_block_is_still_life\n";
}

// Gen 0:  .....   Gen 1:  .....
//         .....           ..o..
//         .ooo.           ..o..
//         .....           ..o..
void test_blinker_oscillation() {
    Grid horizontal = with_cells(5, 5, {{2, 1}, {2, 2}, {2, 3}});
    Grid vertical = with_cells(5, 5, {{1, 2}, {2, 2}, {3, 2}});
    DirectAutomaton gol(horizontal, Rule::standard());

    gol.step();
    assert(gol.grid() == vertical);
    gol.step();
    assert(gol.grid() == horizontal);
    assert(gol.generation() == 2);
    std::cout << "PASSED: test_blinker_oscillation\n";
}

// .o.
// ..o  moves one cell down and right every four generations
// ooo
void test_glider_evolution() {
    Grid start = with_cells(10, 10, {{1, 2}, {2, 3}, {3, 1}, {3, 2}, {3, 3}});
    Grid moved = with_cells(10, 10, {{2, 3}, {3, 4}, {4, 2}, {4, 3}, {4, 4}});
    DirectAutomaton gol(start, Rule::standard());
    for (int i = 0; i < 4; ++i) {
        gol.step();
        assert(gol.grid().countAlive(1) == 5);
    }
    assert(gol.grid() == moved);
    std::cout << "PASSED: test_glider_evolution\n";
}

void test_decay_countdown() {
    // nothing survives, nothing is born
    const Rule rule(CountSpec(), CountSpec(), 4, NEIGHBOR_MOORE);
    DirectAutomaton gol(with_cells(3, 3, {{1, 1}}, 4), rule);

    for (int expected : {3, 2, 1, 0, 0, 0}) {
        gol.step();
        assert(*gol.cell(1, 1) == expected);
        assert(gol.grid().countAlive(0) == 8 + (expected == 0 ? 1 : 0));
    }
    std::cout << "PASSED: test_decay_countdown\n";
}

// Dead is absorbing until a birth count re-activates the cell.
void test_birth_reactivates_dead_cells() {
    const Rule rule(CountSpec(), CountSpec::one(2), 2, NEIGHBOR_MOORE);
    DirectAutomaton gol(Grid(Rows{{2, 0, 2, 0, 0}}), rule);

    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{1, 2, 1, 0, 0}}));
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{0, 1, 0, 0, 0}}));
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{0, 0, 0, 0, 0}}));
    gol.step();
    assert(to_rows(gol.grid()) == (Rows{{0, 0, 0, 0, 0}}));
    std::cout << "PASSED: test_birth_reactivates_dead_cells\n";
}

void test_accessors() {
    const Rule rule = Rule::parse("B3/S23/C5");
    DirectAutomaton gol(Grid(3, 7), rule);
    assert(gol.numx() == 3);
    assert(gol.numy() == 7);
    assert(gol.maxState() == 4);
    assert(gol.generation() == 0);
    assert(gol.rule() == rule);
    assert(gol.cell(2, 6).has_value());
    assert(!gol.cell(3, 0).has_value());
    assert(!gol.cell(0, 7).has_value());
    assert(std::string(gol.name()) == "standard");
    gol.step();
    assert(gol.generation() == 1);
    std::cout << "PASSED: test_accessors\n";
}

void test_rejects_states_above_max() {
    bool threw = false;
    try {
        DirectAutomaton gol(Grid(Rows{{0, 3}}), Rule::parse("B3/S23/C3"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED: test_rejects_states_above_max\n";
}

// The destination buffer's old contents never leak into the result.
void test_ignores_destination_contents() {
    Grid from(Rows{{0, 1, 0}, {0, 1, 0}, {0, 1, 0}});
    DirectAutomaton gol(from, Rule::standard());

    Grid clean(3, 3);
    Grid dirty(Rows{{7, 7, 7}, {7, 7, 7}, {7, 7, 7}});
    gol.computeNextGeneration(from, clean);
    gol.computeNextGeneration(from, dirty);
    assert(clean == dirty);
    assert(to_rows(clean) == (Rows{{0, 0, 0}, {1, 1, 1}, {0, 0, 0}}));
    std::cout << "PASSED: test_ignores_destination_contents\n";
}

// Grids of another size, or the source reused as destination, are rejected
// before anything is written.
void test_rejects_mismatched_buffers() {
    DirectAutomaton gol(Grid(4, 4), Rule::standard());
    Grid big(8, 8);
    Grid small(2, 2);
    Grid ok(4, 4);

    bool threw = false;
    try {
        gol.computeNextGeneration(big, small);
    } catch (const GridDimensionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        gol.computeNextGeneration(ok, small);
    } catch (const GridDimensionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        gol.computeNextGeneration(big, ok);
    } catch (const GridDimensionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        gol.computeNextGeneration(ok, ok);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(gol.generation() == 0);
    std::cout << "PASSED: test_rejects_mismatched_buffers\n";
}

int main() {
    test_standard_rule_all_alive();
    test_two_step_decay_all_alive();
    test_block_is_still_life();
    test_blinker_oscillation();
    test_glider_evolution();
    test_decay_countdown();
    test_birth_reactivates_dead_cells();
    test_accessors();
    test_rejects_states_above_max();
    test_ignores_destination_contents();
    test_rejects_mismatched_buffers();

    std::cout << "\nAll direct update tests passed!\n";
    return 0;
}
