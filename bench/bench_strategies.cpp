#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "arguments.hpp"
#include "automaton.hpp"

// Times each stepping strategy on random square grids of growing size.
int main(int argc, char* argv[])
{
    std::cout << "=== Life-like strategy benchmark ===" << "\n";

    std::size_t generations = 20;
    double probability = 0.3;
    std::unique_ptr<Rule> rule;

    try
    {
        rule = std::make_unique<Rule>(Rule::parse(argc >= 2 ? argv[1] : "B3/S23"));
        if (argc >= 3)
            generations = parseCount(argv[2], "generations");
        if (argc >= 4)
            probability = std::stod(argv[3]);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Usage: ./lifelike_bench [rule] [generations] [probability]\n";
        return 1;
    }

    const std::vector<std::size_t> sizes = {32, 100, 256, 512};
    const std::vector<Algorithm> algorithms = {
        ALGORITHM_DIRECT, ALGORITHM_CONVOLUTION, ALGORITHM_SPECTRAL};

    std::cout << "  rule:        " << rule->toString() << "\n";
    std::cout << "  generations: " << generations << "\n";
    std::cout << "  probability: " << probability << "\n\n";

    std::cout << std::left << std::setw(10) << "size";
    for (Algorithm a : algorithms)
        std::cout << std::right << std::setw(16) << (toString(a) + " [ms]");
    std::cout << "\n";

    for (std::size_t n : sizes)
    {
        std::mt19937 rng(42);
        std::unique_ptr<Grid> initial;
        try
        {
            initial = std::make_unique<Grid>(
                Grid::random(n, n, probability, rule->getMaxState(), rng));
        }
        catch (const std::exception& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        std::cout << std::left << std::setw(10)
                  << (std::to_string(n) + "x" + std::to_string(n));

        for (Algorithm a : algorithms)
        {
            auto automaton = makeAutomaton(a, *initial, *rule);

            const auto start = std::chrono::steady_clock::now();
            for (std::size_t t = 0; t < generations; ++t)
                automaton->step();
            const auto stop = std::chrono::steady_clock::now();

            const double ms =
                std::chrono::duration<double, std::milli>(stop - start).count();
            std::cout << std::right << std::setw(16) << std::fixed
                      << std::setprecision(2) << ms;
        }
        std::cout << "\n";
    }

    return 0;
}
