#include <iostream>
#include <new>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "arguments.hpp"
#include "automaton.hpp"
#include "grid_io.hpp"

namespace {

void printUsage()
{
    std::cerr << "Usage:\n";
    std::cerr << "./lifelike_sim algorithm rule numx numy probability generations [seed] [output_grid]\n";
    std::cerr << "or\n";
    std::cerr << "./lifelike_sim algorithm rule --input initial_grid.txt generations [output_grid]\n";
    std::cerr << "\n";
    std::cerr << "  algorithm: standard | convolution | fft\n";
    std::cerr << "  rule:      e.g. B3/S23, B2/S/C5, B3/S23V\n";
}

} // namespace

int main(int argc, char* argv[])
{
    std::cout << "=== Life-like Cellular Automaton ===" << "\n";

    if (argc < 6)
    {
        std::cerr << "Insufficient arguments provided. ";
        printUsage();
        return 1;
    }

    Algorithm algorithm = ALGORITHM_CONVOLUTION;
    std::unique_ptr<Rule> rule;
    std::unique_ptr<Grid> initial;
    std::size_t generations = 0;
    std::string output_grid = "final_grid.txt";

    try
    {
        algorithm = parseAlgorithm(argv[1]);
        rule = std::make_unique<Rule>(Rule::parse(argv[2]));

        if (std::string(argv[3]) == "--input")
        {
            initial = std::make_unique<Grid>(loadGrid(argv[4]));
            generations = parseCount(argv[5], "generations");
            if (argc >= 7)
                output_grid = argv[6];

            std::cout << "Loaded grid: " << initial->numx() << " x "
                      << initial->numy() << "\n";
        }
        else
        {
            if (argc < 7)
            {
                std::cerr << "Insufficient arguments provided. ";
                printUsage();
                return 1;
            }

            const std::size_t numx = parseCount(argv[3], "numx");
            const std::size_t numy = parseCount(argv[4], "numy");
            const double probability = std::stod(argv[5]);
            generations = parseCount(argv[6], "generations");

            std::mt19937 rng;
            if (argc >= 8)
                rng.seed(static_cast<std::mt19937::result_type>(parseCount(argv[7], "seed")));
            else
                rng.seed(std::random_device{}());
            if (argc >= 9)
                output_grid = argv[8];

            initial = std::make_unique<Grid>(
                Grid::random(numx, numy, probability, rule->getMaxState(), rng));

            std::cout << "Random grid: " << numx << " x " << numy
                      << " (p = " << probability << ")\n";
        }
    }
    catch (const std::logic_error& e)
    {
        // parseCount / std::stod and argument validation
        std::cerr << "Invalid argument: " << e.what() << "\n";
        printUsage();
        return 1;
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::bad_alloc&)
    {
        std::cerr << "Error: not enough memory for the requested grid\n";
        return 1;
    }

    std::cout << "\nParameters:" << std::endl;
    std::cout << "  algorithm:   " << toString(algorithm) << std::endl;
    std::cout << "  rule:        " << rule->toString() << std::endl;
    std::cout << "  neighbors:   " << toString(rule->getNeighborMode()) << std::endl;
    std::cout << "  max state:   " << int(rule->getMaxState()) << std::endl;
    std::cout << "  generations: " << generations << std::endl;
    std::cout << std::endl;

    std::unique_ptr<Automaton> automaton;
    try
    {
        automaton = makeAutomaton(algorithm, *initial, *rule);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Generation 0: "
              << automaton->grid().countAlive(automaton->maxState()) << " alive\n";
    for (std::size_t t = 0; t < generations; ++t)
    {
        automaton->step();
        std::cout << "Generation " << automaton->generation() << ": "
                  << automaton->grid().countAlive(automaton->maxState())
                  << " alive\n";
    }

    try
    {
        saveGrid(automaton->grid(), output_grid);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "Saved final grid to: " << output_grid << "\n";

    std::cout << "\nSimulation complete!" << std::endl;
    return 0;
}
