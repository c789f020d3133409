#include "automaton.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>
#include "direct.hpp"
#include "convolution.hpp"
#include "spectral.hpp"

Automaton::Automaton(Grid initial, const Rule& rule)
    : rules(rule),
      current(std::move(initial)),
      next(current.numx(), current.numy())
{
    if (current.maxValue() > rules.getMaxState())
        throw std::invalid_argument(
            "initial grid holds state " + std::to_string(current.maxValue()) +
            " above maxState " + std::to_string(rules.getMaxState()));
}

void Automaton::step()
{
    update(current, next);
    current.swap(next);
    ++generations;
}

void Automaton::computeNextGeneration(const Grid& from, Grid& to)
{
    requireShape(from);
    requireShape(to);
    if (&from == &to)
        throw std::invalid_argument("next generation cannot overwrite its source");

    update(from, to);
}

void Automaton::requireShape(const Grid& g) const
{
    if (g.numx() != current.numx() || g.numy() != current.numy())
        throw GridDimensionError(
            "Grid of " + std::to_string(g.numx()) + " x " + std::to_string(g.numy()) +
            " does not match automaton of " + std::to_string(current.numx()) +
            " x " + std::to_string(current.numy()));
}

Algorithm parseAlgorithm(const std::string& text)
{
    std::string key;
    for (char c : text)
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (key == "std" || key == "standard" || key == "direct")
        return ALGORITHM_DIRECT;
    if (key == "conv" || key == "convolution")
        return ALGORITHM_CONVOLUTION;
    if (key == "fft" || key == "spectral")
        return ALGORITHM_SPECTRAL;

    throw std::invalid_argument("unknown algorithm '" + text +
                                "' (expected standard, convolution or fft)");
}

std::string toString(Algorithm algorithm)
{
    switch (algorithm)
    {
        case ALGORITHM_DIRECT:      return "standard";
        case ALGORITHM_CONVOLUTION: return "convolution";
        case ALGORITHM_SPECTRAL:    return "fft";
    }
    return "unknown";
}

std::unique_ptr<Automaton> makeAutomaton(Algorithm algorithm,
                                         Grid initial,
                                         const Rule& rule)
{
    switch (algorithm)
    {
        case ALGORITHM_DIRECT:
            return std::make_unique<DirectAutomaton>(std::move(initial), rule);
        case ALGORITHM_CONVOLUTION:
            return std::make_unique<ConvolutionAutomaton>(std::move(initial), rule);
        case ALGORITHM_SPECTRAL:
            return std::make_unique<SpectralAutomaton>(std::move(initial), rule);
    }
    throw std::invalid_argument("unknown algorithm");
}
