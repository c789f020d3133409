#include "grid.hpp"
#include <algorithm>
#include <limits>

namespace {

// numx * numy, or GridDimensionError when either is zero or the product
// does not fit in size_t.
std::size_t cellCount(std::size_t numx, std::size_t numy)
{
    if (numx == 0 || numy == 0)
        throw GridDimensionError("Grid must be non-empty");

    if (numx > std::numeric_limits<std::size_t>::max() / numy)
        throw GridDimensionError(
            "Grid of " + std::to_string(numx) + " x " + std::to_string(numy) +
            " has too many cells");

    return numx * numy;
}

} // namespace

Grid::Grid(std::size_t numx, std::size_t numy)
    : nx(numx),
      ny(numy),
      data(cellCount(numx, numy), 0)
{
}

Grid::Grid(std::size_t numx, std::size_t numy, std::vector<uint8_t> cells)
    : nx(numx),
      ny(numy),
      data(std::move(cells))
{
    if (data.size() != cellCount(nx, ny))
        throw GridDimensionError(
            "Grid of " + std::to_string(nx) + " x " + std::to_string(ny) +
            " cannot hold " + std::to_string(data.size()) + " cells");
}

Grid::Grid(const std::vector<std::vector<int>>& rows)
    : nx(rows.size()),
      ny(rows.empty() ? 0 : rows[0].size()),
      data(cellCount(nx, ny))
{
    for (const auto& row : rows)
        if (row.size() != ny)
            throw GridDimensionError("Grid must be rectangular");

    for (std::size_t x = 0; x < nx; ++x)
        for (std::size_t y = 0; y < ny; ++y)
        {
            const int v = rows[x][y];
            if (v < 0 || v > 255)
                throw std::invalid_argument("cell state " + std::to_string(v) +
                                            " does not fit in a byte");
            data[index(x, y)] = static_cast<uint8_t>(v);
        }
}

Grid Grid::random(std::size_t numx, std::size_t numy,
                  double probability, uint8_t maxState,
                  std::mt19937& rng)
{
    if (!(probability >= 0.0 && probability <= 1.0))
        throw std::invalid_argument("probability must lie in [0, 1]");

    Grid grid(numx, numy);
    std::bernoulli_distribution alive(probability);
    for (auto& c : grid.data)
        c = alive(rng) ? maxState : 0;
    return grid;
}

std::optional<uint8_t> Grid::cell(std::size_t x, std::size_t y) const
{
    if (x >= nx || y >= ny)
        return std::nullopt;
    return data[index(x, y)];
}

void Grid::set(std::size_t x, std::size_t y, uint8_t state)
{
    if (x >= nx || y >= ny)
        throw std::out_of_range("cell (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside grid");
    data[index(x, y)] = state;
}

std::size_t Grid::countAlive(uint8_t maxState) const noexcept
{
    return static_cast<std::size_t>(
        std::count(data.begin(), data.end(), maxState));
}

uint8_t Grid::maxValue() const noexcept
{
    return *std::max_element(data.begin(), data.end());
}

void Grid::swap(Grid& other) noexcept
{
    std::swap(nx, other.nx);
    std::swap(ny, other.ny);
    data.swap(other.data);
}
