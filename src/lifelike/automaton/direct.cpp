#include "direct.hpp"
#include "neighbors.hpp"

void DirectAutomaton::update(const Grid& from, Grid& to)
{
    const Rule& r = rule();
    const uint8_t alive = r.getMaxState();
    const std::size_t rows = from.numx();
    const std::size_t cols = from.numy();

    // Every cell reads only `from`, so cells are independent.
    #pragma omp parallel for collapse(2) if(rows * cols > 1024)
    for (std::size_t x = 0; x < rows; ++x)
    {
        for (std::size_t y = 0; y < cols; ++y)
        {
            const int count = countLivingNeighbors(from, x, y, r);
            const uint8_t state = from.at(x, y);

            if (r.born(count) || (state == alive && r.survives(count)))
                to.at(x, y) = alive;
            else if (state > 0)
                to.at(x, y) = static_cast<uint8_t>(state - 1);
            else
                to.at(x, y) = 0;
        }
    }
}
