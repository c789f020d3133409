#include "neighbors.hpp"

namespace {

const int VON_NEUMANN_OFFSETS[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

} // namespace

int countLivingNeighbors(const Grid& grid, std::size_t x, std::size_t y,
                         const Rule& rule)
{
    const uint8_t alive = rule.getMaxState();
    int count = 0;

    if (rule.getNeighborMode() == NEIGHBOR_MOORE)
    {
        for (int dx = -1; dx <= 1; ++dx)
        for (int dy = -1; dy <= 1; ++dy)
        {
            if (dx == 0 && dy == 0) continue;
            const long nx = long(x) + dx;
            const long ny = long(y) + dy;
            if (grid.inBounds(nx, ny) && grid.at(nx, ny) == alive)
                ++count;
        }
        return count;
    }

    for (const auto& d : VON_NEUMANN_OFFSETS)
    {
        const long nx = long(x) + d[0];
        const long ny = long(y) + d[1];
        if (grid.inBounds(nx, ny) && grid.at(nx, ny) == alive)
            ++count;
    }
    return count;
}
