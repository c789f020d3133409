#pragma once

#include <vector>
#include <random>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

class GridDimensionError : public std::runtime_error {
public:
    explicit GridDimensionError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---- Grid ---- //
// Fixed-size field of cell states. x is the first axis (numx rows), y the
// second (numy columns); storage is row-major, so (x, y) lives at
// x * numy + y.
class Grid {
private:
    std::size_t nx{0}, ny{0};

    // row-major flattened storage
    std::vector<uint8_t> data;

public:
    Grid(std::size_t numx, std::size_t numy);
    Grid(std::size_t numx, std::size_t numy, std::vector<uint8_t> cells);
    explicit Grid(const std::vector<std::vector<int>>& rows);

    // Each cell alive (maxState) with the given probability, dead otherwise.
    static Grid random(std::size_t numx, std::size_t numy,
                       double probability, uint8_t maxState,
                       std::mt19937& rng);

    inline std::size_t index(std::size_t x, std::size_t y) const noexcept {
        return x * ny + y;
    }

    inline bool inBounds(long x, long y) const noexcept {
        return x >= 0 && y >= 0 && x < long(nx) && y < long(ny);
    }

    // ---- Accessors ---- //
    std::size_t numx() const noexcept { return nx; }
    std::size_t numy() const noexcept { return ny; }
    std::size_t size() const noexcept { return data.size(); }

    // Empty when (x, y) is outside the grid.
    std::optional<uint8_t> cell(std::size_t x, std::size_t y) const;

    // Unchecked.
    uint8_t at(std::size_t x, std::size_t y) const noexcept { return data[index(x, y)]; }
    uint8_t& at(std::size_t x, std::size_t y) noexcept { return data[index(x, y)]; }

    void set(std::size_t x, std::size_t y, uint8_t state);

    std::size_t countAlive(uint8_t maxState) const noexcept;
    uint8_t maxValue() const noexcept;

    const std::vector<uint8_t>& raw() const noexcept { return data; }
    std::vector<uint8_t>& raw() noexcept { return data; }

    void swap(Grid& other) noexcept;

    bool operator==(const Grid& other) const noexcept {
        return nx == other.nx && ny == other.ny && data == other.data;
    }
    bool operator!=(const Grid& other) const noexcept { return !(*this == other); }
};
