#include "grid_io.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

Grid loadGrid(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Error opening file: " + filename);

    std::vector<std::vector<int>> rows;
    std::string line;
    std::size_t lineNo = 0;

    while (std::getline(file, line))
    {
        ++lineNo;
        std::vector<int> row;
        std::istringstream iss(line);
        int value;

        while (iss >> value)
            row.push_back(value);

        if (!iss.eof())
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                     ": expected integers");

        if (!row.empty())
            rows.push_back(row);
    }

    if (rows.empty())
        throw std::runtime_error("Error: empty grid file " + filename);

    try
    {
        return Grid(rows);
    }
    catch (const std::exception& e)
    {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

void saveGrid(const Grid& grid, const std::string& filename)
{
    std::ofstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Error opening file for writing: " + filename);

    for (std::size_t x = 0; x < grid.numx(); ++x)
    {
        for (std::size_t y = 0; y < grid.numy(); ++y)
        {
            file << int(grid.at(x, y));
            if (y < grid.numy() - 1)
                file << " ";
        }
        file << "\n";
    }

    if (!file)
        throw std::runtime_error("Error writing file: " + filename);
}
