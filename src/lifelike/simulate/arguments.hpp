#pragma once

#include <cstddef>
#include <string>

// Non-negative decimal count from a command-line argument. Signs, trailing
// characters and out-of-range values throw std::invalid_argument or
// std::out_of_range naming `what`.
std::size_t parseCount(const std::string& text, const std::string& what);
