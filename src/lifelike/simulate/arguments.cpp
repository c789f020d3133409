#include "arguments.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

std::size_t parseCount(const std::string& text, const std::string& what)
{
    std::size_t start = 0;
    while (start < text.size() &&
           std::isspace(static_cast<unsigned char>(text[start])))
        ++start;

    // std::stoul would wrap "-1" around to the largest value
    if (start == text.size() ||
        !std::isdigit(static_cast<unsigned char>(text[start])))
        throw std::invalid_argument(what + " must be a non-negative integer, got '" +
                                    text + "'");

    std::size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size())
        throw std::invalid_argument(what + " must be a non-negative integer, got '" +
                                    text + "'");
    if (value > std::numeric_limits<std::size_t>::max())
        throw std::out_of_range(what + " is too large: " + text);

    return static_cast<std::size_t>(value);
}
