#include "rule.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

// ---- Neighborhoods ---- //
NeighborMode parseNeighborMode(const std::string& text)
{
    std::string key;
    for (char c : text)
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (key == "m" || key == "moore")
        return NEIGHBOR_MOORE;
    if (key == "v" || key == "vn" || key == "vonneumann")
        return NEIGHBOR_VON_NEUMANN;

    throw InvalidRuleError("unknown neighborhood '" + text +
                           "' (expected moore or vonneumann)");
}

std::string toString(NeighborMode mode)
{
    return mode == NEIGHBOR_MOORE ? "Moore" : "von Neumann";
}

// ---- Count sets ---- //
CountSpec CountSpec::one(int count)
{
    return CountSpec(std::vector<int>{count});
}

CountSpec CountSpec::range(int first, int last)
{
    std::vector<int> c;
    for (int i = first; i < last; ++i)
        c.push_back(i);
    return CountSpec(std::move(c));
}

CountSpec CountSpec::numbers(const std::vector<int>& counts)
{
    return CountSpec(counts);
}

CountSpec CountSpec::raw(const CountMask& mask)
{
    std::vector<int> c;
    for (int i = 0; i <= MAX_NEIGHBORS; ++i)
        if (mask[i]) c.push_back(i);
    return CountSpec(std::move(c));
}

// ---- Rule ---- //
namespace {

CountMask toMask(const CountSpec& spec, NeighborMode mode, const char* which)
{
    const int limit = mode == NEIGHBOR_VON_NEUMANN ? MAX_VON_NEUMANN_NEIGHBORS
                                                   : MAX_NEIGHBORS;
    CountMask mask{};
    for (int count : spec.values())
    {
        if (count < 0 || count > MAX_NEIGHBORS)
            throw InvalidRuleError(std::string(which) + " count " +
                                   std::to_string(count) +
                                   " outside [0, 8]");
        if (count > limit)
            throw InvalidRuleError(std::string(which) + " count " +
                                   std::to_string(count) +
                                   " unreachable with von Neumann adjacency");
        mask[count] = true;
    }
    return mask;
}

CountSpec parseDigits(const std::string& digits, const std::string& text)
{
    std::vector<int> counts;
    for (char c : digits)
    {
        if (c < '0' || c > '9')
            throw InvalidRuleError("bad character in rule '" + text + "'");
        counts.push_back(c - '0');
    }
    return CountSpec::numbers(counts);
}

std::string maskDigits(const CountMask& mask)
{
    std::string s;
    for (int i = 0; i <= MAX_NEIGHBORS; ++i)
        if (mask[i]) s += static_cast<char>('0' + i);
    return s;
}

} // namespace

Rule::Rule(const CountSpec& survivalSpec,
           const CountSpec& birthSpec,
           int states,
           NeighborMode mode)
    : neighborMode(mode)
{
    if (states <= 0)
        throw InvalidRuleError("maxState must be at least 1");
    if (states > std::numeric_limits<uint8_t>::max())
        throw InvalidRuleError("maxState must not exceed 255");

    maxState = static_cast<uint8_t>(states);
    survival = toMask(survivalSpec, mode, "survival");
    birth = toMask(birthSpec, mode, "birth");
}

Rule Rule::standard()
{
    return Rule(CountSpec::numbers({2, 3}), CountSpec::one(3), 1, NEIGHBOR_MOORE);
}

Rule Rule::parse(const std::string& text)
{
    std::string s;
    for (char c : text)
        if (!std::isspace(static_cast<unsigned char>(c)))
            s += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (s.empty())
        throw InvalidRuleError("empty rule string");

    NeighborMode mode = NEIGHBOR_MOORE;
    if (s.back() == 'V')
    {
        mode = NEIGHBOR_VON_NEUMANN;
        s.pop_back();
    }

    bool haveB = false, haveS = false, haveC = false;
    CountSpec birthSpec, survivalSpec;
    int states = 2;

    std::size_t start = 0;
    while (start <= s.size())
    {
        std::size_t slash = s.find('/', start);
        if (slash == std::string::npos) slash = s.size();
        const std::string token = s.substr(start, slash - start);
        start = slash + 1;

        if (token.empty())
            throw InvalidRuleError("malformed rule '" + text + "'");

        const char tag = token[0];
        const std::string body = token.substr(1);
        if (tag == 'B' && !haveB)
        {
            birthSpec = parseDigits(body, text);
            haveB = true;
        }
        else if (tag == 'S' && !haveS)
        {
            survivalSpec = parseDigits(body, text);
            haveS = true;
        }
        else if (tag == 'C' && !haveC && !body.empty() && body.size() <= 3 &&
                 std::all_of(body.begin(), body.end(),
                             [](char c) { return c >= '0' && c <= '9'; }))
        {
            states = std::stoi(body);
            if (states < 2)
                throw InvalidRuleError("rule needs at least 2 states: '" + text + "'");
            haveC = true;
        }
        else
        {
            throw InvalidRuleError("malformed rule '" + text + "'");
        }
    }

    if (!haveB || !haveS)
        throw InvalidRuleError("rule '" + text + "' needs both B and S parts");

    return Rule(survivalSpec, birthSpec, states - 1, mode);
}

std::string Rule::toString() const
{
    std::string s = "B" + maskDigits(birth) + "/S" + maskDigits(survival);
    if (maxState > 1)
        s += "/C" + std::to_string(maxState + 1);
    if (neighborMode == NEIGHBOR_VON_NEUMANN)
        s += "V";
    return s;
}

bool Rule::operator==(const Rule& other) const noexcept
{
    return survival == other.survival && birth == other.birth &&
           maxState == other.maxState && neighborMode == other.neighborMode;
}
