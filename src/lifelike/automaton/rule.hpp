#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---- Neighborhoods ---- //
enum NeighborMode : uint8_t {
    NEIGHBOR_MOORE = 0,       // 8 surrounding cells
    NEIGHBOR_VON_NEUMANN = 1  // 4 axis-aligned cells
};

NeighborMode parseNeighborMode(const std::string& text);
std::string toString(NeighborMode mode);

// Largest count each neighborhood can report.
constexpr int MAX_NEIGHBORS = 8;
constexpr int MAX_VON_NEUMANN_NEIGHBORS = 4;

// index = neighbor count, value = rule applies at this count
using CountMask = std::array<bool, MAX_NEIGHBORS + 1>;

class InvalidRuleError : public std::runtime_error {
public:
    explicit InvalidRuleError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---- Count sets ---- //
// Convenience forms for survival / birth sets. Counts are kept as given
// and only checked when a Rule is built from them.
class CountSpec {
private:
    std::vector<int> counts;

    explicit CountSpec(std::vector<int> c) : counts(std::move(c)) {}

public:
    CountSpec() = default;

    static CountSpec one(int count);
    // half-open [first, last)
    static CountSpec range(int first, int last);
    static CountSpec numbers(const std::vector<int>& counts);
    static CountSpec raw(const CountMask& mask);

    const std::vector<int>& values() const noexcept { return counts; }
};

// ---- Rule ---- //
class Rule {
private:
    CountMask survival{};
    CountMask birth{};
    uint8_t maxState{1};
    NeighborMode neighborMode{NEIGHBOR_MOORE};

public:
    Rule(const CountSpec& survivalSpec,
         const CountSpec& birthSpec,
         int maxState,
         NeighborMode mode);

    // B3/S23, two states, Moore
    static Rule standard();

    // "B3/S23", "S23/B3", "B2/S/C5", "B3/S23V", ...
    static Rule parse(const std::string& text);

    bool survives(int count) const noexcept { return survival[count]; }
    bool born(int count) const noexcept { return birth[count]; }

    const CountMask& survivalMask() const noexcept { return survival; }
    const CountMask& birthMask() const noexcept { return birth; }
    uint8_t getMaxState() const noexcept { return maxState; }
    NeighborMode getNeighborMode() const noexcept { return neighborMode; }

    std::string toString() const;

    bool operator==(const Rule& other) const noexcept;
    bool operator!=(const Rule& other) const noexcept { return !(*this == other); }
};
