#pragma once

#include <utility>
#include "automaton.hpp"

// Counts neighbors cell by cell and applies the rule directly.
class DirectAutomaton : public Automaton {
public:
    DirectAutomaton(Grid initial, const Rule& rule)
        : Automaton(std::move(initial), rule) {}

    const char* name() const noexcept override { return "standard"; }

protected:
    void update(const Grid& from, Grid& to) override;
};
