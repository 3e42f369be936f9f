#pragma once
#include <map>
#include <string>
#include <vector>
#include "grammar.hpp"
#include "grammar_sets.hpp"

namespace LL1 {

struct Conflict {
    std::string nonTerminal;
    std::string terminal;
    int production1;  // already in the cell
    int production2;  // proposed on top of it
};

class Table {
   public:
    // nonTerminal -> terminal -> production numbers, in insertion order
    std::map<std::string, std::map<std::string, std::vector<int>>> cells;
    std::vector<Conflict> conflicts;

    // nullptr for an empty cell.
    const std::vector<int>* cell(const std::string& nonTerminal, const std::string& terminal) const;

    // "A → x" or "A → x / A → y"
    std::string cellText(const Grammar::Grammar& grammar, const std::string& nonTerminal, const std::string& terminal) const;

    bool isLL1() const { return conflicts.empty(); }
};

class TableBuilder {
   public:
    TableBuilder(const Grammar::Grammar& grammar, Grammar::GrammarSets sets)
        : grammar(grammar), sets(std::move(sets)) {}

    Table build() const;

   private:
    const Grammar::Grammar& grammar;
    Grammar::GrammarSets sets;
};

}  // namespace LL1
