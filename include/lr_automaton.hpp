#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "grammar.hpp"
#include "grammar_sets.hpp"
#include "lr_item.hpp"

namespace LR {

enum class ItemKind {
    LR0,
    LR1
};

// LR State represents a set of LR items
struct LRState {
    int stateId;
    ItemSet items;
    std::map<std::string, int> transitions;
};

class Automaton {
   public:
    std::shared_ptr<const Grammar::Grammar> grammar;
    ItemKind kind;
    std::vector<LRState> states;

    const LRState& state(int id) const { return states.at(id); }

    // -1 when there is no edge.
    int transition(int stateId, const std::string& symbol) const;
    size_t transitionCount() const;
};

// Breadth-first construction; state ids follow discovery order with symbols
// expanded in sorted order, so the same grammar always yields the same ids.
class AutomatonBuilder {
   public:
    AutomatonBuilder(std::shared_ptr<const Grammar::Grammar> grammar, const Grammar::GrammarSets& sets);

    Automaton build(ItemKind kind) const;

   private:
    std::shared_ptr<const Grammar::Grammar> grammar;
    ClosureEngine engine;
};

}  // namespace LR
