#include "lr_automaton.hpp"

#include <deque>
#include <iostream>
#include <unordered_map>

namespace LR {

int Automaton::transition(int stateId, const std::string& symbol) const {
    const auto& edges = states.at(stateId).transitions;
    auto it = edges.find(symbol);
    return it == edges.end() ? -1 : it->second;
}

size_t Automaton::transitionCount() const {
    size_t count = 0;
    for (const auto& state : states)
        count += state.transitions.size();
    return count;
}

AutomatonBuilder::AutomatonBuilder(std::shared_ptr<const Grammar::Grammar> grammar, const Grammar::GrammarSets& sets)
    : grammar(grammar), engine(grammar, sets) {}

Automaton AutomatonBuilder::build(ItemKind kind) const {
    if (!grammar->isAugmented())
        throw std::runtime_error("Automaton construction needs an augmented grammar");

    Log::trace() << "[LR_BUILD] Building " << (kind == ItemKind::LR1 ? "LR(1)" : "LR(0)") << " states..." << std::endl;

    Automaton automaton;
    automaton.grammar = grammar;
    automaton.kind = kind;

    const Grammar::Production* startProduction = &grammar->production(0);
    ItemSet initial{LRItem(startProduction, 0, kind == ItemKind::LR1 ? Grammar::END_MARKER : NO_LOOKAHEAD)};

    std::unordered_map<std::string, int> index;
    auto addState = [&](ItemSet items) {
        int id = static_cast<int>(automaton.states.size());
        index.emplace(canonicalKey(items), id);
        automaton.states.push_back(LRState{id, std::move(items), {}});
        return id;
    };

    std::deque<int> pending{addState(engine.closure(initial))};
    while (!pending.empty()) {
        int current = pending.front();
        pending.pop_front();

        // Copy: addState may reallocate the state vector.
        ItemSet items = automaton.states[current].items;
        for (const auto& symbol : engine.symbolsAfterDot(items)) {
            ItemSet target = engine.gotoSet(items, symbol);
            if (target.empty())
                continue;
            std::string key = canonicalKey(target);
            auto it = index.find(key);
            int targetId;
            if (it == index.end()) {
                targetId = addState(std::move(target));
                pending.push_back(targetId);
            } else {
                targetId = it->second;
            }
            automaton.states[current].transitions[symbol] = targetId;
        }
    }

    Log::trace() << "[LR_BUILD] Built " << automaton.states.size() << " states, "
                 << automaton.transitionCount() << " transitions" << std::endl;
    return automaton;
}

}  // namespace LR
