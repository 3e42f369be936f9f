#include "lalr.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace LR {

MergeResult LalrMerger::merge(const Automaton& canonical) const {
    if (canonical.kind != ItemKind::LR1)
        throw std::invalid_argument("LALR merging needs a canonical LR(1) automaton");

    MergeResult result;
    result.canonicalStateCount = canonical.states.size();
    result.canonicalToMerged.assign(canonical.states.size(), -1);
    result.automaton.grammar = canonical.grammar;
    result.automaton.kind = ItemKind::LR1;

    std::unordered_map<std::string, int> mergedByCore;
    for (const auto& state : canonical.states) {
        std::string core = coreKey(state.items);
        auto it = mergedByCore.find(core);
        int mergedId;
        if (it == mergedByCore.end()) {
            mergedId = static_cast<int>(result.automaton.states.size());
            mergedByCore.emplace(core, mergedId);
            result.automaton.states.push_back(LRState{mergedId, state.items, {}});
        } else {
            mergedId = it->second;
            result.automaton.states[mergedId].items.insert(state.items.begin(), state.items.end());
        }
        result.canonicalToMerged[state.stateId] = mergedId;
    }

    for (const auto& state : canonical.states) {
        auto& edges = result.automaton.states[result.canonicalToMerged[state.stateId]].transitions;
        for (const auto& edge : state.transitions) {
            int target = result.canonicalToMerged[edge.second];
            auto inserted = edges.emplace(edge.first, target);
            if (!inserted.second && inserted.first->second != target) {
                Log::warning() << "[LALR] Inconsistent transition from merged state " << result.canonicalToMerged[state.stateId]
                               << " on " << edge.first << ": " << inserted.first->second << " vs " << target << std::endl;
            }
        }
    }

    Log::trace() << "[LALR] Merged " << canonical.states.size() << " canonical states into "
                 << result.automaton.states.size() << std::endl;
    return result;
}

}  // namespace LR
