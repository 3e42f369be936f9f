#pragma once
#include <vector>
#include "lr_automaton.hpp"

namespace LR {

struct MergeResult {
    Automaton automaton;
    std::vector<int> canonicalToMerged;  // indexed by canonical state id
    size_t canonicalStateCount;
};

// Folds canonical LR(1) states with equal cores into one state holding the
// union of their items. Merged ids follow the first canonical state of each core.
class LalrMerger {
   public:
    MergeResult merge(const Automaton& canonical) const;
};

}  // namespace LR
