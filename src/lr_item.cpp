#include "lr_item.hpp"

#include <deque>

namespace LR {

std::string LRItem::toString() const {
    std::string s = production->lhs + " \xE2\x86\x92";
    for (size_t k = 0; k < production->rhs.size(); ++k) {
        if (k == dotPosition)
            s += " \xC2\xB7";
        s += " " + production->rhs[k];
    }
    if (isComplete())
        s += " \xC2\xB7";
    if (hasLookahead())
        return "[" + s + ", " + lookahead + "]";
    return s;
}

std::string canonicalKey(const ItemSet& items) {
    std::string key;
    for (const auto& item : items) {
        key += std::to_string(item.production->number);
        key += '.';
        key += std::to_string(item.dotPosition);
        key += '.';
        key += item.lookahead;
        key += '\n';
    }
    return key;
}

std::string coreKey(const ItemSet& items) {
    std::set<std::pair<int, size_t>> cores;
    for (const auto& item : items)
        cores.insert({item.production->number, item.dotPosition});
    std::string key;
    for (const auto& core : cores) {
        key += std::to_string(core.first);
        key += '.';
        key += std::to_string(core.second);
        key += '\n';
    }
    return key;
}

ItemSet ClosureEngine::closure(const ItemSet& items) const {
    ItemSet result = items;
    std::deque<LRItem> pending(items.begin(), items.end());

    while (!pending.empty()) {
        LRItem item = pending.front();
        pending.pop_front();

        std::string next = item.nextSymbol();
        if (next.empty() || !grammar->isNonTerminal(next))
            continue;

        // Lookaheads for B in [A → α · B β, a] are FIRST(β a).
        std::set<std::string> lookaheads;
        if (item.hasLookahead()) {
            for (const auto& terminal : sets.firstOfSequence(item.production->rhs, item.dotPosition + 1)) {
                if (terminal != Grammar::EPSILON)
                    lookaheads.insert(terminal);
            }
            if (sets.sequenceNullable(item.production->rhs, item.dotPosition + 1))
                lookaheads.insert(item.lookahead);
        } else {
            lookaheads.insert(NO_LOOKAHEAD);
        }

        for (const auto* production : grammar->productionsFor(next)) {
            for (const auto& lookahead : lookaheads) {
                LRItem newItem(production, 0, lookahead);
                if (result.insert(newItem).second)
                    pending.push_back(newItem);
            }
        }
    }
    return result;
}

ItemSet ClosureEngine::gotoSet(const ItemSet& items, const std::string& symbol) const {
    ItemSet kernel;
    for (const auto& item : items) {
        if (!item.isComplete() && item.nextSymbol() == symbol)
            kernel.insert(item.advance());
    }
    if (kernel.empty())
        return kernel;
    return closure(kernel);
}

std::set<std::string> ClosureEngine::symbolsAfterDot(const ItemSet& items) const {
    std::set<std::string> symbols;
    for (const auto& item : items) {
        if (!item.isComplete())
            symbols.insert(item.nextSymbol());
    }
    return symbols;
}

}  // namespace LR
