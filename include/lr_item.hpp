#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "grammar.hpp"
#include "grammar_sets.hpp"

namespace LR {

// LR(0) items carry no lookahead; canonical-LR items carry one terminal.
inline const std::string NO_LOOKAHEAD = "";

// LR Item represents a production with a dot position
class LRItem {
   public:
    const Grammar::Production* production;
    size_t dotPosition;
    std::string lookahead;

    LRItem(const Grammar::Production* production, size_t dotPosition, std::string lookahead = NO_LOOKAHEAD)
        : production(production), dotPosition(dotPosition), lookahead(std::move(lookahead)) {}

    bool isComplete() const {
        return dotPosition >= production->rhs.size();
    }

    bool hasLookahead() const {
        return !lookahead.empty();
    }

    // Empty when the item is complete.
    std::string nextSymbol() const {
        if (dotPosition < production->rhs.size())
            return production->rhs[dotPosition];
        return "";
    }

    LRItem advance() const {
        return LRItem(production, dotPosition + 1, lookahead);
    }

    LRItem core() const {
        return LRItem(production, dotPosition);
    }

    // "A → α · β" or "[A → α · β, a]"
    std::string toString() const;

    bool operator==(const LRItem& other) const {
        return production->number == other.production->number &&
               dotPosition == other.dotPosition &&
               lookahead == other.lookahead;
    }

    bool operator!=(const LRItem& other) const {
        return !(*this == other);
    }

    // Production numbers follow (lhs, declaration) order, so this orders by (lhs, rhs, dot, lookahead).
    bool operator<(const LRItem& other) const {
        if (production->number != other.production->number)
            return production->number < other.production->number;
        if (dotPosition != other.dotPosition)
            return dotPosition < other.dotPosition;
        return lookahead < other.lookahead;
    }
};

using ItemSet = std::set<LRItem>;

// Order-independent encoding of an item set, used to deduplicate states.
std::string canonicalKey(const ItemSet& items);

// Same as canonicalKey with lookaheads stripped.
std::string coreKey(const ItemSet& items);

class ClosureEngine {
   public:
    ClosureEngine(std::shared_ptr<const Grammar::Grammar> grammar, const Grammar::GrammarSets& sets)
        : grammar(std::move(grammar)), sets(sets) {}

    ItemSet closure(const ItemSet& items) const;

    // Empty when no item advances over the symbol.
    ItemSet gotoSet(const ItemSet& items, const std::string& symbol) const;

    // Sorted, so expansion order is fixed.
    std::set<std::string> symbolsAfterDot(const ItemSet& items) const;

   private:
    std::shared_ptr<const Grammar::Grammar> grammar;
    Grammar::GrammarSets sets;
};

}  // namespace LR
