#include "grammar_sets.hpp"

#include <iostream>

namespace Grammar {

static const SymbolSet EMPTY_SET;

const SymbolSet& GrammarSets::firstOf(const std::string& symbol) const {
    auto it = first.find(symbol);
    return it == first.end() ? EMPTY_SET : it->second;
}

const SymbolSet& GrammarSets::followOf(const std::string& symbol) const {
    auto it = follow.find(symbol);
    return it == follow.end() ? EMPTY_SET : it->second;
}

SymbolSet GrammarSets::firstOfSequence(const std::vector<std::string>& symbols, size_t from) const {
    SymbolSet result;
    for (size_t i = from; i < symbols.size(); ++i) {
        for (const auto& terminal : firstOf(symbols[i])) {
            if (terminal != EPSILON)
                result.insert(terminal);
        }
        if (!isNullable(symbols[i]))
            return result;
    }
    result.insert(EPSILON);
    return result;
}

bool GrammarSets::sequenceNullable(const std::vector<std::string>& symbols, size_t from) const {
    for (size_t i = from; i < symbols.size(); ++i) {
        if (!isNullable(symbols[i]))
            return false;
    }
    return true;
}

SymbolSet computeNullable(const Grammar& grammar) {
    SymbolSet nullable;
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& production : grammar.productions()) {
            if (nullable.count(production.lhs))
                continue;
            bool allNullable = true;
            for (const auto& symbol : production.rhs) {
                if (!nullable.count(symbol)) {
                    allNullable = false;
                    break;
                }
            }
            if (allNullable) {
                nullable.insert(production.lhs);
                changed = true;
            }
        }
    }
    return nullable;
}

std::map<std::string, SymbolSet> computeFirst(const Grammar& grammar, const SymbolSet& nullable) {
    std::map<std::string, SymbolSet> first;
    for (const auto& terminal : grammar.terminals())
        first[terminal].insert(terminal);
    for (const auto& nonTerminal : grammar.nonTerminals())
        first[nonTerminal];

    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& production : grammar.productions()) {
            auto& target = first[production.lhs];
            size_t oldSize = target.size();
            bool rhsNullable = true;
            for (const auto& symbol : production.rhs) {
                for (const auto& terminal : first[symbol]) {
                    if (terminal != EPSILON)
                        target.insert(terminal);
                }
                if (!nullable.count(symbol)) {
                    rhsNullable = false;
                    break;
                }
            }
            if (rhsNullable)
                target.insert(EPSILON);
            if (target.size() > oldSize)
                changed = true;
        }
    }
    return first;
}

FollowResult computeFollow(const Grammar& grammar,
                           const std::map<std::string, SymbolSet>& first,
                           const SymbolSet& nullable,
                           int maxIterations) {
    FollowResult result;
    for (const auto& nonTerminal : grammar.nonTerminals())
        result.follow[nonTerminal];
    result.follow[grammar.startSymbol()].insert(END_MARKER);
    if (grammar.isAugmented())
        result.follow[grammar.augmentedStart()].insert(END_MARKER);

    bool changed = true;
    while (changed) {
        if (result.iterations >= maxIterations) {
            result.converged = false;
            Log::warning() << "[FIRST_FOLLOW] FOLLOW sets did not converge after " << maxIterations << " iterations" << std::endl;
            break;
        }
        changed = false;
        ++result.iterations;
        for (const auto& production : grammar.productions()) {
            const auto& rhs = production.rhs;
            for (size_t i = 0; i < rhs.size(); ++i) {
                if (!grammar.isNonTerminal(rhs[i]))
                    continue;
                auto& target = result.follow[rhs[i]];
                size_t oldSize = target.size();

                bool restNullable = true;
                for (size_t j = i + 1; j < rhs.size(); ++j) {
                    auto it = first.find(rhs[j]);
                    if (it != first.end()) {
                        for (const auto& terminal : it->second) {
                            if (terminal != EPSILON)
                                target.insert(terminal);
                        }
                    }
                    if (!nullable.count(rhs[j])) {
                        restNullable = false;
                        break;
                    }
                }
                if (restNullable && rhs[i] != production.lhs) {
                    const auto& lhsFollow = result.follow[production.lhs];
                    target.insert(lhsFollow.begin(), lhsFollow.end());
                }
                if (target.size() > oldSize)
                    changed = true;
            }
        }
    }
    return result;
}

GrammarSets computeSets(const Grammar& grammar, int maxFollowIterations) {
    GrammarSets sets;
    sets.nullable = computeNullable(grammar);
    sets.first = computeFirst(grammar, sets.nullable);
    auto followResult = computeFollow(grammar, sets.first, sets.nullable, maxFollowIterations);
    sets.follow = std::move(followResult.follow);
    sets.followIterations = followResult.iterations;
    sets.followConverged = followResult.converged;
    Log::trace() << "[FIRST_FOLLOW] " << sets.nullable.size() << " nullable, FOLLOW settled after "
                 << sets.followIterations << " passes" << std::endl;
    return sets;
}

}  // namespace Grammar
