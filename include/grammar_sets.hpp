#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "grammar.hpp"

namespace Grammar {

using SymbolSet = std::set<std::string>;

constexpr int DEFAULT_FOLLOW_ITERATION_LIMIT = 100;

struct FollowResult {
    std::map<std::string, SymbolSet> follow;
    int iterations = 0;
    bool converged = true;
};

// NULLABLE, FIRST and FOLLOW for one grammar. FIRST sets of nullable
// non-terminals contain EPSILON; FOLLOW sets never do.
struct GrammarSets {
    SymbolSet nullable;
    std::map<std::string, SymbolSet> first;
    std::map<std::string, SymbolSet> follow;
    int followIterations = 0;
    bool followConverged = true;

    bool isNullable(const std::string& symbol) const { return nullable.count(symbol) > 0; }
    const SymbolSet& firstOf(const std::string& symbol) const;
    const SymbolSet& followOf(const std::string& symbol) const;

    // FIRST of symbols[from..]; contains EPSILON iff the whole suffix is nullable.
    SymbolSet firstOfSequence(const std::vector<std::string>& symbols, size_t from = 0) const;
    bool sequenceNullable(const std::vector<std::string>& symbols, size_t from = 0) const;
};

SymbolSet computeNullable(const Grammar& grammar);
std::map<std::string, SymbolSet> computeFirst(const Grammar& grammar, const SymbolSet& nullable);
FollowResult computeFollow(const Grammar& grammar,
                           const std::map<std::string, SymbolSet>& first,
                           const SymbolSet& nullable,
                           int maxIterations = DEFAULT_FOLLOW_ITERATION_LIMIT);

GrammarSets computeSets(const Grammar& grammar, int maxFollowIterations = DEFAULT_FOLLOW_ITERATION_LIMIT);

}  // namespace Grammar
