#pragma once
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "grammar.hpp"
#include "grammar_sets.hpp"
#include "lalr.hpp"
#include "ll1_table.hpp"
#include "lr_automaton.hpp"
#include "lr_table.hpp"

namespace Analysis {

struct LRAnalysis {
    LR::TableKind kind;
    std::shared_ptr<const Grammar::Grammar> grammar;  // augmented
    Grammar::GrammarSets sets;
    LR::Automaton automaton;
    LR::ParseTable table;

    // LALR(1) only: the canonical automaton the merged one came from.
    size_t canonicalStateCount = 0;
    std::vector<int> canonicalToMerged;

    bool belongsToClass() const { return table.isConflictFree(); }
};

struct LL1Analysis {
    std::shared_ptr<const Grammar::Grammar> original;
    std::shared_ptr<const Grammar::Grammar> grammar;  // after transforms, if any ran
    bool leftRecursionEliminated = false;
    bool leftFactored = false;
    Grammar::GrammarSets sets;
    LL1::Table table;

    bool isLL1() const { return table.isLL1(); }
};

struct Lr0SlrComparison {
    LR::ParseTable lr0;
    LR::ParseTable slr;
    std::vector<LR::Conflict> resolvedBySlr;  // LR(0) conflicts with no SLR(1) counterpart
    std::vector<LR::Conflict> remaining;      // SLR(1) conflicts
};

// Throws Grammar::GrammarError for malformed text.
LRAnalysis analyzeLR(const std::string& grammarText, LR::TableKind kind);
LRAnalysis analyzeLR(Grammar::Grammar grammar, LR::TableKind kind);

LL1Analysis analyzeLL1(const std::string& grammarText, bool transform);

// Both tables over the LR(0) automaton of an LR(0) or SLR(1) analysis.
Lr0SlrComparison compareLr0Slr(const LRAnalysis& analysis);

void printReport(std::ostream& os, const LRAnalysis& analysis);
void printReport(std::ostream& os, const LL1Analysis& analysis);
void printComparison(std::ostream& os, const Lr0SlrComparison& comparison);

}  // namespace Analysis
