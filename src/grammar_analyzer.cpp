#include "grammar_analyzer.hpp"

#include <iostream>
#include <set>
#include <stdexcept>
#include "grammar_transforms.hpp"

namespace Analysis {

LRAnalysis analyzeLR(const std::string& grammarText, LR::TableKind kind) {
    return analyzeLR(Grammar::Grammar::parse(grammarText), kind);
}

LRAnalysis analyzeLR(Grammar::Grammar grammar, LR::TableKind kind) {
    grammar.augment();

    LRAnalysis analysis;
    analysis.kind = kind;
    analysis.grammar = std::make_shared<const Grammar::Grammar>(std::move(grammar));
    analysis.sets = Grammar::computeSets(*analysis.grammar);

    LR::AutomatonBuilder builder(analysis.grammar, analysis.sets);
    LR::Automaton automaton = builder.build(LR::itemKindFor(kind));

    if (kind == LR::TableKind::LALR1) {
        LR::MergeResult merged = LR::LalrMerger().merge(automaton);
        analysis.canonicalStateCount = merged.canonicalStateCount;
        analysis.canonicalToMerged = std::move(merged.canonicalToMerged);
        analysis.automaton = std::move(merged.automaton);
    } else {
        analysis.automaton = std::move(automaton);
    }

    analysis.table = LR::TableBuilder(analysis.sets).build(analysis.automaton, kind);
    return analysis;
}

LL1Analysis analyzeLL1(const std::string& grammarText, bool transform) {
    LL1Analysis analysis;
    Grammar::Grammar grammar = Grammar::Grammar::parse(grammarText);
    analysis.original = std::make_shared<const Grammar::Grammar>(grammar);

    if (transform) {
        auto withoutRecursion = Grammar::eliminateLeftRecursion(grammar);
        analysis.leftRecursionEliminated = withoutRecursion.changed;
        auto factored = Grammar::leftFactor(withoutRecursion.grammar);
        analysis.leftFactored = factored.changed;
        grammar = std::move(factored.grammar);
    }

    analysis.grammar = std::make_shared<const Grammar::Grammar>(std::move(grammar));
    analysis.sets = Grammar::computeSets(*analysis.grammar);
    analysis.table = LL1::TableBuilder(*analysis.grammar, analysis.sets).build();
    return analysis;
}

Lr0SlrComparison compareLr0Slr(const LRAnalysis& analysis) {
    if (analysis.automaton.kind != LR::ItemKind::LR0)
        throw std::invalid_argument("LR(0)/SLR(1) comparison needs an LR(0) automaton");

    LR::TableBuilder builder(analysis.sets);
    Lr0SlrComparison comparison{builder.build(analysis.automaton, LR::TableKind::LR0),
                                builder.build(analysis.automaton, LR::TableKind::SLR1),
                                {},
                                {}};

    std::set<std::pair<int, std::string>> slrCells;
    for (const auto& conflict : comparison.slr.conflicts)
        slrCells.insert({conflict.state, conflict.symbol});
    for (const auto& conflict : comparison.lr0.conflicts) {
        if (!slrCells.count({conflict.state, conflict.symbol}))
            comparison.resolvedBySlr.push_back(conflict);
    }
    comparison.remaining = comparison.slr.conflicts;
    return comparison;
}

}  // namespace Analysis
