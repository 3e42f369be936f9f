#include <algorithm>
#include <iomanip>
#include "grammar_analyzer.hpp"

namespace Analysis {

static const std::string RULE(60, '=');

static void banner(std::ostream& os, const std::string& title) {
    os << RULE << "\n" << title << "\n" << RULE << "\n";
}

static std::string joinSet(const std::set<std::string>& symbols) {
    std::string s = "{";
    bool first = true;
    for (const auto& symbol : symbols) {
        s += first ? " " : ", ";
        s += symbol;
        first = false;
    }
    return s + (first ? "}" : " }");
}

// Code points, so cells holding ε line up.
static size_t displayWidth(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return !ScanContext::isContinuationByte(c);
    }));
}

// Plain text grid: every column as wide as its widest cell.
static void printGrid(std::ostream& os, const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty())
        return;
    std::vector<size_t> widths(rows.front().size(), 0);
    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size() && c < widths.size(); ++c)
            widths[c] = std::max(widths[c], displayWidth(row[c]));
    }
    for (const auto& row : rows) {
        os << " ";
        for (size_t c = 0; c < row.size() && c < widths.size(); ++c)
            os << " " << row[c] << std::string(widths[c] - displayWidth(row[c]), ' ') << " |";
        os << "\n";
    }
}

static void printGrammar(std::ostream& os, const Grammar::Grammar& grammar) {
    os << "\nPRODUCTIONS\n";
    for (const auto& production : grammar.productions())
        os << "  " << std::right << std::setw(3) << production.number << ": " << production.toString() << "\n";
    os << "\nTERMINALS: " << joinSet(grammar.terminals()) << "\n";
    os << "NON-TERMINALS: " << joinSet(grammar.nonTerminals()) << "\n";
}

static void printSets(std::ostream& os, const Grammar::Grammar& grammar, const Grammar::GrammarSets& sets) {
    os << "\nNULLABLE: " << joinSet(sets.nullable) << "\n";
    os << "\nFIRST\n";
    for (const auto& nonTerminal : grammar.nonTerminals())
        os << "  " << nonTerminal << ": " << joinSet(sets.firstOf(nonTerminal)) << "\n";
    os << "\nFOLLOW\n";
    for (const auto& nonTerminal : grammar.nonTerminals())
        os << "  " << nonTerminal << ": " << joinSet(sets.followOf(nonTerminal)) << "\n";
    if (!sets.followConverged)
        os << "  (did not converge after " << sets.followIterations << " iterations)\n";
}

static void printConflicts(std::ostream& os, const std::vector<LR::Conflict>& conflicts) {
    os << "\nCONFLICTS (" << conflicts.size() << ")\n";
    for (const auto& conflict : conflicts)
        os << "  " << conflict.toString() << "\n";
}

void printReport(std::ostream& os, const LRAnalysis& analysis) {
    const Grammar::Grammar& grammar = *analysis.grammar;
    const std::string kind = LR::toString(analysis.kind);
    banner(os, kind + " ANALYSIS");
    printGrammar(os, grammar);
    printSets(os, grammar, analysis.sets);

    os << "\nSTATES (" << analysis.automaton.states.size() << ")\n";
    if (analysis.kind == LR::TableKind::LALR1)
        os << "  merged from " << analysis.canonicalStateCount << " canonical LR(1) states\n";
    for (const auto& state : analysis.automaton.states) {
        os << "  I" << state.stateId << ":\n";
        for (const auto& item : state.items)
            os << "    " << item.toString() << "\n";
    }

    os << "\nTRANSITIONS\n";
    for (const auto& state : analysis.automaton.states) {
        for (const auto& edge : state.transitions)
            os << "  I" << state.stateId << " --" << edge.first << "--> I" << edge.second << "\n";
    }

    std::vector<std::string> nonTerminals;
    for (const auto& nonTerminal : grammar.nonTerminals()) {
        if (nonTerminal != grammar.augmentedStart())
            nonTerminals.push_back(nonTerminal);
    }
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> header{"State"};
    header.insert(header.end(), grammar.terminals().begin(), grammar.terminals().end());
    header.insert(header.end(), nonTerminals.begin(), nonTerminals.end());
    rows.push_back(header);
    for (const auto& state : analysis.automaton.states) {
        std::vector<std::string> row{std::to_string(state.stateId)};
        for (const auto& terminal : grammar.terminals())
            row.push_back(analysis.table.cellText(state.stateId, terminal));
        for (const auto& nonTerminal : nonTerminals) {
            int target = analysis.table.gotoState(state.stateId, nonTerminal);
            row.push_back(target < 0 ? "" : std::to_string(target));
        }
        rows.push_back(row);
    }
    os << "\nACTION / GOTO\n";
    printGrid(os, rows);

    printConflicts(os, analysis.table.conflicts);
    os << "\nRESULT: ";
    if (analysis.belongsToClass())
        os << "grammar is " << kind << "\n";
    else
        os << "grammar is NOT " << kind << " (" << analysis.table.conflicts.size() << " conflicts)\n";
}

void printReport(std::ostream& os, const LL1Analysis& analysis) {
    const Grammar::Grammar& grammar = *analysis.grammar;
    banner(os, "LL(1) ANALYSIS");
    if (analysis.leftRecursionEliminated || analysis.leftFactored) {
        os << "\nORIGINAL GRAMMAR\n" << analysis.original->toString();
        os << "\nTRANSFORMED GRAMMAR";
        if (analysis.leftRecursionEliminated)
            os << " (left recursion eliminated)";
        if (analysis.leftFactored)
            os << " (left factored)";
        os << "\n" << grammar.toString();
    }
    printGrammar(os, grammar);
    printSets(os, grammar, analysis.sets);

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> header{""};
    header.insert(header.end(), grammar.terminals().begin(), grammar.terminals().end());
    rows.push_back(header);
    for (const auto& nonTerminal : grammar.nonTerminals()) {
        std::vector<std::string> row{nonTerminal};
        for (const auto& terminal : grammar.terminals())
            row.push_back(analysis.table.cellText(grammar, nonTerminal, terminal));
        rows.push_back(row);
    }
    os << "\nPARSING TABLE\n";
    printGrid(os, rows);

    os << "\nCONFLICTS (" << analysis.table.conflicts.size() << ")\n";
    for (const auto& conflict : analysis.table.conflicts) {
        os << "  (" << conflict.nonTerminal << ", " << conflict.terminal << "): "
           << grammar.production(conflict.production1).toString() << " / "
           << grammar.production(conflict.production2).toString() << "\n";
    }
    os << "\nRESULT: grammar is " << (analysis.isLL1() ? "" : "NOT ") << "LL(1)\n";
}

void printComparison(std::ostream& os, const Lr0SlrComparison& comparison) {
    banner(os, "LR(0) vs SLR(1)");
    os << "LR(0) conflicts: " << comparison.lr0.conflicts.size() << "\n";
    os << "SLR(1) conflicts: " << comparison.slr.conflicts.size() << "\n";
    os << "\nRESOLVED BY FOLLOW SETS (" << comparison.resolvedBySlr.size() << ")\n";
    for (const auto& conflict : comparison.resolvedBySlr)
        os << "  " << conflict.toString() << "\n";
    os << "\nREMAINING IN SLR(1) (" << comparison.remaining.size() << ")\n";
    for (const auto& conflict : comparison.remaining)
        os << "  " << conflict.toString() << "\n";
}

}  // namespace Analysis
