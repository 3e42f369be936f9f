#include "ll1_table.hpp"

#include <iostream>

namespace LL1 {

const std::vector<int>* Table::cell(const std::string& nonTerminal, const std::string& terminal) const {
    auto row = cells.find(nonTerminal);
    if (row == cells.end())
        return nullptr;
    auto it = row->second.find(terminal);
    return it == row->second.end() ? nullptr : &it->second;
}

std::string Table::cellText(const Grammar::Grammar& grammar, const std::string& nonTerminal, const std::string& terminal) const {
    const std::vector<int>* entries = cell(nonTerminal, terminal);
    if (!entries)
        return "";
    std::string text;
    for (size_t i = 0; i < entries->size(); ++i) {
        if (i > 0)
            text += " / ";
        text += grammar.production((*entries)[i]).toString();
    }
    return text;
}

Table TableBuilder::build() const {
    Log::trace() << "[LL1] Building predictive table" << std::endl;
    Table table;

    auto place = [&table](const Grammar::Production& production, const std::string& terminal) {
        auto& entries = table.cells[production.lhs][terminal];
        for (int existing : entries) {
            if (existing == production.number)
                return;
        }
        if (!entries.empty()) {
            table.conflicts.push_back(Conflict{production.lhs, terminal, entries.front(), production.number});
            Log::trace() << "[LL1] Conflict at (" << production.lhs << ", " << terminal << ")" << std::endl;
        }
        entries.push_back(production.number);
    };

    for (const auto& production : grammar.productions()) {
        Grammar::SymbolSet firstAlpha = sets.firstOfSequence(production.rhs);
        for (const auto& terminal : firstAlpha) {
            if (terminal != Grammar::EPSILON)
                place(production, terminal);
        }
        if (firstAlpha.count(Grammar::EPSILON)) {
            for (const auto& terminal : sets.followOf(production.lhs))
                place(production, terminal);
        }
    }

    Log::trace() << "[LL1] " << table.conflicts.size() << " conflicts" << std::endl;
    return table;
}

}  // namespace LL1
