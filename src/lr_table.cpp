#include "lr_table.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace LR {

std::string Action::toString() const {
    switch (type) {
        case ActionType::SHIFT:
            return "s" + std::to_string(value);
        case ActionType::REDUCE:
            return "r" + std::to_string(value);
        case ActionType::ACCEPT:
            return "accept";
    }
    return "?";
}

std::string toString(ConflictKind kind) {
    return kind == ConflictKind::SHIFT_REDUCE ? "shift-reduce" : "reduce-reduce";
}

std::string Conflict::toString() const {
    std::string s = "state " + std::to_string(state) + ", symbol " + symbol + ": " + LR::toString(kind) + " (";
    for (size_t i = 0; i < actions.size(); ++i) {
        if (i > 0)
            s += " / ";
        s += actions[i].toString();
    }
    return s + ")";
}

std::string toString(TableKind kind) {
    switch (kind) {
        case TableKind::LR0:
            return "LR(0)";
        case TableKind::SLR1:
            return "SLR(1)";
        case TableKind::CLR1:
            return "CLR(1)";
        case TableKind::LALR1:
            return "LALR(1)";
    }
    return "?";
}

ItemKind itemKindFor(TableKind kind) {
    return (kind == TableKind::LR0 || kind == TableKind::SLR1) ? ItemKind::LR0 : ItemKind::LR1;
}

const ActionCell* ParseTable::cell(int state, const std::string& terminal) const {
    auto row = action.find(state);
    if (row == action.end())
        return nullptr;
    auto it = row->second.find(terminal);
    return it == row->second.end() ? nullptr : &it->second;
}

std::string ParseTable::cellText(int state, const std::string& terminal) const {
    const ActionCell* actions = cell(state, terminal);
    if (!actions)
        return "";
    std::string text;
    for (size_t i = 0; i < actions->size(); ++i) {
        if (i > 0)
            text += " / ";
        text += (*actions)[i].toString();
    }
    return text;
}

int ParseTable::gotoState(int state, const std::string& nonTerminal) const {
    auto row = gotoTable.find(state);
    if (row == gotoTable.end())
        return -1;
    auto it = row->second.find(nonTerminal);
    return it == row->second.end() ? -1 : it->second;
}

ParseTable TableBuilder::build(const Automaton& automaton, TableKind kind) const {
    if (automaton.kind != itemKindFor(kind))
        throw std::invalid_argument(toString(kind) + " tables need " + (itemKindFor(kind) == ItemKind::LR1 ? "LR(1)" : "LR(0)") + " items");

    const Grammar::Grammar& grammar = *automaton.grammar;
    Log::trace() << "[LR_TABLE] Building " << toString(kind) << " tables over " << automaton.states.size() << " states" << std::endl;

    ParseTable table;
    table.kind = kind;

    for (const auto& state : automaton.states) {
        std::map<std::string, std::set<Action>> candidates;

        // Shift and goto come straight from the transitions.
        for (const auto& edge : state.transitions) {
            if (grammar.isTerminal(edge.first))
                candidates[edge.first].insert(Action(ActionType::SHIFT, edge.second));
            else
                table.gotoTable[state.stateId][edge.first] = edge.second;
        }

        for (const auto& item : state.items) {
            if (!item.isComplete())
                continue;
            const Grammar::Production& production = *item.production;

            if (production.lhs == grammar.augmentedStart()) {
                candidates[Grammar::END_MARKER].insert(Action(ActionType::ACCEPT));
                continue;
            }

            Action reduce(ActionType::REDUCE, production.number);
            switch (kind) {
                case TableKind::LR0:
                    for (const auto& terminal : grammar.terminals())
                        candidates[terminal].insert(reduce);
                    break;
                case TableKind::SLR1:
                    for (const auto& terminal : sets.followOf(production.lhs))
                        candidates[terminal].insert(reduce);
                    break;
                case TableKind::CLR1:
                case TableKind::LALR1:
                    candidates[item.lookahead].insert(reduce);
                    break;
            }
        }

        for (auto& entry : candidates) {
            ActionCell actions(entry.second.begin(), entry.second.end());
            if (actions.size() > 1) {
                bool allReduce = std::all_of(actions.begin(), actions.end(), [](const Action& a) {
                    return a.type != ActionType::SHIFT;
                });
                Conflict conflict{state.stateId,
                                  entry.first,
                                  allReduce ? ConflictKind::REDUCE_REDUCE : ConflictKind::SHIFT_REDUCE,
                                  actions[0].toString(),
                                  actions[1].toString(),
                                  actions};
                Log::trace() << "[LR_TABLE] Conflict: " << conflict.toString() << std::endl;
                table.conflicts.push_back(std::move(conflict));
            }
            table.action[state.stateId][entry.first] = std::move(actions);
        }
    }

    Log::trace() << "[LR_TABLE] " << toString(kind) << ": " << table.conflicts.size() << " conflicts" << std::endl;
    return table;
}

}  // namespace LR
