#pragma once
#include <map>
#include <string>
#include <vector>
#include "grammar_sets.hpp"
#include "lr_automaton.hpp"

namespace LR {

// Action type for the parsing table
enum class ActionType {
    SHIFT,
    REDUCE,
    ACCEPT
};

struct Action {
    ActionType type;
    int value;  // state number for shift, production number for reduce

    Action(ActionType type, int value = 0)
        : type(type), value(value) {}

    // "s4", "r2", "accept"
    std::string toString() const;

    bool operator==(const Action& other) const { return type == other.type && value == other.value; }
    bool operator<(const Action& other) const {
        if (type != other.type)
            return type < other.type;
        return value < other.value;
    }
};

// Sorted, duplicate-free. More than one entry marks a conflict.
using ActionCell = std::vector<Action>;

enum class ConflictKind {
    SHIFT_REDUCE,
    REDUCE_REDUCE
};

std::string toString(ConflictKind kind);

struct Conflict {
    int state;
    std::string symbol;
    ConflictKind kind;
    std::string action1;
    std::string action2;
    ActionCell actions;

    std::string toString() const;
};

enum class TableKind {
    LR0,
    SLR1,
    CLR1,
    LALR1
};

std::string toString(TableKind kind);
ItemKind itemKindFor(TableKind kind);

class ParseTable {
   public:
    TableKind kind;
    std::map<int, std::map<std::string, ActionCell>> action;
    std::map<int, std::map<std::string, int>> gotoTable;
    std::vector<Conflict> conflicts;

    // nullptr for an empty cell.
    const ActionCell* cell(int state, const std::string& terminal) const;

    // "", "s3", or "s3 / r2" for a conflict cell.
    std::string cellText(int state, const std::string& terminal) const;

    // -1 when there is no entry.
    int gotoState(int state, const std::string& nonTerminal) const;

    bool isConflictFree() const { return conflicts.empty(); }
};

class TableBuilder {
   public:
    explicit TableBuilder(Grammar::GrammarSets sets)
        : sets(std::move(sets)) {}

    // Throws std::invalid_argument if the automaton's items do not suit the table kind.
    ParseTable build(const Automaton& automaton, TableKind kind) const;

   private:
    Grammar::GrammarSets sets;
};

}  // namespace LR
