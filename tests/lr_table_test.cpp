#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <set>
#include "grammar.hpp"
#include "grammar_sets.hpp"
#include "lr_automaton.hpp"
#include "lr_table.hpp"

using LR::ActionType;
using LR::ConflictKind;
using LR::TableKind;

namespace {

const char* DRAGON_GRAMMAR = "S → C C\nC → c C | d\n";

// SLR(1) but not LR(0): after T, reduce E → T or shift +.
const char* RIGHT_RECURSIVE_SUM = "E → T + E | T\nT → id\n";

// LALR(1) but not SLR(1).
const char* ASSIGNMENT_GRAMMAR = "S → L = R | R\nL → * R | id\nR → L\n";

const char* MINIMAL_GRAMMAR =
    "Program → Stmt\n"
    "Stmt → Expr ; | Cond ;\n"
    "Expr → Factor\n"
    "Factor → IDENTIFIER | FunctionCall | ( Expr )\n"
    "FunctionCall → IDENTIFIER ( )\n"
    "Cond → Expr == Expr | Cond && Cond\n";

// The same language with && made left-associative.
const char* DISAMBIGUATED_MINIMAL_GRAMMAR =
    "Program → Stmt\n"
    "Stmt → Expr ; | Cond ;\n"
    "Expr → Factor\n"
    "Factor → IDENTIFIER | FunctionCall | ( Expr )\n"
    "FunctionCall → IDENTIFIER ( )\n"
    "Cond → Rel | Cond && Rel\n"
    "Rel → Expr == Expr\n";

struct Built {
    std::shared_ptr<const Grammar::Grammar> grammar;
    Grammar::GrammarSets sets;
    LR::Automaton automaton;
    LR::ParseTable table;
};

Built build(const std::string& text, TableKind kind) {
    auto parsed = Grammar::Grammar::parse(text);
    parsed.augment();
    Built built;
    built.grammar = std::make_shared<const Grammar::Grammar>(std::move(parsed));
    built.sets = Grammar::computeSets(*built.grammar);
    built.automaton = LR::AutomatonBuilder(built.grammar, built.sets).build(LR::itemKindFor(kind));
    built.table = LR::TableBuilder(built.sets).build(built.automaton, kind);
    return built;
}

bool hasConflictOn(const LR::ParseTable& table, const std::string& symbol, ConflictKind kind) {
    return std::any_of(table.conflicts.begin(), table.conflicts.end(), [&](const LR::Conflict& conflict) {
        return conflict.symbol == symbol && conflict.kind == kind;
    });
}

}  // namespace

TEST(ActionTest, Rendering) {
    EXPECT_EQ(LR::Action(ActionType::SHIFT, 4).toString(), "s4");
    EXPECT_EQ(LR::Action(ActionType::REDUCE, 2).toString(), "r2");
    EXPECT_EQ(LR::Action(ActionType::ACCEPT).toString(), "accept");
    EXPECT_EQ(LR::toString(TableKind::LALR1), "LALR(1)");
    EXPECT_EQ(LR::toString(ConflictKind::REDUCE_REDUCE), "reduce-reduce");
}

TEST(LrTableTest, Lr0TableForDragonGrammar) {
    Built built = build(DRAGON_GRAMMAR, TableKind::LR0);
    const auto& table = built.table;

    EXPECT_TRUE(table.isConflictFree());
    EXPECT_EQ(table.cellText(0, "c"), "s3");
    EXPECT_EQ(table.cellText(0, "d"), "s4");
    EXPECT_EQ(table.gotoState(0, "C"), 1);
    EXPECT_EQ(table.gotoState(0, "S"), 2);
    EXPECT_EQ(table.cellText(2, "$"), "accept");

    // LR(0) reduces on every terminal.
    int reduceD = built.grammar->productionNumber("C", {"d"});
    for (const char* terminal : {"c", "d", "$"}) {
        const LR::ActionCell* cell = table.cell(4, terminal);
        ASSERT_NE(cell, nullptr);
        ASSERT_EQ(cell->size(), 1u);
        EXPECT_EQ(cell->front(), LR::Action(ActionType::REDUCE, reduceD));
    }
    EXPECT_EQ(table.cell(4, "x"), nullptr);
    EXPECT_EQ(table.gotoState(4, "C"), -1);
}

TEST(LrTableTest, SlrReducesOnFollowOnly) {
    Built built = build(DRAGON_GRAMMAR, TableKind::SLR1);
    int reduceS = built.grammar->productionNumber("S", {"C", "C"});

    EXPECT_TRUE(built.table.isConflictFree());
    EXPECT_EQ(built.table.cellText(5, "$"), "r" + std::to_string(reduceS));
    EXPECT_EQ(built.table.cell(5, "c"), nullptr);
    EXPECT_EQ(built.table.cell(5, "d"), nullptr);
}

TEST(LrTableTest, ClrReducesOnItemLookaheadOnly) {
    Built built = build(DRAGON_GRAMMAR, TableKind::CLR1);

    EXPECT_TRUE(built.table.isConflictFree());
    for (const auto& state : built.automaton.states) {
        for (const auto& item : state.items) {
            if (!item.isComplete() || item.production->number == 0)
                continue;
            const LR::ActionCell* cell = built.table.cell(state.stateId, item.lookahead);
            ASSERT_NE(cell, nullptr);
            EXPECT_EQ(cell->front(), LR::Action(ActionType::REDUCE, item.production->number));
        }
    }
}

TEST(LrTableTest, ShiftReduceConflictIsRecordedNotResolved) {
    Built built = build(RIGHT_RECURSIVE_SUM, TableKind::LR0);
    const auto& table = built.table;

    ASSERT_EQ(table.conflicts.size(), 1u);
    const LR::Conflict& conflict = table.conflicts.front();
    EXPECT_EQ(conflict.state, 2);
    EXPECT_EQ(conflict.symbol, "+");
    EXPECT_EQ(conflict.kind, ConflictKind::SHIFT_REDUCE);
    EXPECT_EQ(conflict.action1, "s4");
    EXPECT_EQ(conflict.action2, "r2");
    EXPECT_EQ(conflict.actions.size(), 2u);
    EXPECT_EQ(table.cellText(2, "+"), "s4 / r2");
    EXPECT_EQ(conflict.toString(), "state 2, symbol +: shift-reduce (s4 / r2)");
    EXPECT_FALSE(table.isConflictFree());

    EXPECT_TRUE(build(RIGHT_RECURSIVE_SUM, TableKind::SLR1).table.isConflictFree());
}

TEST(LrTableTest, SlrConflictThatLalrResolves) {
    EXPECT_TRUE(hasConflictOn(build(ASSIGNMENT_GRAMMAR, TableKind::SLR1).table, "=", ConflictKind::SHIFT_REDUCE));
    EXPECT_TRUE(build(ASSIGNMENT_GRAMMAR, TableKind::CLR1).table.isConflictFree());
    EXPECT_TRUE(build(ASSIGNMENT_GRAMMAR, TableKind::LALR1).table.isConflictFree());
}

TEST(LrTableTest, ReduceReduceConflict) {
    Built built = build("S → A | B\nA → x\nB → x\n", TableKind::SLR1);

    ASSERT_EQ(built.table.conflicts.size(), 1u);
    EXPECT_EQ(built.table.conflicts.front().kind, ConflictKind::REDUCE_REDUCE);
    EXPECT_EQ(built.table.conflicts.front().symbol, "$");
}

TEST(LrTableTest, MinimalGrammarConflictsUnderLr0) {
    Built built = build(MINIMAL_GRAMMAR, TableKind::LR0);

    EXPECT_FALSE(built.table.isConflictFree());
    // IDENTIFIER alone or IDENTIFIER ( ) for a call.
    EXPECT_TRUE(hasConflictOn(built.table, "(", ConflictKind::SHIFT_REDUCE));
}

TEST(LrTableTest, ClrSettlesTheCallAmbiguity) {
    Built built = build(MINIMAL_GRAMMAR, TableKind::CLR1);

    EXPECT_FALSE(hasConflictOn(built.table, "(", ConflictKind::SHIFT_REDUCE));
    // What is left is the ambiguity of Cond && Cond itself.
    for (const auto& conflict : built.table.conflicts)
        EXPECT_EQ(conflict.symbol, "&&") << conflict.toString();
}

TEST(LrTableTest, DisambiguatedMinimalGrammarIsClr) {
    EXPECT_TRUE(build(DISAMBIGUATED_MINIMAL_GRAMMAR, TableKind::CLR1).table.isConflictFree());
    EXPECT_TRUE(build(DISAMBIGUATED_MINIMAL_GRAMMAR, TableKind::LALR1).table.isConflictFree());
    EXPECT_FALSE(build(DISAMBIGUATED_MINIMAL_GRAMMAR, TableKind::LR0).table.isConflictFree());
}

TEST(LrTableTest, SlrConflictsAreLr0Conflicts) {
    for (const char* text : {DRAGON_GRAMMAR, RIGHT_RECURSIVE_SUM, ASSIGNMENT_GRAMMAR, MINIMAL_GRAMMAR}) {
        Built lr0 = build(text, TableKind::LR0);
        Built slr = build(text, TableKind::SLR1);

        std::set<std::pair<int, std::string>> lr0Cells;
        for (const auto& conflict : lr0.table.conflicts)
            lr0Cells.insert({conflict.state, conflict.symbol});
        for (const auto& conflict : slr.table.conflicts)
            EXPECT_TRUE(lr0Cells.count({conflict.state, conflict.symbol})) << conflict.toString();
        EXPECT_LE(slr.table.conflicts.size(), lr0.table.conflicts.size());
    }
}

TEST(LrTableTest, GotoEntriesMirrorNonTerminalTransitions) {
    Built built = build(ASSIGNMENT_GRAMMAR, TableKind::CLR1);

    for (const auto& state : built.automaton.states) {
        for (const auto& edge : state.transitions) {
            if (built.grammar->isNonTerminal(edge.first))
                EXPECT_EQ(built.table.gotoState(state.stateId, edge.first), edge.second);
            else
                EXPECT_EQ(built.table.gotoState(state.stateId, edge.first), -1);
        }
    }
}

TEST(LrTableTest, RejectsMismatchedItemKind) {
    Built built = build(DRAGON_GRAMMAR, TableKind::LR0);
    LR::TableBuilder builder(built.sets);

    EXPECT_THROW(builder.build(built.automaton, TableKind::CLR1), std::invalid_argument);
    EXPECT_THROW(builder.build(built.automaton, TableKind::LALR1), std::invalid_argument);
    EXPECT_NO_THROW(builder.build(built.automaton, TableKind::SLR1));
}

TEST(LrTableTest, EmptyProductionsReduceOnLookahead) {
    Built built = build("S → A b\nA → a | ε\n", TableKind::CLR1);
    int reduceEmpty = built.grammar->productionNumber("A", {});

    EXPECT_TRUE(built.table.isConflictFree());
    EXPECT_EQ(built.table.cellText(0, "b"), "r" + std::to_string(reduceEmpty));
    EXPECT_EQ(built.table.cellText(0, "a").substr(0, 1), "s");
}
