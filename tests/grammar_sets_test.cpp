#include <gtest/gtest.h>

#include "grammar.hpp"
#include "grammar_sets.hpp"

using Grammar::SymbolSet;

namespace {

const char* EXPRESSION_GRAMMAR =
    "E → T E'\n"
    "E' → + T E' | ε\n"
    "T → F T'\n"
    "T' → * F T' | ε\n"
    "F → ( E ) | id\n";

class GrammarSetsTest : public ::testing::Test {
   protected:
    Grammar::Grammar grammar = Grammar::Grammar::parse(EXPRESSION_GRAMMAR);
    Grammar::GrammarSets sets = Grammar::computeSets(grammar);
};

}  // namespace

TEST_F(GrammarSetsTest, Nullable) {
    EXPECT_EQ(sets.nullable, (SymbolSet{"E'", "T'"}));
    EXPECT_FALSE(sets.isNullable("E"));
    EXPECT_FALSE(sets.isNullable("id"));
}

TEST_F(GrammarSetsTest, FirstSets) {
    EXPECT_EQ(sets.firstOf("E"), (SymbolSet{"(", "id"}));
    EXPECT_EQ(sets.firstOf("T"), (SymbolSet{"(", "id"}));
    EXPECT_EQ(sets.firstOf("F"), (SymbolSet{"(", "id"}));
    EXPECT_EQ(sets.firstOf("E'"), (SymbolSet{"+", Grammar::EPSILON}));
    EXPECT_EQ(sets.firstOf("T'"), (SymbolSet{"*", Grammar::EPSILON}));
    EXPECT_EQ(sets.firstOf("id"), (SymbolSet{"id"}));
    EXPECT_TRUE(sets.firstOf("unknown").empty());
}

TEST_F(GrammarSetsTest, FollowSets) {
    EXPECT_EQ(sets.followOf("E"), (SymbolSet{"$", ")"}));
    EXPECT_EQ(sets.followOf("E'"), (SymbolSet{"$", ")"}));
    EXPECT_EQ(sets.followOf("T"), (SymbolSet{"$", ")", "+"}));
    EXPECT_EQ(sets.followOf("T'"), (SymbolSet{"$", ")", "+"}));
    EXPECT_EQ(sets.followOf("F"), (SymbolSet{"$", ")", "*", "+"}));
    EXPECT_TRUE(sets.followConverged);
}

TEST_F(GrammarSetsTest, FollowNeverContainsEpsilon) {
    for (const auto& entry : sets.follow)
        EXPECT_EQ(entry.second.count(Grammar::EPSILON), 0u) << entry.first;
}

TEST_F(GrammarSetsTest, FirstOfSequence) {
    EXPECT_EQ(sets.firstOfSequence({"T'", "E'"}), (SymbolSet{"*", "+", Grammar::EPSILON}));
    EXPECT_EQ(sets.firstOfSequence({"T'", "id"}), (SymbolSet{"*", "id"}));
    EXPECT_EQ(sets.firstOfSequence({"+", "T", "E'"}, 1), (SymbolSet{"(", "id"}));
    EXPECT_EQ(sets.firstOfSequence({"E"}, 1), (SymbolSet{Grammar::EPSILON}));
    EXPECT_TRUE(sets.sequenceNullable({"T'", "E'"}));
    EXPECT_FALSE(sets.sequenceNullable({"T'", "F"}));
}

TEST(GrammarSetsStandaloneTest, NullableIsTransitive) {
    auto grammar = Grammar::Grammar::parse("S → A B\nA → ε\nB → A\n");
    auto nullable = Grammar::computeNullable(grammar);

    EXPECT_EQ(nullable, (SymbolSet{"A", "B", "S"}));
    auto first = Grammar::computeFirst(grammar, nullable);
    EXPECT_EQ(first["S"], (SymbolSet{Grammar::EPSILON}));
}

TEST(GrammarSetsStandaloneTest, FirstLooksPastNullablePrefixes) {
    auto grammar = Grammar::Grammar::parse("S → A B c\nA → a | ε\nB → b | ε\n");
    auto sets = Grammar::computeSets(grammar);

    EXPECT_EQ(sets.firstOf("S"), (SymbolSet{"a", "b", "c"}));
    EXPECT_EQ(sets.followOf("A"), (SymbolSet{"b", "c"}));
    EXPECT_EQ(sets.followOf("B"), (SymbolSet{"c"}));
    EXPECT_EQ(sets.followOf("S"), (SymbolSet{"$"}));
}

TEST(GrammarSetsStandaloneTest, AugmentedStartFollowsWithEndMarker) {
    auto grammar = Grammar::Grammar::parse("S → a S | b\n");
    grammar.augment();
    auto sets = Grammar::computeSets(grammar);

    EXPECT_EQ(sets.followOf("SBar"), (SymbolSet{"$"}));
    EXPECT_EQ(sets.followOf("S"), (SymbolSet{"$"}));
}

TEST(GrammarSetsStandaloneTest, FollowIterationCapIsReported) {
    auto grammar = Grammar::Grammar::parse(EXPRESSION_GRAMMAR);
    auto nullable = Grammar::computeNullable(grammar);
    auto first = Grammar::computeFirst(grammar, nullable);

    auto capped = Grammar::computeFollow(grammar, first, nullable, 1);
    EXPECT_FALSE(capped.converged);
    EXPECT_EQ(capped.iterations, 1);

    auto full = Grammar::computeFollow(grammar, first, nullable);
    EXPECT_TRUE(full.converged);
    EXPECT_GT(full.iterations, 1);
}
