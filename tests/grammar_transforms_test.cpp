#include <gtest/gtest.h>

#include "grammar.hpp"
#include "grammar_transforms.hpp"

namespace {

Grammar::Grammar parse(const std::string& text) {
    return Grammar::Grammar::parse(text);
}

bool hasProduction(const Grammar::Grammar& grammar, const std::string& lhs, const std::vector<std::string>& rhs) {
    return grammar.productionNumber(lhs, rhs) >= 0;
}

}  // namespace

TEST(EliminateLeftRecursionTest, RewritesDirectRecursion) {
    auto result = Grammar::eliminateLeftRecursion(parse("E → E + T | T\nT → T * F | F\nF → ( E ) | id\n"));
    const auto& grammar = result.grammar;

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(grammar.startSymbol(), "E");
    EXPECT_EQ(grammar.nonTerminals(), (std::set<std::string>{"E", "E'", "F", "T", "T'"}));
    EXPECT_TRUE(hasProduction(grammar, "E", {"T", "E'"}));
    EXPECT_TRUE(hasProduction(grammar, "E'", {"+", "T", "E'"}));
    EXPECT_TRUE(hasProduction(grammar, "E'", {}));
    EXPECT_TRUE(hasProduction(grammar, "T", {"F", "T'"}));
    EXPECT_TRUE(hasProduction(grammar, "T'", {"*", "F", "T'"}));
    EXPECT_TRUE(hasProduction(grammar, "T'", {}));
    EXPECT_TRUE(hasProduction(grammar, "F", {"(", "E", ")"}));
    EXPECT_FALSE(hasProduction(grammar, "E", {"E", "+", "T"}));
    EXPECT_EQ(grammar.productions().size(), 8u);
}

TEST(EliminateLeftRecursionTest, SubstitutesIndirectRecursion) {
    auto result = Grammar::eliminateLeftRecursion(parse("S → A a | b\nA → S c | d\n"));
    const auto& grammar = result.grammar;

    EXPECT_TRUE(result.changed);
    EXPECT_TRUE(hasProduction(grammar, "S", {"A", "a"}));
    EXPECT_TRUE(hasProduction(grammar, "S", {"b"}));
    EXPECT_TRUE(hasProduction(grammar, "A", {"b", "c", "A'"}));
    EXPECT_TRUE(hasProduction(grammar, "A", {"d", "A'"}));
    EXPECT_TRUE(hasProduction(grammar, "A'", {"a", "c", "A'"}));
    EXPECT_TRUE(hasProduction(grammar, "A'", {}));
    EXPECT_FALSE(hasProduction(grammar, "A", {"S", "c"}));
}

TEST(EliminateLeftRecursionTest, LeavesNonRecursiveGrammarsAlone) {
    auto original = parse("S → a S | b\n");
    auto result = Grammar::eliminateLeftRecursion(original);

    EXPECT_FALSE(result.changed);
    EXPECT_EQ(result.grammar.productions().size(), original.productions().size());
}

TEST(EliminateLeftRecursionTest, FreshNamesSkipTakenOnes) {
    auto result = Grammar::eliminateLeftRecursion(parse("A → A x | y | A'\nA' → z\n"));

    EXPECT_TRUE(result.grammar.isNonTerminal("A''"));
    EXPECT_TRUE(hasProduction(result.grammar, "A''", {"x", "A''"}));
    EXPECT_TRUE(hasProduction(result.grammar, "A", {"A'", "A''"}));
}

TEST(EliminateLeftRecursionTest, KeepsAugmentation) {
    auto grammar = parse("E → E + id | id\n");
    grammar.augment();
    auto result = Grammar::eliminateLeftRecursion(grammar);

    ASSERT_TRUE(result.grammar.isAugmented());
    EXPECT_EQ(result.grammar.production(0).lhs, "EBar");
    EXPECT_TRUE(hasProduction(result.grammar, "E", {"id", "E'"}));
}

TEST(LeftFactorTest, FactorsLongestCommonPrefix) {
    auto result = Grammar::leftFactor(parse("S → if E then S | if E then S else S | other\nE → cond\n"));
    const auto& grammar = result.grammar;

    EXPECT_TRUE(result.changed);
    EXPECT_TRUE(hasProduction(grammar, "S", {"if", "E", "then", "S", "S'"}));
    EXPECT_TRUE(hasProduction(grammar, "S", {"other"}));
    EXPECT_TRUE(hasProduction(grammar, "S'", {}));
    EXPECT_TRUE(hasProduction(grammar, "S'", {"else", "S"}));
    EXPECT_EQ(grammar.productionsFor("S").size(), 2u);
}

TEST(LeftFactorTest, RepeatsUntilNoSharedPrefixRemains) {
    auto result = Grammar::leftFactor(parse("A → a b c | a b d | a e\n"));
    const auto& grammar = result.grammar;

    EXPECT_TRUE(hasProduction(grammar, "A", {"a", "A'"}));
    EXPECT_TRUE(hasProduction(grammar, "A'", {"b", "A''"}));
    EXPECT_TRUE(hasProduction(grammar, "A'", {"e"}));
    EXPECT_TRUE(hasProduction(grammar, "A''", {"c"}));
    EXPECT_TRUE(hasProduction(grammar, "A''", {"d"}));
    EXPECT_EQ(grammar.productions().size(), 5u);
}

TEST(LeftFactorTest, NothingToFactor) {
    auto result = Grammar::leftFactor(parse("S → a | b S\n"));
    EXPECT_FALSE(result.changed);
}
