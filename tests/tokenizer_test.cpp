#include <gtest/gtest.h>

#include "common.hpp"
#include "tokenizer.hpp"

using Tokenizer::TokenList;
using Tokenizer::TokenType;

namespace {

class TokenizerTest : public ::testing::Test {
   protected:
    ErrorHandler errors;

    TokenList tokenize(const std::string& source) {
        return Tokenizer::Tokenizer(errors).tokenize(source);
    }

    std::vector<std::string> rendered(const std::string& source) {
        std::vector<std::string> names;
        for (const auto& token : tokenize(source))
            names.push_back(token.toString());
        return names;
    }
};

}  // namespace

TEST_F(TokenizerTest, DeclarationAssignmentAndShow) {
    EXPECT_EQ(rendered("int x; x = 5 + 3; show x;"),
              (std::vector<std::string>{"INT", "IDENTIFIER(x)", "SEMICOLON", "IDENTIFIER(x)", "ASSIGN",
                                        "INTEGER_LITERAL(5)", "PLUS", "INTEGER_LITERAL(3)", "SEMICOLON", "SHOW",
                                        "IDENTIFIER(x)", "SEMICOLON", "EOF"}));
    EXPECT_FALSE(errors.hasErrors());
}

TEST_F(TokenizerTest, KeywordsAndIdentifiers) {
    TokenList tokens = tokenize("func void if elif else loop from to step tell return char float iffy _tmp1");

    std::vector<TokenType> expected{TokenType::FUNC, TokenType::VOID, TokenType::IF, TokenType::ELIF,
                                    TokenType::ELSE, TokenType::LOOP, TokenType::FROM, TokenType::TO,
                                    TokenType::STEP, TokenType::TELL, TokenType::RETURN, TokenType::CHAR,
                                    TokenType::FLOAT, TokenType::IDENTIFIER, TokenType::IDENTIFIER,
                                    TokenType::END_OF_FILE};
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i)
        EXPECT_EQ(tokens[i].type, expected[i]) << i;
    EXPECT_EQ(tokens[13].matched, "iffy");
    EXPECT_EQ(tokens[14].matched, "_tmp1");
}

TEST_F(TokenizerTest, TwoCharacterOperatorsWin) {
    EXPECT_EQ(rendered("== != <= >= && || = ! < >"),
              (std::vector<std::string>{"EQ", "NEQ", "LTE", "GTE", "AND", "OR", "ASSIGN", "NOT", "LT", "GT", "EOF"}));
    EXPECT_EQ(rendered("a<=b"), (std::vector<std::string>{"IDENTIFIER(a)", "LTE", "IDENTIFIER(b)", "EOF"}));
}

TEST_F(TokenizerTest, NumbersAndCharacters) {
    EXPECT_EQ(rendered("42 3.14 5. 'a' ' '"),
              (std::vector<std::string>{"INTEGER_LITERAL(42)", "FLOAT_LITERAL(3.14)", "FLOAT_LITERAL(5.)",
                                        "CHAR_LITERAL(a)", "CHAR_LITERAL( )", "EOF"}));
}

TEST_F(TokenizerTest, CommentsAndPositions) {
    TokenList tokens = tokenize("// header\nint  x; // trailing\n  x = 1;");

    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_EQ(tokens[0].type, TokenType::INT);
    EXPECT_EQ(tokens[0].start_row, 2);
    EXPECT_EQ(tokens[0].start_col, 1);
    EXPECT_EQ(tokens[1].start_col, 6);
    EXPECT_EQ(tokens[3].start_row, 3);
    EXPECT_EQ(tokens[3].start_col, 3);
    EXPECT_EQ(tokens.back().type, TokenType::END_OF_FILE);
}

TEST_F(TokenizerTest, SlashAloneIsDivision) {
    EXPECT_EQ(rendered("a / b % c"), (std::vector<std::string>{"IDENTIFIER(a)", "DIVIDE", "IDENTIFIER(b)", "MODULO",
                                                               "IDENTIFIER(c)", "EOF"}));
}

TEST_F(TokenizerTest, UnknownCharactersAreReportedAndSkipped) {
    EXPECT_EQ(rendered("x @ y & z"),
              (std::vector<std::string>{"IDENTIFIER(x)", "IDENTIFIER(y)", "IDENTIFIER(z)", "EOF"}));
    ASSERT_EQ(errors.lexicalErrors().size(), 2u);
    EXPECT_EQ(errors.lexicalErrors()[0].toString(), "Lexical Error at 1:3: Unknown character '@'");
    EXPECT_EQ(errors.lexicalErrors()[1].message, "Unknown character '&'");
}

TEST_F(TokenizerTest, SecondDecimalPointIsAnError) {
    EXPECT_EQ(rendered("1.2.3 x"), (std::vector<std::string>{"FLOAT_LITERAL(1.2)", "IDENTIFIER(x)", "EOF"}));
    ASSERT_EQ(errors.lexicalErrors().size(), 1u);
    EXPECT_EQ(errors.lexicalErrors()[0].message, "Invalid number format");
    EXPECT_EQ(errors.lexicalErrors()[0].column, 4);
}

TEST_F(TokenizerTest, MalformedCharLiterals) {
    EXPECT_EQ(rendered("'' 'ab' x\n'q"), (std::vector<std::string>{"IDENTIFIER(x)", "EOF"}));

    const auto& lexical = errors.lexicalErrors();
    ASSERT_EQ(lexical.size(), 3u);
    EXPECT_EQ(lexical[0].message, "Empty char literal");
    EXPECT_EQ(lexical[1].message, "Char literal must be single character");
    EXPECT_EQ(lexical[1].column, 4);
    EXPECT_EQ(lexical[2].message, "Unterminated char literal");
    EXPECT_EQ(lexical[2].line, 2);
}

TEST_F(TokenizerTest, MultiByteCharactersCountOnce) {
    TokenList tokens = tokenize("x = 5 \xE2\x82\xAC 3; char c = '\xC3\xA9';");

    const auto& lexical = errors.lexicalErrors();
    ASSERT_EQ(lexical.size(), 1u);
    EXPECT_EQ(lexical[0].toString(), "Lexical Error at 1:7: Unknown character '\xE2\x82\xAC'");

    ASSERT_EQ(tokens.size(), 11u);
    EXPECT_EQ(tokens[3].toString(), "INTEGER_LITERAL(3)");
    EXPECT_EQ(tokens[3].start_col, 9);
    EXPECT_EQ(tokens[8].toString(), "CHAR_LITERAL(\xC3\xA9)");
    EXPECT_EQ(tokens[8].start_col, 21);
    EXPECT_EQ(tokens[9].start_col, 24);
}

TEST_F(TokenizerTest, MultiByteCharLiteralStillNeedsOneCharacter) {
    EXPECT_EQ(rendered("'\xC3\xA9\xC3\xA9' x"), (std::vector<std::string>{"IDENTIFIER(x)", "EOF"}));
    ASSERT_EQ(errors.lexicalErrors().size(), 1u);
    EXPECT_EQ(errors.lexicalErrors()[0].message, "Char literal must be single character");
}

TEST_F(TokenizerTest, EmptyInputStillEndsWithEof) {
    TokenList tokens = tokenize("   \n// only a comment");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::END_OF_FILE);
}

TEST(TokenTest, Rendering) {
    EXPECT_EQ(Tokenizer::tokenTypeName(TokenType::END_OF_FILE), "EOF");
    EXPECT_EQ((Tokenizer::Token{TokenType::SEMICOLON, ";", 1, 1}).toString(), "SEMICOLON");
    EXPECT_EQ((Tokenizer::Token{TokenType::FLOAT_LITERAL, "2.5", 1, 1}).toString(), "FLOAT_LITERAL(2.5)");
    EXPECT_EQ(Tokenizer::Tokenizer::keywords().size(), 15u);
}
