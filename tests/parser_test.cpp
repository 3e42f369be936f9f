#include <gtest/gtest.h>

#include <set>

#include "ast.hpp"
#include "common.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

namespace {

class ParserTest : public ::testing::Test {
   protected:
    ErrorHandler errors;
    Tokenizer::TokenList tokens;

    AST::Program parse(const std::string& source) {
        tokens = Tokenizer::Tokenizer(errors).tokenize(source);
        return Parser::Parser(tokens, errors).parse();
    }

    std::vector<std::string> syntaxMessages() const {
        std::vector<std::string> messages;
        for (const auto& diagnostic : errors.syntaxErrors())
            messages.push_back(diagnostic.message);
        return messages;
    }
};

template <typename T>
const T& as(const AST::Stmt& stmt) {
    return std::get<T>(stmt.node);
}

template <typename T>
const T& as(const AST::Expr& expr) {
    return std::get<T>(expr.node);
}

}  // namespace

TEST_F(ParserTest, DeclarationAssignmentAndShow) {
    AST::Program program = parse("int x; x = 5 + 3; show x;");

    ASSERT_FALSE(errors.hasErrors());
    ASSERT_EQ(program.statements.size(), 3u);
    const auto& decl = as<AST::DeclStmt>(*program.statements[0]);
    EXPECT_EQ(decl.type, AST::DataType::INT);
    EXPECT_EQ(decl.name, "x");
    EXPECT_EQ(decl.init, nullptr);

    const auto& assign = as<AST::AssignStmt>(*program.statements[1]);
    const auto& sum = as<AST::BinaryOp>(*assign.value);
    EXPECT_EQ(sum.op, "+");
    EXPECT_EQ(as<AST::Literal>(*sum.left).value, "5");
    EXPECT_EQ(as<AST::Literal>(*sum.right).value, "3");

    const auto& show = as<AST::PrintStmt>(*program.statements[2]);
    ASSERT_EQ(show.values.size(), 1u);
    EXPECT_EQ(as<AST::Identifier>(*show.values[0]).name, "x");
}

TEST_F(ParserTest, PrecedenceAndAssociativity) {
    AST::Program program = parse("x = 1 - 2 - 3 * -4;");

    ASSERT_FALSE(errors.hasErrors());
    const auto& outer = as<AST::BinaryOp>(*as<AST::AssignStmt>(*program.statements[0]).value);
    EXPECT_EQ(outer.op, "-");
    EXPECT_EQ(as<AST::BinaryOp>(*outer.left).op, "-");
    const auto& product = as<AST::BinaryOp>(*outer.right);
    EXPECT_EQ(product.op, "*");
    EXPECT_EQ(as<AST::UnaryOp>(*product.right).op, "-");
}

TEST_F(ParserTest, ConditionsBindOrBelowAnd) {
    AST::Program program = parse("if (a < 1 || b == 2 && !c > 3) { }");

    ASSERT_FALSE(errors.hasErrors());
    const auto& ifStmt = as<AST::IfStmt>(*program.statements[0]);
    const auto& orOp = as<AST::BinaryOp>(*ifStmt.condition);
    EXPECT_EQ(orOp.op, "||");
    EXPECT_EQ(as<AST::BinaryOp>(*orOp.left).op, "<");
    const auto& andOp = as<AST::BinaryOp>(*orOp.right);
    EXPECT_EQ(andOp.op, "&&");
    EXPECT_EQ(as<AST::UnaryOp>(*andOp.right).op, "!");
}

TEST_F(ParserTest, GroupedConditionMayContinueAsArithmetic) {
    AST::Program program = parse("if ((a + b) * 2 > c) { }");

    ASSERT_FALSE(errors.hasErrors());
    const auto& comparison = as<AST::BinaryOp>(*as<AST::IfStmt>(*program.statements[0]).condition);
    EXPECT_EQ(comparison.op, ">");
    const auto& product = as<AST::BinaryOp>(*comparison.left);
    EXPECT_EQ(product.op, "*");
    EXPECT_EQ(as<AST::BinaryOp>(*product.left).op, "+");
}

TEST_F(ParserTest, IfElifElse) {
    AST::Program program = parse("if (x > 1) { show 1; } elif (x > 0) { show 2; } elif (x == 0) { } else { show 3; }");

    ASSERT_FALSE(errors.hasErrors());
    const auto& ifStmt = as<AST::IfStmt>(*program.statements[0]);
    EXPECT_EQ(ifStmt.thenBlock.statements.size(), 1u);
    EXPECT_EQ(ifStmt.elifs.size(), 2u);
    ASSERT_NE(ifStmt.elseBlock, nullptr);
    EXPECT_EQ(ifStmt.elseBlock->statements.size(), 1u);
}

TEST_F(ParserTest, LoopForms) {
    AST::Program program = parse("loop from i = 0 to 10 step 2 { show i; }\n"
                                 "loop from j to 5 { }\n"
                                 "loop (k < 3) { k = k + 1; }");

    ASSERT_FALSE(errors.hasErrors());
    ASSERT_EQ(program.statements.size(), 3u);

    const auto& counted = as<AST::LoopStmt>(*program.statements[0]);
    EXPECT_EQ(counted.variable, "i");
    EXPECT_FALSE(counted.reusesVariable);
    ASSERT_NE(counted.start, nullptr);
    ASSERT_NE(counted.step, nullptr);
    EXPECT_EQ(as<AST::Literal>(*counted.step).value, "2");

    const auto& reuse = as<AST::LoopStmt>(*program.statements[1]);
    EXPECT_TRUE(reuse.reusesVariable);
    EXPECT_EQ(reuse.start, nullptr);
    EXPECT_EQ(reuse.step, nullptr);

    const auto& conditional = as<AST::ConditionalLoopStmt>(*program.statements[2]);
    EXPECT_EQ(as<AST::BinaryOp>(*conditional.condition).op, "<");
    EXPECT_EQ(conditional.body.statements.size(), 1u);
}

TEST_F(ParserTest, FunctionsAndCalls) {
    AST::Program program = parse("func int add(int a, int b) { return a + b; }\n"
                                 "func void hello() { show 'h'; return; }\n"
                                 "int r = add(2, 3);\n"
                                 "hello();");

    ASSERT_FALSE(errors.hasErrors());
    ASSERT_EQ(program.functions.size(), 2u);
    const auto& add = program.functions[0];
    EXPECT_EQ(add.name, "add");
    EXPECT_EQ(add.returnType, AST::DataType::INT);
    ASSERT_EQ(add.params.size(), 2u);
    EXPECT_EQ(add.params[1].name, "b");
    EXPECT_EQ(program.functions[1].returnType, AST::DataType::VOID);
    EXPECT_TRUE(program.functions[1].params.empty());

    const auto& call = as<AST::FunctionCall>(*as<AST::DeclStmt>(*program.statements[0]).init);
    EXPECT_EQ(call.name, "add");
    EXPECT_EQ(call.arguments.size(), 2u);
    EXPECT_EQ(as<AST::FunctionCall>(*program.statements[1]).name, "hello");
}

TEST_F(ParserTest, InputAndNestedBlocks) {
    AST::Program program = parse("tell x; { int y; { y = 1; } }");

    ASSERT_FALSE(errors.hasErrors());
    EXPECT_EQ(as<AST::InputStmt>(*program.statements[0]).name, "x");
    const auto& outer = as<AST::Block>(*program.statements[1]);
    ASSERT_EQ(outer.statements.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<AST::Block>(outer.statements[1]->node));
}

TEST_F(ParserTest, NumbersAreNormalized) {
    EXPECT_EQ(Parser::normalizeNumber("007", false), "7");
    EXPECT_EQ(Parser::normalizeNumber("0", false), "0");
    EXPECT_EQ(Parser::normalizeNumber("5.", true), "5.0");
    EXPECT_EQ(Parser::normalizeNumber("3.50", true), "3.5");
    EXPECT_EQ(Parser::normalizeNumber("00.25", true), "0.25");

    AST::Program program = parse("float f = 2.50;");
    EXPECT_EQ(as<AST::Literal>(*as<AST::DeclStmt>(*program.statements[0]).init).value, "2.5");
}

TEST_F(ParserTest, NodeIdsAreUnique) {
    AST::Program program = parse("int a = 1 + 2; a = a * 3;");

    const auto& decl = *program.statements[0];
    const auto& init = *as<AST::DeclStmt>(decl).init;
    const auto& sum = as<AST::BinaryOp>(init);
    std::set<AST::NodeId> ids{decl.id, init.id, sum.left->id, sum.right->id, program.statements[1]->id};
    EXPECT_EQ(ids.size(), 5u);
}

TEST_F(ParserTest, RecoversAtTheNextStatement) {
    AST::Program program = parse("int x = ;\nx = 2;\nshow );\nshow x;");

    EXPECT_EQ(syntaxMessages(), (std::vector<std::string>{"Unexpected token in expression: SEMICOLON",
                                                          "Unexpected token in expression: RPAREN"}));
    EXPECT_EQ(errors.syntaxErrors()[0].line, 1);
    EXPECT_EQ(errors.syntaxErrors()[1].line, 3);
    ASSERT_EQ(program.statements.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<AST::AssignStmt>(program.statements[0]->node));
    EXPECT_TRUE(std::holds_alternative<AST::PrintStmt>(program.statements[1]->node));
}

TEST_F(ParserTest, MissingTokenMessages) {
    parse("int x = 1\nshow x;");
    ASSERT_EQ(syntaxMessages().size(), 1u);
    EXPECT_EQ(syntaxMessages()[0], "Expected SEMICOLON, got SHOW");
}

TEST_F(ParserTest, RecoversInsideBlocks) {
    AST::Program program = parse("if (x > 1) { else; show x; }\nshow 1;");

    EXPECT_EQ(syntaxMessages(), (std::vector<std::string>{"Unexpected token ELSE"}));
    ASSERT_EQ(program.statements.size(), 2u);
    EXPECT_EQ(as<AST::IfStmt>(*program.statements[0]).thenBlock.statements.size(), 1u);
}

TEST_F(ParserTest, BadFunctionHeaders) {
    parse("func bool f() { }\nshow 1;");
    ASSERT_FALSE(syntaxMessages().empty());
    EXPECT_EQ(syntaxMessages()[0], "Expected return type (int, float, char, or void)");

    errors = ErrorHandler();
    parse("func int f(x) { return 1; }");
    ASSERT_FALSE(syntaxMessages().empty());
    EXPECT_EQ(syntaxMessages()[0], "Expected RPAREN, got IDENTIFIER");
}

TEST_F(ParserTest, LoopNeedsAssignOrTo) {
    parse("loop from i 10 { }");
    ASSERT_FALSE(syntaxMessages().empty());
    EXPECT_EQ(syntaxMessages()[0], "Expected '=' or 'to' after loop variable");
}

TEST_F(ParserTest, StrayClosingBrace) {
    parse("show 1; } show 2;");
    EXPECT_EQ(syntaxMessages(), (std::vector<std::string>{"Unexpected tokens after program end"}));
}

TEST(ParserConstructionTest, RequiresEofTerminatedTokens) {
    ErrorHandler errors;
    Tokenizer::TokenList tokens;
    EXPECT_THROW(Parser::Parser(tokens, errors).parse(), std::invalid_argument);
}

TEST(AstPrinterTest, IndentedDump) {
    ErrorHandler errors;
    Tokenizer::TokenList tokens = Tokenizer::Tokenizer(errors).tokenize("func int add(int a, int b) {\n  return a + b;\n}\nint x = add(1, 2);");
    AST::Program program = Parser::Parser(tokens, errors).parse();

    EXPECT_EQ(AST::toString(program),
              "Program\n"
              "  FunctionDecl int add(int a, int b) [line 1]\n"
              "    Block\n"
              "      ReturnStmt [line 2]\n"
              "        BinaryOp +\n"
              "          Identifier a\n"
              "          Identifier b\n"
              "  DeclStmt int x [line 4]\n"
              "    init:\n"
              "      FunctionCall add\n"
              "        Literal int 1\n"
              "        Literal int 2\n");
}
