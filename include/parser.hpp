#pragma once
#include <initializer_list>
#include <string>
#include <vector>
#include "ast.hpp"
#include "common.hpp"
#include "tokenizer.hpp"

namespace Parser {

// Unwinds to the nearest recovery point; never escapes Parser::parse.
class ParseError : public CompilerError {
   public:
    ParseError(const Tokenizer::Token& near, const std::string& message)
        : CompilerError(SourceLocation("<tokens>", near.start_row, near.start_col), message) {}
};

// Recursive descent, one token of lookahead.
//
//   Program    := FunctionDecl* Stmt*
//   Condition  := Or
//   Or         := And ('||' And)*
//   And        := Relational ('&&' Relational)*
//   Relational := '!' Relational | '(' Condition ')' [arith...] [relop Expr] | Expr [relop Expr]
//   Expr       := Term (('+' | '-') Term)*
//   Term       := Unary (('*' | '/' | '%') Unary)*
//   Unary      := '-' Unary | Primary
//   Primary    := IDENTIFIER | IDENTIFIER '(' Args ')' | literal | '(' Expr ')'
class Parser {
   public:
    Parser(const Tokenizer::TokenList& tokens, ErrorHandler& errors);

    // Syntax errors are recorded in the handler; the returned tree holds
    // whatever parsed cleanly.
    AST::Program parse();

   private:
    const Tokenizer::TokenList& tokens;
    ErrorHandler& errors;
    size_t pos = 0;
    AST::NodeId nextId = 0;

    const Tokenizer::Token& current() const;
    const Tokenizer::Token& peek(size_t ahead = 1) const;
    bool check(Tokenizer::TokenType type) const;
    bool checkAny(std::initializer_list<Tokenizer::TokenType> types) const;
    void advance();
    const Tokenizer::Token& expect(Tokenizer::TokenType type);
    [[noreturn]] void fail(const std::string& message) const;
    void record(const ParseError& error);
    void synchronize();

    AST::ExprPtr makeExpr(int line, decltype(AST::Expr::node) node);
    AST::StmtPtr makeStmt(int line, decltype(AST::Stmt::node) node);

    AST::FunctionDecl parseFunctionDecl();
    std::vector<AST::Param> parseParamList();
    AST::Param parseParam();

    std::vector<AST::StmtPtr> parseStmtList();
    AST::StmtPtr parseStmt();
    AST::StmtPtr parseDeclStmt();
    AST::StmtPtr parseAssignStmt();
    AST::StmtPtr parseIfStmt();
    AST::StmtPtr parseLoopStmt();
    AST::StmtPtr parsePrintStmt();
    AST::StmtPtr parseInputStmt();
    AST::StmtPtr parseReturnStmt();
    AST::Block parseBlock();

    AST::ExprPtr parseCondition();
    AST::ExprPtr parseLogicalOr();
    AST::ExprPtr parseLogicalAnd();
    AST::ExprPtr parseRelational();
    AST::ExprPtr parseRelationalTail(AST::ExprPtr left);
    AST::ExprPtr parseExpr();
    AST::ExprPtr parseAdditive();
    AST::ExprPtr continueAdditive(AST::ExprPtr left);
    AST::ExprPtr parseMultiplicative();
    AST::ExprPtr continueMultiplicative(AST::ExprPtr left);
    AST::ExprPtr parseUnary();
    AST::ExprPtr parsePrimary();
    AST::FunctionCall parseCall();
};

// "007" -> "7", "5." -> "5.0", "3.50" -> "3.5"
std::string normalizeNumber(const std::string& lexeme, bool isFloat);

}  // namespace Parser
