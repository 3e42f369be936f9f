#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include "ast.hpp"
#include "common.hpp"
#include "symbol_table.hpp"

namespace Semantic {

// Side table filled by the analyzer and read by later phases.
struct Annotations {
    std::map<AST::NodeId, AST::DataType> exprTypes;  // also keyed by call statements
    std::set<AST::NodeId> implicitLoopVariables;     // range loops that declared their variable

    // Throws std::out_of_range for a node the analyzer never typed.
    AST::DataType typeOf(AST::NodeId id) const { return exprTypes.at(id); }
    bool declaresLoopVariable(AST::NodeId loopId) const { return implicitLoopVariables.count(loopId) > 0; }
};

// int widens to float, char widens to int, identical types always match.
bool isTypeCompatible(AST::DataType target, AST::DataType source);
bool areComparable(AST::DataType left, AST::DataType right);
// Empty when the operands are not arithmetic.
std::optional<AST::DataType> arithmeticResult(AST::DataType left, AST::DataType right);

// Syntactic check: a return directly in the block, in a nested block or loop
// body, or in every branch of an if that has an else.
bool returnsOnEveryPath(const AST::Block& block);

class SemanticAnalyzer {
   public:
    explicit SemanticAnalyzer(ErrorHandler& errors)
        : errors(errors) {}

    // Errors go to the handler; analysis always runs to the end.
    Annotations analyze(const AST::Program& program);

    const SymbolTable& symbolTable() const { return table; }
    SymbolTable releaseSymbolTable() { return std::move(table); }

   private:
    ErrorHandler& errors;
    SymbolTable table;
    Annotations annotations;
    std::optional<SymbolEntry> currentFunction;

    void error(int line, const std::string& message);

    void visitFunction(const AST::FunctionDecl& function);
    void visitBlock(const AST::Block& block);

    void visitStmt(const AST::Stmt& stmt);
    void visitStmt(const AST::DeclStmt& decl, const AST::Stmt& stmt);
    void visitStmt(const AST::AssignStmt& assign, const AST::Stmt& stmt);
    void visitStmt(const AST::IfStmt& ifStmt, const AST::Stmt& stmt);
    void visitStmt(const AST::LoopStmt& loop, const AST::Stmt& stmt);
    void visitStmt(const AST::ConditionalLoopStmt& loop, const AST::Stmt& stmt);
    void visitStmt(const AST::PrintStmt& print, const AST::Stmt& stmt);
    void visitStmt(const AST::InputStmt& input, const AST::Stmt& stmt);
    void visitStmt(const AST::ReturnStmt& ret, const AST::Stmt& stmt);
    void visitStmt(const AST::Block& block, const AST::Stmt& stmt);
    void visitStmt(const AST::FunctionCall& call, const AST::Stmt& stmt);

    AST::DataType visitExpr(const AST::Expr& expr);
    AST::DataType typeOf(const AST::BinaryOp& op, int line);
    AST::DataType typeOf(const AST::UnaryOp& op, int line);
    AST::DataType typeOf(const AST::Identifier& identifier, int line);
    AST::DataType typeOf(const AST::Literal& literal, int line);
    AST::DataType typeOf(const AST::FunctionCall& call, int line);

    // nullptr (after recording an error) unless name is a declared variable.
    SymbolEntry* lookupVariable(const std::string& name, int line);
};

}  // namespace Semantic
