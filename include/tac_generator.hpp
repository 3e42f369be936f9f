#pragma once

#include <string>
#include "ast.hpp"
#include "semantic_analyzer.hpp"
#include "tac.hpp"

namespace TAC {

// Lowers a checked program to three-address code. Temporaries (t0, t1, ...)
// and labels (L0, L1, ...) are numbered per generator and never reused.
class TacGenerator {
   public:
    explicit TacGenerator(const Semantic::Annotations& annotations)
        : annotations(annotations) {}

    // Layout: every function, then MAIN: ... END_MAIN.
    Code generate(const AST::Program& program);

   private:
    const Semantic::Annotations& annotations;
    Code code;
    int tempVarCounter = 0;
    int labelCounter = 0;

    std::string createTemp();
    std::string createLabel();
    void addInstruction(std::shared_ptr<Instruction> inst);

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

    // Each returns the operand holding the expression's value.
    std::string visitExpr(const AST::Expr& expr);
    std::string visitExpr(const AST::BinaryOp& op);
    std::string visitExpr(const AST::UnaryOp& op);
    std::string visitExpr(const AST::Identifier& identifier);
    std::string visitExpr(const AST::Literal& literal);
    std::string visitExpr(const AST::FunctionCall& call);
};

}  // namespace TAC
