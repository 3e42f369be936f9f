#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace AST {

enum class DataType {
    INT,
    FLOAT,
    CHAR,
    VOID,
    BOOL,  // result of relational and logical operators, never declared
};

// "int", "float", "char", "void", "bool"
std::string typeName(DataType type);
bool isNumeric(DataType type);

// Unique per node within one parse; keys the semantic side table.
using NodeId = int;

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct BinaryOp {
    std::string op;
    ExprPtr left, right;
};

struct UnaryOp {
    std::string op;  // "-" or "!"
    ExprPtr operand;
};

struct Identifier {
    std::string name;
};

struct Literal {
    std::string value;  // normalized text, the bare character for char literals
    DataType type;
};

struct FunctionCall {
    std::string name;
    std::vector<ExprPtr> arguments;
};

struct Expr {
    NodeId id;
    int line;
    std::variant<BinaryOp, UnaryOp, Identifier, Literal, FunctionCall> node;
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

struct Block {
    std::vector<StmtPtr> statements;
};

struct DeclStmt {
    DataType type;
    std::string name;
    ExprPtr init;  // may be null
};

struct AssignStmt {
    std::string name;
    ExprPtr value;
};

struct ElifClause {
    ExprPtr condition;
    Block block;
};

struct IfStmt {
    ExprPtr condition;
    Block thenBlock;
    std::vector<ElifClause> elifs;
    std::unique_ptr<Block> elseBlock;  // may be null
};

// loop from v = start to end [step s] { ... }, or loop from v to end ... on an existing v
struct LoopStmt {
    std::string variable;
    ExprPtr start;  // null when reusesVariable
    ExprPtr end;
    ExprPtr step;  // null means 1
    Block body;
    bool reusesVariable = false;
};

// loop (condition) { ... }
struct ConditionalLoopStmt {
    ExprPtr condition;
    Block body;
};

// show a, b;
struct PrintStmt {
    std::vector<ExprPtr> values;
};

// tell x;
struct InputStmt {
    std::string name;
};

struct ReturnStmt {
    ExprPtr value;  // may be null
};

struct Stmt {
    NodeId id;
    int line;
    std::variant<DeclStmt, AssignStmt, IfStmt, LoopStmt, ConditionalLoopStmt,
                 PrintStmt, InputStmt, ReturnStmt, Block, FunctionCall>
        node;
};

struct Param {
    DataType type;
    std::string name;
};

struct FunctionDecl {
    NodeId id;
    int line;
    DataType returnType;
    std::string name;
    std::vector<Param> params;
    Block body;
};

struct Program {
    std::vector<FunctionDecl> functions;
    std::vector<StmtPtr> statements;
};

// Indented dump, one node per line.
std::string toString(const Program& program);
std::string toString(const Expr& expr);

}  // namespace AST
