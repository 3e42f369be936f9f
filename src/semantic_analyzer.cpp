#include "semantic_analyzer.hpp"

#include <algorithm>
#include <iostream>

namespace Semantic {

using AST::DataType;

bool isTypeCompatible(DataType target, DataType source) {
    if (target == source)
        return true;
    if (target == DataType::FLOAT && source == DataType::INT)
        return true;
    if (target == DataType::INT && source == DataType::CHAR)
        return true;
    return false;
}

bool areComparable(DataType left, DataType right) {
    auto scalar = [](DataType type) {
        return type == DataType::INT || type == DataType::FLOAT || type == DataType::CHAR;
    };
    if (scalar(left) && scalar(right))
        return true;
    return left == right;
}

std::optional<DataType> arithmeticResult(DataType left, DataType right) {
    if (left == DataType::CHAR)
        left = DataType::INT;
    if (right == DataType::CHAR)
        right = DataType::INT;
    if (!AST::isNumeric(left) || !AST::isNumeric(right))
        return std::nullopt;
    return left == DataType::FLOAT || right == DataType::FLOAT ? DataType::FLOAT : DataType::INT;
}

static bool returns(const AST::Stmt& stmt) {
    if (std::holds_alternative<AST::ReturnStmt>(stmt.node))
        return true;
    if (auto block = std::get_if<AST::Block>(&stmt.node))
        return returnsOnEveryPath(*block);
    if (auto loop = std::get_if<AST::LoopStmt>(&stmt.node))
        return returnsOnEveryPath(loop->body);
    if (auto loop = std::get_if<AST::ConditionalLoopStmt>(&stmt.node))
        return returnsOnEveryPath(loop->body);
    if (auto ifStmt = std::get_if<AST::IfStmt>(&stmt.node)) {
        if (!ifStmt->elseBlock || !returnsOnEveryPath(ifStmt->thenBlock) || !returnsOnEveryPath(*ifStmt->elseBlock))
            return false;
        return std::all_of(ifStmt->elifs.begin(), ifStmt->elifs.end(), [](const AST::ElifClause& elif) {
            return returnsOnEveryPath(elif.block);
        });
    }
    return false;
}

bool returnsOnEveryPath(const AST::Block& block) {
    return std::any_of(block.statements.begin(), block.statements.end(), [](const AST::StmtPtr& stmt) {
        return returns(*stmt);
    });
}

void SemanticAnalyzer::error(int line, const std::string& message) {
    Log::trace() << "[SEMA] line " << line << ": " << message << std::endl;
    errors.addSemanticError(line, message);
}

Annotations SemanticAnalyzer::analyze(const AST::Program& program) {
    // Pass 1: signatures, so calls may precede the callee's declaration.
    for (const auto& function : program.functions) {
        std::vector<DataType> params;
        for (const auto& param : function.params)
            params.push_back(param.type);
        if (!table.insert(SymbolEntry::function(function.name, params, function.returnType, function.line)))
            error(function.line, "Function '" + function.name + "' already declared in this scope");
    }

    // Pass 2: bodies, then the main statement list.
    for (const auto& function : program.functions)
        visitFunction(function);
    for (const auto& stmt : program.statements)
        visitStmt(*stmt);

    Log::trace() << "[SEMA] " << table.history().size() << " symbols, "
                 << errors.semanticErrors().size() << " errors" << std::endl;
    return std::move(annotations);
}

void SemanticAnalyzer::visitFunction(const AST::FunctionDecl& function) {
    table.enterScope();
    std::vector<DataType> params;
    for (const auto& param : function.params)
        params.push_back(param.type);
    currentFunction = SymbolEntry::function(function.name, params, function.returnType, function.line);

    for (const auto& param : function.params) {
        if (!table.insert(SymbolEntry(param.name, param.type, function.line, true)))
            error(function.line, "Variable '" + param.name + "' already declared in this scope");
    }

    visitBlock(function.body);

    if (function.returnType != DataType::VOID && !returnsOnEveryPath(function.body)) {
        error(function.line, "Function '" + function.name + "' with return type '" +
                                 AST::typeName(function.returnType) + "' must have a return statement");
    }

    currentFunction.reset();
    table.leaveScope();
}

void SemanticAnalyzer::visitBlock(const AST::Block& block) {
    table.enterScope();
    for (const auto& stmt : block.statements)
        visitStmt(*stmt);
    table.leaveScope();
}

void SemanticAnalyzer::visitStmt(const AST::Stmt& stmt) {
    std::visit([this, &stmt](const auto& node) { visitStmt(node, stmt); }, stmt.node);
}

void SemanticAnalyzer::visitStmt(const AST::DeclStmt& decl, const AST::Stmt& stmt) {
    // The initializer cannot see the variable it initializes.
    std::optional<DataType> initType;
    if (decl.init)
        initType = visitExpr(*decl.init);

    if (!table.insert(SymbolEntry(decl.name, decl.type, stmt.line, decl.init != nullptr))) {
        error(stmt.line, "Variable '" + decl.name + "' already declared in this scope");
        return;
    }
    if (initType && !isTypeCompatible(decl.type, *initType)) {
        error(stmt.line, "Type mismatch: cannot assign " + AST::typeName(*initType) + " to " + AST::typeName(decl.type));
    }
}

void SemanticAnalyzer::visitStmt(const AST::AssignStmt& assign, const AST::Stmt& stmt) {
    SymbolEntry* entry = lookupVariable(assign.name, stmt.line);
    DataType valueType = visitExpr(*assign.value);
    if (!entry)
        return;
    if (!isTypeCompatible(entry->type, valueType)) {
        error(stmt.line, "Type mismatch: cannot assign " + AST::typeName(valueType) + " to " + AST::typeName(entry->type));
    }
    table.markInitialized(assign.name);
}

void SemanticAnalyzer::visitStmt(const AST::IfStmt& ifStmt, const AST::Stmt&) {
    visitExpr(*ifStmt.condition);
    visitBlock(ifStmt.thenBlock);
    for (const auto& elif : ifStmt.elifs) {
        visitExpr(*elif.condition);
        visitBlock(elif.block);
    }
    if (ifStmt.elseBlock)
        visitBlock(*ifStmt.elseBlock);
}

void SemanticAnalyzer::visitStmt(const AST::LoopStmt& loop, const AST::Stmt& stmt) {
    table.enterScope();

    if (loop.reusesVariable) {
        SymbolEntry* entry = table.lookup(loop.variable);
        if (!entry || entry->isFunction) {
            error(stmt.line, "Loop variable '" + loop.variable + "' not declared");
        } else {
            if (!AST::isNumeric(entry->type))
                error(stmt.line, "Loop variable must be numeric, got " + AST::typeName(entry->type));
            if (!entry->initialized)
                error(stmt.line, "Loop variable '" + loop.variable + "' used before initialization");
        }
    } else {
        if (loop.start) {
            DataType startType = visitExpr(*loop.start);
            if (!AST::isNumeric(startType))
                error(stmt.line, "Loop start must be numeric, got " + AST::typeName(startType));
        }
        SymbolEntry* entry = table.lookup(loop.variable);
        if (!entry) {
            table.insert(SymbolEntry(loop.variable, DataType::INT, stmt.line, true));
            annotations.implicitLoopVariables.insert(stmt.id);
        } else if (entry->isFunction) {
            error(stmt.line, "'" + loop.variable + "' is a function, not a variable");
        } else {
            if (!AST::isNumeric(entry->type))
                error(stmt.line, "Loop variable must be numeric, got " + AST::typeName(entry->type));
            table.markInitialized(loop.variable);
        }
    }

    DataType endType = visitExpr(*loop.end);
    if (!AST::isNumeric(endType))
        error(stmt.line, "Loop end must be numeric, got " + AST::typeName(endType));

    if (loop.step) {
        DataType stepType = visitExpr(*loop.step);
        if (!AST::isNumeric(stepType))
            error(stmt.line, "Loop step must be numeric, got " + AST::typeName(stepType));
    }

    visitBlock(loop.body);
    table.leaveScope();
}

void SemanticAnalyzer::visitStmt(const AST::ConditionalLoopStmt& loop, const AST::Stmt&) {
    table.enterScope();
    visitExpr(*loop.condition);
    visitBlock(loop.body);
    table.leaveScope();
}

void SemanticAnalyzer::visitStmt(const AST::PrintStmt& print, const AST::Stmt&) {
    for (const auto& value : print.values)
        visitExpr(*value);
}

void SemanticAnalyzer::visitStmt(const AST::InputStmt& input, const AST::Stmt& stmt) {
    if (lookupVariable(input.name, stmt.line))
        table.markInitialized(input.name);
}

void SemanticAnalyzer::visitStmt(const AST::ReturnStmt& ret, const AST::Stmt& stmt) {
    if (!currentFunction) {
        error(stmt.line, "Return statement outside of function");
        return;
    }
    const SymbolEntry& function = *currentFunction;

    if (ret.value) {
        DataType valueType = visitExpr(*ret.value);
        if (function.type == DataType::VOID) {
            error(stmt.line, "Void function '" + function.name + "' should not return a value");
        } else if (!isTypeCompatible(function.type, valueType)) {
            error(stmt.line, "Return type mismatch: expected " + AST::typeName(function.type) + ", got " + AST::typeName(valueType));
        }
    } else if (function.type != DataType::VOID) {
        error(stmt.line, "Function '" + function.name + "' must return a value of type " + AST::typeName(function.type));
    }
}

void SemanticAnalyzer::visitStmt(const AST::Block& block, const AST::Stmt&) {
    visitBlock(block);
}

void SemanticAnalyzer::visitStmt(const AST::FunctionCall& call, const AST::Stmt& stmt) {
    annotations.exprTypes[stmt.id] = typeOf(call, stmt.line);
}

AST::DataType SemanticAnalyzer::visitExpr(const AST::Expr& expr) {
    DataType type = std::visit([this, &expr](const auto& node) { return typeOf(node, expr.line); }, expr.node);
    annotations.exprTypes[expr.id] = type;
    return type;
}

AST::DataType SemanticAnalyzer::typeOf(const AST::BinaryOp& op, int line) {
    DataType left = visitExpr(*op.left);
    DataType right = visitExpr(*op.right);

    if (op.op == "&&" || op.op == "||")
        return DataType::BOOL;

    if (op.op == "==" || op.op == "!=" || op.op == "<" || op.op == ">" || op.op == "<=" || op.op == ">=") {
        if (!areComparable(left, right))
            error(line, "Cannot compare " + AST::typeName(left) + " and " + AST::typeName(right));
        return DataType::BOOL;
    }

    std::optional<DataType> result = arithmeticResult(left, right);
    if (!result) {
        error(line, "Invalid operands for " + op.op + ": " + AST::typeName(left) + " and " + AST::typeName(right));
        return DataType::INT;
    }
    return *result;
}

AST::DataType SemanticAnalyzer::typeOf(const AST::UnaryOp& op, int line) {
    DataType operand = visitExpr(*op.operand);
    if (op.op == "!")
        return DataType::BOOL;
    if (!AST::isNumeric(operand))
        error(line, "Cannot negate " + AST::typeName(operand));
    return operand;
}

AST::DataType SemanticAnalyzer::typeOf(const AST::Identifier& identifier, int line) {
    SymbolEntry* entry = lookupVariable(identifier.name, line);
    if (!entry)
        return DataType::INT;
    if (!entry->initialized)
        error(line, "Variable '" + identifier.name + "' used before initialization");
    return entry->type;
}

AST::DataType SemanticAnalyzer::typeOf(const AST::Literal& literal, int) {
    return literal.type;
}

AST::DataType SemanticAnalyzer::typeOf(const AST::FunctionCall& call, int line) {
    SymbolEntry* entry = table.lookup(call.name);
    if (!entry) {
        error(line, "Function '" + call.name + "' not declared");
        return DataType::INT;
    }
    if (!entry->isFunction) {
        error(line, "'" + call.name + "' is not a function");
        return DataType::INT;
    }

    if (call.arguments.size() != entry->paramTypes.size()) {
        error(line, "Function '" + call.name + "' expects " + std::to_string(entry->paramTypes.size()) + " arguments " +
                        entry->paramList() + ", got " + std::to_string(call.arguments.size()));
    }
    for (size_t i = 0; i < call.arguments.size(); ++i) {
        DataType argType = visitExpr(*call.arguments[i]);
        if (i < entry->paramTypes.size() && !isTypeCompatible(entry->paramTypes[i], argType)) {
            error(line, "Argument " + std::to_string(i + 1) + " type mismatch: expected " +
                            AST::typeName(entry->paramTypes[i]) + ", got " + AST::typeName(argType));
        }
    }
    return entry->type;
}

SymbolEntry* SemanticAnalyzer::lookupVariable(const std::string& name, int line) {
    SymbolEntry* entry = table.lookup(name);
    if (!entry) {
        error(line, "Variable '" + name + "' not declared");
        return nullptr;
    }
    if (entry->isFunction) {
        error(line, "'" + name + "' is a function, not a variable");
        return nullptr;
    }
    return entry;
}

}  // namespace Semantic
