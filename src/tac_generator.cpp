#include "tac_generator.hpp"

#include <iostream>

namespace TAC {

std::string TacGenerator::createTemp() {
    return "t" + std::to_string(tempVarCounter++);
}

std::string TacGenerator::createLabel() {
    return "L" + std::to_string(labelCounter++);
}

void TacGenerator::addInstruction(std::shared_ptr<Instruction> inst) {
    code.push_back(std::move(inst));
}

Code TacGenerator::generate(const AST::Program& program) {
    code.clear();
    for (const auto& function : program.functions)
        visitFunction(function);

    addInstruction(std::make_shared<LabelInst>("MAIN"));
    for (const auto& stmt : program.statements)
        visitStmt(*stmt);
    addInstruction(std::make_shared<EndInst>("END_MAIN"));

    Log::trace() << "[TAC] " << code.size() << " instructions, " << tempVarCounter << " temporaries, "
                 << labelCounter << " labels" << std::endl;
    return code;
}

void TacGenerator::visitFunction(const AST::FunctionDecl& function) {
    Log::trace() << "[TAC] Lowering function " << function.name << std::endl;
    addInstruction(std::make_shared<LabelInst>("FUNC_" + function.name));
    for (size_t i = 0; i < function.params.size(); ++i)
        addInstruction(std::make_shared<ParamInst>(function.params[i].name, static_cast<int>(i)));
    visitBlock(function.body);
    // Falling off the end returns 0.
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::RETURN, "0"));
    addInstruction(std::make_shared<EndInst>("END_FUNC_" + function.name));
}

void TacGenerator::visitBlock(const AST::Block& block) {
    addInstruction(std::make_shared<ScopeInst>(true));
    for (const auto& stmt : block.statements)
        visitStmt(*stmt);
    addInstruction(std::make_shared<ScopeInst>(false));
}

void TacGenerator::visitStmt(const AST::Stmt& stmt) {
    std::visit([this, &stmt](const auto& node) { visitStmt(node, stmt); }, stmt.node);
}

void TacGenerator::visitStmt(const AST::DeclStmt& decl, const AST::Stmt&) {
    addInstruction(std::make_shared<AllocInst>(decl.name, AST::typeName(decl.type)));
    if (decl.init) {
        std::string value = visitExpr(*decl.init);
        addInstruction(std::make_shared<CopyInst>(decl.name, value));
    }
}

void TacGenerator::visitStmt(const AST::AssignStmt& assign, const AST::Stmt&) {
    std::string value = visitExpr(*assign.value);
    addInstruction(std::make_shared<CopyInst>(assign.name, value));
}

void TacGenerator::visitStmt(const AST::IfStmt& ifStmt, const AST::Stmt&) {
    std::vector<std::string> elifLabels;
    for (size_t i = 0; i < ifStmt.elifs.size(); ++i)
        elifLabels.push_back(createLabel());
    std::string elseLabel = ifStmt.elseBlock ? createLabel() : "";
    std::string endLabel = createLabel();

    // Where control goes when branch i's test fails.
    auto nextAfter = [&](size_t i) {
        if (i < elifLabels.size())
            return elifLabels[i];
        return ifStmt.elseBlock ? elseLabel : endLabel;
    };

    std::string condition = visitExpr(*ifStmt.condition);
    addInstruction(std::make_shared<IfFalseInst>(condition, nextAfter(0)));
    visitBlock(ifStmt.thenBlock);
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::GOTO, endLabel));

    for (size_t i = 0; i < ifStmt.elifs.size(); ++i) {
        addInstruction(std::make_shared<LabelInst>(elifLabels[i]));
        std::string elifCondition = visitExpr(*ifStmt.elifs[i].condition);
        addInstruction(std::make_shared<IfFalseInst>(elifCondition, nextAfter(i + 1)));
        visitBlock(ifStmt.elifs[i].block);
        addInstruction(std::make_shared<SingleOperandInst>(OpCode::GOTO, endLabel));
    }

    if (ifStmt.elseBlock) {
        addInstruction(std::make_shared<LabelInst>(elseLabel));
        visitBlock(*ifStmt.elseBlock);
    }
    addInstruction(std::make_shared<LabelInst>(endLabel));
}

void TacGenerator::visitStmt(const AST::LoopStmt& loop, const AST::Stmt& stmt) {
    std::string startLabel = createLabel();
    std::string endLabel = createLabel();

    if (annotations.declaresLoopVariable(stmt.id))
        addInstruction(std::make_shared<AllocInst>(loop.variable, "int"));
    if (!loop.reusesVariable && loop.start) {
        std::string start = visitExpr(*loop.start);
        addInstruction(std::make_shared<CopyInst>(loop.variable, start));
    }

    addInstruction(std::make_shared<LabelInst>(startLabel));
    std::string end = visitExpr(*loop.end);
    std::string test = createTemp();
    addInstruction(std::make_shared<BinaryInst>(test, loop.variable, "<=", end));
    addInstruction(std::make_shared<IfFalseInst>(test, endLabel));

    visitBlock(loop.body);

    std::string step = loop.step ? visitExpr(*loop.step) : "1";
    std::string next = createTemp();
    addInstruction(std::make_shared<BinaryInst>(next, loop.variable, "+", step));
    addInstruction(std::make_shared<CopyInst>(loop.variable, next));
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::GOTO, startLabel));
    addInstruction(std::make_shared<LabelInst>(endLabel));
}

void TacGenerator::visitStmt(const AST::ConditionalLoopStmt& loop, const AST::Stmt&) {
    std::string startLabel = createLabel();
    std::string endLabel = createLabel();

    addInstruction(std::make_shared<LabelInst>(startLabel));
    std::string condition = visitExpr(*loop.condition);
    addInstruction(std::make_shared<IfFalseInst>(condition, endLabel));
    visitBlock(loop.body);
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::GOTO, startLabel));
    addInstruction(std::make_shared<LabelInst>(endLabel));
}

void TacGenerator::visitStmt(const AST::PrintStmt& print, const AST::Stmt&) {
    for (const auto& value : print.values) {
        std::string operand = visitExpr(*value);
        addInstruction(std::make_shared<SingleOperandInst>(OpCode::PRINT, operand));
    }
}

void TacGenerator::visitStmt(const AST::InputStmt& input, const AST::Stmt&) {
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::READ, input.name));
}

void TacGenerator::visitStmt(const AST::ReturnStmt& ret, const AST::Stmt&) {
    std::string value = ret.value ? visitExpr(*ret.value) : "0";
    addInstruction(std::make_shared<SingleOperandInst>(OpCode::RETURN, value));
}

void TacGenerator::visitStmt(const AST::Block& block, const AST::Stmt&) {
    visitBlock(block);
}

void TacGenerator::visitStmt(const AST::FunctionCall& call, const AST::Stmt&) {
    visitExpr(call);
}

std::string TacGenerator::visitExpr(const AST::Expr& expr) {
    return std::visit([this](const auto& node) { return visitExpr(node); }, expr.node);
}

std::string TacGenerator::visitExpr(const AST::BinaryOp& op) {
    std::string left = visitExpr(*op.left);
    std::string right = visitExpr(*op.right);
    std::string temp = createTemp();
    addInstruction(std::make_shared<BinaryInst>(temp, left, op.op, right));
    return temp;
}

std::string TacGenerator::visitExpr(const AST::UnaryOp& op) {
    std::string operand = visitExpr(*op.operand);
    std::string temp = createTemp();
    addInstruction(std::make_shared<UnaryInst>(temp, op.op, operand));
    return temp;
}

std::string TacGenerator::visitExpr(const AST::Identifier& identifier) {
    return identifier.name;
}

std::string TacGenerator::visitExpr(const AST::Literal& literal) {
    if (literal.type == AST::DataType::CHAR)
        return "'" + literal.value + "'";
    return literal.value;
}

std::string TacGenerator::visitExpr(const AST::FunctionCall& call) {
    std::vector<std::string> arguments;
    for (const auto& argument : call.arguments)
        arguments.push_back(visitExpr(*argument));
    for (auto it = arguments.rbegin(); it != arguments.rend(); ++it)
        addInstruction(std::make_shared<SingleOperandInst>(OpCode::PUSH, *it));
    addInstruction(std::make_shared<CallInst>("FUNC_" + call.name, static_cast<int>(arguments.size())));
    std::string temp = createTemp();
    addInstruction(std::make_shared<CopyInst>(temp, "RETVAL"));
    return temp;
}

}  // namespace TAC
