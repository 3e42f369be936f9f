#include "ast.hpp"

namespace AST {

std::string typeName(DataType type) {
    switch (type) {
        case DataType::INT: return "int";
        case DataType::FLOAT: return "float";
        case DataType::CHAR: return "char";
        case DataType::VOID: return "void";
        case DataType::BOOL: return "bool";
    }
    return "?";
}

bool isNumeric(DataType type) {
    return type == DataType::INT || type == DataType::FLOAT;
}

namespace {

class Printer {
   private:
    std::string out;
    int indent = 0;
    int currentLine = 0;  // line of the statement being printed

    void line(const std::string& text) {
        out += std::string(indent * 2, ' ') + text + "\n";
    }

    static std::string at(int line) {
        return " [line " + std::to_string(line) + "]";
    }

    struct Nested {
        Printer& printer;
        explicit Nested(Printer& printer)
            : printer(printer) { printer.indent++; }
        ~Nested() { printer.indent--; }
    };

   public:
    std::string result() const { return out; }

    void print(const Program& program) {
        line("Program");
        Nested nested(*this);
        for (const auto& function : program.functions)
            print(function);
        for (const auto& stmt : program.statements)
            print(*stmt);
    }

    void print(const FunctionDecl& function) {
        std::string params;
        for (size_t i = 0; i < function.params.size(); ++i) {
            if (i > 0)
                params += ", ";
            params += typeName(function.params[i].type) + " " + function.params[i].name;
        }
        line("FunctionDecl " + typeName(function.returnType) + " " + function.name + "(" + params + ")" + at(function.line));
        Nested nested(*this);
        (*this)(function.body);
    }

    void print(const Stmt& stmt) {
        currentLine = stmt.line;
        std::visit(*this, stmt.node);
    }

    void print(const Expr& expr) {
        std::visit(*this, expr.node);
    }

    void optional(const char* label, const ExprPtr& expr) {
        if (!expr)
            return;
        line(label);
        Nested nested(*this);
        print(*expr);
    }

    // statements

    void operator()(const Block& block) {
        line("Block");
        Nested nested(*this);
        for (const auto& stmt : block.statements)
            print(*stmt);
    }

    void operator()(const DeclStmt& decl) {
        line("DeclStmt " + typeName(decl.type) + " " + decl.name + at(currentLine));
        Nested nested(*this);
        optional("init:", decl.init);
    }

    void operator()(const AssignStmt& assign) {
        line("AssignStmt " + assign.name + at(currentLine));
        Nested nested(*this);
        print(*assign.value);
    }

    void operator()(const IfStmt& stmt) {
        line("IfStmt" + at(currentLine));
        Nested nested(*this);
        optional("condition:", stmt.condition);
        (*this)(stmt.thenBlock);
        for (const auto& elif : stmt.elifs) {
            line("elif:");
            Nested inner(*this);
            print(*elif.condition);
            (*this)(elif.block);
        }
        if (stmt.elseBlock) {
            line("else:");
            Nested inner(*this);
            (*this)(*stmt.elseBlock);
        }
    }

    void operator()(const LoopStmt& loop) {
        line("LoopStmt " + loop.variable + (loop.reusesVariable ? " (existing)" : "") + at(currentLine));
        Nested nested(*this);
        optional("from:", loop.start);
        optional("to:", loop.end);
        optional("step:", loop.step);
        (*this)(loop.body);
    }

    void operator()(const ConditionalLoopStmt& loop) {
        line("ConditionalLoopStmt" + at(currentLine));
        Nested nested(*this);
        optional("condition:", loop.condition);
        (*this)(loop.body);
    }

    void operator()(const PrintStmt& stmt) {
        line("PrintStmt" + at(currentLine));
        Nested nested(*this);
        for (const auto& value : stmt.values)
            print(*value);
    }

    void operator()(const InputStmt& stmt) {
        line("InputStmt " + stmt.name + at(currentLine));
    }

    void operator()(const ReturnStmt& stmt) {
        line("ReturnStmt" + at(currentLine));
        Nested nested(*this);
        if (stmt.value)
            print(*stmt.value);
    }

    // expressions

    void operator()(const BinaryOp& op) {
        line("BinaryOp " + op.op);
        Nested nested(*this);
        print(*op.left);
        print(*op.right);
    }

    void operator()(const UnaryOp& op) {
        line("UnaryOp " + op.op);
        Nested nested(*this);
        print(*op.operand);
    }

    void operator()(const Identifier& identifier) {
        line("Identifier " + identifier.name);
    }

    void operator()(const Literal& literal) {
        line("Literal " + typeName(literal.type) + " " + literal.value);
    }

    void operator()(const FunctionCall& call) {
        line("FunctionCall " + call.name);
        Nested nested(*this);
        for (const auto& argument : call.arguments)
            print(*argument);
    }
};

}  // namespace

std::string toString(const Program& program) {
    Printer printer;
    printer.print(program);
    return printer.result();
}

std::string toString(const Expr& expr) {
    Printer printer;
    printer.print(expr);
    return printer.result();
}

}  // namespace AST
