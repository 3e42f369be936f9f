#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace TAC {

enum class OpCode {
    LABEL,        // L0:  FUNC_f:  MAIN:
    ALLOC,        // ALLOC x int
    COPY,         // x = y
    BINARY,       // t0 = a + b
    UNARY,        // t0 = -a
    PRINT,        // PRINT x
    READ,         // READ x
    GOTO,         // GOTO L0
    IF_FALSE,     // IF_FALSE t0 GOTO L1
    PARAM,        // PARAM a 0
    PUSH,         // PUSH t1
    CALL,         // CALL FUNC_f 2
    RETURN,       // RETURN t0
    ENTER_SCOPE,
    EXIT_SCOPE,
    END,          // END_MAIN  END_FUNC_f
};

// Operands are plain text: variable names, temporaries (t0), labels (L0),
// numeric literals and quoted chars ('a').
class Instruction {
   public:
    const OpCode opcode;
    explicit Instruction(OpCode opcode)
        : opcode(opcode) {}
    virtual ~Instruction() = default;
    virtual std::string toString() const = 0;
};

class LabelInst : public Instruction {
   public:
    std::string name;
    LabelInst(std::string n)
        : Instruction(OpCode::LABEL), name(std::move(n)) {}
    std::string toString() const override { return name + ":"; }
};

class AllocInst : public Instruction {
   public:
    std::string variable;
    std::string type;
    AllocInst(std::string var, std::string t)
        : Instruction(OpCode::ALLOC), variable(std::move(var)), type(std::move(t)) {}
    std::string toString() const override { return "ALLOC " + variable + " " + type; }
};

class CopyInst : public Instruction {
   public:
    std::string dest;
    std::string source;
    CopyInst(std::string d, std::string s)
        : Instruction(OpCode::COPY), dest(std::move(d)), source(std::move(s)) {}
    std::string toString() const override { return dest + " = " + source; }
};

class BinaryInst : public Instruction {
   public:
    std::string dest;
    std::string left;
    std::string op;
    std::string right;
    BinaryInst(std::string d, std::string l, std::string o, std::string r)
        : Instruction(OpCode::BINARY), dest(std::move(d)), left(std::move(l)), op(std::move(o)), right(std::move(r)) {}
    std::string toString() const override { return dest + " = " + left + " " + op + " " + right; }
};

class UnaryInst : public Instruction {
   public:
    std::string dest;
    std::string op;
    std::string operand;
    UnaryInst(std::string d, std::string o, std::string x)
        : Instruction(OpCode::UNARY), dest(std::move(d)), op(std::move(o)), operand(std::move(x)) {}
    std::string toString() const override { return dest + " = " + op + operand; }
};

// PRINT, READ, GOTO, PUSH and RETURN carry a single operand.
class SingleOperandInst : public Instruction {
   public:
    std::string operand;
    SingleOperandInst(OpCode opcode, std::string x)
        : Instruction(opcode), operand(std::move(x)) {}
    std::string toString() const override {
        switch (opcode) {
            case OpCode::PRINT: return "PRINT " + operand;
            case OpCode::READ: return "READ " + operand;
            case OpCode::GOTO: return "GOTO " + operand;
            case OpCode::PUSH: return "PUSH " + operand;
            case OpCode::RETURN: return "RETURN " + operand;
            default: return "?? " + operand;
        }
    }
};

class IfFalseInst : public Instruction {
   public:
    std::string condition;
    std::string target;
    IfFalseInst(std::string c, std::string t)
        : Instruction(OpCode::IF_FALSE), condition(std::move(c)), target(std::move(t)) {}
    std::string toString() const override { return "IF_FALSE " + condition + " GOTO " + target; }
};

class ParamInst : public Instruction {
   public:
    std::string name;
    int index;
    ParamInst(std::string n, int i)
        : Instruction(OpCode::PARAM), name(std::move(n)), index(i) {}
    std::string toString() const override { return "PARAM " + name + " " + std::to_string(index); }
};

class CallInst : public Instruction {
   public:
    std::string target;
    int argumentCount;
    CallInst(std::string t, int n)
        : Instruction(OpCode::CALL), target(std::move(t)), argumentCount(n) {}
    std::string toString() const override { return "CALL " + target + " " + std::to_string(argumentCount); }
};

class ScopeInst : public Instruction {
   public:
    explicit ScopeInst(bool enter)
        : Instruction(enter ? OpCode::ENTER_SCOPE : OpCode::EXIT_SCOPE) {}
    std::string toString() const override { return opcode == OpCode::ENTER_SCOPE ? "ENTER_SCOPE" : "EXIT_SCOPE"; }
};

// END_MAIN, or END_FUNC_<name>
class EndInst : public Instruction {
   public:
    std::string marker;
    EndInst(std::string m)
        : Instruction(OpCode::END), marker(std::move(m)) {}
    std::string toString() const override { return marker; }
};

using Code = std::vector<std::shared_ptr<Instruction>>;

// One instruction per line: the handoff format for later phases.
inline std::vector<std::string> toLines(const Code& code) {
    std::vector<std::string> lines;
    for (const auto& inst : code)
        lines.push_back(inst->toString());
    return lines;
}

inline void print(std::ostream& os, const Code& code) {
    for (const auto& inst : code)
        os << inst->toString() << "\n";
}

}  // namespace TAC
