#pragma once
#include <string>
#include "ast.hpp"
#include "common.hpp"
#include "semantic_analyzer.hpp"
#include "symbol_table.hpp"
#include "tac.hpp"
#include "tokenizer.hpp"

namespace Compiler {

class IoError : public CompilerError {
   public:
    IoError(const std::string& path, const std::string& message)
        : CompilerError(SourceLocation(path, 0, 0), message) {}
};

// Throws IoError.
std::string readFile(const std::string& path);
void writeFile(const std::string& path, const std::string& content);

enum class Phase {
    NONE,
    LEXICAL,
    SYNTAX,
    SEMANTIC,
    TAC,
};

std::string phaseName(Phase phase);

struct Result {
    bool success = false;
    Phase completed = Phase::NONE;  // last phase that ran cleanly
    ErrorHandler errors;

    Tokenizer::TokenList tokens;
    AST::Program program;
    Semantic::SymbolTable symbols;
    Semantic::Annotations annotations;
    TAC::Code code;
};

// Numbered token list, "  1. INT at 1:1"
std::string formatTokens(const Tokenizer::TokenList& tokens);
std::string formatSymbolTable(const Semantic::SymbolTable& symbols);

// lexer -> parser -> semantic analysis -> TAC. Halts after the first phase
// that reports errors. With an output directory, each phase that ran saves
// its artifact there.
class Pipeline {
   public:
    explicit Pipeline(std::string outputDir = "")
        : outputDir(std::move(outputDir)) {}

    Result compile(const std::string& source, const std::string& filename = "<input>");
    Result compileFile(const std::string& path);

   private:
    std::string outputDir;

    void save(const std::string& name, const std::string& content) const;
    void saveSummary(const Result& result) const;
};

}  // namespace Compiler
