#include "compiler.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "parser.hpp"
#include "tac_generator.hpp"

namespace Compiler {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw IoError(path, "cannot open file for reading");
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open())
        throw IoError(path, "cannot open file for writing");
    file << content;
    if (!file)
        throw IoError(path, "write failed");
}

std::string phaseName(Phase phase) {
    switch (phase) {
        case Phase::NONE: return "none";
        case Phase::LEXICAL: return "lexical analysis";
        case Phase::SYNTAX: return "syntax analysis";
        case Phase::SEMANTIC: return "semantic analysis";
        case Phase::TAC: return "intermediate code generation";
    }
    return "?";
}

static std::string banner(const std::string& title) {
    const std::string rule(70, '=');
    return rule + "\n" + title + "\n" + rule + "\n\n";
}

std::string formatTokens(const Tokenizer::TokenList& tokens) {
    std::ostringstream os;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        os << std::setw(3) << i + 1 << ". " << token.toString()
           << " at " << token.start_row << ":" << token.start_col << "\n";
    }
    return os.str();
}

std::string formatSymbolTable(const Semantic::SymbolTable& symbols) {
    std::ostringstream os;
    symbols.print(os);
    return os.str();
}

void Pipeline::save(const std::string& name, const std::string& content) const {
    if (outputDir.empty())
        return;
    writeFile((std::filesystem::path(outputDir) / name).string(), content);
}

void Pipeline::saveSummary(const Result& result) const {
    std::ostringstream os;
    os << banner("COMPILATION SUMMARY");
    os << "PHASE 1: Lexical Analysis\n  - Tokens Generated: " << result.tokens.size() << "\n\n";
    os << "PHASE 2: Syntax Analysis\n  - Functions: " << result.program.functions.size()
       << "\n  - Top-level Statements: " << result.program.statements.size() << "\n\n";
    os << "PHASE 3: Semantic Analysis\n  - Symbols Declared: " << result.symbols.history().size() << "\n\n";
    os << "PHASE 4: Intermediate Code Generation\n  - TAC Instructions: " << result.code.size() << "\n\n";
    os << std::string(70, '=') << "\nSTATUS: COMPILATION SUCCESSFUL\n" << std::string(70, '=') << "\n";
    save("00_COMPILATION_SUMMARY.txt", os.str());
}

Result Pipeline::compile(const std::string& source, const std::string& filename) {
    Result result;
    if (!outputDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(outputDir, ec);
        if (ec)
            throw IoError(outputDir, "cannot create output directory: " + ec.message());
    }

    Log::trace() << "[PIPELINE] Phase 1: lexical analysis of " << filename << std::endl;
    Tokenizer::Tokenizer tokenizer(result.errors);
    result.tokens = tokenizer.tokenize(source, filename);
    save("Phase1_Lexer_Output_Tokens.txt", banner("PHASE 1 OUTPUT: TOKENS") + "Total Tokens: " +
                                               std::to_string(result.tokens.size()) + "\n\n" + formatTokens(result.tokens));
    if (result.errors.hasErrors())
        return result;
    result.completed = Phase::LEXICAL;

    Log::trace() << "[PIPELINE] Phase 2: syntax analysis" << std::endl;
    Parser::Parser parser(result.tokens, result.errors);
    result.program = parser.parse();
    save("Phase2_Parser_Output_AST.txt", banner("PHASE 2 OUTPUT: ABSTRACT SYNTAX TREE (AST)") + AST::toString(result.program));
    if (result.errors.hasErrors())
        return result;
    result.completed = Phase::SYNTAX;

    Log::trace() << "[PIPELINE] Phase 3: semantic analysis" << std::endl;
    Semantic::SemanticAnalyzer analyzer(result.errors);
    result.annotations = analyzer.analyze(result.program);
    result.symbols = analyzer.releaseSymbolTable();
    save("Phase3_Semantic_Output_SymbolTable.txt", banner("PHASE 3 OUTPUT: SYMBOL TABLE") + formatSymbolTable(result.symbols));
    if (result.errors.hasErrors())
        return result;
    result.completed = Phase::SEMANTIC;

    Log::trace() << "[PIPELINE] Phase 4: intermediate code generation" << std::endl;
    TAC::TacGenerator generator(result.annotations);
    result.code = generator.generate(result.program);
    std::string tac;
    for (const auto& line : TAC::toLines(result.code))
        tac += line + "\n";
    save("Phase4_ICG_Output_TAC.txt", tac);
    result.completed = Phase::TAC;

    result.success = true;
    saveSummary(result);
    return result;
}

Result Pipeline::compileFile(const std::string& path) {
    return compile(readFile(path), path);
}

}  // namespace Compiler
