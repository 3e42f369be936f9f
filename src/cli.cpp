#include "cli.hpp"

#include <map>
#include "compiler.hpp"
#include "grammar_analyzer.hpp"

namespace Cli {

static const std::map<std::string, LR::TableKind> LR_ANALYZERS = {
    {"lr0", LR::TableKind::LR0},
    {"slr1", LR::TableKind::SLR1},
    {"clr1", LR::TableKind::CLR1},
    {"lalr1", LR::TableKind::LALR1},
};

std::string usage() {
    return "usage:\n"
           "  minicc compile <source> [-o <dir>] [--tokens] [--ast] [--symbols] [--verbose]\n"
           "  minicc analyze <lr0|slr1|clr1|lalr1|ll1> <grammar-file> [--compare] [--transform] [--verbose]\n"
           "  minicc help\n"
           "\n"
           "compile   run lexer, parser, semantic analysis and TAC generation\n"
           "          -o <dir>    save each phase's output into <dir>\n"
           "          --tokens    print the token list\n"
           "          --ast       print the syntax tree\n"
           "          --symbols   print the symbol table\n"
           "analyze   build the automaton and tables for a grammar and report conflicts\n"
           "          --compare   with lr0: show which conflicts SLR(1) resolves\n"
           "          --transform with ll1: remove left recursion and left factor first\n"
           "\n"
           "exit codes: 0 ok, 1 errors, 2 grammar conflicts, 64 usage\n";
}

static Options parseCompile(const std::vector<std::string>& args) {
    Options options;
    options.command = Command::COMPILE;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-o") {
            if (i + 1 >= args.size())
                throw UsageError("-o needs a directory");
            options.outputDir = args[++i];
        } else if (arg == "--tokens") {
            options.dumpTokens = true;
        } else if (arg == "--ast") {
            options.dumpAst = true;
        } else if (arg == "--symbols") {
            options.dumpSymbols = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option for compile: " + arg);
        } else if (options.input.empty()) {
            options.input = arg;
        } else {
            throw UsageError("compile takes one source file, got another: " + arg);
        }
    }
    if (options.input.empty())
        throw UsageError("compile needs a source file");
    return options;
}

static Options parseAnalyze(const std::vector<std::string>& args) {
    Options options;
    options.command = Command::ANALYZE;
    std::vector<std::string> positional;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--compare") {
            options.compare = true;
        } else if (arg == "--transform") {
            options.transform = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option for analyze: " + arg);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2)
        throw UsageError("analyze needs an analyzer and a grammar file");
    options.analyzer = positional[0];
    options.input = positional[1];

    if (options.analyzer != "ll1" && !LR_ANALYZERS.count(options.analyzer))
        throw UsageError("unknown analyzer: " + options.analyzer);
    if (options.compare && options.analyzer != "lr0")
        throw UsageError("--compare works with lr0 only");
    if (options.transform && options.analyzer != "ll1")
        throw UsageError("--transform works with ll1 only");
    return options;
}

Options parseCommandLine(const std::vector<std::string>& args) {
    if (args.empty())
        throw UsageError("no command given");
    const std::string& command = args[0];
    if (command == "help" || command == "--help" || command == "-h")
        return Options{};
    if (command == "compile")
        return parseCompile(args);
    if (command == "analyze")
        return parseAnalyze(args);
    throw UsageError("unknown command: " + command);
}

static int runCompile(const Options& options, std::ostream& out, std::ostream& err) {
    Compiler::Pipeline pipeline(options.outputDir);
    Compiler::Result result = pipeline.compileFile(options.input);

    if (options.dumpTokens) {
        out << "=== TOKENS ===\n" << Compiler::formatTokens(result.tokens) << "\n";
    }
    if (options.dumpAst && result.completed >= Compiler::Phase::LEXICAL) {
        out << "=== AST ===\n" << AST::toString(result.program) << "\n";
    }
    if (options.dumpSymbols && result.completed >= Compiler::Phase::SYNTAX) {
        out << "=== SYMBOL TABLE ===" << Compiler::formatSymbolTable(result.symbols) << "\n";
    }

    if (!result.success) {
        result.errors.print(err);
        auto failed = static_cast<Compiler::Phase>(static_cast<int>(result.completed) + 1);
        err << "Compilation halted during " << Compiler::phaseName(failed) << std::endl;
        return EXIT_ERRORS;
    }

    out << "=== THREE-ADDRESS CODE ===\n";
    TAC::print(out, result.code);
    if (!options.outputDir.empty())
        out << "\nPhase outputs saved to " << options.outputDir << "\n";
    return EXIT_OK;
}

static int runAnalyze(const Options& options, std::ostream& out) {
    std::string text = Compiler::readFile(options.input);

    if (options.analyzer == "ll1") {
        Analysis::LL1Analysis analysis = Analysis::analyzeLL1(text, options.transform);
        Analysis::printReport(out, analysis);
        return analysis.isLL1() ? EXIT_OK : EXIT_CONFLICTS;
    }

    Analysis::LRAnalysis analysis = Analysis::analyzeLR(text, LR_ANALYZERS.at(options.analyzer));
    Analysis::printReport(out, analysis);
    if (options.compare) {
        out << "\n";
        Analysis::printComparison(out, Analysis::compareLr0Slr(analysis));
    }
    return analysis.belongsToClass() ? EXIT_OK : EXIT_CONFLICTS;
}

int run(const Options& options, std::ostream& out, std::ostream& err) {
    switch (options.command) {
        case Command::HELP:
            out << usage();
            return EXIT_OK;
        case Command::COMPILE:
            return runCompile(options, out, err);
        case Command::ANALYZE:
            return runAnalyze(options, out);
    }
    return EXIT_USAGE;
}

}  // namespace Cli
