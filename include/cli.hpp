#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "common.hpp"

namespace Cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERRORS = 1;     // compile diagnostics, unreadable files, bad grammars
constexpr int EXIT_CONFLICTS = 2;  // the grammar is not in the requested class
constexpr int EXIT_USAGE = 64;

class UsageError : public CompilerError {
   public:
    explicit UsageError(const std::string& message)
        : CompilerError(SourceLocation("<command line>", 0, 0), message) {}
};

enum class Command {
    HELP,
    COMPILE,
    ANALYZE,
};

struct Options {
    Command command = Command::HELP;
    std::string input;  // source file or grammar file
    bool verbose = false;

    // compile
    std::string outputDir;
    bool dumpTokens = false;
    bool dumpAst = false;
    bool dumpSymbols = false;

    // analyze
    std::string analyzer;  // lr0, slr1, clr1, lalr1, ll1
    bool compare = false;
    bool transform = false;
};

// args excludes the program name. Throws UsageError.
Options parseCommandLine(const std::vector<std::string>& args);

std::string usage();

// Returns the process exit code. IoError and GrammarError propagate.
int run(const Options& options, std::ostream& out, std::ostream& err);

}  // namespace Cli
