#pragma once
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

struct SourceLocation {
    std::string origin;
    int line, column;

    SourceLocation(std::string origin = "<input>", int line = 0, int column = 0)
        : origin(std::move(origin)), line(line), column(column) {}
};

// Cursor over an in-memory source buffer. Rows and columns are 1-based.
struct ScanContext {
    std::string filename;
    std::string text;
    size_t offset;
    int row, column;

    ScanContext(std::string filename, std::string text)
        : filename(std::move(filename)), text(std::move(text)), offset(0), row(1), column(1) {}

    bool atEnd() const {
        return offset >= text.size();
    }

    // '\0' past the end of the buffer.
    char current() const {
        return atEnd() ? '\0' : text[offset];
    }

    char peek(size_t ahead = 1) const {
        return offset + ahead < text.size() ? text[offset + ahead] : '\0';
    }

    bool next(char& c) {
        if (atEnd())
            return false;
        c = text[offset++];
        if (c == '\n') {
            row++;
            column = 1;
        } else if (!isContinuationByte(c)) {
            column++;
        }
        return true;
    }

    // Consumes one whole UTF-8 sequence: the lead byte and its continuation bytes.
    std::string nextCharacter() {
        std::string character;
        char c;
        if (!next(c))
            return character;
        character += c;
        while (!atEnd() && isContinuationByte(current())) {
            next(c);
            character += c;
        }
        return character;
    }

    static bool isContinuationByte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    void skip() {
        char ignored;
        next(ignored);
    }

    SourceLocation location() const {
        return SourceLocation(filename, row, column);
    }
};

class CompilerError : public std::runtime_error {
   public:
    const std::string filename;
    const int row, column;
    const std::string message;
    CompilerError(const SourceLocation& where, const std::string& message)
        : std::runtime_error("error: " + message + " near " + where.origin + "(" + std::to_string(where.line) + ", " + std::to_string(where.column) + ")"),
          filename(where.origin),
          row(where.line),
          column(where.column),
          message(message) {};
};

enum class DiagnosticKind {
    LEXICAL,
    SYNTAX,
    SEMANTIC
};

struct Diagnostic {
    DiagnosticKind kind;
    int line, column;
    std::string message;

    // "Lexical Error at 3:7: ...", "Syntax Error at line 3: ...", "Semantic Error at line 3: ..."
    std::string toString() const;
};

// Collects diagnostics per compiler phase; nothing here aborts a phase.
class ErrorHandler {
   public:
    void addLexicalError(int line, int column, const std::string& message);
    void addSyntaxError(int line, const std::string& message);
    void addSemanticError(int line, const std::string& message);

    const std::vector<Diagnostic>& lexicalErrors() const { return lexical; }
    const std::vector<Diagnostic>& syntaxErrors() const { return syntax; }
    const std::vector<Diagnostic>& semanticErrors() const { return semantic; }

    bool hasErrors() const;
    size_t errorCount() const;
    std::vector<std::string> summary() const;
    void print(std::ostream& os) const;

   private:
    std::vector<Diagnostic> lexical;
    std::vector<Diagnostic> syntax;
    std::vector<Diagnostic> semantic;
};

// Tagged trace lines on stderr, e.g. "[LR_BUILD] Built 12 states".
namespace Log {

void setVerbose(bool enabled);
bool verbose();

// Discards everything unless verbose mode is on.
std::ostream& trace();

// Always printed.
std::ostream& warning();

}  // namespace Log
