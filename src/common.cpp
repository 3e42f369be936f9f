#include "common.hpp"

#include <iostream>

std::string Diagnostic::toString() const {
    switch (kind) {
        case DiagnosticKind::LEXICAL:
            return "Lexical Error at " + std::to_string(line) + ":" + std::to_string(column) + ": " + message;
        case DiagnosticKind::SYNTAX:
            return "Syntax Error at line " + std::to_string(line) + ": " + message;
        case DiagnosticKind::SEMANTIC:
            return "Semantic Error at line " + std::to_string(line) + ": " + message;
    }
    return message;
}

void ErrorHandler::addLexicalError(int line, int column, const std::string& message) {
    lexical.push_back(Diagnostic{DiagnosticKind::LEXICAL, line, column, message});
}

void ErrorHandler::addSyntaxError(int line, const std::string& message) {
    syntax.push_back(Diagnostic{DiagnosticKind::SYNTAX, line, 0, message});
}

void ErrorHandler::addSemanticError(int line, const std::string& message) {
    semantic.push_back(Diagnostic{DiagnosticKind::SEMANTIC, line, 0, message});
}

bool ErrorHandler::hasErrors() const {
    return errorCount() > 0;
}

size_t ErrorHandler::errorCount() const {
    return lexical.size() + syntax.size() + semantic.size();
}

std::vector<std::string> ErrorHandler::summary() const {
    std::vector<std::string> lines;
    for (const auto* channel : {&lexical, &syntax, &semantic}) {
        for (const auto& diagnostic : *channel) {
            lines.push_back(diagnostic.toString());
        }
    }
    return lines;
}

void ErrorHandler::print(std::ostream& os) const {
    if (!hasErrors()) {
        os << "No errors found!" << std::endl;
        return;
    }
    const std::string rule(60, '=');
    os << "\n" << rule << "\nCOMPILATION ERRORS\n" << rule << "\n";

    auto printChannel = [&os](const char* title, const std::vector<Diagnostic>& channel) {
        if (channel.empty())
            return;
        os << "\n--- " << title << " ---\n";
        for (const auto& diagnostic : channel) {
            os << "  * " << diagnostic.toString() << "\n";
        }
    };
    printChannel("LEXICAL ERRORS", lexical);
    printChannel("SYNTAX ERRORS", syntax);
    printChannel("SEMANTIC ERRORS", semantic);

    os << "\n" << rule << "\nTotal Errors: " << errorCount() << "\n" << rule << std::endl;
}

namespace Log {

static bool verboseEnabled = false;

void setVerbose(bool enabled) {
    verboseEnabled = enabled;
}

bool verbose() {
    return verboseEnabled;
}

std::ostream& trace() {
    // A stream with no buffer swallows its input.
    static std::ostream sink(nullptr);
    return verbose() ? std::cerr : sink;
}

std::ostream& warning() {
    return std::cerr << "[WARN] ";
}

}  // namespace Log
