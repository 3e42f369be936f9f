#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "common.hpp"

namespace Grammar {

inline const std::string END_MARKER = "$";
inline const std::string EPSILON = "\xCE\xB5";  // ε
inline const std::string AUGMENT_SUFFIX = "Bar";

class GrammarError : public CompilerError {
   public:
    GrammarError(int line, const std::string& message)
        : CompilerError(SourceLocation("grammar", line, 0), "grammar error: " + message) {}
};

struct Production {
    int number;
    std::string lhs;
    std::vector<std::string> rhs;  // empty for an ε-production

    bool isEmpty() const { return rhs.empty(); }

    // "A → x y", "A → ε"
    std::string toString() const;
};

class Grammar {
   public:
    using Alternative = std::vector<std::string>;

    struct Rule {
        std::string lhs;
        std::vector<Alternative> alternatives;
    };

    // Reads "LHS → rhs | rhs" lines with '|' continuation lines. Throws GrammarError.
    static Grammar parse(const std::string& text);

    // Rules in declaration order. The start symbol defaults to the first rule's LHS.
    static Grammar fromRules(std::vector<Rule> rules, const std::string& startSymbol = "");

    // Adds production 0: <start>Bar → <start>. Calling it twice is a no-op.
    void augment();
    bool isAugmented() const { return !augmentedStartSymbol.empty(); }

    const std::string& startSymbol() const { return start; }
    const std::string& augmentedStart() const { return augmentedStartSymbol; }

    // The symbol the automaton starts from: the augmented start when present.
    const std::string& goalSymbol() const { return isAugmented() ? augmentedStartSymbol : start; }

    const std::vector<Production>& productions() const { return productionList; }
    const Production& production(int number) const;
    std::vector<const Production*> productionsFor(const std::string& nonTerminal) const;

    // -1 when no production matches.
    int productionNumber(const std::string& lhs, const std::vector<std::string>& rhs) const;

    // Declaration order; the augmented rule comes first once present.
    const std::vector<Rule>& rules() const { return ruleList; }

    const std::set<std::string>& terminals() const { return terminalSet; }
    const std::set<std::string>& nonTerminals() const { return nonTerminalSet; }
    bool isTerminal(const std::string& symbol) const { return terminalSet.count(symbol) > 0; }
    bool isNonTerminal(const std::string& symbol) const { return nonTerminalSet.count(symbol) > 0; }

    // One "LHS → alt | alt" line per rule; parse() reads it back.
    std::string toString() const;

   private:
    std::vector<Rule> ruleList;
    std::string start;
    std::string augmentedStartSymbol;
    std::vector<Production> productionList;
    std::map<std::string, std::vector<int>> productionsByLhs;
    std::set<std::string> terminalSet;
    std::set<std::string> nonTerminalSet;

    Grammar() = default;
    void finalize();
};

}  // namespace Grammar
