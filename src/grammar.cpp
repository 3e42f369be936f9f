#include "grammar.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace Grammar {

static const std::string UNICODE_ARROW = "\xE2\x86\x92";  // →
static const std::string ASCII_ARROW = "->";

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

// Returns the arrow's position and sets its byte length, or npos.
static size_t findArrow(const std::string& line, size_t& length) {
    size_t unicode = line.find(UNICODE_ARROW);
    size_t ascii = line.find(ASCII_ARROW);
    if (unicode == std::string::npos && ascii == std::string::npos)
        return std::string::npos;
    if (ascii == std::string::npos || (unicode != std::string::npos && unicode < ascii)) {
        length = UNICODE_ARROW.size();
        return unicode;
    }
    length = ASCII_ARROW.size();
    return ascii;
}

// Whitespace-separated symbols; a symbol opening with ' runs to the next '.
static std::vector<std::string> tokenizeRhs(const std::string& text, int lineNumber) {
    std::vector<std::string> symbols;
    size_t i = 0;
    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        if (text[i] == '\'') {
            size_t close = text.find('\'', i + 1);
            if (close == std::string::npos)
                throw GrammarError(lineNumber, "unterminated quoted symbol: " + text.substr(i));
            symbols.push_back(text.substr(i, close - i + 1));
            i = close + 1;
            continue;
        }
        size_t j = i;
        while (j < text.size() && !std::isspace(static_cast<unsigned char>(text[j])))
            ++j;
        symbols.push_back(text.substr(i, j - i));
        i = j;
    }
    return symbols;
}

static std::vector<Grammar::Alternative> splitAlternatives(const std::vector<std::string>& symbols, int lineNumber) {
    std::vector<Grammar::Alternative> alternatives(1);
    for (const auto& symbol : symbols) {
        if (symbol == "|")
            alternatives.emplace_back();
        else
            alternatives.back().push_back(symbol);
    }
    for (const auto& alternative : alternatives) {
        if (alternative.empty())
            throw GrammarError(lineNumber, "empty alternative (write " + EPSILON + " for the empty production)");
    }
    return alternatives;
}

std::string Production::toString() const {
    std::string s = lhs + " " + UNICODE_ARROW;
    if (rhs.empty())
        return s + " " + EPSILON;
    for (const auto& symbol : rhs)
        s += " " + symbol;
    return s;
}

Grammar Grammar::parse(const std::string& text) {
    std::vector<Rule> rules;
    std::istringstream input(text);
    std::string rawLine;
    int lineNumber = 0;
    Rule* current = nullptr;

    while (std::getline(input, rawLine)) {
        ++lineNumber;
        std::string line = trim(rawLine);
        if (line.empty())
            continue;

        if (line[0] == '|') {
            if (!current)
                throw GrammarError(lineNumber, "alternative '|' appears before any left-hand side");
            auto alternatives = splitAlternatives(tokenizeRhs(line.substr(1), lineNumber), lineNumber);
            current->alternatives.insert(current->alternatives.end(), alternatives.begin(), alternatives.end());
            continue;
        }

        size_t arrowLength = 0;
        size_t arrow = findArrow(line, arrowLength);
        if (arrow == std::string::npos)
            throw GrammarError(lineNumber, "expected '" + UNICODE_ARROW + "' in rule: " + line);
        std::string lhs = trim(line.substr(0, arrow));
        if (lhs.empty())
            throw GrammarError(lineNumber, "missing left-hand side");
        if (std::any_of(lhs.begin(), lhs.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); }))
            throw GrammarError(lineNumber, "left-hand side must be a single symbol: " + lhs);

        rules.push_back(Rule{lhs, splitAlternatives(tokenizeRhs(line.substr(arrow + arrowLength), lineNumber), lineNumber)});
        current = &rules.back();
    }

    Log::trace() << "[GRAMMAR] Read " << rules.size() << " rule lines from " << lineNumber << " lines" << std::endl;
    return fromRules(std::move(rules));
}

Grammar Grammar::fromRules(std::vector<Rule> rules, const std::string& startSymbol) {
    Grammar grammar;
    std::map<std::string, size_t> indexByLhs;
    for (auto& rule : rules) {
        if (rule.lhs.empty())
            throw GrammarError(0, "rule without a left-hand side");
        for (auto& alternative : rule.alternatives) {
            alternative.erase(std::remove(alternative.begin(), alternative.end(), EPSILON), alternative.end());
        }
        auto it = indexByLhs.find(rule.lhs);
        if (it == indexByLhs.end()) {
            indexByLhs[rule.lhs] = grammar.ruleList.size();
            grammar.ruleList.push_back(std::move(rule));
        } else {
            auto& merged = grammar.ruleList[it->second].alternatives;
            merged.insert(merged.end(), rule.alternatives.begin(), rule.alternatives.end());
        }
    }
    if (grammar.ruleList.empty())
        throw GrammarError(0, "grammar has no productions");

    grammar.start = startSymbol.empty() ? grammar.ruleList.front().lhs : startSymbol;
    if (!indexByLhs.count(grammar.start))
        throw GrammarError(0, "start symbol '" + grammar.start + "' has no productions");

    grammar.finalize();
    return grammar;
}

void Grammar::augment() {
    if (isAugmented())
        return;
    std::string name = start + AUGMENT_SUFFIX;
    while (nonTerminalSet.count(name) || terminalSet.count(name))
        name += AUGMENT_SUFFIX;
    augmentedStartSymbol = name;
    ruleList.insert(ruleList.begin(), Rule{name, {{start}}});
    finalize();
    Log::trace() << "[GRAMMAR] Augmented with " << productionList.front().toString() << std::endl;
}

void Grammar::finalize() {
    nonTerminalSet.clear();
    terminalSet.clear();
    productionList.clear();
    productionsByLhs.clear();

    for (const auto& rule : ruleList)
        nonTerminalSet.insert(rule.lhs);
    for (const auto& rule : ruleList) {
        for (const auto& alternative : rule.alternatives) {
            for (const auto& symbol : alternative) {
                if (!nonTerminalSet.count(symbol))
                    terminalSet.insert(symbol);
            }
        }
    }
    terminalSet.insert(END_MARKER);

    auto addProduction = [this](const std::string& lhs, const Alternative& rhs) {
        int number = static_cast<int>(productionList.size());
        productionList.push_back(Production{number, lhs, rhs});
        productionsByLhs[lhs].push_back(number);
    };

    // Production 0 is the augmented one; the rest go by LHS name, then declaration order.
    std::map<std::string, const Rule*> byName;
    for (const auto& rule : ruleList) {
        if (rule.lhs == augmentedStartSymbol)
            addProduction(rule.lhs, rule.alternatives.front());
        else
            byName[rule.lhs] = &rule;
    }
    for (const auto& entry : byName) {
        for (const auto& alternative : entry.second->alternatives)
            addProduction(entry.first, alternative);
    }
}

const Production& Grammar::production(int number) const {
    if (number < 0 || static_cast<size_t>(number) >= productionList.size())
        throw std::out_of_range("no production numbered " + std::to_string(number));
    return productionList[number];
}

std::vector<const Production*> Grammar::productionsFor(const std::string& nonTerminal) const {
    std::vector<const Production*> result;
    auto it = productionsByLhs.find(nonTerminal);
    if (it == productionsByLhs.end())
        return result;
    for (int number : it->second)
        result.push_back(&productionList[number]);
    return result;
}

int Grammar::productionNumber(const std::string& lhs, const std::vector<std::string>& rhs) const {
    for (const auto* production : productionsFor(lhs)) {
        if (production->rhs == rhs)
            return production->number;
    }
    return -1;
}

std::string Grammar::toString() const {
    std::string s;
    for (const auto& rule : ruleList) {
        s += rule.lhs + " " + UNICODE_ARROW;
        for (size_t i = 0; i < rule.alternatives.size(); ++i) {
            if (i > 0)
                s += " |";
            if (rule.alternatives[i].empty())
                s += " " + EPSILON;
            for (const auto& symbol : rule.alternatives[i])
                s += " " + symbol;
        }
        s += "\n";
    }
    return s;
}

}  // namespace Grammar
