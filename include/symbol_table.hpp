#pragma once

#include <iomanip>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "ast.hpp"

namespace Semantic {

struct SymbolEntry {
    std::string name;
    AST::DataType type;  // return type for functions
    int scopeLevel;
    int line;
    bool initialized;
    int offset;  // -1 for functions
    bool isFunction;
    std::vector<AST::DataType> paramTypes;

    SymbolEntry(std::string name, AST::DataType type, int line, bool initialized)
        : name(std::move(name)), type(type), scopeLevel(0), line(line), initialized(initialized), offset(-1), isFunction(false) {}

    static SymbolEntry function(std::string name, std::vector<AST::DataType> params, AST::DataType returnType, int line) {
        SymbolEntry entry(std::move(name), returnType, line, true);
        entry.isFunction = true;
        entry.paramTypes = std::move(params);
        return entry;
    }

    // "(int, int)"
    std::string paramList() const {
        std::string s = "(";
        for (size_t i = 0; i < paramTypes.size(); ++i) {
            if (i > 0)
                s += ", ";
            s += AST::typeName(paramTypes[i]);
        }
        return s + ")";
    }

    // "float" for variables, "(int, int)->int" for functions
    std::string typeString() const {
        return isFunction ? paramList() + "->" + AST::typeName(type) : AST::typeName(type);
    }
};

inline int storageSize(AST::DataType type) {
    return type == AST::DataType::CHAR ? 1 : 4;
}

class Scope {
   public:
    std::map<std::string, SymbolEntry*> symbols;
    Scope* parent;
    int level;

    Scope(Scope* p = nullptr)
        : parent(p), level(p ? p->level + 1 : 0) {}

    SymbolEntry* lookupLocal(const std::string& name) const {
        auto it = symbols.find(name);
        return it == symbols.end() ? nullptr : it->second;
    }

    SymbolEntry* lookup(const std::string& name) const {
        SymbolEntry* found = lookupLocal(name);
        if (found)
            return found;
        return parent ? parent->lookup(name) : nullptr;
    }
};

// Stack of scopes. Entries outlive the scope that declared them so the
// complete declaration history can be reported after analysis.
class SymbolTable {
   public:
    SymbolTable() {
        enterScope();
    }

    void enterScope() {
        std::unique_ptr<Scope> newScope(new Scope(currentScope));
        currentScope = newScope.get();
        scopesStack.push_back(std::move(newScope));
    }

    // The global scope is never left.
    void leaveScope() {
        if (scopesStack.size() <= 1)
            return;
        scopesStack.pop_back();
        currentScope = scopesStack.back().get();
    }

    int level() const { return currentScope->level; }

    // nullptr when the name already exists in the current scope.
    SymbolEntry* insert(SymbolEntry entry) {
        if (lookupCurrentScope(entry.name))
            return nullptr;
        entry.scopeLevel = currentScope->level;
        if (!entry.isFunction) {
            entry.offset = nextOffset;
            nextOffset += storageSize(entry.type);
        }
        entries.push_back(std::unique_ptr<SymbolEntry>(new SymbolEntry(std::move(entry))));
        SymbolEntry* inserted = entries.back().get();
        currentScope->symbols[inserted->name] = inserted;
        return inserted;
    }

    SymbolEntry* lookup(const std::string& name) const {
        return currentScope->lookup(name);
    }

    SymbolEntry* lookupCurrentScope(const std::string& name) const {
        return currentScope->lookupLocal(name);
    }

    void markInitialized(const std::string& name) {
        SymbolEntry* entry = lookup(name);
        if (entry)
            entry->initialized = true;
    }

    // Every entry ever inserted, in insertion order.
    std::vector<const SymbolEntry*> history() const {
        std::vector<const SymbolEntry*> all;
        for (const auto& entry : entries)
            all.push_back(entry.get());
        return all;
    }

    // Grouped by scope level, columns Name, Type, Line, Init, Offset.
    void print(std::ostream& os) const {
        std::map<int, std::vector<const SymbolEntry*>> byLevel;
        for (const auto& entry : entries)
            byLevel[entry->scopeLevel].push_back(entry.get());

        for (const auto& level : byLevel) {
            os << "\nScope Level " << level.first << ":\n";
            os << std::left << std::setw(15) << "Name" << " " << std::setw(15) << "Type" << " "
               << std::setw(8) << "Line" << " " << std::setw(8) << "Init" << " " << std::setw(8) << "Offset" << "\n";
            os << std::string(70, '-') << "\n";
            for (const SymbolEntry* entry : level.second) {
                os << std::setw(15) << entry->name << " " << std::setw(15) << entry->typeString() << " "
                   << std::setw(8) << entry->line << " ";
                if (entry->isFunction)
                    os << std::setw(8) << "N/A" << " " << std::setw(8) << "N/A";
                else
                    os << std::setw(8) << (entry->initialized ? "true" : "false") << " " << std::setw(8) << entry->offset;
                os << "\n";
            }
        }
    }

   private:
    Scope* currentScope = nullptr;
    std::vector<std::unique_ptr<Scope>> scopesStack;
    std::vector<std::unique_ptr<SymbolEntry>> entries;
    int nextOffset = 0;
};

}  // namespace Semantic
