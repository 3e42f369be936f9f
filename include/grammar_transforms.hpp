#pragma once
#include "grammar.hpp"

namespace Grammar {

struct TransformResult {
    Grammar grammar;
    bool changed;
};

// Removes indirect recursion by substitution (declaration order), then
// rewrites A → A α | β as A → β A', A' → α A' | ε.
TransformResult eliminateLeftRecursion(const Grammar& grammar);

// Factors the longest common prefix of alternatives sharing a first symbol
// into a fresh A', repeating until no such pair is left.
TransformResult leftFactor(const Grammar& grammar);

}  // namespace Grammar
