#include "grammar_transforms.hpp"

#include <iostream>

namespace Grammar {

using Rule = Grammar::Rule;
using Alternative = Grammar::Alternative;

static std::vector<Rule> userRules(const Grammar& grammar) {
    std::vector<Rule> rules;
    for (const auto& rule : grammar.rules()) {
        if (rule.lhs != grammar.augmentedStart())
            rules.push_back(rule);
    }
    return rules;
}

static std::set<std::string> usedSymbols(const Grammar& grammar) {
    std::set<std::string> used = grammar.terminals();
    used.insert(grammar.nonTerminals().begin(), grammar.nonTerminals().end());
    return used;
}

static std::string freshName(const std::string& base, std::set<std::string>& used) {
    std::string name = base + "'";
    while (used.count(name))
        name += "'";
    used.insert(name);
    return name;
}

static Grammar rebuild(const Grammar& original, std::vector<Rule> rules) {
    Grammar result = Grammar::fromRules(std::move(rules), original.startSymbol());
    if (original.isAugmented())
        result.augment();
    return result;
}

// Non-terminals that can reach themselves through leading positions.
static std::set<std::string> leftRecursiveSet(const std::vector<Rule>& rules) {
    std::map<std::string, std::set<std::string>> corners;
    for (const auto& rule : rules) {
        for (const auto& alternative : rule.alternatives) {
            if (!alternative.empty())
                corners[rule.lhs].insert(alternative.front());
        }
    }
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto& entry : corners) {
            std::set<std::string> reachable = entry.second;
            for (const auto& corner : entry.second) {
                auto it = corners.find(corner);
                if (it != corners.end())
                    reachable.insert(it->second.begin(), it->second.end());
            }
            if (reachable.size() > entry.second.size()) {
                entry.second = std::move(reachable);
                changed = true;
            }
        }
    }
    std::set<std::string> recursive;
    for (const auto& entry : corners) {
        if (entry.second.count(entry.first))
            recursive.insert(entry.first);
    }
    return recursive;
}

TransformResult eliminateLeftRecursion(const Grammar& grammar) {
    std::vector<Rule> order = userRules(grammar);
    std::set<std::string> used = usedSymbols(grammar);
    std::set<std::string> recursive = leftRecursiveSet(order);
    bool changed = false;

    std::vector<Rule> result;
    std::map<std::string, size_t> processed;

    for (size_t i = 0; i < order.size(); ++i) {
        const std::string& lhs = order[i].lhs;
        std::vector<Alternative> alternatives = order[i].alternatives;

        if (recursive.count(lhs)) {
            for (size_t j = 0; j < i; ++j) {
                const std::string& earlier = order[j].lhs;
                if (!recursive.count(earlier))
                    continue;
                std::vector<Alternative> substituted;
                for (const auto& alternative : alternatives) {
                    if (alternative.empty() || alternative.front() != earlier) {
                        substituted.push_back(alternative);
                        continue;
                    }
                    for (const auto& replacement : result[processed[earlier]].alternatives) {
                        Alternative expanded = replacement;
                        expanded.insert(expanded.end(), alternative.begin() + 1, alternative.end());
                        substituted.push_back(expanded);
                    }
                    changed = true;
                }
                alternatives = std::move(substituted);
            }
        }

        std::vector<Alternative> alphas, betas;
        for (const auto& alternative : alternatives) {
            if (!alternative.empty() && alternative.front() == lhs) {
                // A → A alone derives nothing new.
                if (alternative.size() > 1)
                    alphas.emplace_back(alternative.begin() + 1, alternative.end());
            } else {
                betas.push_back(alternative);
            }
        }

        if (alphas.empty()) {
            if (betas.size() != alternatives.size())
                changed = true;
            processed[lhs] = result.size();
            result.push_back(Rule{lhs, betas});
            continue;
        }

        std::string prime = freshName(lhs, used);
        Rule rewritten{lhs, {}};
        for (auto beta : betas) {
            beta.push_back(prime);
            rewritten.alternatives.push_back(beta);
        }
        Rule tail{prime, {}};
        for (auto alpha : alphas) {
            alpha.push_back(prime);
            tail.alternatives.push_back(alpha);
        }
        tail.alternatives.push_back(Alternative{});

        Log::trace() << "[LL1] Eliminated left recursion in " << lhs << " via " << prime << std::endl;
        processed[lhs] = result.size();
        result.push_back(std::move(rewritten));
        result.push_back(std::move(tail));
        changed = true;
    }

    return TransformResult{rebuild(grammar, std::move(result)), changed};
}

TransformResult leftFactor(const Grammar& grammar) {
    std::vector<Rule> rules = userRules(grammar);
    std::set<std::string> used = usedSymbols(grammar);
    bool changed = false;

    bool factored = true;
    while (factored) {
        factored = false;
        for (size_t index = 0; index < rules.size() && !factored; ++index) {
            const auto alternatives = rules[index].alternatives;

            // First symbol with two or more alternatives starting on it.
            std::string shared;
            for (size_t a = 0; a < alternatives.size() && shared.empty(); ++a) {
                if (alternatives[a].empty())
                    continue;
                for (size_t b = a + 1; b < alternatives.size(); ++b) {
                    if (!alternatives[b].empty() && alternatives[b].front() == alternatives[a].front()) {
                        shared = alternatives[a].front();
                        break;
                    }
                }
            }
            if (shared.empty())
                continue;

            std::vector<Alternative> group;
            for (const auto& alternative : alternatives) {
                if (!alternative.empty() && alternative.front() == shared)
                    group.push_back(alternative);
            }
            size_t prefixLength = 1;
            for (;; ++prefixLength) {
                bool extend = true;
                for (const auto& member : group) {
                    if (member.size() <= prefixLength || member[prefixLength] != group.front()[prefixLength]) {
                        extend = false;
                        break;
                    }
                }
                if (!extend)
                    break;
            }

            const std::string& lhs = rules[index].lhs;
            std::string prime = freshName(lhs, used);
            Alternative head(group.front().begin(), group.front().begin() + prefixLength);
            head.push_back(prime);

            std::vector<Alternative> remaining;
            bool headPlaced = false;
            for (const auto& alternative : alternatives) {
                if (!alternative.empty() && alternative.front() == shared) {
                    if (!headPlaced) {
                        remaining.push_back(head);
                        headPlaced = true;
                    }
                } else {
                    remaining.push_back(alternative);
                }
            }
            Rule tail{prime, {}};
            for (const auto& member : group)
                tail.alternatives.emplace_back(member.begin() + prefixLength, member.end());

            Log::trace() << "[LL1] Left factored " << lhs << " on " << shared << " into " << prime << std::endl;
            rules[index].alternatives = std::move(remaining);
            rules.push_back(std::move(tail));
            factored = true;
            changed = true;
        }
    }

    return TransformResult{rebuild(grammar, std::move(rules)), changed};
}

}  // namespace Grammar
