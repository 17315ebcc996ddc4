#pragma once
// Unification: one-way matching of a pattern against a ground fact
//
// unify() never mutates the incoming bindings; on success it returns
// an extended copy, so the matcher can keep several partial binding
// sets alive across antecedents.

#include "types.hpp"
#include <optional>
#include <set>

namespace anumana {

// Match pattern against fact position-wise, extending bindings.
// Returns nullopt on any mismatch. A fact of different arity is a
// non-match: working memory holds relations of mixed arity.
inline std::optional<Bindings> unify(const Pattern& pattern, const Fact& fact,
                                     const Bindings& bindings = {}) {
    if (pattern.size() != fact.size()) return std::nullopt;

    Bindings result = bindings;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const Term& term = pattern[i];
        if (term.is_constant()) {
            if (term.name != fact[i]) return std::nullopt;
            continue;
        }
        auto it = result.find(term.name);
        if (it == result.end()) {
            result.emplace(term.name, fact[i]);
        } else if (it->second != fact[i]) {
            return std::nullopt;
        }
    }
    return result;
}

// Replace every variable by its binding. Returns nullopt if any
// variable is unbound.
inline std::optional<Fact> substitute(const Pattern& pattern, const Bindings& bindings) {
    Fact fact;
    fact.reserve(pattern.size());
    for (const auto& term : pattern) {
        if (term.is_constant()) {
            fact.push_back(term.name);
            continue;
        }
        auto it = bindings.find(term.name);
        if (it == bindings.end()) return std::nullopt;
        fact.push_back(it->second);
    }
    return fact;
}

// Ground pattern -> fact. Returns nullopt if the pattern has variables.
inline std::optional<Fact> to_fact(const Pattern& pattern) {
    return substitute(pattern, {});
}

inline std::set<std::string> variables_of(const Pattern& pattern) {
    std::set<std::string> vars;
    for (const auto& term : pattern) {
        if (term.is_variable()) vars.insert(term.name);
    }
    return vars;
}

} // namespace anumana
