#pragma once
// Executor: fire one instantiation
//
// Grounds the consequent with the winning bindings. A new fact goes into
// working memory with its derivation; an already known fact is a no-op.
// Either way the instantiation is marked fired.

#include "matcher.hpp"
#include "provenance.hpp"
#include "rule.hpp"
#include "unify.hpp"
#include "working_memory.hpp"
#include <optional>
#include <stdexcept>

namespace anumana {

// Ground antecedent facts an instantiation matched, in antecedent order
inline std::vector<Fact> supporting_facts(const Rule& rule, const Bindings& bindings) {
    std::vector<Fact> supports;
    supports.reserve(rule.antecedents.size());
    for (const auto& p : rule.antecedents) {
        auto fact = substitute(p, bindings);
        if (!fact) {
            throw std::logic_error("rule '" + rule.name + "': antecedent " +
                                   to_string(p) + " not ground under " + to_string(bindings));
        }
        supports.push_back(std::move(*fact));
    }
    return supports;
}

// Returns the newly derived fact, or nullopt if it was already known
inline std::optional<Fact> fire(const Rule& rule, const Instantiation& inst,
                                WorkingMemory& wm, ProvenanceIndex& provenance,
                                FiredHistory& history, size_t cycle = 0) {
    history.add(inst);

    auto fact = substitute(rule.consequent, inst.bindings);
    if (!fact) {
        throw std::logic_error("rule '" + rule.name + "': consequent " +
                               to_string(rule.consequent) + " not ground under " +
                               to_string(inst.bindings));
    }

    if (wm.contains(*fact)) return std::nullopt;

    // Everything that can throw happens before the store changes
    Derivation d;
    d.rule = rule.name;
    d.bindings = inst.bindings;
    d.supports = supporting_facts(rule, inst.bindings);
    d.cycle = cycle;

    wm.insert(*fact);
    provenance.record(*fact, std::move(d));
    return fact;
}

} // namespace anumana
