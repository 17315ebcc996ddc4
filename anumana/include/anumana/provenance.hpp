#pragma once
// Provenance: why each derived fact is in working memory
//
// Tracks, for every derived fact:
// - Rule: which rule fired
// - Bindings: the variable bindings it fired with
// - Supports: the ground antecedent facts it matched, in antecedent order
// - Cycle: the cycle in which it was derived
//
// Initial facts have no record. Supports always predate the fact they
// support, so following supports never loops.

#include "types.hpp"
#include <unordered_map>
#include <vector>

namespace anumana {

struct Derivation {
    std::string rule;
    Bindings bindings;
    std::vector<Fact> supports;
    size_t cycle = 0;
};

class ProvenanceIndex {
public:
    ProvenanceIndex() = default;

    // Record provenance for a newly derived fact. The first derivation
    // of a fact is kept.
    bool record(const Fact& fact, Derivation derivation) {
        auto [it, inserted] = records_.emplace(fact, std::move(derivation));
        if (inserted) order_.push_back(fact);
        return inserted;
    }

    // Get provenance for a fact, nullptr for initial facts
    const Derivation* get(const Fact& fact) const {
        auto it = records_.find(fact);
        return (it != records_.end()) ? &it->second : nullptr;
    }

    bool is_derived(const Fact& fact) const {
        return records_.count(fact) > 0;
    }

    // Derived facts, in derivation order
    const std::vector<Fact>& derived() const { return order_; }

    size_t count() const { return records_.size(); }

    void clear() {
        records_.clear();
        order_.clear();
    }

private:
    std::unordered_map<Fact, Derivation, FactHash> records_;
    std::vector<Fact> order_;
};

} // namespace anumana
