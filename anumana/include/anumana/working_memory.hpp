#pragma once
// Working memory: the set of known ground facts
//
// Facts are only ever added. Enumeration follows insertion order,
// which makes matching (and so the Order strategy) reproducible.

#include "types.hpp"
#include <unordered_set>
#include <vector>

namespace anumana {

class WorkingMemory {
public:
    WorkingMemory() = default;

    explicit WorkingMemory(const std::vector<Fact>& facts) {
        for (const auto& f : facts) insert(f);
    }

    // Returns false if the fact was already present
    bool insert(const Fact& fact) {
        if (!index_.insert(fact).second) return false;
        facts_.push_back(fact);
        return true;
    }

    bool contains(const Fact& fact) const {
        return index_.count(fact) > 0;
    }

    const std::vector<Fact>& facts() const { return facts_; }
    size_t size() const { return facts_.size(); }
    bool empty() const { return facts_.empty(); }

    auto begin() const { return facts_.begin(); }
    auto end() const { return facts_.end(); }

    // Same fact set, regardless of insertion order
    bool same_facts(const WorkingMemory& other) const {
        return index_ == other.index_;
    }

private:
    std::vector<Fact> facts_;
    std::unordered_set<Fact, FactHash> index_;
};

} // namespace anumana
