#pragma once
// Explanation: derivation trees from provenance
//
// A derived fact expands to its rule, bindings and the explanations of
// its supports (depth-first, antecedent order). An initial fact is a
// leaf. A fact shared by several derivations appears under each.

#include "provenance.hpp"
#include "working_memory.hpp"
#include <algorithm>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace anumana {

struct Explanation {
    Fact fact;
    bool derived = false;           // false: initial fact (leaf)
    std::string rule;
    Bindings bindings;
    size_t cycle = 0;
    std::vector<Explanation> supports;

    size_t depth() const {
        size_t d = 0;
        for (const auto& s : supports) d = std::max(d, s.depth());
        return d + 1;
    }

    // Number of nodes in the tree, shared supports counted each time
    size_t size() const {
        size_t n = 1;
        for (const auto& s : supports) n += s.size();
        return n;
    }
};

class Explainer {
public:
    Explainer(const WorkingMemory& wm, const ProvenanceIndex& provenance)
        : wm_(wm), provenance_(provenance) {}

    // Derivation tree for fact, nullopt if the fact is not known
    std::optional<Explanation> explain(const Fact& fact) {
        if (!wm_.contains(fact)) return std::nullopt;
        return build(fact);
    }

    // Trees for every derived fact, in derivation order
    std::vector<Explanation> explain_all() {
        std::vector<Explanation> result;
        for (const auto& f : provenance_.derived()) result.push_back(build(f));
        return result;
    }

    size_t cached() const { return cache_.size(); }

private:
    const WorkingMemory& wm_;
    const ProvenanceIndex& provenance_;
    std::unordered_map<Fact, Explanation, FactHash> cache_;

    const Explanation& build(const Fact& fact) {
        auto it = cache_.find(fact);
        if (it != cache_.end()) return it->second;

        Explanation e;
        e.fact = fact;
        if (const Derivation* d = provenance_.get(fact)) {
            e.derived = true;
            e.rule = d->rule;
            e.bindings = d->bindings;
            e.cycle = d->cycle;
            for (const auto& s : d->supports) e.supports.push_back(build(s));
        }
        return cache_.emplace(fact, std::move(e)).first->second;
    }
};

// Indented text rendering
//
//   (flag-violation, Alice, CS501)  <= grad-only-violation {?c->CS501, ?s->Alice}
//     (enrolled, Alice, CS501)  [given]
//     (graduate-only, CS501)  [given]
inline void render(std::ostream& os, const Explanation& e, int indent = 0) {
    os << std::string(indent * 2, ' ') << to_string(e.fact);
    if (e.derived) {
        os << "  <= " << e.rule << " " << to_string(e.bindings)
           << " [cycle " << e.cycle << "]\n";
        for (const auto& s : e.supports) render(os, s, indent + 1);
    } else {
        os << "  [given]\n";
    }
}

inline std::string render(const Explanation& e) {
    std::ostringstream oss;
    render(oss, e);
    return oss.str();
}

} // namespace anumana
