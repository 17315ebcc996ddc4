#pragma once
// Matcher: rule instantiations against working memory
//
// Conjunctive matching is a fold over antecedents. The set of partial
// binding sets is carried forward; antecedent i extends each survivor
// of antecedent i-1 with every fact it unifies with. Whatever survives
// the last antecedent is an instantiation.
//
// Result order is stable: rules in declaration order, then binding
// sets in discovery order (antecedent by antecedent, facts in
// insertion order).

#include "rule.hpp"
#include "unify.hpp"
#include "working_memory.hpp"
#include <iterator>
#include <set>
#include <utility>
#include <vector>

namespace anumana {

// A (rule, bindings) pair eligible to fire
struct Instantiation {
    size_t rule_index = 0;   // Position in the rule base
    std::string rule;        // Rule identity
    Bindings bindings;

    bool operator==(const Instantiation& other) const {
        return rule == other.rule && bindings == other.bindings;
    }

    bool operator!=(const Instantiation& other) const {
        return !(*this == other);
    }
};

struct MatchStats {
    size_t unifications = 0;  // unify() calls
};

// All binding sets satisfying every antecedent of rule jointly
inline std::vector<Bindings> match_antecedents(const std::vector<Pattern>& antecedents,
                                               const WorkingMemory& wm,
                                               MatchStats* stats = nullptr) {
    std::vector<Bindings> partial{Bindings{}};
    for (const auto& pattern : antecedents) {
        std::vector<Bindings> next;
        for (const auto& b : partial) {
            for (const auto& fact : wm) {
                if (stats) ++stats->unifications;
                if (auto extended = unify(pattern, fact, b)) {
                    next.push_back(std::move(*extended));
                }
            }
        }
        partial = std::move(next);
        if (partial.empty()) break;
    }
    return partial;
}

inline std::vector<Instantiation> match_rule(const RuleBase& rules, size_t rule_index,
                                             const WorkingMemory& wm,
                                             MatchStats* stats = nullptr) {
    const Rule& rule = rules[rule_index];
    std::vector<Instantiation> result;
    for (auto& b : match_antecedents(rule.antecedents, wm, stats)) {
        result.push_back({rule_index, rule.name, std::move(b)});
    }
    return result;
}

// Every instantiation of every rule, in enumeration order
inline std::vector<Instantiation> match_all(const RuleBase& rules, const WorkingMemory& wm,
                                            MatchStats* stats = nullptr) {
    std::vector<Instantiation> result;
    for (size_t i = 0; i < rules.size(); ++i) {
        auto found = match_rule(rules, i, wm, stats);
        result.insert(result.end(),
                      std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
    }
    return result;
}

// Fired-instantiation history: append-only for one run
class FiredHistory {
public:
    bool contains(const Instantiation& inst) const {
        return fired_.count({inst.rule, inst.bindings}) > 0;
    }

    // Returns false if already fired
    bool add(const Instantiation& inst) {
        return fired_.emplace(inst.rule, inst.bindings).second;
    }

    size_t size() const { return fired_.size(); }

private:
    std::set<std::pair<std::string, Bindings>> fired_;
};

// Refraction: drop instantiations that already fired. Preserves order.
inline std::vector<Instantiation> refract(const std::vector<Instantiation>& candidates,
                                          const FiredHistory& history) {
    std::vector<Instantiation> result;
    for (const auto& inst : candidates) {
        if (!history.contains(inst)) result.push_back(inst);
    }
    return result;
}

} // namespace anumana
