#pragma once
// Conflict resolution: pick one instantiation from the conflict set
//
// All strategies share the same tie-break: the first candidate in
// enumeration order wins. Candidates arrive in that order from the
// matcher, so "first maximum" is the whole rule.

#include "matcher.hpp"
#include "rule.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace anumana {

enum class Strategy : uint8_t {
    Priority = 0,     // Highest rule priority
    Specificity = 1,  // Most antecedents
    Order = 2,        // First in enumeration order
};

inline const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Priority: return "priority";
        case Strategy::Specificity: return "specificity";
        case Strategy::Order: return "order";
    }
    return "unknown";
}

inline std::optional<Strategy> parse_strategy(const std::string& name) {
    if (name == "priority") return Strategy::Priority;
    if (name == "specificity") return Strategy::Specificity;
    if (name == "order") return Strategy::Order;
    return std::nullopt;
}

inline const std::vector<Strategy>& all_strategies() {
    static const std::vector<Strategy> strategies{
        Strategy::Priority, Strategy::Specificity, Strategy::Order};
    return strategies;
}

// Ranking key of a candidate under a strategy; higher wins
inline long strategy_score(Strategy s, const Rule& rule) {
    switch (s) {
        case Strategy::Priority: return rule.priority;
        case Strategy::Specificity: return static_cast<long>(rule.specificity());
        case Strategy::Order: return 0;
    }
    return 0;
}

// Index of the winning candidate. Pure and deterministic.
// Throws std::logic_error on an empty conflict set: the engine
// treats an empty set as saturation and must not get here.
inline size_t select(const std::vector<Instantiation>& candidates,
                     const RuleBase& rules, Strategy strategy) {
    if (candidates.empty()) {
        throw std::logic_error("conflict resolution invoked on an empty conflict set");
    }

    size_t best = 0;
    long best_score = strategy_score(strategy, rules[candidates[0].rule_index]);
    for (size_t i = 1; i < candidates.size(); ++i) {
        long score = strategy_score(strategy, rules[candidates[i].rule_index]);
        if (score > best_score) {
            best = i;
            best_score = score;
        }
    }
    return best;
}

} // namespace anumana
