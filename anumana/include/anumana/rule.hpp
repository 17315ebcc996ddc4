#pragma once
// Rules: antecedent patterns => one consequent template
//
// A rule base is a static table, validated once before a run.
// Validation reports the first problem found as a message;
// an empty message means the rule (or rule base) is well-formed.

#include "types.hpp"
#include "unify.hpp"
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace anumana {

struct Rule {
    std::string name;                  // Identity, unique within a rule base
    std::vector<Pattern> antecedents;  // Conjunctive, matched in order
    Pattern consequent;
    int priority = 0;

    // Specificity = number of antecedents
    size_t specificity() const { return antecedents.size(); }
};

// Check one rule in isolation
inline std::string validate_rule(const Rule& rule) {
    if (rule.name.empty()) {
        return "Rule has no name";
    }
    if (rule.antecedents.empty()) {
        return "Rule '" + rule.name + "' has no antecedents";
    }

    std::set<std::string> bound;
    for (size_t i = 0; i < rule.antecedents.size(); ++i) {
        const auto& p = rule.antecedents[i];
        if (p.empty()) {
            return "Rule '" + rule.name + "': antecedent " +
                   std::to_string(i + 1) + " is empty";
        }
        auto vars = variables_of(p);
        bound.insert(vars.begin(), vars.end());
    }

    if (rule.consequent.empty()) {
        return "Rule '" + rule.name + "' has an empty consequent";
    }
    for (const auto& var : variables_of(rule.consequent)) {
        if (!bound.count(var)) {
            return "Rule '" + rule.name + "': consequent variable ?" + var +
                   " is not bound by any antecedent";
        }
    }
    return "";
}

// Ground facts supplied before a run
inline std::string validate_fact(const Pattern& fact) {
    if (fact.empty()) {
        return "Empty fact";
    }
    if (!is_ground(fact)) {
        return "Fact " + to_string(fact) + " contains a variable";
    }
    return "";
}

// Relation name -> arity
using RelationArities = std::unordered_map<std::string, size_t>;

class RuleBase {
public:
    RuleBase() = default;
    explicit RuleBase(std::vector<Rule> rules) : rules_(std::move(rules)) {}

    void add(Rule rule) { rules_.push_back(std::move(rule)); }

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const Rule& operator[](size_t i) const { return rules_[i]; }

    const Rule* find(const std::string& name) const {
        for (const auto& r : rules_) {
            if (r.name == name) return &r;
        }
        return nullptr;
    }

    // Validate every rule, then the cross-rule checks: unique names
    // and one arity per relation name.
    bool validate(std::string& error) const {
        std::unordered_set<std::string> names;
        RelationArities arity;

        auto check_arity = [&](const Rule& rule, const Pattern& p) {
            std::string pred = predicate_of(p);
            if (pred.empty()) return true;
            auto [it, inserted] = arity.emplace(pred, p.size());
            if (!inserted && it->second != p.size()) {
                error = "Rule '" + rule.name + "': relation '" + pred +
                        "' used with arity " + std::to_string(p.size()) +
                        " and " + std::to_string(it->second);
                return false;
            }
            return true;
        };

        for (const auto& rule : rules_) {
            error = validate_rule(rule);
            if (!error.empty()) return false;

            if (!names.insert(rule.name).second) {
                error = "Duplicate rule name '" + rule.name + "'";
                return false;
            }

            for (const auto& p : rule.antecedents) {
                if (!check_arity(rule, p)) return false;
            }
            if (!check_arity(rule, rule.consequent)) return false;
        }

        error.clear();
        return true;
    }

    // Relation name -> arity, from every pattern with a leading constant.
    // On a conflicting rule base the first arity seen wins.
    RelationArities relation_arities() const {
        RelationArities arity;
        for (const auto& rule : rules_) {
            for (const auto& p : rule.antecedents) {
                std::string pred = predicate_of(p);
                if (!pred.empty()) arity.emplace(pred, p.size());
            }
            std::string pred = predicate_of(rule.consequent);
            if (!pred.empty()) arity.emplace(pred, rule.consequent.size());
        }
        return arity;
    }

private:
    std::vector<Rule> rules_;  // Declaration order is the Order strategy's order
};

// A fact of a relation the rules use must have the rules' arity;
// otherwise it could never match. Empty message if consistent.
inline std::string check_fact_arity(const Fact& fact, const RelationArities& arity) {
    if (fact.empty()) return "";
    auto it = arity.find(fact[0]);
    if (it == arity.end() || it->second == fact.size()) return "";
    return "Fact " + to_string(fact) + " has arity " + std::to_string(fact.size()) +
           " but relation '" + fact[0] + "' has arity " + std::to_string(it->second) +
           " in the rules";
}

} // namespace anumana
