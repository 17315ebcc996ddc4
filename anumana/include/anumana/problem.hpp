#pragma once
// Problem files: rule bases and working memories as JSON
//
// {
//   "format_version": {"major": 1, "minor": 0},      (optional)
//   "rules": [
//     {"name": "grad-only-violation", "priority": 5,
//      "antecedents": [["enrolled", "?s", "?c"], ["graduate-only", "?c"]],
//      "consequent": ["flag-violation", "?s", "?c"]}
//   ],
//   "cases": [
//     {"name": "basic", "facts": [["enrolled", "Alice", "CS501"], ["graduate-only", "CS501"]]}
//   ]
// }
//
// Terms are strings; a leading '?' marks a variable.

#include "engine.hpp"
#include "explain.hpp"
#include "rule.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace anumana {

using json = nlohmann::json;

struct Case {
    std::string name;
    std::vector<Fact> facts;
};

struct Problem {
    RuleBase rules;
    std::vector<Case> cases;

    const Case* find_case(const std::string& name) const {
        for (const auto& c : cases) {
            if (c.name == name) return &c;
        }
        return nullptr;
    }
};

// ═══════════════════════════════════════════════════════════════════
// Reading
// ═══════════════════════════════════════════════════════════════════

inline bool parse_pattern(const json& j, Pattern& out, std::string& error) {
    if (!j.is_array()) {
        error = "pattern must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& t : j) {
        if (!t.is_string()) {
            error = "pattern term must be a string: " + t.dump();
            return false;
        }
        out.push_back(Term::parse(t.get<std::string>()));
    }
    return true;
}

inline bool parse_rule(const json& j, Rule& out, std::string& error) {
    if (!j.is_object()) {
        error = "rule must be an object";
        return false;
    }
    for (const char* key : {"name", "antecedents", "consequent"}) {
        if (!j.contains(key)) {
            error = std::string("rule is missing required field: ") + key;
            return false;
        }
    }
    if (!j["name"].is_string()) {
        error = "rule name must be a string";
        return false;
    }
    out = Rule{};
    out.name = j["name"].get<std::string>();

    if (j.contains("priority")) {
        if (!j["priority"].is_number_integer()) {
            error = "rule '" + out.name + "': priority must be an integer";
            return false;
        }
        const auto& pr = j["priority"];
        bool in_range = pr.is_number_unsigned()
            ? pr.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : pr.get<int64_t>() >= std::numeric_limits<int>::min() &&
              pr.get<int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            error = "rule '" + out.name + "': priority out of range";
            return false;
        }
        out.priority = pr.get<int>();
    }

    if (!j["antecedents"].is_array()) {
        error = "rule '" + out.name + "': antecedents must be an array";
        return false;
    }
    for (const auto& a : j["antecedents"]) {
        Pattern p;
        if (!parse_pattern(a, p, error)) {
            error = "rule '" + out.name + "': " + error;
            return false;
        }
        out.antecedents.push_back(std::move(p));
    }

    if (!parse_pattern(j["consequent"], out.consequent, error)) {
        error = "rule '" + out.name + "': " + error;
        return false;
    }
    return true;
}

inline bool parse_facts(const json& j, std::vector<Fact>& out, std::string& error) {
    if (!j.is_array()) {
        error = "facts must be an array";
        return false;
    }
    out.clear();
    for (const auto& f : j) {
        Pattern p;
        if (!parse_pattern(f, p, error)) return false;
        error = validate_fact(p);
        if (!error.empty()) return false;
        Fact fact;
        for (const auto& t : p) fact.push_back(t.name);
        out.push_back(std::move(fact));
    }
    return true;
}

// Parse and validate a problem document. Rules are validated as a
// rule base; a malformed rule base is rejected here.
inline bool load_problem(const json& j, Problem& out, std::string& error) {
    if (!j.is_object()) {
        error = "problem must be a JSON object";
        return false;
    }

    if (j.contains("format_version")) {
        const auto& v = j["format_version"];
        if (!v.is_object()) {
            error = "'format_version' must be an object";
            return false;
        }
        for (const char* key : {"major", "minor"}) {
            if (v.contains(key) && !v[key].is_number_integer()) {
                error = std::string("format_version.") + key + " must be an integer";
                return false;
            }
        }
        int major = v.value("major", 0);
        int minor = v.value("minor", 0);
        if (!version::format_compatible(major, minor)) {
            error = "unsupported format version " + std::to_string(major) + "." +
                    std::to_string(minor);
            return false;
        }
    }

    out = Problem{};
    if (!j.contains("rules") || !j["rules"].is_array()) {
        error = "problem is missing a 'rules' array";
        return false;
    }
    for (const auto& r : j["rules"]) {
        Rule rule;
        if (!parse_rule(r, rule, error)) return false;
        out.rules.add(std::move(rule));
    }
    if (!out.rules.validate(error)) return false;
    RelationArities arity = out.rules.relation_arities();

    if (j.contains("cases")) {
        if (!j["cases"].is_array()) {
            error = "'cases' must be an array";
            return false;
        }
        for (const auto& c : j["cases"]) {
            if (!c.is_object()) {
                error = "case must be an object";
                return false;
            }
            Case wm;
            if (c.contains("name") && !c["name"].is_string()) {
                error = "case name must be a string";
                return false;
            }
            wm.name = c.value("name", "case " + std::to_string(out.cases.size() + 1));
            error.clear();
            if (!c.contains("facts") || !parse_facts(c["facts"], wm.facts, error)) {
                if (error.empty()) error = "missing 'facts'";
                error = "case '" + wm.name + "': " + error;
                return false;
            }
            for (const auto& f : wm.facts) {
                error = check_fact_arity(f, arity);
                if (!error.empty()) {
                    error = "case '" + wm.name + "': " + error;
                    return false;
                }
            }
            out.cases.push_back(std::move(wm));
        }
    }
    return true;
}

inline bool load_problem_file(const std::string& path, Problem& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    try {
        json j = json::parse(in);
        return load_problem(j, out, error);
    } catch (const json::parse_error& e) {
        error = path + ": JSON parse error: " + e.what();
    } catch (const json::type_error& e) {
        error = path + ": " + e.what();
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════════════

inline json pattern_to_json(const Pattern& p) {
    json arr = json::array();
    for (const auto& t : p) arr.push_back(t.to_string());
    return arr;
}

inline json bindings_to_json(const Bindings& b) {
    json obj = json::object();
    for (const auto& [var, value] : b) obj[std::string(1, VARIABLE_MARK) + var] = value;
    return obj;
}

inline json rule_to_json(const Rule& r) {
    json antecedents = json::array();
    for (const auto& a : r.antecedents) antecedents.push_back(pattern_to_json(a));
    return {
        {"name", r.name},
        {"priority", r.priority},
        {"antecedents", antecedents},
        {"consequent", pattern_to_json(r.consequent)}
    };
}

inline json explanation_to_json(const Explanation& e) {
    json j = {{"fact", e.fact}, {"derived", e.derived}};
    if (e.derived) {
        j["rule"] = e.rule;
        j["bindings"] = bindings_to_json(e.bindings);
        j["cycle"] = e.cycle;
        json supports = json::array();
        for (const auto& s : e.supports) supports.push_back(explanation_to_json(s));
        j["supports"] = supports;
    }
    return j;
}

inline json firing_to_json(const FiringRecord& f) {
    return {
        {"cycle", f.cycle},
        {"rule", f.instantiation.rule},
        {"bindings", bindings_to_json(f.instantiation.bindings)},
        {"conflict_set", f.conflict_set_size},
        {"derived", f.derived ? json(*f.derived) : json()}
    };
}

// Full run report: state, stats, facts, firings, and optionally the
// explanation of every derived fact
inline json run_report(const InferenceEngine& engine, bool with_explanations) {
    const auto& st = engine.stats();
    json report = {
        {"strategy", strategy_name(engine.config().strategy)},
        {"state", state_name(engine.state())},
        {"stats", {
            {"cycles", st.cycles},
            {"firings", st.firings},
            {"new_facts", st.new_facts},
            {"redundant_firings", st.redundant_firings},
            {"unifications", st.unifications}
        }},
        {"facts", engine.working_memory().facts()}
    };
    if (engine.state() == EngineState::Failed) report["error"] = engine.error();

    json firings = json::array();
    for (const auto& f : engine.firings()) firings.push_back(firing_to_json(f));
    report["firings"] = firings;

    if (with_explanations) {
        Explainer explainer(engine.working_memory(), engine.provenance());
        json explanations = json::array();
        for (const auto& e : explainer.explain_all()) {
            explanations.push_back(explanation_to_json(e));
        }
        report["explanations"] = explanations;
    }
    return report;
}

} // namespace anumana
