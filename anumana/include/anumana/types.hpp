#pragma once
// Core types: the atoms of inference
//
// A Term is a constant or a variable. A Fact is a tuple of constants.
// A Pattern is a tuple of terms. Bindings map variables to constants.

#include <cstdint>
#include <functional>
#include <utility>
#include <map>
#include <string>
#include <vector>

namespace anumana {

// Variables are written with a leading '?' in rule text ("?student")
constexpr char VARIABLE_MARK = '?';

struct Term {
    enum class Kind : uint8_t { Constant, Variable };

    Kind kind = Kind::Constant;
    std::string name;   // Constant value, or variable name without the mark

    static Term constant(std::string value) {
        return {Kind::Constant, std::move(value)};
    }

    static Term variable(std::string name) {
        return {Kind::Variable, std::move(name)};
    }

    // "?x" -> variable x, anything else -> constant
    static Term parse(const std::string& text) {
        if (text.size() > 1 && text[0] == VARIABLE_MARK) {
            return variable(text.substr(1));
        }
        return constant(text);
    }

    bool is_variable() const { return kind == Kind::Variable; }
    bool is_constant() const { return kind == Kind::Constant; }

    std::string to_string() const {
        return is_variable() ? std::string(1, VARIABLE_MARK) + name : name;
    }

    bool operator==(const Term& other) const {
        return kind == other.kind && name == other.name;
    }

    bool operator!=(const Term& other) const {
        return !(*this == other);
    }

    bool operator<(const Term& other) const {
        return kind < other.kind || (kind == other.kind && name < other.name);
    }
};

// Rule-side tuple: may contain variables, never stored in working memory
using Pattern = std::vector<Term>;

// Ground atom: every position is a constant
using Fact = std::vector<std::string>;

// Variable name -> constant. Ordered, so equality is independent of
// the order in which variables were bound.
using Bindings = std::map<std::string, std::string>;

// Hash for Fact (for use in unordered containers)
struct FactHash {
    size_t operator()(const Fact& fact) const {
        size_t h = fact.size();
        for (const auto& part : fact) {
            h ^= std::hash<std::string>{}(part) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }
};

inline Pattern make_pattern(const std::vector<std::string>& texts) {
    Pattern p;
    p.reserve(texts.size());
    for (const auto& t : texts) p.push_back(Term::parse(t));
    return p;
}

inline bool is_ground(const Pattern& pattern) {
    for (const auto& t : pattern) {
        if (t.is_variable()) return false;
    }
    return true;
}

// Leading constant of a tuple, used as its relation name
inline std::string predicate_of(const Pattern& pattern) {
    if (pattern.empty() || pattern[0].is_variable()) return "";
    return pattern[0].name;
}

inline std::string to_string(const Fact& fact) {
    std::string s = "(";
    for (size_t i = 0; i < fact.size(); ++i) {
        if (i) s += ", ";
        s += fact[i];
    }
    return s + ")";
}

inline std::string to_string(const Pattern& pattern) {
    std::string s = "(";
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (i) s += ", ";
        s += pattern[i].to_string();
    }
    return s + ")";
}

inline std::string to_string(const Bindings& bindings) {
    std::string s = "{";
    bool first = true;
    for (const auto& [var, value] : bindings) {
        if (!first) s += ", ";
        s += std::string(1, VARIABLE_MARK) + var + "->" + value;
        first = false;
    }
    return s + "}";
}

} // namespace anumana
