#pragma once
// Anumana: a forward-chaining production-rule engine
//
// - Types: Terms, Facts, Patterns, Bindings
// - Unify: pattern-against-fact matching
// - Rules: rule bases and load-time validation
// - Matcher: conjunctive instantiation and refraction
// - Conflict: Priority / Specificity / Order strategies
// - Engine: the recognize-act cycle, to saturation
// - Explain: derivation trees from provenance
// - Problem: JSON rule bases, cases and run reports

#include "types.hpp"
#include "unify.hpp"
#include "rule.hpp"
#include "working_memory.hpp"
#include "provenance.hpp"
#include "matcher.hpp"
#include "conflict.hpp"
#include "executor.hpp"
#include "engine.hpp"
#include "explain.hpp"
#include "compare.hpp"
#include "problem.hpp"
#include "version.hpp"
