#include <anumana/anumana.hpp>
#include <iostream>
#include <cassert>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace anumana;

Rule make_rule(const std::string& name,
               const std::vector<std::vector<std::string>>& antecedents,
               const std::vector<std::string>& consequent,
               int priority = 0) {
    Rule r;
    r.name = name;
    for (const auto& a : antecedents) r.antecedents.push_back(make_pattern(a));
    r.consequent = make_pattern(consequent);
    r.priority = priority;
    return r;
}

// Enrollment rule base and the conflict test case
RuleBase enrollment_rules() {
    RuleBase rules;
    rules.add(make_rule("graduate-only-course-restriction",
        {{"graduate-only", "?course"}, {"not-graduate-student", "?student"}},
        {"cannot-enroll-course", "?student", "?course"}, 7));
    rules.add(make_rule("missing-prerequisite-prevents-enrollment",
        {{"course-prerequisite", "?course", "?prereq"},
         {"not-completed", "?student", "?prereq"},
         {"no-waiver", "?student", "?prereq"}},
        {"cannot-enroll-course", "?student", "?course"}, 8));
    rules.add(make_rule("credit-limit-prevents-enrollment",
        {{"would-exceed-credit-limit", "?student", "?course"}},
        {"cannot-enroll-course", "?student", "?course"}, 6));
    rules.add(make_rule("time-conflict-prevents-enrollment",
        {{"enrolled-in", "?student", "?sectionA"},
         {"request-section", "?student", "?sectionB"},
         {"section-overlap", "?sectionA", "?sectionB"}},
        {"cannot-enroll", "?student", "?sectionB"}, 5));
    rules.add(make_rule("administrative-hold-prevents-enrollment",
        {{"has-hold", "?student"}, {"request-course", "?student", "?course"}},
        {"cannot-enroll-course", "?student", "?course"}, 9));
    rules.add(make_rule("cannot-enroll-course-implies-drop-request",
        {{"cannot-enroll-course", "?student", "?course"},
         {"request-course", "?student", "?course"}},
        {"dropped-request", "?student", "?course"}, 4));
    rules.add(make_rule("dropped-request-implies-notify-student",
        {{"dropped-request", "?student", "?course"}},
        {"notified-student", "?student", "?course"}, 3));
    return rules;
}

std::vector<Fact> carol_facts() {
    return {
        {"student", "Carol"},
        {"request-course", "Carol", "CS550"},
        {"graduate-only", "CS550"},
        {"not-graduate-student", "Carol"},
        {"course-prerequisite", "CS550", "CS350"},
        {"not-completed", "Carol", "CS350"},
        {"no-waiver", "Carol", "CS350"},
        {"has-hold", "Carol"},
    };
}

// Two rules plus a third all concluding (needs-advisor-review, Bob):
// Order picks the first declared, Specificity the longest, Priority the highest.
RuleBase advisor_rules() {
    RuleBase rules;
    rules.add(make_rule("low-gpa-review",
        {{"low-gpa", "?s"}},
        {"needs-advisor-review", "?s"}, 1));
    rules.add(make_rule("overload-review",
        {{"requests-overload", "?s"}, {"on-probation", "?s"}, {"credits-above", "?s", "?n"}},
        {"needs-advisor-review", "?s"}, 5));
    rules.add(make_rule("hold-review",
        {{"has-hold", "?s"}, {"registered", "?s"}},
        {"needs-advisor-review", "?s"}, 9));
    return rules;
}

std::vector<Fact> bob_facts() {
    return {
        {"low-gpa", "Bob"},
        {"requests-overload", "Bob"},
        {"on-probation", "Bob"},
        {"credits-above", "Bob", "18"},
        {"has-hold", "Bob"},
        {"registered", "Bob"},
    };
}

// Follow supports from fact; false if a fact recurs on the current path
bool acyclic_from(const ProvenanceIndex& prov, const Fact& fact, std::set<Fact>& path) {
    if (!path.insert(fact).second) return false;
    if (const Derivation* d = prov.get(fact)) {
        for (const auto& s : d->supports) {
            if (!acyclic_from(prov, s, path)) return false;
        }
    }
    path.erase(fact);
    return true;
}

void test_term_parse() {
    std::cout << "Testing Term parse..." << std::endl;

    Term v = Term::parse("?student");
    assert(v.is_variable());
    assert(v.name == "student");
    assert(v.to_string() == "?student");

    Term c = Term::parse("CS101");
    assert(c.is_constant());
    assert(c.name == "CS101");

    // A lone mark is a constant
    assert(Term::parse("?").is_constant());

    Pattern p = make_pattern({"enrolled", "?s", "CS101"});
    assert(!is_ground(p));
    assert(predicate_of(p) == "enrolled");
    assert(to_string(p) == "(enrolled, ?s, CS101)");

    std::cout << "  PASS" << std::endl;
}

void test_unify_basic() {
    std::cout << "Testing unify..." << std::endl;

    Pattern p = make_pattern({"enrolled", "?s", "?c"});
    Fact f{"enrolled", "Alice", "CS501"};

    auto b = unify(p, f);
    assert(b.has_value());
    assert(b->size() == 2);
    assert(b->at("s") == "Alice");
    assert(b->at("c") == "CS501");

    // Constant mismatch
    assert(!unify(p, Fact{"graduate-only", "Alice", "CS501"}));

    // Arity mismatch is a non-match
    assert(!unify(p, Fact{"enrolled", "Alice"}));

    // Repeated variable must bind consistently
    Pattern same = make_pattern({"pair", "?x", "?x"});
    assert(!unify(same, Fact{"pair", "a", "b"}));
    assert(unify(same, Fact{"pair", "a", "a"}));

    std::cout << "  PASS" << std::endl;
}

void test_unify_extends_bindings() {
    std::cout << "Testing unify with incoming bindings..." << std::endl;

    Bindings incoming{{"c", "CS501"}};
    Pattern p = make_pattern({"graduate-only", "?c"});

    auto ok = unify(p, Fact{"graduate-only", "CS501"}, incoming);
    assert(ok.has_value());
    assert(*ok == incoming);

    assert(!unify(p, Fact{"graduate-only", "CS101"}, incoming));

    auto extended = unify(make_pattern({"enrolled", "?s", "?c"}),
                          Fact{"enrolled", "Alice", "CS501"}, incoming);
    assert(extended.has_value());
    assert(extended->size() == 2);

    // Input is never mutated
    assert(incoming.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_unify_consistency() {
    std::cout << "Testing unify consistency..." << std::endl;

    std::vector<Pattern> patterns = {
        make_pattern({"p", "?x", "?y"}),
        make_pattern({"p", "?x", "?x"}),
        make_pattern({"p", "a", "?y"}),
        make_pattern({"?r", "?x", "b"}),
        make_pattern({"p", "a", "b"}),
    };
    std::vector<Fact> facts = {
        {"p", "a", "b"}, {"p", "a", "a"}, {"q", "a", "b"}, {"p", "b", "b"}, {"p", "a"},
    };

    size_t matched = 0;
    for (const auto& p : patterns) {
        for (const auto& f : facts) {
            auto b = unify(p, f);
            if (!b) continue;
            ++matched;
            auto back = substitute(p, *b);
            assert(back.has_value());
            assert(*back == f);
        }
    }
    assert(matched > 0);

    std::cout << "  PASS" << std::endl;
}

void test_substitute() {
    std::cout << "Testing substitute..." << std::endl;

    Pattern p = make_pattern({"flag-violation", "?s", "?c"});
    auto f = substitute(p, {{"s", "Alice"}, {"c", "CS501"}});
    assert(f.has_value());
    assert((*f == Fact{"flag-violation", "Alice", "CS501"}));

    assert(!substitute(p, {{"s", "Alice"}}));
    assert(to_fact(make_pattern({"a", "b"})).has_value());
    assert(!to_fact(make_pattern({"a", "?b"})).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_rule_validation() {
    std::cout << "Testing rule validation..." << std::endl;

    assert(validate_rule(make_rule("ok", {{"p", "?x"}}, {"q", "?x"})).empty());

    Rule no_ante = make_rule("empty", {}, {"q", "a"});
    assert(!validate_rule(no_ante).empty());

    Rule unbound = make_rule("unbound", {{"p", "?x"}}, {"q", "?x", "?y"});
    assert(validate_rule(unbound).find("?y") != std::string::npos);

    assert(!validate_rule(make_rule("", {{"p", "?x"}}, {"q", "?x"})).empty());
    assert(!validate_rule(make_rule("empty-pattern", {{}}, {"q", "a"})).empty());
    assert(!validate_rule(make_rule("empty-consequent", {{"p", "a"}}, {})).empty());

    std::string error;

    RuleBase dup;
    dup.add(make_rule("r", {{"p", "?x"}}, {"q", "?x"}));
    dup.add(make_rule("r", {{"q", "?x"}}, {"s", "?x"}));
    assert(!dup.validate(error));
    assert(error.find("Duplicate") != std::string::npos);

    RuleBase arity;
    arity.add(make_rule("r1", {{"p", "?x"}}, {"q", "?x"}));
    arity.add(make_rule("r2", {{"p", "?x", "?y"}}, {"q", "?y"}));
    assert(!arity.validate(error));
    assert(error.find("arity") != std::string::npos);

    assert(enrollment_rules().validate(error));
    assert(error.empty());

    std::cout << "  PASS" << std::endl;
}

void test_working_memory() {
    std::cout << "Testing WorkingMemory..." << std::endl;

    WorkingMemory wm;
    assert(wm.insert({"a", "b"}));
    assert(wm.insert({"c"}));
    assert(!wm.insert({"a", "b"}));
    assert(wm.size() == 2);
    assert(wm.contains({"c"}));
    assert(!wm.contains({"d"}));
    assert((wm.facts()[0] == Fact{"a", "b"}));

    WorkingMemory other;
    other.insert({"c"});
    other.insert({"a", "b"});
    assert(wm.same_facts(other));

    std::cout << "  PASS" << std::endl;
}

void test_match_conjunctive() {
    std::cout << "Testing conjunctive matching..." << std::endl;

    WorkingMemory wm(std::vector<Fact>{
        {"enrolled", "Alice", "CS501"},
        {"enrolled", "Bob", "CS101"},
        {"enrolled", "Bob", "CS502"},
        {"graduate-only", "CS501"},
        {"graduate-only", "CS502"},
    });

    std::vector<Pattern> antecedents = {
        make_pattern({"enrolled", "?s", "?c"}),
        make_pattern({"graduate-only", "?c"}),
    };

    MatchStats stats;
    auto found = match_antecedents(antecedents, wm, &stats);
    assert(found.size() == 2);
    assert((found[0] == Bindings{{"s", "Alice"}, {"c", "CS501"}}));
    assert((found[1] == Bindings{{"s", "Bob"}, {"c", "CS502"}}));
    // 5 facts for the first antecedent, 5 per survivor (3) for the second
    assert(stats.unifications == 5 + 3 * 5);

    // A fact may satisfy several antecedents of the same rule
    WorkingMemory loop(std::vector<Fact>{{"edge", "a", "a"}});
    auto self = match_antecedents({make_pattern({"edge", "?x", "?y"}),
                                   make_pattern({"edge", "?y", "?x"})}, loop);
    assert(self.size() == 1);

    // Nothing matches the first antecedent
    assert(match_antecedents({make_pattern({"missing", "?x"})}, wm).empty());

    std::cout << "  PASS" << std::endl;
}

void test_match_order() {
    std::cout << "Testing match enumeration order..." << std::endl;

    RuleBase rules;
    rules.add(make_rule("second", {{"p", "?x"}}, {"r", "?x"}));
    rules.add(make_rule("first", {{"p", "?x"}}, {"q", "?x"}));

    WorkingMemory wm(std::vector<Fact>{{"p", "b"}, {"p", "a"}});
    auto all = match_all(rules, wm);
    assert(all.size() == 4);
    assert(all[0].rule == "second" && all[0].bindings.at("x") == "b");
    assert(all[1].rule == "second" && all[1].bindings.at("x") == "a");
    assert(all[2].rule == "first" && all[2].rule_index == 1);

    std::cout << "  PASS" << std::endl;
}

void test_refraction() {
    std::cout << "Testing refraction..." << std::endl;

    // Binding equality does not depend on insertion order
    Bindings b1;
    b1["s"] = "Alice";
    b1["c"] = "CS501";
    Bindings b2;
    b2["c"] = "CS501";
    b2["s"] = "Alice";

    Instantiation i1{0, "r", b1};
    Instantiation i2{0, "r", b2};
    Instantiation other_rule{1, "q", b1};
    Instantiation other_bindings{0, "r", {{"s", "Bob"}, {"c", "CS501"}}};
    assert(i1 == i2);

    FiredHistory history;
    assert(history.add(i1));
    assert(!history.add(i2));
    assert(history.contains(i2));
    assert(history.size() == 1);

    auto left = refract({i1, other_rule, other_bindings}, history);
    assert(left.size() == 2);
    assert(left[0] == other_rule);
    assert(left[1] == other_bindings);

    // refract() leaves history alone
    assert(history.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_strategy_select() {
    std::cout << "Testing strategy selection..." << std::endl;

    RuleBase rules = advisor_rules();
    WorkingMemory wm(bob_facts());
    auto candidates = match_all(rules, wm);
    assert(candidates.size() == 3);

    assert(candidates[select(candidates, rules, Strategy::Order)].rule == "low-gpa-review");
    assert(candidates[select(candidates, rules, Strategy::Specificity)].rule == "overload-review");
    assert(candidates[select(candidates, rules, Strategy::Priority)].rule == "hold-review");

    // Same input, same answer
    for (Strategy s : all_strategies()) {
        assert(select(candidates, rules, s) == select(candidates, rules, s));
    }

    bool threw = false;
    try {
        select({}, rules, Strategy::Priority);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    assert(parse_strategy("specificity") == Strategy::Specificity);
    assert(!parse_strategy("random").has_value());
    assert(std::string(strategy_name(Strategy::Order)) == "order");

    std::cout << "  PASS" << std::endl;
}

void test_strategy_tie_break() {
    std::cout << "Testing strategy tie-break..." << std::endl;

    // Equal priority and specificity: declared order decides,
    // then discovery order within a rule
    RuleBase rules;
    rules.add(make_rule("alpha", {{"p", "?x"}}, {"q", "?x"}, 5));
    rules.add(make_rule("beta", {{"p", "?x"}}, {"r", "?x"}, 5));

    WorkingMemory wm(std::vector<Fact>{{"p", "b"}, {"p", "a"}});
    auto candidates = match_all(rules, wm);

    for (Strategy s : all_strategies()) {
        size_t i = select(candidates, rules, s);
        assert(i == 0);
        assert(candidates[i].rule == "alpha");
        assert(candidates[i].bindings.at("x") == "b");
    }

    std::cout << "  PASS" << std::endl;
}

void test_executor() {
    std::cout << "Testing executor..." << std::endl;

    Rule rule = make_rule("grad-only-violation",
        {{"enrolled", "?s", "?c"}, {"graduate-only", "?c"}},
        {"flag-violation", "?s", "?c"}, 5);

    WorkingMemory wm(std::vector<Fact>{{"enrolled", "Alice", "CS501"}, {"graduate-only", "CS501"}});
    ProvenanceIndex prov;
    FiredHistory history;

    Instantiation inst{0, rule.name, {{"s", "Alice"}, {"c", "CS501"}}};
    auto derived = fire(rule, inst, wm, prov, history, 1);
    assert(derived.has_value());
    assert((*derived == Fact{"flag-violation", "Alice", "CS501"}));
    assert(wm.size() == 3);
    assert(history.contains(inst));

    const Derivation* d = prov.get(*derived);
    assert(d != nullptr);
    assert(d->rule == "grad-only-violation");
    assert(d->bindings == inst.bindings);
    assert(d->supports.size() == 2);
    assert((d->supports[0] == Fact{"enrolled", "Alice", "CS501"}));
    assert((d->supports[1] == Fact{"graduate-only", "CS501"}));
    assert(d->cycle == 1);

    // A second rule reaching a known fact: no new fact, no new record,
    // but the instantiation is spent
    Rule again = make_rule("again", {{"graduate-only", "?c"}, {"enrolled", "?s", "?c"}},
                           {"flag-violation", "?s", "?c"});
    Instantiation inst2{1, again.name, {{"s", "Alice"}, {"c", "CS501"}}};
    assert(!fire(again, inst2, wm, prov, history, 2).has_value());
    assert(wm.size() == 3);
    assert(prov.count() == 1);
    assert(prov.get(*derived)->rule == "grad-only-violation");
    assert(history.size() == 2);

    // A derivation that cannot be grounded leaves the store untouched
    Rule broken = make_rule("broken", {{"enrolled", "?s", "?c"}, {"advisor", "?a"}},
                            {"review", "?s"});
    Instantiation inst3{2, broken.name, {{"s", "Alice"}, {"c", "CS501"}}};
    bool threw = false;
    try {
        fire(broken, inst3, wm, prov, history, 3);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(!wm.contains({"review", "Alice"}));
    assert(wm.size() == 3);
    assert(prov.count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_engine_single_rule() {
    std::cout << "Testing engine single-rule run..." << std::endl;

    RuleBase rules;
    rules.add(make_rule("grad-only-violation",
        {{"enrolled", "?s", "?c"}, {"graduate-only", "?c"}},
        {"flag-violation", "?s", "?c"}, 5));

    InferenceEngine engine(rules, {{"enrolled", "Alice", "CS501"}, {"graduate-only", "CS501"}});
    assert(engine.state() == EngineState::Running);

    assert(engine.step() == EngineState::Running);
    assert(engine.working_memory().contains({"flag-violation", "Alice", "CS501"}));
    assert(engine.firings().size() == 1);

    const Derivation* d = engine.provenance().get({"flag-violation", "Alice", "CS501"});
    assert(d != nullptr);
    assert(d->rule == "grad-only-violation");
    assert((d->bindings == Bindings{{"s", "Alice"}, {"c", "CS501"}}));
    assert((d->supports == std::vector<Fact>{{"enrolled", "Alice", "CS501"},
                                             {"graduate-only", "CS501"}}));

    assert(engine.step() == EngineState::Saturated);
    assert(engine.cycles() == 2);
    assert(engine.working_memory().size() == 3);
    assert(engine.firings().size() == 1);

    // Terminal states are sticky
    assert(engine.step() == EngineState::Saturated);
    assert(engine.cycles() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_engine_no_match() {
    std::cout << "Testing engine with no matching rule..." << std::endl;

    InferenceEngine engine(enrollment_rules(),
        {{"student", "Eve"}, {"likes", "Eve", "AI"}, {"hobby", "Eve", "Chess"}});
    assert(engine.run() == EngineState::Saturated);
    assert(engine.cycles() == 1);
    assert(engine.firings().empty());
    assert(engine.working_memory().size() == 3);
    assert(engine.derived_facts().empty());

    std::cout << "  PASS" << std::endl;
}

void test_engine_enrollment_priority() {
    std::cout << "Testing enrollment conflict case (priority)..." << std::endl;

    InferenceEngine engine(enrollment_rules(), carol_facts());
    assert(engine.run() == EngineState::Saturated);

    const auto& firings = engine.firings();
    assert(firings.size() == 5);
    assert(firings[0].instantiation.rule == "administrative-hold-prevents-enrollment");
    assert(firings[0].conflict_set_size == 3);
    assert(firings[0].derived.has_value());
    assert(firings[1].instantiation.rule == "missing-prerequisite-prevents-enrollment");
    assert(!firings[1].derived.has_value());
    assert(firings[2].instantiation.rule == "graduate-only-course-restriction");
    assert(!firings[2].derived.has_value());
    assert(firings[3].instantiation.rule == "cannot-enroll-course-implies-drop-request");
    assert(firings[4].instantiation.rule == "dropped-request-implies-notify-student");

    const auto& st = engine.stats();
    assert(st.cycles == 6);
    assert(st.new_facts == 3);
    assert(st.redundant_firings == 2);
    assert(st.unifications > 0);

    assert(engine.working_memory().contains({"notified-student", "Carol", "CS550"}));
    assert(engine.working_memory().size() == 11);

    std::vector<Fact> expected_order = {
        {"cannot-enroll-course", "Carol", "CS550"},
        {"dropped-request", "Carol", "CS550"},
        {"notified-student", "Carol", "CS550"},
    };
    assert(engine.derived_facts() == expected_order);

    std::cout << "  PASS" << std::endl;
}

void test_engine_refraction_property() {
    std::cout << "Testing no instantiation fires twice..." << std::endl;

    for (Strategy s : all_strategies()) {
        EngineConfig config;
        config.strategy = s;
        InferenceEngine engine(enrollment_rules(), carol_facts(), config);
        engine.run();

        std::set<std::pair<std::string, Bindings>> seen;
        for (const auto& f : engine.firings()) {
            assert(seen.emplace(f.instantiation.rule, f.instantiation.bindings).second);
        }
        assert(engine.history().size() == engine.firings().size());
    }

    std::cout << "  PASS" << std::endl;
}

void test_engine_transitive_closure() {
    std::cout << "Testing recursive rules terminate..." << std::endl;

    RuleBase rules;
    rules.add(make_rule("parent-is-ancestor",
        {{"parent", "?x", "?y"}}, {"ancestor", "?x", "?y"}));
    rules.add(make_rule("ancestor-chain",
        {{"parent", "?x", "?y"}, {"ancestor", "?y", "?z"}}, {"ancestor", "?x", "?z"}));

    InferenceEngine engine(rules, {{"parent", "a", "b"}, {"parent", "b", "c"}, {"parent", "c", "d"}});
    assert(engine.run() == EngineState::Saturated);

    // ab bc cd ac bd ad
    assert(engine.derived_facts().size() == 6);
    assert(engine.working_memory().contains({"ancestor", "a", "d"}));

    Explainer explainer(engine.working_memory(), engine.provenance());
    auto e = explainer.explain({"ancestor", "a", "d"});
    assert(e.has_value());
    assert(e->derived);
    assert(e->rule == "ancestor-chain");
    assert(e->depth() >= 3);

    // Symmetric rule: the reverse firing rediscovers a known fact
    RuleBase sym;
    sym.add(make_rule("symmetric", {{"edge", "?x", "?y"}}, {"edge", "?y", "?x"}));
    InferenceEngine engine2(sym, {{"edge", "a", "b"}});
    assert(engine2.run() == EngineState::Saturated);
    assert(engine2.stats().firings == 2);
    assert(engine2.stats().new_facts == 1);
    assert(engine2.stats().redundant_firings == 1);

    std::cout << "  PASS" << std::endl;
}

void test_engine_max_cycles() {
    std::cout << "Testing cycle limit..." << std::endl;

    EngineConfig config;
    config.max_cycles = 2;
    InferenceEngine engine(enrollment_rules(), carol_facts(), config);
    assert(engine.run() == EngineState::Halted);
    assert(engine.cycles() == 2);
    assert(engine.firings().size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_engine_failures() {
    std::cout << "Testing engine failure states..." << std::endl;

    RuleBase bad;
    bad.add(make_rule("no-antecedents", {}, {"q", "a"}));
    InferenceEngine e1(bad, {{"p", "a"}});
    assert(e1.state() == EngineState::Failed);
    assert(!e1.error().empty());
    assert(e1.run() == EngineState::Failed);
    assert(e1.firings().empty());
    assert(e1.cycles() == 0);

    RuleBase unbound;
    unbound.add(make_rule("unbound", {{"p", "?x"}}, {"q", "?y"}));
    InferenceEngine e2(unbound, {{"p", "a"}});
    assert(e2.state() == EngineState::Failed);

    RuleBase good;
    good.add(make_rule("ok", {{"p", "?x"}}, {"q", "?x"}));
    InferenceEngine e3(good, {{"p", "?x"}});
    assert(e3.state() == EngineState::Failed);
    assert(e3.error().find("variable") != std::string::npos);

    InferenceEngine e4(good, {{}});
    assert(e4.state() == EngineState::Failed);

    // A fact of a relation the rules use, with the wrong arity, could
    // never match: refused before the first cycle
    RuleBase grad;
    grad.add(make_rule("grad-only-violation",
        {{"enrolled", "?s", "?c"}, {"graduate-only", "?c"}},
        {"flag-violation", "?s", "?c"}));
    InferenceEngine e5(grad, {{"enrolled", "Alice"}, {"graduate-only", "CS501"}});
    assert(e5.state() == EngineState::Failed);
    assert(e5.error().find("arity") != std::string::npos);
    assert(e5.run() == EngineState::Failed);
    assert(e5.cycles() == 0);

    // Relations no rule mentions may have any arity
    InferenceEngine e6(grad, {{"student", "Alice"}, {"enrolled", "Alice", "CS501"}});
    assert(e6.state() == EngineState::Running);

    // Cycle limits parse as plain decimal counts
    assert(parse_cycle_limit("25") == size_t(25));
    assert(parse_cycle_limit("0") == size_t(0));
    assert(!parse_cycle_limit("-1"));
    assert(!parse_cycle_limit("+5"));
    assert(!parse_cycle_limit(""));
    assert(!parse_cycle_limit("10x"));
    assert(!parse_cycle_limit("99999999999999999999999999"));

    std::cout << "  PASS" << std::endl;
}

void test_provenance_acyclic() {
    std::cout << "Testing provenance acyclicity..." << std::endl;

    InferenceEngine engine(enrollment_rules(), carol_facts());
    engine.run();

    for (const auto& f : engine.derived_facts()) {
        std::set<Fact> path;
        assert(acyclic_from(engine.provenance(), f, path));

        // Supports are known, and were derived no later than f
        const Derivation* d = engine.provenance().get(f);
        for (const auto& s : d->supports) {
            assert(engine.working_memory().contains(s));
            if (const Derivation* sd = engine.provenance().get(s)) {
                assert(sd->cycle < d->cycle);
            }
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_determinism() {
    std::cout << "Testing determinism..." << std::endl;

    for (Strategy s : all_strategies()) {
        EngineConfig config;
        config.strategy = s;
        InferenceEngine a(enrollment_rules(), carol_facts(), config);
        InferenceEngine b(enrollment_rules(), carol_facts(), config);
        a.run();
        b.run();

        assert(a.firings().size() == b.firings().size());
        for (size_t i = 0; i < a.firings().size(); ++i) {
            assert(a.firings()[i].instantiation == b.firings()[i].instantiation);
            assert(a.firings()[i].derived == b.firings()[i].derived);
        }
        assert(a.working_memory().facts() == b.working_memory().facts());
    }

    std::cout << "  PASS" << std::endl;
}

void test_explain() {
    std::cout << "Testing explanations..." << std::endl;

    InferenceEngine engine(enrollment_rules(), carol_facts());
    engine.run();

    Explainer explainer(engine.working_memory(), engine.provenance());

    auto leaf = explainer.explain({"has-hold", "Carol"});
    assert(leaf.has_value());
    assert(!leaf->derived);
    assert(leaf->supports.empty());
    assert(leaf->depth() == 1);

    assert(!explainer.explain({"has-hold", "Dave"}).has_value());

    auto e = explainer.explain({"notified-student", "Carol", "CS550"});
    assert(e.has_value());
    assert(e->rule == "dropped-request-implies-notify-student");
    assert(e->supports.size() == 1);

    const Explanation& dropped = e->supports[0];
    assert(dropped.rule == "cannot-enroll-course-implies-drop-request");
    assert(dropped.supports.size() == 2);

    const Explanation& blocked = dropped.supports[0];
    assert(blocked.rule == "administrative-hold-prevents-enrollment");
    assert((blocked.supports[0].fact == Fact{"has-hold", "Carol"}));
    assert(!blocked.supports[0].derived);

    // request-course supports two derivations and appears under both
    assert((dropped.supports[1].fact == Fact{"request-course", "Carol", "CS550"}));
    assert((blocked.supports[1].fact == Fact{"request-course", "Carol", "CS550"}));

    assert(e->depth() == 4);
    assert(e->size() == 6);

    std::string text = render(*e);
    assert(text.find("dropped-request-implies-notify-student") != std::string::npos);
    assert(text.find("[given]") != std::string::npos);

    // Cached trees render identically
    assert(explainer.cached() > 0);
    assert(render(*explainer.explain({"notified-student", "Carol", "CS550"})) == text);

    auto all = explainer.explain_all();
    assert(all.size() == 3);
    assert((all[0].fact == Fact{"cannot-enroll-course", "Carol", "CS550"}));

    std::cout << "  PASS" << std::endl;
}

void test_strategy_divergence() {
    std::cout << "Testing strategy divergence..." << std::endl;

    Comparison cmp = compare_strategies(advisor_rules(), bob_facts());
    assert(cmp.runs.size() == 3);

    Fact review{"needs-advisor-review", "Bob"};
    std::vector<std::string> first_rules;
    for (const auto& r : cmp.runs) {
        assert(r.engine->state() == EngineState::Saturated);
        assert(r.engine->firings().size() == 3);
        assert(r.engine->stats().new_facts == 1);

        const auto& first = r.engine->firings()[0];
        assert(first.derived == review);

        // Primary derivation is whichever rule fired first
        const Derivation* d = r.engine->provenance().get(review);
        assert(d != nullptr);
        assert(d->rule == first.instantiation.rule);
        first_rules.push_back(d->rule);
    }

    assert(cmp.runs[0].strategy == Strategy::Priority);
    assert(first_rules[0] == "hold-review");
    assert(first_rules[1] == "overload-review");
    assert(first_rules[2] == "low-gpa-review");

    assert(cmp.same_final_facts());

    auto orders = cmp.firing_orders();
    assert(orders[0] != orders[1]);
    assert(orders[1] != orders[2]);

    // Explanation trees differ between strategies
    Explainer by_priority(cmp.runs[0].engine->working_memory(), cmp.runs[0].engine->provenance());
    Explainer by_order(cmp.runs[2].engine->working_memory(), cmp.runs[2].engine->provenance());
    auto ep = by_priority.explain(review);
    auto eo = by_order.explain(review);
    assert(ep->supports.size() == 2);
    assert(eo->supports.size() == 1);
    assert(render(*ep) != render(*eo));

    std::cout << "  PASS" << std::endl;
}

void test_enrollment_strategies() {
    std::cout << "Testing enrollment case across strategies..." << std::endl;

    Comparison cmp = compare_strategies(enrollment_rules(), carol_facts());
    assert(cmp.same_final_facts());

    Fact blocked{"cannot-enroll-course", "Carol", "CS550"};
    assert(cmp.runs[0].engine->provenance().get(blocked)->rule ==
           "administrative-hold-prevents-enrollment");
    assert(cmp.runs[1].engine->provenance().get(blocked)->rule ==
           "missing-prerequisite-prevents-enrollment");
    assert(cmp.runs[2].engine->provenance().get(blocked)->rule ==
           "graduate-only-course-restriction");

    // Independent runs: every engine started from the same 8 facts
    for (const auto& r : cmp.runs) {
        assert(r.engine->working_memory().size() == 11);
        assert(r.engine->firings().size() == 5);
    }

    std::cout << "  PASS" << std::endl;
}

void test_load_problem() {
    std::cout << "Testing problem loading..." << std::endl;

    json j = json::parse(R"({
        "format_version": {"major": 1, "minor": 0},
        "rules": [
            {"name": "grad-only-violation", "priority": 5,
             "antecedents": [["enrolled", "?s", "?c"], ["graduate-only", "?c"]],
             "consequent": ["flag-violation", "?s", "?c"]}
        ],
        "cases": [
            {"name": "basic", "facts": [["enrolled", "Alice", "CS501"], ["graduate-only", "CS501"]]}
        ]
    })");

    Problem problem;
    std::string error;
    assert(load_problem(j, problem, error));
    assert(problem.rules.size() == 1);
    assert(problem.rules[0].priority == 5);
    assert(problem.rules[0].specificity() == 2);
    assert(problem.rules[0].antecedents[0][1].is_variable());
    assert(problem.cases.size() == 1);
    assert(problem.find_case("basic") != nullptr);
    assert(problem.find_case("other") == nullptr);

    InferenceEngine engine(problem.rules, problem.cases[0].facts);
    engine.run();
    json report = run_report(engine, true);
    assert(report["state"] == "saturated");
    assert(report["stats"]["new_facts"] == 1);
    assert(report["explanations"].size() == 1);
    assert(report["explanations"][0]["rule"] == "grad-only-violation");
    assert(report["explanations"][0]["bindings"]["?s"] == "Alice");
    assert(report["explanations"][0]["supports"].size() == 2);
    assert(report["firings"][0]["derived"][0] == "flag-violation");

    // Round trip of a rule through its JSON form
    Rule back;
    assert(parse_rule(rule_to_json(problem.rules[0]), back, error));
    assert(back.antecedents == problem.rules[0].antecedents);
    assert(back.consequent == problem.rules[0].consequent);

    std::cout << "  PASS" << std::endl;
}

void test_load_problem_errors() {
    std::cout << "Testing problem loading errors..." << std::endl;

    Problem problem;
    std::string error;

    assert(!load_problem(json::parse(R"({"cases": []})"), problem, error));
    assert(error.find("rules") != std::string::npos);

    assert(!load_problem(json::parse(R"({"rules": [{"name": "r", "antecedents": [],
        "consequent": ["q"]}]})"), problem, error));
    assert(error.find("no antecedents") != std::string::npos);

    assert(!load_problem(json::parse(R"({"rules": [{"name": "r",
        "antecedents": [["p", 1]], "consequent": ["q"]}]})"), problem, error));

    assert(!load_problem(json::parse(R"({"rules": [],
        "cases": [{"name": "bad", "facts": [["p", "?x"]]}]})"), problem, error));
    assert(error.find("bad") != std::string::npos);

    assert(!load_problem(json::parse(R"({"format_version": {"major": 2, "minor": 0},
        "rules": []})"), problem, error));

    // Wrongly typed fields are reported, not thrown
    assert(!load_problem(json::parse(R"({"format_version": {"major": "1"},
        "rules": []})"), problem, error));
    assert(error.find("major") != std::string::npos);

    assert(!load_problem(json::parse(R"({"rules": [],
        "cases": [{"name": 7, "facts": []}]})"), problem, error));
    assert(error.find("name") != std::string::npos);

    assert(!load_problem(json::parse(R"({"rules": [{"name": "r", "priority": 3000000000,
        "antecedents": [["p", "?x"]], "consequent": ["q", "?x"]}]})"), problem, error));
    assert(error.find("out of range") != std::string::npos);

    assert(!load_problem(json::parse(R"({"rules": [{"name": "r", "priority": -3000000000,
        "antecedents": [["p", "?x"]], "consequent": ["q", "?x"]}]})"), problem, error));
    assert(error.find("out of range") != std::string::npos);

    // A case fact whose arity disagrees with the rules is rejected
    assert(!load_problem(json::parse(R"({"rules": [{"name": "grad-only-violation",
        "antecedents": [["enrolled", "?s", "?c"], ["graduate-only", "?c"]],
        "consequent": ["flag-violation", "?s", "?c"]}],
        "cases": [{"name": "short", "facts": [["enrolled", "Alice"]]}]})"), problem, error));
    assert(error.find("short") != std::string::npos);
    assert(error.find("arity") != std::string::npos);

    assert(!load_problem_file("/nonexistent/anumana.json", problem, error));
    assert(error.find("cannot open") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

#ifdef ANUMANA_DATA_DIR
void test_enrollment_file() {
    std::cout << "Testing enrollment.json..." << std::endl;

    Problem problem;
    std::string error;
    bool ok = load_problem_file(std::string(ANUMANA_DATA_DIR) + "/enrollment.json", problem, error);
    if (!ok) std::cout << "    " << error << std::endl;
    assert(ok);
    assert(problem.rules.size() == 7);
    assert(problem.cases.size() == 2);

    const Case* conflict = problem.find_case("conflict");
    assert(conflict != nullptr);
    InferenceEngine engine(problem.rules, conflict->facts);
    assert(engine.run() == EngineState::Saturated);
    assert(engine.firings()[0].instantiation.rule == "administrative-hold-prevents-enrollment");

    const Case* none = problem.find_case("no-match");
    InferenceEngine idle(problem.rules, none->facts);
    assert(idle.run() == EngineState::Saturated);
    assert(idle.firings().empty());

    std::cout << "  PASS" << std::endl;
}
#endif

int main() {
    std::cout << "=== Anumana C++ Tests ===" << std::endl;
    std::cout << "Version " << ANUMANA_VERSION << std::endl;
    std::cout << std::endl;

    test_term_parse();
    test_unify_basic();
    test_unify_extends_bindings();
    test_unify_consistency();
    test_substitute();
    test_rule_validation();
    test_working_memory();
    test_match_conjunctive();
    test_match_order();
    test_refraction();
    test_strategy_select();
    test_strategy_tie_break();
    test_executor();

    std::cout << std::endl;
    std::cout << "=== Engine Tests ===" << std::endl;
    test_engine_single_rule();
    test_engine_no_match();
    test_engine_enrollment_priority();
    test_engine_refraction_property();
    test_engine_transitive_closure();
    test_engine_max_cycles();
    test_engine_failures();
    test_provenance_acyclic();
    test_determinism();
    test_explain();
    test_strategy_divergence();
    test_enrollment_strategies();

    std::cout << std::endl;
    std::cout << "=== Problem File Tests ===" << std::endl;
    test_load_problem();
    test_load_problem_errors();
#ifdef ANUMANA_DATA_DIR
    test_enrollment_file();
#endif

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
