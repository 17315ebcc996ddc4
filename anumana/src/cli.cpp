// anumana: Command-line interface for the production-rule engine
//
// Usage: anumana <command> FILE [options]
//
// Commands:
//   run        Run case(s) to saturation
//   compare    Run a case under every strategy
//   check      Validate a problem file
//   help       Show this help

#include <anumana/anumana.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>

using namespace anumana;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "anumana " << ANUMANA_VERSION << " - Forward-chaining rule engine\n\n"
              << "Usage: " << name << " <command> FILE [options]\n\n"
              << "Commands:\n"
              << "  run FILE           Run case(s) to saturation\n"
              << "  compare FILE       Run a case under every strategy\n"
              << "  check FILE         Validate rules and cases only\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --strategy NAME    priority | specificity | order (default: priority)\n"
              << "  --case NAME        Run only this case (default: all)\n"
              << "  --explain          Print derivation trees for derived facts\n"
              << "  --max-cycles N     Stop after N cycles (default: unbounded)\n"
              << "  --json             Output as JSON\n"
              << "  --trace            Log every cycle\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static void print_facts(const InferenceEngine& engine) {
    for (const auto& f : engine.working_memory()) {
        std::cout << "  " << to_string(f);
        if (engine.provenance().is_derived(f)) std::cout << "  *";
        std::cout << "\n";
    }
}

static void print_run(const Case& c, const InferenceEngine& engine, bool explain) {
    const auto& st = engine.stats();

    std::cout << "Case: " << c.name << "  [" << strategy_name(engine.config().strategy) << "]\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "State:    " << state_name(engine.state()) << "\n";
    if (engine.state() == EngineState::Failed) {
        std::cout << "Error:    " << engine.error() << "\n";
        return;
    }
    std::cout << "Cycles:   " << st.cycles << "\n";
    std::cout << "Firings:  " << st.firings << " (" << st.new_facts << " new, "
              << st.redundant_firings << " redundant)\n";

    std::cout << "\nFirings:\n";
    if (engine.firings().empty()) std::cout << "  (none)\n";
    for (const auto& f : engine.firings()) {
        std::cout << "  [" << f.cycle << "] " << f.instantiation.rule << " "
                  << to_string(f.instantiation.bindings);
        if (f.derived) {
            std::cout << " => " << to_string(*f.derived) << "\n";
        } else {
            std::cout << " => (already known)\n";
        }
    }

    std::cout << "\nFinal working memory (* = derived):\n";
    print_facts(engine);

    if (explain && !engine.derived_facts().empty()) {
        std::cout << "\nExplanations:\n";
        Explainer explainer(engine.working_memory(), engine.provenance());
        for (const auto& e : explainer.explain_all()) {
            std::cout << "\n";
            render(std::cout, e, 1);
        }
    }
    std::cout << "\n";
}

static std::vector<const Case*> select_cases(const Problem& problem, const std::string& name) {
    std::vector<const Case*> cases;
    if (name.empty()) {
        for (const auto& c : problem.cases) cases.push_back(&c);
    } else if (const Case* c = problem.find_case(name)) {
        cases.push_back(c);
    }
    return cases;
}

int cmd_run(const Problem& problem, const std::string& case_name,
            const EngineConfig& config, bool explain, bool json_output) {
    auto cases = select_cases(problem, case_name);
    if (cases.empty()) {
        std::cerr << "No case to run" << (case_name.empty() ? "" : ": " + case_name) << "\n";
        return 1;
    }

    int result = 0;
    json reports = json::array();
    for (const Case* c : cases) {
        InferenceEngine engine(problem.rules, c->facts, config);
        engine.run();
        if (engine.state() == EngineState::Failed) result = 1;

        if (json_output) {
            json report = run_report(engine, explain);
            report["case"] = c->name;
            reports.push_back(report);
        } else {
            print_run(*c, engine, explain);
        }
    }

    if (json_output) std::cout << reports.dump(2) << "\n";
    return result;
}

int cmd_compare(const Problem& problem, const std::string& case_name,
                const EngineConfig& config, bool explain, bool json_output) {
    auto cases = select_cases(problem, case_name);
    if (cases.empty()) {
        std::cerr << "No case to compare" << (case_name.empty() ? "" : ": " + case_name) << "\n";
        return 1;
    }

    int result = 0;
    json out = json::array();
    for (const Case* c : cases) {
        Comparison cmp = compare_strategies(problem.rules, c->facts, config);
        for (const auto& r : cmp.runs) {
            if (r.engine->state() == EngineState::Failed) result = 1;
        }

        if (json_output) {
            json runs = json::array();
            for (const auto& r : cmp.runs) runs.push_back(run_report(*r.engine, explain));
            out.push_back({
                {"case", c->name},
                {"same_final_facts", cmp.same_final_facts()},
                {"runs", runs}
            });
            continue;
        }

        for (const auto& r : cmp.runs) print_run(*c, *r.engine, explain);
        std::cout << "Final working memories "
                  << (cmp.same_final_facts() ? "agree" : "DIFFER")
                  << " across strategies\n\n";
    }

    if (json_output) std::cout << out.dump(2) << "\n";
    return result;
}

int cmd_check(const Problem& problem, bool json_output) {
    if (json_output) {
        json rules = json::array();
        for (const auto& r : problem.rules.rules()) rules.push_back(rule_to_json(r));
        std::cout << json{{"valid", true}, {"rules", rules},
                          {"cases", problem.cases.size()}}.dump(2) << "\n";
        return 0;
    }

    std::cout << "Rules: " << problem.rules.size() << "\n";
    for (const auto& r : problem.rules.rules()) {
        std::cout << "  " << r.name << "  (priority " << r.priority
                  << ", specificity " << r.specificity() << ")\n";
        for (const auto& a : r.antecedents) std::cout << "      " << to_string(a) << "\n";
        std::cout << "    => " << to_string(r.consequent) << "\n";
    }
    std::cout << "Cases: " << problem.cases.size() << "\n";
    for (const auto& c : problem.cases) {
        std::cout << "  " << c.name << " (" << c.facts.size() << " facts)\n";
    }
    std::cout << "OK\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string file;
    std::string case_name;
    std::string strategy = "priority";
    EngineConfig config;
    bool explain = false;
    bool json_output = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--strategy") == 0 && i + 1 < argc) {
            strategy = argv[++i];
        } else if (strcmp(argv[i], "--case") == 0 && i + 1 < argc) {
            case_name = argv[++i];
        } else if (strcmp(argv[i], "--max-cycles") == 0 && i + 1 < argc) {
            auto limit = parse_cycle_limit(argv[++i]);
            if (!limit) {
                std::cerr << "Invalid --max-cycles value: " << argv[i] << "\n";
                return 1;
            }
            config.max_cycles = *limit;
        } else if (strcmp(argv[i], "--explain") == 0) {
            explain = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--trace") == 0) {
            config.trace = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "anumana " << ANUMANA_VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else if (file.empty()) {
            file = argv[i];
        } else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    auto parsed = parse_strategy(strategy);
    if (!parsed) {
        std::cerr << "Unknown strategy: " << strategy << " (priority, specificity, order)\n";
        return 1;
    }
    config.strategy = *parsed;

    if (file.empty()) {
        std::cerr << "Usage: " << prog_name(argv[0]) << " " << command << " FILE [options]\n";
        return 1;
    }

    Problem problem;
    std::string error;
    if (!load_problem_file(file, problem, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    log_debug("cli", "loaded %zu rules, %zu cases from %s",
              problem.rules.size(), problem.cases.size(), file.c_str());

    // Execute command
    int result = 0;
    if (command == "run") {
        result = cmd_run(problem, case_name, config, explain, json_output);
    } else if (command == "compare") {
        result = cmd_compare(problem, case_name, config, explain, json_output);
    } else if (command == "check") {
        result = cmd_check(problem, json_output);
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        result = 1;
    }

    return result;
}
