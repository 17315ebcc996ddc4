#pragma once
// Strategy comparison: the same problem under every strategy
//
// Each strategy gets its own engine, built from the same rules and
// initial facts, so no run sees another's derived facts.

#include "engine.hpp"
#include <memory>
#include <vector>

namespace anumana {

struct StrategyRun {
    Strategy strategy;
    std::unique_ptr<InferenceEngine> engine;
};

struct Comparison {
    std::vector<StrategyRun> runs;

    // All terminal runs ended with the same fact set
    bool same_final_facts() const {
        for (size_t i = 1; i < runs.size(); ++i) {
            if (!runs[i].engine->working_memory().same_facts(
                    runs[0].engine->working_memory())) {
                return false;
            }
        }
        return true;
    }

    // Rule names in firing order, per run
    std::vector<std::vector<std::string>> firing_orders() const {
        std::vector<std::vector<std::string>> orders;
        for (const auto& r : runs) {
            std::vector<std::string> order;
            for (const auto& f : r.engine->firings()) order.push_back(f.instantiation.rule);
            orders.push_back(std::move(order));
        }
        return orders;
    }
};

inline Comparison compare_strategies(const RuleBase& rules, const std::vector<Fact>& facts,
                                     EngineConfig base = {},
                                     const std::vector<Strategy>& strategies = all_strategies()) {
    Comparison c;
    for (Strategy s : strategies) {
        EngineConfig config = base;
        config.strategy = s;
        auto engine = std::make_unique<InferenceEngine>(rules, facts, config);
        log_debug("compare", "running strategy %s", strategy_name(s));
        engine->run();
        c.runs.push_back({s, std::move(engine)});
    }
    return c;
}

} // namespace anumana
