#pragma once
// Inference engine: forward chaining to saturation
//
// Each cycle: match every rule against working memory, drop fired
// instantiations, pick one by strategy, fire it. At most one fact is
// derived per cycle. An empty conflict set ends the run.
//
// An engine owns its working memory, provenance and history. Runs
// that must not see each other's facts use separate engines.

#include "conflict.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "provenance.hpp"
#include "rule.hpp"
#include "working_memory.hpp"
#include <cstdarg>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace anumana {

struct EngineConfig {
    Strategy strategy = Strategy::Priority;
    size_t max_cycles = 0;   // 0 = run to saturation; otherwise stop in Halted
    bool trace = false;      // Log every cycle
};

// Parse a cycle limit: decimal digits only, so "-1" or "+5" is rejected
// rather than wrapped. nullopt when invalid.
inline std::optional<size_t> parse_cycle_limit(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (char ch : text) {
        if (ch < '0' || ch > '9') return std::nullopt;
    }
    try {
        unsigned long long n = std::stoull(text);
        if (n > std::numeric_limits<size_t>::max()) return std::nullopt;
        return static_cast<size_t>(n);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

enum class EngineState : uint8_t {
    Running = 0,
    Saturated = 1,  // No eligible instantiation remains
    Halted = 2,     // Stopped by max_cycles
    Failed = 3,     // Malformed input or internal error
};

inline const char* state_name(EngineState s) {
    switch (s) {
        case EngineState::Running: return "running";
        case EngineState::Saturated: return "saturated";
        case EngineState::Halted: return "halted";
        case EngineState::Failed: return "failed";
    }
    return "unknown";
}

// One firing, in firing order
struct FiringRecord {
    size_t cycle = 0;
    Instantiation instantiation;
    size_t conflict_set_size = 0;
    std::optional<Fact> derived;   // nullopt when the fact was already known
};

struct RunStats {
    size_t cycles = 0;
    size_t firings = 0;
    size_t new_facts = 0;
    size_t redundant_firings = 0;  // Fired without adding a fact
    size_t unifications = 0;
};

class InferenceEngine {
public:
    InferenceEngine(RuleBase rules, const std::vector<Fact>& facts,
                    EngineConfig config = {})
        : rules_(std::move(rules)), config_(config) {
        std::string err;
        if (!rules_.validate(err)) {
            fail(err);
            return;
        }
        RelationArities arity = rules_.relation_arities();
        for (const auto& f : facts) {
            if (!add_initial(f, arity)) return;
        }
    }

    // Run one cycle. Returns the state after it.
    EngineState step() {
        if (state_ != EngineState::Running) return state_;

        if (config_.max_cycles > 0 && stats_.cycles >= config_.max_cycles) {
            state_ = EngineState::Halted;
            trace("cycle limit %zu reached, halting", config_.max_cycles);
            return state_;
        }

        size_t cycle = ++stats_.cycles;
        trace("CYCLE %zu: %zu facts in working memory", cycle, wm_.size());

        try {
            auto candidates = conflict_set();
            if (candidates.empty()) {
                state_ = EngineState::Saturated;
                trace("no changes on last cycle, halting");
                return state_;
            }

            size_t chosen = select(candidates, rules_, config_.strategy);
            const Instantiation& inst = candidates[chosen];
            const Rule& rule = rules_[inst.rule_index];

            trace("firing rule %s %s (%zu candidates, strategy %s)",
                  rule.name.c_str(), to_string(inst.bindings).c_str(),
                  candidates.size(), strategy_name(config_.strategy));

            FiringRecord record;
            record.cycle = cycle;
            record.instantiation = inst;
            record.conflict_set_size = candidates.size();
            record.derived = fire(rule, inst, wm_, provenance_, history_, cycle);

            ++stats_.firings;
            if (record.derived) {
                ++stats_.new_facts;
                trace("adding assertion to WM: %s", to_string(*record.derived).c_str());
            } else {
                ++stats_.redundant_firings;
                trace("no new WM assertions");
            }
            firings_.push_back(std::move(record));
        } catch (const std::exception& e) {
            fail(e.what());
        }
        return state_;
    }

    // Run until a terminal state
    EngineState run() {
        while (state_ == EngineState::Running) step();
        if (state_ == EngineState::Failed) {
            log_info("engine", "run failed: %s", error_.c_str());
        } else {
            log_debug("engine", "%s after %zu cycles, %zu firings, %zu new facts",
                      state_name(state_), stats_.cycles, stats_.firings, stats_.new_facts);
        }
        return state_;
    }

    // Eligible instantiations for the current working memory, in
    // enumeration order, refraction applied
    std::vector<Instantiation> conflict_set() {
        MatchStats ms;
        auto all = match_all(rules_, wm_, &ms);
        stats_.unifications += ms.unifications;

        if (config_.trace) {
            for (size_t i = 0; i < rules_.size(); ++i) {
                size_t n = 0;
                for (const auto& inst : all) {
                    if (inst.rule_index == i) ++n;
                }
                trace("  rule %zu %s: %s", i + 1, rules_[i].name.c_str(),
                      n ? (std::to_string(n) + " match(es)").c_str() : "fails");
            }
        }
        return refract(all, history_);
    }

    EngineState state() const { return state_; }
    bool terminated() const { return state_ != EngineState::Running; }
    const std::string& error() const { return error_; }

    const RuleBase& rules() const { return rules_; }
    const EngineConfig& config() const { return config_; }
    const WorkingMemory& working_memory() const { return wm_; }
    const ProvenanceIndex& provenance() const { return provenance_; }
    const FiredHistory& history() const { return history_; }
    const std::vector<FiringRecord>& firings() const { return firings_; }
    const RunStats& stats() const { return stats_; }
    size_t cycles() const { return stats_.cycles; }

    // Facts that were derived, in derivation order
    const std::vector<Fact>& derived_facts() const { return provenance_.derived(); }

private:
    RuleBase rules_;
    EngineConfig config_;
    EngineState state_ = EngineState::Running;
    std::string error_;

    WorkingMemory wm_;
    ProvenanceIndex provenance_;
    FiredHistory history_;
    std::vector<FiringRecord> firings_;
    RunStats stats_;

    bool add_initial(const Fact& fact, const RelationArities& arity) {
        Pattern p;
        for (const auto& part : fact) p.push_back(Term::parse(part));
        std::string err = validate_fact(p);
        if (err.empty()) err = check_fact_arity(fact, arity);
        if (!err.empty()) {
            fail(err);
            return false;
        }
        wm_.insert(fact);
        return true;
    }

    void fail(const std::string& message) {
        state_ = EngineState::Failed;
        error_ = message;
    }

    void trace(const char* fmt, ...) const {
        if (!config_.trace) return;
        va_list args;
        va_start(args, fmt);
        vlog("engine", fmt, args);
        va_end(args);
    }
};

} // namespace anumana
