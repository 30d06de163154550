#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/override_channel.hpp"
#include "perception/observation_feed.hpp"
#include "planner/planner_client.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/memory_record.hpp"
#include "protocol/observation.hpp"
#include "runtime/instinct_generator.hpp"
#include "runtime/intent_cell.hpp"
#include "runtime/intent_gate.hpp"
#include "runtime/plan_shaper.hpp"
#include "session/memory_store.hpp"
#include "session/session_journal.hpp"

namespace vrc::runtime {

struct LoopSettings {
    core::clock::Duration tick_interval{300};
    core::clock::Duration say_interval{800};
    bool observe_only = false;
    std::size_t short_term_capacity = 8;
    std::size_t retrieve_top_k = 5;

    static LoopSettings from_config(const core::config::AgentConfig& config);
};

struct TickReport {
    std::uint64_t tick_id = 0;
    bool capture_failed = false;
    bool fresh_observation = false;
    std::optional<protocol::Observation> observation;
    GateDecision gate;
    std::optional<planner::StartOutcome> planner;  // set when the gate fired
    protocol::DispatchedAction dispatched;
    std::size_t messages = 0;
    bool dispatch_failed = false;
    bool stop = false;
};

struct LoopStats {
    std::uint64_t ticks = 0;
    std::uint64_t overruns = 0;
    std::uint64_t triggers = 0;
    std::uint64_t planner_started = 0;
    std::uint64_t triggers_dropped = 0;
    std::uint64_t capture_failures = 0;
    std::uint64_t instinct_failures = 0;
    std::uint64_t dispatch_failures = 0;
    std::uint64_t overrides = 0;
    std::uint64_t overrides_rate_limited = 0;
};

// The fast loop. Each tick polls perception, asks the gate whether to replan,
// kicks the planner without waiting for it, then composes and dispatches
// override, intent and instinct actions.
class ControlLoop {
public:
    // `planner`, `memory`, `journal` and `shaper` are optional (nullptr
    // disables them). Memory lookups and shaping run on the planner worker.
    ControlLoop(LoopSettings settings, const core::clock::Clock& clock,
                perception::ObservationFeed& feed, IntentGate& gate, IntentCell& intents,
                InstinctGenerator& instinct, dispatch::ActionDispatcher& dispatcher,
                dispatch::OverrideChannel& overrides, planner::PlannerClient* planner,
                session::MemoryStore* memory, session::SessionJournal* journal,
                PlanShaper* shaper = nullptr);

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    TickReport tick();

    // Ticks until request_stop() or a stop override; `max_ticks` bounds the
    // run when set. Sleeps on real time between ticks.
    void run(std::optional<std::uint64_t> max_ticks = std::nullopt);

    void request_stop();
    bool stop_requested() const;

    LoopStats stats() const;
    std::vector<protocol::MemoryRecord> short_term() const;

private:
    void on_plan_outcome(const planner::PlanOutcome& outcome);
    void maybe_start_planner(const protocol::Observation* observation,
                             const IntentCell::Snapshot& intent, TickReport& report);
    std::vector<protocol::Action> collect_overrides(const std::optional<protocol::Observation>& obs,
                                                    core::clock::TimePoint now,
                                                    bool& stop);

    LoopSettings settings_;
    const core::clock::Clock& clock_;
    perception::ObservationFeed& feed_;
    IntentGate& gate_;
    IntentCell& intents_;
    InstinctGenerator& instinct_;
    dispatch::ActionDispatcher& dispatcher_;
    dispatch::OverrideChannel& overrides_;
    planner::PlannerClient* planner_;
    session::MemoryStore* memory_;
    session::SessionJournal* journal_;
    PlanShaper* shaper_;

    std::uint64_t next_tick_id_ = 1;
    core::clock::TimePoint last_say_at_{};
    bool has_said_ = false;
    LoopStats stats_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stop_ = false;
    std::deque<protocol::MemoryRecord> short_term_;
    TriggerReason pending_trigger_ = TriggerReason::None;
};

}  // namespace vrc::runtime
