#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "planner/planner_backend.hpp"
#include "runtime/intent_cell.hpp"

namespace vrc::planner {

struct PlannerSettings {
    std::uint32_t max_attempts = 3;
    core::clock::Duration retry_base{1200};
    core::clock::Duration failure_cooldown{2000};
    core::clock::Duration max_cooldown{60000};
    core::clock::Duration intent_ttl{2800};

    static PlannerSettings from_config(const core::config::AgentConfig& config);
};

enum class StartOutcome {
    Started,
    InFlight,     // A call is outstanding; the trigger is dropped
    CoolingDown,  // Recent failures; instinct-only for now
    Stopped
};

struct PlannerStats {
    std::uint64_t started = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t attempts = 0;
    std::uint64_t dropped_in_flight = 0;
    std::uint64_t dropped_cooldown = 0;
    std::uint64_t discarded = 0;  // Completed after shutdown began
};

// Outcome of one planner call, reported to the listener on the worker thread.
struct PlanOutcome {
    std::shared_ptr<const protocol::Intent> intent;  // set on success
    std::optional<core::errors::AgentError> error;   // set on failure
    std::uint32_t attempts = 0;
    PlanRequest request;
};

std::string to_string(StartOutcome outcome);

// Runs at most one planner call at a time on a background thread and
// publishes successful results into the IntentCell.
class PlannerClient {
public:
    using Listener = std::function<void(const PlanOutcome&)>;
    // Adjusts a parsed Intent before it is published.
    using Shaper = std::function<void(protocol::Intent&, const PlanRequest&)>;
    // Long-term memory lookup for PlanRequest::memory_query.
    using Retriever = std::function<std::vector<protocol::MemoryRecord>(const std::string&)>;

    PlannerClient(std::unique_ptr<PlannerBackend> backend, runtime::IntentCell& cell,
                  const core::clock::Clock& clock, PlannerSettings settings);
    ~PlannerClient();

    PlannerClient(const PlannerClient&) = delete;
    PlannerClient& operator=(const PlannerClient&) = delete;

    // Must be set before the first try_start().
    void set_listener(Listener listener);
    void set_shaper(Shaper shaper);
    void set_retriever(Retriever retriever);

    StartOutcome try_start(PlanRequest request);

    bool in_flight() const { return in_flight_.load(); }

    bool wait_idle(std::chrono::milliseconds timeout);

    // Cancels an outstanding call (its result is discarded) and joins.
    void shutdown();

    PlannerStats stats() const;
    std::uint32_t consecutive_failures() const;

private:
    void run(PlanRequest request);
    core::clock::Duration cooldown_for(std::uint32_t failures) const;

    std::unique_ptr<PlannerBackend> backend_;
    runtime::IntentCell& cell_;
    const core::clock::Clock& clock_;
    PlannerSettings settings_;
    Listener listener_;
    Shaper shaper_;
    Retriever retriever_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic_bool in_flight_{false};
    CancelToken cancel_ = std::make_shared<std::atomic_bool>(false);
    bool stopped_ = false;
    std::uint32_t consecutive_failures_ = 0;
    core::clock::TimePoint cooldown_until_{};
    PlannerStats stats_;
};

}  // namespace vrc::planner
