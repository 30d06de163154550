#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "dispatch/actuation_scheduler.hpp"
#include "policy/action_guard.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/intent.hpp"

namespace vrc::dispatch {

struct DispatchStats {
    std::uint64_t dispatched = 0;
    std::uint64_t instinct_dropped = 0;  // Lost an actuator to a higher source
    std::uint64_t intent_deferred = 0;   // Step postponed by an override
    std::uint64_t rejected = 0;          // Refused by the action guard
    std::uint64_t failed = 0;
};

// Merges override, intent and instinct actions into one ordered bundle.
//
// Precedence is override > intent > instinct. A lower source loses any action
// whose actuator a higher source already claims this tick; waits never
// conflict. The bundle lists override items first, then intent, then
// instinct. Intent steps are consumed one per tick while the Intent is fresh.
class ActionDispatcher {
public:
    ActionDispatcher(policy::ActionGuard guard, ActuationScheduler& scheduler);

    // `intent` must already be filtered for staleness (null when absent/stale).
    protocol::DispatchedAction compose(std::uint64_t tick_id,
                                       const protocol::InstinctAction& instinct,
                                       const protocol::Intent* intent,
                                       const std::vector<protocol::Action>& overrides);

    // Validates and schedules the bundle. Returns the number of OSC messages queued.
    core::errors::Result<std::size_t> dispatch(const protocol::DispatchedAction& action);

    // Zeroes every actuator and forgets the intent cursor.
    void release_all();

    DispatchStats stats() const { return stats_; }

private:
    policy::ActionGuard guard_;
    ActuationScheduler& scheduler_;
    std::uint64_t intent_generation_ = 0;
    std::size_t intent_cursor_ = 0;
    DispatchStats stats_;
};

}  // namespace vrc::dispatch
