#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/clock/clock.hpp"
#include "protocol/action_contract.hpp"

namespace vrc::protocol {

// Planner-derived goal with a validity window. Owned by the IntentCell and
// shared read-only with the dispatcher once published.
struct Intent {
    std::uint64_t generation = 0;
    std::string goal = "observe";
    double activity_level = 0.35;
    double curiosity = 0.55;
    bool allow_move = true;
    std::string speak;
    std::vector<Action> steps;
    core::clock::TimePoint created_at{};
    core::clock::Duration ttl{0};

    bool is_stale(const core::clock::TimePoint now) const {
        return now >= created_at + ttl;
    }
};

}  // namespace vrc::protocol
