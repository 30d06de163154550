#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/intent.hpp"

namespace vrc::runtime {

// Planner-independent micro behaviour: look jitter, small steps and
// hesitation, shaped by the current Intent's activity and curiosity.
class InstinctGenerator {
public:
    InstinctGenerator(core::config::InstinctConfig config, std::uint32_t seed);

    // `intent` may be null (absent or stale); defaults are used then.
    core::errors::Result<protocol::InstinctAction> generate(
        std::uint64_t tick_id, const protocol::Intent* intent, bool heard_present,
        core::clock::TimePoint now);

    static int deg_to_dx(double degrees);

    int last_dx() const { return last_dx_; }

private:
    double uniform(double lo, double hi);
    bool chance(double probability);
    int soft_cap_dx(int dx, int max_dx);
    void mutate(std::vector<protocol::Action>& actions, int max_dx);

    core::config::InstinctConfig config_;
    std::mt19937 rng_;
    int last_dx_ = 0;
    std::string last_signature_;
    core::clock::TimePoint last_look_at_{};
    bool has_looked_ = false;
};

}  // namespace vrc::runtime
