#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <random>
#include <string>
#include <vector>
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/intent.hpp"
#include "protocol/observation.hpp"

namespace vrc::runtime {

struct ShaperSettings {
    core::clock::Duration heard_reply_dedupe{12000};
    core::clock::Duration auto_chat_interval{14000};
    double auto_chat_base = 0.35;
    double auto_chat_activity_gain = 0.45;
    bool auto_chat = true;
    std::size_t repeat_window = 6;
    std::size_t repeat_limit = 2;

    static ShaperSettings from_config(const core::config::AgentConfig& config);
};

struct ShapeReport {
    bool heard_reply = false;
    bool auto_chat = false;
    bool stabilized = false;
};

// Post-processing of a parsed Intent before it is published: answers fresh
// heard lines, adds an occasional social chat line and breaks up plans the
// model keeps repeating. Called on the planner worker, one plan at a time.
class PlanShaper {
public:
    PlanShaper(const core::clock::Clock& clock, ShaperSettings settings, std::uint32_t seed);

    ShapeReport shape(protocol::Intent& intent, const protocol::Observation& observation);

    static bool has_social_context(const protocol::Observation& observation);

private:
    bool reply_to_heard(protocol::Intent& intent, const protocol::Observation& observation,
                        core::clock::TimePoint now);
    bool add_auto_chat(protocol::Intent& intent, const protocol::Observation& observation,
                       core::clock::TimePoint now);
    bool stabilize(protocol::Intent& intent);

    const core::clock::Clock& clock_;
    ShaperSettings settings_;
    std::mt19937 rng_;
    std::uint64_t shaped_ = 0;

    std::string last_replied_heard_;
    core::clock::TimePoint last_reply_at_{};
    core::clock::TimePoint last_auto_chat_at_{};
    bool has_auto_chatted_ = false;
    std::deque<std::string> recent_signatures_;
};

}  // namespace vrc::runtime
