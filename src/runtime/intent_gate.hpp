#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/clock/clock.hpp"
#include "protocol/intent.hpp"
#include "protocol/observation.hpp"

namespace vrc::runtime {

enum class TriggerReason {
    None,
    InitialScene,
    HeardAudio,
    SceneChanged,
    IntentExpired
};

struct GateDecision {
    bool should_replan = false;
    TriggerReason reason = TriggerReason::None;
    double scene_similarity = 1.0;
};

struct GateSettings {
    double scene_change_threshold = 0.58;
    std::size_t compare_prefix = 320;
};

std::string to_string(TriggerReason reason);

// Similarity in [0, 1] between two scene descriptions (character bigram
// Dice coefficient). Two empty strings are identical.
double scene_similarity(const std::string& a, const std::string& b,
                        std::size_t prefix = 320);

class IntentGate {
public:
    explicit IntentGate(GateSettings settings = {});

    // Pure check: does not move the baseline. `observation` may be null when
    // capture produced nothing this tick; `intent` may be null when absent.
    GateDecision evaluate(const protocol::Observation* observation,
                          const protocol::Intent* intent,
                          core::clock::TimePoint now) const;

    // Called once a planner call has actually started for `observation`.
    // A stale `intent` passed here will not raise another expiry trigger.
    void accept(const protocol::Observation& observation,
                const protocol::Intent* intent, core::clock::TimePoint now);

    bool has_baseline() const { return has_baseline_; }

private:
    GateSettings settings_;
    bool has_baseline_ = false;
    std::string accepted_scene_;
    std::string accepted_heard_;
    std::uint64_t expired_generation_handled_ = 0;
};

}  // namespace vrc::runtime
