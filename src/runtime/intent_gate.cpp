#include "runtime/intent_gate.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace vrc::runtime {

std::string to_string(const TriggerReason reason) {
    switch (reason) {
        case TriggerReason::None:
            return "none";
        case TriggerReason::InitialScene:
            return "initial_scene";
        case TriggerReason::HeardAudio:
            return "heard_audio";
        case TriggerReason::SceneChanged:
            return "scene_changed";
        case TriggerReason::IntentExpired:
            return "intent_expired";
        default:
            return "unknown";
    }
}

double scene_similarity(const std::string& a, const std::string& b,
                        const std::size_t prefix) {
    const std::string left = a.substr(0, std::min(prefix, a.size()));
    const std::string right = b.substr(0, std::min(prefix, b.size()));
    if (left == right) {
        return 1.0;
    }
    if (left.size() < 2 || right.size() < 2) {
        return 0.0;
    }

    std::unordered_map<std::string, int> bigrams;
    for (std::size_t i = 0; i + 1 < left.size(); ++i) {
        ++bigrams[left.substr(i, 2)];
    }
    std::size_t shared = 0;
    for (std::size_t i = 0; i + 1 < right.size(); ++i) {
        auto it = bigrams.find(right.substr(i, 2));
        if (it != bigrams.end() && it->second > 0) {
            --it->second;
            ++shared;
        }
    }
    const std::size_t total = (left.size() - 1) + (right.size() - 1);
    return (2.0 * static_cast<double>(shared)) / static_cast<double>(total);
}

IntentGate::IntentGate(GateSettings settings) : settings_(std::move(settings)) {}

GateDecision IntentGate::evaluate(const protocol::Observation* observation,
                                  const protocol::Intent* intent,
                                  const core::clock::TimePoint now) const {
    GateDecision decision;

    if (observation != nullptr) {
        if (observation->has_heard() && observation->heard != accepted_heard_) {
            decision.should_replan = true;
            decision.reason = TriggerReason::HeardAudio;
            return decision;
        }

        if (observation->has_scene()) {
            if (!has_baseline_ || accepted_scene_.empty()) {
                decision.should_replan = true;
                decision.reason = TriggerReason::InitialScene;
                decision.scene_similarity = 0.0;
                return decision;
            }
            decision.scene_similarity =
                scene_similarity(accepted_scene_, observation->scene, settings_.compare_prefix);
            if (decision.scene_similarity < settings_.scene_change_threshold) {
                decision.should_replan = true;
                decision.reason = TriggerReason::SceneChanged;
                return decision;
            }
        }
    }

    if (intent != nullptr && intent->is_stale(now) &&
        intent->generation != expired_generation_handled_) {
        decision.should_replan = true;
        decision.reason = TriggerReason::IntentExpired;
    }
    return decision;
}

void IntentGate::accept(const protocol::Observation& observation,
                        const protocol::Intent* intent,
                        const core::clock::TimePoint now) {
    has_baseline_ = true;
    if (observation.has_scene()) {
        accepted_scene_ = observation.scene;
    }
    accepted_heard_ = observation.heard;
    if (intent != nullptr && intent->is_stale(now)) {
        expired_generation_handled_ = intent->generation;
    }
}

}  // namespace vrc::runtime
