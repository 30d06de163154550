#include "runtime/instinct_generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace vrc::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Action;
using protocol::ActionType;
using protocol::InstinctAction;
using protocol::MoveDirection;

namespace {

constexpr std::size_t kMaxInstinctActions = 3;
constexpr auto kKeepAliveAfter = std::chrono::milliseconds(2000);

double clamp_probability(const double value) { return std::max(0.0, std::min(1.0, value)); }

Action make_look(const int dx, const int dy) {
    Action action;
    action.type = ActionType::Look;
    action.dx = dx;
    action.dy = dy;
    return action;
}

Action make_wait(const double seconds) {
    Action action;
    action.type = ActionType::Wait;
    action.seconds = seconds;
    return action;
}

double round2(const double value) { return std::round(value * 100.0) / 100.0; }

}  // namespace

InstinctGenerator::InstinctGenerator(core::config::InstinctConfig config,
                                     const std::uint32_t seed)
    : config_(std::move(config)),
      rng_(seed != 0 ? seed : std::random_device{}()) {}

int InstinctGenerator::deg_to_dx(const double degrees) {
    return std::max(1, static_cast<int>(std::lround(std::fabs(degrees) * 9.0)));
}

double InstinctGenerator::uniform(const double lo, const double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

bool InstinctGenerator::chance(const double probability) {
    return uniform(0.0, 1.0) < clamp_probability(probability);
}

int InstinctGenerator::soft_cap_dx(const int dx, const int max_dx) {
    int capped = std::max(-max_dx, std::min(max_dx, dx));
    const int delta_cap = std::max(4, max_dx / 2);
    const int delta = capped - last_dx_;
    if (delta > delta_cap) {
        capped = last_dx_ + delta_cap;
    } else if (delta < -delta_cap) {
        capped = last_dx_ - delta_cap;
    }
    last_dx_ = capped;
    return capped;
}

void InstinctGenerator::mutate(std::vector<Action>& actions, const int max_dx) {
    static constexpr int kJitter[] = {-3, -2, 2, 3};
    std::uniform_int_distribution<int> pick(0, 3);
    std::uniform_int_distribution<int> tilt(-1, 1);
    for (auto& action : actions) {
        if (action.type == ActionType::Look) {
            action.dx = soft_cap_dx(action.dx + kJitter[pick(rng_)], max_dx);
            action.dy += tilt(rng_);
            return;
        }
    }
    // No look to perturb: inject a tiny one instead of repeating.
    actions.push_back(make_look(soft_cap_dx(chance(0.5) ? -6 : 6, max_dx), 0));
    if (actions.size() > kMaxInstinctActions) {
        actions.resize(kMaxInstinctActions);
    }
}

core::errors::Result<InstinctAction> InstinctGenerator::generate(
    const std::uint64_t tick_id, const protocol::Intent* intent, const bool heard_present,
    const core::clock::TimePoint now) {
    if (config_.look_jitter_min_deg <= 0.0 ||
        config_.look_jitter_min_deg > config_.look_jitter_max_deg) {
        return AgentError{ErrorCategory::Internal,
                          "Instinct jitter range is invalid.",
                          "invalid_instinct_config"};
    }

    const protocol::Intent defaults;
    const protocol::Intent& state = intent != nullptr ? *intent : defaults;

    InstinctAction result;
    result.tick_id = tick_id;

    const bool force_keepalive = !has_looked_ || (now - last_look_at_) > kKeepAliveAfter;

    // Sometimes the avatar just "thinks" and does nothing at all.
    if (!force_keepalive && chance(config_.hesitate_idle_prob)) {
        return result;
    }
    if (!force_keepalive && chance(config_.hesitate_pause_prob)) {
        result.actions.push_back(make_wait(round2(uniform(0.3, 0.8))));
        return result;
    }

    std::vector<Action> actions;
    if (chance(0.25)) {
        actions.push_back(make_wait(round2(uniform(0.08, 0.28))));
    }

    const double jitter_min = std::max(0.2, config_.look_jitter_min_deg);
    const double jitter_max = std::max(jitter_min, config_.look_jitter_max_deg);
    const double jitter_deg = uniform(jitter_min, jitter_max) * (0.8 + 0.4 * state.curiosity);
    const int base_dx = deg_to_dx(jitter_deg) * (chance(0.5) ? -1 : 1);
    const bool passive = state.goal == "observe" || state.goal == "listen";
    std::uniform_int_distribution<int> tilt(passive ? -5 : -4, passive ? 6 : 4);
    const int base_dy = tilt(rng_);
    const int max_dx = deg_to_dx(jitter_max * 1.35);

    if (heard_present && chance(0.45)) {
        // Orient towards the speaker, occasionally overshooting and pulling back.
        const int dx = soft_cap_dx(static_cast<int>(base_dx * 1.5), max_dx);
        actions.push_back(make_look(dx, 0));
        if (chance(config_.look_overshoot_prob)) {
            actions.push_back(make_wait(0.06));
            actions.push_back(make_look(static_cast<int>(-dx * uniform(0.28, 0.42)), 0));
        }
    } else {
        actions.push_back(make_look(soft_cap_dx(base_dx, max_dx), base_dy));
    }

    const double move_probability = config_.small_step_move_prob + state.activity_level * 0.2;
    if (state.allow_move && chance(move_probability)) {
        if (chance(0.28)) {
            actions.push_back(make_wait(round2(uniform(0.25, 0.5))));
        } else {
            static constexpr MoveDirection kDirections[] = {
                MoveDirection::Forward, MoveDirection::Left, MoveDirection::Backward,
                MoveDirection::Right};
            std::uniform_int_distribution<int> pick(0, 3);
            Action step;
            step.type = ActionType::Move;
            step.direction = kDirections[pick(rng_)];
            step.seconds = round2(uniform(0.12, 0.25));
            actions.push_back(step);
        }
    }

    if (actions.size() > kMaxInstinctActions) {
        actions.resize(kMaxInstinctActions);
    }
    std::string sig = protocol::signature(actions);
    if (!sig.empty() && sig == last_signature_) {
        mutate(actions, max_dx);
        sig = protocol::signature(actions);
    }
    last_signature_ = sig;
    last_look_at_ = now;
    has_looked_ = true;

    result.actions = std::move(actions);
    return result;
}

}  // namespace vrc::runtime
