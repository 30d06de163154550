#include "dispatch/action_dispatcher.hpp"

#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "dispatch/osc_timeline.hpp"

namespace vrc::dispatch {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Action;
using protocol::ActionSource;
using protocol::Actuator;
using protocol::DispatchedAction;
using protocol::DispatchItem;

ActionDispatcher::ActionDispatcher(policy::ActionGuard guard, ActuationScheduler& scheduler)
    : guard_(std::move(guard)), scheduler_(scheduler) {}

DispatchedAction ActionDispatcher::compose(const std::uint64_t tick_id,
                                           const protocol::InstinctAction& instinct,
                                           const protocol::Intent* intent,
                                           const std::vector<Action>& overrides) {
    DispatchedAction out;
    out.tick_id = tick_id;
    std::set<Actuator> claimed;

    auto claim = [&claimed](const Action& action) {
        const Actuator actuator = protocol::actuator_for(action.type);
        if (actuator != Actuator::None) {
            claimed.insert(actuator);
        }
    };
    auto is_claimed = [&claimed](const Action& action) {
        const Actuator actuator = protocol::actuator_for(action.type);
        return actuator != Actuator::None && claimed.count(actuator) > 0;
    };

    for (const auto& action : overrides) {
        out.items.push_back(DispatchItem{ActionSource::Override, action});
        claim(action);
    }

    if (intent != nullptr) {
        if (intent->generation != intent_generation_) {
            intent_generation_ = intent->generation;
            intent_cursor_ = 0;
        }
        if (intent_cursor_ < intent->steps.size()) {
            const Action& step = intent->steps[intent_cursor_];
            if (is_claimed(step)) {
                ++stats_.intent_deferred;
            } else {
                out.items.push_back(DispatchItem{ActionSource::Intent, step});
                claim(step);
                ++intent_cursor_;
            }
        }
    }

    for (const auto& action : instinct.actions) {
        if (is_claimed(action)) {
            ++stats_.instinct_dropped;
            continue;
        }
        out.items.push_back(DispatchItem{ActionSource::Instinct, action});
    }

    const std::size_t limit = guard_.policy().max_items;
    if (out.items.size() > limit) {
        out.items.resize(limit);
    }
    return out;
}

core::errors::Result<std::size_t> ActionDispatcher::dispatch(const DispatchedAction& action) {
    auto guarded = guard_.filter(action);
    for (const auto& rejection : guarded.rejected) {
        ++stats_.rejected;
        LOG_WARN("ActionGuard rejected item [" + rejection.code + "]: " + rejection.message);
    }
    if (guarded.accepted.empty()) {
        return static_cast<std::size_t>(0);
    }

    const auto timeline = compile_timeline(guarded.accepted);
    auto submitted = scheduler_.submit(timeline);
    if (core::errors::is_error(submitted)) {
        ++stats_.failed;
        const auto& err = core::errors::get_error(submitted);
        return AgentError{ErrorCategory::Dispatch,
                          "Tick " + std::to_string(action.tick_id) + " not dispatched: " +
                              err.message,
                          err.code};
    }
    ++stats_.dispatched;
    LOG_DEBUG("Dispatch tick " + std::to_string(action.tick_id) + " source=" +
              protocol::to_string(guarded.accepted.primary_source()) + " items=" +
              std::to_string(guarded.accepted.items.size()) + " messages=" +
              std::to_string(core::errors::get_value(submitted)));
    return core::errors::get_value(submitted);
}

void ActionDispatcher::release_all() {
    scheduler_.release_all();
    intent_generation_ = 0;
    intent_cursor_ = 0;
}

}  // namespace vrc::dispatch
