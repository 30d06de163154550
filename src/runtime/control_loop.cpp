#include "runtime/control_loop.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace vrc::runtime {

using protocol::Action;
using protocol::ActionType;

LoopSettings LoopSettings::from_config(const core::config::AgentConfig& config) {
    LoopSettings settings;
    settings.tick_interval = core::clock::Duration(config.runtime.tick_interval_ms);
    settings.observe_only = config.runtime.observe_only;
    settings.retrieve_top_k = config.memory.retrieve_top_k;
    return settings;
}

ControlLoop::ControlLoop(LoopSettings settings, const core::clock::Clock& clock,
                         perception::ObservationFeed& feed, IntentGate& gate,
                         IntentCell& intents, InstinctGenerator& instinct,
                         dispatch::ActionDispatcher& dispatcher,
                         dispatch::OverrideChannel& overrides, planner::PlannerClient* planner,
                         session::MemoryStore* memory, session::SessionJournal* journal,
                         PlanShaper* shaper)
    : settings_(std::move(settings)),
      clock_(clock),
      feed_(feed),
      gate_(gate),
      intents_(intents),
      instinct_(instinct),
      dispatcher_(dispatcher),
      overrides_(overrides),
      planner_(planner),
      memory_(memory),
      journal_(journal),
      shaper_(shaper) {
    if (planner_ == nullptr) {
        return;
    }
    planner_->set_listener(
        [this](const planner::PlanOutcome& outcome) { on_plan_outcome(outcome); });
    if (memory_ != nullptr) {
        planner_->set_retriever([this](const std::string& query) {
            return memory_->retrieve(query, settings_.retrieve_top_k);
        });
    }
    if (shaper_ != nullptr) {
        planner_->set_shaper([this](protocol::Intent& intent, const planner::PlanRequest& request) {
            static_cast<void>(shaper_->shape(intent, request.observation));
        });
    }
}

// Runs on the planner worker thread.
void ControlLoop::on_plan_outcome(const planner::PlanOutcome& outcome) {
    TriggerReason trigger = TriggerReason::None;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trigger = pending_trigger_;
    }

    if (!outcome.intent) {
        if (journal_ != nullptr && outcome.error.has_value()) {
            auto written = journal_->write_plan_failed(outcome.error.value(), outcome.attempts);
            if (core::errors::is_error(written)) {
                LOG_WARN("Journal write failed: " + core::errors::get_error(written).message);
            }
        }
        return;
    }

    const auto& intent = *outcome.intent;
    protocol::MemoryRecord record;
    record.timestamp = core::clock::local_timestamp();
    record.scene = outcome.request.observation.scene;
    record.heard = outcome.request.observation.heard;
    record.speak = intent.speak;
    record.actions = protocol::signature(intent.steps);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        short_term_.push_back(record);
        while (short_term_.size() > settings_.short_term_capacity) {
            short_term_.pop_front();
        }
    }

    if (memory_ != nullptr) {
        auto appended = memory_->append(record);
        if (core::errors::is_error(appended)) {
            LOG_WARN("Memory append failed [" + core::errors::get_error(appended).code +
                     "]: " + core::errors::get_error(appended).message);
        }
    }
    if (journal_ != nullptr) {
        auto written = journal_->write_plan(intent, to_string(trigger), outcome.attempts);
        if (core::errors::is_error(written)) {
            LOG_WARN("Journal write failed: " + core::errors::get_error(written).message);
        }
    }
}

void ControlLoop::maybe_start_planner(const protocol::Observation* observation,
                                      const IntentCell::Snapshot& intent, TickReport& report) {
    const auto now = clock_.now();
    report.gate = gate_.evaluate(observation, intent.get(), now);
    if (!report.gate.should_replan) {
        return;
    }
    ++stats_.triggers;

    // An expiry trigger can fire before any observation exists; the planner
    // then works from an empty snapshot.
    protocol::Observation snapshot = observation != nullptr ? *observation : protocol::Observation{};

    if (planner_ == nullptr) {
        gate_.accept(snapshot, intent.get(), now);
        return;
    }
    if (planner_->in_flight()) {
        // Leave the baseline where it is; the next tick after completion
        // re-evaluates against it.
        report.planner = planner::StartOutcome::InFlight;
        ++stats_.triggers_dropped;
        return;
    }

    planner::PlanRequest request;
    request.observation = snapshot;
    request.current_intent = intent;
    request.short_term = short_term();
    if (memory_ != nullptr) {
        request.memory_query = snapshot.scene + "\n" + snapshot.heard;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_trigger_ = report.gate.reason;
    }
    report.planner = planner_->try_start(std::move(request));
    if (report.planner.value() == planner::StartOutcome::Started) {
        ++stats_.planner_started;
        gate_.accept(snapshot, intent.get(), now);
        LOG_INFO("Replan (" + to_string(report.gate.reason) + ")");
    } else {
        ++stats_.triggers_dropped;
        LOG_DEBUG("Replan trigger " + to_string(report.gate.reason) + " dropped: " +
                  planner::to_string(report.planner.value()));
    }
}

std::vector<Action> ControlLoop::collect_overrides(
    const std::optional<protocol::Observation>& observation, const core::clock::TimePoint now,
    bool& stop) {
    std::vector<Action> actions;
    for (auto& event : overrides_.drain()) {
        if (event.kind == dispatch::OverrideKind::Stop) {
            stop = true;
            continue;
        }
        if (has_said_ && now - last_say_at_ < settings_.say_interval) {
            ++stats_.overrides_rate_limited;
            LOG_DEBUG("Say override ignored, rate limited");
            continue;
        }
        std::string text = event.text;
        if (text.empty() && observation.has_value()) {
            text = dispatch::build_utterance(observation.value());
        }
        if (text.empty()) {
            LOG_INFO("Say override ignored, nothing observed yet");
            continue;
        }
        Action chat;
        chat.type = ActionType::Chat;
        chat.text = text;
        actions.push_back(std::move(chat));
        last_say_at_ = now;
        has_said_ = true;
        ++stats_.overrides;
        LOG_INFO("Say override: " + text);
    }
    return actions;
}

TickReport ControlLoop::tick() {
    TickReport report;
    report.tick_id = next_tick_id_++;
    ++stats_.ticks;
    const auto now = clock_.now();

    auto update = feed_.poll(now);
    report.capture_failed = update.capture_failed;
    report.fresh_observation = update.fresh;
    report.observation = update.observation;

    const auto current = intents_.load();
    if (update.capture_failed) {
        // Treated as "nothing changed": no trigger of any kind this tick.
        ++stats_.capture_failures;
    } else {
        maybe_start_planner(report.observation.has_value() ? &report.observation.value() : nullptr,
                            current, report);
    }

    const auto fresh = intents_.load_fresh(now);
    const bool heard = report.observation.has_value() && report.observation->has_heard();

    protocol::InstinctAction instinct;
    instinct.tick_id = report.tick_id;
    auto generated = instinct_.generate(report.tick_id, fresh.get(), heard, now);
    if (core::errors::is_error(generated)) {
        ++stats_.instinct_failures;
        const auto& err = core::errors::get_error(generated);
        LOG_WARN("Instinct failed [" + err.code + "]: " + err.message + "; no-op this tick");
    } else {
        instinct = core::errors::get_value(generated);
    }

    bool stop = false;
    const auto override_actions = collect_overrides(report.observation, now, stop);
    if (stop || overrides_.stop_requested()) {
        LOG_INFO("Stop override received");
        dispatcher_.release_all();
        request_stop();
        report.stop = true;
        return report;
    }

    report.dispatched = dispatcher_.compose(report.tick_id, instinct, fresh.get(), override_actions);
    if (settings_.observe_only || report.dispatched.empty()) {
        return report;
    }

    auto dispatched = dispatcher_.dispatch(report.dispatched);
    if (core::errors::is_error(dispatched)) {
        ++stats_.dispatch_failures;
        report.dispatch_failed = true;
        const auto& err = core::errors::get_error(dispatched);
        LOG_WARN("Dispatch failed [" + err.code + "]: " + err.message);
        if (journal_ != nullptr) {
            auto written = journal_->write_dispatch_failed(report.tick_id, err);
            if (core::errors::is_error(written)) {
                LOG_WARN("Journal write failed: " + core::errors::get_error(written).message);
            }
        }
    } else {
        report.messages = core::errors::get_value(dispatched);
    }
    return report;
}

void ControlLoop::run(const std::optional<std::uint64_t> max_ticks) {
    using SteadyClock = std::chrono::steady_clock;
    auto deadline = SteadyClock::now();
    std::uint64_t ran = 0;

    while (!stop_requested()) {
        if (max_ticks.has_value() && ran >= max_ticks.value()) {
            break;
        }
        const auto report = tick();
        ++ran;
        if (report.stop) {
            break;
        }

        deadline += settings_.tick_interval;
        const auto after = SteadyClock::now();
        if (after > deadline) {
            ++stats_.overruns;
            const auto late =
                std::chrono::duration_cast<std::chrono::milliseconds>(after - deadline);
            LOG_WARN("Tick " + std::to_string(report.tick_id) + " overran by " +
                     std::to_string(late.count()) + " ms");
            deadline = after;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        stop_cv_.wait_until(lock, deadline, [this]() { return stop_; });
    }
}

void ControlLoop::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    stop_cv_.notify_all();
}

bool ControlLoop::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

LoopStats ControlLoop::stats() const { return stats_; }

std::vector<protocol::MemoryRecord> ControlLoop::short_term() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {short_term_.begin(), short_term_.end()};
}

}  // namespace vrc::runtime
