#include "planner/planner_client.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace vrc::planner {

using core::errors::AgentError;
using core::errors::ErrorCategory;

PlannerSettings PlannerSettings::from_config(const core::config::AgentConfig& config) {
    PlannerSettings settings;
    settings.max_attempts = config.planner.max_attempts;
    settings.retry_base = core::clock::Duration(config.planner.retry_base_ms);
    settings.failure_cooldown = core::clock::Duration(config.planner.failure_cooldown_ms);
    settings.max_cooldown = core::clock::Duration(config.planner.max_cooldown_ms);
    settings.intent_ttl = core::clock::Duration(config.runtime.intent_ttl_ms);
    return settings;
}

std::string to_string(const StartOutcome outcome) {
    switch (outcome) {
        case StartOutcome::Started:
            return "started";
        case StartOutcome::InFlight:
            return "in_flight";
        case StartOutcome::CoolingDown:
            return "cooling_down";
        case StartOutcome::Stopped:
            return "stopped";
        default:
            return "unknown";
    }
}

PlannerClient::PlannerClient(std::unique_ptr<PlannerBackend> backend,
                             runtime::IntentCell& cell, const core::clock::Clock& clock,
                             PlannerSettings settings)
    : backend_(std::move(backend)), cell_(cell), clock_(clock), settings_(std::move(settings)) {
    if (settings_.max_attempts == 0) {
        settings_.max_attempts = 1;
    }
}

PlannerClient::~PlannerClient() { shutdown(); }

void PlannerClient::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void PlannerClient::set_shaper(Shaper shaper) {
    std::lock_guard<std::mutex> lock(mutex_);
    shaper_ = std::move(shaper);
}

void PlannerClient::set_retriever(Retriever retriever) {
    std::lock_guard<std::mutex> lock(mutex_);
    retriever_ = std::move(retriever);
}

core::clock::Duration PlannerClient::cooldown_for(const std::uint32_t failures) const {
    if (failures == 0) {
        return core::clock::Duration(0);
    }
    auto cooldown = settings_.failure_cooldown;
    for (std::uint32_t i = 1; i < failures && cooldown < settings_.max_cooldown; ++i) {
        cooldown *= 2;
    }
    return std::min(cooldown, settings_.max_cooldown);
}

StartOutcome PlannerClient::try_start(PlanRequest request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return StartOutcome::Stopped;
    }
    if (in_flight_.load()) {
        ++stats_.dropped_in_flight;
        return StartOutcome::InFlight;
    }
    if (clock_.now() < cooldown_until_) {
        ++stats_.dropped_cooldown;
        return StartOutcome::CoolingDown;
    }
    // The previous worker has already cleared in_flight_ and is exiting.
    if (worker_.joinable()) {
        worker_.join();
    }

    in_flight_.store(true);
    ++stats_.started;
    worker_ = std::thread([this, req = std::move(request)]() mutable { run(std::move(req)); });
    return StartOutcome::Started;
}

void PlannerClient::run(PlanRequest request) {
    core::logging::Logger::set_thread_name("planner");
    PlanOutcome outcome;
    std::optional<protocol::Intent> planned;

    Shaper shaper;
    Retriever retriever;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shaper = shaper_;
        retriever = retriever_;
    }
    // Memory I/O stays off the loop thread.
    if (retriever && !request.memory_query.empty()) {
        request.long_term = retriever(request.memory_query);
    }

    for (std::uint32_t attempt = 0; attempt < settings_.max_attempts; ++attempt) {
        if (cancel_->load()) {
            break;
        }
        outcome.attempts = attempt + 1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.attempts;
        }

        auto result = backend_->plan(request, cancel_);
        if (!core::errors::is_error(result)) {
            planned = core::errors::get_value(result);
            outcome.error.reset();
            break;
        }

        const auto& err = core::errors::get_error(result);
        outcome.error = err;
        if (!err.retryable || attempt + 1 == settings_.max_attempts) {
            break;
        }

        auto delay = settings_.retry_base;
        for (std::uint32_t i = 0; i < attempt; ++i) {
            delay *= 2;
        }
        LOG_WARN("Planner attempt " + std::to_string(attempt + 1) + " failed [" + err.code +
                 "], retry in " + std::to_string(delay.count()) + " ms");
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, delay, [this]() { return cancel_->load(); });
    }

    const bool cancelled = cancel_->load();
    if (planned.has_value() && !cancelled) {
        if (shaper) {
            shaper(planned.value(), request);
        }
        planned->created_at = clock_.now();
        planned->ttl = settings_.intent_ttl;
        const auto generation = cell_.replace(std::move(planned.value()));
        outcome.intent = cell_.load();
        LOG_INFO("Planner: intent #" + std::to_string(generation) + " \"" +
                 (outcome.intent ? outcome.intent->goal : std::string("?")) + "\" (" +
                 std::to_string(outcome.intent ? outcome.intent->steps.size() : 0) +
                 " steps, " + std::to_string(outcome.attempts) + " attempt(s))");
    } else if (cancelled) {
        outcome.error = AgentError{ErrorCategory::Planner,
                                   "Planner result discarded during shutdown.",
                                   "planner_cancelled"};
        LOG_DEBUG("Planner: result discarded, shutdown in progress");
    } else if (!outcome.error.has_value()) {
        outcome.error = AgentError{ErrorCategory::Internal, "Planner produced no result.",
                                   "planner_no_result"};
    }

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome.intent) {
            ++stats_.succeeded;
            consecutive_failures_ = 0;
            cooldown_until_ = core::clock::TimePoint{};
        } else if (cancelled) {
            ++stats_.discarded;
        } else {
            ++stats_.failed;
            ++consecutive_failures_;
            const auto cooldown = cooldown_for(consecutive_failures_);
            cooldown_until_ = clock_.now() + cooldown;
            LOG_WARN("Planner failed [" + outcome.error->code + "]: " + outcome.error->message +
                     "; instinct-only for " + std::to_string(cooldown.count()) + " ms");
        }
        listener = listener_;
    }

    if (listener && !cancelled) {
        outcome.request = std::move(request);
        listener(outcome);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.store(false);
    }
    cv_.notify_all();
}

bool PlannerClient::wait_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !in_flight_.load(); });
}

void PlannerClient::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cancel_->store(true);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

PlannerStats PlannerClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::uint32_t PlannerClient::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

}  // namespace vrc::planner
