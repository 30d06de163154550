#include "dispatch/actuation_scheduler.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace vrc::dispatch {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

osc::OscArgument zero_like(const osc::OscArgument& arg) {
    if (std::holds_alternative<float>(arg)) {
        return osc::OscArgument(0.0f);
    }
    return osc::OscArgument(static_cast<std::int32_t>(0));
}

bool is_releasable(const osc::OscMessage& message) {
    if (message.arguments.size() != 1) {
        return false;
    }
    const auto& arg = message.arguments.front();
    return std::holds_alternative<float>(arg) || std::holds_alternative<std::int32_t>(arg);
}

}  // namespace

ActuationScheduler::ActuationScheduler(osc::OscSink& sink) : sink_(sink) {}

ActuationScheduler::~ActuationScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ActuationScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = true;
    stopping_ = false;
    worker_ = std::thread([this]() { run(); });
}

void ActuationScheduler::drop_pending_for(const std::string& address) {
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->second.address == address) {
            it = queue_.erase(it);
            ++stats_.superseded;
        } else {
            ++it;
        }
    }
}

core::errors::Result<std::size_t> ActuationScheduler::submit(
    const std::vector<ScheduledMessage>& timeline) {
    const auto base = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return AgentError{ErrorCategory::Dispatch, "Actuation scheduler is not running.",
                              "scheduler_stopped"};
        }
        std::set<std::string> replaced;
        for (const auto& scheduled : timeline) {
            if (replaced.insert(scheduled.message.address).second) {
                drop_pending_for(scheduled.message.address);
            }
        }
        for (const auto& scheduled : timeline) {
            queue_.emplace(base + scheduled.offset, scheduled.message);
        }
    }
    cv_.notify_all();
    return timeline.size();
}

void ActuationScheduler::release_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        const auto now = std::chrono::steady_clock::now();
        for (const auto& entry : touched_) {
            queue_.emplace(now, osc::OscMessage{entry.first, {zero_like(entry.second)}});
        }
    }
    cv_.notify_all();
}

bool ActuationScheduler::wait_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return (queue_.empty() && !sending_) || !running_;
    });
}

void ActuationScheduler::shutdown(const std::chrono::milliseconds drain_timeout) {
    release_all();
    if (!wait_idle(drain_timeout)) {
        LOG_WARN("ActuationScheduler: release drain timed out, " +
                 std::to_string(pending()) + " messages dropped");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

SchedulerStats ActuationScheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::size_t ActuationScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ActuationScheduler::run() {
    core::logging::Logger::set_thread_name("osc");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            idle_cv_.notify_all();
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            continue;
        }
        const auto due = queue_.begin()->first;
        if (due > std::chrono::steady_clock::now()) {
            cv_.wait_until(lock, due);
            continue;
        }

        osc::OscMessage message = std::move(queue_.begin()->second);
        queue_.erase(queue_.begin());
        if (is_releasable(message)) {
            touched_[message.address] = message.arguments.front();
        }
        sending_ = true;
        lock.unlock();
        auto sent = sink_.send(message);
        lock.lock();
        sending_ = false;

        if (core::errors::is_error(sent)) {
            const auto& err = core::errors::get_error(sent);
            ++stats_.failed;
            ++consecutive_failures_;
            if (consecutive_failures_ == 1 || consecutive_failures_ % 50 == 0) {
                LOG_WARN("Dispatch failed [" + err.code + "] (" +
                         std::to_string(consecutive_failures_) + " in a row): " + err.message);
            }
        } else {
            ++stats_.sent;
            if (consecutive_failures_ > 0) {
                LOG_INFO("Dispatch recovered after " + std::to_string(consecutive_failures_) +
                         " failed sends");
            }
            consecutive_failures_ = 0;
        }
    }
    running_ = false;
    idle_cv_.notify_all();
}

}  // namespace vrc::dispatch
