#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "dispatch/osc_timeline.hpp"
#include "osc/osc_sink.hpp"

namespace vrc::dispatch {

struct SchedulerStats {
    std::uint64_t sent = 0;
    std::uint64_t failed = 0;
    std::uint64_t superseded = 0;
};

// Owns the only thread that talks to the OSC sink. Timelines are queued by
// due time; a newer message for an address replaces pending ones for it.
class ActuationScheduler {
public:
    explicit ActuationScheduler(osc::OscSink& sink);
    ~ActuationScheduler();

    ActuationScheduler(const ActuationScheduler&) = delete;
    ActuationScheduler& operator=(const ActuationScheduler&) = delete;

    void start();

    core::errors::Result<std::size_t> submit(const std::vector<ScheduledMessage>& timeline);

    // Drops everything pending and zeroes every axis/button touched so far.
    void release_all();

    bool wait_idle(std::chrono::milliseconds timeout);

    // release_all(), bounded drain, then joins the thread.
    void shutdown(std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(500));

    SchedulerStats stats() const;
    std::size_t pending() const;

private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    void run();
    void drop_pending_for(const std::string& address);

    osc::OscSink& sink_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::multimap<SteadyTime, osc::OscMessage> queue_;
    std::map<std::string, osc::OscArgument> touched_;
    SchedulerStats stats_;
    bool running_ = false;
    bool stopping_ = false;
    bool sending_ = false;
    std::uint64_t consecutive_failures_ = 0;
    std::thread worker_;
};

}  // namespace vrc::dispatch
