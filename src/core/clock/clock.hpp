#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace vrc::core::clock {

using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;

// Time source for everything that reasons about TTLs, cooldowns and tick
// deadlines. Tests drive a ManualClock instead of sleeping.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock final : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}

    TimePoint now() const override { return now_.load(); }

    void set(const TimePoint value) { now_.store(value); }

    void advance(const Duration delta) {
        TimePoint expected = now_.load();
        while (!now_.compare_exchange_weak(expected, expected + delta)) {
        }
    }

private:
    std::atomic<TimePoint> now_;
};

// Wall-clock ISO-8601 timestamp (local time, seconds precision) for records
// that outlive the process.
inline std::string local_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

}  // namespace vrc::core::clock
