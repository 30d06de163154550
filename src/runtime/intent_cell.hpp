#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include "core/clock/clock.hpp"
#include "protocol/intent.hpp"

namespace vrc::runtime {

// Single-slot holder for the current Intent. Readers get an immutable
// snapshot; writers replace the whole Intent under the lock, so a reader
// never observes a half-written one.
class IntentCell {
public:
    using Snapshot = std::shared_ptr<const protocol::Intent>;

    // Publishes a new Intent and returns the generation assigned to it.
    std::uint64_t replace(protocol::Intent intent);

    Snapshot load() const;

    // Current Intent, or nullptr when absent or stale at `now`.
    Snapshot load_fresh(core::clock::TimePoint now) const;

    void clear();

    std::uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    Snapshot current_;
    std::uint64_t next_generation_ = 1;
};

}  // namespace vrc::runtime
