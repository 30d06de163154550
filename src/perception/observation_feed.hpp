#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/clock/clock.hpp"
#include "perception/observation_source.hpp"
#include "protocol/observation.hpp"

namespace vrc::perception {

struct FeedUpdate {
    // Latest known observation (possibly from an earlier poll), heard latch applied.
    std::optional<protocol::Observation> observation;
    bool fresh = false;          // A new snapshot arrived this poll
    bool capture_failed = false;
};

// Wraps a source with the last-good cache and the heard latch.
class ObservationFeed {
public:
    ObservationFeed(std::unique_ptr<ObservationSource> source,
                    core::clock::Duration heard_latch);

    FeedUpdate poll(core::clock::TimePoint now);

    std::optional<protocol::Observation> latest() const { return latest_; }

private:
    protocol::Observation apply_heard_latch(protocol::Observation observation,
                                            core::clock::TimePoint now);

    std::unique_ptr<ObservationSource> source_;
    core::clock::Duration heard_latch_;
    std::optional<protocol::Observation> latest_;
    std::string latched_heard_;
    core::clock::TimePoint latch_until_{};
    std::string last_failure_code_;
};

}  // namespace vrc::perception
