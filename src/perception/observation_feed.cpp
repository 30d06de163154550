#include "perception/observation_feed.hpp"

#include <utility>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace vrc::perception {

ObservationFeed::ObservationFeed(std::unique_ptr<ObservationSource> source,
                                 const core::clock::Duration heard_latch)
    : source_(std::move(source)), heard_latch_(heard_latch) {}

protocol::Observation ObservationFeed::apply_heard_latch(protocol::Observation observation,
                                                         const core::clock::TimePoint now) {
    if (observation.has_heard()) {
        latched_heard_ = observation.heard;
        latch_until_ = now + heard_latch_;
        return observation;
    }
    if (!latched_heard_.empty() && now < latch_until_) {
        observation.heard = latched_heard_;
    }
    return observation;
}

FeedUpdate ObservationFeed::poll(const core::clock::TimePoint now) {
    FeedUpdate update;
    auto polled = source_->poll(now);
    if (core::errors::is_error(polled)) {
        const auto& err = core::errors::get_error(polled);
        // One warning per failure streak; the loop polls every tick.
        if (err.code != last_failure_code_) {
            LOG_WARN("Capture failed [" + err.code + "]: " + err.message);
            last_failure_code_ = err.code;
        }
        update.capture_failed = true;
        update.observation = latest_;
        return update;
    }
    if (!last_failure_code_.empty()) {
        LOG_INFO("Capture recovered after [" + last_failure_code_ + "]");
        last_failure_code_.clear();
    }

    const auto& snapshot = core::errors::get_value(polled);
    if (snapshot.has_value()) {
        latest_ = apply_heard_latch(snapshot.value(), now);
        update.fresh = true;
    } else if (latest_.has_value() && latest_->has_heard() && now >= latch_until_) {
        // Latch expired: replace the cached frame with one that has no transcript.
        protocol::Observation expired;
        expired.sequence = latest_->sequence;
        expired.captured_at = latest_->captured_at;
        expired.scene = latest_->scene;
        latest_ = std::move(expired);
        latched_heard_.clear();
    }
    update.observation = latest_;
    return update;
}

}  // namespace vrc::perception
