#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include "core/clock/clock.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/observation.hpp"

namespace vrc::perception {

// Contract of the capture collaborators. Returns std::nullopt when nothing
// new has been produced since the previous poll.
class ObservationSource {
public:
    virtual ~ObservationSource() = default;
    virtual core::errors::Result<std::optional<protocol::Observation>> poll(
        core::clock::TimePoint now) = 0;
};

// Reads {"scene": "...", "heard": "..."} snapshots that an external capture
// process rewrites in place. The file is re-parsed only when its write time
// changes.
class FileObservationSource final : public ObservationSource {
public:
    explicit FileObservationSource(std::filesystem::path snapshot_path);

    core::errors::Result<std::optional<protocol::Observation>> poll(
        core::clock::TimePoint now) override;

    const std::filesystem::path& path() const { return snapshot_path_; }

private:
    std::filesystem::path snapshot_path_;
    std::optional<std::filesystem::file_time_type> last_write_;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace vrc::perception
