#pragma once
#include <cstdint>
#include <string>
#include "core/clock/clock.hpp"

namespace vrc::protocol {

    // Snapshot produced by the capture collaborators. Never mutated after creation.
    struct Observation {
        std::uint64_t sequence = 0;
        core::clock::TimePoint captured_at{};
        std::string scene;   // Vision description of the current frame
        std::string heard;   // ASR transcript of the latest audio window, may be empty

        bool has_scene() const { return !scene.empty(); }
        bool has_heard() const { return !heard.empty(); }
    };

} // namespace vrc::protocol
