#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "protocol/observation.hpp"

namespace vrc::dispatch {

enum class OverrideKind {
    Say,   // Extra utterance on top of whatever the loop is doing
    Stop   // Immediate stop of the agent
};

struct OverrideEvent {
    OverrideKind kind = OverrideKind::Say;
    std::string text;  // Say only; empty means "describe what you see/hear"
};

// Event channel from the hotkey listener into the dispatcher. Overrides rank
// above intent and instinct actions.
class OverrideChannel {
public:
    explicit OverrideChannel(std::size_t capacity = 16);

    // Returns false when the event was dropped because the channel is full.
    // Stop is never dropped.
    bool push(OverrideEvent event);

    std::vector<OverrideEvent> drain();

    bool stop_requested() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<OverrideEvent> pending_;
    bool stop_requested_ = false;
};

// Parses one listener line: "say", "say <text>" or "stop".
std::optional<OverrideEvent> parse_override_command(const std::string& line);

// Short line built from the latest observation for a textless Say.
std::string build_utterance(const protocol::Observation& observation);

}  // namespace vrc::dispatch
