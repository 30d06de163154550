#pragma once

#include <vector>
#include "core/clock/clock.hpp"
#include "osc/osc_message.hpp"
#include "protocol/action_contract.hpp"

namespace vrc::dispatch {

struct ScheduledMessage {
    core::clock::Duration offset{0};
    osc::OscMessage message;
};

// Turns a dispatched bundle into timed OSC messages. Items play in order:
// axes are pressed then released after their hold, buttons pulse 1 -> 0, and
// waits push every later item back.
std::vector<ScheduledMessage> compile_timeline(const protocol::DispatchedAction& dispatched);

}  // namespace vrc::dispatch
