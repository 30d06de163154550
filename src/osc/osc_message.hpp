#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace vrc::osc {

using OscArgument = std::variant<std::int32_t, float, std::string, bool>;

struct OscMessage {
    std::string address;
    std::vector<OscArgument> arguments;
};

// OSC 1.0 binary encoding: padded address, padded ",<tags>" string, then
// big-endian int32/float32 and padded strings. Booleans are carried in the
// tag string (T/F) with no payload.
core::errors::Result<std::vector<std::uint8_t>> encode(const OscMessage& message);

std::string type_tags(const OscMessage& message);

std::string describe(const OscMessage& message);

}  // namespace vrc::osc
