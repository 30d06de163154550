#include "osc/osc_message.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace vrc::osc {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

void append_padded_string(std::vector<std::uint8_t>& out, const std::string& value) {
    out.insert(out.end(), value.begin(), value.end());
    // At least one NUL, then pad to a multiple of four.
    out.push_back(0);
    while (out.size() % 4 != 0) {
        out.push_back(0);
    }
}

void append_be32(std::vector<std::uint8_t>& out, const std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

}  // namespace

std::string type_tags(const OscMessage& message) {
    std::string tags = ",";
    for (const auto& arg : message.arguments) {
        if (std::holds_alternative<std::int32_t>(arg)) {
            tags.push_back('i');
        } else if (std::holds_alternative<float>(arg)) {
            tags.push_back('f');
        } else if (std::holds_alternative<std::string>(arg)) {
            tags.push_back('s');
        } else {
            tags.push_back(std::get<bool>(arg) ? 'T' : 'F');
        }
    }
    return tags;
}

core::errors::Result<std::vector<std::uint8_t>> encode(const OscMessage& message) {
    if (message.address.empty() || message.address.front() != '/') {
        return AgentError{ErrorCategory::Dispatch,
                          "OSC address must start with '/': " + message.address,
                          "invalid_osc_address"};
    }
    if (message.address.find('\0') != std::string::npos) {
        return AgentError{ErrorCategory::Dispatch, "OSC address contains NUL.",
                          "invalid_osc_address"};
    }

    std::vector<std::uint8_t> out;
    out.reserve(64);
    append_padded_string(out, message.address);
    append_padded_string(out, type_tags(message));

    for (const auto& arg : message.arguments) {
        if (std::holds_alternative<std::int32_t>(arg)) {
            append_be32(out, static_cast<std::uint32_t>(std::get<std::int32_t>(arg)));
        } else if (std::holds_alternative<float>(arg)) {
            const float value = std::get<float>(arg);
            std::uint32_t bits = 0;
            static_assert(sizeof(bits) == sizeof(value), "float must be 32-bit");
            std::memcpy(&bits, &value, sizeof(bits));
            append_be32(out, bits);
        } else if (std::holds_alternative<std::string>(arg)) {
            const auto& text = std::get<std::string>(arg);
            if (text.find('\0') != std::string::npos) {
                return AgentError{ErrorCategory::Dispatch, "OSC string argument contains NUL.",
                                  "invalid_osc_argument"};
            }
            append_padded_string(out, text);
        }
    }
    return out;
}

std::string describe(const OscMessage& message) {
    std::ostringstream ss;
    ss << message.address;
    for (const auto& arg : message.arguments) {
        ss << " ";
        if (std::holds_alternative<std::int32_t>(arg)) {
            ss << std::get<std::int32_t>(arg);
        } else if (std::holds_alternative<float>(arg)) {
            ss << std::fixed << std::setprecision(2) << std::get<float>(arg);
        } else if (std::holds_alternative<std::string>(arg)) {
            ss << "\"" << std::get<std::string>(arg) << "\"";
        } else {
            ss << (std::get<bool>(arg) ? "T" : "F");
        }
    }
    return ss.str();
}

}  // namespace vrc::osc
