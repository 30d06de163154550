#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace vrc::core::config {

    // "session-" plus 8 lowercase hex digits; names the journal file and tags
    // every log line of one agent process.
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream ss;
        ss << "session-" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
        return ss.str();
    }

} // namespace vrc::core::config
