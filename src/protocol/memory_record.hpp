#pragma once
#include <string>

namespace vrc::protocol {

    // One remembered tick: what was seen/heard and what the agent did about it.
    struct MemoryRecord {
        std::string timestamp;  // ISO-8601, seconds precision
        std::string scene;
        std::string heard;
        std::string speak;
        std::string actions;    // protocol::signature() of the dispatched actions
    };

} // namespace vrc::protocol
