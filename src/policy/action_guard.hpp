#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/action_contract.hpp"

namespace vrc::policy {

struct ActionPolicy {
    std::size_t max_items = 8;
    std::size_t max_chat_chars = 144;
    int max_look_delta = 120;
    double max_move_seconds = 1.5;
    double max_wait_seconds = 2.0;
    std::vector<std::string> blocked_chat_substrings = {
        "http://",
        "https://",
        "discord.gg/"};
};

struct GuardedDispatch {
    protocol::DispatchedAction accepted;
    std::vector<core::errors::AgentError> rejected;
};

// Last check between composed actions and the actuators: clamps magnitudes,
// cleans chat text and rejects what must never reach the avatar.
class ActionGuard {
public:
    explicit ActionGuard(ActionPolicy policy = {});

    core::errors::Result<protocol::Action> validate_action(
        const protocol::Action& action) const;

    GuardedDispatch filter(const protocol::DispatchedAction& dispatched) const;

    const ActionPolicy& policy() const { return policy_; }

private:
    static std::string lowercase(std::string value);
    std::string clean_chat_text(const std::string& text) const;

    ActionPolicy policy_;
};

}  // namespace vrc::policy
