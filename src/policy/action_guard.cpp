#include "policy/action_guard.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace vrc::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Action;
using protocol::ActionType;

namespace {

// Truncates without splitting a UTF-8 sequence.
std::string utf8_truncate(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    while (max_bytes > 0 &&
           (static_cast<unsigned char>(text[max_bytes]) & 0xC0) == 0x80) {
        --max_bytes;
    }
    return text.substr(0, max_bytes);
}

}  // namespace

ActionGuard::ActionGuard(ActionPolicy policy) : policy_(std::move(policy)) {}

std::string ActionGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string ActionGuard::clean_chat_text(const std::string& text) const {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text) {
        cleaned.push_back(c == '\n' || c == '\r' || c == '\t' ? ' ' : c);
    }
    const auto first = cleaned.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = cleaned.find_last_not_of(' ');
    cleaned = cleaned.substr(first, last - first + 1);
    return utf8_truncate(cleaned, policy_.max_chat_chars);
}

core::errors::Result<Action> ActionGuard::validate_action(const Action& action) const {
    Action checked = action;
    switch (action.type) {
        case ActionType::Look:
            checked.dx = std::max(-policy_.max_look_delta,
                                  std::min(policy_.max_look_delta, action.dx));
            checked.dy = std::max(-policy_.max_look_delta,
                                  std::min(policy_.max_look_delta, action.dy));
            break;
        case ActionType::Move:
        case ActionType::Wait: {
            if (!std::isfinite(action.seconds) || action.seconds < 0.0) {
                return AgentError{ErrorCategory::Policy,
                                  "Duration must be a non-negative number.",
                                  "invalid_duration"};
            }
            const double cap = action.type == ActionType::Move ? policy_.max_move_seconds
                                                               : policy_.max_wait_seconds;
            checked.seconds = std::min(cap, action.seconds);
            break;
        }
        case ActionType::Chat: {
            checked.text = clean_chat_text(action.text);
            if (checked.text.empty()) {
                return AgentError{ErrorCategory::Policy, "Chat text is empty.", "empty_chat"};
            }
            const std::string lowered = lowercase(checked.text);
            for (const auto& blocked : policy_.blocked_chat_substrings) {
                if (lowered.find(lowercase(blocked)) == std::string::npos) {
                    continue;
                }
                return AgentError{ErrorCategory::Policy,
                                  "Chat text contains blocked content: " + blocked,
                                  "blocked_chat_text"};
            }
            break;
        }
        case ActionType::Jump:
        case ActionType::Use:
        case ActionType::Grab:
            break;
    }
    return checked;
}

GuardedDispatch ActionGuard::filter(const protocol::DispatchedAction& dispatched) const {
    GuardedDispatch out;
    out.accepted.tick_id = dispatched.tick_id;
    for (const auto& item : dispatched.items) {
        if (out.accepted.items.size() >= policy_.max_items) {
            out.rejected.push_back(AgentError{ErrorCategory::Policy,
                                              "Dispatch exceeds item limit.",
                                              "too_many_actions"});
            continue;
        }
        auto checked = validate_action(item.action);
        if (core::errors::is_error(checked)) {
            out.rejected.push_back(core::errors::get_error(checked));
            continue;
        }
        protocol::DispatchItem accepted_item;
        accepted_item.source = item.source;
        accepted_item.action = core::errors::get_value(checked);
        out.accepted.items.push_back(std::move(accepted_item));
    }
    return out;
}

}  // namespace vrc::policy
