#include "dispatch/osc_timeline.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

namespace vrc::dispatch {

using core::clock::Duration;
using protocol::Action;
using protocol::ActionType;
using protocol::MoveDirection;

namespace {

constexpr Duration kButtonPulse{30};
constexpr double kLookScale = 35.0;

Duration seconds_to_ms(const double seconds) {
    return Duration(static_cast<Duration::rep>(std::lround(seconds * 1000.0)));
}

float clamp_unit(const double value) {
    return static_cast<float>(std::max(-1.0, std::min(1.0, value)));
}

osc::OscMessage axis(const std::string& name, const float value) {
    return osc::OscMessage{"/input/" + name, {value}};
}

osc::OscMessage button(const std::string& name, const std::int32_t value) {
    return osc::OscMessage{"/input/" + name, {value}};
}

// Axis press followed by a release; returns the hold length.
Duration push_axis(std::vector<ScheduledMessage>& out, const Duration at,
                   const std::string& name, const float value, const Duration hold) {
    out.push_back(ScheduledMessage{at, axis(name, value)});
    out.push_back(ScheduledMessage{at + hold, axis(name, 0.0f)});
    return hold;
}

Duration push_button(std::vector<ScheduledMessage>& out, const Duration at,
                     const std::string& name) {
    out.push_back(ScheduledMessage{at, button(name, 1)});
    out.push_back(ScheduledMessage{at + kButtonPulse, button(name, 0)});
    return kButtonPulse;
}

Duration look_hold(const int delta) {
    const double seconds = std::max(0.03, std::min(0.22, std::abs(delta) / 120.0));
    return seconds_to_ms(seconds);
}

Duration compile_action(std::vector<ScheduledMessage>& out, const Duration at,
                        const Action& action) {
    switch (action.type) {
        case ActionType::Look: {
            Duration longest{0};
            if (std::abs(action.dx) >= 2) {
                longest = std::max(longest, push_axis(out, at, "LookHorizontal",
                                                      clamp_unit(action.dx / kLookScale),
                                                      look_hold(action.dx)));
            }
            if (std::abs(action.dy) >= 2) {
                longest = std::max(longest, push_axis(out, at, "LookVertical",
                                                      clamp_unit(-action.dy / kLookScale),
                                                      look_hold(action.dy)));
            }
            return longest;
        }
        case ActionType::Move: {
            const Duration hold = std::max(Duration(20), seconds_to_ms(action.seconds));
            switch (action.direction) {
                case MoveDirection::Forward:
                    return push_axis(out, at, "Vertical", 1.0f, hold);
                case MoveDirection::Backward:
                    return push_axis(out, at, "Vertical", -1.0f, hold);
                case MoveDirection::Right:
                    return push_axis(out, at, "Horizontal", 1.0f, hold);
                case MoveDirection::Left:
                    return push_axis(out, at, "Horizontal", -1.0f, hold);
            }
            return Duration(0);
        }
        case ActionType::Jump:
            return push_button(out, at, "Jump");
        case ActionType::Use:
            return push_button(out, at, "UseRight");
        case ActionType::Grab:
            return push_button(out, at, "GrabRight");
        case ActionType::Chat:
            // [text, send immediately, play notification sound]
            out.push_back(ScheduledMessage{
                at, osc::OscMessage{"/chatbox/input", {action.text, true, false}}});
            return Duration(0);
        case ActionType::Wait:
            return seconds_to_ms(std::max(0.0, action.seconds));
    }
    return Duration(0);
}

}  // namespace

std::vector<ScheduledMessage> compile_timeline(const protocol::DispatchedAction& dispatched) {
    std::vector<ScheduledMessage> out;
    Duration cursor{0};
    for (const auto& item : dispatched.items) {
        cursor += compile_action(out, cursor, item.action);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ScheduledMessage& a, const ScheduledMessage& b) {
                         return a.offset < b.offset;
                     });
    return out;
}

}  // namespace vrc::dispatch
