#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vrc::protocol {

enum class ActionType {
    Look,
    Move,
    Jump,
    Use,
    Grab,
    Chat,
    Wait
};

enum class MoveDirection {
    Forward,
    Backward,
    Left,
    Right
};

// The physical channel an action drives. Two actions on the same actuator in
// one tick conflict; Actuator::None never does.
enum class Actuator {
    View,
    Locomotion,
    Jump,
    Hands,
    Chatbox,
    None
};

enum class ActionSource {
    Override,
    Intent,
    Instinct
};

struct Action {
    ActionType type = ActionType::Wait;
    int dx = 0;
    int dy = 0;
    MoveDirection direction = MoveDirection::Forward;
    double seconds = 0.0;
    std::string text;
};

struct InstinctAction {
    std::uint64_t tick_id = 0;
    std::vector<Action> actions;

    bool is_noop() const { return actions.empty(); }
};

struct DispatchItem {
    ActionSource source = ActionSource::Instinct;
    Action action;
};

struct DispatchedAction {
    std::uint64_t tick_id = 0;
    std::vector<DispatchItem> items;

    bool empty() const { return items.empty(); }

    // Highest-priority source present, Instinct when empty.
    ActionSource primary_source() const {
        ActionSource best = ActionSource::Instinct;
        for (const auto& item : items) {
            if (static_cast<int>(item.source) < static_cast<int>(best)) {
                best = item.source;
            }
        }
        return best;
    }

    std::size_t count_from(const ActionSource source) const {
        std::size_t n = 0;
        for (const auto& item : items) {
            if (item.source == source) {
                ++n;
            }
        }
        return n;
    }
};

inline Actuator actuator_for(const ActionType type) {
    switch (type) {
        case ActionType::Look:
            return Actuator::View;
        case ActionType::Move:
            return Actuator::Locomotion;
        case ActionType::Jump:
            return Actuator::Jump;
        case ActionType::Use:
        case ActionType::Grab:
            return Actuator::Hands;
        case ActionType::Chat:
            return Actuator::Chatbox;
        case ActionType::Wait:
        default:
            return Actuator::None;
    }
}

inline std::string to_string(const ActionType type) {
    switch (type) {
        case ActionType::Look:
            return "look";
        case ActionType::Move:
            return "move";
        case ActionType::Jump:
            return "jump";
        case ActionType::Use:
            return "use";
        case ActionType::Grab:
            return "grab";
        case ActionType::Chat:
            return "chat";
        case ActionType::Wait:
            return "wait";
        default:
            return "unknown";
    }
}

inline std::string to_string(const MoveDirection direction) {
    switch (direction) {
        case MoveDirection::Forward:
            return "forward";
        case MoveDirection::Backward:
            return "backward";
        case MoveDirection::Left:
            return "left";
        case MoveDirection::Right:
            return "right";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ActionSource source) {
    switch (source) {
        case ActionSource::Override:
            return "override";
        case ActionSource::Intent:
            return "intent";
        case ActionSource::Instinct:
            return "instinct";
        default:
            return "unknown";
    }
}

// Compact form used for logs and repeat detection, e.g. "move:left|look:3:0".
inline std::string signature(const std::vector<Action>& actions) {
    std::string sig;
    for (const auto& action : actions) {
        if (!sig.empty()) {
            sig += "|";
        }
        sig += to_string(action.type);
        if (action.type == ActionType::Move) {
            sig += ":" + to_string(action.direction);
        } else if (action.type == ActionType::Look) {
            sig += ":" + std::to_string(action.dx / 10) + ":" + std::to_string(action.dy / 10);
        }
    }
    return sig;
}

}  // namespace vrc::protocol
