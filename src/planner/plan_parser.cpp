#include "planner/plan_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/action_guard.hpp"

namespace vrc::planner {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Action;
using protocol::ActionType;
using protocol::MoveDirection;

const char* const kIntentSystemPrompt =
    "You are a low-frequency intent controller for a VRChat agent.\n"
    "Return one strict JSON object with keys:\n"
    "{\"intent\": string, \"activity_level\": number(0-1), \"curiosity\": number(0-1),"
    " \"allow_move\": boolean, \"speak\": string, \"actions\": array}\n"
    "Action schema:\n"
    "- move: {\"type\":\"move\",\"direction\":\"w|a|s|d\",\"seconds\":0.3}\n"
    "- jump: {\"type\":\"jump\"}\n"
    "- mouse_move: {\"type\":\"mouse_move\",\"dx\":20,\"dy\":-10}  # rotate view\n"
    "- mouse_click: {\"type\":\"mouse_click\",\"button\":\"left|right\"}\n"
    "- chat_send: {\"type\":\"chat_send\",\"text\":\"hello\"}\n"
    "- wait: {\"type\":\"wait\",\"seconds\":0.5}\n"
    "Rules:\n"
    "- Keep output concise; prefer 0-4 actions.\n"
    "- When nearby players are visible, give a short `speak` line.\n"
    "- If short_term_memory shows a very recent chat_send, skip chat to avoid spam.\n"
    "- Do not repeat the same action sequence every time.\n"
    "- Do NOT output any extra text outside JSON.";

namespace {

constexpr std::size_t kMaxSteps = 8;
constexpr std::size_t kMaxGoalBytes = 40;
constexpr std::size_t kMaxChatBytes = 140;
constexpr double kDefaultActivity = 0.35;
constexpr double kDefaultCuriosity = 0.55;

std::string utf8_prefix(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    while (max_bytes > 0 && (static_cast<unsigned char>(text[max_bytes]) & 0xC0) == 0x80) {
        --max_bytes;
    }
    return text.substr(0, max_bytes);
}

std::size_t utf8_length(const std::string& text) {
    std::size_t n = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return trim(it->get<std::string>());
}

double number_field(const json& obj, const char* key, const double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    const double value = it->get<double>();
    return std::isfinite(value) ? value : fallback;
}

// Clamped before the int conversion; the guard re-checks the same bound.
int look_delta_field(const json& obj, const char* key) {
    const double limit = policy::ActionPolicy{}.max_look_delta;
    const double value = number_field(obj, key, 0.0);
    return static_cast<int>(std::max(-limit, std::min(limit, value)));
}

double clamp01(const double value) { return std::max(0.0, std::min(1.0, value)); }

bool mostly_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    std::size_t digits = 0;
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            ++digits;
        }
    }
    return static_cast<double>(digits) / static_cast<double>(text.size()) >= 0.8;
}

std::optional<MoveDirection> parse_direction(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "w" || value == "forward") {
        return MoveDirection::Forward;
    }
    if (value == "s" || value == "backward" || value == "back") {
        return MoveDirection::Backward;
    }
    if (value == "a" || value == "left") {
        return MoveDirection::Left;
    }
    if (value == "d" || value == "right") {
        return MoveDirection::Right;
    }
    return std::nullopt;
}

std::optional<Action> parse_action(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }
    const std::string type = string_field(item, "type");
    Action action;
    if (type == "move" || type == "key_tap") {
        const std::string key = string_field(item, type == "move" ? "direction" : "key");
        if (type == "key_tap" && (key == "space" || key == "jump")) {
            action.type = ActionType::Jump;
            return action;
        }
        const auto direction = parse_direction(key.empty() ? "w" : key);
        if (!direction.has_value()) {
            return std::nullopt;
        }
        action.type = ActionType::Move;
        action.direction = direction.value();
        action.seconds = number_field(item, type == "move" ? "seconds" : "duration", 0.2);
        return action;
    }
    if (type == "mouse_move" || type == "look") {
        action.type = ActionType::Look;
        action.dx = look_delta_field(item, "dx");
        action.dy = look_delta_field(item, "dy");
        return action;
    }
    if (type == "jump") {
        action.type = ActionType::Jump;
        return action;
    }
    if (type == "mouse_click" || type == "use" || type == "grab") {
        const std::string button = string_field(item, "button");
        action.type = (type == "grab" || button == "right") ? ActionType::Grab : ActionType::Use;
        return action;
    }
    if (type == "chat_send" || type == "chat") {
        action.type = ActionType::Chat;
        action.text = string_field(item, "text");
        return action;
    }
    if (type == "wait") {
        action.type = ActionType::Wait;
        action.seconds = number_field(item, "seconds", 0.2);
        return action;
    }
    return std::nullopt;
}

std::optional<json> extract_object(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return parsed;
    }
    const auto open = text.find('{');
    const auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return std::nullopt;
    }
    parsed = json::parse(text.substr(open, close - open + 1), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return parsed;
    }
    return std::nullopt;
}

}  // namespace

core::errors::Result<protocol::Intent> parse_plan(const std::string& text) {
    const auto parsed = extract_object(text);
    if (!parsed.has_value()) {
        return AgentError{ErrorCategory::Planner, "Planner reply contains no JSON object.",
                          "plan_parse_failed"};
    }
    const json& obj = parsed.value();

    protocol::Intent intent;
    std::string goal = string_field(obj, "intent");
    if (goal.empty()) {
        goal = string_field(obj, "next_focus");
    }
    intent.goal = goal.empty() ? "observe" : utf8_prefix(goal, kMaxGoalBytes);
    intent.activity_level = clamp01(number_field(obj, "activity_level", kDefaultActivity));
    intent.curiosity = clamp01(number_field(obj, "curiosity", kDefaultCuriosity));
    auto allow_move = obj.find("allow_move");
    intent.allow_move = allow_move == obj.end() || !allow_move->is_boolean() ||
                        allow_move->get<bool>();
    intent.speak = string_field(obj, "speak");

    auto actions = obj.find("actions");
    if (actions != obj.end() && actions->is_array()) {
        for (const auto& item : *actions) {
            auto action = parse_action(item);
            if (!action.has_value()) {
                LOG_DEBUG("PlanParser: dropped unsupported action " + item.dump());
                continue;
            }
            intent.steps.push_back(std::move(action.value()));
            if (intent.steps.size() >= kMaxSteps) {
                break;
            }
        }
    }

    bool has_chat = false;
    for (auto& step : intent.steps) {
        if (step.type != ActionType::Chat) {
            continue;
        }
        // Models sometimes emit fragments like "4145"; fall back to the speak line.
        if (utf8_length(step.text) < 4 || mostly_digits(step.text)) {
            step.text = intent.speak;
        }
        step.text = utf8_prefix(step.text, kMaxChatBytes);
        has_chat = has_chat || !step.text.empty();
    }
    intent.steps.erase(std::remove_if(intent.steps.begin(), intent.steps.end(),
                                      [](const Action& step) {
                                          return step.type == ActionType::Chat &&
                                                 step.text.empty();
                                      }),
                       intent.steps.end());

    if (!has_chat && !intent.speak.empty()) {
        Action chat;
        chat.type = ActionType::Chat;
        chat.text = utf8_prefix(intent.speak, kMaxChatBytes);
        intent.steps.insert(intent.steps.begin(), chat);
        if (intent.steps.size() > kMaxSteps) {
            intent.steps.resize(kMaxSteps);
        }
    }
    return intent;
}

json build_planner_payload(const PlanRequest& request) {
    json payload;
    payload["time"] = core::clock::local_timestamp();
    payload["scene"] = utf8_prefix(request.observation.scene, 280);
    payload["heard"] = utf8_prefix(request.observation.heard, 90);

    const protocol::Intent defaults;
    const protocol::Intent& current =
        request.current_intent ? *request.current_intent : defaults;
    payload["intent_state"] = {{"intent", current.goal},
                               {"activity_level", current.activity_level},
                               {"curiosity", current.curiosity},
                               {"allow_move", current.allow_move}};

    json short_term = json::array();
    const std::size_t first =
        request.short_term.size() > 2 ? request.short_term.size() - 2 : 0;
    for (std::size_t i = first; i < request.short_term.size(); ++i) {
        const auto& item = request.short_term[i];
        short_term.push_back({{"speak", utf8_prefix(item.speak, 80)},
                              {"actions", utf8_prefix(item.actions, 80)}});
    }
    payload["short_term_memory"] = short_term;

    json long_term = json::array();
    for (std::size_t i = 0; i < request.long_term.size() && i < 2; ++i) {
        const auto& item = request.long_term[i];
        long_term.push_back({{"scene", utf8_prefix(item.scene, 100)},
                             {"speak", utf8_prefix(item.speak, 80)}});
    }
    payload["long_term_memory"] = long_term;
    return payload;
}

}  // namespace vrc::planner
