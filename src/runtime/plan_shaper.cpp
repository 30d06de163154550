#include "runtime/plan_shaper.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <utility>
#include "core/logging/logger.hpp"
#include "dispatch/override_channel.hpp"

namespace vrc::runtime {

using protocol::Action;
using protocol::ActionType;
using protocol::MoveDirection;

namespace {

constexpr std::size_t kMaxSteps = 8;
constexpr std::size_t kSignatureSteps = 5;

const std::array<const char*, 10> kSocialKeywords = {
    "player", "friend", "chat", "room", "character",
    "avatar", "vrchat", "social", "online", "people"};

bool has_chat(const std::vector<Action>& steps) {
    return std::any_of(steps.begin(), steps.end(),
                       [](const Action& step) { return step.type == ActionType::Chat; });
}

void append_chat(protocol::Intent& intent, std::string text) {
    if (intent.steps.size() >= kMaxSteps) {
        intent.steps.resize(kMaxSteps - 1);
    }
    Action chat;
    chat.type = ActionType::Chat;
    chat.text = std::move(text);
    if (intent.speak.empty()) {
        intent.speak = chat.text;
    }
    intent.steps.push_back(std::move(chat));
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Action make_move(const MoveDirection direction, const double seconds) {
    Action action;
    action.type = ActionType::Move;
    action.direction = direction;
    action.seconds = seconds;
    return action;
}

Action make_look(const int dx, const int dy) {
    Action action;
    action.type = ActionType::Look;
    action.dx = dx;
    action.dy = dy;
    return action;
}

Action make_step(const ActionType type, const double seconds = 0.0) {
    Action action;
    action.type = type;
    action.seconds = seconds;
    return action;
}

// Three fixed exploration patterns used to break a repeated plan.
std::vector<Action> exploration_variant(const std::uint64_t variant) {
    switch (variant % 3) {
        case 0:
            return {make_move(MoveDirection::Left, 0.25), make_look(-30, 0),
                    make_step(ActionType::Jump), make_step(ActionType::Wait, 0.25)};
        case 1:
            return {make_move(MoveDirection::Right, 0.25), make_look(25, -8),
                    make_step(ActionType::Wait, 0.2)};
        default:
            return {make_move(MoveDirection::Backward, 0.2), make_look(0, -12),
                    make_step(ActionType::Use)};
    }
}

}  // namespace

ShaperSettings ShaperSettings::from_config(const core::config::AgentConfig& config) {
    ShaperSettings settings;
    settings.auto_chat = !config.runtime.observe_only;
    return settings;
}

PlanShaper::PlanShaper(const core::clock::Clock& clock, ShaperSettings settings,
                       const std::uint32_t seed)
    : clock_(clock),
      settings_(std::move(settings)),
      rng_(seed != 0 ? seed : std::random_device{}()) {}

bool PlanShaper::has_social_context(const protocol::Observation& observation) {
    if (observation.has_heard()) {
        return true;
    }
    const std::string scene = lowercase(observation.scene);
    return std::any_of(kSocialKeywords.begin(), kSocialKeywords.end(),
                       [&scene](const char* keyword) {
                           return scene.find(keyword) != std::string::npos;
                       });
}

ShapeReport PlanShaper::shape(protocol::Intent& intent, const protocol::Observation& observation) {
    const auto now = clock_.now();
    ++shaped_;

    ShapeReport report;
    report.heard_reply = reply_to_heard(intent, observation, now);
    report.auto_chat = add_auto_chat(intent, observation, now);
    report.stabilized = stabilize(intent);
    return report;
}

bool PlanShaper::reply_to_heard(protocol::Intent& intent,
                                const protocol::Observation& observation,
                                const core::clock::TimePoint now) {
    if (!observation.has_heard() || has_chat(intent.steps)) {
        return false;
    }
    if (observation.heard == last_replied_heard_ &&
        now - last_reply_at_ < settings_.heard_reply_dedupe) {
        return false;
    }
    std::string reply = dispatch::build_utterance(observation);
    if (reply.empty()) {
        return false;
    }
    LOG_INFO("Heard reply: " + reply);
    append_chat(intent, std::move(reply));
    last_replied_heard_ = observation.heard;
    last_reply_at_ = now;
    return true;
}

bool PlanShaper::add_auto_chat(protocol::Intent& intent,
                               const protocol::Observation& observation,
                               const core::clock::TimePoint now) {
    if (!settings_.auto_chat || has_chat(intent.steps)) {
        return false;
    }
    if (has_auto_chatted_ && now - last_auto_chat_at_ < settings_.auto_chat_interval) {
        return false;
    }
    if (!has_social_context(observation)) {
        return false;
    }
    const double probability = std::max(
        0.0, std::min(1.0, settings_.auto_chat_base +
                               intent.activity_level * settings_.auto_chat_activity_gain));
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    if (dist(rng_) >= probability) {
        return false;
    }
    std::string line = dispatch::build_utterance(observation);
    if (line.empty()) {
        return false;
    }
    LOG_DEBUG("Auto chat: " + line);
    append_chat(intent, std::move(line));
    last_auto_chat_at_ = now;
    has_auto_chatted_ = true;
    return true;
}

bool PlanShaper::stabilize(protocol::Intent& intent) {
    // Plans that already talk are never replaced.
    if (has_chat(intent.steps)) {
        return false;
    }
    const std::vector<Action> head(
        intent.steps.begin(),
        intent.steps.begin() + static_cast<std::ptrdiff_t>(
                                   std::min(kSignatureSteps, intent.steps.size())));
    const std::string sig = protocol::signature(head);
    const auto repeated = static_cast<std::size_t>(
        std::count(recent_signatures_.begin(), recent_signatures_.end(), sig));
    recent_signatures_.push_back(sig);
    while (recent_signatures_.size() > settings_.repeat_window) {
        recent_signatures_.pop_front();
    }
    if (repeated < settings_.repeat_limit) {
        return false;
    }

    auto variant = exploration_variant(shaped_);
    if (!intent.allow_move) {
        variant.erase(std::remove_if(variant.begin(), variant.end(),
                                     [](const Action& step) {
                                         return step.type == ActionType::Move;
                                     }),
                      variant.end());
    }
    LOG_INFO("Plan \"" + sig + "\" repeated " + std::to_string(repeated) +
             " times, switching to exploration");
    intent.steps = std::move(variant);
    return true;
}

}  // namespace vrc::runtime
