#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "planner/openai_backend.hpp"
#include "planner/plan_parser.hpp"

namespace {

using vrc::core::errors::get_error;
using vrc::core::errors::get_value;
using vrc::core::errors::is_error;
using vrc::planner::PlanRequest;
using vrc::planner::build_planner_payload;
using vrc::planner::classify_http_status;
using vrc::planner::parse_plan;
using vrc::protocol::ActionType;
using vrc::protocol::MoveDirection;

TEST(PlanParserTest, ParsesStrictJson) {
    auto result = parse_plan(R"({
        "intent": "greet the group",
        "activity_level": 0.6,
        "curiosity": 0.4,
        "allow_move": false,
        "speak": "Hi everyone!",
        "actions": [
            {"type": "mouse_move", "dx": 20, "dy": -10},
            {"type": "move", "direction": "a", "seconds": 0.3},
            {"type": "chat_send", "text": "Hi everyone!"},
            {"type": "wait", "seconds": 0.5}
        ]
    })");
    ASSERT_FALSE(is_error(result));
    const auto& intent = get_value(result);
    EXPECT_EQ(intent.goal, "greet the group");
    EXPECT_DOUBLE_EQ(intent.activity_level, 0.6);
    EXPECT_DOUBLE_EQ(intent.curiosity, 0.4);
    EXPECT_FALSE(intent.allow_move);
    ASSERT_EQ(intent.steps.size(), 4u);
    EXPECT_EQ(intent.steps[0].type, ActionType::Look);
    EXPECT_EQ(intent.steps[0].dx, 20);
    EXPECT_EQ(intent.steps[0].dy, -10);
    EXPECT_EQ(intent.steps[1].type, ActionType::Move);
    EXPECT_EQ(intent.steps[1].direction, MoveDirection::Left);
    EXPECT_DOUBLE_EQ(intent.steps[1].seconds, 0.3);
    EXPECT_EQ(intent.steps[2].type, ActionType::Chat);
    EXPECT_EQ(intent.steps[3].type, ActionType::Wait);
}

TEST(PlanParserTest, ExtractsObjectFromProse) {
    auto result = parse_plan("Sure! Here is the plan:\n```json\n{\"intent\": \"wander\"}\n```");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).goal, "wander");
}

TEST(PlanParserTest, FailsWithoutJson) {
    auto result = parse_plan("I would rather not.");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "plan_parse_failed");
}

TEST(PlanParserTest, AppliesDefaultsAndClamps) {
    auto result = parse_plan(R"({"activity_level": 7, "curiosity": -2})");
    ASSERT_FALSE(is_error(result));
    const auto& intent = get_value(result);
    EXPECT_EQ(intent.goal, "observe");
    EXPECT_DOUBLE_EQ(intent.activity_level, 1.0);
    EXPECT_DOUBLE_EQ(intent.curiosity, 0.0);
    EXPECT_TRUE(intent.allow_move);
    EXPECT_TRUE(intent.steps.empty());

    auto defaults = parse_plan("{}");
    ASSERT_FALSE(is_error(defaults));
    EXPECT_DOUBLE_EQ(get_value(defaults).activity_level, 0.35);
    EXPECT_DOUBLE_EQ(get_value(defaults).curiosity, 0.55);
}

TEST(PlanParserTest, CapsGoalLength) {
    auto result = parse_plan("{\"intent\": \"" + std::string(100, 'g') + "\"}");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).goal.size(), 40u);
}

TEST(PlanParserTest, SpeakBecomesLeadingChatStep) {
    auto result = parse_plan(R"({"speak": "Nice hat!", "actions": [{"type": "jump"}]})");
    ASSERT_FALSE(is_error(result));
    const auto& steps = get_value(result).steps;
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].type, ActionType::Chat);
    EXPECT_EQ(steps[0].text, "Nice hat!");
    EXPECT_EQ(steps[1].type, ActionType::Jump);
}

TEST(PlanParserTest, RepairsDigitAndFragmentChat) {
    auto result = parse_plan(R"({"speak": "Hello friend", "actions": [
        {"type": "chat_send", "text": "4145"},
        {"type": "chat_send", "text": "ok"}
    ]})");
    ASSERT_FALSE(is_error(result));
    const auto& steps = get_value(result).steps;
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].text, "Hello friend");
    EXPECT_EQ(steps[1].text, "Hello friend");
}

TEST(PlanParserTest, DropsChatThatCannotBeRepaired) {
    auto result = parse_plan(R"({"actions": [{"type": "chat_send", "text": "12"}, {"type": "jump"}]})");
    ASSERT_FALSE(is_error(result));
    const auto& steps = get_value(result).steps;
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].type, ActionType::Jump);
}

TEST(PlanParserTest, CapsChatText) {
    const std::string longer(300, 'x');
    auto result = parse_plan("{\"actions\": [{\"type\": \"chat\", \"text\": \"" + longer + "\"}]}");
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).steps.size(), 1u);
    EXPECT_EQ(get_value(result).steps[0].text.size(), 140u);
}

TEST(PlanParserTest, MapsAliasesAndSkipsUnknownTypes) {
    auto result = parse_plan(R"({"actions": [
        {"type": "key_tap", "key": "space"},
        {"type": "key_tap", "key": "d", "duration": 0.4},
        {"type": "mouse_click", "button": "right"},
        {"type": "mouse_click", "button": "left"},
        {"type": "teleport"},
        {"type": "move", "direction": "sideways"}
    ]})");
    ASSERT_FALSE(is_error(result));
    const auto& steps = get_value(result).steps;
    ASSERT_EQ(steps.size(), 4u);
    EXPECT_EQ(steps[0].type, ActionType::Jump);
    EXPECT_EQ(steps[1].type, ActionType::Move);
    EXPECT_EQ(steps[1].direction, MoveDirection::Right);
    EXPECT_DOUBLE_EQ(steps[1].seconds, 0.4);
    EXPECT_EQ(steps[2].type, ActionType::Grab);
    EXPECT_EQ(steps[3].type, ActionType::Use);
}

TEST(PlanParserTest, CapsStepCount) {
    std::string actions;
    for (int i = 0; i < 20; ++i) {
        actions += std::string(i == 0 ? "" : ",") + "{\"type\": \"jump\"}";
    }
    auto result = parse_plan("{\"actions\": [" + actions + "]}");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).steps.size(), 8u);
}

TEST(PlanParserTest, PayloadTruncatesAndKeepsRecentMemory) {
    PlanRequest request;
    request.observation.scene = std::string(500, 's');
    request.observation.heard = std::string(200, 'h');
    for (int i = 0; i < 5; ++i) {
        vrc::protocol::MemoryRecord record;
        record.speak = "line " + std::to_string(i);
        request.short_term.push_back(record);
        request.long_term.push_back(record);
    }
    auto current = std::make_shared<vrc::protocol::Intent>();
    current->goal = "dance";
    request.current_intent = current;

    const auto payload = build_planner_payload(request);
    EXPECT_EQ(payload["scene"].get<std::string>().size(), 280u);
    EXPECT_EQ(payload["heard"].get<std::string>().size(), 90u);
    EXPECT_EQ(payload["intent_state"]["intent"], "dance");
    ASSERT_EQ(payload["short_term_memory"].size(), 2u);
    EXPECT_EQ(payload["short_term_memory"][0]["speak"], "line 3");
    EXPECT_EQ(payload["short_term_memory"][1]["speak"], "line 4");
    ASSERT_EQ(payload["long_term_memory"].size(), 2u);
    EXPECT_EQ(payload["long_term_memory"][0]["speak"], "line 0");
    EXPECT_TRUE(payload.contains("time"));
}

TEST(PlanParserTest, ClassifiesProviderStatus) {
    EXPECT_FALSE(classify_http_status(200, "").has_value());

    const auto throttled = classify_http_status(429, "slow down");
    ASSERT_TRUE(throttled.has_value());
    EXPECT_TRUE(throttled->retryable);

    const auto outage = classify_http_status(503, "");
    ASSERT_TRUE(outage.has_value());
    EXPECT_TRUE(outage->retryable);

    const auto denied = classify_http_status(401, "bad key");
    ASSERT_TRUE(denied.has_value());
    EXPECT_FALSE(denied->retryable);
    EXPECT_EQ(denied->code, "planner_unauthorized");

    const auto bad_request = classify_http_status(400, "bad model");
    ASSERT_TRUE(bad_request.has_value());
    EXPECT_FALSE(bad_request->retryable);
    EXPECT_NE(bad_request->message.find("bad model"), std::string::npos);
}

TEST(PlanParserTest, HugeLookDeltasClampInsteadOfOverflowing) {
    auto result = parse_plan(R"({"actions":[
        {"type":"mouse_move","dx":1e20,"dy":-3e12},
        {"type":"look","dx":-250.7,"dy":64.9}
    ]})");
    ASSERT_FALSE(is_error(result));
    const auto& steps = get_value(result).steps;
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].type, ActionType::Look);
    EXPECT_EQ(steps[0].dx, 120);
    EXPECT_EQ(steps[0].dy, -120);
    EXPECT_EQ(steps[1].dx, -120);
    EXPECT_EQ(steps[1].dy, 64);
}

}  // namespace
