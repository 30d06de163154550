#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "dispatch/action_dispatcher.hpp"

namespace {

using vrc::core::errors::Result;
using vrc::core::errors::get_error;
using vrc::core::errors::get_value;
using vrc::core::errors::is_error;
using vrc::dispatch::ActionDispatcher;
using vrc::dispatch::ActuationScheduler;
using vrc::osc::OscMessage;
using vrc::policy::ActionGuard;
using vrc::protocol::Action;
using vrc::protocol::ActionSource;
using vrc::protocol::ActionType;
using vrc::protocol::InstinctAction;
using vrc::protocol::Intent;
using vrc::protocol::MoveDirection;

class RecordingSink : public vrc::osc::OscSink {
public:
    Result<std::size_t> send(const OscMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
        return static_cast<std::size_t>(16);
    }

    std::vector<OscMessage> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<OscMessage> sent_;
};

Action look(int dx) {
    Action a;
    a.type = ActionType::Look;
    a.dx = dx;
    return a;
}

Action move(MoveDirection direction) {
    Action a;
    a.type = ActionType::Move;
    a.direction = direction;
    a.seconds = 0.2;
    return a;
}

Action chat(const std::string& text) {
    Action a;
    a.type = ActionType::Chat;
    a.text = text;
    return a;
}

Action wait_for(double seconds) {
    Action a;
    a.type = ActionType::Wait;
    a.seconds = seconds;
    return a;
}

InstinctAction instinct(std::initializer_list<Action> actions) {
    InstinctAction out;
    out.actions = actions;
    return out;
}

class ActionDispatcherTest : public ::testing::Test {
protected:
    RecordingSink sink_;
    ActuationScheduler scheduler_{sink_};
    ActionDispatcher dispatcher_{ActionGuard{}, scheduler_};
};

TEST_F(ActionDispatcherTest, InstinctOnlyPassesThrough) {
    const auto out = dispatcher_.compose(1, instinct({look(10), move(MoveDirection::Left)}),
                                         nullptr, {});
    EXPECT_EQ(out.tick_id, 1u);
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.primary_source(), ActionSource::Instinct);
}

TEST_F(ActionDispatcherTest, IntentWinsSharedActuator) {
    Intent intent;
    intent.generation = 1;
    intent.steps = {look(60)};

    const auto out = dispatcher_.compose(1, instinct({look(10), move(MoveDirection::Left)}),
                                         &intent, {});
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.items[0].source, ActionSource::Intent);
    EXPECT_EQ(out.items[0].action.dx, 60);
    EXPECT_EQ(out.items[1].source, ActionSource::Instinct);
    EXPECT_EQ(out.items[1].action.type, ActionType::Move);
    EXPECT_EQ(dispatcher_.stats().instinct_dropped, 1u);
}

TEST_F(ActionDispatcherTest, WaitsNeverConflict) {
    Intent intent;
    intent.generation = 1;
    intent.steps = {wait_for(0.5)};
    const auto out = dispatcher_.compose(1, instinct({wait_for(0.1), look(5)}), &intent, {});
    ASSERT_EQ(out.items.size(), 3u);
    EXPECT_EQ(dispatcher_.stats().instinct_dropped, 0u);
}

TEST_F(ActionDispatcherTest, IntentStepsAdvanceOnePerTick) {
    Intent intent;
    intent.generation = 4;
    intent.steps = {chat("hello"), move(MoveDirection::Forward)};

    auto first = dispatcher_.compose(1, instinct({}), &intent, {});
    ASSERT_EQ(first.items.size(), 1u);
    EXPECT_EQ(first.items[0].action.type, ActionType::Chat);

    auto second = dispatcher_.compose(2, instinct({}), &intent, {});
    ASSERT_EQ(second.items.size(), 1u);
    EXPECT_EQ(second.items[0].action.type, ActionType::Move);

    auto third = dispatcher_.compose(3, instinct({look(3)}), &intent, {});
    ASSERT_EQ(third.items.size(), 1u);
    EXPECT_EQ(third.items[0].source, ActionSource::Instinct);

    // A new generation restarts at its first step.
    Intent next = intent;
    next.generation = 5;
    auto fourth = dispatcher_.compose(4, instinct({}), &next, {});
    ASSERT_EQ(fourth.items.size(), 1u);
    EXPECT_EQ(fourth.items[0].action.type, ActionType::Chat);
}

TEST_F(ActionDispatcherTest, OverrideOutranksIntentAndDefersIt) {
    Intent intent;
    intent.generation = 1;
    intent.steps = {chat("from plan"), look(30)};

    auto out = dispatcher_.compose(1, instinct({look(5)}), &intent, {chat("manual")});
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.items[0].source, ActionSource::Override);
    EXPECT_EQ(out.items[0].action.text, "manual");
    EXPECT_EQ(out.items[1].source, ActionSource::Instinct);
    EXPECT_EQ(out.primary_source(), ActionSource::Override);
    EXPECT_EQ(dispatcher_.stats().intent_deferred, 1u);

    // The deferred chat step plays on the next tick.
    auto next = dispatcher_.compose(2, instinct({}), &intent, {});
    ASSERT_EQ(next.items.size(), 1u);
    EXPECT_EQ(next.items[0].action.text, "from plan");
}

TEST_F(ActionDispatcherTest, OrderIsOverrideIntentInstinctAndCapped) {
    Intent intent;
    intent.generation = 1;
    intent.steps = {move(MoveDirection::Right)};
    std::vector<Action> overrides;
    for (int i = 0; i < 7; ++i) {
        overrides.push_back(wait_for(0.01));
    }
    auto out = dispatcher_.compose(1, instinct({look(4), wait_for(0.1)}), &intent, overrides);
    ASSERT_EQ(out.items.size(), 8u);
    EXPECT_EQ(out.items[6].source, ActionSource::Override);
    EXPECT_EQ(out.items[7].source, ActionSource::Intent);
}

TEST_F(ActionDispatcherTest, DispatchFailsWhenSchedulerStopped) {
    const auto out = dispatcher_.compose(1, instinct({look(40)}), nullptr, {});
    auto result = dispatcher_.dispatch(out);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, vrc::core::errors::ErrorCategory::Dispatch);
    EXPECT_EQ(get_error(result).code, "scheduler_stopped");
    EXPECT_EQ(dispatcher_.stats().failed, 1u);
}

TEST_F(ActionDispatcherTest, DispatchSendsGuardedTimeline) {
    scheduler_.start();
    const auto out = dispatcher_.compose(1, instinct({look(40)}), nullptr, {chat("  hi\nall ")});
    auto result = dispatcher_.dispatch(out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 3u);
    ASSERT_TRUE(scheduler_.wait_idle(std::chrono::milliseconds(2000)));

    const auto sent = sink_.sent();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].address, "/chatbox/input");
    EXPECT_EQ(std::get<std::string>(sent[0].arguments[0]), "hi all");
    EXPECT_EQ(sent[1].address, "/input/LookHorizontal");
    scheduler_.shutdown();
}

TEST_F(ActionDispatcherTest, RejectedItemsAreCountedButRestDispatches) {
    scheduler_.start();
    const auto out = dispatcher_.compose(1, instinct({}), nullptr, {chat("see https://x.y")});
    auto result = dispatcher_.dispatch(out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0u);
    EXPECT_EQ(dispatcher_.stats().rejected, 1u);
    scheduler_.shutdown();
}

}  // namespace
