#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/clock/clock.hpp"
#include "core/config/session_id.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/actuation_scheduler.hpp"
#include "dispatch/override_channel.hpp"
#include "perception/observation_feed.hpp"
#include "planner/planner_client.hpp"
#include "runtime/control_loop.hpp"
#include "session/memory_store.hpp"

namespace {

using vrc::core::clock::Duration;
using vrc::core::clock::ManualClock;
using vrc::core::clock::TimePoint;
using vrc::core::errors::AgentError;
using vrc::core::errors::ErrorCategory;
using vrc::core::errors::Result;
using vrc::dispatch::ActionDispatcher;
using vrc::dispatch::ActuationScheduler;
using vrc::dispatch::OverrideChannel;
using vrc::dispatch::OverrideEvent;
using vrc::dispatch::OverrideKind;
using vrc::osc::OscMessage;
using vrc::perception::ObservationFeed;
using vrc::perception::ObservationSource;
using vrc::planner::CancelToken;
using vrc::planner::PlanRequest;
using vrc::planner::PlannerBackend;
using vrc::planner::PlannerClient;
using vrc::planner::PlannerSettings;
using vrc::planner::StartOutcome;
using vrc::policy::ActionGuard;
using vrc::protocol::Action;
using vrc::protocol::ActionSource;
using vrc::protocol::ActionType;
using vrc::protocol::Intent;
using vrc::protocol::MemoryRecord;
using vrc::protocol::Observation;
using vrc::runtime::ControlLoop;
using vrc::runtime::InstinctGenerator;
using vrc::runtime::IntentCell;
using vrc::runtime::IntentGate;
using vrc::runtime::LoopSettings;
using vrc::runtime::PlanShaper;
using vrc::runtime::ShaperSettings;
using vrc::runtime::TriggerReason;
using vrc::session::MemoryStore;

using PollResult = Result<std::optional<Observation>>;

struct SourceScript {
    std::mutex mutex;
    std::deque<PollResult> polls;
};

class ScriptedSource : public ObservationSource {
public:
    explicit ScriptedSource(std::shared_ptr<SourceScript> script) : script_(std::move(script)) {}

    PollResult poll(TimePoint) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->polls.empty()) {
            return std::optional<Observation>{};
        }
        auto next = script_->polls.front();
        script_->polls.pop_front();
        return next;
    }

private:
    std::shared_ptr<SourceScript> script_;
};

struct BackendScript {
    std::mutex mutex;
    bool hold = false;
    int calls = 0;
    std::vector<Action> steps;
    std::vector<std::string> scenes;
    std::vector<std::size_t> long_term_sizes;
};

// Returns an Intent carrying the scripted steps; blocks while `hold` is set.
class ScriptedBackend : public PlannerBackend {
public:
    explicit ScriptedBackend(std::shared_ptr<BackendScript> script)
        : script_(std::move(script)) {}

    Result<Intent> plan(const PlanRequest& request, const CancelToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            ++script_->calls;
            script_->scenes.push_back(request.observation.scene);
            script_->long_term_sizes.push_back(request.long_term.size());
        }
        while (true) {
            {
                std::lock_guard<std::mutex> lock(script_->mutex);
                if (!script_->hold || cancel->load()) {
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        std::lock_guard<std::mutex> lock(script_->mutex);
        Intent intent;
        intent.goal = "explore";
        intent.speak = "hello there";
        intent.steps = script_->steps;
        return intent;
    }

    std::string name() const override { return "scripted"; }

private:
    std::shared_ptr<BackendScript> script_;
};

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

class ControlLoopTest : public ::testing::Test {
protected:
    ControlLoopTest()
        : clock_(TimePoint{} + std::chrono::seconds(1000)),
          feed_(std::make_unique<ScriptedSource>(source_), Duration(10000)),
          instinct_(vrc::core::config::InstinctConfig{}, 7) {
        scheduler_.start();
    }

    ~ControlLoopTest() override {
        if (planner_) {
            planner_->shutdown();
        }
        loop_.reset();
        scheduler_.shutdown();
    }

    void build(bool with_planner, LoopSettings settings = {}, PlanShaper* shaper = nullptr) {
        if (with_planner) {
            PlannerSettings planner_settings;
            planner_settings.retry_base = Duration(1);
            planner_ = std::make_unique<PlannerClient>(
                std::make_unique<ScriptedBackend>(backend_), intents_, clock_, planner_settings);
        }
        loop_ = std::make_unique<ControlLoop>(settings, clock_, feed_, gate_, intents_, instinct_,
                                              dispatcher_, overrides_, planner_.get(),
                                              memory_.get(), nullptr, shaper);
    }

    void observe(const std::string& scene, const std::string& heard = "") {
        Observation obs;
        obs.scene = scene;
        obs.heard = heard;
        std::lock_guard<std::mutex> lock(source_->mutex);
        source_->polls.push_back(std::optional<Observation>(obs));
    }

    void fail_capture() {
        std::lock_guard<std::mutex> lock(source_->mutex);
        source_->polls.push_back(
            AgentError{ErrorCategory::Capture, "gone", "observation_missing"});
    }

    void set_hold(bool hold) {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        backend_->hold = hold;
    }

    int planner_calls() {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        return backend_->calls;
    }

    void settle() { ASSERT_TRUE(planner_->wait_idle(std::chrono::milliseconds(2000))); }

    ManualClock clock_;
    std::shared_ptr<SourceScript> source_ = std::make_shared<SourceScript>();
    std::shared_ptr<BackendScript> backend_ = std::make_shared<BackendScript>();
    ObservationFeed feed_;
    IntentGate gate_;
    IntentCell intents_;
    InstinctGenerator instinct_;
    RecordingSink sink_;
    ActuationScheduler scheduler_{sink_};
    ActionDispatcher dispatcher_{ActionGuard{}, scheduler_};
    OverrideChannel overrides_;
    std::unique_ptr<MemoryStore> memory_;
    std::unique_ptr<PlannerClient> planner_;
    std::unique_ptr<ControlLoop> loop_;
};

TEST_F(ControlLoopTest, TickDoesNotWaitForSlowPlanner) {
    set_hold(true);
    build(true);
    observe("a rooftop bar with neon signs");

    const auto report = loop_->tick();
    ASSERT_TRUE(report.planner.has_value());
    EXPECT_EQ(report.planner.value(), StartOutcome::Started);
    EXPECT_EQ(report.gate.reason, TriggerReason::InitialScene);
    EXPECT_TRUE(planner_->in_flight());

    // The loop keeps ticking on instinct while the call is outstanding.
    for (int i = 0; i < 5; ++i) {
        clock_.advance(Duration(300));
        const auto next = loop_->tick();
        EXPECT_EQ(next.dispatched.count_from(ActionSource::Intent), 0u);
    }
    EXPECT_EQ(loop_->stats().ticks, 6u);

    set_hold(false);
    settle();
    EXPECT_EQ(intents_.generation(), 1u);
}

TEST_F(ControlLoopTest, UnchangedSceneWithoutPlannerStaysOnInstinct) {
    build(false);
    observe("a quiet lobby with a fountain");

    const auto first = loop_->tick();
    EXPECT_TRUE(first.gate.should_replan);
    for (int i = 0; i < 10; ++i) {
        clock_.advance(Duration(300));
        observe("a quiet lobby with a fountain");
        const auto report = loop_->tick();
        EXPECT_FALSE(report.gate.should_replan);
        EXPECT_EQ(report.dispatched.count_from(ActionSource::Intent), 0u);
        EXPECT_EQ(report.dispatched.count_from(ActionSource::Override), 0u);
    }
    EXPECT_EQ(loop_->stats().triggers, 1u);
}

TEST_F(ControlLoopTest, UnchangedSceneDoesNotReplanWhileIntentIsFresh) {
    build(true);
    observe("a quiet lobby with a fountain");
    static_cast<void>(loop_->tick());
    settle();

    for (int i = 0; i < 5; ++i) {
        clock_.advance(Duration(300));
        observe("a quiet lobby with a fountain");
        const auto report = loop_->tick();
        EXPECT_FALSE(report.planner.has_value());
    }
    EXPECT_EQ(planner_calls(), 1);
}

TEST_F(ControlLoopTest, TriggersDuringOutstandingCallCoalesce) {
    set_hold(true);
    build(true);
    observe("a rooftop bar with neon signs");
    static_cast<void>(loop_->tick());

    const std::vector<std::string> scenes = {
        "an underwater tunnel full of fish", "a snowy mountain cabin at night",
        "a crowded dance floor with lasers", "a quiet library with tall shelves"};
    for (const auto& scene : scenes) {
        clock_.advance(Duration(300));
        observe(scene);
        const auto report = loop_->tick();
        ASSERT_TRUE(report.planner.has_value());
        EXPECT_EQ(report.planner.value(), StartOutcome::InFlight);
    }
    EXPECT_EQ(loop_->stats().triggers_dropped, 4u);

    set_hold(false);
    settle();
    clock_.advance(Duration(300));
    const auto report = loop_->tick();
    ASSERT_TRUE(report.planner.has_value());
    EXPECT_EQ(report.planner.value(), StartOutcome::Started);
    settle();

    for (int i = 0; i < 3; ++i) {
        clock_.advance(Duration(300));
        static_cast<void>(loop_->tick());
    }
    EXPECT_EQ(planner_calls(), 2);
    std::lock_guard<std::mutex> lock(backend_->mutex);
    EXPECT_EQ(backend_->scenes.back(), "a quiet library with tall shelves");
}

TEST_F(ControlLoopTest, IntentStepsReachTheDispatcher) {
    backend_->steps = {look(40)};
    // Held so the Intent cannot land before the first tick's intent read.
    set_hold(true);
    build(true);
    observe("a rooftop bar with neon signs");
    const auto first = loop_->tick();
    EXPECT_EQ(first.dispatched.count_from(ActionSource::Intent), 0u);
    set_hold(false);
    settle();

    clock_.advance(Duration(300));
    const auto report = loop_->tick();
    ASSERT_EQ(report.dispatched.count_from(ActionSource::Intent), 1u);
    EXPECT_EQ(report.dispatched.items.front().action.dx, 40);
    EXPECT_GT(report.messages, 0u);
}

TEST_F(ControlLoopTest, PlanResultsFeedShortAndLongTermMemory) {
    const auto dir = std::filesystem::temp_directory_path() /
                     (".tmp_control_loop_" + vrc::core::config::generate_session_id());
    memory_ = std::make_unique<MemoryStore>(dir / "memory.jsonl");
    build(true);
    observe("a rooftop bar with neon signs", "hi there");
    static_cast<void>(loop_->tick());
    settle();

    const auto recent = loop_->short_term();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].scene, "a rooftop bar with neon signs");
    EXPECT_EQ(recent[0].heard, "hi there");
    EXPECT_EQ(recent[0].speak, "hello there");
    EXPECT_EQ(memory_->load_all().size(), 1u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_F(ControlLoopTest, CaptureFailureRaisesNoTrigger) {
    build(true);
    fail_capture();
    const auto first = loop_->tick();
    EXPECT_TRUE(first.capture_failed);
    EXPECT_FALSE(first.planner.has_value());

    clock_.advance(Duration(300));
    observe("a rooftop bar with neon signs");
    static_cast<void>(loop_->tick());
    settle();
    EXPECT_EQ(planner_calls(), 1);

    // Stale intent, but the failed capture suppresses the expiry trigger.
    clock_.advance(Duration(5000));
    fail_capture();
    const auto failed = loop_->tick();
    EXPECT_TRUE(failed.capture_failed);
    EXPECT_FALSE(failed.gate.should_replan);
    EXPECT_EQ(planner_calls(), 1);

    clock_.advance(Duration(300));
    const auto recovered = loop_->tick();
    EXPECT_EQ(recovered.gate.reason, TriggerReason::IntentExpired);
    settle();
    EXPECT_EQ(planner_calls(), 2);
    EXPECT_EQ(loop_->stats().capture_failures, 2u);
}

TEST_F(ControlLoopTest, SayOverrideIsRateLimited) {
    build(false);
    observe("a quiet lobby with a fountain");

    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "first"}));
    const auto first = loop_->tick();
    ASSERT_EQ(first.dispatched.count_from(ActionSource::Override), 1u);
    EXPECT_EQ(first.dispatched.items.front().action.text, "first");

    clock_.advance(Duration(300));
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "second"}));
    const auto limited = loop_->tick();
    EXPECT_EQ(limited.dispatched.count_from(ActionSource::Override), 0u);

    clock_.advance(Duration(800));
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, ""}));
    const auto described = loop_->tick();
    ASSERT_EQ(described.dispatched.count_from(ActionSource::Override), 1u);
    EXPECT_NE(described.dispatched.items.front().action.text.find("quiet lobby"),
              std::string::npos);

    EXPECT_EQ(loop_->stats().overrides, 2u);
    EXPECT_EQ(loop_->stats().overrides_rate_limited, 1u);
}

TEST_F(ControlLoopTest, StopOverrideEndsTheRun) {
    build(false);
    observe("a quiet lobby with a fountain");
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Stop, ""}));

    const auto report = loop_->tick();
    EXPECT_TRUE(report.stop);
    EXPECT_TRUE(report.dispatched.empty());
    EXPECT_TRUE(loop_->stop_requested());

    // run() returns at once when a stop is already pending.
    loop_->run(5);
    EXPECT_EQ(loop_->stats().ticks, 1u);
    EXPECT_TRUE(scheduler_.wait_idle(std::chrono::milliseconds(1000)));
    EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(ControlLoopTest, RunStopsOnRequestFromAnotherThread) {
    LoopSettings settings;
    settings.tick_interval = Duration(5);
    build(false, settings);

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        loop_->request_stop();
    });
    loop_->run();
    stopper.join();
    EXPECT_TRUE(loop_->stop_requested());
    EXPECT_GE(loop_->stats().ticks, 1u);
}

TEST_F(ControlLoopTest, RunHonoursTickBound) {
    LoopSettings settings;
    settings.tick_interval = Duration(1);
    build(false, settings);
    loop_->run(3);
    EXPECT_EQ(loop_->stats().ticks, 3u);
}

TEST_F(ControlLoopTest, ObserveOnlySendsNothing) {
    LoopSettings settings;
    settings.observe_only = true;
    build(false, settings);
    observe("a quiet lobby with a fountain");
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "hello"}));

    const auto report = loop_->tick();
    EXPECT_FALSE(report.dispatched.empty());
    EXPECT_EQ(report.messages, 0u);
    EXPECT_TRUE(scheduler_.wait_idle(std::chrono::milliseconds(500)));
    EXPECT_TRUE(sink_.sent().empty());
}

TEST_F(ControlLoopTest, DispatchFailureKeepsTheLoopTicking) {
    build(false);
    scheduler_.shutdown();

    observe("a quiet lobby with a fountain");
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "first"}));
    const auto first = loop_->tick();
    EXPECT_FALSE(first.dispatched.empty());
    EXPECT_TRUE(first.dispatch_failed);
    EXPECT_EQ(first.messages, 0u);

    clock_.advance(Duration(1000));
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "second"}));
    const auto second = loop_->tick();
    EXPECT_EQ(second.tick_id, 2u);
    EXPECT_TRUE(second.dispatch_failed);
    EXPECT_FALSE(second.stop);

    EXPECT_EQ(loop_->stats().ticks, 2u);
    EXPECT_EQ(loop_->stats().dispatch_failures, 2u);
    EXPECT_FALSE(loop_->stop_requested());
}

TEST_F(ControlLoopTest, InstinctFailureStillDispatchesIntentAndOverride) {
    vrc::core::config::InstinctConfig broken;
    broken.look_jitter_min_deg = 5.0;
    broken.look_jitter_max_deg = 1.0;
    InstinctGenerator failing(broken, 7);
    ControlLoop loop(LoopSettings{}, clock_, feed_, gate_, intents_, failing, dispatcher_,
                     overrides_, nullptr, nullptr, nullptr);

    Intent intent;
    intent.steps = {look(40)};
    intent.created_at = clock_.now();
    intent.ttl = Duration(5000);
    intents_.replace(intent);
    observe("a quiet lobby with a fountain");
    ASSERT_TRUE(overrides_.push(OverrideEvent{OverrideKind::Say, "hello"}));

    const auto report = loop.tick();
    EXPECT_EQ(loop.stats().instinct_failures, 1u);
    EXPECT_EQ(report.dispatched.count_from(ActionSource::Instinct), 0u);
    EXPECT_EQ(report.dispatched.count_from(ActionSource::Override), 1u);
    EXPECT_EQ(report.dispatched.count_from(ActionSource::Intent), 1u);
    EXPECT_FALSE(report.dispatch_failed);
    EXPECT_GT(report.messages, 0u);
}

TEST_F(ControlLoopTest, LongTermMemoryIsLookedUpByThePlanner) {
    const auto dir = std::filesystem::temp_directory_path() /
                     (".tmp_control_loop_" + vrc::core::config::generate_session_id());
    memory_ = std::make_unique<MemoryStore>(dir / "memory.jsonl");
    MemoryRecord past;
    past.scene = "a rooftop bar with neon signs";
    past.speak = "love the neon";
    ASSERT_FALSE(vrc::core::errors::is_error(memory_->append(past)));

    build(true);
    observe("a rooftop bar with neon signs");
    const auto report = loop_->tick();
    ASSERT_TRUE(report.planner.has_value());
    settle();

    {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ASSERT_EQ(backend_->long_term_sizes.size(), 1u);
        EXPECT_EQ(backend_->long_term_sizes[0], 1u);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_F(ControlLoopTest, ShaperRepliesToHeardLineBeforePublish) {
    ShaperSettings settings;
    settings.auto_chat = false;
    PlanShaper shaper(clock_, settings, 3);
    backend_->steps = {look(40)};
    build(true, LoopSettings{}, &shaper);

    observe("a quiet lobby with a fountain", "is anyone there");
    static_cast<void>(loop_->tick());
    settle();

    const auto published = intents_.load();
    ASSERT_NE(published, nullptr);
    ASSERT_EQ(published->steps.size(), 2u);
    EXPECT_EQ(published->steps.back().type, ActionType::Chat);
    EXPECT_NE(published->steps.back().text.find("is anyone there"), std::string::npos);
}

}  // namespace
