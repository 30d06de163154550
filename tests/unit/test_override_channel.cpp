#include <string>
#include <gtest/gtest.h>
#include "dispatch/override_channel.hpp"

namespace {

using vrc::dispatch::OverrideChannel;
using vrc::dispatch::OverrideEvent;
using vrc::dispatch::OverrideKind;
using vrc::dispatch::build_utterance;
using vrc::dispatch::parse_override_command;
using vrc::protocol::Observation;

TEST(OverrideChannelTest, ParsesCommands) {
    auto say = parse_override_command("  say   hello world ");
    ASSERT_TRUE(say.has_value());
    EXPECT_EQ(say->kind, OverrideKind::Say);
    EXPECT_EQ(say->text, "hello world");

    auto bare = parse_override_command("SAY");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->kind, OverrideKind::Say);
    EXPECT_TRUE(bare->text.empty());

    auto stop = parse_override_command("stop");
    ASSERT_TRUE(stop.has_value());
    EXPECT_EQ(stop->kind, OverrideKind::Stop);
    EXPECT_EQ(parse_override_command("quit")->kind, OverrideKind::Stop);

    EXPECT_FALSE(parse_override_command("").has_value());
    EXPECT_FALSE(parse_override_command("dance").has_value());
}

TEST(OverrideChannelTest, DrainsInOrder) {
    OverrideChannel channel;
    EXPECT_TRUE(channel.push(OverrideEvent{OverrideKind::Say, "one"}));
    EXPECT_TRUE(channel.push(OverrideEvent{OverrideKind::Say, "two"}));
    const auto events = channel.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].text, "one");
    EXPECT_EQ(events[1].text, "two");
    EXPECT_TRUE(channel.drain().empty());
    EXPECT_FALSE(channel.stop_requested());
}

TEST(OverrideChannelTest, FullChannelDropsSayButNeverStop) {
    OverrideChannel channel(1);
    EXPECT_TRUE(channel.push(OverrideEvent{OverrideKind::Say, "one"}));
    EXPECT_FALSE(channel.push(OverrideEvent{OverrideKind::Say, "two"}));
    EXPECT_TRUE(channel.push(OverrideEvent{OverrideKind::Stop, ""}));
    EXPECT_TRUE(channel.stop_requested());
    EXPECT_EQ(channel.drain().size(), 2u);
    EXPECT_TRUE(channel.stop_requested());
}

TEST(OverrideChannelTest, UtterancePrefersHeardText) {
    Observation obs;
    obs.scene = "a plaza";
    obs.heard = "hello\nanyone";
    EXPECT_EQ(build_utterance(obs), "I heard: hello anyone - I'm here.");
}

TEST(OverrideChannelTest, UtteranceFromSceneStripsMarkup) {
    Observation obs;
    obs.scene = "### Scene\n**Two avatars** near a `fountain`";
    EXPECT_EQ(build_utterance(obs), "Hanging out here, looking at Scene Two avatars near a fountain.");

    Observation long_scene;
    long_scene.scene = std::string(200, 'x');
    const auto line = build_utterance(long_scene);
    EXPECT_EQ(line.size(), std::string("Hanging out here, looking at .").size() + 78);

    EXPECT_TRUE(build_utterance(Observation{}).empty());
}

}  // namespace
