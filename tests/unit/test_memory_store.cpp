#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/memory_record.hpp"
#include "session/memory_store.hpp"

namespace {

using vrc::core::errors::get_value;
using vrc::core::errors::is_error;
using vrc::protocol::MemoryRecord;
using vrc::session::MemoryStore;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_memory_store_" + vrc::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

MemoryRecord make_record(const std::string& scene, const std::string& heard = "",
                         const std::string& speak = "") {
    MemoryRecord record;
    record.timestamp = "2026-01-01T00:00:00";
    record.scene = scene;
    record.heard = heard;
    record.speak = speak;
    record.actions = "look(10,0)";
    return record;
}

TEST(MemoryStoreTest, TokenizesWordsAndCjkRuns) {
    const auto tokens = MemoryStore::tokenize("Hello, World_2! \xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96\xE7\x95\x8C");
    EXPECT_EQ(tokens.count("hello"), 1u);
    EXPECT_EQ(tokens.count("world_2"), 1u);
    // Four CJK characters split into a three-character run and a one-character run.
    EXPECT_EQ(tokens.count("\xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96"), 1u);
    EXPECT_EQ(tokens.count("\xE7\x95\x8C"), 1u);
    EXPECT_EQ(tokens.size(), 4u);
}

TEST(MemoryStoreTest, OverlapScoreIsShareOfQueryTokens) {
    const auto query = MemoryStore::tokenize("red door plaza");
    EXPECT_DOUBLE_EQ(MemoryStore::overlap_score(query, MemoryStore::tokenize("a red door")),
                     2.0 / 3.0);
    EXPECT_DOUBLE_EQ(MemoryStore::overlap_score(query, {}), 0.0);
    EXPECT_DOUBLE_EQ(MemoryStore::overlap_score({}, query), 0.0);
}

TEST(MemoryStoreTest, MissingFileRetrievesNothing) {
    TempWorkspace workspace;
    MemoryStore store(workspace.root() / "absent.jsonl");
    EXPECT_TRUE(store.load_all().empty());
    EXPECT_TRUE(store.retrieve("anything").empty());
}

TEST(MemoryStoreTest, AppendCreatesParentDirectory) {
    TempWorkspace workspace;
    MemoryStore store(workspace.root() / "nested" / "memory.jsonl");

    const auto appended = store.append(make_record("a quiet lobby"));
    ASSERT_FALSE(is_error(appended));
    EXPECT_EQ(get_value(appended), 1u);

    const auto records = store.load_all();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].scene, "a quiet lobby");
    EXPECT_EQ(records[0].actions, "look(10,0)");
}

TEST(MemoryStoreTest, RetrievePrefersOverlapOverRecency) {
    TempWorkspace workspace;
    MemoryStore store(workspace.root() / "memory.jsonl");
    ASSERT_FALSE(is_error(store.append(make_record("a mirror room with dancers"))));
    ASSERT_FALSE(is_error(store.append(make_record("a quiet lobby"))));
    ASSERT_FALSE(is_error(store.append(make_record("a forest", "", "nice trees"))));

    const auto hits = store.retrieve("dancers near the mirror", 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].scene, "a mirror room with dancers");
    // No overlap left: recency orders the rest.
    EXPECT_EQ(hits[1].scene, "a forest");
}

TEST(MemoryStoreTest, SkipsUnreadableLines) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "memory.jsonl";
    {
        std::ofstream out(path);
        out << "{\"scene\": \"a plaza\"}\n";
        out << "not json\n";
        out << "\n";
        out << "[1, 2]\n";
        out << "{\"scene\": 5, \"heard\": \"hi\"}\n";
    }
    MemoryStore store(path);
    const auto records = store.load_all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].scene, "a plaza");
    EXPECT_TRUE(records[1].scene.empty());
    EXPECT_EQ(records[1].heard, "hi");
}

TEST(MemoryStoreTest, TruncatesToNewestRecords) {
    TempWorkspace workspace;
    // Capacities below ten are raised to ten.
    MemoryStore store(workspace.root() / "memory.jsonl", 3);
    for (int i = 0; i < 14; ++i) {
        const auto appended = store.append(make_record("scene " + std::to_string(i)));
        ASSERT_FALSE(is_error(appended));
    }
    const auto records = store.load_all();
    ASSERT_EQ(records.size(), 10u);
    EXPECT_EQ(records.front().scene, "scene 4");
    EXPECT_EQ(records.back().scene, "scene 13");
}

}  // namespace
