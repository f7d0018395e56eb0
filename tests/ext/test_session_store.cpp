/**
 * @file test_session_store.cpp
 * @brief Tests for agentbridge::ext session stores
 */

#include "../test_utils.hpp"

#include <agentbridge/errors.hpp>
#include <agentbridge/ext/session_store.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace agentbridge;
using namespace agentbridge::ext;

// ============================================================================
// InMemorySessionStore
// ============================================================================

TEST(InMemorySessionStoreTest, UnknownOwnerIsEmpty)
{
    InMemorySessionStore store;
    EXPECT_FALSE(store.read_latest("chat-1").has_value());
}

TEST(InMemorySessionStoreTest, LatestWriteWins)
{
    InMemorySessionStore store;
    store.write("chat-1", "s-1", "plan");
    store.write("chat-1", "s-2", "default");
    store.write("chat-2", "s-9", "");

    auto latest = store.read_latest("chat-1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "s-2");
    EXPECT_EQ(latest->mode, "default");

    auto other = store.read_latest("chat-2");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->id, "s-9");
    EXPECT_EQ(other->mode, "");
}

TEST(InMemorySessionStoreTest, ConcurrentWriters)
{
    InMemorySessionStore store;
    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i)
    {
        writers.emplace_back(
            [&store, i]()
            {
                for (int j = 0; j < 100; ++j)
                    store.write("owner-" + std::to_string(i), "s-" + std::to_string(j), "m");
            });
    }
    for (auto& writer : writers)
        writer.join();

    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(store.read_latest("owner-" + std::to_string(i))->id, "s-99");
}

// ============================================================================
// JsonFileSessionStore
// ============================================================================

TEST(JsonFileSessionStoreTest, MissingFileReadsAsEmpty)
{
    test::TempDir dir;
    JsonFileSessionStore store(dir.file("sessions.json"));
    EXPECT_FALSE(store.read_latest("chat-1").has_value());
    EXPECT_FALSE(fs::exists(dir.file("sessions.json")));
}

TEST(JsonFileSessionStoreTest, PersistsAcrossInstances)
{
    test::TempDir dir;
    std::string path = (dir.path() / "nested" / "sessions.json").string();

    {
        JsonFileSessionStore store(path);
        store.write("chat-1", "123e4567-e89b-12d3-a456-426614174000", "plan");
        store.write("chat-2", "th-7", "never");
    }

    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    JsonFileSessionStore reopened(path);
    auto latest = reopened.read_latest("chat-1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(latest->mode, "plan");
    EXPECT_EQ(reopened.read_latest("chat-2")->mode, "never");
    EXPECT_EQ(reopened.path(), path);
}

TEST(JsonFileSessionStoreTest, FileLayout)
{
    test::TempDir dir;
    std::string path = dir.file("sessions.json");
    JsonFileSessionStore store(path);
    store.write("chat-1", "s-1", "default");

    std::ifstream file(path);
    nlohmann::json data = nlohmann::json::parse(file);
    EXPECT_EQ(data["sessions"]["chat-1"]["id"], "s-1");
    EXPECT_EQ(data["sessions"]["chat-1"]["mode"], "default");
}

TEST(JsonFileSessionStoreTest, SkipsMalformedEntries)
{
    test::TempDir dir;
    std::string path = dir.write_file("sessions.json", R"({
  "sessions": {
    "good": {"id": "s-1", "mode": "plan"},
    "no-id": {"mode": "plan"},
    "not-an-object": "s-2"
  }
})");

    JsonFileSessionStore store(path);
    EXPECT_TRUE(store.read_latest("good").has_value());
    EXPECT_FALSE(store.read_latest("no-id").has_value());
    EXPECT_FALSE(store.read_latest("not-an-object").has_value());
}

TEST(JsonFileSessionStoreTest, UnexpectedShapeReadsAsEmpty)
{
    test::TempDir dir;
    std::string path = dir.write_file("sessions.json", R"({"version": 1})");
    JsonFileSessionStore store(path);
    EXPECT_FALSE(store.read_latest("chat-1").has_value());
}

TEST(JsonFileSessionStoreTest, CorruptFileThrows)
{
    test::TempDir dir;
    std::string path = dir.write_file("sessions.json", "{not json");
    EXPECT_THROW(JsonFileSessionStore store(path), JSONDecodeError);

    // The corrupt file is left for inspection
    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "{not json");
}

TEST(JsonFileSessionStoreTest, UsableThroughBaseClass)
{
    test::TempDir dir;
    std::unique_ptr<SessionStore> store =
        std::make_unique<JsonFileSessionStore>(dir.file("sessions.json"));
    store->write("chat-1", "s-1", "plan");
    EXPECT_EQ(store->read_latest("chat-1")->id, "s-1");
}
