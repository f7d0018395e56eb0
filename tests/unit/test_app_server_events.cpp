#include "../../src/internal/app_server_events.hpp"
#include "../../src/internal/stream_decoder.hpp"

#include <gtest/gtest.h>

using namespace agentbridge;
using namespace agentbridge::protocol;

TEST(AppServerEventsTest, ThreadStartedFromThreadObject)
{
    AppServerEventTranslator translator;
    auto events = translator.translate("thread/started", {{"thread", {{"id", "th-1"}}}});

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["type"], "thread.started");
    EXPECT_EQ(events[0]["thread_id"], "th-1");
    EXPECT_EQ(translator.thread_id(), "th-1");
}

TEST(AppServerEventsTest, ThreadStartedFromThreadId)
{
    AppServerEventTranslator translator;
    auto events = translator.translate("thread/started", {{"threadId", "th-2"}});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(translator.thread_id(), "th-2");

    EXPECT_TRUE(translator.translate("thread/started", json::object()).empty());
}

TEST(AppServerEventsTest, AgentDeltasFlushOnCompletion)
{
    AppServerEventTranslator translator;
    EXPECT_TRUE(translator.translate("item/started",
                                     {{"item", {{"id", "m1"}, {"type", "agentMessage"}}}})
                    .empty());
    EXPECT_TRUE(
        translator.translate("item/agentMessage/delta", {{"itemId", "m1"}, {"delta", "Hel"}})
            .empty());
    translator.translate("item/agentMessage/delta", {{"itemId", "m1"}, {"delta", "lo"}});

    auto events = translator.translate(
        "item/completed", {{"item", {{"id", "m1"}, {"type", "agentMessage"}, {"text", ""}}}});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["type"], "item.completed");
    EXPECT_EQ(events[0]["item"]["type"], "agent_message");
    EXPECT_EQ(events[0]["item"]["text"], "Hello");
}

TEST(AppServerEventsTest, CompletedTextWinsOverDeltas)
{
    AppServerEventTranslator translator;
    translator.translate("item/agentMessage/delta", {{"itemId", "m1"}, {"delta", "partial"}});
    auto events = translator.translate(
        "item/completed", {{"item", {{"id", "m1"}, {"type", "agentMessage"}, {"text", "Final"}}}});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["item"]["text"], "Final");
}

TEST(AppServerEventsTest, CommandExecutionLifecycle)
{
    AppServerEventTranslator translator;
    auto started = translator.translate(
        "item/started",
        {{"item",
          {{"id", "c1"}, {"type", "commandExecution"}, {"command", "ls"}, {"status", "inProgress"}}}});
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0]["type"], "item.started");
    EXPECT_EQ(started[0]["item"]["type"], "command_execution");
    EXPECT_EQ(started[0]["item"]["status"], "in_progress");
    EXPECT_FALSE(started[0]["item"].contains("exit_code"));

    auto completed = translator.translate("item/completed",
                                          {{"item",
                                            {{"id", "c1"},
                                             {"type", "commandExecution"},
                                             {"command", "ls"},
                                             {"status", "declined"},
                                             {"aggregatedOutput", ""},
                                             {"exitCode", nullptr}}}});
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0]["item"]["status"], "failed");
}

TEST(AppServerEventsTest, OtherItemKinds)
{
    AppServerEventTranslator translator;

    auto file = translator.translate(
        "item/completed",
        {{"item", {{"id", "f1"}, {"type", "fileChange"}, {"changes", json::array()}, {"status", "completed"}}}});
    ASSERT_EQ(file.size(), 1u);
    EXPECT_EQ(file[0]["item"]["type"], "file_change");

    auto mcp = translator.translate("item/started", {{"item",
                                                      {{"id", "x1"},
                                                       {"type", "mcpToolCall"},
                                                       {"tool", "search"},
                                                       {"arguments", {{"q", "a"}}}}}});
    ASSERT_EQ(mcp.size(), 1u);
    EXPECT_EQ(mcp[0]["item"]["tool"], "search");

    auto web = translator.translate(
        "item/completed", {{"item", {{"id", "w1"}, {"type", "webSearch"}, {"query", "cpp"}}}});
    ASSERT_EQ(web.size(), 1u);
    EXPECT_EQ(web[0]["item"]["status"], "completed");

    EXPECT_TRUE(translator
                    .translate("item/completed", {{"item", {{"id", "r1"}, {"type", "reasoning"}}}})
                    .empty());
    EXPECT_TRUE(translator.translate("item/completed", {{"item", "bogus"}}).empty());
}

TEST(AppServerEventsTest, TurnCompletedCarriesThreadAndUsage)
{
    AppServerEventTranslator translator;
    translator.translate("thread/started", {{"thread", {{"id", "th-1"}}}});

    auto events = translator.translate(
        "turn/completed",
        {{"turn", {{"status", "completed"}, {"usage", {{"input_tokens", 3}}}}}});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["type"], "turn.completed");
    EXPECT_EQ(events[0]["thread_id"], "th-1");
    EXPECT_EQ(events[0]["usage"]["input_tokens"], 3);
    EXPECT_TRUE(translator.turn_finished());
}

TEST(AppServerEventsTest, FailedAndInterruptedTurns)
{
    AppServerEventTranslator translator;
    auto failed = translator.translate(
        "turn/completed",
        {{"turn", {{"status", "failed"}, {"error", {{"message", "quota exceeded"}}}}}});
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]["type"], "turn.failed");
    EXPECT_EQ(failed[0]["error"]["message"], "quota exceeded");

    translator.reset();
    EXPECT_FALSE(translator.turn_finished());

    auto interrupted =
        translator.translate("turn/completed", {{"turn", {{"status", "interrupted"}}}});
    ASSERT_EQ(interrupted.size(), 1u);
    EXPECT_EQ(interrupted[0]["error"]["message"], "Turn interrupted");
}

TEST(AppServerEventsTest, RetriedErrorsAreIgnored)
{
    AppServerEventTranslator translator;
    EXPECT_TRUE(translator
                    .translate("error", {{"willRetry", true}, {"error", {{"message", "retrying"}}}})
                    .empty());
    EXPECT_FALSE(translator.turn_finished());

    auto fatal = translator.translate("error", {{"error", {{"message", "stream closed"}}}});
    ASSERT_EQ(fatal.size(), 1u);
    EXPECT_EQ(fatal[0]["error"]["message"], "stream closed");
    EXPECT_TRUE(translator.turn_finished());
}

TEST(AppServerEventsTest, UnknownMethodsProduceNothing)
{
    AppServerEventTranslator translator;
    EXPECT_TRUE(translator.translate("turn/started", json::object()).empty());
    EXPECT_TRUE(translator.translate("account/rateLimits/updated", json::object()).empty());
}

TEST(AppServerEventsTest, TranslatedEventsDecodeAsCodex)
{
    AppServerEventTranslator translator;
    StreamDecoder decoder(WireFormat::Codex, 1024 * 1024,
                          Logger([](LogLevel, const std::string&) {}));

    std::vector<Message> messages;
    auto pump = [&](const std::string& method, const json& params)
    {
        for (const auto& event : translator.translate(method, params))
            for (auto& message : decoder.feed_json(event))
                messages.push_back(std::move(message));
    };

    pump("thread/started", {{"thread", {{"id", "th-9"}}}});
    pump("item/started",
         {{"item", {{"id", "c1"}, {"type", "commandExecution"}, {"command", "make"}}}});
    pump("item/completed", {{"item",
                             {{"id", "c1"},
                              {"type", "commandExecution"},
                              {"command", "make"},
                              {"status", "completed"},
                              {"aggregatedOutput", "built"},
                              {"exitCode", 0}}}});
    pump("item/agentMessage/delta", {{"itemId", "m1"}, {"delta", "Done"}});
    pump("item/completed", {{"item", {{"id", "m1"}, {"type", "agentMessage"}}}});
    pump("turn/completed", {{"turn", {{"status", "completed"}}}});

    ASSERT_EQ(messages.size(), 5u);
    EXPECT_TRUE(is_init_message(messages[0]));
    EXPECT_TRUE(is_tool_call_message(messages[1]));
    ASSERT_TRUE(is_tool_result_message(messages[2]));
    EXPECT_FALSE(std::get<ToolResultMessage>(messages[2]).activity.is_error);
    EXPECT_TRUE(is_assistant_message(messages[3]));
    EXPECT_TRUE(is_result_message(messages[4]));

    EXPECT_EQ(decoder.text(), "Done");
    EXPECT_EQ(decoder.session_id().value_or(""), "th-9");
}
