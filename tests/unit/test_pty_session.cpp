#include "../test_utils.hpp"

#include <agentbridge/errors.hpp>
#include <agentbridge/pty.hpp>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace agentbridge;
using namespace std::chrono_literals;

namespace
{

// Line-oriented agent speaking the Codex event shape on its terminal
const char* ECHO_AGENT = R"(printf '%s\n' '{"type":"session_start","session_id":"sess-1"}'
while IFS= read -r line; do
  case "$line" in
    /exit) exit 0 ;;
    quit) exit 0 ;;
    slow) sleep 30 ;;
    fail) printf '%s\n' '{"type":"error","message":"model overloaded"}' ;;
    *) printf '%s\n' "{\"type\":\"message\",\"content\":\"echo: $line\"}"
       printf '%s\n' '{"type":"done"}' ;;
  esac
done
)";

Logger quiet()
{
    return Logger([](LogLevel, const std::string&) {});
}

PTYSessionConfig stub_config(const std::string& command)
{
    PTYSessionConfig config;
    config.command = command;
    config.poll_interval = 20ms;
    config.startup_timeout = 5s;
    config.startup_flush = 100ms;
    config.stop_grace = 300ms;
    config.inactivity_timeout = 300ms;
    return config;
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds limit = 5s)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

} // namespace

// ============================================================================
// State machine
// ============================================================================

TEST(SessionStateTest, Transitions)
{
    EXPECT_TRUE(is_valid_transition(SessionState::Starting, SessionState::Idle));
    EXPECT_TRUE(is_valid_transition(SessionState::Idle, SessionState::Busy));
    EXPECT_TRUE(is_valid_transition(SessionState::Busy, SessionState::Idle));
    EXPECT_TRUE(is_valid_transition(SessionState::Stopping, SessionState::Stopped));
    EXPECT_TRUE(is_valid_transition(SessionState::Busy, SessionState::Error));
    EXPECT_TRUE(is_valid_transition(SessionState::Idle, SessionState::Stopping));

    EXPECT_FALSE(is_valid_transition(SessionState::Starting, SessionState::Busy));
    EXPECT_FALSE(is_valid_transition(SessionState::Stopped, SessionState::Idle));
    EXPECT_FALSE(is_valid_transition(SessionState::Idle, SessionState::Stopped));
    EXPECT_FALSE(is_valid_transition(SessionState::Error, SessionState::Idle));
}

TEST(SessionStateTest, Names)
{
    EXPECT_STREQ(to_string(SessionState::Starting), "starting");
    EXPECT_STREQ(to_string(SessionState::Idle), "idle");
    EXPECT_STREQ(to_string(SessionState::Busy), "busy");
    EXPECT_STREQ(to_string(SessionState::Stopping), "stopping");
    EXPECT_STREQ(to_string(SessionState::Stopped), "stopped");
    EXPECT_STREQ(to_string(SessionState::Error), "error");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(PTYSessionTest, StartsOnFirstEvent)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    EXPECT_EQ(session.state(), SessionState::Starting);

    session.start();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_TRUE(session.is_alive());
    EXPECT_GT(session.pid(), 0);
    EXPECT_EQ(session.external_session_id().value_or(""), "sess-1");

    SessionInfo info = session.info();
    EXPECT_EQ(info.key, "chat-1");
    EXPECT_EQ(info.state, SessionState::Idle);
    EXPECT_TRUE(info.alive);
    EXPECT_EQ(info.pid, session.pid());

    session.terminate();
    EXPECT_EQ(session.state(), SessionState::Stopped);
    EXPECT_FALSE(session.is_alive());
}

TEST(PTYSessionTest, StartsOnPrompt)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("shell", "printf 'ready> '\nexec cat\n"));
    PTYSession session("shell", config, quiet());
    session.start();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_FALSE(session.external_session_id().has_value());
    session.terminate();
}

TEST(PTYSessionTest, StartTwiceIsRejected)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();
    EXPECT_THROW(session.start(), InvalidSessionStateError);
    session.terminate();
}

TEST(PTYSessionTest, EarlyExitFailsStart)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", "echo boom\nexit 3\n")),
                       quiet());

    try
    {
        session.start();
        FAIL() << "expected SessionStartError";
    }
    catch (const SessionStartError& e)
    {
        EXPECT_NE(std::string(e.what()).find("exited during startup"), std::string::npos);
    }
    EXPECT_EQ(session.state(), SessionState::Error);
}

TEST(PTYSessionTest, SilentProcessTimesOutAtStartup)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", "sleep 30\n"));
    config.startup_timeout = 300ms;

    PTYSession session("chat-1", config, quiet());
    EXPECT_THROW(session.start(), SessionStartError);
    EXPECT_EQ(session.state(), SessionState::Error);
    EXPECT_FALSE(session.is_alive());
}

TEST(PTYSessionTest, MissingCommandFailsStart)
{
    PTYSessionConfig config = stub_config("/nonexistent/agentbridge/agent");
    PTYSession session("chat-1", config, quiet());
    EXPECT_THROW(session.start(), SessionStartError);
    EXPECT_EQ(session.state(), SessionState::Error);
}

// ============================================================================
// Turns
// ============================================================================

TEST(PTYSessionTest, SendCollectsTheResponse)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();

    std::vector<std::string> seen;
    auto result = session.send("hello", [&seen](const Message& msg)
                               { seen.push_back(message_type_name(msg)); });

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.text, "echo: hello");
    EXPECT_EQ(result.external_session_id.value_or(""), "sess-1");
    EXPECT_EQ(seen, (std::vector<std::string>{"assistant", "result"}));
    EXPECT_EQ(session.state(), SessionState::Idle);

    auto second = session.send("again");
    EXPECT_TRUE(second.success);
    EXPECT_EQ(second.text, "echo: again");

    session.terminate();
}

TEST(PTYSessionTest, PlainOutputEndsOnInactivity)
{
    test::TempDir dir;
    PTYSession session("shell", stub_config(dir.write_script("shell", "printf 'ready> '\nexec cat\n")),
                       quiet());
    session.start();

    auto result = session.send("plain words");
    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.text, "plain words");
    EXPECT_EQ(session.state(), SessionState::Idle);
    session.terminate();
}

TEST(PTYSessionTest, ErrorEventKeepsSessionUsable)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();

    auto failed = session.send("fail");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error.value_or(""), "model overloaded");
    EXPECT_EQ(session.state(), SessionState::Idle);

    EXPECT_TRUE(session.send("ok").success);
    session.terminate();
}

TEST(PTYSessionTest, SendBeforeStartIsRejected)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    EXPECT_THROW(session.send("hello"), InvalidSessionStateError);
}

TEST(PTYSessionTest, ConcurrentSendIsRejected)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();

    ExecutionResult slow;
    std::thread runner([&]() { slow = session.send("slow"); });
    ASSERT_TRUE(wait_until([&session]() { return session.state() == SessionState::Busy; }));

    EXPECT_THROW(session.send("hello"), InvalidSessionStateError);

    EXPECT_TRUE(session.interrupt());
    runner.join();
    EXPECT_TRUE(slow.was_cancelled);
    EXPECT_FALSE(slow.success);
    EXPECT_EQ(slow.error.value_or(""), "Cancelled");
    session.terminate();
}

TEST(PTYSessionTest, TurnTimeoutLeavesSessionInError)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();

    auto result = session.send("slow", nullptr, 300ms);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("timed out"), std::string::npos);
    EXPECT_EQ(session.state(), SessionState::Error);

    session.terminate();
    EXPECT_EQ(session.state(), SessionState::Stopped);
    EXPECT_FALSE(session.is_alive());
}

TEST(PTYSessionTest, ProcessDeathIsReported)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();

    auto result = session.send("quit");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Session process terminated unexpectedly");
    EXPECT_EQ(session.state(), SessionState::Error);
    EXPECT_FALSE(session.is_alive());
}

TEST(PTYSessionTest, InterruptWhenDeadReturnsFalse)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    EXPECT_FALSE(session.interrupt());
}

TEST(PTYSessionTest, ResizeUpdatesConfig)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();
    session.resize(30, 100);
    EXPECT_EQ(session.config().rows, 30);
    EXPECT_EQ(session.config().cols, 100);
    session.terminate();
}

TEST(PTYSessionTest, TerminateIsIdempotent)
{
    test::TempDir dir;
    PTYSession session("chat-1", stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());
    session.start();
    session.terminate();
    EXPECT_NO_THROW(session.terminate());
    EXPECT_EQ(session.state(), SessionState::Stopped);
}

TEST(PTYSessionTest, ConcurrentTerminateIsSafe)
{
    test::TempDir dir;
    std::string script = dir.write_script(
        "agent", "trap '' INT TERM\nprintf '%s\\n' '{\"type\":\"session_start\"}'\n"
                 "while true; do sleep 1; done\n");
    PTYSession session("contended", stub_config(script), quiet());
    session.start();

    std::atomic<int> failures{0};
    auto stop = [&session, &failures]()
    {
        try
        {
            session.terminate();
        }
        catch (const std::exception&)
        {
            ++failures;
        }
    };
    std::thread first(stop);
    std::thread second(stop);
    first.join();
    second.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(session.state(), SessionState::Stopped);
    EXPECT_FALSE(session.is_alive());
}

TEST(PTYSessionTest, TerminateEscalatesPastIgnoredExitCommand)
{
    test::TempDir dir;
    std::string script = dir.write_script(
        "agent", "trap '' INT\nprintf '%s\\n' '{\"type\":\"session_start\"}'\nwhile true; do sleep 1; done\n");
    PTYSession session("stubborn", stub_config(script), quiet());
    session.start();

    auto started = std::chrono::steady_clock::now();
    session.terminate();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(session.state(), SessionState::Stopped);
    EXPECT_FALSE(session.is_alive());
}
