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

const char* ECHO_AGENT = R"(printf '%s\n' '{"type":"session_start","session_id":"sess-1"}'
while IFS= read -r line; do
  case "$line" in
    /exit) exit 0 ;;
    quit) exit 0 ;;
    slow) sleep 30 ;;
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
    config.startup_flush = 50ms;
    config.stop_grace = 300ms;
    config.inactivity_timeout = 300ms;
    return config;
}

// Pool whose factory counts the sessions it builds
struct CountingPool
{
    explicit CountingPool(PoolConfig config = {})
        : pool(config,
               [this](const std::string& key, const PTYSessionConfig& session_config)
               {
                   ++created;
                   return std::make_shared<PTYSession>(key, session_config, quiet());
               },
               quiet())
    {
    }

    std::atomic<int> created{0};
    PTYPool pool;
};

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

ExecutionRequest make_request(const std::string& id, const std::string& owner,
                              const std::string& prompt)
{
    ExecutionRequest request;
    request.prompt = prompt;
    request.execution_id = id;
    request.owner_key = owner;
    return request;
}

} // namespace

// ============================================================================
// PTYPool
// ============================================================================

TEST(PTYPoolTest, ReusesLiveSession)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    CountingPool counting;

    auto first = counting.pool.get_or_create("chat-1", config);
    auto second = counting.pool.get_or_create("chat-1", config);
    EXPECT_EQ(first, second);
    EXPECT_EQ(counting.created.load(), 1);
    EXPECT_EQ(counting.pool.count(), 1u);
    EXPECT_EQ(counting.pool.get("chat-1"), first);
    EXPECT_EQ(counting.pool.get("chat-2"), nullptr);
}

TEST(PTYPoolTest, SendRoutesThroughSession)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    CountingPool counting;

    auto result = counting.pool.send("chat-1", "hi", config);
    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.text, "echo: hi");

    auto again = counting.pool.send("chat-1", "there", config);
    EXPECT_EQ(again.text, "echo: there");
    EXPECT_EQ(counting.created.load(), 1);
}

TEST(PTYPoolTest, EvictsLeastRecentlyActiveIdleSession)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    PoolConfig pool_config;
    pool_config.max_sessions = 2;
    CountingPool counting(pool_config);

    auto a = counting.pool.get_or_create("a", config);
    std::this_thread::sleep_for(20ms);
    auto b = counting.pool.get_or_create("b", config);
    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(a->send("touch").success);

    counting.pool.get_or_create("c", config);

    EXPECT_EQ(counting.pool.keys(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(b->state(), SessionState::Stopped);
    EXPECT_EQ(a->state(), SessionState::Idle);
}

TEST(PTYPoolTest, ExhaustedWhenNothingIsIdle)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    PoolConfig pool_config;
    pool_config.max_sessions = 1;
    CountingPool counting(pool_config);

    auto busy = counting.pool.get_or_create("a", config);
    ExecutionResult slow;
    std::thread runner([&]() { slow = busy->send("slow"); });
    ASSERT_TRUE(wait_until([&busy]() { return busy->state() == SessionState::Busy; }));

    try
    {
        counting.pool.get_or_create("b", config);
        FAIL() << "expected PoolExhaustedError";
    }
    catch (const PoolExhaustedError& e)
    {
        EXPECT_EQ(e.max_sessions(), 1u);
    }
    EXPECT_EQ(counting.pool.keys(), (std::vector<std::string>{"a"}));

    EXPECT_TRUE(counting.pool.interrupt("a"));
    runner.join();
    EXPECT_TRUE(slow.was_cancelled);
}

TEST(PTYPoolTest, ReplacesDeadSession)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    CountingPool counting;

    auto first = counting.pool.get_or_create("chat-1", config);
    EXPECT_FALSE(first->send("quit").success);
    EXPECT_EQ(counting.pool.get("chat-1"), nullptr);

    auto second = counting.pool.get_or_create("chat-1", config);
    EXPECT_NE(first, second);
    EXPECT_EQ(counting.created.load(), 2);
    EXPECT_EQ(second->state(), SessionState::Idle);
}

TEST(PTYPoolTest, StartFailureIsNotPooled)
{
    test::TempDir dir;
    CountingPool counting;
    PTYSessionConfig config = stub_config(dir.write_script("agent", "exit 1\n"));

    EXPECT_THROW(counting.pool.get_or_create("chat-1", config), SessionStartError);
    EXPECT_EQ(counting.pool.count(), 0u);
}

TEST(PTYPoolTest, NullFactoryResultThrows)
{
    PTYPool pool(PoolConfig{},
                 [](const std::string&, const PTYSessionConfig&) -> std::shared_ptr<PTYSession>
                 { return nullptr; },
                 quiet());
    EXPECT_THROW(pool.get_or_create("chat-1", PTYSessionConfig{}), SessionStartError);
}

TEST(PTYPoolTest, RemoveByOwnerPrefix)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    CountingPool counting;

    counting.pool.get_or_create("chat-1", config);
    counting.pool.get_or_create("chat-1:thread-2", config);
    counting.pool.get_or_create("chat-10", config);

    EXPECT_EQ(counting.pool.remove_by_owner_prefix("chat-1"), 2u);
    EXPECT_EQ(counting.pool.keys(), (std::vector<std::string>{"chat-10"}));

    EXPECT_TRUE(counting.pool.remove("chat-10"));
    EXPECT_FALSE(counting.pool.remove("chat-10"));
    EXPECT_EQ(counting.pool.count(), 0u);
}

TEST(PTYPoolTest, InterruptUnknownKey)
{
    PTYPool pool(PoolConfig{}, nullptr, quiet());
    EXPECT_FALSE(pool.interrupt("missing"));
    EXPECT_EQ(pool.interrupt_by_owner_prefix("missing"), 0u);
}

TEST(PTYPoolTest, SweepRemovesIdleAndDeadSessions)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));

    PoolConfig keep;
    CountingPool long_lived(keep);
    auto dead = long_lived.pool.get_or_create("dead", config);
    long_lived.pool.get_or_create("alive", config);
    dead->send("quit");
    EXPECT_EQ(long_lived.pool.sweep(), 1u);
    EXPECT_EQ(long_lived.pool.keys(), (std::vector<std::string>{"alive"}));

    PoolConfig expire;
    expire.idle_timeout = std::chrono::seconds(0);
    CountingPool short_lived(expire);
    short_lived.pool.get_or_create("idle", config);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(short_lived.pool.sweep(), 1u);
    EXPECT_EQ(short_lived.pool.count(), 0u);
}

TEST(PTYPoolTest, BackgroundSweeper)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));

    PoolConfig pool_config;
    pool_config.idle_timeout = std::chrono::seconds(0);
    pool_config.cleanup_interval = std::chrono::seconds(1);
    CountingPool counting(pool_config);

    counting.pool.get_or_create("idle", config);
    counting.pool.start_sweeper();
    EXPECT_TRUE(wait_until([&counting]() { return counting.pool.count() == 0; }, 5s));
    counting.pool.stop_sweeper();
}

TEST(PTYPoolTest, SessionInfo)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    config.working_directory = dir.path().string();
    CountingPool counting;

    counting.pool.get_or_create("chat-1", config);
    counting.pool.get_or_create("chat-2", config);

    auto info = counting.pool.session_info("chat-1");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->key, "chat-1");
    EXPECT_EQ(info->state, SessionState::Idle);
    EXPECT_EQ(info->external_session_id.value_or(""), "sess-1");
    EXPECT_EQ(info->working_directory, dir.path().string());
    EXPECT_TRUE(info->alive);

    EXPECT_FALSE(counting.pool.session_info("chat-3").has_value());
    EXPECT_EQ(counting.pool.session_info().size(), 2u);
}

TEST(PTYPoolTest, ShutdownStopsEverything)
{
    test::TempDir dir;
    PTYSessionConfig config = stub_config(dir.write_script("agent", ECHO_AGENT));
    CountingPool counting;

    auto a = counting.pool.get_or_create("a", config);
    auto b = counting.pool.get_or_create("b", config);
    counting.pool.shutdown();

    EXPECT_EQ(counting.pool.count(), 0u);
    EXPECT_EQ(a->state(), SessionState::Stopped);
    EXPECT_EQ(b->state(), SessionState::Stopped);
}

// ============================================================================
// PTYExecutor
// ============================================================================

TEST(PTYExecutorTest, ReusesSessionPerOwner)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    auto first = executor.execute(make_request("e1", "chat-1", "one"));
    auto second = executor.execute(make_request("e2", "chat-1", "two"));

    EXPECT_TRUE(first.success) << first.error.value_or("");
    EXPECT_EQ(first.text, "echo: one");
    EXPECT_EQ(second.text, "echo: two");
    EXPECT_EQ(second.external_session_id.value_or(""), "sess-1");
    EXPECT_EQ(counting.created.load(), 1);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(executor.active_count(), 0u);
}

TEST(PTYExecutorTest, EmptyOwnerUsesExecutionId)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    auto result = executor.execute(make_request("solo", "", "hi"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(counting.pool.keys(), (std::vector<std::string>{"solo"}));
}

TEST(PTYExecutorTest, CancelInterruptsTheSession)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    ExecutionResult result;
    std::thread runner([&]() { result = executor.execute(make_request("e1", "chat-1", "slow")); });

    ASSERT_TRUE(wait_until(
        [&counting]()
        {
            auto session = counting.pool.get("chat-1");
            return session && session->state() == SessionState::Busy;
        }));
    EXPECT_TRUE(registry.contains("e1"));

    EXPECT_TRUE(executor.cancel("e1"));
    runner.join();

    EXPECT_TRUE(result.was_cancelled);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(registry.contains("e1"));
    EXPECT_FALSE(executor.cancel("e1"));
}

TEST(PTYExecutorTest, BusySessionRejectsSecondTurn)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    ExecutionResult slow;
    std::thread runner([&]() { slow = executor.execute(make_request("e1", "chat-1", "slow")); });
    ASSERT_TRUE(wait_until(
        [&counting]()
        {
            auto session = counting.pool.get("chat-1");
            return session && session->state() == SessionState::Busy;
        }));

    auto second = executor.execute(make_request("e2", "chat-1", "hello"));
    EXPECT_FALSE(second.success);
    EXPECT_NE(second.error.value_or("").find("not idle"), std::string::npos);

    auto duplicate = executor.execute(make_request("e1", "chat-1", "hello"));
    EXPECT_NE(duplicate.error.value_or("").find("already running"), std::string::npos);

    EXPECT_EQ(executor.cancel_by_owner("chat-1"), 1u);
    runner.join();
    EXPECT_TRUE(slow.was_cancelled);
}

TEST(PTYExecutorTest, StartFailureIsAFailureResult)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry, stub_config(dir.write_script("agent", "exit 1\n")),
                         quiet());

    auto result = executor.execute(make_request("e1", "chat-1", "hi"));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("Failed to start PTY session"), std::string::npos);
    EXPECT_FALSE(registry.contains("e1"));
}

TEST(PTYExecutorTest, StopSessionDropsOwnerSessions)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    ASSERT_TRUE(executor.execute(make_request("e1", "chat-1", "hi")).success);
    ASSERT_TRUE(executor.execute(make_request("e2", "chat-2", "hi")).success);

    EXPECT_TRUE(executor.stop_session("chat-1"));
    EXPECT_FALSE(executor.stop_session("chat-1"));
    EXPECT_EQ(counting.pool.keys(), (std::vector<std::string>{"chat-2"}));
}

TEST(PTYExecutorTest, ShutdownRefusesNewWork)
{
    test::TempDir dir;
    CountingPool counting;
    ProcessRegistry registry;
    PTYExecutor executor(counting.pool, registry,
                         stub_config(dir.write_script("agent", ECHO_AGENT)), quiet());

    ASSERT_TRUE(executor.execute(make_request("e1", "chat-1", "hi")).success);
    executor.shutdown();

    EXPECT_EQ(counting.pool.count(), 0u);
    auto result = executor.execute(make_request("e2", "chat-1", "hi"));
    EXPECT_EQ(result.error.value_or(""), "Executor is shut down");
}
