#ifndef AGENTBRIDGE_CONFIG_HPP
#define AGENTBRIDGE_CONFIG_HPP

#include <agentbridge/log.hpp>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace agentbridge
{

using std::chrono::milliseconds;

// Timeout families used across executors, the RPC bridge and PTY sessions
struct TimeoutConfig
{
    // One-shot executors: a stall longer than this is treated as a hung process
    milliseconds read_line{std::chrono::seconds(1800)};
    // Poll granularity of read loops (cancellation is observed within one tick)
    milliseconds read_tick{100};
    // PTY: silence this long after output marks a response complete
    milliseconds pty_inactivity{std::chrono::seconds(10)};
    // PTY: time allowed for the readiness marker
    milliseconds startup{std::chrono::seconds(30)};
    // Deferral window after the finish-planning tool is seen
    milliseconds plan_write_grace{std::chrono::seconds(10)};
    // Wait after SIGTERM (and again after SIGKILL) before giving up
    milliseconds termination_grace{std::chrono::seconds(5)};
    // PTY: wait after each stop step (exit command, interrupt)
    milliseconds pty_stop_grace{500};
    // RPC: how long a server-initiated request may wait for a human answer
    milliseconds human_response{std::chrono::minutes(15)};
};

struct PoolConfig
{
    size_t max_sessions = 10;
    std::chrono::seconds idle_timeout{1800};
    std::chrono::seconds cleanup_interval{60};
};

struct EngineConfig
{
    TimeoutConfig timeouts;
    PoolConfig pool;
    size_t max_buffer_size = 1024 * 1024; // StreamDecoder fragment cap

    // Defaults overridden by SESSION_* / AGENTBRIDGE_* environment variables
    static EngineConfig from_environment(const Logger& logger = Logger());

    // Defaults overridden by snake_case keys of a JSON document
    static EngineConfig from_json(const nlohmann::json& j, const Logger& logger = Logger());

    void apply_environment(const Logger& logger = Logger());
    void apply_json(const nlohmann::json& j, const Logger& logger = Logger());
};

// Read a JSON config file; throws AgentBridgeError if it cannot be opened or parsed
EngineConfig load_config_file(const std::string& path, const Logger& logger = Logger());

} // namespace agentbridge

#endif // AGENTBRIDGE_CONFIG_HPP
