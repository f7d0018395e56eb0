#ifndef AGENTBRIDGE_PTY_HPP
#define AGENTBRIDGE_PTY_HPP

#include <agentbridge/backend.hpp>
#include <agentbridge/config.hpp>
#include <agentbridge/executor.hpp>
#include <agentbridge/log.hpp>
#include <agentbridge/registry.hpp>
#include <agentbridge/types.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentbridge
{

namespace subprocess
{
class PtyProcess;
}

// ============================================================================
// Session state
// ============================================================================

enum class SessionState
{
    Starting,
    Idle,
    Busy,
    Stopping,
    Stopped,
    Error
};

const char* to_string(SessionState state);

// Starting->Idle, Idle->Busy, Busy->Idle, any->Stopping, Stopping->Stopped, any->Error
bool is_valid_transition(SessionState from, SessionState to);

struct PTYSessionConfig
{
    // Empty command: the Codex CLI is located through `backend` and started in
    // interactive JSON mode with the sandbox / approval / model settings below
    std::string command;
    std::vector<std::string> args;
    CodexBackendOptions backend;

    std::string working_directory;
    std::map<std::string, std::string> environment;
    WireFormat wire_format = WireFormat::Codex;

    std::string sandbox_mode = "workspace-write";
    std::string approval_mode = "on-request";
    std::string model;

    milliseconds startup_timeout{std::chrono::seconds(30)};
    milliseconds inactivity_timeout{std::chrono::seconds(10)};
    milliseconds poll_interval{100};
    milliseconds stop_grace{500};
    milliseconds startup_flush{300};
    milliseconds response_timeout{std::chrono::hours(60)};

    int cols = 120;
    int rows = 40;
    std::string exit_command = "/exit";
    bool echo = false;

    // Shell-style prompt that also marks the session ready (matched after ANSI stripping)
    std::string prompt_pattern = R"(>\s*$)";

    // Timeouts taken from an engine configuration, everything else defaulted
    static PTYSessionConfig from_config(const EngineConfig& config);
};

// Point-in-time view of a session
struct SessionInfo
{
    std::string key;
    std::optional<std::string> external_session_id;
    SessionState state = SessionState::Starting;
    std::string working_directory;
    Clock::time_point created_at;
    Clock::time_point last_activity;
    std::chrono::milliseconds idle_for{0};
    bool alive = false;
    int pid = 0;
};

// ============================================================================
// PTYSession
// ============================================================================

// One long-lived interactive process on a pseudo-terminal, reused across turns
class PTYSession
{
  public:
    PTYSession(std::string key, PTYSessionConfig config, Logger logger = Logger());
    ~PTYSession();

    PTYSession(const PTYSession&) = delete;
    PTYSession& operator=(const PTYSession&) = delete;

    // Spawn and wait for the readiness marker; throws SessionStartError (state
    // becomes Error) when the process dies or stays silent past the startup timeout
    void start();

    // Send one line and collect the response. Only allowed when Idle, otherwise
    // throws InvalidSessionStateError. Completes on a terminal message, or on
    // inactivity after output; the overall timeout is a failure and leaves the
    // session in Error.
    ExecutionResult send(const std::string& text, const MessageCallback& on_message = nullptr,
                         std::optional<milliseconds> timeout = std::nullopt);

    // Ctrl-C to the foreground program; an in-flight send() returns as cancelled
    bool interrupt();

    // Exit command, then interrupt, then SIGKILL, each after the stop grace
    void terminate();

    void resize(int rows, int cols);

    SessionState state() const;
    bool is_alive() const;
    SessionInfo info() const;

    const std::string& key() const
    {
        return key_;
    }

    const PTYSessionConfig& config() const
    {
        return config_;
    }

    std::optional<std::string> external_session_id() const;
    Clock::time_point last_activity() const;
    int pid() const;

  private:
    void transition(SessionState to);
    void touch();
    bool looks_like_prompt(const std::string& text) const;
    void resolve_command(std::string& executable, std::vector<std::string>& args) const;

    const std::string key_;
    PTYSessionConfig config_;
    Logger logger_;
    std::unique_ptr<subprocess::PtyProcess> process_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Starting;
    Clock::time_point created_at_;
    Clock::time_point last_activity_;
    std::optional<std::string> external_session_id_;

    std::atomic<bool> interrupted_{false};
};

// ============================================================================
// PTYPool
// ============================================================================

// Creates (unstarted) sessions; the pool starts them
using SessionFactory =
    std::function<std::shared_ptr<PTYSession>(const std::string& key, const PTYSessionConfig&)>;

// Bounded map of owner key -> session with LRU eviction of idle sessions and a
// background sweep of dead and long-idle ones
class PTYPool
{
  public:
    explicit PTYPool(PoolConfig config = {}, SessionFactory factory = nullptr,
                     Logger logger = Logger());
    ~PTYPool();

    PTYPool(const PTYPool&) = delete;
    PTYPool& operator=(const PTYPool&) = delete;

    // Reuse a live session for key, or start a new one. At capacity the least
    // recently active Idle session is evicted; throws PoolExhaustedError when none
    // is evictable and SessionStartError when the new session fails to start.
    std::shared_ptr<PTYSession> get_or_create(const std::string& key,
                                              const PTYSessionConfig& config);

    // Live session for key, or nullptr
    std::shared_ptr<PTYSession> get(const std::string& key) const;

    ExecutionResult send(const std::string& key, const std::string& text,
                         const PTYSessionConfig& config,
                         const MessageCallback& on_message = nullptr);

    bool remove(const std::string& key);

    // Stop every session whose key equals prefix or starts with "prefix:"
    size_t remove_by_owner_prefix(const std::string& prefix);

    bool interrupt(const std::string& key);
    size_t interrupt_by_owner_prefix(const std::string& prefix);

    // Remove dead sessions and Idle sessions past the idle timeout
    size_t sweep();

    void start_sweeper();
    void stop_sweeper();

    // Stop the sweeper and every session
    void shutdown();

    size_t count() const;
    std::vector<std::string> keys() const;
    std::optional<SessionInfo> session_info(const std::string& key) const;
    std::vector<SessionInfo> session_info() const;

    const PoolConfig& config() const
    {
        return config_;
    }

  private:
    static bool matches_prefix(const std::string& key, const std::string& prefix);

    PoolConfig config_;
    SessionFactory factory_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PTYSession>> sessions_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
    std::thread sweeper_;
};

// ============================================================================
// PTYExecutor
// ============================================================================

// Executor over a PTYPool: one pooled session per owner key, reused across calls
class PTYExecutor : public Executor
{
  public:
    PTYExecutor(PTYPool& pool, ProcessRegistry& registry, PTYSessionConfig base_config = {},
                Logger logger = Logger());
    ~PTYExecutor() override;

    PTYExecutor(const PTYExecutor&) = delete;
    PTYExecutor& operator=(const PTYExecutor&) = delete;

    ExecutionResult execute(const ExecutionRequest& request,
                            const MessageCallback& on_message = nullptr) override;

    bool cancel(const std::string& execution_id) override;
    size_t cancel_by_owner(const std::string& owner_key) override;
    size_t cancel_all() override;
    void shutdown() override;

    // Stop and drop the session of an owner
    bool stop_session(const std::string& owner_key);

    size_t active_count() const;

  private:
    PTYSessionConfig config_for(const ExecutionRequest& request) const;

    PTYPool& pool_;
    ProcessRegistry& registry_;
    PTYSessionConfig base_config_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> active_; // execution id -> owner key
    std::atomic<bool> shut_down_{false};
};

} // namespace agentbridge

#endif // AGENTBRIDGE_PTY_HPP
