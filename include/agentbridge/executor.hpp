#ifndef AGENTBRIDGE_EXECUTOR_HPP
#define AGENTBRIDGE_EXECUTOR_HPP

#include <agentbridge/backend.hpp>
#include <agentbridge/config.hpp>
#include <agentbridge/log.hpp>
#include <agentbridge/registry.hpp>
#include <agentbridge/types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace agentbridge
{

// Upper bound on attempts of one execute() call, retries included
constexpr int MAX_RETRY_DEPTH = 3;

// Common surface of the one-shot executors, the RPC bridge and the PTY executor
class Executor
{
  public:
    virtual ~Executor() = default;

    // Drive one turn to completion. Runtime failures are reported in the result,
    // never thrown.
    virtual ExecutionResult execute(const ExecutionRequest& request,
                                    const MessageCallback& on_message = nullptr) = 0;

    virtual bool cancel(const std::string& execution_id) = 0;
    virtual size_t cancel_by_owner(const std::string& owner_key) = 0;
    virtual size_t cancel_all() = 0;

    // Cancel everything and refuse new work
    virtual void shutdown() = 0;
};

struct ExecutorOptions
{
    TimeoutConfig timeouts;
    size_t max_buffer_size = 1024 * 1024;
    size_t max_stderr_bytes = 64 * 1024;

    std::optional<LogCallback> log_callback;
    LogLevel log_level = LogLevel::Warning;
    std::optional<StderrCallback> stderr_callback;

    // Decides whether plain assistant text counts as a plan when no explicit plan exists
    PlanPredicate plan_predicate;

    // Extra environment for the child process
    std::map<std::string, std::string> environment;

    static ExecutorOptions from_config(const EngineConfig& config);
};

// Runs one backend CLI process per execute() call
class ProcessExecutor : public Executor
{
  public:
    ProcessExecutor(std::shared_ptr<CliBackend> backend, ProcessRegistry& registry,
                    ExecutorOptions options = {});
    ~ProcessExecutor() override;

    ProcessExecutor(const ProcessExecutor&) = delete;
    ProcessExecutor& operator=(const ProcessExecutor&) = delete;

    ExecutionResult execute(const ExecutionRequest& request,
                            const MessageCallback& on_message = nullptr) override;

    bool cancel(const std::string& execution_id) override;
    size_t cancel_by_owner(const std::string& owner_key) override;
    size_t cancel_all() override;
    void shutdown() override;

    bool is_active(const std::string& execution_id) const;
    size_t active_count() const;

    const CliBackend& backend() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

std::unique_ptr<ProcessExecutor> make_claude_executor(ProcessRegistry& registry,
                                                      ClaudeBackendOptions backend_options = {},
                                                      ExecutorOptions options = {});

std::unique_ptr<ProcessExecutor> make_codex_executor(ProcessRegistry& registry,
                                                     CodexBackendOptions backend_options = {},
                                                     ExecutorOptions options = {});

} // namespace agentbridge

#endif // AGENTBRIDGE_EXECUTOR_HPP
