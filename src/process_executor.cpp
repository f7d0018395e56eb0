#include "internal/execution_state.hpp"
#include "internal/line_reader.hpp"
#include "internal/process_support.hpp"
#include "internal/stream_decoder.hpp"
#include "internal/subprocess/process.hpp"
#include "internal/text_format.hpp"

#include <agentbridge/errors.hpp>
#include <agentbridge/executor.hpp>
#include <atomic>

namespace agentbridge
{

ExecutorOptions ExecutorOptions::from_config(const EngineConfig& config)
{
    ExecutorOptions options;
    options.timeouts = config.timeouts;
    options.max_buffer_size = config.max_buffer_size;
    return options;
}

using internal::StopDecision;

namespace
{

ExecutionResult failure(const std::string& message)
{
    ExecutionResult result;
    result.success = false;
    result.error = message;
    return result;
}

// Removes the execution's control state however execute() is left
class StateGuard
{
  public:
    StateGuard(internal::ExecutionStateMap& states, std::string execution_id)
        : states_(states), execution_id_(std::move(execution_id))
    {
    }

    ~StateGuard()
    {
        states_.erase(execution_id_);
    }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

  private:
    internal::ExecutionStateMap& states_;
    std::string execution_id_;
};

} // namespace

// ============================================================================
// ProcessExecutor::Impl
// ============================================================================

class ProcessExecutor::Impl
{
  public:
    Impl(std::shared_ptr<CliBackend> backend, ProcessRegistry& registry, ExecutorOptions options)
        : backend_(std::move(backend)), registry_(registry), options_(std::move(options)),
          logger_(Logger(options_.log_callback, options_.log_level).with_tag(backend_->name()))
    {
    }

    ExecutionResult execute(const ExecutionRequest& request, const MessageCallback& on_message)
    {
        if (shut_down_)
            return failure("Executor is shut down");
        if (request.execution_id.empty())
            return failure("Execution id is required");

        auto state = states_.create(request.execution_id);
        if (!state)
            return failure("Execution " + request.execution_id + " is already running");
        StateGuard state_guard(states_, request.execution_id);

        auto handle = std::make_shared<internal::ProcessCancelHandle>();
        if (!registry_.register_execution(request.execution_id, request.owner_key, handle))
            return failure("Execution " + request.execution_id + " is already running");
        ScopedRegistration registration(registry_, request.execution_id);

        ExecutionRequest attempt = request;
        bool plan_retry_used = false;
        std::string carried_text;
        std::string carried_detailed;
        ExecutionResult result;

        for (int depth = 0; depth < MAX_RETRY_DEPTH; ++depth)
        {
            *state = internal::ExecutionState{};
            result = run_attempt(attempt, *state, *handle, on_message);

            if (!carried_text.empty())
            {
                result.text = internal::concat_with_spacing(carried_text, result.text);
                result.detailed_text =
                    internal::concat_with_spacing(carried_detailed, result.detailed_text);
            }

            if (handle->cancelled() || result.was_cancelled)
                break;

            // Resumed conversation no longer exists: start fresh instead
            if (attempt.resume_session_id.has_value() && !result.success && result.error &&
                backend_->is_session_missing(*result.error))
            {
                logger_.warning("Session " + *attempt.resume_session_id +
                                " not found, retrying without resume");
                attempt.resume_session_id.reset();
                continue;
            }

            // Plan approval rejected inside the CLI: resume with everything approved
            if (state->plan_finish_failed && !plan_retry_used &&
                result.external_session_id.has_value())
            {
                logger_.info("Plan finish failed, resuming session " +
                             *result.external_session_id + " in " +
                             backend_->auto_approve_mode() + " mode");
                plan_retry_used = true;
                attempt.resume_session_id = result.external_session_id;
                attempt.mode = backend_->auto_approve_mode();
                carried_text = result.text;
                carried_detailed = result.detailed_text;
                continue;
            }

            break;
        }

        return result;
    }

    bool cancel(const std::string& execution_id)
    {
        if (!states_.contains(execution_id))
            return false;
        return registry_.cancel(execution_id);
    }

    size_t cancel_by_owner(const std::string& owner_key)
    {
        size_t count = 0;
        for (const auto& id : states_.ids())
        {
            auto owner = registry_.owner_of(id);
            if (owner && *owner == owner_key && registry_.cancel(id))
                ++count;
        }
        return count;
    }

    size_t cancel_all()
    {
        size_t count = 0;
        for (const auto& id : states_.ids())
        {
            if (registry_.cancel(id))
                ++count;
        }
        return count;
    }

    void shutdown()
    {
        shut_down_ = true;
        size_t count = cancel_all();
        if (count > 0)
            logger_.info("Shutdown cancelled " + std::to_string(count) + " execution(s)");
    }

    bool is_active(const std::string& execution_id) const
    {
        return states_.contains(execution_id);
    }

    size_t active_count() const
    {
        return states_.size();
    }

    const CliBackend& backend() const
    {
        return *backend_;
    }

  private:
    ExecutionResult run_attempt(const ExecutionRequest& request, internal::ExecutionState& state,
                                internal::ProcessCancelHandle& handle,
                                const MessageCallback& on_message);

    std::shared_ptr<CliBackend> backend_;
    ProcessRegistry& registry_;
    ExecutorOptions options_;
    Logger logger_;
    internal::ExecutionStateMap states_;
    std::atomic<bool> shut_down_{false};
};

ExecutionResult ProcessExecutor::Impl::run_attempt(const ExecutionRequest& request,
                                                   internal::ExecutionState& state,
                                                   internal::ProcessCancelHandle& handle,
                                                   const MessageCallback& on_message)
{
    if (handle.cancelled())
    {
        ExecutionResult result = failure("Cancelled");
        result.was_cancelled = true;
        return result;
    }

    std::string executable;
    try
    {
        executable = backend_->resolve_executable();
    }
    catch (const CLINotFoundError& e)
    {
        logger_.error(e.what());
        return failure(e.what());
    }

    std::vector<std::string> args = backend_->build_arguments(request, logger_);

    subprocess::ProcessOptions process_options;
    process_options.working_directory = request.working_directory;
    process_options.environment = options_.environment;
    process_options.redirect_stdin = false;
    process_options.redirect_stdout = true;
    process_options.redirect_stderr = true;
    process_options.new_process_group = true;

    subprocess::Process process;
    try
    {
        process.spawn(executable, args, process_options);
    }
    catch (const ProcessSpawnError& e)
    {
        logger_.error(e.what());
        return failure(e.what());
    }

    logger_.debug("Started " + executable + " (pid " + std::to_string(process.pid()) + ")");
    handle.attach(process.pid(), process.owns_process_group());

    internal::StderrCollector stderr_collector(process.stderr_pipe(), options_.max_stderr_bytes,
                                               options_.stderr_callback, logger_);

    protocol::StreamDecoder decoder(backend_->wire_format(), options_.max_buffer_size, logger_);
    internal::LineReader reader(process.stdout_pipe(), options_.max_buffer_size + 1);
    internal::ControlTracker tracker(*backend_, state, options_.timeouts.plan_write_grace);

    internal::StreamOutcome outcome;
    std::optional<std::string> read_failure;
    StopDecision decision = StopDecision::Continue;
    bool timed_out = false;

    const int tick = static_cast<int>(options_.timeouts.read_tick.count());
    auto last_output = Clock::now();
    std::string line;

    try
    {
        while (!outcome.reached_final)
        {
            if (handle.cancelled())
                break;

            decision = tracker.evaluate(Clock::now());
            if (decision != StopDecision::Continue)
            {
                logger_.info(std::string("Stopping early: ") + internal::to_string(decision));
                break;
            }

            internal::ReadStatus status = reader.next_line(line, tick);
            if (status == internal::ReadStatus::Eof)
                break;
            if (status == internal::ReadStatus::Timeout)
            {
                if (Clock::now() - last_output > options_.timeouts.read_line)
                {
                    timed_out = true;
                    break;
                }
                continue;
            }

            last_output = Clock::now();
            for (const auto& message : decoder.feed(line))
            {
                tracker.observe(message);
                internal::deliver_message(on_message, message, logger_);
                outcome.record(message, logger_);
            }
        }
    }
    catch (const std::exception& e)
    {
        read_failure = e.what();
        logger_.error(std::string("Reading backend output failed: ") + e.what());
    }

    // The process must not be signalled through the registry once it may be reaped
    handle.detach();

    const bool early_stop = decision != StopDecision::Continue;

    std::optional<int> exit_code;
    if (!handle.cancelled() && !early_stop && !timed_out && !read_failure)
        exit_code = process.wait_for(options_.timeouts.termination_grace);
    if (!exit_code.has_value())
    {
        exit_code = subprocess::stop_with_escalation(process, options_.timeouts.termination_grace);
        if (!exit_code.has_value())
            logger_.error("Process " + std::to_string(process.pid()) +
                          " survived SIGKILL; giving up on it");
    }

    stderr_collector.finish();
    const std::string stderr_text = stderr_collector.text();

    // ------------------------------------------------------------------
    // Assemble the result
    // ------------------------------------------------------------------

    ExecutionResult result;
    result.text = decoder.text();
    result.detailed_text = decoder.detailed_text();
    result.external_session_id = decoder.session_id();
    result.exit_code = exit_code;
    result.was_cancelled = handle.cancelled();

    if (const auto& final_result = outcome.final_result)
    {
        if (final_result->session_id)
            result.external_session_id = final_result->session_id;
        result.cost_units = final_result->cost;
        result.duration_ms = final_result->duration_ms;
        if (result.text.empty())
            result.text = final_result->text;
    }

    result.pending_question = decision == StopDecision::QuestionPending;
    if (decision == StopDecision::PlanReady || decision == StopDecision::PlanGraceExpired ||
        (state.exit_plan_detected && !state.plan_finish_failed && !result.pending_question))
    {
        result.pending_plan_approval = true;
        result.plan_write_timed_out = decision == StopDecision::PlanGraceExpired;
    }

    if (!result.pending_question)
    {
        try
        {
            result.plan_candidate_text =
                tracker.plan_candidate(decoder.text(), options_.plan_predicate);
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("Plan predicate threw: ") + e.what());
        }
    }

    if (timed_out)
    {
        result.error = "Command timed out";
    }
    else if (read_failure)
    {
        result.error = *read_failure;
    }
    else if (auto stream_error = outcome.error_text())
    {
        result.error = *stream_error;
    }
    else if (!early_stop && !result.was_cancelled && exit_code.has_value() && *exit_code != 0 &&
             !outcome.final_result)
    {
        if (!stderr_text.empty())
            result.error = stderr_text;
        else
            result.error = backend_->name() + " exited with code " + std::to_string(*exit_code);
    }

    if (result.was_cancelled && !result.error)
        result.error = "Cancelled";

    result.success = !result.error.has_value() && !result.was_cancelled;

    if (result.error && !result.was_cancelled)
        logger_.warning("Execution " + request.execution_id + " failed: " + *result.error);
    return result;
}

// ============================================================================
// ProcessExecutor
// ============================================================================

ProcessExecutor::ProcessExecutor(std::shared_ptr<CliBackend> backend, ProcessRegistry& registry,
                                 ExecutorOptions options)
{
    if (!backend)
        throw AgentBridgeError("ProcessExecutor requires a backend");
    impl_ = std::make_unique<Impl>(std::move(backend), registry, std::move(options));
}

ProcessExecutor::~ProcessExecutor() = default;

ExecutionResult ProcessExecutor::execute(const ExecutionRequest& request,
                                         const MessageCallback& on_message)
{
    return impl_->execute(request, on_message);
}

bool ProcessExecutor::cancel(const std::string& execution_id)
{
    return impl_->cancel(execution_id);
}

size_t ProcessExecutor::cancel_by_owner(const std::string& owner_key)
{
    return impl_->cancel_by_owner(owner_key);
}

size_t ProcessExecutor::cancel_all()
{
    return impl_->cancel_all();
}

void ProcessExecutor::shutdown()
{
    impl_->shutdown();
}

bool ProcessExecutor::is_active(const std::string& execution_id) const
{
    return impl_->is_active(execution_id);
}

size_t ProcessExecutor::active_count() const
{
    return impl_->active_count();
}

const CliBackend& ProcessExecutor::backend() const
{
    return impl_->backend();
}

// ============================================================================
// Factories
// ============================================================================

std::unique_ptr<ProcessExecutor> make_claude_executor(ProcessRegistry& registry,
                                                      ClaudeBackendOptions backend_options,
                                                      ExecutorOptions options)
{
    return std::make_unique<ProcessExecutor>(
        std::make_shared<ClaudeCliBackend>(std::move(backend_options)), registry,
        std::move(options));
}

std::unique_ptr<ProcessExecutor> make_codex_executor(ProcessRegistry& registry,
                                                     CodexBackendOptions backend_options,
                                                     ExecutorOptions options)
{
    return std::make_unique<ProcessExecutor>(
        std::make_shared<CodexCliBackend>(std::move(backend_options)), registry,
        std::move(options));
}

} // namespace agentbridge
