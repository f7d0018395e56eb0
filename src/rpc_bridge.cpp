#include "internal/app_server_events.hpp"
#include "internal/execution_state.hpp"
#include "internal/line_reader.hpp"
#include "internal/process_support.hpp"
#include "internal/stream_decoder.hpp"
#include "internal/subprocess/process.hpp"

#include <agentbridge/errors.hpp>
#include <agentbridge/protocol/json_rpc.hpp>
#include <agentbridge/rpc_bridge.hpp>
#include <agentbridge/version.hpp>
#include <atomic>

namespace agentbridge
{

using internal::StopDecision;

// ============================================================================
// Approval helpers
// ============================================================================

namespace
{

const char* const COMMAND_APPROVAL = "item/commandExecution/requestApproval";
const char* const FILE_CHANGE_APPROVAL = "item/fileChange/requestApproval";
const char* const SKILL_APPROVAL = "skill/requestApproval";
const char* const LEGACY_EXEC_APPROVAL = "execCommandApproval";
const char* const LEGACY_PATCH_APPROVAL = "applyPatchApproval";
const char* const USER_INPUT_REQUEST = "item/tool/requestUserInput";

// Value of key as display text; empty when absent, null or empty
std::string param_text(const json& params, const char* key)
{
    if (!params.is_object())
        return "";
    auto it = params.find(key);
    if (it == params.end() || it->is_null())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_array())
    {
        // Commands arrive as argv arrays
        std::string joined;
        for (const auto& part : *it)
        {
            if (!joined.empty())
                joined += " ";
            joined += part.is_string() ? part.get<std::string>() : part.dump();
        }
        return joined;
    }
    if (it->is_boolean())
        return it->get<bool>() ? "true" : "";
    return it->dump();
}

std::optional<std::string> join_lines(const std::vector<std::string>& lines)
{
    if (lines.empty())
        return std::nullopt;
    std::string text;
    for (const auto& line : lines)
    {
        if (!text.empty())
            text += "\n";
        text += line;
    }
    return text;
}

} // namespace

bool is_approval_method(const std::string& method)
{
    return method == COMMAND_APPROVAL || method == FILE_CHANGE_APPROVAL ||
           method == SKILL_APPROVAL || method == LEGACY_EXEC_APPROVAL ||
           method == LEGACY_PATCH_APPROVAL;
}

json approval_payload(const std::string& method, bool approved)
{
    if (method == SKILL_APPROVAL)
        return {{"decision", approved ? "approve" : "decline"}};
    if (method == LEGACY_EXEC_APPROVAL || method == LEGACY_PATCH_APPROVAL)
        return {{"decision", approved ? "approved" : "denied"}};
    return {{"decision", approved ? "accept" : "decline"}};
}

json default_approval_payload(const std::string& method, const std::string& approval_mode)
{
    return approval_payload(method, normalize_approval_mode(approval_mode) == "never");
}

std::pair<std::string, std::optional<std::string>>
describe_approval_request(const std::string& method, const json& params)
{
    if (method == COMMAND_APPROVAL)
    {
        std::vector<std::string> lines;
        std::string command = param_text(params, "command");
        std::string cwd = param_text(params, "cwd");
        std::string reason = param_text(params, "reason");
        if (!command.empty())
            lines.push_back("command: " + command);
        if (!cwd.empty())
            lines.push_back("cwd: " + cwd);
        if (!reason.empty())
            lines.push_back("reason: " + reason);
        return {"run_command", join_lines(lines)};
    }

    if (method == FILE_CHANGE_APPROVAL)
    {
        std::vector<std::string> lines;
        std::string reason = param_text(params, "reason");
        std::string grant_root = param_text(params, "grantRoot");
        if (!reason.empty())
            lines.push_back("reason: " + reason);
        if (!grant_root.empty())
            lines.push_back("grantRoot: " + grant_root);
        return {"file_change", join_lines(lines)};
    }

    if (method == SKILL_APPROVAL)
    {
        std::string skill = param_text(params, "skillName");
        return {"skill:" + (skill.empty() ? std::string("unknown") : skill), std::nullopt};
    }

    json safe_params = params.is_object() ? params : json::object();
    return {method.empty() ? std::string("codex_approval") : method, safe_params.dump()};
}

// ============================================================================
// One app-server conversation
// ============================================================================

namespace
{

// Cancellation observed inside a wait loop
class AttemptStopped : public AgentBridgeError
{
  public:
    using AgentBridgeError::AgentBridgeError;
};

// The server closed stdout before the turn finished
class ServerClosed : public AgentBridgeError
{
  public:
    using AgentBridgeError::AgentBridgeError;
};

class RpcSession
{
  public:
    RpcSession(subprocess::Process& process, internal::ProcessCancelHandle& handle,
               const RpcBridgeOptions& options, std::string approval_mode, const Logger& logger,
               const MessageCallback& on_message, protocol::StreamDecoder& decoder,
               internal::ControlTracker& tracker)
        : connection_([&process](const std::string& frame) { process.stdin_pipe().write(frame); }),
          reader_(process.stdout_pipe(), options.executor.max_buffer_size + 1), handle_(handle),
          options_(options), approval_mode_(std::move(approval_mode)), logger_(logger),
          on_message_(on_message), decoder_(decoder), tracker_(tracker), last_output_(Clock::now())
    {
    }

    // Send a request and pump until its response arrives; everything received in
    // the meantime is handled in arrival order
    json call(const std::string& method, const json& params)
    {
        int64_t id = connection_.send_request(method, params);
        logger_.debug("-> " + method + " #" + std::to_string(id));

        while (true)
        {
            drain_incoming();
            if (auto response = connection_.take_response(id))
                return *response;
            read_once();
        }
    }

    void notify(const std::string& method)
    {
        connection_.send_notification(method);
    }

    // Pump notifications until the turn ends or the tracker asks for an early stop
    StopDecision run_turn()
    {
        while (true)
        {
            drain_incoming();
            if (outcome_.reached_final || translator_.turn_finished())
                return StopDecision::Continue;

            StopDecision decision = tracker_.evaluate(Clock::now());
            if (decision != StopDecision::Continue)
                return decision;

            read_once();
        }
    }

    // Make sure the stream carries an Init for the thread, even if the server sent
    // no thread/started notification
    void ensure_thread_started(const std::string& thread_id)
    {
        if (translator_.thread_id().empty() && !thread_id.empty())
            handle_notification("thread/started", {{"thread", {{"id", thread_id}}}});
    }

    const internal::StreamOutcome& outcome() const
    {
        return outcome_;
    }

    bool timed_out() const
    {
        return timed_out_;
    }

  private:
    void read_once()
    {
        if (handle_.cancelled())
            throw AttemptStopped("Cancelled");

        const int tick = static_cast<int>(options_.executor.timeouts.read_tick.count());
        internal::ReadStatus status = reader_.next_line(line_, tick);
        if (status == internal::ReadStatus::Eof)
            throw ServerClosed("Codex app-server exited before the turn completed");
        if (status == internal::ReadStatus::Timeout)
        {
            if (Clock::now() - last_output_ > options_.executor.timeouts.read_line)
            {
                timed_out_ = true;
                throw AgentBridgeError("Command timed out");
            }
            return;
        }

        last_output_ = Clock::now();
        if (!connection_.handle_line(line_))
            logger_.debug("Ignoring non JSON-RPC output: " + line_);
    }

    void drain_incoming()
    {
        while (auto incoming = connection_.next_incoming())
        {
            if (incoming->kind == protocol::RpcIncoming::Kind::Request)
                handle_server_request(*incoming);
            else
                handle_notification(incoming->method, incoming->params);
        }
    }

    void handle_notification(const std::string& method, const json& params)
    {
        for (const auto& event : translator_.translate(method, params))
        {
            for (const auto& message : decoder_.feed_json(event))
            {
                tracker_.observe(message);
                internal::deliver_message(on_message_, message, logger_);
                outcome_.record(message, logger_);
            }
        }
    }

    void handle_server_request(const protocol::RpcIncoming& request)
    {
        if (is_approval_method(request.method))
        {
            json decision = default_approval_payload(request.method, approval_mode_);
            if (options_.on_approval_request.has_value() && *options_.on_approval_request)
            {
                std::optional<json> answer =
                    ask(*options_.on_approval_request, request.method, request.params);
                if (answer.has_value())
                {
                    if (answer->is_boolean())
                        decision = approval_payload(request.method, answer->get<bool>());
                    else if (answer->is_object() && answer->contains("decision") &&
                             (*answer)["decision"].is_string())
                        decision = *answer;
                    else
                        logger_.warning("Invalid approval answer for " + request.method +
                                        "; using default");
                }
            }
            connection_.send_result(request.id, decision);
            return;
        }

        if (request.method == USER_INPUT_REQUEST)
        {
            json answer = {{"answers", json::object()}};
            if (options_.on_user_input_request.has_value() && *options_.on_user_input_request)
            {
                std::string request_id =
                    request.id.is_string() ? request.id.get<std::string>() : request.id.dump();
                std::optional<json> provided =
                    ask(*options_.on_user_input_request, request_id, request.params);
                if (provided.has_value() && provided->is_object())
                    answer = *provided;
                else if (provided.has_value())
                    logger_.warning("Invalid user input answer; using empty answers");
            }
            connection_.send_result(request.id, answer);
            return;
        }

        logger_.warning("Unsupported server request: " + request.method);
        connection_.send_error(request.id, protocol::RPC_METHOD_NOT_FOUND,
                               "Method not found: " + request.method);
    }

    // Run a human-facing callback and wait for its answer, honoring cancellation
    template <typename Callback>
    std::optional<json> ask(const Callback& callback, const std::string& key, const json& params)
    {
        std::future<std::optional<json>> future;
        try
        {
            future = callback(key, params);
        }
        catch (const std::exception& e)
        {
            logger_.warning("Server request callback threw: " + std::string(e.what()));
            return std::nullopt;
        }

        if (!future.valid())
            return std::nullopt;

        const auto deadline = Clock::now() + options_.executor.timeouts.human_response;
        const auto tick = options_.executor.timeouts.read_tick;
        while (future.wait_for(tick) == std::future_status::timeout)
        {
            if (handle_.cancelled())
                throw AttemptStopped("Cancelled while waiting for an answer to " + key);
            if (Clock::now() >= deadline)
            {
                logger_.warning("No answer to " + key + " in time; using default");
                return std::nullopt;
            }
        }

        try
        {
            return future.get();
        }
        catch (const std::exception& e)
        {
            logger_.warning("Server request callback failed: " + std::string(e.what()));
            return std::nullopt;
        }
    }

    protocol::JsonRpcConnection connection_;
    internal::LineReader reader_;
    internal::ProcessCancelHandle& handle_;
    const RpcBridgeOptions& options_;
    std::string approval_mode_;
    const Logger& logger_;
    const MessageCallback& on_message_;
    protocol::StreamDecoder& decoder_;
    internal::ControlTracker& tracker_;
    protocol::AppServerEventTranslator translator_;
    internal::StreamOutcome outcome_;

    std::string line_;
    Clock::time_point last_output_;
    bool timed_out_ = false;
};

ExecutionResult failure(const std::string& message)
{
    ExecutionResult result;
    result.error = message;
    return result;
}

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
// RpcBridge::Impl
// ============================================================================

class RpcBridge::Impl
{
  public:
    Impl(ProcessRegistry& registry, RpcBridgeOptions options)
        : registry_(registry), options_(std::move(options)), backend_(options_.backend),
          logger_(Logger(options_.executor.log_callback, options_.executor.log_level)
                      .with_tag("codex-rpc"))
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
        ExecutionResult result;
        for (int depth = 0; depth < MAX_RETRY_DEPTH; ++depth)
        {
            *state = internal::ExecutionState{};
            result = run_attempt(attempt, *state, *handle, on_message);

            if (handle->cancelled() || result.was_cancelled)
                break;

            if (attempt.resume_session_id.has_value() && !result.success && result.error &&
                backend_.is_session_missing(*result.error))
            {
                logger_.warning("Thread " + *attempt.resume_session_id +
                                " not found, starting a new thread");
                attempt.resume_session_id.reset();
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
        cancel_all();
    }

    bool is_active(const std::string& execution_id) const
    {
        return states_.contains(execution_id);
    }

    size_t active_count() const
    {
        return states_.size();
    }

  private:
    ExecutionResult run_attempt(const ExecutionRequest& request, internal::ExecutionState& state,
                                internal::ProcessCancelHandle& handle,
                                const MessageCallback& on_message);

    ProcessRegistry& registry_;
    RpcBridgeOptions options_;
    CodexCliBackend backend_;
    Logger logger_;
    internal::ExecutionStateMap states_;
    std::atomic<bool> shut_down_{false};
};

ExecutionResult RpcBridge::Impl::run_attempt(const ExecutionRequest& request,
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
        executable = backend_.resolve_executable();
    }
    catch (const CLINotFoundError& e)
    {
        logger_.error(e.what());
        return failure(e.what());
    }

    const std::string sandbox = backend_.resolve_sandbox_mode(request.sandbox_mode, logger_);
    const std::string approval = backend_.resolve_approval_mode(request.mode, logger_);
    const std::optional<std::string> model = backend_.resolve_model(request.model, logger_);

    subprocess::ProcessOptions process_options;
    process_options.working_directory = request.working_directory;
    process_options.environment = options_.executor.environment;
    process_options.redirect_stdin = true;
    process_options.redirect_stdout = true;
    process_options.redirect_stderr = true;
    process_options.new_process_group = true;

    subprocess::Process process;
    try
    {
        process.spawn(executable, options_.server_args, process_options);
    }
    catch (const ProcessSpawnError& e)
    {
        logger_.error(e.what());
        return failure(e.what());
    }
    handle.attach(process.pid(), process.owns_process_group());

    internal::StderrCollector stderr_collector(process.stderr_pipe(),
                                               options_.executor.max_stderr_bytes,
                                               options_.executor.stderr_callback, logger_);

    protocol::StreamDecoder decoder(WireFormat::Codex, options_.executor.max_buffer_size, logger_);
    internal::ControlTracker tracker(backend_, state, options_.executor.timeouts.plan_write_grace);
    RpcSession session(process, handle, options_, approval, logger_, on_message, decoder, tracker);

    StopDecision decision = StopDecision::Continue;
    std::optional<std::string> failure_text;
    bool server_closed = false;

    try
    {
        session.call("initialize",
                     {{"clientInfo",
                       {{"name", options_.client_name},
                        {"title", options_.client_name},
                        {"version", version_string()}}}});
        session.notify("initialized");

        json thread_params = {{"approvalPolicy", approval}, {"sandbox", sandbox}};
        if (!request.working_directory.empty())
            thread_params["cwd"] = request.working_directory;
        std::optional<std::string> effort;
        if (model.has_value())
        {
            auto parsed = parse_model_effort(*model);
            thread_params["model"] = parsed.first;
            effort = parsed.second;
        }

        json thread_response;
        if (request.resume_session_id.has_value() &&
            backend_.is_valid_session_id(*request.resume_session_id))
        {
            thread_params["threadId"] = *request.resume_session_id;
            thread_response = session.call("thread/resume", thread_params);
        }
        else
        {
            if (request.resume_session_id.has_value())
                logger_.warning("Ignoring malformed thread id: " + *request.resume_session_id);
            thread_response = session.call("thread/start", thread_params);
        }

        std::string thread_id;
        if (thread_response.is_object() && thread_response.contains("thread") &&
            thread_response["thread"].is_object())
            thread_id = thread_response["thread"].value("id", "");
        if (thread_id.empty())
            throw RpcError("Codex app-server returned no thread id", protocol::RPC_INTERNAL_ERROR);
        session.ensure_thread_started(thread_id);

        json turn_params = {
            {"threadId", thread_id},
            {"input", json::array({{{"type", "text"}, {"text", request.prompt}}})}};
        if (effort.has_value())
            turn_params["effort"] = *effort;
        session.call("turn/start", turn_params);

        decision = session.run_turn();
    }
    catch (const AttemptStopped&)
    {
        logger_.debug("Execution " + request.execution_id + " cancelled");
    }
    catch (const ServerClosed& e)
    {
        server_closed = true;
        failure_text = e.what();
    }
    catch (const std::exception& e)
    {
        failure_text = e.what();
    }

    handle.detach();

    // Closing stdin asks the server to exit on its own
    process.stdin_pipe().close();

    const bool early_stop = decision != StopDecision::Continue;
    std::optional<int> exit_code;
    if (!handle.cancelled() && !early_stop && !session.timed_out())
        exit_code = process.wait_for(options_.executor.timeouts.termination_grace);
    if (!exit_code.has_value())
    {
        exit_code =
            subprocess::stop_with_escalation(process, options_.executor.timeouts.termination_grace);
        if (!exit_code.has_value())
            logger_.error("Codex app-server " + std::to_string(process.pid()) +
                          " survived SIGKILL; giving up on it");
    }

    stderr_collector.finish();
    const std::string stderr_text = stderr_collector.text();
    const internal::StreamOutcome& outcome = session.outcome();

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
    }

    result.pending_question = decision == StopDecision::QuestionPending;
    if (decision == StopDecision::PlanReady || decision == StopDecision::PlanGraceExpired)
    {
        result.pending_plan_approval = true;
        result.plan_write_timed_out = decision == StopDecision::PlanGraceExpired;
    }
    if (!result.pending_question)
    {
        try
        {
            result.plan_candidate_text =
                tracker.plan_candidate(decoder.text(), options_.executor.plan_predicate);
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("Plan predicate threw: ") + e.what());
        }
    }

    if (session.timed_out())
        result.error = "Command timed out";
    else if (auto stream_error = outcome.error_text())
        result.error = *stream_error;
    else if (failure_text && !result.was_cancelled)
        result.error = server_closed && !stderr_text.empty() ? stderr_text : *failure_text;

    if (result.was_cancelled && !result.error)
        result.error = "Cancelled";

    result.success = !result.error.has_value() && !result.was_cancelled;
    if (result.error && !result.was_cancelled)
        logger_.warning("Execution " + request.execution_id + " failed: " + *result.error);
    return result;
}

// ============================================================================
// RpcBridge
// ============================================================================

RpcBridge::RpcBridge(ProcessRegistry& registry, RpcBridgeOptions options)
    : impl_(std::make_unique<Impl>(registry, std::move(options)))
{
}

RpcBridge::~RpcBridge() = default;

ExecutionResult RpcBridge::execute(const ExecutionRequest& request,
                                   const MessageCallback& on_message)
{
    return impl_->execute(request, on_message);
}

bool RpcBridge::cancel(const std::string& execution_id)
{
    return impl_->cancel(execution_id);
}

size_t RpcBridge::cancel_by_owner(const std::string& owner_key)
{
    return impl_->cancel_by_owner(owner_key);
}

size_t RpcBridge::cancel_all()
{
    return impl_->cancel_all();
}

void RpcBridge::shutdown()
{
    impl_->shutdown();
}

bool RpcBridge::is_active(const std::string& execution_id) const
{
    return impl_->is_active(execution_id);
}

size_t RpcBridge::active_count() const
{
    return impl_->active_count();
}

} // namespace agentbridge
