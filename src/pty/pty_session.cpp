#include "../internal/process_support.hpp"
#include "../internal/stream_decoder.hpp"
#include "../internal/subprocess/pty_process.hpp"
#include "../internal/text_format.hpp"

#include <agentbridge/errors.hpp>
#include <agentbridge/pty.hpp>
#include <algorithm>
#include <regex>
#include <signal.h>

namespace agentbridge
{

// ============================================================================
// Session state
// ============================================================================

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Starting:
        return "starting";
    case SessionState::Idle:
        return "idle";
    case SessionState::Busy:
        return "busy";
    case SessionState::Stopping:
        return "stopping";
    case SessionState::Stopped:
        return "stopped";
    case SessionState::Error:
        return "error";
    }
    return "unknown";
}

bool is_valid_transition(SessionState from, SessionState to)
{
    if (to == SessionState::Error || to == SessionState::Stopping)
        return true;
    return (from == SessionState::Starting && to == SessionState::Idle) ||
           (from == SessionState::Idle && to == SessionState::Busy) ||
           (from == SessionState::Busy && to == SessionState::Idle) ||
           (from == SessionState::Stopping && to == SessionState::Stopped);
}

PTYSessionConfig PTYSessionConfig::from_config(const EngineConfig& config)
{
    PTYSessionConfig session;
    session.startup_timeout = config.timeouts.startup;
    session.inactivity_timeout = config.timeouts.pty_inactivity;
    session.poll_interval = config.timeouts.read_tick;
    session.stop_grace = config.timeouts.pty_stop_grace;
    return session;
}

namespace
{

constexpr size_t MAX_SCREEN_TAIL = 4096;

// Pop complete lines off the front of pending, cleaned of ANSI sequences and CRs
std::vector<std::string> take_lines(std::string& pending)
{
    std::vector<std::string> lines;
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos)
    {
        std::string line = internal::strip_ansi(pending.substr(0, pos));
        pending.erase(0, pos + 1);
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string clean_fragment(const std::string& fragment)
{
    std::string line = internal::strip_ansi(fragment);
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    return line;
}

std::string trim(const std::string& text)
{
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Only JSON-looking lines go to the decoder; terminal chatter would otherwise be
// buffered as an incomplete fragment
bool is_event_line(const std::string& line, const protocol::StreamDecoder& decoder)
{
    std::string trimmed = trim(line);
    if (trimmed.empty())
        return false;
    return trimmed[0] == '{' || trimmed[0] == '[' || decoder.has_buffered_data();
}

} // namespace

// ============================================================================
// PTYSession
// ============================================================================

PTYSession::PTYSession(std::string key, PTYSessionConfig config, Logger logger)
    : key_(std::move(key)), config_(std::move(config)), logger_(logger.with_tag("pty " + key_)),
      created_at_(Clock::now()), last_activity_(created_at_)
{
}

PTYSession::~PTYSession()
{
    if (process_ && process_->is_running())
    {
        process_->kill();
        process_->wait_for(config_.stop_grace);
    }
}

void PTYSession::transition(SessionState to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_valid_transition(state_, to))
        throw InvalidSessionStateError(std::string("Invalid session transition ") +
                                       to_string(state_) + " -> " + to_string(to));
    state_ = to;
}

void PTYSession::touch()
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = Clock::now();
}

bool PTYSession::looks_like_prompt(const std::string& text) const
{
    if (config_.prompt_pattern.empty())
        return false;
    try
    {
        return std::regex_search(text, std::regex(config_.prompt_pattern));
    }
    catch (const std::regex_error& e)
    {
        logger_.warning(std::string("Invalid prompt pattern: ") + e.what());
        return false;
    }
}

void PTYSession::resolve_command(std::string& executable, std::vector<std::string>& args) const
{
    if (!config_.command.empty())
    {
        executable = config_.command;
        args = config_.args;
        return;
    }

    CodexCliBackend backend(config_.backend);
    executable = backend.resolve_executable();

    args = {"--json"};
    args.push_back("--sandbox");
    args.push_back(backend.resolve_sandbox_mode(config_.sandbox_mode, logger_));
    args.push_back("--ask-for-approval");
    args.push_back(backend.resolve_approval_mode(config_.approval_mode, logger_));

    if (auto model = backend.resolve_model(config_.model, logger_))
    {
        auto parsed = parse_model_effort(*model);
        args.push_back("--model");
        args.push_back(parsed.first);
        if (parsed.second)
        {
            args.push_back("-c");
            args.push_back("model_reasoning_effort=\"" + *parsed.second + "\"");
        }
    }

    if (!config_.working_directory.empty())
    {
        args.push_back("--cd");
        args.push_back(config_.working_directory);
    }

    args.insert(args.end(), config_.backend.extra_args.begin(), config_.backend.extra_args.end());
    args.insert(args.end(), config_.args.begin(), config_.args.end());
}

void PTYSession::start()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Starting)
            throw InvalidSessionStateError("Session " + key_ + " was already started");
    }

    auto fail = [this](const std::string& reason)
    {
        if (process_ && process_->is_running())
        {
            process_->kill();
            process_->wait_for(config_.stop_grace);
        }
        transition(SessionState::Error);
        logger_.error("Start failed: " + reason);
        throw SessionStartError("Failed to start PTY session " + key_ + ": " + reason);
    };

    std::string executable;
    std::vector<std::string> args;
    try
    {
        resolve_command(executable, args);

        subprocess::PtyOptions options;
        options.working_directory = config_.working_directory;
        options.environment = config_.environment;
        options.environment["TERM"] = "xterm-256color";
        options.environment["FORCE_COLOR"] = "1";
        options.environment["COLUMNS"] = std::to_string(config_.cols);
        options.environment["LINES"] = std::to_string(config_.rows);
        options.cols = config_.cols;
        options.rows = config_.rows;
        options.echo = config_.echo;

        process_ = std::make_unique<subprocess::PtyProcess>();
        process_->spawn(executable, args, options);
    }
    catch (const AgentBridgeError& e)
    {
        fail(e.what());
    }

    logger_.info("Spawned " + executable + " (pid " + std::to_string(process_->pid()) + ")");

    protocol::StreamDecoder decoder(config_.wire_format, 1024 * 1024, logger_);
    const int poll_ms = static_cast<int>(config_.poll_interval.count());
    const auto deadline = Clock::now() + config_.startup_timeout;
    std::string pending;
    std::string screen;
    bool ready = false;

    try
    {
        while (!ready && Clock::now() < deadline)
        {
            bool eof = false;
            std::string chunk = process_->read_available(poll_ms, eof);
            pending += chunk;
            screen += chunk;
            if (screen.size() > MAX_SCREEN_TAIL)
                screen.erase(0, screen.size() - MAX_SCREEN_TAIL);

            for (const auto& line : take_lines(pending))
            {
                if (is_event_line(line, decoder) && !decoder.feed(line).empty())
                    ready = true;
            }
            if (!ready && looks_like_prompt(clean_fragment(screen)))
                ready = true;

            if (eof && !ready)
            {
                auto code = process_->wait_for(config_.stop_grace);
                fail("process exited during startup" +
                     (code ? " with code " + std::to_string(*code) : std::string()) +
                     (screen.empty() ? std::string() : ": " + trim(clean_fragment(screen))));
            }
        }

        if (!ready)
            fail("no readiness marker within " +
                 std::to_string(config_.startup_timeout.count()) + "ms");

        // Residual boot output must not leak into the first response
        const auto flush_until = Clock::now() + config_.startup_flush;
        while (Clock::now() < flush_until)
        {
            bool eof = false;
            pending += process_->read_available(poll_ms, eof);
            for (const auto& line : take_lines(pending))
            {
                if (is_event_line(line, decoder))
                    decoder.feed(line);
            }
            if (eof)
                fail("process exited right after startup");
        }
    }
    catch (const SessionStartError&)
    {
        throw;
    }
    catch (const AgentBridgeError& e)
    {
        fail(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (decoder.session_id())
            external_session_id_ = decoder.session_id();
    }
    transition(SessionState::Idle);
    touch();
    logger_.info("Session ready");
}

ExecutionResult PTYSession::send(const std::string& text, const MessageCallback& on_message,
                                 std::optional<milliseconds> timeout)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle)
            throw InvalidSessionStateError("Session " + key_ + " is " + to_string(state_) +
                                           ", not idle");
        state_ = SessionState::Busy;
        last_activity_ = Clock::now();
    }
    interrupted_ = false;

    protocol::StreamDecoder decoder(config_.wire_format, 1024 * 1024, logger_);
    internal::StreamOutcome outcome;
    std::string plain;
    std::string pending;

    auto handle_line = [&](const std::string& line)
    {
        if (is_event_line(line, decoder))
        {
            for (const auto& message : decoder.feed(line))
            {
                internal::deliver_message(on_message, message, logger_);
                outcome.record(message, logger_);
            }
            return;
        }
        std::string trimmed = trim(line);
        if (!trimmed.empty())
        {
            if (!plain.empty())
                plain += "\n";
            plain += trimmed;
        }
    };

    const auto limit = timeout.value_or(config_.response_timeout);
    const int poll_ms = static_cast<int>(config_.poll_interval.count());
    const auto started = Clock::now();
    auto last_output = started;
    bool got_output = false;
    bool timed_out = false;
    bool died = false;
    bool cancelled = false;
    std::optional<std::string> io_error;

    try
    {
        process_->write(text + "\n");

        while (!outcome.reached_final)
        {
            if (interrupted_)
            {
                cancelled = true;
                break;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ == SessionState::Stopping || state_ == SessionState::Stopped)
                {
                    died = true;
                    break;
                }
            }
            if (Clock::now() - started > limit)
            {
                timed_out = true;
                break;
            }

            bool eof = false;
            std::string chunk = process_->read_available(poll_ms, eof);
            if (!chunk.empty())
            {
                got_output = true;
                last_output = Clock::now();
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    last_activity_ = last_output;
                }
                pending += chunk;
                for (const auto& line : take_lines(pending))
                {
                    handle_line(line);
                    if (outcome.reached_final)
                        break;
                }
            }
            if (eof)
            {
                if (interrupted_)
                    cancelled = true;
                else
                    died = true;
                break;
            }
            // Silence after output means the response is complete
            if (chunk.empty() && got_output &&
                Clock::now() - last_output >= config_.inactivity_timeout)
                break;
        }
    }
    catch (const std::exception& e)
    {
        io_error = e.what();
    }

    if (!pending.empty() && !outcome.reached_final)
        handle_line(clean_fragment(pending));

    ExecutionResult result;
    result.text = decoder.text().empty() ? plain : decoder.text();
    result.detailed_text = decoder.detailed_text().empty() ? plain : decoder.detailed_text();
    if (const auto& final_result = outcome.final_result)
    {
        result.cost_units = final_result->cost;
        result.duration_ms = final_result->duration_ms;
    }

    SessionState next = SessionState::Idle;
    if (timed_out)
    {
        result.error = "Command timed out after " +
                       std::to_string(std::chrono::duration_cast<std::chrono::seconds>(limit).count()) +
                       " seconds";
        next = SessionState::Error;
    }
    else if (io_error)
    {
        result.error = *io_error;
        next = SessionState::Error;
    }
    else if (died)
    {
        result.error = "Session process terminated unexpectedly";
        next = SessionState::Error;
    }
    else if (cancelled)
    {
        result.was_cancelled = true;
        result.error = "Cancelled";
    }
    else if (auto stream_error = outcome.error_text())
    {
        result.error = *stream_error;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<std::string> session_id = decoder.session_id();
        if (outcome.final_result && outcome.final_result->session_id)
            session_id = outcome.final_result->session_id;
        if (session_id)
            external_session_id_ = session_id;
        result.external_session_id = external_session_id_;

        // A concurrent terminate() owns the state from here on
        if (state_ == SessionState::Busy)
            state_ = next;
        last_activity_ = Clock::now();
    }

    result.success = !result.error.has_value() && !result.was_cancelled;
    if (result.error && !result.was_cancelled)
        logger_.warning("Send failed: " + *result.error);
    return result;
}

bool PTYSession::interrupt()
{
    if (!is_alive())
        return false;
    // Flag first: Ctrl-C may end the program before send() sees another read
    interrupted_ = true;
    try
    {
        process_->write("\x03");
    }
    catch (const AgentBridgeError& e)
    {
        interrupted_ = false;
        logger_.warning(std::string("Interrupt failed: ") + e.what());
        return false;
    }
    touch();
    return true;
}

void PTYSession::terminate()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Another caller already owns the shutdown
        if (state_ == SessionState::Stopping || state_ == SessionState::Stopped)
            return;
        state_ = SessionState::Stopping;
    }

    if (process_ && process_->is_running())
    {
        try
        {
            process_->write(config_.exit_command + "\n");
        }
        catch (const AgentBridgeError& e)
        {
            logger_.debug(std::string("Exit command not delivered: ") + e.what());
        }

        if (!process_->wait_for(config_.stop_grace))
        {
            try
            {
                process_->write("\x03");
            }
            catch (const AgentBridgeError& e)
            {
                logger_.debug(std::string("Ctrl-C not delivered: ") + e.what());
            }
            process_->send_signal(SIGINT);

            if (!process_->wait_for(config_.stop_grace))
            {
                process_->kill();
                if (!process_->wait_for(config_.stop_grace))
                    logger_.error("Process " + std::to_string(process_->pid()) +
                                  " did not exit after SIGKILL");
            }
        }
    }
    else if (process_)
    {
        process_->try_wait();
    }

    transition(SessionState::Stopped);
    logger_.info("Session stopped");
}

void PTYSession::resize(int rows, int cols)
{
    config_.rows = rows;
    config_.cols = cols;
    if (process_)
        process_->resize(rows, cols);
}

SessionState PTYSession::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PTYSession::is_alive() const
{
    return process_ && process_->is_running();
}

std::optional<std::string> PTYSession::external_session_id() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return external_session_id_;
}

Clock::time_point PTYSession::last_activity() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

int PTYSession::pid() const
{
    return process_ ? process_->pid() : 0;
}

SessionInfo PTYSession::info() const
{
    SessionInfo info;
    info.key = key_;
    info.working_directory = config_.working_directory;
    info.created_at = created_at_;
    info.alive = is_alive();
    info.pid = pid();

    std::lock_guard<std::mutex> lock(mutex_);
    info.external_session_id = external_session_id_;
    info.state = state_;
    info.last_activity = last_activity_;
    info.idle_for =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_activity_);
    return info;
}

} // namespace agentbridge
