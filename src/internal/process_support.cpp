#include "process_support.hpp"

#include <signal.h>

namespace agentbridge
{
namespace internal
{

// ============================================================================
// ProcessCancelHandle
// ============================================================================

void ProcessCancelHandle::attach(int pid, bool group)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    group_ = group;
}

void ProcessCancelHandle::detach()
{
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = 0;
}

void ProcessCancelHandle::cancel()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if (pid_ > 0)
        subprocess::signal_process(pid_, group_, SIGTERM);
}

// ============================================================================
// StderrCollector
// ============================================================================

StderrCollector::StderrCollector(subprocess::ReadPipe& pipe, size_t max_bytes,
                                 std::optional<StderrCallback> callback, Logger logger)
    : pipe_(pipe), max_bytes_(max_bytes), callback_(std::move(callback)),
      logger_(std::move(logger))
{
    thread_ = std::thread(&StderrCollector::run, this);
}

StderrCollector::~StderrCollector()
{
    finish();
}

void StderrCollector::run()
{
    char buffer[4096];
    try
    {
        while (!stop_)
        {
            if (!pipe_.has_data(50))
                continue;
            size_t n = pipe_.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF
            consume(buffer, n);
        }

        // Drain whatever is already buffered without waiting for more
        while (pipe_.is_open() && pipe_.has_data(0))
        {
            size_t n = pipe_.read(buffer, sizeof(buffer));
            if (n == 0)
                break;
            consume(buffer, n);
        }
    }
    catch (const std::exception& e)
    {
        logger_.debug(std::string("stderr reader stopped: ") + e.what());
    }

    if (!partial_.empty())
        emit_line(std::move(partial_));
    partial_.clear();
}

void StderrCollector::consume(const char* data, size_t size)
{
    partial_.append(data, size);

    size_t pos;
    while ((pos = partial_.find('\n')) != std::string::npos)
    {
        std::string line = partial_.substr(0, pos);
        partial_.erase(0, pos + 1);
        emit_line(std::move(line));
    }

    // Unterminated output cannot grow past the retention cap
    if (partial_.size() >= max_bytes_)
    {
        emit_line(partial_.substr(0, max_bytes_));
        partial_.clear();
    }
}

void StderrCollector::emit_line(std::string line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    if (line.empty())
        return;

    logger_.debug("stderr: " + line);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!collected_.empty())
            collected_ += "\n";
        collected_ += line;
        if (collected_.size() > max_bytes_)
            collected_.erase(0, collected_.size() - max_bytes_);
    }

    if (callback_.has_value() && *callback_)
    {
        try
        {
            (*callback_)(line);
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("stderr callback threw: ") + e.what());
        }
    }
}

void StderrCollector::finish()
{
    stop_ = true;
    if (thread_.joinable())
        thread_.join();
}

std::string StderrCollector::text() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return collected_;
}

// ============================================================================
// StreamOutcome
// ============================================================================

void StreamOutcome::record(const Message& message, const Logger& logger)
{
    if (auto* result = std::get_if<ResultMessage>(&message))
        final_result = *result;
    else if (auto* error = std::get_if<ErrorMessage>(&message))
    {
        if (error->is_final)
            final_error = *error;
        else
            logger.warning(error->text);
    }

    if (is_terminal_message(message))
        reached_final = true;
}

std::optional<std::string> StreamOutcome::error_text() const
{
    if (final_error)
        return final_error->text;
    if (!final_result || !final_result->is_error)
        return std::nullopt;

    if (!final_result->errors.empty())
    {
        std::string joined;
        for (const auto& err : final_result->errors)
        {
            if (!joined.empty())
                joined += "; ";
            joined += err;
        }
        return joined;
    }
    if (!final_result->text.empty())
        return final_result->text;
    return std::string("Execution failed");
}

// ============================================================================
// Callback delivery
// ============================================================================

void deliver_message(const MessageCallback& callback, const Message& message,
                     const Logger& logger)
{
    if (!callback)
        return;

    try
    {
        callback(message);
    }
    catch (const std::exception& e)
    {
        logger.warning("Message callback threw on " + message_type_name(message) +
                       " message: " + e.what());
    }
}

} // namespace internal
} // namespace agentbridge
