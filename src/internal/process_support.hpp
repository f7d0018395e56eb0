#ifndef AGENTBRIDGE_INTERNAL_PROCESS_SUPPORT_HPP
#define AGENTBRIDGE_INTERNAL_PROCESS_SUPPORT_HPP

#include "subprocess/process.hpp"

#include <agentbridge/log.hpp>
#include <agentbridge/registry.hpp>
#include <agentbridge/types.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace agentbridge
{
namespace internal
{

// Registry handle for a child process. Lives across retry attempts; the current
// process is attached while it runs and detached before it is reaped, so a late
// cancel() can never signal a recycled pid.
class ProcessCancelHandle : public Cancellable
{
  public:
    void attach(int pid, bool group);
    void detach();

    void cancel() override;

    bool cancelled() const
    {
        return cancelled_.load();
    }

  private:
    std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    int pid_ = 0;
    bool group_ = false;
};

// Drains a child's stderr on a background thread, forwarding lines to an optional
// callback and keeping the most recent bytes for error reporting
class StderrCollector
{
  public:
    StderrCollector(subprocess::ReadPipe& pipe, size_t max_bytes,
                    std::optional<StderrCallback> callback, Logger logger);
    ~StderrCollector();

    StderrCollector(const StderrCollector&) = delete;
    StderrCollector& operator=(const StderrCollector&) = delete;

    // Stop reading (after draining what is already buffered) and join
    void finish();

    // Collected stderr, trimmed
    std::string text() const;

  private:
    void run();
    void consume(const char* data, size_t size);
    void emit_line(std::string line);

    subprocess::ReadPipe& pipe_;
    size_t max_bytes_;
    std::optional<StderrCallback> callback_;
    Logger logger_;

    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_;
    std::string collected_;
    std::string partial_;
    std::thread thread_;
};

// Terminal messages seen while pumping one attempt
struct StreamOutcome
{
    std::optional<ResultMessage> final_result;
    std::optional<ErrorMessage> final_error;
    bool reached_final = false;

    // Remember results and final errors; non-final errors are only logged
    void record(const Message& message, const Logger& logger);

    // Error text implied by the terminal messages, if any
    std::optional<std::string> error_text() const;
};

// Invoke the caller's callback; exceptions are logged and swallowed so one bad
// handler cannot abort the stream
void deliver_message(const MessageCallback& callback, const Message& message,
                     const Logger& logger);

} // namespace internal
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_PROCESS_SUPPORT_HPP
