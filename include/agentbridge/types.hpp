#ifndef AGENTBRIDGE_TYPES_HPP
#define AGENTBRIDGE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentbridge
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

using Clock = std::chrono::steady_clock;

// Line-delimited event shape a backend emits
enum class WireFormat
{
    Claude, // system / assistant / user / result / error with typed content blocks
    Codex   // item/event shapes: session_start, message, tool_call, tool_result, done,
            // thread.started, item.started, item.completed, turn.completed, ...
};

// ============================================================================
// Tool activity
// ============================================================================

/// One tool invocation requested by the backend agent, paired with its result.
/// Created on the tool-call event; result fields are filled at most once by the
/// matching tool-result event.
struct ToolActivity
{
    std::string id;
    std::string name;
    json input = json::object();
    std::string input_summary;               // One-line summary for status displays
    std::optional<std::string> result;       // Preview (possibly truncated)
    std::optional<std::string> full_result;  // Untruncated result text
    bool is_error = false;
    Clock::time_point started_at = Clock::now();
    std::optional<int64_t> duration_ms;

    bool completed() const
    {
        return result.has_value();
    }
};

// ============================================================================
// Canonical message union
// ============================================================================

// Backend announced (or confirmed) its session
struct InitMessage
{
    std::string session_id;
    json raw;
};

// Assistant text chunk
struct AssistantMessage
{
    std::string text;
    json raw;
};

struct ToolCallMessage
{
    ToolActivity activity;
    json raw;
};

struct ToolResultMessage
{
    ToolActivity activity;
    json raw;
};

// Terminal message of a turn
struct ResultMessage
{
    std::string text;
    std::optional<double> cost;
    std::optional<int64_t> duration_ms;
    std::optional<std::string> session_id;
    bool is_error = false;
    std::vector<std::string> errors;
    bool is_final = true;
    json raw;
};

struct ErrorMessage
{
    std::string text;
    bool is_final = true;
    json raw;
};

using Message = std::variant<InitMessage, AssistantMessage, ToolCallMessage, ToolResultMessage,
                             ResultMessage, ErrorMessage>;

// Helper functions for message type checking
inline bool is_init_message(const Message& msg)
{
    return std::holds_alternative<InitMessage>(msg);
}

inline bool is_assistant_message(const Message& msg)
{
    return std::holds_alternative<AssistantMessage>(msg);
}

inline bool is_tool_call_message(const Message& msg)
{
    return std::holds_alternative<ToolCallMessage>(msg);
}

inline bool is_tool_result_message(const Message& msg)
{
    return std::holds_alternative<ToolResultMessage>(msg);
}

inline bool is_result_message(const Message& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

inline bool is_error_message(const Message& msg)
{
    return std::holds_alternative<ErrorMessage>(msg);
}

// Result, or an Error flagged final
bool is_terminal_message(const Message& msg);

// "init", "assistant", "tool_call", "tool_result", "result" or "error"
std::string message_type_name(const Message& msg);

// ============================================================================
// Execution request / result
// ============================================================================

struct ExecutionRequest
{
    std::string prompt;
    std::string working_directory;
    std::optional<std::string> resume_session_id; // Validated before use, never forwarded raw
    std::string mode;  // Permission mode (Claude) or approval mode (Codex); empty = default
    std::string model; // Empty = backend default
    std::optional<std::string> sandbox_mode; // Codex only
    std::string execution_id;                // Cancellation + state isolation key
    std::string owner_key;                   // Conversation key for bulk cancel / PTY reuse
};

struct ExecutionResult
{
    bool success = false;
    std::string text;
    std::string detailed_text;
    std::optional<std::string> external_session_id;
    std::optional<std::string> error;
    std::optional<double> cost_units;
    std::optional<int64_t> duration_ms;
    std::optional<int> exit_code;
    bool was_cancelled = false;
    bool pending_question = false;
    bool pending_plan_approval = false;
    std::optional<std::string> plan_candidate_text;
    bool plan_write_timed_out = false;
};

// ============================================================================
// Callback types
// ============================================================================

// Invoked once per decoded message, in emission order. Exceptions are logged and ignored.
using MessageCallback = std::function<void(const Message&)>;

// Receives raw stderr lines from a backend process
using StderrCallback = std::function<void(const std::string&)>;

// Decides whether accumulated assistant text is a plan worth presenting for approval
using PlanPredicate = std::function<bool(const std::string&)>;

} // namespace agentbridge

#endif // AGENTBRIDGE_TYPES_HPP
