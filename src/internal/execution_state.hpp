#ifndef AGENTBRIDGE_INTERNAL_EXECUTION_STATE_HPP
#define AGENTBRIDGE_INTERNAL_EXECUTION_STATE_HPP

#include <agentbridge/backend.hpp>
#include <agentbridge/types.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentbridge
{
namespace internal
{

// Control flags of one in-flight execution. Owned by exactly one execution id.
struct ExecutionState
{
    bool exit_plan_detected = false;
    bool ask_question_detected = false;
    std::map<std::string, std::string> pending_writes; // tool id -> path
    std::optional<std::string> plan_subtask_id;
    bool plan_subtask_done = false;
    std::optional<std::string> plan_content_candidate;

    std::optional<std::string> finish_tool_id;
    bool finish_result_seen = false;
    bool plan_finish_failed = false;
    std::optional<std::string> finish_plan_input;     // "plan" argument of the finish tool
    std::optional<std::string> last_markdown_content; // Content of the last *.md write

    std::optional<Clock::time_point> exit_plan_detected_at;
    std::optional<Clock::time_point> ask_question_detected_at;
};

// Mutex-protected map of states keyed by execution id
class ExecutionStateMap
{
  public:
    // nullptr if the id already has a live state
    std::shared_ptr<ExecutionState> create(const std::string& execution_id);
    std::shared_ptr<ExecutionState> find(const std::string& execution_id) const;
    void erase(const std::string& execution_id);
    bool contains(const std::string& execution_id) const;
    size_t size() const;
    std::vector<std::string> ids() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ExecutionState>> states_;
};

enum class StopDecision
{
    Continue,
    QuestionPending, // Stop now: the process would block waiting for an answer
    PlanReady,       // Finish-planning seen and everything it depends on settled
    PlanGraceExpired, // Finish-planning seen, grace elapsed with work still in flight
    PlanFinishFailed // The finish-planning call itself was rejected
};

const char* to_string(StopDecision decision);

// Updates an ExecutionState from decoded messages and decides when to stop early
class ControlTracker
{
  public:
    ControlTracker(const CliBackend& backend, ExecutionState& state, std::chrono::milliseconds grace);

    void observe(const Message& message);

    StopDecision evaluate(Clock::time_point now) const;

    // Plan text to present, by preference: plan sub-task result, finish tool's plan
    // argument, last markdown write, then accumulated text if the predicate accepts it
    std::optional<std::string> plan_candidate(const std::string& accumulated_text,
                                              const PlanPredicate& predicate) const;

  private:
    const CliBackend& backend_;
    ExecutionState& state_;
    std::chrono::milliseconds grace_;
};

} // namespace internal
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_EXECUTION_STATE_HPP
