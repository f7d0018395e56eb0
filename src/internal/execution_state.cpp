#include "execution_state.hpp"

namespace agentbridge
{
namespace internal
{

// ============================================================================
// ExecutionStateMap
// ============================================================================

std::shared_ptr<ExecutionState> ExecutionStateMap::create(const std::string& execution_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (states_.count(execution_id) != 0)
        return nullptr;

    auto state = std::make_shared<ExecutionState>();
    states_[execution_id] = state;
    return state;
}

std::shared_ptr<ExecutionState> ExecutionStateMap::find(const std::string& execution_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(execution_id);
    return it == states_.end() ? nullptr : it->second;
}

void ExecutionStateMap::erase(const std::string& execution_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(execution_id);
}

bool ExecutionStateMap::contains(const std::string& execution_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.count(execution_id) != 0;
}

size_t ExecutionStateMap::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

std::vector<std::string> ExecutionStateMap::ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(states_.size());
    for (const auto& entry : states_)
        ids.push_back(entry.first);
    return ids;
}

// ============================================================================
// ControlTracker
// ============================================================================

namespace
{

std::optional<std::string> string_input(const json& input, const char* key)
{
    auto it = input.find(key);
    if (it == input.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

} // namespace

const char* to_string(StopDecision decision)
{
    switch (decision)
    {
    case StopDecision::Continue:
        return "continue";
    case StopDecision::QuestionPending:
        return "question pending";
    case StopDecision::PlanReady:
        return "plan ready for approval";
    case StopDecision::PlanGraceExpired:
        return "plan ready, grace period expired";
    case StopDecision::PlanFinishFailed:
        return "plan finish failed";
    }
    return "unknown";
}

ControlTracker::ControlTracker(const CliBackend& backend, ExecutionState& state,
                               std::chrono::milliseconds grace)
    : backend_(backend), state_(state), grace_(grace)
{
}

void ControlTracker::observe(const Message& message)
{
    if (auto* call = std::get_if<ToolCallMessage>(&message))
    {
        const ToolActivity& activity = call->activity;
        switch (backend_.classify_tool_call(activity))
        {
        case ControlKind::Question:
            if (!state_.ask_question_detected)
                state_.ask_question_detected_at = Clock::now();
            state_.ask_question_detected = true;
            break;
        case ControlKind::FinishPlanning:
            if (!state_.exit_plan_detected)
                state_.exit_plan_detected_at = Clock::now();
            state_.exit_plan_detected = true;
            state_.finish_tool_id = activity.id;
            state_.finish_result_seen = false;
            if (auto plan = string_input(activity.input, "plan"))
                state_.finish_plan_input = plan;
            break;
        case ControlKind::PlanSubtask:
            state_.plan_subtask_id = activity.id;
            state_.plan_subtask_done = false;
            break;
        case ControlKind::MarkdownWrite:
            state_.pending_writes[activity.id] =
                string_input(activity.input, "file_path").value_or("");
            if (auto content = string_input(activity.input, "content"))
                state_.last_markdown_content = content;
            break;
        case ControlKind::None:
            break;
        }
        return;
    }

    if (auto* result = std::get_if<ToolResultMessage>(&message))
    {
        const ToolActivity& activity = result->activity;

        if (state_.plan_subtask_id && *state_.plan_subtask_id == activity.id)
        {
            state_.plan_subtask_done = true;
            if (!activity.is_error && activity.full_result && !activity.full_result->empty())
                state_.plan_content_candidate = activity.full_result;
        }

        state_.pending_writes.erase(activity.id);

        if (state_.finish_tool_id && *state_.finish_tool_id == activity.id)
        {
            state_.finish_result_seen = true;
            if (activity.is_error)
                state_.plan_finish_failed = true;
        }
    }
}

StopDecision ControlTracker::evaluate(Clock::time_point now) const
{
    if (state_.ask_question_detected)
        return StopDecision::QuestionPending;

    if (!state_.exit_plan_detected)
        return StopDecision::Continue;

    if (state_.plan_finish_failed)
        return StopDecision::PlanFinishFailed;

    bool subtask_running = state_.plan_subtask_id && !state_.plan_subtask_done;
    bool writes_pending = !state_.pending_writes.empty();
    bool finish_pending = state_.finish_tool_id && !state_.finish_result_seen;

    if (!subtask_running && !writes_pending && !finish_pending)
        return StopDecision::PlanReady;

    if (state_.exit_plan_detected_at && now - *state_.exit_plan_detected_at >= grace_)
        return (subtask_running || writes_pending) ? StopDecision::PlanGraceExpired
                                                   : StopDecision::PlanReady;

    return StopDecision::Continue;
}

std::optional<std::string> ControlTracker::plan_candidate(const std::string& accumulated_text,
                                                          const PlanPredicate& predicate) const
{
    if (state_.plan_content_candidate)
        return state_.plan_content_candidate;
    if (state_.finish_plan_input && !state_.finish_plan_input->empty())
        return state_.finish_plan_input;
    if (state_.last_markdown_content && !state_.last_markdown_content->empty())
        return state_.last_markdown_content;

    if (predicate && !accumulated_text.empty() && predicate(accumulated_text))
        return accumulated_text;
    return std::nullopt;
}

} // namespace internal
} // namespace agentbridge
