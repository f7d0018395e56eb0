#include "../internal/text_format.hpp"

#include <agentbridge/backend.hpp>

namespace agentbridge
{

const char* to_string(ControlKind kind)
{
    switch (kind)
    {
    case ControlKind::None:
        return "none";
    case ControlKind::Question:
        return "question";
    case ControlKind::FinishPlanning:
        return "finish_planning";
    case ControlKind::PlanSubtask:
        return "plan_subtask";
    case ControlKind::MarkdownWrite:
        return "markdown_write";
    }
    return "unknown";
}

bool CliBackend::is_session_missing(const std::string& error_text) const
{
    static const char* markers[] = {
        "no conversation found",
        "session not found",
        "thread not found",
        "no rollout found",
    };

    std::string lowered = internal::to_lower(error_text);
    for (const char* marker : markers)
    {
        if (lowered.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

bool CliBackend::is_valid_session_id(const std::string& session_id) const
{
    return internal::is_uuid(session_id);
}

std::pair<std::string, std::optional<std::string>> parse_model_effort(const std::string& model)
{
    static const char* efforts[] = {"minimal", "low", "medium", "high", "xhigh"};

    for (const char* separator : {":", "-"})
    {
        for (const char* effort : efforts)
        {
            std::string suffix = std::string(separator) + effort;
            if (model.size() > suffix.size() && internal::ends_with(model, suffix))
                return {model.substr(0, model.size() - suffix.size()), std::string(effort)};
        }
    }
    return {model, std::nullopt};
}

std::string normalize_approval_mode(const std::string& mode)
{
    std::string normalized = internal::to_lower(mode);
    size_t first = normalized.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "on-request";
    normalized = normalized.substr(first, normalized.find_last_not_of(" \t") - first + 1);

    if (normalized == "on-failure")
        return "on-request";
    return normalized;
}

bool matches_allow_list(const std::string& value, const std::vector<std::string>& allow_list)
{
    for (const auto& entry : allow_list)
    {
        if (!entry.empty() && entry.back() == '*')
        {
            std::string prefix = entry.substr(0, entry.size() - 1);
            if (value.size() > prefix.size() && internal::starts_with(value, prefix))
                return true;
        }
        else if (value == entry)
        {
            return true;
        }
    }
    return false;
}

} // namespace agentbridge
