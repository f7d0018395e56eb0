#include "../internal/cli_verification.hpp"
#include "../internal/text_format.hpp"

#include <agentbridge/backend.hpp>
#include <algorithm>
#include <cstdlib>

namespace agentbridge
{

ClaudeCliBackend::ClaudeCliBackend(ClaudeBackendOptions options) : options_(std::move(options)) {}

const std::vector<std::string>& ClaudeCliBackend::permission_modes()
{
    static const std::vector<std::string> modes = {
        "acceptEdits", "bypassPermissions", "default", "delegate", "dontAsk", "plan",
    };
    return modes;
}

std::string ClaudeCliBackend::resolve_executable() const
{
    std::vector<std::filesystem::path> fallbacks;
    if (const char* home = std::getenv("HOME"))
        fallbacks.push_back(std::filesystem::path(home) / ".claude" / "local" / "claude");

    return internal::locate_cli(options_.location, "CLAUDE_CLI_PATH", "claude", fallbacks,
                                "Please install: npm install -g @anthropic-ai/claude-code");
}

std::vector<std::string> ClaudeCliBackend::build_arguments(const ExecutionRequest& request,
                                                           const Logger& logger) const
{
    std::vector<std::string> args = {"-p", "--verbose", "--output-format", "stream-json"};

    if (request.resume_session_id && !request.resume_session_id->empty())
    {
        if (is_valid_session_id(*request.resume_session_id))
        {
            args.push_back("--resume");
            args.push_back(*request.resume_session_id);
        }
        else
        {
            logger.warning("Invalid session ID format: " + *request.resume_session_id +
                           ", ignoring resume");
        }
    }

    std::string mode = request.mode;
    const auto& modes = permission_modes();
    if (mode.empty())
    {
        mode = options_.default_mode;
    }
    else if (std::find(modes.begin(), modes.end(), mode) == modes.end())
    {
        logger.warning("Invalid permission mode: " + mode + ", using " + options_.default_mode);
        mode = options_.default_mode;
    }
    if (!mode.empty())
    {
        args.push_back("--permission-mode");
        args.push_back(mode);
    }

    std::string model = request.model.empty() ? options_.default_model : request.model;
    if (!model.empty() && !matches_allow_list(model, options_.allowed_models))
    {
        logger.warning("Unknown model: " + model +
                       (options_.default_model.empty() ? ", using CLI default"
                                                       : ", using " + options_.default_model));
        model = options_.default_model;
    }
    if (!model.empty())
    {
        args.push_back("--model");
        args.push_back(model);
    }

    args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());

    args.push_back("--");
    args.push_back(request.prompt);
    return args;
}

ControlKind ClaudeCliBackend::classify_tool_call(const ToolActivity& activity) const
{
    if (activity.name == "AskUserQuestion")
        return ControlKind::Question;
    if (activity.name == "ExitPlanMode")
        return ControlKind::FinishPlanning;

    if (activity.name == "Task")
    {
        auto it = activity.input.find("subagent_type");
        if (it != activity.input.end() && it->is_string() &&
            internal::to_lower(it->get<std::string>()) == "plan")
            return ControlKind::PlanSubtask;
        return ControlKind::None;
    }

    if (activity.name == "Write" || activity.name == "Edit" || activity.name == "MultiEdit")
    {
        auto it = activity.input.find("file_path");
        if (it != activity.input.end() && it->is_string() &&
            internal::ends_with(internal::to_lower(it->get<std::string>()), ".md"))
            return ControlKind::MarkdownWrite;
    }

    return ControlKind::None;
}

std::string ClaudeCliBackend::auto_approve_mode() const
{
    return "bypassPermissions";
}

} // namespace agentbridge
