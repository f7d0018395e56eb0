#include "../internal/cli_verification.hpp"
#include "../internal/text_format.hpp"

#include <agentbridge/backend.hpp>
#include <algorithm>
#include <cstdlib>

namespace agentbridge
{

CodexCliBackend::CodexCliBackend(CodexBackendOptions options) : options_(std::move(options)) {}

const std::vector<std::string>& CodexCliBackend::sandbox_modes()
{
    static const std::vector<std::string> modes = {"read-only", "workspace-write",
                                                   "danger-full-access"};
    return modes;
}

const std::vector<std::string>& CodexCliBackend::approval_modes()
{
    static const std::vector<std::string> modes = {"untrusted", "on-request", "never"};
    return modes;
}

std::string CodexCliBackend::resolve_executable() const
{
    std::vector<std::filesystem::path> fallbacks;
    if (const char* home = std::getenv("HOME"))
        fallbacks.push_back(std::filesystem::path(home) / ".local" / "bin" / "codex");

    return internal::locate_cli(options_.location, "CODEX_CLI_PATH", "codex", fallbacks,
                                "Please install: npm install -g @openai/codex");
}

std::string CodexCliBackend::resolve_sandbox_mode(const std::optional<std::string>& requested,
                                                  const Logger& logger) const
{
    if (!requested || requested->empty())
        return options_.default_sandbox_mode;

    const auto& modes = sandbox_modes();
    if (std::find(modes.begin(), modes.end(), *requested) == modes.end())
    {
        logger.warning("Invalid sandbox mode: " + *requested + ", using " +
                       options_.default_sandbox_mode);
        return options_.default_sandbox_mode;
    }
    return *requested;
}

std::string CodexCliBackend::resolve_approval_mode(const std::string& requested,
                                                   const Logger& logger) const
{
    if (requested.empty())
        return normalize_approval_mode(options_.default_approval_mode);

    std::string mode = normalize_approval_mode(requested);
    const auto& modes = approval_modes();
    if (std::find(modes.begin(), modes.end(), mode) == modes.end())
    {
        logger.warning("Invalid approval mode: " + requested + ", using " +
                       options_.default_approval_mode);
        return normalize_approval_mode(options_.default_approval_mode);
    }
    return mode;
}

std::optional<std::string> CodexCliBackend::resolve_model(const std::string& requested,
                                                          const Logger& logger) const
{
    std::string model = requested.empty() ? options_.default_model : requested;
    if (model.empty())
        return std::nullopt;

    std::string base = parse_model_effort(model).first;
    if (!matches_allow_list(base, options_.allowed_models))
    {
        logger.warning("Unknown model: " + model +
                       (options_.default_model.empty() ? ", using CLI default"
                                                       : ", using " + options_.default_model));
        if (options_.default_model.empty() || options_.default_model == model)
            return std::nullopt;
        return options_.default_model;
    }
    return model;
}

std::vector<std::string> CodexCliBackend::build_arguments(const ExecutionRequest& request,
                                                          const Logger& logger) const
{
    std::vector<std::string> args = {"exec"};

    if (request.resume_session_id && !request.resume_session_id->empty())
    {
        if (is_valid_session_id(*request.resume_session_id))
        {
            args.push_back("resume");
            args.push_back(*request.resume_session_id);
        }
        else
        {
            logger.warning("Invalid session ID format: " + *request.resume_session_id +
                           ", ignoring resume");
        }
    }

    args.push_back("--json");

    if (auto model = resolve_model(request.model, logger))
    {
        auto [base, effort] = parse_model_effort(*model);
        args.push_back("--model");
        args.push_back(base);
        if (effort)
        {
            args.push_back("-c");
            args.push_back("model_reasoning_effort=\"" + *effort + "\"");
        }
    }

    args.push_back("--sandbox");
    args.push_back(resolve_sandbox_mode(request.sandbox_mode, logger));

    if (resolve_approval_mode(request.mode, logger) == "never")
        args.push_back("--full-auto");

    if (!request.working_directory.empty())
    {
        args.push_back("--cd");
        args.push_back(request.working_directory);
    }

    args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());

    args.push_back("--");
    args.push_back(request.prompt);
    return args;
}

ControlKind CodexCliBackend::classify_tool_call(const ToolActivity& activity) const
{
    std::string name = internal::to_lower(activity.name);
    if (name == "request_user_input" || name == "ask_user_question" ||
        name == "askuserquestion")
        return ControlKind::Question;
    return ControlKind::None;
}

std::string CodexCliBackend::auto_approve_mode() const
{
    return "never";
}

} // namespace agentbridge
