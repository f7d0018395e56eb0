#ifndef AGENTBRIDGE_BACKEND_HPP
#define AGENTBRIDGE_BACKEND_HPP

#include <agentbridge/log.hpp>
#include <agentbridge/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentbridge
{

// Role a tool call plays in the execution control flow
enum class ControlKind
{
    None,
    Question,       // Agent asks the human something; the process cannot receive the answer
    FinishPlanning, // Agent requests plan approval
    PlanSubtask,    // Sub-task whose result text is the plan
    MarkdownWrite   // File write of a *.md document (often the plan file)
};

const char* to_string(ControlKind kind);

// Where and how to find a backend executable
struct CliLocation
{
    std::string cli_path;                       // Explicit path; wins over everything
    std::vector<std::string> allowed_cli_paths; // Empty = any path
    std::optional<std::string> cli_hash_sha256; // Pin the binary's contents
};

// Strategy for one backend CLI: discovery, argument construction, wire format and
// the naming of its control tools
class CliBackend
{
  public:
    virtual ~CliBackend() = default;

    virtual std::string name() const = 0;
    virtual WireFormat wire_format() const = 0;

    // Absolute path of the CLI; throws CLINotFoundError
    virtual std::string resolve_executable() const = 0;

    // Full argument list (without argv[0]); the prompt is always last.
    // Invalid resume ids, modes and models are replaced or dropped with a warning.
    virtual std::vector<std::string> build_arguments(const ExecutionRequest& request,
                                                     const Logger& logger) const = 0;

    virtual ControlKind classify_tool_call(const ToolActivity& activity) const = 0;

    // Mode that approves everything without asking
    virtual std::string auto_approve_mode() const = 0;

    // True if the error text says the resumed conversation no longer exists
    virtual bool is_session_missing(const std::string& error_text) const;

    // External session ids accepted for resume
    virtual bool is_valid_session_id(const std::string& session_id) const;
};

// ============================================================================
// Claude CLI
// ============================================================================

struct ClaudeBackendOptions
{
    CliLocation location;
    std::string default_mode = "bypassPermissions";
    std::string default_model; // Empty = let the CLI choose
    // Exact names, or prefixes ending in '*'
    std::vector<std::string> allowed_models = {"opus", "sonnet", "haiku", "opusplan",
                                               "claude-*"};
    std::vector<std::string> extra_args;
};

class ClaudeCliBackend : public CliBackend
{
  public:
    explicit ClaudeCliBackend(ClaudeBackendOptions options = {});

    std::string name() const override
    {
        return "claude";
    }

    WireFormat wire_format() const override
    {
        return WireFormat::Claude;
    }

    std::string resolve_executable() const override;
    std::vector<std::string> build_arguments(const ExecutionRequest& request,
                                             const Logger& logger) const override;
    ControlKind classify_tool_call(const ToolActivity& activity) const override;
    std::string auto_approve_mode() const override;

    static const std::vector<std::string>& permission_modes();

    const ClaudeBackendOptions& options() const
    {
        return options_;
    }

  private:
    ClaudeBackendOptions options_;
};

// ============================================================================
// Codex CLI
// ============================================================================

struct CodexBackendOptions
{
    CliLocation location;
    std::string default_sandbox_mode = "workspace-write";
    std::string default_approval_mode = "on-request";
    std::string default_model;
    // Base model names (effort suffix stripped), or prefixes ending in '*'
    std::vector<std::string> allowed_models = {
        "gpt-5.3-codex", "gpt-5.2-codex",      "gpt-5.1-codex-max", "gpt-5.2",
        "gpt-5.1-codex-mini", "gpt-5-codex",   "gpt-5",             "o3",
        "o4-mini"};
    std::vector<std::string> extra_args;
};

class CodexCliBackend : public CliBackend
{
  public:
    explicit CodexCliBackend(CodexBackendOptions options = {});

    std::string name() const override
    {
        return "codex";
    }

    WireFormat wire_format() const override
    {
        return WireFormat::Codex;
    }

    std::string resolve_executable() const override;
    std::vector<std::string> build_arguments(const ExecutionRequest& request,
                                             const Logger& logger) const override;
    ControlKind classify_tool_call(const ToolActivity& activity) const override;
    std::string auto_approve_mode() const override;

    // Validated sandbox / approval / model values, shared with the RPC bridge and PTY path
    std::string resolve_sandbox_mode(const std::optional<std::string>& requested,
                                     const Logger& logger) const;
    std::string resolve_approval_mode(const std::string& requested, const Logger& logger) const;
    std::optional<std::string> resolve_model(const std::string& requested,
                                             const Logger& logger) const;

    static const std::vector<std::string>& sandbox_modes();
    static const std::vector<std::string>& approval_modes();

    const CodexBackendOptions& options() const
    {
        return options_;
    }

  private:
    CodexBackendOptions options_;
};

// ============================================================================
// Helpers
// ============================================================================

// "gpt-5.2-codex:high" or "gpt-5.2-codex-high" -> ("gpt-5.2-codex", "high");
// no recognised suffix -> (model, nullopt)
std::pair<std::string, std::optional<std::string>> parse_model_effort(const std::string& model);

// Empty and deprecated "on-failure" map to "on-request"; otherwise lower-cased
std::string normalize_approval_mode(const std::string& mode);

// Exact match, or prefix match for entries ending in '*'
bool matches_allow_list(const std::string& value, const std::vector<std::string>& allow_list);

} // namespace agentbridge

#endif // AGENTBRIDGE_BACKEND_HPP
