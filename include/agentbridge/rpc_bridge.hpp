#ifndef AGENTBRIDGE_RPC_BRIDGE_HPP
#define AGENTBRIDGE_RPC_BRIDGE_HPP

#include <agentbridge/backend.hpp>
#include <agentbridge/executor.hpp>
#include <agentbridge/registry.hpp>
#include <agentbridge/types.hpp>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentbridge
{

// Server asks whether an action may proceed. The future resolves to the decision
// payload ({"decision": ...}) or to a bare boolean; nullopt or anything else falls
// back to the default decision.
using ApprovalCallback =
    std::function<std::future<std::optional<json>>(const std::string& method, const json& params)>;

// Server asks the human a free-form question. The future resolves to the answer
// payload ({"answers": {...}}); nullopt or a non-object falls back to empty answers.
using UserInputCallback = std::function<std::future<std::optional<json>>(
    const std::string& request_id, const json& params)>;

struct RpcBridgeOptions
{
    // Executable discovery plus sandbox / approval / model validation
    CodexBackendOptions backend;
    ExecutorOptions executor;

    std::vector<std::string> server_args = {"app-server"};
    std::string client_name = "agentbridge";

    std::optional<ApprovalCallback> on_approval_request;
    std::optional<UserInputCallback> on_user_input_request;
};

// Drives `codex app-server` over newline-delimited JSON-RPC 2.0 on its stdio.
// One server process per execute() call: initialize, start or resume a thread,
// start a turn, then pump notifications until the turn completes or fails.
class RpcBridge : public Executor
{
  public:
    RpcBridge(ProcessRegistry& registry, RpcBridgeOptions options = {});
    ~RpcBridge() override;

    RpcBridge(const RpcBridge&) = delete;
    RpcBridge& operator=(const RpcBridge&) = delete;

    ExecutionResult execute(const ExecutionRequest& request,
                            const MessageCallback& on_message = nullptr) override;

    bool cancel(const std::string& execution_id) override;
    size_t cancel_by_owner(const std::string& owner_key) override;
    size_t cancel_all() override;
    void shutdown() override;

    bool is_active(const std::string& execution_id) const;
    size_t active_count() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Approval helpers
// ============================================================================

// Decision payload for a method: approve/decline for skills, approved/denied for the
// legacy exec/patch methods, accept/decline otherwise
json approval_payload(const std::string& method, bool approved);

// Used when no callback answers: accept only in unattended ("never") approval mode
json default_approval_payload(const std::string& method, const std::string& approval_mode);

// Tool name and input text for presenting an approval request to a human
std::pair<std::string, std::optional<std::string>>
describe_approval_request(const std::string& method, const json& params);

bool is_approval_method(const std::string& method);

} // namespace agentbridge

#endif // AGENTBRIDGE_RPC_BRIDGE_HPP
