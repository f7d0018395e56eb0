// One turn against a backend CLI, resumed from the last run of the same owner.
//
//   quick_start [claude|codex|codex-rpc] "prompt"
//
// The latest session id per owner is kept in .agentbridge_sessions.json so a
// second invocation continues the same conversation.

#include <agentbridge/agentbridge.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

constexpr bool TIMING = true;
constexpr bool VERBOSE = false;

namespace
{

std::unique_ptr<agentbridge::Executor> make_executor(const std::string& backend,
                                                     agentbridge::ProcessRegistry& registry,
                                                     const agentbridge::ExecutorOptions& options)
{
    if (backend == "claude")
        return agentbridge::make_claude_executor(registry, {}, options);
    if (backend == "codex")
        return agentbridge::make_codex_executor(registry, {}, options);
    if (backend == "codex-rpc")
    {
        agentbridge::RpcBridgeOptions rpc;
        rpc.executor = options;
        return std::make_unique<agentbridge::RpcBridge>(registry, rpc);
    }
    return nullptr;
}

} // namespace

int main(int argc, char** argv)
{
    std::cout << "agentbridge version: " << agentbridge::version_string() << "\n\n";

    std::string backend = argc > 1 ? argv[1] : "claude";
    std::string prompt = argc > 2 ? argv[2] : "What is 2+2? Be very brief.";

    agentbridge::EngineConfig config = agentbridge::EngineConfig::from_environment();
    agentbridge::ExecutorOptions options = agentbridge::ExecutorOptions::from_config(config);
    options.log_level = VERBOSE ? agentbridge::LogLevel::Debug : agentbridge::LogLevel::Warning;
    options.stderr_callback = [](const std::string& line) { std::cerr << "[stderr] " << line << "\n"; };

    agentbridge::ProcessRegistry registry;
    auto executor = make_executor(backend, registry, options);
    if (!executor)
    {
        std::cerr << "Unknown backend: " << backend << " (expected claude, codex or codex-rpc)\n";
        return 2;
    }

    std::unique_ptr<agentbridge::ext::JsonFileSessionStore> store;
    try
    {
        store = std::make_unique<agentbridge::ext::JsonFileSessionStore>(".agentbridge_sessions.json");
    }
    catch (const agentbridge::AgentBridgeError& e)
    {
        std::cerr << "Error: session file unusable - " << e.what() << "\n";
        return 1;
    }

    const std::string owner = "quick_start:" + backend;

    agentbridge::ExecutionRequest request;
    request.prompt = prompt;
    request.execution_id =
        owner + ":" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    request.owner_key = owner;
    if (auto previous = store->read_latest(owner))
    {
        request.resume_session_id = previous->id;
        std::cout << "Resuming session " << previous->id << "\n";
    }

    auto start = std::chrono::steady_clock::now();

    auto result = executor->execute(request, [](const agentbridge::Message& msg)
    {
        if (auto* call = std::get_if<agentbridge::ToolCallMessage>(&msg))
            std::cout << "  [tool] " << call->activity.name << " " << call->activity.input_summary
                      << "\n";
        else if (auto* text = std::get_if<agentbridge::AssistantMessage>(&msg))
            std::cout << text->text << "\n";
    });

    auto end = std::chrono::steady_clock::now();

    if (!result.success)
    {
        std::cerr << "Error: " << result.error.value_or("unknown failure") << "\n";
        return 1;
    }

    if (result.external_session_id)
    {
        try
        {
            store->write(owner, *result.external_session_id, request.mode);
        }
        catch (const agentbridge::AgentBridgeError& e)
        {
            std::cerr << "Warning: session not saved - " << e.what() << "\n";
        }
    }

    if (result.pending_question)
        std::cout << "\n(The agent is waiting for an answer)\n";
    if (result.pending_plan_approval)
        std::cout << "\n(A plan is waiting for approval)\n";

    if (TIMING)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        std::cout << "\nCompleted in " << ms << "ms";
        if (result.cost_units)
            std::cout << ", cost " << *result.cost_units;
        std::cout << "\n";
    }

    return 0;
}
