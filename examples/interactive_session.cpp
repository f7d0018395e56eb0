// Line-by-line chat with one long-lived interactive Codex session.
//
//   interactive_session [working-directory]
//
// Every line read from stdin is one turn on the same pooled session.
// An empty line or EOF ends the session.

#include <agentbridge/agentbridge.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    std::cout << "agentbridge version: " << agentbridge::version_string() << "\n\n";

    agentbridge::EngineConfig config = agentbridge::EngineConfig::from_environment();
    agentbridge::Logger logger(std::nullopt, agentbridge::LogLevel::Info);

    agentbridge::PTYSessionConfig session_config = agentbridge::PTYSessionConfig::from_config(config);
    if (argc > 1)
        session_config.working_directory = argv[1];

    agentbridge::PTYPool pool(config.pool, nullptr, logger);
    pool.start_sweeper();

    agentbridge::ProcessRegistry registry;
    agentbridge::PTYExecutor executor(pool, registry, session_config, logger);

    const std::string owner = "interactive";
    int turn = 0;
    std::string line;

    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line) && !line.empty())
    {
        agentbridge::ExecutionRequest request;
        request.prompt = line;
        request.owner_key = owner;
        request.execution_id = owner + ":" + std::to_string(++turn);

        auto result = executor.execute(request, [](const agentbridge::Message& msg)
        {
            if (auto* call = std::get_if<agentbridge::ToolCallMessage>(&msg))
                std::cout << "  [tool] " << call->activity.name << " "
                          << call->activity.input_summary << "\n";
        });

        if (result.success)
            std::cout << result.text << "\n";
        else
            std::cerr << "Error: " << result.error.value_or("unknown failure") << "\n";

        if (auto info = pool.session_info(owner))
            std::cout << "[" << agentbridge::to_string(info->state) << ", session "
                      << info->external_session_id.value_or("?") << "]\n";
        std::cout << "> " << std::flush;
    }

    executor.shutdown();
    return 0;
}
