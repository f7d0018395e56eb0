#include <agentbridge/types.hpp>

namespace agentbridge
{

bool is_terminal_message(const Message& msg)
{
    if (std::holds_alternative<ResultMessage>(msg))
        return std::get<ResultMessage>(msg).is_final;
    if (auto* error = std::get_if<ErrorMessage>(&msg))
        return error->is_final;
    return false;
}

std::string message_type_name(const Message& msg)
{
    if (is_init_message(msg))
        return "init";
    if (is_assistant_message(msg))
        return "assistant";
    if (is_tool_call_message(msg))
        return "tool_call";
    if (is_tool_result_message(msg))
        return "tool_result";
    if (is_result_message(msg))
        return "result";
    return "error";
}

} // namespace agentbridge
