#include "app_server_events.hpp"

namespace agentbridge
{
namespace protocol
{

namespace
{

std::string string_field(const json& object, const char* key)
{
    if (!object.is_object())
        return "";
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return "";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

json field(const json& object, const char* key)
{
    if (!object.is_object())
        return nullptr;
    auto it = object.find(key);
    return it == object.end() ? json(nullptr) : *it;
}

// App-server statuses are camelCase and include "declined"
std::string exec_status(const std::string& status)
{
    if (status == "declined")
        return "failed";
    if (status == "inProgress")
        return "in_progress";
    return status;
}

} // namespace

void AppServerEventTranslator::reset()
{
    agent_deltas_.clear();
    thread_id_.clear();
    turn_finished_ = false;
}

std::vector<json> AppServerEventTranslator::translate(const std::string& method,
                                                      const json& params)
{
    std::vector<json> events;

    if (method == "thread/started")
    {
        std::string id = string_field(field(params, "thread"), "id");
        if (id.empty())
            id = string_field(params, "threadId");
        if (!id.empty())
        {
            thread_id_ = id;
            events.push_back({{"type", "thread.started"}, {"thread_id", id}});
        }
    }
    else if (method == "item/agentMessage/delta")
    {
        std::string item_id = string_field(params, "itemId");
        agent_deltas_[item_id] += string_field(params, "delta");
    }
    else if (method == "item/started")
    {
        events = translate_item(field(params, "item"), false);
    }
    else if (method == "item/completed")
    {
        events = translate_item(field(params, "item"), true);
    }
    else if (method == "turn/completed")
    {
        json turn = field(params, "turn");
        std::string status = string_field(turn, "status");
        turn_finished_ = true;

        if (status == "failed" || status == "interrupted")
        {
            std::string message = string_field(field(turn, "error"), "message");
            if (message.empty())
                message = status == "interrupted" ? "Turn interrupted" : "Codex turn failed";
            events.push_back({{"type", "turn.failed"}, {"error", {{"message", message}}}});
        }
        else
        {
            json event = {{"type", "turn.completed"}};
            if (!thread_id_.empty())
                event["thread_id"] = thread_id_;
            json usage = field(turn, "usage");
            if (!usage.is_null())
                event["usage"] = usage;
            events.push_back(std::move(event));
        }
    }
    else if (method == "error")
    {
        json will_retry = field(params, "willRetry");
        if (will_retry.is_boolean() && will_retry.get<bool>())
            return events;

        std::string message = string_field(field(params, "error"), "message");
        if (message.empty())
            message = string_field(params, "message");
        if (message.empty())
            message = "Codex app-server error";
        turn_finished_ = true;
        events.push_back({{"type", "turn.failed"}, {"error", {{"message", message}}}});
    }

    return events;
}

std::vector<json> AppServerEventTranslator::translate_item(const json& item, bool completed)
{
    std::vector<json> events;
    if (!item.is_object())
        return events;

    const std::string type = string_field(item, "type");
    const std::string id = string_field(item, "id");
    const char* event_type = completed ? "item.completed" : "item.started";

    json translated;
    if (type == "agentMessage")
    {
        if (!completed)
            return events;
        std::string text = string_field(item, "text");
        auto it = agent_deltas_.find(id);
        if (it != agent_deltas_.end())
        {
            if (text.empty())
                text = it->second;
            agent_deltas_.erase(it);
        }
        translated = {{"id", id}, {"type", "agent_message"}, {"text", text}};
    }
    else if (type == "commandExecution")
    {
        translated = {{"id", id},
                      {"type", "command_execution"},
                      {"command", field(item, "command")},
                      {"status", exec_status(string_field(item, "status"))}};
        if (completed)
        {
            translated["aggregated_output"] = field(item, "aggregatedOutput");
            translated["exit_code"] = field(item, "exitCode");
        }
    }
    else if (type == "fileChange")
    {
        translated = {{"id", id},
                      {"type", "file_change"},
                      {"changes", field(item, "changes")},
                      {"status", exec_status(string_field(item, "status"))}};
    }
    else if (type == "mcpToolCall")
    {
        translated = {{"id", id},
                      {"type", "mcp_tool_call"},
                      {"tool", field(item, "tool")},
                      {"arguments", field(item, "arguments")},
                      {"status", exec_status(string_field(item, "status"))}};
        if (completed)
        {
            translated["result"] = field(item, "result");
            translated["error"] = field(item, "error");
        }
    }
    else if (type == "webSearch")
    {
        translated = {{"id", id},
                      {"type", "web_search"},
                      {"query", field(item, "query")},
                      {"status", completed ? "completed" : "in_progress"}};
    }
    else
    {
        // userMessage, reasoning and anything newer carry nothing to surface
        return events;
    }

    events.push_back({{"type", event_type}, {"item", translated}});
    return events;
}

} // namespace protocol
} // namespace agentbridge
