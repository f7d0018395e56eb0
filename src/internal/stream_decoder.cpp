#include "stream_decoder.hpp"

#include "text_format.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace agentbridge
{
namespace protocol
{

namespace
{

// Lenient accessors: a missing key or a value of the wrong type yields the fallback
std::string get_string(const json& j, const char* key, const std::string& fallback = "")
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

const json null_value;

const json& get_member(const json& j, const char* key)
{
    if (!j.is_object())
        return null_value;
    auto it = j.find(key);
    return it == j.end() ? null_value : *it;
}

// First present key among candidates (null counts as absent)
const json& first_member(const json& j, std::initializer_list<const char*> keys)
{
    for (const char* key : keys)
    {
        const json& value = get_member(j, key);
        if (!value.is_null())
            return value;
    }
    return null_value;
}

std::string id_text(const json& value, const std::string& fallback)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_number())
        return value.dump();
    return fallback;
}

std::optional<double> get_number(const json& value)
{
    if (value.is_number())
        return value.get<double>();
    return std::nullopt;
}

std::optional<int64_t> get_integer(const json& value)
{
    if (value.is_number_unsigned())
    {
        uint64_t number = value.get<uint64_t>();
        return number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                   ? std::numeric_limits<int64_t>::max()
                   : static_cast<int64_t>(number);
    }
    if (value.is_number_integer())
        return value.get<int64_t>();
    if (value.is_number_float())
    {
        double number = value.get<double>();
        if (std::isnan(number))
            return std::nullopt;
        // Out-of-range doubles would make the conversion undefined
        if (number >= 9.2e18)
            return std::numeric_limits<int64_t>::max();
        if (number <= -9.2e18)
            return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(number);
    }
    return std::nullopt;
}

bool truthy(const json& value)
{
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_string())
        return internal::to_lower(value.get<std::string>()) == "true";
    if (value.is_number())
        return value.get<double>() != 0;
    if (value.is_object() || value.is_array())
        return !value.empty();
    return false;
}

// Content may be a string, a list of text blocks / strings, or anything else
std::string content_text(const json& content)
{
    if (content.is_null())
        return "";
    if (content.is_string())
        return content.get<std::string>();
    if (content.is_array())
    {
        std::string joined;
        for (const auto& item : content)
        {
            if (item.is_string())
                joined += item.get<std::string>();
            else if (item.is_object() && get_string(item, "type") == "text")
                joined += get_string(item, "text");
        }
        return joined;
    }
    return content.dump();
}

std::string error_text(const json& error, const std::string& fallback)
{
    if (error.is_string())
        return error.get<std::string>();
    if (error.is_object())
    {
        std::string message = get_string(error, "message");
        return message.empty() ? error.dump() : message;
    }
    if (error.is_null())
        return fallback;
    return error.dump();
}

std::string trim(const std::string& line)
{
    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
        ++start;
    size_t end = line.size();
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1])))
        --end;
    return line.substr(start, end - start);
}

} // namespace

const char* to_string(WireFormat format)
{
    return format == WireFormat::Claude ? "claude" : "codex";
}

json normalize_tool_input(const json& input)
{
    if (input.is_string())
    {
        json parsed = json::parse(input.get<std::string>(), nullptr, false);
        if (parsed.is_discarded())
            return json{{"raw", input}};
        return parsed.is_object() ? parsed : json{{"raw", parsed}};
    }
    if (input.is_object())
        return input;
    if (input.is_null())
        return json::object();
    return json{{"raw", input}};
}

StreamDecoder::StreamDecoder(WireFormat format, size_t max_buffer_size, Logger logger)
    : format_(format), max_buffer_size_(max_buffer_size), logger_(std::move(logger))
{
}

void StreamDecoder::reset()
{
    buffer_.clear();
    text_.clear();
    detailed_.clear();
    session_id_.reset();
    pending_tools_.clear();
}

Message StreamDecoder::overflow_error()
{
    buffer_.clear();
    std::string text = "Stream buffer overflow: JSON chunk exceeded " +
                       std::to_string(max_buffer_size_ / 1024) + "KB limit";
    logger_.error(text + "; buffer reset");
    return make_error(text, false, json::object());
}

std::vector<Message> StreamDecoder::feed(const std::string& line)
{
    std::string trimmed = trim(line);
    if (trimmed.empty())
        return {};

    if (trimmed.size() > max_buffer_size_)
        return {overflow_error()};

    // Fragments keep their whitespace; it may sit inside a JSON string
    if (!buffer_.empty())
    {
        json joined = json::parse(buffer_ + line, nullptr, false);
        if (!joined.is_discarded())
        {
            buffer_.clear();
            return dispatch(joined);
        }
    }

    json event = json::parse(trimmed, nullptr, false);
    // While a document is pending only a new object starts over; a bare value
    // is more likely a slice of the pending text
    if (!event.is_discarded() && (buffer_.empty() || event.is_object()))
    {
        if (!buffer_.empty())
        {
            logger_.debug("Discarding " + std::to_string(buffer_.size()) +
                          " bytes of unterminated JSON");
            buffer_.clear();
        }
        return dispatch(event);
    }

    if (buffer_.size() + line.size() > max_buffer_size_)
        return {overflow_error()};

    // Possibly a fragment of a larger document
    buffer_ += line;
    return {};
}

std::vector<Message> StreamDecoder::feed_json(const json& event)
{
    return dispatch(event);
}

std::vector<Message> StreamDecoder::dispatch(const json& event)
{
    try
    {
        if (event.is_null())
            return {};

        // Valid JSON of an unexpected shape still carries visible text
        if (!event.is_object())
        {
            std::string text = event.is_string() ? event.get<std::string>() : event.dump();
            if (text.empty())
                return {};
            return {make_assistant(text, event)};
        }

        return format_ == WireFormat::Claude ? dispatch_claude(event) : dispatch_codex(event);
    }
    catch (const json::exception& e)
    {
        logger_.warning(std::string("Ignoring undecodable ") + to_string(format_) +
                        " event: " + e.what());
        return {};
    }
}

// ============================================================================
// Claude wire format
// ============================================================================

std::vector<Message> StreamDecoder::dispatch_claude(const json& event)
{
    std::vector<Message> messages;
    std::string type = get_string(event, "type", "unknown");

    if (type == "system")
    {
        std::string subtype = get_string(event, "subtype", "init");
        std::string session = get_string(event, "session_id");
        if (!session.empty())
            session_id_ = session;
        if (subtype == "init")
            messages.push_back(InitMessage{session, event});
    }
    else if (type == "assistant")
    {
        const json& content = get_member(get_member(event, "message"), "content");
        if (content.is_string())
        {
            messages.push_back(make_assistant(content.get<std::string>(), event));
            return messages;
        }
        if (!content.is_array())
            return messages;

        std::string pending_text;
        for (const auto& block : content)
        {
            std::string block_type = get_string(block, "type");
            if (block_type == "text")
            {
                pending_text += get_string(block, "text");
            }
            else if (block_type == "tool_use")
            {
                if (!pending_text.empty())
                {
                    messages.push_back(make_assistant(pending_text, event));
                    pending_text.clear();
                }
                messages.push_back(make_tool_call(id_text(get_member(block, "id"), "unknown"),
                                                  get_string(block, "name", "unknown"),
                                                  get_member(block, "input"), event));
            }
        }
        if (!pending_text.empty())
            messages.push_back(make_assistant(pending_text, event));
    }
    else if (type == "user")
    {
        const json& content = get_member(get_member(event, "message"), "content");
        if (!content.is_array())
            return messages;

        for (const auto& block : content)
        {
            if (get_string(block, "type") != "tool_result")
                continue;
            messages.push_back(make_tool_result(
                id_text(get_member(block, "tool_use_id"), "unknown"),
                content_text(get_member(block, "content")), truthy(get_member(block, "is_error")),
                event));
        }
    }
    else if (type == "result")
    {
        messages.push_back(make_result(event));
    }
    else if (type == "error")
    {
        messages.push_back(
            make_error(error_text(get_member(event, "error"), "Unknown error"), true, event));
    }

    return messages;
}

// ============================================================================
// Codex wire format
// ============================================================================

std::vector<Message> StreamDecoder::dispatch_codex(const json& event)
{
    std::vector<Message> messages;
    std::string type = get_string(event, "type", get_string(event, "event", "unknown"));

    if (type == "session_start" || type == "thread.started")
    {
        std::string session = id_text(first_member(event, {"session_id", "thread_id", "id"}), "");
        if (!session.empty())
            session_id_ = session;
        messages.push_back(InitMessage{session_id_.value_or(""), event});
    }
    else if (type == "message" || type == "assistant")
    {
        if (get_string(event, "role", "assistant") == "user")
            return messages;
        std::string text = content_text(first_member(event, {"content", "text"}));
        if (!text.empty())
            messages.push_back(make_assistant(text, event));
    }
    else if (type == "tool_call")
    {
        messages.push_back(make_tool_call(
            id_text(first_member(event, {"id", "call_id", "tool_call_id"}), "unknown"),
            get_string(event, "name", get_string(event, "tool", "unknown")),
            first_member(event, {"input", "arguments", "args"}), event));
    }
    else if (type == "tool_result")
    {
        messages.push_back(make_tool_result(
            id_text(first_member(event, {"tool_use_id", "tool_call_id", "id", "call_id"}),
                    "unknown"),
            content_text(first_member(event, {"content", "output", "result"})),
            truthy(first_member(event, {"is_error", "error"})), event));
    }
    else if (type == "request_user_input")
    {
        messages.push_back(make_tool_call(
            id_text(first_member(event, {"call_id", "id"}), "request_user_input"),
            "request_user_input", json{{"questions", first_member(event, {"questions"})}},
            event));
    }
    else if (type == "item.started")
    {
        const json& item = get_member(event, "item");
        std::string item_type = get_string(item, "type");
        std::string id = id_text(get_member(item, "id"), "unknown");

        if (item_type == "command_execution")
            messages.push_back(make_tool_call(
                id, "run_command", json{{"command", get_member(item, "command")}}, event));
        else if (item_type == "file_change")
            messages.push_back(make_tool_call(
                id, "file_change", json{{"changes", get_member(item, "changes")}}, event));
        else if (item_type == "mcp_tool_call")
            messages.push_back(make_tool_call(id, get_string(item, "tool", "mcp_tool"),
                                              get_member(item, "arguments"), event));
        else if (item_type == "web_search")
            messages.push_back(make_tool_call(id, "web_search",
                                              json{{"query", get_member(item, "query")}}, event));
    }
    else if (type == "item.completed")
    {
        const json& item = get_member(event, "item");
        std::string item_type = get_string(item, "type");
        std::string id = id_text(get_member(item, "id"), "unknown");

        if (item_type == "agent_message")
        {
            std::string text = get_string(item, "text");
            if (!text.empty())
                messages.push_back(make_assistant(text, event));
        }
        else if (item_type == "command_execution")
        {
            std::string output = content_text(first_member(item, {"aggregated_output", "output"}));
            const json& exit_code = get_member(item, "exit_code");
            std::string status = internal::to_lower(get_string(item, "status"));
            const json& item_error = get_member(item, "error");

            bool is_error = (exit_code.is_number() && exit_code.get<double>() != 0) ||
                            status == "failed" || status == "error" || status == "cancelled" ||
                            truthy(item_error);
            if (output.empty() && truthy(item_error))
                output = error_text(item_error, "");

            messages.push_back(make_tool_result(id, output, is_error, event));
        }
        else if (item_type == "file_change" || item_type == "mcp_tool_call" ||
                 item_type == "web_search")
        {
            std::string status = internal::to_lower(get_string(item, "status"));
            const json& item_error = get_member(item, "error");
            bool is_error = status == "failed" || status == "error" || truthy(item_error);

            std::string output = content_text(first_member(item, {"result", "output"}));
            if (output.empty() && truthy(item_error))
                output = error_text(item_error, "");
            if (output.empty())
                output = status;

            messages.push_back(make_tool_result(id, output, is_error, event));
        }
    }
    else if (type == "turn.completed" || type == "done")
    {
        messages.push_back(make_result(event));
    }
    else if (type == "turn.failed")
    {
        messages.push_back(
            make_error(error_text(get_member(event, "error"), "Codex turn failed"), true, event));
    }
    else if (type == "error")
    {
        std::string text = error_text(first_member(event, {"error", "message"}), "Unknown error");
        messages.push_back(make_error(text, true, event));
    }

    return messages;
}

// ============================================================================
// Message construction
// ============================================================================

AssistantMessage StreamDecoder::make_assistant(const std::string& text, const json& raw)
{
    internal::append_with_spacing(text_, text);
    internal::append_with_spacing(detailed_, text);
    return AssistantMessage{text, raw};
}

ToolCallMessage StreamDecoder::make_tool_call(const std::string& id, const std::string& name,
                                              const json& input, const json& raw)
{
    ToolActivity activity;
    activity.id = id;
    activity.name = name;
    activity.input = normalize_tool_input(input);
    activity.input_summary = internal::summarize_tool_input(name, activity.input);
    activity.started_at = Clock::now();

    if (pending_tools_.count(id) != 0)
        logger_.warning("Tool ID collision detected: " + id +
                        " already tracked. This may indicate duplicate tool invocations.");
    pending_tools_[id] = activity;

    internal::append_with_spacing(detailed_, internal::render_tool_call(name, activity.input));
    return ToolCallMessage{activity, raw};
}

ToolResultMessage StreamDecoder::make_tool_result(const std::string& id,
                                                  const std::string& content, bool is_error,
                                                  const json& raw)
{
    ToolActivity activity;
    auto it = pending_tools_.find(id);
    if (it != pending_tools_.end())
    {
        activity = std::move(it->second);
        pending_tools_.erase(it);
        activity.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   Clock::now() - activity.started_at)
                                   .count();
    }
    else
    {
        activity.id = id;
        activity.name = "unknown";
    }

    activity.result = internal::truncate_text(content, 500);
    activity.full_result = content;
    activity.is_error = is_error;

    internal::append_with_spacing(detailed_, internal::render_tool_result(content, is_error));
    return ToolResultMessage{activity, raw};
}

ResultMessage StreamDecoder::make_result(const json& raw)
{
    // A reused decoder must not keep tools from a finished turn
    pending_tools_.clear();

    ResultMessage result;
    result.raw = raw;

    std::string session = id_text(first_member(raw, {"session_id", "thread_id"}), "");
    if (!session.empty())
        session_id_ = session;
    result.session_id = session_id_;

    result.text = text_;
    if (result.text.empty())
        result.text = content_text(get_member(raw, "result"));

    const json& usage = get_member(raw, "usage");
    result.cost = get_number(first_member(raw, {"total_cost_usd", "cost_usd", "cost"}));
    if (!result.cost)
        result.cost = get_number(get_member(usage, "cost"));
    result.duration_ms = get_integer(first_member(raw, {"duration_ms", "duration"}));

    std::string subtype = get_string(raw, "subtype");
    result.is_error = truthy(get_member(raw, "is_error")) || internal::starts_with(subtype, "error");

    const json& errors = get_member(raw, "errors");
    if (errors.is_array())
    {
        for (const auto& e : errors)
            result.errors.push_back(error_text(e, ""));
    }
    else if (!errors.is_null())
    {
        result.errors.push_back(error_text(errors, ""));
    }

    return result;
}

ErrorMessage StreamDecoder::make_error(const std::string& text, bool is_final, const json& raw)
{
    return ErrorMessage{text, is_final, raw};
}

} // namespace protocol
} // namespace agentbridge
