#ifndef AGENTBRIDGE_INTERNAL_STREAM_DECODER_HPP
#define AGENTBRIDGE_INTERNAL_STREAM_DECODER_HPP

#include <agentbridge/log.hpp>
#include <agentbridge/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge
{
namespace protocol
{

const char* to_string(WireFormat format);

// Converts backend output lines into canonical Messages. Pure: no I/O, never throws.
class StreamDecoder
{
  public:
    explicit StreamDecoder(WireFormat format, size_t max_buffer_size = 1024 * 1024,
                           Logger logger = Logger());

    // Decode one output line. Incomplete JSON is buffered until it parses or the
    // buffer cap is hit, in which case one non-final ErrorMessage is returned.
    std::vector<Message> feed(const std::string& line);

    // Decode an already-parsed event (used by the RPC bridge)
    std::vector<Message> feed_json(const json& event);

    // Accumulated assistant text, chunks joined with the paragraph spacing rule
    const std::string& text() const
    {
        return text_;
    }

    // Assistant text plus inline tool call / result renderings
    const std::string& detailed_text() const
    {
        return detailed_;
    }

    const std::optional<std::string>& session_id() const
    {
        return session_id_;
    }

    size_t pending_tool_count() const
    {
        return pending_tools_.size();
    }

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    WireFormat format() const
    {
        return format_;
    }

    void reset();

  private:
    std::vector<Message> dispatch(const json& event);
    std::vector<Message> dispatch_claude(const json& event);
    std::vector<Message> dispatch_codex(const json& event);
    Message overflow_error();

    AssistantMessage make_assistant(const std::string& text, const json& raw);
    ToolCallMessage make_tool_call(const std::string& id, const std::string& name,
                                   const json& input, const json& raw);
    ToolResultMessage make_tool_result(const std::string& id, const std::string& content,
                                       bool is_error, const json& raw);
    ResultMessage make_result(const json& raw);
    ErrorMessage make_error(const std::string& text, bool is_final, const json& raw);

    WireFormat format_;
    size_t max_buffer_size_;
    Logger logger_;

    std::string buffer_;
    std::string text_;
    std::string detailed_;
    std::optional<std::string> session_id_;
    std::map<std::string, ToolActivity> pending_tools_;
};

// Codex tool input normalization: JSON-in-a-string is parsed, null becomes {},
// anything else that is not an object is wrapped as {"raw": value}
json normalize_tool_input(const json& input);

} // namespace protocol
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_STREAM_DECODER_HPP
