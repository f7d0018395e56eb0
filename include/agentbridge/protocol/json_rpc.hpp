#ifndef AGENTBRIDGE_PROTOCOL_JSON_RPC_HPP
#define AGENTBRIDGE_PROTOCOL_JSON_RPC_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentbridge
{

using json = nlohmann::json;

namespace protocol
{

// JSON-RPC 2.0 error codes used in replies to the server
constexpr int RPC_METHOD_NOT_FOUND = -32601;
constexpr int RPC_INTERNAL_ERROR = -32603;

// Something the server sent that is not a response to one of our calls
struct RpcIncoming
{
    enum class Kind
    {
        Notification,
        Request // Server-initiated; must be answered with send_result/send_error
    };

    Kind kind = Kind::Notification;
    json id; // Request only
    std::string method;
    json params = json::object();
};

// Newline-delimited JSON-RPC 2.0 framing. Transport-agnostic: outgoing frames go
// through the write function, incoming lines are handed to handle_line().
// Responses are cached by id so notifications interleaved with a pending call's
// response are queued, never lost.
class JsonRpcConnection
{
  public:
    using WriteFunc = std::function<void(const std::string&)>;

    explicit JsonRpcConnection(WriteFunc write_func);

    // No copy
    JsonRpcConnection(const JsonRpcConnection&) = delete;
    JsonRpcConnection& operator=(const JsonRpcConnection&) = delete;

    // Send a request and return its id
    int64_t send_request(const std::string& method, const json& params);

    void send_notification(const std::string& method, const json& params = json::object());

    // Replies to a server-initiated request
    void send_result(const json& id, const json& result);
    void send_error(const json& id, int code, const std::string& message);

    // Classify one incoming line. Returns false if it is not a JSON-RPC frame.
    bool handle_line(const std::string& line);

    // Cached response for id: the result, nullopt if not arrived yet.
    // Throws RpcError if the server answered with an error.
    std::optional<json> take_response(int64_t id);

    bool has_response(int64_t id) const;

    // Next queued notification or server request, in arrival order
    std::optional<RpcIncoming> next_incoming();

    size_t queued_count() const;

    int64_t last_request_id() const;

  private:
    void write_frame(const json& frame);

    WriteFunc write_func_;
    int64_t next_id_ = 1;

    mutable std::mutex mutex_;
    std::map<int64_t, json> responses_;
    std::deque<RpcIncoming> incoming_;
};

} // namespace protocol
} // namespace agentbridge

#endif // AGENTBRIDGE_PROTOCOL_JSON_RPC_HPP
