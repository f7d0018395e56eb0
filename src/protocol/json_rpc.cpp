#include <agentbridge/errors.hpp>
#include <agentbridge/protocol/json_rpc.hpp>

namespace agentbridge
{
namespace protocol
{

JsonRpcConnection::JsonRpcConnection(WriteFunc write_func) : write_func_(std::move(write_func))
{
}

void JsonRpcConnection::write_frame(const json& frame)
{
    write_func_(frame.dump() + "\n");
}

int64_t JsonRpcConnection::send_request(const std::string& method, const json& params)
{
    int64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
    }

    write_frame({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    return id;
}

void JsonRpcConnection::send_notification(const std::string& method, const json& params)
{
    write_frame({{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
}

void JsonRpcConnection::send_result(const json& id, const json& result)
{
    write_frame({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

void JsonRpcConnection::send_error(const json& id, int code, const std::string& message)
{
    write_frame({{"jsonrpc", "2.0"},
                 {"id", id},
                 {"error", {{"code", code}, {"message", message}}}});
}

bool JsonRpcConnection::handle_line(const std::string& line)
{
    json frame = json::parse(line, nullptr, false);
    if (frame.is_discarded() || !frame.is_object())
        return false;

    auto method_it = frame.find("method");
    auto id_it = frame.find("id");
    bool has_method = method_it != frame.end() && method_it->is_string();
    bool has_id = id_it != frame.end() && !id_it->is_null();

    std::lock_guard<std::mutex> lock(mutex_);

    if (has_method)
    {
        RpcIncoming incoming;
        incoming.kind = has_id ? RpcIncoming::Kind::Request : RpcIncoming::Kind::Notification;
        if (has_id)
            incoming.id = *id_it;
        incoming.method = method_it->get<std::string>();
        auto params_it = frame.find("params");
        if (params_it != frame.end() && !params_it->is_null())
            incoming.params = *params_it;
        incoming_.push_back(std::move(incoming));
        return true;
    }

    if (has_id && id_it->is_number_integer())
    {
        responses_[id_it->get<int64_t>()] = std::move(frame);
        return true;
    }

    return false;
}

std::optional<json> JsonRpcConnection::take_response(int64_t id)
{
    json frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = responses_.find(id);
        if (it == responses_.end())
            return std::nullopt;
        frame = std::move(it->second);
        responses_.erase(it);
    }

    auto error_it = frame.find("error");
    if (error_it != frame.end() && !error_it->is_null())
    {
        int code = error_it->is_object() ? error_it->value("code", 0) : 0;
        std::string message = error_it->is_object() ? error_it->value("message", "RPC error")
                                                    : error_it->dump();
        throw RpcError(message, code);
    }

    auto result_it = frame.find("result");
    if (result_it == frame.end())
        return json(nullptr);
    return *result_it;
}

bool JsonRpcConnection::has_response(int64_t id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.count(id) != 0;
}

std::optional<RpcIncoming> JsonRpcConnection::next_incoming()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (incoming_.empty())
        return std::nullopt;
    RpcIncoming incoming = std::move(incoming_.front());
    incoming_.pop_front();
    return incoming;
}

size_t JsonRpcConnection::queued_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return incoming_.size();
}

int64_t JsonRpcConnection::last_request_id() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

} // namespace protocol
} // namespace agentbridge
