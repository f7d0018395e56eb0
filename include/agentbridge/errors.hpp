#ifndef AGENTBRIDGE_ERRORS_HPP
#define AGENTBRIDGE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace agentbridge
{

// Base exception
class AgentBridgeError : public std::runtime_error
{
  public:
    explicit AgentBridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Backend CLI not found (or rejected by allow-list / hash pin)
class CLINotFoundError : public AgentBridgeError
{
  public:
    explicit CLINotFoundError(const std::string& message) : AgentBridgeError(message) {}
};

// fork/exec/pty allocation failed
class ProcessSpawnError : public AgentBridgeError
{
  public:
    explicit ProcessSpawnError(const std::string& message) : AgentBridgeError(message) {}
};

// JSON decode error
class JSONDecodeError : public AgentBridgeError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentBridgeError(message) {}
};

// JSON-RPC error response or protocol violation
class RpcError : public AgentBridgeError
{
  public:
    RpcError(const std::string& message, int code) : AgentBridgeError(message), code_(code) {}

    int code() const
    {
        return code_;
    }

  private:
    int code_;
};

// PTY session never became ready
class SessionStartError : public AgentBridgeError
{
  public:
    explicit SessionStartError(const std::string& message) : AgentBridgeError(message) {}
};

// Operation not allowed in the session's current state
class InvalidSessionStateError : public AgentBridgeError
{
  public:
    explicit InvalidSessionStateError(const std::string& message) : AgentBridgeError(message) {}
};

// Pool at capacity with nothing evictable
class PoolExhaustedError : public AgentBridgeError
{
  public:
    explicit PoolExhaustedError(size_t max_sessions)
        : AgentBridgeError("Max sessions (" + std::to_string(max_sessions) +
                           ") reached and no idle sessions to evict"),
          max_sessions_(max_sessions)
    {
    }

    size_t max_sessions() const
    {
        return max_sessions_;
    }

  private:
    size_t max_sessions_;
};

} // namespace agentbridge

#endif // AGENTBRIDGE_ERRORS_HPP
