#ifndef AGENTLINK_ERRORS_HPP
#define AGENTLINK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agentlink
{

// Base exception
class AgentError : public std::runtime_error
{
  public:
    explicit AgentError(const std::string& message) : std::runtime_error(message) {}
};

// Transport not ready, not connected, or a write failed
class ConnectionError : public AgentError
{
  public:
    explicit ConnectionError(const std::string& message) : AgentError(message) {}
};

// Agent process failed
class ProcessError : public AgentError
{
  public:
    ProcessError(const std::string& message, int exit_code)
        : AgentError(message + " (exit code: " + std::to_string(exit_code) + ")"),
          exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// JSON decode error
class JSONDecodeError : public AgentError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentError(message) {}
};

// Failure of an outbound control request that never got a usable answer.
// Carries the request subtype for diagnostics.
class ProtocolError : public AgentError
{
  public:
    ProtocolError(const std::string& message, std::string subtype)
        : AgentError(message), subtype_(std::move(subtype))
    {
    }

    const std::string& subtype() const
    {
        return subtype_;
    }

  private:
    std::string subtype_;
};

// The response did not arrive before the deadline
class ControlTimeoutError : public ProtocolError
{
  public:
    explicit ControlTimeoutError(const std::string& subtype)
        : ProtocolError("Control request timed out: " + subtype, subtype)
    {
    }
};

// The wait was cancelled, or the pending slot was aborted (transport
// failure, session closed)
class ControlCancelledError : public ProtocolError
{
  public:
    ControlCancelledError(const std::string& message, const std::string& subtype = "")
        : ProtocolError(message, subtype)
    {
    }
};

// The remote side answered a control request with an error response
class ControlRequestError : public AgentError
{
  public:
    explicit ControlRequestError(const std::string& message) : AgentError(message) {}
};

// An inbound control request could not be dispatched locally
class DispatchError : public AgentError
{
  public:
    explicit DispatchError(const std::string& message) : AgentError(message) {}
};

} // namespace agentlink

#endif // AGENTLINK_ERRORS_HPP
