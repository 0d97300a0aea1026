#ifndef AGENTLINK_PROTOCOL_CONTROL_HPP
#define AGENTLINK_PROTOCOL_CONTROL_HPP

#include <agentlink/cancellation.hpp>
#include <agentlink/protocol/pending_requests.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace agentlink
{

// JSON type alias (also defined in types.hpp)
using json = nlohmann::json;

namespace protocol
{

/// Control request subtypes
namespace RequestSubtype
{
constexpr const char* Initialize = "initialize";
constexpr const char* Interrupt = "interrupt";
constexpr const char* CanUseTool = "can_use_tool";
constexpr const char* SetPermissionMode = "set_permission_mode";
constexpr const char* SetModel = "set_model";
constexpr const char* HookCallback = "hook_callback";
constexpr const char* McpMessage = "mcp_message";
constexpr const char* McpStatus = "mcp_status";
constexpr const char* RewindFiles = "rewind_files";
} // namespace RequestSubtype

// Control request - exchanged in both directions
struct ControlRequest
{
    std::string type = "control_request";
    std::string request_id;
    json request; // Subtype-specific data, including "subtype"

    std::string subtype() const;
    json to_json() const;
    static ControlRequest from_json(const json& j);
};

// Control response - exchanged in both directions
struct ControlResponse
{
    std::string type = "control_response";
    struct Response
    {
        std::string subtype; // "success" or "error"
        std::string request_id;
        json response;     // Response data (success)
        std::string error; // Error message (error)
    } response;

    bool is_error() const
    {
        return response.subtype == "error";
    }

    json to_json() const;

    static ControlResponse success(const std::string& request_id, json data);
    static ControlResponse failure(const std::string& request_id, const std::string& error);
};

// Control protocol manager - issues outbound requests and correlates the
// responses that come back on the read loop.
class ControlProtocol
{
  public:
    using WriteFunc = std::function<void(const std::string&)>;

    explicit ControlProtocol(bool streaming_mode = true);

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    // Send a control request and wait for its response.
    // Returns the response payload (empty object if none was carried).
    // Throws ControlTimeoutError, ControlCancelledError, ControlRequestError,
    // AgentError (not in streaming mode), or whatever write_func throws.
    // A non-positive timeout waits without a deadline.
    json send_request(const WriteFunc& write_func, const std::string& subtype,
                      const json& request_data,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(60000),
                      const CancellationToken* cancel = nullptr);

    // Handle an incoming control_response envelope.
    // Returns false if nothing was waiting for it.
    bool handle_response(const json& message);

    // Abort every outstanding request (transport failure, shutdown)
    std::size_t fail_all_pending(const std::string& reason);

    // Generate unique request ID: req_{counter}_{random hex}
    std::string generate_request_id();

    // Build control request message JSON line
    static std::string build_request_message(const std::string& request_id,
                                             const std::string& subtype, const json& data);

    std::size_t pending_count() const
    {
        return pending_.size();
    }

    bool is_pending(const std::string& request_id) const
    {
        return pending_.contains(request_id);
    }

    bool streaming_mode() const
    {
        return streaming_mode_;
    }

  private:
    bool streaming_mode_;
    std::atomic<std::uint64_t> request_counter_{0};
    PendingRequestTable pending_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_CONTROL_HPP
