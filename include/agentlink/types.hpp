#ifndef AGENTLINK_TYPES_HPP
#define AGENTLINK_TYPES_HPP

#include <agentlink/cancellation.hpp>
#include <agentlink/hooks.hpp>
#include <agentlink/mcp/server.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentlink
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Permission Update Types
// ============================================================================

/// Permission mode options
namespace PermissionMode
{
constexpr const char* Default = "default";
constexpr const char* AcceptEdits = "acceptEdits";
constexpr const char* Plan = "plan";
constexpr const char* BypassPermissions = "bypassPermissions";
} // namespace PermissionMode

/// Permission update destination options
namespace PermissionUpdateDestination
{
constexpr const char* UserSettings = "userSettings";
constexpr const char* ProjectSettings = "projectSettings";
constexpr const char* LocalSettings = "localSettings";
constexpr const char* Session = "session";
} // namespace PermissionUpdateDestination

/// Permission behavior options
namespace PermissionBehavior
{
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
constexpr const char* Ask = "ask";
} // namespace PermissionBehavior

/// Permission rule value
struct PermissionRuleValue
{
    std::string tool_name;                                  // Required
    std::optional<std::string> rule_content = std::nullopt; // Optional
};

/// Permission update configuration
struct PermissionUpdate
{
    std::string type; // "addRules", "replaceRules", "removeRules", "setMode", "addDirectories",
                      // "removeDirectories"
    std::optional<std::vector<PermissionRuleValue>> rules = std::nullopt;
    std::optional<std::string> behavior = std::nullopt; // PermissionBehavior value
    std::optional<std::string> mode = std::nullopt;     // PermissionMode value
    std::optional<std::vector<std::string>> directories = std::nullopt;
    std::optional<std::string> destination = std::nullopt; // PermissionUpdateDestination value

    /// Convert to JSON format matching the control protocol
    json to_json() const;

    /// Parse a permission suggestion sent by the agent process
    static PermissionUpdate from_json(const json& j);
};

// ============================================================================
// Tool Permission Context and Result Types
// ============================================================================

/// Context information for tool permission callbacks
struct ToolPermissionContext
{
    std::vector<PermissionUpdate> suggestions; // Permission suggestions from the agent
    std::optional<std::string> blocked_path;
    CancellationToken cancellation;            // Fires when the session closes
};

/// Permission result: Allow
struct PermissionResultAllow
{
    std::optional<json> updated_input = std::nullopt;
    std::optional<std::vector<PermissionUpdate>> updated_permissions = std::nullopt;
};

/// Permission result: Deny
struct PermissionResultDeny
{
    std::string message = "";
    bool interrupt = false;
};

/// Permission result variant (Allow or Deny)
using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

/// Callback invoked when tool permission is requested.
/// @param tool_name Tool name (e.g., "Read", "Write", "Bash")
/// @param input Tool-specific arguments
/// @param context Permission context with suggestions from the agent
/// @return PermissionResult (allow with optional updates, or deny with optional message)
using ToolPermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

/// Callback invoked when the agent process writes to stderr.
/// @param line Single line of stderr output (without trailing newline)
using StderrCallback = std::function<void(const std::string& line)>;

// ============================================================================
// Data messages
// ============================================================================

/// Message type discriminators of the wire protocol
namespace MessageType
{
constexpr const char* ControlRequest = "control_request";
constexpr const char* ControlResponse = "control_response";
constexpr const char* ControlCancelRequest = "control_cancel_request";
constexpr const char* Result = "result";
constexpr const char* Error = "error";
} // namespace MessageType

/// The "type" field of a message, empty if absent or not a string
inline std::string message_type(const json& msg)
{
    if (msg.is_object())
    {
        auto it = msg.find("type");
        if (it != msg.end() && it->is_string())
            return it->get<std::string>();
    }
    return "";
}

inline bool is_result_message(const json& msg)
{
    return message_type(msg) == MessageType::Result;
}

/// Terminal error marker emitted when the transport fails
inline bool is_error_message(const json& msg)
{
    return message_type(msg) == MessageType::Error;
}

// ============================================================================
// Configuration
// ============================================================================

struct AgentOptions
{
    // Process launch (default subprocess transport)

    /// Executable followed by its arguments
    std::vector<std::string> command;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    /// If false, do not inherit the parent environment when spawning
    bool inherit_environment = true;

    /// Callback invoked for each stderr line of the agent process.
    /// Note: Executes on a background thread - ensure callback is thread-safe.
    std::optional<StderrCallback> stderr_callback;

    /// Maximum size of a single JSON line (in bytes). Default: 1MB
    std::optional<size_t> max_buffer_size;

    // Control protocol

    /// Hook configurations organized by event type
    /// Example:
    /// ```cpp
    /// opts.hooks[HookEvent::PreToolUse] = {
    ///     HookMatcher{
    ///         "Bash",  // matcher pattern
    ///         {my_hook_callback}  // list of callbacks
    ///     }
    /// };
    /// ```
    std::map<std::string, std::vector<HookMatcher>> hooks;

    /// Callback invoked when tool permission is requested.
    /// If not set, permission requests are answered with an error.
    std::optional<ToolPermissionCallback> tool_permission_callback;

    /// In-process tool servers, keyed by the name the agent uses for them
    std::map<std::string, mcp::SdkMcpServer> sdk_mcp_servers;

    /// Handshake timeout (AGENTLINK_STREAM_CLOSE_TIMEOUT may raise it)
    std::chrono::milliseconds initialize_timeout{60000};
    /// How long closing input waits for the first result when hooks or
    /// tool servers are registered (AGENTLINK_STREAM_CLOSE_TIMEOUT overrides)
    std::chrono::milliseconds stream_close_timeout{60000};
    /// Default timeout of interrupt / set_model / ... requests
    std::chrono::milliseconds control_request_timeout{60000};
};

} // namespace agentlink

#endif // AGENTLINK_TYPES_HPP
