#ifndef AGENTLINK_HOOKS_HPP
#define AGENTLINK_HOOKS_HPP

#include <agentlink/cancellation.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentlink
{

// Also defined in types.hpp; hooks.hpp is included from there
using json = nlohmann::json;

// ============================================================================
// Hook Events
// ============================================================================

/// Hook event names as they appear on the wire (hook_event_name)
namespace HookEvent
{
constexpr const char* PreToolUse = "PreToolUse";
constexpr const char* PostToolUse = "PostToolUse";
constexpr const char* PostToolUseFailure = "PostToolUseFailure";
constexpr const char* UserPromptSubmit = "UserPromptSubmit";
constexpr const char* Stop = "Stop";
constexpr const char* SubagentStop = "SubagentStop";
constexpr const char* PreCompact = "PreCompact";
} // namespace HookEvent

/// Get all hook events as a vector
inline std::vector<std::string> all_hook_events()
{
    return {HookEvent::PreToolUse,       HookEvent::PostToolUse, HookEvent::PostToolUseFailure,
            HookEvent::UserPromptSubmit, HookEvent::Stop,        HookEvent::SubagentStop,
            HookEvent::PreCompact};
}

// ============================================================================
// Hook Inputs
// ============================================================================

/// Fields shared by every hook event
struct BaseHookInput
{
    std::string session_id;
    std::string transcript_path;
    std::string cwd;
    std::string permission_mode; // Empty if absent
};

struct PreToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
};

struct PostToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
    json tool_response; // Any JSON value, null if absent
};

struct PostToolUseFailureHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
    std::string tool_use_id;
    std::string error;
    bool is_interrupt = false;
};

struct UserPromptSubmitHookInput : BaseHookInput
{
    std::string prompt;
};

struct StopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct SubagentStopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct PreCompactHookInput : BaseHookInput
{
    std::string trigger; // "manual" or "auto"
    std::optional<std::string> custom_instructions;
};

using HookInput =
    std::variant<PreToolUseHookInput, PostToolUseHookInput, PostToolUseFailureHookInput,
                 UserPromptSubmitHookInput, StopHookInput, SubagentStopHookInput,
                 PreCompactHookInput>;

/// Rebuild a typed hook input from the raw hook_callback payload.
/// Throws DispatchError if the payload is not an object or hook_event_name
/// is not one of the known events.
HookInput parse_hook_input(const json& data);

/// Wire name of the event a hook input belongs to
std::string hook_event_name(const HookInput& input);

/// Common fields of any hook input
const BaseHookInput& base_hook_input(const HookInput& input);

// ============================================================================
// Hook Outputs
// ============================================================================

struct PreToolUseHookSpecificOutput
{
    std::string permission_decision; // "allow" | "deny" | "ask", empty to omit
    std::string permission_decision_reason;
    std::optional<json> updated_input;
};

struct PostToolUseHookSpecificOutput
{
    std::string additional_context;
};

struct PostToolUseFailureHookSpecificOutput
{
    std::string additional_context;
};

struct UserPromptSubmitHookSpecificOutput
{
    std::string additional_context;
};

using HookSpecificOutput =
    std::variant<PreToolUseHookSpecificOutput, PostToolUseHookSpecificOutput,
                 PostToolUseFailureHookSpecificOutput, UserPromptSubmitHookSpecificOutput>;

/// Result of a hook callback.
struct HookOutput
{
    /// Defer the hook; when set, only async/asyncTimeout are sent
    bool async = false;
    int async_timeout_ms = 0;

    /// Whether the agent should proceed after the hook (omitted when unset)
    std::optional<bool> continue_;
    bool suppress_output = false;
    std::string stop_reason;

    std::string decision; // "block" or empty
    std::string system_message;
    std::string reason;

    std::optional<HookSpecificOutput> hook_specific_output;

    /// Serialize with the field names the agent process expects,
    /// omitting empty and zero-valued optional fields.
    json to_json() const;
};

// ============================================================================
// Hook Callbacks
// ============================================================================

/// Context passed to hook callbacks
struct HookContext
{
    /// Fires when the session is closing; long-running hooks should observe it
    CancellationToken cancellation;
};

/// Callback invoked when a registered hook is triggered.
/// @param input Typed hook input for the triggering event
/// @param tool_use_id Tool use identifier (empty if not provided)
/// @param context Hook context
/// Throwing reports the exception message back as a control error.
using HookCallback = std::function<HookOutput(const HookInput& input,
                                              const std::string& tool_use_id,
                                              const HookContext& context)>;

/// Hook matcher configuration
struct HookMatcher
{
    /// Pattern for matching tools/actions (e.g., "Bash", "Write|Edit");
    /// unset matches everything
    std::optional<std::string> matcher;

    /// Callbacks to invoke when the matcher matches
    std::vector<HookCallback> hooks;

    /// Timeout hint in seconds for the hooks of this matcher. Accepts fractional seconds.
    std::optional<double> timeout;

    HookMatcher() = default;
    HookMatcher(std::optional<std::string> m, std::vector<HookCallback> h,
                std::optional<double> t = std::nullopt)
        : matcher(std::move(m)), hooks(std::move(h)), timeout(t)
    {
    }
};

} // namespace agentlink

#endif // AGENTLINK_HOOKS_HPP
