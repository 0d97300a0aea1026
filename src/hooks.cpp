#include <agentlink/errors.hpp>
#include <agentlink/hooks.hpp>
#include <type_traits>

namespace agentlink
{

namespace
{
// Lenient field readers: a missing or mistyped field reads as empty
std::string get_string(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return "";
}

json get_object(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it != obj.end() && it->is_object())
        return *it;
    return json::object();
}

bool get_bool(const json& obj, const char* key)
{
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

void fill_base(BaseHookInput& base, const json& obj)
{
    base.session_id = get_string(obj, "session_id");
    base.transcript_path = get_string(obj, "transcript_path");
    base.cwd = get_string(obj, "cwd");
    base.permission_mode = get_string(obj, "permission_mode");
}

json additional_context_output(const char* event, const std::string& additional_context)
{
    json specific = {{"hookEventName", event}};
    if (!additional_context.empty())
        specific["additionalContext"] = additional_context;
    return specific;
}
} // namespace

HookInput parse_hook_input(const json& data)
{
    if (!data.is_object())
        throw DispatchError("Invalid hook input format");

    const std::string event = get_string(data, "hook_event_name");

    if (event == HookEvent::PreToolUse)
    {
        PreToolUseHookInput input;
        fill_base(input, data);
        input.tool_name = get_string(data, "tool_name");
        input.tool_input = get_object(data, "tool_input");
        return input;
    }
    if (event == HookEvent::PostToolUse)
    {
        PostToolUseHookInput input;
        fill_base(input, data);
        input.tool_name = get_string(data, "tool_name");
        input.tool_input = get_object(data, "tool_input");
        input.tool_response = data.value("tool_response", json());
        return input;
    }
    if (event == HookEvent::PostToolUseFailure)
    {
        PostToolUseFailureHookInput input;
        fill_base(input, data);
        input.tool_name = get_string(data, "tool_name");
        input.tool_input = get_object(data, "tool_input");
        input.tool_use_id = get_string(data, "tool_use_id");
        input.error = get_string(data, "error");
        input.is_interrupt = get_bool(data, "is_interrupt");
        return input;
    }
    if (event == HookEvent::UserPromptSubmit)
    {
        UserPromptSubmitHookInput input;
        fill_base(input, data);
        input.prompt = get_string(data, "prompt");
        return input;
    }
    if (event == HookEvent::Stop)
    {
        StopHookInput input;
        fill_base(input, data);
        input.stop_hook_active = get_bool(data, "stop_hook_active");
        return input;
    }
    if (event == HookEvent::SubagentStop)
    {
        SubagentStopHookInput input;
        fill_base(input, data);
        input.stop_hook_active = get_bool(data, "stop_hook_active");
        return input;
    }
    if (event == HookEvent::PreCompact)
    {
        PreCompactHookInput input;
        fill_base(input, data);
        input.trigger = get_string(data, "trigger");
        auto it = data.find("custom_instructions");
        if (it != data.end() && it->is_string())
            input.custom_instructions = it->get<std::string>();
        return input;
    }

    throw DispatchError("Unknown hook event name: " + event);
}

std::string hook_event_name(const HookInput& input)
{
    return std::visit(
        [](const auto& in) -> std::string
        {
            using T = std::decay_t<decltype(in)>;
            if constexpr (std::is_same_v<T, PreToolUseHookInput>)
                return HookEvent::PreToolUse;
            else if constexpr (std::is_same_v<T, PostToolUseHookInput>)
                return HookEvent::PostToolUse;
            else if constexpr (std::is_same_v<T, PostToolUseFailureHookInput>)
                return HookEvent::PostToolUseFailure;
            else if constexpr (std::is_same_v<T, UserPromptSubmitHookInput>)
                return HookEvent::UserPromptSubmit;
            else if constexpr (std::is_same_v<T, StopHookInput>)
                return HookEvent::Stop;
            else if constexpr (std::is_same_v<T, SubagentStopHookInput>)
                return HookEvent::SubagentStop;
            else
                return HookEvent::PreCompact;
        },
        input);
}

const BaseHookInput& base_hook_input(const HookInput& input)
{
    return std::visit([](const auto& in) -> const BaseHookInput& { return in; }, input);
}

json HookOutput::to_json() const
{
    json result = json::object();

    if (async)
    {
        result["async"] = true;
        if (async_timeout_ms > 0)
            result["asyncTimeout"] = async_timeout_ms;
        return result;
    }

    if (continue_.has_value())
        result["continue"] = *continue_;
    if (suppress_output)
        result["suppressOutput"] = true;
    if (!stop_reason.empty())
        result["stopReason"] = stop_reason;
    if (!decision.empty())
        result["decision"] = decision;
    if (!system_message.empty())
        result["systemMessage"] = system_message;
    if (!reason.empty())
        result["reason"] = reason;

    if (hook_specific_output.has_value())
    {
        result["hookSpecificOutput"] = std::visit(
            [](const auto& out) -> json
            {
                using T = std::decay_t<decltype(out)>;
                if constexpr (std::is_same_v<T, PreToolUseHookSpecificOutput>)
                {
                    json specific = {{"hookEventName", HookEvent::PreToolUse}};
                    if (!out.permission_decision.empty())
                        specific["permissionDecision"] = out.permission_decision;
                    if (!out.permission_decision_reason.empty())
                        specific["permissionDecisionReason"] = out.permission_decision_reason;
                    if (out.updated_input.has_value())
                        specific["updatedInput"] = *out.updated_input;
                    return specific;
                }
                else if constexpr (std::is_same_v<T, PostToolUseHookSpecificOutput>)
                    return additional_context_output(HookEvent::PostToolUse,
                                                     out.additional_context);
                else if constexpr (std::is_same_v<T, PostToolUseFailureHookSpecificOutput>)
                    return additional_context_output(HookEvent::PostToolUseFailure,
                                                     out.additional_context);
                else
                    return additional_context_output(HookEvent::UserPromptSubmit,
                                                     out.additional_context);
            },
            *hook_specific_output);
    }

    return result;
}

} // namespace agentlink
