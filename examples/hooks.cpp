/**
 * @file hooks.cpp
 * @brief Example: PreToolUse hooks in a multi-turn session
 *
 * Usage: hooks <agent-executable> [agent-args...]
 *
 * Commands that touch the filesystem destructively are denied by the hook;
 * everything else runs. The conversation continues until an empty line.
 */

#include <agentlink/agentlink.hpp>
#include <iostream>
#include <string>

using namespace agentlink;

HookOutput guard_bash(const HookInput& input, const std::string& tool_use_id,
                      const HookContext& /*context*/)
{
    HookOutput output;

    const auto* pre = std::get_if<PreToolUseHookInput>(&input);
    if (!pre || pre->tool_name != "Bash")
        return output;

    std::string command = pre->tool_input.value("command", "");
    std::cout << "[HOOK] Bash " << (tool_use_id.empty() ? "" : "(" + tool_use_id + ") ")
              << command << "\n";

    if (command.find("rm -rf") != std::string::npos)
    {
        PreToolUseHookSpecificOutput specific;
        specific.permission_decision = "deny";
        specific.permission_decision_reason = "Recursive deletes are not allowed";
        output.hook_specific_output = specific;
        output.system_message = "Blocked: " + command;
    }
    return output;
}

HookOutput log_write(const HookInput& input, const std::string&, const HookContext&)
{
    if (const auto* pre = std::get_if<PreToolUseHookInput>(&input))
        std::cout << "[HOOK] " << pre->tool_name << " " << pre->tool_input.value("file_path", "")
                  << "\n";
    return HookOutput{};
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <agent-executable> [agent-args...]\n";
        return 2;
    }

    AgentOptions opts;
    opts.command.assign(argv + 1, argv + argc);
    opts.hooks[HookEvent::PreToolUse] = {
        HookMatcher("Bash", {guard_bash}),
        HookMatcher("Write|Edit", {log_write}, 5.0),
    };

    // Hooks decide; plain permission requests are approved
    opts.tool_permission_callback = [](const std::string&, const json&,
                                       const ToolPermissionContext&) -> PermissionResult
    { return PermissionResultAllow{}; };

    try
    {
        AgentClient client(opts);
        client.connect();
        std::cout << "Connected (pid " << client.get_pid() << ")\n";

        std::string line;
        while (std::cout << "> " && std::getline(std::cin, line) && !line.empty())
        {
            client.send_query(line);
            for (const auto& msg : client.receive_messages())
            {
                if (msg.value("type", "") == "assistant")
                {
                    for (const auto& block : msg["message"].value("content", json::array()))
                    {
                        if (block.value("type", "") == "text")
                            std::cout << block.value("text", "") << "\n";
                    }
                }
                else if (is_result_message(msg))
                {
                    break;
                }
            }
        }

        client.disconnect();
    }
    catch (const ConnectionError& e)
    {
        std::cerr << "Connection error: " << e.what() << "\n";
        return 1;
    }
    catch (const AgentError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
