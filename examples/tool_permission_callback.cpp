/**
 * @file tool_permission_callback.cpp
 * @brief Example: allow-list tool permissions
 *
 * Usage: tool_permission_callback <agent-executable> [agent-args...]
 */

#include <agentlink/agentlink.hpp>
#include <iostream>
#include <set>

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <agent-executable> [agent-args...]\n";
        return 2;
    }

    // Allow only specific tools
    std::set<std::string> allowed_tools = {"Read", "Glob", "Grep"};

    agentlink::AgentOptions opts;
    opts.command.assign(argv + 1, argv + argc);

    opts.tool_permission_callback =
        [&allowed_tools](const std::string& tool_name, const agentlink::json& input,
                         const agentlink::ToolPermissionContext& context)
        -> agentlink::PermissionResult
    {
        bool allowed = allowed_tools.count(tool_name) > 0;

        std::cout << "[TOOL] " << tool_name << (allowed ? " [ALLOWED]" : " [DENIED]") << "\n";

        if (allowed)
        {
            // Accept the agent's first suggestion so it stops asking
            agentlink::PermissionResultAllow allow;
            if (!context.suggestions.empty())
                allow.updated_permissions = std::vector<agentlink::PermissionUpdate>{
                    context.suggestions.front()};
            return allow;
        }

        if (input.contains("file_path"))
            std::cout << "       path: " << input["file_path"].get<std::string>() << "\n";
        return agentlink::PermissionResultDeny{"Tool '" + tool_name +
                                                   "' is not in the allowed list",
                                               false};
    };

    try
    {
        agentlink::AgentClient client(opts);
        client.connect();

        std::cout << "Tool Permissions Example\n";
        std::cout << "Allowed tools: Read, Glob, Grep\n";
        std::cout << "All other tools will be denied\n\n";

        client.send_query("Search for all .cpp files, read one, "
                          "and then try to write a new file");

        for (const auto& msg : client.receive_response())
        {
            if (msg.value("type", "") != "assistant")
                continue;
            for (const auto& block : msg["message"].value("content", agentlink::json::array()))
            {
                if (block.value("type", "") == "text")
                    std::cout << block.value("text", "") << std::flush;
            }
        }
        std::cout << "\n";

        client.set_permission_mode(agentlink::PermissionMode::Plan);
        client.disconnect();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
