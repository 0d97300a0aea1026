#include <agentlink/mcp/router.hpp>
#include <exception>
#include <stdexcept>

namespace agentlink
{
namespace mcp
{

json make_error_response(const json& id, int code, const std::string& message)
{
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json make_result_response(const json& id, json result)
{
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

McpRouter::McpRouter(std::map<std::string, SdkMcpServer> servers) : servers_(std::move(servers))
{
}

json McpRouter::handle(const std::string& server_name, const json& message) const
{
    json id = message.is_object() ? message.value("id", json()) : json();

    auto it = servers_.find(server_name);
    if (it == servers_.end())
        return make_error_response(id, kMethodNotFound, "Server '" + server_name + "' not found");

    if (!message.is_object() || !message.contains("method") || !message["method"].is_string())
        return make_error_response(id, kInvalidRequest, "Invalid Request: missing 'method' field");

    const SdkMcpServer& server = it->second;
    const std::string method = message["method"].get<std::string>();

    if (method == "initialize")
        return handle_initialize(id, server);

    if (method == "tools/list")
        return handle_tools_list(id, server);

    if (method == "tools/call")
    {
        json params = message.value("params", json::object());
        return handle_tools_call(id, params.is_object() ? params : json::object(), server);
    }

    // Notification: no id in the reply
    if (method == "notifications/initialized")
        return json{{"jsonrpc", "2.0"}, {"result", json::object()}};

    return make_error_response(id, kMethodNotFound, "Method '" + method + "' not found");
}

json McpRouter::handle_initialize(const json& id, const SdkMcpServer& server)
{
    return make_result_response(
        id, {{"protocolVersion", kProtocolVersion},
             {"capabilities", {{"tools", json::object()}}},
             {"serverInfo", {{"name", server.name}, {"version", server.version}}}});
}

json McpRouter::handle_tools_list(const json& id, const SdkMcpServer& server)
{
    json tools = json::array();
    for (const auto& tool : server.tools)
    {
        tools.push_back({{"name", tool.name},
                         {"description", tool.description},
                         {"inputSchema", tool.input_schema}});
    }
    return make_result_response(id, {{"tools", tools}});
}

json McpRouter::handle_tools_call(const json& id, const json& params, const SdkMcpServer& server)
{
    std::string name;
    if (params.contains("name") && params["name"].is_string())
        name = params["name"].get<std::string>();

    const SdkTool* tool = server.find_tool(name);
    if (tool == nullptr)
        return make_error_response(id, kMethodNotFound, "Tool '" + name + "' not found");

    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object())
        arguments = json::object();

    ToolResult result;
    try
    {
        if (!tool->handler)
            throw std::runtime_error("Tool '" + name + "' has no handler");
        result = tool->handler(arguments);
    }
    catch (const std::exception& e)
    {
        return make_error_response(id, kInternalError, e.what());
    }

    json content = json::array();
    for (const auto& item : result.content)
        content.push_back(item.to_json());

    json body = {{"content", content}};
    if (result.is_error)
        body["is_error"] = true;

    return make_result_response(id, std::move(body));
}

} // namespace mcp
} // namespace agentlink
