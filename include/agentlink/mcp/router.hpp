#ifndef AGENTLINK_MCP_ROUTER_HPP
#define AGENTLINK_MCP_ROUTER_HPP

#include <agentlink/mcp/server.hpp>
#include <map>
#include <string>

namespace agentlink
{
namespace mcp
{

// JSON-RPC error codes used by the router
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

// Protocol version reported by initialize
constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * Answers embedded JSON-RPC messages for in-process tool servers.
 *
 * Supported methods: initialize, tools/list, tools/call and the
 * notifications/initialized acknowledgement. Every failure (unknown server,
 * method or tool, throwing handler) is reported as a JSON-RPC error object
 * inside the reply; handle() itself does not throw for them.
 *
 * The server set is fixed at construction and read-only afterwards, so
 * handle() may be called from several threads at once.
 */
class McpRouter
{
  public:
    McpRouter() = default;
    explicit McpRouter(std::map<std::string, SdkMcpServer> servers);

    /// Route one JSON-RPC message to the named server and return the reply
    json handle(const std::string& server_name, const json& message) const;

    bool empty() const
    {
        return servers_.empty();
    }

    bool has_server(const std::string& name) const
    {
        return servers_.find(name) != servers_.end();
    }

  private:
    std::map<std::string, SdkMcpServer> servers_;

    static json handle_initialize(const json& id, const SdkMcpServer& server);
    static json handle_tools_list(const json& id, const SdkMcpServer& server);
    static json handle_tools_call(const json& id, const json& params, const SdkMcpServer& server);
};

/// Build a JSON-RPC error reply
json make_error_response(const json& id, int code, const std::string& message);

/// Build a JSON-RPC result reply
json make_result_response(const json& id, json result);

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_ROUTER_HPP
