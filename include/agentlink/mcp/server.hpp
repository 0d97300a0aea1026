#ifndef AGENTLINK_MCP_SERVER_HPP
#define AGENTLINK_MCP_SERVER_HPP

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentlink
{
namespace mcp
{

using json = nlohmann::json;

// ============================================================================
// Tool results
// ============================================================================

/// One content item of a tool result ("text" or "image")
struct ToolContent
{
    std::string type = "text";
    std::string text;      // type == "text"
    std::string data;      // type == "image", base64 payload
    std::string mime_type; // type == "image"

    json to_json() const;
};

/// Result returned by a tool handler
struct ToolResult
{
    std::vector<ToolContent> content;
    bool is_error = false; // Tool ran but reports failure to the model
};

/// Tool handler: receives the call arguments (always an object).
/// Throwing reports an internal error (-32603) to the caller.
using ToolHandler = std::function<ToolResult(const json& arguments)>;

inline ToolResult text_result(std::string text)
{
    ToolContent item;
    item.text = std::move(text);
    return ToolResult{{std::move(item)}, false};
}

inline ToolResult error_result(std::string message)
{
    ToolResult result = text_result(std::move(message));
    result.is_error = true;
    return result;
}

inline ToolResult image_result(std::string data, std::string mime_type)
{
    ToolContent item;
    item.type = "image";
    item.data = std::move(data);
    item.mime_type = std::move(mime_type);
    return ToolResult{{std::move(item)}, false};
}

// ============================================================================
// Tools and servers
// ============================================================================

/// A named tool served in-process
struct SdkTool
{
    std::string name;
    std::string description;
    json input_schema = json{{"type", "object"}, {"properties", json::object()}};
    ToolHandler handler;
};

/// In-process tool server. Tools keep their registration order.
struct SdkMcpServer
{
    std::string name;
    std::string version = "1.0.0";
    std::vector<SdkTool> tools;

    /// Find a tool by name, nullptr if absent
    const SdkTool* find_tool(const std::string& tool_name) const;
};

/// Create a tool from its parts
inline SdkTool make_tool(std::string name, std::string description, json input_schema,
                         ToolHandler handler)
{
    return SdkTool{std::move(name), std::move(description), std::move(input_schema),
                   std::move(handler)};
}

/// Create a server from a list of tools. Throws std::invalid_argument on
/// duplicate tool names.
SdkMcpServer create_server(const std::string& name, const std::string& version,
                           std::vector<SdkTool> tools);

/// Fluent builder for tool servers
class ServerBuilder
{
  public:
    ServerBuilder(std::string name, std::string version)
        : name_(std::move(name)), version_(std::move(version))
    {
    }

    /// Add a tool. Throws std::invalid_argument on a duplicate name.
    ServerBuilder& add_tool(SdkTool tool);

    ServerBuilder& add_tool(std::string name, std::string description, json input_schema,
                            ToolHandler handler)
    {
        return add_tool(make_tool(std::move(name), std::move(description),
                                  std::move(input_schema), std::move(handler)));
    }

    SdkMcpServer build() const
    {
        return SdkMcpServer{name_, version_, tools_};
    }

    size_t tool_count() const
    {
        return tools_.size();
    }

  private:
    std::string name_;
    std::string version_;
    std::vector<SdkTool> tools_;
};

inline ServerBuilder server(const std::string& name, const std::string& version)
{
    return ServerBuilder(name, version);
}

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_SERVER_HPP
