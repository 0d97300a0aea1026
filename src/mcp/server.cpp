#include <agentlink/mcp/server.hpp>
#include <stdexcept>

namespace agentlink
{
namespace mcp
{

json ToolContent::to_json() const
{
    json item = {{"type", type}};
    if (type == "text")
    {
        item["text"] = text;
    }
    else if (type == "image")
    {
        item["data"] = data;
        item["mimeType"] = mime_type;
    }
    return item;
}

const SdkTool* SdkMcpServer::find_tool(const std::string& tool_name) const
{
    for (const auto& tool : tools)
    {
        if (tool.name == tool_name)
            return &tool;
    }
    return nullptr;
}

SdkMcpServer create_server(const std::string& name, const std::string& version,
                           std::vector<SdkTool> tools)
{
    ServerBuilder builder(name, version);
    for (auto& tool : tools)
        builder.add_tool(std::move(tool));
    return builder.build();
}

ServerBuilder& ServerBuilder::add_tool(SdkTool tool)
{
    for (const auto& existing : tools_)
    {
        if (existing.name == tool.name)
            throw std::invalid_argument("Duplicate tool name: " + tool.name);
    }
    tools_.push_back(std::move(tool));
    return *this;
}

} // namespace mcp
} // namespace agentlink
