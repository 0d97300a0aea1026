#include <agentlink/mcp.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace agentlink;
using namespace agentlink::mcp;

namespace
{

McpRouter make_calculator_router()
{
    auto calc = server("calc", "2.0.0")
                    .add_tool("add", "Add two numbers",
                              json{{"type", "object"},
                                   {"properties",
                                    {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                                   {"required", {"a", "b"}}},
                              [](const json& args)
                              {
                                  double sum = args.at("a").get<double>() + args.at("b").get<double>();
                                  return text_result(std::to_string(static_cast<int>(sum)));
                              })
                    .add_tool("divide", "Divide a by b", json{{"type", "object"}},
                              [](const json& args)
                              {
                                  if (args.value("b", 0.0) == 0.0)
                                      return error_result("Division by zero");
                                  return text_result("ok");
                              })
                    .add_tool("explode", "Always throws", json{{"type", "object"}},
                              [](const json&) -> ToolResult
                              { throw std::runtime_error("kaboom"); })
                    .build();

    std::map<std::string, SdkMcpServer> servers;
    servers.emplace("calc", std::move(calc));
    return McpRouter(std::move(servers));
}

json rpc(int id, const std::string& method, json params = json::object())
{
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // namespace

TEST(McpRouterTest, Initialize)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", rpc(1, "initialize"));

    EXPECT_EQ(reply["jsonrpc"], "2.0");
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(reply["result"]["capabilities"].contains("tools"));
    EXPECT_EQ(reply["result"]["serverInfo"]["name"], "calc");
    EXPECT_EQ(reply["result"]["serverInfo"]["version"], "2.0.0");
}

TEST(McpRouterTest, ToolsListKeepsRegistrationOrder)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", rpc(2, "tools/list"));

    const auto& tools = reply["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "add");
    EXPECT_EQ(tools[0]["description"], "Add two numbers");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], (json{"a", "b"}));
    EXPECT_EQ(tools[1]["name"], "divide");
    EXPECT_EQ(tools[2]["name"], "explode");
}

TEST(McpRouterTest, ToolsCallReturnsContent)
{
    auto router = make_calculator_router();
    json reply =
        router.handle("calc", rpc(3, "tools/call", {{"name", "add"}, {"arguments", {{"a", 2}, {"b", 3}}}}));

    EXPECT_EQ(reply["id"], 3);
    ASSERT_TRUE(reply.contains("result"));
    const auto& content = reply["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "5");
    EXPECT_FALSE(reply["result"].contains("is_error"));
}

TEST(McpRouterTest, ToolErrorResultIsFlagged)
{
    auto router = make_calculator_router();
    json reply = router.handle(
        "calc", rpc(4, "tools/call", {{"name", "divide"}, {"arguments", {{"a", 1}, {"b", 0}}}}));

    EXPECT_EQ(reply["result"]["is_error"], true);
    EXPECT_EQ(reply["result"]["content"][0]["text"], "Division by zero");
}

TEST(McpRouterTest, ThrowingHandlerBecomesInternalError)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", rpc(5, "tools/call", {{"name", "explode"}}));

    EXPECT_EQ(reply["id"], 5);
    EXPECT_EQ(reply["error"]["code"], kInternalError);
    EXPECT_EQ(reply["error"]["message"], "kaboom");
}

TEST(McpRouterTest, UnknownToolIsMethodNotFound)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", rpc(6, "tools/call", {{"name", "multiply"}}));

    EXPECT_EQ(reply["error"]["code"], kMethodNotFound);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("multiply"), std::string::npos);
}

TEST(McpRouterTest, UnknownServerIsMethodNotFound)
{
    auto router = make_calculator_router();
    json reply = router.handle("weather", rpc(7, "tools/list"));

    EXPECT_EQ(reply["id"], 7);
    EXPECT_EQ(reply["error"]["code"], kMethodNotFound);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("weather"), std::string::npos);
}

TEST(McpRouterTest, UnknownMethodIsMethodNotFound)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", rpc(8, "resources/list"));

    EXPECT_EQ(reply["error"]["code"], kMethodNotFound);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("resources/list"),
              std::string::npos);
}

TEST(McpRouterTest, MissingMethodIsInvalidRequest)
{
    auto router = make_calculator_router();
    json reply = router.handle("calc", json{{"jsonrpc", "2.0"}, {"id", 9}});

    EXPECT_EQ(reply["id"], 9);
    EXPECT_EQ(reply["error"]["code"], kInvalidRequest);
}

TEST(McpRouterTest, InitializedNotificationAcknowledged)
{
    auto router = make_calculator_router();
    json reply =
        router.handle("calc", json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

    EXPECT_EQ(reply["jsonrpc"], "2.0");
    EXPECT_EQ(reply["result"], json::object());
    EXPECT_FALSE(reply.contains("id"));
}

TEST(McpRouterTest, StringIdsEchoed)
{
    auto router = make_calculator_router();
    json msg = {{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "tools/list"}};
    EXPECT_EQ(router.handle("calc", msg)["id"], "abc");
}

TEST(McpServerTest, DuplicateToolNamesRejected)
{
    auto noop = [](const json&) { return text_result(""); };
    std::vector<SdkTool> tools = {make_tool("a", "", json::object(), noop),
                                  make_tool("a", "", json::object(), noop)};
    EXPECT_THROW(create_server("dup", "1.0.0", tools), std::invalid_argument);

    auto builder = server("dup", "1.0.0");
    builder.add_tool("a", "", json::object(), noop);
    EXPECT_THROW(builder.add_tool("a", "", json::object(), noop), std::invalid_argument);
    EXPECT_EQ(builder.tool_count(), 1u);
}

TEST(McpServerTest, ImageContentSerialization)
{
    auto result = image_result("aGVsbG8=", "image/png");
    json item = result.content[0].to_json();
    EXPECT_EQ(item["type"], "image");
    EXPECT_EQ(item["data"], "aGVsbG8=");
    EXPECT_EQ(item["mimeType"], "image/png");
    EXPECT_FALSE(item.contains("text"));
}
