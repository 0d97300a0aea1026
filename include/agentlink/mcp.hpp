#ifndef AGENTLINK_MCP_HPP
#define AGENTLINK_MCP_HPP

/**
 * @file mcp.hpp
 * @brief In-process tool servers answered over the control protocol
 *
 * Example usage:
 * @code
 * #include <agentlink/agentlink.hpp>
 *
 * using namespace agentlink;
 *
 * auto calculator = mcp::server("calculator", "1.0.0")
 *     .add_tool("add", "Add two numbers",
 *               {{"type", "object"},
 *                {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
 *                {"required", {"a", "b"}}},
 *               [](const json& args) {
 *                   double sum = args.at("a").get<double>() + args.at("b").get<double>();
 *                   return mcp::text_result(std::to_string(sum));
 *               })
 *     .build();
 *
 * AgentOptions opts;
 * opts.sdk_mcp_servers["calculator"] = calculator;
 * @endcode
 */

#include <agentlink/mcp/router.hpp>
#include <agentlink/mcp/server.hpp>

#endif // AGENTLINK_MCP_HPP
