/**
 * @file mcp_calculator.cpp
 * @brief Example: Calculator MCP Server
 *
 * Usage: mcp_calculator <agent-executable> [agent-args...]
 *
 * The calculator tools run inside this process. The agent reaches them
 * through mcp_message control requests, so no separate server process is
 * needed.
 */

#include <agentlink/agentlink.hpp>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace agentlink;

namespace
{

json binary_schema(const char* a, const char* b)
{
    return json{{"type", "object"},
                {"properties", {{a, {{"type", "number"}}}, {b, {{"type", "number"}}}}},
                {"required", {a, b}}};
}

std::string format(double value)
{
    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
}

mcp::SdkMcpServer make_calculator()
{
    return mcp::server("calculator", "2.0.0")
        .add_tool("add", "Add two numbers", binary_schema("a", "b"),
                  [](const json& args)
                  {
                      double a = args.at("a").get<double>();
                      double b = args.at("b").get<double>();
                      return mcp::text_result(format(a) + " + " + format(b) + " = " +
                                              format(a + b));
                  })
        .add_tool("subtract", "Subtract one number from another", binary_schema("a", "b"),
                  [](const json& args)
                  {
                      double a = args.at("a").get<double>();
                      double b = args.at("b").get<double>();
                      return mcp::text_result(format(a) + " - " + format(b) + " = " +
                                              format(a - b));
                  })
        .add_tool("multiply", "Multiply two numbers", binary_schema("a", "b"),
                  [](const json& args)
                  {
                      double a = args.at("a").get<double>();
                      double b = args.at("b").get<double>();
                      return mcp::text_result(format(a) + " * " + format(b) + " = " +
                                              format(a * b));
                  })
        .add_tool("divide", "Divide one number by another", binary_schema("a", "b"),
                  [](const json& args)
                  {
                      double a = args.at("a").get<double>();
                      double b = args.at("b").get<double>();
                      // Reported to the model, not raised as a protocol error
                      if (b == 0.0)
                          return mcp::error_result("Division by zero is not allowed");
                      return mcp::text_result(format(a) + " / " + format(b) + " = " +
                                              format(a / b));
                  })
        .add_tool("sqrt", "Calculate square root",
                  json{{"type", "object"},
                       {"properties", {{"n", {{"type", "number"}}}}},
                       {"required", {"n"}}},
                  [](const json& args)
                  {
                      double n = args.at("n").get<double>();
                      if (n < 0)
                          return mcp::error_result("Cannot calculate square root of negative number " +
                                                   format(n));
                      return mcp::text_result("sqrt(" + format(n) + ") = " + format(std::sqrt(n)));
                  })
        .add_tool("power", "Raise a number to a power", binary_schema("base", "exponent"),
                  [](const json& args)
                  {
                      double base = args.at("base").get<double>();
                      double exponent = args.at("exponent").get<double>();
                      return mcp::text_result(format(base) + "^" + format(exponent) + " = " +
                                              format(std::pow(base, exponent)));
                  })
        .build();
}

// Display message content in a clean format
void display_message(const json& msg)
{
    std::string type = message_type(msg);
    if (type == "assistant")
    {
        for (const auto& block : msg["message"].value("content", json::array()))
        {
            std::string block_type = block.value("type", "");
            if (block_type == "text")
            {
                std::cout << "Agent: " << block.value("text", "") << "\n";
            }
            else if (block_type == "tool_use")
            {
                std::cout << "Using tool: " << block.value("name", "") << "\n";
                if (block.contains("input"))
                    std::cout << "  Input: " << block["input"].dump() << "\n";
            }
        }
    }
    else if (is_result_message(msg))
    {
        std::cout << "Result ended\n";
        double cost = msg.value("total_cost_usd", 0.0);
        if (cost > 0.0)
            std::cout << "Cost: $" << std::fixed << std::setprecision(6) << cost << "\n";
    }
    // Ignore system messages
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <agent-executable> [agent-args...]\n";
        return 2;
    }

    std::cout << "=== Calculator MCP Server Example ===\n\n";

    auto calculator = make_calculator();
    std::cout << "Created MCP server '" << calculator.name << "' v" << calculator.version
              << " with " << calculator.tools.size() << " tools\n\n";

    AgentOptions opts;
    opts.command.assign(argv + 1, argv + argc);
    opts.sdk_mcp_servers["calc"] = calculator;
    opts.tool_permission_callback = [](const std::string& tool_name, const json&,
                                       const ToolPermissionContext&) -> PermissionResult
    {
        // Only the calculator tools are allowed
        if (tool_name.rfind("mcp__calc__", 0) == 0)
            return PermissionResultAllow{};
        return PermissionResultDeny{"Only calculator tools may run", false};
    };

    const char* prompts[] = {"List your tools", "Calculate 15 + 27", "What is 100 divided by 7?",
                             "Calculate the square root of 144", "What is 2 raised to the power of 8?"};

    try
    {
        AgentClient client(opts);
        client.connect();

        for (const char* prompt : prompts)
        {
            std::cout << "\n" << std::string(50, '=') << "\n";
            std::cout << "Prompt: " << prompt << "\n";
            std::cout << std::string(50, '=') << "\n";

            client.send_query(prompt);
            for (const auto& msg : client.receive_response())
                display_message(msg);
        }

        client.disconnect();
    }
    catch (const ProcessError& e)
    {
        std::cerr << "Agent process error: " << e.what() << "\n";
        return 1;
    }
    catch (const AgentError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
