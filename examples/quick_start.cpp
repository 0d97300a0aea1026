/**
 * @file quick_start.cpp
 * @brief Example: one-shot queries against an agent process
 *
 * Usage: quick_start <agent-executable> [agent-args...]
 *
 * The agent is launched once per query, answers it, and exits when its
 * input ends.
 */

#include <agentlink/agentlink.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

// Concatenate the text blocks of an assistant message
std::string text_of(const agentlink::json& msg)
{
    std::string text;
    if (msg.value("type", "") != "assistant" || !msg.contains("message"))
        return text;

    const auto& content = msg["message"].value("content", agentlink::json::array());
    if (content.is_string())
        return content.get<std::string>();

    for (const auto& block : content)
    {
        if (block.value("type", "") == "text")
            text += block.value("text", "");
    }
    return text;
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <agent-executable> [agent-args...]\n";
        return 2;
    }

    agentlink::AgentOptions opts;
    opts.command.assign(argv + 1, argv + argc);

    std::vector<std::string> prompts = {"What is 2 + 2?", "Name three prime numbers."};

    for (const auto& prompt : prompts)
    {
        std::cout << "> " << prompt << "\n";
        auto start = std::chrono::steady_clock::now();

        try
        {
            auto messages = agentlink::query(prompt, opts);
            for (const auto& msg : messages)
            {
                std::string text = text_of(msg);
                if (!text.empty())
                    std::cout << text << "\n";
                if (agentlink::is_result_message(msg) && msg.value("is_error", false))
                    std::cout << "(agent reported an error)\n";
            }
        }
        catch (const agentlink::ProcessError& e)
        {
            std::cerr << "Agent process error: " << e.what() << "\n";
            return 1;
        }
        catch (const agentlink::ConnectionError& e)
        {
            std::cerr << "Could not reach the agent: " << e.what() << "\n";
            return 1;
        }
        catch (const agentlink::AgentError& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "[" << elapsed.count() << " ms]\n\n";
    }

    return 0;
}
