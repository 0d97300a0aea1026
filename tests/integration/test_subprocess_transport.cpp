#include "../../src/internal/transport/subprocess_transport.hpp"

#include <agentlink/client.hpp>
#include <agentlink/errors.hpp>
#include <agentlink/version.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace agentlink;
using namespace std::chrono_literals;

// Transport tests against small POSIX tools standing in for the agent

namespace
{

// Drain the transport until its output ends (or the deadline passes)
std::vector<ReadResult> drain(Transport& transport, std::chrono::milliseconds timeout = 5s)
{
    std::vector<ReadResult> all;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto batch = transport.read_messages();
        for (auto& result : batch)
            all.push_back(std::move(result));
        if (batch.empty() && !transport.has_messages())
            break;
    }
    return all;
}

// Read until count results arrived
std::vector<ReadResult> read_n(Transport& transport, std::size_t count,
                               std::chrono::milliseconds timeout = 5s)
{
    std::vector<ReadResult> all;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (all.size() < count && std::chrono::steady_clock::now() < deadline)
    {
        for (auto& result : transport.read_messages())
            all.push_back(std::move(result));
    }
    return all;
}

AgentOptions shell(const std::string& script)
{
    AgentOptions opts;
    opts.command = {"/bin/sh", "-c", script};
    return opts;
}

} // namespace

TEST(SubprocessTransportTest, EchoRoundTrip)
{
    AgentOptions opts;
    opts.command = {"/bin/cat"};
    auto transport = create_subprocess_transport(opts);

    EXPECT_FALSE(transport->is_ready());
    transport->connect();
    EXPECT_TRUE(transport->is_ready());
    EXPECT_GT(transport->get_pid(), 0);

    transport->write(json{{"type", "user"}, {"n", 1}}.dump() + "\n");
    transport->write(json{{"type", "user"}, {"n", 2}}.dump() + "\n");

    auto results = read_n(*transport, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].is_error());
    EXPECT_EQ(results[0].data["n"], 1);
    EXPECT_EQ(results[1].data["n"], 2);

    // cat exits cleanly once its input ends
    transport->end_input();
    auto rest = drain(*transport);
    EXPECT_TRUE(rest.empty());
    EXPECT_FALSE(transport->has_messages());

    transport->close();
}

TEST(SubprocessTransportTest, WriteAfterEndInputFails)
{
    AgentOptions opts;
    opts.command = {"/bin/cat"};
    auto transport = create_subprocess_transport(opts);

    EXPECT_THROW(transport->write("{}\n"), ConnectionError);

    transport->connect();
    transport->end_input();
    transport->end_input();
    EXPECT_THROW(transport->write("{}\n"), ConnectionError);

    transport->close();
}

TEST(SubprocessTransportTest, NonZeroExitEndsWithProcessError)
{
    auto transport =
        create_subprocess_transport(shell("echo '{\"type\":\"system\"}'; exit 3"));
    transport->connect();

    auto results = drain(*transport);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].data["type"], "system");
    ASSERT_TRUE(results[1].is_error());
    EXPECT_NE(results[1].error->find("Agent process failed"), std::string::npos);
    EXPECT_NE(results[1].error->find("exit code: 3"), std::string::npos);

    transport->close();
}

TEST(SubprocessTransportTest, OversizedLineEndsWithDecodeError)
{
    AgentOptions opts = shell("printf '%0200d\\n' 0; cat >/dev/null");
    opts.max_buffer_size = 64;
    auto transport = create_subprocess_transport(opts);
    transport->connect();

    auto results = read_n(*transport, 1);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].is_error());
    EXPECT_NE(results[0].error->find("exceeded maximum buffer size of 64 bytes"), std::string::npos);

    // Nothing follows a terminal error
    EXPECT_TRUE(drain(*transport).empty());
    transport->close();
}

TEST(SubprocessTransportTest, EnvironmentAndVersionPassed)
{
    AgentOptions opts = shell(
        "printf '{\"foo\":\"%s\",\"sdk\":\"%s\"}\\n' \"$AGENTLINK_TEST_FOO\" \"$AGENTLINK_SDK_VERSION\"");
    opts.environment["AGENTLINK_TEST_FOO"] = "bar";
    auto transport = create_subprocess_transport(opts);
    transport->connect();

    auto results = read_n(*transport, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].data["foo"], "bar");
    EXPECT_EQ(results[0].data["sdk"], version_string());

    transport->close();
}

TEST(SubprocessTransportTest, WorkingDirectory)
{
    AgentOptions opts = shell("printf '{\"cwd\":\"%s\"}\\n' \"$(pwd)\"");
    opts.working_directory = "/";
    auto transport = create_subprocess_transport(opts);
    transport->connect();

    auto results = read_n(*transport, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].data["cwd"], "/");

    transport->close();
}

TEST(SubprocessTransportTest, StderrLinesReachCallback)
{
    std::mutex mutex;
    std::vector<std::string> lines;

    AgentOptions opts = shell("echo 'first warning' >&2; echo 'second' >&2; cat >/dev/null");
    opts.stderr_callback = [&](const std::string& line)
    {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    };
    auto transport = create_subprocess_transport(opts);
    transport->connect();

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (lines.size() >= 2)
                break;
        }
        std::this_thread::sleep_for(10ms);
    }
    transport->close();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(lines, (std::vector<std::string>{"first warning", "second"}));
}

TEST(SubprocessTransportTest, ConnectErrors)
{
    AgentOptions empty;
    auto no_command = create_subprocess_transport(empty);
    try
    {
        no_command->connect();
        FAIL() << "Expected ConnectionError";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_STREQ(e.what(), "No agent command configured");
    }

    AgentOptions missing;
    missing.command = {"this_agent_does_not_exist_12345"};
    auto transport = create_subprocess_transport(missing);
    try
    {
        transport->connect();
        FAIL() << "Expected ConnectionError";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_NE(std::string(e.what()).find("Failed to start agent process"), std::string::npos);
    }
    EXPECT_FALSE(transport->is_ready());
}

TEST(SubprocessTransportTest, CloseTerminatesStubbornProcess)
{
    AgentOptions opts;
    opts.command = {"/bin/sleep", "30"};
    auto transport = create_subprocess_transport(opts);
    transport->connect();

    auto start = std::chrono::steady_clock::now();
    transport->close();
    transport->close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_FALSE(transport->is_ready());
    EXPECT_EQ(transport->get_pid(), 0);
    EXPECT_FALSE(transport->has_messages());
    EXPECT_THROW(transport->write("{}\n"), ConnectionError);
}

TEST(SubprocessTransportTest, OneShotQueryAgainstScriptedAgent)
{
    // Answers the handshake, replies to one user message, then waits for EOF
    const char* script = R"sh(read -r line
id=$(printf '%s\n' "$line" | sed 's/.*"request_id":"\([^"]*\)".*/\1/')
printf '{"type":"control_response","response":{"subtype":"success","request_id":"%s","response":{"commands":[]}}}\n' "$id"
read -r line
printf '{"type":"assistant","message":{"content":[{"type":"text","text":"4"}]}}\n'
printf '{"type":"result","subtype":"success","is_error":false}\n'
cat >/dev/null
)sh";

    auto messages = query("What is 2+2?", shell(script));

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["type"], "assistant");
    EXPECT_EQ(messages[0]["message"]["content"][0]["text"], "4");
    EXPECT_TRUE(is_result_message(messages[1]));
}
