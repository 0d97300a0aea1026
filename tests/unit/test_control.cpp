#include "../../src/internal/config.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <chrono>
#include <cstdlib>
#include <future>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace agentlink::protocol;
using agentlink::json;
using namespace std::chrono_literals;

namespace
{

json response_for(const std::string& request_id, json payload)
{
    return json{{"type", "control_response"},
                {"response",
                 {{"subtype", "success"}, {"request_id", request_id}, {"response", payload}}}};
}

std::string request_id_of(const std::string& line)
{
    return json::parse(line)["request_id"].get<std::string>();
}

} // namespace

TEST(ControlProtocolUnitTest, GenerateRequestId)
{
    ControlProtocol protocol;

    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i)
        ids.insert(protocol.generate_request_id());
    EXPECT_EQ(ids.size(), 100u);

    auto id = protocol.generate_request_id();
    EXPECT_EQ(id.substr(0, 4), "req_");
    // req_{counter}_{8 hex}
    auto sep = id.find('_', 4);
    ASSERT_NE(sep, std::string::npos);
    EXPECT_EQ(id.size() - sep - 1, 8u);
}

TEST(ControlProtocolUnitTest, RequestIdIncremental)
{
    ControlProtocol protocol;

    auto extract_counter = [](const std::string& id)
    {
        auto pos = id.find('_', 4);
        return std::stoi(id.substr(4, pos - 4));
    };

    int counter1 = extract_counter(protocol.generate_request_id());
    int counter2 = extract_counter(protocol.generate_request_id());
    EXPECT_EQ(counter1, 1);
    EXPECT_EQ(counter2, 2);
}

TEST(ControlProtocolUnitTest, BuildRequestMessage)
{
    auto message =
        ControlProtocol::build_request_message("req_1_abcd", "set_permission_mode",
                                               json{{"mode", "acceptEdits"}});

    EXPECT_EQ(message.back(), '\n');

    auto parsed = json::parse(message);
    EXPECT_EQ(parsed["type"], "control_request");
    EXPECT_EQ(parsed["request_id"], "req_1_abcd");
    EXPECT_EQ(parsed["request"]["subtype"], "set_permission_mode");
    EXPECT_EQ(parsed["request"]["mode"], "acceptEdits");
}

TEST(ControlProtocolUnitTest, SuccessResponseReturnsPayload)
{
    ControlProtocol protocol;

    auto write_func = [&](const std::string& line)
    { protocol.handle_response(response_for(request_id_of(line), json{{"commands", json::array()}})); };

    json result = protocol.send_request(write_func, "initialize", json::object());
    EXPECT_TRUE(result.contains("commands"));
    EXPECT_EQ(protocol.pending_count(), 0u);
}

TEST(ControlProtocolUnitTest, MissingPayloadYieldsEmptyObject)
{
    ControlProtocol protocol;

    auto write_func = [&](const std::string& line)
    {
        json envelope = {{"type", "control_response"},
                         {"response", {{"subtype", "success"}, {"request_id", request_id_of(line)}}}};
        protocol.handle_response(envelope);
    };

    json result = protocol.send_request(write_func, "interrupt", json::object());
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST(ControlProtocolUnitTest, ErrorResponseThrows)
{
    ControlProtocol protocol;

    auto write_func = [&](const std::string& line)
    {
        json envelope = {{"type", "control_response"},
                         {"response",
                          {{"subtype", "error"},
                           {"request_id", request_id_of(line)},
                           {"error", "Test error message"}}}};
        protocol.handle_response(envelope);
    };

    try
    {
        protocol.send_request(write_func, "set_model", json{{"model", "x"}});
        FAIL() << "Expected ControlRequestError";
    }
    catch (const agentlink::ControlRequestError& e)
    {
        EXPECT_STREQ(e.what(), "Test error message");
    }
}

TEST(ControlProtocolUnitTest, ErrorResponseWithoutMessage)
{
    ControlProtocol protocol;

    auto write_func = [&](const std::string& line)
    {
        json envelope = {{"type", "control_response"},
                         {"response", {{"subtype", "error"}, {"request_id", request_id_of(line)}}}};
        protocol.handle_response(envelope);
    };

    try
    {
        protocol.send_request(write_func, "interrupt", json::object());
        FAIL() << "Expected ControlRequestError";
    }
    catch (const agentlink::ControlRequestError& e)
    {
        EXPECT_STREQ(e.what(), "Unknown error");
    }
}

TEST(ControlProtocolUnitTest, TimeoutThenLateResponseIsNoOp)
{
    ControlProtocol protocol;
    std::string request_id;

    auto write_func = [&](const std::string& line) { request_id = request_id_of(line); };

    auto start = std::chrono::steady_clock::now();
    try
    {
        protocol.send_request(write_func, "interrupt", json::object(), 50ms);
        FAIL() << "Expected ControlTimeoutError";
    }
    catch (const agentlink::ControlTimeoutError& e)
    {
        EXPECT_EQ(e.subtype(), "interrupt");
        EXPECT_NE(std::string(e.what()).find("interrupt"), std::string::npos);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);

    EXPECT_FALSE(protocol.is_pending(request_id));
    EXPECT_FALSE(protocol.handle_response(response_for(request_id, json::object())));
}

TEST(ControlProtocolUnitTest, UnknownResponseIgnored)
{
    ControlProtocol protocol;
    EXPECT_FALSE(protocol.handle_response(response_for("req_99_deadbeef", json::object())));
    EXPECT_FALSE(protocol.handle_response(json{{"type", "control_response"}}));
    EXPECT_FALSE(protocol.handle_response(json::array()));
}

TEST(ControlProtocolUnitTest, RequiresStreamingMode)
{
    ControlProtocol protocol(false);
    bool written = false;

    EXPECT_THROW(protocol.send_request([&](const std::string&) { written = true; }, "interrupt",
                                       json::object()),
                 agentlink::AgentError);
    EXPECT_FALSE(written);
}

TEST(ControlProtocolUnitTest, WriteFailureLeavesNoPendingEntry)
{
    ControlProtocol protocol;

    auto write_func = [](const std::string&) { throw agentlink::ConnectionError("pipe closed"); };

    EXPECT_THROW(protocol.send_request(write_func, "interrupt", json::object()),
                 agentlink::ConnectionError);
    EXPECT_EQ(protocol.pending_count(), 0u);
}

TEST(ControlProtocolUnitTest, PreCancelledTokenSkipsWrite)
{
    ControlProtocol protocol;
    agentlink::CancellationToken token;
    token.cancel();
    bool written = false;

    EXPECT_THROW(protocol.send_request([&](const std::string&) { written = true; }, "interrupt",
                                       json::object(), 1000ms, &token),
                 agentlink::ControlCancelledError);
    EXPECT_FALSE(written);
}

TEST(ControlProtocolUnitTest, CancellationAbortsWait)
{
    ControlProtocol protocol;
    agentlink::CancellationToken token;
    std::promise<std::string> sent;

    auto write_func = [&](const std::string& line) { sent.set_value(request_id_of(line)); };

    auto fut = std::async(std::launch::async,
                          [&] { return protocol.send_request(write_func, "interrupt", json::object(),
                                                             5000ms, &token); });

    std::string request_id = sent.get_future().get();
    token.cancel();

    try
    {
        fut.get();
        FAIL() << "Expected ControlCancelledError";
    }
    catch (const agentlink::ControlCancelledError& e)
    {
        EXPECT_EQ(e.subtype(), "interrupt");
    }
    EXPECT_FALSE(protocol.is_pending(request_id));
}

TEST(ControlProtocolUnitTest, FailAllPendingAbortsWaiters)
{
    ControlProtocol protocol;
    std::promise<void> sent;

    auto write_func = [&](const std::string&) { sent.set_value(); };

    auto fut = std::async(std::launch::async,
                          [&] { return protocol.send_request(write_func, "mcp_status", json::object(),
                                                             5000ms); });

    sent.get_future().wait();
    EXPECT_EQ(protocol.fail_all_pending("Transport closed"), 1u);

    try
    {
        fut.get();
        FAIL() << "Expected ControlCancelledError";
    }
    catch (const agentlink::ControlCancelledError& e)
    {
        EXPECT_EQ(e.subtype(), "mcp_status");
        EXPECT_NE(std::string(e.what()).find("Transport closed"), std::string::npos);
    }
}

TEST(ControlMessageTest, ResponseEnvelopes)
{
    auto ok = ControlResponse::success("req_1", json{{"behavior", "allow"}}).to_json();
    EXPECT_EQ(ok["type"], "control_response");
    EXPECT_EQ(ok["response"]["subtype"], "success");
    EXPECT_EQ(ok["response"]["request_id"], "req_1");
    EXPECT_EQ(ok["response"]["response"]["behavior"], "allow");
    EXPECT_FALSE(ok["response"].contains("error"));

    auto failed = ControlResponse::failure("req_2", "nope");
    EXPECT_TRUE(failed.is_error());
    auto j = failed.to_json();
    EXPECT_EQ(j["response"]["subtype"], "error");
    EXPECT_EQ(j["response"]["error"], "nope");
    EXPECT_FALSE(j["response"].contains("response"));
}

TEST(ControlMessageTest, RequestFromJson)
{
    auto req = ControlRequest::from_json(
        json{{"type", "control_request"},
             {"request_id", "cli_7"},
             {"request", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}}});
    EXPECT_EQ(req.request_id, "cli_7");
    EXPECT_EQ(req.subtype(), RequestSubtype::CanUseTool);

    auto empty = ControlRequest::from_json(json{{"type", "control_request"}});
    EXPECT_TRUE(empty.request_id.empty());
    EXPECT_EQ(empty.subtype(), "");
}

TEST(TimeoutConfigTest, InitializeTimeoutOnlyRaisedByEnv)
{
    using agentlink::internal::resolve_initialize_timeout;

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "1000", 1);
    EXPECT_EQ(resolve_initialize_timeout(60000ms), 60000ms);

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "120000", 1);
    EXPECT_EQ(resolve_initialize_timeout(60000ms), 120000ms);

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "garbage", 1);
    EXPECT_EQ(resolve_initialize_timeout(60000ms), 60000ms);

    unsetenv(agentlink::internal::kStreamCloseTimeoutEnv);
    EXPECT_EQ(resolve_initialize_timeout(60000ms), 60000ms);
}

TEST(TimeoutConfigTest, StreamCloseTimeoutOverride)
{
    using agentlink::internal::resolve_stream_close_timeout;

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "1500", 1);
    EXPECT_EQ(resolve_stream_close_timeout(60000ms), 1500ms);

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "0", 1);
    EXPECT_EQ(resolve_stream_close_timeout(60000ms), 60000ms);

    setenv(agentlink::internal::kStreamCloseTimeoutEnv, "15s", 1);
    EXPECT_EQ(resolve_stream_close_timeout(60000ms), 60000ms);

    unsetenv(agentlink::internal::kStreamCloseTimeoutEnv);
    EXPECT_EQ(resolve_stream_close_timeout(60000ms), 60000ms);
}
