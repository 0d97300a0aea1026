#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentlink
{
namespace protocol
{

std::string ControlRequest::subtype() const
{
    if (request.is_object())
    {
        auto it = request.find("subtype");
        if (it != request.end() && it->is_string())
            return it->get<std::string>();
    }
    return "";
}

json ControlRequest::to_json() const
{
    return json{{"type", type}, {"request_id", request_id}, {"request", request}};
}

ControlRequest ControlRequest::from_json(const json& j)
{
    ControlRequest req;
    if (j.contains("request_id") && j["request_id"].is_string())
        req.request_id = j["request_id"].get<std::string>();
    req.request = j.value("request", json());
    return req;
}

json ControlResponse::to_json() const
{
    json inner = {{"subtype", response.subtype}, {"request_id", response.request_id}};
    if (is_error())
        inner["error"] = response.error;
    else
        inner["response"] = response.response.is_null() ? json::object() : response.response;
    return json{{"type", type}, {"response", inner}};
}

ControlResponse ControlResponse::success(const std::string& request_id, json data)
{
    ControlResponse resp;
    resp.response.subtype = "success";
    resp.response.request_id = request_id;
    resp.response.response = std::move(data);
    return resp;
}

ControlResponse ControlResponse::failure(const std::string& request_id, const std::string& error)
{
    ControlResponse resp;
    resp.response.subtype = "error";
    resp.response.request_id = request_id;
    resp.response.error = error;
    return resp;
}

ControlProtocol::ControlProtocol(bool streaming_mode) : streaming_mode_(streaming_mode) {}

std::string ControlProtocol::generate_request_id()
{
    std::uint64_t counter = ++request_counter_;

    // Random hex string (4 bytes = 8 hex chars)
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << "req_" << counter << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

std::string ControlProtocol::build_request_message(const std::string& request_id,
                                                   const std::string& subtype, const json& data)
{
    json request = data.is_object() ? data : json::object();
    request["subtype"] = subtype;

    json msg = {{"type", "control_request"}, {"request_id", request_id}, {"request", request}};

    return msg.dump() + "\n";
}

json ControlProtocol::send_request(const WriteFunc& write_func, const std::string& subtype,
                                   const json& request_data, std::chrono::milliseconds timeout,
                                   const CancellationToken* cancel)
{
    if (!streaming_mode_)
        throw AgentError("Control requests require streaming mode: " + subtype);

    if (cancel && cancel->is_cancelled())
        throw ControlCancelledError("Control request cancelled: " + subtype, subtype);

    std::string request_id = generate_request_id();

    // Register pending request BEFORE sending
    auto future = pending_.add(request_id);

    std::string line = build_request_message(request_id, subtype, request_data);
    try
    {
        write_func(line);
    }
    catch (...)
    {
        pending_.remove(request_id);
        throw;
    }

    // Caller cancellation completes the slot like any other path
    CancellationSubscription subscription(
        cancel,
        [this, request_id, subtype]()
        {
            pending_.reject(request_id,
                            std::make_exception_ptr(ControlCancelledError(
                                "Control request cancelled: " + subtype, subtype)));
        });

    if (timeout.count() > 0)
    {
        auto status = future.wait_for(timeout);
        // If remove() fails the slot was completed concurrently; use that outcome
        if (status == std::future_status::timeout && pending_.remove(request_id))
            throw ControlTimeoutError(subtype);
    }

    json response;
    try
    {
        response = future.get();
    }
    catch (const ControlCancelledError& e)
    {
        if (!e.subtype().empty())
            throw;
        throw ControlCancelledError(std::string(e.what()) + ": " + subtype, subtype);
    }

    if (response.value("subtype", "") == "error")
    {
        std::string error = "Unknown error";
        if (response.contains("error") && response["error"].is_string())
            error = response["error"].get<std::string>();
        throw ControlRequestError(error);
    }

    if (response.contains("response") && response["response"].is_object())
        return response["response"];

    return json::object();
}

bool ControlProtocol::handle_response(const json& message)
{
    if (!message.is_object() || !message.contains("response") || !message["response"].is_object())
        return false;

    const json& response = message["response"];
    if (!response.contains("request_id") || !response["request_id"].is_string())
        return false;

    return pending_.resolve(response["request_id"].get<std::string>(), response);
}

std::size_t ControlProtocol::fail_all_pending(const std::string& reason)
{
    return pending_.fail_all(std::make_exception_ptr(ControlCancelledError(reason)));
}

} // namespace protocol
} // namespace agentlink
