#include "internal/config.hpp"
#include "internal/hook_registry.hpp"
#include "internal/log.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/mcp/router.hpp>
#include <agentlink/protocol/control.hpp>
#include <agentlink/query.hpp>
#include <future>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace agentlink
{

namespace
{
// Slice used while polling caller input so cancellation is noticed promptly
constexpr auto kInputPollInterval = std::chrono::milliseconds(50);

json permission_result_to_json(const PermissionResult& result, const json& original_input)
{
    return std::visit(
        [&original_input](const auto& value) -> json
        {
            using T = std::decay_t<decltype(value)>;
            json response;
            if constexpr (std::is_same_v<T, PermissionResultAllow>)
            {
                response["behavior"] = PermissionBehavior::Allow;
                response["updatedInput"] = value.updated_input ? *value.updated_input
                                                               : original_input;
                if (value.updated_permissions)
                {
                    json permissions = json::array();
                    for (const auto& update : *value.updated_permissions)
                        permissions.push_back(update.to_json());
                    response["updatedPermissions"] = permissions;
                }
            }
            else
            {
                response["behavior"] = PermissionBehavior::Deny;
                response["message"] = value.message;
                if (value.interrupt)
                    response["interrupt"] = true;
            }
            return response;
        },
        result);
}

std::string string_field(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it != object.end() && it->is_string())
        return it->get<std::string>();
    return "";
}
} // namespace

QueryConfig QueryConfig::from_options(const AgentOptions& options,
                                      std::unique_ptr<Transport> transport)
{
    QueryConfig config;
    config.transport = std::move(transport);
    config.streaming_mode = true;
    config.can_use_tool = options.tool_permission_callback;
    config.hooks = options.hooks;
    config.sdk_mcp_servers = options.sdk_mcp_servers;
    config.initialize_timeout = internal::resolve_initialize_timeout(options.initialize_timeout);
    config.stream_close_timeout =
        internal::resolve_stream_close_timeout(options.stream_close_timeout);
    config.control_request_timeout = options.control_request_timeout;
    return config;
}

// ============================================================================
// Query::Dispatcher - read loop and inbound control requests
// ============================================================================

class Query::Dispatcher
{
  public:
    Dispatcher(Query& query, QueryConfig& config)
        : protocol_(config.streaming_mode), hooks_(std::move(config.hooks)),
          router_(std::move(config.sdk_mcp_servers)),
          can_use_tool_(std::move(config.can_use_tool)), query_(query)
    {
    }

    void start()
    {
        if (reader_thread_.joinable())
            return;
        reader_thread_ = std::thread(&Dispatcher::read_loop, this);
    }

    void join_reader()
    {
        if (reader_thread_.joinable())
            reader_thread_.join();
    }

    // Handlers that ignore cancellation may still be running after close()
    void wait_handlers()
    {
        std::vector<std::future<void>> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers.swap(handlers_);
        }
        for (auto& handler : handlers)
            handler.wait();
    }

    void write_line(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        query_.transport_->write(line);
    }

    void end_input()
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        query_.transport_->end_input();
    }

    json request(const std::string& subtype, const json& data, std::chrono::milliseconds timeout,
                 const CancellationToken* cancel)
    {
        return protocol_.send_request([this](const std::string& line) { write_line(line); },
                                      subtype, data, timeout, cancel);
    }

    // Assign callback ids on first use; later calls reuse them
    json hooks_handshake()
    {
        if (!registry_.sealed())
        {
            hooks_config_ = registry_.register_hooks(hooks_);
            registry_.seal();
        }
        return hooks_config_;
    }

    protocol::ControlProtocol& protocol()
    {
        return protocol_;
    }

  private:
    protocol::ControlProtocol protocol_;
    internal::HookRegistry registry_;
    std::map<std::string, std::vector<HookMatcher>> hooks_;
    json hooks_config_ = json::object();
    mcp::McpRouter router_;
    std::optional<ToolPermissionCallback> can_use_tool_;

    Query& query_;
    std::mutex write_mutex_;
    std::thread reader_thread_;

    std::mutex handlers_mutex_;
    std::vector<std::future<void>> handlers_;

    void read_loop();
    void route(json message);
    void spawn_handler(json message);

    void handle_control_request(const json& message);
    json handle_permission_request(const json& request);
    json handle_hook_callback(const json& request);
    json handle_mcp_message(const json& request);
    void send_response(const protocol::ControlResponse& response);
};

void Query::Dispatcher::read_loop()
{
    std::optional<std::string> failure;
    Transport& transport = *query_.transport_;

    try
    {
        while (!query_.cancel_.is_cancelled() && !failure)
        {
            auto results = transport.read_messages();

            if (results.empty())
            {
                if (!transport.has_messages())
                    break; // Output sequence ended
                continue;
            }

            for (auto& result : results)
            {
                if (query_.cancel_.is_cancelled())
                    break;
                if (result.is_error())
                {
                    failure = *result.error;
                    break;
                }
                route(std::move(result.data));
            }
        }
    }
    catch (const std::exception& e)
    {
        failure = e.what();
    }

    // Nothing will complete the outstanding requests now
    std::size_t aborted = protocol_.fail_all_pending(
        failure ? "Transport failed: " + *failure : std::string("Transport closed"));
    if (aborted > 0)
        internal::debug_log("aborted " + std::to_string(aborted) + " pending control requests");

    if (failure)
    {
        internal::debug_log("read loop stopped: " + *failure);
        query_.output_->push(json{{"type", MessageType::Error}, {"error", *failure}});
    }

    query_.output_->close();
}

void Query::Dispatcher::route(json message)
{
    std::string type = message_type(message);

    if (type == MessageType::ControlResponse)
    {
        if (!protocol_.handle_response(message))
            internal::debug_log("discarding control response with no pending request");
        return;
    }

    if (type == MessageType::ControlRequest)
    {
        spawn_handler(std::move(message));
        return;
    }

    if (type == MessageType::ControlCancelRequest)
    {
        internal::debug_log("ignoring control_cancel_request");
        return;
    }

    if (type == MessageType::Result)
        query_.latch_result();

    query_.output_->push(std::move(message));
}

void Query::Dispatcher::spawn_handler(json message)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);

    // Reap finished handlers
    for (auto it = handlers_.begin(); it != handlers_.end();)
    {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            it = handlers_.erase(it);
        else
            ++it;
    }

    handlers_.push_back(std::async(std::launch::async,
                                   [this, message = std::move(message)]()
                                   { handle_control_request(message); }));
}

void Query::Dispatcher::handle_control_request(const json& message)
{
    std::string request_id = string_field(message, "request_id");

    try
    {
        auto it = message.find("request");
        if (request_id.empty() || it == message.end() || !it->is_object())
            throw DispatchError("Invalid request format");

        const json& request = *it;
        std::string subtype = string_field(request, "subtype");
        internal::debug_log("control request " + request_id + ": " + subtype);

        json response;
        if (subtype == protocol::RequestSubtype::CanUseTool)
            response = handle_permission_request(request);
        else if (subtype == protocol::RequestSubtype::HookCallback)
            response = handle_hook_callback(request);
        else if (subtype == protocol::RequestSubtype::McpMessage)
            response = handle_mcp_message(request);
        else
            throw DispatchError("Unsupported control request subtype: " + subtype);

        send_response(protocol::ControlResponse::success(request_id, std::move(response)));
    }
    catch (const std::exception& e)
    {
        send_response(protocol::ControlResponse::failure(request_id, e.what()));
    }
}

json Query::Dispatcher::handle_permission_request(const json& request)
{
    if (!can_use_tool_)
        throw DispatchError("canUseTool callback is not provided");

    std::string tool_name = string_field(request, "tool_name");
    json input = request.contains("input") ? request["input"] : json::object();

    ToolPermissionContext context;
    context.cancellation = query_.cancel_;
    if (request.contains("permission_suggestions") &&
        request["permission_suggestions"].is_array())
    {
        for (const auto& suggestion : request["permission_suggestions"])
            context.suggestions.push_back(PermissionUpdate::from_json(suggestion));
    }
    if (request.contains("blocked_path") && request["blocked_path"].is_string())
        context.blocked_path = request["blocked_path"].get<std::string>();

    PermissionResult result = (*can_use_tool_)(tool_name, input, context);
    return permission_result_to_json(result, input);
}

json Query::Dispatcher::handle_hook_callback(const json& request)
{
    std::string callback_id = string_field(request, "callback_id");
    std::string tool_use_id = string_field(request, "tool_use_id");
    json input = request.contains("input") ? request["input"] : json::object();

    HookContext context;
    context.cancellation = query_.cancel_;
    return registry_.invoke(callback_id, input, tool_use_id, context);
}

json Query::Dispatcher::handle_mcp_message(const json& request)
{
    std::string server_name = string_field(request, "server_name");
    auto it = request.find("message");
    if (server_name.empty() || it == request.end() || !it->is_object())
        throw DispatchError("Missing server_name or message for MCP request");

    return json{{"mcp_response", router_.handle(server_name, *it)}};
}

void Query::Dispatcher::send_response(const protocol::ControlResponse& response)
{
    if (query_.cancel_.is_cancelled())
    {
        internal::debug_log("session closed, dropping control response for " +
                            response.response.request_id);
        return;
    }

    try
    {
        write_line(response.to_json().dump() + "\n");
    }
    catch (const std::exception& e)
    {
        internal::warn_log("failed to send control response for " +
                           response.response.request_id + ": " + e.what());
    }
}

// ============================================================================
// Query
// ============================================================================

Query::Query(QueryConfig config)
    : transport_(std::move(config.transport)), initialize_timeout_(config.initialize_timeout),
      stream_close_timeout_(config.stream_close_timeout),
      control_request_timeout_(config.control_request_timeout),
      has_callbacks_(!config.hooks.empty() || !config.sdk_mcp_servers.empty()),
      output_(std::make_shared<MessageChannel>())
{
    if (!transport_)
        throw std::invalid_argument("Query requires a transport");
    dispatcher_ = std::make_unique<Dispatcher>(*this, config);
}

Query::~Query()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        internal::warn_log(std::string("error while closing query: ") + e.what());
    }

    // Handlers reference the session; they must finish before it goes away
    dispatcher_->wait_handlers();
}

void Query::start()
{
    if (closed_)
        throw AgentError("Query is closed");
    dispatcher_->start();
}

std::optional<json> Query::initialize()
{
    if (!dispatcher_->protocol().streaming_mode())
        return std::nullopt;

    std::lock_guard<std::mutex> lock(init_mutex_);
    if (auto existing = init_result())
        return existing;

    json request = json::object();
    json hooks = dispatcher_->hooks_handshake();
    if (!hooks.empty())
        request["hooks"] = hooks;

    json response = dispatcher_->request(protocol::RequestSubtype::Initialize, request,
                                         initialize_timeout_, &cancel_);

    std::lock_guard<std::mutex> state_lock(state_mutex_);
    init_result_ = response;
    return response;
}

void Query::interrupt()
{
    send_control_request(protocol::RequestSubtype::Interrupt);
}

void Query::set_permission_mode(const std::string& mode)
{
    send_control_request(protocol::RequestSubtype::SetPermissionMode, {{"mode", mode}});
}

void Query::set_model(const std::string& model)
{
    json request = json::object();
    if (!model.empty())
        request["model"] = model;
    send_control_request(protocol::RequestSubtype::SetModel, request);
}

void Query::rewind_files(const std::string& user_message_id)
{
    send_control_request(protocol::RequestSubtype::RewindFiles,
                         {{"user_message_id", user_message_id}});
}

json Query::get_mcp_status()
{
    return send_control_request(protocol::RequestSubtype::McpStatus);
}

json Query::send_control_request(const std::string& subtype, const json& request,
                                 std::optional<std::chrono::milliseconds> timeout,
                                 const CancellationToken* cancel)
{
    if (closed_)
        throw ControlCancelledError("Query is closed", subtype);

    // Either the caller's token or the session's aborts the wait
    CancellationToken linked;
    CancellationSubscription session_link(&cancel_, [linked]() mutable { linked.cancel(); });
    CancellationSubscription caller_link(cancel, [linked]() mutable { linked.cancel(); });

    return dispatcher_->request(subtype, request, timeout.value_or(control_request_timeout_),
                                &linked);
}

void Query::write(const json& message)
{
    if (closed_)
        throw ConnectionError("Query is closed");
    dispatcher_->write_line(message.dump() + "\n");
}

void Query::stream_input(const std::shared_ptr<MessageChannel>& input,
                         const CancellationToken* cancel,
                         std::optional<std::chrono::milliseconds> timeout)
{
    if (!input)
        throw std::invalid_argument("stream_input requires an input channel");

    while (true)
    {
        if (cancel_.is_cancelled() || (cancel && cancel->is_cancelled()))
        {
            end_transport_input();
            return;
        }

        if (auto message = input->pop_for(kInputPollInterval))
        {
            write(*message);
            continue;
        }

        if (!input->has_more())
            break; // Input exhausted
    }

    end_input(timeout, cancel);
}

void Query::end_input(std::optional<std::chrono::milliseconds> timeout,
                      const CancellationToken* cancel)
{
    if (has_callbacks_ && !result_observed())
    {
        auto wait = timeout.value_or(stream_close_timeout_);
        internal::debug_log("waiting up to " + std::to_string(wait.count()) +
                            "ms for a result before ending input");
        if (!wait_for_result(wait, cancel))
            internal::debug_log("no result before ending input");
    }

    end_transport_input();
}

void Query::end_transport_input()
{
    if (closed_)
        return;

    try
    {
        dispatcher_->end_input();
    }
    catch (const std::exception& e)
    {
        internal::warn_log(std::string("failed to end input stream: ") + e.what());
    }
}

std::optional<json> Query::init_result() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return init_result_;
}

bool Query::is_initialized() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return init_result_.has_value();
}

bool Query::result_observed() const
{
    return result_observed_;
}

void Query::latch_result()
{
    bool expected = false;
    if (!result_observed_.compare_exchange_strong(expected, true))
        return;

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
    }
    result_cv_.notify_all();
}

bool Query::wait_for_result(std::chrono::milliseconds timeout,
                            const CancellationToken* cancel) const
{
    auto wake = [this]()
    {
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
        }
        result_cv_.notify_all();
    };
    CancellationSubscription session_wake(&cancel_, wake);
    CancellationSubscription caller_wake(cancel, wake);

    std::unique_lock<std::mutex> lock(result_mutex_);
    result_cv_.wait_for(lock, timeout,
                        [this, cancel]()
                        {
                            return result_observed_ || cancel_.is_cancelled() ||
                                   (cancel && cancel->is_cancelled());
                        });
    return result_observed_;
}

bool Query::streaming_mode() const
{
    return dispatcher_->protocol().streaming_mode();
}

std::size_t Query::pending_request_count() const
{
    return dispatcher_->protocol().pending_count();
}

void Query::close()
{
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true))
        return;

    internal::debug_log("closing query");

    // Wakes every waiter and stops the read loop
    cancel_.cancel();
    dispatcher_->join_reader();
    dispatcher_->protocol().fail_all_pending("Query closed");
    output_->close();

    // Running handlers are not waited for; their responses are dropped
    transport_->close();
}

} // namespace agentlink
