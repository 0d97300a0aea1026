#include "internal/log.hpp"

#include <agentlink/client.hpp>
#include <agentlink/errors.hpp>
#include <agentlink/query.hpp>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>

namespace agentlink
{

namespace
{
json make_user_message(const std::string& prompt, const std::string& session_id)
{
    return json{{"type", "user"},
                {"message", {{"role", "user"}, {"content", prompt}}},
                {"parent_tool_use_id", nullptr},
                {"session_id", session_id}};
}
} // namespace

// AgentClient::Impl - owns the transport (through the Query) and the session
class AgentClient::Impl
{
  public:
    AgentOptions options_;
    std::unique_ptr<Transport> pending_transport_; // Injected, not yet connected
    std::unique_ptr<Query> query_;
    mutable std::mutex mutex_;

    Impl(const AgentOptions& options, std::unique_ptr<Transport> transport)
        : options_(options), pending_transport_(std::move(transport))
    {
    }

    Query& require_query() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!query_ || query_->is_closed())
            throw ConnectionError("Not connected to agent");
        return *query_;
    }
};

AgentClient::AgentClient(const AgentOptions& options)
    : impl_(std::make_unique<Impl>(options, nullptr))
{
}

AgentClient::AgentClient(const AgentOptions& options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(options, std::move(transport)))
{
}

AgentClient::~AgentClient()
{
    if (!impl_)
        return;

    try
    {
        disconnect();
    }
    catch (const std::exception& e)
    {
        internal::warn_log(std::string("error while disconnecting: ") + e.what());
    }
}

AgentClient::AgentClient(AgentClient&&) noexcept = default;
AgentClient& AgentClient::operator=(AgentClient&&) noexcept = default;

void AgentClient::connect()
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (impl_->query_)
        return; // Already connected

    std::unique_ptr<Transport> transport = std::move(impl_->pending_transport_);
    if (!transport)
        transport = create_subprocess_transport(impl_->options_);

    transport->connect();

    auto query =
        std::make_unique<Query>(QueryConfig::from_options(impl_->options_, std::move(transport)));

    // The Query owns the transport now; closing it releases both
    try
    {
        query->start();
        query->initialize();
    }
    catch (const std::exception&)
    {
        try
        {
            query->close();
        }
        catch (const std::exception& e)
        {
            internal::warn_log(std::string("error while closing failed session: ") + e.what());
        }
        throw;
    }

    impl_->query_ = std::move(query);
}

void AgentClient::disconnect()
{
    std::unique_ptr<Query> query;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        query = std::move(impl_->query_);
    }

    if (query)
        query->close();
}

bool AgentClient::is_connected() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->query_ && !impl_->query_->is_closed() && impl_->query_->transport().is_ready();
}

long AgentClient::get_pid() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (impl_->query_ && !impl_->query_->is_closed())
        return impl_->query_->transport().get_pid();
    return 0;
}

void AgentClient::send_query(const std::string& prompt, const std::string& session_id)
{
    impl_->require_query().write(make_user_message(prompt, session_id));
}

void AgentClient::send_message(json message)
{
    if (!message.is_object())
        throw std::invalid_argument("send_message requires a JSON object");
    if (!message.contains("session_id"))
        message["session_id"] = "default";
    impl_->require_query().write(message);
}

MessageStream AgentClient::receive_messages()
{
    return MessageStream(impl_->require_query().messages());
}

std::vector<json> AgentClient::receive_response()
{
    std::vector<json> messages;

    MessageStream stream(impl_->require_query().messages(), true);
    for (const auto& msg : stream)
        messages.push_back(msg);

    return messages;
}

void AgentClient::interrupt()
{
    impl_->require_query().interrupt();
}

void AgentClient::set_permission_mode(const std::string& mode)
{
    impl_->require_query().set_permission_mode(mode);
}

void AgentClient::set_model(const std::string& model)
{
    impl_->require_query().set_model(model);
}

void AgentClient::rewind_files(const std::string& user_message_id)
{
    impl_->require_query().rewind_files(user_message_id);
}

json AgentClient::get_mcp_status()
{
    return impl_->require_query().get_mcp_status();
}

std::optional<json> AgentClient::get_server_info() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (!impl_->query_)
        return std::nullopt;
    return impl_->query_->init_result();
}

// ============================================================================
// One-shot query
// ============================================================================

std::vector<json> query(const std::string& prompt, const AgentOptions& options,
                        std::unique_ptr<Transport> transport)
{
    if (!transport)
        transport = create_subprocess_transport(options);
    transport->connect();

    Query session(QueryConfig::from_options(options, std::move(transport)));
    session.start();
    session.initialize();

    auto input = std::make_shared<MessageChannel>();
    input->push(make_user_message(prompt, "default"));
    input->close();

    auto writer = std::async(std::launch::async, [&session, input]()
                             { session.stream_input(input, &session.cancellation()); });

    std::vector<json> messages;
    std::optional<std::string> failure;
    MessageStream stream(session.messages());
    for (const auto& msg : stream)
    {
        if (is_error_message(msg))
        {
            failure = msg.value("error", std::string("Unknown transport error"));
            break;
        }
        messages.push_back(msg);
    }

    // Unblocks the writer if it is still waiting for a result
    session.close();

    std::exception_ptr writer_error;
    try
    {
        writer.get();
    }
    catch (...)
    {
        writer_error = std::current_exception();
    }

    // The transport failure explains a failed write, so it wins
    if (failure)
        throw AgentError(*failure);
    if (writer_error)
        std::rethrow_exception(writer_error);

    return messages;
}

} // namespace agentlink
