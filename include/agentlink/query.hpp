#ifndef AGENTLINK_QUERY_HPP
#define AGENTLINK_QUERY_HPP

#include <agentlink/cancellation.hpp>
#include <agentlink/message_stream.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

/// Everything a Query needs; built by hand or from AgentOptions
struct QueryConfig
{
    /// Connected transport; the Query takes ownership
    std::unique_ptr<Transport> transport;

    /// Control requests (and the handshake) require streaming mode
    bool streaming_mode = true;

    std::optional<ToolPermissionCallback> can_use_tool;
    std::map<std::string, std::vector<HookMatcher>> hooks;
    std::map<std::string, mcp::SdkMcpServer> sdk_mcp_servers;

    std::chrono::milliseconds initialize_timeout{60000};
    std::chrono::milliseconds stream_close_timeout{60000};
    std::chrono::milliseconds control_request_timeout{60000};

    /// Copy the callbacks and timeouts of options, applying environment overrides
    static QueryConfig from_options(const AgentOptions& options,
                                    std::unique_ptr<Transport> transport);
};

/**
 * One session of the control protocol over a transport.
 *
 * start() launches the read loop: control responses complete outstanding
 * requests, inbound control requests (permission checks, hook callbacks,
 * tool-server messages) are answered on worker threads, and everything else
 * is forwarded to messages(). A transport failure aborts outstanding requests
 * and ends messages() with {"type":"error","error":...}.
 *
 * Thread-safety: control operations, write() and stream_input() may be
 * called from any thread. close() is idempotent; it cancels the session,
 * joins the read loop, then closes the transport. Handlers that ignore the
 * cancellation keep running in the background and their responses are
 * dropped; the destructor waits for them.
 *
 * Example:
 * ```cpp
 * QueryConfig config;
 * config.transport = std::move(transport);
 * Query query(std::move(config));
 * query.start();
 * query.initialize();
 * query.write(user_message);
 * for (const auto& msg : MessageStream(query.messages(), true))
 *     handle(msg);
 * query.close();
 * ```
 */
class Query
{
  public:
    explicit Query(QueryConfig config);
    ~Query();

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    // Start the read loop. Throws AgentError after close().
    void start();

    // Handshake: registers the hook callbacks and returns the agent's reply.
    // No-op (nullopt) outside streaming mode. Repeating it after success
    // returns the retained reply.
    std::optional<json> initialize();

    // Control operations; throw on timeout, cancellation or an error reply
    void interrupt();
    void set_permission_mode(const std::string& mode);
    // An empty model selects the agent's default
    void set_model(const std::string& model);
    void rewind_files(const std::string& user_message_id);
    json get_mcp_status();

    // Issue an arbitrary control request and return its response payload.
    // Uses the configured control request timeout unless one is given.
    json send_control_request(const std::string& subtype, const json& request = json::object(),
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                              const CancellationToken* cancel = nullptr);

    // Write one data message to the agent
    void write(const json& message);

    // Forward messages from input until it is closed and drained, then end
    // the input stream (waiting first for a result when hooks or tool
    // servers are registered). Ends input immediately on cancellation.
    // timeout overrides the configured stream close timeout.
    void stream_input(const std::shared_ptr<MessageChannel>& input,
                      const CancellationToken* cancel = nullptr,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // End the input stream under the same result-gated rule as stream_input()
    void end_input(std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                   const CancellationToken* cancel = nullptr);

    // Data messages in arrival order; closed when the read loop ends
    std::shared_ptr<MessageChannel> messages() const
    {
        return output_;
    }

    // Handshake reply, once initialize() has succeeded
    std::optional<json> init_result() const;
    bool is_initialized() const;

    // Whether a "result" message has been seen (latched once)
    bool result_observed() const;

    // Wait until a result is seen, the session is cancelled or the timeout
    // elapses. Returns result_observed().
    bool wait_for_result(std::chrono::milliseconds timeout,
                         const CancellationToken* cancel = nullptr) const;

    // Session cancellation signal (fired by close())
    const CancellationToken& cancellation() const
    {
        return cancel_;
    }

    bool streaming_mode() const;
    std::size_t pending_request_count() const;

    void close();
    bool is_closed() const
    {
        return closed_;
    }

    Transport& transport()
    {
        return *transport_;
    }

  private:
    class Dispatcher;

    std::unique_ptr<Transport> transport_;
    std::chrono::milliseconds initialize_timeout_;
    std::chrono::milliseconds stream_close_timeout_;
    std::chrono::milliseconds control_request_timeout_;
    bool has_callbacks_;

    CancellationToken cancel_;
    std::shared_ptr<MessageChannel> output_;
    std::unique_ptr<Dispatcher> dispatcher_;

    std::atomic<bool> closed_{false};
    std::mutex close_mutex_;

    // Result latch
    std::atomic<bool> result_observed_{false};
    mutable std::mutex result_mutex_;
    mutable std::condition_variable result_cv_;

    // Handshake state
    std::mutex init_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<json> init_result_;

    void latch_result();
    void end_transport_input();
};

} // namespace agentlink

#endif // AGENTLINK_QUERY_HPP
