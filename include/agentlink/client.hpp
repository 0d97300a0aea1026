#ifndef AGENTLINK_CLIENT_HPP
#define AGENTLINK_CLIENT_HPP

#include <agentlink/message_stream.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

// Interactive client: one agent process, many turns
class AgentClient
{
  public:
    explicit AgentClient(const AgentOptions& options = AgentOptions{});
    // Use a custom transport instead of spawning AgentOptions::command
    AgentClient(const AgentOptions& options, std::unique_ptr<Transport> transport);
    ~AgentClient();

    // No copy, move only
    AgentClient(const AgentClient&) = delete;
    AgentClient& operator=(const AgentClient&) = delete;
    AgentClient(AgentClient&&) noexcept;
    AgentClient& operator=(AgentClient&&) noexcept;

    // Connection lifecycle
    // connect(): transport connect, start the read loop, handshake.
    // On failure everything started so far is closed again.
    void connect();
    void disconnect();
    bool is_connected() const;

    // Process ID of the agent, 0 if not connected
    long get_pid() const;

    // Send a user message
    void send_query(const std::string& prompt, const std::string& session_id = "default");

    // Send a raw data message; "session_id" is added when missing
    void send_message(json message);

    // Receive messages
    MessageStream receive_messages();

    // Convenience: receive all messages up to and including the next result
    std::vector<json> receive_response();

    // Control operations
    void interrupt();
    void set_permission_mode(const std::string& mode);
    void set_model(const std::string& model);
    void rewind_files(const std::string& user_message_id);
    /// Status of the agent's MCP servers.
    /// Throws ConnectionError if not connected.
    json get_mcp_status();

    // Handshake reply (commands, output styles, capabilities) if connected
    std::optional<json> get_server_info() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * One-shot query.
 *
 * Sends prompt as a single user message, ends the input the way
 * Query::stream_input() does, and returns every data message until the
 * agent finishes. A transport failure is thrown as AgentError.
 */
std::vector<json> query(const std::string& prompt, const AgentOptions& options = AgentOptions{},
                        std::unique_ptr<Transport> transport = nullptr);

} // namespace agentlink

#endif // AGENTLINK_CLIENT_HPP
