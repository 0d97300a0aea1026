#ifndef AGENTLINK_TRANSPORT_HPP
#define AGENTLINK_TRANSPORT_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

using json = nlohmann::json;

// Forward declarations
struct AgentOptions;

/// One element of the transport's output: a decoded JSON object, or a
/// terminal error after which the transport produces nothing more.
struct ReadResult
{
    json data;
    std::optional<std::string> error;

    bool is_error() const
    {
        return error.has_value();
    }

    static ReadResult message(json data)
    {
        ReadResult result;
        result.data = std::move(data);
        return result;
    }

    static ReadResult failure(std::string error)
    {
        ReadResult result;
        result.error = std::move(error);
        return result;
    }
};

/**
 * Abstract transport interface for the agent process.
 *
 * Handles raw I/O of line-delimited JSON. Query builds the control protocol
 * on top of it. Implementations include the subprocess transport returned by
 * create_subprocess_transport(); tests and embedders may supply their own.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Connect the transport and prepare for communication.
     * For subprocess transports, this starts the process.
     */
    virtual void connect() = 0;

    /**
     * Write one line to the transport.
     * @param data Serialized JSON followed by a newline
     * @throws ConnectionError if the transport cannot accept data
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Return the results that became available, in arrival order.
     * Blocks briefly (about 100ms) when nothing is buffered and may return an
     * empty vector.
     */
    virtual std::vector<ReadResult> read_messages() = 0;

    /**
     * True while more results may arrive. Once false and read_messages()
     * returns nothing, the output sequence has ended.
     */
    virtual bool has_messages() const = 0;

    /**
     * Half-close: signal that no more input will be written.
     */
    virtual void end_input() = 0;

    /**
     * Close the connection and release the underlying process.
     */
    virtual void close() = 0;

    virtual bool is_ready() const = 0;

    /**
     * Process id for subprocess transports, 0 otherwise.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

// Spawn AgentOptions::command and speak line-delimited JSON over its pipes
std::unique_ptr<Transport> create_subprocess_transport(const AgentOptions& options);

} // namespace agentlink

#endif // AGENTLINK_TRANSPORT_HPP
