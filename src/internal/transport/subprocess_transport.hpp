#ifndef AGENTLINK_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define AGENTLINK_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../line_buffer.hpp"
#include "../subprocess/process.hpp"

#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentlink
{
namespace internal
{

/**
 * Transport over a child process speaking line-delimited JSON.
 *
 * stdout is decoded on a background thread into a queue drained by
 * read_messages(). A decode failure or a non-zero exit ends the sequence
 * with an error result. stderr lines go to the stderr callback, or to the
 * debug log when none is set.
 */
class SubprocessTransport : public Transport
{
  public:
    explicit SubprocessTransport(const AgentOptions& options);
    ~SubprocessTransport() override;

    // Transport interface
    void connect() override;
    void write(const std::string& data) override;
    std::vector<ReadResult> read_messages() override;
    bool has_messages() const override;
    void end_input() override;
    void close() override;
    bool is_ready() const override;
    long get_pid() const override;

  private:
    // Background reader threads
    void reader_loop();
    void stderr_reader_loop();
    void emit_stderr_line(const std::string& line);

    // Mark the output sequence ended, optionally with a terminal error
    void finish(const std::optional<std::string>& error);

    // Give the process a grace period, then terminate it
    void shutdown_process();

    std::vector<std::string> command_;
    subprocess::ProcessOptions process_options_;
    std::optional<StderrCallback> stderr_callback_;

    // Process management
    std::unique_ptr<subprocess::Process> process_;

    // Message decoding
    JsonLineBuffer parser_;

    // Thread-safe result queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<ReadResult> queue_;
    bool queue_stopped_ = false;

    // Serialize stdin writes and coordinate with end_input/close
    std::mutex write_mutex_;

    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};

    std::thread reader_thread_;
    std::thread stderr_reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_SUBPROCESS_TRANSPORT_HPP
