#include "subprocess_transport.hpp"

#include "../log.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/version.hpp>
#include <chrono>
#include <stdexcept>

namespace agentlink
{
namespace internal
{

namespace
{
// How long close() waits for the process to exit on its own
constexpr auto kExitGracePeriod = std::chrono::milliseconds(500);
// How long close() waits after SIGTERM before SIGKILL
constexpr auto kTerminateGracePeriod = std::chrono::milliseconds(2000);

bool wait_for_exit(subprocess::Process& process, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!process.try_wait())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}
} // namespace

SubprocessTransport::SubprocessTransport(const AgentOptions& options)
    : command_(options.command), stderr_callback_(options.stderr_callback),
      parser_(options.max_buffer_size.value_or(kDefaultMaxBufferSize))
{
    if (options.working_directory)
        process_options_.working_directory = *options.working_directory;
    process_options_.inherit_environment = options.inherit_environment;
    process_options_.environment = options.environment;
    process_options_.environment["AGENTLINK_SDK_VERSION"] = version_string();
    process_options_.redirect_stdin = true;
    process_options_.redirect_stdout = true;
    process_options_.redirect_stderr = true;
}

SubprocessTransport::~SubprocessTransport()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        warn_log(std::string("failed to close agent process: ") + e.what());
    }
}

void SubprocessTransport::connect()
{
    if (process_)
        return; // Already connected

    if (command_.empty())
        throw ConnectionError("No agent command configured");

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(command_, process_options_);
    }
    catch (const std::runtime_error& e)
    {
        throw ConnectionError(std::string("Failed to start agent process: ") + e.what());
    }

    debug_log("spawned " + command_[0] + " (pid " + std::to_string(process->pid()) + ")");
    process_ = std::move(process);

    running_ = true;
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);

    ready_ = true;
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!ready_ || !process_)
        throw ConnectionError("Transport is not ready for writing");

    if (!process_->stdin_pipe().is_open())
        throw ConnectionError("Input stream has already been ended");

    try
    {
        process_->stdin_pipe().write(data);
    }
    catch (const std::runtime_error& e)
    {
        ready_ = false;
        throw ConnectionError(std::string("Failed to write to process stdin: ") + e.what());
    }
}

std::vector<ReadResult> SubprocessTransport::read_messages()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // Wait for results with timeout
    queue_cv_.wait_for(lock, std::chrono::milliseconds(100),
                       [this] { return !queue_.empty() || queue_stopped_; });

    std::vector<ReadResult> results;
    while (!queue_.empty())
    {
        results.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }

    return results;
}

bool SubprocessTransport::has_messages() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !queue_.empty() || !queue_stopped_;
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_ && process_->stdin_pipe().is_open())
        process_->stdin_pipe().close();
}

void SubprocessTransport::close()
{
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_)
        return;
    closed_ = true;
    ready_ = false;

    end_input();

    // Stop reader threads
    running_ = false;
    if (reader_thread_.joinable())
        reader_thread_.join();
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();

    if (process_)
        shutdown_process();

    // Clear result queue
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
        queue_stopped_ = true;
    }
    queue_cv_.notify_all();
}

bool SubprocessTransport::is_ready() const
{
    return ready_;
}

long SubprocessTransport::get_pid() const
{
    if (process_ && !closed_)
        return static_cast<long>(process_->pid());
    return 0;
}

void SubprocessTransport::shutdown_process()
{
    if (wait_for_exit(*process_, kExitGracePeriod))
        return;

    debug_log("agent process did not exit after input closed, terminating");
    process_->terminate();
    if (wait_for_exit(*process_, kTerminateGracePeriod))
        return;

    process_->kill();
    process_->wait();
}

void SubprocessTransport::reader_loop()
{
    std::optional<std::string> error;

    try
    {
        char buffer[4096];
        bool eof = false;
        while (running_ && !error)
        {
            // Check if stdout has data with timeout
            if (!process_->stdout_pipe().has_data(100))
                continue;

            std::size_t n = process_->stdout_pipe().read(buffer, sizeof(buffer));
            if (n == 0)
            {
                eof = true;
                break;
            }

            auto results = parser_.add_data(std::string(buffer, n));
            if (results.empty())
                continue;

            std::lock_guard<std::mutex> lock(queue_mutex_);
            for (auto& result : results)
            {
                if (result.is_error())
                {
                    error = result.error;
                    break;
                }
                queue_.push_back(std::move(result));
            }
            queue_cv_.notify_all();
        }

        // Output ended: report a failed exit
        if (eof)
        {
            std::optional<int> exit_code;
            while (running_ && !(exit_code = process_->try_wait()))
                std::this_thread::sleep_for(std::chrono::milliseconds(10));

            if (exit_code && *exit_code != 0)
                error = ProcessError("Agent process failed", *exit_code).what();
        }
    }
    catch (const std::exception& e)
    {
        error = std::string("Error reading stdout: ") + e.what();
    }

    finish(error);
}

void SubprocessTransport::finish(const std::optional<std::string>& error)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (error)
        {
            debug_log("transport ended with error: " + *error);
            queue_.push_back(ReadResult::failure(*error));
        }
        queue_stopped_ = true;
    }
    queue_cv_.notify_all();
}

void SubprocessTransport::stderr_reader_loop()
{
    // Read stderr and emit it line by line
    std::string pending;
    try
    {
        char buffer[1024];
        while (running_)
        {
            if (!process_->stderr_pipe().has_data(100))
                continue;

            std::size_t n = process_->stderr_pipe().read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF

            pending.append(buffer, n);
            std::size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                emit_stderr_line(pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }
        }
    }
    catch (const std::exception& e)
    {
        debug_log(std::string("stderr reader stopped: ") + e.what());
    }

    if (!pending.empty())
        emit_stderr_line(pending);
}

void SubprocessTransport::emit_stderr_line(const std::string& raw)
{
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

    // Skip empty lines
    if (line.empty())
        return;

    if (!stderr_callback_)
    {
        debug_log("stderr: " + line);
        return;
    }

    try
    {
        (*stderr_callback_)(line);
    }
    catch (const std::exception& e)
    {
        warn_log(std::string("stderr callback threw: ") + e.what());
    }
}

} // namespace internal

// Factory function
std::unique_ptr<Transport> create_subprocess_transport(const AgentOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(options);
}

} // namespace agentlink
