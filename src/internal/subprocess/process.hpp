#ifndef AGENTLINK_SUBPROCESS_PROCESS_HPP
#define AGENTLINK_SUBPROCESS_PROCESS_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{
namespace subprocess
{

// One end of an OS pipe; owns the descriptor
class Pipe
{
  public:
    Pipe() = default;
    explicit Pipe(int fd) : fd_(fd) {}
    ~Pipe();

    // No copy, move only
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    Pipe(Pipe&& other) noexcept;
    Pipe& operator=(Pipe&& other) noexcept;

    // Read up to size bytes. Returns 0 on EOF, throws on error
    std::size_t read(char* buffer, std::size_t size);

    // Write all of data. Throws on error (EPIPE included, without raising SIGPIPE)
    void write(const std::string& data);

    // Wait up to timeout_ms for data (or EOF) to become readable
    bool has_data(int timeout_ms = 0) const;

    void close();

    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    friend class Process;
    int fd_ = -1;
};

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment; // Applied over the inherited set
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

// A child process with optional piped stdio (POSIX)
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Spawn command[0] with the remaining elements as arguments.
    // Throws std::runtime_error if the executable cannot be found or fork fails.
    void spawn(const std::vector<std::string>& command, const ProcessOptions& options = {});

    // Pipes; closed (is_open() == false) when not redirected
    Pipe& stdin_pipe()
    {
        return stdin_;
    }
    Pipe& stdout_pipe()
    {
        return stdout_;
    }
    Pipe& stderr_pipe()
    {
        return stderr_;
    }

    bool is_running();
    std::optional<int> try_wait(); // Non-blocking, returns exit code if done
    int wait();                    // Blocking, returns exit code
    void terminate();              // SIGTERM
    void kill();                   // SIGKILL

    int pid() const
    {
        return pid_;
    }

  private:
    std::mutex state_mutex_;
    int pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;

    Pipe stdin_;
    Pipe stdout_;
    Pipe stderr_;

    // Record a waitpid() status
    void set_exit_status(int status);
};

// Resolve an executable name against PATH (names with a '/' are checked as-is)
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace agentlink

#endif // AGENTLINK_SUBPROCESS_PROCESS_HPP
