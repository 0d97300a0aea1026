// POSIX implementation of subprocess management (Linux and macOS)

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace agentlink
{
namespace subprocess
{

namespace
{
std::string errno_message(int error)
{
    return std::strerror(error);
}

// Both ends close-on-exec so concurrently spawned children do not inherit them
std::pair<Pipe, Pipe> make_pipe(const char* name)
{
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
        throw std::runtime_error(std::string("Failed to create ") + name +
                                 " pipe: " + errno_message(errno));

    Pipe read_end(fds[0]);
    Pipe write_end(fds[1]);
    for (int fd : fds)
    {
        if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
            throw std::runtime_error("fcntl F_SETFD failed: " + errno_message(errno));
    }
    return {std::move(read_end), std::move(write_end)};
}

bool is_executable_file(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> env;
    if (options.inherit_environment)
    {
        for (char** entry = environ; entry && *entry; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos)
                continue;
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env[key] = value;

    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [key, value] : env)
        result.push_back(key + "=" + value);
    return result;
}
} // namespace

// ============================================================================
// Pipe
// ============================================================================

Pipe::~Pipe()
{
    close();
}

Pipe::Pipe(Pipe&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Pipe& Pipe::operator=(Pipe&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::size_t Pipe::read(char* buffer, std::size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    while (true)
    {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0)
            return static_cast<std::size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw std::runtime_error("Read failed: " + errno_message(errno));
    }
}

void Pipe::write(const std::string& data)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    // Block SIGPIPE on this thread so a closed reader surfaces as EPIPE
    sigset_t sigpipe_mask;
    sigset_t old_mask;
    sigemptyset(&sigpipe_mask);
    sigaddset(&sigpipe_mask, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigpipe_mask, &old_mask);

    sigset_t pending;
    sigpending(&pending);
    bool sigpipe_was_pending = sigismember(&pending, SIGPIPE) == 1;

    int error = 0;
    std::size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            error = errno;
            break;
        }
        written += static_cast<std::size_t>(n);
    }

    if (error == EPIPE && !sigpipe_was_pending)
    {
        // Consume the SIGPIPE generated by this write
        struct timespec zero = {0, 0};
        while (sigtimedwait(&sigpipe_mask, nullptr, &zero) == -1 && errno == EINTR)
            continue;
    }
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);

    if (error == EPIPE)
        throw std::runtime_error("Broken pipe (process closed stdin)");
    if (error != 0)
        throw std::runtime_error("Write failed: " + errno_message(error));
}

bool Pipe::has_data(int timeout_ms) const
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("poll failed: " + errno_message(errno));
    }

    // POLLHUP means EOF is readable
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void Pipe::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// Process
// ============================================================================

Process::~Process()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ > 0 && running_)
    {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR)
            continue;
        running_ = false;
    }
}

void Process::spawn(const std::vector<std::string>& command, const ProcessOptions& options)
{
    if (command.empty())
        throw std::runtime_error("No command to spawn");
    if (pid_ > 0)
        throw std::runtime_error("Process already spawned");

    auto executable = find_executable(command[0]);
    if (!executable)
        throw std::runtime_error("Executable not found: " + command[0]);

    // Everything the child needs is prepared before fork()
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable->c_str()));
    for (std::size_t i = 1; i < command.size(); ++i)
        argv.push_back(const_cast<char*>(command[i].c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> envp;
    for (auto& entry : env_strings)
        envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    std::pair<Pipe, Pipe> in_pipe;
    std::pair<Pipe, Pipe> out_pipe;
    std::pair<Pipe, Pipe> err_pipe;
    if (options.redirect_stdin)
        in_pipe = make_pipe("stdin");
    if (options.redirect_stdout)
        out_pipe = make_pipe("stdout");
    if (options.redirect_stderr)
        err_pipe = make_pipe("stderr");

    // Child-side descriptors, read before fork so the child only makes syscalls
    const int child_stdin = options.redirect_stdin ? in_pipe.first.fd_ : -1;
    const int child_stdout = options.redirect_stdout ? out_pipe.second.fd_ : -1;
    const int child_stderr = options.redirect_stderr ? err_pipe.second.fd_ : -1;
    const char* working_directory =
        options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    pid_t pid = ::fork();
    if (pid < 0)
        throw std::runtime_error("Failed to fork process: " + errno_message(errno));

    if (pid == 0)
    {
        // Child process: async-signal-safe calls only
        if (child_stdin >= 0 && ::dup2(child_stdin, STDIN_FILENO) < 0)
            _exit(127);
        if (child_stdout >= 0 && ::dup2(child_stdout, STDOUT_FILENO) < 0)
            _exit(127);
        if (child_stderr >= 0 && ::dup2(child_stderr, STDERR_FILENO) < 0)
            _exit(127);

        if (working_directory && ::chdir(working_directory) != 0)
            _exit(127);

        ::execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    // Parent: keep our ends, the child's ends close with the pairs
    stdin_ = std::move(in_pipe.second);
    stdout_ = std::move(out_pipe.first);
    stderr_ = std::move(err_pipe.first);

    std::lock_guard<std::mutex> lock(state_mutex_);
    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

void Process::set_exit_status(int status)
{
    if (WIFEXITED(status))
        exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exit_code_ = 128 + WTERMSIG(status);
    else
        exit_code_ = -1;
    running_ = false;
}

bool Process::is_running()
{
    return !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ <= 0 || !running_)
        return exit_code_;

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_)
    {
        set_exit_status(status);
        return exit_code_;
    }
    if (result == 0)
        return std::nullopt;

    if (errno == ECHILD)
    {
        // Reaped elsewhere; the status is lost
        running_ = false;
        return exit_code_;
    }
    if (errno == EINTR)
        return std::nullopt;
    throw std::runtime_error("waitpid failed: " + errno_message(errno));
}

int Process::wait()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ <= 0 || !running_)
        return exit_code_;

    int status = 0;
    while (true)
    {
        pid_t result = ::waitpid(pid_, &status, 0);
        if (result == pid_)
        {
            set_exit_status(status);
            return exit_code_;
        }
        if (errno == EINTR)
            continue;
        if (errno == ECHILD)
        {
            running_ = false;
            return exit_code_;
        }
        throw std::runtime_error("waitpid failed: " + errno_message(errno));
    }
}

void Process::terminate()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGKILL);
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    if (name.empty())
        return std::nullopt;

    // Absolute or relative path: no PATH search
    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= path_str.size())
    {
        std::size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (dir.empty())
            dir = ".";

        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate))
            return candidate;

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace agentlink
