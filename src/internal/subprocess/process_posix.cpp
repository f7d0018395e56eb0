// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <agentbridge/errors.hpp>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace agentbridge
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool group = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Both ends close-on-exec from the start, so a child forked concurrently by
// another thread never inherits them
static int make_pipe(int fds[2])
{
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0)
        return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

// Child side: install fd as target, clearing close-on-exec on the result
static bool redirect_fd(int fd, int target)
{
    if (fd == target)
        return fcntl(fd, F_SETFD, 0) == 0;
    if (dup2(fd, target) < 0)
        return false;
    ::close(fd);
    return true;
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    line.reserve(256);

    char ch;
    while (line.size() < max_size)
    {
        size_t bytes_read = read(&ch, 1);
        if (bytes_read == 0)
            break; // EOF

        line.push_back(ch);
        if (ch == '\n')
            break;
    }

    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd{handle_->fd, POLLIN, 0};
    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("poll failed: " + get_errno_message());
    }

    // Hang-up counts as readable: the next read reports EOF
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    size_t total = 0;
    while (total < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total, size - total);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + get_errno_message());
        }
        total += static_cast<size_t>(bytes_written);
    }

    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const std::exception&)
        {
            // Child already reaped elsewhere; nothing left to release
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    // Writes to a pipe whose reader exited must fail with EPIPE, not kill us
    ::signal(SIGPIPE, SIG_IGN);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
    };

    if (options.redirect_stdin && make_pipe(stdin_pipe) != 0)
    {
        cleanup();
        throw ProcessSpawnError("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && make_pipe(stdout_pipe) != 0)
    {
        cleanup();
        throw ProcessSpawnError("Failed to create stdout pipe: " + get_errno_message());
    }
    if (options.redirect_stderr && make_pipe(stderr_pipe) != 0)
    {
        cleanup();
        throw ProcessSpawnError("Failed to create stderr pipe: " + get_errno_message());
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        cleanup();
        throw ProcessSpawnError("Failed to fork process: " + get_errno_message());
    }

    if (pid == 0)
    {
        // Child process
        if (options.new_process_group)
            setpgid(0, 0);

        ::signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (!redirect_fd(stdin_pipe[0], STDIN_FILENO))
                _exit(127);
        }
        else
        {
            // No stdin: an interactive prompt must see EOF instead of our terminal
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (!redirect_fd(stdout_pipe[1], STDOUT_FILENO))
                _exit(127);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (!redirect_fd(stderr_pipe[1], STDERR_FILENO))
                _exit(127);
        }

        if (!options.working_directory.empty())
        {
            if (chdir(options.working_directory.c_str()) != 0)
                _exit(127);
        }

        if (!options.inherit_environment)
        {
#if defined(__linux__)
            clearenv();
#else
            if (environ)
                environ[0] = nullptr;
#endif
        }
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execvp(executable.c_str(), argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    if (options.new_process_group)
        setpgid(pid, pid); // Mirror the child's call to close the startup race

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->group = options.new_process_group;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Peek without reaping so a later wait() still sees the exit status
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno != ECHILD;

    // si_pid stays 0 while the child has not exited yet
    return info.si_pid == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

void Process::send_signal(int signal)
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        signal_process(handle_->pid, handle_->group, signal);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

bool Process::owns_process_group() const
{
    return handle_ && handle_->group;
}

// ============================================================================
// Helper functions
// ============================================================================

void signal_process(int pid, bool group, int signal)
{
    if (pid <= 0)
        return;

    if (group && ::kill(-pid, signal) == 0)
        return;
    ::kill(pid, signal);
}

std::optional<int> stop_with_escalation(Process& process, std::chrono::milliseconds grace)
{
    if (auto code = process.try_wait())
        return code;

    process.terminate();
    if (auto code = process.wait_for(grace))
        return code;

    process.kill();
    return process.wait_for(grace);
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    // If it's an absolute path and exists, check if it's executable
    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (fs::exists(exe_path) && access(exe_path.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (fs::exists(test_path) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace agentbridge
