// POSIX pseudo-terminal process

#include "pty_process.hpp"

#include <agentbridge/errors.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace agentbridge
{
namespace subprocess
{

namespace
{

std::string errno_message(const std::string& what)
{
    return what + ": " + std::strerror(errno);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

PtyProcess::PtyProcess() = default;

PtyProcess::~PtyProcess()
{
    if (pid_ > 0 && is_running())
    {
        kill();
        wait_for(std::chrono::milliseconds(1000));
    }
    if (master_fd_ >= 0)
        ::close(master_fd_);
}

void PtyProcess::spawn(const std::string& executable, const std::vector<std::string>& args,
                       const PtyOptions& options)
{
    ::signal(SIGPIPE, SIG_IGN);

    int master_fd = ::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (master_fd < 0)
        throw ProcessSpawnError(errno_message("posix_openpt failed"));
    if (::grantpt(master_fd) != 0 || ::unlockpt(master_fd) != 0)
    {
        std::string message = errno_message("grantpt/unlockpt failed");
        ::close(master_fd);
        throw ProcessSpawnError(message);
    }
    char* slave_name = ::ptsname(master_fd);
    if (!slave_name)
    {
        std::string message = errno_message("ptsname failed");
        ::close(master_fd);
        throw ProcessSpawnError(message);
    }
    int slave_fd = ::open(slave_name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (slave_fd < 0)
    {
        std::string message = errno_message("Opening PTY slave failed");
        ::close(master_fd);
        throw ProcessSpawnError(message);
    }

    // Terminal size and echo are slave attributes; set them before the child starts
    struct winsize ws{};
    ws.ws_row = static_cast<unsigned short>(options.rows);
    ws.ws_col = static_cast<unsigned short>(options.cols);
    (void)::ioctl(slave_fd, TIOCSWINSZ, &ws);

    struct termios tio{};
    if (::tcgetattr(slave_fd, &tio) == 0)
    {
        if (options.echo)
            tio.c_lflag |= ECHO;
        else
            tio.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHOE | ECHOK | ECHONL);
        (void)::tcsetattr(slave_fd, TCSANOW, &tio);
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        std::string message = errno_message("Failed to fork process");
        ::close(slave_fd);
        ::close(master_fd);
        throw ProcessSpawnError(message);
    }

    if (pid == 0)
    {
        (void)::setsid();
        (void)::ioctl(slave_fd, TIOCSCTTY, 0);
        ::signal(SIGPIPE, SIG_DFL);

        (void)::dup2(slave_fd, STDIN_FILENO);
        (void)::dup2(slave_fd, STDOUT_FILENO);
        (void)::dup2(slave_fd, STDERR_FILENO);
        if (slave_fd > STDERR_FILENO)
            ::close(slave_fd);
        else
            (void)fcntl(slave_fd, F_SETFD, 0);
        ::close(master_fd);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            _exit(127);

        if (!options.inherit_environment)
            clearenv();
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        ::execvp(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(slave_fd);
    int flags = fcntl(master_fd, F_GETFL, 0);
    if (flags >= 0)
        fcntl(master_fd, F_SETFL, flags | O_NONBLOCK);

    master_fd_ = master_fd;
    pid_ = pid;
    reaped_ = false;
    exit_code_ = -1;
}

void PtyProcess::write(const std::string& data)
{
    if (master_fd_ < 0)
        throw AgentBridgeError("PTY is not open");

    size_t total = 0;
    while (total < data.size())
    {
        ssize_t n = ::write(master_fd_, data.data() + total, data.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                struct pollfd pfd{master_fd_, POLLOUT, 0};
                (void)::poll(&pfd, 1, 50);
                continue;
            }
            throw AgentBridgeError(errno_message("Write to PTY failed"));
        }
        total += static_cast<size_t>(n);
    }
}

std::string PtyProcess::read_available(int timeout_ms, bool& eof)
{
    eof = false;
    std::string out;
    if (master_fd_ < 0)
    {
        eof = true;
        return out;
    }

    struct pollfd pfd{master_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0)
    {
        if (errno == EINTR)
            return out;
        throw AgentBridgeError(errno_message("poll on PTY failed"));
    }
    if (ready == 0)
        return out;

    char buffer[4096];
    while (true)
    {
        ssize_t n = ::read(master_fd_, buffer, sizeof(buffer));
        if (n > 0)
        {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
        {
            eof = true;
            break;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;
        // Linux reports a closed slave as EIO
        if (errno == EIO)
        {
            eof = true;
            break;
        }
        throw AgentBridgeError(errno_message("Read from PTY failed"));
    }
    return out;
}

void PtyProcess::resize(int rows, int cols)
{
    if (master_fd_ < 0)
        return;
    struct winsize ws{};
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    (void)::ioctl(master_fd_, TIOCSWINSZ, &ws);
}

bool PtyProcess::is_running() const
{
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0 || reaped_)
        return false;

    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return false;
    return info.si_pid == 0;
}

std::optional<int> PtyProcess::try_wait()
{
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0)
        return std::nullopt;
    if (reaped_)
        return exit_code_;

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_)
    {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return exit_code_;
    }
    if (rc < 0 && errno == ECHILD)
    {
        reaped_ = true;
        return exit_code_;
    }
    return std::nullopt;
}

std::optional<int> PtyProcess::wait_for(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void PtyProcess::send_signal(int signal)
{
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0 || reaped_)
        return;
    // setsid() made the child a group leader
    if (::kill(-pid_, signal) != 0)
        (void)::kill(pid_, signal);
}

void PtyProcess::kill()
{
    send_signal(SIGKILL);
}

} // namespace subprocess
} // namespace agentbridge
