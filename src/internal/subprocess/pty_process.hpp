#ifndef AGENTBRIDGE_SUBPROCESS_PTY_PROCESS_HPP
#define AGENTBRIDGE_SUBPROCESS_PTY_PROCESS_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge
{
namespace subprocess
{

struct PtyOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    int cols = 120;
    int rows = 40;
    bool echo = false;
};

// Child process attached to a pseudo-terminal. The child leads its own session
// (and process group) with the PTY slave as its controlling terminal.
class PtyProcess
{
  public:
    PtyProcess();
    ~PtyProcess();

    // No copy
    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    // Throws ProcessSpawnError. An exec failure surfaces as exit code 127.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const PtyOptions& options = {});

    // Write everything to the terminal; throws AgentBridgeError on failure
    void write(const std::string& data);

    // Wait up to timeout_ms for output and return whatever is available (possibly
    // nothing). eof is set once the slave side is gone.
    std::string read_available(int timeout_ms, bool& eof);

    void resize(int rows, int cols);

    bool is_running() const;
    std::optional<int> try_wait();
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    // Signal the child's whole process group
    void send_signal(int signal);
    void kill();

    int pid() const
    {
        return pid_;
    }

  private:
    int master_fd_ = -1;
    int pid_ = 0;

    mutable std::mutex wait_mutex_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

} // namespace subprocess
} // namespace agentbridge

#endif // AGENTBRIDGE_SUBPROCESS_PTY_PROCESS_HPP
