/**
 * @file process_utils.hpp
 * @brief Child process execution with separated, bounded output capture
 *
 * Runs external tools (the container runtime CLI) without a shell: arguments
 * are passed verbatim to execvpe, so an inline script argument never needs
 * quoting. stdout and stderr are read from separate pipes into BoundedBuffer
 * sinks so that a runaway program cannot exhaust host memory.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace coderunner {
namespace utils {

/**
 * @class BoundedBuffer
 * @brief Byte sink that keeps a head window and a tail window
 *
 * The first @p head_limit bytes are always retained. Bytes beyond that go to a
 * sliding tail window of @p tail_limit bytes. Anything in between is dropped and
 * the buffer reports Overflowed(). When nothing was dropped, Contents() returns
 * the complete stream.
 *
 * **Example**:
 * @code
 * BoundedBuffer buf(4, 4);
 * buf.Append("0123456789", 10);
 * buf.Head();        // "0123"
 * buf.Tail();        // "6789"
 * buf.Overflowed();  // true
 * @endcode
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t head_limit = 0, std::size_t tail_limit = 0);

    void Append(const char* data, std::size_t size);
    void Append(const std::string& data) { Append(data.data(), data.size()); }

    /// First bytes of the stream (at most head_limit)
    const std::string& Head() const { return head_; }

    /// Last bytes after the head window (at most tail_limit)
    std::string Tail() const;

    /// Complete stream when !Overflowed(), otherwise Head() + Tail()
    std::string Contents() const;

    bool Overflowed() const { return total_ > head_limit_ + tail_limit_; }
    std::size_t TotalBytes() const { return total_; }
    std::size_t HeadLimit() const { return head_limit_; }
    std::size_t TailLimit() const { return tail_limit_; }

private:
    std::size_t head_limit_;
    std::size_t tail_limit_;
    std::size_t total_{0};
    std::string head_;
    std::string tail_;  ///< Up to 2x tail_limit_ before compaction
};

/**
 * @struct CommandResult
 * @brief Outcome of a short-lived helper command
 */
struct CommandResult {
    int exit_code{-1};    ///< Exit status (128 + signal when killed)
    std::string output;   ///< Captured stdout
    std::string error;    ///< Captured stderr
    bool success{false};  ///< exit_code == 0
    bool timed_out{false};  ///< Killed after its deadline
};

/**
 * @class ChildProcess
 * @brief Forked child with stdout/stderr pipes
 *
 * The child leads its own process group; Kill() signals the whole group.
 *
 * Communicate() may run on one thread while Kill() is called from another;
 * reaping and signalling are serialized so a recycled pid is never signalled.
 * The destructor kills and reaps a child that is still alive.
 */
class ChildProcess {
public:
    /**
     * @brief Fork and exec @p argv (PATH lookup) with extra environment variables
     * @throws std::system_error if pipes cannot be created or fork fails
     */
    static std::unique_ptr<ChildProcess> Spawn(
        const std::vector<std::string>& argv,
        const std::map<std::string, std::string>& env_overrides = {});

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Drain stdout/stderr until both close, then reap the child
     *
     * @param deadline Stop waiting at this point and return std::nullopt
     *                 (the child keeps running and can be communicated with again)
     * @return Exit status, or std::nullopt when the deadline passed first
     */
    std::optional<int> Communicate(
        BoundedBuffer& out, BoundedBuffer& err,
        std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    /// Send @p signal to the child if it has not been reaped yet
    void Kill(int signal);

    pid_t Pid() const { return pid_; }

private:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);

    int Reap();
    void CloseFds();

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::mutex reap_mutex_;
    bool reaped_{false};
    int exit_status_{-1};
};

/**
 * @brief Run a helper command to completion and capture its output
 *
 * @param argv Program and arguments (no shell involved)
 * @param env_overrides Extra environment variables for the child
 * @param max_output Per-stream capture limit
 * @param timeout Kill the command (and its process group) after this long
 * @return CommandResult; exit_code -1 with error text if spawning failed,
 *         exit_code -1 and timed_out set if the deadline passed
 */
CommandResult RunCommand(const std::vector<std::string>& argv,
                         const std::map<std::string, std::string>& env_overrides = {},
                         std::size_t max_output = 1 << 20,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * @brief Decode a waitpid() status into an exit code (128 + signal when signalled)
 */
int DecodeWaitStatus(int status);

} // namespace utils
} // namespace coderunner
