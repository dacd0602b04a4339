/**
 * @file process_utils.cpp
 * @brief fork/exec child process helper with bounded pipe capture
 *
 * Unlike a popen() based helper this never goes through /bin/sh: the argument
 * vector reaches execvpe() unchanged, which is what allows a whole bootstrap
 * script to travel as a single argument to the container runtime CLI.
 *
 * **Reading model**:
 * ```
 * poll(stdout, stderr) -> read chunk -> BoundedBuffer::Append
 *        ... until both pipes report EOF ...
 * waitpid() -> exit status (128 + signal for signalled children)
 * ```
 *
 * @date 2025
 */

#include "coderunner/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace coderunner {
namespace utils {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string key = item.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToCharVector(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

void ClosePipe(int (&fds)[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // anonymous namespace

// ============================================================================
// BOUNDED BUFFER
// ============================================================================

BoundedBuffer::BoundedBuffer(std::size_t head_limit, std::size_t tail_limit)
    : head_limit_(head_limit)
    , tail_limit_(tail_limit) {
}

void BoundedBuffer::Append(const char* data, std::size_t size) {
    total_ += size;

    std::size_t to_head = 0;
    if (head_.size() < head_limit_) {
        to_head = std::min(size, head_limit_ - head_.size());
        head_.append(data, to_head);
    }
    if (to_head == size || tail_limit_ == 0) {
        return;
    }

    tail_.append(data + to_head, size - to_head);
    // Compact lazily so appends stay amortized O(n)
    if (tail_.size() > 2 * tail_limit_) {
        tail_.erase(0, tail_.size() - tail_limit_);
    }
}

std::string BoundedBuffer::Tail() const {
    if (tail_.size() <= tail_limit_) {
        return tail_;
    }
    return tail_.substr(tail_.size() - tail_limit_);
}

std::string BoundedBuffer::Contents() const {
    return head_ + Tail();
}

// ============================================================================
// CHILD PROCESS
// ============================================================================

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd) {
}

ChildProcess::~ChildProcess() {
    Kill(SIGKILL);
    Reap();
    CloseFds();
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(
    const std::vector<std::string>& argv,
    const std::map<std::string, std::string>& env_overrides) {

    if (argv.empty()) {
        throw std::invalid_argument("ChildProcess::Spawn: empty argument vector");
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> args(argv);
    std::vector<std::string> env = BuildEnvironment(env_overrides);
    std::vector<char*> c_args = ToCharVector(args);
    std::vector<char*> c_env = ToCharVector(env);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2(stdout)");
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        ClosePipe(out_pipe);
        throw std::system_error(saved, std::generic_category(), "pipe2(stderr)");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull == STDIN_FILENO) {
            ::fcntl(devnull, F_SETFD, 0);
        } else if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvpe(c_args[0], c_args.data(), c_env.data());

        const char msg[] = "exec failed: command not found or not executable\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Set on both sides so Kill() can reach the group whichever runs first
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    spdlog::debug("Spawned pid {}: {}", pid, argv[0]);
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, out_pipe[0], err_pipe[0]));
}

std::optional<int> ChildProcess::Communicate(
    BoundedBuffer& out, BoundedBuffer& err,
    std::optional<std::chrono::steady_clock::time_point> deadline) {

    std::array<char, kReadChunk> chunk;

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        int timeout_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            timeout_ms = static_cast<int>(std::min<long long>(remaining.count(), 1000 * 60));
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        int* owners[2];
        BoundedBuffer* sinks[2];
        if (stdout_fd_ >= 0) {
            fds[count] = {stdout_fd_, POLLIN, 0};
            owners[count] = &stdout_fd_;
            sinks[count] = &out;
            ++count;
        }
        if (stderr_fd_ >= 0) {
            fds[count] = {stderr_fd_, POLLIN, 0};
            owners[count] = &stderr_fd_;
            sinks[count] = &err;
            ++count;
        }

        int ready = ::poll(fds, count, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n > 0) {
                sinks[i]->Append(chunk.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(*owners[i]);
                *owners[i] = -1;
            }
        }
    }

    return Reap();
}

void ChildProcess::Kill(int signal) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!reaped_ && pid_ > 0) {
        // The whole group, so helpers the child started do not keep the pipes open
        if (::kill(-pid_, signal) != 0) {
            ::kill(pid_, signal);
        }
    }
}

int ChildProcess::Reap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) {
        return exit_status_;
    }
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    reaped_ = true;
    exit_status_ = rc == pid_ ? DecodeWaitStatus(status) : -1;
    return exit_status_;
}

void ChildProcess::CloseFds() {
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

// ============================================================================
// ONE-SHOT COMMANDS
// ============================================================================

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

CommandResult RunCommand(const std::vector<std::string>& argv,
                         const std::map<std::string, std::string>& env_overrides,
                         std::size_t max_output,
                         std::optional<std::chrono::milliseconds> timeout) {
    CommandResult result;

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::Spawn(argv, env_overrides);
    } catch (const std::system_error& e) {
        result.error = std::string("Failed to execute command: ") + e.what();
        return result;
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }

    BoundedBuffer out(max_output);
    BoundedBuffer err(max_output);
    std::optional<int> status = child->Communicate(out, err, deadline);
    if (!status) {
        // The destructor reaps the killed child
        spdlog::warn("Command {} exceeded {} ms, killing pid {}", argv[0], timeout->count(),
                     child->Pid());
        child->Kill(SIGKILL);
        result.timed_out = true;
    }

    result.exit_code = status.value_or(-1);
    result.output = out.Contents();
    result.error = err.Contents();
    result.success = result.exit_code == 0;
    return result;
}

} // namespace utils
} // namespace coderunner
