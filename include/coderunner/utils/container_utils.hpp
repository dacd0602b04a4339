/**
 * @file container_utils.hpp
 * @brief Container runtime client abstraction and Docker CLI implementation
 *
 * The execution engine never talks to a runtime directly: it goes through the
 * ContainerClient interface so the orchestration logic can be exercised with a
 * recording fake, and so another OCI runtime can be slotted in later.
 * DockerClient drives the docker CLI against an explicit daemon socket
 * (`docker -H <host>`) pinned to an optional API version (DOCKER_API_VERSION).
 *
 * @date 2025
 */

#pragma once

#include "coderunner/utils/process_utils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace coderunner {
namespace utils {

/**
 * @class ContainerRuntimeError
 * @brief A runtime command failed or the runtime could not be reached
 */
class ContainerRuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct ContainerConfig
 * @brief Everything needed to create one hardened, ephemeral container
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                              ///< Container name
    std::string image;                             ///< Image reference
    std::vector<std::string> command;              ///< Entrypoint override (argv)
    std::string user{"65534:65534"};               ///< Run as (nobody)
    std::string working_dir{"/sandbox"};           ///< Initial working directory

    // Resource Limits
    std::size_t memory_limit_mb{256};              ///< Memory (swap pinned to the same value)
    double cpu_limit{0.5};                         ///< CPU share (--cpus)
    int pids_limit{64};                            ///< Max processes/threads
    std::map<std::string, std::string> tmpfs;      ///< Mount point -> tmpfs options

    // Security Settings
    bool network_disabled{true};                   ///< --network none
    bool read_only_rootfs{true};                   ///< --read-only
    std::vector<std::string> capabilities_drop{"ALL"};
    std::vector<std::string> security_opts{"no-new-privileges"};

    // Lifecycle
    bool auto_remove{true};                        ///< Daemon removes it on exit (--rm)
    std::map<std::string, std::string> labels;     ///< Ownership labels
    std::map<std::string, std::string> environment_vars;
};

/**
 * @struct ContainerInfo
 * @brief One row of a container listing
 */
struct ContainerInfo {
    std::string id;     ///< Container ID
    std::string name;   ///< Container name
    std::string image;  ///< Image name
    std::string state;  ///< created / running / exited / ...
};

/**
 * @struct RuntimeVersion
 * @brief Daemon identification returned by a successful ping
 */
struct RuntimeVersion {
    std::string server_version;   ///< Engine release (e.g. "24.0.7")
    std::string api_version;      ///< Highest API version served (e.g. "1.43")
    std::string min_api_version;  ///< Lowest API version served
};

/**
 * @struct AttachLimits
 * @brief Capture windows for an attached run's output streams
 */
struct AttachLimits {
    std::size_t stdout_head{64 * 1024};
    std::size_t stdout_tail{256 * 1024};
    std::size_t stderr_head{64 * 1024};
};

/**
 * @struct AttachOutcome
 * @brief What came back from an attached container once its streams closed
 */
struct AttachOutcome {
    int exit_code{-1};             ///< Container exit status
    BoundedBuffer stdout_capture;  ///< Bounded stdout
    BoundedBuffer stderr_capture;  ///< Bounded stderr
};

/**
 * @class AttachedContainer
 * @brief A started container whose output is being streamed back
 */
class AttachedContainer {
public:
    virtual ~AttachedContainer() = default;

    /**
     * @brief Block until the container's streams close and collect the outcome
     * @throws ContainerRuntimeError if the runtime reported a failure instead of a run
     */
    virtual AttachOutcome Wait() = 0;

    /// Tear down the local attachment so that a pending Wait() returns promptly
    virtual void Abort() = 0;
};

/**
 * @class ContainerClient
 * @brief Operations the engine needs from a container runtime
 *
 * Implementations must allow concurrent calls for different containers.
 * Failures are reported as ContainerRuntimeError.
 */
class ContainerClient {
public:
    virtual ~ContainerClient() = default;

    /// Ping the daemon; throws ContainerRuntimeError when unreachable
    virtual RuntimeVersion GetVersion() = 0;

    /// true if @p image is present locally
    virtual bool ImageExists(const std::string& image) = 0;

    virtual void PullImage(const std::string& image) = 0;

    /// Create (but do not start) a container; returns its ID
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    /**
     * @brief Start a created container with its output streams attached
     *
     * Returns once the runtime has acknowledged the start request.
     */
    virtual std::unique_ptr<AttachedContainer> StartAttached(const std::string& container_id,
                                                             const AttachLimits& limits) = 0;

    /// SIGKILL the container; a container that is already gone is not an error
    virtual void KillContainer(const std::string& container_id) = 0;

    /// Force-remove the container; a container that is already gone is not an error
    virtual void RemoveContainer(const std::string& container_id) = 0;

    /// All containers (any state) carrying every label in @p labels
    virtual std::vector<ContainerInfo> ListContainers(
        const std::map<std::string, std::string>& labels) = 0;

    /// Human-readable endpoint (socket URL)
    virtual std::string Endpoint() const = 0;
};

/**
 * @class DockerClient
 * @brief ContainerClient backed by the docker CLI
 *
 * Every call runs `docker -H <host> ...` with DOCKER_API_VERSION pinned when an
 * API version is configured. Arguments are passed without a shell.
 *
 * **Usage Example**:
 * @code
 * DockerClient docker("unix:///var/run/docker.sock", "1.41");
 * auto version = docker.GetVersion();
 *
 * ContainerConfig config;
 * config.image = "python:3.12-slim";
 * config.command = {"python3", "-c", "print('hi')"};
 * auto id = docker.CreateContainer(config);
 * auto run = docker.StartAttached(id, AttachLimits{});
 * auto outcome = run->Wait();
 * docker.RemoveContainer(id);
 * @endcode
 */
class DockerClient : public ContainerClient {
public:
    /**
     * @param host Daemon address (unix:///path, /path, tcp://host:port)
     * @param api_version API version to pin, empty to let the CLI negotiate
     * @param docker_binary CLI executable name or path
     * @param command_timeout Deadline for each helper command (version, inspect,
     *                        create, kill, rm, ps); image pulls get kPullTimeout
     */
    explicit DockerClient(std::string host, std::string api_version = "",
                          std::string docker_binary = "docker",
                          std::chrono::milliseconds command_timeout = std::chrono::seconds(30));

    /// Deadline for `docker pull` (never shorter than the command timeout)
    static constexpr std::chrono::minutes kPullTimeout{10};

    RuntimeVersion GetVersion() override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerConfig& config) override;
    std::unique_ptr<AttachedContainer> StartAttached(const std::string& container_id,
                                                     const AttachLimits& limits) override;
    void KillContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id) override;
    std::vector<ContainerInfo> ListContainers(
        const std::map<std::string, std::string>& labels) override;
    std::string Endpoint() const override { return host_; }

    /// Full `docker create` argument vector for @p config (exposed for inspection)
    std::vector<std::string> BuildCreateArgs(const ContainerConfig& config) const;

private:
    std::vector<std::string> BaseArgs() const;
    std::map<std::string, std::string> Environment() const;
    /// Runs one helper command; throws ContainerRuntimeError if it outlives its deadline
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       std::size_t max_output = 1 << 20,
                                       std::optional<std::chrono::milliseconds> timeout =
                                           std::nullopt) const;

    std::string host_;
    std::string api_version_;
    std::string docker_binary_;
    std::chrono::milliseconds command_timeout_;
};

/**
 * @struct SocketStatus
 * @brief Filesystem view of a unix-domain runtime socket
 */
struct SocketStatus {
    std::filesystem::path path;  ///< Socket path
    bool exists{false};          ///< Path exists
    bool is_socket{false};       ///< Path is a socket
    std::string mode;            ///< Permission bits in octal (e.g. "0660")
};

/**
 * @brief Normalize a runtime address to URL form
 *
 * Empty -> unix:///var/run/docker.sock, "/path" -> "unix:///path",
 * "unix://path" -> "unix:///path". Other schemes are returned trimmed.
 */
std::string NormalizeRuntimeHost(const std::string& host);

/// Socket path for unix:// addresses, std::nullopt for network addresses
std::optional<std::filesystem::path> SocketPathFromHost(const std::string& host);

/// stat() the socket; never throws
SocketStatus InspectSocket(const std::filesystem::path& path);

/**
 * @brief Compare dotted API versions ("1.41" < "1.43")
 * @return negative, zero or positive like strcmp
 */
int CompareApiVersions(const std::string& lhs, const std::string& rhs);

} // namespace utils
} // namespace coderunner
