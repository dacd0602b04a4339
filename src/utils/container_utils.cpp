/**
 * @file container_utils.cpp
 * @brief Docker CLI implementation of the container runtime client
 *
 * Container lifecycle for one run:
 * ```
 * create (hardened, --rm) -> start --attach -> [kill on timeout] -> rm -f
 * ```
 *
 * **Security Hardening** applied by BuildCreateArgs():
 * - Network: --network none, no published ports
 * - Capabilities: --cap-drop ALL, --security-opt no-new-privileges
 * - Filesystem: --read-only root, writable tmpfs scratch only
 * - Resources: --memory (swap pinned), --cpus, --pids-limit
 * - Identity: unprivileged user (65534:65534 by default)
 * - Image policy: --pull never (pulling is decided by the engine)
 *
 * Every invocation targets an explicit daemon socket with `-H` so the process
 * never depends on DOCKER_HOST from its environment. Helper commands run under
 * a deadline; a wedged daemon surfaces as ContainerRuntimeError.
 *
 * @date 2025
 */

#include "coderunner/utils/container_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <signal.h>
#include <sys/stat.h>

using json = nlohmann::json;

namespace coderunner {
namespace utils {

namespace {

constexpr const char* kDefaultHost = "unix:///var/run/docker.sock";

std::string Trim(const std::string& str) {
    const char* ws = " \t\r\n";
    auto begin = str.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(ws);
    return str.substr(begin, end - begin + 1);
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

// ============================================================================
// ATTACHED RUN
// ============================================================================
// `docker start --attach` relays the container's stdout/stderr on its own
// stdout/stderr and exits with the container's exit status.

class DockerAttachedContainer : public AttachedContainer {
public:
    DockerAttachedContainer(std::string container_id, std::unique_ptr<ChildProcess> process,
                            const AttachLimits& limits)
        : container_id_(std::move(container_id))
        , process_(std::move(process))
        , limits_(limits) {
    }

    AttachOutcome Wait() override {
        AttachOutcome outcome;
        outcome.stdout_capture = BoundedBuffer(limits_.stdout_head, limits_.stdout_tail);
        outcome.stderr_capture = BoundedBuffer(limits_.stderr_head, 0);

        std::optional<int> status;
        try {
            status = process_->Communicate(outcome.stdout_capture, outcome.stderr_capture);
        } catch (const std::system_error& e) {
            throw ContainerRuntimeError(std::string("Lost attachment to container: ") + e.what());
        }
        outcome.exit_code = status.value_or(-1);

        // A daemon-side failure produces no program output at all, only the
        // CLI's error line. A real run always writes to stdout.
        const std::string& err = outcome.stderr_capture.Head();
        if (outcome.exit_code != 0 && outcome.stdout_capture.TotalBytes() == 0 &&
            err.rfind("Error response from daemon", 0) == 0) {
            throw ContainerRuntimeError("Container " + ShortId(container_id_) +
                                        " failed to start: " + Trim(err));
        }

        spdlog::debug("Container {} streams closed (exit code {})",
                      ShortId(container_id_), outcome.exit_code);
        return outcome;
    }

    void Abort() override {
        spdlog::warn("Aborting attachment to container {}", ShortId(container_id_));
        process_->Kill(SIGKILL);
    }

private:
    std::string container_id_;
    std::unique_ptr<ChildProcess> process_;
    AttachLimits limits_;
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerClient::DockerClient(std::string host, std::string api_version, std::string docker_binary,
                           std::chrono::milliseconds command_timeout)
    : host_(NormalizeRuntimeHost(host))
    , api_version_(Trim(api_version))
    , docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout) {
    if (command_timeout_.count() <= 0) {
        throw std::invalid_argument("DockerClient: command timeout must be positive");
    }
    spdlog::debug("Docker client for {} (API {})", host_,
                  api_version_.empty() ? "negotiated" : api_version_);
}

std::vector<std::string> DockerClient::BaseArgs() const {
    return {docker_binary_, "-H", host_};
}

std::map<std::string, std::string> DockerClient::Environment() const {
    std::map<std::string, std::string> env;
    if (!api_version_.empty()) {
        env["DOCKER_API_VERSION"] = api_version_;
    }
    return env;
}

CommandResult DockerClient::ExecuteDockerCommand(
    const std::vector<std::string>& args, std::size_t max_output,
    std::optional<std::chrono::milliseconds> timeout) const {

    std::vector<std::string> argv = BaseArgs();
    argv.insert(argv.end(), args.begin(), args.end());
    const std::string command = args.empty() ? "" : args.front();
    const auto deadline = timeout.value_or(command_timeout_);

    spdlog::trace("docker {}", command);
    auto result = RunCommand(argv, Environment(), max_output, deadline);
    if (result.timed_out) {
        throw ContainerRuntimeError("Container runtime at " + host_ + " did not respond to '" +
                                    command + "' within " + std::to_string(deadline.count()) +
                                    " ms");
    }
    return result;
}

// ============================================================================
// RUNTIME / IMAGE QUERIES
// ============================================================================

RuntimeVersion DockerClient::GetVersion() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{json .}}"});
    if (!result.success) {
        std::string reason = Trim(result.error);
        if (reason.empty()) {
            reason = "exit code " + std::to_string(result.exit_code);
        }
        throw ContainerRuntimeError("Container runtime unreachable at " + host_ + ": " + reason);
    }

    try {
        auto doc = json::parse(result.output);
        const auto& server = doc.at("Server");
        if (server.is_null()) {
            throw ContainerRuntimeError("Container runtime at " + host_ + " returned no server info");
        }
        RuntimeVersion version;
        version.server_version = server.value("Version", "");
        version.api_version = server.value("ApiVersion", "");
        version.min_api_version = server.value("MinAPIVersion", "");
        return version;
    } catch (const json::exception& e) {
        throw ContainerRuntimeError(std::string("Unparseable runtime version output: ") + e.what());
    }
}

bool DockerClient::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image});
    if (result.success) {
        return true;
    }
    if (Contains(result.error, "No such image") || Contains(result.error, "No such object")) {
        return false;
    }
    throw ContainerRuntimeError("Image inspection failed for " + image + ": " + Trim(result.error));
}

void DockerClient::PullImage(const std::string& image) {
    spdlog::info("Pulling image {}...", image);
    auto result = ExecuteDockerCommand({"pull", "--quiet", image}, 1 << 20,
                                       std::max<std::chrono::milliseconds>(command_timeout_,
                                                                           kPullTimeout));
    if (!result.success) {
        throw ContainerRuntimeError("Unable to pull image " + image + ": " + Trim(result.error));
    }
    spdlog::info("✓ Pulled {}", image);
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::vector<std::string> DockerClient::BuildCreateArgs(const ContainerConfig& config) const {
    std::vector<std::string> args{"create"};

    if (!config.name.empty()) {
        args.insert(args.end(), {"--name", config.name});
    }
    for (const auto& [key, value] : config.labels) {
        args.insert(args.end(), {"--label", key + "=" + value});
    }

    // Network isolation
    if (config.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }

    // Resource limits
    std::string memory = std::to_string(config.memory_limit_mb) + "m";
    args.insert(args.end(), {"--memory", memory, "--memory-swap", memory});
    args.insert(args.end(), {"--cpus", FormatCpus(config.cpu_limit)});
    args.insert(args.end(), {"--pids-limit", std::to_string(config.pids_limit)});
    for (const auto& [mount, options] : config.tmpfs) {
        args.insert(args.end(), {"--tmpfs", mount + ":" + options});
    }

    // Security hardening
    for (const auto& cap : config.capabilities_drop) {
        args.insert(args.end(), {"--cap-drop", cap});
    }
    for (const auto& opt : config.security_opts) {
        args.insert(args.end(), {"--security-opt", opt});
    }
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }
    if (!config.user.empty()) {
        args.insert(args.end(), {"--user", config.user});
    }
    if (!config.working_dir.empty()) {
        args.insert(args.end(), {"--workdir", config.working_dir});
    }
    for (const auto& [key, value] : config.environment_vars) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }

    if (config.auto_remove) {
        args.push_back("--rm");
    }
    args.insert(args.end(), {"--pull", "never"});

    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());
    return args;
}

std::string DockerClient::CreateContainer(const ContainerConfig& config) {
    spdlog::debug("Creating container {} from {}", config.name, config.image);

    auto result = ExecuteDockerCommand(BuildCreateArgs(config));
    if (!result.success) {
        throw ContainerRuntimeError("Failed to create container: " + Trim(result.error));
    }

    std::string container_id = Trim(result.output);
    if (container_id.empty()) {
        throw ContainerRuntimeError("Runtime returned no container ID");
    }
    spdlog::debug("Container created: {}", ShortId(container_id));
    return container_id;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

std::unique_ptr<AttachedContainer> DockerClient::StartAttached(const std::string& container_id,
                                                               const AttachLimits& limits) {
    std::vector<std::string> argv = BaseArgs();
    argv.insert(argv.end(), {"start", "--attach", container_id});

    std::unique_ptr<ChildProcess> process;
    try {
        process = ChildProcess::Spawn(argv, Environment());
    } catch (const std::system_error& e) {
        throw ContainerRuntimeError(std::string("Failed to start container: ") + e.what());
    }

    spdlog::debug("Container {} started", ShortId(container_id));
    return std::make_unique<DockerAttachedContainer>(container_id, std::move(process), limits);
}

void DockerClient::KillContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"kill", container_id});
    if (result.success) {
        spdlog::debug("Container {} killed", ShortId(container_id));
        return;
    }
    if (Contains(result.error, "No such container") || Contains(result.error, "is not running")) {
        spdlog::debug("Container {} already stopped", ShortId(container_id));
        return;
    }
    throw ContainerRuntimeError("Failed to kill container " + ShortId(container_id) + ": " +
                                Trim(result.error));
}

void DockerClient::RemoveContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"rm", "--force", container_id});
    if (result.success) {
        spdlog::debug("Container {} removed", ShortId(container_id));
        return;
    }
    // With --rm the daemon may already be removing it
    if (Contains(result.error, "No such container") || Contains(result.error, "already in progress")) {
        spdlog::debug("Container {} already removed", ShortId(container_id));
        return;
    }
    throw ContainerRuntimeError("Failed to remove container " + ShortId(container_id) + ": " +
                                Trim(result.error));
}

std::vector<ContainerInfo> DockerClient::ListContainers(
    const std::map<std::string, std::string>& labels) {

    std::vector<std::string> args{"ps", "--all", "--no-trunc", "--format", "{{json .}}"};
    for (const auto& [key, value] : labels) {
        args.insert(args.end(), {"--filter", "label=" + key + "=" + value});
    }

    auto result = ExecuteDockerCommand(args, 8 << 20);
    if (!result.success) {
        throw ContainerRuntimeError("Failed to list containers: " + Trim(result.error));
    }

    std::vector<ContainerInfo> containers;
    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        line = Trim(line);
        if (line.empty()) {
            continue;
        }
        try {
            auto row = json::parse(line);
            ContainerInfo info;
            info.id = row.value("ID", "");
            info.name = row.value("Names", "");
            info.image = row.value("Image", "");
            info.state = row.value("State", "");
            containers.push_back(std::move(info));
        } catch (const json::exception& e) {
            spdlog::warn("Skipping unparseable container row: {}", e.what());
        }
    }
    return containers;
}

// ============================================================================
// ADDRESS / SOCKET HELPERS
// ============================================================================

std::string NormalizeRuntimeHost(const std::string& host) {
    std::string normalized = Trim(host);
    if (normalized.empty()) {
        return kDefaultHost;
    }
    if (normalized.front() == '/') {
        return "unix://" + normalized;
    }
    const std::string unix_scheme = "unix://";
    if (normalized.rfind(unix_scheme, 0) == 0) {
        std::string path = normalized.substr(unix_scheme.size());
        path.erase(0, path.find_first_not_of('/'));
        return "unix:///" + path;
    }
    return normalized;
}

std::optional<std::filesystem::path> SocketPathFromHost(const std::string& host) {
    std::string normalized = NormalizeRuntimeHost(host);
    const std::string unix_scheme = "unix://";
    if (normalized.rfind(unix_scheme, 0) != 0) {
        return std::nullopt;
    }
    return std::filesystem::path(normalized.substr(unix_scheme.size()));
}

SocketStatus InspectSocket(const std::filesystem::path& path) {
    SocketStatus status;
    status.path = path;

    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return status;
    }
    status.exists = true;
    status.is_socket = S_ISSOCK(info.st_mode);

    std::ostringstream oss;
    oss << std::oct << std::setw(4) << std::setfill('0') << (info.st_mode & 0777);
    status.mode = oss.str();
    return status;
}

int CompareApiVersions(const std::string& lhs, const std::string& rhs) {
    auto parse = [](const std::string& version) {
        std::vector<int> parts;
        std::istringstream iss(version);
        std::string token;
        while (std::getline(iss, token, '.')) {
            try {
                parts.push_back(std::stoi(token));
            } catch (const std::exception&) {
                parts.push_back(0);
            }
        }
        return parts;
    };

    auto a = parse(lhs);
    auto b = parse(rhs);
    std::size_t n = std::max(a.size(), b.size());
    a.resize(n, 0);
    b.resize(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) {
            return a[i] < b[i] ? -1 : 1;
        }
    }
    return 0;
}

} // namespace utils
} // namespace coderunner
