/**
 * @file execution_engine.cpp
 * @brief Run state machine over the container runtime
 *
 * **Timeout Management**:
 * - The clock starts once the runtime acknowledged the start (attach spawned)
 * - Waiting on the attached stream is the single asynchronous boundary
 *   (std::future bounded by wait_for(timeout))
 * - On timeout: kill + remove the container in the background, give the
 *   stream kill_grace to close, then abort the local attachment
 * - Every runtime CLI call has its own deadline (runtime_timeout), so a
 *   timed-out run ends within timeout + max(kill_grace, 2 * runtime_timeout)
 *
 * **Cleanup guarantees**:
 * - The gate slot is a scoped ConcurrencyGate::Slot
 * - The container is force-removed by a scoped guard on every path after
 *   creation; "already gone" is not an error
 *
 * @date 2025
 */

#include "coderunner/core/execution_engine.hpp"
#include "coderunner/core/errors.hpp"
#include "coderunner/utils/encoding_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>

namespace coderunner {
namespace core {

using utils::ContainerRuntimeError;

namespace {

constexpr const char* kRunLabel = "coderunner.run";

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

/**
 * Runs a cleanup action when the scope is left, unless dismissed.
 */
class ContainerGuard {
public:
    explicit ContainerGuard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~ContainerGuard() { Run(); }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    void Run() {
        if (cleanup_) {
            auto cleanup = std::move(cleanup_);
            cleanup_ = nullptr;
            cleanup();
        }
    }

private:
    std::function<void()> cleanup_;
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ExecutionEngine::ExecutionEngine(const RunnerConfig& config)
    : ExecutionEngine(config, std::make_shared<utils::DockerClient>(
          config.docker_host, config.docker_api_version, "docker",
          std::chrono::duration_cast<std::chrono::milliseconds>(config.runtime_timeout))) {
}

ExecutionEngine::ExecutionEngine(const RunnerConfig& config,
                                 std::shared_ptr<utils::ContainerClient> client)
    : config_(config)
    , client_(std::move(client))
    , engine_id_(utils::EncodingUtils::RandomHex(8))
    , validator_(config)
    , encoder_(config)
    , collector_(config)
    , gate_(config.concurrency_limit,
            std::chrono::duration_cast<std::chrono::milliseconds>(config.queue_wait),
            config.max_queue) {
    if (!client_) {
        throw std::invalid_argument("ExecutionEngine requires a container client");
    }
    spdlog::info("Execution engine {} ready ({} via {})", engine_id_, config_.image,
                 client_->Endpoint());
    spdlog::debug("Timeout: {}s, memory: {} MB, cpus: {}, concurrency: {}",
                  config_.timeout.count(), config_.memory_mb, config_.cpus,
                  config_.concurrency_limit);
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request) {
    if (!config_.enabled) {
        throw RunnerUnavailable("Code runner is disabled");
    }

    const std::string run_id = utils::EncodingUtils::RandomHex(6);
    Transition(run_id, RunState::VALIDATING);

    ExecutionRequest validated = validator_.Validate(request);
    BootstrapScript bootstrap = encoder_.Encode(validated);

    ConcurrencyGate::Slot slot = gate_.Acquire();
    Transition(run_id, RunState::SLOT_ACQUIRED);

    try {
        return RunInContainer(run_id, bootstrap);
    } catch (const ContainerRuntimeError& e) {
        Transition(run_id, RunState::FAILED);
        spdlog::error("Run {} failed: {}", run_id, e.what());
        RecordError(e.what());
        throw RunnerUnavailable(e.what());
    } catch (const RunnerUnavailable& e) {
        Transition(run_id, RunState::FAILED);
        spdlog::error("Run {} failed: {}", run_id, e.what());
        RecordError(e.what());
        throw;
    }
}

std::future<ExecutionResult> ExecutionEngine::ExecuteAsync(ExecutionRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

ExecutionResult ExecutionEngine::RunInContainer(const std::string& run_id,
                                                const BootstrapScript& bootstrap) {
    Transition(run_id, RunState::LAUNCHING);
    EnsureRuntimeReady();

    const std::string container_id =
        client_->CreateContainer(BuildContainerConfig(run_id, bootstrap.script));
    ContainerGuard guard([this, &container_id] { RemoveQuietly(container_id); });

    auto attached = client_->StartAttached(container_id, collector_.CaptureLimits());
    const auto started = std::chrono::steady_clock::now();
    Transition(run_id, RunState::RUNNING, container_id);

    auto waiter = std::async(std::launch::async, [&attached] { return attached->Wait(); });

    bool timed_out = false;
    if (waiter.wait_for(config_.timeout) == std::future_status::timeout) {
        timed_out = true;
        spdlog::warn("⏱ Timeout reached ({}s), killing container {}", config_.timeout.count(),
                     ShortId(container_id));
        // Kill and remove off this thread; a wedged runtime must not delay the abort
        auto cleanup = std::async(std::launch::async, [this, &container_id, &guard] {
            KillQuietly(container_id);
            guard.Run();
        });
        if (waiter.wait_for(config_.kill_grace) == std::future_status::timeout) {
            attached->Abort();
        }
        cleanup.wait();
    }

    utils::AttachOutcome outcome;
    try {
        outcome = waiter.get();
    } catch (const ContainerRuntimeError& e) {
        if (!timed_out) {
            throw;
        }
        // The kill can surface as a daemon error on the attach stream
        spdlog::debug("Attachment to {} ended with: {}", ShortId(container_id), e.what());
    }

    Transition(run_id, RunState::COLLECTING, container_id);
    ExecutionResult result =
        collector_.Collect(outcome.stdout_capture, outcome.stderr_capture, bootstrap.sentinel);
    result.timed_out = timed_out;
    if (!timed_out) {
        result.exit_code = outcome.exit_code;
    }
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    Transition(run_id, RunState::CLEANING, container_id);
    guard.Run();
    Transition(run_id, RunState::DONE, container_id);

    if (timed_out) {
        spdlog::info("Run {} timed out after {} ms", run_id, result.duration_ms);
    } else {
        spdlog::info("Run {} finished: exit code {}, {} ms, {} files{}", run_id,
                     *result.exit_code, result.duration_ms, result.files.size(),
                     result.files_truncated ? " (truncated)" : "");
    }
    return result;
}

void ExecutionEngine::EnsureRuntimeReady() {
    auto version = client_->GetVersion();
    if (auto problem = CheckApiCompatibility(version, config_.docker_api_version)) {
        throw RunnerUnavailable(*problem);
    }

    if (client_->ImageExists(config_.image)) {
        return;
    }
    if (!config_.auto_pull) {
        throw RunnerUnavailable("Runner image " + config_.image +
                                " is not present and auto-pull is disabled");
    }
    client_->PullImage(config_.image);
}

utils::ContainerConfig ExecutionEngine::BuildContainerConfig(const std::string& run_id,
                                                             const std::string& script) const {
    utils::ContainerConfig container;
    container.name = "coderunner-" + engine_id_ + "-" + run_id;
    container.image = config_.image;
    container.command = {config_.interpreter, "-c", script};
    container.user = config_.run_user;
    container.working_dir = BootstrapEncoder::kScratchRoot;

    container.memory_limit_mb = config_.memory_mb;
    container.cpu_limit = config_.cpus;
    container.pids_limit = config_.pids_limit;
    container.tmpfs[BootstrapEncoder::kScratchRoot] =
        "rw,size=" + std::to_string(config_.tmpfs_mb) + "m,mode=1777";

    container.network_disabled = true;
    container.read_only_rootfs = true;
    container.capabilities_drop = {"ALL"};
    container.security_opts = {"no-new-privileges"};
    container.auto_remove = true;

    container.labels[kEngineLabel] = engine_id_;
    container.labels[kRunLabel] = run_id;
    container.environment_vars["PYTHONDONTWRITEBYTECODE"] = "1";
    container.environment_vars["PYTHONUNBUFFERED"] = "1";
    container.environment_vars["HOME"] = BootstrapEncoder::kScratchRoot;
    container.environment_vars["TMPDIR"] = BootstrapEncoder::kScratchRoot;
    return container;
}

// ============================================================================
// CLEANUP
// ============================================================================

void ExecutionEngine::KillQuietly(const std::string& container_id) noexcept {
    try {
        client_->KillContainer(container_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to kill container {}: {}", ShortId(container_id), e.what());
        RecordError(e.what());
    }
}

void ExecutionEngine::RemoveQuietly(const std::string& container_id) noexcept {
    try {
        client_->RemoveContainer(container_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove container {}: {}", ShortId(container_id), e.what());
        RecordError(e.what());
    }
}

// ============================================================================
// STATE / DIAGNOSTIC HELPERS
// ============================================================================

std::vector<utils::ContainerInfo> ExecutionEngine::ListOwnedContainers() const {
    return client_->ListContainers({{kEngineLabel, engine_id_}});
}

std::optional<std::string> ExecutionEngine::LastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ExecutionEngine::RecordError(const std::string& message) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

void ExecutionEngine::Transition(const std::string& run_id, RunState state,
                                 const std::string& container_id) const {
    if (container_id.empty()) {
        spdlog::debug("[run {}] -> {}", run_id, ToString(state));
    } else {
        spdlog::debug("[run {}] -> {} (container {})", run_id, ToString(state),
                      ShortId(container_id));
    }
}

std::optional<std::string> ExecutionEngine::CheckApiCompatibility(
    const utils::RuntimeVersion& version, const std::string& configured) {

    if (configured.empty() || version.api_version.empty()) {
        return std::nullopt;
    }
    if (utils::CompareApiVersions(configured, version.api_version) > 0) {
        return "Configured API version " + configured + " is too new; daemon supports up to " +
               version.api_version;
    }
    if (!version.min_api_version.empty() &&
        utils::CompareApiVersions(configured, version.min_api_version) < 0) {
        return "Configured API version " + configured + " is too old; daemon requires at least " +
               version.min_api_version;
    }
    return std::nullopt;
}

} // namespace core
} // namespace coderunner
