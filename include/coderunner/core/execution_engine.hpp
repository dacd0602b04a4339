/**
 * @file execution_engine.hpp
 * @brief Sandboxed execution of untrusted programs in ephemeral containers
 *
 * One call to Execute() is one orchestration:
 * ```
 * caller
 *   -> RequestValidator     (limits, paths; no runtime contact)
 *   -> BootstrapEncoder     (inline script + per-run sentinel)
 *   -> ConcurrencyGate      (admission, scoped slot)
 *   -> container runtime    (check, create, start --attach, wait / kill on timeout)
 *   -> OutputCollector      (split, bound, manifest)
 *   -> container removed, slot released (scoped, on every path)
 * ```
 *
 * **Isolation per run**: no network, no published ports, tmpfs scratch,
 * memory/CPU/pids limits, all capabilities dropped, no-new-privileges,
 * read-only root filesystem, unprivileged user, auto-remove.
 *
 * @date 2025
 */

#pragma once

#include "coderunner/core/bootstrap_encoder.hpp"
#include "coderunner/core/concurrency_gate.hpp"
#include "coderunner/core/execution_types.hpp"
#include "coderunner/core/output_collector.hpp"
#include "coderunner/core/request_validator.hpp"
#include "coderunner/core/runner_config.hpp"
#include "coderunner/utils/container_utils.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coderunner {
namespace core {

/**
 * @class ExecutionEngine
 * @brief Turns an ExecutionRequest into an isolated run and an ExecutionResult
 *
 * **Thread Safety**: Execute() may be called from any number of threads; runs
 * proceed concurrently up to RunnerConfig::concurrency_limit. The configuration
 * is immutable after construction.
 *
 * **Errors**:
 * - ValidationError: request rejected before any runtime call
 * - ResourceExhausted: no slot within the queue-wait cap, or queue full
 * - RunnerUnavailable: runtime unreachable/incompatible, image missing, runtime
 *   command failed, or the runner is disabled
 *
 * A timeout or a non-zero exit is a normal result, never an exception.
 *
 * **Usage Example**:
 * @code
 * auto config = RunnerConfig::Load(std::nullopt);
 * ExecutionEngine engine(config);
 *
 * ExecutionRequest request;
 * request.code = "print('hi')";
 * auto result = engine.Execute(request);
 * // result.stdout_output == "hi\n", *result.exit_code == 0
 * @endcode
 */
class ExecutionEngine {
public:
    /// Label key put on every container this engine creates
    static constexpr const char* kEngineLabel = "coderunner.engine";

    /// Engine backed by the docker CLI at config.docker_host
    explicit ExecutionEngine(const RunnerConfig& config);

    /// Engine backed by an arbitrary runtime client
    ExecutionEngine(const RunnerConfig& config, std::shared_ptr<utils::ContainerClient> client);

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run one program to completion or timeout
     *
     * @param request Code and input files
     * @return Bounded stdout/stderr, exit code (absent on timeout), produced files
     *
     * @throws ValidationError, ResourceExhausted, RunnerUnavailable
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief Execute() on a background thread
     *
     * The task refers to this engine: the engine must outlive the returned
     * future (call get() or wait() before destroying it).
     *
     * @return Future resolving to the result or rethrowing Execute()'s exception
     */
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    const RunnerConfig& GetConfig() const { return config_; }
    const ConcurrencyGate& Gate() const { return gate_; }
    utils::ContainerClient& Client() const { return *client_; }

    /// Random per-instance value of the kEngineLabel label
    const std::string& EngineId() const { return engine_id_; }

    /// Containers (any state) carrying this engine's label
    std::vector<utils::ContainerInfo> ListOwnedContainers() const;

    /// Most recent runtime failure, if any
    std::optional<std::string> LastError() const;

    /**
     * @brief Check the daemon's API range against the pinned version
     * @return Problem description, or std::nullopt when compatible
     */
    static std::optional<std::string> CheckApiCompatibility(const utils::RuntimeVersion& version,
                                                            const std::string& configured);

private:
    ExecutionResult RunInContainer(const std::string& run_id, const BootstrapScript& bootstrap);
    void EnsureRuntimeReady();
    utils::ContainerConfig BuildContainerConfig(const std::string& run_id,
                                                const std::string& script) const;

    // Cleanup helpers: never throw, failures are logged and recorded
    void KillQuietly(const std::string& container_id) noexcept;
    void RemoveQuietly(const std::string& container_id) noexcept;

    void Transition(const std::string& run_id, RunState state,
                    const std::string& container_id = "") const;
    void RecordError(const std::string& message) const;

    const RunnerConfig config_;
    std::shared_ptr<utils::ContainerClient> client_;
    std::string engine_id_;

    RequestValidator validator_;
    BootstrapEncoder encoder_;
    OutputCollector collector_;
    ConcurrencyGate gate_;

    mutable std::mutex error_mutex_;
    mutable std::optional<std::string> last_error_;
};

} // namespace core
} // namespace coderunner
