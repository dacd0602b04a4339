/**
 * @file runner_config.hpp
 * @brief Process-wide runner configuration
 *
 * RunnerConfig is loaded once at startup (defaults, then an optional JSON
 * file, then RUNNER_* environment overrides), validated, and injected into the
 * ExecutionEngine as an immutable value shared by all concurrent runs.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace coderunner {
namespace core {

/**
 * @struct RunnerConfig
 * @brief Isolation, admission and output limits for sandboxed runs
 */
struct RunnerConfig {
    bool enabled{true};                                   ///< Master switch

    // Container Runtime
    std::string image{"python:3.12-slim"};                ///< Runner image reference
    std::string docker_host{"unix:///var/run/docker.sock"};  ///< Runtime socket address
    std::string docker_api_version;                       ///< Pinned API version (empty = negotiate)
    bool auto_pull{false};                                ///< Pull the image when missing
    std::string interpreter{"python3"};                   ///< Interpreter inside the image
    std::string run_user{"65534:65534"};                  ///< uid:gid the program runs as

    // Resource Limits
    std::chrono::seconds timeout{5};                      ///< Wall-clock limit per run
    std::size_t memory_mb{256};                           ///< Memory (no extra swap)
    double cpus{0.5};                                     ///< CPU share
    int pids_limit{64};                                   ///< Processes/threads
    std::size_t tmpfs_mb{64};                             ///< Scratch tmpfs size

    // Admission Control
    std::size_t concurrency_limit{4};                     ///< Simultaneous runs
    std::chrono::seconds queue_wait{10};                  ///< Longest wait for a slot
    std::size_t max_queue{32};                            ///< Waiting callers (0 = unbounded)
    std::chrono::seconds kill_grace{5};                   ///< Wait for streams after a forced kill
    std::chrono::seconds runtime_timeout{30};             ///< Deadline for each runtime CLI call

    // Request / Output Limits
    std::size_t max_output_bytes{65536};                  ///< Per stream
    std::size_t max_code_bytes{20000};
    std::size_t max_files{10};
    std::size_t max_file_bytes{16384};
    std::size_t max_archive_bytes{65536};

    /**
     * @brief Check ranges and cross-field constraints
     * @throws ConfigError describing the first invalid field
     */
    void Validate() const;

    /// snake_case JSON form (durations in seconds)
    nlohmann::json ToJson() const;

    /**
     * @brief Overlay keys present in @p doc onto @p base
     * @throws ConfigError on unknown keys or wrongly typed values
     */
    static RunnerConfig FromJson(const nlohmann::json& doc, const RunnerConfig& base);

    /// FromJson() on top of the defaults
    static RunnerConfig FromJson(const nlohmann::json& doc);

    /**
     * @brief Load a JSON configuration file on top of the defaults
     * @throws ConfigError if the file cannot be read or parsed
     */
    static RunnerConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Apply RUNNER_* overrides
     *
     * @param lookup Environment accessor (defaults to getenv)
     * @throws ConfigError if a variable holds an unparseable value
     */
    void ApplyEnvironment(
        const std::function<std::optional<std::string>(const std::string&)>& lookup = {});

    /**
     * @brief Defaults -> optional file -> environment -> Validate()
     *
     * This is what the CLI uses at startup.
     */
    static RunnerConfig Load(const std::optional<std::filesystem::path>& path);
};

/**
 * @class RunnerConfigBuilder
 * @brief Fluent construction of a RunnerConfig
 *
 * **Usage Example**:
 * @code
 * auto config = RunnerConfigBuilder()
 *     .WithImage("python:3.12-slim")
 *     .WithTimeout(std::chrono::seconds(3))
 *     .WithMemoryLimit(128)
 *     .WithConcurrencyLimit(2)
 *     .Build();
 * @endcode
 */
class RunnerConfigBuilder {
public:
    RunnerConfigBuilder& Enabled(bool enable = true) {
        config_.enabled = enable;
        return *this;
    }

    RunnerConfigBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    RunnerConfigBuilder& WithDockerHost(const std::string& host) {
        config_.docker_host = host;
        return *this;
    }

    RunnerConfigBuilder& WithApiVersion(const std::string& version) {
        config_.docker_api_version = version;
        return *this;
    }

    RunnerConfigBuilder& WithTimeout(std::chrono::seconds timeout) {
        config_.timeout = timeout;
        return *this;
    }

    RunnerConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.memory_mb = mb;
        return *this;
    }

    RunnerConfigBuilder& WithCPULimit(double cpus) {
        config_.cpus = cpus;
        return *this;
    }

    RunnerConfigBuilder& WithPidsLimit(int pids) {
        config_.pids_limit = pids;
        return *this;
    }

    RunnerConfigBuilder& WithConcurrencyLimit(std::size_t limit) {
        config_.concurrency_limit = limit;
        return *this;
    }

    /**
     * @brief Admission queue behaviour
     * @param wait Longest time a caller waits for a slot
     * @param depth Maximum number of waiting callers (0 = unbounded)
     */
    RunnerConfigBuilder& WithQueue(std::chrono::seconds wait, std::size_t depth) {
        config_.queue_wait = wait;
        config_.max_queue = depth;
        return *this;
    }

    RunnerConfigBuilder& WithMaxOutput(std::size_t bytes) {
        config_.max_output_bytes = bytes;
        return *this;
    }

    RunnerConfigBuilder& WithMaxCode(std::size_t bytes) {
        config_.max_code_bytes = bytes;
        return *this;
    }

    /**
     * @brief Input/output file limits
     * @param max_files File count
     * @param max_file_bytes Per-file size
     * @param max_archive_bytes Total size
     */
    RunnerConfigBuilder& WithFileLimits(std::size_t max_files, std::size_t max_file_bytes,
                                        std::size_t max_archive_bytes) {
        config_.max_files = max_files;
        config_.max_file_bytes = max_file_bytes;
        config_.max_archive_bytes = max_archive_bytes;
        return *this;
    }

    RunnerConfigBuilder& AutoPull(bool enable = true) {
        config_.auto_pull = enable;
        return *this;
    }

    RunnerConfigBuilder& WithKillGrace(std::chrono::seconds grace) {
        config_.kill_grace = grace;
        return *this;
    }

    RunnerConfigBuilder& WithRuntimeTimeout(std::chrono::seconds timeout) {
        config_.runtime_timeout = timeout;
        return *this;
    }

    RunnerConfig Build() const {
        return config_;
    }

private:
    RunnerConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace coderunner
