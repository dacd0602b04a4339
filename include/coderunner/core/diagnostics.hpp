/**
 * @file diagnostics.hpp
 * @brief Operational health of the runner for privileged callers
 *
 * Never part of the execute path. Probing never throws: every failure ends up
 * as a field of the report.
 *
 * @date 2025
 */

#pragma once

#include "coderunner/core/execution_engine.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace coderunner {
namespace core {

/**
 * @struct DiagnosticsReport
 * @brief Snapshot of runtime reachability, image state and admission load
 */
struct DiagnosticsReport {
    bool enabled{false};                          ///< Runner switched on

    // Runtime Endpoint
    std::string runtime_host;                     ///< Normalized runtime address
    std::optional<std::string> socket_path;       ///< Unix socket path (unix:// hosts only)
    bool socket_exists{false};
    bool socket_is_socket{false};
    std::string socket_mode;                      ///< Octal permission bits
    bool socket_reachable{false};                 ///< Daemon answered a version query

    // Versions
    std::string configured_api_version;           ///< Pinned version (empty = negotiate)
    std::string server_api_version;
    std::string server_min_api_version;
    std::string server_version;
    bool api_compatible{false};

    // Image
    std::string image;
    std::optional<bool> image_present;            ///< Unknown when the daemon is unreachable

    // Admission
    std::size_t in_flight{0};
    std::size_t waiting{0};
    std::size_t concurrency_limit{0};

    std::optional<std::string> last_error;        ///< Most recent orchestrator failure
    std::vector<std::string> probe_errors;        ///< Failures seen while building this report

    nlohmann::json ToJson() const;
};

/**
 * @class DiagnosticsReporter
 * @brief Builds DiagnosticsReport snapshots for one engine
 */
class DiagnosticsReporter {
public:
    explicit DiagnosticsReporter(const ExecutionEngine& engine);

    /// Probe socket, daemon and image; never throws
    DiagnosticsReport Report() const;

private:
    const ExecutionEngine& engine_;
};

} // namespace core
} // namespace coderunner
