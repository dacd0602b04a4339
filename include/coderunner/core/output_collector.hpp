/**
 * @file output_collector.hpp
 * @brief Recovers bounded stdout/stderr and produced files from a finished run
 *
 * The container's stdout carries the program's own output followed by the
 * bootstrap manifest:
 * ```
 * <user stdout>\n<sentinel>\n{"files":[{"path","size","data"}...],"truncated":bool}\n
 * ```
 * The split happens at the LAST occurrence of "\n<sentinel>\n", so anything the
 * program printed itself (including a copy of the sentinel) stays user output.
 *
 * @date 2025
 */

#pragma once

#include "coderunner/core/execution_types.hpp"
#include "coderunner/core/runner_config.hpp"
#include "coderunner/utils/container_utils.hpp"
#include "coderunner/utils/process_utils.hpp"

#include <cstddef>
#include <string>

namespace coderunner {
namespace core {

/**
 * @class OutputCollector
 * @brief Sentinel split, output bounding, manifest parsing and MIME sniffing
 *
 * Stateless apart from its limits; thread-safe.
 */
class OutputCollector {
public:
    /// Appended to stdout/stderr when they were cut
    static constexpr const char* kTruncationMarker = "\n...[truncated]";

    explicit OutputCollector(const RunnerConfig& config);

    /**
     * @brief Capture windows the attached run should use
     *
     * stdout keeps max_output_bytes + 1 at the head and a tail large enough to
     * always hold a complete manifest.
     */
    utils::AttachLimits CaptureLimits() const;

    /**
     * @brief Build the output part of an ExecutionResult
     *
     * Fills stdout_output, stderr_output, files and files_truncated. Exit code,
     * timeout flag and duration are left to the caller.
     */
    ExecutionResult Collect(const utils::BoundedBuffer& stdout_capture,
                            const utils::BoundedBuffer& stderr_capture,
                            const std::string& sentinel) const;

    /**
     * @brief Cut @p text to @p limit bytes on a UTF-8 boundary and append the marker
     *
     * Text within the limit is returned unchanged.
     */
    static std::string BoundText(const std::string& text, std::size_t limit);

    /// Content signature first, then extension, then text/plain vs octet-stream
    static std::string SniffMime(const std::string& path, const std::string& content);

private:
    void ParseManifest(const std::string& manifest, ExecutionResult& result) const;

    std::size_t max_output_bytes_;
    std::size_t max_files_;
    std::size_t max_file_bytes_;
    std::size_t max_archive_bytes_;
};

} // namespace core
} // namespace coderunner
