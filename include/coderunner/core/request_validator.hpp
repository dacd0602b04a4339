/**
 * @file request_validator.hpp
 * @brief Size, count and path checks applied before any isolation resource
 *
 * @date 2025
 */

#pragma once

#include "coderunner/core/execution_types.hpp"
#include "coderunner/core/runner_config.hpp"

#include <optional>
#include <string>

namespace coderunner {
namespace core {

/**
 * @class RequestValidator
 * @brief Rejects oversized, too-numerous or unsafe inputs
 *
 * Checks run in this order and stop at the first violation:
 * 1. code is not blank and fits max_code_bytes        ("code_bytes")
 * 2. file count fits max_files                        ("files")
 * 3. per file: safe relative path                     ("file_path")
 *              content fits max_file_bytes            ("file_bytes")
 * 4. summed file sizes fit max_archive_bytes          ("archive_bytes")
 *
 * Pure and thread-safe: the container runtime is never involved.
 */
class RequestValidator {
public:
    explicit RequestValidator(const RunnerConfig& config);

    /**
     * @brief Validate @p request and return it with normalized file paths
     * @throws ValidationError naming the violated limit
     */
    ExecutionRequest Validate(const ExecutionRequest& request) const;

    /**
     * @brief Normalize a run-folder relative path
     *
     * Backslashes become '/', surrounding whitespace is trimmed. Returns
     * std::nullopt for empty, absolute or traversing paths, and for characters
     * outside [A-Za-z0-9._/-] (first character alphanumeric).
     */
    static std::optional<std::string> NormalizePath(const std::string& path);

private:
    std::size_t max_code_bytes_;
    std::size_t max_files_;
    std::size_t max_file_bytes_;
    std::size_t max_archive_bytes_;
};

} // namespace core
} // namespace coderunner
