/**
 * @file execution_types.hpp
 * @brief Request/result records exchanged with the execution engine
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coderunner {
namespace core {

/**
 * @enum RunState
 * @brief Lifecycle of one run inside the engine
 *
 * ```
 * VALIDATING -> SLOT_ACQUIRED -> LAUNCHING -> RUNNING -> COLLECTING -> CLEANING -> DONE
 *                                    |            |
 *                                    +------------+--> FAILED
 * ```
 */
enum class RunState {
    VALIDATING,     ///< Checking limits, building the bootstrap
    SLOT_ACQUIRED,  ///< Admitted by the concurrency gate
    LAUNCHING,      ///< Creating and starting the container
    RUNNING,        ///< Start acknowledged, timeout clock running
    COLLECTING,     ///< Process gone (or killed), parsing output
    CLEANING,       ///< Removing the container, releasing the slot
    DONE,           ///< Result delivered
    FAILED          ///< Runtime failure, surfaced as RunnerUnavailable
};

std::string ToString(RunState state);

/**
 * @struct InputFile
 * @brief File placed into the run folder before the program starts
 */
struct InputFile {
    std::string path;     ///< Relative path inside the run folder
    std::string content;  ///< Raw bytes
};

/**
 * @struct ExecutionRequest
 * @brief One untrusted program and its input files
 */
struct ExecutionRequest {
    std::string code;               ///< Program source
    std::vector<InputFile> files;   ///< Ordered input files
};

/**
 * @struct OutputFile
 * @brief Regular file found in the run folder after the program finished
 */
struct OutputFile {
    std::string path;     ///< Relative, sandbox-rooted, no traversal
    std::size_t size{0};  ///< Bytes returned (after truncation)
    std::string mime;     ///< Best-effort content type
    std::string content;  ///< Raw bytes
};

/**
 * @struct ExecutionResult
 * @brief Everything recovered from one completed run
 *
 * A run that timed out or exited non-zero is still a result, not an error.
 */
struct ExecutionResult {
    std::string stdout_output;             ///< Bounded, marker-terminated if cut
    std::string stderr_output;             ///< Bounded, marker-terminated if cut
    std::optional<int> exit_code;          ///< Absent when the run timed out
    bool timed_out{false};                 ///< Wall-clock limit hit, container killed
    std::int64_t duration_ms{0};           ///< Start acknowledgement to collection
    std::vector<OutputFile> files;         ///< Produced (and input) files
    bool files_truncated{false};           ///< Some files were cut or dropped
};

nlohmann::json ToJson(const OutputFile& file);

/**
 * @brief JSON form of a result
 *
 * Keys: stdout, stderr, exit_code (null when absent), timed_out, duration_ms,
 * files[{path, size, mime, content_base64}], files_truncated.
 */
nlohmann::json ToJson(const ExecutionResult& result);

} // namespace core
} // namespace coderunner
