/**
 * @file bootstrap_encoder.hpp
 * @brief Serializes code + input files into one self-contained inline script
 *
 * File injection and execution are never separate steps: the container runs
 * `[interpreter, "-c", script]` and the script itself recreates the run
 * folder, writes the inputs, runs the program and reports the produced files.
 *
 * **Script phases** (inside the container):
 * ```
 * 1. recreate <root>/run, install <root>/lib/turtle.py
 * 2. write input files (base64 payloads) into <root>/run
 * 3. chdir <root>/run, exec user code as main.py (__name__ == "__main__")
 * 4. run atexit handlers, flush stdio
 * 5. print "\n<sentinel>\n" + one-line JSON manifest of <root>/run
 * 6. os._exit(status)
 * ```
 *
 * No user-controlled byte is ever spliced into script syntax: code, paths and
 * contents are embedded as base64 string literals.
 *
 * @date 2025
 */

#pragma once

#include "coderunner/core/execution_types.hpp"
#include "coderunner/core/runner_config.hpp"

#include <cstddef>
#include <string>

namespace coderunner {
namespace core {

/**
 * @struct BootstrapScript
 * @brief Encoded script plus the per-run sentinel the collector must look for
 */
struct BootstrapScript {
    std::string script;    ///< Python source passed with -c
    std::string sentinel;  ///< Line that separates user stdout from the manifest
};

/**
 * @class BootstrapEncoder
 * @brief Builds bootstrap scripts for one runner configuration
 *
 * Thread-safe; every Encode() call draws a fresh sentinel.
 */
class BootstrapEncoder {
public:
    /// Largest single argv entry the kernel accepts (MAX_ARG_STRLEN - 1 for the NUL)
    static constexpr std::size_t kMaxInlineScriptBytes = 128 * 1024 - 1;

    /// Scratch tmpfs mount inside the container
    static constexpr const char* kScratchRoot = "/sandbox";

    /**
     * @param config Manifest limits are taken from max_files / max_file_bytes /
     *               max_archive_bytes
     * @param scratch_root Directory holding run/ and lib/ when the script runs
     */
    explicit BootstrapEncoder(const RunnerConfig& config, std::string scratch_root = kScratchRoot);

    /**
     * @brief Encode a validated request
     * @throws ValidationError("bootstrap_bytes") if the script exceeds kMaxInlineScriptBytes
     */
    BootstrapScript Encode(const ExecutionRequest& request) const;

    /// `__CODERUNNER_MANIFEST_<64 hex>__` from 32 OpenSSL random bytes
    static std::string NewSentinel();

    /// Source of the headless turtle stand-in installed into lib/
    static const std::string& TurtleModule();

private:
    std::string scratch_root_;
    std::size_t max_files_;
    std::size_t max_file_bytes_;
    std::size_t max_archive_bytes_;
};

} // namespace core
} // namespace coderunner
