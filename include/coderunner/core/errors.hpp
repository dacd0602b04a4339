/**
 * @file errors.hpp
 * @brief Engine-level failure taxonomy
 *
 * Failures that mean "the sandbox could not do its job" are exceptions.
 * A user program that times out or exits non-zero is NOT an error: it is
 * reported through ExecutionResult (timed_out / exit_code).
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace coderunner {
namespace core {

/**
 * @class EngineError
 * @brief Common base for every failure raised by the execution engine
 */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ValidationError
 * @brief Request violates a size/count/path limit
 *
 * Raised before any isolation resource is touched. No container is created
 * and the container runtime is never contacted.
 */
class ValidationError : public EngineError {
public:
    ValidationError(std::string limit_name, std::size_t observed, std::size_t limit,
                    const std::string& detail = "");

    const std::string& LimitName() const { return limit_name_; }
    std::size_t Observed() const { return observed_; }
    std::size_t Limit() const { return limit_; }

private:
    std::string limit_name_;  ///< Name of the violated limit (e.g. "code_bytes")
    std::size_t observed_;    ///< Observed value
    std::size_t limit_;       ///< Configured limit
};

/**
 * @class ResourceExhausted
 * @brief Admission control refused the run (queue full or queue-wait cap reached)
 */
class ResourceExhausted : public EngineError {
public:
    using EngineError::EngineError;
};

/**
 * @class RunnerUnavailable
 * @brief Container runtime cannot serve the run
 *
 * Socket unreachable, incompatible API version, image missing with auto-pull
 * disabled, a failing runtime command, or the runner switched off.
 */
class RunnerUnavailable : public EngineError {
public:
    using EngineError::EngineError;
};

/**
 * @class ConfigError
 * @brief Invalid runner configuration detected at load time
 */
class ConfigError : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace core
} // namespace coderunner
