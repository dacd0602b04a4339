/**
 * @file errors.cpp
 * @brief Engine failure taxonomy
 *
 * @date 2025
 */

#include "coderunner/core/errors.hpp"

#include <utility>

namespace coderunner {
namespace core {

namespace {

std::string FormatValidationMessage(const std::string& limit_name, std::size_t observed,
                                    std::size_t limit, const std::string& detail) {
    std::string message = "Request rejected (" + limit_name + "): ";
    if (!detail.empty()) {
        message += detail;
    } else {
        message += "observed " + std::to_string(observed) +
                   " exceeds limit " + std::to_string(limit);
    }
    return message;
}

} // anonymous namespace

ValidationError::ValidationError(std::string limit_name, std::size_t observed,
                                 std::size_t limit, const std::string& detail)
    : EngineError(FormatValidationMessage(limit_name, observed, limit, detail))
    , limit_name_(std::move(limit_name))
    , observed_(observed)
    , limit_(limit) {
}

} // namespace core
} // namespace coderunner
