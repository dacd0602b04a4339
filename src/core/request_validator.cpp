/**
 * @file request_validator.cpp
 * @brief Request limit and path checks
 *
 * @date 2025
 */

#include "coderunner/core/request_validator.hpp"
#include "coderunner/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>

namespace coderunner {
namespace core {

namespace {

const std::regex kSafePath("^[A-Za-z0-9][A-Za-z0-9._/-]*$");

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string Trim(const std::string& str) {
    const char* ws = " \t\r\n";
    auto begin = str.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(ws);
    return str.substr(begin, end - begin + 1);
}

} // anonymous namespace

RequestValidator::RequestValidator(const RunnerConfig& config)
    : max_code_bytes_(config.max_code_bytes)
    , max_files_(config.max_files)
    , max_file_bytes_(config.max_file_bytes)
    , max_archive_bytes_(config.max_archive_bytes) {
}

std::optional<std::string> RequestValidator::NormalizePath(const std::string& path) {
    std::string cleaned = Trim(path);
    std::replace(cleaned.begin(), cleaned.end(), '\\', '/');

    if (cleaned.empty() || !std::regex_match(cleaned, kSafePath)) {
        return std::nullopt;
    }

    // Every segment must name something: no "", "." or ".."
    std::istringstream segments(cleaned);
    std::string segment;
    std::size_t count = 0;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return std::nullopt;
        }
        ++count;
    }
    if (count == 0 || cleaned.back() == '/') {
        return std::nullopt;
    }
    return cleaned;
}

ExecutionRequest RequestValidator::Validate(const ExecutionRequest& request) const {
    if (IsBlank(request.code)) {
        throw ValidationError("code_bytes", 0, max_code_bytes_, "code is empty");
    }
    if (request.code.size() > max_code_bytes_) {
        throw ValidationError("code_bytes", request.code.size(), max_code_bytes_);
    }
    if (request.files.size() > max_files_) {
        throw ValidationError("files", request.files.size(), max_files_);
    }

    ExecutionRequest normalized;
    normalized.code = request.code;
    normalized.files.reserve(request.files.size());

    std::set<std::string> seen;
    std::size_t total = 0;
    for (const auto& file : request.files) {
        auto path = NormalizePath(file.path);
        if (!path) {
            throw ValidationError("file_path", 0, 0, "invalid file path '" + file.path + "'");
        }
        if (!seen.insert(*path).second) {
            throw ValidationError("file_path", 0, 0, "duplicate file path '" + *path + "'");
        }
        if (file.content.size() > max_file_bytes_) {
            throw ValidationError("file_bytes", file.content.size(), max_file_bytes_,
                                  "file '" + *path + "' has " + std::to_string(file.content.size()) +
                                  " bytes, limit is " + std::to_string(max_file_bytes_));
        }
        total += file.content.size();
        normalized.files.push_back(InputFile{*path, file.content});
    }

    // A file may not also be a parent directory of another file
    for (const auto& path : seen) {
        auto child = seen.lower_bound(path + "/");
        if (child != seen.end() && child->rfind(path + "/", 0) == 0) {
            throw ValidationError("file_path", 0, 0, "file path '" + path + "' is also a directory");
        }
    }

    if (total > max_archive_bytes_) {
        throw ValidationError("archive_bytes", total, max_archive_bytes_);
    }

    spdlog::debug("Request accepted: {} code bytes, {} files, {} file bytes",
                  request.code.size(), normalized.files.size(), total);
    return normalized;
}

} // namespace core
} // namespace coderunner
