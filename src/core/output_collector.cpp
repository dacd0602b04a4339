/**
 * @file output_collector.cpp
 * @brief Output bounding, manifest parsing and MIME detection
 *
 * @date 2025
 */

#include "coderunner/core/output_collector.hpp"
#include "coderunner/core/request_validator.hpp"
#include "coderunner/utils/encoding_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

using json = nlohmann::json;

namespace coderunner {
namespace core {

namespace {

constexpr std::size_t kManifestSlack = 64 * 1024;
constexpr std::size_t kMaxPathBytes = 4096;

bool StartsWith(const std::string& data, const std::string& prefix) {
    return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
}

std::string Extension(const std::string& path) {
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool IsValidUtf8(const std::string& data) {
    std::size_t i = 0;
    while (i < data.size()) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        std::size_t extra;
        if (c == 0) {
            return false;
        } else if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (extra > 0 && i + extra >= data.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

bool LooksLikeSvg(const std::string& content) {
    std::string head = content.substr(0, 1024);
    auto start = head.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return false;
    }
    head.erase(0, start);
    if (StartsWith(head, "<svg")) {
        return true;
    }
    return StartsWith(head, "<?xml") && head.find("<svg") != std::string::npos;
}

} // anonymous namespace

OutputCollector::OutputCollector(const RunnerConfig& config)
    : max_output_bytes_(config.max_output_bytes)
    , max_files_(config.max_files)
    , max_file_bytes_(config.max_file_bytes)
    , max_archive_bytes_(config.max_archive_bytes) {
}

utils::AttachLimits OutputCollector::CaptureLimits() const {
    utils::AttachLimits limits;
    limits.stdout_head = max_output_bytes_ + 1;
    limits.stdout_tail = 2 * max_archive_bytes_ + max_files_ * kMaxPathBytes + kManifestSlack;
    limits.stderr_head = max_output_bytes_ + 1;
    return limits;
}

// ============================================================================
// TEXT BOUNDING
// ============================================================================

std::string OutputCollector::BoundText(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    std::size_t cut = limit;
    // Do not split a multi-byte sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + kTruncationMarker;
}

// ============================================================================
// COLLECTION
// ============================================================================

ExecutionResult OutputCollector::Collect(const utils::BoundedBuffer& stdout_capture,
                                         const utils::BoundedBuffer& stderr_capture,
                                         const std::string& sentinel) const {
    ExecutionResult result;
    const std::string delimiter = "\n" + sentinel + "\n";

    std::string user_stdout;
    std::string manifest;
    bool found = false;

    if (!stdout_capture.Overflowed()) {
        std::string full = stdout_capture.Contents();
        auto pos = full.rfind(delimiter);
        if (pos != std::string::npos) {
            user_stdout = full.substr(0, pos);
            manifest = full.substr(pos + delimiter.size());
            found = true;
        } else {
            user_stdout = std::move(full);
        }
    } else {
        // The head window is all user output; only the tail can hold the manifest
        std::string tail = stdout_capture.Tail();
        auto pos = tail.rfind(delimiter);
        if (pos != std::string::npos) {
            manifest = tail.substr(pos + delimiter.size());
            found = true;
        }
        user_stdout = stdout_capture.Head();
    }

    result.stdout_output = BoundText(user_stdout, max_output_bytes_);
    result.stderr_output = BoundText(stderr_capture.Head(), max_output_bytes_);

    if (found) {
        auto eol = manifest.find('\n');
        if (eol != std::string::npos) {
            manifest.resize(eol);
        }
        ParseManifest(manifest, result);
    } else {
        spdlog::debug("No manifest in output; reporting no files");
    }
    return result;
}

void OutputCollector::ParseManifest(const std::string& manifest, ExecutionResult& result) const {
    json doc = json::parse(manifest, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("files") || !doc["files"].is_array()) {
        spdlog::warn("Discarding malformed file manifest ({} bytes)", manifest.size());
        result.files_truncated = true;
        return;
    }

    if (doc.value("truncated", false)) {
        result.files_truncated = true;
    }

    std::set<std::string> seen;
    std::size_t total = 0;
    for (const auto& entry : doc["files"]) {
        if (!entry.is_object() || !entry.contains("path") || !entry["path"].is_string() ||
            !entry.contains("data") || !entry["data"].is_string()) {
            result.files_truncated = true;
            continue;
        }

        const std::string raw_path = entry["path"].get<std::string>();
        auto path = RequestValidator::NormalizePath(raw_path);
        if (!path || *path != raw_path || !seen.insert(*path).second) {
            spdlog::warn("Dropping manifest entry with unsafe path '{}'", raw_path);
            result.files_truncated = true;
            continue;
        }

        auto content = utils::EncodingUtils::FromBase64(entry["data"].get<std::string>());
        if (!content) {
            spdlog::warn("Dropping manifest entry '{}' with invalid content", raw_path);
            result.files_truncated = true;
            continue;
        }

        if (result.files.size() >= max_files_) {
            result.files_truncated = true;
            continue;
        }
        if (content->size() > max_file_bytes_) {
            content->resize(max_file_bytes_);
            result.files_truncated = true;
        }
        if (total + content->size() > max_archive_bytes_) {
            result.files_truncated = true;
            continue;
        }
        total += content->size();

        OutputFile file;
        file.path = *path;
        file.size = content->size();
        file.mime = SniffMime(file.path, *content);
        file.content = std::move(*content);
        result.files.push_back(std::move(file));
    }

    spdlog::debug("Manifest: {} files, {} bytes{}", result.files.size(), total,
                  result.files_truncated ? " (truncated)" : "");
}

// ============================================================================
// MIME DETECTION
// ============================================================================

std::string OutputCollector::SniffMime(const std::string& path, const std::string& content) {
    // Magic numbers
    if (StartsWith(content, std::string("\x89PNG\r\n\x1a\n", 8))) return "image/png";
    if (StartsWith(content, "\xFF\xD8\xFF")) return "image/jpeg";
    if (StartsWith(content, "GIF87a") || StartsWith(content, "GIF89a")) return "image/gif";
    if (StartsWith(content, "%PDF-")) return "application/pdf";
    if (LooksLikeSvg(content)) return "image/svg+xml";

    static const std::map<std::string, std::string> kByExtension = {
        {"svg", "image/svg+xml"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"json", "application/json"},
        {"txt", "text/plain"},
        {"csv", "text/plain"},
        {"md", "text/plain"},
        {"py", "text/plain"},
        {"log", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
    };
    auto it = kByExtension.find(Extension(path));
    if (it != kByExtension.end()) {
        return it->second;
    }

    return IsValidUtf8(content) ? "text/plain" : "application/octet-stream";
}

} // namespace core
} // namespace coderunner
