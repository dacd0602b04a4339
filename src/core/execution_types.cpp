/**
 * @file execution_types.cpp
 * @brief String and JSON forms of the execution records
 *
 * @date 2025
 */

#include "coderunner/core/execution_types.hpp"
#include "coderunner/utils/encoding_utils.hpp"

using json = nlohmann::json;

namespace coderunner {
namespace core {

std::string ToString(RunState state) {
    switch (state) {
        case RunState::VALIDATING: return "validating";
        case RunState::SLOT_ACQUIRED: return "slot_acquired";
        case RunState::LAUNCHING: return "launching";
        case RunState::RUNNING: return "running";
        case RunState::COLLECTING: return "collecting";
        case RunState::CLEANING: return "cleaning";
        case RunState::DONE: return "done";
        case RunState::FAILED: return "failed";
    }
    return "unknown";
}

json ToJson(const OutputFile& file) {
    return json{
        {"path", file.path},
        {"size", file.size},
        {"mime", file.mime},
        {"content_base64", utils::EncodingUtils::ToBase64(file.content)},
    };
}

json ToJson(const ExecutionResult& result) {
    json files = json::array();
    for (const auto& file : result.files) {
        files.push_back(ToJson(file));
    }

    json doc;
    doc["stdout"] = result.stdout_output;
    doc["stderr"] = result.stderr_output;
    doc["exit_code"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
    doc["timed_out"] = result.timed_out;
    doc["duration_ms"] = result.duration_ms;
    doc["files"] = std::move(files);
    doc["files_truncated"] = result.files_truncated;
    return doc;
}

} // namespace core
} // namespace coderunner
