/**
 * @file runner_config.cpp
 * @brief RunnerConfig loading, environment overrides and validation
 *
 * @date 2025
 */

#include "coderunner/core/runner_config.hpp"
#include "coderunner/core/errors.hpp"
#include "coderunner/utils/encoding_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>

using json = nlohmann::json;

namespace coderunner {
namespace core {

namespace {

// Largest single argv entry accepted by execve() on Linux (MAX_ARG_STRLEN)
constexpr std::size_t kArgStrLimit = 128 * 1024;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ParseBool(const std::string& name, const std::string& raw) {
    std::string value = ToLower(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) {
        return false;
    }
    throw ConfigError(name + ": expected a boolean, got '" + raw + "'");
}

std::size_t ParseSize(const std::string& name, const std::string& raw) {
    try {
        std::size_t consumed = 0;
        if (!raw.empty() && raw.front() == '-') {
            throw std::invalid_argument("negative");
        }
        unsigned long long value = std::stoull(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected a non-negative integer, got '" + raw + "'");
    }
}

double ParseDouble(const std::string& name, const std::string& raw) {
    try {
        std::size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected a number, got '" + raw + "'");
    }
}

template <typename T>
T Get(const json& value, const std::string& key) {
    try {
        return value.get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Config key '" + key + "' has the wrong type: " + e.what());
    }
}

std::size_t GetSize(const json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError("Config key '" + key + "' must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

std::chrono::seconds GetSeconds(const json& value, const std::string& key) {
    return std::chrono::seconds(static_cast<long long>(GetSize(value, key)));
}

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ============================================================================
// VALIDATION
// ============================================================================

void RunnerConfig::Validate() const {
    auto require = [](bool ok, const std::string& message) {
        if (!ok) {
            throw ConfigError("Invalid runner configuration: " + message);
        }
    };

    require(!image.empty(), "image must not be empty");
    require(!interpreter.empty(), "interpreter must not be empty");
    require(!run_user.empty(), "run_user must not be empty");
    require(docker_host.empty() || docker_host.front() == '/' ||
                docker_host.rfind("unix://", 0) == 0 || docker_host.rfind("tcp://", 0) == 0 ||
                docker_host.rfind("ssh://", 0) == 0,
            "docker_host must be a unix://, tcp:// or ssh:// address or a socket path");

    require(timeout.count() > 0, "timeout_seconds must be positive");
    require(memory_mb >= 6, "memory_mb must be at least 6");
    require(cpus > 0.0, "cpus must be positive");
    require(pids_limit > 0, "pids_limit must be positive");
    require(tmpfs_mb > 0, "tmpfs_mb must be positive");

    require(concurrency_limit >= 1, "concurrency_limit must be at least 1");
    require(queue_wait.count() >= 0, "queue_wait_seconds must not be negative");
    require(kill_grace.count() >= 0, "kill_grace_seconds must not be negative");
    require(runtime_timeout.count() > 0, "runtime_timeout_seconds must be positive");

    require(max_output_bytes > 0, "max_output_bytes must be positive");
    require(max_code_bytes > 0, "max_code_bytes must be positive");
    require(max_file_bytes > 0, "max_file_bytes must be positive");
    require(max_archive_bytes > 0, "max_archive_bytes must be positive");
    require(max_archive_bytes <= tmpfs_mb * 1024 * 1024, "max_archive_bytes exceeds tmpfs_mb");

    // Requests at the limits may still be rejected by the inline-script bound
    std::size_t worst_case = utils::EncodingUtils::Base64Length(max_code_bytes) +
                             utils::EncodingUtils::Base64Length(max_archive_bytes);
    if (worst_case >= kArgStrLimit) {
        spdlog::warn("max_code_bytes + max_archive_bytes ({} + {}) may not fit a single "
                     "inline script; large requests will be rejected",
                     max_code_bytes, max_archive_bytes);
    }
}

// ============================================================================
// JSON
// ============================================================================

json RunnerConfig::ToJson() const {
    return json{
        {"enabled", enabled},
        {"image", image},
        {"docker_host", docker_host},
        {"docker_api_version", docker_api_version},
        {"auto_pull", auto_pull},
        {"interpreter", interpreter},
        {"run_user", run_user},
        {"timeout_seconds", timeout.count()},
        {"memory_mb", memory_mb},
        {"cpus", cpus},
        {"pids_limit", pids_limit},
        {"tmpfs_mb", tmpfs_mb},
        {"concurrency_limit", concurrency_limit},
        {"queue_wait_seconds", queue_wait.count()},
        {"max_queue", max_queue},
        {"kill_grace_seconds", kill_grace.count()},
        {"runtime_timeout_seconds", runtime_timeout.count()},
        {"max_output_bytes", max_output_bytes},
        {"max_code_bytes", max_code_bytes},
        {"max_files", max_files},
        {"max_file_bytes", max_file_bytes},
        {"max_archive_bytes", max_archive_bytes},
    };
}

RunnerConfig RunnerConfig::FromJson(const json& doc, const RunnerConfig& base) {
    if (!doc.is_object()) {
        throw ConfigError("Runner configuration must be a JSON object");
    }

    RunnerConfig config = base;
    for (const auto& [key, value] : doc.items()) {
        if (key == "enabled") config.enabled = Get<bool>(value, key);
        else if (key == "image") config.image = Get<std::string>(value, key);
        else if (key == "docker_host") config.docker_host = Get<std::string>(value, key);
        else if (key == "docker_api_version") config.docker_api_version = Get<std::string>(value, key);
        else if (key == "auto_pull") config.auto_pull = Get<bool>(value, key);
        else if (key == "interpreter") config.interpreter = Get<std::string>(value, key);
        else if (key == "run_user") config.run_user = Get<std::string>(value, key);
        else if (key == "timeout_seconds") config.timeout = GetSeconds(value, key);
        else if (key == "memory_mb") config.memory_mb = GetSize(value, key);
        else if (key == "cpus") config.cpus = Get<double>(value, key);
        else if (key == "pids_limit") config.pids_limit = static_cast<int>(GetSize(value, key));
        else if (key == "tmpfs_mb") config.tmpfs_mb = GetSize(value, key);
        else if (key == "concurrency_limit") config.concurrency_limit = GetSize(value, key);
        else if (key == "queue_wait_seconds") config.queue_wait = GetSeconds(value, key);
        else if (key == "max_queue") config.max_queue = GetSize(value, key);
        else if (key == "kill_grace_seconds") config.kill_grace = GetSeconds(value, key);
        else if (key == "runtime_timeout_seconds") config.runtime_timeout = GetSeconds(value, key);
        else if (key == "max_output_bytes") config.max_output_bytes = GetSize(value, key);
        else if (key == "max_code_bytes") config.max_code_bytes = GetSize(value, key);
        else if (key == "max_files") config.max_files = GetSize(value, key);
        else if (key == "max_file_bytes") config.max_file_bytes = GetSize(value, key);
        else if (key == "max_archive_bytes") config.max_archive_bytes = GetSize(value, key);
        else throw ConfigError("Unknown config key '" + key + "'");
    }
    return config;
}

RunnerConfig RunnerConfig::FromJson(const json& doc) {
    return FromJson(doc, RunnerConfig());
}

RunnerConfig RunnerConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded runner config from {}", path.string());
    return FromJson(doc);
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

void RunnerConfig::ApplyEnvironment(
    const std::function<std::optional<std::string>(const std::string&)>& lookup) {

    std::function<std::optional<std::string>(const std::string&)> get = lookup;
    if (!get) {
        get = GetEnv;
    }

    using Setter = std::function<void(RunnerConfig&, const std::string&, const std::string&)>;
    auto seconds = [](std::chrono::seconds RunnerConfig::*field) -> Setter {
        return [field](RunnerConfig& c, const std::string& n, const std::string& v) {
            c.*field = std::chrono::seconds(static_cast<long long>(ParseSize(n, v)));
        };
    };
    auto size = [](std::size_t RunnerConfig::*field) -> Setter {
        return [field](RunnerConfig& c, const std::string& n, const std::string& v) {
            c.*field = ParseSize(n, v);
        };
    };
    auto text = [](std::string RunnerConfig::*field) -> Setter {
        return [field](RunnerConfig& c, const std::string&, const std::string& v) {
            c.*field = v;
        };
    };
    auto flag = [](bool RunnerConfig::*field) -> Setter {
        return [field](RunnerConfig& c, const std::string& n, const std::string& v) {
            c.*field = ParseBool(n, v);
        };
    };

    const std::map<std::string, Setter> overrides = {
        {"RUNNER_ENABLED", flag(&RunnerConfig::enabled)},
        {"RUNNER_IMAGE", text(&RunnerConfig::image)},
        {"RUNNER_DOCKER_HOST", text(&RunnerConfig::docker_host)},
        {"RUNNER_DOCKER_API_VERSION", text(&RunnerConfig::docker_api_version)},
        {"RUNNER_TIMEOUT_SEC", seconds(&RunnerConfig::timeout)},
        {"RUNNER_MEMORY_MB", size(&RunnerConfig::memory_mb)},
        {"RUNNER_CPUS", [](RunnerConfig& c, const std::string& n, const std::string& v) {
             c.cpus = ParseDouble(n, v);
         }},
        {"RUNNER_PIDS_LIMIT", [](RunnerConfig& c, const std::string& n, const std::string& v) {
             c.pids_limit = static_cast<int>(ParseSize(n, v));
         }},
        {"RUNNER_TMPFS_MB", size(&RunnerConfig::tmpfs_mb)},
        {"RUNNER_CONCURRENCY", size(&RunnerConfig::concurrency_limit)},
        {"RUNNER_QUEUE_WAIT_SEC", seconds(&RunnerConfig::queue_wait)},
        {"RUNNER_MAX_QUEUE", size(&RunnerConfig::max_queue)},
        {"RUNNER_KILL_GRACE_SEC", seconds(&RunnerConfig::kill_grace)},
        {"RUNNER_RUNTIME_TIMEOUT_SEC", seconds(&RunnerConfig::runtime_timeout)},
        {"RUNNER_MAX_OUTPUT", size(&RunnerConfig::max_output_bytes)},
        {"RUNNER_MAX_CODE_SIZE", size(&RunnerConfig::max_code_bytes)},
        {"RUNNER_MAX_FILES", size(&RunnerConfig::max_files)},
        {"RUNNER_MAX_FILE_BYTES", size(&RunnerConfig::max_file_bytes)},
        {"RUNNER_MAX_ARCHIVE_BYTES", size(&RunnerConfig::max_archive_bytes)},
        {"RUNNER_AUTO_PULL", flag(&RunnerConfig::auto_pull)},
    };

    for (const auto& [name, apply] : overrides) {
        auto value = get(name);
        if (!value) {
            continue;
        }
        apply(*this, name, *value);
        spdlog::debug("Config override from {}", name);
    }
}

RunnerConfig RunnerConfig::Load(const std::optional<std::filesystem::path>& path) {
    RunnerConfig config = path ? LoadFromFile(*path) : RunnerConfig{};
    config.ApplyEnvironment();
    config.Validate();
    return config;
}

} // namespace core
} // namespace coderunner
