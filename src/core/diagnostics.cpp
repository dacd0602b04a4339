/**
 * @file diagnostics.cpp
 * @brief Runner health probes
 *
 * @date 2025
 */

#include "coderunner/core/diagnostics.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace coderunner {
namespace core {

DiagnosticsReporter::DiagnosticsReporter(const ExecutionEngine& engine)
    : engine_(engine) {
}

DiagnosticsReport DiagnosticsReporter::Report() const {
    const RunnerConfig& config = engine_.GetConfig();
    utils::ContainerClient& client = engine_.Client();

    DiagnosticsReport report;
    report.enabled = config.enabled;
    report.image = config.image;
    report.configured_api_version = config.docker_api_version;
    report.in_flight = engine_.Gate().InFlight();
    report.waiting = engine_.Gate().Waiting();
    report.concurrency_limit = engine_.Gate().Limit();
    report.last_error = engine_.LastError();

    try {
        report.runtime_host = client.Endpoint();

        if (auto path = utils::SocketPathFromHost(report.runtime_host)) {
            auto socket = utils::InspectSocket(*path);
            report.socket_path = socket.path.string();
            report.socket_exists = socket.exists;
            report.socket_is_socket = socket.is_socket;
            report.socket_mode = socket.mode;
        }
    } catch (const std::exception& e) {
        report.probe_errors.push_back(std::string("socket: ") + e.what());
    }

    try {
        auto version = client.GetVersion();
        report.socket_reachable = true;
        report.server_version = version.server_version;
        report.server_api_version = version.api_version;
        report.server_min_api_version = version.min_api_version;

        auto problem = ExecutionEngine::CheckApiCompatibility(version, config.docker_api_version);
        report.api_compatible = !problem.has_value();
        if (problem) {
            report.probe_errors.push_back("api: " + *problem);
        }
    } catch (const std::exception& e) {
        std::string message = e.what();
        report.probe_errors.push_back("runtime: " + message);
        // The CLI refuses to talk at all when the pinned version is above the daemon's
        if (message.find("is too new") != std::string::npos) {
            report.socket_reachable = true;
        }
    }

    if (report.socket_reachable && report.api_compatible) {
        try {
            report.image_present = client.ImageExists(config.image);
        } catch (const std::exception& e) {
            report.probe_errors.push_back(std::string("image: ") + e.what());
        }
    }

    spdlog::debug("Diagnostics: reachable={} image_present={} in_flight={}/{}",
                  report.socket_reachable,
                  report.image_present ? (*report.image_present ? "yes" : "no") : "unknown",
                  report.in_flight, report.concurrency_limit);
    return report;
}

json DiagnosticsReport::ToJson() const {
    json doc;
    doc["enabled"] = enabled;
    doc["runtime_host"] = runtime_host;
    doc["socket_path"] = socket_path ? json(*socket_path) : json(nullptr);
    doc["socket_exists"] = socket_exists;
    doc["socket_is_socket"] = socket_is_socket;
    doc["socket_mode"] = socket_mode.empty() ? json(nullptr) : json(socket_mode);
    doc["socket_reachable"] = socket_reachable;
    doc["configured_api_version"] = configured_api_version.empty()
        ? json(nullptr) : json(configured_api_version);
    doc["server_api_version"] = server_api_version.empty() ? json(nullptr) : json(server_api_version);
    doc["server_min_api_version"] = server_min_api_version.empty()
        ? json(nullptr) : json(server_min_api_version);
    doc["server_version"] = server_version.empty() ? json(nullptr) : json(server_version);
    doc["api_compatible"] = api_compatible;
    doc["image"] = image;
    doc["image_present"] = image_present ? json(*image_present) : json(nullptr);
    doc["in_flight"] = in_flight;
    doc["waiting"] = waiting;
    doc["concurrency_limit"] = concurrency_limit;
    doc["last_error"] = last_error ? json(*last_error) : json(nullptr);
    doc["probe_errors"] = probe_errors;
    return doc;
}

} // namespace core
} // namespace coderunner
