/**
 * @file main.cpp
 * @brief coderunner - Command-line interface
 *
 * Runs a Python program in an isolated, ephemeral container and prints the
 * result as JSON. Also exposes the runner diagnostics and the effective
 * configuration.
 *
 * **Exit Codes** (`run`):
 * - 0: run completed (including timeouts and non-zero program exits)
 * - 2: request rejected (ValidationError)
 * - 3: no runner slot (ResourceExhausted)
 * - 4: runner unavailable (RunnerUnavailable)
 * - 1: any other error
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "coderunner/core/diagnostics.hpp"
#include "coderunner/core/errors.hpp"
#include "coderunner/core/execution_engine.hpp"
#include "coderunner/core/request_validator.hpp"
#include "coderunner/core/runner_config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

using json = nlohmann::json;
using namespace coderunner;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitValidation = 2;
constexpr int kExitExhausted = 3;
constexpr int kExitUnavailable = 4;

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/**
 * "local[:sandbox_path]" -> InputFile. The sandbox path defaults to the
 * local file name.
 */
core::InputFile LoadInputFile(const std::string& spec) {
    std::string local = spec;
    std::string target;
    auto colon = spec.find(':');
    if (colon != std::string::npos) {
        local = spec.substr(0, colon);
        target = spec.substr(colon + 1);
    }
    if (target.empty()) {
        target = std::filesystem::path(local).filename().string();
    }
    return core::InputFile{target, ReadFile(local)};
}

void SaveFiles(const core::ExecutionResult& result, const std::filesystem::path& dir) {
    for (const auto& file : result.files) {
        auto safe = core::RequestValidator::NormalizePath(file.path);
        if (!safe) {
            spdlog::warn("Not saving file with unsafe path '{}'", file.path);
            continue;
        }
        auto target = dir / *safe;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        if (!out) {
            throw std::runtime_error("Failed to write " + target.string());
        }
        spdlog::info("✓ Saved: {} ({} bytes, {})", target.string(), file.size, file.mime);
    }
}

void PrintJson(const json& doc) {
    std::cout << doc.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"coderunner - sandboxed Python execution"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string config_path;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "JSON runner configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Run a Python script in the sandbox");
    std::string script_path;
    std::vector<std::string> input_specs;
    std::string save_dir;
    run_cmd->add_option("script", script_path, "Python source file")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-f,--file", input_specs,
                        "Input file as local[:sandbox_path] (repeatable)");
    run_cmd->add_option("--save-files", save_dir, "Write produced files into this directory");

    // diagnostics / config
    auto* diag_cmd = app.add_subcommand("diagnostics", "Report runner health");
    auto* config_cmd = app.add_subcommand("config", "Print the effective configuration");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout stays machine-readable
    spdlog::set_default_logger(spdlog::stderr_color_mt("coderunner"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        std::optional<std::filesystem::path> config_file;
        if (!config_path.empty()) {
            config_file = config_path;
        }
        auto config = core::RunnerConfig::Load(config_file);

        if (*config_cmd) {
            PrintJson(config.ToJson());
            return kExitOk;
        }

        core::ExecutionEngine engine(config);

        if (*diag_cmd) {
            core::DiagnosticsReporter reporter(engine);
            PrintJson(reporter.Report().ToJson());
            return kExitOk;
        }

        core::ExecutionRequest request;
        request.code = ReadFile(script_path);
        for (const auto& spec : input_specs) {
            request.files.push_back(LoadInputFile(spec));
        }

        spdlog::info("Running {} ({} input files)", script_path, request.files.size());
        auto result = engine.Execute(request);

        if (!save_dir.empty()) {
            SaveFiles(result, save_dir);
        }
        PrintJson(core::ToJson(result));
        return kExitOk;

    } catch (const core::ValidationError& e) {
        spdlog::error("Rejected: {}", e.what());
        return kExitValidation;
    } catch (const core::ResourceExhausted& e) {
        spdlog::error("Busy: {}", e.what());
        return kExitExhausted;
    } catch (const core::RunnerUnavailable& e) {
        spdlog::error("Runner unavailable: {}", e.what());
        return kExitUnavailable;
    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitError;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitError;
    }
}
