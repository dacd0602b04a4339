#include <gtest/gtest.h>

#include <coderunner/core/errors.hpp>
#include <coderunner/core/runner_config.hpp>
#include <coderunner/utils/encoding_utils.hpp>

#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;
using namespace coderunner::core;
using json = nlohmann::json;

namespace {

auto Env(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

} // namespace

TEST(RunnerConfig, DefaultsAreValid) {
  RunnerConfig config;
  EXPECT_NO_THROW(config.Validate());
  EXPECT_TRUE(config.enabled);
  EXPECT_EQ(config.timeout.count(), 5);
  EXPECT_EQ(config.memory_mb, 256u);
  EXPECT_DOUBLE_EQ(config.cpus, 0.5);
  EXPECT_EQ(config.pids_limit, 64);
  EXPECT_EQ(config.concurrency_limit, 4u);
  EXPECT_EQ(config.max_output_bytes, 65536u);
  EXPECT_EQ(config.max_code_bytes, 20000u);
  EXPECT_EQ(config.max_files, 10u);
  EXPECT_EQ(config.max_file_bytes, 16384u);
  EXPECT_EQ(config.max_archive_bytes, 65536u);
  EXPECT_FALSE(config.auto_pull);
  EXPECT_EQ(config.run_user, "65534:65534");
  EXPECT_EQ(config.runtime_timeout.count(), 30);
}

TEST(RunnerConfig, FromJsonOverlaysPresentKeys) {
  auto config = RunnerConfig::FromJson(json{
      {"image", "python:3.11-alpine"},
      {"timeout_seconds", 3},
      {"cpus", 1},
      {"auto_pull", true},
      {"max_files", 4}});
  EXPECT_EQ(config.image, "python:3.11-alpine");
  EXPECT_EQ(config.timeout.count(), 3);
  EXPECT_DOUBLE_EQ(config.cpus, 1.0);
  EXPECT_TRUE(config.auto_pull);
  EXPECT_EQ(config.max_files, 4u);
  EXPECT_EQ(config.memory_mb, 256u);
}

TEST(RunnerConfig, FromJsonOverlaysOntoAGivenBase) {
  auto base = RunnerConfigBuilder()
      .WithImage("base:1")
      .WithRuntimeTimeout(std::chrono::seconds(7))
      .Build();
  auto config = RunnerConfig::FromJson(json{{"runtime_timeout_seconds", 12}}, base);
  EXPECT_EQ(config.image, "base:1");
  EXPECT_EQ(config.runtime_timeout.count(), 12);
  EXPECT_EQ(base.runtime_timeout.count(), 7);
  EXPECT_EQ(RunnerConfig::FromJson(json::object()).runtime_timeout.count(), 30);
}

TEST(RunnerConfig, FromJsonRejectsUnknownKeysAndBadTypes) {
  EXPECT_THROW(RunnerConfig::FromJson(json{{"memroy_mb", 10}}), ConfigError);
  EXPECT_THROW(RunnerConfig::FromJson(json{{"memory_mb", "lots"}}), ConfigError);
  EXPECT_THROW(RunnerConfig::FromJson(json{{"memory_mb", -1}}), ConfigError);
  EXPECT_THROW(RunnerConfig::FromJson(json{{"memory_mb", 1.5}}), ConfigError);
  EXPECT_THROW(RunnerConfig::FromJson(json{{"enabled", "yes"}}), ConfigError);
  EXPECT_THROW(RunnerConfig::FromJson(json::array()), ConfigError);
}

TEST(RunnerConfig, ToJsonRoundTrips) {
  auto config = RunnerConfigBuilder()
      .WithImage("img")
      .WithTimeout(std::chrono::seconds(9))
      .WithQueue(std::chrono::seconds(2), 7)
      .Build();
  auto doc = config.ToJson();
  EXPECT_EQ(doc["timeout_seconds"], 9);
  EXPECT_EQ(doc["queue_wait_seconds"], 2);
  EXPECT_EQ(doc["max_queue"], 7);

  auto back = RunnerConfig::FromJson(doc);
  EXPECT_EQ(back.ToJson(), doc);
}

TEST(RunnerConfig, EnvironmentOverrides) {
  RunnerConfig config;
  config.ApplyEnvironment(Env({{"RUNNER_IMAGE", "custom:1"},
                               {"RUNNER_TIMEOUT_SEC", "12"},
                               {"RUNNER_CPUS", "1.5"},
                               {"RUNNER_CONCURRENCY", "8"},
                               {"RUNNER_MAX_OUTPUT", "1024"},
                               {"RUNNER_AUTO_PULL", "Yes"},
                               {"RUNNER_ENABLED", "0"},
                               {"RUNNER_KILL_GRACE_SEC", "4"},
                               {"RUNNER_RUNTIME_TIMEOUT_SEC", "15"}}));
  EXPECT_EQ(config.image, "custom:1");
  EXPECT_EQ(config.timeout.count(), 12);
  EXPECT_DOUBLE_EQ(config.cpus, 1.5);
  EXPECT_EQ(config.concurrency_limit, 8u);
  EXPECT_EQ(config.max_output_bytes, 1024u);
  EXPECT_TRUE(config.auto_pull);
  EXPECT_FALSE(config.enabled);
  EXPECT_EQ(config.kill_grace.count(), 4);
  EXPECT_EQ(config.runtime_timeout.count(), 15);
}

TEST(RunnerConfig, EnvironmentRejectsGarbage) {
  RunnerConfig config;
  EXPECT_THROW(config.ApplyEnvironment(Env({{"RUNNER_MEMORY_MB", "12abc"}})), ConfigError);
  EXPECT_THROW(config.ApplyEnvironment(Env({{"RUNNER_MAX_FILES", "-3"}})), ConfigError);
  EXPECT_THROW(config.ApplyEnvironment(Env({{"RUNNER_CPUS", "fast"}})), ConfigError);
  EXPECT_THROW(config.ApplyEnvironment(Env({{"RUNNER_ENABLED", "maybe"}})), ConfigError);
}

TEST(RunnerConfig, ValidateRejectsOutOfRangeValues) {
  auto invalid = [](auto mutate) {
    RunnerConfig config;
    mutate(config);
    EXPECT_THROW(config.Validate(), ConfigError);
  };
  invalid([](RunnerConfig& c) { c.image.clear(); });
  invalid([](RunnerConfig& c) { c.docker_host = "http://localhost"; });
  invalid([](RunnerConfig& c) { c.timeout = std::chrono::seconds(0); });
  invalid([](RunnerConfig& c) { c.runtime_timeout = std::chrono::seconds(0); });
  invalid([](RunnerConfig& c) { c.memory_mb = 4; });
  invalid([](RunnerConfig& c) { c.cpus = 0; });
  invalid([](RunnerConfig& c) { c.pids_limit = 0; });
  invalid([](RunnerConfig& c) { c.concurrency_limit = 0; });
  invalid([](RunnerConfig& c) { c.max_output_bytes = 0; });
  invalid([](RunnerConfig& c) { c.tmpfs_mb = 1; c.max_archive_bytes = 2 * 1024 * 1024; });
}

TEST(RunnerConfig, AcceptsSocketPathsAndRemoteHosts) {
  for (const char* host : {"", "/run/user/1000/docker.sock", "unix:///var/run/docker.sock",
                           "tcp://10.0.0.2:2376", "ssh://runner@build-host"}) {
    RunnerConfig config;
    config.docker_host = host;
    EXPECT_NO_THROW(config.Validate()) << host;
  }
}

TEST(RunnerConfig, LoadFromFile) {
  auto path = fs::temp_directory_path() /
              ("coderunner-config-" + coderunner::utils::EncodingUtils::RandomHex(6) + ".json");
  {
    std::ofstream out(path);
    out << R"({"memory_mb": 128, "concurrency_limit": 2})";
  }
  auto config = RunnerConfig::LoadFromFile(path);
  EXPECT_EQ(config.memory_mb, 128u);
  EXPECT_EQ(config.concurrency_limit, 2u);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(RunnerConfig::LoadFromFile(path), ConfigError);
  fs::remove(path);

  EXPECT_THROW(RunnerConfig::LoadFromFile(path), ConfigError);
}
