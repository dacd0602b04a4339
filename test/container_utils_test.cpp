#include <gtest/gtest.h>

#include <coderunner/utils/container_utils.hpp>
#include <coderunner/utils/encoding_utils.hpp>

#include "scripted_docker.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace coderunner::utils;
using namespace std::chrono_literals;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag,
             const std::string& value) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) return true;
  }
  return false;
}

// Answers the handful of subcommands the client tests need
class ScriptedDocker : public ::testing::Test {
 protected:
  ScriptedDocker()
      : docker_(std::string(kScriptedVersionCase) +
                "  image) echo 'Error: No such image: missing:1' >&2; exit 1 ;;\n"
                "  kill) echo 'Error response from daemon: Container abc is not running' >&2; exit 1 ;;\n"
                "  rm) echo 'Error response from daemon: permission denied' >&2; exit 1 ;;\n"
                "  ps) echo '{\"ID\":\"abc\",\"Names\":\"coderunner-1-2\",\"Image\":\"py\",\"State\":\"running\"}';"
                " echo 'garbage' ;;\n") {}

  std::string Read(const std::string& name) { return docker_.Read(name); }

  ScriptedDockerBinary docker_;
  const std::string binary_ = docker_.Path();
};

} // namespace

TEST(DockerClient, CreateArgsCarryHardening) {
  DockerClient docker("unix:///var/run/docker.sock");
  ContainerConfig config;
  config.name = "coderunner-e-r";
  config.image = "python:3.12-slim";
  config.command = {"python3", "-c", "print('hi')"};
  config.memory_limit_mb = 128;
  config.cpu_limit = 0.5;
  config.pids_limit = 32;
  config.tmpfs["/sandbox"] = "rw,size=64m,mode=1777";
  config.labels["coderunner.engine"] = "e";
  config.environment_vars["HOME"] = "/sandbox";

  auto args = docker.BuildCreateArgs(config);
  EXPECT_EQ(args.front(), "create");
  EXPECT_TRUE(HasPair(args, "--name", "coderunner-e-r"));
  EXPECT_TRUE(HasPair(args, "--network", "none"));
  EXPECT_TRUE(HasPair(args, "--memory", "128m"));
  EXPECT_TRUE(HasPair(args, "--memory-swap", "128m"));
  EXPECT_TRUE(HasPair(args, "--cpus", "0.5"));
  EXPECT_TRUE(HasPair(args, "--pids-limit", "32"));
  EXPECT_TRUE(HasPair(args, "--tmpfs", "/sandbox:rw,size=64m,mode=1777"));
  EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
  EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
  EXPECT_TRUE(HasPair(args, "--user", "65534:65534"));
  EXPECT_TRUE(HasPair(args, "--label", "coderunner.engine=e"));
  EXPECT_TRUE(HasPair(args, "--env", "HOME=/sandbox"));
  EXPECT_TRUE(HasPair(args, "--pull", "never"));
  EXPECT_NE(std::find(args.begin(), args.end(), "--read-only"), args.end());
  EXPECT_NE(std::find(args.begin(), args.end(), "--rm"), args.end());
  EXPECT_EQ(std::find(args.begin(), args.end(), "--publish"), args.end());

  // image then argv, script last and untouched
  ASSERT_GE(args.size(), 4u);
  EXPECT_EQ(args[args.size() - 4], "python:3.12-slim");
  EXPECT_EQ(args.back(), "print('hi')");
}

TEST(ContainerUtils, NormalizeRuntimeHost) {
  EXPECT_EQ(NormalizeRuntimeHost(""), "unix:///var/run/docker.sock");
  EXPECT_EQ(NormalizeRuntimeHost("/run/docker.sock"), "unix:///run/docker.sock");
  EXPECT_EQ(NormalizeRuntimeHost("unix://run/docker.sock"), "unix:///run/docker.sock");
  EXPECT_EQ(NormalizeRuntimeHost(" tcp://10.0.0.1:2375 "), "tcp://10.0.0.1:2375");
}

TEST(ContainerUtils, SocketPathFromHost) {
  EXPECT_EQ(SocketPathFromHost("unix:///var/run/docker.sock"), fs::path("/var/run/docker.sock"));
  EXPECT_EQ(SocketPathFromHost("/tmp/d.sock"), fs::path("/tmp/d.sock"));
  EXPECT_FALSE(SocketPathFromHost("tcp://host:2375").has_value());
}

TEST(ContainerUtils, InspectSocket) {
  auto missing = InspectSocket("/nonexistent/coderunner.sock");
  EXPECT_FALSE(missing.exists);
  EXPECT_FALSE(missing.is_socket);

  auto file = fs::temp_directory_path() / ("coderunner-sock-" + EncodingUtils::RandomHex(4));
  std::ofstream(file) << "x";
  fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write);
  auto status = InspectSocket(file);
  EXPECT_TRUE(status.exists);
  EXPECT_FALSE(status.is_socket);
  EXPECT_EQ(status.mode, "0600");
  fs::remove(file);
}

TEST(ContainerUtils, CompareApiVersions) {
  EXPECT_EQ(CompareApiVersions("1.41", "1.41"), 0);
  EXPECT_LT(CompareApiVersions("1.9", "1.41"), 0);
  EXPECT_GT(CompareApiVersions("1.44", "1.43"), 0);
  EXPECT_EQ(CompareApiVersions("1.40", "1.40.0"), 0);
}

TEST_F(ScriptedDocker, VersionIsParsedAndApiPinned) {
  DockerClient docker("/tmp/fake.sock", "1.41", binary_);
  auto version = docker.GetVersion();
  EXPECT_EQ(version.server_version, "24.0.7");
  EXPECT_EQ(version.api_version, "1.43");
  EXPECT_EQ(version.min_api_version, "1.12");
  EXPECT_EQ(Read("api"), "1.41");
  EXPECT_EQ(Read("args"), "-H\nunix:///tmp/fake.sock\nversion\n--format\n{{json .}}\n");
}

TEST_F(ScriptedDocker, MissingImageIsNotAnError) {
  DockerClient docker("/tmp/fake.sock", "", binary_);
  EXPECT_FALSE(docker.ImageExists("missing:1"));
  EXPECT_EQ(Read("api"), "");
}

TEST_F(ScriptedDocker, KillToleratesStoppedContainer) {
  DockerClient docker("/tmp/fake.sock", "", binary_);
  EXPECT_NO_THROW(docker.KillContainer("abc"));
}

TEST_F(ScriptedDocker, RemoveFailureIsReported) {
  DockerClient docker("/tmp/fake.sock", "", binary_);
  EXPECT_THROW(docker.RemoveContainer("abc"), ContainerRuntimeError);
}

TEST_F(ScriptedDocker, ListFiltersByLabelAndSkipsBadRows) {
  DockerClient docker("/tmp/fake.sock", "", binary_);
  auto containers = docker.ListContainers({{"coderunner.engine", "1"}});
  ASSERT_EQ(containers.size(), 1u);
  EXPECT_EQ(containers[0].id, "abc");
  EXPECT_EQ(containers[0].name, "coderunner-1-2");
  EXPECT_EQ(containers[0].state, "running");
  EXPECT_NE(Read("args").find("--filter\nlabel=coderunner.engine=1\n"), std::string::npos);
}

TEST(DockerClient, MissingBinaryIsRuntimeError) {
  DockerClient docker("/tmp/fake.sock", "", "coderunner-no-such-docker");
  EXPECT_THROW(docker.GetVersion(), ContainerRuntimeError);
}

TEST(DockerClient, HungRuntimeCommandIsAbandoned) {
  ScriptedDockerBinary docker("  version) sleep 30 ;;\n");
  DockerClient client("/tmp/fake.sock", "", docker.Path(), 500ms);

  auto start = std::chrono::steady_clock::now();
  try {
    client.GetVersion();
    FAIL() << "expected ContainerRuntimeError";
  } catch (const ContainerRuntimeError& e) {
    EXPECT_NE(std::string(e.what()).find("did not respond to 'version' within 500 ms"),
              std::string::npos) << e.what();
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(DockerClient, CommandTimeoutMustBePositive) {
  EXPECT_THROW(DockerClient("/tmp/fake.sock", "", "docker", 0ms), std::invalid_argument);
}
