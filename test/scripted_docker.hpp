#pragma once

#include <coderunner/utils/encoding_utils.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

// Stand-in docker CLI: a shell script in a fresh temp directory. The client
// always passes `-H <host>` first, so the subcommand arrives as $3. Each call
// records its arguments in `args` and DOCKER_API_VERSION in `api`.
class ScriptedDockerBinary {
 public:
  explicit ScriptedDockerBinary(const std::string& cases) {
    namespace fs = std::filesystem;
    dir_ = fs::temp_directory_path() /
           ("coderunner-docker-" + coderunner::utils::EncodingUtils::RandomHex(6));
    fs::create_directories(dir_);
    binary_ = dir_ / "docker";
    std::ofstream script(binary_);
    script << "#!/bin/sh\n"
              "printf '%s\\n' \"$@\" > \"" << (dir_ / "args").string() << "\"\n"
              "printf '%s' \"$DOCKER_API_VERSION\" > \"" << (dir_ / "api").string() << "\"\n"
              "case \"$3\" in\n" << cases << "esac\n";
    script.close();
    fs::permissions(binary_, fs::perms::owner_all);
  }

  ~ScriptedDockerBinary() {
    std::error_code ignored;
    std::filesystem::remove_all(dir_, ignored);
  }

  ScriptedDockerBinary(const ScriptedDockerBinary&) = delete;
  ScriptedDockerBinary& operator=(const ScriptedDockerBinary&) = delete;

  std::string Path() const { return binary_.string(); }

  std::string Read(const std::string& name) const {
    std::ifstream in(dir_ / name);
    return std::string(std::istreambuf_iterator<char>(in), {});
  }

 private:
  std::filesystem::path dir_;
  std::filesystem::path binary_;
};

// `docker version` output of a healthy daemon
inline constexpr const char* kScriptedVersionCase =
    "  version) echo '{\"Client\":{},\"Server\":{\"Version\":\"24.0.7\","
    "\"ApiVersion\":\"1.43\",\"MinAPIVersion\":\"1.12\"}}' ;;\n";
