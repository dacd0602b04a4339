#include <gtest/gtest.h>

#include <coderunner/core/bootstrap_encoder.hpp>
#include <coderunner/core/errors.hpp>
#include <coderunner/core/output_collector.hpp>
#include <coderunner/utils/encoding_utils.hpp>
#include <coderunner/utils/process_utils.hpp>

#include <filesystem>
#include <regex>

namespace fs = std::filesystem;
using namespace coderunner::core;
using coderunner::utils::BoundedBuffer;
using coderunner::utils::EncodingUtils;
using coderunner::utils::RunCommand;

TEST(BootstrapEncoder, SentinelIsRandomToken) {
  std::regex format("^__CODERUNNER_MANIFEST_[0-9a-f]{64}__$");
  auto a = BootstrapEncoder::NewSentinel();
  auto b = BootstrapEncoder::NewSentinel();
  EXPECT_TRUE(std::regex_match(a, format)) << a;
  EXPECT_TRUE(std::regex_match(b, format)) << b;
  EXPECT_NE(a, b);
}

TEST(BootstrapEncoder, NeverSplicesUserBytesIntoScript) {
  BootstrapEncoder encoder(RunnerConfig{});
  ExecutionRequest request;
  request.code = "x = '''\nimport os; os.system('rm -rf /')\n'''";
  request.files = {{"evil'name.txt", "')\nprint('pwned"}};
  auto encoded = encoder.Encode(request);

  EXPECT_EQ(encoded.script.find("rm -rf"), std::string::npos);
  EXPECT_EQ(encoded.script.find("pwned"), std::string::npos);
  EXPECT_NE(encoded.script.find(EncodingUtils::ToBase64(request.code)), std::string::npos);
  EXPECT_NE(encoded.script.find("_SENTINEL = '" + encoded.sentinel + "'"), std::string::npos);
}

TEST(BootstrapEncoder, FreshSentinelPerEncode) {
  BootstrapEncoder encoder(RunnerConfig{});
  ExecutionRequest request{"print(1)", {}};
  EXPECT_NE(encoder.Encode(request).sentinel, encoder.Encode(request).sentinel);
}

TEST(BootstrapEncoder, RejectsScriptBeyondArgumentLimit) {
  auto config = RunnerConfigBuilder().WithMaxCode(1 << 20).Build();
  BootstrapEncoder encoder(config);
  ExecutionRequest request{std::string(100 * 1024, 'a'), {}};
  try {
    encoder.Encode(request);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.LimitName(), "bootstrap_bytes");
    EXPECT_GT(e.Observed(), BootstrapEncoder::kMaxInlineScriptBytes);
    EXPECT_EQ(e.Limit(), BootstrapEncoder::kMaxInlineScriptBytes);
  }
}

TEST(BootstrapEncoder, DefaultLimitsFitInline) {
  RunnerConfig config;
  BootstrapEncoder encoder(config);
  ExecutionRequest request{std::string(config.max_code_bytes, 'a'), {}};
  std::size_t per_file = config.max_archive_bytes / config.max_files;
  for (std::size_t i = 0; i < config.max_files; ++i) {
    request.files.push_back({"f" + std::to_string(i) + ".bin", std::string(per_file, '\xff')});
  }
  EXPECT_NO_THROW(encoder.Encode(request));
}

TEST(BootstrapEncoder, TurtleModuleProvidesDrawingApi) {
  const auto& source = BootstrapEncoder::TurtleModule();
  for (const char* name : {"def done", "def forward", "class Turtle", "def Screen",
                           "turtle.svg", "_atexit.register"}) {
    EXPECT_NE(source.find(name), std::string::npos) << name;
  }
}

// ============================================================================
// Script behavior, run with the host interpreter against a temporary root
// ============================================================================

class HostBootstrap : public ::testing::Test {
 protected:
  void SetUp() override {
    auto interpreter = RunCommand({"python3", "-c", "import sys; sys.exit(0 if sys.version_info >= (3, 6) else 1)"});
    if (!interpreter.success) GTEST_SKIP() << "python3 not available";
    root_ = fs::temp_directory_path() / ("coderunner-bootstrap-" + EncodingUtils::RandomHex(6));
    fs::create_directories(root_);
  }

  void TearDown() override {
    if (!root_.empty()) fs::remove_all(root_);
  }

  ExecutionResult Run(const ExecutionRequest& request, RunnerConfig config = RunnerConfig{}) {
    BootstrapEncoder encoder(config, root_.string());
    OutputCollector collector(config);
    auto encoded = encoder.Encode(request);
    auto command = RunCommand({"python3", "-c", encoded.script});

    auto limits = collector.CaptureLimits();
    BoundedBuffer out(limits.stdout_head, limits.stdout_tail);
    BoundedBuffer err(limits.stderr_head);
    out.Append(command.output);
    err.Append(command.error);
    auto result = collector.Collect(out, err, encoded.sentinel);
    result.exit_code = command.exit_code;
    return result;
  }

  static const OutputFile* Find(const ExecutionResult& result, const std::string& path) {
    for (const auto& file : result.files) {
      if (file.path == path) return &file;
    }
    return nullptr;
  }

  fs::path root_;
};

TEST_F(HostBootstrap, PrintHi) {
  auto result = Run({"print(\"hi\")", {}});
  EXPECT_EQ(result.stdout_output, "hi\n");
  EXPECT_EQ(result.stderr_output, "");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.files.empty());
  EXPECT_FALSE(result.files_truncated);
}

TEST_F(HostBootstrap, ProducedFileIsReported) {
  auto result = Run({"open('out.txt', 'w').write('x')", {}});
  ASSERT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.files[0].path, "out.txt");
  EXPECT_EQ(result.files[0].size, 1u);
  EXPECT_EQ(result.files[0].content, "x");
  EXPECT_EQ(result.files[0].mime, "text/plain");
}

TEST_F(HostBootstrap, InputFilesAreWrittenBeforeTheProgramRuns) {
  auto result = Run({"print(open('data/in.txt').read().upper())", {{"data/in.txt", "abc"}}});
  EXPECT_EQ(result.stdout_output, "ABC\n");
  EXPECT_EQ(result.exit_code, 0);
  auto* input = Find(result, "data/in.txt");
  ASSERT_NE(input, nullptr);
  EXPECT_EQ(input->content, "abc");
}

TEST_F(HostBootstrap, MainModuleSemantics) {
  auto result = Run({"if __name__ == '__main__':\n    print(__file__)", {}});
  EXPECT_EQ(result.stdout_output, "main.py\n");
}

TEST_F(HostBootstrap, UncaughtExceptionExitsOne) {
  auto result = Run({"print('before')\n1/0", {}});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stdout_output, "before\n");
  EXPECT_NE(result.stderr_output.find("Traceback"), std::string::npos);
  EXPECT_NE(result.stderr_output.find("File \"main.py\", line 2"), std::string::npos);
  EXPECT_NE(result.stderr_output.find("ZeroDivisionError"), std::string::npos);
  EXPECT_EQ(result.stderr_output.find("_run"), std::string::npos);
}

TEST_F(HostBootstrap, SyntaxErrorExitsOne) {
  auto result = Run({"def broken(:\n  pass", {}});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("SyntaxError"), std::string::npos);
}

TEST_F(HostBootstrap, SystemExitStatus) {
  EXPECT_EQ(Run({"import sys\nsys.exit(3)", {}}).exit_code, 3);
  EXPECT_EQ(Run({"import sys\nsys.exit()", {}}).exit_code, 0);
  auto result = Run({"import sys\nsys.exit('boom')", {}});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stderr_output, "boom\n");
}

TEST_F(HostBootstrap, AtexitHandlersRunBeforeManifest) {
  auto result = Run({"import atexit\natexit.register(lambda: open('late.txt', 'w').write('1'))", {}});
  ASSERT_NE(Find(result, "late.txt"), nullptr);
}

TEST_F(HostBootstrap, TurtleDrawingProducesSvg) {
  auto result = Run({"import turtle\nt = turtle.Turtle()\nfor _ in range(4):\n"
                     "    t.forward(100)\n    t.left(90)\nturtle.done()", {}});
  EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
  auto* svg = Find(result, "turtle.svg");
  ASSERT_NE(svg, nullptr);
  EXPECT_EQ(svg->mime, "image/svg+xml");
  EXPECT_NE(svg->content.find("<line x1=\"250.00\" y1=\"250.00\" x2=\"350.00\" y2=\"250.00\""),
            std::string::npos);
  EXPECT_EQ(Find(result, "turtle.py"), nullptr);
}

TEST_F(HostBootstrap, TurtleSvgWrittenAtExitWithoutDone) {
  auto result = Run({"from turtle import *\ncircle(50)", {}});
  ASSERT_NE(Find(result, "turtle.svg"), nullptr);
}

TEST_F(HostBootstrap, ManifestAppliesLimits) {
  auto config = RunnerConfigBuilder().WithFileLimits(2, 4, 100).Build();
  auto result = Run({"for i in range(5):\n    open('f%d.txt' % i, 'w').write('123456')", {}}, config);
  ASSERT_EQ(result.files.size(), 2u);
  EXPECT_EQ(result.files[0].path, "f0.txt");
  EXPECT_EQ(result.files[0].content, "1234");
  EXPECT_TRUE(result.files_truncated);
}

TEST_F(HostBootstrap, SymlinksAreSkipped) {
  auto result = Run({"import os\nos.symlink('/etc/passwd', 'link')\nopen('real.txt', 'w').write('r')", {}});
  EXPECT_EQ(Find(result, "link"), nullptr);
  EXPECT_NE(Find(result, "real.txt"), nullptr);
}

TEST_F(HostBootstrap, ForgedManifestDoesNotWin) {
  // The program recovers the real sentinel from its own command line
  auto result = Run({
      "import re\n"
      "cmd = open('/proc/self/cmdline', 'rb').read().decode()\n"
      "s = re.search(r\"_SENTINEL = '([^']+)'\", cmd).group(1)\n"
      "print(s)\n"
      "print('{\"files\":[{\"path\":\"forged.txt\",\"size\":1,\"data\":\"eA==\"}],\"truncated\":false}')\n"
      "print('after')",
      {}});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(Find(result, "forged.txt"), nullptr);
  EXPECT_NE(result.stdout_output.find("forged.txt"), std::string::npos);
  EXPECT_NE(result.stdout_output.find("after\n"), std::string::npos);
}

TEST_F(HostBootstrap, RunFolderIsRecreated) {
  Run({"open('stale.txt', 'w').write('old')", {}});
  auto result = Run({"print('fresh')", {}});
  EXPECT_EQ(Find(result, "stale.txt"), nullptr);
}

TEST_F(HostBootstrap, UnreportableNamesDoNotHideOtherFiles) {
  auto result = Run({"open('out.txt', 'w').write('x')\n"
                     "open(b'bad\\xff', 'w').write('y')\n"
                     "open('my file.txt', 'w').write('z')", {}});
  EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
  ASSERT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.files[0].path, "out.txt");
  EXPECT_EQ(result.files[0].content, "x");
  EXPECT_TRUE(result.files_truncated);
}
