#include "server/health.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::MatchesRegex;

const std::string test_tmpdir = "/tmp/exec_agent_testdir/health";

executor::ExecutionConfig ShellConfig() {
  util::File::MakeDirs(test_tmpdir);
  executor::ExecutionConfig config;
  config.interpreter = "/bin/sh";
  config.temp_root = test_tmpdir;
  return config;
}

// NOLINTNEXTLINE
TEST(Health, Healthy) {
  server::HealthChecker checker(ShellConfig(), &sandbox::ProcessRunner::Create,
                                "echo 4.2");
  nlohmann::json report = checker.Check();
  EXPECT_EQ(report["status"], "healthy") << report.dump();
  EXPECT_EQ(report["checks"]["interpreter"]["status"], "ok");
  EXPECT_EQ(report["checks"]["interpreter"]["path"], "/bin/sh");
  EXPECT_EQ(report["checks"]["subprocess_creation"]["status"], "ok");
  EXPECT_EQ(report["checks"]["subprocess_creation"]["version"], "4.2");
  EXPECT_EQ(report["checks"]["temp_directory"]["status"], "ok");
  EXPECT_TRUE(report["checks"]["disk_space"]["free_space_gb"].is_number());
  EXPECT_THAT(report["timestamp"].get<std::string>(),
              MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T.*"));
}

// NOLINTNEXTLINE
TEST(Health, MissingInterpreter) {
  executor::ExecutionConfig config = ShellConfig();
  config.interpreter = "no-such-interpreter-here";
  server::HealthChecker checker(config, &sandbox::ProcessRunner::Create,
                                "true");
  nlohmann::json report = checker.Check();
  EXPECT_EQ(report["status"], "unhealthy");
  EXPECT_EQ(report["checks"]["interpreter"]["status"], "error");
  EXPECT_EQ(report["checks"]["subprocess_creation"]["status"], "error");
  EXPECT_EQ(report["checks"]["temp_directory"]["status"], "ok");
}

// NOLINTNEXTLINE
TEST(Health, ProbeFails) {
  server::HealthChecker checker(ShellConfig(), &sandbox::ProcessRunner::Create,
                                "exit 2");
  nlohmann::json report = checker.Check();
  EXPECT_EQ(report["status"], "unhealthy");
  EXPECT_THAT(report["checks"]["subprocess_creation"]["error"].get<std::string>(),
              HasSubstr("non-zero code: 2"));
}

// NOLINTNEXTLINE
TEST(Health, ProbeHangs) {
  server::HealthChecker checker(ShellConfig(), &sandbox::ProcessRunner::Create,
                                "sleep 10");
  nlohmann::json report = checker.Check();
  EXPECT_EQ(report["status"], "unhealthy");
  EXPECT_EQ(report["checks"]["subprocess_creation"]["error"],
            "Subprocess creation timeout");
}

// NOLINTNEXTLINE
TEST(Health, BadTempRoot) {
  executor::ExecutionConfig config = ShellConfig();
  config.temp_root = "/nope/nope/nope";
  server::HealthChecker checker(config, &sandbox::ProcessRunner::Create,
                                "true");
  nlohmann::json report = checker.Check();
  EXPECT_EQ(report["status"], "unhealthy");
  EXPECT_EQ(report["checks"]["temp_directory"]["status"], "error");
  EXPECT_EQ(report["checks"]["disk_space"]["status"], "warning");
}

}  // namespace
