// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Unit tests for severity parsing, environment overrides and init/shutdown
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#define UPLIFT_LOG_COMPONENT "test_log_init"
#include "uplift_log_init.hpp"
#include "uplift_log_macros.hpp"

using namespace uplift::logging;

namespace {

const char* const kEnvVars[] = {
  "UPLIFT_LOG_LEVEL",
  "UPLIFT_LOG_CONSOLE_LEVEL",
  "UPLIFT_LOG_FILE_LEVEL",
  "UPLIFT_LOG_FILE_DIR",
  "UPLIFT_LOG_FORMAT",
  "UPLIFT_LOG_FILE_ENABLED",
  "UPLIFT_LOG_CONSOLE_ENABLED",
};

}  // namespace

TEST(SeverityLevelTest, ParseValidLevels) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("info"), severity_level::info);
  EXPECT_EQ(parse_severity_level("warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityLevelTest, ParseCaseInsensitive) {
  EXPECT_EQ(parse_severity_level("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("WaRnInG"), severity_level::warn);
}

TEST(SeverityLevelTest, ParseInvalid) {
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("info ").has_value());
}

TEST(SeverityLevelTest, StreamsUppercaseName) {
  std::ostringstream oss;
  oss << severity_level::warn << " " << severity_level::fatal;
  EXPECT_EQ(oss.str(), "WARN FATAL");
}

class EnvOverrideTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char* name : kEnvVars) {
      unsetenv(name);
    }
  }
};

TEST_F(EnvOverrideTest, NoEnvLeavesConfigUntouched) {
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.console_enabled);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(EnvOverrideTest, GlobalLevelAppliesToBothSinks) {
  setenv("UPLIFT_LOG_LEVEL", "error", 1);
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(EnvOverrideTest, SinkLevelOverridesGlobal) {
  setenv("UPLIFT_LOG_LEVEL", "error", 1);
  setenv("UPLIFT_LOG_CONSOLE_LEVEL", "debug", 1);
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::debug);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(EnvOverrideTest, InvalidValuesIgnored) {
  setenv("UPLIFT_LOG_LEVEL", "loud", 1);
  setenv("UPLIFT_LOG_FILE_ENABLED", "maybe", 1);
  setenv("UPLIFT_LOG_FORMAT", "xml", 1);
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_TRUE(config.file_config.format_json);
}

TEST_F(EnvOverrideTest, FileSettings) {
  setenv("UPLIFT_LOG_FILE_ENABLED", "yes", 1);
  setenv("UPLIFT_LOG_CONSOLE_ENABLED", "off", 1);
  setenv("UPLIFT_LOG_FILE_DIR", "/tmp/uplift_env_logs", 1);
  setenv("UPLIFT_LOG_FORMAT", "TEXT", 1);
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.file_enabled);
  EXPECT_FALSE(config.console_enabled);
  EXPECT_EQ(config.file_config.directory, "/tmp/uplift_env_logs");
  EXPECT_FALSE(config.file_config.format_json);
}

class LogInitTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
};

TEST_F(LogInitTest, InitAndShutdown) {
  LoggingConfig config;
  config.console_colors = false;
  init_logging(config);
  EXPECT_TRUE(is_logging_initialized());

  UPLIFT_LOG_INFO("init test" << kv("answer", 42));
  flush_logging();

  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LogInitTest, DoubleInitIsNoop) {
  init_logging_default();
  init_logging_default();
  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LogInitTest, ShutdownWithoutInitIsSafe) {
  EXPECT_NO_THROW(shutdown_logging());
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LogInitTest, ReconfigureKeepsLoggingUp) {
  init_logging_default();
  LoggingConfig config;
  config.console_level = severity_level::warn;
  reconfigure_logging(config);
  EXPECT_TRUE(is_logging_initialized());
}

TEST(KvTest, FormatsValues) {
  EXPECT_EQ(kv("count", 3), " count=3");
  EXPECT_EQ(kv("name", std::string("a.pdf")), " name=\"a.pdf\"");
  EXPECT_EQ(kv("name", "b.png"), " name=\"b.png\"");
  EXPECT_EQ(kv("name", static_cast<const char*>(nullptr)), " name=\"\"");
}

TEST(LogThrottleTest, SuppressesWithinInterval) {
  LogThrottle throttle;
  EXPECT_TRUE(throttle.should_log(60.0));
  EXPECT_FALSE(throttle.should_log(60.0));
  EXPECT_TRUE(throttle.should_log(0.0));
}

TEST(LogMacroTest, SamplingMacrosCompileAndRun) {
  for (int i = 0; i < 5; ++i) {
    UPLIFT_LOG_INFO_EVERY_N(2, "sampled" << kv("i", i));
    UPLIFT_LOG_WARN_THROTTLE(10.0, "throttled" << kv("i", i));
  }
  SUCCEED();
}
