// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Unit tests for logging initialization and environment overrides
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "runlift_log_init.hpp"
#include "runlift_log_macros.hpp"
#include "runlift_log_severity.hpp"

using namespace runlift::logging;

namespace {

const char* const kEnvVars[] = {
  "RUNLIFT_LOG_LEVEL",
  "RUNLIFT_LOG_CONSOLE_LEVEL",
  "RUNLIFT_LOG_FILE_LEVEL",
  "RUNLIFT_LOG_FILE_DIR",
  "RUNLIFT_LOG_FORMAT",
  "RUNLIFT_LOG_FILE_ENABLED",
  "RUNLIFT_LOG_CONSOLE_ENABLED",
};

void clear_env() {
  for (const char* name : kEnvVars) {
    unsetenv(name);
  }
}

}  // namespace

// ============================================================================
// Severity Level Tests
// ============================================================================

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
  EXPECT_EQ(parse_severity_level("InFo"), severity_level::info);
  EXPECT_EQ(parse_severity_level("WaRnInG"), severity_level::warn);
}

TEST(SeverityLevelTest, ParseInvalidLevels) {
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level(" debug ").has_value());
  EXPECT_FALSE(parse_severity_level("deb").has_value());
}

TEST(SeverityLevelTest, OutputStream) {
  std::ostringstream oss;
  oss << severity_level::debug << " " << severity_level::warn << " " << severity_level::fatal;
  EXPECT_EQ(oss.str(), "DEBUG WARN FATAL");
}

TEST(SeverityLevelTest, OutputStreamOutOfRange) {
  std::ostringstream oss;
  oss << static_cast<severity_level>(42);
  EXPECT_EQ(oss.str(), "42");
}

// ============================================================================
// Environment Override Tests
// ============================================================================

class LoggingConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_env();
  }

  void TearDown() override {
    clear_env();
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
};

TEST_F(LoggingConfigTest, DefaultConfigValues) {
  LoggingConfig config;

  EXPECT_TRUE(config.console_enabled);
  EXPECT_TRUE(config.console_colors);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_EQ(config.file_config.directory, "/var/log/runlift");
  EXPECT_EQ(config.file_config.max_files, 5);
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, GlobalLevelAppliesToBothSinks) {
  LoggingConfig config;
  setenv("RUNLIFT_LOG_LEVEL", "warn", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::warn);
  EXPECT_EQ(config.file_level, severity_level::warn);
}

TEST_F(LoggingConfigTest, SinkLevelWinsOverGlobalLevel) {
  LoggingConfig config;
  setenv("RUNLIFT_LOG_LEVEL", "warn", 1);
  setenv("RUNLIFT_LOG_CONSOLE_LEVEL", "error", 1);
  setenv("RUNLIFT_LOG_FILE_LEVEL", "debug", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(LoggingConfigTest, FileDirectoryAndFormat) {
  LoggingConfig config;
  setenv("RUNLIFT_LOG_FILE_DIR", "/tmp/runlift_logs", 1);
  setenv("RUNLIFT_LOG_FORMAT", "JSON", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.file_config.directory, "/tmp/runlift_logs");
  EXPECT_TRUE(config.file_config.format_json);

  setenv("RUNLIFT_LOG_FORMAT", "text", 1);
  apply_env_overrides(config);
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, EnableDisableSinks) {
  LoggingConfig config;
  setenv("RUNLIFT_LOG_FILE_ENABLED", "yes", 1);
  setenv("RUNLIFT_LOG_CONSOLE_ENABLED", "off", 1);

  apply_env_overrides(config);

  EXPECT_TRUE(config.file_enabled);
  EXPECT_FALSE(config.console_enabled);
}

TEST_F(LoggingConfigTest, InvalidValuesKeepCurrentSettings) {
  LoggingConfig config;
  config.console_enabled = false;
  setenv("RUNLIFT_LOG_LEVEL", "loud", 1);
  setenv("RUNLIFT_LOG_CONSOLE_ENABLED", "maybe", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_FALSE(config.console_enabled);
}

TEST_F(LoggingConfigTest, EmptyVariableIsIgnored) {
  LoggingConfig config;
  setenv("RUNLIFT_LOG_LEVEL", "", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
}

// ============================================================================
// Initialization Tests
// ============================================================================

class LoggingInitTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_env();
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

TEST_F(LoggingInitTest, InitDefault) {
  EXPECT_FALSE(is_logging_initialized());
  init_logging_default();
  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingInitTest, DoubleInitIsIgnored) {
  LoggingConfig config;
  config.console_colors = false;

  init_logging(config);
  init_logging(config);
  EXPECT_TRUE(is_logging_initialized());

  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, InitShutdownCycles) {
  for (int i = 0; i < 3; ++i) {
    init_logging_default();
    EXPECT_TRUE(is_logging_initialized());
    shutdown_logging();
    EXPECT_FALSE(is_logging_initialized());
  }
}

TEST_F(LoggingInitTest, ReconfigureReplacesSinks) {
  init_logging_default();

  LoggingConfig config;
  config.console_level = severity_level::debug;
  reconfigure_logging(config);

  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingInitTest, ShutdownAndFlushWithoutInitAreSafe) {
  EXPECT_NO_THROW(shutdown_logging());
  EXPECT_NO_THROW(flush_logging());
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, MacrosLogThroughGlobalLogger) {
  init_logging_default();

  RUNLIFT_LOG_INFO("Upload finished" << kv("run_id", std::string("240101_A")) << kv("files", 3));
  RUNLIFT_LOG_WARN("Slow transfer" << kv("path", "/data/a.bin"));
  for (int i = 0; i < 10; ++i) {
    RUNLIFT_LOG_INFO_EVERY_N(5, "Sampled" << kv("i", i));
  }

  EXPECT_NO_THROW(flush_logging());
}

TEST(KeyValueTest, FormatsValues) {
  EXPECT_EQ(kv("files", 3), " files=3");
  EXPECT_EQ(kv("run_id", std::string("r1")), " run_id=\"r1\"");
  EXPECT_EQ(kv("bucket", "b"), " bucket=\"b\"");
}
