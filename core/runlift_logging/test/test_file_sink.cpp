// Copyright (c) 2026 ArcheBase
// runlift is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for the rotating file sink and its formatters
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "runlift_file_sink.hpp"
#include "runlift_log_init.hpp"
#include "runlift_log_macros.hpp"

namespace fs = std::filesystem;

using namespace runlift::logging;

// ============================================================================
// File Sink Tests
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("runlift_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  // Concatenated contents of every regular file under the test directory
  std::string read_all_logs() const {
    std::string contents;
    for (const auto& entry : fs::recursive_directory_iterator(test_dir_)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::ifstream in(entry.path());
      std::stringstream buffer;
      buffer << in.rdbuf();
      contents += buffer.str();
    }
    return contents;
  }

  LoggingConfig file_only_config(bool json) const {
    LoggingConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_level = severity_level::info;
    config.file_config.directory = test_dir_.string();
    config.file_config.file_pattern = "runlift_test.log";
    config.file_config.format_json = json;
    return config;
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, DefaultConfigValues) {
  FileSinkConfig config;

  EXPECT_EQ(config.directory, "/var/log/runlift");
  EXPECT_EQ(config.file_pattern, "runlift.log.%Y-%m-%d");
  EXPECT_EQ(config.rotation_size_mb, 100u);
  EXPECT_TRUE(config.rotate_at_midnight);
  EXPECT_EQ(config.max_files, 5);
}

TEST_F(FileSinkTest, CreatesMissingDirectory) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested" / "logs").string();

  auto sink = create_file_sink(config, severity_level::debug);

  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::is_directory(test_dir_ / "nested" / "logs"));
}

TEST_F(FileSinkTest, UncreatableDirectoryThrows) {
  std::ofstream(test_dir_ / "not_a_dir") << "x";
  FileSinkConfig config;
  config.directory = (test_dir_ / "not_a_dir" / "logs").string();

  EXPECT_THROW(create_file_sink(config, severity_level::debug), std::runtime_error);
}

TEST_F(FileSinkTest, FailedInitLeavesLoggingDown) {
  std::ofstream(test_dir_ / "not_a_dir") << "x";
  LoggingConfig config = file_only_config(false);
  config.console_enabled = true;
  config.file_config.directory = (test_dir_ / "not_a_dir" / "logs").string();

  EXPECT_THROW(init_logging(config), std::runtime_error);
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(FileSinkTest, TextFormatWritesMessageAndRunId) {
  init_logging(file_only_config(false));
  {
    RUNLIFT_LOG_SCOPED_RUN("240101_M0001_0001_A");
    RUNLIFT_LOG_INFO("Run uploaded" << kv("files", 3));
  }
  shutdown_logging();

  std::string logs = read_all_logs();
  EXPECT_NE(logs.find("[INFO] [runlift] Run uploaded files=3"), std::string::npos);
  EXPECT_NE(logs.find("run_id=240101_M0001_0001_A"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatEscapesMessage) {
  init_logging(file_only_config(true));
  RUNLIFT_LOG_ERROR("Upload failed" << kv("path", std::string("/data/run/a.bin")));
  shutdown_logging();

  std::string logs = read_all_logs();
  EXPECT_NE(logs.find("\"level\":\"ERROR\""), std::string::npos);
  EXPECT_NE(logs.find("\"component\":\"runlift\""), std::string::npos);
  EXPECT_NE(logs.find("path=\\\"/data/run/a.bin\\\""), std::string::npos);
}

TEST_F(FileSinkTest, RecordsBelowLevelAreFiltered) {
  init_logging(file_only_config(false));
  RUNLIFT_LOG_DEBUG("filtered-debug-line");
  RUNLIFT_LOG_WARN("kept-warn-line");
  shutdown_logging();

  std::string logs = read_all_logs();
  EXPECT_EQ(logs.find("filtered-debug-line"), std::string::npos);
  EXPECT_NE(logs.find("kept-warn-line"), std::string::npos);
}
