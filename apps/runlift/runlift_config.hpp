// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_CONFIG_HPP
#define RUNLIFT_APP_CONFIG_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "s3_client.hpp"

namespace runlift {
namespace app {

/**
 * One monitored location: the directories scanned for runs and where their
 * files go in S3.
 */
struct MonitorSection {
  std::vector<std::string> monitored_directories;
  std::string bucket;
  std::string remote_path;
  std::vector<std::string> exclude_patterns;
  std::string run_name_pattern;  // Empty accepts every run
};

struct SlackConfig {
  std::string log_webhook;    // Run summaries
  std::string alert_webhook;  // Setup errors and failed runs
};

/**
 * Logging section as written in YAML. Levels stay strings here and are
 * parsed when converted to runlift::logging::LoggingConfig.
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = true;
  std::string file_level = "debug";
  std::string file_format = "text";
  uint64_t rotation_size_mb = 100;
  int max_files = 5;
  bool rotate_at_midnight = true;
};

inline int default_worker_count() {
  return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

/**
 * Complete monitor configuration, built once at startup.
 */
struct RunliftConfig {
  std::string log_dir;
  int max_workers = default_worker_count();
  int max_tasks = 4;

  std::vector<std::string> run_markers = {"RunInfo.xml"};
  std::vector<std::string> completion_markers = {
    "CopyComplete.txt", "RTAComplete.txt", "RTAComplete.xml"
  };

  uploader::S3Config s3;
  SlackConfig slack;
  LoggingSettings logging;

  std::vector<MonitorSection> monitor;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_CONFIG_HPP
