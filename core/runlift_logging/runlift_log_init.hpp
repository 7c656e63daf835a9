// Copyright (c) 2026 ArcheBase
// runlift is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef RUNLIFT_LOG_INIT_HPP
#define RUNLIFT_LOG_INIT_HPP

#include <optional>
#include <string>

#include "runlift_console_sink.hpp"
#include "runlift_file_sink.hpp"
#include "runlift_log_severity.hpp"

namespace runlift {
namespace logging {

/**
 * Logging configuration for runlift.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   RUNLIFT_LOG_LEVEL            - Global level (overrides both console and file)
 *   RUNLIFT_LOG_CONSOLE_LEVEL    - Console sink level
 *   RUNLIFT_LOG_FILE_LEVEL       - File sink level
 *   RUNLIFT_LOG_FILE_DIR         - Log file directory
 *   RUNLIFT_LOG_FORMAT           - File format ("json" or "text")
 *   RUNLIFT_LOG_FILE_ENABLED     - Enable file logging ("true" or "false")
 *   RUNLIFT_LOG_CONSOLE_ENABLED  - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize logging (console and file sinks).
 * A second call is ignored until shutdown_logging() runs.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize console-only logging at INFO.
 */
void init_logging_default();

/**
 * Stop async sink threads and flush pending records.
 */
void shutdown_logging();

/**
 * Flush all sinks.
 */
void flush_logging();

/**
 * Shut down the current sinks and initialize again with config.
 * Environment variable overrides are applied automatically.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace runlift

#endif  // RUNLIFT_LOG_INIT_HPP
