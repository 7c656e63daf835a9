// Copyright (c) 2026 ArcheBase
// runlift is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef RUNLIFT_APP_CONFIG_PARSER_HPP
#define RUNLIFT_APP_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "runlift_config.hpp"

namespace runlift {
namespace logging {
struct LoggingConfig;
}
}  // namespace runlift

namespace runlift {
namespace app {

/**
 * Convert the YAML logging section into runlift::logging::LoggingConfig.
 * The file sink writes runlift.log.%Y-%m-%d into config.log_dir.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(
  const RunliftConfig& config, ::runlift::logging::LoggingConfig& log_config
);

/**
 * Fill Slack webhooks left empty in the file from SLACK_LOG_WEBHOOK and
 * SLACK_ALERT_WEBHOOK.
 */
void apply_env_fallbacks(RunliftConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, RunliftConfig& config);

  /**
   * Load configuration from YAML string.
   * Values of the wrong type fail the load; missing values are left for
   * validate() to report.
   */
  bool load_from_string(const std::string& yaml_content, RunliftConfig& config);

  /**
   * Validate configuration, collecting every problem into one message:
   *
   *   "2 errors found in config:\n\trequired parameter log_dir not defined\n\t..."
   */
  static bool validate(const RunliftConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_monitor(const YAML::Node& node, std::vector<MonitorSection>& sections);
  bool parse_s3(const YAML::Node& node, uploader::S3Config& s3);
  bool parse_slack(const YAML::Node& node, SlackConfig& slack);
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_CONFIG_PARSER_HPP
