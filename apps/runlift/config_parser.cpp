// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>

#define RUNLIFT_LOG_COMPONENT "config_parser"
#include <runlift_log_init.hpp>
#include <runlift_log_macros.hpp>

namespace runlift {
namespace app {

namespace {

bool regex_compiles(const std::string& pattern) {
  try {
    std::regex re(pattern);
    return true;
  } catch (const std::regex_error&) {
    return false;
  }
}

void fill_from_env(std::string& value, const char* name) {
  if (!value.empty()) {
    return;
  }
  const char* env = std::getenv(name);
  if (env && env[0] != '\0') {
    value = env;
  }
}

}  // namespace

void convert_logging_config(
  const RunliftConfig& config, ::runlift::logging::LoggingConfig& log_config
) {
  const LoggingSettings& settings = config.logging;

  log_config.console_enabled = settings.console_enabled;
  log_config.console_colors = settings.console_colors;
  if (auto level = ::runlift::logging::parse_severity_level(settings.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = settings.file_enabled && !config.log_dir.empty();
  if (auto level = ::runlift::logging::parse_severity_level(settings.file_level)) {
    log_config.file_level = *level;
  }
  log_config.file_config.directory = config.log_dir;
  log_config.file_config.file_pattern = "runlift.log.%Y-%m-%d";
  log_config.file_config.format_json = (settings.file_format == "json");
  log_config.file_config.rotation_size_mb = settings.rotation_size_mb;
  log_config.file_config.max_files = settings.max_files;
  log_config.file_config.rotate_at_midnight = settings.rotate_at_midnight;
}

void apply_env_fallbacks(RunliftConfig& config) {
  fill_from_env(config.slack.log_webhook, "SLACK_LOG_WEBHOOK");
  fill_from_env(config.slack.alert_webhook, "SLACK_ALERT_WEBHOOK");
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, RunliftConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, RunliftConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (!node.IsDefined() || node.IsNull()) {
      // Empty document: everything required is reported by validate()
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Config root must be a mapping";
      return false;
    }

    if (node["log_dir"]) {
      config.log_dir = node["log_dir"].as<std::string>();
    }

    // max_cores / max_threads are the names used by older configs
    if (node["max_cores"]) {
      config.max_workers = node["max_cores"].as<int>();
    }
    if (node["max_workers"]) {
      config.max_workers = node["max_workers"].as<int>();
    }
    if (node["max_threads"]) {
      config.max_tasks = node["max_threads"].as<int>();
    }
    if (node["max_tasks"]) {
      config.max_tasks = node["max_tasks"].as<int>();
    }

    if (node["run_markers"]) {
      config.run_markers = node["run_markers"].as<std::vector<std::string>>();
    }
    if (node["completion_markers"]) {
      config.completion_markers = node["completion_markers"].as<std::vector<std::string>>();
    }

    if (node["monitor"] && !parse_monitor(node["monitor"], config.monitor)) {
      return false;
    }
    if (node["s3"] && !parse_s3(node["s3"], config.s3)) {
      return false;
    }
    if (node["slack"] && !parse_slack(node["slack"], config.slack)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_monitor(const YAML::Node& node, std::vector<MonitorSection>& sections) {
  if (!node.IsSequence()) {
    last_error_ = "monitor must be a sequence of sections";
    return false;
  }

  sections.clear();
  for (const auto& section_node : node) {
    MonitorSection section;
    if (section_node["monitored_directories"]) {
      section.monitored_directories =
        section_node["monitored_directories"].as<std::vector<std::string>>();
    }
    if (section_node["bucket"]) {
      section.bucket = section_node["bucket"].as<std::string>();
    }
    if (section_node["remote_path"]) {
      section.remote_path = section_node["remote_path"].as<std::string>();
    }
    if (section_node["exclude_patterns"]) {
      section.exclude_patterns = section_node["exclude_patterns"].as<std::vector<std::string>>();
    }
    if (section_node["run_name_pattern"]) {
      section.run_name_pattern = section_node["run_name_pattern"].as<std::string>();
    }
    sections.push_back(section);
  }
  return true;
}

bool ConfigParser::parse_s3(const YAML::Node& node, uploader::S3Config& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["part_size_mb"]) {
    s3.part_size = node["part_size_mb"].as<uint64_t>() * 1024 * 1024;
  }
  if (node["executor_thread_count"]) {
    s3.executor_thread_count = node["executor_thread_count"].as<int>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_slack(const YAML::Node& node, SlackConfig& slack) {
  if (node["log_webhook"]) {
    slack.log_webhook = node["log_webhook"].as<std::string>();
  }
  if (node["alert_webhook"]) {
    slack.alert_webhook = node["alert_webhook"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const RunliftConfig& config, std::string& error_msg) {
  std::vector<std::string> errors;

  if (config.max_workers <= 0) {
    errors.push_back("max_workers must be a positive integer");
  }
  if (config.max_tasks <= 0) {
    errors.push_back("max_tasks must be a positive integer");
  }

  if (config.log_dir.empty()) {
    errors.push_back("required parameter log_dir not defined");
  }

  if (config.monitor.empty()) {
    errors.push_back("required parameter monitor not defined");
  }

  if (config.run_markers.empty()) {
    errors.push_back("run_markers must name at least one file");
  }
  if (config.completion_markers.empty()) {
    errors.push_back("completion_markers must name at least one file");
  }

  for (size_t idx = 0; idx < config.monitor.size(); ++idx) {
    const MonitorSection& section = config.monitor[idx];
    std::string suffix = " missing from monitor section " + std::to_string(idx);

    if (section.monitored_directories.empty()) {
      errors.push_back("required parameter monitored_directories" + suffix);
    }
    if (section.bucket.empty()) {
      errors.push_back("required parameter bucket" + suffix);
    }
    if (section.remote_path.empty()) {
      errors.push_back("required parameter remote_path" + suffix);
    }

    for (const auto& pattern : section.exclude_patterns) {
      if (!regex_compiles(pattern)) {
        errors.push_back(
          "invalid exclude pattern '" + pattern + "' in monitor section " + std::to_string(idx)
        );
      }
    }
    if (!section.run_name_pattern.empty() && !regex_compiles(section.run_name_pattern)) {
      errors.push_back(
        "invalid run_name_pattern '" + section.run_name_pattern + "' in monitor section " +
        std::to_string(idx)
      );
    }
  }

  if (errors.empty()) {
    RUNLIFT_LOG_DEBUG("Config valid");
    return true;
  }

  error_msg = std::to_string(errors.size()) + " errors found in config:";
  for (const auto& error : errors) {
    error_msg += "\n\t" + error;
  }
  return false;
}

}  // namespace app
}  // namespace runlift
