// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "runlift_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "runlift_log_macros.hpp"

namespace runlift {
namespace logging {

namespace {

struct SinkRegistry {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<bool> parse_flag(const std::string& s) {
  std::string v = lowercase(s);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    return false;
  }
  return std::nullopt;
}

// Remove the sink from the core and drain its queue
template <typename SinkPtr>
void detach(SinkPtr& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

struct EnvOverride {
  const char* name;
  std::function<void(const std::string&, LoggingConfig&)> apply;
};

// Applied in order, so per-sink levels win over RUNLIFT_LOG_LEVEL
const std::vector<EnvOverride>& env_overrides() {
  static const std::vector<EnvOverride> table = {
    {"RUNLIFT_LOG_LEVEL",
     [](const std::string& v, LoggingConfig& c) {
       if (auto level = parse_severity_level(v)) {
         c.console_level = *level;
         c.file_level = *level;
       }
     }},
    {"RUNLIFT_LOG_CONSOLE_LEVEL",
     [](const std::string& v, LoggingConfig& c) {
       if (auto level = parse_severity_level(v)) {
         c.console_level = *level;
       }
     }},
    {"RUNLIFT_LOG_FILE_LEVEL",
     [](const std::string& v, LoggingConfig& c) {
       if (auto level = parse_severity_level(v)) {
         c.file_level = *level;
       }
     }},
    {"RUNLIFT_LOG_CONSOLE_ENABLED",
     [](const std::string& v, LoggingConfig& c) {
       c.console_enabled = parse_flag(v).value_or(c.console_enabled);
     }},
    {"RUNLIFT_LOG_FILE_ENABLED",
     [](const std::string& v, LoggingConfig& c) {
       c.file_enabled = parse_flag(v).value_or(c.file_enabled);
     }},
    {"RUNLIFT_LOG_FILE_DIR",
     [](const std::string& v, LoggingConfig& c) {
       c.file_config.directory = v;
     }},
    {"RUNLIFT_LOG_FORMAT",
     [](const std::string& v, LoggingConfig& c) {
       c.file_config.format_json = lowercase(v) == "json";
     }},
  };
  return table;
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> names[] = {
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warn", severity_level::warn},
    {"warning", severity_level::warn},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal},
  };

  std::string wanted = lowercase(level_str);
  for (const auto& [name, level] : names) {
    if (wanted == name) {
      return level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : env_overrides()) {
    const char* value = std::getenv(entry.name);
    if (value && value[0] != '\0') {
      entry.apply(value, config);
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  // Build both sinks before touching the core so a bad log directory
  // leaves logging untouched
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  if (config.console_enabled) {
    console = create_console_sink(config.console_level, config.console_colors);
  }
  if (config.file_enabled) {
    file = create_file_sink(config.file_config, config.file_level);
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();
  if (console) {
    core->add_sink(console);
  }
  if (file) {
    core->add_sink(file);
  }

  reg.console = console;
  reg.file = file;
  reg.initialized = true;
}

void init_logging_default() {
  LoggingConfig config;
  apply_env_overrides(config);
  // The log directory is only known once the config has been read
  config.file_enabled = false;
  init_logging(config);
}

void shutdown_logging() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }
  detach(reg.console);
  detach(reg.file);
  reg.initialized = false;
}

void flush_logging() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console) {
    reg.console->flush();
  }
  if (reg.file) {
    reg.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace runlift
