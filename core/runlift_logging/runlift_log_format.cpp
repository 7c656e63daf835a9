// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "runlift_log_format.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <nlohmann/json.hpp>

#include <sstream>

#include "runlift_log_severity.hpp"

namespace runlift {
namespace logging {

namespace {

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[1;31m";
  }
  return "";
}

std::string timestamp_of(boost::log::record_view const& rec) {
  auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (!ts) {
    return std::string();
  }
  std::string iso = boost::posix_time::to_iso_extended_string(*ts);
  auto t = iso.find('T');
  if (t != std::string::npos) {
    iso[t] = ' ';
  }
  return iso;
}

std::string thread_of(boost::log::record_view const& rec) {
  auto tid =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (!tid) {
    return std::string();
  }
  std::ostringstream oss;
  oss << *tid;
  return oss.str();
}

}  // namespace

void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[" << timestamp_of(rec) << "] ";

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]\033[0m ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  if (auto component = boost::log::extract<std::string>(COMPONENT_ATTR, rec)) {
    strm << "[" << *component << "] ";
  }

  strm << rec[boost::log::expressions::smessage];

  if (auto run_id = boost::log::extract<std::string>(RUN_ID_ATTR, rec)) {
    strm << " run_id=" << *run_id;
  }
}

void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;
  line["ts"] = timestamp_of(rec);

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    std::ostringstream level;
    level << *sev;
    line["level"] = level.str();
  }
  if (auto component = boost::log::extract<std::string>(COMPONENT_ATTR, rec)) {
    line["component"] = *component;
  }

  auto message = rec[boost::log::expressions::smessage];
  line["msg"] = message ? message.get() : std::string();

  std::string thread = thread_of(rec);
  if (!thread.empty()) {
    line["thread"] = thread;
  }
  if (auto run_id = boost::log::extract<std::string>(RUN_ID_ATTR, rec)) {
    line["run_id"] = *run_id;
  }

  // Paths on disk are not guaranteed to be valid UTF-8
  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace runlift
