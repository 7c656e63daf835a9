// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "runlift_file_sink.hpp"

#include <boost/log/expressions.hpp>
#include <boost/filesystem.hpp>
#include <boost/make_shared.hpp>

#include <stdexcept>

#include "runlift_log_format.hpp"

namespace runlift {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

boost::filesystem::path ensure_log_directory(const std::string& directory) {
  boost::filesystem::path dir(directory);
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + directory + ": " + ec.message());
  }
  return dir;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  boost::filesystem::path dir = ensure_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = (dir / config.file_pattern).string(),
    keywords::open_mode = std::ios_base::out | std::ios_base::app,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  // Retention also covers files left by earlier processes
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = dir, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json_record);
  } else {
    sink->set_formatter(
      [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
        format_text_record(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace runlift
