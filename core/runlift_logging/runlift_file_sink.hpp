// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_FILE_SINK_HPP
#define RUNLIFT_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "runlift_log_severity.hpp"

namespace runlift {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * Daily log file in the runlift log directory, next to the uploads/ state
 * records. Older files beyond max_files are removed by the collector.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/runlift";
  std::string file_pattern = "runlift.log.%Y-%m-%d";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 5;
  bool format_json = false;
};

/**
 * Create the rotating file sink, creating config.directory if needed.
 *
 * @throws std::runtime_error if the directory cannot be created
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace runlift

#endif  // RUNLIFT_FILE_SINK_HPP
