// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "runlift_console_sink.hpp"

#include <boost/log/expressions.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <unistd.h>

#include <iostream>

#include "runlift_log_format.hpp"

namespace runlift {
namespace logging {

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::cerr, boost::null_deleter()));
  backend->auto_flush(true);

  bool colors = use_colors && ::isatty(STDERR_FILENO) == 1;

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_text_record(rec, strm, colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace runlift
