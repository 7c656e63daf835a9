// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_LOG_FORMAT_HPP
#define RUNLIFT_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

namespace runlift {
namespace logging {

// Attribute names shared by the macros, the scoped run helper and the sinks
constexpr const char* COMPONENT_ATTR = "Component";
constexpr const char* RUN_ID_ATTR = "RunID";

/**
 * One line of text:
 *
 *   [2026-01-05 10:12:01.532917] [INFO] [upload_engine] Beginning upload files=12 run_id=R1
 *
 * The severity tag is wrapped in ANSI colors when use_colors is set.
 */
void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * One JSON object per record with keys ts, level, component, msg, thread
 * and run_id. Keys whose attribute is absent are omitted.
 */
void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace runlift

#endif  // RUNLIFT_LOG_FORMAT_HPP
