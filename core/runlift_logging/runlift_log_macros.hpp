// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_LOG_MACROS_HPP
#define RUNLIFT_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "runlift_log_format.hpp"
#include "runlift_log_severity.hpp"

namespace runlift {
namespace logging {

// Global severity logger type. The multi-threaded logger is required because
// upload workers log concurrently.
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in runlift_log_init.cpp
 */
logger_type& get_logger();

/**
 * Simple key-value formatter for structured logging.
 * Usage: RUNLIFT_LOG_INFO("message" << kv("key", value));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted
template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace runlift

// =============================================================================
// Component identification
// Define RUNLIFT_LOG_COMPONENT before including this header:
//
//   #define RUNLIFT_LOG_COMPONENT "upload_engine"
//   #include <runlift_log_macros.hpp>
// =============================================================================
#ifndef RUNLIFT_LOG_COMPONENT
#define RUNLIFT_LOG_COMPONENT "runlift"
#endif

// DEBUG logs are compiled out of release builds
#ifdef NDEBUG
#define RUNLIFT_LOG_ENABLE_DEBUG 0
#else
#define RUNLIFT_LOG_ENABLE_DEBUG 1
#endif

// The component travels as a record attribute so sinks can place it
#define RUNLIFT_LOG_SEV(level, msg)                                                          \
  BOOST_LOG_SEV(::runlift::logging::get_logger(), ::runlift::logging::severity_level::level) \
    << ::boost::log::add_value(                                                             \
         ::runlift::logging::COMPONENT_ATTR, std::string(RUNLIFT_LOG_COMPONENT)             \
       )                                                                                    \
    << msg

#define RUNLIFT_LOG_DEBUG(msg)         \
  do {                                 \
    if (RUNLIFT_LOG_ENABLE_DEBUG) {    \
      RUNLIFT_LOG_SEV(debug, msg);     \
    }                                  \
  } while (0)

#define RUNLIFT_LOG_INFO(msg)   \
  do {                          \
    RUNLIFT_LOG_SEV(info, msg); \
  } while (0)

#define RUNLIFT_LOG_WARN(msg)   \
  do {                          \
    RUNLIFT_LOG_SEV(warn, msg); \
  } while (0)

#define RUNLIFT_LOG_ERROR(msg)   \
  do {                           \
    RUNLIFT_LOG_SEV(error, msg); \
  } while (0)

#define RUNLIFT_LOG_FATAL(msg)   \
  do {                           \
    RUNLIFT_LOG_SEV(fatal, msg); \
  } while (0)

// =============================================================================
// Run context using scoped attributes
// Usage: RUNLIFT_LOG_SCOPED_RUN(run.run_id);
// The RunID attribute is cleared when the scope exits
// =============================================================================
#define RUNLIFT_LOG_SCOPED_RUN(run_id_val)                        \
  BOOST_LOG_SCOPED_THREAD_ATTR(                                   \
    ::runlift::logging::RUN_ID_ATTR,                              \
    ::boost::log::attributes::constant<std::string>(run_id_val)   \
  )

// =============================================================================
// Count-based sampling: log every Nth occurrence at a call site.
// Usage: RUNLIFT_LOG_DEBUG_EVERY_N(500, "Uploaded files" << kv("count", n));
// =============================================================================
#define RUNLIFT_LOG_DEBUG_EVERY_N(n, msg)                  \
  do {                                                     \
    static std::atomic<uint64_t> _runlift_log_counter{0}; \
    if ((++_runlift_log_counter % (n)) == 1) {             \
      RUNLIFT_LOG_DEBUG(msg);                              \
    }                                                      \
  } while (0)

#define RUNLIFT_LOG_INFO_EVERY_N(n, msg)                   \
  do {                                                     \
    static std::atomic<uint64_t> _runlift_log_counter{0}; \
    if ((++_runlift_log_counter % (n)) == 1) {             \
      RUNLIFT_LOG_INFO(msg);                               \
    }                                                      \
  } while (0)

#endif  // RUNLIFT_LOG_MACROS_HPP
