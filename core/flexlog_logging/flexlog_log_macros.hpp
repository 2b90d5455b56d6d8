// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_LOG_MACROS_HPP
#define FLEXLOG_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "flexlog_log_severity.hpp"

namespace flexlog {
namespace logging {

using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Process-wide logger shared by every component
logger_type& get_logger();

namespace detail {

inline std::string format_field(const char* name, const std::string& text, bool quoted) {
  std::string out;
  out.reserve(text.size() + 8);
  out += ' ';
  out += name;
  out += quoted ? "=\"" : "=";
  out += text;
  if (quoted) {
    out += '"';
  }
  return out;
}

}  // namespace detail

/**
 * Render one ` name=value` field for a log line. Strings are quoted.
 *
 *   FLEXLOG_LOG_DEBUG("Registered" << kv("type", name) << kv("methods", n));
 */
template<typename T>
std::string kv(const char* name, const T& value) {
  std::ostringstream text;
  text << value;
  return detail::format_field(name, text.str(), false);
}

inline std::string kv(const char* name, const std::string& value) {
  return detail::format_field(name, value, true);
}

inline std::string kv(const char* name, const char* value) {
  return detail::format_field(name, value, true);
}

}  // namespace logging
}  // namespace flexlog

// Each translation unit names itself before including this header:
//
//   #define FLEXLOG_LOG_COMPONENT "decision_cache"
//   #include "flexlog_log_macros.hpp"
#ifndef FLEXLOG_LOG_COMPONENT
#define FLEXLOG_LOG_COMPONENT "flexlog"
#endif

// TRACE and DEBUG vanish from NDEBUG builds
#ifdef NDEBUG
#define FLEXLOG_LOG_ENABLE_DEBUG 0
#else
#define FLEXLOG_LOG_ENABLE_DEBUG 1
#endif

#define FLEXLOG_LOG_RECORD(level, msg)                                                     \
  BOOST_LOG_SEV(::flexlog::logging::get_logger(), ::flexlog::logging::severity_level::level) \
    << "[" << FLEXLOG_LOG_COMPONENT << "] " << msg

#define FLEXLOG_LOG_TRACE(msg)          \
  do {                                  \
    if (FLEXLOG_LOG_ENABLE_DEBUG) {     \
      FLEXLOG_LOG_RECORD(trace, msg);   \
    }                                   \
  } while (0)

#define FLEXLOG_LOG_DEBUG(msg)          \
  do {                                  \
    if (FLEXLOG_LOG_ENABLE_DEBUG) {     \
      FLEXLOG_LOG_RECORD(debug, msg);   \
    }                                   \
  } while (0)

#define FLEXLOG_LOG_INFO(msg) do { FLEXLOG_LOG_RECORD(info, msg); } while (0)
#define FLEXLOG_LOG_WARN(msg) do { FLEXLOG_LOG_RECORD(warn, msg); } while (0)
#define FLEXLOG_LOG_ERROR(msg) do { FLEXLOG_LOG_RECORD(error, msg); } while (0)
#define FLEXLOG_LOG_FATAL(msg) do { FLEXLOG_LOG_RECORD(fatal, msg); } while (0)

// Tags every record emitted on this thread until the enclosing scope ends.
// The console sink appends it as " | service_type=<name>".
#define FLEXLOG_LOG_SCOPED_SERVICE(service_type_name) \
  BOOST_LOG_SCOPED_THREAD_ATTR(                       \
    "ServiceType", boost::log::attributes::constant<std::string>(service_type_name))

// At most one DEBUG record per call site per interval_sec seconds.
// Compiled out together with DEBUG records.
#define FLEXLOG_LOG_DEBUG_THROTTLE(interval_sec, msg)                                    \
  do {                                                                                   \
    if (FLEXLOG_LOG_ENABLE_DEBUG) {                                                      \
      static std::mutex flexlog_throttle_mutex_;                                         \
      static std::chrono::steady_clock::time_point flexlog_throttle_next_{};             \
      bool flexlog_throttle_emit_ = false;                                               \
      {                                                                                  \
        const auto flexlog_throttle_now_ = std::chrono::steady_clock::now();             \
        std::lock_guard<std::mutex> flexlog_throttle_lock_(flexlog_throttle_mutex_);     \
        if (flexlog_throttle_now_ >= flexlog_throttle_next_) {                           \
          flexlog_throttle_next_ =                                                       \
            flexlog_throttle_now_ +                                                      \
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(            \
              std::chrono::duration<double>(interval_sec)                                \
            );                                                                           \
          flexlog_throttle_emit_ = true;                                                 \
        }                                                                                \
      }                                                                                  \
      if (flexlog_throttle_emit_) {                                                      \
        FLEXLOG_LOG_RECORD(debug, msg);                                                  \
      }                                                                                  \
    }                                                                                    \
  } while (0)

#endif  // FLEXLOG_LOG_MACROS_HPP
