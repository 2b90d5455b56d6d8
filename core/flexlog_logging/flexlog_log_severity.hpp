// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_LOG_SEVERITY_HPP
#define FLEXLOG_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace flexlog {
namespace logging {

/**
 * Used both for diagnostic records and for the levels carried by interception
 * decisions. Ordered from most to least verbose.
 */
enum class severity_level { trace = 0, debug = 1, info = 2, warn = 3, error = 4, fatal = 5 };

/**
 * Upper-case name, or nullptr for a value outside the enum.
 */
inline const char* severity_name(severity_level level) {
  static const char* const names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  const auto index = static_cast<std::size_t>(level);
  return index < sizeof(names) / sizeof(names[0]) ? names[index] : nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = severity_name(level)) {
    return strm << name;
  }
  return strm << static_cast<int>(level);
}

inline severity_level more_verbose(severity_level a, severity_level b) {
  return a <= b ? a : b;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace flexlog

#endif  // FLEXLOG_LOG_SEVERITY_HPP
