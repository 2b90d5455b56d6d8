// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_LOG_INIT_HPP
#define FLEXLOG_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "flexlog_console_sink.hpp"
#include "flexlog_log_severity.hpp"

namespace flexlog {
namespace logging {

/**
 * Settings for the library's own diagnostic output.
 * Records of intercepted calls never pass through here; the host routes them.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;
};

/**
 * Level name to severity_level, case-insensitive.
 * Known names: trace, debug, info, warn, warning, error, fatal.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Overlay environment variables onto config:
 *
 *   FLEXLOG_LOG_LEVEL            console level
 *   FLEXLOG_LOG_CONSOLE_LEVEL    console level, applied after FLEXLOG_LOG_LEVEL
 *   FLEXLOG_LOG_CONSOLE_ENABLED  true/false, 1/0, yes/no, on/off
 *
 * Unset, empty or unparsable variables leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the sinks described by config. No-op while already initialized.
 */
void init_logging(const LoggingConfig& config);

void init_logging_default();

/**
 * Drain and detach every sink installed through this module.
 */
void shutdown_logging();

/**
 * Attach or detach an additional sink. Sinks added here are detached by shutdown_logging().
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Change the console threshold without recreating the sink.
 * Has no effect when the console sink is disabled.
 */
void set_console_level(severity_level level);

/**
 * Apply environment overrides to config, then shut down and initialize again.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace flexlog

#endif  // FLEXLOG_LOG_INIT_HPP
