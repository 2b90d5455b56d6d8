// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "flexlog_log_init.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <vector>

#define FLEXLOG_LOG_COMPONENT "logging"
#include "flexlog_log_macros.hpp"

namespace flexlog {
namespace logging {

namespace {

struct LoggingState {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  // Every sink attached through this module, console included
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> sinks;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

struct LevelName {
  const char* name;
  severity_level level;
};

const LevelName kLevelNames[] = {
  {"trace", severity_level::trace}, {"debug", severity_level::debug},
  {"info", severity_level::info},   {"warn", severity_level::warn},
  {"warning", severity_level::warn}, {"error", severity_level::error},
  {"fatal", severity_level::fatal},
};

const char* const kTrueWords[] = {"true", "1", "yes", "on"};
const char* const kFalseWords[] = {"false", "0", "no", "off"};

template<std::size_t N>
bool matches_any(const std::string& value, const char* const (&words)[N]) {
  return std::any_of(std::begin(words), std::end(words), [&value](const char* word) {
    return boost::algorithm::iequals(value, word);
  });
}

std::optional<std::string> read_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void override_level(const char* variable, severity_level& level) {
  if (auto value = read_env(variable)) {
    if (auto parsed = parse_severity_level(*value)) {
      level = *parsed;
    }
  }
}

void override_flag(const char* variable, bool& flag) {
  if (auto value = read_env(variable)) {
    if (matches_any(*value, kTrueWords)) {
      flag = true;
    } else if (matches_any(*value, kFalseWords)) {
      flag = false;
    }
  }
}

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  for (const auto& entry : kLevelNames) {
    if (boost::algorithm::iequals(level_str, entry.name)) {
      return entry.level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  override_level("FLEXLOG_LOG_LEVEL", config.console_level);
  override_level("FLEXLOG_LOG_CONSOLE_LEVEL", config.console_level);
  override_flag("FLEXLOG_LOG_CONSOLE_ENABLED", config.console_enabled);
}

void init_logging(const LoggingConfig& config) {
  {
    LoggingState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.initialized) {
      return;
    }

    boost::log::add_common_attributes();

    if (config.console_enabled) {
      s.console = create_console_sink(config.console_level, config.console_colors);
      boost::log::core::get()->add_sink(s.console);
      s.sinks.push_back(s.console);
    }
    s.initialized = true;
  }

  FLEXLOG_LOG_DEBUG(
    "Diagnostic logging initialized"
    << kv("console", config.console_enabled ? "on" : "off")
    << kv("console_level", config.console_level)
  );
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  // stop() joins the feeding thread; flush() then drains what is left
  if (s.console) {
    s.console->stop();
    s.console->flush();
    s.console.reset();
  }

  auto core = boost::log::core::get();
  for (const auto& sink : s.sinks) {
    core->remove_sink(sink);
  }
  s.sinks.clear();
  s.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  boost::log::core::get()->add_sink(sink);
  s.sinks.push_back(std::move(sink));
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  boost::log::core::get()->remove_sink(sink);
  s.sinks.erase(std::remove(s.sinks.begin(), s.sinks.end(), sink), s.sinks.end());
}

void flush_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.console) {
    s.console->flush();
  }
}

void set_console_level(severity_level level) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.console) {
    s.console->set_filter(severity >= level);
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

}  // namespace logging
}  // namespace flexlog
