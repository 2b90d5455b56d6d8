// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "flexlog_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

namespace flexlog {
namespace logging {

namespace {

constexpr const char* kResetColor = "\033[0m";

// Indexed by severity_level
constexpr const char* kLevelColors[] = {
  "\033[90m",  // trace
  "\033[36m",  // debug
  "\033[32m",  // info
  "\033[33m",  // warn
  "\033[31m",  // error
  "\033[35m",  // fatal
};

class ConsoleFormatter {
public:
  explicit ConsoleFormatter(bool use_colors)
      : use_colors_(use_colors) {}

  void operator()(
    const boost::log::record_view& rec, boost::log::formatting_ostream& strm
  ) const {
    strm << '[';
    if (auto stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
      strm << *stamp;
    }
    strm << "] ";

    if (auto level = boost::log::extract<severity_level>("Severity", rec)) {
      write_level(strm, *level);
    }

    strm << rec[boost::log::expressions::smessage];

    if (auto service = boost::log::extract<std::string>("ServiceType", rec)) {
      strm << " | service_type=" << *service;
    }
  }

private:
  void write_level(boost::log::formatting_ostream& strm, severity_level level) const {
    if (!use_colors_) {
      strm << '[' << level << "] ";
      return;
    }
    strm << get_color(level) << '[' << level << ']' << kResetColor << ' ';
  }

  bool use_colors_;
};

}  // namespace

const char* get_color(severity_level level) {
  const auto index = static_cast<std::size_t>(level);
  if (index >= sizeof(kLevelColors) / sizeof(kLevelColors[0])) {
    return "";
  }
  return kLevelColors[index];
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(ConsoleFormatter(use_colors));
  return sink;
}

}  // namespace logging
}  // namespace flexlog
