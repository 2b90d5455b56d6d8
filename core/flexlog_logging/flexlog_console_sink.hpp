// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FLEXLOG_CONSOLE_SINK_HPP
#define FLEXLOG_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstddef>

#include "flexlog_log_severity.hpp"

namespace flexlog {
namespace logging {

constexpr std::size_t kConsoleQueueCapacity = 1024;

// Records past kConsoleQueueCapacity are dropped rather than blocking the caller
using async_console_sink_t = boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<kConsoleQueueCapacity, boost::log::sinks::drop_on_overflow>>;

const char* get_color(severity_level level);

/**
 * Builds (but does not register) an asynchronous sink that writes to std::clog.
 *
 * Line layout: `[<timestamp>] [<LEVEL>] <message>[ | service_type=<name>]`.
 * With use_colors the level tag is wrapped in the escape from get_color().
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace flexlog

#endif  // FLEXLOG_CONSOLE_SINK_HPP
