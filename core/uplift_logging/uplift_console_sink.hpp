// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CONSOLE_SINK_HPP
#define UPLIFT_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "uplift_log_severity.hpp"

namespace uplift {
namespace logging {

/**
 * Async console sink. Records beyond the queue bound are dropped so upload
 * workers never block on terminal output.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the console sink writing to std::clog.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Wrap the level tag in ANSI color codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace uplift

#endif  // UPLIFT_CONSOLE_SINK_HPP
