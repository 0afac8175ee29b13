// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_FILE_SINK_HPP
#define UPLIFT_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "uplift_log_severity.hpp"

namespace uplift {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/uplift";
  std::string file_pattern = "uplift_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;
};

/**
 * Create an async rotating file sink.
 *
 * The directory is created when missing; if that fails the sink falls back
 * to /tmp. Files rotate by size and optionally at midnight, and the collector
 * keeps at most max_files old files.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace uplift

#endif  // UPLIFT_FILE_SINK_HPP
