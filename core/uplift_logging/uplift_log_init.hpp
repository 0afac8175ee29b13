// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_LOG_INIT_HPP
#define UPLIFT_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "uplift_console_sink.hpp"
#include "uplift_file_sink.hpp"
#include "uplift_log_severity.hpp"

namespace uplift {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (any case).
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 *   UPLIFT_LOG_LEVEL            - level for both sinks
 *   UPLIFT_LOG_CONSOLE_LEVEL    - console sink level
 *   UPLIFT_LOG_FILE_LEVEL       - file sink level
 *   UPLIFT_LOG_FILE_DIR         - log file directory
 *   UPLIFT_LOG_FORMAT           - file format, "json" or "text"
 *   UPLIFT_LOG_FILE_ENABLED     - "true" / "false"
 *   UPLIFT_LOG_CONSOLE_ENABLED  - "true" / "false"
 *
 * Invalid values are ignored and leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call without shutdown_logging()
 * in between is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop the async sink threads, drain pending records and detach all sinks.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void flush_logging();

/**
 * Shut down and reinitialize with config plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace uplift

#endif  // UPLIFT_LOG_INIT_HPP
