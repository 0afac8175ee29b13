// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CLI_CONFIG_HPP
#define UPLIFT_CLI_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "local_transport.hpp"
#include "s3_transport.hpp"
#include "upload_queue.hpp"

namespace uplift {
namespace cli {

/**
 * Logging section as written in YAML. Levels and format stay strings until
 * convert_logging_config() maps them onto uplift::logging::LoggingConfig.
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/uplift";
  std::string file_pattern = "uplift_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // "json" or "text"
  uint64_t rotation_size_mb = 50;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

struct TransportSettings {
  std::string type = "local";  // "local" or "s3"
  transfer::LocalTransportConfig local;
  s3::S3Config s3;
};

struct UpliftConfig {
  LoggingSettings logging;
  transfer::QueueConfig queue;
  TransportSettings transport;

  std::chrono::milliseconds progress_interval{500};  // console progress line
  std::string report_path;                            // empty = no JSON report
};

}  // namespace cli
}  // namespace uplift

#endif  // UPLIFT_CLI_CONFIG_HPP
