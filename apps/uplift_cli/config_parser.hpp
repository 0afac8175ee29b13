// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CLI_CONFIG_PARSER_HPP
#define UPLIFT_CLI_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

#include "uplift_config.hpp"

namespace uplift {
namespace logging {
struct LoggingConfig;
}
}  // namespace uplift

namespace uplift {
namespace cli {

/**
 * Convert the YAML logging section to uplift::logging::LoggingConfig.
 * Unknown level names leave the library default in place.
 */
void convert_logging_config(const LoggingSettings& yaml_config, logging::LoggingConfig& log_config);

/**
 * Parse a byte size: a plain integer or a number with a KB/MB/GB or
 * KiB/MiB/GiB suffix ("512", "5MiB", "1.5 GB").
 */
std::optional<uint64_t> parse_byte_size(const std::string& text);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UpliftConfig& config);

  /**
   * Load configuration from YAML string. Keys that are absent keep the
   * values already in config.
   */
  bool load_from_string(const std::string& yaml_content, UpliftConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UpliftConfig& config, std::string& error_msg);

  /**
   * Validate the transport section
   */
  static bool validate_transport_config(const UpliftConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const { return last_error_; }

private:
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);
  bool parse_queue(const YAML::Node& node, transfer::QueueConfig& queue);
  bool parse_transfer(const YAML::Node& node, transfer::TransferConfig& transfer);
  bool parse_validation(const YAML::Node& node, transfer::ValidatorConfig& validation);
  bool parse_progress(const YAML::Node& node, UpliftConfig& config);
  bool parse_transport(const YAML::Node& node, TransportSettings& transport);
  bool parse_retry(const YAML::Node& node, transfer::RetryConfig& retry);
  bool parse_size(const YAML::Node& node, const std::string& field, uint64_t& out);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace uplift

#endif  // UPLIFT_CLI_CONFIG_PARSER_HPP
