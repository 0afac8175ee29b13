// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CLI_OPTIONS_HPP
#define UPLIFT_CLI_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "uplift_config.hpp"

namespace uplift {
namespace cli {

/**
 * Command-line flags. Unset flags leave the configuration file values alone.
 */
struct CliOptions {
  std::string config_file;
  std::optional<int> priority;
  std::string destination_dir;
  std::string staging_dir;
  std::optional<uint64_t> chunk_size;
  std::optional<size_t> max_concurrent;
  std::optional<size_t> max_concurrent_chunks;
  std::string report_path;
  bool quiet = false;
  bool help = false;
  std::vector<std::string> files;
};

/**
 * Parse argv. "--" ends flag parsing; everything after it is a file.
 *
 * @return false with error_msg set on an unknown flag, a missing value or a
 *         malformed number
 */
bool parse_cli_args(int argc, const char* const argv[], CliOptions& options, std::string& error_msg);

/**
 * Command-line values take precedence over the configuration file.
 */
void apply_cli_overrides(const CliOptions& options, UpliftConfig& config);

void print_usage(const char* program_name);

}  // namespace cli
}  // namespace uplift

#endif  // UPLIFT_CLI_OPTIONS_HPP
