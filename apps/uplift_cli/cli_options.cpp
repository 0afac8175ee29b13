// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>

#include "config_parser.hpp"

namespace uplift {
namespace cli {

namespace {

template <typename T>
bool parse_count(const std::string& text, T& out) {
  try {
    size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size() || value < 0) {
      return false;
    }
    out = static_cast<T>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool parse_int(const std::string& text, int& out) {
  try {
    size_t used = 0;
    out = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

bool parse_cli_args(
  int argc, const char* const argv[], CliOptions& options, std::string& error_msg
) {
  bool flags_done = false;

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];

    if (flags_done || arg[0] != '-' || std::strcmp(arg, "-") == 0) {
      options.files.emplace_back(arg);
      continue;
    }

    if (std::strcmp(arg, "--") == 0) {
      flags_done = true;
      continue;
    }
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      options.help = true;
      continue;
    }
    if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
      options.quiet = true;
      continue;
    }

    // Every remaining flag takes a value
    if (i + 1 >= argc) {
      error_msg = std::string(arg) + " requires an argument";
      return false;
    }
    const std::string value = argv[++i];

    if (std::strcmp(arg, "--config") == 0) {
      options.config_file = value;
    } else if (std::strcmp(arg, "--dest") == 0) {
      options.destination_dir = value;
    } else if (std::strcmp(arg, "--staging") == 0) {
      options.staging_dir = value;
    } else if (std::strcmp(arg, "--report") == 0) {
      options.report_path = value;
    } else if (std::strcmp(arg, "--priority") == 0) {
      int priority = 0;
      if (!parse_int(value, priority)) {
        error_msg = "--priority expects an integer, got '" + value + "'";
        return false;
      }
      options.priority = priority;
    } else if (std::strcmp(arg, "--chunk-size") == 0) {
      auto size = parse_byte_size(value);
      if (!size || *size == 0) {
        error_msg = "--chunk-size expects a positive size such as 1048576 or 5MiB, got '" +
                    value + "'";
        return false;
      }
      options.chunk_size = *size;
    } else if (std::strcmp(arg, "--max-concurrent") == 0) {
      size_t count = 0;
      if (!parse_count(value, count) || count == 0) {
        error_msg = "--max-concurrent expects a positive integer, got '" + value + "'";
        return false;
      }
      options.max_concurrent = count;
    } else if (std::strcmp(arg, "--max-chunks") == 0) {
      size_t count = 0;
      if (!parse_count(value, count) || count == 0) {
        error_msg = "--max-chunks expects a positive integer, got '" + value + "'";
        return false;
      }
      options.max_concurrent_chunks = count;
    } else {
      error_msg = std::string("Unknown argument: ") + arg;
      return false;
    }
  }

  return true;
}

void apply_cli_overrides(const CliOptions& options, UpliftConfig& config) {
  if (options.priority) {
    config.queue.default_priority = *options.priority;
  }
  if (!options.destination_dir.empty()) {
    config.transport.local.destination_dir = options.destination_dir;
  }
  if (!options.staging_dir.empty()) {
    config.transport.local.staging_dir = options.staging_dir;
  }
  if (options.chunk_size) {
    config.queue.transfer.chunk_size = *options.chunk_size;
  }
  if (options.max_concurrent) {
    config.queue.max_concurrent = *options.max_concurrent;
  }
  if (options.max_concurrent_chunks) {
    config.queue.transfer.max_concurrent_chunks = *options.max_concurrent_chunks;
  }
  if (!options.report_path.empty()) {
    config.report_path = options.report_path;
  }
}

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS] FILE...\n"
    << "\n"
    << "Uplift - chunked, prioritized file uploader\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH          Path to YAML configuration file\n"
    << "  --priority N           Priority of the given files, higher first (default: 5)\n"
    << "  --dest DIR             Destination directory for the local transport\n"
    << "  --staging DIR          Chunk staging directory for the local transport\n"
    << "  --chunk-size SIZE      Chunk size in bytes or with a KiB/MiB suffix (default: 1MiB)\n"
    << "  --max-concurrent N     Files uploading at once (default: 3)\n"
    << "  --max-chunks N         Chunks in flight per file (default: 3)\n"
    << "  --report PATH          Write a JSON report of the run\n"
    << "  --quiet, -q            No progress line, warnings and errors only\n"
    << "  --help, -h             Show this help message\n"
    << "\n"
    << "Configuration File:\n"
    << "  Command-line arguments OVERRIDE config file values.\n"
    << "  Example config file structure:\n"
    << "  queue:\n"
    << "    max_concurrent: 3\n"
    << "    auto_retry: true\n"
    << "  transfer:\n"
    << "    chunk_size: 1MiB\n"
    << "    chunk_threshold: 1MiB\n"
    << "  transport:\n"
    << "    type: local\n"
    << "    local:\n"
    << "      destination_dir: /data/uploads\n"
    << "\n"
    << "Logging can be adjusted with UPLIFT_LOG_LEVEL, UPLIFT_LOG_FILE_ENABLED and friends.\n"
    << "\n"
    << "Exit status: 0 if every file uploaded, 1 if any file was rejected, failed or\n"
    << "was cancelled, 2 on a usage or configuration error.\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --dest /tmp/out a.png b.pdf\n"
    << "  " << program_name << " --config config/default_config.yaml --report run.json *.zip\n"
    << std::endl;
}

}  // namespace cli
}  // namespace uplift
