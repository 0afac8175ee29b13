// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "file_source.hpp"
#include "local_transport.hpp"
#include "upload_queue.hpp"
#include "upload_report.hpp"

#ifdef UPLIFT_HAS_S3
#include "s3_transport.hpp"
#endif

#define UPLIFT_LOG_COMPONENT "uplift_cli"
#include <uplift_log_init.hpp>
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace cli {

namespace {

std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

std::shared_ptr<transfer::ITransport> make_transport(const TransportSettings& settings) {
  if (settings.type == "s3") {
#ifdef UPLIFT_HAS_S3
    return std::make_shared<s3::S3Transport>(settings.s3);
#else
    throw std::runtime_error("uplift was built without S3 support (AWS SDK not found)");
#endif
  }
  return std::make_shared<transfer::LocalDirectoryTransport>(settings.local);
}

void print_progress(const transfer::ProgressSnapshot& snapshot, const transfer::QueueStats& stats) {
  std::cout << "\r" << std::fixed << std::setprecision(1) << snapshot.percentage << "%  "
            << transfer::formatBytes(snapshot.bytes_transferred) << " / "
            << transfer::formatBytes(snapshot.total_bytes) << "  "
            << transfer::formatBytes(static_cast<uint64_t>(snapshot.bytes_per_second)) << "/s";
  if (snapshot.eta_seconds) {
    std::cout << "  ETA " << transfer::formatDuration(*snapshot.eta_seconds);
  }
  std::cout << "  [" << stats.completed << " done, " << stats.uploading << " active, "
            << stats.pending << " waiting, " << stats.error << " failed]   " << std::flush;
}

void print_statistics(const transfer::QueueStats& stats, const transfer::ProgressSnapshot& progress) {
  std::cout << "\n=== Upload Statistics ===\n"
            << "Files:       " << stats.total << "\n"
            << "Completed:   " << stats.completed << "\n"
            << "Failed:      " << stats.error << "\n"
            << "Cancelled:   " << stats.cancelled << "\n"
            << "Bytes:       " << transfer::formatBytes(stats.completed_bytes) << " of "
            << transfer::formatBytes(stats.total_bytes) << "\n"
            << "Elapsed:     "
            << transfer::formatDuration(static_cast<double>(progress.elapsed.count()) / 1000.0)
            << "\n"
            << "Peak speed:  "
            << transfer::formatBytes(static_cast<uint64_t>(progress.peak_bytes_per_second))
            << "/s\n"
            << std::endl;
}

void cancel_outstanding(transfer::UploadQueue& queue) {
  for (const auto& item : queue.items()) {
    if (!transfer::isFinished(item.status)) {
      auto result = queue.cancel(item.id);
      if (!result) {
        UPLIFT_LOG_WARN("Cancel failed" << kv("item_id", item.id)
                                        << kv("error", result.error->message));
      }
    }
  }
}

}  // namespace

int run(int argc, char* argv[]) {
  CliOptions options;
  std::string error_msg;
  if (!parse_cli_args(argc, argv, options, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(argv[0]);
    return 2;
  }
  if (options.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (options.files.empty()) {
    std::cerr << "Error: At least one FILE is required" << std::endl;
    print_usage(argv[0]);
    return 2;
  }

  // Warnings only until the configured sinks are known
  logging::LoggingConfig bootstrap_log;
  bootstrap_log.console_level = logging::severity_level::warn;
  logging::init_logging(bootstrap_log);

  // Config file first, then command-line overrides
  UpliftConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << options.config_file
                << "': " << parser.get_last_error() << std::endl;
      logging::shutdown_logging();
      return 2;
    }
  }
  apply_cli_overrides(options, config);

  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    logging::shutdown_logging();
    return 2;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  if (options.quiet) {
    log_config.console_level = logging::severity_level::warn;
  }
  logging::reconfigure_logging(log_config);

  std::shared_ptr<transfer::ITransport> transport;
  try {
    transport = make_transport(config.transport);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to create " << config.transport.type
              << " transport: " << e.what() << std::endl;
    logging::shutdown_logging();
    return 2;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int exit_code = 0;
  std::vector<RejectedFile> rejected;
  {
    transfer::UploadQueue queue(transport, config.queue);

    const bool quiet = options.quiet;
    queue.setEventCallback([quiet](const transfer::StatusChange& change) {
      if (change.to == transfer::UploadStatus::ERROR && change.error) {
        std::cerr << "\nFailed: " << change.filename << ": " << change.error->toString()
                  << std::endl;
      } else if (!quiet && change.to == transfer::UploadStatus::COMPLETED) {
        std::cout << "\nUploaded: " << change.filename << std::endl;
      }
    });

    // Admission
    for (const auto& path : options.files) {
      std::shared_ptr<transfer::IFileSource> source;
      try {
        source = std::make_shared<transfer::LocalFileSource>(path);
      } catch (const std::exception& e) {
        std::cerr << "Rejected: " << path << ": " << e.what() << std::endl;
        rejected.push_back({path, e.what(), {}});
        continue;
      }

      auto admission = queue.add(source);
      if (admission) {
        for (const auto& warning : admission.validation.warnings) {
          std::cerr << "Warning: " << path << ": " << warning.message << " (" << warning.code
                    << ")" << std::endl;
        }
        continue;
      }

      RejectedFile file{path, "", admission.validation.errors};
      if (admission.error) {
        file.reason = admission.error->message;
      }
      std::cerr << "Rejected: " << path << ": "
                << (file.reason.empty() ? admission.validation.summary() : file.reason)
                << std::endl;
      for (const auto& error : admission.validation.errors) {
        std::cerr << "  - " << error.code << ": " << error.message << std::endl;
      }
      rejected.push_back(std::move(file));
    }

    if (!config.queue.auto_start) {
      queue.process();
    }

    // Wait for the queue, drawing the progress line between checks
    bool cancelling = false;
    while (!queue.waitUntilIdle(config.progress_interval)) {
      if (g_should_exit.load() && !cancelling) {
        std::cout << "\nInterrupted, cancelling outstanding uploads..." << std::endl;
        UPLIFT_LOG_WARN("Interrupted by signal, cancelling uploads");
        cancel_outstanding(queue);
        cancelling = true;
        continue;
      }
      if (!options.quiet) {
        print_progress(*queue.overallProgress(), queue.stats());
      }
    }

    const auto stats = queue.stats();
    const auto progress = queue.overallProgress();
    if (!options.quiet) {
      print_progress(*progress, stats);
      print_statistics(stats, *progress);
    }

    if (!config.report_path.empty()) {
      auto report = build_upload_report(queue.items(), rejected, stats, *progress);
      std::string report_error;
      if (!write_upload_report(config.report_path, report, report_error)) {
        std::cerr << "Error: " << report_error << std::endl;
        exit_code = 1;
      }
    }

    if (!rejected.empty() || stats.completed < stats.total) {
      exit_code = 1;
    }
    UPLIFT_LOG_INFO("Run finished" << kv("completed", stats.completed) << kv("failed", stats.error)
                                   << kv("rejected", rejected.size()) << kv("exit_code", exit_code));

    queue.shutdown();
  }

  logging::shutdown_logging();
  return exit_code;
}

}  // namespace cli
}  // namespace uplift

int main(int argc, char* argv[]) {
  return uplift::cli::run(argc, argv);
}
