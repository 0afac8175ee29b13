// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CLI_UPLOAD_REPORT_HPP
#define UPLIFT_CLI_UPLOAD_REPORT_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "file_validator.hpp"
#include "progress_tracker.hpp"
#include "upload_queue.hpp"

namespace uplift {
namespace cli {

/**
 * A command-line file that never entered the queue.
 */
struct RejectedFile {
  std::string path;
  std::string reason;                         // read failure or queue error
  std::vector<transfer::Diagnostic> errors;  // validation errors, if any
};

/**
 * "2026-10-19T08:30:00.123Z"
 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

nlohmann::json diagnostic_to_json(const transfer::Diagnostic& diagnostic);

nlohmann::json item_to_json(const transfer::UploadItem& item);

/**
 * Build the run report: every item, every rejected file, queue counters
 * and overall throughput.
 */
nlohmann::json build_upload_report(
  const std::vector<transfer::UploadItem>& items, const std::vector<RejectedFile>& rejected,
  const transfer::QueueStats& stats, const transfer::ProgressSnapshot& progress
);

/**
 * Write report to path, pretty-printed. Returns false and sets error_msg
 * when the file cannot be written.
 */
bool write_upload_report(
  const std::string& path, const nlohmann::json& report, std::string& error_msg
);

}  // namespace cli
}  // namespace uplift

#endif  // UPLIFT_CLI_UPLOAD_REPORT_HPP
