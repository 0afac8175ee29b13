// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_report.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#define UPLIFT_LOG_COMPONENT "upload_report"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace cli {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  const auto ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
     << (ms < 0 ? ms + 1000 : ms) << 'Z';
  return ss.str();
}

nlohmann::json diagnostic_to_json(const transfer::Diagnostic& diagnostic) {
  nlohmann::json json = {{"code", diagnostic.code}, {"message", diagnostic.message}};
  if (!diagnostic.field.empty()) {
    json["field"] = diagnostic.field;
  }
  return json;
}

nlohmann::json item_to_json(const transfer::UploadItem& item) {
  nlohmann::json json;
  json["id"] = item.id;
  json["name"] = item.file.name;
  json["size"] = item.file.size;
  json["mime_type"] = item.file.mime_type;
  json["priority"] = item.priority;
  json["status"] = transfer::uploadStatusToString(item.status);
  json["strategy"] =
    item.strategy ? nlohmann::json(transfer::uploadStrategyToString(*item.strategy)) : nullptr;
  json["retry_count"] = item.retry_count;
  json["queued_at"] = format_timestamp(item.queued_at);

  const auto& progress = item.progress;
  json["bytes_transferred"] = progress.bytes_transferred;
  json["percentage"] = progress.percentage();
  json["chunks"] = {
    {"completed", progress.chunks_completed},
    {"total", progress.total_chunks},
  };
  if (progress.started_at) {
    json["started_at"] = format_timestamp(*progress.started_at);
  }
  if (progress.completed_at) {
    json["completed_at"] = format_timestamp(*progress.completed_at);
  }

  json["url"] = item.result_url.empty() ? nlohmann::json(nullptr) : nlohmann::json(item.result_url);

  if (item.last_error) {
    const auto& error = *item.last_error;
    nlohmann::json error_json = {
      {"kind", transfer::transferErrorKindToString(error.kind)},
      {"message", error.message},
      {"retryable", error.retryable},
    };
    if (error.chunk_index) {
      error_json["chunk_index"] = *error.chunk_index;
    }
    json["error"] = error_json;
  } else {
    json["error"] = nullptr;
  }

  if (!item.warnings.empty()) {
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : item.warnings) {
      warnings.push_back(diagnostic_to_json(warning));
    }
    json["warnings"] = warnings;
  }
  return json;
}

nlohmann::json build_upload_report(
  const std::vector<transfer::UploadItem>& items, const std::vector<RejectedFile>& rejected,
  const transfer::QueueStats& stats, const transfer::ProgressSnapshot& progress
) {
  nlohmann::json report;
  report["generated_at"] = format_timestamp(std::chrono::system_clock::now());

  nlohmann::json items_json = nlohmann::json::array();
  for (const auto& item : items) {
    items_json.push_back(item_to_json(item));
  }
  report["items"] = items_json;

  nlohmann::json rejected_json = nlohmann::json::array();
  for (const auto& file : rejected) {
    nlohmann::json errors = nlohmann::json::array();
    for (const auto& error : file.errors) {
      errors.push_back(diagnostic_to_json(error));
    }
    rejected_json.push_back({{"path", file.path}, {"reason", file.reason}, {"errors", errors}});
  }
  report["rejected"] = rejected_json;

  report["stats"] = {
    {"total", stats.total},
    {"pending", stats.pending},
    {"uploading", stats.uploading},
    {"paused", stats.paused},
    {"completed", stats.completed},
    {"error", stats.error},
    {"cancelled", stats.cancelled},
    {"total_bytes", stats.total_bytes},
    {"completed_bytes", stats.completed_bytes},
  };

  const double elapsed_seconds = static_cast<double>(progress.elapsed.count()) / 1000.0;
  const double average =
    elapsed_seconds > 0.0 ? static_cast<double>(progress.bytes_transferred) / elapsed_seconds : 0.0;
  report["throughput"] = {
    {"bytes_transferred", progress.bytes_transferred},
    {"elapsed_seconds", elapsed_seconds},
    {"average_bytes_per_second", average},
    {"peak_bytes_per_second", progress.peak_bytes_per_second},
  };
  return report;
}

bool write_upload_report(
  const std::string& path, const nlohmann::json& report, std::string& error_msg
) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    error_msg = "Cannot open report file: " + path;
    return false;
  }
  file << report.dump(2) << '\n';
  if (!file) {
    error_msg = "Failed to write report file: " + path;
    return false;
  }
  UPLIFT_LOG_INFO("Upload report written" << kv("path", path));
  return true;
}

}  // namespace cli
}  // namespace uplift
