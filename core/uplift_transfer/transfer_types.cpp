// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_types.hpp"

#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace uplift {
namespace transfer {

std::string uploadStatusToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::PENDING:
      return "pending";
    case UploadStatus::UPLOADING:
      return "uploading";
    case UploadStatus::PAUSED:
      return "paused";
    case UploadStatus::COMPLETED:
      return "completed";
    case UploadStatus::ERROR:
      return "error";
    case UploadStatus::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

std::optional<UploadStatus> uploadStatusFromString(const std::string& str) {
  static const std::map<std::string, UploadStatus> table = {
    {"pending", UploadStatus::PENDING},
    {"uploading", UploadStatus::UPLOADING},
    {"paused", UploadStatus::PAUSED},
    {"completed", UploadStatus::COMPLETED},
    {"error", UploadStatus::ERROR},
    {"cancelled", UploadStatus::CANCELLED},
  };
  auto it = table.find(str);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool isValidTransition(UploadStatus from, UploadStatus to) {
  static const std::set<std::pair<UploadStatus, UploadStatus>> transitions = {
    {UploadStatus::PENDING, UploadStatus::UPLOADING},
    {UploadStatus::PENDING, UploadStatus::PAUSED},
    {UploadStatus::PENDING, UploadStatus::CANCELLED},
    {UploadStatus::UPLOADING, UploadStatus::COMPLETED},
    {UploadStatus::UPLOADING, UploadStatus::ERROR},
    {UploadStatus::UPLOADING, UploadStatus::CANCELLED},
    {UploadStatus::UPLOADING, UploadStatus::PAUSED},
    {UploadStatus::PAUSED, UploadStatus::PENDING},
    {UploadStatus::PAUSED, UploadStatus::CANCELLED},
    {UploadStatus::ERROR, UploadStatus::PENDING},
  };
  return transitions.count({from, to}) > 0;
}

bool isFinished(UploadStatus status) {
  return status == UploadStatus::COMPLETED || status == UploadStatus::ERROR ||
         status == UploadStatus::CANCELLED;
}

std::string chunkStatusToString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::PENDING:
      return "pending";
    case ChunkStatus::UPLOADING:
      return "uploading";
    case ChunkStatus::COMPLETED:
      return "completed";
    case ChunkStatus::ERROR:
      return "error";
  }
  return "unknown";
}

std::string uploadStrategyToString(UploadStrategy strategy) {
  return strategy == UploadStrategy::CHUNKED ? "chunked" : "whole";
}

std::string formatBytes(uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(*units)) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  if (unit == 0 || value >= 100.0 || value == static_cast<double>(static_cast<uint64_t>(value))) {
    oss << static_cast<uint64_t>(value);
  } else {
    oss << std::fixed << std::setprecision(1) << value;
  }
  oss << " " << units[unit];
  return oss.str();
}

std::string formatDuration(double seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  const auto total = static_cast<uint64_t>(seconds + 0.5);
  const uint64_t hours = total / 3600;
  const uint64_t minutes = (total % 3600) / 60;
  const uint64_t secs = total % 60;
  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h " << minutes << "m";
  } else if (minutes > 0) {
    oss << minutes << "m " << secs << "s";
  } else {
    oss << secs << "s";
  }
  return oss.str();
}

std::string validationErrorKindToString(ValidationErrorKind kind) {
  switch (kind) {
    case ValidationErrorKind::TOO_LARGE:
      return "FILE_TOO_LARGE";
    case ValidationErrorKind::EMPTY:
      return "FILE_EMPTY";
    case ValidationErrorKind::INVALID_TYPE:
      return "INVALID_FILE_TYPE";
    case ValidationErrorKind::INVALID_FILENAME:
      return "INVALID_FILENAME";
    case ValidationErrorKind::CONTENT_MISMATCH:
      return "CONTENT_MISMATCH";
    case ValidationErrorKind::SECURITY_FLAGGED:
      return "SECURITY_FLAGGED";
    case ValidationErrorKind::CUSTOM_RULE_FAILED:
      return "CUSTOM_VALIDATION_ERROR";
    case ValidationErrorKind::UNREADABLE:
      return "FILE_UNREADABLE";
  }
  return "UNKNOWN";
}

std::string transferErrorKindToString(TransferErrorKind kind) {
  switch (kind) {
    case TransferErrorKind::NETWORK:
      return "network";
    case TransferErrorKind::SERVER:
      return "server";
    case TransferErrorKind::CANCELLED:
      return "cancelled";
    case TransferErrorKind::TIMEOUT:
      return "timeout";
    case TransferErrorKind::IO:
      return "io";
  }
  return "unknown";
}

std::string TransferError::toString() const {
  std::ostringstream oss;
  oss << transferErrorKindToString(kind) << ": " << message;
  if (!filename.empty() || chunk_index) {
    oss << " (";
    if (!filename.empty()) {
      oss << "file=" << filename;
    }
    if (chunk_index) {
      oss << (filename.empty() ? "" : ", ") << "chunk=" << *chunk_index;
    }
    oss << ")";
  }
  return oss.str();
}

std::string queueErrorKindToString(QueueErrorKind kind) {
  switch (kind) {
    case QueueErrorKind::NOT_FOUND:
      return "NOT_FOUND";
    case QueueErrorKind::INVALID_OPERATION:
      return "INVALID_OPERATION";
    case QueueErrorKind::QUEUE_FULL:
      return "QUEUE_FULL";
    case QueueErrorKind::RETRY_LIMIT:
      return "RETRY_LIMIT";
    case QueueErrorKind::VALIDATION_FAILED:
      return "VALIDATION_FAILED";
    case QueueErrorKind::SHUTDOWN:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

double UploadProgress::percentage() const {
  if (total_bytes == 0) {
    return total_chunks > 0 && chunks_completed == total_chunks ? 100.0 : 0.0;
  }
  return 100.0 * static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes);
}

}  // namespace transfer
}  // namespace uplift
