// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_TRANSFER_TYPES_HPP
#define UPLIFT_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplift {
namespace transfer {

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;

/**
 * Lifecycle of one upload item
 *
 * PENDING -> UPLOADING -> COMPLETED | ERROR | CANCELLED
 * UPLOADING -> PAUSED -> PENDING (resume re-enters scheduling)
 * ERROR -> PENDING (retry)
 */
enum class UploadStatus {
  PENDING,
  UPLOADING,
  PAUSED,
  COMPLETED,
  ERROR,
  CANCELLED,
};

std::string uploadStatusToString(UploadStatus status);
std::optional<UploadStatus> uploadStatusFromString(const std::string& str);

/**
 * Whether the item state machine allows from -> to.
 */
bool isValidTransition(UploadStatus from, UploadStatus to);

/**
 * COMPLETED, ERROR and CANCELLED no longer occupy a slot.
 */
bool isFinished(UploadStatus status);

enum class ChunkStatus {
  PENDING,
  UPLOADING,
  COMPLETED,
  ERROR,
};

std::string chunkStatusToString(ChunkStatus status);

enum class UploadStrategy {
  WHOLE,
  CHUNKED,
};

std::string uploadStrategyToString(UploadStrategy strategy);

/**
 * Human-readable size: "0 B", "512 B", "1.5 KB", "10 MB".
 */
std::string formatBytes(uint64_t bytes);

/**
 * Human-readable duration: "45s", "2m 5s", "1h 3m".
 */
std::string formatDuration(double seconds);

// =============================================================================
// Error taxonomy
// =============================================================================

enum class ValidationErrorKind {
  TOO_LARGE,
  EMPTY,
  INVALID_TYPE,
  INVALID_FILENAME,
  CONTENT_MISMATCH,
  SECURITY_FLAGGED,
  CUSTOM_RULE_FAILED,
  UNREADABLE,
};

std::string validationErrorKindToString(ValidationErrorKind kind);

enum class TransferErrorKind {
  NETWORK,
  SERVER,
  CANCELLED,
  TIMEOUT,
  IO,
};

std::string transferErrorKindToString(TransferErrorKind kind);

/**
 * Structured transfer failure, attached to an item in ERROR state.
 */
struct TransferError {
  TransferErrorKind kind = TransferErrorKind::NETWORK;
  std::string message;
  std::string filename;
  std::optional<size_t> chunk_index;
  bool retryable = true;

  static TransferError network(const std::string& message, bool retryable = true) {
    return {TransferErrorKind::NETWORK, message, "", std::nullopt, retryable};
  }

  /**
   * Server-side failure. Retryable unless the server refused the request
   * outright (4xx-style), which callers mark with retryable = false.
   */
  static TransferError server(const std::string& message, bool retryable = true) {
    return {TransferErrorKind::SERVER, message, "", std::nullopt, retryable};
  }

  static TransferError timeout(const std::string& message) {
    return {TransferErrorKind::TIMEOUT, message, "", std::nullopt, true};
  }

  static TransferError cancelled(const std::string& message = "cancelled") {
    return {TransferErrorKind::CANCELLED, message, "", std::nullopt, false};
  }

  static TransferError io(const std::string& message) {
    return {TransferErrorKind::IO, message, "", std::nullopt, false};
  }

  /**
   * "network: connection reset (file=a.bin, chunk=3)"
   */
  std::string toString() const;
};

enum class QueueErrorKind {
  NOT_FOUND,
  INVALID_OPERATION,
  QUEUE_FULL,
  RETRY_LIMIT,
  VALIDATION_FAILED,
  SHUTDOWN,
};

std::string queueErrorKindToString(QueueErrorKind kind);

struct QueueError {
  QueueErrorKind kind = QueueErrorKind::INVALID_OPERATION;
  std::string message;
};

/**
 * Outcome of a queue operation
 */
struct QueueResult {
  bool success = true;
  std::optional<QueueError> error;

  static QueueResult ok() { return {true, std::nullopt}; }

  static QueueResult fail(QueueErrorKind kind, const std::string& message) {
    return {false, QueueError{kind, message}};
  }

  explicit operator bool() const { return success; }
};

/**
 * One validation finding. Blocking errors carry a ValidationErrorKind,
 * warnings carry only a code.
 */
struct Diagnostic {
  std::string code;
  std::string message;
  std::string field;
  std::optional<ValidationErrorKind> kind;

  static Diagnostic error(
    ValidationErrorKind kind, const std::string& message, const std::string& field = ""
  ) {
    return {validationErrorKindToString(kind), message, field, kind};
  }

  static Diagnostic warning(
    const std::string& code, const std::string& message, const std::string& field = ""
  ) {
    return {code, message, field, std::nullopt};
  }
};

// =============================================================================
// Data model
// =============================================================================

/**
 * Metadata of a caller-owned file.
 */
struct FileInfo {
  std::string name;
  uint64_t size = 0;
  std::string mime_type;
  std::chrono::system_clock::time_point last_modified{};
};

/**
 * One contiguous byte range [start, end) of a file.
 */
struct ChunkDescriptor {
  size_t index = 0;
  uint64_t start = 0;
  uint64_t end = 0;
  ChunkStatus status = ChunkStatus::PENDING;
  int retry_count = 0;
  std::string etag;

  uint64_t size() const { return end - start; }
};

struct UploadProgress {
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  size_t chunks_completed = 0;
  size_t total_chunks = 0;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;

  double percentage() const;
};

/**
 * Snapshot of one logical file transfer.
 */
struct UploadItem {
  std::string id;
  FileInfo file;
  int priority = 5;
  UploadStatus status = UploadStatus::PENDING;
  UploadProgress progress;
  std::vector<ChunkDescriptor> chunks;  // empty for whole-file transfers
  std::optional<UploadStrategy> strategy;
  int retry_count = 0;
  int max_retries = 3;
  std::optional<TransferError> last_error;
  std::chrono::system_clock::time_point queued_at{};
  uint64_t sequence = 0;
  std::string result_url;
  std::vector<Diagnostic> warnings;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_TRANSFER_TYPES_HPP
