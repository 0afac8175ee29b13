// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_TRANSFER_ENGINE_HPP
#define UPLIFT_TRANSFER_ENGINE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "progress_channel.hpp"
#include "retry_handler.hpp"
#include "transfer_interfaces.hpp"
#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

struct TransferConfig {
  uint64_t chunk_size = 1 * MiB;
  uint64_t chunk_threshold = 1 * MiB;  // files larger than this are chunked
  size_t max_concurrent_chunks = 3;
  int max_chunk_retries = 3;
  RetryConfig chunk_retry;  // backoff between chunk attempts

  std::chrono::milliseconds chunk_timeout{0};  // 0 = no per-chunk timeout
  std::chrono::milliseconds item_timeout{0};   // 0 = no per-item timeout

  // Simulated progress for transports without native whole-file progress
  std::chrono::milliseconds simulated_progress_interval{100};
  std::chrono::milliseconds simulated_progress_time_constant{2000};
  double simulated_progress_cap = 0.9;
};

enum class TransferOutcome {
  COMPLETED,
  FAILED,
  CANCELLED,
  PAUSED,
};

std::string transferOutcomeToString(TransferOutcome outcome);

struct TransferReport {
  TransferOutcome outcome = TransferOutcome::FAILED;
  std::optional<TransferError> error;  // set only for FAILED
  std::string url;                     // set only for COMPLETED
};

/**
 * Drives one attempt at uploading one file.
 *
 * Files up to chunk_threshold go out in a single uploadWhole() call. Larger
 * files are split and a pool of max_concurrent_chunks workers pulls chunk
 * indices from a shared work queue. A failed chunk goes back on the queue
 * after the retry delay until it has failed more than max_chunk_retries
 * times, which aborts the remaining chunks and fails the attempt. When every
 * chunk is done the etags are handed to finalizeChunks() in index order.
 *
 * Completed chunks survive pause, cancel and failure, and can be passed to
 * a later engine for the same file so it resumes from the first incomplete
 * chunk.
 *
 * run() blocks the calling thread. cancel() and pause() may be called from
 * any thread; once a stop is observed no further progress is posted.
 */
class TransferEngine {
public:
  TransferEngine(
    std::string item_id, std::shared_ptr<IFileSource> source, std::shared_ptr<ITransport> transport,
    TransferConfig config, uint64_t attempt = 1,
    std::shared_ptr<ProgressChannel> progress = nullptr,
    std::vector<ChunkDescriptor> resume_chunks = {}
  );

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;
  TransferEngine(TransferEngine&&) = delete;
  TransferEngine& operator=(TransferEngine&&) = delete;

  TransferReport run();

  void cancel();
  void pause();

  /**
   * Stop a run whose owner has already recorded it as failed.
   */
  void abort();

  static UploadStrategy selectStrategy(uint64_t total_bytes, uint64_t chunk_threshold);

  UploadStrategy strategy() const { return strategy_; }
  const std::string& itemId() const { return item_id_; }
  uint64_t attempt() const { return attempt_; }

  /**
   * Copy of the chunk table. Empty for whole-file transfers.
   */
  std::vector<ChunkDescriptor> chunks() const;

  UploadProgress progress() const;

private:
  TransferReport runWhole();
  TransferReport runChunked();
  TransferReport finalize();

  void chunkWorker();
  void uploadOneChunk(size_t index);
  void handleChunkFailure(size_t index, TransferError error);

  void simulateProgress(std::mutex& done_mutex, std::condition_variable& done_cv, const bool& done);
  void requestStop(StopReason reason);

  /**
   * Post absolute progress unless a stop has been requested.
   */
  void emitProgress(uint64_t bytes, size_t chunks_completed);

  TransferReport stoppedReport() const;
  TransferError withContext(TransferError error, std::optional<size_t> chunk_index) const;

  const std::string item_id_;
  const std::shared_ptr<IFileSource> source_;
  const std::shared_ptr<ITransport> transport_;
  const TransferConfig config_;
  const uint64_t attempt_;
  const std::shared_ptr<ProgressChannel> progress_;
  const FileInfo file_;
  const UploadStrategy strategy_;
  size_t total_chunks_ = 1;
  RetryHandler chunk_retry_;

  CancellationSource stop_;
  CancellationToken token_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<ChunkDescriptor> chunks_;
  std::deque<size_t> ready_;
  std::vector<std::pair<std::chrono::steady_clock::time_point, size_t>> delayed_;
  size_t in_flight_ = 0;
  bool failed_ = false;
  std::optional<TransferError> chunk_error_;
  uint64_t bytes_done_ = 0;
  size_t chunks_done_ = 0;

  std::mutex emit_mutex_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_TRANSFER_ENGINE_HPP
