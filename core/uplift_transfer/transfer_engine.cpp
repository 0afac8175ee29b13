// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

#include "chunker.hpp"

#define UPLIFT_LOG_COMPONENT "transfer_engine"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace transfer {

namespace {

FileInfo describe(const std::shared_ptr<IFileSource>& source) {
  if (!source) {
    throw std::invalid_argument("TransferEngine requires a file source");
  }
  return source->info();
}

/**
 * Stops and joins the simulated-progress thread on every exit path.
 */
class SimulatorGuard {
public:
  SimulatorGuard(std::mutex& mutex, std::condition_variable& cv, bool& done)
      : mutex_(mutex)
      , cv_(cv)
      , done_(done) {}

  ~SimulatorGuard() { stop(); }

  void start(std::thread thread) { thread_ = std::move(thread); }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::mutex& mutex_;
  std::condition_variable& cv_;
  bool& done_;
  std::thread thread_;
};

}  // namespace

std::string transferOutcomeToString(TransferOutcome outcome) {
  switch (outcome) {
    case TransferOutcome::COMPLETED:
      return "completed";
    case TransferOutcome::FAILED:
      return "failed";
    case TransferOutcome::CANCELLED:
      return "cancelled";
    case TransferOutcome::PAUSED:
      return "paused";
  }
  return "unknown";
}

TransferEngine::TransferEngine(
  std::string item_id, std::shared_ptr<IFileSource> source, std::shared_ptr<ITransport> transport,
  TransferConfig config, uint64_t attempt, std::shared_ptr<ProgressChannel> progress,
  std::vector<ChunkDescriptor> resume_chunks
)
    : item_id_(std::move(item_id))
    , source_(std::move(source))
    , transport_(std::move(transport))
    , config_(std::move(config))
    , attempt_(attempt)
    , progress_(std::move(progress))
    , file_(describe(source_))
    , strategy_(selectStrategy(file_.size, config_.chunk_threshold))
    , chunk_retry_(config_.chunk_retry)
    , token_(stop_.token()) {
  if (!transport_) {
    throw std::invalid_argument("TransferEngine requires a transport");
  }
  if (config_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }
  if (config_.max_concurrent_chunks == 0) {
    throw std::invalid_argument("max_concurrent_chunks must be greater than zero");
  }

  if (strategy_ == UploadStrategy::CHUNKED) {
    if (!resume_chunks.empty() &&
        Chunker::matchesLayout(resume_chunks, file_.size, config_.chunk_size)) {
      chunks_ = std::move(resume_chunks);
    } else {
      if (!resume_chunks.empty()) {
        UPLIFT_LOG_WARN(
          "Discarding chunk state with a different layout" << kv("item", item_id_)
                                                            << kv("chunks", resume_chunks.size())
        );
      }
      chunks_ = Chunker::split(file_.size, config_.chunk_size);
    }
    total_chunks_ = chunks_.size();
    bytes_done_ = Chunker::bytesCompleted(chunks_);
    chunks_done_ = Chunker::completedCount(chunks_);
  }
}

UploadStrategy TransferEngine::selectStrategy(uint64_t total_bytes, uint64_t chunk_threshold) {
  return total_bytes > chunk_threshold ? UploadStrategy::CHUNKED : UploadStrategy::WHOLE;
}

TransferReport TransferEngine::run() {
  if (config_.item_timeout.count() > 0) {
    token_ = token_.withDeadline(std::chrono::steady_clock::now() + config_.item_timeout);
  }

  UPLIFT_LOG_DEBUG(
    "Transfer started" << kv("item", item_id_) << kv("attempt", attempt_)
                       << kv("strategy", uploadStrategyToString(strategy_))
                       << kv("bytes", file_.size) << kv("chunks", total_chunks_)
  );

  if (token_.isCancelled()) {
    return stoppedReport();
  }

  TransferReport report;
  try {
    report = strategy_ == UploadStrategy::WHOLE ? runWhole() : runChunked();
  } catch (const std::exception& e) {
    UPLIFT_LOG_ERROR("Transfer aborted by exception" << kv("item", item_id_) << kv("error", e.what()));
    report.outcome = TransferOutcome::FAILED;
    report.error = withContext(
      TransferError::server(std::string("Unexpected transfer failure: ") + e.what(), false), std::nullopt
    );
  }

  if (report.outcome == TransferOutcome::FAILED && report.error) {
    UPLIFT_LOG_WARN("Transfer failed" << kv("item", item_id_) << kv("error", report.error->toString()));
  } else {
    UPLIFT_LOG_DEBUG(
      "Transfer finished" << kv("item", item_id_)
                          << kv("outcome", transferOutcomeToString(report.outcome))
    );
  }
  return report;
}

void TransferEngine::requestStop(StopReason reason) {
  {
    // Holding emit_mutex_ guarantees no progress is posted after this returns.
    std::lock_guard<std::mutex> emit_lock(emit_mutex_);
    stop_.requestStop(reason);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();
}

void TransferEngine::cancel() {
  UPLIFT_LOG_DEBUG("Cancel requested" << kv("item", item_id_));
  requestStop(StopReason::CANCELLED);
}

void TransferEngine::pause() {
  UPLIFT_LOG_DEBUG("Pause requested" << kv("item", item_id_));
  requestStop(StopReason::PAUSED);
}

void TransferEngine::abort() {
  UPLIFT_LOG_DEBUG("Abort requested" << kv("item", item_id_));
  requestStop(StopReason::ABORTED);
}

std::vector<ChunkDescriptor> TransferEngine::chunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_;
}

UploadProgress TransferEngine::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  UploadProgress p;
  p.bytes_transferred = bytes_done_;
  p.total_bytes = file_.size;
  p.chunks_completed = chunks_done_;
  p.total_chunks = total_chunks_;
  return p;
}

void TransferEngine::emitProgress(uint64_t bytes, size_t chunks_completed) {
  if (!progress_) {
    return;
  }
  std::lock_guard<std::mutex> lock(emit_mutex_);
  if (token_.isCancelled()) {
    return;
  }
  ProgressEvent event;
  event.item_id = item_id_;
  event.attempt = attempt_;
  event.bytes_transferred = std::min(bytes, file_.size);
  event.total_bytes = file_.size;
  event.chunks_completed = chunks_completed;
  event.total_chunks = total_chunks_;
  progress_->post(std::move(event));
}

TransferError TransferEngine::withContext(TransferError error, std::optional<size_t> chunk_index) const {
  error.filename = file_.name;
  if (chunk_index) {
    error.chunk_index = chunk_index;
  }
  return error;
}

TransferReport TransferEngine::stoppedReport() const {
  TransferReport report;
  switch (stop_.reason()) {
    case StopReason::CANCELLED:
      report.outcome = TransferOutcome::CANCELLED;
      return report;
    case StopReason::PAUSED:
      report.outcome = TransferOutcome::PAUSED;
      return report;
    case StopReason::ABORTED: {
      std::lock_guard<std::mutex> lock(mutex_);
      report.outcome = TransferOutcome::FAILED;
      report.error = chunk_error_ ? *chunk_error_
                                  : withContext(TransferError::server("Transfer aborted", false), std::nullopt);
      return report;
    }
    case StopReason::NONE:
      break;
  }
  report.outcome = TransferOutcome::FAILED;
  report.error = withContext(TransferError::timeout("Upload exceeded item timeout"), std::nullopt);
  return report;
}

// =============================================================================
// Whole-file strategy
// =============================================================================

void TransferEngine::simulateProgress(
  std::mutex& done_mutex, std::condition_variable& done_cv, const bool& done
) {
  const auto started = std::chrono::steady_clock::now();
  const double cap = std::clamp(config_.simulated_progress_cap, 0.0, 0.99);
  const double tau = std::max(
    std::chrono::duration<double>(config_.simulated_progress_time_constant).count(), 0.001
  );
  uint64_t last = 0;

  std::unique_lock<std::mutex> lock(done_mutex);
  while (!done) {
    done_cv.wait_for(lock, config_.simulated_progress_interval, [&done] { return done; });
    if (done) {
      break;
    }
    const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const auto bytes = static_cast<uint64_t>(cap * (1.0 - std::exp(-t / tau)) *
                                             static_cast<double>(file_.size));
    if (bytes > last && bytes < file_.size) {
      last = bytes;
      emitProgress(bytes, 0);
    }
  }
}

TransferReport TransferEngine::runWhole() {
  emitProgress(0, 0);

  std::mutex done_mutex;
  std::condition_variable done_cv;
  bool done = false;
  SimulatorGuard simulator(done_mutex, done_cv, done);

  ProgressCallback callback;
  if (transport_->supportsProgress()) {
    callback = [this](uint64_t sent, uint64_t /*total*/) { emitProgress(sent, 0); };
  } else {
    simulator.start(std::thread([this, &done_mutex, &done_cv, &done] {
      simulateProgress(done_mutex, done_cv, done);
    }));
  }

  TransportResult result;
  try {
    result = transport_->uploadWhole(item_id_, *source_, token_, callback);
  } catch (const std::exception& e) {
    result = TransportResult::Failure(TransferError::network(e.what()));
  }
  simulator.stop();

  // A transport that ignored the token may still report success after the
  // item deadline; the deadline wins.
  if (result.success && !token_.deadlineExpired()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      bytes_done_ = file_.size;
      chunks_done_ = 1;
    }
    emitProgress(file_.size, 1);
    TransferReport report;
    report.outcome = TransferOutcome::COMPLETED;
    report.url = result.value;
    return report;
  }

  if (token_.isCancelled()) {
    return stoppedReport();
  }

  TransferReport report;
  report.outcome = TransferOutcome::FAILED;
  report.error = withContext(result.error, std::nullopt);
  return report;
}

// =============================================================================
// Chunked strategy
// =============================================================================

TransferReport TransferEngine::runChunked() {
  size_t pending = 0;
  uint64_t resumed_bytes = 0;
  size_t resumed_chunks = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.clear();
    delayed_.clear();
    for (auto& chunk : chunks_) {
      if (chunk.status != ChunkStatus::COMPLETED) {
        chunk.status = ChunkStatus::PENDING;
        chunk.retry_count = 0;
        ready_.push_back(chunk.index);
      }
    }
    pending = ready_.size();
    resumed_bytes = bytes_done_;
    resumed_chunks = chunks_done_;
  }

  if (resumed_chunks > 0) {
    UPLIFT_LOG_INFO(
      "Resuming chunked upload" << kv("item", item_id_) << kv("completed", resumed_chunks)
                                << kv("remaining", pending)
    );
  }
  emitProgress(resumed_bytes, resumed_chunks);

  if (pending > 0) {
    const size_t worker_count = std::min(config_.max_concurrent_chunks, pending);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(&TransferEngine::chunkWorker, this);
    }
    for (auto& worker : workers) {
      worker.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
      TransferReport report;
      report.outcome = TransferOutcome::FAILED;
      report.error = chunk_error_;
      return report;
    }
  }

  if (token_.isCancelled()) {
    return stoppedReport();
  }
  return finalize();
}

void TransferEngine::chunkWorker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!failed_ && !token_.isCancelled()) {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = delayed_.begin(); it != delayed_.end();) {
      if (it->first <= now) {
        ready_.push_back(it->second);
        it = delayed_.erase(it);
      } else {
        ++it;
      }
    }

    if (!ready_.empty()) {
      const size_t index = ready_.front();
      ready_.pop_front();
      chunks_[index].status = ChunkStatus::UPLOADING;
      ++in_flight_;
      lock.unlock();
      uploadOneChunk(index);
      lock.lock();
      continue;
    }

    if (delayed_.empty() && in_flight_ == 0) {
      break;
    }

    std::optional<std::chrono::steady_clock::time_point> wake = token_.deadline();
    for (const auto& entry : delayed_) {
      if (!wake || entry.first < *wake) {
        wake = entry.first;
      }
    }
    if (wake) {
      cv_.wait_until(lock, *wake);
    } else {
      cv_.wait(lock);
    }
  }
  lock.unlock();
  cv_.notify_all();
}

void TransferEngine::uploadOneChunk(size_t index) {
  ChunkDescriptor chunk;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk = chunks_[index];
  }

  std::vector<uint8_t> bytes;
  try {
    bytes = source_->read(chunk.start, static_cast<size_t>(chunk.size()));
  } catch (const std::exception& e) {
    handleChunkFailure(index, TransferError::io(std::string("Read failed: ") + e.what()));
    return;
  }
  if (bytes.size() != chunk.size()) {
    handleChunkFailure(
      index, TransferError::io(
               "Short read: expected " + std::to_string(chunk.size()) + " bytes, got " +
               std::to_string(bytes.size())
             )
    );
    return;
  }

  CancellationToken chunk_token = token_;
  if (config_.chunk_timeout.count() > 0) {
    chunk_token = token_.withDeadline(std::chrono::steady_clock::now() + config_.chunk_timeout);
  }

  TransportResult result;
  try {
    result = transport_->uploadChunk(item_id_, file_, chunk, bytes, chunk_token);
  } catch (const std::exception& e) {
    result = TransportResult::Failure(TransferError::network(e.what()));
  }

  if (result.success && chunk_token.deadlineExpired()) {
    UPLIFT_LOG_DEBUG("Late chunk discarded" << kv("item", item_id_) << kv("index", index));
    result = TransportResult::Failure(TransferError::timeout("Chunk upload timed out"));
  }
  if (!result.success) {
    TransferError error = result.error;
    if (chunk_token.deadlineExpired() && !token_.isCancelled()) {
      error = TransferError::timeout("Chunk upload timed out");
    }
    handleChunkFailure(index, error);
    return;
  }

  uint64_t bytes_done = 0;
  size_t chunks_done = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkDescriptor& stored = chunks_[index];
    stored.status = ChunkStatus::COMPLETED;
    stored.etag = result.value;
    bytes_done_ += stored.size();
    ++chunks_done_;
    --in_flight_;
    bytes_done = bytes_done_;
    chunks_done = chunks_done_;
  }
  cv_.notify_all();

  UPLIFT_LOG_DEBUG(
    "Chunk uploaded" << kv("item", item_id_) << kv("index", index)
                     << kv("done", chunks_done) << kv("of", total_chunks_)
  );
  emitProgress(bytes_done, chunks_done);
}

void TransferEngine::handleChunkFailure(size_t index, TransferError error) {
  bool abort = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    ChunkDescriptor& chunk = chunks_[index];

    if (token_.isCancelled()) {
      // Stopped, not failed: the chunk is picked up again on resume.
      chunk.status = ChunkStatus::PENDING;
    } else {
      ++chunk.retry_count;
      error = withContext(std::move(error), index);
      if (RetryHandler::isRetryableError(error) && chunk.retry_count <= config_.max_chunk_retries) {
        chunk.status = ChunkStatus::PENDING;
        const auto delay = chunk_retry_.getDelay(chunk.retry_count - 1);
        delayed_.emplace_back(std::chrono::steady_clock::now() + delay, index);
        UPLIFT_LOG_WARN(
          "Chunk failed, retrying" << kv("item", item_id_) << kv("index", index)
                                   << kv("retry", chunk.retry_count)
                                   << kv("delay_ms", delay.count()) << kv("error", error.message)
        );
      } else {
        chunk.status = ChunkStatus::ERROR;
        failed_ = true;
        chunk_error_ = error;
        abort = true;
        UPLIFT_LOG_ERROR(
          "Chunk failed permanently" << kv("item", item_id_) << kv("index", index)
                                     << kv("retries", chunk.retry_count)
                                     << kv("error", error.toString())
        );
      }
    }
  }

  if (abort) {
    requestStop(StopReason::ABORTED);
  } else {
    cv_.notify_all();
  }
}

TransferReport TransferEngine::finalize() {
  std::vector<std::string> etags;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkDescriptor> ordered = chunks_;
    std::sort(ordered.begin(), ordered.end(), [](const ChunkDescriptor& a, const ChunkDescriptor& b) {
      return a.index < b.index;
    });
    etags.reserve(ordered.size());
    for (const auto& chunk : ordered) {
      etags.push_back(chunk.etag);
    }
  }

  int retries = 0;
  while (true) {
    if (token_.isCancelled()) {
      return stoppedReport();
    }

    TransportResult result;
    try {
      result = transport_->finalizeChunks(item_id_, file_, etags, token_);
    } catch (const std::exception& e) {
      result = TransportResult::Failure(TransferError::network(e.what()));
    }

    if (result.success && !token_.deadlineExpired()) {
      emitProgress(file_.size, total_chunks_);
      UPLIFT_LOG_INFO(
        "Chunked upload finalized" << kv("item", item_id_) << kv("chunks", etags.size())
                                   << kv("url", result.value)
      );
      TransferReport report;
      report.outcome = TransferOutcome::COMPLETED;
      report.url = result.value;
      return report;
    }

    if (token_.isCancelled()) {
      return stoppedReport();
    }

    TransferError error = withContext(result.error, std::nullopt);
    if (RetryHandler::isRetryableError(error) && retries < config_.max_chunk_retries) {
      const auto delay = chunk_retry_.getDelay(retries++);
      UPLIFT_LOG_WARN(
        "Finalize failed, retrying" << kv("item", item_id_) << kv("retry", retries)
                                    << kv("error", error.message)
      );
      token_.waitFor(delay);
      continue;
    }

    TransferReport report;
    report.outcome = TransferOutcome::FAILED;
    report.error = error;
    return report;
  }
}

}  // namespace transfer
}  // namespace uplift
