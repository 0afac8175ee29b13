// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_queue.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "chunker.hpp"

#define UPLIFT_LOG_COMPONENT "upload_queue"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace transfer {

namespace {

size_t slot(UploadStatus status) {
  return static_cast<size_t>(status);
}

// Lets an engine that honors its token report its own timeout first.
constexpr std::chrono::milliseconds kDeadlineGrace{50};

}  // namespace

UploadQueue::UploadQueue(std::shared_ptr<ITransport> transport, QueueConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config))
    , retry_handler_(config_.retry)
    , validator_(config_.validation)
    , tracker_(config_.progress)
    , channel_(std::make_shared<ProgressChannel>(config_.progress_channel_capacity))
    , id_rng_(std::random_device{}()) {
  if (!transport_) {
    throw std::invalid_argument("UploadQueue requires a transport");
  }
  if (config_.max_concurrent == 0) {
    throw std::invalid_argument("max_concurrent must be greater than zero");
  }
  if (config_.transfer.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }
  if (config_.transfer.max_concurrent_chunks == 0) {
    throw std::invalid_argument("max_concurrent_chunks must be greater than zero");
  }

  dispatcher_ = std::thread(&UploadQueue::dispatchLoop, this);
  housekeeper_ = std::thread(&UploadQueue::housekeepingLoop, this);

  UPLIFT_LOG_DEBUG(
    "Upload queue started" << kv("max_concurrent", config_.max_concurrent)
                           << kv("max_chunks", config_.transfer.max_concurrent_chunks)
                           << kv("max_files", config_.max_files)
  );
}

UploadQueue::~UploadQueue() {
  shutdown();
}

// =============================================================================
// Admission
// =============================================================================

AdmissionResult UploadQueue::add(std::shared_ptr<IFileSource> source, const AddOptions& options) {
  if (!source) {
    throw std::invalid_argument("add() requires a file source");
  }

  AdmissionResult result;
  if (shutdown_.load()) {
    result.error = QueueError{QueueErrorKind::SHUTDOWN, "Queue is shut down"};
    return result;
  }

  const FileInfo info = source->info();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.max_files > 0 && entries_.size() >= config_.max_files) {
      UPLIFT_LOG_WARN("Queue full, file rejected" << kv("file", info.name) << kv("max", config_.max_files));
      result.error = QueueError{
        QueueErrorKind::QUEUE_FULL,
        "Queue already holds " + std::to_string(config_.max_files) + " files"
      };
      return result;
    }
  }

  // Validation reads file headers, so it runs without the queue lock.
  result.validation = validator_.validate(*source, options.max_size);
  if (!result.validation.accepted) {
    result.error = QueueError{QueueErrorKind::VALIDATION_FAILED, result.validation.summary()};
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load()) {
      result.error = QueueError{QueueErrorKind::SHUTDOWN, "Queue is shut down"};
      return result;
    }
    if (config_.max_files > 0 && entries_.size() >= config_.max_files) {
      result.error = QueueError{
        QueueErrorKind::QUEUE_FULL,
        "Queue already holds " + std::to_string(config_.max_files) + " files"
      };
      return result;
    }

    Entry entry;
    entry.source = std::move(source);
    entry.item.id = nextIdLocked();
    entry.item.file = info;
    entry.item.priority = options.priority.value_or(config_.default_priority);
    entry.item.max_retries = options.max_retries.value_or(config_.max_retries);
    entry.item.status = UploadStatus::PENDING;
    entry.item.progress.total_bytes = info.size;
    entry.item.queued_at = std::chrono::system_clock::now();
    entry.item.sequence = next_sequence_++;
    entry.item.warnings = result.validation.warnings;

    result.id = entry.item.id;
    pushHeapLocked(entry);
    ++counts_[slot(UploadStatus::PENDING)];
    total_bytes_ += info.size;
    entries_.emplace(result.id, std::move(entry));
  }
  result.admitted = true;

  UPLIFT_LOG_INFO(
    "File admitted" << kv("id", result.id) << kv("file", info.name)
                    << kv("size", formatBytes(info.size))
                    << kv("priority", options.priority.value_or(config_.default_priority))
  );

  if (config_.auto_start) {
    process();
  }
  idle_cv_.notify_all();
  return result;
}

std::string UploadQueue::nextIdLocked() {
  std::ostringstream oss;
  oss << "upload_" << next_sequence_ << "_" << std::hex << std::setw(8) << std::setfill('0')
      << (id_rng_() & 0xffffffffu);
  return oss.str();
}

// =============================================================================
// Item operations
// =============================================================================

QueueResult UploadQueue::remove(const std::string& id) {
  bool abort_chunks = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
    }
    Entry& entry = it->second;
    if (entry.item.status == UploadStatus::UPLOADING) {
      entry.remove_when_finished = true;
      entry.cancel_requested = true;
      if (entry.engine) {
        entry.engine->cancel();
      }
      UPLIFT_LOG_DEBUG("Removal deferred until upload stops" << kv("id", id));
      return QueueResult::ok();
    }
    abort_chunks = entry.item.status != UploadStatus::COMPLETED &&
                   Chunker::completedCount(entry.item.chunks) > 0;
    eraseLocked(it);
  }
  if (abort_chunks) {
    transport_->abortChunks(id);
  }
  UPLIFT_LOG_DEBUG("Item removed" << kv("id", id));
  idle_cv_.notify_all();
  return QueueResult::ok();
}

QueueResult UploadQueue::changePriority(const std::string& id, int priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
  }
  Entry& entry = it->second;
  const UploadStatus status = entry.item.status;
  if (status != UploadStatus::PENDING && status != UploadStatus::PAUSED) {
    return QueueResult::fail(
      QueueErrorKind::INVALID_OPERATION,
      "Cannot change priority of a " + uploadStatusToString(status) + " item"
    );
  }
  entry.item.priority = priority;
  if (status == UploadStatus::PENDING) {
    eraseHeapLocked(id);
    pushHeapLocked(entry);
  }
  return QueueResult::ok();
}

QueueResult UploadQueue::pause(const std::string& id) {
  Events events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
    }
    Entry& entry = it->second;
    switch (entry.item.status) {
      case UploadStatus::PENDING:
        eraseHeapLocked(id);
        transitionLocked(entry, UploadStatus::PAUSED, events);
        break;
      case UploadStatus::UPLOADING:
        // The engine reports PAUSED once in-flight chunks have stopped.
        if (entry.engine) {
          entry.engine->pause();
        }
        break;
      default:
        return QueueResult::fail(
          QueueErrorKind::INVALID_OPERATION,
          "Cannot pause a " + uploadStatusToString(entry.item.status) + " item"
        );
    }
  }
  fire(events);
  idle_cv_.notify_all();
  return QueueResult::ok();
}

QueueResult UploadQueue::resume(const std::string& id) {
  Events events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
    }
    Entry& entry = it->second;
    if (entry.item.status != UploadStatus::PAUSED) {
      return QueueResult::fail(
        QueueErrorKind::INVALID_OPERATION,
        "Cannot resume a " + uploadStatusToString(entry.item.status) + " item"
      );
    }
    transitionLocked(entry, UploadStatus::PENDING, events);
    pushHeapLocked(entry);
    if (config_.auto_start) {
      promoteLocked(events);
    }
  }
  fire(events);
  return QueueResult::ok();
}

QueueResult UploadQueue::cancel(const std::string& id) {
  Events events;
  bool abort_chunks = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
    }
    Entry& entry = it->second;
    switch (entry.item.status) {
      case UploadStatus::PENDING:
        eraseHeapLocked(id);
        [[fallthrough]];
      case UploadStatus::PAUSED:
        abort_chunks = Chunker::completedCount(entry.item.chunks) > 0;
        transitionLocked(entry, UploadStatus::CANCELLED, events);
        tracker_.removeFile(id);
        break;
      case UploadStatus::UPLOADING:
        entry.cancel_requested = true;
        if (entry.engine) {
          entry.engine->cancel();
        }
        break;
      default:
        return QueueResult::fail(
          QueueErrorKind::INVALID_OPERATION,
          "Cannot cancel a " + uploadStatusToString(entry.item.status) + " item"
        );
    }
  }
  if (abort_chunks) {
    transport_->abortChunks(id);
  }
  fire(events);
  idle_cv_.notify_all();
  return QueueResult::ok();
}

QueueResult UploadQueue::retry(const std::string& id) {
  Events events;
  QueueResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return QueueResult::fail(QueueErrorKind::NOT_FOUND, "No item " + id);
    }
    result = retryLocked(it->second, events);
    if (result && config_.auto_start) {
      promoteLocked(events);
    }
  }
  fire(events);
  return result;
}

size_t UploadQueue::retryFailed() {
  Events events;
  size_t retried = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : entries_) {
      if (entry.item.status == UploadStatus::ERROR && retryLocked(entry, events)) {
        ++retried;
      }
    }
    if (retried > 0 && config_.auto_start) {
      promoteLocked(events);
    }
  }
  fire(events);
  if (retried > 0) {
    UPLIFT_LOG_INFO("Failed items re-enqueued" << kv("count", retried));
  }
  return retried;
}

QueueResult UploadQueue::retryLocked(Entry& entry, Events& events) {
  if (entry.item.status != UploadStatus::ERROR) {
    return QueueResult::fail(
      QueueErrorKind::INVALID_OPERATION,
      "Cannot retry a " + uploadStatusToString(entry.item.status) + " item"
    );
  }
  if (entry.item.retry_count >= entry.item.max_retries) {
    return QueueResult::fail(
      QueueErrorKind::RETRY_LIMIT,
      "Item " + entry.item.id + " reached its retry limit of " +
        std::to_string(entry.item.max_retries)
    );
  }
  ++entry.item.retry_count;
  entry.item.last_error.reset();
  transitionLocked(entry, UploadStatus::PENDING, events);
  pushHeapLocked(entry);
  UPLIFT_LOG_DEBUG(
    "Item re-enqueued" << kv("id", entry.item.id) << kv("retry", entry.item.retry_count)
                       << kv("resume_chunks", Chunker::completedCount(entry.item.chunks))
  );
  return QueueResult::ok();
}

// =============================================================================
// Scheduling
// =============================================================================

size_t UploadQueue::process() {
  Events events;
  size_t promoted = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    promoted = promoteLocked(events);
  }
  fire(events);
  return promoted;
}

size_t UploadQueue::promoteLocked(Events& events) {
  if (shutdown_.load() || scheduling_paused_) {
    return 0;
  }
  size_t promoted = 0;
  while (counts_[slot(UploadStatus::UPLOADING)] < config_.max_concurrent && !heap_.empty() &&
         !scheduling_paused_) {
    std::pop_heap(heap_.begin(), heap_.end(), HeapOrder{});
    HeapNode node = std::move(heap_.back());
    heap_.pop_back();

    auto it = entries_.find(node.id);
    if (it == entries_.end() || it->second.item.status != UploadStatus::PENDING) {
      continue;
    }
    startLocked(it->second, events);
    ++promoted;
  }
  return promoted;
}

void UploadQueue::startLocked(Entry& entry, Events& events) {
  const std::string& id = entry.item.id;
  ++entry.attempt;
  entry.cancel_requested = false;

  std::shared_ptr<TransferEngine> engine;
  try {
    engine = std::make_shared<TransferEngine>(
      id, entry.source, transport_, config_.transfer, entry.attempt, channel_, entry.item.chunks
    );
  } catch (const std::exception& e) {
    UPLIFT_LOG_ERROR("Cannot start transfer" << kv("id", id) << kv("error", e.what()));
    TransferError error = TransferError::server(e.what(), false);
    error.filename = entry.item.file.name;
    transitionLocked(entry, UploadStatus::UPLOADING, events);
    failLocked(entry, error, events);
    return;
  }

  entry.engine = engine;
  entry.item.strategy = engine->strategy();
  entry.item.chunks = engine->chunks();
  const UploadProgress progress = engine->progress();
  entry.item.progress.bytes_transferred = progress.bytes_transferred;
  entry.item.progress.chunks_completed = progress.chunks_completed;
  entry.item.progress.total_chunks = progress.total_chunks;
  if (!entry.item.progress.started_at) {
    entry.item.progress.started_at = std::chrono::system_clock::now();
  }

  tracker_.registerFile(id, entry.item.file.size);
  tracker_.update(id, progress.bytes_transferred);
  transitionLocked(entry, UploadStatus::UPLOADING, events);

  try {
    entry.worker = std::thread(&UploadQueue::runEngine, this, id, entry.item.file.name, engine);
  } catch (const std::system_error& e) {
    UPLIFT_LOG_ERROR("Cannot start transfer thread" << kv("id", id) << kv("error", e.what()));
    entry.engine.reset();
    TransferError error =
      TransferError::server(std::string("Cannot start transfer thread: ") + e.what(), false);
    error.filename = entry.item.file.name;
    failLocked(entry, error, events);
    return;
  }

  if (config_.transfer.item_timeout.count() > 0) {
    deadline_timers_.push(Timer{
      std::chrono::steady_clock::now() + config_.transfer.item_timeout + kDeadlineGrace, id,
      entry.attempt
    });
    housekeeping_cv_.notify_all();
  }
}

void UploadQueue::failLocked(Entry& entry, const TransferError& error, Events& events) {
  const std::string& id = entry.item.id;
  entry.item.last_error = error;
  transitionLocked(entry, UploadStatus::ERROR, events, error);
  UPLIFT_LOG_ERROR(
    "Upload failed" << kv("id", id) << kv("error", error.toString())
                    << kv("retries", entry.item.retry_count)
  );
  if (config_.auto_retry && !entry.remove_when_finished &&
      entry.item.retry_count < entry.item.max_retries) {
    const auto delay = retry_handler_.getDelay(entry.item.retry_count);
    retry_timers_.push(Timer{std::chrono::steady_clock::now() + delay, id, entry.attempt});
    housekeeping_cv_.notify_all();
    UPLIFT_LOG_INFO("Automatic retry scheduled" << kv("id", id) << kv("delay_ms", delay.count()));
  }
  if (config_.pause_on_error && !scheduling_paused_) {
    scheduling_paused_ = true;
    UPLIFT_LOG_WARN("Scheduling paused after error" << kv("id", id));
  }
}

void UploadQueue::detachEngineLocked(Entry& entry) {
  if (!entry.engine) {
    return;
  }
  entry.item.chunks = entry.engine->chunks();
  const UploadProgress progress = entry.engine->progress();
  entry.item.progress.chunks_completed = progress.chunks_completed;
  entry.engine->abort();
  if (entry.worker.joinable()) {
    detached_workers_.emplace(entry.engine.get(), std::move(entry.worker));
  }
  entry.engine.reset();
}

void UploadQueue::runEngine(
  std::string id, std::string filename, std::shared_ptr<TransferEngine> engine
) {
  UPLIFT_LOG_SCOPED_ITEM(id, filename);

  TransferReport report;
  try {
    report = engine->run();
  } catch (const std::exception& e) {
    UPLIFT_LOG_ERROR("Transfer threw" << kv("error", e.what()));
    report.outcome = TransferOutcome::FAILED;
    report.error = TransferError::server(e.what(), false);
    report.error->filename = filename;
  }
  onEngineFinished(id, engine, report);
}

void UploadQueue::onEngineFinished(
  const std::string& id, const std::shared_ptr<TransferEngine>& engine,
  const TransferReport& report
) {
  Events events;
  bool abort_chunks = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.engine != engine) {
      // Detached after its deadline; the item already moved on.
      auto detached = detached_workers_.find(engine.get());
      if (detached != detached_workers_.end()) {
        finished_threads_.push_back(std::move(detached->second));
        detached_workers_.erase(detached);
        housekeeping_cv_.notify_all();
      }
      UPLIFT_LOG_DEBUG(
        "Late engine result ignored" << kv("id", id)
                                     << kv("outcome", transferOutcomeToString(report.outcome))
      );
      return;
    }
    Entry& entry = it->second;
    if (entry.worker.joinable()) {
      finished_threads_.push_back(std::move(entry.worker));
    }
    entry.engine.reset();

    entry.item.chunks = engine->chunks();
    const UploadProgress progress = engine->progress();
    entry.item.progress.chunks_completed = progress.chunks_completed;
    if (entry.item.strategy == UploadStrategy::CHUNKED) {
      entry.item.progress.bytes_transferred = progress.bytes_transferred;
    }

    TransferOutcome outcome = report.outcome;
    if (outcome == TransferOutcome::PAUSED && entry.cancel_requested) {
      outcome = TransferOutcome::CANCELLED;
    }

    switch (outcome) {
      case TransferOutcome::COMPLETED:
        entry.item.result_url = report.url;
        entry.item.progress.bytes_transferred = entry.item.file.size;
        entry.item.progress.chunks_completed = entry.item.progress.total_chunks;
        entry.item.progress.completed_at = std::chrono::system_clock::now();
        transitionLocked(entry, UploadStatus::COMPLETED, events);
        tracker_.markComplete(id);
        completed_bytes_ += entry.item.file.size;
        if (config_.auto_clear_after.count() > 0) {
          clear_timers_.push(
            Timer{std::chrono::steady_clock::now() + config_.auto_clear_after, id, entry.attempt}
          );
        }
        UPLIFT_LOG_INFO(
          "Upload completed" << kv("id", id) << kv("file", entry.item.file.name)
                             << kv("url", report.url)
        );
        break;

      case TransferOutcome::CANCELLED:
        transitionLocked(entry, UploadStatus::CANCELLED, events);
        tracker_.removeFile(id);
        abort_chunks = Chunker::completedCount(entry.item.chunks) > 0;
        UPLIFT_LOG_INFO("Upload cancelled" << kv("id", id));
        break;

      case TransferOutcome::PAUSED:
        transitionLocked(entry, UploadStatus::PAUSED, events);
        UPLIFT_LOG_INFO(
          "Upload paused" << kv("id", id)
                          << kv("chunks_done", Chunker::completedCount(entry.item.chunks))
        );
        break;

      case TransferOutcome::FAILED:
        failLocked(
          entry, report.error ? *report.error : TransferError::server("Transfer failed", false),
          events
        );
        break;
    }

    if (entry.remove_when_finished) {
      abort_chunks = abort_chunks || (entry.item.status != UploadStatus::COMPLETED &&
                                      Chunker::completedCount(entry.item.chunks) > 0);
      eraseLocked(it);
    }

    promoteLocked(events);
  }

  if (abort_chunks) {
    transport_->abortChunks(id);
  }
  housekeeping_cv_.notify_all();
  idle_cv_.notify_all();
  fire(events);
}

// =============================================================================
// Internal state helpers
// =============================================================================

bool UploadQueue::transitionLocked(
  Entry& entry, UploadStatus to, Events& events, const std::optional<TransferError>& error
) {
  const UploadStatus from = entry.item.status;
  if (!isValidTransition(from, to)) {
    UPLIFT_LOG_ERROR(
      "Rejected status transition" << kv("id", entry.item.id)
                                   << kv("from", uploadStatusToString(from))
                                   << kv("to", uploadStatusToString(to))
    );
    return false;
  }
  --counts_[slot(from)];
  ++counts_[slot(to)];
  entry.item.status = to;
  events.push_back(StatusChange{entry.item.id, entry.item.file.name, from, to, error});
  return true;
}

void UploadQueue::pushHeapLocked(const Entry& entry) {
  heap_.push_back(HeapNode{entry.item.priority, entry.item.sequence, entry.item.id});
  std::push_heap(heap_.begin(), heap_.end(), HeapOrder{});
}

void UploadQueue::eraseHeapLocked(const std::string& id) {
  auto it = std::remove_if(heap_.begin(), heap_.end(), [&id](const HeapNode& node) {
    return node.id == id;
  });
  if (it != heap_.end()) {
    heap_.erase(it, heap_.end());
    std::make_heap(heap_.begin(), heap_.end(), HeapOrder{});
  }
}

void UploadQueue::eraseLocked(std::map<std::string, Entry>::iterator it) {
  Entry& entry = it->second;
  if (entry.item.status == UploadStatus::PENDING) {
    eraseHeapLocked(it->first);
  }
  if (entry.worker.joinable()) {
    finished_threads_.push_back(std::move(entry.worker));
    housekeeping_cv_.notify_all();
  }
  --counts_[slot(entry.item.status)];
  total_bytes_ -= entry.item.file.size;
  if (entry.item.status == UploadStatus::COMPLETED) {
    completed_bytes_ -= entry.item.file.size;
  }
  tracker_.removeFile(it->first);
  entries_.erase(it);
}

bool UploadQueue::idleLocked() const {
  if (counts_[slot(UploadStatus::UPLOADING)] > 0 || !retry_timers_.empty()) {
    return false;
  }
  return scheduling_paused_ || shutdown_.load() || heap_.empty();
}

// =============================================================================
// Queries
// =============================================================================

QueueStats UploadQueue::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStats stats;
  stats.total = entries_.size();
  stats.pending = counts_[slot(UploadStatus::PENDING)];
  stats.uploading = counts_[slot(UploadStatus::UPLOADING)];
  stats.paused = counts_[slot(UploadStatus::PAUSED)];
  stats.completed = counts_[slot(UploadStatus::COMPLETED)];
  stats.error = counts_[slot(UploadStatus::ERROR)];
  stats.cancelled = counts_[slot(UploadStatus::CANCELLED)];
  stats.total_bytes = total_bytes_;
  stats.completed_bytes = completed_bytes_;
  stats.active_slots = stats.uploading;
  return stats;
}

std::optional<UploadItem> UploadQueue::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  UploadItem item = it->second.item;
  if (it->second.engine) {
    item.chunks = it->second.engine->chunks();
  }
  return item;
}

std::vector<UploadItem> UploadQueue::items() const {
  std::vector<UploadItem> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      result.push_back(entry.item);
      if (entry.engine) {
        result.back().chunks = entry.engine->chunks();
      }
    }
  }
  std::sort(result.begin(), result.end(), [](const UploadItem& a, const UploadItem& b) {
    return a.sequence < b.sequence;
  });
  return result;
}

std::vector<UploadItem> UploadQueue::pending() const {
  std::vector<HeapNode> order;
  std::vector<UploadItem> result;
  std::lock_guard<std::mutex> lock(mutex_);
  order = heap_;
  std::sort(order.begin(), order.end(), [](const HeapNode& a, const HeapNode& b) {
    return HeapOrder{}(b, a);
  });
  for (const auto& node : order) {
    auto it = entries_.find(node.id);
    if (it != entries_.end() && it->second.item.status == UploadStatus::PENDING) {
      result.push_back(it->second.item);
    }
  }
  return result;
}

size_t UploadQueue::clearFinished() {
  size_t cleared = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      const UploadStatus status = it->second.item.status;
      auto next = std::next(it);
      if (status == UploadStatus::COMPLETED || status == UploadStatus::CANCELLED) {
        eraseLocked(it);
        ++cleared;
      }
      it = next;
    }
  }
  if (cleared > 0) {
    UPLIFT_LOG_DEBUG("Finished items cleared" << kv("count", cleared));
  }
  return cleared;
}

void UploadQueue::pauseAll() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduling_paused_ = true;
  }
  UPLIFT_LOG_INFO("Queue scheduling paused");
  idle_cv_.notify_all();
}

void UploadQueue::resumeAll() {
  Events events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduling_paused_ = false;
    promoteLocked(events);
  }
  UPLIFT_LOG_INFO("Queue scheduling resumed");
  fire(events);
}

bool UploadQueue::isPaused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scheduling_paused_;
}

bool UploadQueue::waitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return idleLocked(); });
}

std::shared_ptr<const ProgressSnapshot> UploadQueue::overallProgress() const {
  return tracker_.snapshot();
}

std::shared_ptr<const ProgressSnapshot> UploadQueue::fileProgress(const std::string& id) const {
  return tracker_.fileSnapshot(id);
}

void UploadQueue::setEventCallback(StatusCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

void UploadQueue::fire(const Events& events) {
  if (events.empty()) {
    return;
  }
  StatusCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = callback_;
  }
  if (!callback) {
    return;
  }
  for (const auto& event : events) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      UPLIFT_LOG_WARN("Status callback threw" << kv("id", event.id) << kv("error", e.what()));
    }
  }
}

// =============================================================================
// Background threads
// =============================================================================

void UploadQueue::dispatchLoop() {
  while (true) {
    auto event = channel_->receive(std::chrono::milliseconds(100));
    if (!event) {
      if (channel_->isClosed()) {
        break;
      }
      continue;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(event->item_id);
    if (it == entries_.end()) {
      continue;
    }
    Entry& entry = it->second;
    if (entry.attempt != event->attempt || entry.item.status != UploadStatus::UPLOADING) {
      continue;
    }
    UploadProgress& progress = entry.item.progress;
    progress.bytes_transferred = std::max(progress.bytes_transferred, event->bytes_transferred);
    progress.chunks_completed = std::max(progress.chunks_completed, event->chunks_completed);
    progress.total_chunks = event->total_chunks;
    tracker_.update(event->item_id, progress.bytes_transferred, event->at);
    UPLIFT_LOG_DEBUG_THROTTLE(
      1.0, "Upload progress" << kv("id", event->item_id)
                             << kv("bytes", progress.bytes_transferred)
                             << kv("of", progress.total_bytes)
                             << kv("chunks", progress.chunks_completed)
    );
  }
}

void UploadQueue::housekeepingLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (!finished_threads_.empty()) {
      std::vector<std::thread> finished;
      finished.swap(finished_threads_);
      lock.unlock();
      for (auto& thread : finished) {
        thread.join();
      }
      lock.lock();
      continue;
    }

    if (shutdown_.load()) {
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    Events events;
    std::vector<std::string> to_abort;
    bool retried = false;
    bool timed_out = false;

    while (!deadline_timers_.empty() && deadline_timers_.top().due <= now) {
      Timer timer = deadline_timers_.top();
      deadline_timers_.pop();
      auto it = entries_.find(timer.id);
      if (it == entries_.end() || it->second.attempt != timer.attempt ||
          it->second.item.status != UploadStatus::UPLOADING || !it->second.engine) {
        continue;
      }
      Entry& entry = it->second;
      UPLIFT_LOG_WARN(
        "Upload deadline passed, detaching engine"
        << kv("id", timer.id) << kv("timeout_ms", config_.transfer.item_timeout.count())
      );
      detachEngineLocked(entry);
      if (entry.cancel_requested) {
        transitionLocked(entry, UploadStatus::CANCELLED, events);
        tracker_.removeFile(timer.id);
      } else {
        TransferError error = TransferError::timeout("Upload exceeded item timeout");
        error.filename = entry.item.file.name;
        failLocked(entry, error, events);
      }
      if (entry.remove_when_finished) {
        if (Chunker::completedCount(entry.item.chunks) > 0) {
          to_abort.push_back(timer.id);
        }
        eraseLocked(it);
      }
      timed_out = true;
    }

    while (!retry_timers_.empty() && retry_timers_.top().due <= now) {
      Timer timer = retry_timers_.top();
      retry_timers_.pop();
      auto it = entries_.find(timer.id);
      if (it == entries_.end() || it->second.attempt != timer.attempt) {
        continue;
      }
      if (it->second.item.status == UploadStatus::ERROR && retryLocked(it->second, events)) {
        retried = true;
      }
    }

    while (!clear_timers_.empty() && clear_timers_.top().due <= now) {
      Timer timer = clear_timers_.top();
      clear_timers_.pop();
      auto it = entries_.find(timer.id);
      if (it != entries_.end() && it->second.attempt == timer.attempt &&
          it->second.item.status == UploadStatus::COMPLETED) {
        UPLIFT_LOG_DEBUG("Completed item evicted" << kv("id", timer.id));
        eraseLocked(it);
      }
    }

    if ((retried || timed_out) && config_.auto_start) {
      promoteLocked(events);
    }

    if (!events.empty() || !to_abort.empty()) {
      lock.unlock();
      for (const auto& id : to_abort) {
        transport_->abortChunks(id);
      }
      fire(events);
      idle_cv_.notify_all();
      lock.lock();
      continue;
    }
    if (retried || timed_out) {
      idle_cv_.notify_all();
    }
    if (!finished_threads_.empty()) {
      continue;
    }

    std::optional<std::chrono::steady_clock::time_point> wake;
    for (const TimerQueue* timers : {&retry_timers_, &clear_timers_, &deadline_timers_}) {
      if (!timers->empty() && (!wake || timers->top().due < *wake)) {
        wake = timers->top().due;
      }
    }
    if (wake) {
      housekeeping_cv_.wait_until(lock, *wake);
    } else {
      housekeeping_cv_.wait(lock);
    }
  }
}

void UploadQueue::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }
  UPLIFT_LOG_DEBUG("Upload queue shutting down");

  {
    std::unique_lock<std::mutex> lock(mutex_);
    for (auto& [id, entry] : entries_) {
      if (entry.engine) {
        entry.cancel_requested = true;
        entry.engine->cancel();
      }
    }
    idle_cv_.wait(lock, [this] { return counts_[slot(UploadStatus::UPLOADING)] == 0; });
    while (!retry_timers_.empty()) {
      retry_timers_.pop();
    }
    while (!deadline_timers_.empty()) {
      deadline_timers_.pop();
    }
  }

  channel_->close();
  housekeeping_cv_.notify_all();
  idle_cv_.notify_all();

  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  if (housekeeper_.joinable()) {
    housekeeper_.join();
  }

  // Detached engines may still be inside a transport call.
  std::vector<std::thread> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining.swap(finished_threads_);
    for (auto& [engine, thread] : detached_workers_) {
      remaining.push_back(std::move(thread));
    }
    detached_workers_.clear();
  }
  for (auto& thread : remaining) {
    thread.join();
  }
}

}  // namespace transfer
}  // namespace uplift
