// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_UPLOAD_QUEUE_HPP
#define UPLIFT_UPLOAD_QUEUE_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "file_validator.hpp"
#include "progress_channel.hpp"
#include "progress_tracker.hpp"
#include "retry_handler.hpp"
#include "transfer_engine.hpp"
#include "transfer_interfaces.hpp"
#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

inline RetryConfig defaultQueueRetryConfig() {
  RetryConfig config;
  config.policy = BackoffPolicy::FIXED;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter = false;
  return config;
}

struct QueueConfig {
  size_t max_concurrent = 3;  // items uploading at once
  size_t max_files = 100;     // simultaneous membership, 0 = unlimited
  int max_retries = 3;
  int default_priority = 5;
  bool auto_start = true;
  bool auto_retry = false;
  bool pause_on_error = false;
  RetryConfig retry = defaultQueueRetryConfig();   // delay before an automatic retry
  std::chrono::milliseconds auto_clear_after{0};  // evict completed items, 0 = keep
  size_t progress_channel_capacity = 1024;

  TransferConfig transfer;
  ValidatorConfig validation;
  ProgressTrackerConfig progress;
};

/**
 * Per-call overrides for add()
 */
struct AddOptions {
  std::optional<int> priority;
  std::optional<uint64_t> max_size;
  std::optional<int> max_retries;
};

struct AdmissionResult {
  bool admitted = false;
  std::string id;
  ValidationResult validation;
  std::optional<QueueError> error;

  explicit operator bool() const { return admitted; }
};

struct QueueStats {
  size_t total = 0;
  size_t pending = 0;
  size_t uploading = 0;
  size_t paused = 0;
  size_t completed = 0;
  size_t error = 0;
  size_t cancelled = 0;
  uint64_t total_bytes = 0;
  uint64_t completed_bytes = 0;
  size_t active_slots = 0;
};

/**
 * One item status transition, delivered outside the queue lock.
 */
struct StatusChange {
  std::string id;
  std::string filename;
  UploadStatus from = UploadStatus::PENDING;
  UploadStatus to = UploadStatus::PENDING;
  std::optional<TransferError> error;
};

using StatusCallback = std::function<void(const StatusChange&)>;

/**
 * Prioritized upload queue
 *
 * Admitted items wait in a binary heap ordered by priority (higher first)
 * and admission sequence (earlier first). process() promotes pending items
 * while fewer than max_concurrent are uploading; each promoted item gets a
 * TransferEngine running on its own thread. The scheduler runs again after
 * every completion, failure, cancellation or pause, so callers only need
 * process() when auto_start is off.
 *
 * Progress from all engines flows through one bounded ProgressChannel that
 * a dispatcher thread drains into the items and the ProgressTracker. Events
 * from an older attempt of an item are ignored.
 *
 * A housekeeping thread runs automatic retries, auto-clear eviction and
 * joins finished engine threads. It also enforces the per-item timeout: an
 * item still uploading when its deadline passes is marked failed at once
 * and its engine is detached, so a transport that ignores cancellation
 * cannot hold a slot.
 *
 * Thread-safe. All queue state lives under one mutex.
 */
class UploadQueue {
public:
  /**
   * @throws std::invalid_argument if transport is null or max_concurrent is 0
   */
  UploadQueue(std::shared_ptr<ITransport> transport, QueueConfig config = {});
  ~UploadQueue();

  UploadQueue(const UploadQueue&) = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;
  UploadQueue(UploadQueue&&) = delete;
  UploadQueue& operator=(UploadQueue&&) = delete;

  /**
   * Validate and admit a file. Rejected files never enter the queue.
   */
  AdmissionResult add(std::shared_ptr<IFileSource> source, const AddOptions& options = {});

  /**
   * Remove an item. An uploading item is cancelled first and disappears
   * once its engine has stopped.
   */
  QueueResult remove(const std::string& id);

  /**
   * Pending and paused items only.
   */
  QueueResult changePriority(const std::string& id, int priority);

  QueueResult pause(const std::string& id);
  QueueResult resume(const std::string& id);
  QueueResult cancel(const std::string& id);

  /**
   * Return a failed item to pending, keeping its completed chunks.
   */
  QueueResult retry(const std::string& id);

  /**
   * Retry every failed item still under its retry limit.
   *
   * @return Number of items re-enqueued
   */
  size_t retryFailed();

  /**
   * Scheduler tick. A no-op when no slot is free.
   *
   * @return Number of items promoted to uploading
   */
  size_t process();

  QueueStats stats() const;

  std::optional<UploadItem> get(const std::string& id) const;

  /**
   * All items in admission order.
   */
  std::vector<UploadItem> items() const;

  /**
   * Pending items in promotion order.
   */
  std::vector<UploadItem> pending() const;

  /**
   * Evict completed and cancelled items.
   *
   * @return Number of items evicted
   */
  size_t clearFinished();

  /**
   * Stop promoting items. Uploads in flight continue.
   */
  void pauseAll();
  void resumeAll();
  bool isPaused() const;

  /**
   * Block until nothing is uploading and nothing is waiting to be promoted
   * or automatically retried.
   *
   * @return false on timeout
   */
  bool waitUntilIdle(std::chrono::milliseconds timeout);

  std::shared_ptr<const ProgressSnapshot> overallProgress() const;

  /**
   * @return nullptr for unknown or untracked items
   */
  std::shared_ptr<const ProgressSnapshot> fileProgress(const std::string& id) const;

  void setEventCallback(StatusCallback callback);

  FileValidator& validator() { return validator_; }

  uint64_t droppedProgressEvents() const { return channel_->droppedCount(); }

  /**
   * Cancel running uploads, wait for their engines and stop the queue's
   * threads. Idempotent; called by the destructor.
   */
  void shutdown();

private:
  struct Entry {
    UploadItem item;
    std::shared_ptr<IFileSource> source;
    std::shared_ptr<TransferEngine> engine;
    std::thread worker;
    uint64_t attempt = 0;
    bool remove_when_finished = false;
    bool cancel_requested = false;
  };

  struct HeapNode {
    int priority;
    uint64_t sequence;
    std::string id;
  };

  // std::push_heap keeps the greatest element first
  struct HeapOrder {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
      if (a.priority != b.priority) {
        return a.priority < b.priority;
      }
      return a.sequence > b.sequence;
    }
  };

  struct Timer {
    std::chrono::steady_clock::time_point due;
    std::string id;
    uint64_t attempt;
  };

  // Min-heap: earliest due time on top
  struct TimerOrder {
    bool operator()(const Timer& a, const Timer& b) const { return a.due > b.due; }
  };

  using TimerQueue = std::priority_queue<Timer, std::vector<Timer>, TimerOrder>;
  using Events = std::vector<StatusChange>;

  bool transitionLocked(
    Entry& entry, UploadStatus to, Events& events,
    const std::optional<TransferError>& error = std::nullopt
  );
  void pushHeapLocked(const Entry& entry);
  void eraseHeapLocked(const std::string& id);
  size_t promoteLocked(Events& events);
  void startLocked(Entry& entry, Events& events);
  void failLocked(Entry& entry, const TransferError& error, Events& events);
  void detachEngineLocked(Entry& entry);
  QueueResult retryLocked(Entry& entry, Events& events);
  void eraseLocked(std::map<std::string, Entry>::iterator it);
  bool idleLocked() const;
  std::string nextIdLocked();

  void runEngine(std::string id, std::string filename, std::shared_ptr<TransferEngine> engine);
  void onEngineFinished(
    const std::string& id, const std::shared_ptr<TransferEngine>& engine,
    const TransferReport& report
  );

  void dispatchLoop();
  void housekeepingLoop();
  void fire(const Events& events);

  const std::shared_ptr<ITransport> transport_;
  const QueueConfig config_;
  const RetryHandler retry_handler_;

  FileValidator validator_;
  ProgressTracker tracker_;
  std::shared_ptr<ProgressChannel> channel_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::condition_variable housekeeping_cv_;
  std::map<std::string, Entry> entries_;
  std::vector<HeapNode> heap_;
  TimerQueue retry_timers_;
  TimerQueue clear_timers_;
  TimerQueue deadline_timers_;
  std::vector<std::thread> finished_threads_;
  std::map<const TransferEngine*, std::thread> detached_workers_;
  std::array<size_t, 6> counts_{};
  uint64_t total_bytes_ = 0;
  uint64_t completed_bytes_ = 0;
  uint64_t next_sequence_ = 1;
  bool scheduling_paused_ = false;
  std::mt19937 id_rng_;

  std::mutex callback_mutex_;
  StatusCallback callback_;

  std::atomic<bool> shutdown_{false};
  std::thread dispatcher_;
  std::thread housekeeper_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_UPLOAD_QUEUE_HPP
