// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_PROGRESS_CHANNEL_HPP
#define UPLIFT_PROGRESS_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uplift {
namespace transfer {

/**
 * Absolute progress of one transfer attempt. Events carry totals rather
 * than deltas, so dropping an intermediate event loses nothing.
 */
struct ProgressEvent {
  std::string item_id;
  uint64_t attempt = 0;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  size_t chunks_completed = 0;
  size_t total_chunks = 0;
  std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now();
};

/**
 * Bounded multi-producer channel between transfer workers and the
 * progress dispatcher.
 *
 * post() never blocks: when the channel is full the oldest event is
 * discarded. receive() blocks the consumer until an event arrives, the
 * timeout elapses or the channel is closed.
 */
class ProgressChannel {
public:
  explicit ProgressChannel(size_t capacity = 1024);

  ProgressChannel(const ProgressChannel&) = delete;
  ProgressChannel& operator=(const ProgressChannel&) = delete;

  /**
   * @return false if the event was not queued without loss (channel closed
   *         or an older event was dropped to make room)
   */
  bool post(ProgressEvent event);

  std::optional<ProgressEvent> receive(std::chrono::milliseconds timeout);

  /**
   * Take everything queued without waiting.
   */
  std::vector<ProgressEvent> drain();

  /**
   * Wake the consumer; later posts are rejected. Queued events stay
   * available to receive() and drain().
   */
  void close();

  bool isClosed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }
  uint64_t droppedCount() const { return dropped_.load(); }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> events_;
  bool closed_ = false;
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_PROGRESS_CHANNEL_HPP
