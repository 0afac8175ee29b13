// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CANCELLATION_HPP
#define UPLIFT_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace uplift {
namespace transfer {

/**
 * Why a transfer run was asked to stop. The first request wins.
 */
enum class StopReason {
  NONE,
  CANCELLED,
  PAUSED,
  ABORTED,
};

/**
 * Read side of a cooperative stop signal, optionally bounded by a deadline.
 *
 * Tokens are cheap to copy; all copies observe the same source. A token
 * created by withDeadline() additionally reports expiry once its deadline
 * passes, which callers map to a timeout.
 */
class CancellationToken {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  CancellationToken() = default;

  bool isStopRequested() const {
    return state_ && state_->reason.load() != StopReason::NONE;
  }

  StopReason reason() const { return state_ ? state_->reason.load() : StopReason::NONE; }

  bool deadlineExpired() const {
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
  }

  /**
   * Stop requested or deadline passed.
   */
  bool isCancelled() const { return isStopRequested() || deadlineExpired(); }

  std::optional<TimePoint> deadline() const { return deadline_; }

  /**
   * Copy of this token that also expires at the given time. An earlier
   * existing deadline is kept.
   */
  CancellationToken withDeadline(TimePoint deadline) const {
    CancellationToken child = *this;
    if (!child.deadline_ || deadline < *child.deadline_) {
      child.deadline_ = deadline;
    }
    return child;
  }

  /**
   * Sleep for up to duration, waking early on stop or deadline.
   *
   * @return true if the token was cancelled when the wait ended
   */
  template<typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    auto until = std::chrono::steady_clock::now() +
                 std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    if (deadline_ && *deadline_ < until) {
      until = *deadline_;
    }
    if (!state_) {
      std::this_thread::sleep_until(until);
      return deadlineExpired();
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, until, [this] {
      return state_->reason.load() != StopReason::NONE;
    });
    return isCancelled();
  }

private:
  friend class CancellationSource;

  struct State {
    std::atomic<StopReason> reason{StopReason::NONE};
    std::mutex mutex;
    std::condition_variable cv;
  };

  explicit CancellationToken(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
  std::optional<TimePoint> deadline_;
};

/**
 * Write side of the stop signal. One source per transfer run.
 */
class CancellationSource {
public:
  CancellationSource()
      : state_(std::make_shared<CancellationToken::State>()) {}

  CancellationToken token() const { return CancellationToken(state_); }

  /**
   * Request a stop. Returns false if a stop had already been requested.
   */
  bool requestStop(StopReason reason) {
    StopReason expected = StopReason::NONE;
    if (!state_->reason.compare_exchange_strong(expected, reason)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
    }
    state_->cv.notify_all();
    return true;
  }

  StopReason reason() const { return state_->reason.load(); }

private:
  std::shared_ptr<CancellationToken::State> state_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_CANCELLATION_HPP
