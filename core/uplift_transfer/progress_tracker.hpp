// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_PROGRESS_TRACKER_HPP
#define UPLIFT_PROGRESS_TRACKER_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace uplift {
namespace transfer {

struct ProgressTrackerConfig {
  std::chrono::milliseconds window{30000};  // throughput sliding window
  size_t max_samples = 20;
  size_t min_samples_for_eta = 3;
  std::chrono::milliseconds min_elapsed_for_eta{2000};
};

/**
 * Immutable aggregate at one point in time. Always replaced, never mutated.
 */
struct ProgressSnapshot {
  double percentage = 0.0;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  double bytes_per_second = 0.0;
  double peak_bytes_per_second = 0.0;
  std::optional<double> eta_seconds;  // unknown until throughput is measurable
  bool complete = false;
  size_t active_files = 0;
  size_t total_files = 0;
  std::chrono::milliseconds elapsed{0};
};

/**
 * Aggregates absolute per-file byte counts into per-file and overall
 * percentage, throughput and ETA.
 *
 * Throughput is averaged over a sliding window ending at the query time,
 * so it decays while no bytes move. Every method takes an optional
 * time point so the math can be driven deterministically.
 *
 * Thread-safe; snapshots are consistent copies.
 */
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit ProgressTracker(ProgressTrackerConfig config = {});

  /**
   * Start tracking a file, or re-arm a completed one for another attempt.
   */
  void registerFile(const std::string& id, uint64_t total_bytes, TimePoint now = Clock::now());

  /**
   * Record the absolute byte count of a file. Decreases (a restarted
   * attempt) are accepted but do not count toward throughput. Unknown ids
   * are ignored.
   */
  void update(const std::string& id, uint64_t bytes_transferred, TimePoint now = Clock::now());

  void markComplete(const std::string& id, TimePoint now = Clock::now());

  /**
   * Stop tracking a file (cancelled or removed items).
   */
  void removeFile(const std::string& id);

  bool contains(const std::string& id) const;

  std::shared_ptr<const ProgressSnapshot> snapshot(TimePoint now = Clock::now()) const;

  /**
   * @return nullptr if id is not tracked
   */
  std::shared_ptr<const ProgressSnapshot> fileSnapshot(
    const std::string& id, TimePoint now = Clock::now()
  ) const;

  void reset();

private:
  class SpeedWindow {
  public:
    void add(TimePoint at, uint64_t cumulative, size_t max_samples, std::chrono::milliseconds window);
    double bytesPerSecond(TimePoint now, std::chrono::milliseconds window) const;
    size_t samplesSince(TimePoint since) const;
    double peak() const { return peak_; }

  private:
    std::deque<std::pair<TimePoint, uint64_t>> samples_;
    double peak_ = 0.0;
  };

  struct FileState {
    uint64_t total_bytes = 0;
    uint64_t bytes_transferred = 0;
    uint64_t cumulative = 0;  // sum of forward progress across attempts
    bool complete = false;
    TimePoint started_at;
    SpeedWindow speed;
  };

  std::shared_ptr<ProgressSnapshot> buildSnapshot(
    uint64_t bytes, uint64_t total, bool complete, const SpeedWindow& speed, TimePoint started,
    TimePoint now
  ) const;

  void advance(FileState& file, uint64_t bytes, TimePoint now);

  const ProgressTrackerConfig config_;
  mutable std::mutex mutex_;
  std::map<std::string, FileState> files_;
  SpeedWindow overall_speed_;
  uint64_t overall_cumulative_ = 0;
  std::optional<TimePoint> started_at_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_PROGRESS_TRACKER_HPP
