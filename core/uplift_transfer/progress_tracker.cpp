// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_tracker.hpp"

#include <algorithm>

namespace uplift {
namespace transfer {

namespace {

double secondsBetween(ProgressTracker::TimePoint from, ProgressTracker::TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

}  // namespace

void ProgressTracker::SpeedWindow::add(
  TimePoint at, uint64_t cumulative, size_t max_samples, std::chrono::milliseconds window
) {
  if (!samples_.empty()) {
    const auto& last = samples_.back();
    const double span = secondsBetween(last.first, at);
    if (span > 0.0 && cumulative > last.second) {
      peak_ = std::max(peak_, static_cast<double>(cumulative - last.second) / span);
    }
  }
  samples_.emplace_back(at, cumulative);

  // Keep one sample older than the window as the baseline.
  while (samples_.size() >= 2 && samples_[1].first < at - window) {
    samples_.pop_front();
  }
  while (samples_.size() > std::max<size_t>(max_samples, 2)) {
    samples_.pop_front();
  }
}

double ProgressTracker::SpeedWindow::bytesPerSecond(
  TimePoint now, std::chrono::milliseconds window
) const {
  if (samples_.size() < 2) {
    return 0.0;
  }

  const TimePoint window_start = now - window;
  auto baseline = std::find_if(samples_.begin(), samples_.end(), [&](const auto& sample) {
    return sample.first >= window_start;
  });
  if (baseline == samples_.end()) {
    return 0.0;  // nothing moved inside the window
  }
  if (std::next(baseline) == samples_.end() && baseline != samples_.begin()) {
    --baseline;
  }

  const auto& latest = samples_.back();
  const double span = secondsBetween(baseline->first, now);
  if (span <= 0.0 || latest.second <= baseline->second) {
    return 0.0;
  }
  return static_cast<double>(latest.second - baseline->second) / span;
}

size_t ProgressTracker::SpeedWindow::samplesSince(TimePoint since) const {
  return static_cast<size_t>(std::count_if(samples_.begin(), samples_.end(), [&](const auto& s) {
    return s.first >= since;
  }));
}

ProgressTracker::ProgressTracker(ProgressTrackerConfig config)
    : config_(config) {}

void ProgressTracker::registerFile(const std::string& id, uint64_t total_bytes, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!started_at_) {
    started_at_ = now;
  }

  auto [it, inserted] = files_.try_emplace(id);
  FileState& file = it->second;
  file.total_bytes = total_bytes;
  file.complete = false;
  if (inserted) {
    file.started_at = now;
    file.speed.add(now, 0, config_.max_samples, config_.window);
  }
  overall_speed_.add(now, overall_cumulative_, config_.max_samples, config_.window);
}

void ProgressTracker::advance(FileState& file, uint64_t bytes, TimePoint now) {
  bytes = std::min(bytes, file.total_bytes);
  if (bytes > file.bytes_transferred) {
    const uint64_t delta = bytes - file.bytes_transferred;
    file.cumulative += delta;
    overall_cumulative_ += delta;
  }
  file.bytes_transferred = bytes;
  file.speed.add(now, file.cumulative, config_.max_samples, config_.window);
  overall_speed_.add(now, overall_cumulative_, config_.max_samples, config_.window);
}

void ProgressTracker::update(const std::string& id, uint64_t bytes_transferred, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(id);
  if (it == files_.end()) {
    return;
  }
  advance(it->second, bytes_transferred, now);
}

void ProgressTracker::markComplete(const std::string& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(id);
  if (it == files_.end()) {
    return;
  }
  advance(it->second, it->second.total_bytes, now);
  it->second.complete = true;
}

void ProgressTracker::removeFile(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.erase(id);
}

bool ProgressTracker::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.count(id) > 0;
}

std::shared_ptr<ProgressSnapshot> ProgressTracker::buildSnapshot(
  uint64_t bytes, uint64_t total, bool complete, const SpeedWindow& speed, TimePoint started,
  TimePoint now
) const {
  auto snap = std::make_shared<ProgressSnapshot>();
  snap->bytes_transferred = bytes;
  snap->total_bytes = total;
  snap->complete = complete;
  if (total > 0) {
    snap->percentage = std::min(100.0, 100.0 * static_cast<double>(bytes) / static_cast<double>(total));
  } else {
    snap->percentage = complete ? 100.0 : 0.0;
  }
  snap->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
  snap->bytes_per_second = speed.bytesPerSecond(now, config_.window);
  snap->peak_bytes_per_second = speed.peak();

  if (complete) {
    snap->eta_seconds = 0.0;
  } else if (snap->bytes_per_second > 0.0 &&
             speed.samplesSince(now - config_.window) >= config_.min_samples_for_eta &&
             snap->elapsed >= config_.min_elapsed_for_eta) {
    snap->eta_seconds = static_cast<double>(total - std::min(bytes, total)) / snap->bytes_per_second;
  }
  return snap;
}

std::shared_ptr<const ProgressSnapshot> ProgressTracker::snapshot(TimePoint now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t bytes = 0;
  uint64_t total = 0;
  size_t active = 0;
  for (const auto& [id, file] : files_) {
    bytes += file.bytes_transferred;
    total += file.total_bytes;
    if (!file.complete) {
      ++active;
    }
  }
  const bool complete = !files_.empty() && active == 0;
  auto snap = buildSnapshot(bytes, total, complete, overall_speed_, started_at_.value_or(now), now);
  snap->active_files = active;
  snap->total_files = files_.size();
  return snap;
}

std::shared_ptr<const ProgressSnapshot> ProgressTracker::fileSnapshot(
  const std::string& id, TimePoint now
) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(id);
  if (it == files_.end()) {
    return nullptr;
  }
  const FileState& file = it->second;
  auto snap = buildSnapshot(
    file.bytes_transferred, file.total_bytes, file.complete, file.speed, file.started_at, now
  );
  snap->active_files = file.complete ? 0 : 1;
  snap->total_files = 1;
  return snap;
}

void ProgressTracker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.clear();
  overall_speed_ = SpeedWindow{};
  overall_cumulative_ = 0;
  started_at_.reset();
}

}  // namespace transfer
}  // namespace uplift
