// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_channel.hpp"

#include <stdexcept>
#include <utility>

#define UPLIFT_LOG_COMPONENT "progress_channel"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace transfer {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("ProgressChannel capacity must be greater than zero");
  }
}

bool ProgressChannel::post(ProgressEvent event) {
  bool lossless = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (events_.size() >= capacity_) {
      events_.pop_front();
      dropped_.fetch_add(1);
      lossless = false;
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
  if (!lossless) {
    UPLIFT_LOG_WARN_EVERY_N(
      1000, "Progress channel full, dropping oldest events" << kv("capacity", capacity_)
                                                             << kv("dropped", dropped_.load())
    );
  }
  return lossless;
}

std::optional<ProgressEvent> ProgressChannel::receive(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
  if (events_.empty()) {
    return std::nullopt;
  }
  ProgressEvent event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProgressEvent> result(
    std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end())
  );
  events_.clear();
  return result;
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ProgressChannel::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ProgressChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace transfer
}  // namespace uplift
