// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_RETRY_HANDLER_HPP
#define UPLIFT_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>

#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

enum class BackoffPolicy {
  NONE,         // retry immediately
  FIXED,        // initial_delay every time
  EXPONENTIAL,  // initial_delay * base^retry, capped at max_delay
};

inline std::string backoffPolicyToString(BackoffPolicy policy) {
  switch (policy) {
    case BackoffPolicy::NONE:
      return "none";
    case BackoffPolicy::FIXED:
      return "fixed";
    case BackoffPolicy::EXPONENTIAL:
      return "exponential";
  }
  return "unknown";
}

inline std::optional<BackoffPolicy> backoffPolicyFromString(const std::string& str) {
  if (str == "none") return BackoffPolicy::NONE;
  if (str == "fixed") return BackoffPolicy::FIXED;
  if (str == "exponential") return BackoffPolicy::EXPONENTIAL;
  return std::nullopt;
}

/**
 * Backoff between attempts. Retry budgets belong to the caller
 * (TransferConfig::max_chunk_retries, QueueConfig::max_retries).
 */
struct RetryConfig {
  BackoffPolicy policy = BackoffPolicy::EXPONENTIAL;
  std::chrono::milliseconds initial_delay{500};
  std::chrono::milliseconds max_delay{30000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.2;  // delay scaled by a factor in [1-f, 1+f]
};

/**
 * Retry policy shared by chunk retries and queue auto-retry.
 *
 * Thread-safe: getDelay() may be called from several chunk workers at once.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * Delay before retry number retry_count + 1 (retry_count is 0-indexed).
   */
  std::chrono::milliseconds getDelay(int retry_count) const {
    double delay_ms = 0.0;
    switch (config_.policy) {
      case BackoffPolicy::NONE:
        return std::chrono::milliseconds(0);
      case BackoffPolicy::FIXED:
        delay_ms = static_cast<double>(config_.initial_delay.count());
        break;
      case BackoffPolicy::EXPONENTIAL:
        delay_ms = static_cast<double>(config_.initial_delay.count()) *
                   std::pow(config_.exponential_base, static_cast<double>(std::max(retry_count, 0)));
        break;
    }

    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    if (config_.jitter && delay_ms > 0.0) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_real_distribution<> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      delay_ms *= dist(rng_);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay_ms, 0.0)));
  }

  /**
   * Network, server and timeout failures are retried when the transport
   * marked them retryable. Cancellation and local I/O failures never are.
   */
  static bool isRetryableError(const TransferError& error) {
    switch (error.kind) {
      case TransferErrorKind::NETWORK:
      case TransferErrorKind::SERVER:
      case TransferErrorKind::TIMEOUT:
        return error.retryable;
      case TransferErrorKind::CANCELLED:
      case TransferErrorKind::IO:
        return false;
    }
    return false;
  }

  /**
   * Transient S3/HTTP error codes.
   */
  static bool isRetryableErrorCode(const std::string& error_code) {
    static const std::set<std::string> retryable = {
      "RequestTimeout",
      "ServiceUnavailable",
      "InternalError",
      "SlowDown",
      "RequestTimeTooSkewed",
      "OperationAborted",
      "ConnectionReset",
      "ConnectionTimeout",
      "ConnectionRefused",
      "NetworkingError",
      "Throttling",
      "ThrottlingException",
      "TransientError",
    };
    return retryable.count(error_code) > 0;
  }

  const RetryConfig& config() const { return config_; }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_RETRY_HANDLER_HPP
