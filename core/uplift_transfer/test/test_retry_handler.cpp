// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <set>

#include "retry_handler.hpp"

using namespace uplift::transfer;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    RetryConfig config;
    config.initial_delay = std::chrono::milliseconds(1000);
    config.max_delay = std::chrono::milliseconds(60000);
    config.exponential_base = 2.0;
    config.jitter = false;  // deterministic delays
    handler_ = std::make_unique<RetryHandler>(config);
  }

  std::unique_ptr<RetryHandler> handler_;
};

TEST_F(RetryHandlerTest, ExponentialBackoff) {
  EXPECT_EQ(handler_->getDelay(0).count(), 1000);
  EXPECT_EQ(handler_->getDelay(1).count(), 2000);
  EXPECT_EQ(handler_->getDelay(2).count(), 4000);
  EXPECT_EQ(handler_->getDelay(3).count(), 8000);
}

TEST_F(RetryHandlerTest, MaxDelayCap) {
  // 2^10 * 1000 ms, capped at max_delay
  EXPECT_EQ(handler_->getDelay(10).count(), 60000);
}

TEST_F(RetryHandlerTest, FixedPolicy) {
  RetryConfig config;
  config.policy = BackoffPolicy::FIXED;
  config.initial_delay = std::chrono::milliseconds(250);
  config.jitter = false;
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(0).count(), 250);
  EXPECT_EQ(handler.getDelay(4).count(), 250);
}

TEST_F(RetryHandlerTest, NonePolicy) {
  RetryConfig config;
  config.policy = BackoffPolicy::NONE;
  config.jitter = true;
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(0).count(), 0);
  EXPECT_EQ(handler.getDelay(3).count(), 0);
}

TEST_F(RetryHandlerTest, PolicyNames) {
  EXPECT_EQ(backoffPolicyToString(BackoffPolicy::EXPONENTIAL), "exponential");
  EXPECT_EQ(backoffPolicyFromString("fixed"), BackoffPolicy::FIXED);
  EXPECT_EQ(backoffPolicyFromString("none"), BackoffPolicy::NONE);
  EXPECT_FALSE(backoffPolicyFromString("linear").has_value());
}

TEST_F(RetryHandlerTest, JitterStaysInRange) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter = true;
  config.jitter_factor = 0.5;
  RetryHandler jitter_handler(config);

  std::set<int64_t> delays;
  for (int i = 0; i < 100; ++i) {
    delays.insert(jitter_handler.getDelay(0).count());
  }

  EXPECT_GT(delays.size(), 1u);
  for (auto d : delays) {
    EXPECT_GE(d, 500);
    EXPECT_LE(d, 1500);
  }
}

TEST_F(RetryHandlerTest, RetryableTransferErrors) {
  EXPECT_TRUE(RetryHandler::isRetryableError(TransferError::network("reset")));
  EXPECT_TRUE(RetryHandler::isRetryableError(TransferError::timeout("slow")));
  EXPECT_TRUE(RetryHandler::isRetryableError(TransferError::server("503")));

  EXPECT_FALSE(RetryHandler::isRetryableError(TransferError::server("403", false)));
  EXPECT_FALSE(RetryHandler::isRetryableError(TransferError::network("bad host", false)));
  EXPECT_FALSE(RetryHandler::isRetryableError(TransferError::cancelled()));
  EXPECT_FALSE(RetryHandler::isRetryableError(TransferError::io("disk gone")));
}

TEST_F(RetryHandlerTest, RetryableErrorCodes) {
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("ServiceUnavailable"));
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("InternalError"));
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("SlowDown"));
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("NetworkingError"));
  EXPECT_TRUE(RetryHandler::isRetryableErrorCode("ThrottlingException"));

  EXPECT_FALSE(RetryHandler::isRetryableErrorCode("AccessDenied"));
  EXPECT_FALSE(RetryHandler::isRetryableErrorCode("NoSuchBucket"));
  EXPECT_FALSE(RetryHandler::isRetryableErrorCode("NoSuchUpload"));
  EXPECT_FALSE(RetryHandler::isRetryableErrorCode(""));
}

TEST_F(RetryHandlerTest, ConfigAccess) {
  const auto& config = handler_->config();
  EXPECT_EQ(config.initial_delay.count(), 1000);
  EXPECT_EQ(config.max_delay.count(), 60000);
  EXPECT_EQ(config.policy, BackoffPolicy::EXPONENTIAL);
  EXPECT_FALSE(config.jitter);
}

TEST_F(RetryHandlerTest, ExponentialBaseVariations) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.max_delay = std::chrono::milliseconds(100000);
  config.exponential_base = 1.5;
  config.jitter = false;
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(0).count(), 1000);
  EXPECT_EQ(handler.getDelay(1).count(), 1500);
  EXPECT_EQ(handler.getDelay(2).count(), 2250);
}
