// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <stdexcept>

#include "retry_handler.hpp"
#include "s3_transport.hpp"
#include "s3_transport_test_helpers.hpp"

using namespace uplift::s3;
using uplift::transfer::RetryHandler;
using uplift::transfer::TransferErrorKind;

// ============================================================================
// Object keys and URLs
// ============================================================================

TEST(S3KeyTest, NoPrefixUsesFilename) {
  EXPECT_EQ(objectKeyFor("", "report.pdf"), "report.pdf");
}

TEST(S3KeyTest, PrefixJoinedWithSingleSlash) {
  EXPECT_EQ(objectKeyFor("uploads", "a.bin"), "uploads/a.bin");
  EXPECT_EQ(objectKeyFor("uploads/", "a.bin"), "uploads/a.bin");
  EXPECT_EQ(objectKeyFor("uploads//", "/a.bin"), "uploads/a.bin");
  EXPECT_EQ(objectKeyFor("team/2026", "a.bin"), "team/2026/a.bin");
}

TEST(S3KeyTest, SlashOnlyPrefixIgnored) {
  EXPECT_EQ(objectKeyFor("/", "a.bin"), "a.bin");
}

TEST(S3UrlTest, AwsUsesS3Scheme) {
  S3Config config;
  config.bucket = "data";
  EXPECT_EQ(objectUrl(config, "x/y.bin"), "s3://data/x/y.bin");
}

TEST(S3UrlTest, CustomEndpointIsPathStyle) {
  S3Config config;
  config.bucket = "data";
  config.endpoint_url = "http://localhost:9000/";
  EXPECT_EQ(objectUrl(config, "y.bin"), "http://localhost:9000/data/y.bin");
}

// ============================================================================
// Error classification
// ============================================================================

TEST(S3ErrorTest, NoResponseIsRetryableNetworkError) {
  auto error = classifyS3Error("", "Connection refused", false, false);
  EXPECT_EQ(error.kind, TransferErrorKind::NETWORK);
  EXPECT_TRUE(error.retryable);
  EXPECT_TRUE(RetryHandler::isRetryableError(error));
  EXPECT_EQ(error.message, "Connection refused");
}

TEST(S3ErrorTest, RequestTimeoutMapsToTimeout) {
  auto error = classifyS3Error("RequestTimeout", "slow", true, false);
  EXPECT_EQ(error.kind, TransferErrorKind::TIMEOUT);
  EXPECT_TRUE(RetryHandler::isRetryableError(error));
}

TEST(S3ErrorTest, TransientServerCodesAreRetryable) {
  for (const char* code : {"SlowDown", "ServiceUnavailable", "InternalError"}) {
    auto error = classifyS3Error(code, "try later", true, false);
    EXPECT_EQ(error.kind, TransferErrorKind::SERVER) << code;
    EXPECT_TRUE(error.retryable) << code;
  }
}

TEST(S3ErrorTest, PermanentServerCodesAreNotRetryable) {
  auto error = classifyS3Error("AccessDenied", "Access Denied", true, false);
  EXPECT_EQ(error.kind, TransferErrorKind::SERVER);
  EXPECT_FALSE(error.retryable);
  EXPECT_EQ(error.message, "AccessDenied: Access Denied");
}

TEST(S3ErrorTest, SdkRetryHintWins) {
  auto error = classifyS3Error("SomethingNew", "", true, true);
  EXPECT_TRUE(error.retryable);
  EXPECT_EQ(error.message, "SomethingNew");
}

TEST(S3ErrorTest, EmptyErrorGetsMessage) {
  auto error = classifyS3Error("", "", true, false);
  EXPECT_FALSE(error.message.empty());
}

// ============================================================================
// Construction
// ============================================================================

TEST(S3TransportTest, EmptyBucketRejected) {
  S3Config config;
  EXPECT_THROW(S3Transport transport(config), std::invalid_argument);
}

TEST(S3TransportTest, PartLimits) {
  EXPECT_EQ(kMinPartSize, 5u * 1024 * 1024);
  EXPECT_EQ(kMaxParts, 10000u);
}
