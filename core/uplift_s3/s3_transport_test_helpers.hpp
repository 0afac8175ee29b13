// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_S3_TRANSPORT_TEST_HELPERS_HPP
#define UPLIFT_S3_TRANSPORT_TEST_HELPERS_HPP

// Testing only: internal helpers defined in s3_transport.cpp

#include <string>

#include "s3_transport.hpp"
#include "transfer_types.hpp"

namespace uplift {
namespace s3 {

/**
 * Object key for a file: prefix joined to the file name with one '/'.
 */
std::string objectKeyFor(const std::string& prefix, const std::string& filename);

/**
 * Public location of an object, "s3://bucket/key" or endpoint/bucket/key.
 */
std::string objectUrl(const S3Config& config, const std::string& key);

/**
 * Map an SDK error to a transfer error.
 *
 * @param request_made false when no HTTP response was received
 * @param sdk_should_retry the SDK's own retry hint
 */
transfer::TransferError classifyS3Error(
  const std::string& exception_name, const std::string& message, bool request_made,
  bool sdk_should_retry
);

}  // namespace s3
}  // namespace uplift

#endif  // UPLIFT_S3_TRANSPORT_TEST_HELPERS_HPP
