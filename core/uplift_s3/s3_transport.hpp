// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_S3_TRANSPORT_HPP
#define UPLIFT_S3_TRANSPORT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "transfer_interfaces.hpp"

namespace uplift {
namespace s3 {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "https://play.min.io"; empty for AWS S3
  std::string bucket;
  std::string region = "us-east-1";
  std::string prefix;  // prepended to every object key
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // The transfer engine retries chunks itself, so SDK retries stay off.
  int max_sdk_retries = 0;
};

/**
 * S3 rejects multipart parts below this size, except the last one.
 */
constexpr uint64_t kMinPartSize = 5 * 1024 * 1024;
constexpr size_t kMaxParts = 10000;

/**
 * Transport backed by S3-compatible object storage.
 *
 * Whole files go out as a single PutObject. Chunked files use a multipart
 * upload that is created lazily by the first chunk of a file: chunk i is
 * part i + 1 and its ETag is the chunk etag. finalizeChunks() completes the
 * multipart upload and abortChunks() aborts it.
 *
 * Safe for concurrent calls.
 */
class S3Transport : public transfer::ITransport {
public:
  /**
   * @throws std::invalid_argument if bucket is empty
   */
  explicit S3Transport(const S3Config& config);
  ~S3Transport() override;

  S3Transport(const S3Transport&) = delete;
  S3Transport& operator=(const S3Transport&) = delete;
  S3Transport(S3Transport&&) = delete;
  S3Transport& operator=(S3Transport&&) = delete;

  transfer::TransportResult uploadWhole(
    const std::string& file_id, const transfer::IFileSource& source,
    const transfer::CancellationToken& token, const transfer::ProgressCallback& progress
  ) override;

  transfer::TransportResult uploadChunk(
    const std::string& file_id, const transfer::FileInfo& file,
    const transfer::ChunkDescriptor& chunk, const std::vector<uint8_t>& bytes,
    const transfer::CancellationToken& token
  ) override;

  transfer::TransportResult finalizeChunks(
    const std::string& file_id, const transfer::FileInfo& file,
    const std::vector<std::string>& etags_by_index, const transfer::CancellationToken& token
  ) override;

  void abortChunks(const std::string& file_id) override;

  bool supportsProgress() const override { return true; }

  /**
   * Check if an object exists in the bucket
   */
  bool objectExists(const std::string& key);

  const std::string& bucket() const;
  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace s3
}  // namespace uplift

#endif  // UPLIFT_S3_TRANSPORT_HPP
