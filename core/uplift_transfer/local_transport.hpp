// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_LOCAL_TRANSPORT_HPP
#define UPLIFT_LOCAL_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "transfer_interfaces.hpp"

namespace uplift {
namespace transfer {

/**
 * Hex SHA-256 of a buffer. Empty string if OpenSSL fails.
 */
std::string sha256Hex(const std::vector<uint8_t>& data);

/**
 * Hex SHA-256 of a file's contents. Empty string if the file cannot be read.
 */
std::string sha256File(const std::string& path);

struct LocalTransportConfig {
  std::string staging_dir = "/tmp/uplift/staging";
  std::string destination_dir = "/tmp/uplift/uploads";
  bool overwrite = true;
  std::chrono::milliseconds simulated_latency{0};  // per call, for demos and tests
};

/**
 * Transport that "uploads" into a local directory.
 *
 * Chunks are written as part files under staging_dir/<file_id>/ and their
 * etag is the SHA-256 of the part. finalizeChunks() re-hashes every part
 * against the etag list, concatenates them in index order into
 * destination_dir/<filename> and removes the staging directory.
 *
 * Safe for concurrent calls.
 */
class LocalDirectoryTransport : public ITransport {
public:
  explicit LocalDirectoryTransport(LocalTransportConfig config);

  TransportResult uploadWhole(
    const std::string& file_id, const IFileSource& source, const CancellationToken& token,
    const ProgressCallback& progress
  ) override;

  TransportResult uploadChunk(
    const std::string& file_id, const FileInfo& file, const ChunkDescriptor& chunk,
    const std::vector<uint8_t>& bytes, const CancellationToken& token
  ) override;

  TransportResult finalizeChunks(
    const std::string& file_id, const FileInfo& file,
    const std::vector<std::string>& etags_by_index, const CancellationToken& token
  ) override;

  void abortChunks(const std::string& file_id) override;

  bool supportsProgress() const override { return true; }

  std::string stagingPath(const std::string& file_id) const;
  std::string partPath(const std::string& file_id, size_t index) const;
  std::string destinationPath(const std::string& filename) const;

  const LocalTransportConfig& config() const { return config_; }

private:
  /**
   * Sleep simulated_latency. Returns false if the token was cancelled.
   */
  bool simulateLatency(const CancellationToken& token) const;

  TransportResult stopped(const CancellationToken& token) const;

  LocalTransportConfig config_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_LOCAL_TRANSPORT_HPP
