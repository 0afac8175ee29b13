// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_TRANSFER_INTERFACES_HPP
#define UPLIFT_TRANSFER_INTERFACES_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

/**
 * Read-only access to caller-owned file bytes and metadata.
 */
class IFileSource {
public:
  virtual ~IFileSource() = default;

  virtual FileInfo info() const = 0;

  /**
   * Read up to length bytes starting at offset. Returns fewer bytes only at
   * end of file.
   *
   * @throws std::runtime_error on I/O failure
   */
  virtual std::vector<uint8_t> read(uint64_t offset, size_t length) const = 0;
};

/**
 * @param bytes_transferred Bytes sent so far
 * @param total_bytes Payload size
 */
using ProgressCallback = std::function<void(uint64_t bytes_transferred, uint64_t total_bytes)>;

/**
 * Result of a transport call. value holds the etag for chunk uploads and
 * the object location for whole-file uploads and finalize.
 */
struct TransportResult {
  bool success = false;
  std::string value;
  TransferError error;

  static TransportResult Success(const std::string& value) { return {true, value, {}}; }

  static TransportResult Failure(const TransferError& error) { return {false, "", error}; }
};

/**
 * Remote endpoint that receives whole files or byte-range chunks.
 *
 * Implementations must be safe for concurrent calls: chunks of one file and
 * calls for different files arrive from several threads at once. Every call
 * receives the run's cancellation token and should return promptly once it
 * is cancelled.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual TransportResult uploadWhole(
    const std::string& file_id, const IFileSource& source, const CancellationToken& token,
    const ProgressCallback& progress
  ) = 0;

  /**
   * Upload one byte range. file is the same for every chunk of a file_id.
   */
  virtual TransportResult uploadChunk(
    const std::string& file_id, const FileInfo& file, const ChunkDescriptor& chunk,
    const std::vector<uint8_t>& bytes, const CancellationToken& token
  ) = 0;

  /**
   * Combine previously uploaded chunks. etags_by_index[i] belongs to chunk i.
   */
  virtual TransportResult finalizeChunks(
    const std::string& file_id, const FileInfo& file,
    const std::vector<std::string>& etags_by_index, const CancellationToken& token
  ) = 0;

  /**
   * Discard chunks of an upload that will never be finalized. Best effort.
   */
  virtual void abortChunks(const std::string& file_id) { (void)file_id; }

  /**
   * Whether uploadWhole() reports byte progress through its callback.
   */
  virtual bool supportsProgress() const { return false; }
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_TRANSFER_INTERFACES_HPP
