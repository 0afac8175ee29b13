// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_CHUNKER_HPP
#define UPLIFT_CHUNKER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

/**
 * Splits a byte range into fixed-size chunk descriptors. Stateless, no I/O.
 */
class Chunker {
public:
  /**
   * Split [0, total_bytes) into contiguous chunks of chunk_size bytes; only
   * the last one may be shorter. total_bytes <= chunk_size yields a single
   * descriptor, including the empty file.
   *
   * @throws std::invalid_argument if chunk_size is 0
   */
  static std::vector<ChunkDescriptor> split(uint64_t total_bytes, uint64_t chunk_size);

  /**
   * Number of descriptors split() would return.
   */
  static size_t chunkCount(uint64_t total_bytes, uint64_t chunk_size);

  static uint64_t bytesCompleted(const std::vector<ChunkDescriptor>& chunks);
  static size_t completedCount(const std::vector<ChunkDescriptor>& chunks);

  /**
   * Index of the first chunk not yet completed, std::nullopt when all are.
   */
  static std::optional<size_t> firstIncomplete(const std::vector<ChunkDescriptor>& chunks);

  /**
   * Whether chunks is exactly the layout split(total_bytes, chunk_size)
   * would produce, ignoring status and etags.
   */
  static bool matchesLayout(
    const std::vector<ChunkDescriptor>& chunks, uint64_t total_bytes, uint64_t chunk_size
  );
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_CHUNKER_HPP
