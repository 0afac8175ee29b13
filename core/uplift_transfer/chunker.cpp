// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunker.hpp"

#include <algorithm>
#include <stdexcept>

namespace uplift {
namespace transfer {

std::vector<ChunkDescriptor> Chunker::split(uint64_t total_bytes, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }

  std::vector<ChunkDescriptor> chunks;
  chunks.reserve(chunkCount(total_bytes, chunk_size));

  if (total_bytes == 0) {
    chunks.push_back(ChunkDescriptor{});
    return chunks;
  }

  for (uint64_t start = 0; start < total_bytes; start += chunk_size) {
    ChunkDescriptor chunk;
    chunk.index = chunks.size();
    chunk.start = start;
    chunk.end = std::min(start + chunk_size, total_bytes);
    chunks.push_back(chunk);
  }
  return chunks;
}

size_t Chunker::chunkCount(uint64_t total_bytes, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }
  if (total_bytes == 0) {
    return 1;
  }
  return static_cast<size_t>((total_bytes + chunk_size - 1) / chunk_size);
}

uint64_t Chunker::bytesCompleted(const std::vector<ChunkDescriptor>& chunks) {
  uint64_t total = 0;
  for (const auto& chunk : chunks) {
    if (chunk.status == ChunkStatus::COMPLETED) {
      total += chunk.size();
    }
  }
  return total;
}

size_t Chunker::completedCount(const std::vector<ChunkDescriptor>& chunks) {
  return static_cast<size_t>(
    std::count_if(chunks.begin(), chunks.end(), [](const ChunkDescriptor& c) {
      return c.status == ChunkStatus::COMPLETED;
    })
  );
}

std::optional<size_t> Chunker::firstIncomplete(const std::vector<ChunkDescriptor>& chunks) {
  for (const auto& chunk : chunks) {
    if (chunk.status != ChunkStatus::COMPLETED) {
      return chunk.index;
    }
  }
  return std::nullopt;
}

bool Chunker::matchesLayout(
  const std::vector<ChunkDescriptor>& chunks, uint64_t total_bytes, uint64_t chunk_size
) {
  if (chunk_size == 0 || chunks.size() != chunkCount(total_bytes, chunk_size)) {
    return false;
  }
  const auto expected = split(total_bytes, chunk_size);
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].index != expected[i].index || chunks[i].start != expected[i].start ||
        chunks[i].end != expected[i].end) {
      return false;
    }
  }
  return true;
}

}  // namespace transfer
}  // namespace uplift
