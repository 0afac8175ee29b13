// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for Chunker
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "chunker.hpp"

using namespace uplift::transfer;

namespace {

void expectContiguous(const std::vector<ChunkDescriptor>& chunks, uint64_t total) {
  ASSERT_FALSE(chunks.empty());
  uint64_t expected_start = 0;
  uint64_t sum = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].index, i);
    EXPECT_EQ(chunks[i].start, expected_start);
    EXPECT_GE(chunks[i].end, chunks[i].start);
    EXPECT_EQ(chunks[i].status, ChunkStatus::PENDING);
    EXPECT_EQ(chunks[i].retry_count, 0);
    expected_start = chunks[i].end;
    sum += chunks[i].size();
  }
  EXPECT_EQ(chunks.back().end, total);
  EXPECT_EQ(sum, total);
}

}  // namespace

TEST(ChunkerTest, ExactMultiple) {
  auto chunks = Chunker::split(5 * MiB, MiB);
  ASSERT_EQ(chunks.size(), 5u);
  expectContiguous(chunks, 5 * MiB);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.size(), MiB);
  }
}

TEST(ChunkerTest, LastChunkShorter) {
  auto chunks = Chunker::split(2500, 1000);
  ASSERT_EQ(chunks.size(), 3u);
  expectContiguous(chunks, 2500);
  EXPECT_EQ(chunks[2].start, 2000u);
  EXPECT_EQ(chunks[2].size(), 500u);
}

TEST(ChunkerTest, SmallerThanChunk) {
  auto chunks = Chunker::split(10, 1000);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].start, 0u);
  EXPECT_EQ(chunks[0].end, 10u);
}

TEST(ChunkerTest, EmptyFileYieldsSingleEmptyChunk) {
  auto chunks = Chunker::split(0, 1000);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].start, 0u);
  EXPECT_EQ(chunks[0].end, 0u);
  EXPECT_EQ(chunks[0].size(), 0u);
}

TEST(ChunkerTest, ZeroChunkSizeThrows) {
  EXPECT_THROW(Chunker::split(100, 0), std::invalid_argument);
  EXPECT_THROW(Chunker::chunkCount(100, 0), std::invalid_argument);
}

TEST(ChunkerTest, ContiguousForAssortedSizes) {
  const std::vector<uint64_t> totals = {1, 7, 999, 1000, 1001, 4096, 65537, 3 * MiB + 17};
  const std::vector<uint64_t> sizes = {1, 3, 512, 1000, 4096, MiB};
  for (uint64_t total : totals) {
    for (uint64_t size : sizes) {
      SCOPED_TRACE("total=" + std::to_string(total) + " chunk=" + std::to_string(size));
      auto chunks = Chunker::split(total, size);
      EXPECT_EQ(chunks.size(), Chunker::chunkCount(total, size));
      expectContiguous(chunks, total);
    }
  }
}

TEST(ChunkerTest, ProgressHelpers) {
  auto chunks = Chunker::split(2500, 1000);
  EXPECT_EQ(Chunker::bytesCompleted(chunks), 0u);
  EXPECT_EQ(Chunker::completedCount(chunks), 0u);
  EXPECT_EQ(Chunker::firstIncomplete(chunks), 0u);

  chunks[0].status = ChunkStatus::COMPLETED;
  chunks[2].status = ChunkStatus::COMPLETED;
  EXPECT_EQ(Chunker::bytesCompleted(chunks), 1500u);
  EXPECT_EQ(Chunker::completedCount(chunks), 2u);
  EXPECT_EQ(Chunker::firstIncomplete(chunks), 1u);

  chunks[1].status = ChunkStatus::COMPLETED;
  EXPECT_FALSE(Chunker::firstIncomplete(chunks).has_value());
}

TEST(ChunkerTest, MatchesLayout) {
  auto chunks = Chunker::split(2500, 1000);
  chunks[0].status = ChunkStatus::COMPLETED;
  chunks[0].etag = "abc";
  EXPECT_TRUE(Chunker::matchesLayout(chunks, 2500, 1000));
  EXPECT_FALSE(Chunker::matchesLayout(chunks, 2600, 1000));
  EXPECT_FALSE(Chunker::matchesLayout(chunks, 2500, 500));
  EXPECT_FALSE(Chunker::matchesLayout({}, 2500, 1000));
}
