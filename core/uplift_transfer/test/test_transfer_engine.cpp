// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TransferEngine
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chunker.hpp"
#include "test_helpers.hpp"
#include "transfer_engine.hpp"
#include "transfer_mocks.hpp"

using namespace uplift::transfer;
using namespace uplift::transfer::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using std::chrono::milliseconds;

namespace {

TransferConfig fastConfig() {
  TransferConfig config;
  config.chunk_size = 1 * MiB;
  config.chunk_threshold = 1 * MiB;
  config.max_concurrent_chunks = 3;
  config.max_chunk_retries = 3;
  config.chunk_retry.policy = BackoffPolicy::FIXED;
  config.chunk_retry.initial_delay = milliseconds(5);
  config.chunk_retry.jitter = false;
  return config;
}

TransferConfig smallChunkConfig(uint64_t chunk_size = 1024) {
  TransferConfig config = fastConfig();
  config.chunk_size = chunk_size;
  config.chunk_threshold = chunk_size;
  return config;
}

std::vector<std::string> expectedEtags(size_t count) {
  std::vector<std::string> etags;
  for (size_t i = 0; i < count; ++i) {
    etags.push_back("etag-" + std::to_string(i));
  }
  return etags;
}

}  // namespace

class TransferEngineTest : public ::testing::Test {
protected:
  std::shared_ptr<ProgressChannel> channel = std::make_shared<ProgressChannel>(4096);
};

// =============================================================================
// Construction and strategy
// =============================================================================

TEST_F(TransferEngineTest, StrategyThreshold) {
  EXPECT_EQ(TransferEngine::selectStrategy(1 * MiB, 1 * MiB), UploadStrategy::WHOLE);
  EXPECT_EQ(TransferEngine::selectStrategy(1 * MiB + 1, 1 * MiB), UploadStrategy::CHUNKED);
  EXPECT_EQ(TransferEngine::selectStrategy(0, 1 * MiB), UploadStrategy::WHOLE);
}

TEST_F(TransferEngineTest, ConstructorRejectsBadArguments) {
  auto transport = std::make_shared<ScriptedTransport>();
  auto source = textSource("a.txt", 10);

  EXPECT_THROW(TransferEngine("x", nullptr, transport, fastConfig()), std::invalid_argument);
  EXPECT_THROW(TransferEngine("x", source, nullptr, fastConfig()), std::invalid_argument);

  TransferConfig zero_chunk = fastConfig();
  zero_chunk.chunk_size = 0;
  EXPECT_THROW(TransferEngine("x", source, transport, zero_chunk), std::invalid_argument);

  TransferConfig zero_workers = fastConfig();
  zero_workers.max_concurrent_chunks = 0;
  EXPECT_THROW(TransferEngine("x", source, transport, zero_workers), std::invalid_argument);
}

TEST_F(TransferEngineTest, ChunkTableBuiltForLargeFiles) {
  auto transport = std::make_shared<ScriptedTransport>();
  TransferEngine whole("w", textSource("w.txt", 100), transport, fastConfig());
  EXPECT_EQ(whole.strategy(), UploadStrategy::WHOLE);
  EXPECT_TRUE(whole.chunks().empty());
  EXPECT_EQ(whole.progress().total_chunks, 1u);

  TransferEngine chunked("c", textSource("c.txt", 2500), transport, smallChunkConfig());
  EXPECT_EQ(chunked.strategy(), UploadStrategy::CHUNKED);
  EXPECT_EQ(chunked.chunks().size(), 3u);
  EXPECT_EQ(chunked.progress().total_chunks, 3u);
  EXPECT_EQ(chunked.progress().total_bytes, 2500u);
}

// =============================================================================
// Whole-file transfers
// =============================================================================

TEST_F(TransferEngineTest, WholeFileCompletesWithNativeProgress) {
  auto transport = std::make_shared<ScriptedTransport>();
  const uint64_t size = 500 * 1000;
  TransferEngine engine("item-a", textSource("report.txt", size), transport, fastConfig(), 1, channel);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(report.url, "mem://item-a");
  EXPECT_FALSE(report.error.has_value());
  EXPECT_EQ(transport->wholeCalls(), 1);
  EXPECT_EQ(transport->totalChunkCalls(), 0);

  auto events = channel->drain();
  ASSERT_GE(events.size(), 2u);
  EXPECT_EQ(events.front().bytes_transferred, 0u);
  uint64_t last = 0;
  for (const auto& event : events) {
    EXPECT_EQ(event.item_id, "item-a");
    EXPECT_EQ(event.total_bytes, size);
    EXPECT_GE(event.bytes_transferred, last);
    last = event.bytes_transferred;
  }
  EXPECT_EQ(events.back().bytes_transferred, size);
  EXPECT_EQ(events.back().chunks_completed, 1u);

  UploadProgress progress = engine.progress();
  EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}

TEST_F(TransferEngineTest, WholeFileFailureCarriesFilename) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->failWhole(1);
  TransferEngine engine("item", textSource("notes.txt", 100), transport, fastConfig());

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::NETWORK);
  EXPECT_EQ(report.error->filename, "notes.txt");
  EXPECT_FALSE(report.error->chunk_index.has_value());
  EXPECT_EQ(transport->wholeCalls(), 1);
}

TEST_F(TransferEngineTest, WholeFileTransportExceptionBecomesNetworkError) {
  auto transport = std::make_shared<NiceMock<MockTransport>>();
  ON_CALL(*transport, supportsProgress()).WillByDefault(Return(true));
  EXPECT_CALL(*transport, uploadWhole(_, _, _, _))
    .WillOnce(Throw(std::runtime_error("socket closed")));

  TransferEngine engine("item", textSource("a.txt", 64), transport, fastConfig());
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::NETWORK);
  EXPECT_EQ(report.error->message, "socket closed");
}

TEST_F(TransferEngineTest, SimulatedProgressStaysBelowComplete) {
  auto transport = std::make_shared<NiceMock<MockTransport>>();
  ON_CALL(*transport, supportsProgress()).WillByDefault(Return(false));
  EXPECT_CALL(*transport, uploadWhole("item", _, _, _))
    .WillOnce(Invoke([](const std::string& id, const IFileSource&, const CancellationToken&,
                        const ProgressCallback& progress) {
      EXPECT_FALSE(static_cast<bool>(progress));
      std::this_thread::sleep_for(milliseconds(300));
      return TransportResult::Success("mem://" + id);
    }));

  TransferConfig config = fastConfig();
  config.simulated_progress_interval = milliseconds(10);
  config.simulated_progress_time_constant = milliseconds(100);
  config.simulated_progress_cap = 0.9;

  const uint64_t size = 100000;
  TransferEngine engine("item", textSource("a.txt", size), transport, config, 1, channel);
  TransferReport report = engine.run();
  ASSERT_EQ(report.outcome, TransferOutcome::COMPLETED);

  auto events = channel->drain();
  ASSERT_GE(events.size(), 3u);
  for (size_t i = 0; i + 1 < events.size(); ++i) {
    EXPECT_LE(events[i].bytes_transferred, static_cast<uint64_t>(0.9 * size));
  }
  bool saw_intermediate = false;
  for (const auto& event : events) {
    saw_intermediate |= event.bytes_transferred > 0 && event.bytes_transferred < size;
  }
  EXPECT_TRUE(saw_intermediate);
  EXPECT_EQ(events.back().bytes_transferred, size);
}

TEST_F(TransferEngineTest, ItemTimeoutFailsStalledUpload) {
  auto transport = std::make_shared<BlockingTransport>();
  TransferConfig config = fastConfig();
  config.item_timeout = milliseconds(100);

  TransferEngine engine("slow", textSource("slow.txt", 100), transport, config);
  const auto start = std::chrono::steady_clock::now();
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::TIMEOUT);
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(3000));
}

TEST_F(TransferEngineTest, LateWholeSuccessAfterItemTimeoutFails) {
  auto transport = std::make_shared<SlowTransport>(milliseconds(400));
  TransferConfig config = fastConfig();
  config.item_timeout = milliseconds(100);

  TransferEngine engine("late", textSource("late.txt", 100), transport, config, 1, channel);
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::TIMEOUT);
  EXPECT_TRUE(report.url.empty());
  EXPECT_EQ(transport->calls(), 1);
  for (const auto& event : channel->drain()) {
    EXPECT_LT(event.bytes_transferred, 100u);
  }
}

// =============================================================================
// Chunked transfers
// =============================================================================

TEST_F(TransferEngineTest, ChunkedUploadFinalizesOnceInOrder) {
  auto transport = std::make_shared<ScriptedTransport>();
  TransferEngine engine("big", textSource("big.bin", 5 * MiB), transport, fastConfig(), 1, channel);
  ASSERT_EQ(engine.chunks().size(), 5u);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(report.url, "mem://big");
  EXPECT_EQ(transport->finalizeCalls(), 1);
  EXPECT_EQ(transport->finalizedEtags(), expectedEtags(5));
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(transport->chunkCalls(i), 1);
  }
  EXPECT_EQ(transport->wholeCalls(), 0);

  for (const auto& chunk : engine.chunks()) {
    EXPECT_EQ(chunk.status, ChunkStatus::COMPLETED);
    EXPECT_EQ(chunk.etag, "etag-" + std::to_string(chunk.index));
  }

  auto events = channel->drain();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().bytes_transferred, 5 * MiB);
  EXPECT_EQ(events.back().chunks_completed, 5u);
  EXPECT_EQ(events.back().total_chunks, 5u);
}

TEST_F(TransferEngineTest, SequentialChunksReportMonotonicProgress) {
  auto transport = std::make_shared<ScriptedTransport>();
  TransferConfig config = smallChunkConfig();
  config.max_concurrent_chunks = 1;
  TransferEngine engine("seq", textSource("seq.bin", 4096), transport, config, 7, channel);

  ASSERT_EQ(engine.run().outcome, TransferOutcome::COMPLETED);

  auto events = channel->drain();
  ASSERT_EQ(events.size(), 6u);  // start, four chunks, finalize
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_GE(events[i].bytes_transferred, events[i - 1].bytes_transferred);
    EXPECT_EQ(events[i].attempt, 7u);
  }
}

TEST_F(TransferEngineTest, FailedChunkRetriedUntilSuccess) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->failChunk(2, 2);
  TransferEngine engine("flaky", textSource("flaky.bin", 5 * MiB), transport, fastConfig());

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(transport->chunkCalls(2), 3);
  EXPECT_EQ(engine.chunks()[2].retry_count, 2);
  EXPECT_EQ(engine.chunks()[0].retry_count, 0);
  EXPECT_EQ(transport->finalizeCalls(), 1);
  EXPECT_EQ(transport->finalizedEtags(), expectedEtags(5));
}

TEST_F(TransferEngineTest, ExhaustedChunkRetriesFailWithoutFinalize) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->failChunk(1, 100);
  TransferConfig config = smallChunkConfig();
  config.max_chunk_retries = 3;
  TransferEngine engine("doomed", textSource("doomed.bin", 4096), transport, config);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::NETWORK);
  ASSERT_TRUE(report.error->chunk_index.has_value());
  EXPECT_EQ(*report.error->chunk_index, 1u);
  EXPECT_EQ(report.error->filename, "doomed.bin");
  EXPECT_EQ(transport->chunkCalls(1), 4);
  EXPECT_EQ(transport->finalizeCalls(), 0);
  EXPECT_EQ(engine.chunks()[1].status, ChunkStatus::ERROR);
}

TEST_F(TransferEngineTest, NonRetryableChunkErrorFailsImmediately) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->setFailure(TransferError::server("forbidden", false));
  transport->failChunk(0, 1);
  TransferEngine engine("denied", textSource("denied.bin", 4096), transport, smallChunkConfig());

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::SERVER);
  EXPECT_EQ(transport->chunkCalls(0), 1);
  EXPECT_EQ(transport->finalizeCalls(), 0);
}

TEST_F(TransferEngineTest, ReadErrorFailsWithIoError) {
  auto source = std::make_shared<NiceMock<MockFileSource>>();
  FileInfo info;
  info.name = "vanished.bin";
  info.size = 4096;
  ON_CALL(*source, info()).WillByDefault(Return(info));
  ON_CALL(*source, read(_, _)).WillByDefault(Throw(std::runtime_error("disk gone")));

  auto transport = std::make_shared<ScriptedTransport>();
  TransferEngine engine("io", source, transport, smallChunkConfig());
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::IO);
  EXPECT_FALSE(report.error->retryable);
  EXPECT_EQ(transport->totalChunkCalls(), 0);
}

TEST_F(TransferEngineTest, ShortReadFailsWithIoError) {
  auto source = std::make_shared<NiceMock<MockFileSource>>();
  FileInfo info;
  info.name = "truncated.bin";
  info.size = 4096;
  ON_CALL(*source, info()).WillByDefault(Return(info));
  ON_CALL(*source, read(_, _)).WillByDefault(Return(std::vector<uint8_t>(10, 0)));

  auto transport = std::make_shared<ScriptedTransport>();
  TransferEngine engine("short", source, transport, smallChunkConfig());
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::IO);
}

TEST_F(TransferEngineTest, ChunkTimeoutRetriedThenFails) {
  auto transport = std::make_shared<BlockingTransport>();
  TransferConfig config = smallChunkConfig();
  config.chunk_timeout = milliseconds(50);
  config.max_chunk_retries = 1;
  TransferEngine engine("stuck", textSource("stuck.bin", 2048), transport, config);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::TIMEOUT);
  EXPECT_EQ(transport->finalizeCount(), 0u);
}

TEST_F(TransferEngineTest, LateChunkSuccessTreatedAsTimeout) {
  auto transport = std::make_shared<SlowTransport>(milliseconds(400));
  TransferConfig config = smallChunkConfig();
  config.chunk_timeout = milliseconds(50);
  config.max_chunk_retries = 0;
  TransferEngine engine("late", textSource("late.bin", 4096), transport, config);
  ASSERT_EQ(engine.chunks().size(), 4u);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::TIMEOUT);
  EXPECT_TRUE(report.url.empty());
  for (const auto& chunk : engine.chunks()) {
    EXPECT_NE(chunk.status, ChunkStatus::COMPLETED);
  }
}

TEST_F(TransferEngineTest, LateChunkSuccessGoesThroughRetry) {
  auto transport = std::make_shared<SlowTransport>(milliseconds(150));
  TransferConfig config = smallChunkConfig();
  config.chunk_timeout = milliseconds(50);
  config.max_chunk_retries = 2;
  config.max_concurrent_chunks = 1;
  TransferEngine engine("late", textSource("late.bin", 1024), transport, config);
  ASSERT_EQ(engine.chunks().size(), 1u);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::TIMEOUT);
  EXPECT_EQ(engine.chunks()[0].retry_count, 3);
  EXPECT_EQ(transport->calls(), 3);
}

TEST_F(TransferEngineTest, ServerErrorChunkRetriedByDefault) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->setFailure(TransferError::server("HTTP 500"));
  transport->failChunk(0, 2);
  TransferConfig config = smallChunkConfig();
  config.chunk_retry.policy = BackoffPolicy::NONE;
  TransferEngine engine("busy", textSource("busy.bin", 4096), transport, config);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(transport->chunkCalls(0), 3);
  EXPECT_EQ(transport->finalizeCalls(), 1);
}

TEST_F(TransferEngineTest, FinalizeExceptionRetriedAsNetworkError) {
  auto transport = std::make_shared<NiceMock<MockTransport>>();
  ON_CALL(*transport, uploadChunk(_, _, _, _, _))
    .WillByDefault(Invoke([](const std::string&, const FileInfo&, const ChunkDescriptor& chunk,
                             const std::vector<uint8_t>&, const CancellationToken&) {
      return TransportResult::Success("etag-" + std::to_string(chunk.index));
    }));
  EXPECT_CALL(*transport, finalizeChunks(_, _, _, _))
    .WillOnce(Throw(std::runtime_error("connection dropped")))
    .WillOnce(Return(TransportResult::Success("mem://fin")));

  TransferEngine engine("fin", textSource("fin.bin", 4096), transport, smallChunkConfig());
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(report.url, "mem://fin");
}

TEST_F(TransferEngineTest, FinalizeExceptionReportedAsNetworkError) {
  auto transport = std::make_shared<NiceMock<MockTransport>>();
  ON_CALL(*transport, uploadChunk(_, _, _, _, _))
    .WillByDefault(Return(TransportResult::Success("etag")));
  ON_CALL(*transport, finalizeChunks(_, _, _, _))
    .WillByDefault(Throw(std::runtime_error("connection dropped")));
  TransferConfig config = smallChunkConfig();
  config.max_chunk_retries = 0;

  TransferEngine engine("fin", textSource("fin.bin", 4096), transport, config);
  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::NETWORK);
  EXPECT_EQ(report.error->message, "connection dropped");
}

TEST_F(TransferEngineTest, FinalizeRetriedOnRetryableFailure) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->failFinalize(2);
  TransferEngine engine("fin", textSource("fin.bin", 4096), transport, smallChunkConfig());

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(transport->finalizeCalls(), 3);
  EXPECT_EQ(transport->totalChunkCalls(), 4);
}

TEST_F(TransferEngineTest, FinalizeGivesUpAfterRetryLimit) {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->failFinalize(100);
  TransferConfig config = smallChunkConfig();
  config.max_chunk_retries = 2;
  TransferEngine engine("fin", textSource("fin.bin", 4096), transport, config);

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::FAILED);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, TransferErrorKind::SERVER);
  EXPECT_EQ(transport->finalizeCalls(), 3);
}

TEST_F(TransferEngineTest, ConcurrentChunksCappedPerItem) {
  auto transport = std::make_shared<BlockingTransport>();
  TransferConfig config = smallChunkConfig();
  config.max_concurrent_chunks = 3;
  TransferEngine engine("wide", textSource("wide.bin", 10 * 1024), transport, config);

  auto result = std::async(std::launch::async, [&engine] { return engine.run(); });

  ASSERT_TRUE(waitFor([&] { return transport->active() == 3; }));
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(transport->active(), 3u);

  transport->open();
  TransferReport report = result.get();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(transport->peakForFile("wide"), 3u);
  EXPECT_TRUE(transport->finalized("wide"));
}

// =============================================================================
// Cancel, pause and resume
// =============================================================================

TEST_F(TransferEngineTest, CancelBeforeRunSkipsTransport) {
  auto transport = std::make_shared<ScriptedTransport>();
  TransferEngine engine("early", textSource("early.bin", 4096), transport, smallChunkConfig());
  engine.cancel();

  TransferReport report = engine.run();

  EXPECT_EQ(report.outcome, TransferOutcome::CANCELLED);
  EXPECT_FALSE(report.error.has_value());
  EXPECT_EQ(transport->totalChunkCalls(), 0);
  EXPECT_EQ(transport->finalizeCalls(), 0);
}

TEST_F(TransferEngineTest, CancelStopsChunksAndProgress) {
  auto transport = std::make_shared<BlockingTransport>();
  TransferEngine engine(
    "cancel-me", textSource("cancel.bin", 8 * 1024), transport, smallChunkConfig(), 1, channel
  );

  auto result = std::async(std::launch::async, [&engine] { return engine.run(); });
  transport->release(2);
  ASSERT_TRUE(waitFor([&] { return engine.progress().chunks_completed == 2; }));
  ASSERT_TRUE(waitFor([&] { return transport->active() > 0; }));

  engine.cancel();
  channel->drain();

  TransferReport report = result.get();

  EXPECT_EQ(report.outcome, TransferOutcome::CANCELLED);
  EXPECT_FALSE(transport->finalized("cancel-me"));
  EXPECT_EQ(channel->size(), 0u);

  size_t completed = 0;
  for (const auto& chunk : engine.chunks()) {
    EXPECT_NE(chunk.status, ChunkStatus::UPLOADING);
    EXPECT_NE(chunk.status, ChunkStatus::ERROR);
    completed += chunk.status == ChunkStatus::COMPLETED ? 1 : 0;
  }
  EXPECT_EQ(completed, 2u);
}

TEST_F(TransferEngineTest, StopIsFirstWins) {
  auto transport = std::make_shared<BlockingTransport>();
  TransferEngine engine("both", textSource("both.txt", 100), transport, fastConfig());

  auto result = std::async(std::launch::async, [&engine] { return engine.run(); });
  ASSERT_TRUE(waitFor([&] { return transport->active() == 1; }));
  engine.pause();
  engine.cancel();

  EXPECT_EQ(result.get().outcome, TransferOutcome::PAUSED);
}

TEST_F(TransferEngineTest, PauseKeepsCompletedChunksForResume) {
  auto blocking = std::make_shared<BlockingTransport>();
  TransferConfig config = smallChunkConfig();
  config.max_concurrent_chunks = 1;
  auto source = textSource("resume.bin", 5 * 1024);

  std::vector<ChunkDescriptor> saved;
  {
    TransferEngine first("resume", source, blocking, config, 1);
    auto result = std::async(std::launch::async, [&first] { return first.run(); });
    blocking->release(2);
    ASSERT_TRUE(waitFor([&] { return first.progress().chunks_completed == 2; }));
    first.pause();

    TransferReport report = result.get();
    EXPECT_EQ(report.outcome, TransferOutcome::PAUSED);
    EXPECT_FALSE(blocking->finalized("resume"));
    saved = first.chunks();
  }
  ASSERT_EQ(Chunker::completedCount(saved), 2u);
  EXPECT_EQ(saved[0].status, ChunkStatus::COMPLETED);
  EXPECT_EQ(saved[1].status, ChunkStatus::COMPLETED);

  auto scripted = std::make_shared<ScriptedTransport>();
  TransferEngine second("resume", source, scripted, config, 2, channel, saved);
  EXPECT_EQ(second.progress().chunks_completed, 2u);
  EXPECT_EQ(second.progress().bytes_transferred, 2048u);

  TransferReport report = second.run();

  EXPECT_EQ(report.outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(scripted->chunkCalls(0), 0);
  EXPECT_EQ(scripted->chunkCalls(1), 0);
  EXPECT_EQ(scripted->totalChunkCalls(), 3);
  EXPECT_EQ(scripted->finalizedEtags(), expectedEtags(5));

  auto events = channel->drain();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().bytes_transferred, 2048u);
  EXPECT_EQ(events.front().chunks_completed, 2u);
  EXPECT_EQ(events.front().attempt, 2u);
}

TEST_F(TransferEngineTest, MismatchedResumeLayoutStartsOver) {
  auto transport = std::make_shared<ScriptedTransport>();
  auto stale = Chunker::split(4096, 512);
  for (auto& chunk : stale) {
    chunk.status = ChunkStatus::COMPLETED;
    chunk.etag = "old";
  }

  TransferEngine engine("relayout", textSource("relayout.bin", 4096), transport, smallChunkConfig(), 1,
                        nullptr, stale);
  ASSERT_EQ(engine.chunks().size(), 4u);
  EXPECT_EQ(engine.progress().chunks_completed, 0u);

  EXPECT_EQ(engine.run().outcome, TransferOutcome::COMPLETED);
  EXPECT_EQ(transport->totalChunkCalls(), 4);
  EXPECT_EQ(transport->finalizedEtags(), expectedEtags(4));
}

TEST(TransferOutcomeTest, Names) {
  EXPECT_EQ(transferOutcomeToString(TransferOutcome::COMPLETED), "completed");
  EXPECT_EQ(transferOutcomeToString(TransferOutcome::FAILED), "failed");
  EXPECT_EQ(transferOutcomeToString(TransferOutcome::CANCELLED), "cancelled");
  EXPECT_EQ(transferOutcomeToString(TransferOutcome::PAUSED), "paused");
}
