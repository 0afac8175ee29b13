// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for LocalDirectoryTransport, LocalFileSource and the queue running
 * against a real directory
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "chunker.hpp"
#include "file_source.hpp"
#include "local_transport.hpp"
#include "test_helpers.hpp"
#include "transfer_engine.hpp"
#include "upload_queue.hpp"

using namespace uplift::transfer;
using namespace uplift::transfer::test;
namespace fs = std::filesystem;

namespace {

/**
 * Reports claimed_size bytes but can only deliver data.
 */
class TruncatedSource : public IFileSource {
public:
  TruncatedSource(std::string name, std::vector<uint8_t> data, uint64_t claimed_size)
      : name_(std::move(name))
      , data_(std::move(data))
      , claimed_size_(claimed_size) {}

  FileInfo info() const override {
    FileInfo info;
    info.name = name_;
    info.size = claimed_size_;
    info.mime_type = "application/octet-stream";
    return info;
  }

  std::vector<uint8_t> read(uint64_t offset, size_t length) const override {
    if (offset >= data_.size()) {
      return {};
    }
    const auto count = static_cast<size_t>(std::min<uint64_t>(length, data_.size() - offset));
    return std::vector<uint8_t>(data_.begin() + offset, data_.begin() + offset + count);
  }

private:
  std::string name_;
  std::vector<uint8_t> data_;
  uint64_t claimed_size_;
};

bool hasTempFiles(const std::string& dir) {
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().extension() == ".tmp") {
      return true;
    }
  }
  return false;
}

}  // namespace

class LocalTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = createTempDir("uplift_local_");
    config_.staging_dir = root_ + "/staging";
    config_.destination_dir = root_ + "/uploads";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  std::string root_;
  LocalTransportConfig config_;
  CancellationSource stop_;
};

TEST(Sha256Test, KnownDigests) {
  EXPECT_EQ(
    sha256Hex({}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
  );
  EXPECT_EQ(
    sha256Hex({'a', 'b', 'c'}),
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
  );
  EXPECT_EQ(sha256File("/nonexistent/uplift/file"), "");
}

TEST_F(LocalTransportTest, ConstructorCreatesDirectories) {
  LocalDirectoryTransport transport(config_);
  EXPECT_TRUE(fs::is_directory(config_.staging_dir));
  EXPECT_TRUE(fs::is_directory(config_.destination_dir));
  EXPECT_TRUE(transport.supportsProgress());

  LocalTransportConfig empty;
  empty.staging_dir = "";
  EXPECT_THROW(LocalDirectoryTransport{empty}, std::invalid_argument);
}

TEST_F(LocalTransportTest, WholeUploadCopiesBytes) {
  LocalDirectoryTransport transport(config_);
  auto data = patternBytes(200 * 1024);
  MemoryFileSource source("photo.bin", data);

  std::vector<uint64_t> ticks;
  auto result = transport.uploadWhole("id-1", source, stop_.token(), [&](uint64_t sent, uint64_t total) {
    EXPECT_EQ(total, data.size());
    ticks.push_back(sent);
  });

  ASSERT_TRUE(result.success) << result.error.toString();
  const std::string dest = transport.destinationPath("photo.bin");
  EXPECT_EQ(result.value, "file://" + dest);
  EXPECT_EQ(readFile(dest), data);
  ASSERT_EQ(ticks.size(), 4u);  // 64 KiB blocks
  EXPECT_EQ(ticks.back(), data.size());
}

TEST_F(LocalTransportTest, WholeUploadRejectsShortSource) {
  LocalDirectoryTransport transport(config_);
  TruncatedSource source("cut.bin", patternBytes(100 * 1024), 300 * 1024);

  auto result = transport.uploadWhole("cut", source, stop_.token(), nullptr);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, TransferErrorKind::IO);
  EXPECT_FALSE(fs::exists(transport.destinationPath("cut.bin")));
  EXPECT_FALSE(hasTempFiles(config_.destination_dir));
}

TEST_F(LocalTransportTest, FilenameCannotEscapeDestination) {
  LocalDirectoryTransport transport(config_);
  EXPECT_EQ(
    transport.destinationPath("../../etc/passwd"),
    (fs::path(config_.destination_dir) / "passwd").string()
  );
  EXPECT_EQ(transport.destinationPath(".."), (fs::path(config_.destination_dir) / "unnamed").string());
}

TEST_F(LocalTransportTest, RefusesOverwriteWhenDisabled) {
  config_.overwrite = false;
  LocalDirectoryTransport transport(config_);
  MemoryFileSource source("a.txt", {'x'});

  ASSERT_TRUE(transport.uploadWhole("1", source, stop_.token(), nullptr).success);
  auto second = transport.uploadWhole("2", source, stop_.token(), nullptr);
  EXPECT_FALSE(second.success);
  EXPECT_EQ(second.error.kind, TransferErrorKind::SERVER);
}

TEST_F(LocalTransportTest, CancelledTokenStopsUpload) {
  LocalDirectoryTransport transport(config_);
  MemoryFileSource source("a.txt", patternBytes(1024));
  stop_.requestStop(StopReason::CANCELLED);

  auto result = transport.uploadWhole("1", source, stop_.token(), nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, TransferErrorKind::CANCELLED);
  EXPECT_FALSE(fs::exists(transport.destinationPath("a.txt")));
}

TEST_F(LocalTransportTest, ChunksAssembledInIndexOrder) {
  LocalDirectoryTransport transport(config_);
  auto data = patternBytes(10000);
  auto chunks = Chunker::split(data.size(), 4096);
  ASSERT_EQ(chunks.size(), 3u);

  FileInfo info;
  info.name = "big.bin";
  info.size = data.size();
  std::vector<std::string> etags(chunks.size());
  // Upload out of order
  for (size_t i : {2u, 0u, 1u}) {
    const auto& chunk = chunks[i];
    std::vector<uint8_t> bytes(data.begin() + chunk.start, data.begin() + chunk.end);
    auto result = transport.uploadChunk("big", info, chunk, bytes, stop_.token());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value, sha256Hex(bytes));
    etags[i] = result.value;
  }
  EXPECT_TRUE(fs::exists(transport.partPath("big", 2)));

  auto result = transport.finalizeChunks("big", info, etags, stop_.token());

  ASSERT_TRUE(result.success) << result.error.toString();
  EXPECT_EQ(readFile(transport.destinationPath("big.bin")), data);
  EXPECT_FALSE(fs::exists(transport.stagingPath("big")));
}

TEST_F(LocalTransportTest, FinalizeRejectsWrongEtag) {
  LocalDirectoryTransport transport(config_);
  auto chunks = Chunker::split(100, 50);
  FileInfo info;
  info.name = "x.bin";
  info.size = 100;
  std::vector<std::string> etags;
  for (const auto& chunk : chunks) {
    auto result = transport.uploadChunk("x", info, chunk, patternBytes(50, chunk.index), stop_.token());
    ASSERT_TRUE(result.success);
    etags.push_back(result.value);
  }
  std::swap(etags[0], etags[1]);

  auto result = transport.finalizeChunks("x", info, etags, stop_.token());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, TransferErrorKind::SERVER);
  EXPECT_FALSE(fs::exists(transport.destinationPath("x.bin")));
}

TEST_F(LocalTransportTest, FinalizeRejectsMissingPartAndSizeMismatch) {
  LocalDirectoryTransport transport(config_);
  auto chunks = Chunker::split(100, 50);
  auto bytes = patternBytes(50);
  FileInfo info;
  info.name = "y.bin";
  info.size = 100;
  auto first = transport.uploadChunk("y", info, chunks[0], bytes, stop_.token());
  ASSERT_TRUE(first.success);

  EXPECT_FALSE(transport.finalizeChunks("y", info, {first.value, "missing"}, stop_.token()).success);

  auto second = transport.uploadChunk("y", info, chunks[1], bytes, stop_.token());
  ASSERT_TRUE(second.success);
  info.size = 99;
  auto result = transport.finalizeChunks("y", info, {first.value, second.value}, stop_.token());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(fs::exists(transport.destinationPath("y.bin")));
}

TEST_F(LocalTransportTest, AbortRemovesStaging) {
  LocalDirectoryTransport transport(config_);
  auto chunks = Chunker::split(100, 50);
  FileInfo info;
  info.name = "z.bin";
  info.size = 100;
  ASSERT_TRUE(transport.uploadChunk("z", info, chunks[0], patternBytes(50), stop_.token()).success);
  ASSERT_TRUE(fs::exists(transport.stagingPath("z")));

  transport.abortChunks("z");
  EXPECT_FALSE(fs::exists(transport.stagingPath("z")));
  transport.abortChunks("z");
}

TEST_F(LocalTransportTest, LocalFileSourceReadsRanges) {
  auto data = patternBytes(5000);
  const std::string path = writeFile(root_ + "/input.txt", data);

  LocalFileSource source(path);
  FileInfo info = source.info();
  EXPECT_EQ(info.name, "input.txt");
  EXPECT_EQ(info.size, 5000u);
  EXPECT_EQ(info.mime_type, "text/plain");

  auto middle = source.read(1000, 100);
  EXPECT_EQ(middle, std::vector<uint8_t>(data.begin() + 1000, data.begin() + 1100));
  EXPECT_EQ(source.read(4990, 100).size(), 10u);
  EXPECT_TRUE(source.read(6000, 10).empty());

  EXPECT_THROW(LocalFileSource(root_ + "/missing.txt"), std::runtime_error);
  EXPECT_THROW(LocalFileSource{root_}, std::runtime_error);
}

TEST_F(LocalTransportTest, EngineUploadsFileThroughDirectory) {
  auto transport = std::make_shared<LocalDirectoryTransport>(config_);
  auto data = patternBytes(3 * 1024 * 1024 + 123);
  const std::string path = writeFile(root_ + "/payload.bin", data);

  TransferConfig config;
  config.chunk_retry.jitter = false;
  TransferEngine engine("payload", std::make_shared<LocalFileSource>(path), transport, config);
  ASSERT_EQ(engine.strategy(), UploadStrategy::CHUNKED);

  TransferReport report = engine.run();

  ASSERT_EQ(report.outcome, TransferOutcome::COMPLETED)
    << (report.error ? report.error->toString() : "");
  EXPECT_EQ(report.url, "file://" + transport->destinationPath("payload.bin"));
  EXPECT_EQ(sha256File(transport->destinationPath("payload.bin")), sha256Hex(data));
}

TEST_F(LocalTransportTest, QueueUploadsManyFiles) {
  auto transport = std::make_shared<LocalDirectoryTransport>(config_);
  QueueConfig config;
  config.transfer.chunk_size = 4096;
  config.transfer.chunk_threshold = 4096;

  std::vector<std::string> ids;
  std::vector<std::vector<uint8_t>> payloads;
  {
    UploadQueue queue(transport, config);
    for (int i = 0; i < 6; ++i) {
      std::vector<uint8_t> data(1000 + i * 3000, static_cast<uint8_t>('a' + i));
      const std::string name = "doc" + std::to_string(i) + ".txt";
      auto result = queue.add(std::make_shared<LocalFileSource>(writeFile(root_ + "/" + name, data)));
      ASSERT_TRUE(result) << result.validation.summary();
      ids.push_back(result.id);
      payloads.push_back(std::move(data));
    }
    ASSERT_TRUE(queue.waitUntilIdle(std::chrono::milliseconds(20000)));
    EXPECT_EQ(queue.stats().completed, 6u);
  }

  for (size_t i = 0; i < payloads.size(); ++i) {
    EXPECT_EQ(readFile(transport->destinationPath("doc" + std::to_string(i) + ".txt")), payloads[i]);
  }
  EXPECT_TRUE(fs::is_empty(config_.staging_dir));
}
