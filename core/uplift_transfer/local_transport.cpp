// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "local_transport.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#define UPLIFT_LOG_COMPONENT "local_transport"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace fs = std::filesystem;

namespace uplift {
namespace transfer {

namespace {

constexpr size_t kCopyBlockSize = 64 * 1024;

std::string toHex(const unsigned char* hash, unsigned int len) {
  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; ++i) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}

/**
 * Owns an EVP digest context for one SHA-256 computation.
 */
class Sha256 {
public:
  Sha256()
      : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ != nullptr && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
  }

  ~Sha256() {
    if (ctx_) {
      EVP_MD_CTX_free(ctx_);
    }
  }

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, size_t len) {
    if (ok_ && len > 0) {
      ok_ = EVP_DigestUpdate(ctx_, data, len) == 1;
    }
  }

  std::string hex() {
    if (!ok_) {
      return "";
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
      return "";
    }
    return toHex(hash, hash_len);
  }

private:
  EVP_MD_CTX* ctx_;
  bool ok_ = false;
};

std::string partName(size_t index) {
  std::ostringstream ss;
  ss << "part_" << std::setw(5) << std::setfill('0') << index;
  return ss.str();
}

/**
 * Keep only the final path component so names cannot escape the directory.
 */
std::string safeFilename(const std::string& name) {
  std::string base = fs::path(name).filename().string();
  if (base.empty() || base == "." || base == "..") {
    return "unnamed";
  }
  return base;
}

}  // namespace

std::string sha256Hex(const std::vector<uint8_t>& data) {
  Sha256 hash;
  hash.update(data.data(), data.size());
  return hash.hex();
}

std::string sha256File(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return "";
  }
  Sha256 hash;
  std::vector<char> buffer(kCopyBlockSize);
  while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
    hash.update(buffer.data(), static_cast<size_t>(file.gcount()));
  }
  return hash.hex();
}

LocalDirectoryTransport::LocalDirectoryTransport(LocalTransportConfig config)
    : config_(std::move(config)) {
  if (config_.staging_dir.empty() || config_.destination_dir.empty()) {
    throw std::invalid_argument("LocalDirectoryTransport requires staging and destination dirs");
  }
  std::error_code ec;
  fs::create_directories(config_.staging_dir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create staging dir " + config_.staging_dir + ": " + ec.message());
  }
  fs::create_directories(config_.destination_dir, ec);
  if (ec) {
    throw std::runtime_error(
      "Cannot create destination dir " + config_.destination_dir + ": " + ec.message()
    );
  }
}

std::string LocalDirectoryTransport::stagingPath(const std::string& file_id) const {
  return (fs::path(config_.staging_dir) / safeFilename(file_id)).string();
}

std::string LocalDirectoryTransport::partPath(const std::string& file_id, size_t index) const {
  return (fs::path(stagingPath(file_id)) / partName(index)).string();
}

std::string LocalDirectoryTransport::destinationPath(const std::string& filename) const {
  return (fs::path(config_.destination_dir) / safeFilename(filename)).string();
}

bool LocalDirectoryTransport::simulateLatency(const CancellationToken& token) const {
  if (config_.simulated_latency.count() <= 0) {
    return !token.isCancelled();
  }
  return !token.waitFor(config_.simulated_latency);
}

TransportResult LocalDirectoryTransport::stopped(const CancellationToken& token) const {
  if (token.isStopRequested()) {
    return TransportResult::Failure(TransferError::cancelled());
  }
  return TransportResult::Failure(TransferError::timeout("Deadline expired"));
}

TransportResult LocalDirectoryTransport::uploadWhole(
  const std::string& file_id, const IFileSource& source, const CancellationToken& token,
  const ProgressCallback& progress
) {
  if (!simulateLatency(token)) {
    return stopped(token);
  }

  const FileInfo info = source.info();
  const std::string dest = destinationPath(info.name);
  if (!config_.overwrite && fs::exists(dest)) {
    return TransportResult::Failure(TransferError::server("Destination exists: " + dest, false));
  }

  const std::string tmp = dest + "." + safeFilename(file_id) + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return TransportResult::Failure(TransferError::server("Cannot write " + tmp));
    }

    auto discard = [&out, &tmp](TransportResult result) {
      out.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      return result;
    };

    uint64_t offset = 0;
    while (offset < info.size) {
      if (token.isCancelled()) {
        return discard(stopped(token));
      }
      const size_t want = static_cast<size_t>(std::min<uint64_t>(kCopyBlockSize, info.size - offset));
      std::vector<uint8_t> block;
      try {
        block = source.read(offset, want);
      } catch (const std::exception& e) {
        return discard(TransportResult::Failure(TransferError::io(e.what())));
      }
      if (block.empty()) {
        return discard(TransportResult::Failure(TransferError::io(
          "Short read: got " + std::to_string(offset) + " of " + std::to_string(info.size) + " bytes"
        )));
      }
      out.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
      if (!out) {
        return discard(TransportResult::Failure(TransferError::server("Write failed: " + tmp)));
      }
      offset += block.size();
      if (progress) {
        progress(offset, info.size);
      }
    }
    out.close();
    if (!out) {
      return discard(TransportResult::Failure(TransferError::server("Write failed: " + tmp)));
    }
  }

  std::error_code ec;
  fs::rename(tmp, dest, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return TransportResult::Failure(TransferError::server("Cannot move into place: " + dest, false));
  }

  UPLIFT_LOG_DEBUG("Whole file stored" << kv("id", file_id) << kv("path", dest));
  return TransportResult::Success("file://" + dest);
}

TransportResult LocalDirectoryTransport::uploadChunk(
  const std::string& file_id, const FileInfo& file, const ChunkDescriptor& chunk,
  const std::vector<uint8_t>& bytes, const CancellationToken& token
) {
  (void)file;
  if (!simulateLatency(token)) {
    return stopped(token);
  }

  std::error_code ec;
  fs::create_directories(stagingPath(file_id), ec);
  if (ec) {
    return TransportResult::Failure(
      TransferError::server("Cannot create staging dir: " + ec.message())
    );
  }

  const std::string path = partPath(file_id, chunk.index);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return TransportResult::Failure(TransferError::server("Cannot write " + path));
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    return TransportResult::Failure(TransferError::server("Write failed: " + path));
  }

  return TransportResult::Success(sha256Hex(bytes));
}

TransportResult LocalDirectoryTransport::finalizeChunks(
  const std::string& file_id, const FileInfo& file,
  const std::vector<std::string>& etags_by_index, const CancellationToken& token
) {
  if (!simulateLatency(token)) {
    return stopped(token);
  }

  for (size_t i = 0; i < etags_by_index.size(); ++i) {
    const std::string actual = sha256File(partPath(file_id, i));
    if (actual.empty()) {
      return TransportResult::Failure(TransferError::server("Missing part " + std::to_string(i), false));
    }
    if (actual != etags_by_index[i]) {
      UPLIFT_LOG_ERROR("Part checksum mismatch" << kv("id", file_id) << kv("index", i));
      return TransportResult::Failure(TransferError::server("Checksum mismatch in part " + std::to_string(i), false));
    }
  }

  const std::string dest = destinationPath(file.name);
  if (!config_.overwrite && fs::exists(dest)) {
    return TransportResult::Failure(TransferError::server("Destination exists: " + dest, false));
  }

  const std::string tmp = dest + "." + safeFilename(file_id) + ".tmp";
  uint64_t written = 0;
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return TransportResult::Failure(TransferError::server("Cannot write " + tmp));
    }
    std::vector<char> buffer(kCopyBlockSize);
    for (size_t i = 0; i < etags_by_index.size(); ++i) {
      std::ifstream in(partPath(file_id, i), std::ios::binary);
      while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        out.write(buffer.data(), in.gcount());
        written += static_cast<uint64_t>(in.gcount());
      }
    }
    out.close();
    if (!out) {
      std::error_code ec;
      fs::remove(tmp, ec);
      return TransportResult::Failure(TransferError::server("Write failed: " + tmp));
    }
  }

  std::error_code ec;
  if (written != file.size) {
    fs::remove(tmp, ec);
    return TransportResult::Failure(TransferError::server(
      "Assembled " + std::to_string(written) + " bytes, expected " + std::to_string(file.size), false
    ));
  }

  fs::rename(tmp, dest, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return TransportResult::Failure(TransferError::server("Cannot move into place: " + dest, false));
  }
  fs::remove_all(stagingPath(file_id), ec);

  UPLIFT_LOG_DEBUG(
    "Chunks assembled" << kv("id", file_id) << kv("parts", etags_by_index.size())
                       << kv("path", dest)
  );
  return TransportResult::Success("file://" + dest);
}

void LocalDirectoryTransport::abortChunks(const std::string& file_id) {
  std::error_code ec;
  fs::remove_all(stagingPath(file_id), ec);
  if (ec) {
    UPLIFT_LOG_WARN("Cannot remove staging dir" << kv("id", file_id) << kv("error", ec.message()));
  }
}

}  // namespace transfer
}  // namespace uplift
