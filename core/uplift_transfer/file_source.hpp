// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_FILE_SOURCE_HPP
#define UPLIFT_FILE_SOURCE_HPP

#include <memory>
#include <string>
#include <vector>

#include "transfer_interfaces.hpp"

namespace uplift {
namespace transfer {

/**
 * File on the local filesystem. Metadata is captured at construction; the
 * MIME type is taken from the extension when none is declared.
 */
class LocalFileSource : public IFileSource {
public:
  /**
   * @throws std::runtime_error if path does not name a regular file
   */
  explicit LocalFileSource(const std::string& path, const std::string& mime_type = "");

  FileInfo info() const override { return info_; }
  std::vector<uint8_t> read(uint64_t offset, size_t length) const override;

  const std::string& path() const { return path_; }

private:
  std::string path_;
  FileInfo info_;
};

/**
 * In-memory payload, used for generated content and tests.
 */
class MemoryFileSource : public IFileSource {
public:
  MemoryFileSource(
    const std::string& name, std::vector<uint8_t> data, const std::string& mime_type = "",
    std::chrono::system_clock::time_point last_modified = std::chrono::system_clock::now()
  );

  FileInfo info() const override { return info_; }
  std::vector<uint8_t> read(uint64_t offset, size_t length) const override;

  const std::vector<uint8_t>& data() const { return data_; }

private:
  FileInfo info_;
  std::vector<uint8_t> data_;
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_FILE_SOURCE_HPP
