// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_source.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "mime_types.hpp"

namespace fs = std::filesystem;

namespace uplift {
namespace transfer {

namespace {

std::chrono::system_clock::time_point toSystemClock(fs::file_time_type ftime) {
  // file_clock has no portable conversion in C++17; rebase through now().
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
  );
}

}  // namespace

LocalFileSource::LocalFileSource(const std::string& path, const std::string& mime_type)
    : path_(path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw std::runtime_error("Not a regular file: " + path);
  }
  info_.name = fs::path(path).filename().string();
  info_.size = static_cast<uint64_t>(fs::file_size(path, ec));
  if (ec) {
    throw std::runtime_error("Cannot stat file: " + path + ": " + ec.message());
  }
  auto mtime = fs::last_write_time(path, ec);
  if (!ec) {
    info_.last_modified = toSystemClock(mtime);
  }
  info_.mime_type = mime_type.empty() ? mimeTypeForFilename(info_.name) : mime_type;
}

std::vector<uint8_t> LocalFileSource::read(uint64_t offset, size_t length) const {
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open file: " + path_);
  }
  file.seekg(static_cast<std::streamoff>(offset));
  if (!file) {
    throw std::runtime_error("Cannot seek in file: " + path_);
  }

  std::vector<uint8_t> buffer(length);
  file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
  if (file.bad()) {
    throw std::runtime_error("Read failed: " + path_);
  }
  buffer.resize(static_cast<size_t>(file.gcount()));
  return buffer;
}

MemoryFileSource::MemoryFileSource(
  const std::string& name, std::vector<uint8_t> data, const std::string& mime_type,
  std::chrono::system_clock::time_point last_modified
)
    : data_(std::move(data)) {
  info_.name = name;
  info_.size = data_.size();
  info_.mime_type = mime_type.empty() ? mimeTypeForFilename(name) : mime_type;
  info_.last_modified = last_modified;
}

std::vector<uint8_t> MemoryFileSource::read(uint64_t offset, size_t length) const {
  if (offset >= data_.size()) {
    return {};
  }
  const size_t available = data_.size() - static_cast<size_t>(offset);
  const size_t count = std::min(length, available);
  auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
  return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count));
}

}  // namespace transfer
}  // namespace uplift
