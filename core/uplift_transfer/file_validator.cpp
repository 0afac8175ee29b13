// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_validator.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <set>
#include <sstream>

#include "mime_types.hpp"

#define UPLIFT_LOG_COMPONENT "file_validator"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace transfer {

namespace {

const std::set<std::string>& executableExtensions() {
  static const std::set<std::string> exts = {
    "exe", "com", "bat", "cmd", "scr", "pif", "vbs", "js", "jar", "app",
    "deb", "pkg", "dmg", "msi", "ps1", "sh", "dll",
  };
  return exts;
}

const std::set<std::string>& serverScriptExtensions() {
  static const std::set<std::string> exts = {
    "php", "phtml", "asp", "aspx", "jsp", "py", "rb", "pl", "cgi",
  };
  return exts;
}

const std::set<std::string>& reservedDeviceNames() {
  static const std::set<std::string> names = {
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
    "COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
  };
  return names;
}

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

std::string toLower(const std::vector<uint8_t>& bytes) {
  std::string s(bytes.begin(), bytes.end());
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

uint32_t readBigEndian32(const std::vector<uint8_t>& b, size_t pos) {
  return (static_cast<uint32_t>(b[pos]) << 24) | (static_cast<uint32_t>(b[pos + 1]) << 16) |
         (static_cast<uint32_t>(b[pos + 2]) << 8) | static_cast<uint32_t>(b[pos + 3]);
}

uint32_t readBigEndian16(const std::vector<uint8_t>& b, size_t pos) {
  return (static_cast<uint32_t>(b[pos]) << 8) | static_cast<uint32_t>(b[pos + 1]);
}

uint32_t readLittleEndian16(const std::vector<uint8_t>& b, size_t pos) {
  return static_cast<uint32_t>(b[pos]) | (static_cast<uint32_t>(b[pos + 1]) << 8);
}

// Walks JPEG segments up to the first start-of-frame marker.
std::optional<ImageDimensions> jpegDimensions(const std::vector<uint8_t>& data) {
  size_t pos = 2;
  while (pos + 9 < data.size()) {
    if (data[pos] != 0xFF) {
      return std::nullopt;
    }
    const uint8_t marker = data[pos + 1];
    if (marker == 0xFF) {
      ++pos;
      continue;
    }
    const uint32_t length = readBigEndian16(data, pos + 2);
    if (marker >= 0xC0 && marker <= 0xC3) {
      return ImageDimensions{readBigEndian16(data, pos + 7), readBigEndian16(data, pos + 5)};
    }
    if (length < 2) {
      return std::nullopt;
    }
    pos += 2 + length;
  }
  return std::nullopt;
}

uint32_t countPdfPages(const std::string& content) {
  uint32_t pages = 0;
  for (const std::string needle : {"/type /page", "/type/page"}) {
    size_t pos = content.find(needle);
    while (pos != std::string::npos) {
      const size_t after = pos + needle.size();
      if (after >= content.size() || content[after] != 's') {
        ++pages;
      }
      pos = content.find(needle, after);
    }
  }
  return pages;
}

}  // namespace

bool ValidationResult::hasError(ValidationErrorKind kind) const {
  return std::any_of(errors.begin(), errors.end(), [kind](const Diagnostic& d) {
    return d.kind == kind;
  });
}

bool ValidationResult::hasWarning(const std::string& code) const {
  return std::any_of(warnings.begin(), warnings.end(), [&code](const Diagnostic& d) {
    return d.code == code;
  });
}

std::string ValidationResult::summary() const {
  std::ostringstream oss;
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      oss << "; ";
    }
    oss << errors[i].message;
  }
  return oss.str();
}

FileValidator::FileValidator(ValidatorConfig config)
    : config_(std::move(config)) {
  if (config_.allowed_types.empty()) {
    config_.allowed_types = defaultAllowedTypes();
  }
}

ValidationResult FileValidator::validate(
  const IFileSource& source, std::optional<uint64_t> max_size_override
) {
  const FileInfo info = source.info();
  const uint64_t max_size = max_size_override.value_or(config_.max_size);
  const CacheKey key{
    info.name, info.size, info.last_modified.time_since_epoch().count(), max_size
  };

  if (config_.enable_cache) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      cache_hits_.fetch_add(1);
      return it->second;
    }
  }

  ValidationResult result = runChecks(source, info, max_size);

  if (!result.accepted) {
    UPLIFT_LOG_INFO(
      "File rejected" << kv("file", info.name) << kv("errors", result.errors.size())
                      << kv("reason", result.summary())
    );
  } else if (!result.warnings.empty()) {
    UPLIFT_LOG_DEBUG(
      "File accepted with warnings" << kv("file", info.name)
                                    << kv("warnings", result.warnings.size())
    );
  }

  if (config_.enable_cache) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[key] = result;
  }
  return result;
}

ValidationResult FileValidator::runChecks(
  const IFileSource& source, const FileInfo& info, uint64_t max_size
) {
  ValidationResult result;
  result.metadata.size = info.size;
  result.metadata.extension = extensionOf(info.name);
  result.metadata.declared_type =
    info.mime_type.empty() ? mimeTypeForExtension(result.metadata.extension) : info.mime_type;
  result.metadata.category = categoryOf(result.metadata.declared_type);

  FileInfo effective = info;
  effective.mime_type = result.metadata.declared_type;

  const bool read_header = info.size > 0 && (config_.check_content_signature || config_.check_security);
  const std::string& type = effective.mime_type;
  const bool scan_content = info.size > 0 &&
                            ((config_.check_security && isTextBased(type)) ||
                             sameMimeType(type, "application/pdf") ||
                             sameMimeType(type, "image/jpeg"));

  // I/O-bound checks start first and overlap with the metadata checks.
  std::future<std::vector<uint8_t>> header_future;
  std::future<std::vector<uint8_t>> content_future;
  if (read_header) {
    header_future = std::async(std::launch::async, [&source, this] {
      return source.read(0, config_.header_bytes);
    });
  }
  if (scan_content) {
    content_future = std::async(std::launch::async, [&source, this] {
      return source.read(0, config_.scan_bytes);
    });
  }

  checkSize(info, max_size, result);
  checkType(effective, result);
  checkFilename(info, result);
  if (config_.check_security) {
    checkNameSecurity(info, result);
  }

  if (header_future.valid()) {
    try {
      checkHeader(effective, header_future.get(), result);
    } catch (const std::exception& e) {
      result.addError(ValidationErrorKind::UNREADABLE, std::string("Cannot read file: ") + e.what(), "content");
    }
  }
  if (content_future.valid()) {
    try {
      checkContent(effective, content_future.get(), result);
    } catch (const std::exception& e) {
      if (!result.hasError(ValidationErrorKind::UNREADABLE)) {
        result.addError(ValidationErrorKind::UNREADABLE, std::string("Cannot read file: ") + e.what(), "content");
      }
    }
  }

  runCustomRules(source, result);
  result.accepted = result.errors.empty();
  return result;
}

void FileValidator::checkSize(const FileInfo& info, uint64_t max_size, ValidationResult& result) const {
  if (info.size == 0) {
    result.addError(ValidationErrorKind::EMPTY, "File is empty", "size");
    return;
  }
  if (info.size > max_size) {
    result.addError(
      ValidationErrorKind::TOO_LARGE,
      "File size " + formatBytes(info.size) + " exceeds maximum allowed size of " +
        formatBytes(max_size),
      "size"
    );
  }
}

void FileValidator::checkType(const FileInfo& info, ValidationResult& result) const {
  if (info.mime_type.empty()) {
    result.addError(ValidationErrorKind::INVALID_TYPE, "Unable to determine file type", "type");
    return;
  }

  const bool allowed = std::any_of(
    config_.allowed_types.begin(), config_.allowed_types.end(),
    [&info](const std::string& pattern) { return mimeMatches(pattern, info.mime_type); }
  );
  if (!allowed) {
    result.addError(
      ValidationErrorKind::INVALID_TYPE, "File type " + info.mime_type + " is not allowed", "type"
    );
  }

  const std::string extension = extensionOf(info.name);
  if (extension.empty()) {
    result.addWarning("MISSING_EXTENSION", "File has no extension", "name");
    return;
  }
  const std::string expected = mimeTypeForExtension(extension);
  if (expected.empty()) {
    result.addWarning("UNKNOWN_EXTENSION", "Unrecognized file extension ." + extension, "name");
  } else if (!sameMimeType(expected, info.mime_type)) {
    result.addWarning(
      "EXTENSION_MISMATCH",
      "Extension ." + extension + " does not match declared type " + info.mime_type, "name"
    );
  }
}

void FileValidator::checkFilename(const FileInfo& info, ValidationResult& result) const {
  const std::string& name = info.name;
  if (name.empty()) {
    result.addError(ValidationErrorKind::INVALID_FILENAME, "File name is empty", "name");
    return;
  }
  if (name.size() > config_.max_filename_length) {
    result.addError(
      ValidationErrorKind::INVALID_FILENAME,
      "File name exceeds " + std::to_string(config_.max_filename_length) + " characters", "name"
    );
  }

  const bool has_control = std::any_of(name.begin(), name.end(), [](unsigned char c) {
    return c < 0x20 || c == 0x7F;
  });
  if (has_control) {
    result.addError(
      ValidationErrorKind::INVALID_FILENAME, "File name contains control characters", "name"
    );
  }
  if (name.find_first_of("/\\") != std::string::npos) {
    result.addError(
      ValidationErrorKind::INVALID_FILENAME, "File name contains path separators", "name"
    );
  }
  if (name.find_first_of("<>:\"|?*") != std::string::npos) {
    result.addError(
      ValidationErrorKind::INVALID_FILENAME, "File name contains invalid characters", "name"
    );
  }

  std::string stem = toUpper(name.substr(0, name.find('.')));
  while (!stem.empty() && stem.back() == ' ') {
    stem.pop_back();
  }
  if (reservedDeviceNames().count(stem) > 0) {
    result.addError(
      ValidationErrorKind::INVALID_FILENAME, "File name uses reserved device name " + stem, "name"
    );
  }

  if (name.front() == '.') {
    result.addWarning("HIDDEN_FILE", "File name starts with a dot", "name");
  }
  if (name.back() == '.' || name.back() == ' ') {
    result.addWarning("TRAILING_CHARACTER", "File name ends with a dot or space", "name");
  }
}

void FileValidator::checkNameSecurity(const FileInfo& info, ValidationResult& result) const {
  const auto extensions = extensionsOf(info.name);
  if (extensions.empty()) {
    return;
  }

  const std::string& last = extensions.back();
  if (executableExtensions().count(last) > 0) {
    result.addError(
      ValidationErrorKind::SECURITY_FLAGGED, "Executable file type ." + last + " is not allowed",
      "name"
    );
  } else if (serverScriptExtensions().count(last) > 0) {
    result.addError(
      ValidationErrorKind::SECURITY_FLAGGED, "Script file type ." + last + " is not allowed",
      "name"
    );
  }

  for (size_t i = 0; i + 1 < extensions.size(); ++i) {
    if (executableExtensions().count(extensions[i]) > 0) {
      result.addError(
        ValidationErrorKind::SECURITY_FLAGGED,
        "Double extension hides executable type ." + extensions[i], "name"
      );
      break;
    }
  }
}

void FileValidator::checkHeader(
  const FileInfo& info, const std::vector<uint8_t>& header, ValidationResult& result
) const {
  const auto detected = detectMimeType(header);
  if (detected) {
    result.metadata.detected_type = *detected;
  }

  if (config_.check_content_signature && hasKnownSignature(info.mime_type) &&
      !signatureMatches(info.mime_type, header)) {
    std::string message = "File content does not match declared type " + info.mime_type;
    if (detected) {
      message += " (detected " + *detected + ")";
    }
    result.addError(ValidationErrorKind::CONTENT_MISMATCH, message, "content");
  } else if (config_.check_content_signature && detected && !hasKnownSignature(info.mime_type) &&
             categoryOf(*detected) != categoryOf(info.mime_type)) {
    result.addWarning(
      "CONTENT_TYPE_SUSPECT", "Content looks like " + *detected + " but declared " + info.mime_type,
      "content"
    );
  }

  if (detected && *detected == "image/png" && header.size() >= 24) {
    result.metadata.dimensions = ImageDimensions{readBigEndian32(header, 16), readBigEndian32(header, 20)};
  } else if (detected && *detected == "image/gif" && header.size() >= 10) {
    result.metadata.dimensions = ImageDimensions{readLittleEndian16(header, 6), readLittleEndian16(header, 8)};
  }
}

void FileValidator::checkContent(
  const FileInfo& info, const std::vector<uint8_t>& content, ValidationResult& result
) const {
  if (config_.check_security && isTextBased(info.mime_type)) {
    const std::string lowered = toLower(content);
    for (const char* pattern : {"<script", "<iframe", "<object", "<embed", "javascript:"}) {
      if (lowered.find(pattern) != std::string::npos) {
        result.addError(
          ValidationErrorKind::SECURITY_FLAGGED,
          std::string("Embedded script content detected (") + pattern + ")", "content"
        );
        break;
      }
    }
  }

  if (sameMimeType(info.mime_type, "application/pdf")) {
    const std::string lowered = toLower(content);
    const uint32_t pages = countPdfPages(lowered);
    if (pages > 0) {
      result.metadata.page_count = pages;
    }
    if (lowered.find("/javascript") != std::string::npos) {
      result.addWarning("PDF_JAVASCRIPT", "PDF contains embedded JavaScript", "content");
    }
  } else if (sameMimeType(info.mime_type, "image/jpeg") && !result.metadata.dimensions) {
    result.metadata.dimensions = jpegDimensions(content);
  }
}

void FileValidator::runCustomRules(const IFileSource& source, ValidationResult& result) {
  std::vector<std::pair<std::string, CustomRule>> rules;
  {
    std::lock_guard<std::mutex> lock(rules_mutex_);
    rules = custom_rules_;
  }

  for (const auto& [name, rule] : rules) {
    try {
      ValidationResult custom = rule(source);
      for (auto& error : custom.errors) {
        if (!error.kind) {
          error.kind = ValidationErrorKind::CUSTOM_RULE_FAILED;
          error.code = validationErrorKindToString(ValidationErrorKind::CUSTOM_RULE_FAILED);
        }
        result.errors.push_back(error);
      }
      result.warnings.insert(result.warnings.end(), custom.warnings.begin(), custom.warnings.end());
    } catch (const std::exception& e) {
      UPLIFT_LOG_WARN("Custom validation rule threw" << kv("rule", name) << kv("error", e.what()));
      result.addError(
        ValidationErrorKind::CUSTOM_RULE_FAILED,
        "Custom rule '" + name + "' failed: " + e.what(), "custom"
      );
    }
  }
}

void FileValidator::addCustomRule(const std::string& name, CustomRule rule) {
  {
    std::lock_guard<std::mutex> lock(rules_mutex_);
    custom_rules_.emplace_back(name, std::move(rule));
  }
  clearCache();
}

void FileValidator::clearCache() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_.clear();
}

size_t FileValidator::cacheSize() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

}  // namespace transfer
}  // namespace uplift
