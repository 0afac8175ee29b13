// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_FILE_VALIDATOR_HPP
#define UPLIFT_FILE_VALIDATOR_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "transfer_interfaces.hpp"
#include "transfer_types.hpp"

namespace uplift {
namespace transfer {

struct ImageDimensions {
  uint32_t width = 0;
  uint32_t height = 0;
};

/**
 * Facts extracted while validating.
 */
struct ValidationMetadata {
  uint64_t size = 0;
  std::string category;
  std::string extension;
  std::string declared_type;
  std::string detected_type;  // from magic bytes, empty if unknown
  std::optional<ImageDimensions> dimensions;
  std::optional<uint32_t> page_count;  // estimate from the scanned prefix
};

/**
 * Accept/reject decision. accepted is false iff errors is non-empty.
 */
struct ValidationResult {
  bool accepted = true;
  std::vector<Diagnostic> errors;
  std::vector<Diagnostic> warnings;
  ValidationMetadata metadata;

  void addError(ValidationErrorKind kind, const std::string& message, const std::string& field) {
    errors.push_back(Diagnostic::error(kind, message, field));
    accepted = false;
  }

  void addWarning(const std::string& code, const std::string& message, const std::string& field) {
    warnings.push_back(Diagnostic::warning(code, message, field));
  }

  bool hasError(ValidationErrorKind kind) const;
  bool hasWarning(const std::string& code) const;

  /**
   * Error messages joined with "; ".
   */
  std::string summary() const;
};

/**
 * Caller-supplied check. Its errors block admission, its warnings are
 * kept; the returned accepted flag is ignored. A rule that throws is
 * reported as CUSTOM_VALIDATION_ERROR.
 */
using CustomRule = std::function<ValidationResult(const IFileSource& source)>;

struct ValidatorConfig {
  uint64_t max_size = 10 * MiB;
  std::vector<std::string> allowed_types;  // empty = built-in default list
  size_t max_filename_length = 255;
  bool check_content_signature = true;
  bool check_security = true;
  bool enable_cache = true;
  size_t header_bytes = 32;
  size_t scan_bytes = 64 * KiB;
};

/**
 * Classifies a candidate file before admission.
 *
 * Size, type, filename and name-based security checks run inline; the
 * header sniff and the content scan read from the source concurrently.
 * Results are cached per (name, size, last_modified, size limit) until
 * clearCache() or addCustomRule().
 *
 * Thread-safe.
 */
class FileValidator {
public:
  explicit FileValidator(ValidatorConfig config = {});

  FileValidator(const FileValidator&) = delete;
  FileValidator& operator=(const FileValidator&) = delete;

  /**
   * @param max_size_override per-call size ceiling replacing config().max_size
   */
  ValidationResult validate(
    const IFileSource& source, std::optional<uint64_t> max_size_override = std::nullopt
  );

  void addCustomRule(const std::string& name, CustomRule rule);

  void clearCache();
  size_t cacheSize() const;
  uint64_t cacheHits() const { return cache_hits_.load(); }

  const ValidatorConfig& config() const { return config_; }

private:
  using CacheKey = std::tuple<std::string, uint64_t, int64_t, uint64_t>;

  ValidationResult runChecks(const IFileSource& source, const FileInfo& info, uint64_t max_size);

  void checkSize(const FileInfo& info, uint64_t max_size, ValidationResult& result) const;
  void checkType(const FileInfo& info, ValidationResult& result) const;
  void checkFilename(const FileInfo& info, ValidationResult& result) const;
  void checkNameSecurity(const FileInfo& info, ValidationResult& result) const;
  void checkHeader(
    const FileInfo& info, const std::vector<uint8_t>& header, ValidationResult& result
  ) const;
  void checkContent(
    const FileInfo& info, const std::vector<uint8_t>& content, ValidationResult& result
  ) const;
  void runCustomRules(const IFileSource& source, ValidationResult& result);

  ValidatorConfig config_;

  std::mutex rules_mutex_;
  std::vector<std::pair<std::string, CustomRule>> custom_rules_;

  mutable std::mutex cache_mutex_;
  std::map<CacheKey, ValidationResult> cache_;
  std::atomic<uint64_t> cache_hits_{0};
};

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_FILE_VALIDATOR_HPP
