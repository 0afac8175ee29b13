// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

#define UPLIFT_LOG_COMPONENT "config_parser"
#include <uplift_log_init.hpp>
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace cli {

namespace {

std::chrono::milliseconds as_millis(const YAML::Node& node) {
  return std::chrono::milliseconds(node.as<int64_t>());
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

// ============================================================================
// Byte sizes
// ============================================================================

std::optional<uint64_t> parse_byte_size(const std::string& text) {
  size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  const size_t number_start = pos;
  while (pos < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
    ++pos;
  }
  if (pos == number_start) {
    return std::nullopt;
  }

  double value = 0.0;
  try {
    value = std::stod(text.substr(number_start, pos - number_start));
  } catch (const std::exception&) {
    return std::nullopt;
  }

  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  std::string suffix = lower(text.substr(pos));
  while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.back()))) {
    suffix.pop_back();
  }

  double multiplier = 0.0;
  if (suffix.empty() || suffix == "b") {
    multiplier = 1.0;
  } else if (suffix == "kb") {
    multiplier = 1e3;
  } else if (suffix == "mb") {
    multiplier = 1e6;
  } else if (suffix == "gb") {
    multiplier = 1e9;
  } else if (suffix == "kib" || suffix == "k") {
    multiplier = 1024.0;
  } else if (suffix == "mib" || suffix == "m") {
    multiplier = 1024.0 * 1024.0;
  } else if (suffix == "gib" || suffix == "g") {
    multiplier = 1024.0 * 1024.0 * 1024.0;
  } else {
    return std::nullopt;
  }

  const double bytes = value * multiplier;
  if (!std::isfinite(bytes) || bytes < 0.0 || bytes > 1.8e19) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(std::llround(bytes));
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UpliftConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    if (!load_from_string(YAML::Dump(yaml), config)) {
      return false;
    }
    UPLIFT_LOG_DEBUG("Configuration loaded" << kv("path", path));
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UpliftConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Configuration root must be a mapping";
      return false;
    }

    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    if (node["queue"] && !parse_queue(node["queue"], config.queue)) {
      return false;
    }
    if (node["transfer"] && !parse_transfer(node["transfer"], config.queue.transfer)) {
      return false;
    }
    if (node["validation"] && !parse_validation(node["validation"], config.queue.validation)) {
      return false;
    }
    if (node["progress"] && !parse_progress(node["progress"], config)) {
      return false;
    }
    if (node["transport"] && !parse_transport(node["transport"], config.transport)) {
      return false;
    }
    if (node["report"]) {
      config.report_path = node["report"].as<std::string>();
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_size(const YAML::Node& node, const std::string& field, uint64_t& out) {
  auto size = parse_byte_size(node.as<std::string>());
  if (!size) {
    last_error_ = "Invalid size for " + field + ": " + node.as<std::string>();
    return false;
  }
  out = *size;
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, transfer::RetryConfig& retry) {
  if (node["policy"]) {
    const auto name = node["policy"].as<std::string>();
    auto policy = transfer::backoffPolicyFromString(lower(name));
    if (!policy) {
      last_error_ = "Unknown retry policy: " + name + " (expected none, fixed or exponential)";
      return false;
    }
    retry.policy = *policy;
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay = as_millis(node["initial_delay_ms"]);
  }
  if (node["max_delay_ms"]) {
    retry.max_delay = as_millis(node["max_delay_ms"]);
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  if (node["jitter_factor"]) {
    retry.jitter_factor = node["jitter_factor"].as<double>();
  }
  return true;
}

bool ConfigParser::parse_queue(const YAML::Node& node, transfer::QueueConfig& queue) {
  if (node["max_concurrent"]) {
    queue.max_concurrent = node["max_concurrent"].as<size_t>();
  }
  if (node["max_files"]) {
    queue.max_files = node["max_files"].as<size_t>();
  }
  if (node["max_retries"]) {
    queue.max_retries = node["max_retries"].as<int>();
  }
  if (node["priority"]) {
    queue.default_priority = node["priority"].as<int>();
  }
  if (node["auto_start"]) {
    queue.auto_start = node["auto_start"].as<bool>();
  }
  if (node["auto_retry"]) {
    queue.auto_retry = node["auto_retry"].as<bool>();
  }
  if (node["pause_on_error"]) {
    queue.pause_on_error = node["pause_on_error"].as<bool>();
  }
  if (node["auto_clear_after_ms"]) {
    queue.auto_clear_after = as_millis(node["auto_clear_after_ms"]);
  }
  if (node["progress_channel_capacity"]) {
    queue.progress_channel_capacity = node["progress_channel_capacity"].as<size_t>();
  }
  if (node["retry"] && !parse_retry(node["retry"], queue.retry)) {
    return false;
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, transfer::TransferConfig& transfer) {
  if (node["chunk_size"] && !parse_size(node["chunk_size"], "transfer.chunk_size", transfer.chunk_size)) {
    return false;
  }
  if (node["chunk_threshold"] &&
      !parse_size(node["chunk_threshold"], "transfer.chunk_threshold", transfer.chunk_threshold)) {
    return false;
  }
  if (node["max_concurrent_chunks"]) {
    transfer.max_concurrent_chunks = node["max_concurrent_chunks"].as<size_t>();
  }
  if (node["max_chunk_retries"]) {
    transfer.max_chunk_retries = node["max_chunk_retries"].as<int>();
  }
  if (node["chunk_timeout_ms"]) {
    transfer.chunk_timeout = as_millis(node["chunk_timeout_ms"]);
  }
  if (node["item_timeout_ms"]) {
    transfer.item_timeout = as_millis(node["item_timeout_ms"]);
  }
  if (node["retry"] && !parse_retry(node["retry"], transfer.chunk_retry)) {
    return false;
  }

  if (node["simulated_progress"]) {
    const auto& simulated = node["simulated_progress"];
    if (simulated["interval_ms"]) {
      transfer.simulated_progress_interval = as_millis(simulated["interval_ms"]);
    }
    if (simulated["time_constant_ms"]) {
      transfer.simulated_progress_time_constant = as_millis(simulated["time_constant_ms"]);
    }
    if (simulated["cap"]) {
      transfer.simulated_progress_cap = simulated["cap"].as<double>();
    }
  }
  return true;
}

bool ConfigParser::parse_validation(
  const YAML::Node& node, transfer::ValidatorConfig& validation
) {
  if (node["max_size"] && !parse_size(node["max_size"], "validation.max_size", validation.max_size)) {
    return false;
  }
  if (node["allowed_types"]) {
    if (!node["allowed_types"].IsSequence()) {
      last_error_ = "validation.allowed_types must be a sequence";
      return false;
    }
    validation.allowed_types.clear();
    for (const auto& type : node["allowed_types"]) {
      validation.allowed_types.push_back(type.as<std::string>());
    }
  }
  if (node["max_filename_length"]) {
    validation.max_filename_length = node["max_filename_length"].as<size_t>();
  }
  if (node["check_content_signature"]) {
    validation.check_content_signature = node["check_content_signature"].as<bool>();
  }
  if (node["check_security"]) {
    validation.check_security = node["check_security"].as<bool>();
  }
  if (node["enable_cache"]) {
    validation.enable_cache = node["enable_cache"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_progress(const YAML::Node& node, UpliftConfig& config) {
  auto& progress = config.queue.progress;
  if (node["window_ms"]) {
    progress.window = as_millis(node["window_ms"]);
  }
  if (node["max_samples"]) {
    progress.max_samples = node["max_samples"].as<size_t>();
  }
  if (node["min_samples_for_eta"]) {
    progress.min_samples_for_eta = node["min_samples_for_eta"].as<size_t>();
  }
  if (node["min_elapsed_for_eta_ms"]) {
    progress.min_elapsed_for_eta = as_millis(node["min_elapsed_for_eta_ms"]);
  }
  if (node["tick_ms"]) {
    config.progress_interval = as_millis(node["tick_ms"]);
  }
  return true;
}

bool ConfigParser::parse_transport(const YAML::Node& node, TransportSettings& transport) {
  if (node["type"]) {
    transport.type = lower(node["type"].as<std::string>());
  }

  if (node["local"]) {
    const auto& local = node["local"];
    if (local["staging_dir"]) {
      transport.local.staging_dir = local["staging_dir"].as<std::string>();
    }
    if (local["destination_dir"]) {
      transport.local.destination_dir = local["destination_dir"].as<std::string>();
    }
    if (local["overwrite"]) {
      transport.local.overwrite = local["overwrite"].as<bool>();
    }
    if (local["simulated_latency_ms"]) {
      transport.local.simulated_latency = as_millis(local["simulated_latency_ms"]);
    }
  }

  if (node["s3"]) {
    const auto& s3 = node["s3"];
    if (s3["endpoint_url"]) {
      transport.s3.endpoint_url = s3["endpoint_url"].as<std::string>();
    }
    if (s3["bucket"]) {
      transport.s3.bucket = s3["bucket"].as<std::string>();
    }
    if (s3["region"]) {
      transport.s3.region = s3["region"].as<std::string>();
    }
    if (s3["prefix"]) {
      transport.s3.prefix = s3["prefix"].as<std::string>();
    }
    if (s3["use_ssl"]) {
      transport.s3.use_ssl = s3["use_ssl"].as<bool>();
    }
    if (s3["verify_ssl"]) {
      transport.s3.verify_ssl = s3["verify_ssl"].as<bool>();
    }
    if (s3["access_key"]) {
      transport.s3.access_key = s3["access_key"].as<std::string>();
    }
    if (s3["secret_key"]) {
      transport.s3.secret_key = s3["secret_key"].as<std::string>();
    }
    if (s3["connect_timeout_ms"]) {
      transport.s3.connect_timeout_ms = s3["connect_timeout_ms"].as<int>();
    }
    if (s3["request_timeout_ms"]) {
      transport.s3.request_timeout_ms = s3["request_timeout_ms"].as<int>();
    }
  }

  return true;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

bool validate_retry(
  const transfer::RetryConfig& retry, const std::string& section, std::string& error_msg
) {
  if (retry.initial_delay.count() < 0) {
    error_msg = "Invalid " + section + ".initial_delay_ms - must be >= 0";
    return false;
  }
  if (retry.max_delay < retry.initial_delay) {
    error_msg = "Invalid " + section + ".max_delay_ms - must be >= initial_delay_ms";
    return false;
  }
  if (retry.exponential_base < 1.0) {
    error_msg = "Invalid " + section + ".exponential_base - must be >= 1";
    return false;
  }
  if (retry.jitter_factor < 0.0 || retry.jitter_factor >= 1.0) {
    error_msg = "Invalid " + section + ".jitter_factor - must be in [0, 1)";
    return false;
  }
  return true;
}

}  // namespace

bool ConfigParser::validate(const UpliftConfig& config, std::string& error_msg) {
  const auto& queue = config.queue;
  const auto& transfer = queue.transfer;

  if (queue.max_concurrent < 1 || queue.max_concurrent > 64) {
    error_msg = "Invalid queue.max_concurrent - must be between 1 and 64";
    return false;
  }
  if (queue.max_retries < 0 || queue.max_retries > 100) {
    error_msg = "Invalid queue.max_retries - must be between 0 and 100";
    return false;
  }
  if (queue.progress_channel_capacity == 0) {
    error_msg = "Invalid queue.progress_channel_capacity - must be > 0";
    return false;
  }
  if (queue.auto_clear_after.count() < 0) {
    error_msg = "Invalid queue.auto_clear_after_ms - must be >= 0";
    return false;
  }
  if (!validate_retry(queue.retry, "queue.retry", error_msg)) {
    return false;
  }

  if (transfer.chunk_size == 0) {
    error_msg = "Invalid transfer.chunk_size - must be > 0";
    return false;
  }
  if (transfer.max_concurrent_chunks < 1 || transfer.max_concurrent_chunks > 64) {
    error_msg = "Invalid transfer.max_concurrent_chunks - must be between 1 and 64";
    return false;
  }
  if (transfer.max_chunk_retries < 0 || transfer.max_chunk_retries > 100) {
    error_msg = "Invalid transfer.max_chunk_retries - must be between 0 and 100";
    return false;
  }
  if (transfer.chunk_timeout.count() < 0 || transfer.item_timeout.count() < 0) {
    error_msg = "Invalid transfer timeouts - must be >= 0";
    return false;
  }
  if (transfer.simulated_progress_cap <= 0.0 || transfer.simulated_progress_cap >= 1.0) {
    error_msg = "Invalid transfer.simulated_progress.cap - must be in (0, 1)";
    return false;
  }
  if (transfer.simulated_progress_interval.count() <= 0 ||
      transfer.simulated_progress_time_constant.count() <= 0) {
    error_msg = "Invalid transfer.simulated_progress - interval and time constant must be > 0";
    return false;
  }
  if (!validate_retry(transfer.chunk_retry, "transfer.retry", error_msg)) {
    return false;
  }

  if (queue.validation.max_size == 0) {
    error_msg = "Invalid validation.max_size - must be > 0";
    return false;
  }
  if (queue.validation.max_filename_length == 0) {
    error_msg = "Invalid validation.max_filename_length - must be > 0";
    return false;
  }

  if (queue.progress.window.count() <= 0) {
    error_msg = "Invalid progress.window_ms - must be > 0";
    return false;
  }
  if (queue.progress.max_samples < 2) {
    error_msg = "Invalid progress.max_samples - must be >= 2";
    return false;
  }
  if (config.progress_interval.count() <= 0) {
    error_msg = "Invalid progress.tick_ms - must be > 0";
    return false;
  }

  return validate_transport_config(config, error_msg);
}

bool ConfigParser::validate_transport_config(const UpliftConfig& config, std::string& error_msg) {
  const auto& transport = config.transport;

  if (transport.type == "local") {
    if (transport.local.destination_dir.empty()) {
      error_msg = "transport.local.destination_dir is empty";
      return false;
    }
    if (transport.local.staging_dir.empty()) {
      error_msg = "transport.local.staging_dir is empty";
      return false;
    }
    return true;
  }

  if (transport.type != "s3") {
    error_msg = "Unknown transport.type '" + transport.type + "' - must be 'local' or 's3'";
    return false;
  }

  if (transport.s3.bucket.empty()) {
    error_msg = "S3 transport selected but s3.bucket is not configured";
    return false;
  }

  if (!transport.s3.endpoint_url.empty()) {
    if (transport.s3.endpoint_url.find("http://") != 0 &&
        transport.s3.endpoint_url.find("https://") != 0) {
      error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
      return false;
    }
  }

  // Every part except the last must meet the S3 minimum
  const auto& transfer = config.queue.transfer;
  if (transfer.chunk_size < s3::kMinPartSize) {
    error_msg = "Invalid transfer.chunk_size for S3 - parts must be at least 5 MiB";
    return false;
  }
  const uint64_t max_parts =
    (config.queue.validation.max_size + transfer.chunk_size - 1) / transfer.chunk_size;
  if (max_parts > s3::kMaxParts) {
    error_msg = "validation.max_size / transfer.chunk_size exceeds the S3 limit of 10000 parts";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingSettings& yaml_config, logging::LoggingConfig& log_config
) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (lower(yaml_config.file_format) == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = yaml_config.max_files;
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace cli
}  // namespace uplift
