// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_transport.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <mutex>
#include <stdexcept>

#include "retry_handler.hpp"
#include "s3_transport_test_helpers.hpp"

#define UPLIFT_LOG_COMPONENT "s3_transport"
#include <uplift_log_macros.hpp>

using uplift::logging::kv;

namespace uplift {
namespace s3 {

using transfer::CancellationToken;
using transfer::ChunkDescriptor;
using transfer::FileInfo;
using transfer::TransferError;
using transfer::TransportResult;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must run exactly once per process while any client
// lives, so the SDK is reference counted across transports.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

std::string objectKeyFor(const std::string& prefix, const std::string& filename) {
  const size_t first = filename.find_first_not_of('/');
  const std::string name = first == std::string::npos ? "" : filename.substr(first);
  if (prefix.empty()) {
    return name;
  }
  std::string base = prefix;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (base.empty()) {
    return name;
  }
  return base + "/" + name;
}

std::string objectUrl(const S3Config& config, const std::string& key) {
  if (config.endpoint_url.empty()) {
    return "s3://" + config.bucket + "/" + key;
  }
  std::string endpoint = config.endpoint_url;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint + "/" + config.bucket + "/" + key;
}

TransferError classifyS3Error(
  const std::string& exception_name, const std::string& message, bool request_made,
  bool sdk_should_retry
) {
  std::string text = message.empty() ? exception_name : message;
  if (!exception_name.empty() && !message.empty()) {
    text = exception_name + ": " + message;
  }
  if (text.empty()) {
    text = "S3 request failed";
  }

  if (!request_made) {
    return TransferError::network(text, true);
  }
  if (exception_name == "RequestTimeout") {
    return TransferError::timeout(text);
  }
  const bool retryable =
    transfer::RetryHandler::isRetryableErrorCode(exception_name) || sdk_should_retry;
  return TransferError::server(text, retryable);
}

namespace {

TransportResult stopped(const CancellationToken& token) {
  if (token.isStopRequested()) {
    return TransportResult::Failure(TransferError::cancelled());
  }
  return TransportResult::Failure(TransferError::timeout("Deadline expired"));
}

template <typename Outcome>
TransportResult failure(const Outcome& outcome, const CancellationToken& token) {
  if (token.isCancelled()) {
    return stopped(token);
  }
  const auto& error = outcome.GetError();
  const bool request_made =
    error.GetResponseCode() != Aws::Http::HttpResponseCode::REQUEST_NOT_MADE;
  return TransportResult::Failure(classifyS3Error(
    error.GetExceptionName(), error.GetMessage(), request_made, error.ShouldRetry()
  ));
}

std::shared_ptr<Aws::IOStream> bodyFrom(const std::vector<uint8_t>& bytes) {
  auto body = Aws::MakeShared<Aws::StringStream>("uplift");
  body->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return body;
}

}  // namespace

// =============================================================================
// S3Transport Implementation
// =============================================================================

class S3Transport::Impl {
public:
  /**
   * Multipart upload of one file, shared by its concurrent chunk uploads.
   */
  struct MultipartState {
    std::mutex mutex;
    std::string key;
    std::string upload_id;
  };

  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  std::mutex uploads_mutex;
  std::map<std::string, std::shared_ptr<MultipartState>> uploads;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // SDK objects must be gone before release() may shut the SDK down
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("uplift", config.max_sdk_retries);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (MinIO and friends) need path-style addressing
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }

  std::shared_ptr<MultipartState> stateFor(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(uploads_mutex);
    auto& state = uploads[file_id];
    if (!state) {
      state = std::make_shared<MultipartState>();
    }
    return state;
  }

  std::shared_ptr<MultipartState> findState(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(uploads_mutex);
    auto it = uploads.find(file_id);
    return it == uploads.end() ? nullptr : it->second;
  }

  void forget(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(uploads_mutex);
    uploads.erase(file_id);
  }

  /**
   * Start the multipart upload on first use. Caller holds state.mutex.
   */
  TransportResult ensureStarted(
    MultipartState& state, const FileInfo& file, const CancellationToken& token
  ) {
    if (!state.upload_id.empty()) {
      return TransportResult::Success(state.upload_id);
    }

    state.key = objectKeyFor(config.prefix, file.name);
    Aws::S3::Model::CreateMultipartUploadRequest request;
    request.SetBucket(config.bucket);
    request.SetKey(state.key);
    request.SetContentType(file.mime_type.empty() ? "application/octet-stream" : file.mime_type);

    auto outcome = client->CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      return failure(outcome, token);
    }
    state.upload_id = outcome.GetResult().GetUploadId();
    UPLIFT_LOG_DEBUG("Multipart upload started" << kv("key", state.key)
                                                << kv("upload_id", state.upload_id));
    return TransportResult::Success(state.upload_id);
  }
};

S3Transport::S3Transport(const S3Config& config) {
  if (config.bucket.empty()) {
    throw std::invalid_argument("S3 bucket must not be empty");
  }

  impl_ = std::make_unique<Impl>();
  impl_->config = config;

  // Load credentials from environment if not provided
  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  UPLIFT_LOG_INFO("S3 transport ready" << kv("bucket", config.bucket)
                                       << kv("endpoint", config.endpoint_url));
}

S3Transport::~S3Transport() = default;

TransportResult S3Transport::uploadWhole(
  const std::string& file_id, const transfer::IFileSource& source,
  const CancellationToken& token, const transfer::ProgressCallback& progress
) {
  if (token.isCancelled()) {
    return stopped(token);
  }

  const FileInfo info = source.info();
  std::vector<uint8_t> bytes;
  try {
    bytes = source.read(0, static_cast<size_t>(info.size));
  } catch (const std::exception& e) {
    return TransportResult::Failure(TransferError::io(e.what()));
  }
  if (bytes.size() != info.size) {
    return TransportResult::Failure(TransferError::io(
      "Short read: got " + std::to_string(bytes.size()) + " of " + std::to_string(info.size)
    ));
  }

  const std::string key = objectKeyFor(impl_->config.prefix, info.name);
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentType(info.mime_type.empty() ? "application/octet-stream" : info.mime_type);
  request.SetContentLength(static_cast<long long>(bytes.size()));
  request.SetBody(bodyFrom(bytes));

  const uint64_t total = info.size;
  uint64_t sent = 0;
  request.SetDataSentEventHandler(
    [&sent, total, &progress](const Aws::Http::HttpRequest*, long long amount) {
      if (amount <= 0) {
        return;
      }
      sent = std::min<uint64_t>(total, sent + static_cast<uint64_t>(amount));
      if (progress) {
        progress(sent, total);
      }
    }
  );
  request.SetContinueRequestHandler([&token](const Aws::Http::HttpRequest*) {
    return !token.isCancelled();
  });

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    auto result = failure(outcome, token);
    UPLIFT_LOG_WARN("PutObject failed" << kv("file_id", file_id) << kv("key", key)
                                       << kv("error", result.error.toString()));
    return result;
  }

  UPLIFT_LOG_DEBUG("PutObject succeeded" << kv("key", key) << kv("size", total));
  return TransportResult::Success(objectUrl(impl_->config, key));
}

TransportResult S3Transport::uploadChunk(
  const std::string& file_id, const FileInfo& file, const ChunkDescriptor& chunk,
  const std::vector<uint8_t>& bytes, const CancellationToken& token
) {
  if (token.isCancelled()) {
    return stopped(token);
  }
  if (chunk.index >= kMaxParts) {
    return TransportResult::Failure(TransferError::server(
      "Chunk index " + std::to_string(chunk.index) + " exceeds the S3 part limit", false
    ));
  }

  auto state = impl_->stateFor(file_id);
  std::string key;
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    auto started = impl_->ensureStarted(*state, file, token);
    if (!started.success) {
      return started;
    }
    key = state->key;
    upload_id = state->upload_id;
  }

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(static_cast<int>(chunk.index) + 1);
  request.SetContentLength(static_cast<long long>(bytes.size()));
  request.SetBody(bodyFrom(bytes));
  request.SetContinueRequestHandler([&token](const Aws::Http::HttpRequest*) {
    return !token.isCancelled();
  });

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failure(outcome, token);
  }
  return TransportResult::Success(outcome.GetResult().GetETag());
}

TransportResult S3Transport::finalizeChunks(
  const std::string& file_id, const FileInfo& file,
  const std::vector<std::string>& etags_by_index, const CancellationToken& token
) {
  if (token.isCancelled()) {
    return stopped(token);
  }

  auto state = impl_->findState(file_id);
  if (!state) {
    return TransportResult::Failure(
      TransferError::server("No multipart upload for " + file.name, false)
    );
  }

  std::string key;
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    key = state->key;
    upload_id = state->upload_id;
  }

  Aws::S3::Model::CompletedMultipartUpload completed;
  for (size_t i = 0; i < etags_by_index.size(); ++i) {
    completed.AddParts(Aws::S3::Model::CompletedPart()
                         .WithETag(etags_by_index[i])
                         .WithPartNumber(static_cast<int>(i) + 1));
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    auto result = failure(outcome, token);
    UPLIFT_LOG_WARN("CompleteMultipartUpload failed"
                    << kv("key", key) << kv("error", result.error.toString()));
    return result;
  }

  impl_->forget(file_id);
  UPLIFT_LOG_INFO("Multipart upload completed" << kv("key", key)
                                               << kv("parts", etags_by_index.size()));
  return TransportResult::Success(objectUrl(impl_->config, key));
}

void S3Transport::abortChunks(const std::string& file_id) {
  auto state = impl_->findState(file_id);
  if (!state) {
    return;
  }

  std::string key;
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    key = state->key;
    upload_id = state->upload_id;
  }
  impl_->forget(file_id);
  if (upload_id.empty()) {
    return;
  }

  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    UPLIFT_LOG_WARN("AbortMultipartUpload failed" << kv("key", key)
                                                  << kv("error", outcome.GetError().GetMessage()));
  }
}

bool S3Transport::objectExists(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  return outcome.IsSuccess();
}

const std::string& S3Transport::bucket() const { return impl_->config.bucket; }

const std::string& S3Transport::endpoint() const { return impl_->config.endpoint_url; }

}  // namespace s3
}  // namespace uplift
