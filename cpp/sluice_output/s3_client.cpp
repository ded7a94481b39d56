// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <filesystem>
#include <mutex>
#include <set>

#include "credentials_provider.hpp"
#include "output_errors.hpp"

#define SLUICE_LOG_COMPONENT "s3_client"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace output {

namespace {

const char* const kAllocationTag = "SluiceS3Client";

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must be balanced and called once per process while any
// client is alive. Every S3Client holds a reference; the last one shuts the
// SDK down.
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
      // SDK logging stays off; failures are reported through sluice logging
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

std::string strip_quotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

}  // namespace

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  OutputConfig config;
  CredentialSource credential_source;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must be gone before release() may call Aws::ShutdownAPI()
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    // Endpoint without trailing slash and without the bucket name
    std::string endpoint = config.endpoint;
    while (!endpoint.empty() && endpoint.back() == '/') {
      endpoint.pop_back();
    }
    client_config.endpointOverride = endpoint;
    if (endpoint.rfind("http://", 0) == 0) {
      client_config.scheme = Aws::Http::Scheme::HTTP;
    } else {
      client_config.scheme = Aws::Http::Scheme::HTTPS;
    }

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;

    // Retry belongs to the pipeline's resume, never to the client
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    auto provider = makeCredentialsProvider(credential_source);

    // useVirtualAddressing: true = bucket.host/key, false = host/bucket/key (MinIO)
    client = Aws::MakeShared<Aws::S3::S3Client>(
      kAllocationTag,
      provider,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      !config.path_style_access
    );
  }

  void checkBucketAccess() {
    Aws::S3::Model::HeadBucketRequest request;
    request.SetBucket(config.bucket);

    auto outcome = client->HeadBucket(request);
    if (!outcome.IsSuccess()) {
      const auto& error = outcome.GetError();
      throw AuthenticationError(
        "can't call S3 API. Please check your access_key_id / secret_access_key, endpoint "
        "or bucket configuration (bucket '" +
        config.bucket + "', " + std::string(error.GetExceptionName()) + ": " +
        std::string(error.GetMessage()) + ")"
      );
    }
  }
};

S3Client::S3Client(const OutputConfig& config, const EnvLookup& env)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
  impl_->credential_source = resolveCredentials(config, env);

  SLUICE_LOG_INFO(
    "Creating S3 client" << logging::kv("endpoint", config.endpoint)
                         << logging::kv("bucket", config.bucket)
                         << logging::kv("credentials",
                                        credentialSourceName(impl_->credential_source))
  );

  impl_->initClient();
  impl_->checkBucketAccess();
}

S3Client::~S3Client() = default;

UploadResult S3Client::uploadFile(const std::string& local_path, const std::string& key) {
  std::error_code ec;
  uint64_t file_size = std::filesystem::file_size(local_path, ec);
  if (ec) {
    return UploadResult::Failure(
      "Cannot stat local file " + local_path + ": " + ec.message(), "FileNotFound", false
    );
  }

  auto body = Aws::MakeShared<Aws::FStream>(
    kAllocationTag, local_path.c_str(), std::ios_base::in | std::ios_base::binary
  );
  if (!body->good()) {
    return UploadResult::Failure("Cannot open local file " + local_path, "FileNotFound", false);
  }

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentLength(static_cast<long long>(file_size));
  request.SetContentType("application/octet-stream");
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (outcome.IsSuccess()) {
    SLUICE_LOG_DEBUG(
      "S3 upload succeeded" << logging::kv("key", key) << logging::kv("bytes", file_size)
    );
    return UploadResult::Success(strip_quotes(outcome.GetResult().GetETag()));
  }

  const auto& error = outcome.GetError();
  std::string error_code = error.GetExceptionName();
  if (error_code.empty()) {
    error_code = "TransferFailed";
  }
  std::string error_msg = error.GetMessage();
  if (error_msg.empty()) {
    error_msg = "PutObject failed with HTTP status " +
                std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  bool retryable = isRetryableError(error_code) || error.ShouldRetry();

  SLUICE_LOG_ERROR(
    "S3 upload failed" << logging::kv("key", key) << logging::kv("error", error_msg)
                       << logging::kv("code", error_code)
                       << logging::kv("retryable", retryable ? "yes" : "no")
  );
  return UploadResult::Failure(error_msg, error_code, retryable);
}

bool S3Client::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> retryable = {
    // S3/HTTP errors
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "RequestTimeTooSkewed",
    "OperationAborted",

    // Network errors
    "ConnectionReset",
    "ConnectionTimeout",
    "ConnectionRefused",
    "NetworkingError",
    "UnknownEndpoint",

    // MinIO-specific
    "XMinioServerNotInitialized",
    "XAmzContentSHA256Mismatch",

    // Generic
    "Throttling",
    "ThrottlingException",
    "TransientError"
  };
  return retryable.count(error_code) > 0;
}

const std::string& S3Client::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3Client::endpoint() const {
  return impl_->config.endpoint;
}

const CredentialSource& S3Client::credentialSource() const {
  return impl_->credential_source;
}

}  // namespace output
}  // namespace sluice
