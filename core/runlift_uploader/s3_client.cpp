// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/transfer/TransferHandle.h>
#include <aws/transfer/TransferManager.h>

#include <fstream>
#include <mutex>
#include <stdexcept>

#define RUNLIFT_LOG_COMPONENT "s3_client"
#include <runlift_log_macros.hpp>

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every SDK object in the process and may run
// only once each. Sessions reference count the SDK.
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
      if (shut_down_) {
        throw std::runtime_error("AWS SDK was already shut down in this process");
      }
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
      ++init_count_;
      RUNLIFT_LOG_DEBUG("AWS SDK initialised");
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
        shut_down_ = true;
        RUNLIFT_LOG_DEBUG("AWS SDK shut down");
      }
    }
  }

  int initCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return init_count_;
  }

  bool active() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  bool shut_down_ = false;
  int ref_count_ = 0;
  int init_count_ = 0;
  Aws::SDKOptions options_;
};

AwsSdkSession::AwsSdkSession() { AwsSdkManager::instance().addRef(); }

AwsSdkSession::~AwsSdkSession() { AwsSdkManager::instance().release(); }

int AwsSdkSession::initCount() { return AwsSdkManager::instance().initCount(); }

bool AwsSdkSession::active() { return AwsSdkManager::instance().active(); }

namespace {

std::string stripQuotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

const char* transferStatusCode(Aws::Transfer::TransferStatus status) {
  switch (status) {
    case Aws::Transfer::TransferStatus::CANCELED:
      return "TransferCanceled";
    case Aws::Transfer::TransferStatus::FAILED:
      return "TransferFailed";
    case Aws::Transfer::TransferStatus::ABORTED:
      return "TransferAborted";
    default:
      return "TransferError";
  }
}

}  // namespace

// =============================================================================
// S3BlobStore Implementation
// =============================================================================

class S3BlobStore::Impl {
public:
  // Declared first so it is released after every SDK object below
  AwsSdkSession sdk_session;
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;
  std::shared_ptr<Aws::Utils::Threading::PooledThreadExecutor> executor;
  std::shared_ptr<Aws::Transfer::TransferManager> transfer_manager;

  ~Impl() {
    // The transfer manager uses the executor and the client
    transfer_manager.reset();
    client.reset();
    executor.reset();
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
    client_config.enableTcpKeepAlive = true;
    client_config.maxConnections = 100;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::StandardRetryStrategy>("S3RetryStrategy", config.max_sdk_retries);

    // Path-style addressing for custom endpoints (MinIO), virtual-hosted for AWS
    bool use_virtual_addressing = config.endpoint_url.empty();

    std::shared_ptr<Aws::Auth::AWSCredentialsProvider> provider;
    if (config.credentials.useProfile()) {
      provider = Aws::MakeShared<Aws::Auth::ProfileConfigFileAWSCredentialsProvider>(
        "S3Credentials", config.credentials.profile.c_str()
      );
    } else {
      provider = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
        "S3Credentials",
        Aws::Auth::AWSCredentials(config.credentials.access_key, config.credentials.secret_key)
      );
    }

    client = Aws::MakeShared<Aws::S3::S3Client>(
      "S3Client",
      provider,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );

    executor = Aws::MakeShared<Aws::Utils::Threading::PooledThreadExecutor>(
      "S3Executor", config.executor_thread_count
    );

    Aws::Transfer::TransferManagerConfiguration transfer_config(executor.get());
    transfer_config.s3Client = client;

    // S3 part size limits: 5MB minimum, 5GB maximum
    constexpr uint64_t MIN_PART_SIZE = 5 * 1024 * 1024;
    constexpr uint64_t MAX_PART_SIZE = 5ULL * 1024 * 1024 * 1024;
    uint64_t part_size = config.part_size;
    if (part_size < MIN_PART_SIZE) {
      RUNLIFT_LOG_WARN("part_size below S3 minimum, using 5MB" << kv("part_size", config.part_size));
      part_size = MIN_PART_SIZE;
    } else if (part_size > MAX_PART_SIZE) {
      RUNLIFT_LOG_WARN("part_size above S3 maximum, using 5GB" << kv("part_size", config.part_size));
      part_size = MAX_PART_SIZE;
    }
    transfer_config.bufferSize = part_size;

    transfer_manager = Aws::Transfer::TransferManager::Create(transfer_config);
  }
};

S3BlobStore::S3BlobStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
  impl_->initClient();
}

S3BlobStore::~S3BlobStore() = default;

BlobResult S3BlobStore::putObject(
  const std::string& bucket, const std::string& key, const std::string& local_path
) {
  std::ifstream file(local_path, std::ios::binary | std::ios::ate);
  if (!file) {
    return BlobResult::Failure("Cannot open local file: " + local_path, "FileNotFound");
  }
  uint64_t file_size = static_cast<uint64_t>(file.tellg());
  file.close();

  RUNLIFT_LOG_DEBUG(
    "Uploading" << kv("path", local_path) << kv("bucket", bucket) << kv("key", key)
                << kv("bytes", file_size)
  );

  auto upload_handle = impl_->transfer_manager->UploadFile(
    local_path.c_str(),
    bucket.c_str(),
    key.c_str(),
    "application/octet-stream",
    Aws::Map<Aws::String, Aws::String>()
  );
  upload_handle->WaitUntilFinished();

  auto status = upload_handle->GetStatus();
  if (status == Aws::Transfer::TransferStatus::COMPLETED) {
    return BlobResult::Success();
  }

  const auto& error = upload_handle->GetLastError();
  std::string error_code = error.GetExceptionName();
  if (error_code.empty()) {
    error_code = transferStatusCode(status);
  }
  std::string error_msg = error.GetMessage();
  if (error_msg.empty()) {
    error_msg = "Transfer failed with status: " + std::to_string(static_cast<int>(status));
  }
  return BlobResult::Failure(error_msg, error_code);
}

BlobResult S3BlobStore::headObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    return BlobResult::Failure(error.GetMessage(), error.GetExceptionName());
  }
  return BlobResult::Success(stripQuotes(outcome.GetResult().GetETag()));
}

BlobResult S3BlobStore::checkAccess() {
  auto outcome = impl_->client->ListBuckets();
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    return BlobResult::Failure(error.GetMessage(), error.GetExceptionName());
  }
  RUNLIFT_LOG_DEBUG("AWS access verified" << kv("buckets", outcome.GetResult().GetBuckets().size()));
  return BlobResult::Success();
}

bool S3BlobStore::bucketExists(const std::string& bucket) {
  Aws::S3::Model::HeadBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->HeadBucket(request);
  if (!outcome.IsSuccess()) {
    RUNLIFT_LOG_DEBUG(
      "HeadBucket failed" << kv("bucket", bucket)
                          << kv("error", std::string(outcome.GetError().GetMessage()))
    );
    return false;
  }
  return true;
}

BlobStoreFactory makeS3BlobStoreFactory(const S3Config& config) {
  auto session = std::make_shared<AwsSdkSession>();
  return [config, session]() -> std::unique_ptr<IBlobStore> {
    return std::make_unique<S3BlobStore>(config);
  };
}

}  // namespace uploader
}  // namespace runlift
