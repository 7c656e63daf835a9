// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_S3_CLIENT_HPP
#define RUNLIFT_S3_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "aws_credentials.hpp"
#include "blob_store.hpp"

namespace runlift {
namespace uploader {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // Empty for AWS S3, e.g. "http://localhost:9000" for MinIO
  std::string region = "eu-west-2";
  bool use_ssl = true;
  bool verify_ssl = true;

  AwsCredentialConfig credentials;

  // Files above part_size are sent as multipart uploads by TransferManager
  uint64_t part_size = 64 * 1024 * 1024;
  int executor_thread_count = 4;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // Retries inside a single transfer are left to the SDK
  int max_sdk_retries = 10;
};

/**
 * Holds the AWS SDK initialised for as long as any session is alive.
 *
 * The first session calls Aws::InitAPI and the last one to go calls
 * Aws::ShutdownAPI. The SDK cannot be brought back up once it has been shut
 * down, so a session created after that throws std::runtime_error. Callers
 * keep one session for the whole command so per-worker stores never take the
 * count to zero between them.
 */
class AwsSdkSession {
public:
  AwsSdkSession();
  ~AwsSdkSession();

  AwsSdkSession(const AwsSdkSession&) = delete;
  AwsSdkSession& operator=(const AwsSdkSession&) = delete;

  // Number of InitAPI calls made in this process
  static int initCount();
  static bool active();
};

/**
 * Blob store backed by the AWS SDK for C++.
 *
 * Uploads go through TransferManager, so large files are split into
 * concurrent multipart uploads. The object id recorded for a file is the
 * ETag returned by a HeadObject issued after the transfer completes.
 *
 * Thread safety: all methods may be called concurrently.
 */
class S3BlobStore : public IBlobStore {
public:
  explicit S3BlobStore(const S3Config& config);
  ~S3BlobStore() override;

  // Non-copyable, non-movable
  S3BlobStore(const S3BlobStore&) = delete;
  S3BlobStore& operator=(const S3BlobStore&) = delete;
  S3BlobStore(S3BlobStore&&) = delete;
  S3BlobStore& operator=(S3BlobStore&&) = delete;

  BlobResult putObject(
    const std::string& bucket, const std::string& key, const std::string& local_path
  ) override;

  BlobResult headObject(const std::string& bucket, const std::string& key) override;

  BlobResult checkAccess() override;

  bool bucketExists(const std::string& bucket) override;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Factory producing a fresh S3BlobStore per call. Every copy of the factory
 * shares one AwsSdkSession, so the SDK is initialised once when the factory
 * is made and shut down after the last copy is destroyed.
 */
BlobStoreFactory makeS3BlobStoreFactory(const S3Config& config);

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_S3_CLIENT_HPP
