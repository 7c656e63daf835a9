// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_BLOB_STORE_HPP
#define RUNLIFT_BLOB_STORE_HPP

#include <functional>
#include <memory>
#include <string>

namespace runlift {
namespace uploader {

/**
 * Result of a blob store operation
 */
struct BlobResult {
  bool success;
  std::string object_id;      // ETag without surrounding quotes
  std::string error_message;  // Error message if failed
  std::string error_code;     // SDK exception name or local error class

  static BlobResult Success(const std::string& object_id = "") {
    return {true, object_id, "", ""};
  }

  static BlobResult Failure(const std::string& message, const std::string& code = "") {
    return {false, "", message, code};
  }
};

/**
 * Object storage capability used by the upload engine.
 *
 * One instance is shared by the transfer tasks of a single engine worker,
 * so implementations must tolerate concurrent calls.
 */
class IBlobStore {
public:
  virtual ~IBlobStore() = default;

  /**
   * Upload a local file to bucket/key.
   */
  virtual BlobResult putObject(
    const std::string& bucket, const std::string& key, const std::string& local_path
  ) = 0;

  /**
   * Fetch object metadata. On success object_id holds the unquoted ETag.
   */
  virtual BlobResult headObject(const std::string& bucket, const std::string& key) = 0;

  /**
   * Verify the configured credentials by listing buckets.
   */
  virtual BlobResult checkAccess() = 0;

  virtual bool bucketExists(const std::string& bucket) = 0;
};

/**
 * Creates one blob store per engine worker. May throw on construction failure.
 */
using BlobStoreFactory = std::function<std::unique_ptr<IBlobStore>()>;

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_BLOB_STORE_HPP
