// Copyright (c) 2026 ArcheBase
// runlift is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef RUNLIFT_UPLOAD_ENGINE_HPP
#define RUNLIFT_UPLOAD_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "file_inventory.hpp"

namespace runlift {
namespace uploader {

/**
 * Terminal state of a single file within one upload attempt
 */
enum class FileState {
  SUCCEEDED,  // Uploaded and confirmed by HeadObject
  FAILED      // Any error; retried on the next cycle
};

/**
 * Terminal result of one file
 */
struct FileOutcome {
  std::string local_path;
  FileState state = FileState::FAILED;
  std::string object_id;  // Set when SUCCEEDED
  std::string error;      // Set when FAILED
};

/**
 * Engine sizing. worker_count bounds the outer tier, tasks_per_worker the
 * inner tier of each worker.
 */
struct EngineConfig {
  size_t worker_count;
  size_t tasks_per_worker;

  EngineConfig();
  EngineConfig(size_t workers, size_t tasks)
      : worker_count(workers)
      , tasks_per_worker(tasks) {}
};

/**
 * Where a run's files go
 */
struct UploadTarget {
  std::string bucket;
  std::string remote_prefix;
  std::string parent_path;  // Stripped from local paths to form keys
};

/**
 * Aggregated result of one attempt
 */
struct UploadSummary {
  std::map<std::string, std::string> uploaded;  // local path -> object id
  std::vector<std::string> failed;
  std::map<std::string, std::string> errors;  // local path -> reason, for failed files
};

/**
 * Copyable view of EngineStats
 */
struct EngineStatsSnapshot {
  uint64_t in_flight = 0;
  uint64_t succeeded = 0;
  uint64_t failed = 0;
  uint64_t bytes_uploaded = 0;
};

/**
 * Counters updated by transfer tasks. Cumulative across attempts except
 * in_flight.
 */
struct EngineStats {
  std::atomic<uint64_t> in_flight{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> bytes_uploaded{0};

  EngineStatsSnapshot snapshot() const {
    EngineStatsSnapshot s;
    s.in_flight = in_flight.load(std::memory_order_relaxed);
    s.succeeded = succeeded.load(std::memory_order_relaxed);
    s.failed = failed.load(std::memory_order_relaxed);
    s.bytes_uploaded = bytes_uploaded.load(std::memory_order_relaxed);
    return s;
  }
};

/**
 * Build the object key for a local file: parent_path is removed from the
 * front of local_path, leading slashes are trimmed, and the remainder is
 * joined onto remote_prefix. The result never starts with '/'. Segments
 * are not URL-encoded.
 */
std::string buildRemoteKey(
  const std::string& local_path, const std::string& parent_path, const std::string& remote_prefix
);

/**
 * Two-tier concurrent uploader.
 *
 * Threading Model:
 * - Outer tier: one task per partition on a pool of
 *   min(worker_count, partitions) threads
 * - Each outer task creates its own IBlobStore from the factory and runs
 *   its partition on an inner pool of tasks_per_worker threads that share
 *   that store
 * - Outcomes are gathered through futures at a single aggregation point,
 *   so completion order does not matter
 *
 * Failure isolation:
 * - A failed or throwing transfer marks only that file FAILED
 * - An outer task that fails as a whole (store construction, unexpected
 *   exception) marks every file of its partition FAILED
 *
 * upload() returns only after every outer task has finished.
 */
class UploadEngine {
public:
  /**
   * @throws std::invalid_argument if a count in config is zero or factory is empty
   */
  UploadEngine(BlobStoreFactory factory, EngineConfig config);

  // Non-copyable, non-movable
  UploadEngine(const UploadEngine&) = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;
  UploadEngine(UploadEngine&&) = delete;
  UploadEngine& operator=(UploadEngine&&) = delete;

  UploadSummary upload(
    const std::vector<std::vector<FileEntry>>& partitions, const UploadTarget& target
  );

  EngineStatsSnapshot stats() const { return stats_.snapshot(); }

private:
  std::vector<FileOutcome> uploadPartition(
    const std::vector<FileEntry>& partition, const UploadTarget& target, size_t worker_id
  );

  FileOutcome uploadFile(IBlobStore& store, const FileEntry& file, const UploadTarget& target);

  BlobStoreFactory factory_;
  EngineConfig config_;
  EngineStats stats_;
};

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_UPLOAD_ENGINE_HPP
