// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_engine.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "task_pool.hpp"

#define RUNLIFT_LOG_COMPONENT "upload_engine"
#include <runlift_log_macros.hpp>

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

namespace {

std::string lstripSlashes(const std::string& s) {
  size_t pos = s.find_first_not_of('/');
  return pos == std::string::npos ? std::string() : s.substr(pos);
}

// "<code>: <message>", or the bare message when the store gave no code
std::string describeFailure(const BlobResult& result) {
  if (result.error_code.empty()) {
    return result.error_message;
  }
  return result.error_code + ": " + result.error_message;
}

}  // namespace

EngineConfig::EngineConfig()
    : worker_count(std::max(1u, std::thread::hardware_concurrency()))
    , tasks_per_worker(4) {}

std::string buildRemoteKey(
  const std::string& local_path, const std::string& parent_path, const std::string& remote_prefix
) {
  std::string relative = local_path;
  if (!parent_path.empty() && relative.compare(0, parent_path.size(), parent_path) == 0) {
    relative = relative.substr(parent_path.size());
  }
  relative = lstripSlashes(relative);

  std::string key = remote_prefix;
  if (!key.empty() && key.back() != '/') {
    key += '/';
  }
  key += relative;
  return lstripSlashes(key);
}

UploadEngine::UploadEngine(BlobStoreFactory factory, EngineConfig config)
    : factory_(std::move(factory))
    , config_(config) {
  if (!factory_) {
    throw std::invalid_argument("UploadEngine requires a blob store factory");
  }
  if (config_.worker_count == 0 || config_.tasks_per_worker == 0) {
    throw std::invalid_argument("worker_count and tasks_per_worker must be positive");
  }
}

UploadSummary UploadEngine::upload(
  const std::vector<std::vector<FileEntry>>& partitions, const UploadTarget& target
) {
  UploadSummary summary;

  size_t total_files = 0;
  size_t non_empty = 0;
  for (const auto& partition : partitions) {
    total_files += partition.size();
    if (!partition.empty()) {
      ++non_empty;
    }
  }
  if (non_empty == 0) {
    return summary;
  }

  size_t outer_threads = std::min(config_.worker_count, non_empty);
  RUNLIFT_LOG_INFO(
    "Beginning upload" << kv("files", total_files) << kv("workers", outer_threads)
                       << kv("tasks_per_worker", config_.tasks_per_worker)
                       << kv("bucket", target.bucket) << kv("remote_path", target.remote_prefix)
  );

  // Each future is paired with its partition so a failed worker can be
  // expanded to its files
  std::vector<std::pair<const std::vector<FileEntry>*, std::future<std::vector<FileOutcome>>>>
    jobs;
  {
    TaskPool outer_pool(outer_threads);
    size_t worker_id = 0;
    for (const auto& partition : partitions) {
      if (partition.empty()) {
        continue;
      }
      const std::vector<FileEntry>* part = &partition;
      size_t id = worker_id++;
      jobs.emplace_back(part, outer_pool.submit([this, part, &target, id]() {
        return uploadPartition(*part, target, id);
      }));
    }

    for (auto& [part, future] : jobs) {
      try {
        for (auto& outcome : future.get()) {
          if (outcome.state == FileState::SUCCEEDED) {
            summary.uploaded[outcome.local_path] = outcome.object_id;
          } else {
            summary.failed.push_back(outcome.local_path);
            summary.errors[outcome.local_path] = outcome.error;
          }
        }
      } catch (const std::exception& e) {
        RUNLIFT_LOG_ERROR(
          "Worker failed with an unhandled error, marking its partition failed"
          << kv("files", part->size()) << kv("error", e.what())
        );
        for (const auto& file : *part) {
          summary.failed.push_back(file.path);
          summary.errors[file.path] = std::string("worker failed: ") + e.what();
        }
        stats_.failed += part->size();
      }
    }
  }

  RUNLIFT_LOG_INFO(
    "Upload attempt finished" << kv("uploaded", summary.uploaded.size())
                              << kv("failed", summary.failed.size()) << kv("bucket", target.bucket)
  );
  if (!summary.failed.empty()) {
    RUNLIFT_LOG_ERROR(
      "Files failed to upload and will be retried" << kv("failed", summary.failed.size())
    );
  }
  return summary;
}

std::vector<FileOutcome> UploadEngine::uploadPartition(
  const std::vector<FileEntry>& partition, const UploadTarget& target, size_t worker_id
) {
  // Store is declared before the pool so the pool's threads are joined first
  std::unique_ptr<IBlobStore> store = factory_();
  if (!store) {
    throw std::runtime_error("blob store factory returned null");
  }

  size_t inner_threads = std::min(config_.tasks_per_worker, partition.size());
  RUNLIFT_LOG_DEBUG(
    "Worker starting" << kv("worker", worker_id) << kv("files", partition.size())
                      << kv("threads", inner_threads)
  );

  std::vector<FileOutcome> outcomes;
  outcomes.reserve(partition.size());

  TaskPool inner_pool(inner_threads);
  std::vector<std::future<FileOutcome>> futures;
  futures.reserve(partition.size());
  IBlobStore& shared_store = *store;
  for (const auto& file : partition) {
    futures.push_back(inner_pool.submit([this, &shared_store, &file, &target]() {
      return uploadFile(shared_store, file, target);
    }));
  }

  for (size_t i = 0; i < futures.size(); ++i) {
    try {
      outcomes.push_back(futures[i].get());
    } catch (const std::exception& e) {
      RUNLIFT_LOG_ERROR("Error in uploading" << kv("path", partition[i].path) << kv("error", e.what()));
      outcomes.push_back(FileOutcome{partition[i].path, FileState::FAILED, "", e.what()});
    }
  }

  inner_pool.shutdown();
  return outcomes;
}

FileOutcome UploadEngine::uploadFile(
  IBlobStore& store, const FileEntry& file, const UploadTarget& target
) {
  FileOutcome outcome{file.path, FileState::FAILED, "", ""};
  ++stats_.in_flight;

  std::string key = buildRemoteKey(file.path, target.parent_path, target.remote_prefix);

  try {
    BlobResult put = store.putObject(target.bucket, key, file.path);
    if (put.success) {
      // Confirm the object landed and record its ETag
      BlobResult head = store.headObject(target.bucket, key);
      if (head.success) {
        outcome.state = FileState::SUCCEEDED;
        outcome.object_id = head.object_id;
      } else {
        outcome.error = "confirmation failed: " + describeFailure(head);
      }
    } else {
      outcome.error = describeFailure(put);
    }
  } catch (const std::exception& e) {
    outcome.error = e.what();
  }

  --stats_.in_flight;
  if (outcome.state == FileState::SUCCEEDED) {
    ++stats_.succeeded;
    stats_.bytes_uploaded += file.size;
    RUNLIFT_LOG_DEBUG(
      "Uploaded" << kv("path", file.path) << kv("key", key) << kv("etag", outcome.object_id)
    );
  } else {
    ++stats_.failed;
    RUNLIFT_LOG_ERROR(
      "Error in uploading" << kv("path", file.path) << kv("key", key) << kv("error", outcome.error)
    );
  }
  return outcome;
}

}  // namespace uploader
}  // namespace runlift
