// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_UPLOAD_STATE_STORE_HPP
#define RUNLIFT_UPLOAD_STATE_STORE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "upload_state.hpp"

namespace runlift {
namespace uploader {

/**
 * File-backed store of per-run upload records.
 *
 * Each run has one JSON file at <log_dir>/uploads/<run_id>.upload.log.json.
 * Writes go to "<file>.tmp" and are renamed into place, so a crash leaves
 * either the previous record or the new one.
 *
 * Runs are processed one at a time, so there is a single writer per record
 * and no locking here.
 */
class UploadStateStore {
public:
  explicit UploadStateStore(const std::string& log_dir);

  // Non-copyable, non-movable
  UploadStateStore(const UploadStateStore&) = delete;
  UploadStateStore& operator=(const UploadStateStore&) = delete;
  UploadStateStore(UploadStateStore&&) = delete;
  UploadStateStore& operator=(UploadStateStore&&) = delete;

  /**
   * Load a run's record.
   *
   * @return The record, or std::nullopt if the run has none yet
   * @throws StateRecordError if the record exists but cannot be parsed
   * @throws std::runtime_error if the file exists but cannot be read
   */
  std::optional<RunUploadState> read(const std::string& run_id) const;

  /**
   * Merge an attempt's outcome into the run's record and persist it.
   *
   * @throws StateRecordError if the existing record is malformed
   * @throws std::runtime_error if the record cannot be written
   */
  RunUploadState mergeAndWrite(
    const std::string& run_id,
    const std::string& run_path,
    const std::vector<std::string>& observed_local_files,
    const std::map<std::string, std::string>& succeeded,
    const std::vector<std::string>& failed
  );

  std::string recordPath(const std::string& run_id) const;

  const std::string& uploadsDir() const { return uploads_dir_; }

private:
  void writeAtomically(const RunUploadState& state);

  std::string uploads_dir_;
};

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_UPLOAD_STATE_STORE_HPP
