// Copyright (c) 2026 ArcheBase
// runlift is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef RUNLIFT_UPLOAD_STATE_HPP
#define RUNLIFT_UPLOAD_STATE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace runlift {
namespace uploader {

/**
 * Raised when a persisted state record cannot be parsed. The record is
 * left on disk untouched.
 */
class StateRecordError : public std::runtime_error {
public:
  explicit StateRecordError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Persisted upload progress of one run.
 *
 * uploaded_files accumulates across attempts; failed_upload_files and
 * total_failed_upload describe only the most recent attempt.
 */
struct RunUploadState {
  std::string run_id;
  std::string run_path;
  bool completed = false;
  uint64_t total_local_files = 0;
  uint64_t total_uploaded_files = 0;
  uint64_t total_failed_upload = 0;
  std::vector<std::string> failed_upload_files;
  std::map<std::string, std::string> uploaded_files;  // local path -> object id

  std::set<std::string> uploadedPaths() const;
};

/**
 * True iff nothing failed in the last attempt and every observed local
 * file has been uploaded.
 */
bool computeCompleted(
  uint64_t total_failed_upload, uint64_t total_local_files, uint64_t total_uploaded_files
);

/**
 * Fold one attempt's outcome into a run's record.
 *
 * Starts from existing (or an empty record), overlays succeeded onto
 * uploaded_files with the newest object id winning, recounts
 * total_uploaded_files from the map, replaces the failed list (sorted,
 * duplicates removed) and recomputes completed. total_local_files is set
 * to observed_local_files.size().
 */
RunUploadState mergeUploadResults(
  const std::optional<RunUploadState>& existing,
  const std::string& run_id,
  const std::string& run_path,
  const std::vector<std::string>& observed_local_files,
  const std::map<std::string, std::string>& succeeded,
  const std::vector<std::string>& failed
);

void to_json(nlohmann::json& j, const RunUploadState& state);
void from_json(const nlohmann::json& j, RunUploadState& state);

/**
 * Parse a serialized record.
 *
 * @throws StateRecordError on invalid JSON or missing/mistyped fields
 */
RunUploadState parseUploadState(const std::string& text);

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_UPLOAD_STATE_HPP
