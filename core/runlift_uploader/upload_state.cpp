// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_state.hpp"

#include <algorithm>

namespace runlift {
namespace uploader {

std::set<std::string> RunUploadState::uploadedPaths() const {
  std::set<std::string> paths;
  for (const auto& [path, object_id] : uploaded_files) {
    paths.insert(path);
  }
  return paths;
}

bool computeCompleted(
  uint64_t total_failed_upload, uint64_t total_local_files, uint64_t total_uploaded_files
) {
  return total_failed_upload == 0 && total_local_files == total_uploaded_files;
}

RunUploadState mergeUploadResults(
  const std::optional<RunUploadState>& existing,
  const std::string& run_id,
  const std::string& run_path,
  const std::vector<std::string>& observed_local_files,
  const std::map<std::string, std::string>& succeeded,
  const std::vector<std::string>& failed
) {
  RunUploadState state;
  if (existing) {
    state = *existing;
  } else {
    state.run_id = run_id;
    state.run_path = run_path;
  }

  state.total_local_files = observed_local_files.size();

  for (const auto& [path, object_id] : succeeded) {
    state.uploaded_files[path] = object_id;
  }
  state.total_uploaded_files = state.uploaded_files.size();

  std::vector<std::string> failed_sorted = failed;
  std::sort(failed_sorted.begin(), failed_sorted.end());
  failed_sorted.erase(std::unique(failed_sorted.begin(), failed_sorted.end()), failed_sorted.end());
  state.failed_upload_files = std::move(failed_sorted);
  state.total_failed_upload = state.failed_upload_files.size();

  state.completed = computeCompleted(
    state.total_failed_upload, state.total_local_files, state.total_uploaded_files
  );
  return state;
}

void to_json(nlohmann::json& j, const RunUploadState& state) {
  j = nlohmann::json{
    {"run_id", state.run_id},
    {"run_path", state.run_path},
    {"completed", state.completed},
    {"total_local_files", state.total_local_files},
    {"total_uploaded_files", state.total_uploaded_files},
    {"total_failed_upload", state.total_failed_upload},
    {"failed_upload_files", state.failed_upload_files},
    {"uploaded_files", state.uploaded_files},
  };
}

void from_json(const nlohmann::json& j, RunUploadState& state) {
  j.at("run_id").get_to(state.run_id);
  // Older records store the path under "run path"
  if (j.contains("run_path")) {
    j.at("run_path").get_to(state.run_path);
  } else {
    j.at("run path").get_to(state.run_path);
  }
  j.at("completed").get_to(state.completed);
  j.at("total_local_files").get_to(state.total_local_files);
  j.at("total_uploaded_files").get_to(state.total_uploaded_files);
  j.at("total_failed_upload").get_to(state.total_failed_upload);
  j.at("failed_upload_files").get_to(state.failed_upload_files);
  j.at("uploaded_files").get_to(state.uploaded_files);
}

RunUploadState parseUploadState(const std::string& text) {
  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      throw StateRecordError("state record is not a JSON object");
    }
    return j.get<RunUploadState>();
  } catch (const nlohmann::json::exception& e) {
    throw StateRecordError(std::string("malformed state record: ") + e.what());
  }
}

}  // namespace uploader
}  // namespace runlift
