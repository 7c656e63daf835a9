// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_state_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#define RUNLIFT_LOG_COMPONENT "upload_state"
#include <runlift_log_macros.hpp>

namespace fs = std::filesystem;

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

UploadStateStore::UploadStateStore(const std::string& log_dir)
    : uploads_dir_((fs::path(log_dir) / "uploads").string()) {}

std::string UploadStateStore::recordPath(const std::string& run_id) const {
  return (fs::path(uploads_dir_) / (run_id + ".upload.log.json")).string();
}

std::optional<RunUploadState> UploadStateStore::read(const std::string& run_id) const {
  std::string path = recordPath(run_id);

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      throw std::runtime_error("Cannot stat state record " + path + ": " + ec.message());
    }
    return std::nullopt;
  }

  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open state record: " + path);
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();

  RunUploadState state;
  try {
    state = parseUploadState(buffer.str());
  } catch (const StateRecordError& e) {
    throw StateRecordError(path + ": " + e.what());
  }

  RUNLIFT_LOG_DEBUG(
    "Read state record" << kv("run_id", run_id) << kv("completed", state.completed)
                        << kv("local", state.total_local_files)
                        << kv("uploaded", state.total_uploaded_files)
                        << kv("failed", state.total_failed_upload)
  );
  return state;
}

RunUploadState UploadStateStore::mergeAndWrite(
  const std::string& run_id,
  const std::string& run_path,
  const std::vector<std::string>& observed_local_files,
  const std::map<std::string, std::string>& succeeded,
  const std::vector<std::string>& failed
) {
  auto existing = read(run_id);
  if (existing) {
    RUNLIFT_LOG_DEBUG("Updating existing state record" << kv("path", recordPath(run_id)));
  }

  RunUploadState state =
    mergeUploadResults(existing, run_id, run_path, observed_local_files, succeeded, failed);

  RUNLIFT_LOG_INFO(
    "Logging upload state" << kv("run_id", run_id) << kv("local", state.total_local_files)
                           << kv("uploaded", state.total_uploaded_files)
                           << kv("failed", state.total_failed_upload)
                           << kv("completed", state.completed)
  );

  writeAtomically(state);
  return state;
}

void UploadStateStore::writeAtomically(const RunUploadState& state) {
  fs::path record_path = recordPath(state.run_id);
  fs::path tmp_path = record_path;
  tmp_path += ".tmp";

  std::error_code ec;
  fs::create_directories(uploads_dir_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create " + uploads_dir_ + ": " + ec.message());
  }

  {
    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("Cannot open " + tmp_path.string() + " for writing");
    }
    ofs << nlohmann::json(state).dump(4);
    ofs.flush();
    if (!ofs) {
      ofs.close();
      fs::remove(tmp_path, ec);
      throw std::runtime_error("Failed writing " + tmp_path.string());
    }
  }

  fs::rename(tmp_path, record_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(tmp_path, cleanup_ec);
    throw std::runtime_error(
      "Cannot rename " + tmp_path.string() + " to " + record_path.string() + ": " + ec.message()
    );
  }
}

}  // namespace uploader
}  // namespace runlift
