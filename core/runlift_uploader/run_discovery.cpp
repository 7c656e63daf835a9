// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "run_discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <stdexcept>

#include "file_inventory.hpp"

#define RUNLIFT_LOG_COMPONENT "run_discovery"
#include <runlift_log_macros.hpp>

namespace fs = std::filesystem;

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

namespace {

bool fileExists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

}  // namespace

RunDiscovery::RunDiscovery(const UploadStateStore& state_store, RunMarkers markers)
    : state_store_(state_store)
    , markers_(std::move(markers)) {}

bool RunDiscovery::isRunDirectory(const std::string& dir) const {
  if (markers_.run_markers.empty()) {
    return false;
  }
  for (const auto& marker : markers_.run_markers) {
    if (!fileExists(fs::path(dir) / marker)) {
      return false;
    }
  }
  return true;
}

bool RunDiscovery::isAcquisitionComplete(const std::string& dir) const {
  for (const auto& marker : markers_.completion_markers) {
    if (fileExists(fs::path(dir) / marker)) {
      return true;
    }
  }
  return false;
}

DiscoveryResult RunDiscovery::discover(
  const std::vector<std::string>& roots, const std::optional<std::string>& run_name_filter
) const {
  std::optional<std::regex> name_re;
  if (run_name_filter && !run_name_filter->empty()) {
    try {
      name_re.emplace(*run_name_filter);
    } catch (const std::regex_error& e) {
      throw std::invalid_argument(
        "Invalid run name pattern '" + *run_name_filter + "': " + e.what()
      );
    }
  }

  DiscoveryResult result;

  for (const auto& root : roots) {
    RUNLIFT_LOG_INFO("Checking for completed runs" << kv("root", root));

    // Listing the root itself is allowed to throw
    std::vector<fs::path> sub_dirs;
    for (const auto& entry : fs::directory_iterator(root)) {
      std::error_code ec;
      if (entry.is_directory(ec) && !ec) {
        sub_dirs.push_back(normalizePath(entry.path().string()));
      }
    }
    std::sort(sub_dirs.begin(), sub_dirs.end());

    for (const auto& sub_dir : sub_dirs) {
      std::string run_id = sub_dir.filename().string();
      std::string run_path = sub_dir.string();

      if (!isRunDirectory(run_path)) {
        RUNLIFT_LOG_DEBUG("Not a run directory, skipping" << kv("path", run_path));
        continue;
      }
      if (!isAcquisitionComplete(run_path)) {
        RUNLIFT_LOG_DEBUG("Acquisition not complete, skipping" << kv("path", run_path));
        continue;
      }
      if (name_re && !std::regex_search(run_id, *name_re)) {
        RUNLIFT_LOG_DEBUG("Run name does not match filter, skipping" << kv("run_id", run_id));
        continue;
      }

      std::optional<RunUploadState> state;
      try {
        state = state_store_.read(run_id);
      } catch (const std::exception& e) {
        RUNLIFT_LOG_ERROR(
          "Cannot read state record, skipping run" << kv("run_id", run_id) << kv("error", e.what())
        );
        result.errored_runs.push_back(DiscoveryError{run_id, run_path, e.what()});
        continue;
      }

      RunDescriptor run;
      run.run_id = run_id;
      run.run_path = run_path;
      run.parent_path = sub_dir.parent_path().string();

      if (!state) {
        RUNLIFT_LOG_INFO("Run has not started uploading, will be uploaded" << kv("run_id", run_id));
        result.new_runs.push_back(std::move(run));
      } else if (state->completed) {
        RUNLIFT_LOG_INFO("Run has completed uploading and will be skipped" << kv("run_id", run_id));
      } else {
        run.uploaded_files = state->uploadedPaths();
        RUNLIFT_LOG_INFO(
          "Run partially uploaded, will continue uploading"
          << kv("run_id", run_id) << kv("uploaded", run.uploaded_files.size())
        );
        result.partial_runs.push_back(std::move(run));
      }
    }
  }

  return result;
}

}  // namespace uploader
}  // namespace runlift
