// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_RUN_DISCOVERY_HPP
#define RUNLIFT_RUN_DISCOVERY_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "upload_state_store.hpp"

namespace runlift {
namespace uploader {

/**
 * A run directory selected for upload
 */
struct RunDescriptor {
  std::string run_id;       // Directory name
  std::string run_path;     // Absolute path of the run directory
  std::string parent_path;  // Monitored root the run lives in
  std::string bucket;
  std::string remote_path_prefix;
  std::vector<std::string> exclude_patterns;
  std::set<std::string> uploaded_files;  // Empty for new runs
};

/**
 * A run that was skipped because its state could not be determined
 */
struct DiscoveryError {
  std::string run_id;
  std::string run_path;
  std::string reason;
};

struct DiscoveryResult {
  std::vector<RunDescriptor> new_runs;
  std::vector<RunDescriptor> partial_runs;
  std::vector<DiscoveryError> errored_runs;

  bool empty() const { return new_runs.empty() && partial_runs.empty(); }
};

/**
 * Marker files identifying a run directory and its completion
 */
struct RunMarkers {
  std::vector<std::string> run_markers = {"RunInfo.xml"};
  std::vector<std::string> completion_markers = {
    "CopyComplete.txt", "RTAComplete.txt", "RTAComplete.xml"
  };
};

/**
 * Finds runs ready for upload under monitored roots.
 *
 * A subdirectory qualifies when it contains every run marker and at least
 * one completion marker, and its name matches the optional filter. Its
 * state record then decides the class: none means new, completed means
 * skip, anything else means partial.
 *
 * Discovery only reads the filesystem.
 */
class RunDiscovery {
public:
  RunDiscovery(const UploadStateStore& state_store, RunMarkers markers = RunMarkers());

  /**
   * Scan each root's immediate subdirectories in name order.
   *
   * A bad subdirectory is logged and skipped; runs with a corrupt state
   * record are reported in errored_runs.
   *
   * Descriptors carry run id, path and uploaded files. bucket, prefix and
   * exclusions are left for the caller.
   *
   * @param roots Monitored directories
   * @param run_name_filter ECMAScript regex searched in the directory name
   * @throws std::filesystem::filesystem_error if a root cannot be listed
   * @throws std::invalid_argument if run_name_filter does not compile
   */
  DiscoveryResult discover(
    const std::vector<std::string>& roots,
    const std::optional<std::string>& run_name_filter = std::nullopt
  ) const;

  bool isRunDirectory(const std::string& dir) const;
  bool isAcquisitionComplete(const std::string& dir) const;

private:
  const UploadStateStore& state_store_;
  RunMarkers markers_;
};

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_RUN_DISCOVERY_HPP
