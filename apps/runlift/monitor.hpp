// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_MONITOR_HPP
#define RUNLIFT_APP_MONITOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "notifier.hpp"
#include "run_discovery.hpp"
#include "runlift_config.hpp"
#include "upload_engine.hpp"
#include "upload_state_store.hpp"

namespace runlift {
namespace app {

/**
 * Result of one run's upload attempt.
 */
struct RunOutcome {
  std::string run_id;
  std::string run_path;
  bool completed = false;
  uint64_t files_attempted = 0;
  uint64_t total_local_files = 0;
  uint64_t total_uploaded_files = 0;
  uint64_t total_failed_upload = 0;
  std::string error;  // Set when the run could not be processed at all
};

/**
 * What a monitor cycle found and did.
 */
struct CycleReport {
  bool dry_run = false;

  // Partial runs first, then new runs, in upload order
  std::vector<uploader::RunDescriptor> planned;
  std::vector<RunOutcome> outcomes;

  std::vector<std::string> completed_runs;
  // Runs left with failures, plus runs whose state record could not be read
  std::vector<std::string> failed_runs;
  // Monitored directories that could not be listed
  std::vector<std::string> unreadable_directories;
};

/**
 * Drives the discover, upload, persist cycle over every configured
 * monitor section.
 *
 * Runs are processed one at a time, so each state record has exactly one
 * writer. A failure inside one run is recorded in its outcome and the
 * cycle moves on to the next run.
 */
class Monitor {
public:
  Monitor(const RunliftConfig& config, uploader::BlobStoreFactory factory, INotifier& notifier);
  ~Monitor() = default;

  // Non-copyable, non-movable
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;
  Monitor(Monitor&&) = delete;
  Monitor& operator=(Monitor&&) = delete;

  /**
   * Run one cycle. A dry run stops after discovery: nothing is uploaded,
   * no state record is written and nothing is sent to the notifier.
   */
  CycleReport runCycle(bool dry_run = false);

  /**
   * Upload whatever of the run is not yet recorded as uploaded and merge
   * the results into its state record.
   */
  RunOutcome uploadRun(const uploader::RunDescriptor& run);

  const uploader::UploadStateStore& stateStore() const {
    return state_store_;
  }

private:
  void discoverSection(
    const MonitorSection& section, std::vector<uploader::RunDescriptor>& new_runs,
    std::vector<uploader::RunDescriptor>& partial_runs, CycleReport& report
  );

  const RunliftConfig& config_;
  INotifier& notifier_;
  uploader::UploadStateStore state_store_;
  uploader::RunDiscovery discovery_;
  uploader::UploadEngine engine_;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_MONITOR_HPP
