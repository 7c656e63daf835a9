// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "monitor.hpp"

#include <optional>

#include "file_inventory.hpp"
#include "partitioner.hpp"

#define RUNLIFT_LOG_COMPONENT "monitor"
#include <runlift_log_macros.hpp>

namespace runlift {
namespace app {

using ::runlift::logging::kv;

namespace {

uploader::RunMarkers markers_from(const RunliftConfig& config) {
  uploader::RunMarkers markers;
  markers.run_markers = config.run_markers;
  markers.completion_markers = config.completion_markers;
  return markers;
}

const char* const UNREADABLE_DIRECTORY_PREFIX =
  ":warning:  *S3 Upload*: Cannot read monitored directories, runs in them were not checked\n\n";

std::string join_run_ids(const std::vector<uploader::RunDescriptor>& runs) {
  std::string joined;
  for (const auto& run : runs) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += run.run_id;
  }
  return joined;
}

}  // namespace

Monitor::Monitor(
  const RunliftConfig& config, uploader::BlobStoreFactory factory, INotifier& notifier
)
    : config_(config)
    , notifier_(notifier)
    , state_store_(config.log_dir)
    , discovery_(state_store_, markers_from(config))
    , engine_(
        std::move(factory),
        uploader::EngineConfig(
          static_cast<size_t>(config.max_workers), static_cast<size_t>(config.max_tasks)
        )
      ) {}

void Monitor::discoverSection(
  const MonitorSection& section, std::vector<uploader::RunDescriptor>& new_runs,
  std::vector<uploader::RunDescriptor>& partial_runs, CycleReport& report
) {
  std::optional<std::string> name_filter;
  if (!section.run_name_pattern.empty()) {
    name_filter = section.run_name_pattern;
  }

  // Directories are scanned one by one so a missing mount only costs its own runs
  for (const auto& directory : section.monitored_directories) {
    uploader::DiscoveryResult result;
    try {
      result = discovery_.discover({directory}, name_filter);
    } catch (const std::exception& e) {
      RUNLIFT_LOG_ERROR(
        "Cannot scan monitored directory" << kv("directory", directory) << kv("error", e.what())
      );
      report.unreadable_directories.push_back(directory);
      continue;
    }

    auto assign_section = [&section](uploader::RunDescriptor& run) {
      run.bucket = section.bucket;
      run.remote_path_prefix = section.remote_path;
      run.exclude_patterns = section.exclude_patterns;
    };

    for (auto& run : result.new_runs) {
      assign_section(run);
      new_runs.push_back(std::move(run));
    }
    for (auto& run : result.partial_runs) {
      assign_section(run);
      partial_runs.push_back(std::move(run));
    }
    for (const auto& errored : result.errored_runs) {
      RUNLIFT_LOG_ERROR(
        "Skipping run with unreadable upload state" << kv("run", errored.run_id)
                                                    << kv("reason", errored.reason)
      );
      report.failed_runs.push_back(errored.run_id);
    }
  }
}

CycleReport Monitor::runCycle(bool dry_run) {
  CycleReport report;
  report.dry_run = dry_run;

  RUNLIFT_LOG_INFO("Beginning monitoring directories for runs to upload");

  std::vector<uploader::RunDescriptor> new_runs;
  std::vector<uploader::RunDescriptor> partial_runs;
  for (const auto& section : config_.monitor) {
    discoverSection(section, new_runs, partial_runs, report);
  }

  RUNLIFT_LOG_INFO(
    "Found " << new_runs.size() << " new runs to upload" << kv("runs", join_run_ids(new_runs))
  );
  if (!partial_runs.empty()) {
    RUNLIFT_LOG_INFO(
      "Found " << partial_runs.size() << " partially uploaded runs to continue uploading"
               << kv("runs", join_run_ids(partial_runs))
    );
  }

  // Partially uploaded runs go first
  report.planned = partial_runs;
  report.planned.insert(report.planned.end(), new_runs.begin(), new_runs.end());

  if (dry_run) {
    for (const auto& run : report.planned) {
      RUNLIFT_LOG_INFO(
        "Dry run, would upload" << kv("run", run.run_id) << kv("bucket", run.bucket)
                                << kv("already_uploaded", run.uploaded_files.size())
      );
    }
    return report;
  }

  if (!report.unreadable_directories.empty()) {
    std::string listing;
    for (const auto& directory : report.unreadable_directories) {
      listing += "- " + directory + "\n";
    }
    notifier_.alert(UNREADABLE_DIRECTORY_PREFIX + listing);
  }

  if (report.planned.empty() && report.failed_runs.empty()) {
    RUNLIFT_LOG_INFO("No runs to upload");
    return report;
  }

  for (const auto& run : report.planned) {
    RunOutcome outcome = uploadRun(run);
    if (outcome.completed) {
      report.completed_runs.push_back(outcome.run_id);
    } else {
      report.failed_runs.push_back(outcome.run_id);
    }
    report.outcomes.push_back(std::move(outcome));
  }

  RUNLIFT_LOG_INFO(
    "Upload cycle finished" << kv("completed", report.completed_runs.size())
                            << kv("failed", report.failed_runs.size())
  );

  notifier_.notifyRunSummary(report.completed_runs, report.failed_runs);

  return report;
}

RunOutcome Monitor::uploadRun(const uploader::RunDescriptor& run) {
  RUNLIFT_LOG_SCOPED_RUN(run.run_id);

  RunOutcome outcome;
  outcome.run_id = run.run_id;
  outcome.run_path = run.run_path;

  try {
    auto inventory = uploader::listRunFiles(run.run_path, run.exclude_patterns);
    auto pending = uploader::filterUploaded(inventory, run.uploaded_files);
    outcome.files_attempted = pending.size();

    RUNLIFT_LOG_INFO(
      "Uploading run" << kv("files", pending.size()) << kv("local_files", inventory.size())
                      << kv("bucket", run.bucket) << kv("remote_path", run.remote_path_prefix)
    );

    auto partitions =
      uploader::partitionRoundRobin(pending, static_cast<size_t>(config_.max_workers));
    auto summary = engine_.upload(
      partitions, uploader::UploadTarget{run.bucket, run.remote_path_prefix, run.parent_path}
    );

    std::vector<std::string> observed;
    observed.reserve(inventory.size());
    for (const auto& entry : inventory) {
      observed.push_back(entry.path);
    }

    auto state = state_store_.mergeAndWrite(
      run.run_id, run.run_path, observed, summary.uploaded, summary.failed
    );

    outcome.completed = state.completed;
    outcome.total_local_files = state.total_local_files;
    outcome.total_uploaded_files = state.total_uploaded_files;
    outcome.total_failed_upload = state.total_failed_upload;

    if (state.completed) {
      RUNLIFT_LOG_INFO("Run fully uploaded" << kv("files", state.total_uploaded_files));
    } else {
      RUNLIFT_LOG_WARN(
        "Run partially uploaded" << kv("uploaded", state.total_uploaded_files)
                                 << kv("local_files", state.total_local_files)
                                 << kv("failed", state.total_failed_upload)
      );
    }
  } catch (const std::exception& e) {
    outcome.error = e.what();
    RUNLIFT_LOG_ERROR("Failed to upload run" << kv("error", e.what()));
  }

  return outcome;
}

}  // namespace app
}  // namespace runlift
