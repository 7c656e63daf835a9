// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <vector>

#include "aws_credentials.hpp"
#include "config_parser.hpp"
#include "file_inventory.hpp"
#include "instance_lock.hpp"
#include "monitor.hpp"
#include "s3_client.hpp"
#include "slack_notifier.hpp"

#define RUNLIFT_LOG_COMPONENT "commands"
#include <runlift_log_init.hpp>
#include <runlift_log_macros.hpp>

namespace runlift {
namespace app {

namespace fs = std::filesystem;
using ::runlift::logging::kv;

namespace {

const char* const AWS_ERROR_PREFIX = ":warning:  *S3 Upload*: Error in connecting to AWS!\n\n";
const char* const BUCKET_ERROR_PREFIX =
  ":warning:  *S3 Upload*: Error in accessing specified S3 buckets!\n\n\t\t";

bool parse_positive_int(const std::string& text, int& out) {
  try {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size() || value <= 0) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void start_logging(const RunliftConfig& config) {
  ::runlift::logging::LoggingConfig log_config;
  convert_logging_config(config, log_config);
  ::runlift::logging::reconfigure_logging(log_config);
}

}  // namespace

// ============================================================================
// Argument parsing
// ============================================================================

bool parse_command_line(int argc, char* argv[], CommandLine& cmd, std::string& error_msg) {
  if (argc < 2) {
    error_msg = "No mode given";
    return false;
  }

  std::string mode = argv[1];
  if (mode == "help" || mode == "--help" || mode == "-h") {
    cmd.mode = Mode::HELP;
    return true;
  } else if (mode == "upload") {
    cmd.mode = Mode::UPLOAD;
  } else if (mode == "monitor") {
    cmd.mode = Mode::MONITOR;
  } else {
    error_msg = "Unknown mode '" + mode + "'";
    return false;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::optional<std::string> inline_value;

    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }

    auto take_value = [&](std::string& out) {
      if (inline_value) {
        out = *inline_value;
        return true;
      }
      if (i + 1 >= argc) {
        error_msg = "Option " + arg + " requires a value";
        return false;
      }
      out = argv[++i];
      return true;
    };

    auto take_count = [&](int& out) {
      std::string text;
      if (!take_value(text)) {
        return false;
      }
      if (!parse_positive_int(text, out)) {
        error_msg = "Option " + arg + " expects a positive integer, got '" + text + "'";
        return false;
      }
      return true;
    };

    bool ok = true;
    if (cmd.mode == Mode::UPLOAD) {
      UploadOptions& upload = cmd.upload;
      if (arg == "--local-path" || arg == "--local_path") {
        ok = take_value(upload.local_path);
      } else if (arg == "--bucket") {
        ok = take_value(upload.bucket);
      } else if (arg == "--remote-path" || arg == "--remote_path") {
        ok = take_value(upload.remote_path);
      } else if (arg == "--workers" || arg == "--cores") {
        ok = take_count(upload.workers);
      } else if (arg == "--tasks" || arg == "--threads") {
        ok = take_count(upload.tasks);
      } else if (arg == "--log-dir" || arg == "--log_dir") {
        ok = take_value(upload.log_dir);
      } else {
        error_msg = "Unknown option '" + arg + "' for upload";
        return false;
      }
    } else {
      MonitorOptions& monitor = cmd.monitor;
      if (arg == "--config") {
        ok = take_value(monitor.config_path);
      } else if (arg == "--dry-run" && !inline_value) {
        monitor.dry_run = true;
      } else {
        error_msg = "Unknown option '" + arg + "' for monitor";
        return false;
      }
    }

    if (!ok) {
      return false;
    }
  }

  if (cmd.mode == Mode::UPLOAD) {
    if (cmd.upload.local_path.empty()) {
      error_msg = "upload requires --local-path";
      return false;
    }
    if (cmd.upload.bucket.empty()) {
      error_msg = "upload requires --bucket";
      return false;
    }
  } else if (cmd.mode == Mode::MONITOR && cmd.monitor.config_path.empty()) {
    error_msg = "monitor requires --config";
    return false;
  }

  return true;
}

// ============================================================================
// Commands Implementation
// ============================================================================

Commands::Commands(uploader::BlobStoreFactory store_factory)
    : store_factory_(std::move(store_factory)) {}

bool Commands::prepare_blob_store(
  uploader::S3Config s3, const std::set<std::string>& buckets, INotifier& notifier,
  uploader::BlobStoreFactory& factory
) {
  RUNLIFT_LOG_INFO("Checking access to AWS");

  if (store_factory_) {
    factory = store_factory_;
  } else {
    std::string error_msg;
    if (!uploader::resolveCredentials(uploader::captureAwsEnvironment(), s3.credentials, error_msg)) {
      notifier.alert(AWS_ERROR_PREFIX + error_msg);
      RUNLIFT_LOG_FATAL(error_msg);
      return false;
    }
    factory = uploader::makeS3BlobStoreFactory(s3);
  }

  std::unique_ptr<uploader::IBlobStore> store;
  try {
    store = factory();
  } catch (const std::exception& e) {
    notifier.alert(AWS_ERROR_PREFIX + std::string(e.what()));
    RUNLIFT_LOG_FATAL("Failed to create S3 client" << kv("error", e.what()));
    return false;
  }
  if (!store) {
    notifier.alert(AWS_ERROR_PREFIX + std::string("no blob store available"));
    RUNLIFT_LOG_FATAL("Failed to create S3 client");
    return false;
  }

  auto access = store->checkAccess();
  if (!access.success) {
    notifier.alert(AWS_ERROR_PREFIX + access.error_message);
    RUNLIFT_LOG_FATAL("Error in connecting to AWS" << kv("error", access.error_message));
    return false;
  }

  RUNLIFT_LOG_INFO("Checking bucket(s) exist and accessible" << kv("buckets", buckets.size()));

  std::vector<std::string> invalid;
  for (const auto& bucket : buckets) {
    if (!store->bucketExists(bucket)) {
      invalid.push_back(bucket);
    }
  }

  if (!invalid.empty()) {
    std::string joined;
    for (const auto& bucket : invalid) {
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += bucket;
    }
    std::string message =
      std::to_string(invalid.size()) + " bucket(s) not accessible or do not exist: " + joined;
    notifier.alert(BUCKET_ERROR_PREFIX + message);
    RUNLIFT_LOG_FATAL(message);
    return false;
  }

  return true;
}

int Commands::upload(const UploadOptions& options) {
  RunliftConfig config;
  config.log_dir = options.log_dir;
  config.max_workers = options.workers;
  config.max_tasks = options.tasks;
  apply_env_fallbacks(config);
  start_logging(config);

  InstanceLock lock(InstanceLock::default_path(config.log_dir));
  std::string error_msg;
  if (!lock.try_acquire(error_msg)) {
    RUNLIFT_LOG_FATAL(error_msg);
    return EXIT_SETUP_FAILURE;
  }

  SlackNotifier notifier(config.slack);

  uploader::BlobStoreFactory factory;
  if (!prepare_blob_store(config.s3, {options.bucket}, notifier, factory)) {
    return EXIT_SETUP_FAILURE;
  }

  fs::path run_dir = uploader::normalizePath(options.local_path);

  try {
    Monitor monitor(config, factory, notifier);

    uploader::RunDiscovery checker(monitor.stateStore());
    if (!checker.isRunDirectory(run_dir.string()) ||
        !checker.isAcquisitionComplete(run_dir.string())) {
      RUNLIFT_LOG_ERROR(
        "Provided directory does not appear to be a complete run, check the path and try again"
        << kv("path", run_dir.string())
      );
      return EXIT_SETUP_FAILURE;
    }

    uploader::RunDescriptor run;
    run.run_id = run_dir.filename().string();
    run.run_path = run_dir.string();
    run.parent_path = run_dir.parent_path().string();
    run.bucket = options.bucket;
    run.remote_path_prefix = options.remote_path;

    // Resume from an earlier attempt when one was recorded
    if (auto existing = monitor.stateStore().read(run.run_id)) {
      run.uploaded_files = existing->uploadedPaths();
    }

    RunOutcome outcome = monitor.uploadRun(run);
    if (!outcome.error.empty()) {
      return EXIT_SETUP_FAILURE;
    }

    std::vector<std::string> completed;
    std::vector<std::string> failed;
    (outcome.completed ? completed : failed).push_back(outcome.run_id);
    notifier.notifyRunSummary(completed, failed);
  } catch (const std::exception& e) {
    RUNLIFT_LOG_FATAL("Upload failed" << kv("error", e.what()));
    return EXIT_SETUP_FAILURE;
  }

  return EXIT_OK;
}

int Commands::monitor(const MonitorOptions& options) {
  RunliftConfig config;
  ConfigParser parser;

  if (!parser.load_from_file(options.config_path, config)) {
    std::cerr << "Error: " << parser.get_last_error() << std::endl;
    return EXIT_SETUP_FAILURE;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    return EXIT_SETUP_FAILURE;
  }

  apply_env_fallbacks(config);
  start_logging(config);

  InstanceLock lock(InstanceLock::default_path(config.log_dir));
  if (!lock.try_acquire(error_msg)) {
    RUNLIFT_LOG_FATAL(error_msg);
    return EXIT_SETUP_FAILURE;
  }

  SlackNotifier notifier(config.slack);

  uploader::BlobStoreFactory factory;
  if (options.dry_run) {
    // Nothing is transferred, so S3 is never contacted
    factory = store_factory_ ? store_factory_ : uploader::makeS3BlobStoreFactory(config.s3);
  } else {
    std::set<std::string> buckets;
    for (const auto& section : config.monitor) {
      buckets.insert(section.bucket);
    }
    if (!prepare_blob_store(config.s3, buckets, notifier, factory)) {
      return EXIT_SETUP_FAILURE;
    }
  }

  try {
    Monitor monitor(config, factory, notifier);
    CycleReport report = monitor.runCycle(options.dry_run);

    if (options.dry_run) {
      std::cout << report.planned.size() << " run(s) would be uploaded" << std::endl;
      for (const auto& run : report.planned) {
        std::cout << "  " << run.run_id << " -> " << run.bucket << ":" << run.remote_path_prefix
                  << (run.uploaded_files.empty() ? "" : " (resuming)") << std::endl;
      }
    }
  } catch (const std::exception& e) {
    RUNLIFT_LOG_FATAL("Monitor cycle failed" << kv("error", e.what()));
    return EXIT_SETUP_FAILURE;
  }

  return EXIT_OK;
}

int Commands::execute(int argc, char* argv[]) {
  CommandLine cmd;
  std::string error_msg;

  if (!parse_command_line(argc, argv, cmd, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage();
    return EXIT_USAGE;
  }

  switch (cmd.mode) {
    case Mode::UPLOAD:
      return upload(cmd.upload);
    case Mode::MONITOR:
      return monitor(cmd.monitor);
    case Mode::HELP:
      print_usage();
      return EXIT_OK;
  }
  return EXIT_USAGE;
}

void Commands::print_usage() {
  std::cout << "Usage: runlift <mode> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Modes:" << std::endl;
  std::cout << "  upload    Upload a single finished run directory" << std::endl;
  std::cout << "  monitor   Scan configured directories and upload finished runs" << std::endl;
  std::cout << "  help      Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Upload options:" << std::endl;
  std::cout << "  --local-path DIR    Run directory to upload (required)" << std::endl;
  std::cout << "  --bucket NAME       S3 bucket to upload to (required)" << std::endl;
  std::cout << "  --remote-path PATH  Prefix in the bucket (default: /)" << std::endl;
  std::cout << "  --workers N         Parallel workers (default: CPU count)" << std::endl;
  std::cout << "  --tasks N           Concurrent transfers per worker (default: 4)" << std::endl;
  std::cout << "  --log-dir DIR       Log and upload state directory (default: /var/log/runlift)"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Monitor options:" << std::endl;
  std::cout << "  --config FILE       YAML config file (required)" << std::endl;
  std::cout << "  --dry-run           Report runs to upload without uploading" << std::endl;
  std::cout << std::endl;
  std::cout << "Exit codes: 0 success, 1 setup failure, 2 usage error" << std::endl;
}

}  // namespace app
}  // namespace runlift
