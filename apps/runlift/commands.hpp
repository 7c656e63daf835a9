// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_COMMANDS_HPP
#define RUNLIFT_APP_COMMANDS_HPP

#include <set>
#include <string>

#include "blob_store.hpp"
#include "notifier.hpp"
#include "runlift_config.hpp"

namespace runlift {
namespace app {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_SETUP_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

/**
 * Options of `runlift upload`
 */
struct UploadOptions {
  std::string local_path;
  std::string bucket;
  std::string remote_path = "/";
  int workers = default_worker_count();
  int tasks = 4;
  std::string log_dir = "/var/log/runlift";
};

/**
 * Options of `runlift monitor`
 */
struct MonitorOptions {
  std::string config_path;
  bool dry_run = false;
};

enum class Mode { HELP, UPLOAD, MONITOR };

struct CommandLine {
  Mode mode = Mode::HELP;
  UploadOptions upload;
  MonitorOptions monitor;
};

/**
 * Parse argv into a CommandLine. Options take their value either as the
 * next argument or after '=' (--bucket=name). The underscore spellings
 * of the older uploader (--local_path, --cores, --threads) are accepted.
 */
bool parse_command_line(int argc, char* argv[], CommandLine& cmd, std::string& error_msg);

/**
 * Command handler for the runlift CLI
 */
class Commands {
public:
  Commands() = default;

  /**
   * Use store_factory for every blob store instead of building S3 clients
   * from the AWS_* environment.
   */
  explicit Commands(uploader::BlobStoreFactory store_factory);

  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Upload one finished run directory
   */
  int upload(const UploadOptions& options);

  /**
   * Run one monitor cycle from a config file
   */
  int monitor(const MonitorOptions& options);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  void print_usage();

private:
  /**
   * Resolve credentials and check that S3 and every bucket are reachable.
   * Each failure is sent to the notifier as an alert.
   */
  bool prepare_blob_store(
    uploader::S3Config s3, const std::set<std::string>& buckets, INotifier& notifier,
    uploader::BlobStoreFactory& factory
  );

  uploader::BlobStoreFactory store_factory_;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_COMMANDS_HPP
