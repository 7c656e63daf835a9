// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <runlift_log_init.hpp>

#include "commands.hpp"
#include "instance_lock.hpp"
#include "test_helpers.hpp"
#include "upload_state_store.hpp"
#include "uploader_mocks.hpp"

namespace fs = std::filesystem;

namespace runlift {
namespace app {
namespace test {

using uploader::test::createRunDir;
using uploader::test::createTempDir;
using uploader::test::FakeRemote;
using uploader::test::makeFakeFactory;
using uploader::test::removeDir;
using uploader::test::writeTextFile;

namespace {

// Holds argv storage for the duration of a call
class Argv {
public:
  Argv(std::initializer_list<std::string> args)
      : storage_(args) {
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
  }

  int argc() const {
    return static_cast<int>(pointers_.size());
  }

  char** argv() {
    return pointers_.data();
  }

private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

}  // namespace

// ============================================================================
// Argument parsing
// ============================================================================

TEST(ParseCommandLineTest, UploadWithAllOptions) {
  Argv args{"runlift", "upload", "--local-path", "/data/R1", "--bucket", "raw",
            "--remote-path", "/seq", "--workers", "3", "--tasks", "5", "--log-dir", "/tmp/l"};
  CommandLine cmd;
  std::string error;

  ASSERT_TRUE(parse_command_line(args.argc(), args.argv(), cmd, error)) << error;
  EXPECT_EQ(cmd.mode, Mode::UPLOAD);
  EXPECT_EQ(cmd.upload.local_path, "/data/R1");
  EXPECT_EQ(cmd.upload.bucket, "raw");
  EXPECT_EQ(cmd.upload.remote_path, "/seq");
  EXPECT_EQ(cmd.upload.workers, 3);
  EXPECT_EQ(cmd.upload.tasks, 5);
  EXPECT_EQ(cmd.upload.log_dir, "/tmp/l");
}

TEST(ParseCommandLineTest, UploadDefaultsAndAliases) {
  Argv args{"runlift", "upload", "--local_path=/data/R1", "--bucket=raw", "--threads", "8"};
  CommandLine cmd;
  std::string error;

  ASSERT_TRUE(parse_command_line(args.argc(), args.argv(), cmd, error)) << error;
  EXPECT_EQ(cmd.upload.local_path, "/data/R1");
  EXPECT_EQ(cmd.upload.remote_path, "/");
  EXPECT_GE(cmd.upload.workers, 1);
  EXPECT_EQ(cmd.upload.tasks, 8);
  EXPECT_EQ(cmd.upload.log_dir, "/var/log/runlift");
}

TEST(ParseCommandLineTest, Monitor) {
  Argv args{"runlift", "monitor", "--config", "/etc/runlift.yaml", "--dry-run"};
  CommandLine cmd;
  std::string error;

  ASSERT_TRUE(parse_command_line(args.argc(), args.argv(), cmd, error)) << error;
  EXPECT_EQ(cmd.mode, Mode::MONITOR);
  EXPECT_EQ(cmd.monitor.config_path, "/etc/runlift.yaml");
  EXPECT_TRUE(cmd.monitor.dry_run);
}

TEST(ParseCommandLineTest, Rejections) {
  struct Case {
    std::vector<std::string> args;
    std::string expected;
  };
  std::vector<Case> cases = {
    {{"runlift"}, "No mode"},
    {{"runlift", "sync"}, "Unknown mode"},
    {{"runlift", "upload", "--bucket", "raw"}, "--local-path"},
    {{"runlift", "upload", "--local-path", "/d"}, "--bucket"},
    {{"runlift", "upload", "--local-path", "/d", "--bucket"}, "requires a value"},
    {{"runlift", "upload", "--local-path", "/d", "--bucket", "b", "--workers", "0"}, "positive"},
    {{"runlift", "upload", "--local-path", "/d", "--bucket", "b", "--tasks", "4x"}, "positive"},
    {{"runlift", "upload", "--local-path", "/d", "--bucket", "b", "--dry-run"}, "Unknown option"},
    {{"runlift", "monitor"}, "--config"},
    {{"runlift", "monitor", "--config", "c.yaml", "--bucket", "b"}, "Unknown option"},
  };

  for (const auto& c : cases) {
    std::vector<std::string> storage = c.args;
    std::vector<char*> argv;
    for (auto& arg : storage) {
      argv.push_back(arg.data());
    }
    CommandLine cmd;
    std::string error;

    EXPECT_FALSE(parse_command_line(static_cast<int>(argv.size()), argv.data(), cmd, error))
      << storage.back();
    EXPECT_NE(error.find(c.expected), std::string::npos) << error;
  }
}

TEST(ParseCommandLineTest, Help) {
  Argv args{"runlift", "--help"};
  CommandLine cmd;
  std::string error;

  ASSERT_TRUE(parse_command_line(args.argc(), args.argv(), cmd, error));
  EXPECT_EQ(cmd.mode, Mode::HELP);
}

// ============================================================================
// Command execution with an in-memory blob store
// ============================================================================

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("SLACK_LOG_WEBHOOK");
    unsetenv("SLACK_ALERT_WEBHOOK");
    root_ = createTempDir("runlift_commands_root_");
    log_dir_ = createTempDir("runlift_commands_logs_");
    remote_ = std::make_shared<FakeRemote>();
  }

  void TearDown() override {
    ::runlift::logging::shutdown_logging();
    removeDir(root_);
    removeDir(log_dir_);
  }

  UploadOptions uploadOptions(const std::string& run_dir) {
    UploadOptions options;
    options.local_path = run_dir;
    options.bucket = "raw";
    options.remote_path = "/seq";
    options.workers = 2;
    options.tasks = 2;
    options.log_dir = log_dir_;
    return options;
  }

  std::string writeConfig() {
    std::string path = root_ + "/runlift.yaml";
    writeTextFile(
      path,
      "log_dir: " + log_dir_ +
        "\n"
        "max_workers: 2\n"
        "max_tasks: 2\n"
        "logging:\n"
        "  console: {enabled: false}\n"
        "monitor:\n"
        "  - monitored_directories: [" +
        root_ + "/runs]\n" +
        "    bucket: raw\n"
        "    remote_path: /\n"
    );
    return path;
  }

  std::string root_;
  std::string log_dir_;
  std::shared_ptr<FakeRemote> remote_;
};

TEST_F(CommandsTest, ExecuteUsageErrors) {
  Commands commands(makeFakeFactory(remote_));

  Argv bad{"runlift", "upload"};
  EXPECT_EQ(commands.execute(bad.argc(), bad.argv()), EXIT_USAGE);

  Argv help{"runlift", "help"};
  EXPECT_EQ(commands.execute(help.argc(), help.argv()), EXIT_OK);
}

TEST_F(CommandsTest, UploadSingleRun) {
  std::string run = createRunDir(root_, "R1", {{"Data/a.bcl", 100}});
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_OK);

  auto objects = remote_->objects();
  EXPECT_EQ(objects.size(), 3u);
  EXPECT_EQ(objects.count("raw/seq/R1/Data/a.bcl"), 1u);

  uploader::UploadStateStore store(log_dir_);
  auto state = store.read("R1");
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->completed);
  EXPECT_EQ(state->total_uploaded_files, 3u);
}

TEST_F(CommandsTest, UploadAcceptsTrailingSlash) {
  std::string run = createRunDir(root_, "R1", {{"a", 1}});
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run + "/")), EXIT_OK);
  EXPECT_EQ(remote_->objects().count("raw/seq/R1/a"), 1u);
}

TEST_F(CommandsTest, UploadResidualFailuresStillExitZeroAndResume) {
  std::string run = createRunDir(root_, "R1", {{"a", 10}, {"b", 10}});
  remote_->failPut(run + "/b");
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_OK);
  {
    uploader::UploadStateStore store(log_dir_);
    auto state = store.read("R1");
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->completed);
    EXPECT_EQ(state->failed_upload_files, std::vector<std::string>{run + "/b"});
  }

  remote_->clearFailures();
  remote_->resetAttempts();
  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_OK);

  EXPECT_EQ(remote_->attempted(), std::vector<std::string>{run + "/b"});
  uploader::UploadStateStore store(log_dir_);
  EXPECT_TRUE(store.read("R1")->completed);
}

TEST_F(CommandsTest, UploadRejectsIncompleteRun) {
  std::string run = createRunDir(root_, "R1", {{"a", 10}}, "");
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_SETUP_FAILURE);
  EXPECT_TRUE(remote_->attempted().empty());
}

TEST_F(CommandsTest, UploadStopsWhenBucketMissing) {
  std::string run = createRunDir(root_, "R1", {{"a", 10}});
  remote_->hideBucket("raw");
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_SETUP_FAILURE);
  EXPECT_TRUE(remote_->attempted().empty());
}

TEST_F(CommandsTest, UploadStopsWhenAccessDenied) {
  std::string run = createRunDir(root_, "R1", {{"a", 10}});
  remote_->denyAccess("InvalidAccessKeyId");
  Commands commands(makeFakeFactory(remote_));

  EXPECT_EQ(commands.upload(uploadOptions(run)), EXIT_SETUP_FAILURE);
  EXPECT_TRUE(remote_->attempted().empty());
}

TEST_F(CommandsTest, MonitorUploadsFinishedRuns) {
  fs::create_directories(root_ + "/runs");
  createRunDir(root_ + "/runs", "R1", {{"a", 10}});
  Commands commands(makeFakeFactory(remote_));

  MonitorOptions options;
  options.config_path = writeConfig();
  EXPECT_EQ(commands.monitor(options), EXIT_OK);

  EXPECT_EQ(remote_->objects().count("raw/R1/a"), 1u);
  EXPECT_TRUE(fs::exists(log_dir_ + "/uploads/R1.upload.log.json"));
}

TEST_F(CommandsTest, MonitorDryRunUploadsNothing) {
  fs::create_directories(root_ + "/runs");
  createRunDir(root_ + "/runs", "R1", {{"a", 10}});
  Commands commands(makeFakeFactory(remote_));

  MonitorOptions options;
  options.config_path = writeConfig();
  options.dry_run = true;
  EXPECT_EQ(commands.monitor(options), EXIT_OK);

  EXPECT_TRUE(remote_->attempted().empty());
  EXPECT_FALSE(fs::exists(log_dir_ + "/uploads"));
}

TEST_F(CommandsTest, MonitorSetupFailures) {
  Commands commands(makeFakeFactory(remote_));
  MonitorOptions options;

  options.config_path = root_ + "/missing.yaml";
  EXPECT_EQ(commands.monitor(options), EXIT_SETUP_FAILURE);

  options.config_path = root_ + "/invalid.yaml";
  writeTextFile(options.config_path, "max_workers: 2\n");
  EXPECT_EQ(commands.monitor(options), EXIT_SETUP_FAILURE);
}

TEST_F(CommandsTest, MonitorRefusesWhenLockHeld) {
  fs::create_directories(root_ + "/runs");
  createRunDir(root_ + "/runs", "R1", {{"a", 10}});
  InstanceLock other(InstanceLock::default_path(log_dir_));
  std::string error;
  ASSERT_TRUE(other.try_acquire(error)) << error;
  Commands commands(makeFakeFactory(remote_));

  MonitorOptions options;
  options.config_path = writeConfig();
  EXPECT_EQ(commands.monitor(options), EXIT_SETUP_FAILURE);
  EXPECT_TRUE(remote_->attempted().empty());
}

}  // namespace test
}  // namespace app
}  // namespace runlift
