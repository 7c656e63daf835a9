// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for run discovery and New/Partial/Uploaded classification
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "file_inventory.hpp"
#include "run_discovery.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace runlift::uploader;
using namespace runlift::uploader::test;

class RunDiscoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = createTempDir("runlift_discovery_root_");
    log_dir_ = createTempDir("runlift_discovery_logs_");
    store_ = std::make_unique<UploadStateStore>(log_dir_);
  }

  void TearDown() override {
    removeDir(root_);
    removeDir(log_dir_);
  }

  std::string root_;
  std::string log_dir_;
  std::unique_ptr<UploadStateStore> store_;
};

TEST_F(RunDiscoveryTest, NewRunWithoutRecord) {
  std::string run = createRunDir(root_, "240101_M0001_0001_A", {{"a.bcl", 10}});
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_});

  ASSERT_EQ(result.new_runs.size(), 1u);
  EXPECT_TRUE(result.partial_runs.empty());
  EXPECT_EQ(result.new_runs[0].run_id, "240101_M0001_0001_A");
  EXPECT_EQ(result.new_runs[0].run_path, run);
  EXPECT_EQ(result.new_runs[0].parent_path, root_);
  EXPECT_TRUE(result.new_runs[0].uploaded_files.empty());
}

TEST_F(RunDiscoveryTest, RootSpellingDoesNotChangeRecordedPaths) {
  std::string partial = createRunDir(root_, "R_partial", {{"a", 1}, {"b", 1}});
  fs::create_directories(root_ + "/scratch");
  store_->mergeAndWrite(
    "R_partial", partial, {partial + "/a", partial + "/b"}, {{partial + "/a", "e1"}},
    {partial + "/b"}
  );
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_ + "/scratch/..//"});

  ASSERT_EQ(result.partial_runs.size(), 1u);
  const RunDescriptor& run = result.partial_runs[0];
  EXPECT_EQ(run.run_path, partial);
  EXPECT_EQ(run.parent_path, root_);

  // Files listed under the discovered path match what the record holds,
  // so only the unconfirmed file is left to upload
  auto remaining = filterUploaded(listRunFiles(run.run_path), run.uploaded_files);
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].path, partial + "/b");
}

TEST_F(RunDiscoveryTest, EachCompletionMarkerIsSufficient) {
  createRunDir(root_, "R_copy", {}, "CopyComplete.txt");
  createRunDir(root_, "R_rta_txt", {}, "RTAComplete.txt");
  createRunDir(root_, "R_rta_xml", {}, "RTAComplete.xml");
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_});

  ASSERT_EQ(result.new_runs.size(), 3u);
  EXPECT_EQ(result.new_runs[0].run_id, "R_copy");
  EXPECT_EQ(result.new_runs[1].run_id, "R_rta_txt");
  EXPECT_EQ(result.new_runs[2].run_id, "R_rta_xml");
}

TEST_F(RunDiscoveryTest, SkipsDirectoriesWithoutMarkers) {
  createRunDir(root_, "still_sequencing", {{"a.bcl", 10}}, "");
  fs::create_directories(root_ + "/not_a_run");
  createSizedFile(root_ + "/not_a_run/CopyComplete.txt", 0);
  createSizedFile(root_ + "/stray_file.txt", 5);
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_});

  EXPECT_TRUE(result.empty());
  EXPECT_TRUE(result.errored_runs.empty());
}

TEST_F(RunDiscoveryTest, ClassifiesByStateRecord) {
  createRunDir(root_, "R_new", {{"a", 1}});
  std::string partial = createRunDir(root_, "R_partial", {{"a", 1}, {"b", 1}});
  std::string done = createRunDir(root_, "R_done", {{"a", 1}});

  store_->mergeAndWrite(
    "R_partial", partial, {partial + "/a", partial + "/b"}, {{partial + "/a", "e1"}},
    {partial + "/b"}
  );
  store_->mergeAndWrite("R_done", done, {done + "/a"}, {{done + "/a", "e1"}}, {});

  RunDiscovery discovery(*store_);
  auto result = discovery.discover({root_});

  ASSERT_EQ(result.new_runs.size(), 1u);
  EXPECT_EQ(result.new_runs[0].run_id, "R_new");
  ASSERT_EQ(result.partial_runs.size(), 1u);
  EXPECT_EQ(result.partial_runs[0].run_id, "R_partial");
  EXPECT_EQ(result.partial_runs[0].uploaded_files, (std::set<std::string>{partial + "/a"}));
}

TEST_F(RunDiscoveryTest, CorruptRecordIsReportedAndSkipped) {
  createRunDir(root_, "R_bad", {{"a", 1}});
  createRunDir(root_, "R_good", {{"a", 1}});
  writeTextFile(store_->recordPath("R_bad"), "not json");

  RunDiscovery discovery(*store_);
  auto result = discovery.discover({root_});

  ASSERT_EQ(result.errored_runs.size(), 1u);
  EXPECT_EQ(result.errored_runs[0].run_id, "R_bad");
  ASSERT_EQ(result.new_runs.size(), 1u);
  EXPECT_EQ(result.new_runs[0].run_id, "R_good");
}

TEST_F(RunDiscoveryTest, RunNameFilter) {
  createRunDir(root_, "240101_M0001_0001_A", {});
  createRunDir(root_, "test_run", {});
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_}, std::string("^[0-9]{6}_"));

  ASSERT_EQ(result.new_runs.size(), 1u);
  EXPECT_EQ(result.new_runs[0].run_id, "240101_M0001_0001_A");
  EXPECT_THROW(discovery.discover({root_}, std::string("([")), std::invalid_argument);
}

TEST_F(RunDiscoveryTest, CustomMarkers) {
  fs::create_directories(root_ + "/custom");
  createSizedFile(root_ + "/custom/manifest.json", 1);
  createSizedFile(root_ + "/custom/DONE", 0);
  createRunDir(root_, "illumina", {});

  RunMarkers markers;
  markers.run_markers = {"manifest.json"};
  markers.completion_markers = {"DONE"};
  RunDiscovery discovery(*store_, markers);

  auto result = discovery.discover({root_});

  ASSERT_EQ(result.new_runs.size(), 1u);
  EXPECT_EQ(result.new_runs[0].run_id, "custom");
}

TEST_F(RunDiscoveryTest, MultipleRoots) {
  std::string second_root = createTempDir("runlift_discovery_second_");
  createRunDir(root_, "R1", {});
  createRunDir(second_root, "R2", {});
  RunDiscovery discovery(*store_);

  auto result = discovery.discover({root_, second_root});

  ASSERT_EQ(result.new_runs.size(), 2u);
  EXPECT_EQ(result.new_runs[1].parent_path, second_root);
  removeDir(second_root);
}

TEST_F(RunDiscoveryTest, InaccessibleRootThrows) {
  RunDiscovery discovery(*store_);
  EXPECT_THROW(discovery.discover({root_ + "/missing"}), fs::filesystem_error);
}

TEST_F(RunDiscoveryTest, DiscoveryDoesNotWrite) {
  createRunDir(root_, "R1", {{"a", 1}});
  RunDiscovery discovery(*store_);

  discovery.discover({root_});

  EXPECT_FALSE(fs::exists(store_->uploadsDir()));
}
