// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for round-robin partitioning
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "file_inventory.hpp"
#include "partitioner.hpp"

using namespace runlift::uploader;

namespace {

const std::vector<int> kSixteen = {
  1, 2, 3, 4, 5, 6, 7, 8, 100, 110, 120, 130, 140, 150, 160, 170
};

}  // namespace

TEST(PartitionerTest, FourWayMatchesExpectedBuckets) {
  auto parts = partitionRoundRobin(kSixteen, 4);

  std::vector<std::vector<int>> expected = {
    {1, 5, 100, 140}, {2, 6, 110, 150}, {3, 7, 120, 160}, {4, 8, 130, 170}
  };
  EXPECT_EQ(parts, expected);
}

TEST(PartitionerTest, ThreeWayMatchesExpectedBuckets) {
  auto parts = partitionRoundRobin(kSixteen, 3);

  std::vector<std::vector<int>> expected = {
    {1, 4, 7, 110, 140, 170}, {2, 5, 8, 120, 150}, {3, 6, 100, 130, 160}
  };
  EXPECT_EQ(parts, expected);
}

TEST(PartitionerTest, MoreBucketsThanItemsGivesSingletons) {
  auto parts = partitionRoundRobin(std::vector<int>{1, 2}, 3);

  std::vector<std::vector<int>> expected = {{1}, {2}};
  EXPECT_EQ(parts, expected);
}

TEST(PartitionerTest, EmptyInputGivesNoBuckets) {
  auto parts = partitionRoundRobin(std::vector<int>{}, 4);
  EXPECT_TRUE(parts.empty());
}

TEST(PartitionerTest, ZeroBucketsRejected) {
  EXPECT_THROW(partitionRoundRobin(kSixteen, 0), std::invalid_argument);
}

TEST(PartitionerTest, EveryItemAppearsExactlyOnce) {
  for (size_t n : {0u, 1u, 5u, 16u, 37u}) {
    std::vector<int> items(n);
    std::iota(items.begin(), items.end(), 0);

    for (size_t k = 1; k <= 10; ++k) {
      auto parts = partitionRoundRobin(items, k);

      EXPECT_EQ(parts.size(), std::min(k, n)) << "n=" << n << " k=" << k;

      std::vector<int> flattened;
      for (const auto& part : parts) {
        EXPECT_FALSE(part.empty());
        flattened.insert(flattened.end(), part.begin(), part.end());
      }
      std::sort(flattened.begin(), flattened.end());
      EXPECT_EQ(flattened, items) << "n=" << n << " k=" << k;
    }
  }
}

TEST(PartitionerTest, SpreadsLargeFilesAcrossBuckets) {
  std::vector<FileEntry> files = {
    {"/run/a", 900}, {"/run/b", 800}, {"/run/c", 700}, {"/run/d", 10}, {"/run/e", 5}
  };

  auto parts = partitionRoundRobin(files, 3);

  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0][0].path, "/run/a");
  EXPECT_EQ(parts[1][0].path, "/run/b");
  EXPECT_EQ(parts[2][0].path, "/run/c");
  EXPECT_EQ(parts[0][1].path, "/run/d");
  EXPECT_EQ(parts[1][1].path, "/run/e");
}
