// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_PARTITIONER_HPP
#define RUNLIFT_PARTITIONER_HPP

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace runlift {
namespace uploader {

/**
 * Deal items round-robin into k buckets: the item at position p goes to
 * bucket p % k. With items sorted largest first this spreads big files
 * across buckets, giving roughly even counts and byte totals.
 *
 * Empty buckets are dropped, so the result holds min(k, items.size())
 * buckets in ascending bucket index.
 *
 * @throws std::invalid_argument if k == 0
 */
template <typename T>
std::vector<std::vector<T>> partitionRoundRobin(const std::vector<T>& items, size_t k) {
  if (k == 0) {
    throw std::invalid_argument("partition count must be positive");
  }

  size_t bucket_count = items.size() < k ? items.size() : k;
  std::vector<std::vector<T>> buckets(bucket_count);
  for (size_t p = 0; p < items.size(); ++p) {
    buckets[p % k].push_back(items[p]);
  }
  return buckets;
}

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_PARTITIONER_HPP
