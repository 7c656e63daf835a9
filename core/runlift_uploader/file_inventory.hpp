// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_FILE_INVENTORY_HPP
#define RUNLIFT_FILE_INVENTORY_HPP

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace runlift {
namespace uploader {

/**
 * One regular file under a run directory
 */
struct FileEntry {
  std::string path;  // Absolute local path
  uint64_t size = 0;
};

/**
 * Absolute, lexically normalised form of path with no trailing separator.
 * Every recorded run and file path goes through this, so the same directory
 * is always spelled the same way in state records and object keys.
 */
std::string normalizePath(const std::string& path);

/**
 * Recursively list the regular files under run_dir, largest first.
 * Paths are rooted at normalizePath(run_dir).
 *
 * Symlinked directories are not descended into. A file is dropped if its
 * full path matches any of exclude_patterns (ECMAScript, searched anywhere
 * in the path). Entries of equal size keep directory iteration order.
 *
 * @throws std::filesystem::filesystem_error if run_dir is missing or unreadable
 * @throws std::invalid_argument if a pattern does not compile
 */
std::vector<FileEntry> listRunFiles(
  const std::string& run_dir, const std::vector<std::string>& exclude_patterns = {}
);

/**
 * Drop entries whose path is in uploaded_paths. Order is preserved.
 */
std::vector<FileEntry> filterUploaded(
  const std::vector<FileEntry>& entries, const std::set<std::string>& uploaded_paths
);

/**
 * Human-readable binary size, e.g. 1536 -> "1.50KB".
 */
std::string formatSize(uint64_t bytes);

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_FILE_INVENTORY_HPP
