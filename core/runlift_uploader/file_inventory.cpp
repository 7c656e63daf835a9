// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_inventory.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <regex>
#include <stdexcept>

#define RUNLIFT_LOG_COMPONENT "file_inventory"
#include <runlift_log_macros.hpp>

namespace fs = std::filesystem;

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

namespace {

std::vector<std::regex> compilePatterns(const std::vector<std::string>& patterns) {
  std::vector<std::regex> compiled;
  compiled.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    try {
      compiled.emplace_back(pattern);
    } catch (const std::regex_error& e) {
      throw std::invalid_argument("Invalid exclude pattern '" + pattern + "': " + e.what());
    }
  }
  return compiled;
}

bool isExcluded(const std::string& path, const std::vector<std::regex>& patterns) {
  for (const auto& re : patterns) {
    if (std::regex_search(path, re)) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string normalizePath(const std::string& path) {
  fs::path normal = fs::absolute(path).lexically_normal();
  if (normal.filename().empty() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal.string();
}

std::vector<FileEntry> listRunFiles(
  const std::string& run_dir, const std::vector<std::string>& exclude_patterns
) {
  auto patterns = compilePatterns(exclude_patterns);

  fs::path root = normalizePath(run_dir);
  std::vector<FileEntry> entries;

  // Throws on a missing or unreadable root, and on unreadable subdirectories,
  // so callers never see a partial listing
  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::string path = entry.path().string();
    if (isExcluded(path, patterns)) {
      RUNLIFT_LOG_DEBUG("Excluding file" << kv("path", path));
      continue;
    }
    entries.push_back(FileEntry{path, static_cast<uint64_t>(entry.file_size())});
  }

  std::stable_sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
    return a.size > b.size;
  });

  uint64_t total = 0;
  for (const auto& e : entries) {
    total += e.size;
  }
  RUNLIFT_LOG_INFO(
    "Listed run files" << kv("run_dir", root.string()) << kv("files", entries.size())
                       << kv("total", formatSize(total))
  );

  return entries;
}

std::vector<FileEntry> filterUploaded(
  const std::vector<FileEntry>& entries, const std::set<std::string>& uploaded_paths
) {
  std::vector<FileEntry> remaining;
  remaining.reserve(entries.size());
  for (const auto& entry : entries) {
    if (uploaded_paths.count(entry.path) == 0) {
      remaining.push_back(entry);
    }
  }

  RUNLIFT_LOG_DEBUG(
    "Filtered uploaded files" << kv("local", entries.size()) << kv("uploaded", uploaded_paths.size())
                              << kv("remaining", remaining.size())
  );
  return remaining;
}

std::string formatSize(uint64_t bytes) {
  static const char* units[] = {"", "K", "M", "G", "T", "P", "E", "Z"};
  double num = static_cast<double>(bytes);
  char buf[32];
  for (const char* unit : units) {
    if (num < 1024.0) {
      snprintf(buf, sizeof(buf), "%.2f%sB", num, unit);
      return buf;
    }
    num /= 1024.0;
  }
  snprintf(buf, sizeof(buf), "%.2fYiB", num);
  return buf;
}

}  // namespace uploader
}  // namespace runlift
