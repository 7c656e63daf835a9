// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "instance_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

#define RUNLIFT_LOG_COMPONENT "instance_lock"
#include <runlift_log_macros.hpp>

namespace runlift {
namespace app {

namespace fs = std::filesystem;

InstanceLock::InstanceLock(std::string lock_path)
    : lock_path_(std::move(lock_path)) {}

InstanceLock::~InstanceLock() {
  release();
}

std::string InstanceLock::default_path(const std::string& log_dir) {
  return (fs::path(log_dir) / "runlift.lock").string();
}

bool InstanceLock::try_acquire(std::string& error_msg) {
  if (held()) {
    return true;
  }

  std::error_code ec;
  fs::path parent = fs::path(lock_path_).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }
  if (ec) {
    error_msg = "Cannot create lock directory for " + lock_path_ + ": " + ec.message();
    return false;
  }

  int fd = ::open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    error_msg = "Cannot open lock file " + lock_path_ + ": " + std::strerror(errno);
    return false;
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      error_msg = "Another runlift instance holds " + lock_path_;
    } else {
      error_msg = "Cannot lock " + lock_path_ + ": " + std::strerror(err);
    }
    return false;
  }

  fd_ = fd;
  RUNLIFT_LOG_DEBUG("Acquired instance lock" << ::runlift::logging::kv("path", lock_path_));
  return true;
}

void InstanceLock::release() {
  if (fd_ < 0) {
    return;
  }
  // Closing the descriptor drops the flock
  ::close(fd_);
  fd_ = -1;
}

}  // namespace app
}  // namespace runlift
