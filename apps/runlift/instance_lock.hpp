// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_INSTANCE_LOCK_HPP
#define RUNLIFT_APP_INSTANCE_LOCK_HPP

#include <string>

namespace runlift {
namespace app {

/**
 * Advisory exclusive lock (flock) on a file, held until release() or
 * destruction. Keeps two monitor processes off the same log directory.
 */
class InstanceLock {
public:
  explicit InstanceLock(std::string lock_path);
  ~InstanceLock();

  // Non-copyable, non-movable
  InstanceLock(const InstanceLock&) = delete;
  InstanceLock& operator=(const InstanceLock&) = delete;
  InstanceLock(InstanceLock&&) = delete;
  InstanceLock& operator=(InstanceLock&&) = delete;

  /**
   * Take the lock without blocking. Creates the parent directory and the
   * lock file when missing.
   *
   * @return false with error_msg set if another holder exists or the file
   *         cannot be opened
   */
  bool try_acquire(std::string& error_msg);

  void release();

  bool held() const {
    return fd_ >= 0;
  }

  const std::string& path() const {
    return lock_path_;
  }

  static std::string default_path(const std::string& log_dir);

private:
  std::string lock_path_;
  int fd_ = -1;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_INSTANCE_LOCK_HPP
