// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "task_pool.hpp"

namespace runlift {
namespace uploader {

TaskPool::TaskPool(size_t thread_count) {
  if (thread_count == 0) {
    throw std::invalid_argument("TaskPool needs at least one thread");
  }
  workers_.reserve(thread_count);
  try {
    for (size_t i = 0; i < thread_count; ++i) {
      workers_.emplace_back(&TaskPool::workerLoop, this);
    }
  } catch (...) {
    // Joinable threads must not outlive a failed constructor
    shutdown();
    throw;
  }
}

TaskPool::~TaskPool() { shutdown(); }

void TaskPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void TaskPool::workerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

      // Drain the queue before exiting
      if (tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // packaged_task stores any exception in the future
    task();
  }
}

}  // namespace uploader
}  // namespace runlift
