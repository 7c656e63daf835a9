// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_TASK_POOL_HPP
#define RUNLIFT_TASK_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace runlift {
namespace uploader {

/**
 * Fixed-size thread pool with a FIFO task queue.
 *
 * Tasks return their result (or exception) through the std::future handed
 * out by submit(). Both tiers of the upload engine are TaskPool instances.
 *
 * Thread Safety:
 * - submit() may be called from any thread, including pool threads
 * - shutdown() runs the remaining queued tasks and joins the threads
 */
class TaskPool {
public:
  explicit TaskPool(size_t thread_count);
  ~TaskPool();

  // Non-copyable, non-movable
  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;
  TaskPool(TaskPool&&) = delete;
  TaskPool& operator=(TaskPool&&) = delete;

  /**
   * Queue a callable for execution.
   *
   * @throws std::runtime_error if the pool has been shut down
   */
  template <typename F>
  std::future<typename std::invoke_result<F>::type> submit(F&& fn) {
    using result_type = typename std::invoke_result<F>::type;

    auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(fn));
    std::future<result_type> future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        throw std::runtime_error("submit on stopped TaskPool");
      }
      tasks_.emplace([task]() {
        (*task)();
      });
    }
    cv_.notify_one();
    return future;
  }

  /**
   * Finish queued tasks and join all threads. Idempotent.
   */
  void shutdown();

  size_t threadCount() const { return workers_.size(); }

private:
  void workerLoop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_TASK_POOL_HPP
