#pragma once
#ifndef BACKUPFORGE_WORKER_POOL_HPP
#define BACKUPFORGE_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace backupforge {

/**
 * @brief Fixed set of threads draining a bounded task queue.
 *
 * submit() blocks while the queue is full, which is what bounds the number
 * of chunks held in memory. Results and exceptions travel back through the
 * returned future.
 */
class WorkerPool {
public:
  /**
   * @param threads Worker count, at least 1.
   * @param queueCapacity Tasks waiting for a worker, at least 1.
   */
  WorkerPool(size_t threads, size_t queueCapacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename F>
  auto submit(F &&fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;
    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
  }

  /** Finish queued tasks and join the threads. Idempotent. */
  void shutdown();

  size_t threadCount() const { return threads_.size(); }

private:
  void enqueue(std::function<void()> job);
  void threadFunc();

  std::mutex mutex_;
  std::condition_variable notEmpty_;
  std::condition_variable notFull_;
  std::deque<std::function<void()>> queue_;
  size_t capacity_;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

} // namespace backupforge

#endif // BACKUPFORGE_WORKER_POOL_HPP
