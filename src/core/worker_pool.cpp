#include "core/worker_pool.hpp"

#include <algorithm>
#include <stdexcept>

namespace backupforge {

WorkerPool::WorkerPool(size_t threads, size_t queueCapacity)
    : capacity_(std::max<size_t>(queueCapacity, 1)) {
  threads = std::max<size_t>(threads, 1);
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::threadFunc, this);
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && threads_.empty())
      return;
    stopping_ = true;
  }
  notEmpty_.notify_all();
  notFull_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

void WorkerPool::enqueue(std::function<void()> job) {
  std::unique_lock<std::mutex> lock(mutex_);
  notFull_.wait(lock,
                [this] { return stopping_ || queue_.size() < capacity_; });
  if (stopping_) {
    throw std::runtime_error("WorkerPool is shut down");
  }
  queue_.push_back(std::move(job));
  lock.unlock();
  notEmpty_.notify_one();
}

void WorkerPool::threadFunc() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      notEmpty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return; // stopping and drained
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    notFull_.notify_one();
    // packaged_task stores any exception in the future.
    job();
  }
}

} // namespace backupforge
