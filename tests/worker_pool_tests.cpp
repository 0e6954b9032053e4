#include "core/worker_pool.hpp"
#include "gtest/gtest.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace backupforge;

TEST(WorkerPoolTest, FuturesCarryResults) {
  WorkerPool pool(4, 4);
  EXPECT_EQ(pool.threadCount(), 4u);
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 64; ++i) {
    futures.push_back(pool.submit([i]() { return i * i; }));
  }
  for (int i = 0; i < 64; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(WorkerPoolTest, ExceptionsReachTheCaller) {
  WorkerPool pool(2, 2);
  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  auto fine = pool.submit([]() { return 7; });
  EXPECT_THROW(failing.get(), std::runtime_error);
  EXPECT_EQ(fine.get(), 7);
}

TEST(WorkerPoolTest, ConcurrencyNeverExceedsThreadCount) {
  WorkerPool pool(3, 1);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 24; ++i) {
    futures.push_back(pool.submit([&]() {
      const int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      --running;
    }));
  }
  for (auto &f : futures) {
    f.get();
  }
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueThenRejects) {
  WorkerPool pool(1, 8);
  std::atomic<int> done{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(pool.submit([&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++done;
    }));
  }
  pool.shutdown();
  EXPECT_EQ(done.load(), 8);
  EXPECT_THROW(pool.submit([]() { return 0; }), std::runtime_error);
  // Idempotent.
  pool.shutdown();
}

TEST(WorkerPoolTest, ZeroSizesAreClampedToOne) {
  WorkerPool pool(0, 0);
  EXPECT_EQ(pool.threadCount(), 1u);
  EXPECT_EQ(pool.submit([]() { return 5; }).get(), 5);
}
