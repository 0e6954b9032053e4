#include "core/dedup_index.hpp"
#include "core/errors.hpp"
#include "test_utils.hpp"
#include "gtest/gtest.h"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace backupforge;

namespace {

ChunkId idFor(const std::string &content) {
  return ChunkId::compute(backupforge::test::toBytes(content));
}

} // namespace

TEST(DedupIndexTest, FirstSightingIsNewThenDuplicate) {
  DedupIndex index;
  const ChunkId id = idFor("alpha");

  EXPECT_EQ(index.checkAndRegister(id), CheckResult::New);
  EXPECT_TRUE(index.contains(id));
  EXPECT_FALSE(index.isCommitted(id));
  index.commit(id, 42);

  uint64_t stored = 0;
  EXPECT_EQ(index.checkAndRegister(id, &stored), CheckResult::Duplicate);
  EXPECT_EQ(stored, 42u);
  EXPECT_EQ(index.referenceCount(id), 2u);
  EXPECT_EQ(index.storedSize(id), 42u);
}

TEST(DedupIndexTest, ReleaseCountsDownToZeroAndKeepsEntry) {
  DedupIndex index;
  const ChunkId id = idFor("beta");
  ASSERT_EQ(index.checkAndRegister(id), CheckResult::New);
  index.commit(id, 10);
  for (int i = 0; i < 4; ++i)
    ASSERT_EQ(index.checkAndRegister(id), CheckResult::Duplicate);
  EXPECT_EQ(index.referenceCount(id), 5u);

  for (uint64_t expected = 4;; --expected) {
    EXPECT_EQ(index.release(id), expected);
    if (expected == 0)
      break;
  }
  EXPECT_TRUE(index.isCommitted(id));
  EXPECT_THROW(index.release(id), IndexConsistencyError);

  // A zero-reference chunk is still reused until pruned.
  EXPECT_EQ(index.checkAndRegister(id), CheckResult::Duplicate);
  EXPECT_EQ(index.referenceCount(id), 1u);
}

TEST(DedupIndexTest, MisuseIsReportedAsConsistencyError) {
  DedupIndex index;
  const ChunkId id = idFor("gamma");
  EXPECT_THROW(index.commit(id, 1), IndexConsistencyError);
  EXPECT_THROW(index.rollback(id), IndexConsistencyError);
  EXPECT_THROW(index.release(id), IndexConsistencyError);
  EXPECT_THROW(index.addReference(id), IndexConsistencyError);

  ASSERT_EQ(index.checkAndRegister(id), CheckResult::New);
  EXPECT_THROW(index.release(id), IndexConsistencyError);
  EXPECT_THROW(index.rebuildFrom({}), IndexConsistencyError);
  index.commit(id, 1);
  EXPECT_THROW(index.commit(id, 1), IndexConsistencyError);
}

TEST(DedupIndexTest, RollbackForgetsTheChunk) {
  DedupIndex index;
  const ChunkId id = idFor("delta");
  ASSERT_EQ(index.checkAndRegister(id), CheckResult::New);
  index.rollback(id);
  EXPECT_FALSE(index.contains(id));
  EXPECT_EQ(index.checkAndRegister(id), CheckResult::New);
}

TEST(DedupIndexTest, ConcurrentRegistrationYieldsExactlyOneNew) {
  DedupIndex index;
  const ChunkId id = idFor("contended");
  constexpr int kThreads = 16;
  std::atomic<int> newCount{0};
  std::atomic<int> dupCount{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      if (index.checkAndRegister(id) == CheckResult::New) {
        ++newCount;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        index.commit(id, 7);
      } else {
        ++dupCount;
      }
    });
  }
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(newCount.load(), 1);
  EXPECT_EQ(dupCount.load(), kThreads - 1);
  EXPECT_EQ(index.referenceCount(id), static_cast<uint64_t>(kThreads));
}

TEST(DedupIndexTest, WaiterIsPromotedAfterRollback) {
  DedupIndex index;
  const ChunkId id = idFor("promoted");
  ASSERT_EQ(index.checkAndRegister(id), CheckResult::New);

  auto waiter = std::async(std::launch::async,
                           [&]() { return index.checkAndRegister(id); });
  // The waiter must block while the entry is pending.
  EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout);

  index.rollback(id);
  EXPECT_EQ(waiter.get(), CheckResult::New);
  EXPECT_EQ(index.referenceCount(id), 1u);
  index.commit(id, 3);
  EXPECT_TRUE(index.isCommitted(id));
}

TEST(DedupIndexTest, RebuildReplacesContents) {
  DedupIndex index;
  const ChunkId stale = idFor("stale");
  ASSERT_EQ(index.checkAndRegister(stale), CheckResult::New);
  index.commit(stale, 1);

  const ChunkId a = idFor("a");
  const ChunkId b = idFor("b");
  index.rebuildFrom({{a, 100}, {b, 200}});

  EXPECT_FALSE(index.contains(stale));
  EXPECT_TRUE(index.isCommitted(a));
  EXPECT_EQ(index.referenceCount(a), 0u);
  EXPECT_EQ(index.storedSize(b), 200u);

  index.addReference(a);
  EXPECT_EQ(index.referenceCount(a), 1u);

  const auto unreferenced = index.unreferenced();
  ASSERT_EQ(unreferenced.size(), 1u);
  EXPECT_EQ(unreferenced.front(), b);
}

TEST(DedupIndexTest, EraseOnlyDropsUnreferencedEntries) {
  DedupIndex index;
  const ChunkId a = idFor("a");
  const ChunkId b = idFor("b");
  index.rebuildFrom({{a, 1}, {b, 1}});
  index.addReference(a);

  EXPECT_FALSE(index.erase(a));
  EXPECT_TRUE(index.erase(b));
  EXPECT_FALSE(index.erase(b));
  EXPECT_EQ(index.size(), 1u);
}

TEST(DedupIndexTest, StatsSummariseEntries) {
  DedupIndex index;
  const ChunkId a = idFor("a");
  const ChunkId b = idFor("b");
  const ChunkId c = idFor("c");
  index.rebuildFrom({{a, 1}, {b, 1}});
  index.addReference(a);
  index.addReference(a);
  ASSERT_EQ(index.checkAndRegister(c), CheckResult::New);

  const DedupIndex::Stats stats = index.stats();
  EXPECT_EQ(stats.uniqueChunks, 2u);
  EXPECT_EQ(stats.totalReferences, 2u);
  EXPECT_EQ(stats.pendingChunks, 1u);
  EXPECT_EQ(stats.unreferencedChunks, 1u);
  index.rollback(c);
}
