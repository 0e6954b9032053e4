#include "core/backup_engine.hpp"
#include "core/errors.hpp"
#include "core/restorer.hpp"
#include "test_utils.hpp"
#include "utilities/metrics.h"
#include "gtest/gtest.h"
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <unistd.h>
#include <unordered_set>

using namespace backupforge;
using backupforge::test::randomString;
using backupforge::test::scratchDir;
using backupforge::test::smallChunkConfig;
using backupforge::test::toBytes;

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

class BackupEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    MetricsRegistry::instance().reset();
    config_ = smallChunkConfig();
    engine_ = std::make_unique<BackupEngine>(config_, storage_, index_);
  }

  MemoryStorage &memory() { return *storage_.as<MemoryStorage>(); }

  /// Three files: two random, one empty.
  std::vector<SourceEntry> sampleEntries() {
    SourceAttributes attrs;
    attrs.mode = 0640;
    attrs.mtimeNs = 1600000000123456789LL;
    attrs.atimeNs = 1600000100000000000LL;
    return {memorySource("docs/report.bin", randomString(300 * 1024, 1), attrs),
            memorySource("empty.txt", "", attrs),
            memorySource("notes.txt", randomString(90 * 1024, 2), attrs)};
  }

  uint64_t totalOccurrences(const Snapshot &snapshot) {
    uint64_t n = 0;
    for (const auto &f : snapshot.files) {
      n += f.chunks.size();
    }
    return n;
  }

  EngineConfig config_;
  Storage storage_{std::in_place_type<MemoryStorage>};
  DedupIndex index_;
  std::unique_ptr<BackupEngine> engine_;
};

} // namespace

TEST_F(BackupEngineTest, RestoresByteIdenticalFilesWithAttributes) {
  const auto entries = sampleEntries();
  const Snapshot snapshot = engine_->backup(entries, {"/data", "first", {}, {}});
  ASSERT_TRUE(snapshot.failures.empty());
  EXPECT_TRUE(snapshot.complete);
  EXPECT_EQ(snapshot.fileCount, 3u);
  EXPECT_EQ(snapshot.logicalBytes, 390u * 1024);
  EXPECT_EQ(snapshot.source, "/data");
  EXPECT_GT(snapshot.newChunks, 2u);
  EXPECT_EQ(snapshot.reusedChunks, 0u);
  EXPECT_EQ(snapshot.storedBytes, snapshot.referencedStoredBytes);

  const fs::path target = scratchDir("engine_roundtrip");
  Restorer restorer(config_, storage_);
  const RestoreReport report = restorer.restore(snapshot, target);
  ASSERT_TRUE(report.ok()) << report.failures[0].message;
  EXPECT_EQ(report.restored.size(), 3u);
  EXPECT_EQ(report.bytesWritten, snapshot.logicalBytes);

  for (const auto &entry : entries) {
    const fs::path restored = target / entry.relativePath;
    ASSERT_TRUE(fs::exists(restored)) << entry.relativePath;
    EXPECT_FALSE(fs::exists(restored.string() + ".partial"));
    const SourceAttributes attrs = statAttributes(restored);
    EXPECT_EQ(attrs.mode, 0640u);
    EXPECT_EQ(attrs.mtimeNs, 1600000000123456789LL);
    EXPECT_EQ(attrs.atimeNs, 1600000100000000000LL);
    EXPECT_EQ(attrs.size, entry.attributes.size);
    auto in = entry.open();
    const std::string expected((std::istreambuf_iterator<char>(*in)),
                               std::istreambuf_iterator<char>());
    EXPECT_EQ(readFile(restored), expected) << entry.relativePath;
  }
}

TEST_F(BackupEngineTest, EmptyFileHasNoChunks) {
  SourceAttributes attrs;
  attrs.mode = 0600;
  const Snapshot snapshot = engine_->backup({memorySource("zero", "", attrs)});
  ASSERT_EQ(snapshot.files.size(), 1u);
  EXPECT_TRUE(snapshot.files[0].chunks.empty());
  EXPECT_EQ(snapshot.files[0].size, 0u);
  EXPECT_EQ(memory().putCount(), 0u);

  const fs::path target = scratchDir("engine_empty");
  Restorer restorer(config_, storage_);
  ASSERT_TRUE(restorer.restore(snapshot, target).ok());
  EXPECT_EQ(fs::file_size(target / "zero"), 0u);
  EXPECT_EQ(statAttributes(target / "zero").mode, 0600u);
}

TEST_F(BackupEngineTest, UnchangedSourceStoresNothingNew) {
  const auto entries = sampleEntries();
  const Snapshot first = engine_->backup(entries);
  memory().resetCounters();

  const Snapshot second = engine_->backup(entries);
  EXPECT_EQ(memory().putCount(), 0u);
  EXPECT_EQ(second.newChunks, 0u);
  EXPECT_EQ(second.reusedChunks, first.newChunks + first.reusedChunks);
  EXPECT_EQ(second.storedBytes, 0u);
  EXPECT_EQ(second.referencedStoredBytes, first.referencedStoredBytes);
  EXPECT_NE(second.id, first.id);

  for (const auto &file : second.files) {
    for (const auto &id : file.chunks) {
      EXPECT_EQ(index_.referenceCount(id), 2u);
    }
  }
}

TEST_F(BackupEngineTest, RepeatedChunkWithinFileCountsEachOccurrence) {
  config_.chunking.strategy = ChunkingStrategy::Fixed;
  engine_ = std::make_unique<BackupEngine>(config_, storage_, index_);
  const std::string block = randomString(config_.chunking.avgSize, 4);

  const Snapshot snapshot =
      engine_->backup({memorySource("twice.bin", block + block)});
  ASSERT_TRUE(snapshot.failures.empty());
  ASSERT_EQ(snapshot.files.size(), 1u);
  const FileMetadata &file = snapshot.files[0];
  ASSERT_EQ(file.chunks.size(), 2u);
  EXPECT_EQ(file.chunks[0], file.chunks[1]);
  EXPECT_EQ(index_.referenceCount(file.chunks[0]), 2u);
  EXPECT_EQ(memory().putCount(), 1u);
  EXPECT_EQ(snapshot.newChunks, 1u);
  EXPECT_EQ(snapshot.reusedChunks, 1u);

  EXPECT_EQ(engine_->releaseSnapshot(snapshot), 1u);
  EXPECT_EQ(index_.referenceCount(file.chunks[0]), 0u);
}

TEST_F(BackupEngineTest, IdenticalFilesShareChunks) {
  const std::string content = randomString(200 * 1024, 3);
  std::vector<SourceEntry> entries;
  for (int i = 0; i < 6; ++i) {
    entries.push_back(memorySource("copy" + std::to_string(i), content));
  }
  const Snapshot snapshot = engine_->backup(entries);
  ASSERT_TRUE(snapshot.failures.empty());

  const auto &chunks = snapshot.files[0].chunks;
  const std::unordered_set<ChunkId, ChunkIdHash> unique(chunks.begin(),
                                                       chunks.end());
  EXPECT_EQ(memory().objectCount(), unique.size());
  EXPECT_EQ(memory().putCount(), unique.size());
  EXPECT_EQ(snapshot.newChunks, unique.size());
  for (const auto &file : snapshot.files) {
    EXPECT_EQ(file.chunks, chunks);
  }
  for (const auto &id : unique) {
    EXPECT_EQ(index_.referenceCount(id), 6u);
  }
}

TEST_F(BackupEngineTest, PermanentStoreFailureFailsOnlyThatFile) {
  const std::string doomed = randomString(200 * 1024, 4);
  const auto chunks = Chunker(config_.chunking).split(toBytes(doomed));
  ASSERT_GE(chunks.size(), 2u);
  const std::string failKey = ChunkId::compute(chunks.back().data).toString();
  const ChunkId firstId = ChunkId::compute(chunks.front().data);

  memory().setFaultHook([failKey](StorageOperation op, const std::string &key) {
    if (op == StorageOperation::Put && key == failKey) {
      throw StorageError(StorageError::Code::Permanent, "disk full");
    }
  });

  std::vector<SourceEntry> entries = {
      memorySource("good1", randomString(50 * 1024, 5)),
      memorySource("doomed", doomed),
      memorySource("good2", randomString(70 * 1024, 6))};
  const Snapshot snapshot = engine_->backup(entries);

  ASSERT_EQ(snapshot.failures.size(), 1u);
  const FileFailure &failure = snapshot.failures[0];
  EXPECT_EQ(failure.path, "doomed");
  EXPECT_EQ(failure.kind, ErrorKind::Storage);
  EXPECT_EQ(failure.chunkId, failKey);
  ASSERT_TRUE(failure.offset.has_value());
  EXPECT_EQ(*failure.offset, chunks.back().offset);
  EXPECT_TRUE(snapshot.complete);

  ASSERT_EQ(snapshot.files.size(), 2u);
  EXPECT_EQ(snapshot.files[0].path, "good1");
  EXPECT_EQ(snapshot.files[1].path, "good2");

  // The failed chunk was never committed; the stored ones were released.
  EXPECT_FALSE(index_.contains(ChunkId::fromString(failKey)));
  EXPECT_EQ(index_.referenceCount(firstId), 0u);
  for (const auto &file : snapshot.files) {
    for (const auto &id : file.chunks) {
      EXPECT_EQ(index_.referenceCount(id), 1u);
    }
  }
  EXPECT_EQ(MetricsRegistry::instance().counterValue(metrics::FILE_FAILURES),
            1.0);
}

TEST_F(BackupEngineTest, TransientStoreFailuresAreRetried) {
  auto attempts = std::make_shared<std::map<std::string, int>>();
  auto mutex = std::make_shared<std::mutex>();
  memory().setFaultHook([attempts, mutex](StorageOperation op,
                                          const std::string &key) {
    if (op != StorageOperation::Put) {
      return;
    }
    std::lock_guard<std::mutex> lock(*mutex);
    if (++(*attempts)[key] <= 2) {
      throw StorageError(StorageError::Code::Transient, "timeout");
    }
  });

  const Snapshot snapshot =
      engine_->backup({memorySource("f", randomString(100 * 1024, 7))});
  ASSERT_TRUE(snapshot.failures.empty());
  EXPECT_EQ(memory().objectCount(), snapshot.newChunks);
  EXPECT_EQ(MetricsRegistry::instance().counterValue(metrics::STORAGE_RETRIES),
            2.0 * static_cast<double>(snapshot.newChunks));

  const fs::path target = scratchDir("engine_retry");
  Restorer restorer(config_, storage_);
  EXPECT_TRUE(restorer.restore(snapshot, target).ok());
}

TEST_F(BackupEngineTest, ExhaustedRetriesRollBack) {
  memory().setFaultHook([](StorageOperation op, const std::string &) {
    if (op == StorageOperation::Put) {
      throw StorageError(StorageError::Code::Transient, "still down");
    }
  });
  const Snapshot snapshot =
      engine_->backup({memorySource("only", randomString(8 * 1024, 8))});
  ASSERT_EQ(snapshot.failures.size(), 1u);
  EXPECT_EQ(snapshot.failures[0].kind, ErrorKind::Storage);
  EXPECT_EQ(index_.size(), 0u);
  EXPECT_EQ(MetricsRegistry::instance().counterValue(metrics::STORAGE_RETRIES),
            static_cast<double>(config_.storageRetry.maxAttempts - 1));
}

TEST_F(BackupEngineTest, UnreadableSourceIsAnIoFailure) {
  SourceEntry broken;
  broken.relativePath = "gone";
  broken.open = []() -> std::unique_ptr<std::istream> { return nullptr; };
  const Snapshot snapshot =
      engine_->backup({broken, memorySource("ok", "fine")});
  ASSERT_EQ(snapshot.failures.size(), 1u);
  EXPECT_EQ(snapshot.failures[0].path, "gone");
  EXPECT_EQ(snapshot.failures[0].kind, ErrorKind::Io);
  ASSERT_EQ(snapshot.files.size(), 1u);
  EXPECT_EQ(snapshot.files[0].path, "ok");
}

TEST_F(BackupEngineTest, FailedSourceEntryIsReportedWithItsMessage) {
  const Snapshot snapshot = engine_->backup(
      {failedSource("locked", IoError("cannot read directory: denied")),
       memorySource("ok", "fine")});
  ASSERT_EQ(snapshot.failures.size(), 1u);
  EXPECT_EQ(snapshot.failures[0].path, "locked");
  EXPECT_EQ(snapshot.failures[0].kind, ErrorKind::Io);
  EXPECT_NE(snapshot.failures[0].message.find("denied"), std::string::npos);
  ASSERT_EQ(snapshot.files.size(), 1u);
  EXPECT_TRUE(snapshot.complete);
}

TEST_F(BackupEngineTest, CancelLeavesPartialSnapshot) {
  config_.fileParallelism = 1;
  engine_ = std::make_unique<BackupEngine>(config_, storage_, index_);

  BackupEngine *engine = engine_.get();
  SourceEntry trigger = memorySource("first", randomString(100 * 1024, 9));
  auto realOpen = trigger.open;
  trigger.open = [engine, realOpen]() {
    engine->cancel();
    return realOpen();
  };
  const std::vector<SourceEntry> entries = {
      trigger, memorySource("second", randomString(10 * 1024, 10))};

  const Snapshot snapshot = engine_->backup(entries);
  EXPECT_FALSE(snapshot.complete);
  EXPECT_TRUE(snapshot.files.empty());
  ASSERT_EQ(snapshot.failures.size(), 2u);
  for (const auto &failure : snapshot.failures) {
    EXPECT_EQ(failure.kind, ErrorKind::Cancelled);
  }
  EXPECT_EQ(index_.stats().totalReferences, 0u);

  // The flag is cleared once backup() returns.
  EXPECT_FALSE(engine_->cancelRequested());
  const Snapshot next =
      engine_->backup({memorySource("second", randomString(10 * 1024, 10))});
  EXPECT_TRUE(next.complete);
  EXPECT_TRUE(next.failures.empty());
}

TEST_F(BackupEngineTest, ReferenceCountsFollowSnapshots) {
  const auto entries = sampleEntries();
  std::vector<Snapshot> snapshots;
  for (int i = 0; i < 3; ++i) {
    snapshots.push_back(engine_->backup(entries));
  }
  const ChunkId sharedChunk = snapshots[0].files[0].chunks[0];
  EXPECT_EQ(index_.referenceCount(sharedChunk), 3u);

  const size_t unique = index_.size();
  EXPECT_EQ(engine_->releaseSnapshot(snapshots[0]), 0u);
  EXPECT_EQ(index_.referenceCount(sharedChunk), 2u);
  EXPECT_EQ(engine_->releaseSnapshot(snapshots[1]), 0u);
  EXPECT_EQ(engine_->releaseSnapshot(snapshots[2]), unique);
  EXPECT_EQ(index_.referenceCount(sharedChunk), 0u);
  // Still indexed until pruned.
  EXPECT_TRUE(index_.isCommitted(sharedChunk));
}

TEST_F(BackupEngineTest, PruneDeletesOnlyUnreferencedChunks) {
  const Snapshot keep =
      engine_->backup({memorySource("keep", randomString(120 * 1024, 11))});
  const Snapshot drop =
      engine_->backup({memorySource("drop", randomString(120 * 1024, 12))});
  const size_t before = memory().objectCount();
  engine_->releaseSnapshot(drop);

  const auto dry = engine_->prune(true);
  EXPECT_EQ(dry.totalChunks, before);
  EXPECT_EQ(dry.reclaimableChunks, drop.newChunks);
  EXPECT_EQ(dry.reclaimableBytes, drop.storedBytes);
  EXPECT_EQ(dry.freedChunks, 0u);
  EXPECT_EQ(memory().objectCount(), before);

  const auto real = engine_->prune(false);
  EXPECT_EQ(real.freedChunks, drop.newChunks);
  EXPECT_EQ(real.freedBytes, drop.storedBytes);
  EXPECT_EQ(memory().objectCount(), before - drop.newChunks);
  for (const auto &id : drop.files[0].chunks) {
    EXPECT_FALSE(index_.contains(id));
    EXPECT_FALSE(storage_.exists(id.toString()));
  }

  Restorer restorer(config_, storage_);
  EXPECT_TRUE(restorer.restore(keep, scratchDir("engine_prune")).ok());
  EXPECT_EQ(engine_->prune(false).freedChunks, 0u);
}

TEST_F(BackupEngineTest, RebuildIndexFromStorageAndCatalog) {
  const auto entries = sampleEntries();
  const Snapshot a = engine_->backup(entries);
  const Snapshot b =
      engine_->backup({memorySource("extra", randomString(40 * 1024, 13))});

  const ChunkId lost = b.files[0].chunks[0];
  storage_.remove(lost.toString());
  storage_.put("not-a-chunk", toBytes("stray"));

  DedupIndex fresh;
  BackupEngine restarted(config_, storage_, fresh);
  const auto report = restarted.rebuildIndex({a, b});

  EXPECT_EQ(report.storedChunks, memory().objectCount() - 1);
  ASSERT_EQ(report.foreignKeys.size(), 1u);
  EXPECT_EQ(report.foreignKeys[0], "not-a-chunk");
  ASSERT_EQ(report.missingChunks.size(), 1u);
  EXPECT_EQ(report.missingChunks[0], lost.toString());
  EXPECT_EQ(report.references, totalOccurrences(a) + totalOccurrences(b) - 1);

  for (const auto &file : a.files) {
    for (const auto &id : file.chunks) {
      EXPECT_EQ(fresh.referenceCount(id), index_.referenceCount(id));
      EXPECT_EQ(fresh.storedSize(id), index_.storedSize(id));
    }
  }

  // A rebuilt index deduplicates against what is already stored.
  memory().resetCounters();
  restarted.backup(entries);
  EXPECT_EQ(memory().putCount(), 0u);
}

TEST_F(BackupEngineTest, EncryptionRequiresKey) {
  EngineConfig config = smallChunkConfig();
  config.encryptionEnabled = true;
  EXPECT_THROW((BackupEngine{config, storage_, index_}), ConfigurationError);
}

TEST_F(BackupEngineTest, EncryptedRoundTrip) {
  EngineConfig config = smallChunkConfig();
  config.encryptionEnabled = true;
  config.cipher = CipherAlgorithm::ChaCha20Poly1305;
  const SessionKey key = SessionKey::generate();
  BackupEngine engine(config, storage_, index_, &key);

  const std::string secret = "attack at dawn " + randomString(20 * 1024, 14);
  const Snapshot snapshot = engine.backup({memorySource("plan", secret)});
  ASSERT_TRUE(snapshot.failures.empty());

  for (const auto &stored : memory().list()) {
    const std::string record = test::toString(storage_.get(stored));
    EXPECT_EQ(record.find("attack at dawn"), std::string::npos);
  }

  const fs::path target = scratchDir("engine_encrypted");
  Restorer withKey(config, storage_, &key);
  ASSERT_TRUE(withKey.restore(snapshot, target).ok());
  EXPECT_EQ(readFile(target / "plan"), secret);

  Restorer withoutKey(config, storage_);
  const RestoreReport report =
      withoutKey.restore(snapshot, scratchDir("engine_encrypted_nokey"));
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].kind, ErrorKind::Configuration);
}

TEST_F(BackupEngineTest, BackupFileReturnsMetadata) {
  SourceAttributes attrs;
  attrs.mode = 0755;
  const FileMetadata md = engine_->backupFile(
      memorySource("bin/tool", randomString(30 * 1024, 15), attrs));
  EXPECT_EQ(md.path, "bin/tool");
  EXPECT_EQ(md.size, 30u * 1024);
  EXPECT_EQ(md.mode, 0755u);
  EXPECT_EQ(md.chunks.size(), md.chunkSizes.size());
  EXPECT_EQ(md.chunks.size(), md.storedSizes.size());

  EXPECT_THROW(engine_->backupFile(SourceEntry{"no-reader", nullptr, {}}),
               IoError);
}

TEST(SourceTest, CollectDirectoryWalksRegularFiles) {
  const fs::path root = scratchDir("source_walk");
  fs::create_directories(root / "sub" / "deeper");
  std::ofstream(root / "b.txt") << "bee";
  std::ofstream(root / "sub" / "a.txt") << "ay";
  std::ofstream(root / "sub" / "deeper" / "c.txt") << "";
  fs::create_symlink(root / "b.txt", root / "link");

  const auto entries = collectDirectory(root);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].relativePath, "b.txt");
  EXPECT_EQ(entries[1].relativePath, "sub/a.txt");
  EXPECT_EQ(entries[2].relativePath, "sub/deeper/c.txt");
  EXPECT_EQ(entries[0].attributes.size, 3u);

  auto in = entries[1].open();
  std::string body;
  *in >> body;
  EXPECT_EQ(body, "ay");

  EXPECT_THROW(collectDirectory(root / "missing"), IoError);
}

TEST(SourceTest, ExcludedPathsAreSkipped) {
  const fs::path root = scratchDir("source_exclude");
  fs::create_directories(root / "keep");
  fs::create_directories(root / "node_modules" / "pkg");
  std::ofstream(root / "keep" / "a.txt") << "a";
  std::ofstream(root / "keep" / "a.tmp") << "scratch";
  std::ofstream(root / "node_modules" / "pkg" / "index.js") << "js";

  const auto entries = collectDirectory(root, {"node_modules", ".tmp"});
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].relativePath, "keep/a.txt");

  EXPECT_EQ(collectDirectory(root).size(), 3u);
  EXPECT_TRUE(isExcluded("a/node_modules/b", {"node_modules"}));
  EXPECT_FALSE(isExcluded("a/b", {"", "c"}));
}

TEST(SourceTest, UnreadableDirectoryDoesNotStopTheWalk) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permission bits do not restrict root";
  }
  const fs::path root = scratchDir("source_unreadable");
  fs::create_directories(root / "locked");
  std::ofstream(root / "locked" / "hidden.txt") << "x";
  std::ofstream(root / "open.txt") << "y";
  fs::permissions(root / "locked", fs::perms::none);

  std::vector<SourceEntry> entries;
  ASSERT_NO_THROW(entries = collectDirectory(root));
  fs::permissions(root / "locked", fs::perms::owner_all);

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].relativePath, "locked");
  EXPECT_THROW(entries[0].open(), IoError);
  EXPECT_EQ(entries[1].relativePath, "open.txt");

  Storage storage{std::in_place_type<MemoryStorage>};
  DedupIndex index;
  BackupEngine engine(smallChunkConfig(), storage, index);
  const Snapshot snapshot = engine.backup(entries);
  ASSERT_EQ(snapshot.failures.size(), 1u);
  EXPECT_EQ(snapshot.failures[0].path, "locked");
  EXPECT_EQ(snapshot.files.size(), 1u);
}
