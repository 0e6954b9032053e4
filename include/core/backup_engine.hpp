#pragma once
#ifndef BACKUPFORGE_BACKUP_ENGINE_HPP
#define BACKUPFORGE_BACKUP_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/chunk_record.hpp"
#include "core/chunker.hpp"
#include "core/dedup_index.hpp"
#include "core/engine_config.hpp"
#include "core/snapshot.hpp"
#include "core/source.hpp"
#include "core/worker_pool.hpp"
#include "storage/storage.hpp"

namespace backupforge {

struct BackupOptions {
  std::string source;
  std::string description;
  std::vector<std::string> tags;
  std::optional<std::string> parentId;
};

/**
 * @brief Drives Chunker, DedupIndex, ChunkRecordCodec and Storage to turn a
 *        set of source entries into a Snapshot.
 *
 * Files run in parallel (fileParallelism), and the chunks of every file
 * share one bounded WorkerPool. The index decision for a chunk is made on
 * the worker that processes it, so a chunk waiting on a pending duplicate
 * always waits on a task that is already running.
 *
 * A file whose chunk fails is reported in Snapshot::failures and its
 * references are released; the other files are unaffected. An
 * IndexConsistencyError ends the run and propagates from backup().
 *
 * prune() and rebuildIndex() exclude concurrent backups.
 */
class BackupEngine {
public:
  struct RebuildReport {
    size_t storedChunks{0};
    uint64_t references{0};
    /// Chunks named by a snapshot but absent from storage.
    std::vector<std::string> missingChunks;
    /// Storage keys that are not chunk ids.
    std::vector<std::string> foreignKeys;
  };

  struct PruneStats {
    size_t totalChunks{0};
    size_t reclaimableChunks{0};
    uint64_t reclaimableBytes{0};
    size_t freedChunks{0};
    uint64_t freedBytes{0};
  };

  /**
   * @param key Session key when config.encryptionEnabled; must outlive the
   *        engine.
   * @throw ConfigurationError If @p config is invalid or encryption is
   *        enabled without a key.
   */
  BackupEngine(EngineConfig config, Storage &storage, DedupIndex &index,
               const SessionKey *key = nullptr);
  ~BackupEngine();

  BackupEngine(const BackupEngine &) = delete;
  BackupEngine &operator=(const BackupEngine &) = delete;

  /**
   * @brief Back up @p entries and return the snapshot.
   *
   * After cancel() the snapshot is partial: complete is false and files
   * that did not finish are listed as Cancelled failures.
   * @throw IndexConsistencyError
   */
  Snapshot backup(const std::vector<SourceEntry> &entries,
                  const BackupOptions &options = {});

  /**
   * @brief Back up a single entry.
   * @throw BackupError (any kind) if the file could not be backed up. Its
   *        references have been released by then.
   */
  FileMetadata backupFile(const SourceEntry &entry);

  /** Stop the running backup between chunks. Cleared when backup() ends. */
  void cancel() { cancelled_ = true; }
  bool cancelRequested() const { return cancelled_; }

  /**
   * @brief Drop one reference per chunk occurrence in @p snapshot.
   * @return Chunks left with no references.
   */
  size_t releaseSnapshot(const Snapshot &snapshot);

  /**
   * @brief Repopulate the index from the storage listing, then count the
   *        references of @p liveSnapshots.
   */
  RebuildReport rebuildIndex(const std::vector<Snapshot> &liveSnapshots);

  /** Delete stored chunks with no references (or only count them). */
  PruneStats prune(bool dryRun);

  const EngineConfig &config() const { return config_; }
  const ChunkRecordCodec &codec() const { return codec_; }

private:
  struct ChunkOutcome {
    ChunkId id;
    uint64_t plainSize{0};
    uint64_t storedSize{0};
    bool isNew{false};
  };

  struct FileResult {
    FileMetadata metadata;
    uint64_t newChunks{0};
    uint64_t reusedChunks{0};
    uint64_t storedBytes{0};
    uint64_t referencedStoredBytes{0};
  };

  FileResult backupOne(const SourceEntry &entry);
  ChunkOutcome processChunk(const RawChunk &chunk, const std::string &path);
  void storeWithRetry(const std::string &key,
                      const std::vector<std::byte> &record,
                      const ErrorContext &ctx);
  void releaseOutcomes(const std::vector<ChunkOutcome> &outcomes);

  EngineConfig config_;
  Storage &storage_;
  DedupIndex &index_;
  Chunker chunker_;
  ChunkRecordCodec codec_;
  std::unique_ptr<WorkerPool> pool_;
  std::atomic<bool> cancelled_{false};
  std::shared_mutex maintenanceMutex_;
};

} // namespace backupforge

#endif // BACKUPFORGE_BACKUP_ENGINE_HPP
